/*
 * (c) 2008, Bernhard Walle <bwalle@suse.de>, SUSE LINUX Products GmbH
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301, USA.
 */
#ifndef PACKAGER_H
#define PACKAGER_H

#include <memory>
#include <string>

#include "global.h"
#include "fileutil.h"
#include "stringvector.h"

struct RunConfig;
class StagingArea;

//{{{ ImagePackager ------------------------------------------------------------

/**
 * Writes the contents of a staging area to the output file.
 */
class ImagePackager {

    public:
        virtual ~ImagePackager()
        { }

        /**
         * Create the packager for the format in @p config.
         */
        static std::unique_ptr<ImagePackager> create(const RunConfig &config);

        /**
         * Package @p staging into @p output, which must not exist.
         * If packaging fails, a file created at @p output is removed.
         *
         * @exception PackagingError if a helper program fails
         * @exception KError on any other error
         */
        void package(const StagingArea &staging, const FilePath &output);

    protected:
        virtual void write(const StagingArea &staging,
                           const FilePath &output) = 0;
};

//}}}
//{{{ CpioPackager -------------------------------------------------------------

/**
 * newc cpio archive of the whole staging root, piped through a
 * compressor. The archive keeps the lib/firmware prefix.
 */
class CpioPackager : public ImagePackager {

    public:
        /**
         * @param[in] compress the compressor, or an empty string to
         *            write the archive uncompressed
         * @param[in] compressArgs the compressor arguments
         * @param[in] verbose let cpio list the files on stderr
         */
        CpioPackager(const std::string &compress,
                     const StringVector &compressArgs, bool verbose);

        /**
         * Recursively list @p root, sorted, with paths relative to
         * @p root. A directory comes before its contents.
         */
        static StringVector listFiles(const FilePath &root);

        StringVector cpioArgs() const;

    protected:
        void write(const StagingArea &staging, const FilePath &output);

    private:
        std::string m_compress;
        StringVector m_compressArgs;
        bool m_verbose;
};

//}}}
//{{{ SquashfsPackager ---------------------------------------------------------

/**
 * xz-compressed squashfs image. The image root is the lib/firmware
 * directory of the staging area.
 */
class SquashfsPackager : public ImagePackager {

    public:
        explicit SquashfsPackager(bool verbose);

        StringVector mksquashfsArgs(const FilePath &source,
                                    const FilePath &output) const;

    protected:
        void write(const StagingArea &staging, const FilePath &output);

    private:
        bool m_verbose;
};

//}}}

#endif /* PACKAGER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
