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
#ifndef STAGINGAREA_H
#define STAGINGAREA_H

#include <string>

#include "global.h"
#include "fileutil.h"

//{{{ StagingArea --------------------------------------------------------------

/**
 * A temporary directory tree that mirrors the output:
 *
 *   <root>/lib/firmware/<relative firmware path>
 *
 * The tree is removed when the object goes away.
 */
class StagingArea {

    public:
        /**
         * Create the staging root and its lib/firmware directory.
         *
         * @param[in] firmwareDir the directory the files are copied from
         * @exception StagingError if the directories cannot be created
         */
        explicit StagingArea(const std::string &firmwareDir);

        /**
         * The staging root.
         */
        const FilePath& root() const
        { return m_tmpdir.path(); }

        /**
         * The lib/firmware directory below the staging root.
         */
        FilePath firmwareRoot() const;

        /**
         * Copy one firmware file into the staging root.
         *
         * @param[in] path the path relative to the firmware directory
         * @exception StagingError if @p path is invalid, the file is
         *            missing or the copy fails
         */
        void add(const std::string &path);

        /**
         * Copy all files of @p paths.
         */
        void addAll(const StringSet &paths);

    private:
        StagingArea(const StagingArea &);
        StagingArea& operator=(const StagingArea &);

        FilePath m_firmwareDir;
        TemporaryDirectory m_tmpdir;
};

//}}}

#endif /* STAGINGAREA_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
