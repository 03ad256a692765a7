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
#ifndef COMPRESSOR_H
#define COMPRESSOR_H

#include <map>
#include <string>

#include "global.h"
#include "stringvector.h"

class Configuration;

//{{{ CompressorProfile --------------------------------------------------------

/**
 * How to compress and decompress with one compressor.
 */
struct CompressorProfile {
    /** Compressor executable; reads stdin, writes stdout. */
    std::string compress;

    /**
     * Arguments that follow the executable in <NAME>_COMP. They are
     * always passed, also when -C replaces the default arguments.
     */
    StringVector compressOptions;

    /** Default arguments for the compressor (<NAME>_COMP_ARGS). */
    StringVector compressArgs;

    /** Decompressor command line (program name plus arguments). */
    std::string decompress;
};

//}}}
//{{{ CompressorTable ----------------------------------------------------------

/**
 * The compressor profiles of a configuration, keyed by compressor.
 */
class CompressorTable {

    public:
        enum Compressor {
            COMP_NONE,
            COMP_ZSTD,
            COMP_XZ,
            COMP_LZMA,
            COMP_GZIP,
            COMP_BZIP2,
            COMP_LZ4,
            COMP_LZOP,
            COMP_MAX
        };

        /**
         * Parse a compressor name (case does not matter).
         *
         * @param[in] name the compressor name, e.g. "zstd" or "none"
         * @return the compressor
         * @exception ConfigError if the name is unknown
         */
        static Compressor parseName(const std::string &name);

        /**
         * Return the canonical (lower-case) name of a compressor.
         */
        static const char *name(Compressor comp);

        /**
         * Build the table from the <NAME>_COMP, <NAME>_COMP_ARGS and
         * <NAME>_DECOMP variables of @p config. <NAME>_COMP is split into
         * the executable and its fixed options. A profile whose compress
         * or decompress command is empty is left out.
         */
        explicit CompressorTable(const Configuration &config);

        /**
         * Look up a profile.
         *
         * @param[in] comp the compressor
         * @return the profile, or NULL if @p comp is not configured.
         *         COMP_NONE never has a profile.
         */
        const CompressorProfile *find(Compressor comp) const;

    private:
        std::map<Compressor, CompressorProfile> m_profiles;
};

//}}}

#endif /* COMPRESSOR_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
