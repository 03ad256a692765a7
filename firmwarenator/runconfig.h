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
#ifndef RUNCONFIG_H
#define RUNCONFIG_H

#include <iosfwd>
#include <string>

#include "global.h"
#include "fileutil.h"
#include "option.h"
#include "optionparser.h"
#include "stringvector.h"

//{{{ RunConfig ----------------------------------------------------------------

/**
 * The fully resolved settings of one run. Built once by OptionResolver
 * and handed to the later stages by const reference.
 */
struct RunConfig {
    enum Format {
        FORMAT_ARCHIVE,     // compressed cpio archive
        FORMAT_IMAGE        // squashfs image
    };

    RunConfig()
        : force(false), verbose(false), format(FORMAT_ARCHIVE)
    { }

    /** Absolute path of the output file. */
    FilePath output;

    /** Overwrite an existing output file. */
    bool force;

    bool verbose;

    Format format;

    /** Canonical compressor name ("none" for an uncompressed archive). */
    std::string compressor;

    /** Compressor executable, empty for "none". */
    std::string compress;

    StringVector compressArgs;

    /** Decompressor command line, empty for "none". */
    std::string decompress;
};

//}}}
//{{{ OptionResolver -----------------------------------------------------------

/**
 * Turns the command line and the configuration files into a RunConfig.
 */
class OptionResolver {

    public:
        OptionResolver();

        /**
         * Replace the list of configuration files. Files are read in
         * order, later ones override earlier ones. Missing files are
         * skipped.
         */
        void setConfigFiles(const StringVector &files)
        { m_configFiles = files; }

        const StringVector& getConfigFiles() const
        { return m_configFiles; }

        /**
         * Parses the command line.
         *
         * @exception UsageError on an unknown option or missing argument
         */
        void parseCommandline(int argc, char *argv[]);

        bool helpRequested() const
        { return m_doHelp; }

        bool versionRequested() const
        { return m_doVersion; }

        bool verboseRequested() const
        { return m_verbose; }

        /**
         * Print the usage to @p os.
         */
        void printHelp(std::ostream &os) const;

        /**
         * Read the configuration files and compute the settings.
         *
         * @return the resolved settings
         * @exception UsageError if IMGNAME is missing or cannot be resolved
         * @exception ConfigError for an unusable compressor setup
         * @exception PreflightError if the output file exists and
         *            --force was not given
         */
        RunConfig resolve() const;

    private:
        void resolveCompressor(RunConfig &rc) const;
        void resolveOutput(RunConfig &rc) const;

        bool m_doHelp;
        bool m_doVersion;
        bool m_verbose;
        bool m_force;
        bool m_sqsh;
        std::string m_compressor;
        StringVector m_compressorArgs;
        StringVector m_configFiles;

        FlagOption m_helpOption;
        FlagOption m_versionOption;
        FlagOption m_verboseOption;
        FlagOption m_forceOption;
        StringOption m_compressorOption;
        StringListOption m_compressorArgsOption;
        FlagOption m_sqshOption;

        OptionParser m_parser;
};

//}}}

#endif /* RUNCONFIG_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
