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
#ifndef FIRMWARENATOR_H
#define FIRMWARENATOR_H

#include <iosfwd>
#include <string>

#include "global.h"
#include "runconfig.h"

//{{{ Firmwarenator ------------------------------------------------------------

/**
 * Main class of the program.
 */
class Firmwarenator {

    public:
        Firmwarenator();

    public:
        /**
         * Parses the command line. This method must be called before the
         * execute() method is called. Exits for --help and --version.
         *
         * @exception UsageError on invalid options
         */
        void parseCommandline(int argc, char *argv[]);

        /**
         * Reads the configuration files and resolves the settings.
         *
         * @exception UsageError, ConfigError or PreflightError
         */
        void readConfiguration();

        /**
         * Executes the main program.
         *
         * @exception StagingError, PackagingError or KError
         */
        void execute();

        /**
         * Print the usage on @p os.
         */
        void printUsage(std::ostream &os) const;

        /**
         * Copy the firmware from @p dir instead of FIRMWARE_DIR.
         */
        void setFirmwareDir(const std::string &dir)
        { m_firmwareDir = dir; }

        /**
         * Scan @p log instead of the output of dmesg. The stream must
         * live until execute() returns.
         */
        void setKernelLog(std::istream *log)
        { m_kernelLog = log; }

        void setConfigFiles(const StringVector &files)
        { m_resolver.setConfigFiles(files); }

        const RunConfig& getRunConfig() const
        { return m_config; }

    protected:
        void printVersion();

    private:
        OptionResolver m_resolver;
        RunConfig m_config;
        std::string m_firmwareDir;
        std::istream *m_kernelLog;
};

//}}}

#endif /* FIRMWARENATOR_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
