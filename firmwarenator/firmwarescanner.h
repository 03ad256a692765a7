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
#ifndef FIRMWARESCANNER_H
#define FIRMWARESCANNER_H

#include <iosfwd>
#include <string>

#include "global.h"

//{{{ FirmwareScanner ----------------------------------------------------------

/**
 * Finds the firmware files the kernel has loaded by looking for the
 * firmware loader's messages in the kernel log. The loader logs
 *
 *   <driver> <device>: Loading firmware from /lib/firmware/<file>
 *
 * only if dynamic debug is enabled for it.
 */
class FirmwareScanner {

    public:
        /**
         * @param[in] firmwareDir the firmware root; absolute paths
         *            below it are made relative
         */
        explicit FirmwareScanner(const std::string &firmwareDir);

        /**
         * Scan a kernel log.
         *
         * @param[in] log the log text, one record per line
         * @return the firmware paths relative to the firmware root
         */
        StringSet scan(std::istream &log) const;

        /**
         * Run dmesg(1) and scan its output.
         *
         * @exception KError if dmesg cannot be run or fails
         */
        StringSet scanKernelLog() const;

        /**
         * Extract the firmware path from one log line.
         *
         * @param[in] line the log line
         * @param[out] path the path relative to the firmware root
         * @return @c true if @p line is a firmware-load record with a
         *         usable path
         */
        bool parseLine(const std::string &line, std::string &path) const;

    private:
        std::string m_firmwareDir;
};

//}}}

#endif /* FIRMWARESCANNER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
