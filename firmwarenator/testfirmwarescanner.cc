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
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "global.h"
#include "firmwarescanner.h"
#include "util.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;
using std::stringstream;

// -----------------------------------------------------------------------------
static StringSet scan(const string &log)
{
    FirmwareScanner scanner("/lib/firmware");
    stringstream ss(log);
    return scanner.scan(ss);
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;

        test.check("Duplicate loads collapse",
                   []() {
                       StringSet s = scan(
                           "[    2.1] iwlwifi 0000:00:14.3: Loading firmware "
                           "from iwlwifi-1.ucode\n"
                           "[    2.2] ath10k_pci 0000:3a:00.0: Loading "
                           "firmware from ath10k/cal-pci.bin\n"
                           "[   60.4] iwlwifi 0000:00:14.3: Loading firmware "
                           "from iwlwifi-1.ucode\n");
                       return s.size() == 2 &&
                           s.count("iwlwifi-1.ucode") &&
                           s.count("ath10k/cal-pci.bin");
                   });

        test.check("Absolute paths below the firmware root are relative",
                   []() {
                       StringSet s = scan(
                           "i915 0000:00:02.0: Loading firmware from "
                           "/lib/firmware/updates/i915/tgl_dmc.bin\n");
                       return s.size() == 1 &&
                           s.count("updates/i915/tgl_dmc.bin");
                   });

        test.check("Quotes around the path are removed",
                   []() {
                       StringSet s = scan(
                           "foo: Loading firmware from "
                           "\"/lib/firmware/rtl_nic/rtl8168h-2.fw\"\n");
                       return s.size() == 1 &&
                           s.count("rtl_nic/rtl8168h-2.fw");
                   });

        test.check("Paths outside the firmware root are skipped",
                   []() {
                       StringSet s = scan(
                           "foo: Loading firmware from /usr/lib/fw.bin\n"
                           "foo: Loading firmware from /lib/firmwarex/a.bin\n");
                       return s.empty();
                   });

        test.check("Other lines are ignored",
                   []() {
                       StringSet s = scan(
                           "Linux version 6.1.0\n"
                           "iwlwifi 0000:00:14.3: loaded firmware version 1\n"
                           "\n"
                           "firmware_class: Loading firmware from\n"
                           "firmware_class: Loading firmware from  \n"
                           "firmware_class: Loading firmware from \"\"\n");
                       return s.empty();
                   });

        test.check("Empty log gives an empty set",
                   []() {
                       return scan("").empty();
                   });

        test.check("Last line without a newline is used",
                   []() {
                       StringSet s = scan(
                           "x: Loading firmware from amdgpu/psp.bin");
                       return s.size() == 1 && s.count("amdgpu/psp.bin");
                   });

        test.check("Trailing blanks and carriage returns are ignored",
                   []() {
                       StringSet s = scan(
                           "x: Loading firmware from amdgpu/psp.bin  \r\n");
                       return s.size() == 1 && s.count("amdgpu/psp.bin");
                   });

        test.check("Firmware root with a trailing slash",
                   []() {
                       FirmwareScanner scanner("/lib/firmware/");
                       string path;
                       return scanner.parseLine("Loading firmware from "
                                                "/lib/firmware/a/b.bin", path)
                           && path == "a/b.bin";
                   });

        test.check("Custom firmware root",
                   []() {
                       FirmwareScanner scanner("/opt/fw");
                       string path;
                       bool inside = scanner.parseLine(
                           "Loading firmware from /opt/fw/c.bin", path);
                       string other;
                       bool outside = scanner.parseLine(
                           "Loading firmware from /lib/firmware/c.bin", other);
                       return inside && path == "c.bin" && !outside;
                   });

        // reading the kernel log may be forbidden (dmesg_restrict)
        if (!Util::findExecutable("dmesg").empty()) {
            test.check("Kernel log can be scanned or fails with KError",
                       []() {
                           FirmwareScanner scanner("/lib/firmware");
                           try {
                               StringSet s = scanner.scanKernelLog();
                               cerr << s.size() << " firmware file(s)" << endl;
                           } catch (const KError &ke) {
                               cerr << ke.what() << endl;
                           }
                           return true;
                       });
        }

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
