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
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

#include <sys/stat.h>

#include "global.h"
#include "stagingarea.h"
#include "fileutil.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;

// -----------------------------------------------------------------------------
static FilePath add_firmware(const FilePath &root, const string &name,
                             const string &contents)
{
    FilePath path = root;
    path.appendPath(name);
    FilePath(path.dirName()).mkdir(true);
    write_file(path, contents);
    return path;
}

// -----------------------------------------------------------------------------
static mode_t file_mode(const string &path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        throw KSystemError("Cannot stat " + path, errno);
    return st.st_mode & 07777;
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;
        TemporaryDirectory tmp("teststaging.");

        FilePath firmware = tmp.path();
        firmware.appendPath("firmware");
        firmware.mkdir(false);
        FilePath ucode = add_firmware(firmware, "iwlwifi-1.ucode",
                                      "iwlwifi firmware\n");
        add_firmware(firmware, "ath10k/cal-pci.bin", string("\0\1\2\3", 4));
        if (chmod(ucode.c_str(), 0600) != 0)
            throw KSystemError("Cannot chmod " + ucode, errno);

        // staging directories go here
        FilePath tmpdir = tmp.path();
        tmpdir.appendPath("tmp");
        tmpdir.mkdir(false);
        if (setenv("TMPDIR", tmpdir.c_str(), 1) != 0)
            throw KSystemError("Cannot set TMPDIR", errno);

        test.check("Staging root is created below TMPDIR",
                   [&firmware, &tmpdir]() {
                       StagingArea staging(firmware);
                       FilePath root = staging.root();
                       return root.startsWith(tmpdir + "/firmwarenator.") &&
                           root.isDirectory();
                   });

        test.check("Empty set gives an empty lib/firmware",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       staging.addAll(StringSet());
                       StringVector top = staging.root().listDir();
                       FilePath fwroot = staging.firmwareRoot();
                       return top.size() == 1 && top[0] == "lib" &&
                           fwroot == staging.root() + "/lib/firmware" &&
                           fwroot.isDirectory() &&
                           fwroot.listDir().empty();
                   });

        test.check("Files are copied to their relative location",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       StringSet files;
                       files.insert("iwlwifi-1.ucode");
                       files.insert("ath10k/cal-pci.bin");
                       staging.addAll(files);
                       FilePath fwroot = staging.firmwareRoot();
                       return read_file(fwroot + "/iwlwifi-1.ucode") ==
                               "iwlwifi firmware\n" &&
                           read_file(fwroot + "/ath10k/cal-pci.bin") ==
                               string("\0\1\2\3", 4);
                   });

        test.check("File mode is preserved",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       staging.add("iwlwifi-1.ucode");
                       return file_mode(staging.firmwareRoot() +
                                        "/iwlwifi-1.ucode") == 0600;
                   });

        test.check("Adding a file twice is harmless",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       staging.add("ath10k/cal-pci.bin");
                       staging.add("ath10k/cal-pci.bin");
                       return staging.firmwareRoot().listDir().size() == 1;
                   });

        test.check("Missing firmware is a StagingError",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       return throws<StagingError>([&staging]() {
                           staging.add("missing.bin");
                       });
                   });

        test.check("Paths with '..' are a StagingError",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       return throws<StagingError>([&staging]() {
                           staging.add("../firmware/iwlwifi-1.ucode");
                       }) && throws<StagingError>([&staging]() {
                           staging.add("ath10k/../../etc/passwd");
                       });
                   });

        test.check("Absolute paths are a StagingError",
                   [&firmware, &ucode]() {
                       StagingArea staging(firmware);
                       return throws<StagingError>([&staging, &ucode]() {
                           staging.add(ucode);
                       });
                   });

        test.check("Staging roots are removed on success",
                   [&tmpdir]() {
                       return tmpdir.listDir().empty();
                   });

        test.check("Staging root is removed after a failure",
                   [&firmware, &tmpdir]() {
                       bool thrown = throws<StagingError>([&firmware]() {
                           StagingArea staging(firmware);
                           StringSet files;
                           files.insert("ath10k/cal-pci.bin");
                           files.insert("zzz/missing.bin");
                           staging.addAll(files);
                       });
                       return thrown && tmpdir.listDir().empty();
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
