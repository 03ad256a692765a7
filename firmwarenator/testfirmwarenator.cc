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
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "global.h"
#include "firmwarenator.h"
#include "charv.h"
#include "fileutil.h"
#include "process.h"
#include "quotedstring.h"
#include "util.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;
using std::stringstream;

static const char kernel_log[] =
    "[    1.000000] Linux version 6.1.0 (gcc)\n"
    "[    2.100000] iwlwifi 0000:00:14.3: Loading firmware from "
    "/lib/firmware/iwlwifi-1.ucode\n"
    "[    2.200000] ath10k_pci 0000:3a:00.0: Loading firmware from "
    "/lib/firmware/ath10k/cal-pci.bin\n"
    "[   61.300000] iwlwifi 0000:00:14.3: Loading firmware from "
    "/lib/firmware/iwlwifi-1.ucode\n";

static FilePath firmware_dir;
static FilePath staging_tmpdir;
static StringVector config_files;

// -----------------------------------------------------------------------------
static void run(const StringVector &args, const string &log)
{
    CharV argv(args);
    argv.insert(argv.begin(), "firmwarenator");
    int argc = argv.size();

    stringstream ss(log);
    Firmwarenator fwn;
    fwn.setConfigFiles(config_files);
    fwn.setFirmwareDir(firmware_dir);
    fwn.setKernelLog(&ss);
    fwn.parseCommandline(argc, argv.data());
    fwn.readConfiguration();
    fwn.execute();
}

// -----------------------------------------------------------------------------
static string list_archive(const string &path)
{
    stringstream out, err;
    ProcessFilter p;
    p.setStdout(&out);
    p.setStderr(&err);

    StringVector args;
    args.push_back("-c");
    args.push_back("cpio -it --quiet < " + ShellQuotedString(path).quoted());
    if (p.execute("/bin/sh", args) != 0)
        throw KError("Cannot list " + path + ": " + err.str());
    return out.str();
}

// -----------------------------------------------------------------------------
static bool no_staging_left()
{
    return staging_tmpdir.listDir().empty();
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;
    bool skipped = false;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    signal(SIGPIPE, SIG_IGN);
    try {
        TestRun test;
        TemporaryDirectory tmp("testfirmwarenator.");
        FilePath dir = tmp.path().getCanonicalPath();

        firmware_dir = dir + "/lib/firmware";
        FilePath(firmware_dir + "/ath10k").mkdir(true);
        write_file(firmware_dir + "/iwlwifi-1.ucode", "ucode");
        write_file(firmware_dir + "/ath10k/cal-pci.bin", "calibration");

        FilePath conf = dir + "/firmwarenator.conf";
        write_file(conf, "GZIP_COMP=false\nGZIP_DECOMP=cat\n");
        config_files.push_back(conf);

        staging_tmpdir = dir + "/tmp";
        staging_tmpdir.mkdir(false);
        if (setenv("TMPDIR", staging_tmpdir.c_str(), 1) != 0)
            throw KSystemError("Cannot set TMPDIR", errno);

        // the kernel log refers to /lib/firmware
        string log = kernel_log;
        for (string::size_type pos = log.find("/lib/firmware");
                pos != string::npos;
                pos = log.find("/lib/firmware", pos + firmware_dir.size()))
            log.replace(pos, 13, firmware_dir);

        test.check("Existing output without --force fails before staging",
                   [&dir, &log]() {
                       FilePath out = dir + "/exists.cpio";
                       write_file(out, "old");
                       bool thrown = throws<PreflightError>([&out, &log]() {
                           run({ "-c", "none", out }, log);
                       });
                       return thrown && read_file(out) == "old" &&
                           no_staging_left();
                   });

        test.check("Output created after the check is not overwritten",
                   [&dir, &log]() {
                       FilePath out = dir + "/late.cpio";
                       StringVector args = { "-c", "none", out };
                       CharV argv(args);
                       argv.insert(argv.begin(), "firmwarenator");
                       int argc = argv.size();

                       stringstream ss(log);
                       Firmwarenator fwn;
                       fwn.setConfigFiles(config_files);
                       fwn.setFirmwareDir(firmware_dir);
                       fwn.setKernelLog(&ss);
                       fwn.parseCommandline(argc, argv.data());
                       fwn.readConfiguration();

                       write_file(out, "late");
                       bool thrown = throws<KError>([&fwn]() {
                           fwn.execute();
                       });
                       return thrown && read_file(out) == "late" &&
                           no_staging_left();
                   });

        test.check("Missing firmware is a StagingError",
                   [&dir]() {
                       FilePath out = dir + "/missing.cpio";
                       bool thrown = throws<StagingError>([&out]() {
                           run({ "-c", "none", out },
                               "x: Loading firmware from no-such.bin\n");
                       });
                       return thrown && !out.exists() && no_staging_left();
                   });

        if (Util::findExecutable("cpio").empty()) {
            cerr << "cpio not found, skipping archive tests" << endl;
            skipped = true;
        } else {
            test.check("Uncompressed archive of the loaded firmware",
                       [&dir, &log]() {
                           FilePath out = dir + "/out.cpio";
                           run({ "-c", "none", out }, log);
                           string list = list_archive(out);
                           return list.find("lib/firmware/iwlwifi-1.ucode\n")
                                   != string::npos &&
                               list.find("lib/firmware/ath10k/cal-pci.bin\n")
                                   != string::npos &&
                               no_staging_left();
                       });

            test.check("Relative paths in the log",
                       [&dir]() {
                           FilePath out = dir + "/relative.cpio";
                           run({ "-c", "none", out },
                               "x: Loading firmware from iwlwifi-1.ucode\n");
                           return list_archive(out) ==
                               "lib\nlib/firmware\n"
                               "lib/firmware/iwlwifi-1.ucode\n";
                       });

            test.check("Firmware outside the firmware root is ignored",
                       [&dir]() {
                           FilePath out = dir + "/outside.cpio";
                           run({ "-c", "none", out },
                               "x: Loading firmware from /etc/passwd\n");
                           return list_archive(out) == "lib\nlib/firmware\n";
                       });

            test.check("Empty log gives an empty archive",
                       [&dir]() {
                           FilePath out = dir + "/empty.cpio";
                           run({ "-c", "none", out }, "");
                           return list_archive(out) == "lib\nlib/firmware\n";
                       });

            test.check("--force replaces the output",
                       [&dir, &log]() {
                           FilePath out = dir + "/replace.cpio";
                           write_file(out, "old");
                           run({ "-f", "-c", "none", out }, log);
                           return list_archive(out).find("iwlwifi-1.ucode")
                               != string::npos;
                       });

            test.check("Failing compressor removes the output",
                       [&dir, &log]() {
                           FilePath out = dir + "/failed.cpio.gz";
                           write_file(out, "old");
                           bool thrown = throws<PackagingError>(
                               [&out, &log]() {
                                   run({ "-f", "-c", "gzip", out }, log);
                               });
                           return thrown && !out.exists() &&
                               no_staging_left();
                       });
        }

        if (Util::findExecutable("mksquashfs").empty() ||
                Util::findExecutable("unsquashfs").empty()) {
            cerr << "mksquashfs or unsquashfs not found, "
                 << "skipping image tests" << endl;
            skipped = true;
        } else {
            test.check("Image of the loaded firmware",
                       [&dir, &log]() {
                           FilePath out = dir + "/out.sqsh";
                           run({ "-s", out }, log);

                           stringstream list, err;
                           ProcessFilter p;
                           p.setStdout(&list);
                           p.setStderr(&err);
                           StringVector args;
                           args.push_back("-l");
                           args.push_back(out);
                           if (p.execute("unsquashfs", args) != 0)
                               return false;
                           string s = list.str();
                           return s.find("squashfs-root/iwlwifi-1.ucode\n")
                                   != string::npos &&
                               s.find("squashfs-root/ath10k/cal-pci.bin\n")
                                   != string::npos &&
                               no_staging_left();
                       });
        }

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    if (result == EXIT_SUCCESS && skipped)
        return EXIT_SKIP;
    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
