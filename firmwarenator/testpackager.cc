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
#include <memory>
#include <sstream>
#include <string>

#include "global.h"
#include "packager.h"
#include "runconfig.h"
#include "stagingarea.h"
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
using std::unique_ptr;

static const char ucode_data[] = "iwlwifi firmware\n";
static const char cal_data[] = "\x01\x02\x03 calibration";

// -----------------------------------------------------------------------------
static string quote(const string &s)
{
    return ShellQuotedString(s).quoted();
}

// -----------------------------------------------------------------------------
static uint8_t shell(const string &cmd, string *output = NULL)
{
    stringstream out, err;
    ProcessFilter p;
    p.setStdout(&out);
    p.setStderr(&err);

    StringVector args;
    args.push_back("-c");
    args.push_back(cmd);
    uint8_t status = p.execute("/bin/sh", args);
    if (output)
        *output = out.str();
    if (status != 0)
        cerr << cmd << ": " << err.str();
    return status;
}

// -----------------------------------------------------------------------------
static bool same_file(const string &path, const string &data)
{
    FilePath fp(path);
    return fp.exists() && read_file(path) == data;
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
        TemporaryDirectory tmp("testpackager.");
        FilePath dir = tmp.path().getCanonicalPath();

        FilePath firmware = dir;
        firmware.appendPath("firmware");
        FilePath(firmware + "/ath10k").mkdir(true);
        write_file(firmware + "/iwlwifi-1.ucode", ucode_data);
        write_file(firmware + "/ath10k/cal-pci.bin", cal_data);

        StringSet files;
        files.insert("iwlwifi-1.ucode");
        files.insert("ath10k/cal-pci.bin");

        test.check("File list is sorted and relative",
                   [&firmware, &files]() {
                       StagingArea staging(firmware);
                       staging.addAll(files);
                       StringVector list =
                           CpioPackager::listFiles(staging.root());
                       return list.join(' ') ==
                           "lib lib/firmware lib/firmware/ath10k "
                           "lib/firmware/ath10k/cal-pci.bin "
                           "lib/firmware/iwlwifi-1.ucode";
                   });

        test.check("File list of an empty staging root",
                   [&firmware]() {
                       StagingArea staging(firmware);
                       StringVector list =
                           CpioPackager::listFiles(staging.root());
                       return list.join(' ') == "lib lib/firmware";
                   });

        test.check("cpio writes newc",
                   []() {
                       CpioPackager quiet("", StringVector(), false);
                       CpioPackager verbose("", StringVector(), true);
                       return quiet.cpioArgs().join(' ') ==
                               "-o -H newc --null --quiet" &&
                           verbose.cpioArgs().join(' ') ==
                               "-o -H newc --null -v";
                   });

        test.check("mksquashfs arguments",
                   []() {
                       SquashfsPackager quiet(false);
                       SquashfsPackager verbose(true);
                       return quiet.mksquashfsArgs("/s", "/o.img").join(' ') ==
                               "/s /o.img -noappend -comp xz -all-root "
                               "-quiet -no-progress" &&
                           verbose.mksquashfsArgs("/s", "/o.img").join(' ') ==
                               "/s /o.img -noappend -comp xz -all-root";
                   });

        test.check("Format selects the packager",
                   []() {
                       RunConfig rc;
                       rc.format = RunConfig::FORMAT_IMAGE;
                       unique_ptr<ImagePackager> image =
                           ImagePackager::create(rc);
                       rc.format = RunConfig::FORMAT_ARCHIVE;
                       unique_ptr<ImagePackager> archive =
                           ImagePackager::create(rc);
                       return dynamic_cast<SquashfsPackager *>(image.get()) &&
                           dynamic_cast<CpioPackager *>(archive.get());
                   });

        if (Util::findExecutable("cpio").empty()) {
            cerr << "cpio not found, skipping archive tests" << endl;
            skipped = true;
        } else {
            test.check("Uncompressed archive lists the firmware",
                       [&dir, &firmware, &files]() {
                           FilePath out = dir + "/none.cpio";
                           StagingArea staging(firmware);
                           staging.addAll(files);
                           CpioPackager packager("", StringVector(), false);
                           packager.package(staging, out);

                           string list;
                           if (shell("cpio -it --quiet < " + quote(out),
                                     &list) != 0)
                               return false;
                           return list ==
                               "lib\n"
                               "lib/firmware\n"
                               "lib/firmware/ath10k\n"
                               "lib/firmware/ath10k/cal-pci.bin\n"
                               "lib/firmware/iwlwifi-1.ucode\n";
                       });

            test.check("Empty staging root gives a valid archive",
                       [&dir, &firmware]() {
                           FilePath out = dir + "/empty.cpio";
                           StagingArea staging(firmware);
                           CpioPackager packager("", StringVector(), false);
                           packager.package(staging, out);

                           string list;
                           if (shell("cpio -it --quiet < " + quote(out),
                                     &list) != 0)
                               return false;
                           return list == "lib\nlib/firmware\n";
                       });

            if (Util::findExecutable("gzip").empty()) {
                cerr << "gzip not found, skipping round trip" << endl;
                skipped = true;
            } else {
                test.check("Compressed archive round trip",
                           [&dir, &firmware, &files]() {
                               FilePath out = dir + "/fw.cpio.gz";
                               StagingArea staging(firmware);
                               staging.addAll(files);
                               CpioPackager packager("gzip",
                                   StringVector{ "-n", "-9" }, false);
                               packager.package(staging, out);

                               FilePath extract = dir + "/extract";
                               extract.mkdir(false);
                               if (shell("cd " + quote(extract) +
                                         " && gzip -dc < " + quote(out) +
                                         " | cpio -idm --quiet") != 0)
                                   return false;
                               return same_file(extract +
                                       "/lib/firmware/iwlwifi-1.ucode",
                                       ucode_data) &&
                                   same_file(extract +
                                       "/lib/firmware/ath10k/cal-pci.bin",
                                       cal_data);
                           });
            }

            test.check("Failing compressor is a PackagingError",
                       [&dir, &firmware, &files]() {
                           FilePath out = dir + "/failed.cpio";
                           StagingArea staging(firmware);
                           staging.addAll(files);
                           CpioPackager packager("false", StringVector(),
                                                 false);
                           try {
                               packager.package(staging, out);
                           } catch (const PackagingError &err) {
                               // reported instead of cpio's broken pipe
                               return string(err.what()).find(
                                       "false failed") == 0 &&
                                   !out.exists();
                           }
                           return false;
                       });

            test.check("Missing compressor is a PackagingError",
                       [&dir, &firmware]() {
                           FilePath out = dir + "/missing.cpio";
                           StagingArea staging(firmware);
                           CpioPackager packager("firmwarenator-no-such-xz",
                                                 StringVector(), false);
                           bool thrown = throws<PackagingError>(
                               [&packager, &staging, &out]() {
                                   packager.package(staging, out);
                               });
                           return thrown && !out.exists();
                       });

            test.check("Existing output is left alone",
                       [&dir, &firmware]() {
                           FilePath out = dir + "/existing.cpio";
                           write_file(out, "keep");
                           StagingArea staging(firmware);
                           CpioPackager packager("", StringVector(), false);
                           bool thrown = throws<KError>(
                               [&packager, &staging, &out]() {
                                   packager.package(staging, out);
                               });
                           return thrown && same_file(out, "keep");
                       });
        }

        if (Util::findExecutable("mksquashfs").empty() ||
                Util::findExecutable("unsquashfs").empty()) {
            cerr << "mksquashfs or unsquashfs not found, "
                 << "skipping image tests" << endl;
            skipped = true;
        } else {
            test.check("Image holds the firmware at its root",
                       [&dir, &firmware, &files]() {
                           FilePath out = dir + "/fw.sqsh";
                           StagingArea staging(firmware);
                           staging.addAll(files);
                           SquashfsPackager packager(false);
                           packager.package(staging, out);

                           FilePath extract = dir + "/sqsh";
                           if (shell("unsquashfs -no-progress -d " +
                                     quote(extract) + " " + quote(out)) != 0)
                               return false;
                           return same_file(extract + "/iwlwifi-1.ucode",
                                            ucode_data) &&
                               same_file(extract + "/ath10k/cal-pci.bin",
                                         cal_data) &&
                               !FilePath(extract + "/lib").exists();
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
