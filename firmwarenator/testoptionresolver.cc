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

#include <unistd.h>

#include "global.h"
#include "runconfig.h"
#include "charv.h"
#include "fileutil.h"
#include "process.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;
using std::stringstream;

// -----------------------------------------------------------------------------
static RunConfig resolve(const StringVector &configFiles,
                         const StringVector &args)
{
    CharV argv(args);
    argv.insert(argv.begin(), "firmwarenator");
    int argc = argv.size();

    OptionResolver resolver;
    resolver.setConfigFiles(configFiles);
    resolver.parseCommandline(argc, argv.data());
    return resolver.resolve();
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;
        TemporaryDirectory tmp("testoptionresolver.");
        FilePath dir = tmp.path().getCanonicalPath();

        // every profile uses programs that exist everywhere
        FilePath tools = dir;
        tools.appendPath("tools.conf");
        write_file(tools,
                   "ZSTD_COMP=cat\n"
                   "ZSTD_COMP_ARGS='-u'\n"
                   "ZSTD_DECOMP='cat -u'\n"
                   "XZ_COMP=cat\n"
                   "XZ_DECOMP=cat\n"
                   "GZIP_COMP=cat\n"
                   "GZIP_DECOMP=cat\n");
        StringVector configs;
        configs.push_back(tools);

        FilePath out = dir;
        out.appendPath("out.img");

        FilePath existing = dir;
        existing.appendPath("existing.img");
        write_file(existing, "old");

        test.check("Missing IMGNAME is a UsageError",
                   [&configs]() {
                       return throws<UsageError>([&configs]() {
                           resolve(configs, StringVector());
                       });
                   });

        test.check("Two positional arguments are a UsageError",
                   [&configs, &out]() {
                       return throws<UsageError>([&configs, &out]() {
                           resolve(configs, { out, out });
                       });
                   });

        test.check("Unknown option is a UsageError",
                   [&configs, &out]() {
                       return throws<UsageError>([&configs, &out]() {
                           resolve(configs, { "-x", out });
                       });
                   });

        test.check("Option without its argument is a UsageError",
                   [&configs]() {
                       return throws<UsageError>([&configs]() {
                           resolve(configs, { "-c" });
                       });
                   });

        test.check("Defaults",
                   [&configs, &out]() {
                       RunConfig rc = resolve(configs, { out });
                       return rc.output == out && !rc.force &&
                           !rc.verbose &&
                           rc.format == RunConfig::FORMAT_ARCHIVE &&
                           rc.compressor == "zstd" &&
                           rc.compress == "cat" &&
                           rc.compressArgs.join(' ') == "-u" &&
                           rc.decompress == "cat -u";
                   });

        test.check("Flags",
                   [&configs, &out]() {
                       RunConfig rc = resolve(configs,
                           { "--verbose", "-f", "--sqsh", out });
                       return rc.force && rc.verbose &&
                           rc.format == RunConfig::FORMAT_IMAGE;
                   });

        test.check("Relative IMGNAME is made absolute",
                   [&configs]() {
                       RunConfig rc = resolve(configs, { "firmware.cpio" });
                       FilePath expected = FilePath::getcwd()
                           .getCanonicalPath();
                       expected.appendPath("firmware.cpio");
                       return rc.output == expected;
                   });

        test.check("Symbolic links in IMGNAME are resolved",
                   [&configs, &dir]() {
                       FilePath target = dir;
                       target.appendPath("target");
                       target.mkdir(false);
                       FilePath link = dir;
                       link.appendPath("link");
                       if (symlink(target.c_str(), link.c_str()) != 0)
                           return false;
                       RunConfig rc = resolve(configs, { link + "/fw.img" });
                       return rc.output == target + "/fw.img";
                   });

        test.check("IMGNAME below a regular file is a UsageError",
                   [&configs, &existing]() {
                       return throws<UsageError>([&configs, &existing]() {
                           resolve(configs, { existing + "/fw.img" });
                       });
                   });

        test.check("Compressor from the command line",
                   [&configs, &out]() {
                       RunConfig rc = resolve(configs, { "-c", "GZip", out });
                       return rc.compressor == "gzip" &&
                           rc.compress == "cat" &&
                           rc.compressArgs.join(' ') == "-n -9";
                   });

        test.check("DEFAULT_COMPRESSOR selects the compressor",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("default.conf");
                       write_file(f, "DEFAULT_COMPRESSOR=xz\n");
                       StringVector files(configs);
                       files.push_back(f);
                       RunConfig rc = resolve(files, { out });
                       return rc.compressor == "xz";
                   });

        test.check("-c overrides DEFAULT_COMPRESSOR",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("default2.conf");
                       write_file(f, "DEFAULT_COMPRESSOR=xz\n");
                       StringVector files(configs);
                       files.push_back(f);
                       RunConfig rc = resolve(files, { "-c", "gzip", out });
                       return rc.compressor == "gzip";
                   });

        test.check("Later configuration files win",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("user.conf");
                       write_file(f, "ZSTD_COMP_ARGS='-1 -T0'\n");
                       StringVector files(configs);
                       files.push_back(f);
                       RunConfig rc = resolve(files, { out });
                       return rc.compressArgs.join(' ') == "-1 -T0";
                   });

        test.check("Missing configuration files are skipped",
                   [&configs, &dir, &out]() {
                       StringVector files(configs);
                       files.push_back(dir + "/no-such.conf");
                       RunConfig rc = resolve(files, { out });
                       return rc.compressor == "zstd";
                   });

        test.check("First -C replaces the configured arguments",
                   [&configs, &out]() {
                       RunConfig rc = resolve(configs, { "-C", "-3", out });
                       return rc.compressArgs.size() == 1 &&
                           rc.compressArgs[0] == "-3";
                   });

        test.check("Further -C options append",
                   [&configs, &out]() {
                       RunConfig rc = resolve(configs,
                           { "-C", "-3", "--compressor-args=-T0 -v", out });
                       return rc.compressArgs.join(' ') == "-3 -T0 -v";
                   });

        test.check("Empty -C gives no arguments",
                   [&configs, &out]() {
                       RunConfig rc = resolve(configs, { "-C", "", out });
                       return rc.compressArgs.empty();
                   });

        test.check("Options in <NAME>_COMP are kept apart from the program",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("comp-options.conf");
                       write_file(f, "GZIP_COMP='cat -u'\n"
                                     "GZIP_COMP_ARGS=-\n");
                       StringVector files(configs);
                       files.push_back(f);
                       RunConfig rc = resolve(files, { "-c", "gzip", out });
                       if (rc.compress != "cat" ||
                               rc.compressArgs.join(' ') != "-u -")
                           return false;

                       stringstream in("firmware"), data;
                       ProcessFilter p;
                       p.setStdin(&in);
                       p.setStdout(&data);
                       return p.execute(rc.compress, rc.compressArgs) == 0 &&
                           data.str() == "firmware";
                   });

        test.check("-C keeps the options in <NAME>_COMP",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("comp-options-c.conf");
                       write_file(f, "GZIP_COMP='cat -u'\n"
                                     "GZIP_COMP_ARGS=-n\n");
                       StringVector files(configs);
                       files.push_back(f);
                       RunConfig rc = resolve(files,
                           { "-c", "gzip", "-C", "-", out });
                       return rc.compress == "cat" &&
                           rc.compressArgs.join(' ') == "-u -";
                   });

        test.check("'none' needs no programs",
                   [&out]() {
                       RunConfig rc = resolve(StringVector(),
                                              { "-c", "none", out });
                       return rc.compressor == "none" &&
                           rc.compress.empty() && rc.decompress.empty();
                   });

        test.check("Unknown compressor is a ConfigError",
                   [&configs, &out]() {
                       return throws<ConfigError>([&configs, &out]() {
                           resolve(configs, { "-c", "rar", out });
                       });
                   });

        test.check("Unknown DEFAULT_COMPRESSOR is a ConfigError",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("bad-default.conf");
                       write_file(f, "DEFAULT_COMPRESSOR=rar\n");
                       StringVector files(configs);
                       files.push_back(f);
                       return throws<ConfigError>([&files, &out]() {
                           resolve(files, { out });
                       });
                   });

        test.check("Unconfigured compressor is a ConfigError",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("unset.conf");
                       write_file(f, "ZSTD_DECOMP=\n");
                       StringVector files(configs);
                       files.push_back(f);
                       return throws<ConfigError>([&files, &out]() {
                           resolve(files, { out });
                       });
                   });

        test.check("Missing compressor program is a ConfigError",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("missing-comp.conf");
                       write_file(f, "ZSTD_COMP=firmwarenator-no-such-zstd\n");
                       StringVector files(configs);
                       files.push_back(f);
                       return throws<ConfigError>([&files, &out]() {
                           resolve(files, { out });
                       });
                   });

        test.check("Missing decompressor program is a ConfigError",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("missing-decomp.conf");
                       write_file(f, "ZSTD_DECOMP='firmwarenator-unzstd -d'\n");
                       StringVector files(configs);
                       files.push_back(f);
                       return throws<ConfigError>([&files, &out]() {
                           resolve(files, { out });
                       });
                   });

        test.check("The image format ignores the compressor setup",
                   [&configs, &dir, &out]() {
                       FilePath f = dir;
                       f.appendPath("image.conf");
                       write_file(f, "ZSTD_COMP=firmwarenator-no-such-zstd\n");
                       StringVector files(configs);
                       files.push_back(f);
                       RunConfig rc = resolve(files, { "-s", out });
                       return rc.format == RunConfig::FORMAT_IMAGE;
                   });

        test.check("Existing IMGNAME without --force is a PreflightError",
                   [&configs, &existing]() {
                       return throws<PreflightError>([&configs, &existing]() {
                           resolve(configs, { existing });
                       });
                   });

        test.check("Existing IMGNAME with --force is accepted",
                   [&configs, &existing]() {
                       RunConfig rc = resolve(configs, { "-f", existing });
                       return rc.force && rc.output == existing &&
                           read_file(existing) == "old";
                   });

        test.check("Directory as IMGNAME is a PreflightError",
                   [&configs, &dir]() {
                       return throws<PreflightError>([&configs, &dir]() {
                           resolve(configs, { "-f", dir });
                       });
                   });

        test.check("Help and version are recognized",
                   []() {
                       StringVector args = { "firmwarenator", "-h", "-V" };
                       CharV argv(args);
                       int argc = argv.size();
                       OptionResolver resolver;
                       resolver.parseCommandline(argc, argv.data());
                       return resolver.helpRequested() &&
                           resolver.versionRequested();
                   });

        test.check("Help text lists the options",
                   []() {
                       OptionResolver resolver;
                       stringstream ss;
                       resolver.printHelp(ss);
                       string help = ss.str();
                       return help.find("IMGNAME") != string::npos &&
                           help.find("--compressor-args") != string::npos &&
                           help.find("dyndbg") != string::npos;
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
