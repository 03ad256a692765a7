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
#include <string>
#include <iostream>
#include <cstdlib>
#include <stdexcept>

#include "global.h"
#include "configparser.h"
#include "configuration.h"
#include "fileutil.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;

// -----------------------------------------------------------------------------
static FilePath config_file(const TemporaryDirectory &tmp, const string &name,
                            const string &contents)
{
    FilePath path = tmp.path();
    path.appendPath(name);
    write_file(path, contents);
    return path;
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;
        TemporaryDirectory tmp("testconfig.");

        // ShellConfigParser
        test.check("Unset variables keep their default",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "plain", "# nothing\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("XZ_COMP", "xz");
                       cp.parse();
                       return cp.getValue("XZ_COMP") == "xz";
                   });

        test.check("Variables are set by the file",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "set",
                           "XZ_COMP_ARGS=\"-T0 -6\"\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("XZ_COMP_ARGS", "-9");
                       cp.parse();
                       return cp.getValue("XZ_COMP_ARGS") == "-T0 -6";
                   });

        test.check("Defaults are visible to the file",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "expand",
                           "GZIP_COMP_ARGS=\"$GZIP_COMP_ARGS --rsyncable\"\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("GZIP_COMP_ARGS", "-n -9");
                       cp.parse();
                       return cp.getValue("GZIP_COMP_ARGS") ==
                           "-n -9 --rsyncable";
                   });

        test.check("Quotes in values survive",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "quotes",
                           "LZ4_DECOMP=\"sh -c 'unlz4'\"\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("LZ4_DECOMP", "it's");
                       cp.parse();
                       return cp.getValue("LZ4_DECOMP") == "sh -c 'unlz4'";
                   });

        test.check("Output of the file is ignored",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "noisy",
                           "echo hello\nLZOP_COMP=lzop\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("LZOP_COMP", "");
                       cp.parse();
                       return cp.getValue("LZOP_COMP") == "lzop";
                   });

        test.check("Unknown variable name throws",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "unknown", "\n");
                       ShellConfigParser cp(f);
                       return throws<KError>([&cp]() {
                           cp.getValue("NO_SUCH_VARIABLE");
                       });
                   });

        test.check("Multi-line value is a ConfigError",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "multiline",
                           "XZ_COMP='xz\nfoo'\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("XZ_COMP", "xz");
                       return throws<ConfigError>([&cp]() { cp.parse(); });
                   });

        test.check("Shell syntax error is a ConfigError",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "broken",
                           "if then fi (\n");
                       ShellConfigParser cp(f);
                       cp.addVariable("XZ_COMP", "xz");
                       return throws<ConfigError>([&cp]() { cp.parse(); });
                   });

        test.check("Missing file is a ConfigError",
                   [&tmp]() {
                       FilePath f = tmp.path();
                       f.appendPath("missing");
                       ShellConfigParser cp(f);
                       return throws<ConfigError>([&cp]() { cp.parse(); });
                   });

        // Configuration
        test.check("Built-in defaults",
                   []() {
                       Configuration config;
                       return config.DEFAULT_COMPRESSOR.value() == "zstd" &&
                           config.ZSTD_COMP.value() == "zstd" &&
                           config.ZSTD_COMP_ARGS.value() == "-q -15 -T0" &&
                           config.LZOP_DECOMP.value() == "lzop -d" &&
                           config.ZSTD_COMP.isDefault();
                   });

        test.check("find() returns options by name",
                   []() {
                       Configuration config;
                       const ConfigOption *opt = config.find("GZIP_COMP_ARGS");
                       return opt && opt->valueAsString() == "-n -9" &&
                           config.find("gzip_comp_args") == NULL;
                   });

        test.check("Later files override earlier files",
                   [&tmp]() {
                       FilePath sys = config_file(tmp, "system.conf",
                           "DEFAULT_COMPRESSOR=xz\nXZ_COMP_ARGS=-6\n");
                       FilePath user = config_file(tmp, "user.conf",
                           "XZ_COMP_ARGS=\"$XZ_COMP_ARGS -T0\"\n");
                       Configuration config;
                       config.readFile(sys);
                       config.readFile(user);
                       return config.DEFAULT_COMPRESSOR.value() == "xz" &&
                           config.XZ_COMP_ARGS.value() == "-6 -T0" &&
                           !config.XZ_COMP_ARGS.isDefault() &&
                           config.XZ_COMP.value() == "xz";
                   });

        test.check("readFileIfExists() skips missing files",
                   [&tmp]() {
                       FilePath f = tmp.path();
                       f.appendPath("does-not-exist");
                       Configuration config;
                       return !config.readFileIfExists(f) &&
                           config.DEFAULT_COMPRESSOR.isDefault();
                   });

        test.check("readFileIfExists() reads existing files",
                   [&tmp]() {
                       FilePath f = config_file(tmp, "exists",
                           "DEFAULT_COMPRESSOR=none\n");
                       Configuration config;
                       return config.readFileIfExists(f) &&
                           config.DEFAULT_COMPRESSOR.value() == "none";
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
