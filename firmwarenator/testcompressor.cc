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
#include <string>

#include "global.h"
#include "compressor.h"
#include "configuration.h"
#include "fileutil.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;
        TemporaryDirectory tmp("testcompressor.");

        test.check("Names are parsed case-insensitively",
                   []() {
                       return CompressorTable::parseName("zstd") ==
                           CompressorTable::COMP_ZSTD &&
                           CompressorTable::parseName("XZ") ==
                           CompressorTable::COMP_XZ &&
                           CompressorTable::parseName("BZip2") ==
                           CompressorTable::COMP_BZIP2 &&
                           CompressorTable::parseName("None") ==
                           CompressorTable::COMP_NONE;
                   });

        test.check("Unknown name is a ConfigError",
                   []() {
                       return throws<ConfigError>([]() {
                           CompressorTable::parseName("rar");
                       });
                   });

        test.check("Empty name is a ConfigError",
                   []() {
                       return throws<ConfigError>([]() {
                           CompressorTable::parseName("");
                       });
                   });

        test.check("Canonical names round-trip",
                   []() {
                       for (int i = 0; i < CompressorTable::COMP_MAX; ++i) {
                           CompressorTable::Compressor comp =
                               static_cast<CompressorTable::Compressor>(i);
                           if (CompressorTable::parseName(
                                   CompressorTable::name(comp)) != comp)
                               return false;
                       }
                       return true;
                   });

        test.check("Every built-in profile is complete",
                   []() {
                       Configuration config;
                       CompressorTable table(config);
                       for (int i = CompressorTable::COMP_NONE + 1;
                               i < CompressorTable::COMP_MAX; ++i) {
                           const CompressorProfile *p = table.find(
                               static_cast<CompressorTable::Compressor>(i));
                           if (!p || p->compress.empty() ||
                                   p->decompress.empty())
                               return false;
                       }
                       return true;
                   });

        test.check("Built-in zstd profile",
                   []() {
                       Configuration config;
                       CompressorTable table(config);
                       const CompressorProfile *p =
                           table.find(CompressorTable::COMP_ZSTD);
                       return p && p->compress == "zstd" &&
                           p->compressArgs.join(' ') == "-q -15 -T0" &&
                           p->decompress == "unzstd";
                   });

        test.check("Built-in lzop decompressor has arguments",
                   []() {
                       Configuration config;
                       CompressorTable table(config);
                       const CompressorProfile *p =
                           table.find(CompressorTable::COMP_LZOP);
                       return p && p->decompress == "lzop -d";
                   });

        test.check("'none' has no profile",
                   []() {
                       Configuration config;
                       CompressorTable table(config);
                       return table.find(CompressorTable::COMP_NONE) == NULL;
                   });

        test.check("Undefined profile is absent",
                   [&tmp]() {
                       FilePath f = tmp.path();
                       f.appendPath("undefined.conf");
                       write_file(f, "LZ4_COMP=\nXZ_DECOMP='  '\n");
                       Configuration config;
                       config.readFile(f);
                       CompressorTable table(config);
                       return table.find(CompressorTable::COMP_LZ4) == NULL &&
                           table.find(CompressorTable::COMP_XZ) == NULL &&
                           table.find(CompressorTable::COMP_GZIP) != NULL;
                   });

        test.check("Configured arguments are split into words",
                   [&tmp]() {
                       FilePath f = tmp.path();
                       f.appendPath("args.conf");
                       write_file(f, "GZIP_COMP=pigz\n"
                                     "GZIP_COMP_ARGS=' -n  -9\t-p 4 '\n");
                       Configuration config;
                       config.readFile(f);
                       CompressorTable table(config);
                       const CompressorProfile *p =
                           table.find(CompressorTable::COMP_GZIP);
                       return p && p->compress == "pigz" &&
                           p->compressArgs.size() == 4 &&
                           p->compressArgs.join(' ') == "-n -9 -p 4";
                   });

        test.check("Options in <NAME>_COMP are split off the program",
                   [&tmp]() {
                       FilePath f = tmp.path();
                       f.appendPath("compopts.conf");
                       write_file(f, "GZIP_COMP=' gzip  -n '\n"
                                     "GZIP_COMP_ARGS=-9\n");
                       Configuration config;
                       config.readFile(f);
                       CompressorTable table(config);
                       const CompressorProfile *p =
                           table.find(CompressorTable::COMP_GZIP);
                       return p && p->compress == "gzip" &&
                           p->compressOptions.size() == 1 &&
                           p->compressOptions[0] == "-n" &&
                           p->compressArgs.join(' ') == "-9";
                   });

        test.check("Empty argument list is allowed",
                   [&tmp]() {
                       FilePath f = tmp.path();
                       f.appendPath("noargs.conf");
                       write_file(f, "BZIP2_COMP_ARGS=\n");
                       Configuration config;
                       config.readFile(f);
                       CompressorTable table(config);
                       const CompressorProfile *p =
                           table.find(CompressorTable::COMP_BZIP2);
                       return p && p->compressArgs.empty();
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
