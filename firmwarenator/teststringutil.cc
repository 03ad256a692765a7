/*
 * (c) 2013, Petr Tesarik <ptesarik@suse.de>, SUSE LINUX Products GmbH
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
#include "debug.h"
#include "stringutil.h"
#include "stringvector.h"
#include "quotedstring.h"
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

        KString const empty;
        KString const s("lib/firmware/ath10k");

        // KString::startsWith()
        test.check("Empty string starts with an empty string",
                   [&empty]() {
                       return empty.startsWith("");
                   });

        test.check("Prefix string matches",
                   [&s]() {
                       return s.startsWith("lib/") && !s.startsWith("/lib");
                   });

        test.check("String does not start with a longer string",
                   [&s]() {
                       return !s.startsWith(s + "/");
                   });

        // KString::trim()
        test.check("Blanks are trimmed on both sides",
                   []() {
                       KString t(" \t-q -15\n");
                       return t.trim() == "-q -15";
                   });

        test.check("Trimming only blanks gives an empty string",
                   []() {
                       KString t(" \t \n");
                       return t.trim().empty();
                   });

        test.check("Quotes are trimmed with a custom set",
                   []() {
                       KString t("\"/lib/firmware/a.bin\"");
                       return t.trim("\"") == "/lib/firmware/a.bin";
                   });

        test.check("rtrim keeps leading characters",
                   []() {
                       KString t("//lib/firmware//");
                       return t.rtrim("/") == "//lib/firmware";
                   });

        // KString::split()
        test.check("Split keeps empty components",
                   []() {
                       StringVector v = KString("a//b").split('/');
                       return v.size() == 3 && v[0] == "a" &&
                           v[1].empty() && v[2] == "b";
                   });

        test.check("Split without separator gives one element",
                   []() {
                       StringVector v = KString("iwlwifi-1.ucode").split('/');
                       return v.size() == 1 && v[0] == "iwlwifi-1.ucode";
                   });

        // Stringutil
        test.check("toUpper",
                   []() {
                       return Stringutil::toUpper("bzip2") == "BZIP2";
                   });

        test.check("toLower",
                   []() {
                       return Stringutil::toLower("ZStd") == "zstd";
                   });

        test.check("number2string",
                   []() {
                       return Stringutil::number2string(127) == "127";
                   });

        // StringVector
        test.check("appendWords splits on blanks",
                   []() {
                       StringVector v;
                       v.push_back("xz");
                       v.appendWords("  --check=crc32\t--lzma2=dict=1MiB \n");
                       return v.size() == 3 && v[1] == "--check=crc32" &&
                           v[2] == "--lzma2=dict=1MiB";
                   });

        test.check("appendWords of a blank string adds nothing",
                   []() {
                       StringVector v;
                       v.appendWords(" \t");
                       return v.empty();
                   });

        test.check("join",
                   []() {
                       StringVector v;
                       v.appendWords("lzop -d");
                       return v.join(' ') == "lzop -d" &&
                           StringVector().join(' ').empty();
                   });

        test.check("append",
                   []() {
                       StringVector a = { "-o", "-H" };
                       StringVector b = { "newc" };
                       a.append(b);
                       return a.join(' ') == "-o -H newc";
                   });

        // ShellQuotedString
        test.check("Safe strings are not quoted",
                   []() {
                       return ShellQuotedString("--lzma2=dict=1MiB").quoted()
                           == "--lzma2=dict=1MiB";
                   });

        test.check("Empty string is quoted",
                   []() {
                       return ShellQuotedString("").quoted() == "''";
                   });

        test.check("Blanks are quoted",
                   []() {
                       return ShellQuotedString("-q -15").quoted()
                           == "'-q -15'";
                   });

        test.check("Single quotes are escaped",
                   []() {
                       return ShellQuotedString("it's").quoted()
                           == "'it'\\''s'";
                   });

        test.check("Shell expansions are quoted",
                   []() {
                       return ShellQuotedString("$HOME").quoted()
                           == "'$HOME'";
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
