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

#include <unistd.h>

#include "global.h"
#include "fileutil.h"
#include "debug.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;

// -----------------------------------------------------------------------------
static void make_link(const string &target, const string &name)
{
    if (symlink(target.c_str(), name.c_str()) != 0)
        throw KSystemError("Cannot create symlink " + name, errno);
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;
        TemporaryDirectory tmp("testfileutil.");
        FilePath dir = tmp.path().getCanonicalPath();

        FilePath(dir + "/a/b").mkdir(true);
        write_file(dir + "/a/b/file", "data");
        make_link("b", dir + "/a/rel");
        make_link(dir + "/a/b", dir + "/abs");
        make_link("loop2", dir + "/loop1");
        make_link("loop1", dir + "/loop2");

        test.check("dirName strips the last component",
                   []() {
                       FilePath p("/lib/firmware/ath10k/cal-pci.bin");
                       return p.dirName() == "/lib/firmware/ath10k";
                   });

        test.check("appendPath joins with one slash",
                   []() {
                       FilePath p("/tmp/");
                       p.appendPath("/lib").appendPath("firmware");
                       return p == "/tmp/lib/firmware";
                   });

        test.check("Canonical path removes '.' and '..'",
                   [&dir]() {
                       FilePath p = dir + "/./a/../a/b/./file";
                       return p.getCanonicalPath() == dir + "/a/b/file";
                   });

        test.check("Canonical path collapses slashes",
                   [&dir]() {
                       FilePath p = dir + "//a///b/";
                       return p.getCanonicalPath() == dir + "/a/b";
                   });

        test.check("Relative symlinks are resolved",
                   [&dir]() {
                       FilePath p = dir + "/a/rel/file";
                       return p.getCanonicalPath() == dir + "/a/b/file";
                   });

        test.check("Absolute symlinks are resolved",
                   [&dir]() {
                       FilePath p = dir + "/abs/new.img";
                       return p.getCanonicalPath() == dir + "/a/b/new.img";
                   });

        test.check("Missing trailing components are kept",
                   [&dir]() {
                       FilePath p = dir + "/a/x/y.img";
                       return p.getCanonicalPath() == dir + "/a/x/y.img";
                   });

        test.check("Relative paths start at the current directory",
                   []() {
                       FilePath p("fw.img");
                       return p.getCanonicalPath() ==
                           FilePath::getcwd().getCanonicalPath() + "/fw.img";
                   });

        test.check("'..' does not leave the root",
                   []() {
                       return FilePath("/../..").getCanonicalPath() == "/";
                   });

        test.check("Symlink loop throws",
                   [&dir]() {
                       FilePath p = dir + "/loop1/x";
                       return throws<KError>([&p]() {
                           p.getCanonicalPath();
                       });
                   });

        test.check("Regular file as a directory throws",
                   [&dir]() {
                       FilePath p = dir + "/a/b/file/x";
                       return throws<KError>([&p]() {
                           p.getCanonicalPath();
                       });
                   });

        test.check("readLink returns the link target",
                   [&dir]() {
                       return FilePath(dir + "/a/rel").readLink() == "b";
                   });

        test.check("exists and isDirectory",
                   [&dir]() {
                       return FilePath(dir + "/a").exists() &&
                           FilePath(dir + "/a").isDirectory() &&
                           !FilePath(dir + "/a/b/file").isDirectory() &&
                           !FilePath(dir + "/missing").exists();
                   });

        test.check("listDir is sorted and skips dot entries",
                   [&dir]() {
                       StringVector v = FilePath(dir).listDir();
                       return v.join(' ') == "a abs loop1 loop2";
                   });

        test.check("listDir of a missing directory throws",
                   [&dir]() {
                       return throws<KError>([&dir]() {
                           FilePath(dir + "/missing").listDir();
                       });
                   });

        test.check("Recursive mkdir and rmdir",
                   [&dir]() {
                       FilePath top = dir + "/tree";
                       FilePath(top + "/x/y/z").mkdir(true);
                       FilePath(top + "/x/y/z").mkdir(true);
                       write_file(top + "/x/y/f", "f");
                       make_link(dir + "/a", top + "/x/link");
                       top.rmdir(true);
                       return !top.exists() && FilePath(dir + "/a").exists();
                   });

        test.check("remove deletes a file",
                   [&dir]() {
                       FilePath f = dir + "/removeme";
                       write_file(f, "x");
                       f.remove();
                       return !f.exists() &&
                           throws<KError>([&f]() { f.remove(); });
                   });

        test.check("Temporary directory is removed with its contents",
                   []() {
                       FilePath path;
                       {
                           TemporaryDirectory t("testfileutil.");
                           path = t.path();
                           FilePath(path + "/sub").mkdir(false);
                           write_file(path + "/sub/file", "x");
                           if (!path.isDirectory())
                               return false;
                       }
                       return !path.exists();
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
