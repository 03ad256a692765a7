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
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <libgen.h>
#include <dirent.h>
#include <sys/param.h>

#include "global.h"
#include "debug.h"
#include "fileutil.h"
#include "stringutil.h"
#include "util.h"

using std::string;
using std::strcpy;
using std::free;

//{{{ FilePath -----------------------------------------------------------------

const string FilePath::m_slash("/");

// -----------------------------------------------------------------------------
FilePath FilePath::getcwd(void)
{
    char *cwd = ::getcwd(NULL, 0);

    if (!cwd)
        throw KSystemError("getcwd failed", errno);

    FilePath ret(cwd);
    free(cwd);
    Debug::debug()->trace("Current directory: " + ret);

    return ret;
}

// -----------------------------------------------------------------------------
string FilePath::dirName() const
{
    // modification of the arguments is allowed
    char *path = new char[length() + 1];
    strcpy(path, c_str());
    string ret(::dirname(path));
    delete[] path;
    return ret;
}

// -----------------------------------------------------------------------------
FilePath& FilePath::appendPath(const string &p)
{
    rtrim(PATH_SEPARATOR);
    append(PATH_SEPARATOR);
    size_type idx = p.find_first_not_of(PATH_SEPARATOR);
    if (idx != npos)
        append(p.substr(idx));
    return *this;
}

// -----------------------------------------------------------------------------
bool FilePath::exists() const
{
    struct stat mystat;
    int ret = stat(c_str(), &mystat);
    return ret == 0;
}

// -----------------------------------------------------------------------------
bool FilePath::isDirectory() const
{
    struct stat mystat;

    int ret = lstat(c_str(), &mystat);
    if (ret < 0)
        throw KSystemError("Stat of " + *this + " failed", errno);

    return S_ISDIR(mystat.st_mode);
}

// -----------------------------------------------------------------------------
string FilePath::readLink() const
{
    char buffer[BUFSIZ];

    int ret = ::readlink(c_str(), buffer, BUFSIZ-1);
    if (ret < 0) {
        throw KSystemError("readlink() failed", errno);
    }

    buffer[ret] = '\0';
    return string(buffer);
}

// -----------------------------------------------------------------------------
FilePath FilePath::getCanonicalPath(const string &root) const
{
    Debug::debug()->trace("getCanonicalPath(%s, %s)",
                          c_str(), root.c_str());

    if (empty())
        return *this;

    const string *rootp = root.empty() ? &m_slash : &root;

    // Use the current directory for relative paths
    FilePath ret;
    const_iterator p = begin();
    if (*p != '/') {
        ret = getcwd();

        if (ret.size() < rootp->size() ||
            ret.substr(0, rootp->size()) != *rootp)
            throw KSystemError("Cannot get current directory", ENOENT);
    } else
        ret = *rootp;

    string extra;
    int num_links = 0;
    const string *rpath = this;
    while (p != rpath->end()) {
        // Skip sequence of multiple path-separators.
        while (p != rpath->end() && *p == '/')
            ++p;

        // Find end of path component.
        const_iterator dirp = p;
        while (p != rpath->end() && *p != '/')
            ++p;
        string dir(dirp, p);

        // Handle the last component
        if (dir.empty())
            ;                   // extra slash(es) at end - ignore
        else if (dir == ".")
            ;                   // nothing
        else if (dir == "..") {
            // Back up to previous component
            if (ret.size() > rootp->size())
                ret.resize(ret.rfind('/'));
            if (ret.size() < rootp->size())
                ret = *rootp;
        } else {
            if (*ret.rbegin() != '/')
                ret += '/';
            ret += dir;

            struct stat st;
            if (lstat(ret.c_str(), &st) < 0) {
                if (errno == ENOENT)
                    ;           // non-existent elements will be created
                else
                    throw KSystemError("Stat failed", errno);
            } else if (S_ISLNK(st.st_mode)) {
                if (rpath == &extra) {
                    extra.replace(0, p - extra.begin(), ret.readLink());
                } else {
                    extra = ret.readLink();
                    extra.append(p, rpath->end());
                    rpath = &extra;
                }

                if (++num_links > MAXSYMLINKS)
                    throw KSystemError("getCanonicalPath() failed", ELOOP);

                p = rpath->begin();
                ret.resize(*p == '/' ? rootp->size() : ret.rfind('/'));
                if (ret.empty())
                    ret = m_slash;
            } else if (!S_ISDIR(st.st_mode) && p != rpath->end()) {
                throw KSystemError("getCanonicalPath() failed", ENOTDIR);
            }
        }
    }

    return ret;
}

// -----------------------------------------------------------------------------
static int filter_dots(const struct dirent *d)
{
    if (strcmp(d->d_name, ".") == 0)
        return 0;
    if (strcmp(d->d_name, "..") == 0)
        return 0;
    else
        return 1;
}

// -----------------------------------------------------------------------------
StringVector FilePath::listDir() const
{
    Debug::debug()->trace("FilePath::listDir(%s)", c_str());

    StringVector v;
    struct dirent **namelist;
    int count = scandir(c_str(), &namelist, filter_dots, alphasort);
    if (count < 0)
        throw KSystemError("Cannot scan directory " + *this + ".", errno);

    for (int i = 0; i < count; i++) {
        v.push_back(namelist[i]->d_name);
        free(namelist[i]);
    }
    free(namelist);

    return v;
}

// -----------------------------------------------------------------------------
void FilePath::mkdir(bool recursive)
{
    Debug::debug()->trace("mkdir(%s, %d)", c_str(), int(recursive));

    if (!recursive) {
        int ret = ::mkdir(c_str(), 0755);
        if (ret != 0 && errno != EEXIST)
            throw KSystemError("mkdir of " + *this + " failed.", errno);
    } else {
        FilePath directory = *this;

        // remove trailing '/' if there are any
        directory.rtrim(PATH_SEPARATOR);
        if (directory.empty())
            return;

        size_type current_slash = 0;

        while (true) {
            current_slash = directory.find('/', current_slash+1);
            if (current_slash == npos) {
                directory.mkdir(false);
                break;
            }

            FilePath fp = directory.substr(0, current_slash);
            fp.mkdir(false);
        }
    }
}

// -----------------------------------------------------------------------------
void FilePath::rmdir(bool recursive)
{
    Debug::debug()->trace("FilePath::rmdir(%s, %d)", c_str(), recursive);

    if (recursive) {
        StringVector contents = listDir();
        for (StringVector::const_iterator it = contents.begin();
                it != contents.end(); ++it) {
            FilePath fn = *this;
            fn.appendPath(*it);
            if (fn.isDirectory())
                fn.rmdir(true);
            else
                fn.remove();
        }
    }
    int ret = ::rmdir(c_str());
    if (ret != 0)
        throw KSystemError("Cannot rmdir(" + *this + ").", errno);
}

// -----------------------------------------------------------------------------
void FilePath::remove()
{
    Debug::debug()->trace("FilePath::remove(%s)", c_str());

    if (::unlink(c_str()) != 0)
        throw KSystemError("Cannot remove " + *this + ".", errno);
}

//}}}
//{{{ TemporaryDirectory -------------------------------------------------------

// -----------------------------------------------------------------------------
TemporaryDirectory::TemporaryDirectory(const string &prefix)
{
    FilePath tmpl(Util::getenv("TMPDIR", "/tmp"));
    if (tmpl.empty())
        tmpl = "/tmp";
    tmpl.appendPath(prefix + "XXXXXX");

    char *buf = new char[tmpl.length() + 1];
    strcpy(buf, tmpl.c_str());
    if (!mkdtemp(buf)) {
        int err = errno;
        delete[] buf;
        throw KSystemError("Cannot create temporary directory " + tmpl, err);
    }
    m_path = buf;
    delete[] buf;

    Debug::debug()->dbg("Created temporary directory %s", m_path.c_str());
}

// -----------------------------------------------------------------------------
TemporaryDirectory::~TemporaryDirectory()
{
    Debug::debug()->dbg("Removing temporary directory %s", m_path.c_str());
    try {
        m_path.rmdir(true);
    } catch (const KError &ke) {
        Debug::debug()->info("Cannot clean up %s: %s",
                             m_path.c_str(), ke.what());
    }
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
