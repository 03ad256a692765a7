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
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>
#include <sys/types.h>
#include <sys/stat.h>

#include "global.h"
#include "util.h"
#include "debug.h"
#include "fileutil.h"
#include "stringutil.h"

using std::string;

// -----------------------------------------------------------------------------
string Util::getenv(const string &env, const string &defaultValue, bool *isDefault)
{
    char *ret = ::getenv(env.c_str());
    if (ret == NULL) {
        if (isDefault) {
            *isDefault = true;
        }
        return defaultValue;
    } else {
        if (isDefault) {
            *isDefault = false;
        }
        return string(ret);
    }
}

// -----------------------------------------------------------------------------
string Util::getHomeDir()
{
    bool isDefault;
    string home = getenv("HOME", "", &isDefault);
    if (!isDefault)
        return home;

    struct passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir)
        return string(pw->pw_dir);

    return string();
}

// -----------------------------------------------------------------------------
static bool is_executable(const string &path)
{
    struct stat mystat;
    if (stat(path.c_str(), &mystat) != 0)
        return false;
    return S_ISREG(mystat.st_mode) && access(path.c_str(), X_OK) == 0;
}

// -----------------------------------------------------------------------------
string Util::findExecutable(const string &name)
{
    Debug::debug()->trace("Util::findExecutable(%s)", name.c_str());

    if (name.empty())
        return string();

    if (name.find('/') != string::npos)
        return is_executable(name) ? name : string();

    KString path(getenv("PATH", "/usr/local/bin:/usr/bin:/bin"));
    StringVector dirs = path.split(':');
    for (StringVector::const_iterator it = dirs.begin();
            it != dirs.end(); ++it) {
        // an empty PATH element means the current directory
        FilePath candidate(it->empty() ? string(".") : *it);
        candidate.appendPath(name);
        if (is_executable(candidate)) {
            Debug::debug()->trace("Found %s", candidate.c_str());
            return candidate;
        }
    }

    return string();
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
