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
#include <sstream>
#include <string>

#include "stagingarea.h"
#include "global.h"
#include "debug.h"
#include "process.h"
#include "stringutil.h"

using std::string;
using std::stringstream;

//{{{ StagingArea --------------------------------------------------------------

// -----------------------------------------------------------------------------
StagingArea::StagingArea(const string &firmwareDir)
    : m_firmwareDir(firmwareDir), m_tmpdir("firmwarenator.")
{
    FilePath dir = firmwareRoot();
    try {
        dir.mkdir(true);
    } catch (const KError &ke) {
        throw StagingError(ke.what());
    }
}

// -----------------------------------------------------------------------------
FilePath StagingArea::firmwareRoot() const
{
    FilePath ret = root();
    ret.appendPath(STAGING_FIRMWARE_SUBDIR);
    return ret;
}

// -----------------------------------------------------------------------------
static bool valid_relative_path(const KString &path)
{
    if (path.empty() || path[0] == '/')
        return false;

    StringVector components = path.split('/');
    for (StringVector::const_iterator it = components.begin();
            it != components.end(); ++it) {
        if (*it == "..")
            return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
void StagingArea::add(const string &path)
{
    Debug::debug()->trace("StagingArea::add(%s)", path.c_str());

    if (!valid_relative_path(path))
        throw StagingError("Invalid firmware path " + path + ".");

    FilePath source = m_firmwareDir;
    source.appendPath(path);
    if (!source.exists())
        throw StagingError("Firmware file " + source + " does not exist.");

    FilePath target = firmwareRoot();
    target.appendPath(path);

    FilePath targetDir = target.dirName();
    try {
        targetDir.mkdir(true);
    } catch (const KError &ke) {
        throw StagingError(ke.what());
    }

    stringstream err;
    ProcessFilter p;
    p.setStderr(&err);

    StringVector args;
    args.push_back("-p");
    args.push_back("--");
    args.push_back(source);
    args.push_back(target);
    uint8_t status = p.execute("cp", args);
    if (status != 0) {
        KString msg(err.str());
        msg.trim();
        if (msg.empty())
            msg = "cp failed with exit status " +
                Stringutil::number2string(int(status));
        throw StagingError("Cannot copy " + source + ": " + msg);
    }

    Debug::debug()->dbg("Staged %s", path.c_str());
}

// -----------------------------------------------------------------------------
void StagingArea::addAll(const StringSet &paths)
{
    for (StringSet::const_iterator it = paths.begin();
            it != paths.end(); ++it)
        add(*it);
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
