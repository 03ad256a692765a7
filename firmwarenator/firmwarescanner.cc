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
#include <istream>
#include <sstream>
#include <string>

#include "firmwarescanner.h"
#include "global.h"
#include "debug.h"
#include "process.h"
#include "stringutil.h"

using std::istream;
using std::string;
using std::stringstream;

#define FIRMWARE_LOAD_RECORD    "Loading firmware from "

//{{{ FirmwareScanner ----------------------------------------------------------

// -----------------------------------------------------------------------------
FirmwareScanner::FirmwareScanner(const string &firmwareDir)
    : m_firmwareDir(firmwareDir)
{
    KString dir(m_firmwareDir);
    dir.rtrim(PATH_SEPARATOR);
    m_firmwareDir = dir;
}

// -----------------------------------------------------------------------------
bool FirmwareScanner::parseLine(const string &line, string &path) const
{
    string::size_type pos = line.find(FIRMWARE_LOAD_RECORD);
    if (pos == string::npos)
        return false;

    KString rest(line.substr(pos + sizeof(FIRMWARE_LOAD_RECORD) - 1));
    rest.rtrim(" \t\r\n");

    StringVector words;
    words.appendWords(rest);
    if (words.empty())
        return false;

    KString token(words.back());
    token.trim("\"");
    if (token.empty())
        return false;

    if (token[0] == '/') {
        string prefix = m_firmwareDir + PATH_SEPARATOR;
        if (!token.startsWith(prefix)) {
            Debug::debug()->info("Ignoring %s: not below %s",
                                 token.c_str(), m_firmwareDir.c_str());
            return false;
        }
        token.erase(0, prefix.length());
        token.ltrim(PATH_SEPARATOR);
        if (token.empty())
            return false;
    }

    path = token;
    return true;
}

// -----------------------------------------------------------------------------
StringSet FirmwareScanner::scan(istream &log) const
{
    StringSet ret;
    string line;

    while (getline(log, line)) {
        string path;
        if (!parseLine(line, path))
            continue;

        if (ret.insert(path).second)
            Debug::debug()->dbg("Found firmware %s", path.c_str());
        else
            Debug::debug()->trace("Duplicate firmware %s", path.c_str());
    }

    if (ret.empty())
        Debug::debug()->dbg("No firmware loads in the kernel log. "
                            "Is dynamic debug enabled for the firmware "
                            "loader?");

    return ret;
}

// -----------------------------------------------------------------------------
StringSet FirmwareScanner::scanKernelLog() const
{
    stringstream log, err;

    ProcessFilter p;
    p.setStdout(&log);
    p.setStderr(&err);
    uint8_t status = p.execute("dmesg", StringVector());
    if (status != 0) {
        KString msg(err.str());
        msg.trim();
        throw KError("dmesg failed with exit status " +
                     Stringutil::number2string(int(status)) +
                     (msg.empty() ? string(".") : ": " + msg));
    }

    return scan(log);
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
