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
#include <cctype>

#include "stringutil.h"
#include "global.h"

using std::string;

//{{{ Stringutil ---------------------------------------------------------------

// -----------------------------------------------------------------------------
string Stringutil::toUpper(const string &s)
{
    string ret(s);
    for (string::iterator it = ret.begin(); it != ret.end(); ++it)
        *it = std::toupper(static_cast<unsigned char>(*it));
    return ret;
}

// -----------------------------------------------------------------------------
string Stringutil::toLower(const string &s)
{
    string ret(s);
    for (string::iterator it = ret.begin(); it != ret.end(); ++it)
        *it = std::tolower(static_cast<unsigned char>(*it));
    return ret;
}

//}}}
//{{{ KString ------------------------------------------------------------------

// -----------------------------------------------------------------------------
KString& KString::trim(const char *chars)
{
    return rtrim(chars).ltrim(chars);
}

// -----------------------------------------------------------------------------
KString& KString::ltrim(const char *chars)
{
    erase(0, find_first_not_of(chars));
    return *this;
}

// -----------------------------------------------------------------------------
KString& KString::rtrim(const char *chars)
{
    erase(find_last_not_of(chars) + 1);
    return *this;
}

// -----------------------------------------------------------------------------
bool KString::startsWith(const string &part) const
{
    return compare(0, part.length(), part) == 0;
}

// -----------------------------------------------------------------------------
StringVector KString::split(char split) const
{
    StringVector ret;

    size_type start = 0;
    size_type next = find(split);
    while (next != npos) {
        ret.push_back(substr(start, next - start));
        start = next + 1;
        next = find(split, start);
    }

    // rest
    ret.push_back(substr(start));

    return ret;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
