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
#include "quotedstring.h"

using std::string;

//{{{ QuotedString -------------------------------------------------------------

// -----------------------------------------------------------------------------
QuotedString::~QuotedString()
{
}

//}}}
//{{{ ShellQuotedString --------------------------------------------------------

// -----------------------------------------------------------------------------
static bool is_shell_safe(const char c)
{
    return (c >= '0' && c <= '9') ||
        (c >= 'A' && c <= 'Z') ||
        (c >= 'a' && c <= 'z') ||
        (c == '_' || c == '/' || c == '@' || c == '-' ||
         c == '.' || c == ',' || c == ':' || c == '=');
}

// -----------------------------------------------------------------------------
string ShellQuotedString::quoted(void) const
{
    if (empty())
        return "''";

    string ret;
    bool quotes_needed = false;
    for (const_iterator it = begin(); it != end(); ++it) {
        if (!is_shell_safe(*it))
            quotes_needed = true;
        if (*it == '\'')
            ret.append("'\\''");
        else
            ret.push_back(*it);
    }
    if (quotes_needed) {
        ret.insert(0, "'");
        ret.push_back('\'');
    }
    return ret;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
