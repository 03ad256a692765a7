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
#include "stringvector.h"

using std::string;

//{{{ StringVector -------------------------------------------------------------

// -----------------------------------------------------------------------------
string StringVector::join(char joiner) const
{
    string result;
    const_iterator it = begin();

    if (it != end()) {
        result = *it;
        while (++it != end()) {
            result += joiner;
            result += *it;
        }
    }

    return result;
}

// -----------------------------------------------------------------------------
StringVector& StringVector::append(const StringVector &other)
{
    insert(end(), other.begin(), other.end());
    return *this;
}

// -----------------------------------------------------------------------------
StringVector& StringVector::appendWords(const string &s)
{
    static const char blanks[] = " \t\n";

    string::size_type start = s.find_first_not_of(blanks);
    while (start != string::npos) {
        string::size_type stop = s.find_first_of(blanks, start);
        if (stop == string::npos) {
            push_back(s.substr(start));
            break;
        }
        push_back(s.substr(start, stop - start));
        start = s.find_first_not_of(blanks, stop);
    }

    return *this;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
