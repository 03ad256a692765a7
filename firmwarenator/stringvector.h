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
#ifndef STRINGVECTOR_H
#define STRINGVECTOR_H

#include <string>
#include <vector>
#include <initializer_list>

//{{{ StringVector -------------------------------------------------------------

/**
 * Argument lists for child processes and path component lists.
 */
class StringVector : public std::vector<std::string>
{
    public:
        StringVector()
            : std::vector<std::string>()
        { }
        template <class InputIterator>
                StringVector(InputIterator first, InputIterator last)
                : std::vector<std::string>(first, last)
        { }
        StringVector(const std::vector<std::string>& x)
                : std::vector<std::string>(x)
        { }
        StringVector(std::initializer_list<value_type> il)
                :  std::vector<std::string>(il)
        { }

        /**
         * Join elements into a single string.
         *
         * @param[in] joiner element separator
         * @return the resulting string
         */
        std::string join(char joiner) const;

        /**
         * Append all elements of another vector.
         *
         * @param[in] other elements to append
         * @return reference to this instance
         */
        StringVector& append(const StringVector &other);

        /**
         * Split @p s at runs of blanks (space, tab, newline) and append
         * the non-empty words.
         *
         * @param[in] s the string to split
         * @return reference to this instance
         */
        StringVector& appendWords(const std::string &s);
};

//}}}

#endif /* STRINGVECTOR_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
