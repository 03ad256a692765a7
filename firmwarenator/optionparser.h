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
#ifndef OPTIONPARSER_H
#define OPTIONPARSER_H

#include <iosfwd>
#include <string>

#include "option.h"
#include "stringvector.h"

//{{{ OptionParser -------------------------------------------------------------

/**
 * Command line parser on top of getopt_long(3). Options and non-option
 * arguments may be mixed; everything that is not an option ends up in
 * getArgs().
 */
class OptionParser {
    public:
        /**
         * Add an option to the parser. The parser does not take ownership.
         *
         * @param option the option to be added
         */
        void addOption(Option *option);

        /**
         * Print the option list.
         *
         * @param[in] os the output stream
         * @param[in] usage first line of the output
         */
        void printHelp(std::ostream &os, const std::string &usage) const;

        /**
         * Parse the command line. Every recognized option is stored via
         * Option::setValue().
         *
         * @exception UsageError on an unknown option or a missing option
         *            argument
         */
        void parse(int argc, char *argv[]);

        const StringVector& getArgs() const
            { return m_args; }

    private:
        StringVector m_args;
        OptionList m_options;
};

//}}}

#endif /* OPTIONPARSER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
