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
#include <iostream>
#include <cstring>
#include <vector>

#include <getopt.h>
#include <unistd.h>

#include "global.h"
#include "optionparser.h"

using std::string;
using std::endl;
using std::ostream;
using std::vector;

/* -------------------------------------------------------------------------- */
void OptionParser::addOption(Option *option)
{
    m_options.push_back(option);
}

/* -------------------------------------------------------------------------- */
void OptionParser::parse(int argc, char *argv[])
{
    OptionList::const_iterator it;
    vector<struct option> opt(m_options.size() + 1);
    struct option *cur;

    // leading ':' to distinguish a missing argument from an unknown option
    string getopt_string = ":";

    // get a struct option array from the list
    cur = opt.data();
    for (it = m_options.begin(); it != m_options.end(); ++it)
        getopt_string += (*it)->getoptArgs(cur++);
    std::memset(cur, 0, sizeof(struct option));

    // now parse the options
    optind = 0;
    opterr = 0;
    for (;;) {
        int option_index = 0;

        int c = getopt_long(argc, argv, getopt_string.c_str(),
                opt.data(), &option_index);
        if (c == -1)
            break;

        if (c == ':')
            throw UsageError(string("Option ") + argv[optind - 1] +
                             " requires an argument.");
        if (c == '?') {
            if (optopt)
                throw UsageError(string("Invalid command line option -") +
                                 char(optopt) + ".");
            throw UsageError(string("Invalid command line option ") +
                             argv[optind - 1] + ".");
        }

        for (it = m_options.begin(); it != m_options.end(); ++it) {
            if ((*it)->getLetter() == c) {
                (*it)->setValue(optarg);
                break;
            }
        }
        if (it == m_options.end())
            throw UsageError("Invalid command line option");
    }

    // save arguments
    m_args.clear();
    while (optind < argc)
        m_args.push_back(argv[optind++]);
}

// -----------------------------------------------------------------------------
void OptionParser::printHelp(ostream &os, const string &usage) const
{
    os << usage << endl << endl;
    os << "Options" << endl << endl;

    for (OptionList::const_iterator it = m_options.begin();
            it != m_options.end(); ++it) {
        const Option *opt = *it;

        os << "   --" << opt->getLongName();
        const char *placeholder = opt->getPlaceholder();
        if (placeholder)
            os << "=" << placeholder;
        os << " | -" << opt->getLetter();
        if (placeholder)
            os << " " << placeholder;
        os << endl;
        os << "        " << opt->getDescription() << endl;
    }
}

// vim: set sw=4 ts=4 et fdm=marker: :collapseFolds=1:
