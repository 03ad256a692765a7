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
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>

#include "configparser.h"
#include "debug.h"
#include "stringutil.h"
#include "process.h"
#include "quotedstring.h"

using std::string;
using std::ifstream;
using std::stringstream;

//{{{ ConfigParser -------------------------------------------------------------

// -----------------------------------------------------------------------------
void ConfigParser::addVariable(const string &name, const string &defvalue)
{
    Debug::debug()->trace("ConfigParser: Adding %s to variable list"
	" (default: '%s')", name.c_str(), defvalue.c_str());

    // add the default value to the map
    m_variables[name] = defvalue;
}

// -----------------------------------------------------------------------------
string ConfigParser::getValue(const std::string &name) const
{
    StringStringMap::const_iterator loc = m_variables.find(name);

    if (loc == m_variables.end())
        throw KError("Variable " + name + " does not exist.");

    return loc->second;
}

//}}}
//{{{ ShellConfigParser --------------------------------------------------------

// -----------------------------------------------------------------------------
ShellConfigParser::ShellConfigParser(const string &filename)
    : ConfigParser(filename)
{}

// -----------------------------------------------------------------------------
void ShellConfigParser::parse()
{
    // check if the configuration file can be read
    ifstream fin(m_configFile.c_str());
    if (!fin)
        throw ConfigError("Cannot open config file " + m_configFile +
                          " (" + std::strerror(errno) + ")");
    fin.close();

    // build the shell snippet
    stringstream shell;
    shell << "set -e\n";

    // set default values
    for (StringStringMap::const_iterator it = m_variables.begin();
            it != m_variables.end(); ++it) {
        const string name = it->first;
	ShellQuotedString value(it->second);

        shell << name << "=" << value.quoted() << "\n";
    }

    // output of the config file must not mix with the values
    shell << ". " << ShellQuotedString(m_configFile).quoted() << " >&2\n";

    for (StringStringMap::const_iterator it = m_variables.begin();
            it != m_variables.end(); ++it) {
        const string name = it->first;

        shell << "printf '%s=%s\\n' " << name << " \"$" << name << "\"\n";
    }

    stringstream shelloutput, shellerrors;

    ProcessFilter p;
    p.setStdin(&shell);
    p.setStdout(&shelloutput);
    p.setStderr(&shellerrors);
    uint8_t ret = p.execute("/bin/sh", StringVector());
    if (ret != 0) {
        KString errors(shellerrors.str());
        throw ConfigError("Cannot evaluate config file " + m_configFile +
                          ": " + errors.trim());
    }

    string s;
    int no = 1;
    while (getline(shelloutput, s)) {
        Debug::debug()->trace("ShellConfigParser: Parsing line %s", s.c_str());

        string::size_type loc = s.find('=');
        if (loc == string::npos)
            throw ConfigError("Parsing line number " +
                Stringutil::number2string(no) + " of " + m_configFile +
                " failed.");

        string name = s.substr(0, loc);
        string value = s.substr(loc+1);

        // a line without a known name is the continuation of a
        // multi-line value
        if (m_variables.find(name) == m_variables.end())
            throw ConfigError("Multi-line value in " + m_configFile +
                " (line " + Stringutil::number2string(no) + ")");

        Debug::debug()->trace("ShellConfigParser: Setting %s to %s",
            name.c_str(), value.c_str());

        m_variables[name] = value;
        ++no;
    }
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
