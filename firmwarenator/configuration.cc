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

#include "configuration.h"
#include "configparser.h"
#include "fileutil.h"
#include "debug.h"

using std::string;

//{{{ StringConfigOption -------------------------------------------------------

// -----------------------------------------------------------------------------
string StringConfigOption::valueAsString() const
{
    return m_value;
}

// -----------------------------------------------------------------------------
void StringConfigOption::update(const string &value)
{
    m_value = value;
}

//}}}
//{{{ Configuration ------------------------------------------------------------

// -----------------------------------------------------------------------------
Configuration::Configuration()
    :
#define DEFINE_OPT(name, type, defval)				\
    name (#name, defval),
#include "define_opt.h"
#undef DEFINE_OPT
    m_options()
{
#define DEFINE_OPT(name, type, defval)				\
    m_options.push_back(&name);
#include "define_opt.h"
#undef DEFINE_OPT
}

// -----------------------------------------------------------------------------
void Configuration::readFile(const string &filename)
{
    Debug::debug()->dbg("Reading configuration file %s", filename.c_str());

    ShellConfigParser cp(filename);

    std::vector<ConfigOption*>::iterator it;
    for (it = m_options.begin(); it != m_options.end(); ++it) {
        ConfigOption *opt = *it;
        cp.addVariable(opt->name(), opt->valueAsString());
    }

    cp.parse();

    for (it = m_options.begin(); it != m_options.end(); ++it) {
        ConfigOption *opt = *it;
        opt->update(cp.getValue(opt->name()));
    }
}

// -----------------------------------------------------------------------------
bool Configuration::readFileIfExists(const string &filename)
{
    if (filename.empty() || !FilePath(filename).exists()) {
        Debug::debug()->trace("Configuration file %s not present",
                              filename.c_str());
        return false;
    }

    readFile(filename);
    return true;
}

// -----------------------------------------------------------------------------
const ConfigOption *Configuration::find(const string &name) const
{
    for (ConfigOptionIterator it = m_options.begin();
            it != m_options.end(); ++it) {
        if (name == (*it)->name())
            return *it;
    }
    return NULL;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
