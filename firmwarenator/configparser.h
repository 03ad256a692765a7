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
#ifndef CONFIGPARSER_H
#define CONFIGPARSER_H

#include <string>

#include "global.h"

//{{{ ConfigParser -------------------------------------------------------------

/**
 * Parses a configuration file. Only variables registered with
 * addVariable() are read; all others are ignored.
 */
class ConfigParser {

    public:

        /**
         * Creates a new ConfigParser object with the specified file name
         * as configuration file.
         *
         * @param[in] filename the file name of the configuration file
         *            (here it is not checked if the file exists)
         */
        ConfigParser(const std::string &filename)
	: m_configFile(filename)
	{}

        virtual ~ConfigParser()
        {}

        /**
         * Adds a variable which should be parsed.
         *
         * @param[in] name the name of the variable
	 * @param[in] defvalue default value for the variable
         */
        void addVariable(const std::string &name, const std::string &defvalue);

        /**
         * Parse the configuration file.
         *
         * @exception ConfigError if opening of the file failed or if the
         *            file cannot be evaluated
         */
        virtual void parse() = 0;

        /**
         * Returns the value of the specified configuration option.
         *
         * @param[in] name the configuration option (case matters)
         * @return the value
         *
         * @exception KError if the value cannot be found
         */
        std::string getValue(const std::string &name) const;

    protected:
        std::string m_configFile;
        StringStringMap m_variables;
};

//}}}
//{{{ ShellConfigParser --------------------------------------------------------

/**
 * Parser for configuration files in shell syntax. The file is sourced by
 * /bin/sh with all registered variables preset to their defaults, so
 * the file may refer to other variables and use any shell construct.
 */
class ShellConfigParser : public ConfigParser {

    public:

        /**
         * Creates a new ShellConfigParser object with the specified file
         * name as configuration file.
         *
         * @param[in] filename the file name of the configuration file
         *            (here it is not checked if the file exists)
         */
        ShellConfigParser(const std::string &filename);

        /**
         * Parse the configuration file.
         *
         * @exception ConfigError if opening of the file failed or if the
         *            shell that evaluates the file fails
         */
        virtual void parse();
};

//}}}

#endif /* CONFIGPARSER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
