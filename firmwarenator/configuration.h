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
#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include <vector>

#include "global.h"

//{{{ ConfigOption -------------------------------------------------------------

/**
 * A single configuration variable.
 */
class ConfigOption {

    public:
	ConfigOption(const char *name)
	: m_name(name)
	{ }

	virtual ~ConfigOption()
	{ }

	/**
	 * Return the name of the option.
	 */
	const char *name() const
	{ return m_name; }

	/**
	 * Return the string representation of the value.
	 */
	virtual std::string valueAsString() const = 0;

	/**
	 * Update the value from a parser.
	 *
	 * @param val new value of the option (as a string)
	 */
	virtual void update(const std::string &value) = 0;

	/**
	 * Return true if this option is assigned the default value.
	 */
	virtual bool isDefault(void) const = 0;

    protected:
	const char *const m_name;
};

//}}}
//{{{ StringConfigOption -------------------------------------------------------

class StringConfigOption : public ConfigOption {

    public:
	StringConfigOption(const char *name, const char *const defvalue)
	: ConfigOption(name), m_defvalue(defvalue), m_value(defvalue)
	{ }

	/**
	 * Get the config option value.
	 */
	const std::string &value(void) const
	{ return m_value; }

	virtual std::string valueAsString() const;
	virtual void update(const std::string &value);

	virtual bool isDefault(void) const
	{ return m_value == m_defvalue; }

    protected:
	const char *const m_defvalue;
	std::string m_value;
};

//}}}
//{{{ Configuration ------------------------------------------------------------

typedef std::vector<ConfigOption*>::const_iterator ConfigOptionIterator;

/**
 * Layered configuration. All options start with their built-in default;
 * every configuration file read afterwards sees the current values and
 * may override them, so later files take precedence over earlier ones.
 */
class Configuration {

    public:
        /**
         * Configuration options.
         */
#define DEFINE_OPT(name, type, defval)		\
        type ## ConfigOption name;
#include "define_opt.h"
#undef DEFINE_OPT

    public:
        Configuration();

        /**
         * Reads a configuration file.
         *
         * @param filename the file name to read
         * @exception ConfigError if the @c filename was not found or the
         *            shell that evaluates it fails
         */
        void readFile(const std::string &filename);

        /**
         * Reads a configuration file if it exists.
         *
         * @param filename the file name to read
         * @return @c true if the file was read, @c false if it does not
         *         exist
         * @exception ConfigError see readFile()
         */
        bool readFileIfExists(const std::string &filename);

        /**
         * Look up an option by its variable name.
         *
         * @param name the variable name (case matters)
         * @return the option, or NULL if there is no such variable
         */
        const ConfigOption *find(const std::string &name) const;

	ConfigOptionIterator optionsBegin() const
	{ return m_options.begin(); }

	ConfigOptionIterator optionsEnd() const
	{ return m_options.end(); }

    private:
        Configuration(const Configuration &);
        Configuration& operator=(const Configuration &);

	std::vector<ConfigOption*> m_options;
};

//}}}

#endif /* CONFIGURATION_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
