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
#ifndef UTIL_H
#define UTIL_H

#include <string>

#include "global.h"

//{{{ Util ---------------------------------------------------------------------

/**
 * Various utility functions.
 */
class Util {

    public:
        /**
         * Retrieves the environment variables @p env.
         *
         * @param[in] env the environment variable to retrieve
         * @param[in] defaultValue the default which will be returned
         *            if @p env is not set
         * @param[out] isDefault when non-NULL, will be set to @c true
         *             if @p defaultValue will be returned to discriminate
         *             the case when the actual value is the default value
         * @return the environment value of @p env or @p default if there
         *         is no such environment
         */
        static std::string getenv(const std::string &env,
                                  const std::string &defaultValue,
                                  bool *isDefault = NULL);

        /**
         * Returns the home directory of the current user: $HOME, or the
         * passwd entry if HOME is not set.
         *
         * @return the home directory, or an empty string if unknown
         */
        static std::string getHomeDir();

        /**
         * Looks up an executable like the shell does. A @p name that
         * contains a slash is checked as is, otherwise every directory
         * in $PATH is searched.
         *
         * @param[in] name the program name
         * @return the full path, or an empty string if not found
         */
        static std::string findExecutable(const std::string &name);
};

//}}}

#endif /* UTIL_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
