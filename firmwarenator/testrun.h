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
#ifndef TESTRUN_H
#define TESTRUN_H

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "global.h"

/**
 * Exit status of a test that cannot run on this machine.
 */
#define EXIT_SKIP   77

//{{{ TestRun -----------------------------------------------------------------

class TestRun {
    int m_result;

public:
    TestRun()
        : m_result(EXIT_SUCCESS)
    { }

    int result(void)
    { return m_result; }

    template<typename check_fn>
    void check(const char *what, check_fn fn);
};

// -----------------------------------------------------------------------------
template<typename check_fn>
void TestRun::check(const char *what, check_fn fn)
{
    std::cout << what << ": ";
    try {
        if (fn()) {
            std::cout << "OK";
        } else {
            std::cout << "FAILED";
            m_result = EXIT_FAILURE;
        }
        std::cout << std::endl;
    } catch (KError &e) {
        std::cout << "EXCEPTION" << std::endl;
        std::cerr << e.what() << std::endl;
        m_result = EXIT_FAILURE;
    }
}

//}}}
//{{{ Helpers ------------------------------------------------------------------

/**
 * Run @p fn and check that it throws @p Error.
 */
template<typename Error, typename fn_type>
bool throws(fn_type fn)
{
    try {
        fn();
    } catch (const Error &e) {
        std::cout << "(" << e.what() << ") ";
        return true;
    } catch (const KError &e) {
        std::cout << "(wrong exception: " << e.what() << ") ";
        return false;
    }
    return false;
}

// -----------------------------------------------------------------------------
static inline void write_file(const std::string &path,
                              const std::string &data)
{
    std::ofstream f(path.c_str(), std::ios::binary);
    f << data;
    f.close();
    if (!f)
        throw KError("Cannot write " + path);
}

// -----------------------------------------------------------------------------
static inline std::string read_file(const std::string &path)
{
    std::ifstream f(path.c_str(), std::ios::binary);
    if (!f)
        throw KError("Cannot read " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

//}}}

#endif /* TESTRUN_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
