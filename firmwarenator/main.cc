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
#include <cstdlib>
#include <csignal>
#include <stdexcept>

#include "global.h"
#include "firmwarenator.h"

using std::cerr;
using std::endl;

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    Firmwarenator fwn;

    // write errors on pipes are reported as EPIPE
    signal(SIGPIPE, SIG_IGN);

    try {
        fwn.parseCommandline(argc, argv);
        fwn.readConfiguration();
        fwn.execute();
    } catch (const UsageError &ue) {
        fwn.printUsage(cerr);
        cerr << endl << ue.what() << endl;
        return EXIT_FAILURE;
    } catch (const ConfigError &ce) {
        fwn.printUsage(cerr);
        cerr << endl << ce.what() << endl;
        return EXIT_FAILURE;
    } catch (const KError &ke) {
        cerr << ke.what() << endl;
        return EXIT_FAILURE;
    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
