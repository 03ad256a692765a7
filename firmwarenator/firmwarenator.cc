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
#include <memory>
#include <string>

#include "firmwarenator.h"
#include "global.h"
#include "debug.h"
#include "firmwarescanner.h"
#include "stagingarea.h"
#include "packager.h"

using std::cout;
using std::endl;
using std::exit;
using std::ostream;
using std::string;
using std::unique_ptr;

#define PROGRAM_NAME                "firmwarenator"
#define PROGRAM_VERSION_STRING      PROGRAM_NAME " " PACKAGE_VERSION

//{{{ Firmwarenator ------------------------------------------------------------

// -----------------------------------------------------------------------------
Firmwarenator::Firmwarenator()
    : m_firmwareDir(FIRMWARE_DIR), m_kernelLog(NULL)
{}

// -----------------------------------------------------------------------------
void Firmwarenator::parseCommandline(int argc, char *argv[])
{
    m_resolver.parseCommandline(argc, argv);

    if (m_resolver.helpRequested()) {
        printUsage(cout);
        exit(EXIT_SUCCESS);
    } else if (m_resolver.versionRequested()) {
        printVersion();
        exit(EXIT_SUCCESS);
    }

    if (m_resolver.verboseRequested() &&
            Debug::debug()->getStderrLevel() > Debug::DL_DEBUG)
        Debug::debug()->setStderrLevel(Debug::DL_DEBUG);
}

// -----------------------------------------------------------------------------
void Firmwarenator::readConfiguration()
{
    Debug::debug()->trace("Firmwarenator::readConfiguration");

    m_config = m_resolver.resolve();
}

// -----------------------------------------------------------------------------
void Firmwarenator::execute()
{
    Debug::debug()->trace("Firmwarenator::execute");

    FirmwareScanner scanner(m_firmwareDir);
    StringSet firmware = m_kernelLog
        ? scanner.scan(*m_kernelLog)
        : scanner.scanKernelLog();
    Debug::debug()->dbg("%lu firmware file(s) loaded by the kernel",
                        (unsigned long)firmware.size());

    StagingArea staging(m_firmwareDir);
    staging.addAll(firmware);

    FilePath output = m_config.output;
    if (m_config.force && output.exists()) {
        Debug::debug()->dbg("Removing existing %s", output.c_str());
        output.remove();
    }

    unique_ptr<ImagePackager> packager = ImagePackager::create(m_config);
    packager->package(staging, output);
}

// -----------------------------------------------------------------------------
void Firmwarenator::printUsage(ostream &os) const
{
    m_resolver.printHelp(os);
}

// -----------------------------------------------------------------------------
void Firmwarenator::printVersion()
{
    cout << PROGRAM_VERSION_STRING << endl;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
