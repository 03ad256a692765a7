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
#include <string>

#include "runconfig.h"
#include "global.h"
#include "debug.h"
#include "configuration.h"
#include "compressor.h"
#include "util.h"

using std::endl;
using std::ostream;
using std::string;

#define PROGRAM_NAME    "firmwarenator"

//{{{ OptionResolver -----------------------------------------------------------

// -----------------------------------------------------------------------------
OptionResolver::OptionResolver()
    : m_doHelp(false), m_doVersion(false), m_verbose(false),
      m_force(false), m_sqsh(false),
      m_helpOption("help", 'h', &m_doHelp,
                   "Prints help output."),
      m_versionOption("version", 'V', &m_doVersion,
                      "Prints version information and exits."),
      m_verboseOption("verbose", 'v', &m_verbose,
                      "Prints the resolved settings and the output of "
                      "the helper programs."),
      m_forceOption("force", 'f', &m_force,
                    "Overwrites an existing IMGNAME."),
      m_compressorOption("compressor", 'c', &m_compressor,
                         "Uses compressor NAME for the archive (zstd, xz, "
                         "lzma, gzip, bzip2, lz4, lzop or none).",
                         "NAME"),
      m_compressorArgsOption("compressor-args", 'C', &m_compressorArgs,
                             "Passes ARGS to the compressor instead of the "
                             "configured arguments. May be repeated.",
                             "ARGS"),
      m_sqshOption("sqsh", 's', &m_sqsh,
                   "Creates a squashfs image instead of a cpio archive.")
{
    m_parser.addOption(&m_helpOption);
    m_parser.addOption(&m_versionOption);
    m_parser.addOption(&m_verboseOption);
    m_parser.addOption(&m_forceOption);
    m_parser.addOption(&m_compressorOption);
    m_parser.addOption(&m_compressorArgsOption);
    m_parser.addOption(&m_sqshOption);

    m_configFiles.push_back(string(SYSCONFDIR) + "/firmwarenator.conf");
    string home = Util::getHomeDir();
    if (!home.empty())
        m_configFiles.push_back(home + "/.firmwarenatorrc");
}

// -----------------------------------------------------------------------------
void OptionResolver::parseCommandline(int argc, char *argv[])
{
    m_parser.parse(argc, argv);
}

// -----------------------------------------------------------------------------
void OptionResolver::printHelp(ostream &os) const
{
    m_parser.printHelp(os, "Usage: " PROGRAM_NAME " [OPTIONS] IMGNAME");

    os << endl;
    os << "Creates IMGNAME with the firmware files the running kernel has"
       << endl;
    os << "loaded, as recorded in the kernel log. The files are taken from"
       << endl;
    os << FIRMWARE_DIR "." << endl;
    os << endl;
    os << "The kernel logs firmware loads only if dynamic debug is enabled"
       << endl;
    os << "for the firmware loader. Boot with" << endl;
    os << endl;
    os << "  dyndbg=\"file drivers/base/firmware_loader/main.c +p\"" << endl;
    os << endl;
    os << "Settings are read from " SYSCONFDIR "/firmwarenator.conf and"
       << endl;
    os << "~/.firmwarenatorrc." << endl;
}

// -----------------------------------------------------------------------------
RunConfig OptionResolver::resolve() const
{
    const StringVector &args = m_parser.getArgs();
    if (args.size() != 1)
        throw UsageError("IMGNAME required.");

    RunConfig rc;
    rc.force = m_force;
    rc.verbose = m_verbose;
    rc.format = m_sqsh ? RunConfig::FORMAT_IMAGE : RunConfig::FORMAT_ARCHIVE;

    resolveCompressor(rc);
    resolveOutput(rc);

    Debug::debug()->dbg("Output file:      %s", rc.output.c_str());
    Debug::debug()->dbg("Format:           %s",
        rc.format == RunConfig::FORMAT_IMAGE ? "squashfs" : "cpio");
    Debug::debug()->dbg("Overwrite:        %s", rc.force ? "yes" : "no");
    if (rc.format == RunConfig::FORMAT_ARCHIVE) {
        Debug::debug()->dbg("Compressor:       %s", rc.compressor.c_str());
        Debug::debug()->dbg("Compressor args:  %s",
                            rc.compressArgs.join(' ').c_str());
        Debug::debug()->dbg("Decompressor:     %s", rc.decompress.c_str());
    }

    return rc;
}

// -----------------------------------------------------------------------------
static void check_executable(const string &cmdline)
{
    StringVector words;
    words.appendWords(cmdline);
    if (words.empty())
        throw ConfigError("Empty command line.");

    string path = Util::findExecutable(words.front());
    if (path.empty())
        throw ConfigError("Command '" + words.front() + "' not found.");

    Debug::debug()->trace("Found %s at %s",
                          words.front().c_str(), path.c_str());
}

// -----------------------------------------------------------------------------
void OptionResolver::resolveCompressor(RunConfig &rc) const
{
    Configuration config;
    for (StringVector::const_iterator it = m_configFiles.begin();
            it != m_configFiles.end(); ++it) {
        if (config.readFileIfExists(*it))
            Debug::debug()->dbg("Read configuration file %s", it->c_str());
    }

    KString name;
    if (m_compressorOption.isSet())
        name = m_compressor;
    else
        name = config.DEFAULT_COMPRESSOR.value();
    name.trim();

    CompressorTable::Compressor comp = CompressorTable::parseName(name);
    rc.compressor = CompressorTable::name(comp);

    // the image builder has its own compression
    if (rc.format == RunConfig::FORMAT_IMAGE ||
            comp == CompressorTable::COMP_NONE)
        return;

    CompressorTable table(config);
    const CompressorProfile *profile = table.find(comp);
    if (!profile) {
        string prefix = Stringutil::toUpper(rc.compressor);
        throw ConfigError("Compressor " + rc.compressor + " is not "
                          "configured. Set " + prefix + "_COMP and " +
                          prefix + "_DECOMP.");
    }

    rc.compress = profile->compress;
    rc.decompress = profile->decompress;
    rc.compressArgs = profile->compressOptions;
    if (m_compressorArgsOption.isSet()) {
        for (StringVector::const_iterator it = m_compressorArgs.begin();
                it != m_compressorArgs.end(); ++it)
            rc.compressArgs.appendWords(*it);
    } else
        rc.compressArgs.insert(rc.compressArgs.end(),
                               profile->compressArgs.begin(),
                               profile->compressArgs.end());

    check_executable(rc.compress);
    check_executable(rc.decompress);
}

// -----------------------------------------------------------------------------
void OptionResolver::resolveOutput(RunConfig &rc) const
{
    FilePath imgname = m_parser.getArgs().front();
    if (imgname.empty())
        throw UsageError("IMGNAME required.");

    try {
        rc.output = imgname.getCanonicalPath();
    } catch (const KError &ke) {
        Debug::debug()->dbg("Cannot resolve %s: %s",
                            imgname.c_str(), ke.what());
        throw UsageError("IMGNAME required.");
    }

    if (!rc.output.exists())
        return;

    if (rc.output.isDirectory())
        throw PreflightError(rc.output + " is a directory.");
    if (!rc.force)
        throw PreflightError(rc.output + ": file exists. "
                             "Use --force to overwrite it.");
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
