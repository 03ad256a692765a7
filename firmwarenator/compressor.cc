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

#include "compressor.h"
#include "configuration.h"
#include "stringutil.h"
#include "stringvector.h"
#include "debug.h"

using std::string;

static const char *const compressor_names[CompressorTable::COMP_MAX] = {
    "none",
    "zstd",
    "xz",
    "lzma",
    "gzip",
    "bzip2",
    "lz4",
    "lzop",
};

//{{{ CompressorTable ----------------------------------------------------------

// -----------------------------------------------------------------------------
CompressorTable::Compressor CompressorTable::parseName(const string &name)
{
    string lower = Stringutil::toLower(name);
    for (int i = 0; i < COMP_MAX; ++i) {
        if (lower == compressor_names[i])
            return static_cast<Compressor>(i);
    }
    throw ConfigError("Unknown compressor '" + name + "'.");
}

// -----------------------------------------------------------------------------
const char *CompressorTable::name(Compressor comp)
{
    if (comp < 0 || comp >= COMP_MAX)
        return "unknown";
    return compressor_names[comp];
}

// -----------------------------------------------------------------------------
static string config_value(const Configuration &config, const string &name)
{
    const ConfigOption *opt = config.find(name);
    if (!opt)
        return string();

    KString value(opt->valueAsString());
    return value.trim();
}

// -----------------------------------------------------------------------------
CompressorTable::CompressorTable(const Configuration &config)
{
    for (int i = COMP_NONE + 1; i < COMP_MAX; ++i) {
        Compressor comp = static_cast<Compressor>(i);
        string prefix = Stringutil::toUpper(compressor_names[i]);

        CompressorProfile profile;
        StringVector words;
        words.appendWords(config_value(config, prefix + "_COMP"));
        if (!words.empty()) {
            profile.compress = words.front();
            profile.compressOptions.assign(words.begin() + 1, words.end());
        }
        profile.compressArgs.appendWords(
            config_value(config, prefix + "_COMP_ARGS"));
        profile.decompress = config_value(config, prefix + "_DECOMP");

        if (profile.compress.empty() || profile.decompress.empty()) {
            Debug::debug()->trace("Compressor %s is not configured",
                                  compressor_names[i]);
            continue;
        }

        m_profiles[comp] = profile;
    }
}

// -----------------------------------------------------------------------------
const CompressorProfile *CompressorTable::find(Compressor comp) const
{
    std::map<Compressor, CompressorProfile>::const_iterator it;
    it = m_profiles.find(comp);
    return it != m_profiles.end() ? &it->second : NULL;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
