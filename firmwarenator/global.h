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
#ifndef GLOBAL_H
#define GLOBAL_H

#include <stdexcept>
#include <set>
#include <string>
#include <vector>
#include <map>

#include "config.h"

//{{{ Constants ----------------------------------------------------------------

#define PATH_SEPARATOR      "/"

/**
 * Location of the firmware files inside the staging root. The archive
 * variant keeps this prefix, the image variant uses its contents as root.
 */
#define STAGING_FIRMWARE_SUBDIR "lib/firmware"

//}}}
//{{{ Type definitions ---------------------------------------------------------

typedef std::set<std::string> StringSet;
typedef std::map<std::string, std::string> StringStringMap;

//}}}
//{{{ KErrorCode ---------------------------------------------------------------

/**
 * Pure virtual class which serves as a base class for errors described
 * by integer code values.
 */
class KErrorCode {
    public:
        KErrorCode(int code)
            : m_code(code)
        {}

        virtual std::string message(void) const = 0;

        int getCode(void) const
        { return m_code; }

    private:
        int m_code;
};

//}}}
//{{{ KError -------------------------------------------------------------------

/**
 * Standard error class.
 */
class KError : public std::runtime_error {
    public:
        /**
         * Creates a new object of KError with string as error message.
         *
         * @param string the error message
         */
        KError(const std::string& string)
            : std::runtime_error(string) {}

};

//}}}
//{{{ KCodeError ---------------------------------------------------------------

/**
 * Standard error class template for errors that have a numeric code.
 */
template <class ErrorCode>
class KCodeError : public KError {
    public:
        /**
         * Creates a new object of KError with an error message format:
         *
         *   'message (ErrorCode(errorcode).message())'
         *
         * @param message the error message
         * @param errorcode the system error code (errno)
         */
        KCodeError(const std::string& message, int errorcode)
            : KError(message + " (" + ErrorCode(errorcode).message() + ")")
        {}
};

//}}}
//{{{ KSystemErrorCode ---------------------------------------------------------

/**
 * Class for errors that store a value in the errno variable.
 */
class KSystemErrorCode : public KErrorCode {
    public:
        KSystemErrorCode(int code)
            : KErrorCode(code)
        {}

        virtual std::string message(void) const;
};

//}}}
//{{{ Pre-defined error classes ------------------------------------------------

typedef KCodeError<KSystemErrorCode> KSystemError;

/**
 * Invalid or missing command line arguments. The usage is printed
 * together with the message.
 */
class UsageError : public KError {
    public:
        UsageError(const std::string& string)
            : KError(string) {}
};

/**
 * Unusable configuration: unknown compressor, unconfigured profile,
 * missing executable or a configuration file that cannot be parsed.
 */
class ConfigError : public KError {
    public:
        ConfigError(const std::string& string)
            : KError(string) {}
};

/**
 * A check that runs before any file system modification failed.
 */
class PreflightError : public KError {
    public:
        PreflightError(const std::string& string)
            : KError(string) {}
};

/**
 * Assembling the staging root failed.
 */
class StagingError : public KError {
    public:
        StagingError(const std::string& string)
            : KError(string) {}
};

/**
 * An external archive writer, compressor or image builder failed.
 */
class PackagingError : public KError {
    public:
        PackagingError(const std::string& string)
            : KError(string) {}
};

//}}}

#endif /* GLOBAL_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
