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
#ifndef FILEUTIL_H
#define FILEUTIL_H

#include "global.h"
#include "stringutil.h"

//{{{ FilePath -----------------------------------------------------------------

/**
 * File path.
 */
class FilePath : public KString {

    private:
        static const std::string m_slash;

    public:
        /**
         * Standard constructors (refer to std::string).
         */
        FilePath()
        : KString()
        {}
        FilePath(const std::string& str)
        : KString(str)
        {}
        FilePath(const char* s)
        : KString(s)
        {}
        template <class InputIterator>
            FilePath(InputIterator first, InputIterator last)
        : KString(first, last)
        {}

        /**
         * Get the current working directory.
         *
         * @throw KError on any error
         */
        static FilePath getcwd(void);

        /**
         * Gets the directory name of a file.
         *
         * @return the directory name
         */
        std::string dirName() const;

        /**
         * Concatenates two path components.
         *
         * @param[in] p the path component to be appended
         * @return reference to this instance
         */
        FilePath& appendPath(const std::string &p);

        /**
         * Checks if the specified file exists. Symbolic links are
         * followed, so a dangling link does not exist.
         *
         * @return @c true on success, @c false otherwise
         */
        bool exists() const;

        /**
         * Checks if the path is a directory (symbolic links are not
         * followed).
         *
         * @throw KError if lstat() fails
         */
        bool isDirectory() const;

        /**
         * Reads a symbolic link. Does the same like readlink(2), only
         * that it's C++ and an exception is thrown on error instead of
         * giving an error code.
         *
         * @return the resolved link
         *
         * @throw KError if an error occured
         */
        std::string readLink() const;

        /**
         * Returns the canonical representation of the specified path.
         * This means that all symbolic links are resolved. It does that
         * as if the root directory was @p root. Non-existing path
         * components are allowed.
         *
         * @param[in] root the new root where the function should chroot to
         * @return the canonical representation of the path
         *
         * @throw KError when a path component cannot be examined
         */
        FilePath getCanonicalPath(const std::string &root = m_slash) const;

        /**
         * Gets the sorted list of the contents of the directory.
         * The contents is sorted alphabetically, and "." and ".." entries
         * are omitted.
         *
         * @exception KError if something went wrong
         */
        StringVector listDir() const;

        /**
         * Creates a new directory in the specified path.
         *
         * @param[in] recursive @b true if the behaviour of <tt>mkdir -p</tt>
         *            should be copied, @c false otherwise.
         *
         * @throw KError on any error
         */
        void mkdir(bool recursive);

        /**
         * Delete the specified directory.
         *
         * @param[in] recursive @c true if all contents of non-empty
         *            directories should be deleted, @c false otherwise
         * @exception KError if something went wrong
         */
        void rmdir(bool recursive);

        /**
         * Delete a file that is not a directory.
         *
         * @exception KError if unlink() fails
         */
        void remove();
};

//}}}
//{{{ TemporaryDirectory -------------------------------------------------------

/**
 * A uniquely named directory below $TMPDIR (or /tmp). The directory and
 * everything in it is removed when the object is destroyed.
 */
class TemporaryDirectory {

    public:
        /**
         * Create the directory.
         *
         * @param[in] prefix name prefix; six random characters are appended
         * @exception KError if mkdtemp() fails
         */
        explicit TemporaryDirectory(const std::string &prefix);

        /**
         * Remove the directory tree. Errors are reported on the debug
         * channel, never thrown.
         */
        ~TemporaryDirectory();

        const FilePath& path() const
        { return m_path; }

    private:
        TemporaryDirectory(const TemporaryDirectory &);
        TemporaryDirectory& operator=(const TemporaryDirectory &);

        FilePath m_path;
};

//}}}

#endif /* FILEUTIL_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
