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
#include <cerrno>
#include <sstream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "packager.h"
#include "global.h"
#include "debug.h"
#include "process.h"
#include "runconfig.h"
#include "stagingarea.h"
#include "stringutil.h"

using std::make_shared;
using std::shared_ptr;
using std::string;
using std::stringstream;
using std::unique_ptr;

//{{{ ImagePackager ------------------------------------------------------------

// -----------------------------------------------------------------------------
unique_ptr<ImagePackager> ImagePackager::create(const RunConfig &config)
{
    if (config.format == RunConfig::FORMAT_IMAGE)
        return unique_ptr<ImagePackager>(
            new SquashfsPackager(config.verbose));
    else
        return unique_ptr<ImagePackager>(
            new CpioPackager(config.compress, config.compressArgs,
                             config.verbose));
}

// -----------------------------------------------------------------------------
void ImagePackager::package(const StagingArea &staging, const FilePath &output)
{
    Debug::debug()->trace("ImagePackager::package(%s, %s)",
                          staging.root().c_str(), output.c_str());

    FilePath partial = output;
    bool existed = partial.exists();

    try {
        write(staging, output);
    } catch (const KError &) {
        if (!existed && partial.exists()) {
            Debug::debug()->dbg("Removing partial output %s",
                                partial.c_str());
            try {
                partial.remove();
            } catch (const KError &ke) {
                Debug::debug()->info("%s", ke.what());
            }
        }
        throw;
    }

    Debug::debug()->dbg("Wrote %s", output.c_str());
}

//}}}
//{{{ OutputFile ---------------------------------------------------------------

/**
 * File descriptor of a newly created output file, closed on
 * destruction.
 */
class OutputFile {

    public:
        explicit OutputFile(const FilePath &path)
            : m_path(path)
        {
            m_fd = ::open(path.c_str(),
                          O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (m_fd < 0)
                throw KSystemError("Cannot create " + path, errno);
        }

        ~OutputFile()
        {
            if (m_fd >= 0)
                ::close(m_fd);
        }

        int fd() const
        { return m_fd; }

        void close()
        {
            int fd = m_fd;
            m_fd = -1;
            if (::close(fd) != 0)
                throw KSystemError("Cannot close " + m_path, errno);
        }

    private:
        OutputFile(const OutputFile &);
        OutputFile& operator=(const OutputFile &);

        FilePath m_path;
        int m_fd;
};

//}}}
//{{{ CpioPackager -------------------------------------------------------------

// -----------------------------------------------------------------------------
CpioPackager::CpioPackager(const string &compress,
                           const StringVector &compressArgs, bool verbose)
    : m_compress(compress), m_compressArgs(compressArgs), m_verbose(verbose)
{}

// -----------------------------------------------------------------------------
static void list_files(const FilePath &root, const string &prefix,
                       StringVector &result)
{
    FilePath dir = root;
    if (!prefix.empty())
        dir.appendPath(prefix);

    StringVector entries = dir.listDir();
    for (StringVector::const_iterator it = entries.begin();
            it != entries.end(); ++it) {
        string name = prefix.empty() ? *it : prefix + PATH_SEPARATOR + *it;
        result.push_back(name);

        FilePath entry = root;
        entry.appendPath(name);
        if (entry.isDirectory())
            list_files(root, name, result);
    }
}

// -----------------------------------------------------------------------------
StringVector CpioPackager::listFiles(const FilePath &root)
{
    StringVector ret;
    list_files(root, string(), ret);
    return ret;
}

// -----------------------------------------------------------------------------
StringVector CpioPackager::cpioArgs() const
{
    StringVector args;
    args.push_back("-o");
    args.push_back("-H");
    args.push_back("newc");
    args.push_back("--null");
    args.push_back(m_verbose ? "-v" : "--quiet");
    return args;
}

// -----------------------------------------------------------------------------
static void write_all(int fd, const string &data)
{
    const char *p = data.data();
    size_t left = data.size();

    while (left > 0) {
        ssize_t cnt = ::write(fd, p, left);
        if (cnt < 0) {
            if (errno == EINTR)
                continue;
            // cpio has exited, its exit status tells why
            if (errno == EPIPE)
                return;
            throw KSystemError("Cannot write file list to cpio", errno);
        }
        p += cnt;
        left -= cnt;
    }
}

// -----------------------------------------------------------------------------
static void check_status(const string &name, int status)
{
    uint8_t code = SubProcess::exitCode(status);
    if (code != 0)
        throw PackagingError(name + " failed with exit status " +
                             Stringutil::number2string(int(code)) + ".");
}

// -----------------------------------------------------------------------------
void CpioPackager::write(const StagingArea &staging, const FilePath &output)
{
    StringVector files = listFiles(staging.root());
    string listing;
    for (StringVector::const_iterator it = files.begin();
            it != files.end(); ++it) {
        Debug::debug()->trace("Archiving %s", it->c_str());
        listing += *it;
        listing += '\0';
    }

    OutputFile out(output);

    shared_ptr<ParentToChildPipe> input = make_shared<ParentToChildPipe>();
    shared_ptr<ChildToParentPipe> archive;

    SubProcess cpio;
    cpio.setWorkingDirectory(staging.root());
    cpio.setChildFD(STDIN_FILENO, input);
    if (m_compress.empty())
        cpio.setChildFD(STDOUT_FILENO,
                        make_shared<SubProcessRedirect>(out.fd()));
    else {
        archive = make_shared<ChildToParentPipe>();
        cpio.setChildFD(STDOUT_FILENO, archive);
    }
    cpio.spawn("cpio", cpioArgs());

    SubProcess compressor;
    if (archive) {
        Debug::debug()->dbg("Compressing with %s %s", m_compress.c_str(),
                            m_compressArgs.join(' ').c_str());
        compressor.setChildFD(STDIN_FILENO,
            make_shared<SubProcessRedirect>(archive->parentFD()));
        compressor.setChildFD(STDOUT_FILENO,
            make_shared<SubProcessRedirect>(out.fd()));
        compressor.spawn(m_compress, m_compressArgs);
        archive->close();
    }

    write_all(input->parentFD(), listing);
    input->close();

    int cpioStatus = cpio.wait();
    int compressorStatus = archive ? compressor.wait() : 0;
    out.close();

    // a dead compressor makes cpio fail with SIGPIPE
    check_status(m_compress, compressorStatus);
    check_status("cpio", cpioStatus);
}

//}}}
//{{{ SquashfsPackager ---------------------------------------------------------

// -----------------------------------------------------------------------------
SquashfsPackager::SquashfsPackager(bool verbose)
    : m_verbose(verbose)
{}

// -----------------------------------------------------------------------------
StringVector SquashfsPackager::mksquashfsArgs(const FilePath &source,
                                              const FilePath &output) const
{
    StringVector args;
    args.push_back(source);
    args.push_back(output);
    args.push_back("-noappend");
    args.push_back("-comp");
    args.push_back("xz");
    args.push_back("-all-root");
    if (!m_verbose) {
        args.push_back("-quiet");
        args.push_back("-no-progress");
    }
    return args;
}

// -----------------------------------------------------------------------------
void SquashfsPackager::write(const StagingArea &staging,
                             const FilePath &output)
{
    StringVector args = mksquashfsArgs(staging.firmwareRoot(), output);

    stringstream out, err;
    ProcessFilter p;
    if (!m_verbose) {
        p.setStdout(&out);
        p.setStderr(&err);
    }

    uint8_t status = p.execute("mksquashfs", args);
    if (status != 0) {
        KString msg(err.str());
        msg.trim();
        if (!msg.empty())
            Debug::debug()->info("mksquashfs: %s", msg.c_str());
        throw PackagingError("mksquashfs failed with exit status " +
                             Stringutil::number2string(int(status)) + ".");
    }
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
