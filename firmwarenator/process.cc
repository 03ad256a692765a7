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
#include <iostream>
#include <cstdio>
#include <cstring>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <poll.h>

#include "process.h"
#include "global.h"
#include "stringutil.h"
#include "charv.h"
#include "debug.h"

using std::string;
using std::istream;
using std::ostream;
using std::make_shared;
using std::shared_ptr;
using std::unique_ptr;

//{{{ SubProcess ---------------------------------------------------------------

// -----------------------------------------------------------------------------
SubProcess::SubProcess()
    : m_pid(-1)
{}

// -----------------------------------------------------------------------------
SubProcess::~SubProcess()
{
    if (m_pid != -1) {
	// never throw from a destructor; the child is reaped either way
	::kill(m_pid, SIGKILL);
	int status;
	while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR)
	    ;
    }
}

// -----------------------------------------------------------------------------
void SubProcess::checkSpawned(void)
{
    if (m_pid == -1)
	throw KError("SubProcess::checkSpawned(): no subprocess spawned");
}

// -----------------------------------------------------------------------------
void SubProcess::setChildFD(int fd, shared_ptr<SubProcessFD> setup)
{
    m_fdmap.erase(fd);
    if (setup)
        m_fdmap.emplace(fd, setup);
}

// -----------------------------------------------------------------------------
shared_ptr<SubProcessFD> SubProcess::getChildFD(int fd)
{
    auto it = m_fdmap.find(fd);
    return it != m_fdmap.end()
        ? it->second
        : shared_ptr<SubProcessFD>(nullptr);
}

// -----------------------------------------------------------------------------
void SubProcess::spawn(const string &name, const StringVector &args)
{
    Debug::debug()->trace("SubProcess::spawn(%s, %s)",
        name.c_str(), args.join(':').c_str());

    //
    // setup pipes
    //
    for (auto &elem : m_fdmap)
        elem.second->prepare();

    // prepare argv before forking, the child must not allocate
    CharV fullV = args;
    fullV.insert(fullV.begin(), name);
    char **vector = fullV.data();

    //
    // execute the child
    //

    pid_t child = fork();
    if (child > 0) {		// parent code
	m_pid = child;

        for (auto &elem : m_fdmap)
            elem.second->finalizeParent();

    } else if (child == 0) {	// child code
	try {
	    for (auto &elem : m_fdmap)
		elem.second->finalizeChild(elem.first);

	    if (!m_workdir.empty() && chdir(m_workdir.c_str()) != 0)
		throw KSystemError("Cannot change directory to " + m_workdir,
				   errno);
	} catch (const KError &ke) {
	    fprintf(stderr, "%s\n", ke.what());
	    _exit(127);
	}

	// the parent ignores SIGPIPE, children get the default back
	signal(SIGPIPE, SIG_DFL);
	execvp(name.c_str(), vector);
	fprintf(stderr, "Execution of '%s' failed (%s)\n",
		name.c_str(), std::strerror(errno));
	_exit(127);

    } else {                    // parent code failure
        throw KSystemError("SubProcess::spawn(): fork failed", errno);
    }

    Debug::debug()->trace("Forked child PID %d", m_pid);
}

// -----------------------------------------------------------------------------
int SubProcess::wait(void)
{
    Debug::debug()->trace("SubProcess::wait() on %d", m_pid);

    checkSpawned();

    int status;
    pid_t ret;
    do {
	ret = ::waitpid(m_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1)
	throw KSystemError("SubProcess::wait(): cannot get state of PID "
			   + Stringutil::number2string(m_pid), errno);

    if (ret != m_pid)
	throw KError("SubProcess::wait(): spawned PID "
		     + Stringutil::number2string(m_pid) + " but PID "
		     + Stringutil::number2string(ret) + " exited.");

    Debug::debug()->trace("PID %d exited with status 0x%04x", m_pid, status);

    m_pid = -1;
    return status;
}

// -----------------------------------------------------------------------------
uint8_t SubProcess::exitCode(int status)
{
    if (WIFEXITED(status))
	return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
	return 128 + WTERMSIG(status);
    return 255;
}

//}}}
//{{{ SubProcessFD -------------------------------------------------------------

// -----------------------------------------------------------------------------
SubProcessFD::~SubProcessFD()
{
}

// -----------------------------------------------------------------------------
void SubProcessFD::_move_fd(int& oldfd, int newfd)
{
    if (oldfd == newfd) {
	// already in place, only make sure it survives exec
	int flags = fcntl(oldfd, F_GETFD);
	if (flags < 0 || fcntl(oldfd, F_SETFD, flags & ~FD_CLOEXEC) < 0)
	    throw KSystemError("Cannot clear close-on-exec flag of fd "
			       + Stringutil::number2string(oldfd), errno);
	oldfd = -1;
	return;
    }

    if (dup2(oldfd, newfd) < 0)
        throw KSystemError("Cannot duplicate fd "
                           + Stringutil::number2string(oldfd)
                           + " to fd " + Stringutil::number2string(newfd),
                           errno);
    close(oldfd);
    oldfd = -1;
}

//}}}
//{{{ SubProcessRedirect -------------------------------------------------------

// -----------------------------------------------------------------------------
void SubProcessRedirect::prepare()
{
}

// -----------------------------------------------------------------------------
void SubProcessRedirect::finalizeParent()
{
}

// -----------------------------------------------------------------------------
void SubProcessRedirect::finalizeChild(int fd)
{
    _move_fd(m_fd, fd);
}

// -----------------------------------------------------------------------------
int SubProcessRedirect::parentFD()
{
    return -1;
}

//}}}
//{{{ SubProcessPipe -----------------------------------------------------------

// -----------------------------------------------------------------------------
SubProcessPipe::~SubProcessPipe()
{
    close();
}

// -----------------------------------------------------------------------------
void SubProcessPipe::prepare()
{
    close();
    if (pipe2(m_pipefd, O_CLOEXEC) < 0)
        throw KSystemError("Cannot create subprocess pipe", errno);
}

// -----------------------------------------------------------------------------
void SubProcessPipe::close()
{
    if (m_pipefd[0] >= 0)
        ::close(m_pipefd[0]);
    if (m_pipefd[1] >= 0)
        ::close(m_pipefd[1]);
    m_pipefd[0] = m_pipefd[1] = -1;
}

//}}}
//{{{ ParentToChildPipe --------------------------------------------------------

// -----------------------------------------------------------------------------
void ParentToChildPipe::finalizeParent()
{
    ::close(m_pipefd[0]);
    m_pipefd[0] = -1;
}

// -----------------------------------------------------------------------------
void ParentToChildPipe::finalizeChild(int fd)
{
    ::close(m_pipefd[1]);
    m_pipefd[1] = -1;
    _move_fd(m_pipefd[0], fd);
}

// -----------------------------------------------------------------------------
int ParentToChildPipe::parentFD()
{
    return m_pipefd[1];
}

//}}}
//{{{ ChildToParentPipe --------------------------------------------------------

// -----------------------------------------------------------------------------
void ChildToParentPipe::finalizeParent()
{
    ::close(m_pipefd[1]);
    m_pipefd[1] = -1;
}

// -----------------------------------------------------------------------------
void ChildToParentPipe::finalizeChild(int fd)
{
    ::close(m_pipefd[0]);
    m_pipefd[0] = -1;
    _move_fd(m_pipefd[1], fd);
}

// -----------------------------------------------------------------------------
int ChildToParentPipe::parentFD()
{
    return m_pipefd[0];
}

//}}}
//{{{ IStream ------------------------------------------------------------------

class IStream : public ProcessFilter::IO {
    public:
	IStream(int fd, std::istream *input)
	: ProcessFilter::IO(fd, make_shared<ParentToChildPipe>()),
	  m_input(input), pollidx(-1), bufptr(buf), bufend(buf)
	{ }

        virtual void setupIO(MultiplexIO &io);
        virtual void handleEvents(MultiplexIO &io);

    private:
	std::istream *m_input;
	int pollidx;
	char buf[BUFSIZ], *bufptr, *bufend;
};

// -----------------------------------------------------------------------------
void IStream::setupIO(MultiplexIO &io)
{
    pollidx = io.add(m_pipe->parentFD(), POLLOUT);
}

// -----------------------------------------------------------------------------
void IStream::handleEvents(MultiplexIO &io)
{
    const struct pollfd *poll = &io[pollidx];

    if (poll->revents & (POLLERR | POLLHUP)) {
	// reader has gone away
	m_pipe->close();
	io.deactivate(pollidx);
	return;
    }

    if (poll->revents & POLLOUT) {
	// Buffer underflow
	if (bufptr >= bufend && !m_input->eof()) {
	    m_input->read(bufptr = buf, sizeof buf);
	    if (m_input->bad())
		throw KSystemError("Cannot get data for input pipe", errno);
	    bufend = bufptr + m_input->gcount();
	}
	if (bufptr < bufend) {
	    ssize_t cnt = write(poll->fd, bufptr, bufend - bufptr);
	    if (cnt < 0)
		throw KSystemError("Cannot send data to input pipe", errno);
	    bufptr += cnt;
	}

	if (m_input->eof() && bufptr >= bufend) {
            m_pipe->close();
	    io.deactivate(pollidx);
	}
    }
}

//}}}
//{{{ OStream ------------------------------------------------------------------

class OStream : public ProcessFilter::IO {
    public:
	OStream(int fd, std::ostream *output)
	: ProcessFilter::IO(fd, make_shared<ChildToParentPipe>()),
	  m_output(output), pollidx(-1)
	{ }

        virtual void setupIO(MultiplexIO &io);
        virtual void handleEvents(MultiplexIO &io);

    private:
	std::ostream *m_output;
	int pollidx;
	char buf[BUFSIZ];
};

// -----------------------------------------------------------------------------
void OStream::setupIO(MultiplexIO &io)
{
    pollidx = io.add(m_pipe->parentFD(), POLLIN);
}

// -----------------------------------------------------------------------------
void OStream::handleEvents(MultiplexIO &io)
{
    ssize_t cnt;
    const struct pollfd *poll = &io[pollidx];

    if (poll->revents & (POLLIN | POLLHUP | POLLERR)) {
	if (poll->revents & POLLIN) {
	    cnt = read(poll->fd, buf, sizeof buf);
	    if (cnt < 0)
		throw KSystemError("Cannot get data from output pipe", errno);
	} else
	    cnt = 0;

	if (!cnt) {
            m_pipe->close();
	    io.deactivate(pollidx);
	}
	m_output->write(buf, cnt);
    }
}

//}}}
//{{{ ProcessFilter ------------------------------------------------------------

// -----------------------------------------------------------------------------
void ProcessFilter::setIO(unique_ptr<IO> io)
{
    int fd = io->getFD();
    m_iomap[fd] = std::move(io);
}

// -----------------------------------------------------------------------------
void ProcessFilter::setInput(int fd, istream *stream)
{
    setIO(unique_ptr<IO>(new IStream(fd, stream)));
}

// -----------------------------------------------------------------------------
void ProcessFilter::setOutput(int fd, ostream *stream)
{
    setIO(unique_ptr<IO>(new OStream(fd, stream)));
}

// -----------------------------------------------------------------------------
void ProcessFilter::setStdin(std::istream *stream)
{
    setInput(STDIN_FILENO, stream);
}

// -----------------------------------------------------------------------------
void ProcessFilter::setStdout(std::ostream *stream)
{
    setOutput(STDOUT_FILENO, stream);
}

// -----------------------------------------------------------------------------
void ProcessFilter::setStderr(std::ostream *stream)
{
    setOutput(STDERR_FILENO, stream);
}

// -----------------------------------------------------------------------------
uint8_t ProcessFilter::execute(const string &name, const StringVector &args)
{
    Debug::debug()->trace("ProcessFilter::execute(%s, %s)",
        name.c_str(), args.join(':').c_str());

    SubProcess p;
    for (auto &it : m_iomap)
	it.second->setupSubProcess(p);
    p.spawn(name, args);

    // initialize multiplex IO
    MultiplexIO io;
    for (auto &it : m_iomap)
        it.second->setupIO(io);

    while (io.active() > 0) {
	io.monitor();
	for (auto &it : m_iomap)
            it.second->handleEvents(io);
    }

    int status = p.wait();
    return SubProcess::exitCode(status);
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
