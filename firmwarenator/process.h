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
#ifndef PROCESS_H
#define PROCESS_H

#include <stdint.h>
#include <map>
#include <memory>
#include <iosfwd>

#include <sys/types.h>

#include "global.h"
#include "stringvector.h"
#include "multiplexio.h"

//{{{ SubProcessFD -------------------------------------------------------------

/**
 * Abstract base class for file descriptor setup.
 */
class SubProcessFD {

    public:

        virtual ~SubProcessFD();

        /**
         * Do all necessary preparations before forking.
         */
        virtual void prepare() = 0;

        /**
         * Finalize the file descriptor in parent.
         */
        virtual void finalizeParent() = 0;

        /**
         * Finalize the file descriptor in child.
         *
         * @param[in] fd file descriptor in child
         */
        virtual void finalizeChild(int fd) = 0;

        /**
         * Get the file descriptor that the parent uses to talk to the
         * child, or -1 if there is none.
         */
        virtual int parentFD() = 0;

    protected:

        void _move_fd(int& oldfd, int newfd);
};

//}}}
//{{{ SubProcessRedirect -------------------------------------------------------

/**
 * Make a file descriptor of the parent available in the child. The
 * parent keeps ownership of @c fd.
 */
class SubProcessRedirect : public SubProcessFD {

        int m_fd;

    public:

        SubProcessRedirect(int fd)
            : m_fd(fd)
        { }

        void prepare();
        void finalizeParent();
        void finalizeChild(int fd);
        int parentFD();
};

//}}}
//{{{ SubProcessPipe -----------------------------------------------------------

class SubProcessPipe : public SubProcessFD {

    protected:

        int m_pipefd[2];

    public:

        SubProcessPipe()
        { m_pipefd[0] = m_pipefd[1] = -1; }

        ~SubProcessPipe();
        void prepare();

        /**
         * Explicitly close the pipe.
         */
        void close();
};

//}}}
//{{{ ParentToChildPipe --------------------------------------------------------

/**
 * Pipe for data written from parent to child.
 */
class ParentToChildPipe : public SubProcessPipe {

    public:

        void finalizeParent();
        void finalizeChild(int fd);
        int parentFD();
};

//}}}
//{{{ ChildToParentPipe --------------------------------------------------------

/**
 * Pipe for data written from child to parent.
 */
class ChildToParentPipe : public SubProcessPipe {

    public:

        void finalizeParent();
        void finalizeChild(int fd);
        int parentFD();
};

//}}}
//{{{ SubProcess ---------------------------------------------------------------

/**
 * Representation of a subprocess in the parent.
 */
class SubProcess {

    public:

	/**
	 * Prepare a new subprocess.
	 */
	SubProcess();

	/**
	 * Destructor. Kills the subprocess if still running.
	 */
	virtual ~SubProcess();

	/**
	 * Set up a file descriptor in the child.
	 *
	 * @param[in] fd file descriptor in the child
	 * @param[in] setup file descriptor setup class, or nullptr to
	 *            let the child inherit the parent's descriptor
	 */
        void setChildFD(int fd, std::shared_ptr<SubProcessFD> setup);

	/**
	 * Get child file descriptor setup.
	 *
	 * @param[in] fd file descriptor in the child
         * @return the setup class, or nullptr if @p fd is not set up
	 */
        std::shared_ptr<SubProcessFD> getChildFD(int fd);

	/**
	 * Run the child in @p dir instead of the current directory.
	 */
	void setWorkingDirectory(const std::string &dir)
	{ m_workdir = dir; }

	/**
	 * Spawns a subprocess.
	 *
         * @param[in] name the executable (PATH is searched) of the process
         *            to execute
         * @param[in] args the arguments for the process (argv[0] is used from
         *            @c name, so it cannot be overwritten here). Pass an empty
         *            list if you don't want to provide arguments.
	 * @exception KError if the pipes cannot be set up or fork fails.
	 *            A failing exec is reported through exit status 127.
	 */
	void spawn(const std::string &name, const StringVector &args);

	/**
	 * Wait for the child to terminate.
	 *
	 * @return Child exit status, see wait(2).
	 */
	int wait(void);

	/**
	 * Convert a wait(2) status into a shell-like exit code: the exit
	 * status for normal termination, 128 + signal number otherwise.
	 */
	static uint8_t exitCode(int status);

    protected:

	/**
	 * Make sure that a child process has been spawned.
	 *
	 * @exception KError if there is no child process.
	 */
	void checkSpawned(void);

	pid_t m_pid;
	std::string m_workdir;

    private:

	std::map<int, std::shared_ptr<SubProcessFD>> m_fdmap;
};

//}}}
//{{{ ProcessFilter ------------------------------------------------------------

/**
 * Simple to use API to process-based filters.
 */
class ProcessFilter {

    public:

	/**
	 * Abstract base class for handling input/output.
	 */
	class IO;

        /**
         * Runs the process, redirecting input/output.
         *
         * @param[in] name the executable (PATH is searched) of the process
         *            to execute
         * @param[in] args the arguments for the process (argv[0] is used from
         *            @c name, so it cannot be overwritten here). Pass an empty
         *            list if you don't want to provide arguments.
         * @return the numeric return value (between 0 and 255) of the process
         *         that has been executed
         */
        uint8_t execute(const std::string &name, const StringVector &args);

        /**
         * Redirect input in the subprocess from a std::istream.
         *
	 * @param[in] fd file descriptor in child
         * @param[in] stream the stream to be used as input
         */
        void setInput(int fd, std::istream *stream);

        /**
	 * Redirect output from the subprocess to a std::ostream.
         *
	 * @param[in] fd file descriptor in child
         * @param[in] stream the stream to be used as output
         */
        void setOutput(int fd, std::ostream *stream);

	/**
	 * setInput/setOutput shortcuts for stdin, stdout and stderr.
	 *
	 * @param[in] stream the stream to be used as input/output
	 */
	void setStdin(std::istream *stream);
	void setStdout(std::ostream *stream);
	void setStderr(std::ostream *stream);

    private:

        void setIO(std::unique_ptr<IO> io);

        std::map<int, std::unique_ptr<IO>> m_iomap;
};

//}}}
//{{{ ProcessFilter::IO --------------------------------------------------------

class ProcessFilter::IO {
    public:
	/**
	 * Prepare a new IO object.
	 *
	 * @param[in] fd desired file descriptor in the child.
         * @param[in] pipe subprocess pipe.
	 */
        IO(int fd, std::shared_ptr<SubProcessPipe> pipe)
            : m_fd(fd), m_pipe(pipe)
	{ }

	virtual ~IO()
	{ }

	/**
	 * Get the associated file descriptor.
	 */
	int getFD(void) const
	{ return m_fd; }

	/**
	 * Prepare a SubProcess instance (before spawning a child).
	 */
        void setupSubProcess(SubProcess &p)
        { p.setChildFD(m_fd, m_pipe); }

	/**
	 * Set up I/O multiplexing.
	 *
	 * @param[in,out] io IO multiplexer instance
	 *
	 * This method is called after the subprocess has already started,
	 * so you can get pipe file descriptors, etc.
	 */
        virtual void setupIO(MultiplexIO &io) = 0;

	/**
	 * Handle I/O events.
	 *
	 * @param[in,out] io IO multiplexer instance
	 */
        virtual void handleEvents(MultiplexIO &io) = 0;

    protected:
	/**
	 * Desired file descriptor in the child.
	 */
	int m_fd;

        /**
         * Pipe setup for the child.
         */
        std::shared_ptr<SubProcessPipe> m_pipe;
};

//}}}

#endif /* PROCESS_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
