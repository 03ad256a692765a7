/*
 * (c) 2014, Petr Tesarik <ptesarik@suse.de>, SUSE LINUX Products GmbH
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
#include <memory>
#include <sstream>
#include <string>
#include <typeinfo>

#include <unistd.h>

#include "global.h"
#include "process.h"
#include "debug.h"
#include "fileutil.h"
#include "stringvector.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::make_shared;
using std::shared_ptr;
using std::string;
using std::stringstream;

// -----------------------------------------------------------------------------
static bool write_string(int fd, const string &s)
{
    ssize_t res = write(fd, s.data(), s.size());
    return res == ssize_t(s.size());
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    static const char hello_world[] = "Hello, world!\n";
    static const char another_line[] = "This line is not shown.\n";

    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;

        test.check("Uninitialized fd setup is nullptr",
                   []() {
                       SubProcess p;
                       return !p.getChildFD(0);
                   });

        test.check("Fd setups can be replaced and removed",
                   []() {
                       SubProcess p;
                       p.setChildFD(0, make_shared<ParentToChildPipe>());
                       bool ok = typeid(*p.getChildFD(0)) ==
                           typeid(ParentToChildPipe);
                       p.setChildFD(0, make_shared<ChildToParentPipe>());
                       ok = ok && typeid(*p.getChildFD(0)) ==
                           typeid(ChildToParentPipe);
                       p.setChildFD(0, nullptr);
                       return ok && !p.getChildFD(0);
                   });

        test.check("Exit status of 'true' is 0",
                   []() {
                       SubProcess p;
                       p.spawn("true", StringVector());
                       return SubProcess::exitCode(p.wait()) == 0;
                   });

        test.check("Exit status of 'false' is 1",
                   []() {
                       SubProcess p;
                       p.spawn("false", StringVector());
                       return SubProcess::exitCode(p.wait()) == 1;
                   });

        test.check("Missing program exits with 127",
                   []() {
                       SubProcess p;
                       p.spawn("firmwarenator-no-such-program",
                               StringVector());
                       return SubProcess::exitCode(p.wait()) == 127;
                   });

        test.check("wait() without a child throws",
                   []() {
                       return throws<KError>([]() {
                           SubProcess p;
                           p.wait();
                       });
                   });

        // Redirect the output from one command to another
        test.check("Pipe from 'cat' to 'grep'",
                   []() {
                       SubProcess cat, grep;
                       auto input = make_shared<ParentToChildPipe>();
                       auto output = make_shared<ChildToParentPipe>();
                       cat.setChildFD(0, input);
                       cat.setChildFD(1, output);
                       cat.spawn("cat", StringVector());

                       grep.setChildFD(0,
                           make_shared<SubProcessRedirect>(output->parentFD()));
                       StringVector args;
                       args.push_back("^Hello");
                       args.push_back("-");
                       grep.spawn("grep", args);
                       output->close();

                       bool ok = write_string(input->parentFD(), another_line);
                       ok = ok && write_string(input->parentFD(), hello_world);
                       input->close();

                       ok = ok && SubProcess::exitCode(cat.wait()) == 0;
                       ok = ok && SubProcess::exitCode(grep.wait()) == 0;
                       return ok;
                   });

        test.check("ProcessFilter passes stdin to stdout",
                   []() {
                       stringstream in(hello_world), out;
                       ProcessFilter p;
                       p.setStdin(&in);
                       p.setStdout(&out);
                       uint8_t status = p.execute("cat", StringVector());
                       return status == 0 && out.str() == hello_world;
                   });

        test.check("ProcessFilter handles data larger than a pipe buffer",
                   []() {
                       string big(1024 * 1024, 'x');
                       stringstream in(big), out;
                       ProcessFilter p;
                       p.setStdin(&in);
                       p.setStdout(&out);
                       uint8_t status = p.execute("cat", StringVector());
                       return status == 0 && out.str() == big;
                   });

        test.check("ProcessFilter captures stderr and the exit status",
                   []() {
                       stringstream out, err;
                       ProcessFilter p;
                       p.setStdout(&out);
                       p.setStderr(&err);
                       StringVector args;
                       args.push_back("-c");
                       args.push_back("echo out; echo err >&2; exit 3");
                       uint8_t status = p.execute("/bin/sh", args);
                       return status == 3 && out.str() == "out\n" &&
                           err.str() == "err\n";
                   });

        test.check("Working directory is set in the child",
                   []() {
                       TemporaryDirectory tmp("testprocess.");
                       FilePath dir = tmp.path().getCanonicalPath();

                       SubProcess p;
                       auto output = make_shared<ChildToParentPipe>();
                       p.setChildFD(1, output);
                       p.setWorkingDirectory(dir);
                       p.spawn("pwd", StringVector());

                       string text;
                       char buf[256];
                       ssize_t cnt;
                       while ((cnt = read(output->parentFD(), buf,
                                          sizeof buf)) > 0)
                           text.append(buf, cnt);
                       output->close();

                       int status = p.wait();
                       return SubProcess::exitCode(status) == 0 &&
                           text == dir + "\n";
                   });

        test.check("Bad working directory exits with 127",
                   []() {
                       SubProcess p;
                       p.setWorkingDirectory("/nonexistent/firmwarenator");
                       p.spawn("true", StringVector());
                       return SubProcess::exitCode(p.wait()) == 127;
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
