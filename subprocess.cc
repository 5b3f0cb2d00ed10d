/* Cirrus: Snapshot Backups for Self-Hosted Document Stacks
 * Copyright (C) 2026 The Cirrus Developers
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "cirrus.h"
#include "error.h"
#include "subprocess.h"
#include "util.h"

using std::string;
using std::vector;

string format_command(const vector<string> &argv)
{
    string result;

    for (vector<string>::const_iterator i = argv.begin();
         i != argv.end(); ++i) {
        if (i != argv.begin())
            result += " ";
        if (i->find_first_of(" \t'\"") != string::npos)
            result += "'" + *i + "'";
        else
            result += *i;
    }

    return result;
}

static double monotonic_now()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec / 1e9;
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return 1;
}

/* Child side of run_command: rearrange file descriptors and exec.  Only
 * async-signal-safe calls are made between fork and exec. */
static void exec_child(const CommandOptions &options,
                       int in_fd, int out_fd, char **args)
{
    if (!options.cwd.empty() && chdir(options.cwd.c_str()) < 0)
        _exit(127);

    if (dup2(in_fd, 0) < 0)
        _exit(127);
    if (out_fd >= 0 && dup2(out_fd, 1) < 0)
        _exit(127);

    execvp(args[0], args);

    /* Should not reach here except for error cases. */
    _exit(127);
}

int run_command(const vector<string> &argv, const CommandOptions &options)
{
    if (argv.empty())
        throw CirrusError(ERR_LOCAL_IO, "run_command: empty command");

    if (verbose)
        printf("+ %s\n", format_command(argv).c_str());

    const char *in_path = options.stdin_path.empty()
        ? "/dev/null" : options.stdin_path.c_str();
    int in_fd = open(in_path, O_RDONLY);
    if (in_fd < 0) {
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to open %s: %s", in_path,
                                        strerror(errno)));
    }
    cloexec(in_fd);

    int out_fd = -1;
    int pipe_fds[2] = { -1, -1 };
    if (!options.stdout_path.empty()) {
        out_fd = open(options.stdout_path.c_str(),
                      O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (out_fd < 0) {
            int saved_errno = errno;
            close(in_fd);
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("Error opening output file %s: %s",
                                            options.stdout_path.c_str(),
                                            strerror(saved_errno)));
        }
        cloexec(out_fd);
    } else if (options.capture_stdout != NULL) {
        if (pipe(pipe_fds) < 0) {
            close(in_fd);
            throw CirrusError(ERR_LOCAL_IO,
                              "Unable to create pipe for child process");
        }
        cloexec(pipe_fds[0]);
        cloexec(pipe_fds[1]);
        out_fd = pipe_fds[1];
    }

    /* Build the argument vector before forking. */
    vector<char *> args;
    for (vector<string>::const_iterator i = argv.begin();
         i != argv.end(); ++i) {
        args.push_back(const_cast<char *>(i->c_str()));
    }
    args.push_back(NULL);

    pid_t pid = fork();
    if (pid < 0) {
        int saved_errno = errno;
        close(in_fd);
        if (out_fd >= 0)
            close(out_fd);
        if (pipe_fds[0] >= 0)
            close(pipe_fds[0]);
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to fork %s: %s",
                                        argv[0].c_str(),
                                        strerror(saved_errno)));
    }

    if (pid == 0)
        exec_child(options, in_fd, out_fd, &args[0]);

    /* Parent */
    close(in_fd);
    if (out_fd >= 0)
        close(out_fd);

    double deadline = options.timeout > 0
        ? monotonic_now() + options.timeout : 0;
    bool timed_out = false;

    if (pipe_fds[0] >= 0) {
        char buf[4096];
        while (true) {
            int wait_ms = -1;
            if (deadline > 0) {
                double left = deadline - monotonic_now();
                if (left <= 0) {
                    timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(left * 1000) + 1;
            }

            struct pollfd pfd;
            pfd.fd = pipe_fds[0];
            pfd.events = POLLIN;
            int res = poll(&pfd, 1, wait_ms);
            if (res < 0) {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (res == 0)
                continue;

            ssize_t bytes = read(pipe_fds[0], buf, sizeof(buf));
            if (bytes < 0) {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (bytes == 0)
                break;
            options.capture_stdout->append(buf, bytes);
        }
        close(pipe_fds[0]);
    }

    if (timed_out)
        kill(pid, SIGKILL);

    int status = 0;
    while (true) {
        pid_t res = waitpid(pid, &status, timed_out ? 0 : WNOHANG);
        if (res == pid)
            break;
        if (res < 0) {
            if (errno == EINTR)
                continue;
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("waitpid(%s): %s",
                                            argv[0].c_str(),
                                            strerror(errno)));
        }

        /* Still running. */
        if (deadline > 0 && monotonic_now() >= deadline) {
            kill(pid, SIGKILL);
            timed_out = true;
            continue;
        }
        sleep_ms(10);
    }

    if (timed_out) {
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("%s timed out after %d seconds",
                                        argv[0].c_str(), options.timeout));
    }

    return decode_status(status);
}
