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

/* Running external programs (docker compose, rclone, pg_dump through the
 * container runtime).  This is the only place where process management
 * happens; everything above it sees exit codes, captured output and
 * CirrusError exceptions. */

#ifndef _CIRRUS_SUBPROCESS_H
#define _CIRRUS_SUBPROCESS_H

#include <string>
#include <vector>

struct CommandOptions {
    CommandOptions() : timeout(0), capture_stdout(NULL) { }

    // If non-empty, the child's stdin is read from / stdout is written to the
    // named file.  Otherwise stdin is /dev/null and stdout is inherited (or
    // captured, see below).
    std::string stdin_path, stdout_path;

    // Working directory for the child, if non-empty.
    std::string cwd;

    // Seconds before the child is killed; 0 means no limit.
    int timeout;

    // If non-NULL and stdout_path is empty, stdout is collected here.
    std::string *capture_stdout;
};

/* Run a program (looked up in PATH) and wait for it.  Returns its exit
 * status; a child killed by a signal is reported as 128 + signal number, and
 * a program which cannot be executed as 127.  Throws CirrusError of kind
 * ERR_TRANSIENT_IO if the timeout expires (the child is killed), or
 * ERR_LOCAL_IO if the process cannot be started at all. */
int run_command(const std::vector<std::string> &argv,
                const CommandOptions &options);

// Human-readable form of a command line, for log messages.
std::string format_command(const std::vector<std::string> &argv);

#endif // _CIRRUS_SUBPROCESS_H
