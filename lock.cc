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
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/file.h>

#include <string>

#include "cirrus.h"
#include "error.h"
#include "lock.h"
#include "util.h"

using std::string;

InstanceLock::InstanceLock(const string &state_dir, const string &instance)
    : path(path_join(state_dir, instance + ".lock")), fd(-1)
{
    make_dirs(state_dir, 0700);

    fd = open(path.c_str(), O_RDWR | O_CREAT, 0600);
    if (fd < 0)
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to open lock file %s: %s",
                                        path.c_str(), strerror(errno)));
    cloexec(fd);

    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(fd);
        fd = -1;
        if (err == EWOULDBLOCK)
            throw CirrusError(ERR_BUSY,
                              "Another operation is running for instance "
                              + instance);
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to lock %s: %s", path.c_str(),
                                        strerror(err)));
    }

    // Record the holder, for whoever finds the lock busy.
    string pid = encode_int(getpid()) + "\n";
    if (ftruncate(fd, 0) < 0 || write(fd, pid.data(), pid.size()) < 0)
        fprintf(stderr, "Warning: unable to write %s: %m\n", path.c_str());

    if (verbose)
        printf("Acquired lock %s\n", path.c_str());
}

InstanceLock::~InstanceLock()
{
    if (fd >= 0) {
        flock(fd, LOCK_UN);
        close(fd);
    }
}
