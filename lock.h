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

/* Mutual exclusion between cirrus processes working on the same instance.
 * The lock is an flock(2) lock on "<state_dir>/<instance>.lock", so it is
 * released automatically if the holder dies.  Acquiring it never waits: a
 * lock held by someone else is reported as ERR_BUSY. */

#ifndef _CIRRUS_LOCK_H
#define _CIRRUS_LOCK_H

#include <string>

#include "util.h"

class InstanceLock : public noncopyable {
public:
    InstanceLock(const std::string &state_dir, const std::string &instance);
    ~InstanceLock();

    const std::string &Path() const { return path; }

private:
    std::string path;
    int fd;
};

#endif // _CIRRUS_LOCK_H
