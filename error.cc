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

#include <string>

#include "error.h"

using std::string;

const char *error_kind_name(ErrorKind kind)
{
    switch (kind) {
    case ERR_TRANSIENT_IO:
        return "TransientIO";
    case ERR_CORRUPTION:
        return "Corruption";
    case ERR_UNREACHABLE:
        return "Unreachable";
    case ERR_POLICY_CONFLICT:
        return "PolicyConflict";
    case ERR_INVALID_INPUT:
        return "InvalidInput";
    case ERR_BUSY:
        return "Busy";
    case ERR_LOCAL_IO:
        return "LocalIO";
    }
    return "Unknown";
}

bool error_is_transient(ErrorKind kind)
{
    switch (kind) {
    case ERR_TRANSIENT_IO:
        return true;
    case ERR_CORRUPTION:
    case ERR_UNREACHABLE:
    case ERR_POLICY_CONFLICT:
    case ERR_INVALID_INPUT:
    case ERR_BUSY:
    case ERR_LOCAL_IO:
        return false;
    }
    return false;
}

CirrusError::CirrusError(ErrorKind kind, const string &err)
    : kind(kind), error(err)
{
}

CirrusError::CirrusError(ErrorKind kind, const string &err,
                         const string &snapshot)
    : kind(kind), error(err), snapshot(snapshot)
{
}
