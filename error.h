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

/* Error reporting for the snapshot engine.  Every failure which can reach the
 * command-line driver is reported as a CirrusError, which carries a kind so
 * that callers can decide between retrying and aborting without looking at
 * the message text, and optionally the snapshot the failure concerns. */

#ifndef _CIRRUS_ERROR_H
#define _CIRRUS_ERROR_H

#include <exception>
#include <string>

enum ErrorKind {
    ERR_TRANSIENT_IO,       // Network or timeout problem; may be retried
    ERR_CORRUPTION,         // Checksum mismatch, broken or cyclic chain
    ERR_UNREACHABLE,        // A dependent service did not respond
    ERR_POLICY_CONFLICT,    // Retention would orphan a retained snapshot
    ERR_INVALID_INPUT,      // Bad arguments, configuration or snapshot id
    ERR_BUSY,               // Another operation holds the instance lock
    ERR_LOCAL_IO,           // Failure reading or writing local files
};

const char *error_kind_name(ErrorKind kind);

/* Only transient failures are worth repeating; corruption never goes away by
 * itself, and a dependent service gets its own bounded wait. */
bool error_is_transient(ErrorKind kind);

class CirrusError : public std::exception {
public:
    CirrusError(ErrorKind kind, const std::string &err);
    CirrusError(ErrorKind kind, const std::string &err,
                const std::string &snapshot);
    virtual ~CirrusError() throw () { }

    ErrorKind get_kind() const { return kind; }
    std::string getError() const { return error; }
    const std::string &get_snapshot() const { return snapshot; }
    void set_snapshot(const std::string &s) { snapshot = s; }

    virtual const char *what() const throw () { return error.c_str(); }

private:
    ErrorKind kind;
    std::string error;
    std::string snapshot;
};

/* Raised by the chain resolver when a parent manifest cannot be found.  A
 * restore must never continue from a partial chain. */
class ChainBroken : public CirrusError {
public:
    ChainBroken(const std::string &err, const std::string &snapshot)
        : CirrusError(ERR_CORRUPTION, err, snapshot) { }
};

#endif // _CIRRUS_ERROR_H
