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

/* Logical dumps of the application's PostgreSQL database.  The database is
 * dumped completely for every snapshot, whatever its kind, and restored by
 * replacing the database as a whole. */

#ifndef _CIRRUS_DUMPER_H
#define _CIRRUS_DUMPER_H

#include <string>

#include "config.h"

class ContainerRuntime;

class DatabaseDumper {
public:
    virtual ~DatabaseDumper() { }

    // Write a self-contained dump to out_path.  Throws ERR_UNREACHABLE if
    // the database never accepts connections, ERR_TRANSIENT_IO if the dump
    // fails or comes out empty.
    virtual void Dump(const std::string &out_path) = 0;

    // Replace the database with the contents of a dump.
    virtual void Restore(const std::string &dump_path) = 0;

    // Load a dump into a scratch database which is thrown away afterwards.
    // Throws ERR_CORRUPTION if the dump does not load.
    virtual void TrialRestore(const std::string &dump_path) = 0;
};

/* Runs pg_dump and psql inside the stack's database service.  Trial restores
 * run psql in a throwaway container of the configured PostgreSQL image. */
class ComposeDatabaseDumper : public DatabaseDumper {
public:
    ComposeDatabaseDumper(ContainerRuntime *runtime, const Config &config);

    virtual void Dump(const std::string &out_path);
    virtual void Restore(const std::string &dump_path);
    virtual void TrialRestore(const std::string &dump_path);

    // Wait, with exponential backoff, until pg_isready succeeds in the
    // database service, or in the named scratch container if one is given.
    void WaitReady(const std::string &scratch = "");

private:
    ContainerRuntime *runtime;
    std::string service, database, user;
    std::string trial_image;
    int ready_attempts;
    long backoff_ms;
    int timeout;

    int Psql(const std::string &db, const std::string &command,
             const std::string &stdin_path);
};

#endif // _CIRRUS_DUMPER_H
