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

/* The local state database journals every snapshot run started on this host,
 * and records which snapshot each domain's change-state token describes.  It
 * is consulted to find the parent for an incremental snapshot, and lets a run
 * that was interrupted be recognized on the next start.
 *
 * The database is implemented as an SQLite3 database, but this implementation
 * detail is kept internal to this file, so that the storage format may be
 * changed later. */

#ifndef _CIRRUS_LOCALDB_H
#define _CIRRUS_LOCALDB_H

#include <sqlite3.h>
#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

#include "snapshot.h"
#include "util.h"

/* One row of the snapshot journal. */
struct SnapshotRecord {
    SnapshotRecord() : kind(KIND_FULL), status(STATUS_PENDING), started(0),
                       finished(0), size(0) { }

    std::string id;
    SnapshotKind kind;
    std::string parent;
    SnapshotStatus status;
    time_t started, finished;
    int64_t size;
    std::string message;
};

class LocalDb : public noncopyable {
public:
    LocalDb() : db(NULL) { }
    ~LocalDb() { Close(); }

    // Open (creating if needed) the database at path.  If the caller holds
    // the instance lock, runs still marked pending from an earlier,
    // interrupted invocation are marked failed.
    void Open(const std::string &path, bool locked = true);
    void Close();

    void BeginSnapshot(const std::string &id, SnapshotKind kind,
                       const std::string &parent, time_t started);
    void FinishSnapshot(const std::string &id, SnapshotStatus status,
                        int64_t size, const std::string &message);

    // The most recent verified snapshot, if any.
    bool LastCommitted(SnapshotRecord *record);
    std::vector<SnapshotRecord> RecentRuns(int limit);

    // Bookkeeping for change-state tokens.  GetToken returns an empty string
    // if the domain has no token.
    void SetToken(const std::string &domain, const std::string &snapshot);
    void ClearToken(const std::string &domain);
    std::string GetToken(const std::string &domain);

private:
    sqlite3 *db;

    sqlite3_stmt *Prepare(const char *sql);
    void ReportError(int rc);
    void Exec(const char *sql);
    void Step(sqlite3_stmt *stmt);
    void CreateSchema();
    SnapshotRecord ReadRecord(sqlite3_stmt *stmt);
};

#endif // _CIRRUS_LOCALDB_H
