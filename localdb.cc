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

#include <stdio.h>
#include <string.h>
#include <sqlite3.h>

#include <string>
#include <vector>

#include "cirrus.h"
#include "error.h"
#include "localdb.h"
#include "util.h"

using std::string;
using std::vector;

static const int SCHEMA_MAJOR = 1;
static const int SCHEMA_MINOR = 0;

static const char SNAPSHOT_COLUMNS[] =
    "id, kind, parent, status, started, finished, size, message";

/* Helper function to prepare a statement for execution in the current
 * database. */
sqlite3_stmt *LocalDb::Prepare(const char *sql)
{
    sqlite3_stmt *stmt;
    int rc;
    const char *tail;

    rc = sqlite3_prepare_v2(db, sql, strlen(sql), &stmt, &tail);
    if (rc != SQLITE_OK) {
        ReportError(rc);
        throw CirrusError(ERR_LOCAL_IO,
                          string("Error preparing statement: ") + sql);
    }

    return stmt;
}

void LocalDb::ReportError(int rc)
{
    fprintf(stderr, "Result code: %d\n", rc);
    fprintf(stderr, "Error message: %s\n", sqlite3_errmsg(db));
}

void LocalDb::Exec(const char *sql)
{
    int rc = sqlite3_exec(db, sql, NULL, NULL, NULL);
    if (rc != SQLITE_OK) {
        ReportError(rc);
        throw CirrusError(ERR_LOCAL_IO,
                          string("Local database error in: ") + sql);
    }
}

/* Run a statement which returns no rows, then finalize it. */
void LocalDb::Step(sqlite3_stmt *stmt)
{
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        ReportError(rc);
        throw CirrusError(ERR_LOCAL_IO, "Local database execution error");
    }
}

static void bind_string(sqlite3_stmt *stmt, int index, const string &s)
{
    sqlite3_bind_text(stmt, index, s.c_str(), s.size(), SQLITE_TRANSIENT);
}

static string column_string(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (text == NULL)
        return "";
    return string(reinterpret_cast<const char *>(text));
}

void LocalDb::CreateSchema()
{
    Exec("create table if not exists schema_version ("
         "    major integer not null,"
         "    minor integer not null"
         ")");
    Exec("create table if not exists snapshots ("
         "    id text primary key,"
         "    kind text not null,"
         "    parent text,"
         "    status text not null,"
         "    started integer not null,"
         "    finished integer,"
         "    size integer not null default 0,"
         "    message text"
         ")");
    Exec("create table if not exists tokens ("
         "    domain text primary key,"
         "    snapshot text not null,"
         "    updated integer not null"
         ")");

    sqlite3_stmt *stmt = Prepare("select major, minor from schema_version");
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        int major = sqlite3_column_int(stmt, 0);
        int minor = sqlite3_column_int(stmt, 1);
        sqlite3_finalize(stmt);
        if (major != SCHEMA_MAJOR) {
            fprintf(stderr,
                    "Local database does not have required schema version!\n"
                    "  expected: %d.%d, found: %d.%d\n",
                    SCHEMA_MAJOR, SCHEMA_MINOR, major, minor);
            throw CirrusError(ERR_LOCAL_IO,
                              "Unsupported local database version");
        }
    } else {
        sqlite3_finalize(stmt);
        stmt = Prepare("insert into schema_version(major, minor) "
                       "values (?, ?)");
        sqlite3_bind_int(stmt, 1, SCHEMA_MAJOR);
        sqlite3_bind_int(stmt, 2, SCHEMA_MINOR);
        Step(stmt);
    }
}

void LocalDb::Open(const string &path, bool locked)
{
    int rc;

    rc = sqlite3_open(path.c_str(), &db);
    if (rc) {
        fprintf(stderr, "Can't open database: %s\n", sqlite3_errmsg(db));
        sqlite3_close(db);
        db = NULL;
        throw CirrusError(ERR_LOCAL_IO, "Error opening local database " + path);
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, 5000);

    Exec("begin");
    try {
        CreateSchema();

        /* A run still pending now was interrupted: with the instance lock
         * held, nothing else can be working on it. */
        if (locked) {
            sqlite3_stmt *stmt = Prepare(
                "update snapshots set status = 'failed', "
                "message = 'interrupted' where status = 'pending'");
            Step(stmt);
            int stale = sqlite3_changes(db);
            if (stale > 0 && verbose)
                printf("Marked %d interrupted run(s) as failed\n", stale);
        }

        Exec("commit");
    } catch (CirrusError &) {
        sqlite3_exec(db, "rollback", NULL, NULL, NULL);
        Close();
        throw;
    }
}

void LocalDb::Close()
{
    if (db == NULL)
        return;

    int rc = sqlite3_close(db);
    if (rc != SQLITE_OK) {
        fprintf(stderr, "DATABASE ERROR: Can't close database!\n");
        ReportError(rc);
    }
    db = NULL;
}

void LocalDb::BeginSnapshot(const string &id, SnapshotKind kind,
                            const string &parent, time_t started)
{
    sqlite3_stmt *stmt = Prepare(
        "insert or replace into snapshots(id, kind, parent, status, started) "
        "values (?, ?, ?, 'pending', ?)");
    bind_string(stmt, 1, id);
    sqlite3_bind_text(stmt, 2, kind_to_string(kind), -1, SQLITE_STATIC);
    if (parent.empty())
        sqlite3_bind_null(stmt, 3);
    else
        bind_string(stmt, 3, parent);
    sqlite3_bind_int64(stmt, 4, started);
    Step(stmt);
}

void LocalDb::FinishSnapshot(const string &id, SnapshotStatus status,
                             int64_t size, const string &message)
{
    sqlite3_stmt *stmt = Prepare(
        "update snapshots set status = ?, finished = ?, size = ?, "
        "message = ? where id = ?");
    sqlite3_bind_text(stmt, 1, status_to_string(status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, time(NULL));
    sqlite3_bind_int64(stmt, 3, size);
    bind_string(stmt, 4, message);
    bind_string(stmt, 5, id);
    Step(stmt);
}

SnapshotRecord LocalDb::ReadRecord(sqlite3_stmt *stmt)
{
    SnapshotRecord record;
    record.id = column_string(stmt, 0);
    if (!parse_kind(column_string(stmt, 1), &record.kind))
        fprintf(stderr, "Warning: snapshot %s has unknown kind \"%s\"\n",
                record.id.c_str(), column_string(stmt, 1).c_str());
    record.parent = column_string(stmt, 2);
    if (!parse_status(column_string(stmt, 3), &record.status))
        record.status = STATUS_FAILED;
    record.started = sqlite3_column_int64(stmt, 4);
    record.finished = sqlite3_column_int64(stmt, 5);
    record.size = sqlite3_column_int64(stmt, 6);
    record.message = column_string(stmt, 7);
    return record;
}

bool LocalDb::LastCommitted(SnapshotRecord *record)
{
    string sql = string("select ") + SNAPSHOT_COLUMNS + " from snapshots "
        "where status = 'verified' order by id desc limit 1";
    sqlite3_stmt *stmt = Prepare(sql.c_str());

    bool found = false;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *record = ReadRecord(stmt);
        found = true;
    } else if (rc != SQLITE_DONE) {
        ReportError(rc);
        sqlite3_finalize(stmt);
        throw CirrusError(ERR_LOCAL_IO, "Local database execution error");
    }

    sqlite3_finalize(stmt);
    return found;
}

vector<SnapshotRecord> LocalDb::RecentRuns(int limit)
{
    string sql = string("select ") + SNAPSHOT_COLUMNS + " from snapshots "
        "order by id desc limit ?";
    sqlite3_stmt *stmt = Prepare(sql.c_str());
    sqlite3_bind_int(stmt, 1, limit);

    vector<SnapshotRecord> runs;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        runs.push_back(ReadRecord(stmt));
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        ReportError(rc);
        throw CirrusError(ERR_LOCAL_IO, "Local database execution error");
    }

    return runs;
}

void LocalDb::SetToken(const string &domain, const string &snapshot)
{
    sqlite3_stmt *stmt = Prepare(
        "insert or replace into tokens(domain, snapshot, updated) "
        "values (?, ?, ?)");
    bind_string(stmt, 1, domain);
    bind_string(stmt, 2, snapshot);
    sqlite3_bind_int64(stmt, 3, time(NULL));
    Step(stmt);
}

void LocalDb::ClearToken(const string &domain)
{
    sqlite3_stmt *stmt = Prepare("delete from tokens where domain = ?");
    bind_string(stmt, 1, domain);
    Step(stmt);
}

string LocalDb::GetToken(const string &domain)
{
    sqlite3_stmt *stmt = Prepare(
        "select snapshot from tokens where domain = ?");
    bind_string(stmt, 1, domain);

    string snapshot;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
        snapshot = column_string(stmt, 0);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        ReportError(rc);
        throw CirrusError(ERR_LOCAL_IO, "Local database execution error");
    }

    return snapshot;
}
