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
#include <unistd.h>

#include <string>
#include <vector>

#include "cirrus.h"
#include "dumper.h"
#include "error.h"
#include "runtime.h"
#include "util.h"

using std::string;
using std::vector;

static const long MAX_READY_BACKOFF_MS = 30000;

/* Quote an SQL identifier. */
static string quote_identifier(const string &name)
{
    string out = "\"";
    for (size_t i = 0; i < name.size(); i++) {
        if (name[i] == '"')
            out += '"';
        out += name[i];
    }
    return out + "\"";
}

ComposeDatabaseDumper::ComposeDatabaseDumper(ContainerRuntime *runtime,
                                             const Config &config)
    : runtime(runtime), service(config.db_service),
      database(config.postgres_db), user(config.postgres_user),
      trial_image(config.trial_image),
      ready_attempts(config.db_ready_attempts),
      backoff_ms(config.retry_backoff_ms), timeout(config.db_timeout)
{
}

void ComposeDatabaseDumper::WaitReady(const string &scratch)
{
    vector<string> argv;
    argv.push_back("pg_isready");
    if (!scratch.empty()) {
        // The image's init scripts run a socket-only server first.
        argv.push_back("-h");
        argv.push_back("127.0.0.1");
    }
    argv.push_back("-U");
    argv.push_back(user);
    argv.push_back("-d");
    argv.push_back(database);

    long delay = backoff_ms;
    for (int attempt = 1; attempt <= ready_attempts; attempt++) {
        int status;
        try {
            if (scratch.empty())
                status = runtime->Exec(service, argv, "", "", 30);
            else
                status = runtime->ExecScratch(scratch, argv, "", 30);
        } catch (CirrusError &e) {
            if (!error_is_transient(e.get_kind()))
                throw;
            status = -1;
        }
        if (status == 0)
            return;

        if (attempt < ready_attempts) {
            fprintf(stderr, "Warning: database not ready (attempt %d of %d), "
                    "waiting %ld ms\n", attempt, ready_attempts, delay);
            sleep_ms(delay);
            delay *= 2;
            if (delay > MAX_READY_BACKOFF_MS)
                delay = MAX_READY_BACKOFF_MS;
        }
    }

    throw CirrusError(ERR_UNREACHABLE,
                      string_printf("Database %s did not accept "
                                    "connections after %d attempts",
                                    (scratch.empty() ? service
                                     : scratch).c_str(), ready_attempts));
}

void ComposeDatabaseDumper::Dump(const string &out_path)
{
    WaitReady();

    if (verbose)
        printf("Dumping database %s\n", database.c_str());

    vector<string> argv;
    argv.push_back("pg_dump");
    argv.push_back("-U");
    argv.push_back(user);
    argv.push_back(database);

    int status = runtime->Exec(service, argv, "", out_path, timeout);
    if (status != 0) {
        unlink(out_path.c_str());
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("pg_dump exited with status %d",
                                        status));
    }

    if (!path_exists(out_path) || file_size(out_path) == 0) {
        unlink(out_path.c_str());
        throw CirrusError(ERR_TRANSIENT_IO, "pg_dump produced an empty dump");
    }
}

int ComposeDatabaseDumper::Psql(const string &db, const string &command,
                                const string &stdin_path)
{
    vector<string> argv;
    argv.push_back("psql");
    argv.push_back("-U");
    argv.push_back(user);
    argv.push_back("-d");
    argv.push_back(db);
    if (!command.empty()) {
        argv.push_back("-v");
        argv.push_back("ON_ERROR_STOP=1");
        argv.push_back("-c");
        argv.push_back(command);
    }

    return runtime->Exec(service, argv, stdin_path, "", timeout);
}

void ComposeDatabaseDumper::Restore(const string &dump_path)
{
    runtime->Up(service);
    WaitReady();

    if (verbose)
        printf("Recreating database %s\n", database.c_str());

    // The restore replaces the database as a whole, so that objects created
    // after the snapshot do not survive it.
    int status = Psql("postgres", "DROP DATABASE IF EXISTS "
                      + quote_identifier(database) + ";", "");
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("Dropping database %s failed with "
                                        "status %d", database.c_str(),
                                        status));

    status = Psql("postgres", "CREATE DATABASE " + quote_identifier(database)
                  + " OWNER " + quote_identifier(user) + ";", "");
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("Creating database %s failed with "
                                        "status %d", database.c_str(),
                                        status));

    if (verbose)
        printf("Loading database dump\n");

    status = Psql(database, "", dump_path);
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("psql exited with status %d while "
                                        "loading the dump", status));
}

void ComposeDatabaseDumper::TrialRestore(const string &dump_path)
{
    string name = "cirrus-trial-" + generate_uuid();
    vector<string> env;
    env.push_back("POSTGRES_USER=" + user);
    env.push_back("POSTGRES_DB=" + database);
    env.push_back("POSTGRES_PASSWORD=" + generate_uuid());

    printf("Trying the database dump in a %s container\n",
           trial_image.c_str());
    runtime->RunScratch(name, trial_image, env);

    int status;
    try {
        WaitReady(name);

        vector<string> argv;
        argv.push_back("psql");
        argv.push_back("-h");
        argv.push_back("127.0.0.1");
        argv.push_back("-U");
        argv.push_back(user);
        argv.push_back("-d");
        argv.push_back(database);
        argv.push_back("-v");
        argv.push_back("ON_ERROR_STOP=1");
        status = runtime->ExecScratch(name, argv, dump_path, timeout);
    } catch (CirrusError &) {
        runtime->RemoveScratch(name);
        throw;
    }
    runtime->RemoveScratch(name);

    if (status != 0)
        throw CirrusError(ERR_CORRUPTION,
                          string_printf("The database dump does not load: "
                                        "psql exited with status %d",
                                        status));
}
