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

/* The snapshot engine: the operations behind the command-line verbs.  It
 * ties the archiver, database dumper, sealer, remote store, retention pruner,
 * chain resolver and restore applier together, holds the instance lock for
 * the duration of each operation, and journals snapshot runs in the local
 * database.
 *
 * A snapshot is created in a private staging directory, uploaded, and only
 * then are the change-state tokens advanced; a run which fails at any point
 * leaves the tokens and the remote namespace as they were.  A database dump
 * which does not load into a throwaway database fails the run. */

#ifndef _CIRRUS_ENGINE_H
#define _CIRRUS_ENGINE_H

#include <time.h>

#include <string>
#include <vector>

#include "config.h"
#include "localdb.h"
#include "snapshot.h"
#include "util.h"

class Archiver;
class ContainerRuntime;
class DatabaseDumper;
class PassphraseSource;
class RemoteStore;

class SnapshotEngine : public noncopyable {
public:
    SnapshotEngine(const Config &config, RemoteStore *remote,
                   Archiver *archiver, DatabaseDumper *dumper,
                   ContainerRuntime *runtime);
    virtual ~SnapshotEngine() { }

    // Overrides the passphrase file named in the configuration.
    void set_passphrase(const PassphraseSource *source)
        { passphrase = source; }
    void set_keep_config(bool keep) { keep_config = keep; }
    void set_prune(bool enabled) { prune_enabled = enabled; }

    // Take a snapshot and return its id.  An incremental snapshot is taken
    // as a full one if there is no usable parent or change-state token.
    std::string Create(SnapshotKind kind);

    // Committed snapshots of the instance, oldest first.
    std::vector<Snapshot> List();
    // Runs journaled on this host, newest first.
    std::vector<SnapshotRecord> RecentRuns(int limit);

    // Download a snapshot, check every artifact, and check that its chain
    // resolves.
    void Verify(const std::string &id);

    std::vector<std::string> Prune();

    // Restore a snapshot, or the latest one if id is empty.  Returns the id
    // restored.
    std::string Restore(const std::string &id);

protected:
    virtual time_t Now();

private:
    const Config &config;
    RemoteStore *remote;
    Archiver *archiver;
    DatabaseDumper *dumper;
    ContainerRuntime *runtime;
    const PassphraseSource *passphrase;
    bool keep_config;
    bool prune_enabled;

    std::string DbPath() const;
    SnapshotKind ChooseParent(SnapshotKind kind, LocalDb *db,
                              std::string *parent);
    void AddConfig(const std::string &staging, Snapshot *snapshot);
    void AddCompose(const std::string &staging, Snapshot *snapshot);
    // Image versions are informational; failing to read them only warns.
    void RecordImages(Snapshot *snapshot);
    void CheckPassphrase();
    void ResetTokens(LocalDb *db);
    std::vector<std::string> PruneLocked();
};

#endif // _CIRRUS_ENGINE_H
