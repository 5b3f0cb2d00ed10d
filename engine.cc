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

#include <map>
#include <set>
#include <string>
#include <vector>

#include "archiver.h"
#include "chain.h"
#include "cirrus.h"
#include "dumper.h"
#include "engine.h"
#include "error.h"
#include "localdb.h"
#include "lock.h"
#include "manifest.h"
#include "remote.h"
#include "restore.h"
#include "retention.h"
#include "runtime.h"
#include "sealer.h"
#include "util.h"

using std::map;
using std::set;
using std::string;
using std::vector;

/* A private temporary directory, removed with everything in it when the
 * object goes out of scope. */
class StagingDir : public noncopyable {
public:
    StagingDir(const string &base, const string &prefix)
        : path(make_temp_dir(base, prefix)) { }
    ~StagingDir() {
        try {
            remove_tree(path);
        } catch (CirrusError &e) {
            fprintf(stderr, "Warning: unable to clean up %s: %s\n",
                    path.c_str(), e.what());
        }
    }

    const string &Path() const { return path; }

private:
    string path;
};

static string host_identity()
{
    char buf[256];
    if (gethostname(buf, sizeof(buf)) < 0)
        return "unknown";
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

SnapshotEngine::SnapshotEngine(const Config &config, RemoteStore *remote,
                               Archiver *archiver, DatabaseDumper *dumper,
                               ContainerRuntime *runtime)
    : config(config), remote(remote), archiver(archiver), dumper(dumper),
      runtime(runtime), passphrase(NULL), keep_config(false),
      prune_enabled(true)
{
}

time_t SnapshotEngine::Now()
{
    return time(NULL);
}

string SnapshotEngine::DbPath() const
{
    return path_join(config.state_dir, config.instance_name + ".db");
}

/* Decide what an incremental snapshot can build on.  The parent is the last
 * snapshot committed from this host; it must still be stored, its chain must
 * resolve, and every domain's token must come from that chain.  Otherwise
 * the snapshot is taken as a full one. */
SnapshotKind SnapshotEngine::ChooseParent(SnapshotKind kind, LocalDb *db,
                                          string *parent)
{
    parent->clear();
    if (kind != KIND_INCREMENTAL)
        return kind;

    string ns = config.namespace_name();
    string reason;
    SnapshotRecord last;
    vector<Snapshot> chain;

    if (!db->LastCommitted(&last)) {
        reason = "no earlier snapshot";
    } else {
        RemoteManifestSource source(remote, ns);
        ChainResolver resolver(&source, config.max_chain_hops);
        try {
            chain = resolver.Resolve(last.id);
            // Leave room for the new snapshot within the hop limit.
            if ((int)chain.size() > config.max_chain_hops)
                reason = "the chain of " + last.id + " is at its length "
                    "limit";
        } catch (CirrusError &e) {
            if (e.get_kind() != ERR_CORRUPTION
                && e.get_kind() != ERR_INVALID_INPUT)
                throw;
            reason = "parent " + last.id + " is not usable: " + e.getError();
        }
    }

    set<string> chain_ids;
    set<string> archived_in_chain;
    for (vector<Snapshot>::const_iterator i = chain.begin();
         i != chain.end(); ++i) {
        chain_ids.insert(i->id);
        for (map<string, Artifact>::const_iterator a = i->artifacts.begin();
             a != i->artifacts.end(); ++a) {
            archived_in_chain.insert(a->first);
        }
    }

    const vector<string> &domains = archived_domains();
    for (vector<string>::const_iterator d = domains.begin();
         reason.empty() && d != domains.end(); ++d) {
        string token = archiver->TokenSnapshot(*d);
        if (token != db->GetToken(*d)) {
            reason = "the " + *d + " token does not match the local database";
        } else if (token.empty()) {
            if (archived_in_chain.count(*d))
                reason = "no change-state token for " + *d;
        } else if (chain_ids.count(token) == 0) {
            reason = "the " + *d + " token belongs to snapshot " + token
                + ", outside the chain of " + last.id;
        }
    }

    if (!reason.empty()) {
        printf("Taking a full snapshot instead: %s\n", reason.c_str());
        return KIND_FULL;
    }

    *parent = last.id;
    return KIND_INCREMENTAL;
}

void SnapshotEngine::CheckPassphrase()
{
    if (config.config_mode != CONFIG_SEALED || !path_exists(config.env_file))
        return;

    if (passphrase != NULL)
        passphrase->Read();
    else
        PassphraseSource::FromFile(config.passphrase_file).Read();
}

void SnapshotEngine::AddConfig(const string &staging, Snapshot *snapshot)
{
    if (config.config_mode == CONFIG_NONE)
        return;

    if (!path_exists(config.env_file)) {
        fprintf(stderr, "Warning: configuration file %s not found, not "
                "included\n", config.env_file.c_str());
        return;
    }

    switch (config.config_mode) {
    case CONFIG_NONE:
        return;
    case CONFIG_PLAIN:
        copy_file(config.env_file, path_join(staging, DOMAIN_CONFIG));
        snapshot->artifacts[DOMAIN_CONFIG]
            = describe_artifact(staging, DOMAIN_CONFIG, DOMAIN_CONFIG);
        break;
    case CONFIG_SEALED:
        if (passphrase != NULL)
            seal_file(config.env_file, path_join(staging, CONFIG_SEALED_FILE),
                      *passphrase);
        else
            seal_file(config.env_file, path_join(staging, CONFIG_SEALED_FILE),
                      PassphraseSource::FromFile(config.passphrase_file));
        snapshot->artifacts[DOMAIN_CONFIG]
            = describe_artifact(staging, DOMAIN_CONFIG, CONFIG_SEALED_FILE);
        break;
    }
}

void SnapshotEngine::AddCompose(const string &staging, Snapshot *snapshot)
{
    if (!path_exists(config.compose_file)) {
        fprintf(stderr, "Warning: compose file %s not found, not included\n",
                config.compose_file.c_str());
        return;
    }

    copy_file(config.compose_file, path_join(staging, DOMAIN_COMPOSE));
    snapshot->artifacts[DOMAIN_COMPOSE]
        = describe_artifact(staging, DOMAIN_COMPOSE, DOMAIN_COMPOSE);
}

void SnapshotEngine::RecordImages(Snapshot *snapshot)
{
    try {
        snapshot->images = runtime->ImageVersions();
    } catch (CirrusError &e) {
        fprintf(stderr, "Warning: unable to record image versions: %s\n",
                e.what());
    }
}

void SnapshotEngine::ResetTokens(LocalDb *db)
{
    const vector<string> &domains = archived_domains();
    for (vector<string>::const_iterator d = domains.begin();
         d != domains.end(); ++d) {
        archiver->ResetToken(*d);
        db->ClearToken(*d);
    }
}

string SnapshotEngine::Create(SnapshotKind kind)
{
    InstanceLock lock(config.state_dir, config.instance_name);
    LocalDb db;
    db.Open(DbPath());

    CheckPassphrase();

    string ns = config.namespace_name();
    time_t now = Now();
    string id = make_snapshot_id(now);
    while (remote->IsPresent(ns, id)) {
        sleep_ms(1000);
        now = Now();
        id = make_snapshot_id(now);
    }

    string parent;
    SnapshotKind effective = ChooseParent(kind, &db, &parent);

    printf("Creating %s snapshot %s", kind_to_string(effective), id.c_str());
    if (!parent.empty())
        printf(" (parent %s)", parent.c_str());
    printf("\n");

    db.BeginSnapshot(id, effective, parent, now);

    Snapshot snapshot;
    snapshot.id = id;
    snapshot.kind = effective;
    snapshot.parent_id = parent;
    snapshot.created_at = now;
    snapshot.host_identity = host_identity();
    snapshot.application_version = config.application_version;
    snapshot.producer = string("Cirrus ")
        + CIRRUS_STRINGIFY(CIRRUS_VERSION);

    set<string> archived;
    try {
        StagingDir staging(config.tmp_dir, "cirrus-" + id);
        string dir = staging.Path();

        string dump = path_join(dir, DOMAIN_DATABASE);
        dumper->Dump(dump);
        if (config.trial_restore)
            dumper->TrialRestore(dump);
        snapshot.artifacts[DOMAIN_DATABASE]
            = describe_artifact(dir, DOMAIN_DATABASE, DOMAIN_DATABASE);
        RecordImages(&snapshot);

        const vector<string> &domains = archived_domains();
        for (vector<string>::const_iterator d = domains.begin();
             d != domains.end(); ++d) {
            string blob = path_join(dir, *d);
            ArchiveResult result;
            if (!archiver->Archive(*d, config.domain_dir(*d), effective, id,
                                   blob, &result))
                continue;

            archiver->Verify(blob, result.entries);
            Artifact artifact = describe_artifact(dir, *d, *d);
            artifact.tree_hash = result.tree_hash;
            artifact.entries = result.entries;
            snapshot.artifacts[*d] = artifact;
            archived.insert(*d);
        }

        AddConfig(dir, &snapshot);
        AddCompose(dir, &snapshot);

        snapshot.status = STATUS_VERIFIED;
        snapshot.finished_at = Now();
        write_manifest(dir, snapshot);

        remote->Upload(ns, id, dir);

        // The snapshot is stored; advance the tokens.
        if (effective != KIND_INCREMENTAL)
            ResetTokens(&db);
        archiver->CommitTokens();
        for (set<string>::const_iterator d = archived.begin();
             d != archived.end(); ++d) {
            db.SetToken(*d, id);
        }

        db.FinishSnapshot(id, STATUS_VERIFIED, snapshot.total_size(), "");
    } catch (CirrusError &e) {
        archiver->DiscardTokens();
        try {
            db.FinishSnapshot(id, STATUS_FAILED, 0,
                              string(error_kind_name(e.get_kind())) + ": "
                              + e.getError());
        } catch (CirrusError &db_error) {
            fprintf(stderr, "Warning: unable to record failed run: %s\n",
                    db_error.what());
        }
        if (e.get_snapshot().empty())
            e.set_snapshot(id);
        throw;
    }

    printf("Snapshot %s stored (%lld bytes)\n", id.c_str(),
           (long long)snapshot.total_size());

    if (prune_enabled && config.prune_after_backup) {
        try {
            PruneLocked();
        } catch (CirrusError &e) {
            fprintf(stderr, "Warning: pruning failed: [%s] %s\n",
                    error_kind_name(e.get_kind()), e.what());
        }
    }

    return id;
}

vector<Snapshot> SnapshotEngine::List()
{
    string ns = config.namespace_name();
    vector<string> ids = remote->List(ns);
    vector<Snapshot> snapshots;

    for (vector<string>::const_iterator i = ids.begin(); i != ids.end(); ++i) {
        Snapshot snapshot;
        try {
            if (remote->FetchManifest(ns, *i, &snapshot))
                snapshots.push_back(snapshot);
        } catch (CirrusError &e) {
            if (e.get_kind() != ERR_CORRUPTION)
                throw;
            fprintf(stderr, "Warning: snapshot %s: %s\n", i->c_str(),
                    e.what());
        }
    }

    return snapshots;
}

vector<SnapshotRecord> SnapshotEngine::RecentRuns(int limit)
{
    if (!path_exists(DbPath()))
        return vector<SnapshotRecord>();

    LocalDb db;
    db.Open(DbPath(), false);
    return db.RecentRuns(limit);
}

void SnapshotEngine::Verify(const string &id)
{
    InstanceLock lock(config.state_dir, config.instance_name);
    string ns = config.namespace_name();

    if (!is_snapshot_id(id))
        throw CirrusError(ERR_INVALID_INPUT, "Not a snapshot id", id);

    RemoteManifestSource source(remote, ns);
    ChainResolver resolver(&source, config.max_chain_hops);
    vector<Snapshot> chain = resolver.Resolve(id);

    StagingDir staging(config.tmp_dir, "cirrus-verify");
    string dir = remote->Download(ns, id, staging.Path());
    Snapshot snapshot = read_manifest(dir);

    for (map<string, Artifact>::const_iterator i = snapshot.artifacts.begin();
         i != snapshot.artifacts.end(); ++i) {
        string path = path_join(dir, i->second.filename);
        try {
            verify_artifact(i->second, path);
            if (!i->second.tree_hash.empty())
                archiver->Verify(path, i->second.entries);
        } catch (CirrusError &e) {
            e.set_snapshot(id);
            throw;
        }
        if (verbose)
            printf("  %s: ok\n", i->first.c_str());
    }

    printf("Snapshot %s verified; chain of %d snapshot(s) resolves\n",
           id.c_str(), (int)chain.size());
}

vector<string> SnapshotEngine::PruneLocked()
{
    RetentionPruner pruner(remote, RetentionPolicy::FromConfig(config));
    return pruner.Prune(config.namespace_name(), Now());
}

vector<string> SnapshotEngine::Prune()
{
    InstanceLock lock(config.state_dir, config.instance_name);
    return PruneLocked();
}

string SnapshotEngine::Restore(const string &requested)
{
    InstanceLock lock(config.state_dir, config.instance_name);
    string ns = config.namespace_name();

    string id = requested;
    if (id.empty()) {
        vector<string> ids = remote->List(ns);
        if (ids.empty())
            throw CirrusError(ERR_INVALID_INPUT,
                              "No snapshots to restore in " + ns);
        id = ids.back();
    } else if (!is_snapshot_id(id)) {
        throw CirrusError(ERR_INVALID_INPUT, "Not a snapshot id", id);
    }

    printf("Resolving snapshot %s\n", id.c_str());
    RemoteManifestSource source(remote, ns);
    ChainResolver resolver(&source, config.max_chain_hops);
    vector<Snapshot> chain = resolver.Resolve(id);

    RestoreTargets targets;
    const vector<string> &domains = archived_domains();
    for (vector<string>::const_iterator d = domains.begin();
         d != domains.end(); ++d) {
        targets.domain_dirs[*d] = config.domain_dir(*d);
    }
    if (!keep_config) {
        targets.env_file = config.env_file;
        targets.compose_file = config.compose_file;
    }

    PassphraseSource from_file
        = PassphraseSource::FromFile(config.passphrase_file);
    RestoreApplier applier(archiver, dumper, runtime);
    if (passphrase != NULL)
        applier.set_passphrase(passphrase);
    else if (path_exists(config.passphrase_file))
        applier.set_passphrase(&from_file);

    try {
        StagingDir staging(config.tmp_dir, "cirrus-restore");
        vector<StagedSnapshot> staged;
        for (vector<Snapshot>::const_iterator i = chain.begin();
             i != chain.end(); ++i) {
            StagedSnapshot member;
            member.dir = remote->Download(ns, i->id, staging.Path());
            member.snapshot = read_manifest(member.dir);
            staged.push_back(member);
        }

        applier.Apply(staged, targets);
    } catch (CirrusError &e) {
        if (applier.State() != RESTORE_RUNNING)
            fprintf(stderr, "Restore stopped in state \"%s\"; the "
                    "application was left down\n",
                    restore_state_name(applier.State()));
        if (e.get_snapshot().empty())
            e.set_snapshot(id);
        throw;
    }

    // The trees now match the restored snapshot rather than the tokens, so
    // the next snapshot starts a new chain.
    LocalDb db;
    db.Open(DbPath());
    ResetTokens(&db);

    printf("Restored snapshot %s\n", id.c_str());
    return id;
}
