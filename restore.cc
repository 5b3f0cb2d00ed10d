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

#include <map>
#include <string>
#include <vector>

#include "archiver.h"
#include "cirrus.h"
#include "dumper.h"
#include "error.h"
#include "manifest.h"
#include "restore.h"
#include "runtime.h"
#include "sealer.h"
#include "util.h"

using std::map;
using std::string;
using std::vector;

const char *restore_state_name(RestoreState state)
{
    switch (state) {
    case RESTORE_RUNNING:
        return "running";
    case RESTORE_STOPPED:
        return "stopped";
    case RESTORE_DOMAINS_RESTORED:
        return "domains restored";
    case RESTORE_DATABASE_RESTORED:
        return "database restored";
    case RESTORE_STARTED:
        return "started";
    }
    return "unknown";
}

RestoreApplier::RestoreApplier(Archiver *archiver, DatabaseDumper *dumper,
                               ContainerRuntime *runtime)
    : archiver(archiver), dumper(dumper), runtime(runtime), passphrase(NULL),
      state(RESTORE_RUNNING)
{
}

static const char SCRATCH_PREFIX[] = ".cirrus-restore-";

/* Replace the contents of dir with those of its scratch subdirectory.  The
 * directory itself stays, since it may be a mount point. */
static void swap_in(const string &dir, const string &scratch_name)
{
    vector<string> names = list_directory(dir);
    for (vector<string>::const_iterator i = names.begin();
         i != names.end(); ++i) {
        if (*i != scratch_name)
            remove_tree(path_join(dir, *i));
    }

    string scratch = path_join(dir, scratch_name);
    names = list_directory(scratch);
    for (vector<string>::const_iterator i = names.begin();
         i != names.end(); ++i) {
        rename_file(path_join(scratch, *i), path_join(dir, *i));
    }
    remove_tree(scratch);
}

/* A domain rebuilt but not yet moved into place. */
struct PreparedDomain {
    string domain;
    string dir;
    string scratch_name;
};

static void discard_prepared(const vector<PreparedDomain> &prepared)
{
    for (vector<PreparedDomain>::const_iterator i = prepared.begin();
         i != prepared.end(); ++i) {
        remove_tree(path_join(i->dir, i->scratch_name));
    }
}

/* Rebuild one domain from the chain in a fresh scratch directory inside dir,
 * so that moving it into place later never crosses a file system.  Returns
 * the scratch directory's name; on failure nothing is left behind. */
string RestoreApplier::PrepareDomain(const vector<StagedSnapshot> &chain,
                                     const string &domain, const string &dir)
{
    const StagedSnapshot &target = chain.back();
    const Artifact &expected = target.snapshot.artifacts.find(domain)->second;

    if (!path_exists(dir))
        make_dirs(dir, 0755);
    string scratch_name = SCRATCH_PREFIX + generate_uuid();
    string scratch = path_join(dir, scratch_name);
    make_dirs(scratch, 0700);

    if (verbose)
        printf("Rebuilding %s in %s\n", domain.c_str(), scratch.c_str());

    try {
        for (vector<StagedSnapshot>::const_iterator i = chain.begin();
             i != chain.end(); ++i) {
            map<string, Artifact>::const_iterator a
                = i->snapshot.artifacts.find(domain);
            if (a == i->snapshot.artifacts.end())
                continue;

            string blob = path_join(i->dir, a->second.filename);
            try {
                verify_artifact(a->second, blob);
            } catch (CirrusError &e) {
                e.set_snapshot(i->snapshot.id);
                throw;
            }

            if (verbose)
                printf("  applying %s\n", i->snapshot.id.c_str());
            archiver->Extract(blob, scratch);
        }

        if (!expected.tree_hash.empty()
            && tree_hash(scratch) != expected.tree_hash)
            throw CirrusError(ERR_CORRUPTION,
                              "Restored " + domain + " tree does not match "
                              "the snapshot", target.snapshot.id);
    } catch (CirrusError &) {
        remove_tree(scratch);
        throw;
    }

    return scratch_name;
}

/* Verify a bundle of the target and return its plain contents, unsealing it
 * if needed.  Returns false if the snapshot carries no such bundle. */
bool RestoreApplier::ReadBundle(const StagedSnapshot &target,
                                const string &domain, string *contents)
{
    map<string, Artifact>::const_iterator a
        = target.snapshot.artifacts.find(domain);
    if (a == target.snapshot.artifacts.end())
        return false;

    string blob = path_join(target.dir, a->second.filename);
    try {
        verify_artifact(a->second, blob);

        if (a->second.filename == CONFIG_SEALED_FILE) {
            if (passphrase == NULL)
                throw CirrusError(ERR_INVALID_INPUT,
                                  "A passphrase is needed to restore the "
                                  "sealed configuration");
            *contents = unseal(read_file(blob), *passphrase);
        } else {
            *contents = read_file(blob);
        }
    } catch (CirrusError &e) {
        e.set_snapshot(target.snapshot.id);
        throw;
    }

    return true;
}

void RestoreApplier::Apply(const vector<StagedSnapshot> &chain,
                           const RestoreTargets &targets)
{
    if (chain.empty())
        throw CirrusError(ERR_INVALID_INPUT, "Nothing to restore");

    const StagedSnapshot &target = chain.back();
    if (!target.snapshot.has_artifact(DOMAIN_DATABASE))
        throw CirrusError(ERR_CORRUPTION, "Snapshot has no database dump",
                          target.snapshot.id);

    const Artifact &dump
        = target.snapshot.artifacts.find(DOMAIN_DATABASE)->second;
    string dump_path = path_join(target.dir, dump.filename);
    try {
        verify_artifact(dump, dump_path);
    } catch (CirrusError &e) {
        e.set_snapshot(target.snapshot.id);
        throw;
    }

    string env_contents, compose_contents;
    bool have_env = false, have_compose = false;
    if (!targets.env_file.empty()) {
        have_env = ReadBundle(target, DOMAIN_CONFIG, &env_contents);
        if (!have_env)
            fprintf(stderr, "Warning: snapshot %s has no configuration "
                    "bundle; keeping %s\n", target.snapshot.id.c_str(),
                    targets.env_file.c_str());
    }
    if (!targets.compose_file.empty()) {
        have_compose = ReadBundle(target, DOMAIN_COMPOSE, &compose_contents);
        if (!have_compose)
            fprintf(stderr, "Warning: snapshot %s has no compose bundle; "
                    "keeping %s\n", target.snapshot.id.c_str(),
                    targets.compose_file.c_str());
    }

    vector<PreparedDomain> prepared;
    const vector<string> &domains = archived_domains();
    try {
        for (vector<string>::const_iterator i = domains.begin();
             i != domains.end(); ++i) {
            map<string, string>::const_iterator dir
                = targets.domain_dirs.find(*i);
            if (dir == targets.domain_dirs.end())
                continue;

            if (!target.snapshot.has_artifact(*i)) {
                fprintf(stderr, "Warning: snapshot %s has no %s archive; "
                        "leaving %s untouched\n", target.snapshot.id.c_str(),
                        i->c_str(), dir->second.c_str());
                continue;
            }

            PreparedDomain p;
            p.domain = *i;
            p.dir = dir->second;
            p.scratch_name = PrepareDomain(chain, *i, dir->second);
            prepared.push_back(p);
        }
    } catch (CirrusError &) {
        discard_prepared(prepared);
        throw;
    }

    printf("Stopping the application\n");
    try {
        runtime->Down();
    } catch (CirrusError &) {
        discard_prepared(prepared);
        throw;
    }
    state = RESTORE_STOPPED;

    for (vector<PreparedDomain>::const_iterator i = prepared.begin();
         i != prepared.end(); ++i) {
        printf("Restoring %s into %s\n", i->domain.c_str(), i->dir.c_str());
        swap_in(i->dir, i->scratch_name);
    }

    if (have_env) {
        printf("Restoring configuration to %s\n", targets.env_file.c_str());
        write_file(targets.env_file, env_contents, 0600);
    }
    if (have_compose) {
        printf("Restoring compose file to %s\n",
               targets.compose_file.c_str());
        write_file(targets.compose_file, compose_contents, 0644);
    }
    state = RESTORE_DOMAINS_RESTORED;

    printf("Restoring the database\n");
    dumper->Restore(dump_path);
    state = RESTORE_DATABASE_RESTORED;

    printf("Starting the application\n");
    runtime->Up("");
    state = RESTORE_STARTED;

    if (!runtime->IsHealthy(""))
        fprintf(stderr, "Warning: no containers of the application are "
                "running after the restore\n");
}
