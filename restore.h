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

/* Applying a resolved chain of snapshots to the instance.  Everything that
 * can be checked is checked while the application is still running: every
 * artifact is verified, the configuration is unsealed in memory, and each
 * archived domain is rebuilt in a scratch directory inside its target by
 * extracting the chain's archives oldest first and compared with the tree
 * hash in the target's manifest.  A failure up to this point leaves the live
 * instance exactly as it was.
 *
 * Only then is the application brought down, the rebuilt trees are moved into
 * place, the bundles written and the database dump loaded.  The application
 * is started again once all of this has succeeded; after a failure past the
 * stop it stays down. */

#ifndef _CIRRUS_RESTORE_H
#define _CIRRUS_RESTORE_H

#include <map>
#include <string>
#include <vector>

#include "snapshot.h"

class Archiver;
class ContainerRuntime;
class DatabaseDumper;
class PassphraseSource;

enum RestoreState {
    RESTORE_RUNNING,            // Application still up; nothing changed yet
    RESTORE_STOPPED,
    RESTORE_DOMAINS_RESTORED,
    RESTORE_DATABASE_RESTORED,
    RESTORE_STARTED,
};

const char *restore_state_name(RestoreState state);

/* A chain member together with the local directory it was downloaded to. */
struct StagedSnapshot {
    Snapshot snapshot;
    std::string dir;
};

struct RestoreTargets {
    std::map<std::string, std::string> domain_dirs;
    // Where the configuration bundle is restored; empty to keep the
    // current configuration.
    std::string env_file;
    // Where the compose bundle is restored; empty to keep the current file.
    std::string compose_file;
};

class RestoreApplier {
public:
    RestoreApplier(Archiver *archiver, DatabaseDumper *dumper,
                   ContainerRuntime *runtime);

    // Needed to restore a sealed configuration bundle.
    void set_passphrase(const PassphraseSource *source)
        { passphrase = source; }

    void Apply(const std::vector<StagedSnapshot> &chain,
               const RestoreTargets &targets);

    RestoreState State() const { return state; }

private:
    Archiver *archiver;
    DatabaseDumper *dumper;
    ContainerRuntime *runtime;
    const PassphraseSource *passphrase;
    RestoreState state;

    std::string PrepareDomain(const std::vector<StagedSnapshot> &chain,
                              const std::string &domain,
                              const std::string &dir);
    bool ReadBundle(const StagedSnapshot &target, const std::string &domain,
                    std::string *contents);
};

#endif // _CIRRUS_RESTORE_H
