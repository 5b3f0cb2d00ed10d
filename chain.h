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

/* Restore-time chain resolution: the list of snapshots which must be applied,
 * oldest first, to rebuild a target snapshot.  Relationships between
 * snapshots are taken only from the Parent field of their manifests. */

#ifndef _CIRRUS_CHAIN_H
#define _CIRRUS_CHAIN_H

#include <string>
#include <vector>

#include "snapshot.h"

class RemoteStore;

/* Where manifests are looked up. */
class ManifestSource {
public:
    virtual ~ManifestSource() { }

    // Returns false if there is no committed snapshot with that id.
    virtual bool GetManifest(const std::string &id, Snapshot *snapshot) = 0;
};

class RemoteManifestSource : public ManifestSource {
public:
    RemoteManifestSource(RemoteStore *remote, const std::string &ns)
        : remote(remote), ns(ns) { }

    virtual bool GetManifest(const std::string &id, Snapshot *snapshot);

private:
    RemoteStore *remote;
    std::string ns;
};

class ChainResolver {
public:
    ChainResolver(ManifestSource *source, int max_hops)
        : source(source), max_hops(max_hops) { }

    /* Returns [full, incremental 1, ..., target].  An unknown target is
     * ERR_INVALID_INPUT; a missing parent raises ChainBroken; a chain which
     * revisits a snapshot, exceeds max_hops, or contains a snapshot that was
     * never verified is ERR_CORRUPTION. */
    std::vector<Snapshot> Resolve(const std::string &id);

private:
    ManifestSource *source;
    int max_hops;
};

#endif // _CIRRUS_CHAIN_H
