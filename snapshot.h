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

/* The snapshot data model: what kind of snapshot something is, which
 * artifacts it consists of, and the provenance recorded in its manifest.
 *
 * Snapshots are named by the UTC time at which they were started, in the form
 * YYYY-MM-DD_HH-MM-SS, so that names sort in creation order. */

#ifndef _CIRRUS_SNAPSHOT_H
#define _CIRRUS_SNAPSHOT_H

#include <stdint.h>
#include <time.h>

#include <map>
#include <string>
#include <vector>

enum SnapshotKind {
    KIND_FULL,
    KIND_INCREMENTAL,
    KIND_ARCHIVE,           // A full snapshot kept under the archive policy
};

enum SnapshotStatus {
    STATUS_PENDING,
    STATUS_VERIFIED,
    STATUS_FAILED,
};

const char *kind_to_string(SnapshotKind kind);
// Accepts "full", "incremental" (or the older "incr") and "archive".
bool parse_kind(const std::string &s, SnapshotKind *kind);

// Full and archive snapshots stand on their own; incrementals need a parent.
bool kind_is_base(SnapshotKind kind);

const char *status_to_string(SnapshotStatus status);
bool parse_status(const std::string &s, SnapshotStatus *status);

/* Logical domain names, which are also the artifact file names inside a
 * snapshot directory. */
extern const char DOMAIN_MEDIA[];
extern const char DOMAIN_DATA[];
extern const char DOMAIN_EXPORT[];
extern const char DOMAIN_CONFIG[];
extern const char DOMAIN_COMPOSE[];
extern const char DOMAIN_DATABASE[];

// File names used for the configuration bundle and the commit marker.
extern const char CONFIG_SEALED_FILE[];
extern const char MANIFEST_FILE[];

// The directory-tree domains handled by the archiver, in archiving order.
const std::vector<std::string> &archived_domains();

/* One file of a snapshot. */
struct Artifact {
    Artifact() : size(0), entries(0) { }

    std::string domain;
    std::string filename;       // Name within the snapshot directory
    int64_t size;
    std::string content_hash;   // "sha256=<hex>" of the file contents

    // Only for archived domains: the recursive content hash of the domain's
    // tree at snapshot time, and the number of archive members.
    std::string tree_hash;
    int64_t entries;
};

/* Everything the manifest records about a snapshot. */
struct Snapshot {
    Snapshot() : kind(KIND_FULL), created_at(0), finished_at(0),
                 status(STATUS_PENDING) { }

    std::string id;
    SnapshotKind kind;
    std::string parent_id;      // Only set when kind == KIND_INCREMENTAL
    time_t created_at, finished_at;
    std::string host_identity;
    std::string application_version;
    std::string producer;
    SnapshotStatus status;

    // Image references the stack ran at snapshot time, one per service.
    std::vector<std::string> images;

    std::map<std::string, Artifact> artifacts;  // Keyed by domain

    bool has_artifact(const std::string &domain) const
        { return artifacts.count(domain) > 0; }
    int64_t total_size() const;
};

std::string make_snapshot_id(time_t timestamp);
bool parse_snapshot_id(const std::string &id, time_t *timestamp);
bool is_snapshot_id(const std::string &id);

#endif // _CIRRUS_SNAPSHOT_H
