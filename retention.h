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

/* Retention: deciding which stored snapshots are kept.
 *
 * Every snapshot is kept while it is at most keep_days old.  Beyond that,
 * archive snapshots are kept while at most archive_days old (only those taken
 * on the first of a month, if archive_monthly_only is set); everything else
 * has expired.  An age exactly on a limit is kept.
 *
 * Expiry alone does not decide deletion.  An incremental snapshot needs every
 * ancestor up to its full snapshot, so a snapshot any kept snapshot depends
 * on is kept as well (its deletion is deferred), and a chain is only removed
 * once nothing in it is kept.  A snapshot whose chain is broken is kept like
 * any other until it expires itself.  Deletions run newest first: children
 * always have later ids than their parents, so an interrupted prune never
 * leaves an incremental whose parent has gone. */

#ifndef _CIRRUS_RETENTION_H
#define _CIRRUS_RETENTION_H

#include <time.h>

#include <string>
#include <vector>

#include "config.h"
#include "snapshot.h"

class RemoteStore;

struct RetentionPolicy {
    RetentionPolicy() : keep_days(30), archive_days(180),
                        archive_monthly_only(true) { }

    static RetentionPolicy FromConfig(const Config &config);

    int keep_days;              // 0 disables pruning
    int archive_days;
    bool archive_monthly_only;
};

enum RetentionClass {
    RETENTION_RECENT,
    RETENTION_ARCHIVAL,
    RETENTION_EXPIRED,
};

const char *retention_class_name(RetentionClass c);

RetentionClass classify(SnapshotKind kind, time_t created_at, time_t now,
                        const RetentionPolicy &policy);

struct PrunePlan {
    std::vector<std::string> expired;   // Whole chains or unneeded members
    std::vector<std::string> orphaned;  // Expired, with a broken chain
    std::vector<std::string> broken;    // Broken chain, but not expired; kept
    std::vector<std::string> deferred;  // Expired, but a kept one needs them
    std::vector<std::string> stale;     // Partial uploads past keep_days

    // Everything to delete, newest first.
    std::vector<std::string> Deletions() const;
};

class RetentionPruner {
public:
    RetentionPruner(RemoteStore *remote, const RetentionPolicy &policy);

    // Delete what the policy no longer keeps from a namespace.  Returns the
    // ids deleted, in deletion order.
    std::vector<std::string> Prune(const std::string &ns, time_t now);

    // The decision, without touching the store.  snapshots are the committed
    // snapshots of a namespace, partial the ids of uncommitted directories
    // and unreadable those whose manifest could not be parsed.
    static PrunePlan Plan(const std::vector<Snapshot> &snapshots,
                          const std::vector<std::string> &partial,
                          time_t now, const RetentionPolicy &policy,
                          const std::vector<std::string> &unreadable
                              = std::vector<std::string>());

private:
    RemoteStore *remote;
    RetentionPolicy policy;
};

#endif // _CIRRUS_RETENTION_H
