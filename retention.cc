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
#include <time.h>

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "cirrus.h"
#include "error.h"
#include "remote.h"
#include "retention.h"
#include "snapshot.h"

using std::greater;
using std::map;
using std::set;
using std::string;
using std::vector;

static const time_t SECONDS_PER_DAY = 86400;

RetentionPolicy RetentionPolicy::FromConfig(const Config &config)
{
    RetentionPolicy policy;
    policy.keep_days = config.retention_days;
    policy.archive_days = config.retention_archive_days;
    policy.archive_monthly_only = config.archive_monthly_only;
    return policy;
}

const char *retention_class_name(RetentionClass c)
{
    switch (c) {
    case RETENTION_RECENT:
        return "recent";
    case RETENTION_ARCHIVAL:
        return "archival";
    case RETENTION_EXPIRED:
        return "expired";
    }
    return "unknown";
}

static bool first_of_month(time_t t)
{
    struct tm tm;
    gmtime_r(&t, &tm);
    return tm.tm_mday == 1;
}

RetentionClass classify(SnapshotKind kind, time_t created_at, time_t now,
                        const RetentionPolicy &policy)
{
    if (policy.keep_days <= 0)
        return RETENTION_RECENT;

    time_t age = now - created_at;
    if (age <= policy.keep_days * SECONDS_PER_DAY)
        return RETENTION_RECENT;

    switch (kind) {
    case KIND_ARCHIVE:
        if (age <= policy.archive_days * SECONDS_PER_DAY
            && (!policy.archive_monthly_only || first_of_month(created_at)))
            return RETENTION_ARCHIVAL;
        return RETENTION_EXPIRED;
    case KIND_FULL:
    case KIND_INCREMENTAL:
        return RETENTION_EXPIRED;
    }
    return RETENTION_EXPIRED;
}

vector<string> PrunePlan::Deletions() const
{
    vector<string> chains(expired);
    chains.insert(chains.end(), orphaned.begin(), orphaned.end());
    sort(chains.begin(), chains.end(), greater<string>());

    vector<string> partial(stale);
    sort(partial.begin(), partial.end(), greater<string>());
    chains.insert(chains.end(), partial.begin(), partial.end());

    return chains;
}

enum ChainState {
    CHAIN_COMPLETE,
    CHAIN_BROKEN,               // Missing parent or cycle
    CHAIN_UNKNOWN,              // Passes through an unreadable manifest
};

/* Collect the ancestors of a snapshot, nearest first.  There is no hop limit
 * here: the walk ends at a base, a gap or a repeat. */
static ChainState ancestry(const string &id, const map<string, Snapshot> &by_id,
                           const set<string> &unreadable,
                           vector<string> *ancestors)
{
    set<string> visited;
    string current = id;

    ancestors->clear();
    while (true) {
        if (unreadable.count(current))
            return CHAIN_UNKNOWN;

        map<string, Snapshot>::const_iterator i = by_id.find(current);
        if (i == by_id.end() || visited.count(current))
            return CHAIN_BROKEN;
        visited.insert(current);

        if (kind_is_base(i->second.kind))
            return CHAIN_COMPLETE;

        current = i->second.parent_id;
        ancestors->push_back(current);
    }
}

PrunePlan RetentionPruner::Plan(const vector<Snapshot> &snapshots,
                                const vector<string> &partial, time_t now,
                                const RetentionPolicy &policy,
                                const vector<string> &unreadable)
{
    PrunePlan plan;
    if (policy.keep_days <= 0)
        return plan;

    map<string, Snapshot> by_id;
    for (vector<Snapshot>::const_iterator i = snapshots.begin();
         i != snapshots.end(); ++i) {
        by_id[i->id] = *i;
    }

    set<string> bad(unreadable.begin(), unreadable.end());

    // Everything a kept snapshot depends on is kept too.  A chain through a
    // manifest which could not be read is left alone entirely, and a broken
    // chain loses a member only once that member has expired.
    set<string> orphans, broken, kept, needed;
    map<string, string> base_of;
    for (map<string, Snapshot>::const_iterator i = by_id.begin();
         i != by_id.end(); ++i) {
        vector<string> ancestors;
        ChainState state = ancestry(i->first, by_id, bad, &ancestors);
        if (state == CHAIN_UNKNOWN) {
            kept.insert(i->first);
            needed.insert(ancestors.begin(), ancestors.end());
            continue;
        }
        if (state == CHAIN_COMPLETE)
            base_of[i->first] = ancestors.empty()
                ? i->first : ancestors.back();

        RetentionClass c = classify(i->second.kind, i->second.created_at,
                                    now, policy);
        if (c == RETENTION_EXPIRED) {
            if (state == CHAIN_BROKEN)
                orphans.insert(i->first);
            continue;
        }

        if (state == CHAIN_BROKEN)
            broken.insert(i->first);
        kept.insert(i->first);
        needed.insert(ancestors.begin(), ancestors.end());
    }

    // An unreadable manifest may belong to an incremental of the newest base
    // before it, so that family stays up to the unreadable id.
    for (set<string>::const_iterator u = bad.begin(); u != bad.end(); ++u) {
        string base;
        for (map<string, Snapshot>::const_iterator i = by_id.begin();
             i != by_id.end() && i->first < *u; ++i) {
            if (kind_is_base(i->second.kind))
                base = i->first;
        }
        if (base.empty())
            continue;

        for (map<string, string>::const_iterator i = base_of.begin();
             i != base_of.end() && i->first < *u; ++i) {
            if (i->second == base)
                needed.insert(i->first);
        }
    }

    for (map<string, Snapshot>::const_iterator i = by_id.begin();
         i != by_id.end(); ++i) {
        if (broken.count(i->first))
            plan.broken.push_back(i->first);
        else if (kept.count(i->first))
            continue;
        else if (needed.count(i->first))
            plan.deferred.push_back(i->first);
        else if (orphans.count(i->first))
            plan.orphaned.push_back(i->first);
        else
            plan.expired.push_back(i->first);
    }

    for (vector<string>::const_iterator i = partial.begin();
         i != partial.end(); ++i) {
        time_t created;
        if (!parse_snapshot_id(*i, &created))
            continue;
        if (now - created > policy.keep_days * SECONDS_PER_DAY)
            plan.stale.push_back(*i);
    }

    return plan;
}

RetentionPruner::RetentionPruner(RemoteStore *remote,
                                 const RetentionPolicy &policy)
    : remote(remote), policy(policy)
{
}

vector<string> RetentionPruner::Prune(const string &ns, time_t now)
{
    vector<string> deleted;

    if (policy.keep_days <= 0) {
        if (verbose)
            printf("Retention disabled, nothing to prune\n");
        return deleted;
    }

    vector<string> all = remote->ListAll(ns);
    vector<Snapshot> snapshots;
    vector<string> partial, unreadable;
    for (vector<string>::const_iterator i = all.begin(); i != all.end(); ++i) {
        Snapshot snapshot;
        try {
            if (remote->FetchManifest(ns, *i, &snapshot))
                snapshots.push_back(snapshot);
            else
                partial.push_back(*i);
        } catch (CirrusError &e) {
            if (e.get_kind() != ERR_CORRUPTION)
                throw;
            fprintf(stderr, "Warning: not pruning %s: %s\n", i->c_str(),
                    e.what());
            unreadable.push_back(*i);
        }
    }

    if (verbose) {
        for (vector<Snapshot>::const_iterator i = snapshots.begin();
             i != snapshots.end(); ++i) {
            printf("  %s  %-11s  %s\n", i->id.c_str(), kind_to_string(i->kind),
                   retention_class_name(classify(i->kind, i->created_at, now,
                                                 policy)));
        }
    }

    PrunePlan plan = Plan(snapshots, partial, now, policy, unreadable);

    for (vector<string>::const_iterator i = plan.deferred.begin();
         i != plan.deferred.end(); ++i) {
        printf("Keeping expired snapshot %s: a retained snapshot depends "
               "on it\n", i->c_str());
    }
    for (vector<string>::const_iterator i = plan.broken.begin();
         i != plan.broken.end(); ++i) {
        fprintf(stderr, "Warning: snapshot %s has a broken chain; keeping it "
                "until it expires\n", i->c_str());
    }
    for (vector<string>::const_iterator i = plan.orphaned.begin();
         i != plan.orphaned.end(); ++i) {
        fprintf(stderr, "Warning: snapshot %s has a broken chain and has "
                "expired\n", i->c_str());
    }

    vector<string> deletions = plan.Deletions();
    for (vector<string>::const_iterator i = deletions.begin();
         i != deletions.end(); ++i) {
        printf("Pruning snapshot %s\n", i->c_str());
        remote->Delete(ns, *i);
        deleted.push_back(*i);
    }

    return deleted;
}
