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

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "chain.h"
#include "hash.h"
#include "manifest.h"
#include "remote.h"
#include "retention.h"
#include "snapshot.h"
#include "test_helpers.h"

using std::string;
using std::vector;

static const time_t DAY = 86400;

// Mid-month, so that nothing created a few days earlier lands on the 1st.
static const time_t NOW = utc_time(2026, 10, 17, 12, 0, 0);

static Snapshot make(time_t created, SnapshotKind kind,
                     const string &parent = "")
{
  Snapshot snapshot;
  snapshot.id = make_snapshot_id(created);
  snapshot.kind = kind;
  snapshot.parent_id = parent;
  snapshot.status = STATUS_VERIFIED;
  snapshot.created_at = created;
  return snapshot;
}

static bool contains(const vector<string> &ids, const string &id)
{
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

TEST(ClassifyTest, AgeBoundaryIsRetained) {
  RetentionPolicy policy;
  EXPECT_EQ(RETENTION_RECENT, classify(KIND_FULL, NOW - 30 * DAY, NOW,
                                       policy));
  EXPECT_EQ(RETENTION_EXPIRED, classify(KIND_FULL, NOW - 30 * DAY - 1, NOW,
                                        policy));
  EXPECT_EQ(RETENTION_RECENT, classify(KIND_INCREMENTAL, NOW, NOW, policy));
  EXPECT_STREQ("expired", retention_class_name(RETENTION_EXPIRED));
}

TEST(ClassifyTest, ArchiveSnapshots) {
  RetentionPolicy policy;
  time_t first = utc_time(2026, 7, 1, 3, 30, 0);
  time_t second = utc_time(2026, 7, 2, 3, 30, 0);

  EXPECT_EQ(RETENTION_ARCHIVAL, classify(KIND_ARCHIVE, first, NOW, policy));
  EXPECT_EQ(RETENTION_EXPIRED, classify(KIND_ARCHIVE, second, NOW, policy));
  EXPECT_EQ(RETENTION_EXPIRED, classify(KIND_FULL, first, NOW, policy));

  policy.archive_monthly_only = false;
  EXPECT_EQ(RETENTION_ARCHIVAL, classify(KIND_ARCHIVE, second, NOW, policy));

  EXPECT_EQ(RETENTION_ARCHIVAL,
            classify(KIND_ARCHIVE, NOW - 180 * DAY, NOW, policy));
  EXPECT_EQ(RETENTION_EXPIRED,
            classify(KIND_ARCHIVE, NOW - 180 * DAY - 1, NOW, policy));
}

TEST(ClassifyTest, ZeroKeepDaysDisablesExpiry) {
  RetentionPolicy policy;
  policy.keep_days = 0;
  EXPECT_EQ(RETENTION_RECENT, classify(KIND_FULL, NOW - 1000 * DAY, NOW,
                                       policy));
  EXPECT_TRUE(RetentionPruner::Plan(
      vector<Snapshot>(1, make(NOW - 1000 * DAY, KIND_FULL)),
      vector<string>(), NOW, policy).Deletions().empty());
}

TEST(PrunePlanTest, ExpiredChainGoesTogether) {
  Snapshot full = make(NOW - 40 * DAY, KIND_FULL);
  Snapshot a = make(NOW - 35 * DAY, KIND_INCREMENTAL, full.id);
  Snapshot b = make(NOW - 35 * DAY + 3600, KIND_INCREMENTAL, a.id);

  vector<Snapshot> snapshots;
  snapshots.push_back(full);
  snapshots.push_back(a);
  snapshots.push_back(b);

  PrunePlan plan = RetentionPruner::Plan(snapshots, vector<string>(), NOW,
                                         RetentionPolicy());
  EXPECT_TRUE(plan.deferred.empty());
  vector<string> deletions = plan.Deletions();
  ASSERT_EQ(3u, deletions.size());
  // Children before their parents.
  EXPECT_EQ(b.id, deletions[0]);
  EXPECT_EQ(a.id, deletions[1]);
  EXPECT_EQ(full.id, deletions[2]);
}

TEST(PrunePlanTest, RetainedIncrementalDefersItsChain) {
  Snapshot full = make(NOW - 40 * DAY, KIND_FULL);
  Snapshot a = make(NOW - 35 * DAY, KIND_INCREMENTAL, full.id);
  Snapshot b = make(NOW - 10 * DAY, KIND_INCREMENTAL, a.id);
  Snapshot old_full = make(NOW - 60 * DAY, KIND_FULL);

  vector<Snapshot> snapshots;
  snapshots.push_back(old_full);
  snapshots.push_back(full);
  snapshots.push_back(a);
  snapshots.push_back(b);

  PrunePlan plan = RetentionPruner::Plan(snapshots, vector<string>(), NOW,
                                         RetentionPolicy());
  EXPECT_TRUE(contains(plan.deferred, full.id));
  EXPECT_TRUE(contains(plan.deferred, a.id));
  vector<string> deletions = plan.Deletions();
  ASSERT_EQ(1u, deletions.size());
  EXPECT_EQ(old_full.id, deletions[0]);
}

TEST(PrunePlanTest, ExpiredOrphansAreRemoved) {
  Snapshot orphan = make(NOW - 40 * DAY, KIND_INCREMENTAL,
                         make_snapshot_id(NOW - 41 * DAY));
  Snapshot child = make(NOW - 39 * DAY, KIND_INCREMENTAL, orphan.id);
  Snapshot full = make(NOW - DAY, KIND_FULL);

  vector<Snapshot> snapshots;
  snapshots.push_back(orphan);
  snapshots.push_back(child);
  snapshots.push_back(full);

  PrunePlan plan = RetentionPruner::Plan(snapshots, vector<string>(), NOW,
                                         RetentionPolicy());
  ASSERT_EQ(2u, plan.orphaned.size());
  EXPECT_TRUE(contains(plan.orphaned, orphan.id));
  EXPECT_TRUE(contains(plan.orphaned, child.id));
  EXPECT_TRUE(plan.broken.empty());
  EXPECT_FALSE(contains(plan.Deletions(), full.id));
}

TEST(PrunePlanTest, RecentBrokenChainIsKept) {
  Snapshot orphan = make(NOW - 40 * DAY, KIND_INCREMENTAL,
                         make_snapshot_id(NOW - 41 * DAY));
  Snapshot child = make(NOW - 2 * DAY, KIND_INCREMENTAL, orphan.id);
  Snapshot recent = make(NOW - DAY, KIND_INCREMENTAL,
                         make_snapshot_id(NOW - 3 * DAY));

  vector<Snapshot> snapshots;
  snapshots.push_back(orphan);
  snapshots.push_back(child);
  snapshots.push_back(recent);

  PrunePlan plan = RetentionPruner::Plan(snapshots, vector<string>(), NOW,
                                         RetentionPolicy());
  EXPECT_TRUE(plan.Deletions().empty());
  EXPECT_TRUE(contains(plan.broken, child.id));
  EXPECT_TRUE(contains(plan.broken, recent.id));
  EXPECT_TRUE(contains(plan.deferred, orphan.id));
}

TEST(PrunePlanTest, UnreadableManifestProtectsItsChain) {
  Snapshot full = make(NOW - 40 * DAY, KIND_FULL);
  string unreadable = make_snapshot_id(NOW - 39 * DAY);
  Snapshot child = make(NOW - 38 * DAY, KIND_INCREMENTAL, unreadable);

  vector<Snapshot> snapshots;
  snapshots.push_back(full);
  snapshots.push_back(child);

  PrunePlan plan = RetentionPruner::Plan(snapshots, vector<string>(), NOW,
                                         RetentionPolicy(),
                                         vector<string>(1, unreadable));
  vector<string> deletions = plan.Deletions();
  EXPECT_FALSE(contains(deletions, child.id));
  EXPECT_FALSE(contains(deletions, unreadable));
  // The unreadable snapshot may be an incremental of the full one.
  EXPECT_FALSE(contains(deletions, full.id));
  EXPECT_TRUE(contains(plan.deferred, full.id));
}

TEST(PrunePlanTest, UnreadableManifestLeavesOlderFamiliesAlone) {
  Snapshot old_full = make(NOW - 60 * DAY, KIND_FULL);
  Snapshot full = make(NOW - 40 * DAY, KIND_FULL);
  string unreadable = make_snapshot_id(NOW - 39 * DAY);

  vector<Snapshot> snapshots;
  snapshots.push_back(old_full);
  snapshots.push_back(full);

  PrunePlan plan = RetentionPruner::Plan(snapshots, vector<string>(), NOW,
                                         RetentionPolicy(),
                                         vector<string>(1, unreadable));
  vector<string> deletions = plan.Deletions();
  EXPECT_TRUE(contains(deletions, old_full.id));
  EXPECT_FALSE(contains(deletions, full.id));
  EXPECT_FALSE(contains(deletions, unreadable));
}

TEST(PrunePlanTest, StalePartialUploads) {
  vector<string> partial;
  partial.push_back(make_snapshot_id(NOW - 31 * DAY));
  partial.push_back(make_snapshot_id(NOW - DAY));

  PrunePlan plan = RetentionPruner::Plan(vector<Snapshot>(), partial, NOW,
                                         RetentionPolicy());
  ASSERT_EQ(1u, plan.stale.size());
  EXPECT_EQ(partial[0], plan.stale[0]);
}

/* Pruning a real (local) store leaves every remaining chain resolvable. */
class RetentionPrunerTest : public ::testing::Test {
protected:
  RetentionPrunerTest()
      : config(scratch_config(scratch.Path())),
        store(config, config.remote_root) { }

  virtual void SetUp() { hash_init(); }

  void Store(const Snapshot &snapshot) {
    string dir = scratch.Sub("staging-" + snapshot.id);
    make_dirs(dir, 0700);
    put_file(path_join(dir, DOMAIN_DATABASE), "dump of " + snapshot.id);
    Snapshot s = snapshot;
    s.artifacts[DOMAIN_DATABASE]
        = describe_artifact(dir, DOMAIN_DATABASE, DOMAIN_DATABASE);
    write_manifest(dir, s);
    store.Upload("test", s.id, dir);
  }

  ScratchDir scratch;
  Config config;
  LocalRemoteStore store;
};

TEST_F(RetentionPrunerTest, LongChainWithinRetentionIsKept) {
  config.max_chain_hops = 2;
  Snapshot f = make(NOW - 4 * DAY, KIND_FULL);
  Snapshot i1 = make(NOW - 4 * DAY + 3600, KIND_INCREMENTAL, f.id);
  Snapshot i2 = make(NOW - 4 * DAY + 7200, KIND_INCREMENTAL, i1.id);
  Snapshot i3 = make(NOW - 4 * DAY + 10800, KIND_INCREMENTAL, i2.id);
  Snapshot i4 = make(NOW - 4 * DAY + 14400, KIND_INCREMENTAL, i3.id);
  Store(f);
  Store(i1);
  Store(i2);
  Store(i3);
  Store(i4);

  RetentionPruner pruner(&store, RetentionPolicy::FromConfig(config));
  EXPECT_TRUE(pruner.Prune("test", NOW).empty());
  EXPECT_EQ(5u, store.List("test").size());
}

TEST_F(RetentionPrunerTest, RemainingChainsResolve) {
  Snapshot f1 = make(NOW - 45 * DAY, KIND_FULL);
  Snapshot i1 = make(NOW - 44 * DAY, KIND_INCREMENTAL, f1.id);
  Snapshot f2 = make(NOW - 40 * DAY, KIND_FULL);
  Snapshot i2 = make(NOW - 35 * DAY, KIND_INCREMENTAL, f2.id);
  Snapshot i3 = make(NOW - 5 * DAY, KIND_INCREMENTAL, i2.id);
  Snapshot archive = make(utc_time(2026, 8, 1, 3, 30, 0), KIND_ARCHIVE);
  Store(f1);
  Store(i1);
  Store(f2);
  Store(i2);
  Store(i3);
  Store(archive);

  // An abandoned upload.
  string partial = make_snapshot_id(NOW - 50 * DAY);
  put_file(path_join(path_join(path_join(config.remote_root, "test"),
                               partial), DOMAIN_DATABASE), "partial");

  RetentionPruner pruner(&store, RetentionPolicy::FromConfig(config));
  vector<string> deleted = pruner.Prune("test", NOW);
  ASSERT_EQ(3u, deleted.size());
  EXPECT_EQ(i1.id, deleted[0]);
  EXPECT_EQ(f1.id, deleted[1]);
  EXPECT_EQ(partial, deleted[2]);

  vector<string> remaining = store.ListAll("test");
  ASSERT_EQ(4u, remaining.size());

  RemoteManifestSource source(&store, "test");
  ChainResolver resolver(&source, config.max_chain_hops);
  for (vector<string>::const_iterator i = remaining.begin();
       i != remaining.end(); ++i) {
    EXPECT_NO_THROW(resolver.Resolve(*i)) << *i;
  }

  // Running it again changes nothing.
  EXPECT_TRUE(pruner.Prune("test", NOW).empty());
}
