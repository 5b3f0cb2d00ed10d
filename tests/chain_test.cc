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

#include <map>
#include <string>
#include <vector>

#include "chain.h"
#include "error.h"
#include "snapshot.h"
#include "test_helpers.h"

using std::map;
using std::string;
using std::vector;

class MapManifestSource : public ManifestSource {
public:
  virtual bool GetManifest(const string &id, Snapshot *snapshot) {
    lookups++;
    map<string, Snapshot>::const_iterator i = snapshots.find(id);
    if (i == snapshots.end())
      return false;
    *snapshot = i->second;
    return true;
  }

  void Add(const string &id, SnapshotKind kind, const string &parent = "") {
    Snapshot snapshot;
    snapshot.id = id;
    snapshot.kind = kind;
    snapshot.parent_id = parent;
    snapshot.status = STATUS_VERIFIED;
    snapshots[id] = snapshot;
  }

  MapManifestSource() : lookups(0) { }

  map<string, Snapshot> snapshots;
  int lookups;
};

static string day(int n)
{
  return make_snapshot_id(utc_time(2026, 10, n, 3, 30, 0));
}

TEST(ChainResolverTest, ResolvesOldestFirst) {
  MapManifestSource source;
  source.Add(day(1), KIND_FULL);
  source.Add(day(2), KIND_INCREMENTAL, day(1));
  source.Add(day(3), KIND_INCREMENTAL, day(2));

  ChainResolver resolver(&source, 512);
  vector<Snapshot> chain = resolver.Resolve(day(3));
  ASSERT_EQ(3u, chain.size());
  EXPECT_EQ(day(1), chain[0].id);
  EXPECT_EQ(day(2), chain[1].id);
  EXPECT_EQ(day(3), chain[2].id);

  chain = resolver.Resolve(day(1));
  ASSERT_EQ(1u, chain.size());
  EXPECT_EQ(KIND_FULL, chain[0].kind);
}

TEST(ChainResolverTest, ArchiveSnapshotsEndTheChain) {
  MapManifestSource source;
  source.Add(day(1), KIND_ARCHIVE);
  source.Add(day(2), KIND_INCREMENTAL, day(1));

  ChainResolver resolver(&source, 512);
  EXPECT_EQ(2u, resolver.Resolve(day(2)).size());
}

TEST(ChainResolverTest, UnknownTargetIsInvalidInput) {
  MapManifestSource source;
  ChainResolver resolver(&source, 512);
  try {
    resolver.Resolve(day(1));
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_INVALID_INPUT, e.get_kind());
  }
}

TEST(ChainResolverTest, MissingParentBreaksTheChain) {
  MapManifestSource source;
  source.Add(day(2), KIND_INCREMENTAL, day(1));
  source.Add(day(3), KIND_INCREMENTAL, day(2));

  ChainResolver resolver(&source, 512);
  try {
    resolver.Resolve(day(3));
    FAIL() << "expected an exception";
  } catch (ChainBroken &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
    EXPECT_EQ(day(3), e.get_snapshot());
  }
}

TEST(ChainResolverTest, CycleIsDetected) {
  MapManifestSource source;
  source.Add(day(2), KIND_INCREMENTAL, day(3));
  source.Add(day(3), KIND_INCREMENTAL, day(2));

  ChainResolver resolver(&source, 512);
  try {
    resolver.Resolve(day(3));
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
  }
  EXPECT_LE(source.lookups, 3);

  MapManifestSource self;
  self.Add(day(4), KIND_INCREMENTAL, day(4));
  ChainResolver self_resolver(&self, 512);
  EXPECT_THROW(self_resolver.Resolve(day(4)), CirrusError);
}

TEST(ChainResolverTest, HopLimitIsEnforced) {
  MapManifestSource source;
  source.Add(day(1), KIND_FULL);
  for (int n = 2; n <= 5; n++)
    source.Add(day(n), KIND_INCREMENTAL, day(n - 1));

  // Four hops from day 5 back to the full snapshot.
  EXPECT_EQ(5u, ChainResolver(&source, 4).Resolve(day(5)).size());

  try {
    ChainResolver(&source, 3).Resolve(day(5));
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
  }
  EXPECT_EQ(4u, ChainResolver(&source, 3).Resolve(day(4)).size());
}

TEST(ChainResolverTest, UnverifiedMemberIsCorruption) {
  MapManifestSource source;
  source.Add(day(1), KIND_FULL);
  source.Add(day(2), KIND_INCREMENTAL, day(1));
  source.snapshots[day(1)].status = STATUS_FAILED;

  ChainResolver resolver(&source, 512);
  try {
    resolver.Resolve(day(2));
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
  }
}
