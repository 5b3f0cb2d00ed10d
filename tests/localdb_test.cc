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

#include <string>
#include <vector>

#include "error.h"
#include "localdb.h"
#include "lock.h"
#include "test_helpers.h"

using std::string;
using std::vector;

TEST(LocalDbTest, JournalsRuns) {
  ScratchDir scratch;
  LocalDb db;
  db.Open(scratch.Sub("test.db"));

  SnapshotRecord last;
  EXPECT_FALSE(db.LastCommitted(&last));

  db.BeginSnapshot("2026-10-16_03-30-00", KIND_FULL, "", 100);
  db.FinishSnapshot("2026-10-16_03-30-00", STATUS_VERIFIED, 4096, "");
  db.BeginSnapshot("2026-10-17_03-30-00", KIND_INCREMENTAL,
                   "2026-10-16_03-30-00", 200);
  db.FinishSnapshot("2026-10-17_03-30-00", STATUS_FAILED, 0,
                    "TransientIO: upload failed");

  ASSERT_TRUE(db.LastCommitted(&last));
  EXPECT_EQ("2026-10-16_03-30-00", last.id);
  EXPECT_EQ(KIND_FULL, last.kind);
  EXPECT_EQ(4096, last.size);

  vector<SnapshotRecord> runs = db.RecentRuns(10);
  ASSERT_EQ(2u, runs.size());
  EXPECT_EQ("2026-10-17_03-30-00", runs[0].id);
  EXPECT_EQ(STATUS_FAILED, runs[0].status);
  EXPECT_EQ("2026-10-16_03-30-00", runs[0].parent);
  EXPECT_EQ("TransientIO: upload failed", runs[0].message);
  EXPECT_EQ(200, runs[0].started);
}

TEST(LocalDbTest, InterruptedRunsAreMarkedFailed) {
  ScratchDir scratch;
  {
    LocalDb db;
    db.Open(scratch.Sub("test.db"));
    db.BeginSnapshot("2026-10-17_03-30-00", KIND_FULL, "", 100);
  }

  {
    // Without the lock the run may still be going on.
    LocalDb db;
    db.Open(scratch.Sub("test.db"), false);
    EXPECT_EQ(STATUS_PENDING, db.RecentRuns(1)[0].status);
  }

  LocalDb db;
  db.Open(scratch.Sub("test.db"));
  vector<SnapshotRecord> runs = db.RecentRuns(1);
  ASSERT_EQ(1u, runs.size());
  EXPECT_EQ(STATUS_FAILED, runs[0].status);
  EXPECT_EQ("interrupted", runs[0].message);
}

TEST(LocalDbTest, Tokens) {
  ScratchDir scratch;
  LocalDb db;
  db.Open(scratch.Sub("test.db"));

  EXPECT_EQ("", db.GetToken("media"));
  db.SetToken("media", "2026-10-16_03-30-00");
  db.SetToken("media", "2026-10-17_03-30-00");
  EXPECT_EQ("2026-10-17_03-30-00", db.GetToken("media"));
  EXPECT_EQ("", db.GetToken("data"));

  db.ClearToken("media");
  EXPECT_EQ("", db.GetToken("media"));
}

TEST(InstanceLockTest, SecondHolderIsBusy) {
  ScratchDir scratch;
  InstanceLock lock(scratch.Path(), "test");
  EXPECT_TRUE(path_exists(lock.Path()));

  try {
    InstanceLock again(scratch.Path(), "test");
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_BUSY, e.get_kind());
  }

  // Other instances are independent.
  InstanceLock other(scratch.Path(), "other");
}

TEST(InstanceLockTest, ReleasedOnDestruction) {
  ScratchDir scratch;
  {
    InstanceLock lock(scratch.Path(), "test");
  }
  InstanceLock lock(scratch.Path(), "test");
}
