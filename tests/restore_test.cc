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

#include "archiver.h"
#include "error.h"
#include "hash.h"
#include "manifest.h"
#include "restore.h"
#include "sealer.h"
#include "snapshot.h"
#include "test_helpers.h"

using std::string;
using std::vector;

class RestoreApplierTest : public ::testing::Test {
protected:
  RestoreApplierTest()
      : source(scratch.Sub("live-media")), target(scratch.Sub("media")),
        archiver(scratch.Sub("state")),
        applier(&archiver, &dumper, &runtime) { }

  virtual void SetUp() {
    hash_init();
    put_file(path_join(source, "documents/0001.pdf"), "first document");
    put_file(path_join(source, "documents/0002.pdf"), "second document");
    targets.domain_dirs[DOMAIN_MEDIA] = target;
  }

  // Archive the live tree as a new chain member and stage it.
  StagedSnapshot Take(const string &id, SnapshotKind kind,
                      const string &parent, const string &dump) {
    StagedSnapshot staged;
    staged.dir = scratch.Sub("staged-" + id);
    make_dirs(staged.dir, 0700);

    ArchiveResult result;
    EXPECT_TRUE(archiver.Archive(DOMAIN_MEDIA, source, kind, id,
                                 path_join(staged.dir, DOMAIN_MEDIA),
                                 &result));
    archiver.CommitTokens();
    put_file(path_join(staged.dir, DOMAIN_DATABASE), dump);
    put_file(path_join(staged.dir, DOMAIN_CONFIG), "INSTANCE_NAME=" + id + "\n");
    put_file(path_join(staged.dir, DOMAIN_COMPOSE), "# " + id + "\nservices:\n");

    Snapshot &s = staged.snapshot;
    s.id = id;
    s.kind = kind;
    s.parent_id = parent;
    s.status = STATUS_VERIFIED;
    s.artifacts[DOMAIN_MEDIA]
        = describe_artifact(staged.dir, DOMAIN_MEDIA, DOMAIN_MEDIA);
    s.artifacts[DOMAIN_MEDIA].tree_hash = result.tree_hash;
    s.artifacts[DOMAIN_MEDIA].entries = result.entries;
    s.artifacts[DOMAIN_DATABASE]
        = describe_artifact(staged.dir, DOMAIN_DATABASE, DOMAIN_DATABASE);
    s.artifacts[DOMAIN_CONFIG]
        = describe_artifact(staged.dir, DOMAIN_CONFIG, DOMAIN_CONFIG);
    s.artifacts[DOMAIN_COMPOSE]
        = describe_artifact(staged.dir, DOMAIN_COMPOSE, DOMAIN_COMPOSE);
    return staged;
  }

  ScratchDir scratch;
  string source, target;
  TarArchiver archiver;
  FakeDumper dumper;
  FakeRuntime runtime;
  RestoreApplier applier;
  RestoreTargets targets;
};

TEST_F(RestoreApplierTest, AppliesChainInOrder) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump 1"));
  put_file(path_join(source, "documents/0003.pdf"), "third document");
  remove_tree(path_join(source, "documents/0001.pdf"));
  chain.push_back(Take("2026-10-17_03-30-00", KIND_INCREMENTAL,
                       "2026-10-16_03-30-00", "dump 2"));

  // Whatever was there before is replaced.
  put_file(path_join(target, "stray.txt"), "not in any snapshot");
  targets.env_file = scratch.Sub(".env");

  applier.Apply(chain, targets);

  EXPECT_EQ(RESTORE_STARTED, applier.State());
  EXPECT_EQ(tree_hash(source), tree_hash(target));
  EXPECT_FALSE(path_exists(path_join(target, "stray.txt")));
  EXPECT_EQ("dump 2", dumper.contents);
  EXPECT_EQ(1, dumper.restores);
  EXPECT_EQ("INSTANCE_NAME=2026-10-17_03-30-00\n",
            read_file(targets.env_file));

  ASSERT_EQ(2u, runtime.calls.size());
  EXPECT_EQ("down", runtime.calls[0]);
  EXPECT_EQ("up", runtime.calls[1]);
}

TEST_F(RestoreApplierTest, UnhealthyStartOnlyWarns) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  runtime.healthy = false;

  applier.Apply(chain, targets);
  EXPECT_EQ(RESTORE_STARTED, applier.State());
  EXPECT_EQ(1, dumper.restores);
}

TEST_F(RestoreApplierTest, KeepsConfigWhenNoTarget) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  put_file(scratch.Sub(".env"), "CURRENT=1\n");

  applier.Apply(chain, targets);
  EXPECT_EQ("CURRENT=1\n", read_file(scratch.Sub(".env")));
}

TEST_F(RestoreApplierTest, CorruptArchiveLeavesLiveTreeUntouched) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  string blob = path_join(chain[0].dir, DOMAIN_MEDIA);
  string data = read_file(blob);
  data[data.size() / 2] ^= 0x20;
  put_file(blob, data);
  put_file(path_join(target, "precious.pdf"), "live document");

  try {
    applier.Apply(chain, targets);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
    EXPECT_EQ("2026-10-16_03-30-00", e.get_snapshot());
  }

  EXPECT_EQ(RESTORE_RUNNING, applier.State());
  EXPECT_TRUE(runtime.calls.empty());
  EXPECT_EQ(0, dumper.restores);
  EXPECT_EQ("live document", read_file(path_join(target, "precious.pdf")));
  EXPECT_EQ(1u, list_directory(target).size());
}

TEST_F(RestoreApplierTest, CorruptSecondDomainLeavesFirstUntouched) {
  string data_source = scratch.Sub("live-data");
  string data_target = scratch.Sub("data");
  put_file(path_join(data_source, "index/segment"), "search index");
  put_file(path_join(target, "precious.pdf"), "live document");
  put_file(path_join(data_target, "index/segment"), "live index");

  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  StagedSnapshot &staged = chain[0];
  string blob = path_join(staged.dir, DOMAIN_DATA);
  ArchiveResult result;
  ASSERT_TRUE(archiver.Archive(DOMAIN_DATA, data_source, KIND_FULL,
                               staged.snapshot.id, blob, &result));
  archiver.CommitTokens();
  staged.snapshot.artifacts[DOMAIN_DATA]
      = describe_artifact(staged.dir, DOMAIN_DATA, DOMAIN_DATA);
  staged.snapshot.artifacts[DOMAIN_DATA].tree_hash = result.tree_hash;

  // Same size, different bytes.
  string data = read_file(blob);
  data[data.size() / 2] ^= 0x01;
  put_file(blob, data);
  targets.domain_dirs[DOMAIN_DATA] = data_target;

  try {
    applier.Apply(chain, targets);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
  }

  EXPECT_EQ(RESTORE_RUNNING, applier.State());
  EXPECT_TRUE(runtime.calls.empty());
  EXPECT_EQ("live document", read_file(path_join(target, "precious.pdf")));
  EXPECT_EQ(1u, list_directory(target).size());
  EXPECT_EQ("live index", read_file(path_join(data_target, "index/segment")));
  EXPECT_EQ(1u, list_directory(data_target).size());
}

TEST_F(RestoreApplierTest, TreeMismatchIsCorruption) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  chain[0].snapshot.artifacts[DOMAIN_MEDIA].tree_hash = "sha256=00";
  put_file(path_join(target, "precious.pdf"), "live document");

  try {
    applier.Apply(chain, targets);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
  }
  EXPECT_EQ(0, dumper.restores);
  EXPECT_TRUE(runtime.calls.empty());
  EXPECT_EQ("live document", read_file(path_join(target, "precious.pdf")));
  EXPECT_EQ(1u, list_directory(target).size());
}

TEST_F(RestoreApplierTest, WrongPassphraseLeavesApplicationRunning) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  StagedSnapshot &staged = chain[0];

  PassphraseSource key = PassphraseSource::FromValue("s3cret");
  seal_file(path_join(staged.dir, DOMAIN_CONFIG),
            path_join(staged.dir, CONFIG_SEALED_FILE), key);
  staged.snapshot.artifacts[DOMAIN_CONFIG]
      = describe_artifact(staged.dir, DOMAIN_CONFIG, CONFIG_SEALED_FILE);
  targets.env_file = scratch.Sub(".env");
  put_file(targets.env_file, "CURRENT=1\n");

  PassphraseSource wrong = PassphraseSource::FromValue("guess");
  applier.set_passphrase(&wrong);
  try {
    applier.Apply(chain, targets);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
    EXPECT_EQ("2026-10-16_03-30-00", e.get_snapshot());
  }
  EXPECT_EQ(RESTORE_RUNNING, applier.State());
  EXPECT_TRUE(runtime.calls.empty());
  EXPECT_EQ("CURRENT=1\n", read_file(targets.env_file));
  EXPECT_FALSE(path_exists(path_join(target, "documents")));
}

TEST_F(RestoreApplierTest, RestoresComposeBundle) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  targets.compose_file = scratch.Sub("docker-compose.yml");
  put_file(targets.compose_file, "# edited since\n");

  applier.Apply(chain, targets);
  EXPECT_EQ("# 2026-10-16_03-30-00\nservices:\n",
            read_file(targets.compose_file));
}

TEST_F(RestoreApplierTest, SnapshotWithoutDumpIsRefusedUpFront) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  chain[0].snapshot.artifacts.erase(DOMAIN_DATABASE);

  EXPECT_THROW(applier.Apply(chain, targets), CirrusError);
  EXPECT_EQ(RESTORE_RUNNING, applier.State());
  EXPECT_TRUE(runtime.calls.empty());
}

TEST_F(RestoreApplierTest, SealedConfigNeedsPassphrase) {
  vector<StagedSnapshot> chain;
  chain.push_back(Take("2026-10-16_03-30-00", KIND_FULL, "", "dump"));
  StagedSnapshot &staged = chain[0];

  PassphraseSource key = PassphraseSource::FromValue("s3cret");
  seal_file(path_join(staged.dir, DOMAIN_CONFIG),
            path_join(staged.dir, CONFIG_SEALED_FILE), key);
  staged.snapshot.artifacts[DOMAIN_CONFIG]
      = describe_artifact(staged.dir, DOMAIN_CONFIG, CONFIG_SEALED_FILE);
  targets.env_file = scratch.Sub(".env");

  try {
    applier.Apply(chain, targets);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_INVALID_INPUT, e.get_kind());
  }
  EXPECT_TRUE(runtime.calls.empty());

  RestoreApplier with_key(&archiver, &dumper, &runtime);
  with_key.set_passphrase(&key);
  with_key.Apply(chain, targets);
  EXPECT_EQ("INSTANCE_NAME=2026-10-16_03-30-00\n",
            read_file(targets.env_file));
}
