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

#include "dumper.h"
#include "error.h"
#include "runtime.h"
#include "subprocess.h"
#include "test_helpers.h"

using std::string;
using std::vector;

/* Answers pg_isready, pg_dump and psql the way a database container would. */
class ScriptedRuntime : public FakeRuntime {
public:
  ScriptedRuntime() : not_ready(0), dump_status(0), trial_status(0) { }

  virtual int Exec(const string &service, const vector<string> &argv,
                   const string &stdin_path, const string &stdout_path,
                   int timeout) {
    FakeRuntime::Exec(service, argv, stdin_path, stdout_path, timeout);
    commands.push_back(format_command(argv));

    if (argv[0] == "pg_isready") {
      if (not_ready > 0) {
        not_ready--;
        return 2;
      }
      return 0;
    }
    if (argv[0] == "pg_dump") {
      if (!dump_output.empty())
        write_file(stdout_path, dump_output);
      return dump_status;
    }
    if (argv[0] == "psql" && !stdin_path.empty())
      loaded = read_file(stdin_path);
    return 0;
  }

  virtual int ExecScratch(const string &name, const vector<string> &argv,
                          const string &stdin_path, int timeout) {
    FakeRuntime::ExecScratch(name, argv, stdin_path, timeout);
    commands.push_back(format_command(argv));

    if (argv[0] == "pg_isready") {
      if (not_ready > 0) {
        not_ready--;
        return 2;
      }
      return 0;
    }
    if (argv[0] == "psql" && !stdin_path.empty()) {
      trial_loaded = read_file(stdin_path);
      return trial_status;
    }
    return 0;
  }

  int not_ready;
  int dump_status;
  int trial_status;
  string trial_loaded;
  string dump_output;
  string loaded;
  vector<string> commands;
};

class DumperTest : public ::testing::Test {
protected:
  DumperTest()
      : config(scratch_config(scratch.Path())),
        dumper(&runtime, Tweak(config)) { }

  static const Config &Tweak(Config &c) {
    c.db_ready_attempts = 3;
    c.postgres_db = "paper\"less";
    return c;
  }

  ScratchDir scratch;
  Config config;
  ScriptedRuntime runtime;
  ComposeDatabaseDumper dumper;
};

TEST_F(DumperTest, DumpWaitsForDatabase) {
  runtime.not_ready = 2;
  runtime.dump_output = "CREATE TABLE documents;\n";

  string out = scratch.Sub("database");
  dumper.Dump(out);
  EXPECT_EQ("CREATE TABLE documents;\n", read_file(out));
  ASSERT_EQ(4u, runtime.commands.size());
  EXPECT_EQ(0u, runtime.commands[3].find("pg_dump"));
}

TEST_F(DumperTest, DatabaseThatNeverAnswersIsUnreachable) {
  runtime.not_ready = 100;
  try {
    dumper.Dump(scratch.Sub("database"));
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_UNREACHABLE, e.get_kind());
  }
  EXPECT_EQ(3u, runtime.commands.size());
}

TEST_F(DumperTest, EmptyOrFailedDumpLeavesNoFile) {
  string out = scratch.Sub("database");
  EXPECT_THROW(dumper.Dump(out), CirrusError);
  EXPECT_FALSE(path_exists(out));

  runtime.dump_output = "partial";
  runtime.dump_status = 1;
  try {
    dumper.Dump(out);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_TRANSIENT_IO, e.get_kind());
  }
  EXPECT_FALSE(path_exists(out));
}

TEST_F(DumperTest, RestoreRecreatesDatabase) {
  string dump = scratch.Sub("database");
  put_file(dump, "CREATE TABLE documents;\n");

  dumper.Restore(dump);
  EXPECT_EQ("CREATE TABLE documents;\n", runtime.loaded);
  EXPECT_EQ("up db", runtime.calls[0]);

  bool dropped = false, created = false;
  for (vector<string>::const_iterator i = runtime.commands.begin();
       i != runtime.commands.end(); ++i) {
    if (i->find("DROP DATABASE IF EXISTS \"paper\"\"less\"") != string::npos)
      dropped = true;
    if (i->find("CREATE DATABASE \"paper\"\"less\" OWNER") != string::npos)
      created = true;
  }
  EXPECT_TRUE(dropped);
  EXPECT_TRUE(created);
}

TEST(RunCommandTest, CapturesOutputAndStatus) {
  vector<string> argv;
  argv.push_back("sh");
  argv.push_back("-c");
  argv.push_back("echo hello; exit 3");

  string output;
  CommandOptions options;
  options.capture_stdout = &output;
  EXPECT_EQ(3, run_command(argv, options));
  EXPECT_EQ("hello\n", output);
}

TEST(RunCommandTest, MissingProgram) {
  vector<string> argv;
  argv.push_back("cirrus-no-such-program");
  EXPECT_EQ(127, run_command(argv, CommandOptions()));
}

TEST(RunCommandTest, TimeoutKillsChild) {
  vector<string> argv;
  argv.push_back("sleep");
  argv.push_back("30");

  CommandOptions options;
  options.timeout = 1;
  try {
    run_command(argv, options);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_TRANSIENT_IO, e.get_kind());
  }
}

TEST_F(DumperTest, TrialRestoreUsesThrowawayContainer) {
  string dump = scratch.Sub("database");
  put_file(dump, "CREATE TABLE documents;\n");
  runtime.not_ready = 1;

  dumper.TrialRestore(dump);
  EXPECT_EQ("CREATE TABLE documents;\n", runtime.trial_loaded);
  EXPECT_EQ("", runtime.loaded);

  ASSERT_EQ(5u, runtime.calls.size());
  EXPECT_EQ("run postgres", runtime.calls[0]);
  EXPECT_EQ("exec-scratch pg_isready", runtime.calls[1]);
  EXPECT_EQ("exec-scratch psql", runtime.calls[3]);
  EXPECT_EQ("rm", runtime.calls[4]);
  EXPECT_NE(string::npos, runtime.commands[2].find("ON_ERROR_STOP=1"));
}

TEST_F(DumperTest, DumpThatDoesNotLoadIsCorruption) {
  string dump = scratch.Sub("database");
  put_file(dump, "CREATE TABLE broken(\n");
  runtime.trial_status = 3;

  try {
    dumper.TrialRestore(dump);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_CORRUPTION, e.get_kind());
  }
  EXPECT_EQ("rm", runtime.calls.back());
}

TEST_F(DumperTest, TrialContainerIsRemovedWhenItNeverAnswers) {
  string dump = scratch.Sub("database");
  put_file(dump, "CREATE TABLE documents;\n");
  runtime.not_ready = 100;

  try {
    dumper.TrialRestore(dump);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_UNREACHABLE, e.get_kind());
  }
  EXPECT_EQ("rm", runtime.calls.back());
  EXPECT_EQ("", runtime.trial_loaded);
}
