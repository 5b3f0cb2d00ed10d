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

#include "config.h"
#include "error.h"
#include "snapshot.h"
#include "test_helpers.h"

using std::string;

TEST(ParseEnvTest, HandlesCommentsQuotesAndExport) {
  dictionary settings = parse_env(
      "# comment\n"
      "\n"
      "INSTANCE_NAME=archive\n"
      "export POSTGRES_DB = docs \n"
      "PAPERLESS_SECRET_KEY=\"a b=c\"\n"
      "QUOTED='x'\n"
      "not a setting\n"
      "=novalue\n");

  EXPECT_EQ("archive", settings["INSTANCE_NAME"]);
  EXPECT_EQ("docs", settings["POSTGRES_DB"]);
  EXPECT_EQ("a b=c", settings["PAPERLESS_SECRET_KEY"]);
  EXPECT_EQ("x", settings["QUOTED"]);
  EXPECT_EQ(4u, settings.size());
}

TEST(ConfigTest, InstanceNameDerivesPaths) {
  Config config;
  dictionary settings;
  settings["INSTANCE_NAME"] = "archive";
  config.apply(settings);

  EXPECT_EQ("archive", config.namespace_name());
  EXPECT_EQ("/home/docker/archive", config.data_root);
  EXPECT_EQ("/home/docker/archive/media", config.domain_dir(DOMAIN_MEDIA));
  EXPECT_EQ("/home/docker/archive-setup/.env", config.env_file);
  EXPECT_EQ("paperless-archive", config.project_name);
  EXPECT_EQ("/var/lib/cirrus/archive", config.state_dir);
}

TEST(ConfigTest, ExplicitDirectoriesWin) {
  Config config;
  dictionary settings;
  settings["DATA_ROOT"] = "/srv/docs";
  settings["DIR_EXPORT"] = "/mnt/export";
  config.apply(settings);

  EXPECT_EQ("/srv/docs/media", config.media_dir);
  EXPECT_EQ("/srv/docs/data", config.data_dir);
  EXPECT_EQ("/mnt/export", config.export_dir);
}

TEST(ConfigTest, RcloneSettingsNameTheRemoteRoot) {
  Config config;
  dictionary settings;
  settings["RCLONE_REMOTE_NAME"] = "b2";
  settings["RCLONE_REMOTE_PATH"] = "backups/paperless/paperless";
  config.apply(settings);

  EXPECT_EQ(REMOTE_RCLONE, config.remote_type);
  EXPECT_EQ("b2:backups/paperless", config.remote_root);
}

TEST(ConfigTest, RetentionAndModes) {
  Config config;
  dictionary settings;
  settings["RETENTION_DAYS"] = "14";
  settings["RETENTION_MONTHLY_DAYS"] = "365";
  settings["RETENTION_MONTHLY_ONLY"] = "no";
  settings["ENV_BACKUP_MODE"] = "plain";
  config.apply(settings);

  EXPECT_EQ(14, config.retention_days);
  EXPECT_EQ(365, config.retention_archive_days);
  EXPECT_FALSE(config.archive_monthly_only);
  EXPECT_EQ(CONFIG_PLAIN, config.config_mode);
  EXPECT_STREQ("plain", config_mode_to_string(config.config_mode));
  config.validate();
}

TEST(ConfigTest, RejectsBadValues) {
  Config config;
  dictionary settings;
  settings["RETENTION_DAYS"] = "many";
  try {
    config.apply(settings);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_INVALID_INPUT, e.get_kind());
  }

  settings.clear();
  settings["ENV_BACKUP_MODE"] = "zip";
  EXPECT_THROW(config.apply(settings), CirrusError);

  settings.clear();
  settings["CIRRUS_REMOTE"] = "ftp";
  EXPECT_THROW(config.apply(settings), CirrusError);
}

TEST(ConfigTest, ValidateRejectsUnusableSettings) {
  Config config;
  config.instance_name = "a/b";
  EXPECT_THROW(config.validate(), CirrusError);

  config = Config();
  config.retention_days = 30;
  config.retention_archive_days = 7;
  EXPECT_THROW(config.validate(), CirrusError);

  config = Config();
  config.max_chain_hops = 0;
  EXPECT_THROW(config.validate(), CirrusError);
}

TEST(ConfigTest, LoadConfigReadsEnvFile) {
  ScratchDir scratch;
  string env = scratch.Sub(".env");
  put_file(env, "INSTANCE_NAME=office\nCIRRUS_REMOTE=local\n"
                "CIRRUS_REMOTE_ROOT=/mnt/backup\n");

  Config config = load_config(env);
  EXPECT_EQ("office", config.instance_name);
  EXPECT_EQ(REMOTE_LOCAL, config.remote_type);
  EXPECT_EQ("/mnt/backup", config.remote_root);
  EXPECT_EQ(env, config.env_file);
}

TEST(ConfigTest, MissingEnvFileGivesDefaults) {
  ScratchDir scratch;
  Config config = load_config(scratch.Sub("absent.env"));
  EXPECT_EQ("paperless", config.instance_name);
  EXPECT_EQ(scratch.Sub("absent.env"), config.env_file);
}

TEST(ConfigTest, RejectsIntegersOutOfRange) {
  Config config;
  dictionary settings;
  settings["RETENTION_DAYS"] = "9999999999";
  try {
    config.apply(settings);
    FAIL() << "expected an exception";
  } catch (CirrusError &e) {
    EXPECT_EQ(ERR_INVALID_INPUT, e.get_kind());
  }
  EXPECT_EQ(30, config.retention_days);

  settings["RETENTION_DAYS"] = "99999999999999999999999";
  EXPECT_THROW(config.apply(settings), CirrusError);

  settings["RETENTION_DAYS"] = "2147483647";
  config.apply(settings);
  EXPECT_EQ(2147483647, config.retention_days);
}

TEST(ConfigTest, TmpDirPrecedence) {
  Config defaults;
  defaults.choose_tmp_dir("", NULL);
  EXPECT_EQ("/tmp", defaults.tmp_dir);

  Config from_environment;
  from_environment.choose_tmp_dir("", "/var/tmp");
  EXPECT_EQ("/var/tmp", from_environment.tmp_dir);

  Config configured;
  dictionary settings;
  settings["CIRRUS_TMPDIR"] = "/srv/staging";
  configured.apply(settings);
  configured.choose_tmp_dir("", "/var/tmp");
  EXPECT_EQ("/srv/staging", configured.tmp_dir);

  configured.choose_tmp_dir("/mnt/scratch", "/var/tmp");
  EXPECT_EQ("/mnt/scratch", configured.tmp_dir);
}

TEST(ConfigTest, TrialRestoreSettings) {
  Config config;
  EXPECT_TRUE(config.trial_restore);
  EXPECT_EQ("postgres", config.trial_image);

  dictionary settings;
  settings["CIRRUS_TRIAL_RESTORE"] = "no";
  settings["CIRRUS_TRIAL_IMAGE"] = "postgres:16";
  config.apply(settings);
  EXPECT_FALSE(config.trial_restore);
  EXPECT_EQ("postgres:16", config.trial_image);

  Config empty_image;
  empty_image.trial_image = "";
  EXPECT_THROW(empty_image.validate(), CirrusError);
}
