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

/* Configuration for one deployment instance.  Settings are read from the
 * instance's .env file (KEY=value lines, as written by the installer) and may
 * be overridden from the command line.  A Config is built once in main and
 * passed to every component; nothing else consults the environment. */

#ifndef _CIRRUS_CONFIG_H
#define _CIRRUS_CONFIG_H

#include <map>
#include <string>

typedef std::map<std::string, std::string> dictionary;

/* How the instance's configuration bundle (the .env file) is included in a
 * snapshot. */
enum ConfigBackupMode {
    CONFIG_NONE,            // Not backed up
    CONFIG_PLAIN,           // Stored as-is
    CONFIG_SEALED,          // Encrypted with the passphrase
};

enum RemoteType {
    REMOTE_LOCAL,           // A directory tree on a mounted filesystem
    REMOTE_RCLONE,          // Any rclone remote ("name:path")
};

struct Config {
    Config();

    std::string instance_name;
    std::string stack_dir;
    std::string data_root;
    std::string media_dir, data_dir, export_dir;
    std::string env_file;
    std::string compose_file;
    std::string project_name;
    std::string application_version;

    // Remote storage.  Snapshots live under "<remote_root>/<instance_name>".
    RemoteType remote_type;
    std::string remote_root;
    int remote_timeout;         // Seconds allowed for one remote call
    int remote_retries;         // Attempts for a transient failure
    int retry_backoff_ms;       // First backoff delay; doubles per attempt

    // Database service inside the Compose project.
    std::string db_service;
    std::string postgres_db, postgres_user;
    int db_ready_attempts;
    int db_timeout;

    // Load each new dump into a throwaway container of trial_image before
    // the snapshot is stored.
    bool trial_restore;
    std::string trial_image;

    ConfigBackupMode config_mode;
    std::string passphrase_file;

    // Retention.  retention_days == 0 disables pruning.
    int retention_days;
    int retention_archive_days;
    bool archive_monthly_only;
    bool prune_after_backup;

    int max_chain_hops;

    // Local state: database, change-state caches, lock file.
    std::string state_dir;
    std::string tmp_dir;
    bool tmp_dir_configured;    // Set by CIRRUS_TMPDIR

    // Apply KEY=value settings.  Unknown keys are ignored (the .env file is
    // shared with the application stack).  Paths derived from DATA_ROOT and
    // STACK_DIR follow them unless given explicitly.
    void apply(const dictionary &settings);

    // Pick the staging directory: the command-line option if given, else
    // CIRRUS_TMPDIR, else the TMPDIR environment variable (NULL if unset),
    // else /tmp.
    void choose_tmp_dir(const std::string &option, const char *environment);

    // Throws CirrusError(ERR_INVALID_INPUT) on an unusable configuration.
    void validate() const;

    std::string domain_dir(const std::string &domain) const;
    std::string namespace_name() const { return instance_name; }
};

/* Parse a .env-style file.  Lines are KEY=value; blank lines and lines
 * starting with '#' are ignored, an "export " prefix is accepted, and values
 * may be wrapped in single or double quotes. */
dictionary parse_env(const std::string &text);

/* Load the configuration from the given .env file, starting from the
 * defaults.  A missing file yields the defaults with env_file pointing at it. */
Config load_config(const std::string &env_path);

const char *config_mode_to_string(ConfigBackupMode mode);
bool parse_config_mode(const std::string &s, ConfigBackupMode *mode);

#endif // _CIRRUS_CONFIG_H
