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

#include <errno.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>

#include <sstream>
#include <string>

#include "config.h"
#include "error.h"
#include "snapshot.h"
#include "util.h"

using std::istringstream;
using std::string;

static const char DEFAULT_INSTANCE[] = "paperless";
static const char DEFAULT_HOME[] = "/home/docker";

Config::Config()
    : instance_name(DEFAULT_INSTANCE),
      remote_type(REMOTE_RCLONE),
      remote_root("pcloud:backups/paperless"),
      remote_timeout(600),
      remote_retries(4),
      retry_backoff_ms(1000),
      db_service("db"),
      postgres_db("paperless"),
      postgres_user("paperless"),
      db_ready_attempts(6),
      db_timeout(3600),
      trial_restore(true),
      trial_image("postgres"),
      config_mode(CONFIG_SEALED),
      passphrase_file("/root/.paperless_env_pass"),
      retention_days(30),
      retention_archive_days(180),
      archive_monthly_only(true),
      prune_after_backup(true),
      max_chain_hops(512),
      tmp_dir("/tmp"),
      tmp_dir_configured(false)
{
    stack_dir = string(DEFAULT_HOME) + "/paperless-setup";
    data_root = string(DEFAULT_HOME) + "/paperless";
    media_dir = data_root + "/media";
    data_dir = data_root + "/data";
    export_dir = data_root + "/export";
    env_file = stack_dir + "/.env";
    compose_file = stack_dir + "/docker-compose.yml";
    project_name = string("paperless-") + instance_name;
    state_dir = string("/var/lib/cirrus/") + instance_name;
}

static bool lookup(const dictionary &settings, const char *key, string *value)
{
    dictionary::const_iterator i = settings.find(key);
    if (i == settings.end())
        return false;
    *value = i->second;
    return true;
}

static int lookup_int(const dictionary &settings, const char *key,
                      int current)
{
    string value;
    if (!lookup(settings, key, &value))
        return current;

    char *end = NULL;
    errno = 0;
    long n = strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || n < 0 || errno == ERANGE
        || n > INT_MAX) {
        throw CirrusError(ERR_INVALID_INPUT,
                          string_printf("%s must be a non-negative integer, "
                                        "got \"%s\"", key, value.c_str()));
    }
    return static_cast<int>(n);
}

static bool lookup_bool(const dictionary &settings, const char *key,
                        bool current)
{
    string value;
    if (!lookup(settings, key, &value))
        return current;

    if (value == "yes" || value == "true" || value == "1" || value == "on")
        return true;
    if (value == "no" || value == "false" || value == "0" || value == "off")
        return false;

    throw CirrusError(ERR_INVALID_INPUT,
                      string_printf("%s must be yes or no, got \"%s\"",
                                    key, value.c_str()));
}

void Config::apply(const dictionary &settings)
{
    string value;
    bool instance_changed = false, data_root_changed = false,
         stack_dir_changed = false;

    if (lookup(settings, "INSTANCE_NAME", &value) && value != instance_name) {
        instance_name = value;
        instance_changed = true;
    }

    if (lookup(settings, "DATA_ROOT", &value)) {
        data_root = value;
        data_root_changed = true;
    } else if (instance_changed) {
        data_root = string(DEFAULT_HOME) + "/" + instance_name;
        data_root_changed = true;
    }

    if (lookup(settings, "STACK_DIR", &value)) {
        stack_dir = value;
        stack_dir_changed = true;
    } else if (instance_changed) {
        stack_dir = string(DEFAULT_HOME) + "/" + instance_name + "-setup";
        stack_dir_changed = true;
    }

    if (lookup(settings, "DIR_MEDIA", &value))
        media_dir = value;
    else if (data_root_changed)
        media_dir = path_join(data_root, DOMAIN_MEDIA);
    if (lookup(settings, "DIR_DATA", &value))
        data_dir = value;
    else if (data_root_changed)
        data_dir = path_join(data_root, DOMAIN_DATA);
    if (lookup(settings, "DIR_EXPORT", &value))
        export_dir = value;
    else if (data_root_changed)
        export_dir = path_join(data_root, DOMAIN_EXPORT);

    if (lookup(settings, "ENV_FILE", &value))
        env_file = value;
    else if (stack_dir_changed)
        env_file = path_join(stack_dir, ".env");
    if (lookup(settings, "COMPOSE_FILE", &value))
        compose_file = value;
    else if (stack_dir_changed)
        compose_file = path_join(stack_dir, "docker-compose.yml");

    if (lookup(settings, "COMPOSE_PROJECT_NAME", &value))
        project_name = value;
    else if (instance_changed)
        project_name = "paperless-" + instance_name;

    if (lookup(settings, "CIRRUS_STATE_DIR", &value))
        state_dir = value;
    else if (instance_changed)
        state_dir = "/var/lib/cirrus/" + instance_name;

    if (lookup(settings, "CIRRUS_TMPDIR", &value)) {
        tmp_dir = value;
        tmp_dir_configured = true;
    }

    if (lookup(settings, "APP_VERSION", &value))
        application_version = value;
    else if (lookup(settings, "PAPERLESS_IMAGE", &value))
        application_version = value;

    /* Remote storage.  CIRRUS_REMOTE_ROOT names the parent of the per-instance
     * namespace directly; otherwise the installer's rclone settings are used.
     * RCLONE_REMOTE_PATH names the namespace itself, so its last component is
     * the instance and is dropped here. */
    if (lookup(settings, "CIRRUS_REMOTE", &value)) {
        if (value == "local") {
            remote_type = REMOTE_LOCAL;
        } else if (value == "rclone") {
            remote_type = REMOTE_RCLONE;
        } else {
            throw CirrusError(ERR_INVALID_INPUT,
                              "CIRRUS_REMOTE must be local or rclone, got \""
                              + value + "\"");
        }
    }
    if (lookup(settings, "CIRRUS_REMOTE_ROOT", &value)) {
        remote_root = value;
    } else {
        string remote_name = "pcloud", remote_path;
        bool have_name = lookup(settings, "RCLONE_REMOTE_NAME", &remote_name);
        bool have_path = lookup(settings, "RCLONE_REMOTE_PATH", &remote_path);
        if (have_path) {
            size_t slash = remote_path.rfind('/');
            remote_path = (slash == string::npos)
                ? "" : remote_path.substr(0, slash);
        } else {
            remote_path = "backups/paperless";
        }
        if (have_name || have_path)
            remote_root = remote_name + ":" + remote_path;
    }

    remote_timeout = lookup_int(settings, "CIRRUS_REMOTE_TIMEOUT",
                                remote_timeout);
    remote_retries = lookup_int(settings, "CIRRUS_REMOTE_RETRIES",
                                remote_retries);
    retry_backoff_ms = lookup_int(settings, "CIRRUS_RETRY_BACKOFF_MS",
                                  retry_backoff_ms);

    if (lookup(settings, "DB_SERVICE", &value))
        db_service = value;
    if (lookup(settings, "POSTGRES_DB", &value))
        postgres_db = value;
    if (lookup(settings, "POSTGRES_USER", &value))
        postgres_user = value;
    db_ready_attempts = lookup_int(settings, "CIRRUS_DB_READY_ATTEMPTS",
                                   db_ready_attempts);
    db_timeout = lookup_int(settings, "CIRRUS_DB_TIMEOUT", db_timeout);
    trial_restore = lookup_bool(settings, "CIRRUS_TRIAL_RESTORE",
                                trial_restore);
    if (lookup(settings, "CIRRUS_TRIAL_IMAGE", &value))
        trial_image = value;

    if (lookup(settings, "ENV_BACKUP_MODE", &value)) {
        if (!parse_config_mode(value, &config_mode)) {
            throw CirrusError(ERR_INVALID_INPUT,
                              "ENV_BACKUP_MODE must be none, plain or sealed, "
                              "got \"" + value + "\"");
        }
    }
    if (lookup(settings, "ENV_BACKUP_PASSPHRASE_FILE", &value))
        passphrase_file = value;

    retention_days = lookup_int(settings, "RETENTION_DAYS", retention_days);
    retention_archive_days = lookup_int(settings, "RETENTION_MONTHLY_DAYS",
                                        retention_archive_days);
    archive_monthly_only = lookup_bool(settings, "RETENTION_MONTHLY_ONLY",
                                       archive_monthly_only);
    prune_after_backup = lookup_bool(settings, "CIRRUS_PRUNE_AFTER_BACKUP",
                                     prune_after_backup);
    max_chain_hops = lookup_int(settings, "CIRRUS_MAX_CHAIN_HOPS",
                                max_chain_hops);
}

void Config::choose_tmp_dir(const string &option, const char *environment)
{
    if (!option.empty())
        tmp_dir = option;
    else if (!tmp_dir_configured && environment != NULL && *environment)
        tmp_dir = environment;
}

void Config::validate() const
{
    if (instance_name.empty() || instance_name.find('/') != string::npos
        || instance_name == "." || instance_name == "..") {
        throw CirrusError(ERR_INVALID_INPUT,
                          "INSTANCE_NAME must be a non-empty name without "
                          "slashes");
    }
    if (remote_root.empty())
        throw CirrusError(ERR_INVALID_INPUT, "No remote storage configured");
    if (state_dir.empty())
        throw CirrusError(ERR_INVALID_INPUT, "No state directory configured");
    if (max_chain_hops < 1)
        throw CirrusError(ERR_INVALID_INPUT,
                          "CIRRUS_MAX_CHAIN_HOPS must be at least 1");
    if (trial_restore && trial_image.empty())
        throw CirrusError(ERR_INVALID_INPUT,
                          "CIRRUS_TRIAL_IMAGE must name an image");
    if (remote_retries < 1)
        throw CirrusError(ERR_INVALID_INPUT,
                          "CIRRUS_REMOTE_RETRIES must be at least 1");
    if (retention_archive_days > 0 && retention_days > 0
        && retention_archive_days < retention_days) {
        throw CirrusError(ERR_INVALID_INPUT,
                          "RETENTION_MONTHLY_DAYS must not be shorter than "
                          "RETENTION_DAYS");
    }
}

string Config::domain_dir(const string &domain) const
{
    if (domain == DOMAIN_MEDIA)
        return media_dir;
    if (domain == DOMAIN_DATA)
        return data_dir;
    if (domain == DOMAIN_EXPORT)
        return export_dir;
    return "";
}

dictionary parse_env(const string &text)
{
    dictionary result;
    istringstream input(text);
    string line;

    while (getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.compare(0, 7, "export ") == 0)
            line = trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == string::npos || eq == 0)
            continue;

        string key = trim(line.substr(0, eq));
        string value = trim(line.substr(eq + 1));
        if (value.size() >= 2
            && (value[0] == '"' || value[0] == '\'')
            && value[value.size() - 1] == value[0]) {
            value = value.substr(1, value.size() - 2);
        }

        result[key] = value;
    }

    return result;
}

Config load_config(const string &env_path)
{
    Config config;

    if (path_exists(env_path)) {
        dictionary settings = parse_env(read_file(env_path));
        if (settings.find("ENV_FILE") == settings.end())
            settings["ENV_FILE"] = env_path;
        config.apply(settings);
    } else {
        fprintf(stderr, "Warning: No .env at %s, using defaults\n",
                env_path.c_str());
        config.env_file = env_path;
    }

    return config;
}

const char *config_mode_to_string(ConfigBackupMode mode)
{
    switch (mode) {
    case CONFIG_NONE:
        return "none";
    case CONFIG_PLAIN:
        return "plain";
    case CONFIG_SEALED:
        return "sealed";
    }
    return "unknown";
}

bool parse_config_mode(const string &s, ConfigBackupMode *mode)
{
    if (s == "none") {
        *mode = CONFIG_NONE;
    } else if (s == "plain") {
        *mode = CONFIG_PLAIN;
    } else if (s == "sealed" || s == "openssl") {
        *mode = CONFIG_SEALED;
    } else {
        return false;
    }
    return true;
}
