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
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/time.h>

#include <string>
#include <vector>

#include "error.h"
#include "test_helpers.h"

using std::string;
using std::vector;

static string scratch_base()
{
    const char *tmp = getenv("TMPDIR");
    return tmp != NULL ? tmp : "/tmp";
}

ScratchDir::ScratchDir()
    : path(make_temp_dir(scratch_base(), "cirrus-test"))
{
}

ScratchDir::~ScratchDir()
{
    try {
        remove_tree(path);
    } catch (CirrusError &e) {
        fprintf(stderr, "Warning: %s\n", e.what());
    }
}

void put_file(const string &path, const string &data)
{
    size_t slash = path.rfind('/');
    if (slash != string::npos && slash > 0)
        make_dirs(path.substr(0, slash), 0755);
    write_file(path, data, 0644);
}

void set_mtime(const string &path, time_t mtime)
{
    struct timeval times[2];
    memset(times, 0, sizeof(times));
    times[0].tv_sec = mtime;
    times[1].tv_sec = mtime;
    if (utimes(path.c_str(), times) < 0)
        throw CirrusError(ERR_LOCAL_IO, "utimes(" + path + ") failed");
}

time_t utc_time(int year, int month, int day, int hour, int min, int sec)
{
    struct tm tm;
    memset(&tm, 0, sizeof(tm));
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return timegm(&tm);
}

Config scratch_config(const string &root)
{
    Config config;
    config.instance_name = "test";
    config.stack_dir = path_join(root, "stack");
    config.data_root = path_join(root, "data-root");
    config.media_dir = path_join(config.data_root, "media");
    config.data_dir = path_join(config.data_root, "data");
    config.export_dir = path_join(config.data_root, "export");
    config.env_file = path_join(config.stack_dir, ".env");
    config.compose_file = path_join(config.stack_dir, "docker-compose.yml");
    config.project_name = "paperless-test";
    config.remote_type = REMOTE_LOCAL;
    config.remote_root = path_join(root, "remote");
    config.remote_retries = 2;
    config.retry_backoff_ms = 1;
    config.config_mode = CONFIG_PLAIN;
    config.passphrase_file = path_join(root, "passphrase");
    config.state_dir = path_join(root, "state");
    config.tmp_dir = path_join(root, "tmp");

    make_dirs(config.state_dir, 0700);
    make_dirs(config.tmp_dir, 0700);
    make_dirs(config.remote_root, 0755);
    return config;
}

void FakeRuntime::Down()
{
    calls.push_back("down");
}

void FakeRuntime::Up(const string &service)
{
    calls.push_back(service.empty() ? "up" : "up " + service);
}

int FakeRuntime::Exec(const string &service, const vector<string> &argv,
                      const string &stdin_path, const string &stdout_path,
                      int timeout)
{
    calls.push_back("exec " + service + " " + (argv.empty() ? "" : argv[0]));
    return 0;
}

bool FakeRuntime::IsHealthy(const string &service)
{
    return healthy;
}

vector<string> FakeRuntime::ImageVersions()
{
    if (!images_known)
        throw CirrusError(ERR_UNREACHABLE, "docker compose config failed");
    return images;
}

void FakeRuntime::RunScratch(const string &name, const string &image,
                             const vector<string> &env)
{
    calls.push_back("run " + image);
}

int FakeRuntime::ExecScratch(const string &name, const vector<string> &argv,
                             const string &stdin_path, int timeout)
{
    calls.push_back("exec-scratch " + (argv.empty() ? "" : argv[0]));
    return 0;
}

void FakeRuntime::RemoveScratch(const string &name)
{
    calls.push_back("rm");
}

void FakeDumper::Dump(const string &out_path)
{
    if (!reachable)
        throw CirrusError(ERR_UNREACHABLE, "Database did not become ready");
    write_file(out_path, contents, 0600);
}

void FakeDumper::Restore(const string &dump_path)
{
    contents = read_file(dump_path);
    restores++;
}

void FakeDumper::TrialRestore(const string &dump_path)
{
    trials++;
    if (!loads)
        throw CirrusError(ERR_CORRUPTION, "The database dump does not load");
}
