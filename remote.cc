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
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "cirrus.h"
#include "error.h"
#include "manifest.h"
#include "remote.h"
#include "subprocess.h"
#include "util.h"

using std::map;
using std::set;
using std::sort;
using std::string;
using std::vector;

static const long MAX_BACKOFF_MS = 60000;

static string remote_join(const string &a, const string &b)
{
    if (a.empty())
        return b;
    return a + "/" + b;
}

RemoteStore::RemoteStore(const Config &config)
    : retries(config.remote_retries), backoff_ms(config.retry_backoff_ms),
      tmp_dir(config.tmp_dir)
{
    if (retries < 1)
        retries = 1;
}

RemoteStore *RemoteStore::New(const Config &config)
{
    switch (config.remote_type) {
    case REMOTE_LOCAL:
        return new LocalRemoteStore(config, config.remote_root);
    case REMOTE_RCLONE:
        return new RcloneRemoteStore(config, config.remote_root);
    }
    throw CirrusError(ERR_INVALID_INPUT, "Unknown remote type");
}

/* Decide whether a failed primitive call is tried again, and wait before the
 * next attempt.  Rethrows the error once the attempts are used up. */
void RemoteStore::Backoff(const CirrusError &e, const char *what,
                          const string &path, int attempt)
{
    if (!error_is_transient(e.get_kind()) || attempt >= retries)
        throw e;

    long delay = backoff_ms;
    for (int i = 1; i < attempt && delay < MAX_BACKOFF_MS; i++)
        delay *= 2;
    if (delay > MAX_BACKOFF_MS)
        delay = MAX_BACKOFF_MS;

    fprintf(stderr, "Warning: %s %s failed (attempt %d of %d): %s; "
            "retrying in %ld ms\n", what, path.c_str(), attempt, retries,
            e.what(), delay);
    sleep_ms(delay);
}

bool RemoteStore::ListDir(const string &path, vector<RemoteEntry> *entries)
{
    for (int attempt = 1; ; attempt++) {
        try {
            entries->clear();
            return list_dir(path, entries);
        } catch (CirrusError &e) {
            Backoff(e, "list", path, attempt);
        }
    }
}

void RemoteStore::CopyIn(const string &local_path, const string &remote_path)
{
    for (int attempt = 1; ; attempt++) {
        try {
            copy_in(local_path, remote_path);
            return;
        } catch (CirrusError &e) {
            Backoff(e, "upload of", remote_path, attempt);
        }
    }
}

bool RemoteStore::CopyOut(const string &remote_path, const string &local_path)
{
    for (int attempt = 1; ; attempt++) {
        try {
            return copy_out(remote_path, local_path);
        } catch (CirrusError &e) {
            Backoff(e, "download of", remote_path, attempt);
        }
    }
}

void RemoteStore::DeleteRecursive(const string &remote_path)
{
    for (int attempt = 1; ; attempt++) {
        try {
            delete_recursive(remote_path);
            return;
        } catch (CirrusError &e) {
            Backoff(e, "delete of", remote_path, attempt);
        }
    }
}

bool RemoteStore::ReadRemoteFile(const string &remote_path, string *data)
{
    make_dirs(tmp_dir, 0755);
    string local = path_join(tmp_dir, "cirrus-fetch." + generate_uuid());

    bool found;
    try {
        found = CopyOut(remote_path, local);
        if (found)
            *data = read_file(local);
    } catch (CirrusError &) {
        unlink(local.c_str());
        throw;
    }

    unlink(local.c_str());
    return found;
}

static map<string, int64_t> file_sizes(const vector<RemoteEntry> &entries)
{
    map<string, int64_t> sizes;
    for (vector<RemoteEntry>::const_iterator i = entries.begin();
         i != entries.end(); ++i) {
        if (!i->is_dir)
            sizes[i->name] = i->size;
    }
    return sizes;
}

void RemoteStore::Upload(const string &ns, const string &id,
                         const string &staging_dir)
{
    string dir = remote_join(ns, id);

    map<string, int64_t> staged;
    vector<string> names = list_directory(staging_dir);
    for (vector<string>::const_iterator i = names.begin();
         i != names.end(); ++i) {
        staged[*i] = file_size(path_join(staging_dir, *i));
    }
    if (staged.count(MANIFEST_FILE) == 0)
        throw CirrusError(ERR_INVALID_INPUT,
                          "Staging directory has no manifest", id);

    vector<RemoteEntry> listing;
    ListDir(dir, &listing);
    map<string, int64_t> remote = file_sizes(listing);

    if (remote.count(MANIFEST_FILE)) {
        string remote_manifest;
        string local_manifest = read_file(path_join(staging_dir,
                                                    MANIFEST_FILE));
        if (!ReadRemoteFile(remote_join(dir, MANIFEST_FILE), &remote_manifest)
            || remote_manifest != local_manifest)
            throw CirrusError(ERR_CORRUPTION,
                              "A different snapshot with this id is already "
                              "stored", id);
        if (remote != staged)
            throw CirrusError(ERR_CORRUPTION,
                              "Stored snapshot does not match its staged "
                              "files", id);
        if (verbose)
            printf("Snapshot %s already uploaded\n", id.c_str());
        return;
    }

    if (verbose)
        printf("Uploading %s to %s\n", id.c_str(), dir.c_str());

    // Without a manifest nothing stored here is known to be ours, whatever
    // its size, so every file is copied again.
    for (map<string, int64_t>::const_iterator i = staged.begin();
         i != staged.end(); ++i) {
        if (i->first == MANIFEST_FILE)
            continue;
        CopyIn(path_join(staging_dir, i->first), remote_join(dir, i->first));
    }

    // Leftovers of an earlier, different attempt.
    for (map<string, int64_t>::const_iterator i = remote.begin();
         i != remote.end(); ++i) {
        if (staged.count(i->first) == 0)
            DeleteRecursive(remote_join(dir, i->first));
    }

    CopyIn(path_join(staging_dir, MANIFEST_FILE),
           remote_join(dir, MANIFEST_FILE));

    ListDir(dir, &listing);
    remote = file_sizes(listing);
    if (remote != staged) {
        DeleteRecursive(remote_join(dir, MANIFEST_FILE));
        throw CirrusError(ERR_TRANSIENT_IO,
                          "Remote listing does not match the staged files "
                          "after upload", id);
    }
}

vector<string> RemoteStore::ListAll(const string &ns)
{
    vector<RemoteEntry> listing;
    vector<string> ids;

    if (!ListDir(ns, &listing))
        return ids;

    for (vector<RemoteEntry>::const_iterator i = listing.begin();
         i != listing.end(); ++i) {
        if (i->is_dir && is_snapshot_id(i->name))
            ids.push_back(i->name);
    }

    sort(ids.begin(), ids.end());
    return ids;
}

bool RemoteStore::IsPresent(const string &ns, const string &id)
{
    vector<RemoteEntry> listing;
    if (!ListDir(remote_join(ns, id), &listing))
        return false;
    return file_sizes(listing).count(MANIFEST_FILE) > 0;
}

vector<string> RemoteStore::List(const string &ns)
{
    vector<string> all = ListAll(ns), ids;
    for (vector<string>::const_iterator i = all.begin(); i != all.end(); ++i) {
        if (IsPresent(ns, *i))
            ids.push_back(*i);
    }
    return ids;
}

bool RemoteStore::FetchManifest(const string &ns, const string &id,
                                Snapshot *snapshot)
{
    string path = remote_join(remote_join(ns, id), MANIFEST_FILE);
    string text;

    if (!ReadRemoteFile(path, &text))
        return false;

    *snapshot = parse_manifest(text, path);
    if (snapshot->id != id)
        throw CirrusError(ERR_CORRUPTION,
                          "Manifest names snapshot " + snapshot->id, id);
    return true;
}

string RemoteStore::Download(const string &ns, const string &id,
                             const string &local_dir)
{
    Snapshot snapshot;
    if (!FetchManifest(ns, id, &snapshot))
        throw CirrusError(ERR_INVALID_INPUT, "No such snapshot", id);

    string dir = remote_join(ns, id);
    string target = path_join(local_dir, id);
    make_dirs(target, 0700);

    if (verbose)
        printf("Downloading %s\n", id.c_str());

    for (map<string, Artifact>::const_iterator i = snapshot.artifacts.begin();
         i != snapshot.artifacts.end(); ++i) {
        const string &file = i->second.filename;
        if (!CopyOut(remote_join(dir, file), path_join(target, file)))
            throw CirrusError(ERR_CORRUPTION,
                              "Artifact " + file + " is missing", id);
    }

    if (!CopyOut(remote_join(dir, MANIFEST_FILE),
                 path_join(target, MANIFEST_FILE)))
        throw CirrusError(ERR_TRANSIENT_IO,
                          "Manifest disappeared during download", id);

    return target;
}

void RemoteStore::Delete(const string &ns, const string &id)
{
    string dir = remote_join(ns, id);

    if (verbose)
        printf("Deleting %s\n", dir.c_str());

    vector<RemoteEntry> listing;
    if (!ListDir(dir, &listing))
        return;
    if (file_sizes(listing).count(MANIFEST_FILE))
        DeleteRecursive(remote_join(dir, MANIFEST_FILE));
    DeleteRecursive(dir);
}

LocalRemoteStore::LocalRemoteStore(const Config &config, const string &root)
    : RemoteStore(config), root(root)
{
}

bool LocalRemoteStore::list_dir(const string &path,
                                vector<RemoteEntry> *entries)
{
    string dir = path_join(root, path);
    if (!is_directory(dir))
        return false;

    vector<string> names = list_directory(dir);
    for (vector<string>::const_iterator i = names.begin();
         i != names.end(); ++i) {
        struct stat stat_buf;
        if (lstat(path_join(dir, *i).c_str(), &stat_buf) < 0)
            continue;
        if (S_ISDIR(stat_buf.st_mode))
            entries->push_back(RemoteEntry(*i, 0, true));
        else if (S_ISREG(stat_buf.st_mode))
            entries->push_back(RemoteEntry(*i, stat_buf.st_size, false));
    }

    return true;
}

/* Files are copied under a temporary name and renamed, so that a listing
 * never shows a partly written file under its final name. */
void LocalRemoteStore::copy_in(const string &local_path,
                               const string &remote_path)
{
    string dest = path_join(root, remote_path);
    size_t slash = dest.rfind('/');
    if (slash != string::npos)
        make_dirs(dest.substr(0, slash), 0755);

    string tmp = dest + ".tmp-" + generate_uuid();
    try {
        copy_file(local_path, tmp);
        rename_file(tmp, dest);
    } catch (CirrusError &) {
        unlink(tmp.c_str());
        throw;
    }
}

bool LocalRemoteStore::copy_out(const string &remote_path,
                                const string &local_path)
{
    string src = path_join(root, remote_path);
    if (!path_exists(src))
        return false;
    copy_file(src, local_path);
    return true;
}

void LocalRemoteStore::delete_recursive(const string &remote_path)
{
    remove_tree(path_join(root, remote_path));
}

/* rclone exit codes for a missing directory or file. */
static const int RCLONE_DIR_NOT_FOUND = 3;
static const int RCLONE_FILE_NOT_FOUND = 4;

RcloneRemoteStore::RcloneRemoteStore(const Config &config, const string &root)
    : RemoteStore(config), root(root), timeout(config.remote_timeout)
{
}

string RcloneRemoteStore::RemotePath(const string &path) const
{
    if (path.empty())
        return root;
    if (!root.empty() && root[root.size() - 1] == ':')
        return root + path;
    return root + "/" + path;
}

int RcloneRemoteStore::Run(const vector<string> &args, string *output)
{
    vector<string> argv;
    argv.push_back("rclone");
    argv.push_back("--retries");
    argv.push_back("1");
    argv.insert(argv.end(), args.begin(), args.end());

    if (verbose)
        printf("Running %s\n", format_command(argv).c_str());

    CommandOptions options;
    options.timeout = timeout;
    options.capture_stdout = output;
    return run_command(argv, options);
}

bool RcloneRemoteStore::list_dir(const string &path,
                                 vector<RemoteEntry> *entries)
{
    vector<string> args;
    args.push_back("lsf");
    args.push_back("--format");
    args.push_back("sp");
    args.push_back("--separator");
    args.push_back("\t");
    args.push_back(RemotePath(path));

    string output;
    int status = Run(args, &output);
    if (status == RCLONE_DIR_NOT_FOUND)
        return false;
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("rclone lsf exited with status %d",
                                        status));

    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == string::npos)
            end = output.size();
        string line = output.substr(start, end - start);
        start = end + 1;

        size_t tab = line.find('\t');
        if (tab == string::npos)
            continue;

        string name = line.substr(tab + 1);
        bool is_dir = !name.empty() && name[name.size() - 1] == '/';
        if (is_dir)
            name.resize(name.size() - 1);
        int64_t size = is_dir ? 0 : strtoll(line.substr(0, tab).c_str(),
                                            NULL, 10);
        entries->push_back(RemoteEntry(name, size, is_dir));
    }

    return true;
}

void RcloneRemoteStore::copy_in(const string &local_path,
                                const string &remote_path)
{
    vector<string> args;
    args.push_back("copyto");
    args.push_back(local_path);
    args.push_back(RemotePath(remote_path));

    int status = Run(args, NULL);
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("rclone copyto exited with status %d",
                                        status));
}

bool RcloneRemoteStore::copy_out(const string &remote_path,
                                 const string &local_path)
{
    vector<string> args;
    args.push_back("copyto");
    args.push_back(RemotePath(remote_path));
    args.push_back(local_path);

    int status = Run(args, NULL);
    if (status == RCLONE_DIR_NOT_FOUND || status == RCLONE_FILE_NOT_FOUND)
        return false;
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("rclone copyto exited with status %d",
                                        status));
    return true;
}

void RcloneRemoteStore::delete_recursive(const string &remote_path)
{
    // A single file is removed with deletefile; purge only takes directories.
    vector<string> args;
    bool is_file = remote_path.find('/') != string::npos
        && !is_snapshot_id(remote_path.substr(remote_path.rfind('/') + 1));
    args.push_back(is_file ? "deletefile" : "purge");
    args.push_back(RemotePath(remote_path));

    int status = Run(args, NULL);
    if (status == RCLONE_DIR_NOT_FOUND || status == RCLONE_FILE_NOT_FOUND)
        return;
    if (status != 0)
        throw CirrusError(ERR_TRANSIENT_IO,
                          string_printf("rclone %s exited with status %d",
                                        args[0].c_str(), status));
}
