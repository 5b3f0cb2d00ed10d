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

/* Snapshots are kept in a remote store, under a per-instance namespace:
 * "<namespace>/<snapshot id>/<artifact>".  The store itself only has to
 * provide four primitives (list a directory, copy a file in, copy a file out,
 * delete recursively); the snapshot-level operations are built on top of
 * these in RemoteStore.
 *
 * A snapshot counts as present only once its manifest is visible.  Uploads
 * send the manifest last and then re-read the remote listing, so an upload
 * that was interrupted leaves a directory without a manifest, which is
 * ignored by List() and overwritten by the next attempt. */

#ifndef _CIRRUS_REMOTE_H
#define _CIRRUS_REMOTE_H

#include <stdint.h>

#include <string>
#include <vector>

#include "config.h"
#include "error.h"
#include "snapshot.h"

struct RemoteEntry {
    RemoteEntry() : size(0), is_dir(false) { }
    RemoteEntry(const std::string &name, int64_t size, bool is_dir)
        : name(name), size(size), is_dir(is_dir) { }

    std::string name;
    int64_t size;
    bool is_dir;
};

class RemoteStore {
public:
    explicit RemoteStore(const Config &config);
    virtual ~RemoteStore() { }

    // Construct the store selected by the configuration.
    static RemoteStore *New(const Config &config);

    // Store the snapshot staged in staging_dir.  Uploading a snapshot which
    // is already present with the same manifest does nothing; one present
    // with a different manifest is reported as ERR_CORRUPTION.
    void Upload(const std::string &ns, const std::string &id,
                const std::string &staging_dir);

    // Ids of the committed snapshots in a namespace, sorted.
    std::vector<std::string> List(const std::string &ns);
    // Ids of all snapshot directories, including partial uploads.
    std::vector<std::string> ListAll(const std::string &ns);

    bool IsPresent(const std::string &ns, const std::string &id);

    // Copy a snapshot into "<local_dir>/<id>" and return that path.  Throws
    // ERR_INVALID_INPUT if the snapshot is not present.
    std::string Download(const std::string &ns, const std::string &id,
                         const std::string &local_dir);

    // Read just the manifest.  Returns false if the snapshot is not present.
    bool FetchManifest(const std::string &ns, const std::string &id,
                       Snapshot *snapshot);

    // Remove a snapshot.  The manifest goes first, so that an interrupted
    // delete leaves an uncommitted directory rather than a broken snapshot.
    void Delete(const std::string &ns, const std::string &id);

protected:
    /* The primitives.  Paths are relative to the root of the store, with '/'
     * separators.  list_dir and copy_out return false if the path does not
     * exist; other failures are thrown, as ERR_TRANSIENT_IO where retrying
     * may help. */
    virtual bool list_dir(const std::string &path,
                          std::vector<RemoteEntry> *entries) = 0;
    virtual void copy_in(const std::string &local_path,
                         const std::string &remote_path) = 0;
    virtual bool copy_out(const std::string &remote_path,
                          const std::string &local_path) = 0;
    virtual void delete_recursive(const std::string &remote_path) = 0;

private:
    int retries;
    long backoff_ms;
    std::string tmp_dir;

    // The primitives, retried with exponential backoff on transient errors.
    bool ListDir(const std::string &path, std::vector<RemoteEntry> *entries);
    void CopyIn(const std::string &local_path,
                const std::string &remote_path);
    bool CopyOut(const std::string &remote_path,
                 const std::string &local_path);
    void DeleteRecursive(const std::string &remote_path);

    void Backoff(const CirrusError &e, const char *what,
                 const std::string &path, int attempt);
    bool ReadRemoteFile(const std::string &remote_path, std::string *data);
};

/* A store in a local directory tree (a mounted disk or network share). */
class LocalRemoteStore : public RemoteStore {
public:
    LocalRemoteStore(const Config &config, const std::string &root);

protected:
    virtual bool list_dir(const std::string &path,
                          std::vector<RemoteEntry> *entries);
    virtual void copy_in(const std::string &local_path,
                         const std::string &remote_path);
    virtual bool copy_out(const std::string &remote_path,
                          const std::string &local_path);
    virtual void delete_recursive(const std::string &remote_path);

private:
    std::string root;
};

/* A store reached through rclone; root is an rclone path such as
 * "pcloud:backups". */
class RcloneRemoteStore : public RemoteStore {
public:
    RcloneRemoteStore(const Config &config, const std::string &root);

protected:
    virtual bool list_dir(const std::string &path,
                          std::vector<RemoteEntry> *entries);
    virtual void copy_in(const std::string &local_path,
                         const std::string &remote_path);
    virtual bool copy_out(const std::string &remote_path,
                          const std::string &local_path);
    virtual void delete_recursive(const std::string &remote_path);

private:
    std::string root;
    int timeout;

    std::string RemotePath(const std::string &path) const;
    int Run(const std::vector<std::string> &args, std::string *output);
};

#endif // _CIRRUS_REMOTE_H
