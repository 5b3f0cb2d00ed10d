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

/* The change-state token for one archived domain: a cache of the stat
 * information and checksums of every path included in the most recent
 * snapshot of that domain.  Incremental archives compare the live tree with
 * this cache to decide what to emit.
 *
 * The cache is a text file "<state_dir>/<domain>.statcache".  A new cache is
 * always written to a separate file ("<domain>.statcache.<snapshot>") and only
 * renamed over the old one by Commit(), once the snapshot it describes is
 * safely stored; until then the old token stays in force.  The format is one
 * block per path, sorted in traversal order:
 *
 *     Snapshot: 2026-10-17_03-30-00
 *     Domain: media
 *
 *     documents/a.pdf
 *     type: f
 *     size: 1234
 *     mtime: 1760671800.123456789
 *     mode: 0644
 *     checksum: sha256=...
 *
 * Paths are URI-encoded, relative to the domain root, without leading slash.
 */

#ifndef _CIRRUS_STATCACHE_H
#define _CIRRUS_STATCACHE_H

#include <stdint.h>
#include <sys/stat.h>

#include <map>
#include <string>
#include <vector>

/* Stat information for a single path within a domain. */
struct StatEntry {
    StatEntry() : type('?'), size(0), mtime_sec(0), mtime_nsec(0),
                  mode(0) { }

    std::string path;
    char type;                  // 'f' file, 'd' directory, 'l' symlink
    int64_t size;
    int64_t mtime_sec;
    long mtime_nsec;
    unsigned int mode;          // Permission bits only
    std::string checksum;       // Regular files only
    std::string target;         // Symlinks only

    /* Is the path unchanged with respect to a cached entry?  Type, size,
     * permission bits and modification time (to the nanosecond) must all
     * match; contents are not compared. */
    bool same_as(const StatEntry &old) const;

    static StatEntry from_stat(const std::string &path,
                               const struct stat &stat_buf);
};

class StatCache {
public:
    StatCache(const std::string &state_dir, const std::string &domain);

    // Load the committed token, if any.  Returns false if there is none.
    bool Load();
    bool Exists() const { return !snapshot.empty(); }

    const std::string &Domain() const { return domain; }
    // The snapshot the loaded (or newly built) token describes.
    const std::string &Snapshot() const { return snapshot; }

    const StatEntry *Find(const std::string &path) const;
    const std::map<std::string, StatEntry> &Entries() const
        { return entries; }

    // Start building a new token for the named snapshot.
    void Begin(const std::string &snapshot_name);
    void Save(const StatEntry &entry);

    // Write the new token to its pending file.
    void WritePending();
    // Rename the pending file over the committed token.
    void Commit();
    // Remove the pending file, leaving the committed token untouched.
    void Discard();

    // Delete the committed token for a domain (a full snapshot was forced).
    static void Reset(const std::string &state_dir, const std::string &domain);

    std::string CommittedPath() const;
    std::string PendingPath() const;

private:
    std::string state_dir, domain, snapshot;
    std::map<std::string, StatEntry> entries;
    std::vector<std::string> order;

    void Parse(const std::string &text);
};

#endif // _CIRRUS_STATCACHE_H
