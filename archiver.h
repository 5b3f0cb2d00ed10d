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

/* Per-domain archives.  Each archived domain (media, data, export) of a
 * snapshot is stored as one tar file, written and read with libtar.
 *
 * A full archive contains every path of the domain.  An incremental archive
 * contains every directory, every path which changed since the domain's
 * change-state token (see statcache.h), and a member named .cirrus-deleted
 * which lists, one URI-encoded path per line, the paths deleted since the
 * token.  Extracting the archives of a chain in order onto an empty directory
 * rebuilds the tree as it was at the last snapshot.
 *
 * The archiver owns the change-state tokens.  Archive() prepares a new token
 * alongside the old one; the tokens are only advanced when the caller commits
 * them, after the snapshot has been stored. */

#ifndef _CIRRUS_ARCHIVER_H
#define _CIRRUS_ARCHIVER_H

#include <stdint.h>

#include <map>
#include <string>

#include "snapshot.h"
#include "statcache.h"
#include "util.h"

// Name of the archive member listing deleted paths.
extern const char DELETED_MEMBER[];

struct ArchiveResult {
    ArchiveResult() : entries(0), changed(0), deleted(0) { }

    int64_t entries;            // Domain members written to the archive
    int64_t changed;            // Of which files or links changed
    int64_t deleted;            // Paths listed as deleted
    std::string tree_hash;      // Recursive hash of the tree at this time
};

class Archiver {
public:
    virtual ~Archiver() { }

    // Archive the tree at source_dir as the given domain into blob_path.
    // Returns false, without creating blob_path, if source_dir does not
    // exist.  An incremental archive is made relative to the domain's
    // token; the caller must have checked that the token is usable.
    virtual bool Archive(const std::string &domain,
                         const std::string &source_dir, SnapshotKind mode,
                         const std::string &snapshot_id,
                         const std::string &blob_path,
                         ArchiveResult *result) = 0;

    // Apply an archive to target_dir: remove the paths it lists as deleted,
    // then create or replace every member.
    virtual void Extract(const std::string &blob_path,
                         const std::string &target_dir) = 0;

    // Read an archive back and check it holds the expected number of
    // members.  Throws CirrusError(ERR_CORRUPTION) otherwise.
    virtual void Verify(const std::string &blob_path,
                        int64_t expected_entries) = 0;

    // Snapshot the committed token of a domain describes, or "" if none.
    virtual std::string TokenSnapshot(const std::string &domain) = 0;

    // Advance every token prepared by Archive() since the last commit.
    virtual void CommitTokens() = 0;
    // Forget the prepared tokens, leaving the committed ones in force.
    virtual void DiscardTokens() = 0;
    // Delete the committed token of a domain.
    virtual void ResetToken(const std::string &domain) = 0;
};

class TarArchiver : public Archiver, public noncopyable {
public:
    explicit TarArchiver(const std::string &state_dir);
    virtual ~TarArchiver();

    virtual bool Archive(const std::string &domain,
                         const std::string &source_dir, SnapshotKind mode,
                         const std::string &snapshot_id,
                         const std::string &blob_path,
                         ArchiveResult *result);
    virtual void Extract(const std::string &blob_path,
                         const std::string &target_dir);
    virtual void Verify(const std::string &blob_path,
                        int64_t expected_entries);

    virtual std::string TokenSnapshot(const std::string &domain);
    virtual void CommitTokens();
    virtual void DiscardTokens();
    virtual void ResetToken(const std::string &domain);

private:
    std::string state_dir;
    std::map<std::string, StatCache *> pending;
};

/* Recursive content hash of a directory tree: SHA-256 over the sorted list of
 * "type path digest-or-target" lines of everything below dir.  The root itself
 * does not contribute, so only the contents of dir are compared. */
std::string tree_hash(const std::string &dir);

// The same hash computed from the entries of a change-state token.
std::string tree_hash(const StatCache &cache);

#endif // _CIRRUS_ARCHIVER_H
