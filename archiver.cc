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

/* Domain archives built on top of libtar.  See archiver.h for the archive
 * layout. */

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>
#include <libtar.h>

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "archiver.h"
#include "cirrus.h"
#include "error.h"
#include "hash.h"
#include "statcache.h"
#include "util.h"

using std::make_pair;
using std::map;
using std::pair;
using std::set;
using std::string;
using std::vector;

const char DELETED_MEMBER[] = ".cirrus-deleted";

static string read_link(const string &path)
{
    vector<char> buf(256);

    while (true) {
        ssize_t len = readlink(path.c_str(), &buf[0], buf.size());
        if (len < 0)
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("readlink(%s): %s", path.c_str(),
                                            strerror(errno)));
        if ((size_t)len < buf.size())
            return string(&buf[0], len);
        buf.resize(buf.size() * 2);
    }
}

static string parent_of(const string &path)
{
    size_t slash = path.rfind('/');
    if (slash == string::npos)
        return ".";
    if (slash == 0)
        return "/";
    return path.substr(0, slash);
}

/* Collect stat information for everything below root, in traversal order:
 * each directory is followed by its contents, and the entries of a directory
 * are visited in sorted order. */
static void scan_tree(const string &root, const string &rel,
                      vector<StatEntry> *entries)
{
    string dir = rel.empty() ? root : path_join(root, rel);
    vector<string> names = list_directory(dir);

    for (vector<string>::const_iterator i = names.begin();
         i != names.end(); ++i) {
        string path = rel.empty() ? *i : rel + "/" + *i;
        string full = path_join(root, path);

        struct stat stat_buf;
        if (lstat(full.c_str(), &stat_buf) < 0) {
            if (errno == ENOENT) {
                fprintf(stderr, "Warning: %s vanished during scan\n",
                        full.c_str());
                continue;
            }
            throw CirrusError(ERR_LOCAL_IO,
                              string_printf("lstat(%s): %s", full.c_str(),
                                            strerror(errno)));
        }

        if (!S_ISREG(stat_buf.st_mode) && !S_ISDIR(stat_buf.st_mode)
            && !S_ISLNK(stat_buf.st_mode)) {
            fprintf(stderr, "Warning: skipping special file %s\n",
                    full.c_str());
            continue;
        }

        StatEntry entry = StatEntry::from_stat(path, stat_buf);
        if (entry.type == 'l')
            entry.target = read_link(full);
        entries->push_back(entry);

        if (entry.type == 'd')
            scan_tree(root, path, entries);
    }
}

static string tree_line(const StatEntry &entry)
{
    string value = "-";
    if (entry.type == 'f')
        value = entry.checksum;
    else if (entry.type == 'l')
        value = uri_encode(entry.target);

    return string(1, entry.type) + " " + uri_encode(entry.path) + " "
        + value + "\n";
}

static string hash_lines(const map<string, string> &lines)
{
    scoped_ptr<Hash> hash(Hash::New());
    for (map<string, string>::const_iterator i = lines.begin();
         i != lines.end(); ++i) {
        hash->update(i->second);
    }
    return hash->digest_str();
}

static string checksum_file(const string &path)
{
    string checksum = Hash::hash_file(path.c_str());
    if (checksum.empty())
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to read %s: %s", path.c_str(),
                                        strerror(errno)));
    return checksum;
}

string tree_hash(const string &dir)
{
    vector<StatEntry> entries;
    scan_tree(dir, "", &entries);

    map<string, string> lines;
    for (vector<StatEntry>::iterator i = entries.begin();
         i != entries.end(); ++i) {
        if (i->type == 'f')
            i->checksum = checksum_file(path_join(dir, i->path));
        lines[i->path] = tree_line(*i);
    }

    return hash_lines(lines);
}

string tree_hash(const StatCache &cache)
{
    map<string, string> lines;
    const map<string, StatEntry> &entries = cache.Entries();
    for (map<string, StatEntry>::const_iterator i = entries.begin();
         i != entries.end(); ++i) {
        lines[i->first] = tree_line(i->second);
    }

    return hash_lines(lines);
}

/* Write a regular file member from memory. */
static void write_member(TAR *t, const string &path, const string &data)
{
    memset(&t->th_buf, 0, sizeof(struct tar_header));

    th_set_type(t, S_IFREG | 0600);
    th_set_user(t, 0);
    th_set_group(t, 0);
    th_set_mode(t, S_IFREG | 0600);
    th_set_size(t, data.size());
    th_set_mtime(t, time(NULL));
    th_set_path(t, const_cast<char *>(path.c_str()));
    th_finish(t);

    if (th_write(t) != 0)
        throw CirrusError(ERR_LOCAL_IO, "Error writing tar header");

    for (size_t offset = 0; offset < data.size(); offset += T_BLOCKSIZE) {
        char block[T_BLOCKSIZE];
        size_t len = data.size() - offset;
        if (len > T_BLOCKSIZE)
            len = T_BLOCKSIZE;

        memset(block, 0, sizeof(block));
        memcpy(block, data.data() + offset, len);
        if (tar_block_write(t, block) == -1)
            throw CirrusError(ERR_LOCAL_IO, "Error writing tar block");
    }
}

/* Name of the member whose header was just read, without any trailing
 * slash.  Long names come from the GNU extension headers; the ustar prefix
 * field only has that meaning in POSIX archives. */
static string member_name(TAR *t)
{
    string name;

    if (t->th_buf.gnu_longname != NULL) {
        name = t->th_buf.gnu_longname;
    } else {
        name = string(t->th_buf.name,
                      strnlen(t->th_buf.name, sizeof(t->th_buf.name)));
        size_t prefix_len = strnlen(t->th_buf.prefix,
                                    sizeof(t->th_buf.prefix));
        if (prefix_len > 0 && t->th_buf.magic[5] == '\0')
            name = string(t->th_buf.prefix, prefix_len) + "/" + name;
    }

    while (name.size() > 1 && name[name.size() - 1] == '/')
        name.resize(name.size() - 1);
    while (name.compare(0, 2, "./") == 0)
        name = name.substr(2);

    return name;
}

static string member_linkname(TAR *t)
{
    if (t->th_buf.gnu_longlink != NULL)
        return t->th_buf.gnu_longlink;
    return string(t->th_buf.linkname,
                  strnlen(t->th_buf.linkname, sizeof(t->th_buf.linkname)));
}

/* Archive members must stay inside the extraction directory. */
static void check_member_name(const string &name, const string &blob_path)
{
    bool bad = name.empty() || name[0] == '/';

    size_t start = 0;
    while (!bad && start <= name.size()) {
        size_t slash = name.find('/', start);
        if (slash == string::npos)
            slash = name.size();
        if (name.compare(start, slash - start, "..") == 0
            && slash - start == 2)
            bad = true;
        start = slash + 1;
    }

    if (bad)
        throw CirrusError(ERR_CORRUPTION,
                          "Unsafe member name \"" + name + "\" in archive "
                          + blob_path);
}

/* Read the data of the current member into memory. */
static string read_member(TAR *t)
{
    int64_t size = th_get_size(t);
    string data;

    while ((int64_t)data.size() < size) {
        char block[T_BLOCKSIZE];
        if (tar_block_read(t, block) != T_BLOCKSIZE)
            throw CirrusError(ERR_CORRUPTION, "Truncated archive member");

        size_t len = size - data.size();
        if (len > T_BLOCKSIZE)
            len = T_BLOCKSIZE;
        data.append(block, len);
    }

    return data;
}

static void skip_member(TAR *t)
{
    int64_t size = th_get_size(t);
    for (int64_t done = 0; done < size; done += T_BLOCKSIZE) {
        char block[T_BLOCKSIZE];
        if (tar_block_read(t, block) != T_BLOCKSIZE)
            throw CirrusError(ERR_CORRUPTION, "Truncated archive member");
    }
}

static TAR *open_archive(const string &blob_path, int flags)
{
    TAR *t = NULL;
    if (tar_open(&t, const_cast<char *>(blob_path.c_str()), NULL, flags,
                 0600, TAR_GNU) == -1)
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to open archive %s: %s",
                                        blob_path.c_str(), strerror(errno)));
    return t;
}

TarArchiver::TarArchiver(const string &state_dir)
    : state_dir(state_dir)
{
}

TarArchiver::~TarArchiver()
{
    DiscardTokens();
}

bool TarArchiver::Archive(const string &domain, const string &source_dir,
                          SnapshotKind mode, const string &snapshot_id,
                          const string &blob_path, ArchiveResult *result)
{
    if (!is_directory(source_dir)) {
        fprintf(stderr, "Warning: %s directory %s does not exist, "
                "skipping\n", domain.c_str(), source_dir.c_str());
        return false;
    }

    /* An incremental archive of a domain without a token contains the whole
     * tree and an empty deletion list. */
    bool incremental = (mode == KIND_INCREMENTAL);
    StatCache old(state_dir, domain);
    if (incremental)
        old.Load();

    vector<StatEntry> entries;
    scan_tree(source_dir, "", &entries);

    StatCache cache(state_dir, domain);
    cache.Begin(snapshot_id);
    *result = ArchiveResult();

    if (verbose)
        printf("Archiving %s (%s) from %s\n", domain.c_str(),
               kind_to_string(mode), source_dir.c_str());

    TAR *t = open_archive(blob_path, O_WRONLY | O_CREAT | O_TRUNC);
    try {
        if (incremental) {
            set<string> present;
            for (vector<StatEntry>::const_iterator i = entries.begin();
                 i != entries.end(); ++i) {
                present.insert(i->path);
            }

            string deleted;
            const map<string, StatEntry> &old_entries = old.Entries();
            for (map<string, StatEntry>::const_iterator i
                     = old_entries.begin();
                 i != old_entries.end(); ++i) {
                if (present.count(i->first) == 0) {
                    deleted += uri_encode(i->first) + "\n";
                    result->deleted++;
                }
            }
            write_member(t, DELETED_MEMBER, deleted);
        }

        for (vector<StatEntry>::iterator i = entries.begin();
             i != entries.end(); ++i) {
            string full = path_join(source_dir, i->path);
            const StatEntry *prev = incremental ? old.Find(i->path) : NULL;
            bool changed = (prev == NULL || !i->same_as(*prev));

            if (i->type == 'f') {
                if (!changed && !prev->checksum.empty())
                    i->checksum = prev->checksum;
                else
                    i->checksum = checksum_file(full);
            }
            cache.Save(*i);

            if (i->type != 'd') {
                if (!changed)
                    continue;
                result->changed++;
            }

            if (tar_append_file(t, const_cast<char *>(full.c_str()),
                                const_cast<char *>(i->path.c_str())) != 0)
                throw CirrusError(ERR_LOCAL_IO,
                                  string_printf("Unable to archive %s: %s",
                                                full.c_str(),
                                                strerror(errno)));
            result->entries++;
        }

        if (tar_append_eof(t) != 0)
            throw CirrusError(ERR_LOCAL_IO,
                              "Error finishing archive " + blob_path);
    } catch (CirrusError &) {
        tar_close(t);
        unlink(blob_path.c_str());
        throw;
    }

    if (tar_close(t) != 0)
        throw CirrusError(ERR_LOCAL_IO, "Error closing archive " + blob_path);

    cache.WritePending();
    result->tree_hash = tree_hash(cache);

    map<string, StatCache *>::iterator p = pending.find(domain);
    if (p != pending.end()) {
        delete p->second;
        pending.erase(p);
    }
    pending[domain] = new StatCache(cache);

    if (verbose)
        printf("  %lld entries, %lld changed, %lld deleted\n",
               (long long)result->entries, (long long)result->changed,
               (long long)result->deleted);

    return true;
}

static void apply_deletions(const string &list, const string &target_dir,
                            const string &blob_path)
{
    size_t start = 0;
    while (start < list.size()) {
        size_t end = list.find('\n', start);
        if (end == string::npos)
            end = list.size();

        string line = list.substr(start, end - start);
        start = end + 1;
        if (line.empty())
            continue;

        string path = uri_decode(line);
        check_member_name(path, blob_path);
        remove_tree(path_join(target_dir, path));
    }
}

void TarArchiver::Extract(const string &blob_path, const string &target_dir)
{
    make_dirs(target_dir, 0755);

    // Directory permissions are applied last, so that read-only directories
    // can still be filled.
    vector<pair<string, mode_t> > dir_modes;

    TAR *t = open_archive(blob_path, O_RDONLY);
    try {
        int rc;
        while ((rc = th_read(t)) == 0) {
            string name = member_name(t);
            check_member_name(name, blob_path);
            string dest = path_join(target_dir, name);

            if (name == DELETED_MEMBER) {
                apply_deletions(read_member(t), target_dir, blob_path);
                continue;
            }

            if (TH_ISLNK(t)) {
                string link_name = member_linkname(t);
                check_member_name(link_name, blob_path);
                string source = path_join(target_dir, link_name);

                remove_tree(dest);
                make_dirs(parent_of(dest), 0755);
                if (link(source.c_str(), dest.c_str()) < 0)
                    copy_file_preserving(source, dest);
            } else if (TH_ISSYM(t)) {
                remove_tree(dest);
                make_dirs(parent_of(dest), 0755);
                if (tar_extract_symlink(t, const_cast<char *>(dest.c_str()))
                        != 0)
                    throw CirrusError(ERR_LOCAL_IO,
                                      string_printf("Unable to create %s: %s",
                                                    dest.c_str(),
                                                    strerror(errno)));
            } else if (TH_ISDIR(t)) {
                struct stat stat_buf;
                if (lstat(dest.c_str(), &stat_buf) == 0
                    && !S_ISDIR(stat_buf.st_mode))
                    remove_tree(dest);
                make_dirs(dest, 0700);
                dir_modes.push_back(make_pair(dest, th_get_mode(t) & 07777));
            } else if (TH_ISREG(t)) {
                remove_tree(dest);
                make_dirs(parent_of(dest), 0755);
                if (tar_extract_regfile(t, const_cast<char *>(dest.c_str()))
                        != 0)
                    throw CirrusError(ERR_LOCAL_IO,
                                      string_printf("Unable to extract %s: %s",
                                                    dest.c_str(),
                                                    strerror(errno)));
            } else {
                fprintf(stderr, "Warning: skipping unsupported member %s in "
                        "%s\n", name.c_str(), blob_path.c_str());
                skip_member(t);
            }
        }

        if (rc < 0)
            throw CirrusError(ERR_CORRUPTION,
                              "Error reading archive " + blob_path);
    } catch (CirrusError &) {
        tar_close(t);
        throw;
    }
    tar_close(t);

    for (vector<pair<string, mode_t> >::reverse_iterator i
             = dir_modes.rbegin();
         i != dir_modes.rend(); ++i) {
        if (chmod(i->first.c_str(), i->second) < 0)
            fprintf(stderr, "Warning: chmod(%s): %m\n", i->first.c_str());
    }
}

void TarArchiver::Verify(const string &blob_path, int64_t expected_entries)
{
    int64_t members = 0;

    TAR *t = open_archive(blob_path, O_RDONLY);
    try {
        int rc;
        while ((rc = th_read(t)) == 0) {
            string name = member_name(t);
            check_member_name(name, blob_path);
            if (name != DELETED_MEMBER)
                members++;
            if (TH_ISREG(t) && !TH_ISLNK(t))
                skip_member(t);
        }

        if (rc < 0)
            throw CirrusError(ERR_CORRUPTION,
                              "Error reading archive " + blob_path);
    } catch (CirrusError &) {
        tar_close(t);
        throw;
    }
    tar_close(t);

    if (members != expected_entries)
        throw CirrusError(ERR_CORRUPTION,
                          string_printf("Archive %s holds %lld members, "
                                        "expected %lld", blob_path.c_str(),
                                        (long long)members,
                                        (long long)expected_entries));
}

string TarArchiver::TokenSnapshot(const string &domain)
{
    StatCache cache(state_dir, domain);
    if (!cache.Load())
        return "";
    return cache.Snapshot();
}

void TarArchiver::CommitTokens()
{
    for (map<string, StatCache *>::iterator i = pending.begin();
         i != pending.end(); ++i) {
        i->second->Commit();
        delete i->second;
    }
    pending.clear();
}

void TarArchiver::DiscardTokens()
{
    for (map<string, StatCache *>::iterator i = pending.begin();
         i != pending.end(); ++i) {
        i->second->Discard();
        delete i->second;
    }
    pending.clear();
}

void TarArchiver::ResetToken(const string &domain)
{
    StatCache::Reset(state_dir, domain);
}
