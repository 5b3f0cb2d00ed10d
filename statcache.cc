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

/* Change-state tokens: reading, writing and committing the per-domain stat
 * cache.  See statcache.h for the file format. */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
#include <unistd.h>
#include <sys/stat.h>

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "error.h"
#include "statcache.h"
#include "util.h"

using std::map;
using std::string;
using std::vector;
using std::getline;
using std::istringstream;

bool StatEntry::same_as(const StatEntry &old) const
{
    if (type != old.type)
        return false;
    if (size != old.size)
        return false;
    if (mode != old.mode)
        return false;
    if (mtime_sec != old.mtime_sec || mtime_nsec != old.mtime_nsec)
        return false;
    if (type == 'l' && target != old.target)
        return false;

    return true;
}

StatEntry StatEntry::from_stat(const string &path, const struct stat &stat_buf)
{
    StatEntry entry;
    entry.path = path;

    if (S_ISDIR(stat_buf.st_mode))
        entry.type = 'd';
    else if (S_ISLNK(stat_buf.st_mode))
        entry.type = 'l';
    else if (S_ISREG(stat_buf.st_mode))
        entry.type = 'f';

    entry.size = (entry.type == 'f') ? stat_buf.st_size : 0;
    entry.mtime_sec = stat_buf.st_mtim.tv_sec;
    entry.mtime_nsec = stat_buf.st_mtim.tv_nsec;
    entry.mode = stat_buf.st_mode & 07777;

    return entry;
}

StatCache::StatCache(const string &state_dir, const string &domain)
    : state_dir(state_dir), domain(domain)
{
}

string StatCache::CommittedPath() const
{
    return path_join(state_dir, domain + ".statcache");
}

string StatCache::PendingPath() const
{
    return CommittedPath() + "." + snapshot;
}

bool StatCache::Load()
{
    snapshot = "";
    entries.clear();
    order.clear();

    string path = CommittedPath();
    if (!path_exists(path))
        return false;

    Parse(read_file(path));
    return Exists();
}

/* The file is a header block followed by one block per entry; blocks are
 * separated by blank lines.  The first line of an entry block is the path,
 * the rest are "key: value" fields. */
void StatCache::Parse(const string &text)
{
    istringstream cache(text);
    bool header = true;

    while (!cache.eof()) {
        map<string, string> fields;
        string name;

        string line;
        while (getline(cache, line)) {
            if (line.empty())
                break;

            if (!header && name.empty()) {
                name = uri_decode(line);
                continue;
            }

            size_t colon = line.find(':');
            if (colon == string::npos)
                continue;
            fields[line.substr(0, colon)] = trim(line.substr(colon + 1));
        }

        if (header) {
            if (fields.empty() && cache.eof())
                break;
            if (fields["Domain"] != domain) {
                fprintf(stderr, "Warning: statcache %s belongs to domain "
                        "\"%s\", ignoring it\n", CommittedPath().c_str(),
                        fields["Domain"].c_str());
                return;
            }
            snapshot = fields["Snapshot"];
            header = false;
            continue;
        }

        if (name.empty())
            continue;

        StatEntry entry;
        entry.path = name;
        if (fields.count("type") && !fields["type"].empty())
            entry.type = fields["type"][0];
        if (fields.count("size"))
            entry.size = parse_int(fields["size"]);
        if (fields.count("mtime")) {
            const string &mtime = fields["mtime"];
            size_t dot = mtime.find('.');
            entry.mtime_sec = parse_int(mtime.substr(0, dot));
            if (dot != string::npos)
                // Zero-padded, so not parse_int(), which would read octal.
                entry.mtime_nsec = strtol(mtime.c_str() + dot + 1, NULL, 10);
        }
        if (fields.count("mode"))
            entry.mode = strtoul(fields["mode"].c_str(), NULL, 8);
        entry.checksum = fields["checksum"];
        if (fields.count("target"))
            entry.target = uri_decode(fields["target"]);

        if (entries.count(name) == 0)
            order.push_back(name);
        entries[name] = entry;
    }

    if (snapshot.empty()) {
        entries.clear();
        order.clear();
    }
}

const StatEntry *StatCache::Find(const string &path) const
{
    map<string, StatEntry>::const_iterator i = entries.find(path);
    if (i == entries.end())
        return NULL;
    return &i->second;
}

void StatCache::Begin(const string &snapshot_name)
{
    snapshot = snapshot_name;
    entries.clear();
    order.clear();
}

void StatCache::Save(const StatEntry &entry)
{
    if (entries.count(entry.path) == 0)
        order.push_back(entry.path);
    entries[entry.path] = entry;
}

void StatCache::WritePending()
{
    string out;
    out += "Snapshot: " + snapshot + "\n";
    out += "Domain: " + domain + "\n";

    for (vector<string>::const_iterator i = order.begin();
         i != order.end(); ++i) {
        const StatEntry &entry = entries[*i];
        char mtime[64], mode[16];
        snprintf(mtime, sizeof(mtime), "%lld.%09ld",
                 (long long)entry.mtime_sec, entry.mtime_nsec);
        snprintf(mode, sizeof(mode), "%04o", entry.mode);

        out += "\n" + uri_encode(entry.path) + "\n";
        out += string("type: ") + entry.type + "\n";
        out += "size: " + encode_int(entry.size) + "\n";
        out += string("mtime: ") + mtime + "\n";
        out += string("mode: ") + mode + "\n";
        if (!entry.checksum.empty())
            out += "checksum: " + entry.checksum + "\n";
        if (!entry.target.empty())
            out += "target: " + uri_encode(entry.target) + "\n";
    }

    make_dirs(state_dir, 0700);
    write_file(PendingPath(), out, 0600);
}

void StatCache::Commit()
{
    rename_file(PendingPath(), CommittedPath());
}

void StatCache::Discard()
{
    if (snapshot.empty())
        return;

    string path = PendingPath();
    if (unlink(path.c_str()) < 0 && errno != ENOENT)
        fprintf(stderr, "Warning: unable to remove %s: %m\n", path.c_str());
}

void StatCache::Reset(const string &state_dir, const string &domain)
{
    StatCache cache(state_dir, domain);
    string path = cache.CommittedPath();
    if (unlink(path.c_str()) < 0 && errno != ENOENT)
        throw CirrusError(ERR_LOCAL_IO,
                          string_printf("Unable to remove %s: %s",
                                        path.c_str(), strerror(errno)));
}
