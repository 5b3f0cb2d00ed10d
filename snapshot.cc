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

#include <string>
#include <vector>

#include "snapshot.h"
#include "util.h"

using std::map;
using std::string;
using std::vector;

const char DOMAIN_MEDIA[] = "media";
const char DOMAIN_DATA[] = "data";
const char DOMAIN_EXPORT[] = "export";
const char DOMAIN_CONFIG[] = "config";
const char DOMAIN_COMPOSE[] = "compose";
const char DOMAIN_DATABASE[] = "database";

const char CONFIG_SEALED_FILE[] = "config.enc";
const char MANIFEST_FILE[] = "manifest";

const char *kind_to_string(SnapshotKind kind)
{
    switch (kind) {
    case KIND_FULL:
        return "full";
    case KIND_INCREMENTAL:
        return "incremental";
    case KIND_ARCHIVE:
        return "archive";
    }
    return "unknown";
}

bool parse_kind(const string &s, SnapshotKind *kind)
{
    if (s == "full") {
        *kind = KIND_FULL;
    } else if (s == "incremental" || s == "incr") {
        *kind = KIND_INCREMENTAL;
    } else if (s == "archive") {
        *kind = KIND_ARCHIVE;
    } else {
        return false;
    }
    return true;
}

bool kind_is_base(SnapshotKind kind)
{
    switch (kind) {
    case KIND_FULL:
    case KIND_ARCHIVE:
        return true;
    case KIND_INCREMENTAL:
        return false;
    }
    return false;
}

const char *status_to_string(SnapshotStatus status)
{
    switch (status) {
    case STATUS_PENDING:
        return "pending";
    case STATUS_VERIFIED:
        return "verified";
    case STATUS_FAILED:
        return "failed";
    }
    return "unknown";
}

bool parse_status(const string &s, SnapshotStatus *status)
{
    if (s == "pending") {
        *status = STATUS_PENDING;
    } else if (s == "verified") {
        *status = STATUS_VERIFIED;
    } else if (s == "failed") {
        *status = STATUS_FAILED;
    } else {
        return false;
    }
    return true;
}

const vector<string> &archived_domains()
{
    static vector<string> domains;
    if (domains.empty()) {
        domains.push_back(DOMAIN_MEDIA);
        domains.push_back(DOMAIN_DATA);
        domains.push_back(DOMAIN_EXPORT);
    }
    return domains;
}

int64_t Snapshot::total_size() const
{
    int64_t total = 0;
    for (map<string, Artifact>::const_iterator i = artifacts.begin();
         i != artifacts.end(); ++i) {
        total += i->second.size;
    }
    return total;
}

string make_snapshot_id(time_t timestamp)
{
    return TimeFormat::format(timestamp, TimeFormat::FORMAT_FILENAME, true);
}

bool parse_snapshot_id(const string &id, time_t *timestamp)
{
    if (!is_snapshot_id(id))
        return false;
    return TimeFormat::parse(id, TimeFormat::FORMAT_FILENAME, timestamp);
}

/* Checks the exact shape "dddd-dd-dd_dd-dd-dd", so that stray directories in
 * a namespace are never mistaken for snapshots. */
bool is_snapshot_id(const string &id)
{
    static const char pattern[] = "dddd-dd-dd_dd-dd-dd";

    if (id.size() != sizeof(pattern) - 1)
        return false;

    for (size_t i = 0; i < id.size(); i++) {
        if (pattern[i] == 'd') {
            if (id[i] < '0' || id[i] > '9')
                return false;
        } else if (id[i] != pattern[i]) {
            return false;
        }
    }

    return true;
}
