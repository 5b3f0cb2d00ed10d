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

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "cirrus.h"
#include "error.h"
#include "hash.h"
#include "manifest.h"
#include "snapshot.h"
#include "util.h"

using std::istringstream;
using std::map;
using std::string;
using std::vector;

const char MANIFEST_FORMAT[] = "Cirrus Snapshot v1";

Artifact describe_artifact(const string &dir, const string &domain,
                           const string &filename)
{
    string path = path_join(dir, filename);

    Artifact artifact;
    artifact.domain = domain;
    artifact.filename = filename;
    artifact.size = file_size(path);
    artifact.content_hash = Hash::hash_file(path.c_str());
    if (artifact.content_hash.empty())
        throw CirrusError(ERR_LOCAL_IO, "Unable to read artifact " + path);

    return artifact;
}

void verify_artifact(const Artifact &artifact, const string &path)
{
    if (!path_exists(path))
        throw CirrusError(ERR_CORRUPTION,
                          "Artifact " + artifact.filename + " is missing");

    int64_t size = file_size(path);
    if (size != artifact.size)
        throw CirrusError(ERR_CORRUPTION,
                          string_printf("Artifact %s has size %lld, "
                                        "expected %lld",
                                        artifact.filename.c_str(),
                                        (long long)size,
                                        (long long)artifact.size));

    string checksum = Hash::hash_file(path.c_str());
    if (checksum != artifact.content_hash)
        throw CirrusError(ERR_CORRUPTION,
                          "Checksum mismatch for artifact "
                          + artifact.filename);
}

string build_manifest(const Snapshot &snapshot)
{
    if (!is_snapshot_id(snapshot.id))
        throw CirrusError(ERR_INVALID_INPUT,
                          "Bad snapshot id \"" + snapshot.id + "\"");
    if (snapshot.kind == KIND_INCREMENTAL && snapshot.parent_id.empty())
        throw CirrusError(ERR_INVALID_INPUT,
                          "Incremental snapshot without parent",
                          snapshot.id);
    if (snapshot.kind != KIND_INCREMENTAL && !snapshot.parent_id.empty())
        throw CirrusError(ERR_INVALID_INPUT,
                          string("A ") + kind_to_string(snapshot.kind)
                          + " snapshot cannot have a parent", snapshot.id);

    string out;
    out += string("Format: ") + MANIFEST_FORMAT + "\n";
    out += "Producer: " + snapshot.producer + "\n";
    out += "Snapshot: " + snapshot.id + "\n";
    out += string("Kind: ") + kind_to_string(snapshot.kind) + "\n";
    if (!snapshot.parent_id.empty())
        out += "Parent: " + snapshot.parent_id + "\n";
    out += string("Status: ") + status_to_string(snapshot.status) + "\n";
    out += "Created: " + TimeFormat::isoformat(snapshot.created_at) + "\n";
    if (snapshot.finished_at != 0)
        out += "Finished: " + TimeFormat::isoformat(snapshot.finished_at)
            + "\n";
    out += "Host: " + snapshot.host_identity + "\n";
    if (!snapshot.application_version.empty())
        out += "Application-Version: " + snapshot.application_version + "\n";

    if (!snapshot.images.empty()) {
        out += "Images:\n";
        for (vector<string>::const_iterator i = snapshot.images.begin();
             i != snapshot.images.end(); ++i) {
            if (i->empty() || i->find_first_of(" \t\n") != string::npos)
                throw CirrusError(ERR_INVALID_INPUT,
                                  "Bad image reference \"" + *i + "\"",
                                  snapshot.id);
            out += "    " + *i + "\n";
        }
    }

    out += "Artifacts:\n";
    for (map<string, Artifact>::const_iterator i = snapshot.artifacts.begin();
         i != snapshot.artifacts.end(); ++i) {
        const Artifact &a = i->second;
        if (a.content_hash.empty() || a.filename.empty())
            throw CirrusError(ERR_INVALID_INPUT,
                              "Artifact " + i->first + " was never finalized",
                              snapshot.id);

        out += "    " + i->first + " " + a.filename + " "
            + encode_int(a.size) + " " + a.content_hash;
        if (!a.tree_hash.empty())
            out += " tree=" + a.tree_hash + " entries=" + encode_int(a.entries);
        out += "\n";
    }

    return out;
}

static Artifact parse_artifact_line(const string &line, const string &where)
{
    istringstream in(line);
    Artifact artifact;
    string size, option;

    if (!(in >> artifact.domain >> artifact.filename >> size
          >> artifact.content_hash))
        throw CirrusError(ERR_CORRUPTION,
                          "Malformed artifact line in " + where + ": " + line);

    char *end;
    artifact.size = strtoll(size.c_str(), &end, 10);
    if (*end != '\0' || artifact.size < 0)
        throw CirrusError(ERR_CORRUPTION,
                          "Bad artifact size in " + where + ": " + line);

    while (in >> option) {
        if (option.compare(0, 5, "tree=") == 0) {
            artifact.tree_hash = option.substr(5);
        } else if (option.compare(0, 8, "entries=") == 0) {
            artifact.entries = parse_int(option.substr(8));
        } else if (verbose) {
            fprintf(stderr, "Warning: ignoring artifact option \"%s\" in %s\n",
                    option.c_str(), where.c_str());
        }
    }

    if (artifact.content_hash.find('=') == string::npos)
        throw CirrusError(ERR_CORRUPTION,
                          "Bad artifact checksum in " + where + ": " + line);

    return artifact;
}

Snapshot parse_manifest(const string &text, const string &where)
{
    istringstream in(text);
    map<string, string> fields;
    Snapshot snapshot;
    string section;

    string line;
    while (getline(in, line)) {
        if (line.empty())
            continue;

        bool indented = (line[0] == ' ' || line[0] == '\t');
        if (indented && section == "Images") {
            snapshot.images.push_back(trim(line));
            continue;
        }
        if (indented && section == "Artifacts") {
            Artifact artifact = parse_artifact_line(line, where);
            if (snapshot.artifacts.count(artifact.domain))
                throw CirrusError(ERR_CORRUPTION,
                                  "Duplicate artifact " + artifact.domain
                                  + " in " + where);
            snapshot.artifacts[artifact.domain] = artifact;
            continue;
        }

        size_t colon = line.find(':');
        if (colon == string::npos)
            throw CirrusError(ERR_CORRUPTION,
                              "Malformed manifest line in " + where + ": "
                              + line);

        string key = line.substr(0, colon);
        fields[key] = trim(line.substr(colon + 1));
        section = key;
    }

    if (fields["Format"] != MANIFEST_FORMAT)
        throw CirrusError(ERR_CORRUPTION,
                          "Unsupported manifest format \"" + fields["Format"]
                          + "\" in " + where);

    snapshot.id = fields["Snapshot"];
    if (!is_snapshot_id(snapshot.id))
        throw CirrusError(ERR_CORRUPTION, "Bad snapshot id in " + where);

    if (!parse_kind(fields["Kind"], &snapshot.kind))
        throw CirrusError(ERR_CORRUPTION,
                          "Unknown snapshot kind \"" + fields["Kind"]
                          + "\" in " + where, snapshot.id);

    snapshot.parent_id = fields["Parent"];
    if (snapshot.kind == KIND_INCREMENTAL) {
        if (!is_snapshot_id(snapshot.parent_id))
            throw CirrusError(ERR_CORRUPTION,
                              "Incremental snapshot without a valid parent",
                              snapshot.id);
    } else if (!snapshot.parent_id.empty()) {
        throw CirrusError(ERR_CORRUPTION,
                          string("A ") + kind_to_string(snapshot.kind)
                          + " snapshot names a parent", snapshot.id);
    }

    if (!parse_status(fields["Status"], &snapshot.status))
        throw CirrusError(ERR_CORRUPTION,
                          "Unknown status \"" + fields["Status"] + "\"",
                          snapshot.id);

    if (!TimeFormat::parse(fields["Created"], TimeFormat::FORMAT_ISO8601,
                           &snapshot.created_at))
        throw CirrusError(ERR_CORRUPTION, "Bad creation time", snapshot.id);
    if (fields.count("Finished")
        && !TimeFormat::parse(fields["Finished"], TimeFormat::FORMAT_ISO8601,
                              &snapshot.finished_at))
        throw CirrusError(ERR_CORRUPTION, "Bad finish time", snapshot.id);

    snapshot.producer = fields["Producer"];
    snapshot.host_identity = fields["Host"];
    snapshot.application_version = fields["Application-Version"];

    return snapshot;
}

void write_manifest(const string &dir, const Snapshot &snapshot)
{
    write_file(path_join(dir, MANIFEST_FILE), build_manifest(snapshot));
}

Snapshot read_manifest(const string &dir)
{
    string path = path_join(dir, MANIFEST_FILE);
    if (!path_exists(path))
        throw CirrusError(ERR_CORRUPTION, "No manifest in " + dir);
    return parse_manifest(read_file(path), path);
}
