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

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "chain.h"
#include "cirrus.h"
#include "error.h"
#include "remote.h"
#include "util.h"

using std::reverse;
using std::set;
using std::string;
using std::vector;

bool RemoteManifestSource::GetManifest(const string &id, Snapshot *snapshot)
{
    return remote->FetchManifest(ns, id, snapshot);
}

vector<Snapshot> ChainResolver::Resolve(const string &id)
{
    vector<Snapshot> chain;
    set<string> visited;
    string current = id;

    while (true) {
        if (visited.count(current))
            throw CirrusError(ERR_CORRUPTION,
                              "Snapshot chain revisits " + current, id);
        if ((int)chain.size() > max_hops)
            throw CirrusError(ERR_CORRUPTION,
                              string_printf("Snapshot chain is longer than "
                                            "%d hops", max_hops), id);
        visited.insert(current);

        Snapshot snapshot;
        if (!source->GetManifest(current, &snapshot)) {
            if (current == id)
                throw CirrusError(ERR_INVALID_INPUT, "No such snapshot", id);
            throw ChainBroken("Parent snapshot " + current + " is missing",
                              id);
        }

        if (snapshot.status != STATUS_VERIFIED)
            throw CirrusError(ERR_CORRUPTION,
                              "Snapshot " + current + " in the chain is "
                              + status_to_string(snapshot.status), id);

        if (verbose)
            printf("  %s (%s)\n", snapshot.id.c_str(),
                   kind_to_string(snapshot.kind));

        chain.push_back(snapshot);
        if (kind_is_base(snapshot.kind))
            break;

        current = snapshot.parent_id;
    }

    reverse(chain.begin(), chain.end());
    return chain;
}
