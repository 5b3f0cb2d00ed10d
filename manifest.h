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

/* Snapshot manifests.  The manifest is a small text file stored beside the
 * artifacts of a snapshot; it is the only record of what a snapshot contains
 * and which snapshot it builds on, and its presence marks a snapshot as
 * completely stored.  Example:
 *
 *     Format: Cirrus Snapshot v1
 *     Producer: Cirrus 1.0
 *     Snapshot: 2026-10-17_03-30-00
 *     Kind: incremental
 *     Parent: 2026-10-16_03-30-00
 *     Status: verified
 *     Created: 2026-10-17 03:30:00
 *     Finished: 2026-10-17 03:41:12
 *     Host: docs.example.org
 *     Application-Version: ghcr.io/paperless-ngx/paperless-ngx:2.11
 *     Artifacts:
 *         media media 10240 sha256=... tree=sha256=... entries=12
 *         database database 81920 sha256=...
 *
 * Timestamps are UTC.  The manifest must be written only once every artifact
 * it lists is complete. */

#ifndef _CIRRUS_MANIFEST_H
#define _CIRRUS_MANIFEST_H

#include <string>

#include "snapshot.h"

extern const char MANIFEST_FORMAT[];

/* Compute the size and content hash of an artifact file. */
Artifact describe_artifact(const std::string &dir, const std::string &domain,
                           const std::string &filename);

/* Check that the artifact stored at path has the recorded size and hash.
 * Throws CirrusError(ERR_CORRUPTION) if not. */
void verify_artifact(const Artifact &artifact, const std::string &path);

/* Render a manifest.  Throws CirrusError(ERR_INVALID_INPUT) if the metadata
 * is inconsistent (an incremental without parent, an artifact without
 * hash, ...). */
std::string build_manifest(const Snapshot &snapshot);

/* Parse a manifest; any malformed or inconsistent content is reported as
 * CirrusError(ERR_CORRUPTION).  where names the source in messages. */
Snapshot parse_manifest(const std::string &text, const std::string &where);

// Write the manifest into a snapshot directory / read it back.
void write_manifest(const std::string &dir, const Snapshot &snapshot);
Snapshot read_manifest(const std::string &dir);

#endif // _CIRRUS_MANIFEST_H
