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

/* A generic interface for computing digests of data, used for data integrity
 * verification of snapshot artifacts and for the recursive content hash of a
 * restored tree. */

#ifndef _CIRRUS_HASH_H
#define _CIRRUS_HASH_H

#include <stdint.h>
#include <string>

/* An object-oriented wrapper around checksumming functionality. */
class Hash {
public:
    Hash() : digest_bytes(NULL) { }
    virtual ~Hash() { }

    // Adds data to the digest computation.
    virtual void update(const void *data, size_t len) = 0;
    // Returns the size of the buffer returned by digest, in bytes.
    virtual size_t digest_size() const = 0;
    // Returns the name of the hash algorithm.
    virtual std::string name() const = 0;

    void update(const std::string &data) { update(data.data(), data.size()); }

    // Calls update with the contents of the data found in the specified file.
    bool update_from_file(const char *filename);
    // Finalizes the digest and returns a pointer to a raw byte array
    // containing the hash.
    const uint8_t *digest();

    // Returns the digest in text form: "<digest name>=<hex digits>".
    std::string digest_str();

    static void Register(const std::string& name, Hash *(*constructor)());
    static Hash *New();
    static Hash *New(const std::string& name);

    // Digest of an entire file with the default algorithm, in digest_str()
    // form.  Returns an empty string if the file cannot be read.
    static std::string hash_file(const char *filename);

protected:
    virtual const uint8_t *finalize() = 0;

private:
    const uint8_t *digest_bytes;
};

void hash_init();

#endif // _CIRRUS_HASH_H
