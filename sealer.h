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

/* Sealing of the configuration bundle before it leaves the host.  Data is
 * encrypted with AES-256-GCM under a key derived from a passphrase with
 * PBKDF2-HMAC-SHA256 and a fresh random salt, so sealing the same input twice
 * yields different output.  Sealed data has the layout
 *
 *     "CIRRUS01" | iterations (4 bytes, big-endian) | salt (16) | iv (12)
 *         | ciphertext | tag (16)
 *
 * Unsealing checks the authentication tag and fails rather than return data
 * when the passphrase is wrong or the input was altered. */

#ifndef _CIRRUS_SEALER_H
#define _CIRRUS_SEALER_H

#include <string>

extern const int SEAL_ITERATIONS;

/* Where the passphrase comes from: a file (whose trailing newline is
 * ignored), or a value supplied interactively.  The passphrase itself is
 * never written into sealed output. */
class PassphraseSource {
public:
    static PassphraseSource FromFile(const std::string &path);
    static PassphraseSource FromValue(const std::string &value);

    const std::string &Path() const { return path; }

    // Throws CirrusError(ERR_INVALID_INPUT) if the file is missing or the
    // passphrase empty.
    std::string Read() const;

private:
    PassphraseSource() : is_file(false) { }

    bool is_file;
    std::string path;
    std::string value;
};

std::string seal(const std::string &plain, const PassphraseSource &source,
                 int iterations = SEAL_ITERATIONS);

// Throws CirrusError(ERR_CORRUPTION) if the data cannot be authenticated.
std::string unseal(const std::string &sealed, const PassphraseSource &source);

void seal_file(const std::string &in_path, const std::string &out_path,
               const PassphraseSource &source);
void unseal_file(const std::string &in_path, const std::string &out_path,
                 const PassphraseSource &source);

#endif // _CIRRUS_SEALER_H
