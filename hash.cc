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
#include <stdint.h>
#include <openssl/evp.h>

#include <map>
#include <string>

#include "cirrus.h"
#include "hash.h"
#include "util.h"

using std::map;
using std::string;

static string default_algorithm;
static map<string, Hash *(*)()> hash_registry;

/* Digest computed by an OpenSSL EVP message digest. */
class EvpHash : public Hash {
public:
    EvpHash(const string &name, const EVP_MD *md);
    virtual ~EvpHash();

    virtual void update(const void *data, size_t len);
    virtual size_t digest_size() const { return EVP_MD_size(md); }
    virtual string name() const { return algorithm; }

protected:
    virtual const uint8_t *finalize();

private:
    string algorithm;
    const EVP_MD *md;
    EVP_MD_CTX *ctx;
    uint8_t result[EVP_MAX_MD_SIZE];
};

EvpHash::EvpHash(const string &name, const EVP_MD *md)
    : algorithm(name), md(md)
{
    ctx = EVP_MD_CTX_new();
    if (ctx == NULL || EVP_DigestInit_ex(ctx, md, NULL) != 1)
        fatal("Unable to initialize " + name + " digest");
}

EvpHash::~EvpHash()
{
    EVP_MD_CTX_free(ctx);
}

void EvpHash::update(const void *data, size_t len)
{
    if (EVP_DigestUpdate(ctx, data, len) != 1)
        fatal("Digest update failed");
}

const uint8_t *EvpHash::finalize()
{
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, result, &len) != 1)
        fatal("Digest finalization failed");
    return result;
}

static Hash *new_sha256()
{
    return new EvpHash("sha256", EVP_sha256());
}

void Hash::Register(const std::string& name, Hash *(*constructor)())
{
    hash_registry.insert(make_pair(name, constructor));
}

Hash *Hash::New()
{
    if (hash_registry.empty())
        hash_init();

    return New(default_algorithm);
}

Hash *Hash::New(const std::string& name)
{
    if (hash_registry.empty())
        hash_init();

    map<string, Hash *(*)()>::const_iterator i = hash_registry.find(name);
    if (i == hash_registry.end())
        return NULL;
    else
        return i->second();
}

string Hash::hash_file(const char *filename)
{
    string result;
    scoped_ptr<Hash> hash(Hash::New());
    if (hash->update_from_file(filename))
        result = hash->digest_str();

    return result;
}

bool Hash::update_from_file(const char *filename)
{
    FILE *f = fopen(filename, "rb");
    if (f == NULL)
        return false;

    while (!feof(f)) {
        char buf[65536];
        size_t bytes = fread(buf, 1, sizeof(buf), f);

        if (ferror(f)) {
            fclose(f);
            return false;
        }

        update(buf, bytes);
    }

    fclose(f);
    return true;
}

const uint8_t *Hash::digest()
{
    if (!digest_bytes) {
        digest_bytes = finalize();
    }

    return digest_bytes;
}

string Hash::digest_str()
{
    const uint8_t *raw_digest = digest();
    size_t len = digest_size();
    string hex;

    for (size_t i = 0; i < len; i++) {
        char buf[3];
        snprintf(buf, sizeof(buf), "%02x", raw_digest[i]);
        hex += buf;
    }

    return name() + "=" + hex;
}

void hash_init()
{
    if (!hash_registry.empty())
        return;

    Hash::Register("sha256", new_sha256);
    default_algorithm = "sha256";
}
