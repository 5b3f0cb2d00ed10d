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

#include <stdint.h>
#include <string.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <string>
#include <vector>

#include "error.h"
#include "sealer.h"
#include "util.h"

using std::string;
using std::vector;

const int SEAL_ITERATIONS = 200000;

static const char SEAL_MAGIC[] = "CIRRUS01";
static const size_t MAGIC_LEN = 8;
static const size_t SALT_LEN = 16;
static const size_t IV_LEN = 12;
static const size_t TAG_LEN = 16;
static const size_t KEY_LEN = 32;
static const size_t HEADER_LEN = MAGIC_LEN + 4 + SALT_LEN + IV_LEN;

static const int MAX_ITERATIONS = 10000000;

PassphraseSource PassphraseSource::FromFile(const string &path)
{
    PassphraseSource source;
    source.is_file = true;
    source.path = path;
    return source;
}

PassphraseSource PassphraseSource::FromValue(const string &value)
{
    PassphraseSource source;
    source.value = value;
    return source;
}

string PassphraseSource::Read() const
{
    string passphrase = value;

    if (is_file) {
        if (path.empty() || !path_exists(path))
            throw CirrusError(ERR_INVALID_INPUT,
                              "Passphrase file " + path + " not found");
        passphrase = read_file(path);
        while (!passphrase.empty()
               && (passphrase[passphrase.size() - 1] == '\n'
                   || passphrase[passphrase.size() - 1] == '\r'))
            passphrase.resize(passphrase.size() - 1);
    }

    if (passphrase.empty())
        throw CirrusError(ERR_INVALID_INPUT, "Empty passphrase");

    return passphrase;
}

static void derive_key(const string &passphrase, const unsigned char *salt,
                       int iterations, unsigned char *key)
{
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), passphrase.size(), salt,
                          SALT_LEN, iterations, EVP_sha256(), KEY_LEN,
                          key) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Key derivation failed");
}

/* Owns an EVP cipher context for the duration of one operation. */
class CipherContext : public noncopyable {
public:
    CipherContext() : ctx(EVP_CIPHER_CTX_new()) {
        if (ctx == NULL)
            throw CirrusError(ERR_LOCAL_IO, "Unable to allocate cipher");
    }
    ~CipherContext() { EVP_CIPHER_CTX_free(ctx); }

    EVP_CIPHER_CTX *get() { return ctx; }

private:
    EVP_CIPHER_CTX *ctx;
};

string seal(const string &plain, const PassphraseSource &source,
            int iterations)
{
    string passphrase = source.Read();

    unsigned char salt[SALT_LEN], iv[IV_LEN], key[KEY_LEN];
    if (RAND_bytes(salt, sizeof(salt)) != 1
        || RAND_bytes(iv, sizeof(iv)) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Unable to obtain random bytes");
    derive_key(passphrase, salt, iterations, key);

    string out(SEAL_MAGIC, MAGIC_LEN);
    out += (char)((iterations >> 24) & 0xff);
    out += (char)((iterations >> 16) & 0xff);
    out += (char)((iterations >> 8) & 0xff);
    out += (char)(iterations & 0xff);
    out.append(reinterpret_cast<char *>(salt), sizeof(salt));
    out.append(reinterpret_cast<char *>(iv), sizeof(iv));

    CipherContext ctx;
    vector<unsigned char> buf(plain.size() + 16);
    int len = 0, total = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), NULL, NULL, NULL) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN,
                               NULL) != 1
        || EVP_EncryptInit_ex(ctx.get(), NULL, NULL, key, iv) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Unable to initialize cipher");

    // Authenticate the header along with the data.
    if (EVP_EncryptUpdate(ctx.get(), NULL, &len,
                          reinterpret_cast<const unsigned char *>(out.data()),
                          out.size()) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Encryption failed");

    if (!plain.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), &buf[0], &len,
                              reinterpret_cast<const unsigned char *>(
                                  plain.data()),
                              plain.size()) != 1)
            throw CirrusError(ERR_LOCAL_IO, "Encryption failed");
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), &buf[0] + total, &len) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Encryption failed");
    total += len;

    unsigned char tag[TAG_LEN];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN,
                            tag) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Unable to obtain cipher tag");

    out.append(reinterpret_cast<char *>(&buf[0]), total);
    out.append(reinterpret_cast<char *>(tag), sizeof(tag));

    memset(key, 0, sizeof(key));
    return out;
}

string unseal(const string &sealed, const PassphraseSource &source)
{
    if (sealed.size() < HEADER_LEN + TAG_LEN
        || sealed.compare(0, MAGIC_LEN, SEAL_MAGIC) != 0)
        throw CirrusError(ERR_CORRUPTION, "Not a sealed configuration bundle");

    const unsigned char *data
        = reinterpret_cast<const unsigned char *>(sealed.data());
    uint32_t iterations = ((uint32_t)data[MAGIC_LEN] << 24)
        | ((uint32_t)data[MAGIC_LEN + 1] << 16)
        | ((uint32_t)data[MAGIC_LEN + 2] << 8)
        | (uint32_t)data[MAGIC_LEN + 3];
    if (iterations == 0 || iterations > (uint32_t)MAX_ITERATIONS)
        throw CirrusError(ERR_CORRUPTION,
                          "Implausible key derivation parameters");

    const unsigned char *salt = data + MAGIC_LEN + 4;
    const unsigned char *iv = salt + SALT_LEN;
    const unsigned char *ciphertext = data + HEADER_LEN;
    size_t cipher_len = sealed.size() - HEADER_LEN - TAG_LEN;
    unsigned char tag[TAG_LEN];
    memcpy(tag, data + sealed.size() - TAG_LEN, TAG_LEN);

    string passphrase = source.Read();
    unsigned char key[KEY_LEN];
    derive_key(passphrase, salt, iterations, key);

    CipherContext ctx;
    vector<unsigned char> buf(cipher_len + 16);
    int len = 0, total = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), NULL, NULL, NULL) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN,
                               NULL) != 1
        || EVP_DecryptInit_ex(ctx.get(), NULL, NULL, key, iv) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Unable to initialize cipher");
    memset(key, 0, sizeof(key));

    if (EVP_DecryptUpdate(ctx.get(), NULL, &len, data, HEADER_LEN) != 1)
        throw CirrusError(ERR_CORRUPTION, "Decryption failed");
    if (cipher_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), &buf[0], &len, ciphertext,
                              cipher_len) != 1)
            throw CirrusError(ERR_CORRUPTION, "Decryption failed");
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN,
                            tag) != 1)
        throw CirrusError(ERR_LOCAL_IO, "Unable to set cipher tag");
    if (EVP_DecryptFinal_ex(ctx.get(), &buf[0] + total, &len) != 1)
        throw CirrusError(ERR_CORRUPTION,
                          "Decryption failed: wrong passphrase or damaged "
                          "data");
    total += len;

    return string(reinterpret_cast<char *>(&buf[0]), total);
}

void seal_file(const string &in_path, const string &out_path,
               const PassphraseSource &source)
{
    write_file(out_path, seal(read_file(in_path), source), 0600);
}

void unseal_file(const string &in_path, const string &out_path,
                 const PassphraseSource &source)
{
    write_file(out_path, unseal(read_file(in_path), source), 0600);
}
