#include "credential_hasher.h"

#include "errors.h"
#include "misato_util.h"

#include <sodium.h>
#include <new>
#include <string>
#include <utility>

namespace misato {

/*
Credential hashing
==================

Passwords are derived with libsodium's crypto_pwhash (Argon2i / Argon2id).

Salt width
----------
Stored salts are long (256 bytes by default), but crypto_pwhash takes exactly
crypto_pwhash_SALTBYTES (16). We fold the whole stored salt into the KDF salt
with keyed BLAKE2b:

    kdf_salt = BLAKE2b-128(key = kSaltFoldKey, msg = stored_salt)

so every stored byte participates and the mapping is deterministic.

Limits:
  - stored salt shorter than crypto_pwhash_SALTBYTES -> HashingFailure
  - stored salt longer than kMaxSaltBytes           -> HashingFailure

Comparison
----------
verify() compares with sodium_memcmp (constant time for equal lengths). A hash
length that does not match the profile is rejected before any comparison.
*/

static constexpr size_t kMaxSaltBytes = 4096;

// 32 bytes: within crypto_generichash_KEYBYTES_MIN..MAX.
static const unsigned char kSaltFoldKey[32] = {
    'm','i','s','a','t','o','.','c','r','e','d','e','n','t','i','a',
    'l','.','s','a','l','t','.','f','o','l','d','.','v','0','0','1'
};

HashParams hash_params_v1() {
    HashParams p;
    p.version  = 1;
    p.alg      = crypto_pwhash_ALG_ARGON2I13;
    p.opslimit = 3;
    p.memlimit = 4096 * 1024;
    p.salt_len = 256;
    p.hash_len = 32;
    return p;
}

HashParams hash_params_v2() {
    HashParams p;
    p.version  = 2;
    p.alg      = crypto_pwhash_ALG_ARGON2ID13;
    p.opslimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    p.memlimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
    p.salt_len = 256;
    p.hash_len = 32;
    return p;
}

const HashParams* HashParamSet::find(std::uint32_t version) const {
    for (const auto& p : known) {
        if (p.version == version) return &p;
    }
    return nullptr;
}

HashParamSet default_hash_param_set() {
    HashParamSet s;
    s.known.push_back(hash_params_v1());
    s.known.push_back(hash_params_v2());
    s.current = 2;
    return s;
}

std::vector<unsigned char> generate_salt(size_t n) {
    return random_bytes(n);
}

CredentialHasher::CredentialHasher(HashParamSet params)
    : params_(std::move(params)) {
    const HashParams* cur = params_.find(params_.current);
    if (!cur) {
        throw HashingFailure("current hash params version " +
                             std::to_string(params_.current) + " is not registered");
    }
    current_ = *cur;
    if (current_.salt_len < crypto_pwhash_SALTBYTES || current_.salt_len > kMaxSaltBytes) {
        throw HashingFailure("current hash params salt_len out of range");
    }
}

bool CredentialHasher::derive_(const HashParams& p,
                               const std::vector<unsigned char>& salt,
                               const std::string& password,
                               std::vector<unsigned char>& out) {
    if (salt.size() < crypto_pwhash_SALTBYTES || salt.size() > kMaxSaltBytes) return false;
    if (p.hash_len < crypto_pwhash_BYTES_MIN) return false;

    unsigned char kdf_salt[crypto_pwhash_SALTBYTES];
    if (crypto_generichash(kdf_salt, sizeof(kdf_salt),
                           salt.data(), salt.size(),
                           kSaltFoldKey, sizeof(kSaltFoldKey)) != 0) {
        return false;
    }

    out.assign(p.hash_len, 0);
    if (crypto_pwhash(out.data(), out.size(),
                      password.data(), static_cast<unsigned long long>(password.size()),
                      kdf_salt,
                      p.opslimit, p.memlimit, p.alg) != 0) {
        // Out of memory or limits rejected by libsodium.
        out.clear();
        return false;
    }
    return true;
}

Credential CredentialHasher::hash_new(const std::string& password) const {
    return hash_with_salt(generate_salt(current_.salt_len), password);
}

Credential CredentialHasher::hash_with_salt(const std::vector<unsigned char>& salt,
                                            const std::string& password) const {
    if (salt.empty()) throw HashingFailure("empty salt");

    Credential c;
    if (!derive_(current_, salt, password, c.hash)) {
        throw HashingFailure("password derivation failed (salt " +
                             std::to_string(salt.size()) + " bytes)");
    }
    c.params_version = current_.version;
    c.salt = salt;
    return c;
}

Credential CredentialHasher::hash_new_under(std::uint32_t version, const std::string& password) const {
    const HashParams* p = params_.find(version);
    if (!p) throw HashingFailure("hash params version " + std::to_string(version) + " is not registered");

    Credential c;
    c.salt = generate_salt(p->salt_len);
    if (!derive_(*p, c.salt, password, c.hash)) {
        throw HashingFailure("password derivation failed under v" + std::to_string(version));
    }
    c.params_version = p->version;
    return c;
}

std::vector<std::uint32_t> CredentialHasher::known_versions() const {
    std::vector<std::uint32_t> out;
    out.reserve(params_.known.size());
    for (const auto& p : params_.known) out.push_back(p.version);
    return out;
}

bool CredentialHasher::verify(const Credential& credential, const std::string& password) const {
    const HashParams* p = params_.find(credential.params_version);
    if (!p) return false;
    if (credential.hash.size() != p->hash_len) return false;

    std::vector<unsigned char> got;
    try {
        if (!derive_(*p, credential.salt, password, got)) return false;
    } catch (const std::bad_alloc&) {
        return false;
    }

    const bool ok = sodium_memcmp(got.data(), credential.hash.data(), got.size()) == 0;
    sodium_memzero(got.data(), got.size());
    return ok;
}

bool CredentialHasher::needs_rehash(const Credential& credential) const {
    return credential.params_version != current_.version;
}

} // namespace misato
