#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "account.h"

namespace misato {

/*
HashParams
==========

One versioned Argon2 cost profile. The version number is persisted in every
Credential, so verification always re-derives with the exact profile the
credential was created under, even after the default moves on.

Versions are append-only: never change the numbers of an existing entry.
*/
struct HashParams {
    std::uint32_t version = 0;
    int alg = 0;                       // crypto_pwhash_ALG_*
    unsigned long long opslimit = 0;   // Argon2 time cost
    size_t memlimit = 0;               // bytes
    size_t salt_len = 256;             // stored salt size
    size_t hash_len = 32;
};

// v1: Argon2i, t=3, m=4 MiB, 256-byte salt, 32-byte hash.
HashParams hash_params_v1();
// v2: Argon2id at libsodium's interactive limits, 256-byte salt, 32-byte hash.
HashParams hash_params_v2();

// The profiles a hasher accepts, plus the one new credentials are made with.
struct HashParamSet {
    std::uint32_t current = 0;
    std::vector<HashParams> known;

    const HashParams* find(std::uint32_t version) const;
};

// {v1, v2}, current = v2.
HashParamSet default_hash_param_set();

// Fresh CSPRNG salt of n bytes.
std::vector<unsigned char> generate_salt(size_t n);

class CredentialHasher {
public:
    // Throws HashingFailure if params.current is not listed in params.known.
    explicit CredentialHasher(HashParamSet params = default_hash_param_set());

    // New salt + hash under the current profile. Throws HashingFailure.
    Credential hash_new(const std::string& password) const;

    // Deterministic re-derivation under the current profile with a known salt.
    // Only for comparisons; never store the result as a new credential.
    // Throws HashingFailure on an empty or out-of-range salt.
    Credential hash_with_salt(const std::vector<unsigned char>& salt,
                              const std::string& password) const;

    // Fresh credential under a registered, possibly non-current profile.
    // Throws HashingFailure if version is unknown.
    Credential hash_new_under(std::uint32_t version, const std::string& password) const;

    // Every registered profile version, in registration order.
    std::vector<std::uint32_t> known_versions() const;

    // Constant-time check. Any derivation problem returns false.
    bool verify(const Credential& credential, const std::string& password) const;

    // True when the credential was made under a profile other than current.
    bool needs_rehash(const Credential& credential) const;

    const HashParams& current_params() const { return current_; }

private:
    HashParamSet params_;
    HashParams current_;

    static bool derive_(const HashParams& p,
                        const std::vector<unsigned char>& salt,
                        const std::string& password,
                        std::vector<unsigned char>& out);
};

} // namespace misato
