// tests/credentials/test_credential_hasher.cpp
//
// Credential hashing properties:
// 1) hash_new twice on one password -> different salt and hash
// 2) hash_with_salt is deterministic and password-sensitive
// 3) verify accepts the right password, rejects others
// 4) bad inputs: short/empty salt throws HashingFailure; verify returns false
// 5) a credential made under an older profile still verifies and needs rehash
// 6) hash_new_under targets a registered non-current profile

#include <sodium.h>

#include <iostream>
#include <string>
#include <vector>

#include "credential_hasher.h"
#include "errors.h"

static int g_failures = 0;

static void expect(bool cond, const char* what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        ++g_failures;
    }
}

// Minimum Argon2id cost so the suite stays fast.
static misato::HashParams fast_params(std::uint32_t version) {
    misato::HashParams p;
    p.version  = version;
    p.alg      = crypto_pwhash_ALG_ARGON2ID13;
    p.opslimit = crypto_pwhash_OPSLIMIT_MIN;
    p.memlimit = crypto_pwhash_MEMLIMIT_MIN;
    p.salt_len = 256;
    p.hash_len = 32;
    return p;
}

static misato::HashParamSet fast_set() {
    misato::HashParamSet s;
    s.known.push_back(fast_params(10));
    s.current = 10;
    return s;
}

static void test_fresh_salt_every_call(const misato::CredentialHasher& h) {
    auto a = h.hash_new("anypassword");
    auto b = h.hash_new("anypassword");
    expect(a.salt.size() == 256, "salt is 256 bytes");
    expect(a.hash.size() == 32, "hash is 32 bytes");
    expect(a.salt != b.salt, "two hash_new calls give different salts");
    expect(a.hash != b.hash, "two hash_new calls give different hashes");
    expect(a.params_version == 10, "credential records the profile version");
}

static void test_hash_with_salt(const misato::CredentialHasher& h) {
    const auto salt = misato::generate_salt(256);
    auto one     = h.hash_with_salt(salt, "anypassword");
    auto same    = h.hash_with_salt(salt, "anypassword");
    auto another = h.hash_with_salt(salt, "anotherpassword");

    expect(one.salt == salt && another.salt == salt, "hash_with_salt keeps the given salt");
    expect(one.hash == same.hash, "same salt + password is deterministic");
    expect(one.hash != another.hash, "different password under one salt differs");

    // Every byte of a long salt participates.
    auto tweaked = salt;
    tweaked[200] ^= 0x01;
    expect(h.hash_with_salt(tweaked, "anypassword").hash != one.hash,
           "a change deep in the salt changes the hash");
}

static void test_verify(const misato::CredentialHasher& h) {
    auto c = h.hash_new("anypassword");
    expect(h.verify(c, "anypassword"), "verify accepts the right password");
    expect(!h.verify(c, "anotherpassword"), "verify rejects a wrong password");
    expect(!h.verify(c, ""), "verify rejects the empty password");
    expect(!h.verify(c, "anypassword "), "verify rejects a near miss");

    auto empty_pw = h.hash_new("");
    expect(h.verify(empty_pw, ""), "empty password round-trips at this layer");
}

static void test_bad_inputs(const misato::CredentialHasher& h) {
    bool threw = false;
    try {
        (void)h.hash_with_salt({}, "pw");
    } catch (const misato::HashingFailure&) {
        threw = true;
    }
    expect(threw, "empty salt throws HashingFailure");

    threw = false;
    try {
        (void)h.hash_with_salt(std::vector<unsigned char>(8, 0x41), "pw");
    } catch (const misato::HashingFailure&) {
        threw = true;
    }
    expect(threw, "8-byte salt throws HashingFailure");

    auto c = h.hash_new("anypassword");

    auto short_salt = c;
    short_salt.salt.resize(4);
    expect(!h.verify(short_salt, "anypassword"), "verify: malformed salt -> false");

    auto no_hash = c;
    no_hash.hash.clear();
    expect(!h.verify(no_hash, "anypassword"), "verify: empty hash -> false");

    auto unknown = c;
    unknown.params_version = 999;
    expect(!h.verify(unknown, "anypassword"), "verify: unknown profile -> false");

    misato::Credential blank;
    expect(!h.verify(blank, ""), "verify: default credential -> false");
}

static void test_profile_upgrade() {
    misato::HashParamSet old_set;
    old_set.known.push_back(misato::hash_params_v1());
    old_set.current = 1;
    misato::CredentialHasher old_hasher(old_set);
    auto legacy = old_hasher.hash_new("anypassword");
    expect(legacy.params_version == 1, "legacy credential is v1");

    misato::HashParamSet new_set;
    new_set.known.push_back(misato::hash_params_v1());
    new_set.known.push_back(fast_params(10));
    new_set.current = 10;
    misato::CredentialHasher new_hasher(new_set);

    expect(new_hasher.verify(legacy, "anypassword"), "v1 credential verifies after upgrade");
    expect(!new_hasher.verify(legacy, "wrong"), "v1 credential still rejects wrong password");
    expect(new_hasher.needs_rehash(legacy), "v1 credential needs rehash");
    expect(!new_hasher.needs_rehash(new_hasher.hash_new("x")), "current credential does not");

    bool threw = false;
    try {
        misato::HashParamSet broken;
        broken.current = 7;
        misato::CredentialHasher bad(broken);
    } catch (const misato::HashingFailure&) {
        threw = true;
    }
    expect(threw, "unregistered current profile is rejected at construction");
}

static void test_hash_new_under() {
    misato::HashParamSet set;
    set.known.push_back(fast_params(10));
    set.known.push_back(fast_params(11));
    set.current = 11;
    misato::CredentialHasher h(set);

    const auto versions = h.known_versions();
    expect(versions.size() == 2 && versions[0] == 10 && versions[1] == 11,
           "known_versions lists profiles in registration order");

    auto older = h.hash_new_under(10, "anypassword");
    expect(older.params_version == 10, "hash_new_under records the requested profile");
    expect(older.salt.size() == 256, "hash_new_under uses the profile's salt length");
    expect(h.verify(older, "anypassword"), "credential made under v10 verifies");
    expect(h.needs_rehash(older), "non-current credential needs rehash");

    bool threw = false;
    try {
        (void)h.hash_new_under(99, "anypassword");
    } catch (const misato::HashingFailure&) {
        threw = true;
    }
    expect(threw, "hash_new_under on an unknown profile throws HashingFailure");
}

static void test_default_profiles() {
    auto set = misato::default_hash_param_set();
    expect(set.current == 2, "default profile is v2");
    expect(set.find(1) != nullptr && set.find(2) != nullptr, "v1 and v2 registered");
    expect(set.find(2)->alg == crypto_pwhash_ALG_ARGON2ID13, "v2 is Argon2id");
    expect(set.find(2)->salt_len == 256, "v2 salt is 256 bytes");
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    misato::CredentialHasher h(fast_set());
    test_fresh_salt_every_call(h);
    test_hash_with_salt(h);
    test_verify(h);
    test_bad_inputs(h);
    test_profile_upgrade();
    test_hash_new_under();
    test_default_profiles();

    if (g_failures != 0) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: credential hasher tests passed\n";
    return 0;
}
