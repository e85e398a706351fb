#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace misato {

/*
Account model
=============

An account is the only owner of its credential and of its active token set.
Nothing else in the process holds either between requests: every operation
re-reads the account from the store.

Roles form a strict ladder:
    user < admin < root

A token "satisfies" a required role when the bound account ranks at least
that high. Root accounts are only created by bootstrap.
*/
enum class Role : int {
    User  = 0,
    Admin = 1,
    Root  = 2,
};

std::string role_to_string(Role r);

// Unknown strings map to Role::User (least privilege).
Role role_from_string(const std::string& s);

// Strict parse used for request input: unknown strings are rejected.
std::optional<Role> parse_role(const std::string& s);

bool role_satisfies(Role have, Role required);

// Salted, memory-hard password hash.
//
// params_version names the HashParams entry the hash was derived with, so that
// cost parameters can be raised later without orphaning older credentials.
struct Credential {
    std::uint32_t params_version = 0;
    std::vector<unsigned char> salt;
    std::vector<unsigned char> hash;
};

// One active token as persisted.
// token_hash is the lowercase hex BLAKE2b-256 digest of the bearer string.
struct TokenRecord {
    std::string token_hash;
    long issued_at = 0;
};

struct Account {
    std::string id;
    Role role = Role::User;
    Credential credential;
    std::vector<TokenRecord> tokens;
    std::string created_at;    // ISO-8601 UTC
};

// What a successful token validation resolves to.
struct Principal {
    std::string account_id;
    Role role = Role::User;
};

} // namespace misato
