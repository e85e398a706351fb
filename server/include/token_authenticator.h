#pragma once
#include <optional>
#include <string>

#include "account.h"

namespace misato {

class AccountStore;
class AuditLog;

/*
TokenAuthenticator
==================

Issues, validates and revokes opaque bearer tokens.

Token format
------------
    "mst_" + base64url_no_pad(32 CSPRNG bytes)      (47 chars, 256 bits)

Only BLAKE2b-256(token) is handed to the store. A leaked accounts file does
not hand out working tokens.

Lifecycle
---------
A token is ACTIVE from issue() until revoke_one(), revoke_all() or
on_account_deleted() removes it; it never becomes active again. An account
may hold any number of active tokens.

State
-----
None. Every call goes to the store; StoreUnavailable propagates unchanged.
*/
class TokenAuthenticator {
public:
    // audit may be null.
    explicit TokenAuthenticator(AccountStore& store, AuditLog* audit = nullptr);

    // Empty when the account does not exist.
    std::optional<std::string> issue(const std::string& account_id);

    // Bound principal if the token is active and its account ranks at least
    // required_role. Malformed, unknown, revoked and under-privileged tokens
    // are all the same empty result.
    std::optional<Principal> validate(const std::string& token, Role required_role);

    // Idempotent. Unknown account or token is a no-op.
    void revoke_one(const std::string& account_id, const std::string& token);

    // Idempotent.
    void revoke_all(const std::string& account_id);

    // Revokes every token, then removes the account record.
    // Returns false if the account did not exist.
    bool on_account_deleted(const std::string& account_id);

    static bool is_well_formed(const std::string& token);
    static std::string digest(const std::string& token);

private:
    AccountStore& store_;
    AuditLog* audit_;

    std::string generate_();
    void emit_(const std::string& event, const std::string& account_id,
               const std::string& token_hash, int level);
};

} // namespace misato
