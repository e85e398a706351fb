#pragma once
#include <optional>
#include <string>

#include "account.h"

namespace misato {

/*
AccountStore
============

Persistence seam consumed by the authentication core. The store is the sole
persistence authority: the core reads an account fresh on every call and
never caches it.

Contract for implementations:
  - Each mutation is atomic for a single account (no lost token updates when
    two logins race on the same account).
  - Any failure to read or write the backing medium throws StoreUnavailable.
    "Not found" is never an exception; it is an empty optional / false.
  - Token lookups take the token digest (TokenRecord::token_hash), never the
    bearer string.
*/
class AccountStore {
public:
    virtual ~AccountStore() = default;

    virtual std::optional<Account> find_account(const std::string& id) = 0;
    virtual std::optional<Account> find_account_by_token(const std::string& token_hash) = 0;

    // False if an account with the same id already exists.
    virtual bool create_account(const Account& account) = 0;

    // Mutations return false when the account does not exist.
    virtual bool save_credential(const std::string& id, const Credential& credential) = 0;
    virtual bool append_token(const std::string& id, const TokenRecord& token) = 0;
    virtual bool remove_token(const std::string& id, const std::string& token_hash) = 0;
    virtual bool clear_tokens(const std::string& id) = 0;
    virtual bool delete_account(const std::string& id) = 0;

    virtual bool has_role(Role role) = 0;
};

} // namespace misato
