#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "account_store.h"

namespace misato {

// AccountStore backed by one JSON document on disk.
//
// Every mutation is applied in memory under mu_ and then written out with
// write-temp-then-rename. If the write fails the in-memory change is rolled
// back and StoreUnavailable is thrown, so memory and disk never diverge.
//
// An empty path keeps the store in memory only.
class JsonAccountStore : public AccountStore {
public:
    explicit JsonAccountStore(std::string path);

    // Missing file = empty store (returns true). Unreadable or malformed JSON,
    // or a record field of the wrong type, returns false and leaves the store
    // empty.
    bool load();

    std::optional<Account> find_account(const std::string& id) override;
    std::optional<Account> find_account_by_token(const std::string& token_hash) override;

    bool create_account(const Account& account) override;
    bool save_credential(const std::string& id, const Credential& credential) override;
    bool append_token(const std::string& id, const TokenRecord& token) override;
    bool remove_token(const std::string& id, const std::string& token_hash) override;
    bool clear_tokens(const std::string& id) override;
    bool delete_account(const std::string& id) override;

    bool has_role(Role role) override;

    size_t size() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Account> by_id_;
    std::unordered_map<std::string, std::string> id_by_token_;   // token_hash -> id

    void persist_locked_() const;

    // Runs fn on the account under mu_, persists, and restores the previous
    // record if persisting throws.
    template <class Fn>
    bool mutate_(const std::string& id, Fn fn);

    void index_tokens_locked_(const Account& a);
    void unindex_tokens_locked_(const Account& a);
};

} // namespace misato
