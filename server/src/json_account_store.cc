#include "json_account_store.h"

#include "errors.h"
#include "misato_util.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>
#include <unistd.h>

using json = nlohmann::json;

namespace misato {

/*
================================================================================
JSON account store
================================================================================

File layout
-----------
  {
    "accounts": [
      {
        "id": "u1",
        "role": "user",                  // "root" | "admin" | "user"
        "created_at": "2026-01-19T12:34:56.123Z",
        "credential": {
          "params_version": 2,
          "salt": "<base64>",
          "hash": "<base64>"
        },
        "tokens": [
          { "token_hash": "<64 hex>", "issued_at": 1768826096 }
        ]
      }
    ]
  }

Accounts are written sorted by id so the file diffs cleanly.

Schema firewall
---------------
  - A field present with the wrong JSON type fails load() as a whole.
  - Unknown role strings load as "user" (least privilege).
  - A credential that fails base64 decoding loads empty; verify() rejects it.
  - Token entries that are not 64 lowercase hex chars are dropped.

Threading
---------
  by_id_ and id_by_token_ are guarded by mu_. Every public method takes the
  lock itself; read methods return copies.
================================================================================
*/

static bool is_token_hash(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

static json account_to_json(const Account& a) {
    json toks = json::array();
    for (const auto& t : a.tokens) {
        toks.push_back(json{{"token_hash", t.token_hash}, {"issued_at", t.issued_at}});
    }
    return json{
        {"id", a.id},
        {"role", role_to_string(a.role)},
        {"created_at", a.created_at},
        {"credential", json{
            {"params_version", a.credential.params_version},
            {"salt", b64std_enc(a.credential.salt)},
            {"hash", b64std_enc(a.credential.hash)}
        }},
        {"tokens", toks}
    };
}

static bool account_from_json(const json& it, Account& a) {
    if (!it.is_object()) return false;
    a.id = it.value("id", "");
    if (a.id.empty()) return false;

    a.role = role_from_string(it.value("role", "user"));
    a.created_at = it.value("created_at", "");

    if (it.contains("credential") && it["credential"].is_object()) {
        const auto& c = it["credential"];
        a.credential.params_version = c.value("params_version", 0u);
        if (!b64std_dec(c.value("salt", ""), a.credential.salt) ||
            !b64std_dec(c.value("hash", ""), a.credential.hash)) {
            a.credential = Credential{};
        }
    }

    if (it.contains("tokens") && it["tokens"].is_array()) {
        for (const auto& t : it["tokens"]) {
            if (!t.is_object()) continue;
            TokenRecord r;
            r.token_hash = lower_ascii(t.value("token_hash", ""));
            r.issued_at = t.value("issued_at", 0L);
            if (!is_token_hash(r.token_hash)) continue;
            a.tokens.push_back(r);
        }
    }
    return true;
}

JsonAccountStore::JsonAccountStore(std::string path) : path_(std::move(path)) {}

bool JsonAccountStore::load() {
    std::lock_guard<std::mutex> lk(mu_);
    by_id_.clear();
    id_by_token_.clear();

    if (path_.empty()) return true;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return true;

    std::ifstream f(path_);
    if (!f.good()) return false;

    json j;
    try {
        f >> j;
    } catch (const json::exception&) {
        return false;
    }
    if (!j.is_object() || !j.contains("accounts") || !j["accounts"].is_array()) return false;

    // A mistyped field fails the whole load, not just its record.
    try {
        for (const auto& it : j["accounts"]) {
            Account a;
            if (!account_from_json(it, a)) continue;
            by_id_[a.id] = a;
        }
    } catch (const json::exception&) {
        by_id_.clear();
        return false;
    }
    for (const auto& kv : by_id_) index_tokens_locked_(kv.second);
    return true;
}

/*
persist_locked_()
  - Full snapshot, written to a unique temp file in the target directory and
    renamed over the target (atomic replace on POSIX).
  - Caller holds mu_.
  - Throws StoreUnavailable on any I/O failure.
*/
void JsonAccountStore::persist_locked_() const {
    if (path_.empty()) return;

    std::vector<std::string> keys;
    keys.reserve(by_id_.size());
    for (const auto& kv : by_id_) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    json j;
    j["accounts"] = json::array();
    for (const auto& k : keys) j["accounts"].push_back(account_to_json(by_id_.at(k)));

    std::filesystem::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) throw StoreUnavailable("cannot create store directory: " + ec.message());
    }

    std::filesystem::path tmp = p;
    tmp += ".tmp.";
    tmp += std::to_string(::getpid());
    tmp += ".";
    tmp += std::to_string(static_cast<long long>(std::time(nullptr)));

    {
        std::ofstream out(tmp.string(), std::ios::trunc);
        if (!out.good()) throw StoreUnavailable("cannot open " + tmp.string());
        out << j.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            std::filesystem::remove(tmp, ec);
            throw StoreUnavailable("write failed: " + tmp.string());
        }
    }

    ec.clear();
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        throw StoreUnavailable("rename failed: " + ec.message());
    }
}

void JsonAccountStore::index_tokens_locked_(const Account& a) {
    for (const auto& t : a.tokens) id_by_token_[t.token_hash] = a.id;
}

void JsonAccountStore::unindex_tokens_locked_(const Account& a) {
    for (const auto& t : a.tokens) {
        auto it = id_by_token_.find(t.token_hash);
        if (it != id_by_token_.end() && it->second == a.id) id_by_token_.erase(it);
    }
}

template <class Fn>
bool JsonAccountStore::mutate_(const std::string& id, Fn fn) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;

    const Account before = it->second;
    unindex_tokens_locked_(before);
    fn(it->second);
    index_tokens_locked_(it->second);

    try {
        persist_locked_();
    } catch (const StoreUnavailable&) {
        unindex_tokens_locked_(it->second);
        it->second = before;
        index_tokens_locked_(before);
        throw;
    }
    return true;
}

std::optional<Account> JsonAccountStore::find_account(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

std::optional<Account> JsonAccountStore::find_account_by_token(const std::string& token_hash) {
    std::lock_guard<std::mutex> lk(mu_);
    auto t = id_by_token_.find(token_hash);
    if (t == id_by_token_.end()) return std::nullopt;
    auto it = by_id_.find(t->second);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

bool JsonAccountStore::create_account(const Account& account) {
    if (account.id.empty()) return false;

    std::lock_guard<std::mutex> lk(mu_);
    if (by_id_.find(account.id) != by_id_.end()) return false;

    by_id_[account.id] = account;
    index_tokens_locked_(account);
    try {
        persist_locked_();
    } catch (const StoreUnavailable&) {
        unindex_tokens_locked_(account);
        by_id_.erase(account.id);
        throw;
    }
    return true;
}

bool JsonAccountStore::save_credential(const std::string& id, const Credential& credential) {
    return mutate_(id, [&](Account& a) { a.credential = credential; });
}

bool JsonAccountStore::append_token(const std::string& id, const TokenRecord& token) {
    return mutate_(id, [&](Account& a) { a.tokens.push_back(token); });
}

bool JsonAccountStore::remove_token(const std::string& id, const std::string& token_hash) {
    return mutate_(id, [&](Account& a) {
        a.tokens.erase(std::remove_if(a.tokens.begin(), a.tokens.end(),
                                      [&](const TokenRecord& t) { return t.token_hash == token_hash; }),
                       a.tokens.end());
    });
}

bool JsonAccountStore::clear_tokens(const std::string& id) {
    return mutate_(id, [](Account& a) { a.tokens.clear(); });
}

bool JsonAccountStore::delete_account(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;

    const Account before = it->second;
    unindex_tokens_locked_(before);
    by_id_.erase(it);
    try {
        persist_locked_();
    } catch (const StoreUnavailable&) {
        by_id_[id] = before;
        index_tokens_locked_(before);
        throw;
    }
    return true;
}

bool JsonAccountStore::has_role(Role role) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : by_id_) {
        if (kv.second.role == role) return true;
    }
    return false;
}

size_t JsonAccountStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_id_.size();
}

} // namespace misato
