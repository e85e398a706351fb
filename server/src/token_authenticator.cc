#include "token_authenticator.h"

#include "account_store.h"
#include "audit_log.h"
#include "misato_util.h"

#include <algorithm>

namespace misato {

static const std::string kTokenPrefix = "mst_";
static constexpr size_t kTokenRandomBytes = 32;

TokenAuthenticator::TokenAuthenticator(AccountStore& store, AuditLog* audit)
    : store_(store), audit_(audit) {}

bool TokenAuthenticator::is_well_formed(const std::string& token) {
    // 32 bytes -> 43 base64url chars without padding.
    if (token.size() != kTokenPrefix.size() + 43) return false;
    if (token.compare(0, kTokenPrefix.size(), kTokenPrefix) != 0) return false;
    for (size_t i = kTokenPrefix.size(); i < token.size(); ++i) {
        const char c = token[i];
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

std::string TokenAuthenticator::digest(const std::string& token) {
    return blake2b_hex(token);
}

std::string TokenAuthenticator::generate_() {
    const auto raw = random_bytes(kTokenRandomBytes);
    return kTokenPrefix + b64url_enc(raw.data(), raw.size());
}

void TokenAuthenticator::emit_(const std::string& event, const std::string& account_id,
                               const std::string& token_hash, int level) {
    if (!audit_) return;
    AuditEvent ev;
    ev.event = event;
    ev.outcome = "ok";
    ev.level = level;
    ev.f["account"] = account_id;
    if (!token_hash.empty()) ev.f["token"] = shorten(token_hash, 12);
    audit_->append(ev);
}

std::optional<std::string> TokenAuthenticator::issue(const std::string& account_id) {
    if (!store_.find_account(account_id)) return std::nullopt;

    // A digest already bound to any account is never handed out again.
    std::string token;
    std::string h;
    do {
        token = generate_();
        h = digest(token);
    } while (store_.find_account_by_token(h).has_value());

    TokenRecord rec;
    rec.token_hash = h;
    rec.issued_at = now_epoch();
    if (!store_.append_token(account_id, rec)) return std::nullopt;   // deleted meanwhile

    emit_("auth.token_issued", account_id, h, 1);
    return token;
}

std::optional<Principal> TokenAuthenticator::validate(const std::string& token, Role required_role) {
    // Lookup runs for every input, well-formed or not.
    const std::string h = digest(token);
    const auto acct = store_.find_account_by_token(h);
    if (!is_well_formed(token) || !acct) return std::nullopt;

    const bool active = std::any_of(acct->tokens.begin(), acct->tokens.end(),
                                    [&](const TokenRecord& t) { return t.token_hash == h; });
    if (!active) return std::nullopt;
    if (!role_satisfies(acct->role, required_role)) return std::nullopt;

    Principal p;
    p.account_id = acct->id;
    p.role = acct->role;
    return p;
}

void TokenAuthenticator::revoke_one(const std::string& account_id, const std::string& token) {
    const std::string h = digest(token);
    const auto owner = store_.find_account_by_token(h);
    if (!owner || owner->id != account_id) return;
    if (store_.remove_token(account_id, h)) {
        emit_("auth.token_revoked", account_id, h, 1);
    }
}

void TokenAuthenticator::revoke_all(const std::string& account_id) {
    if (store_.clear_tokens(account_id)) {
        emit_("auth.tokens_cleared", account_id, "", 2);
    }
}

bool TokenAuthenticator::on_account_deleted(const std::string& account_id) {
    if (!store_.find_account(account_id)) return false;
    revoke_all(account_id);
    const bool removed = store_.delete_account(account_id);
    if (removed) emit_("account.deleted", account_id, "", 2);
    return removed;
}

} // namespace misato
