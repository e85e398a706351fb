#include "account_service.h"

#include "account_store.h"
#include "audit_log.h"
#include "misato_util.h"
#include "token_authenticator.h"

#include <cstdint>
#include <stdexcept>

namespace misato {

static constexpr size_t kIdMin = 2;
static constexpr size_t kIdMax = 64;
static constexpr size_t kPasswordMin = 8;
static constexpr size_t kPasswordMax = 1024;

const char* auth_status_str(AuthStatus s) {
    switch (s) {
        case AuthStatus::Ok:           return "ok";
        case AuthStatus::Unauthorized: return "unauthorized";
        case AuthStatus::InvalidInput: return "invalid_input";
        case AuthStatus::Conflict:     return "conflict";
    }
    return "unauthorized";
}

bool AccountService::valid_account_id(const std::string& id) {
    if (id.size() < kIdMin || id.size() > kIdMax) return false;
    for (char c : id) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
        if (!ok) return false;
    }
    return true;
}

bool AccountService::valid_password(const std::string& password) {
    return password.size() >= kPasswordMin && password.size() <= kPasswordMax;
}

AccountService::AccountService(AccountStore& store,
                               const CredentialHasher& hasher,
                               TokenAuthenticator& tokens,
                               AuditLog* audit)
    : store_(store), hasher_(hasher), tokens_(tokens), audit_(audit) {
    const auto filler = random_bytes(32);
    const std::string pw = b64url_enc(filler.data(), filler.size());
    for (std::uint32_t v : hasher_.known_versions()) {
        dummies_.push_back(hasher_.hash_new_under(v, pw));
    }
}

void AccountService::emit_(const std::string& event, const std::string& outcome, int level,
                           const std::string& account_id, const std::string& reason) {
    if (!audit_) return;
    AuditEvent ev;
    ev.event = event;
    ev.outcome = outcome;
    ev.level = level;
    ev.f["account"] = shorten(account_id, 64);
    if (!reason.empty()) ev.f["reason"] = reason;
    audit_->append(ev);
}

IssueResult AccountService::create_(const std::string& id, const std::string& password, Role role) {
    IssueResult r;
    if (!valid_account_id(id) || !valid_password(password)) {
        r.status = AuthStatus::InvalidInput;
        return r;
    }

    Account a;
    a.id = id;
    a.role = role;
    a.credential = hasher_.hash_new(password);
    a.created_at = now_iso_utc();

    if (!store_.create_account(a)) {
        r.status = AuthStatus::Conflict;
        return r;
    }
    emit_("account.created", "ok", 2, id, role_to_string(role));

    auto token = tokens_.issue(id);
    if (!token) {
        // Deleted between create and issue.
        r.status = AuthStatus::Unauthorized;
        return r;
    }
    r.status = AuthStatus::Ok;
    r.token = *token;
    return r;
}

IssueResult AccountService::signup_user(const std::string& id, const std::string& password) {
    return create_(id, password, Role::User);
}

IssueResult AccountService::signup_privileged(const std::string& caller_token,
                                              const std::string& id,
                                              const std::string& password,
                                              Role role) {
    auto caller = tokens_.validate(caller_token, Role::Admin);
    if (!caller) {
        emit_("account.signup_denied", "deny", 3, id, "caller_not_admin");
        return IssueResult{AuthStatus::Unauthorized, ""};
    }
    if (role == Role::Root) {
        emit_("account.signup_denied", "deny", 3, id, "root_via_signup");
        return IssueResult{AuthStatus::InvalidInput, ""};
    }
    return create_(id, password, role);
}

std::optional<std::string> AccountService::login_(const std::string& id,
                                                  const std::string& password,
                                                  Role required_role) {
    const auto acct = store_.find_account(id);

    // One derivation per profile whatever the account's own profile is.
    bool pw_ok = false;
    for (const auto& d : dummies_) {
        if (acct && acct->credential.params_version == d.params_version) {
            pw_ok = hasher_.verify(acct->credential, password);
        } else {
            (void)hasher_.verify(d, password);
        }
    }
    if (!acct || !pw_ok || !role_satisfies(acct->role, required_role)) {
        emit_("auth.login_fail", "fail", 3, id);
        return std::nullopt;
    }

    if (hasher_.needs_rehash(acct->credential) &&
        !store_.save_credential(id, hasher_.hash_new(password))) {
        return std::nullopt;   // deleted meanwhile
    }

    auto token = tokens_.issue(id);
    if (token) emit_("auth.login_ok", "ok", 1, id);
    return token;
}

std::optional<std::string> AccountService::login(const std::string& id, const std::string& password) {
    return login_(id, password, Role::User);
}

std::optional<std::string> AccountService::login_root(const std::string& id, const std::string& password) {
    return login_(id, password, Role::Root);
}

std::optional<Principal> AccountService::check_token(const std::string& token, Role required_role) {
    return tokens_.validate(token, required_role);
}

AuthStatus AccountService::revoke_token(const std::string& caller_token, const std::string& token) {
    auto caller = tokens_.validate(caller_token, Role::User);
    if (!caller) return AuthStatus::Unauthorized;
    tokens_.revoke_one(caller->account_id, token);
    return AuthStatus::Ok;
}

AuthStatus AccountService::clear_tokens(const std::string& caller_token) {
    auto caller = tokens_.validate(caller_token, Role::User);
    if (!caller) return AuthStatus::Unauthorized;
    tokens_.revoke_all(caller->account_id);
    return AuthStatus::Ok;
}

AuthStatus AccountService::delete_account(const std::string& caller_token) {
    auto caller = tokens_.validate(caller_token, Role::User);
    if (!caller) return AuthStatus::Unauthorized;
    tokens_.on_account_deleted(caller->account_id);
    return AuthStatus::Ok;
}

IssueResult AccountService::change_password(const std::string& caller_token,
                                            const std::string& old_password,
                                            const std::string& new_password) {
    auto caller = tokens_.validate(caller_token, Role::User);
    if (!caller) return IssueResult{AuthStatus::Unauthorized, ""};

    const auto acct = store_.find_account(caller->account_id);
    if (!acct || !hasher_.verify(acct->credential, old_password)) {
        emit_("auth.password_change_fail", "fail", 3, caller->account_id);
        return IssueResult{AuthStatus::Unauthorized, ""};
    }
    if (!valid_password(new_password)) return IssueResult{AuthStatus::InvalidInput, ""};

    if (!store_.save_credential(acct->id, hasher_.hash_new(new_password))) {
        return IssueResult{AuthStatus::Unauthorized, ""};
    }
    tokens_.revoke_all(acct->id);
    emit_("auth.password_changed", "ok", 2, acct->id);

    auto token = tokens_.issue(acct->id);
    if (!token) return IssueResult{AuthStatus::Unauthorized, ""};
    return IssueResult{AuthStatus::Ok, *token};
}

bool AccountService::ensure_root_account(const std::string& root_id, const std::string& secret) {
    if (secret.empty()) throw std::invalid_argument("root secret is empty");
    if (!valid_account_id(root_id)) throw std::invalid_argument("invalid root account id: " + root_id);

    if (store_.has_role(Role::Root)) {
        emit_("bootstrap.root_present", "ok", 1, root_id);
        return false;
    }

    Account a;
    a.id = root_id;
    a.role = Role::Root;
    a.credential = hasher_.hash_new(secret);
    a.created_at = now_iso_utc();
    if (!store_.create_account(a)) {
        throw std::runtime_error("account id '" + root_id + "' is taken by a non-root account");
    }

    emit_("bootstrap.root_created", "ok", 2, root_id);
    return true;
}

} // namespace misato
