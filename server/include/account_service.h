#pragma once
#include <optional>
#include <string>
#include <vector>

#include "account.h"
#include "credential_hasher.h"

namespace misato {

class AccountStore;
class AuditLog;
class TokenAuthenticator;

enum class AuthStatus {
    Ok,
    Unauthorized,   // bad/unknown token, wrong password, unknown account, insufficient role
    InvalidInput,   // malformed id/password or disallowed role
    Conflict,       // account id already taken
};

const char* auth_status_str(AuthStatus s);

// Outcome of operations that hand back a fresh token on success.
struct IssueResult {
    AuthStatus status = AuthStatus::Unauthorized;
    std::string token;
};

/*
AccountService
==============

The operations route handlers call. Each one is a short composition of the
credential hasher, the token authenticator and the store; none of them keeps
state between calls.

Anti-enumeration
----------------
login() and login_root() return the same empty result for an unknown account,
a wrong password and (for login_root) a non-root account. Every login runs
one derivation per registered hash profile: the stored credential under its
own profile, a dummy under each of the others. An account still on a legacy
profile therefore costs the same as an unknown id. Token-gated operations return
Unauthorized for every kind of token failure.

Errors
------
StoreUnavailable and HashingFailure propagate; everything else is a status.
*/
class AccountService {
public:
    // Builds one dummy credential per registered hash profile.
    AccountService(AccountStore& store,
                   const CredentialHasher& hasher,
                   TokenAuthenticator& tokens,
                   AuditLog* audit = nullptr);

    // Public signup, always role user.
    IssueResult signup_user(const std::string& id, const std::string& password);

    // Signup gated by an admin-or-root caller token. role must be user or admin.
    // The caller token is checked before anything in the payload.
    IssueResult signup_privileged(const std::string& caller_token,
                                  const std::string& id,
                                  const std::string& password,
                                  Role role);

    std::optional<std::string> login(const std::string& id, const std::string& password);
    std::optional<std::string> login_root(const std::string& id, const std::string& password);

    std::optional<Principal> check_token(const std::string& token, Role required_role = Role::User);

    // Revokes one of the caller's own tokens (may be the caller token itself).
    AuthStatus revoke_token(const std::string& caller_token, const std::string& token);
    AuthStatus clear_tokens(const std::string& caller_token);
    AuthStatus delete_account(const std::string& caller_token);

    // New credential, every existing token revoked, fresh token returned.
    IssueResult change_password(const std::string& caller_token,
                                const std::string& old_password,
                                const std::string& new_password);

    // Creates root_id as a root account from secret unless some root account
    // already exists. Returns true when it created one.
    // Throws std::invalid_argument on an empty secret or invalid id, and
    // std::runtime_error when root_id is already taken by a non-root account.
    bool ensure_root_account(const std::string& root_id, const std::string& secret);

    static bool valid_account_id(const std::string& id);
    static bool valid_password(const std::string& password);

private:
    AccountStore& store_;
    const CredentialHasher& hasher_;
    TokenAuthenticator& tokens_;
    AuditLog* audit_;
    std::vector<Credential> dummies_;

    IssueResult create_(const std::string& id, const std::string& password, Role role);
    std::optional<std::string> login_(const std::string& id, const std::string& password,
                                      Role required_role);
    void emit_(const std::string& event, const std::string& outcome, int level,
               const std::string& account_id, const std::string& reason = "");
};

} // namespace misato
