#include "account.h"

namespace misato {

std::string role_to_string(Role r) {
    switch (r) {
        case Role::Root:  return "root";
        case Role::Admin: return "admin";
        case Role::User:  return "user";
    }
    return "user";
}

Role role_from_string(const std::string& s) {
    auto r = parse_role(s);
    return r.has_value() ? *r : Role::User;
}

std::optional<Role> parse_role(const std::string& s) {
    if (s == "root") return Role::Root;
    if (s == "admin") return Role::Admin;
    if (s == "user") return Role::User;
    return std::nullopt;
}

bool role_satisfies(Role have, Role required) {
    return static_cast<int>(have) >= static_cast<int>(required);
}

} // namespace misato
