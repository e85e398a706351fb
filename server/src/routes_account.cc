// routes_account.cc
//
// Account HTTP routes. Transport only: every decision is made by
// AccountService, this file maps outcomes to status codes and JSON.
//
// Status mapping
//   Ok            -> 200 (201 for signup)
//   Unauthorized  -> 401 {"error":"unauthorized"}   (one body for every cause)
//   InvalidInput  -> 400
//   Conflict      -> 409
//   StoreUnavailable -> 503, HashingFailure -> 500
//
// All JSON responses are no-store.

#include "routes_account.h"

#include "account_service.h"
#include "errors.h"

#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>

using nlohmann::json;
using misato::AuthStatus;
using misato::Role;

static void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body.dump(), "application/json; charset=utf-8");
}

static void reply_unauthorized(httplib::Response& res) {
    reply_json(res, 401, json{{"error", "unauthorized"}});
}

static bool parse_json_body(const httplib::Request& req, json& out, std::string& err) {
    try {
        if (req.body.empty()) { err = "empty_body"; return false; }
        out = json::parse(req.body);
        if (!out.is_object()) { err = "json_must_be_object"; return false; }
        return true;
    } catch (const json::exception&) {
        err = "json_parse_error";
        return false;
    }
}

static std::string str_field(const json& j, const char* k) {
    if (!j.contains(k) || !j[k].is_string()) return "";
    return j[k].get<std::string>();
}

static int status_code(AuthStatus s) {
    switch (s) {
        case AuthStatus::Ok:           return 200;
        case AuthStatus::Unauthorized: return 401;
        case AuthStatus::InvalidInput: return 400;
        case AuthStatus::Conflict:     return 409;
    }
    return 401;
}

static void reply_status(httplib::Response& res, AuthStatus s) {
    if (s == AuthStatus::Unauthorized) { reply_unauthorized(res); return; }
    if (s == AuthStatus::Ok) { reply_json(res, 200, json{{"ok", true}}); return; }
    reply_json(res, status_code(s), json{{"error", misato::auth_status_str(s)}});
}

static void reply_issue(httplib::Response& res, const misato::IssueResult& r, int ok_status) {
    if (r.status != AuthStatus::Ok) { reply_status(res, r.status); return; }
    reply_json(res, ok_status, json{{"ok", true}, {"token", r.token}});
}

// Runs a handler body, turning core exceptions into transport errors.
static void guarded(const char* route, httplib::Response& res, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const misato::StoreUnavailable& e) {
        std::cerr << "[http] " << route << " store unavailable: " << e.what() << std::endl;
        reply_json(res, 503, json{{"error", "store_unavailable"}});
    } catch (const misato::HashingFailure& e) {
        std::cerr << "[http] " << route << " hashing failure: " << e.what() << std::endl;
        reply_json(res, 500, json{{"error", "internal_error"}});
    }
}

std::string bearer_token(const httplib::Request& req) {
    const std::string auth = req.get_header_value("Authorization");
    const std::string prefix = "Bearer ";
    if (auth.size() > prefix.size() && auth.compare(0, prefix.size(), prefix) == 0) {
        return auth.substr(prefix.size());
    }
    return req.get_header_value("X-Api-Key");
}

void register_routes_account(httplib::Server& srv, const RoutesAccountContext& ctx) {
    misato::AccountService* accounts = ctx.accounts;
    const std::string service = ctx.service_name;

    srv.Get("/health", [service](const httplib::Request&, httplib::Response& res) {
        reply_json(res, 200, json{{"ok", true}, {"service", service}});
    });

    // ----- public -------------------------------------------------------------

    srv.Post("/api/account/signup", [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("/api/account/signup", res, [&] {
            json body; std::string err;
            if (!parse_json_body(req, body, err)) { reply_json(res, 400, json{{"error", err}}); return; }
            auto r = accounts->signup_user(str_field(body, "username"), str_field(body, "password"));
            reply_issue(res, r, 201);
        });
    });

    auto login_handler = [accounts](bool root_only, const char* route) {
        return [accounts, root_only, route](const httplib::Request& req, httplib::Response& res) {
            guarded(route, res, [&] {
                json body; std::string err;
                if (!parse_json_body(req, body, err)) { reply_json(res, 400, json{{"error", err}}); return; }
                const std::string id = str_field(body, "username");
                const std::string pw = str_field(body, "password");
                auto token = root_only ? accounts->login_root(id, pw) : accounts->login(id, pw);
                if (!token) { reply_unauthorized(res); return; }
                reply_json(res, 200, json{{"ok", true}, {"token", *token}});
            });
        };
    };
    srv.Post("/api/account/login", login_handler(false, "/api/account/login"));
    srv.Post("/root/account/login", login_handler(true, "/root/account/login"));

    // ----- user token ---------------------------------------------------------

    auto check_token = [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("check_token", res, [&] {
            auto p = accounts->check_token(bearer_token(req), Role::User);
            if (!p) { reply_unauthorized(res); return; }
            reply_json(res, 200, json{{"ok", true},
                                      {"username", p->account_id},
                                      {"role", misato::role_to_string(p->role)}});
        });
    };
    srv.Get("/api/account/check_token", check_token);
    srv.Get("/user/account/check_token", check_token);

    auto clear_tokens = [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("clear_tokens", res, [&] {
            reply_status(res, accounts->clear_tokens(bearer_token(req)));
        });
    };
    srv.Post("/api/account/clear_tokens", clear_tokens);
    srv.Post("/user/account/clear_tokens", clear_tokens);

    auto delete_account = [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("delete", res, [&] {
            reply_status(res, accounts->delete_account(bearer_token(req)));
        });
    };
    srv.Delete("/api/account/delete", delete_account);
    srv.Delete("/user/account/delete", delete_account);

    srv.Post("/user/account/revoke_token", [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("/user/account/revoke_token", res, [&] {
            const std::string caller = bearer_token(req);
            json body; std::string err;
            if (!parse_json_body(req, body, err)) {
                // Unauthorized wins over a malformed body.
                if (!accounts->check_token(caller)) { reply_unauthorized(res); return; }
                reply_json(res, 400, json{{"error", err}});
                return;
            }
            reply_status(res, accounts->revoke_token(caller, str_field(body, "token")));
        });
    });

    srv.Post("/user/account/password", [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("/user/account/password", res, [&] {
            const std::string caller = bearer_token(req);
            json body; std::string err;
            if (!parse_json_body(req, body, err)) {
                if (!accounts->check_token(caller)) { reply_unauthorized(res); return; }
                reply_json(res, 400, json{{"error", err}});
                return;
            }
            auto r = accounts->change_password(caller,
                                               str_field(body, "old_password"),
                                               str_field(body, "new_password"));
            reply_issue(res, r, 200);
        });
    });

    // ----- admin token --------------------------------------------------------

    srv.Post("/admin/account/signup", [accounts](const httplib::Request& req, httplib::Response& res) {
        guarded("/admin/account/signup", res, [&] {
            const std::string caller = bearer_token(req);
            json body; std::string err;
            if (!parse_json_body(req, body, err)) {
                if (!accounts->check_token(caller, Role::Admin)) { reply_unauthorized(res); return; }
                reply_json(res, 400, json{{"error", err}});
                return;
            }
            const std::string role_s = body.contains("role") ? str_field(body, "role") : "admin";
            auto role = misato::parse_role(role_s);
            if (!role) {
                if (!accounts->check_token(caller, Role::Admin)) { reply_unauthorized(res); return; }
                reply_json(res, 400, json{{"error", "invalid_role"}});
                return;
            }
            auto r = accounts->signup_privileged(caller,
                                                 str_field(body, "username"),
                                                 str_field(body, "password"),
                                                 *role);
            reply_issue(res, r, 201);
        });
    });
}
