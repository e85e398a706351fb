// tests/http/test_routes_account.cpp
//
// Account routes over loopback HTTP:
// signup -> login -> check_token -> clear_tokens -> check_token (401),
// admin signup with a user token (401, same body), malformed bodies (400),
// duplicate signup (409), and the root-only login route.

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <sodium.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "account_service.h"
#include "credential_hasher.h"
#include "json_account_store.h"
#include "routes_account.h"
#include "token_authenticator.h"

using nlohmann::json;

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        ++g_failures;
    }
}

static misato::HashParamSet fast_set() {
    misato::HashParams p;
    p.version  = 10;
    p.alg      = crypto_pwhash_ALG_ARGON2ID13;
    p.opslimit = crypto_pwhash_OPSLIMIT_MIN;
    p.memlimit = crypto_pwhash_MEMLIMIT_MIN;
    p.salt_len = 256;
    p.hash_len = 32;
    misato::HashParamSet s;
    s.known.push_back(p);
    s.current = 10;
    return s;
}

static httplib::Headers bearer(const std::string& t) {
    return httplib::Headers{{"Authorization", "Bearer " + t}};
}

static std::string creds(const std::string& id, const std::string& pw) {
    return json{{"username", id}, {"password", pw}}.dump();
}

static std::string token_of(const httplib::Result& r) {
    if (!r) return "";
    auto j = json::parse(r->body, nullptr, false);
    if (!j.is_object() || !j.contains("token") || !j["token"].is_string()) return "";
    return j["token"].get<std::string>();
}

static bool is_unauthorized(const httplib::Result& r) {
    return r && r->status == 401 && r->body == R"({"error":"unauthorized"})";
}

static void run_checks(httplib::Client& cli) {
    auto health = cli.Get("/health");
    expect(health && health->status == 200, "health is 200");

    auto su = cli.Post("/api/account/signup", creds("u1", "anypassword"), "application/json");
    expect(su && su->status == 201, "signup is 201");
    expect(!token_of(su).empty(), "signup returns a token");

    auto dup = cli.Post("/api/account/signup", creds("u1", "anypassword"), "application/json");
    expect(dup && dup->status == 409, "duplicate signup is 409");

    auto weak = cli.Post("/api/account/signup", creds("u2", "short"), "application/json");
    expect(weak && weak->status == 400, "weak password is 400");

    auto junk = cli.Post("/api/account/signup", "{not json", "application/json");
    expect(junk && junk->status == 400, "malformed body is 400");

    auto li = cli.Post("/api/account/login", creds("u1", "anypassword"), "application/json");
    expect(li && li->status == 200, "login is 200");
    const std::string t = token_of(li);
    expect(!t.empty(), "login returns a token");

    auto bad = cli.Post("/api/account/login", creds("u1", "wrongpassword"), "application/json");
    auto ghost = cli.Post("/api/account/login", creds("ghost", "anypassword"), "application/json");
    expect(is_unauthorized(bad), "wrong password is 401");
    expect(is_unauthorized(ghost), "unknown account is 401");
    expect(bad && ghost && bad->body == ghost->body, "both login failures share one body");

    auto ct = cli.Get("/user/account/check_token", bearer(t));
    expect(ct && ct->status == 200, "check_token is 200");
    if (ct) {
        auto j = json::parse(ct->body, nullptr, false);
        expect(j.is_object() && j.value("username", "") == "u1", "check_token names u1");
    }

    auto via_key = cli.Get("/api/account/check_token", httplib::Headers{{"X-Api-Key", t}});
    expect(via_key && via_key->status == 200, "X-Api-Key header accepted");

    expect(is_unauthorized(cli.Get("/user/account/check_token")), "no token is 401");

    auto adm = cli.Post("/admin/account/signup", bearer(t),
                        creds("adm1", "anypassword"), "application/json");
    expect(is_unauthorized(adm), "user token on admin signup is 401");
    auto adm_junk = cli.Post("/admin/account/signup", bearer(t), "{oops", "application/json");
    expect(is_unauthorized(adm_junk), "user token with malformed body is still 401");

    auto root_as_user = cli.Post("/root/account/login", creds("u1", "anypassword"), "application/json");
    expect(is_unauthorized(root_as_user), "user on root login is 401");

    auto root = cli.Post("/root/account/login", creds("root", "operator-secret"), "application/json");
    expect(root && root->status == 200, "root login is 200");
    const std::string rt = token_of(root);

    auto adm_ok = cli.Post("/admin/account/signup", bearer(rt),
                           creds("adm1", "anypassword"), "application/json");
    expect(adm_ok && adm_ok->status == 201, "root creates admin");

    auto mk_root = cli.Post("/admin/account/signup", bearer(rt),
                            json{{"username", "r2"}, {"password", "anypassword"}, {"role", "root"}}.dump(),
                            "application/json");
    expect(mk_root && mk_root->status == 400, "role root via signup is 400");

    auto clr = cli.Post("/user/account/clear_tokens", bearer(t), "", "application/json");
    expect(clr && clr->status == 200, "clear_tokens is 200");
    expect(is_unauthorized(cli.Get("/user/account/check_token", bearer(t))), "cleared token is 401");

    auto del_tok = token_of(cli.Post("/api/account/login", creds("u1", "anypassword"), "application/json"));
    auto del = cli.Delete("/user/account/delete", bearer(del_tok));
    expect(del && del->status == 200, "delete is 200");
    expect(is_unauthorized(cli.Post("/api/account/login", creds("u1", "anypassword"), "application/json")),
           "deleted account cannot log in");

    auto cc = cli.Get("/health");
    expect(cc && cc->get_header_value("Cache-Control") == "no-store", "responses are no-store");
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    misato::JsonAccountStore store("");
    misato::CredentialHasher hasher(fast_set());
    misato::TokenAuthenticator tokens(store);
    misato::AccountService accounts(store, hasher, tokens);
    accounts.ensure_root_account("root", "operator-secret");

    httplib::Server srv;
    RoutesAccountContext ctx;
    ctx.accounts = &accounts;
    register_routes_account(srv, ctx);

    const int port = srv.bind_to_any_port("127.0.0.1");
    if (port <= 0) {
        std::cerr << "bind failed\n";
        return 2;
    }
    std::thread th([&] { srv.listen_after_bind(); });
    for (int i = 0; i < 200 && !srv.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    httplib::Client cli("127.0.0.1", port);
    run_checks(cli);

    srv.stop();
    th.join();

    if (g_failures != 0) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: account route tests passed\n";
    return 0;
}
