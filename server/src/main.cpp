#include <httplib.h>
#include <sodium.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "account_service.h"
#include "audit_log.h"
#include "credential_hasher.h"
#include "errors.h"
#include "json_account_store.h"
#include "routes_account.h"
#include "settings.h"
#include "token_authenticator.h"

// -----------------------------------------------------------------------------
// main
// -----------------------------------------------------------------------------
int main()
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    misato::Settings settings;
    std::string err;
    if (!misato::load_settings(settings, err)) {
        std::cerr << "[settings] FATAL: " << err << std::endl;
        return 2;
    }
    std::cerr << "[settings] accounts=" << settings.accounts_path
              << " audit_dir=" << settings.audit_dir
              << " listen=" << settings.listen_host << ":" << settings.listen_port << std::endl;

    // ---- Audit log (hash-chained JSONL) ----
    try {
        std::filesystem::create_directories(settings.audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }
    misato::AuditLog audit(settings.audit_dir + "/misato_audit.jsonl",
                           settings.audit_dir + "/misato_audit.state");
    audit.set_min_level_str(settings.audit_min_level);   // validated by load_settings
    std::cerr << "[audit] min_level=" << audit.min_level_str() << std::endl;

    // ---- Account store ----
    misato::JsonAccountStore store(settings.accounts_path);
    if (!store.load()) {
        std::cerr << "[store] FATAL: failed to load accounts: " << settings.accounts_path << std::endl;
        return 3;
    }
    std::cerr << "[store] loaded " << store.size() << " accounts" << std::endl;

    misato::CredentialHasher hasher;
    misato::TokenAuthenticator tokens(store, &audit);
    misato::AccountService accounts(store, hasher, tokens, &audit);

    // ---- Root bootstrap (no-op once a root account exists) ----
    try {
        if (accounts.ensure_root_account(settings.root_id, settings.root_secret)) {
            std::cerr << "[bootstrap] created root account '" << settings.root_id << "'" << std::endl;
        } else {
            std::cerr << "[bootstrap] root account present" << std::endl;
        }
    } catch (const misato::StoreUnavailable& e) {
        std::cerr << "[bootstrap] FATAL: store unavailable: " << e.what() << std::endl;
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[bootstrap] FATAL: " << e.what() << std::endl;
        return 4;
    }

    httplib::Server srv;

    RoutesAccountContext ctx;
    ctx.accounts = &accounts;
    register_routes_account(srv, ctx);

    srv.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });

    std::cerr << "misato listening on " << settings.listen_host << ":" << settings.listen_port << std::endl;
    if (!srv.listen(settings.listen_host, settings.listen_port)) {
        std::cerr << "[http] FATAL: cannot listen on "
                  << settings.listen_host << ":" << settings.listen_port << std::endl;
        return 5;
    }
    return 0;
}
