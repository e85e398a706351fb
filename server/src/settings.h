#pragma once
#include <string>

namespace misato {

struct Settings {
    std::string settings_path = "config/settings.json";

    std::string listen_host = "0.0.0.0";
    int listen_port = 8000;

    std::string accounts_path = "data/accounts.json";
    std::string audit_dir = "data/audit";
    std::string audit_min_level = "ADMIN";

    std::string root_id = "root";
    std::string root_secret;   // never logged
};

// Defaults <- JSON settings file (optional) <- MISATO_* environment.
// Returns false with a one-line reason in err on a malformed file or value,
// or a missing root secret.
bool load_settings(Settings& out, std::string& err);

// Same, with the environment lookup injected (tests).
bool load_settings_from(Settings& out, std::string& err,
                        const char* (*getenv_fn)(const char*));

} // namespace misato
