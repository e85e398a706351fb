#include "settings.h"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace misato {

static bool parse_port(const std::string& s, int& out) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    const int v = std::atoi(s.c_str());
    if (v < 1 || v > 65535) return false;
    out = v;
    return true;
}

static bool valid_level(const std::string& s) {
    return s == "DEBUG" || s == "INFO" || s == "ADMIN" || s == "SECURITY";
}

static const char* system_getenv(const char* name) {
    return std::getenv(name);
}

bool load_settings(Settings& out, std::string& err) {
    return load_settings_from(out, err, &system_getenv);
}

bool load_settings_from(Settings& out, std::string& err,
                        const char* (*getenv_fn)(const char*)) {
    Settings s;
    if (const char* p = getenv_fn("MISATO_SETTINGS_PATH")) s.settings_path = p;

    // ---- file layer (missing file is fine) ----
    std::error_code ec;
    if (std::filesystem::exists(s.settings_path, ec)) {
        std::ifstream f(s.settings_path);
        if (!f.good()) { err = "cannot read " + s.settings_path; return false; }
        json j;
        try {
            f >> j;
        } catch (const json::exception& e) {
            err = "malformed " + s.settings_path + ": " + e.what();
            return false;
        }
        if (!j.is_object()) { err = s.settings_path + " must be a JSON object"; return false; }

        try {
            s.listen_host     = j.value("listen_host", s.listen_host);
            s.listen_port     = j.value("listen_port", s.listen_port);
            s.accounts_path   = j.value("accounts_path", s.accounts_path);
            s.audit_dir       = j.value("audit_dir", s.audit_dir);
            s.audit_min_level = j.value("audit_min_level", s.audit_min_level);
            s.root_id         = j.value("root_id", s.root_id);
            s.root_secret     = j.value("root_secret", s.root_secret);
        } catch (const json::exception& e) {
            err = "bad value in " + s.settings_path + ": " + e.what();
            return false;
        }
        if (s.listen_port < 1 || s.listen_port > 65535) {
            err = "listen_port out of range in " + s.settings_path;
            return false;
        }
    }

    // ---- env layer ----
    if (const char* v = getenv_fn("MISATO_LISTEN_HOST")) s.listen_host = v;
    if (const char* v = getenv_fn("MISATO_LISTEN_PORT")) {
        if (!parse_port(v, s.listen_port)) { err = std::string("invalid MISATO_LISTEN_PORT: ") + v; return false; }
    }
    if (const char* v = getenv_fn("MISATO_ACCOUNTS_PATH")) s.accounts_path = v;
    if (const char* v = getenv_fn("MISATO_AUDIT_DIR")) s.audit_dir = v;
    if (const char* v = getenv_fn("MISATO_AUDIT_MIN_LEVEL")) s.audit_min_level = v;
    if (const char* v = getenv_fn("MISATO_ROOT_ID")) s.root_id = v;
    if (const char* v = getenv_fn("MISATO_ROOT_SECRET")) s.root_secret = v;

    if (!valid_level(s.audit_min_level)) {
        err = "invalid audit_min_level: " + s.audit_min_level;
        return false;
    }
    if (s.root_secret.empty()) {
        err = "root secret missing (set MISATO_ROOT_SECRET or root_secret)";
        return false;
    }

    out = s;
    return true;
}

} // namespace misato
