#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace misato {

/*
AuditEvent
==========

One security-relevant event. All fields are strings so JSONL lines stay flat
and stable.

Never put passwords, salts, hashes or bearer tokens in here. Tokens are
referenced by a short prefix of their digest at most.
*/
struct AuditEvent {
    // ISO-8601 UTC with milliseconds; stamped by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>", e.g. "auth.login_ok", "account.deleted".
    std::string event;

    // "ok" | "fail" | "deny"
    std::string outcome;

    // DEBUG=0, INFO=1, ADMIN=2, SECURITY=3.
    int level = 3;

    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL:

    line_hash_i = SHA256( line_hash_{i-1} || json_i_without_line_hash )

The last line_hash is kept in a state file so appends do not rescan the log.
Any edit, insertion, deletion or reordering breaks verify_chain() from that
line on. This is tamper evidence, not tamper prevention.
*/
class AuditLog {
public:
    AuditLog(std::string jsonl_path, std::string state_path);

    // Thread-safe. Events below the minimum level are dropped.
    void append(const AuditEvent& e);

    enum class MinLevel : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    static std::string now_iso_utc();
    static std::string sha256_hex(const std::string& s);

    // Replays the chain from genesis. Returns the number of verified lines, or
    // -1 (with *out_bad_line set, 1-based) at the first broken link.
    static long verify_chain(const std::string& jsonl_path, long* out_bad_line = nullptr);

private:
    std::atomic<int> min_level_{static_cast<int>(MinLevel::ADMIN)};
    std::string jsonl_path_;
    std::string state_path_;
    std::mutex mu_;

    std::string load_prev_hash_();
    bool store_prev_hash_(const std::string& h);

    static std::string json_str_(const std::string& s);
    static std::string build_json_(const AuditEvent& e,
                                   const std::string& prev_hash,
                                   std::string* out_content_hash_hex);
};

} // namespace misato
