#include "audit_log.h"

#include "misato_util.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include <openssl/sha.h>

namespace misato {

/*
Audit log (hash-chained JSONL)
==============================

Line format (fields always in this order):

  {"ts":"...","event":"...","outcome":"...","prev_hash":"<64hex>","line_hash":"<64hex>","f":{...}}

The hash preimage is prev_hash followed by the same line with the
,"line_hash":"..." member removed. verify_chain() strips that member back out
to recompute it, so build_json_ and verify_chain must agree byte for byte.

Genesis prev_hash is 64 zeros. A missing or corrupt state file restarts the
chain from genesis.
*/

static const std::string kGenesis(64, '0');
static const std::string kLineHashKey = ",\"line_hash\":\"";
static const std::string kPrevHashKey = "\"prev_hash\":\"";

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
  : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

std::string AuditLog::now_iso_utc() {
  return misato::now_iso_utc();
}

std::string AuditLog::sha256_hex(const std::string& s) {
  unsigned char h[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
  return to_hex(h, sizeof(h));
}

bool AuditLog::set_min_level_str(const std::string& s) {
  if (s == "DEBUG")    { min_level_ = static_cast<int>(MinLevel::DEBUG);    return true; }
  if (s == "INFO")     { min_level_ = static_cast<int>(MinLevel::INFO);     return true; }
  if (s == "ADMIN")    { min_level_ = static_cast<int>(MinLevel::ADMIN);    return true; }
  if (s == "SECURITY") { min_level_ = static_cast<int>(MinLevel::SECURITY); return true; }
  return false;
}

std::string AuditLog::min_level_str() const {
  switch (static_cast<MinLevel>(min_level_.load())) {
    case MinLevel::DEBUG:    return "DEBUG";
    case MinLevel::INFO:     return "INFO";
    case MinLevel::ADMIN:    return "ADMIN";
    case MinLevel::SECURITY: return "SECURITY";
  }
  return "ADMIN";
}

// Chain head from the state file. Anything other than 64 lowercase hex chars
// restarts from genesis.
std::string AuditLog::load_prev_hash_() {
  std::ifstream f(state_path_);
  std::string head;
  if (!(f >> head) || head.size() != 64) return kGenesis;
  const bool hex = std::all_of(head.begin(), head.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
  return hex ? head : kGenesis;
}

// tmp + rename: the state file only ever holds a complete head.
bool AuditLog::store_prev_hash_(const std::string& h) {
  const std::string tmp = state_path_ + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    f << h << "\n";
    f.flush();
    if (!f.good()) return false;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, state_path_, ec);
  return !ec;
}

// Quoted JSON string. Invalid UTF-8 is replaced rather than thrown on.
std::string AuditLog::json_str_(const std::string& s) {
  return nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string AuditLog::build_json_(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  std::string* out_content_hash_hex) {
  std::ostringstream head;
  head << "{"
       << "\"ts\":" << json_str_(e.ts_utc)
       << ",\"event\":" << json_str_(e.event)
       << ",\"outcome\":" << json_str_(e.outcome)
       << ",\"prev_hash\":\"" << prev_hash << "\"";

  std::ostringstream tail;
  if (!e.f.empty()) {
    tail << ",\"f\":{";
    bool first = true;
    for (const auto& kv : e.f) {
      if (!first) tail << ",";
      first = false;
      tail << json_str_(kv.first) << ":" << json_str_(kv.second);
    }
    tail << "}";
  }
  tail << "}";

  *out_content_hash_hex = sha256_hex(prev_hash + head.str() + tail.str());
  return head.str() + kLineHashKey + *out_content_hash_hex + "\"" + tail.str();
}

void AuditLog::append(const AuditEvent& e_in) {
  if (e_in.level < min_level_.load()) return;

  std::lock_guard<std::mutex> lk(mu_);

  AuditEvent e = e_in;
  if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

  const std::string prev = load_prev_hash_();

  std::string content_hash;
  const std::string line = build_json_(e, prev, &content_hash);

  std::ofstream out(jsonl_path_, std::ios::app);
  out << line << "\n";
  out.flush();
  if (!out.good()) return;   // chain head stays on the last line that made it to disk

  if (!store_prev_hash_(content_hash)) {
    std::cerr << "[audit] WARNING: cannot update chain head " << state_path_ << std::endl;
  }
}

long AuditLog::verify_chain(const std::string& jsonl_path, long* out_bad_line) {
  std::ifstream in(jsonl_path);
  if (!in.good()) return 0;

  std::string prev = kGenesis;
  std::string line;
  long n = 0;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    ++n;

    auto fail = [&]() -> long {
      if (out_bad_line) *out_bad_line = n;
      return -1;
    };

    const auto lh = line.find(kLineHashKey);
    if (lh == std::string::npos || lh + kLineHashKey.size() + 65 > line.size()) return fail();
    const std::string line_hash = line.substr(lh + kLineHashKey.size(), 64);
    std::string stripped = line;
    stripped.erase(lh, kLineHashKey.size() + 65);

    const auto ph = line.find(kPrevHashKey);
    if (ph == std::string::npos || ph + kPrevHashKey.size() + 64 > line.size()) return fail();
    if (line.compare(ph + kPrevHashKey.size(), 64, prev) != 0) return fail();

    if (sha256_hex(prev + stripped) != line_hash) return fail();
    prev = line_hash;
  }
  return n;
}

} // namespace misato
