#include "misato_util.h"

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sodium.h>

namespace misato {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

// libsodium writes a trailing NUL into the output buffer; trim to C-string length.
static std::string b64_enc_variant(const unsigned char* data, size_t len, int variant) {
    const size_t outLen = sodium_base64_encoded_len(len, variant);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, variant);
    out.resize(std::strlen(out.c_str()));
    return out;
}

static bool b64_dec_variant(const std::string& s, std::vector<unsigned char>& out, int variant) {
    // Decoded length is <= encoded length.
    out.resize(s.size() + 1);
    size_t out_len = 0;
    if (sodium_base642bin(out.data(), out.size(),
                          s.c_str(), s.size(),
                          nullptr, &out_len, nullptr,
                          variant) != 0) {
        out.clear();
        return false;
    }
    out.resize(out_len);
    return true;
}

std::string b64url_enc(const unsigned char* data, size_t len) {
    return b64_enc_variant(data, len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

bool b64url_dec(const std::string& s, std::vector<unsigned char>& out) {
    return b64_dec_variant(s, out, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::string b64std_enc(const std::vector<unsigned char>& data) {
    return b64_enc_variant(data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
}

bool b64std_dec(const std::string& s, std::vector<unsigned char>& out) {
    return b64_dec_variant(s, out, sodium_base64_VARIANT_ORIGINAL);
}

std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

std::vector<unsigned char> random_bytes(size_t n) {
    std::vector<unsigned char> out(n);
    if (n > 0) randombytes_buf(out.data(), out.size());
    return out;
}

std::string blake2b_hex(const std::string& s) {
    unsigned char h[crypto_generichash_BYTES];   // 32
    crypto_generichash(h, sizeof(h),
                       reinterpret_cast<const unsigned char*>(s.data()), s.size(),
                       nullptr, 0);
    return to_hex(h, sizeof(h));
}

std::string shorten(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    return s.substr(0, n);
}

} // namespace misato
