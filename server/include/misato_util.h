#pragma once
#include <string>
#include <vector>

namespace misato {

    long now_epoch();
    std::string now_iso_utc();
    std::string lower_ascii(std::string s);

    // URL-safe base64 without padding (tokens, header-safe values).
    std::string b64url_enc(const unsigned char* data, size_t len);
    bool b64url_dec(const std::string& s, std::vector<unsigned char>& out);

    // Standard base64 with padding (persisted salts/hashes).
    std::string b64std_enc(const std::vector<unsigned char>& data);
    bool b64std_dec(const std::string& s, std::vector<unsigned char>& out);

    std::string to_hex(const unsigned char* p, size_t n);

    // CSPRNG bytes (libsodium randombytes_buf). sodium_init() must have run.
    std::vector<unsigned char> random_bytes(size_t n);

    // Lowercase hex BLAKE2b-256 of s. Used to index tokens without storing them.
    std::string blake2b_hex(const std::string& s);

    // First n chars of s, for log fields that must not carry a full secret digest.
    std::string shorten(const std::string& s, size_t n);

} // namespace misato
