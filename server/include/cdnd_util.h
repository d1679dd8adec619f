#pragma once
#include <cstddef>
#include <string>

namespace cdnd {

    std::string now_iso_utc();
    std::string lower_ascii(std::string s);
    std::string trim_ws(std::string s);

    // Lowercase hex of arbitrary bytes (libsodium bin2hex).
    std::string hex_encode(const unsigned char* data, size_t len);

    // HMAC-SHA256(key, msg) as lowercase hex. Key may be any length.
    std::string hmac_sha256_hex(const unsigned char* key, size_t key_len,
                                const std::string& msg);

    // Constant-time equality for secret-derived strings.
    // Lengths are compared first (length is not secret here); contents are
    // compared with sodium_memcmp.
    bool ct_equal(const std::string& a, const std::string& b);

    // SHA-256 as lowercase hex (OpenSSL). Integrity/tooling only.
    std::string sha256_hex(const std::string& s);

    // Directory containing the running executable (/proc/self/exe).
    std::string exe_dir();

    bool read_file_to_string(const std::string& path, std::string& out);

} // namespace cdnd
