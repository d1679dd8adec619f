#include "session_cookie.h"
#include "cdnd_util.h"

#include <sodium.h>

/*
 * session_cookie.cc
 *
 * cdnd session token (value of the "session" cookie):
 *
 *   token := hex(nonce16) "." trunc(hex(hmac_sha256(nonce_hex, secret32)), sig_hex_len)
 *
 * Security properties:
 * - Integrity/authenticity: HMAC-SHA256 keyed by a per-process secret.
 * - Forgery requires the in-memory secret or guessing the truncated
 *   signature (64 bits at the default 16 hex chars).
 *
 * Notes:
 * - The token carries no identity: there is a single operator account.
 * - The MAC input is the nonce *hex text*, exactly as it appears in the token.
 */

namespace cdnd {

static size_t clamp_sig_len(size_t n) {
    const size_t full = crypto_auth_hmacsha256_BYTES * 2;
    if (n < SessionAuthenticator::kDefaultSigHexLen) return SessionAuthenticator::kDefaultSigHexLen;
    if (n > full) return full;
    return n;
}

SessionAuthenticator::SessionAuthenticator(size_t sig_hex_len)
    : sig_hex_len_(clamp_sig_len(sig_hex_len)) {
    randombytes_buf(key_.data(), key_.size());
}

SessionAuthenticator::SessionAuthenticator(const std::array<unsigned char, kKeyBytes>& key,
                                           size_t sig_hex_len)
    : key_(key), sig_hex_len_(clamp_sig_len(sig_hex_len)) {}

SessionAuthenticator::~SessionAuthenticator() {
    sodium_memzero(key_.data(), key_.size());
}

std::string SessionAuthenticator::sign_(const std::string& nonce_hex) const {
    return hmac_sha256_hex(key_.data(), key_.size(), nonce_hex).substr(0, sig_hex_len_);
}

// -----------------------------------------------------------------------------
// Mint
// -----------------------------------------------------------------------------

std::string SessionAuthenticator::issue_token() const {
    unsigned char nonce[kNonceBytes];
    randombytes_buf(nonce, sizeof(nonce));
    const std::string nonce_hex = hex_encode(nonce, sizeof(nonce));
    return nonce_hex + "." + sign_(nonce_hex);
}

// -----------------------------------------------------------------------------
// Verify
// -----------------------------------------------------------------------------

bool SessionAuthenticator::verify_token(const std::string& token) const {
    if (token.empty()) return false;

    // Exactly two parts: "<nonce>.<sig>"
    const auto dot = token.find('.');
    if (dot == std::string::npos) return false;
    if (token.find('.', dot + 1) != std::string::npos) return false;

    const std::string nonce_hex = token.substr(0, dot);
    const std::string sig = token.substr(dot + 1);
    if (nonce_hex.empty() || sig.empty()) return false;

    // Constant-time compare to avoid timing attacks on MAC verification
    return ct_equal(sign_(nonce_hex), sig);
}

std::string SessionAuthenticator::cookie_header(const std::string& token) {
    return std::string(kSessionCookieName) + "=" + token
        + "; Path=/"
        + "; Max-Age=" + std::to_string(kSessionCookieMaxAge)
        + "; HttpOnly; Secure; SameSite=None";
}

bool credential_matches(const std::string& expected_hash,
                        const std::string& submitted_hash) {
    if (expected_hash.empty()) return false;
    return ct_equal(expected_hash, submitted_hash);
}

} // namespace cdnd
