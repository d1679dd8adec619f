#pragma once
#include <array>
#include <cstddef>
#include <string>

namespace cdnd {

// Cookie attributes are fixed: browsers load media cross-site from the CDN
// origin, so SameSite=None requires Secure.
constexpr const char* kSessionCookieName = "session";
constexpr long kSessionCookieMaxAge = 31536000; // 365 days, advisory only

/*
SessionAuthenticator
====================

Owns the per-process session secret and mints/verifies session tokens.

Token format:

  token := nonce_hex "." sig_hex
  nonce_hex := hex(16 random bytes)
  sig_hex   := first sig_hex_len chars of hex(HMAC-SHA256(secret, nonce_hex))

Lifetime:
- The secret is generated in the constructor and never leaves the instance.
- A restart (new instance) invalidates every token minted before it.
- Tokens carry no expiry. The cookie Max-Age is the only lifetime hint.

Thread safety:
- The secret is read-only after construction, so issue_token() and
  verify_token() may be called concurrently without locking.

Hard requirement:
- sodium_init() must have succeeded before constructing an instance.
*/
class SessionAuthenticator {
public:
    static constexpr size_t kKeyBytes = 32;
    static constexpr size_t kNonceBytes = 16;
    static constexpr size_t kDefaultSigHexLen = 16;

    // Fresh random secret.
    explicit SessionAuthenticator(size_t sig_hex_len = kDefaultSigHexLen);

    // Caller-supplied secret (tests, deterministic tooling).
    SessionAuthenticator(const std::array<unsigned char, kKeyBytes>& key,
                         size_t sig_hex_len = kDefaultSigHexLen);

    ~SessionAuthenticator();

    SessionAuthenticator(const SessionAuthenticator&) = delete;
    SessionAuthenticator& operator=(const SessionAuthenticator&) = delete;

    // Mint a new token. Performs no authorization: the caller must have
    // checked the submitted credential already.
    std::string issue_token() const;

    // Fail-closed verification. Never throws.
    bool verify_token(const std::string& token) const;

    // Full Set-Cookie header value carrying `token`.
    static std::string cookie_header(const std::string& token);

    size_t sig_hex_len() const { return sig_hex_len_; }

private:
    std::string sign_(const std::string& nonce_hex) const;

    std::array<unsigned char, kKeyBytes> key_{};
    size_t sig_hex_len_;
};

// Constant-time check of a submitted credential hash against the configured
// one. An empty expected value never matches.
bool credential_matches(const std::string& expected_hash,
                        const std::string& submitted_hash);

} // namespace cdnd
