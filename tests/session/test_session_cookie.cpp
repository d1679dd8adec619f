// tests/session/test_session_cookie.cpp
//
// Regression test: session token minting + verification + cookie parsing.
//
// What it tests:
// 1) verify_token(issue_token()) holds for many fresh tokens
// 2) empty / dot-less / extra-dot / empty-part tokens are rejected
// 3) a one-character change in the signature (or nonce) is rejected
// 4) a token from another authenticator instance (other secret) is rejected
// 5) deterministic key -> deterministic signature, full-length option works
// 6) require_session() on a fake httplib::Request with/without the cookie
//
// Build target links cdnd_core.

#include <sodium.h>

#include <array>
#include <iostream>
#include <set>
#include <string>

#include "httplib.h"
#include "authz.h"
#include "cdnd_util.h"
#include "session_cookie.h"

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

static std::string flip_hex_char(std::string s, size_t pos) {
    s[pos] = (s[pos] == '0') ? '1' : '0';
    return s;
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    const cdnd::SessionAuthenticator auth;

    // ---- 1) round trip ------------------------------------------------------
    std::set<std::string> seen;
    for (int i = 0; i < 200; i++) {
        const std::string t = auth.issue_token();
        expect(auth.verify_token(t), "fresh token must verify: " + t);
        expect(seen.insert(t).second, "tokens must not repeat");

        const auto dot = t.find('.');
        expect(dot == 32, "nonce must be 32 hex chars");
        expect(t.size() - dot - 1 == 16, "signature must be 16 hex chars");
    }

    // ---- 2) malformed -------------------------------------------------------
    const std::string good = auth.issue_token();
    const auto dot = good.find('.');
    const std::string nonce = good.substr(0, dot);
    const std::string sig = good.substr(dot + 1);

    expect(!auth.verify_token(""), "empty token must fail");
    expect(!auth.verify_token(nonce + sig), "token without '.' must fail");
    expect(!auth.verify_token("."), "lone '.' must fail");
    expect(!auth.verify_token(nonce + "."), "empty signature must fail");
    expect(!auth.verify_token("." + sig), "empty nonce must fail");
    expect(!auth.verify_token(good + ".x"), "three parts must fail");
    expect(!auth.verify_token("a." + good), "leading extra part must fail");
    expect(!auth.verify_token(nonce + "." + sig.substr(0, 15)), "short signature must fail");
    expect(!auth.verify_token(good + "0"), "long signature must fail");

    // ---- 3) tampering -------------------------------------------------------
    for (size_t i = 0; i < sig.size(); i++) {
        expect(!auth.verify_token(nonce + "." + flip_hex_char(sig, i)),
               "flipped signature char " + std::to_string(i) + " must fail");
    }
    expect(!auth.verify_token(flip_hex_char(nonce, 0) + "." + sig), "altered nonce must fail");

    // ---- 4) other process / restarted process --------------------------------
    {
        const cdnd::SessionAuthenticator other;
        expect(!other.verify_token(good), "token from another secret must fail");
        expect(!auth.verify_token(other.issue_token()), "foreign token must fail");
    }

    // ---- 5) deterministic key ------------------------------------------------
    std::array<unsigned char, cdnd::SessionAuthenticator::kKeyBytes> key{};
    for (size_t i = 0; i < key.size(); i++) key[i] = (unsigned char)i;

    const cdnd::SessionAuthenticator a1(key);
    const cdnd::SessionAuthenticator a2(key);
    const std::string t1 = a1.issue_token();
    expect(a2.verify_token(t1), "same key must verify across instances");

    const std::string n1 = t1.substr(0, t1.find('.'));
    const std::string expected_sig =
        cdnd::hmac_sha256_hex(key.data(), key.size(), n1).substr(0, 16);
    expect(t1 == n1 + "." + expected_sig, "signature must be truncated HMAC-SHA256 of the nonce hex");

    const cdnd::SessionAuthenticator full(key, 64);
    const std::string tf = full.issue_token();
    expect(tf.size() - tf.find('.') - 1 == 64, "full-length signature must be 64 hex chars");
    expect(full.verify_token(tf), "full-length token must verify");
    expect(!a1.verify_token(tf), "length mismatch must fail");

    // ---- cookie header -------------------------------------------------------
    const std::string hdr = cdnd::SessionAuthenticator::cookie_header(good);
    expect(hdr.rfind("session=" + good + ";", 0) == 0, "cookie must start with session=<token>");
    expect(hdr.find("Path=/") != std::string::npos, "cookie Path=/");
    expect(hdr.find("HttpOnly") != std::string::npos, "cookie HttpOnly");
    expect(hdr.find("Secure") != std::string::npos, "cookie Secure");
    expect(hdr.find("SameSite=None") != std::string::npos, "cookie SameSite=None");
    expect(hdr.find("Max-Age=31536000") != std::string::npos, "cookie Max-Age one year");

    // ---- credential compare --------------------------------------------------
    expect(cdnd::credential_matches("abc123", "abc123"), "equal hashes match");
    expect(!cdnd::credential_matches("abc123", "abc124"), "different hashes");
    expect(!cdnd::credential_matches("abc123", "abc12"), "prefix must not match");
    expect(!cdnd::credential_matches("", ""), "empty expected never matches");

    // ---- 6) gate on a fake request -------------------------------------------
    {
        httplib::Request req;
        httplib::Response res;
        req.path = "/music/";
        req.headers.emplace("Cookie", "theme=dark; session=" + good + "; lang=en");
        expect(cdnd::require_session(req, res, auth, "/nonexistent/login.html"),
               "valid session cookie must pass the gate");
    }
    {
        httplib::Request req;
        httplib::Response res;
        req.path = "/music/";
        req.headers.emplace("Cookie", "xsession=" + good);
        expect(!cdnd::require_session(req, res, auth, "/nonexistent/login.html"),
               "cookie name must match exactly");
        expect(res.status == 401, "missing session on non-root path is 401");
        expect(res.body == "Unauthorized", "401 body carries no detail");
    }
    {
        httplib::Request req;
        httplib::Response res;
        req.path = "/music/";
        req.headers.emplace("Cookie", "session=" + nonce + "." + flip_hex_char(sig, 3));
        expect(!cdnd::require_session(req, res, auth, "/nonexistent/login.html"),
               "tampered cookie must not pass");
        expect(res.status == 401, "tampered cookie is 401");
    }

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: session token/cookie regression test passed\n";
    return 0;
}
