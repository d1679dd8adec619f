#pragma once
#include <string>

namespace cdnd {

namespace deploy { class Redeployer; }

constexpr const char* kWebhookSignatureHeader = "X-Hub-Signature-256";
constexpr const char* kWebhookSignaturePrefix = "sha256=";

enum class WebhookRc {
    OK = 0,
    NOT_CONFIGURED,     // secret empty or no redeployer (repo dir unset)
    MISSING_SIGNATURE,  // header absent or not "sha256=..."
    INVALID_SIGNATURE,  // HMAC mismatch
    REDEPLOY_FAILED,    // sync/restart failed after a valid signature
};

struct WebhookOutcome {
    WebhookRc rc = WebhookRc::NOT_CONFIGURED;
    int http_status = 500;
    std::string message;   // plain-text response body
};

const char* webhook_rc_str(WebhookRc rc);

// "sha256=" + hex(HMAC-SHA256(secret, raw_body))
std::string webhook_signature(const std::string& secret, const std::string& raw_body);

// Signature checks only (steps 1-3, in order). `raw_body` must be the exact
// bytes received; a re-serialized body will not verify.
WebhookRc verify_webhook_signature(const std::string& raw_body,
                                   const std::string& signature_header,
                                   const std::string& configured_secret);

// Full webhook decision: verify, then delegate to the redeployer.
// `redeployer` may be null when no repository is configured.
WebhookOutcome verify_and_trigger(const std::string& raw_body,
                                  const std::string& signature_header,
                                  const std::string& configured_secret,
                                  deploy::Redeployer* redeployer);

} // namespace cdnd
