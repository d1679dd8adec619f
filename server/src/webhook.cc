#include "webhook.h"
#include "cdnd_util.h"
#include "deploy/redeployer.h"

#include <exception>

/*
Webhook verification
====================

The deploy trigger (a git host) signs each delivery with the shared secret:

  X-Hub-Signature-256: sha256=<hex(HMAC-SHA256(secret, raw_body))>

Checks, in order, each fail-closed:
  1) not configured      -> 500 (operator error, safe to say so)
  2) missing signature   -> 401
  3) invalid signature   -> 401 (constant-time compare)
Only then is the redeployer touched.
*/

namespace cdnd {

const char* webhook_rc_str(WebhookRc rc) {
    switch (rc) {
        case WebhookRc::OK:                return "ok";
        case WebhookRc::NOT_CONFIGURED:    return "not_configured";
        case WebhookRc::MISSING_SIGNATURE: return "missing_signature";
        case WebhookRc::INVALID_SIGNATURE: return "invalid_signature";
        case WebhookRc::REDEPLOY_FAILED:   return "redeploy_failed";
    }
    return "unknown";
}

std::string webhook_signature(const std::string& secret, const std::string& raw_body) {
    return std::string(kWebhookSignaturePrefix)
        + hmac_sha256_hex(reinterpret_cast<const unsigned char*>(secret.data()),
                          secret.size(), raw_body);
}

WebhookRc verify_webhook_signature(const std::string& raw_body,
                                   const std::string& signature_header,
                                   const std::string& configured_secret) {
    if (configured_secret.empty()) return WebhookRc::NOT_CONFIGURED;

    if (signature_header.rfind(kWebhookSignaturePrefix, 0) != 0) {
        return WebhookRc::MISSING_SIGNATURE;
    }

    const std::string expected = webhook_signature(configured_secret, raw_body);
    if (!ct_equal(expected, signature_header)) return WebhookRc::INVALID_SIGNATURE;

    return WebhookRc::OK;
}

static WebhookOutcome outcome(WebhookRc rc, int status, std::string msg) {
    WebhookOutcome o;
    o.rc = rc;
    o.http_status = status;
    o.message = std::move(msg);
    return o;
}

WebhookOutcome verify_and_trigger(const std::string& raw_body,
                                  const std::string& signature_header,
                                  const std::string& configured_secret,
                                  deploy::Redeployer* redeployer) {
    if (!redeployer) {
        return outcome(WebhookRc::NOT_CONFIGURED, 500, "Webhook not configured");
    }

    switch (verify_webhook_signature(raw_body, signature_header, configured_secret)) {
        case WebhookRc::OK:
            break;
        case WebhookRc::NOT_CONFIGURED:
            return outcome(WebhookRc::NOT_CONFIGURED, 500, "Webhook not configured");
        case WebhookRc::MISSING_SIGNATURE:
            return outcome(WebhookRc::MISSING_SIGNATURE, 401, "Missing signature");
        default:
            return outcome(WebhookRc::INVALID_SIGNATURE, 401, "Invalid signature");
    }

    try {
        const deploy::CmdResult sync = redeployer->sync_to_remote();
        if (!sync.ok) {
            return outcome(WebhookRc::REDEPLOY_FAILED, 500, sync.err);
        }

        const deploy::CmdResult restart = redeployer->schedule_restart();
        if (!restart.ok) {
            return outcome(WebhookRc::REDEPLOY_FAILED, 500, "Restart failed: " + restart.err);
        }
    } catch (const std::exception& e) {
        return outcome(WebhookRc::REDEPLOY_FAILED, 500, std::string("Error: ") + e.what());
    }

    return outcome(WebhookRc::OK, 200, "OK, restarting...");
}

} // namespace cdnd
