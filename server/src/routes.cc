// routes.cc
//
// HTTP surface of cdnd.
//
//   GET  /login.html   no auth      login page
//   POST /login        no auth      {"hash": "..."} -> Set-Cookie session
//   POST /webhook      HMAC header  verify, sync checkout, restart detached
//   GET  /<path>       session      listing / file (ranges) / 401 / 403 / 404
//   OPTIONS *          CORS preflight for the configured origin allow-list
//
// This file is transport + orchestration only. Token crypto lives in
// session_cookie.cc, signature checks in webhook.cc, path rules in
// path_resolver.cc, process control in deploy/.

#include "routes.h"

#include "audit_fields.h"
#include "audit_log.h"
#include "authz.h"
#include "config.h"
#include "file_serve.h"
#include "path_resolver.h"
#include "session_cookie.h"
#include "webhook.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <functional>
#include <iostream>
#include <map>

using nlohmann::json;

static void reply_json(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body, "application/json");
}

static void reply_text(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, "text/plain; charset=utf-8");
}

// Behind a tunnel the socket peer is the tunnel; prefer its forwarded header.
static std::string client_ip(const httplib::Request& req) {
    const std::string cf = req.get_header_value("CF-Connecting-IP");
    if (!cf.empty()) return cf;
    return req.remote_addr.empty() ? "?" : req.remote_addr;
}

bool cors_origin_allowed(const std::vector<std::string>& allowed, const std::string& origin) {
    if (origin.empty()) return false;
    return std::find(allowed.begin(), allowed.end(), origin) != allowed.end();
}

void register_routes(httplib::Server& srv, const RoutesContext& ctx) {
    const cdnd::ServerConfig& cfg = *ctx.cfg;
    const cdnd::SessionAuthenticator& auth = *ctx.auth;

    auto audit_emit = [ctx](const httplib::Request& req,
                            const std::string& event,
                            const std::string& outcome,
                            cdnd::AuditLog::Level level,
                            const std::function<void(std::map<std::string, std::string>&)>& fill) {
        if (!ctx.audit) return;
        cdnd::AuditEvent ev;
        ev.event = event;
        ev.outcome = outcome;
        ev.f["ip"] = client_ip(req);
        ev.f["ua"] = cdnd::shorten(req.get_header_value("User-Agent"));
        if (fill) fill(ev.f);
        ctx.audit->append(ev, level);
    };

    // ---- CORS ---------------------------------------------------------------
    // Credentialed requests: the origin is echoed, never "*".
    srv.set_post_routing_handler([&cfg](const httplib::Request& req, httplib::Response& res) {
        const std::string origin = req.get_header_value("Origin");
        if (!cors_origin_allowed(cfg.allowed_origins, origin)) return;
        if (res.has_header("Access-Control-Allow-Origin")) return;
        res.set_header("Access-Control-Allow-Origin", origin);
        res.set_header("Access-Control-Allow-Credentials", "true");
        res.set_header("Vary", "Origin");
    });

    srv.Options(R"(.*)", [&cfg](const httplib::Request& req, httplib::Response& res) {
        const std::string origin = req.get_header_value("Origin");
        if (!cors_origin_allowed(cfg.allowed_origins, origin)) {
            reply_text(res, 400, "Disallowed CORS origin");
            return;
        }
        res.status = 200;
        res.set_header("Access-Control-Allow-Origin", origin);
        res.set_header("Access-Control-Allow-Credentials", "true");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.set_header("Access-Control-Max-Age", "600");
        res.set_header("Vary", "Origin");
    });

    // One bad request must never take the process down.
    srv.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                 std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        std::cerr << "[cdnd] ERROR: " << req.method << " " << req.path << ": " << what << std::endl;
        reply_text(res, 500, "Internal server error");
    });

    // ---- login --------------------------------------------------------------
    srv.Get("/login.html", [&cfg](const httplib::Request&, httplib::Response& res) {
        cdnd::serve_static_page(res, cfg.login_page, "text/html; charset=utf-8");
    });

    srv.Post("/login", [&cfg, &auth, audit_emit](const httplib::Request& req, httplib::Response& res) {
        // Any malformed body is just a wrong credential.
        std::string received_hash;
        try {
            const json body = json::parse(req.body);
            if (body.is_object()) {
                auto it = body.find("hash");
                if (it != body.end() && it->is_string()) received_hash = it->get<std::string>();
            }
        } catch (const std::exception&) {
            received_hash.clear();
        }

        if (!cdnd::credential_matches(cfg.password_hash, received_hash)) {
            audit_emit(req, "login.fail", "fail", cdnd::AuditLog::Level::SECURITY, nullptr);
            reply_json(res, 401, json({{"ok", false}}).dump());
            return;
        }

        const std::string token = auth.issue_token();
        res.set_header("Set-Cookie", cdnd::SessionAuthenticator::cookie_header(token));
        audit_emit(req, "login.ok", "ok", cdnd::AuditLog::Level::SECURITY, nullptr);
        reply_json(res, 200, json({{"ok", true}}).dump());
    });

    // ---- webhook ------------------------------------------------------------
    srv.Post("/webhook", [&cfg, ctx, audit_emit](const httplib::Request& req, httplib::Response& res) {
        // req.body is the exact received byte sequence; never re-serialize it.
        const std::string sig = req.get_header_value(cdnd::kWebhookSignatureHeader);
        const cdnd::WebhookOutcome o =
            cdnd::verify_and_trigger(req.body, sig, cfg.webhook_secret, ctx.redeployer);

        std::string event;
        switch (o.rc) {
            case cdnd::WebhookRc::OK:                event = "webhook.redeploy_ok";    break;
            case cdnd::WebhookRc::NOT_CONFIGURED:    event = "webhook.not_configured"; break;
            case cdnd::WebhookRc::REDEPLOY_FAILED:   event = "webhook.redeploy_fail";  break;
            default:                                 event = "webhook.bad_signature";  break;
        }

        if (o.rc == cdnd::WebhookRc::OK) {
            std::cerr << "[webhook] verified, checkout synced, restart launched" << std::endl;
        } else {
            std::cerr << "[webhook] " << cdnd::webhook_rc_str(o.rc) << " (http " << o.http_status
                      << ") " << cdnd::shorten(o.message, 200) << std::endl;
        }

        audit_emit(req, event, o.rc == cdnd::WebhookRc::OK ? "ok" : "fail",
                   cdnd::AuditLog::Level::SECURITY,
                   [&](std::map<std::string, std::string>& f) {
                       f["reason"] = cdnd::webhook_rc_str(o.rc);
                       f["http"] = std::to_string(o.http_status);
                       if (o.rc == cdnd::WebhookRc::REDEPLOY_FAILED)
                           f["detail"] = cdnd::shorten(o.message, 200);
                   });

        reply_text(res, o.http_status, o.message);
    });

    // ---- files (catch-all, must stay last) ----------------------------------
    srv.Get(R"(/.*)", [&cfg, &auth, audit_emit](const httplib::Request& req, httplib::Response& res) {
        if (!cdnd::require_session(req, res, auth, cfg.login_page)) {
            audit_emit(req, "session.denied", "deny", cdnd::AuditLog::Level::INFO,
                       [&](std::map<std::string, std::string>& f) {
                           f["path"] = cdnd::shorten(req.path, 200);
                       });
            return;
        }

        const cdnd::Resolved r = cdnd::resolve_request_path(req.path, cfg.data_dir);
        switch (r.kind) {
            case cdnd::Resolved::Kind::FORBIDDEN:
                audit_emit(req, "files.forbidden", "deny", cdnd::AuditLog::Level::SECURITY,
                           [&](std::map<std::string, std::string>& f) {
                               f["path"] = cdnd::shorten(req.path, 200);
                           });
                reply_text(res, 403, "Forbidden");
                return;

            case cdnd::Resolved::Kind::LISTING: {
                const auto entries = cdnd::collect_listing(r.abs_path);
                res.status = 200;
                res.set_header("Cache-Control", "no-store");
                res.set_content(cdnd::render_listing_html(entries, req.path),
                                "text/html; charset=utf-8");
                return;
            }

            case cdnd::Resolved::Kind::FILE:
                cdnd::serve_file(res, r.abs_path);
                return;

            case cdnd::Resolved::Kind::NOT_FOUND:
                reply_text(res, 404, "Not found");
                return;
        }
    });
}
