/*
cdnd: authenticated static-file server with signed self-redeploy
================================================================

Serves one directory tree to browsers that hold a session cookie.

- Login: the browser posts SHA-256(password) as hex; the server compares it
  in constant time with the configured value and sets a "session" cookie
  signed with a per-process secret.
- Files: every GET except /login.html needs that cookie. Paths are resolved
  lexically under the data dir; any ".." is refused outright.
- Redeploy: a git host posts to /webhook with an HMAC-SHA256 signature over
  the raw body. A valid delivery force-syncs the checkout to the remote tip
  and launches the restart script detached.

Non-goals (explicit)
--------------------
- No TLS: run behind a tunnel or reverse proxy that terminates HTTPS.
- No user accounts, token revocation, or rate limiting.
- Sessions do not survive a restart (the secret lives in memory only).
*/

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <sodium.h>

#include "httplib.h"

#include "audit_log.h"
#include "config.h"
#include "deploy/redeployer.h"
#include "routes.h"
#include "session_cookie.h"

int main(int argc, char** argv)
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    cdnd::ServerConfig cfg;
    {
        std::string err;
        if (!cdnd::load_config(argc, argv, &cfg, &err)) {
            std::cerr << "[config] FATAL: " << err << std::endl;
            std::cerr << "usage: cdnd_server --data-dir DIR --repo-dir DIR --password-hash HEX"
                         " [--webhook-secret S] [--port N] [--config FILE]" << std::endl;
            return 2;
        }
    }

    // ---- Audit log (hash-chained JSONL) ----
    try {
        std::filesystem::create_directories(cfg.audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    cdnd::AuditLog audit(cfg.audit_dir + "/cdnd_audit.jsonl",
                         cfg.audit_dir + "/cdnd_audit.state");
    if (!audit.set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[audit] WARNING: invalid audit_min_level '" << cfg.audit_min_level
                  << "', keeping " << audit.min_level_str() << std::endl;
    }
    std::cerr << "[audit] " << audit.jsonl_path() << " min_level=" << audit.min_level_str() << std::endl;

    // ---- Session secret: one per process, never persisted ----
    const cdnd::SessionAuthenticator auth((size_t)cfg.session_sig_hex_len);

    // ---- Redeploy (only with a repository and a secret) ----
    std::unique_ptr<cdnd::deploy::Redeployer> redeployer;
    if (!cfg.repo_dir.empty()) {
        cdnd::deploy::GitRedeployConfig rc;
        rc.repo_dir = cfg.repo_dir;
        rc.remote = cfg.deploy_remote;
        rc.branch = cfg.deploy_branch;
        rc.restart_script = cfg.restart_script;
        redeployer = cdnd::deploy::make_git_redeployer(rc);
    }
    if (cfg.webhook_secret.empty() || !redeployer) {
        std::cerr << "[webhook] disabled (needs webhook secret and repo dir)" << std::endl;
    }

    httplib::Server srv;

    RoutesContext ctx;
    ctx.cfg = &cfg;
    ctx.auth = &auth;
    ctx.redeployer = redeployer.get();
    ctx.audit = &audit;
    register_routes(srv, ctx);

    {
        cdnd::AuditEvent ev;
        ev.event = "server.start";
        ev.outcome = "ok";
        ev.f["port"] = std::to_string(cfg.port);
        ev.f["data_dir"] = cfg.data_dir;
        audit.append(ev);
    }

    std::cerr << "cdnd serving " << cfg.data_dir << " on " << cfg.bind_host << ":" << cfg.port << std::endl;
    if (!srv.listen(cfg.bind_host.c_str(), cfg.port)) {
        std::cerr << "[cdnd] FATAL: failed to listen on " << cfg.bind_host << ":" << cfg.port << std::endl;
        return 3;
    }
    return 0;
}
