#pragma once
#include <string>
#include <vector>

namespace cdnd {

/*
Process configuration. Loaded once in main() and never mutated afterwards.

Layers (later wins):
  1) built-in defaults
  2) JSON file: --config <path> or CDND_CONFIG_PATH
  3) environment: CDND_DATA_DIR, CDND_REPO_DIR, CDND_PASSWORD_HASH,
     CDND_WEBHOOK_SECRET, CDND_LISTEN_PORT, CDND_BIND_HOST,
     CDND_ALLOWED_ORIGINS (comma separated), CDND_DEPLOY_REMOTE,
     CDND_DEPLOY_BRANCH, CDND_RESTART_SCRIPT, CDND_LOGIN_PAGE,
     CDND_AUDIT_DIR, CDND_AUDIT_MIN_LEVEL, CDND_SESSION_SIG_HEX_LEN
  4) command line: --data-dir, --repo-dir, --password-hash,
     --webhook-secret, --port
*/
struct ServerConfig {
    std::string data_dir;        // sandbox root (required)
    std::string repo_dir;        // git checkout for redeploy
    std::string password_hash;   // compared as-is, never re-hashed (required)
    std::string webhook_secret;  // empty disables /webhook

    int port = 8888;
    std::string bind_host = "0.0.0.0";

    std::vector<std::string> allowed_origins = {
        "https://jkyl.io",
        "https://audio.jkyl.io",
    };

    std::string deploy_remote = "origin";
    std::string deploy_branch = "main";
    std::string restart_script;  // default: <repo_dir>/scripts/start-cdnd.sh
    std::string login_page;      // default: <repo_dir>/server/src/static/login.html

    std::string audit_dir;       // default: <exe_dir>/audit
    std::string audit_min_level = "SECURITY";

    int session_sig_hex_len = 16;
};

// Resolve all layers. Returns false with *err set on unknown flags,
// unreadable config file, or failed validation.
bool load_config(int argc, char** argv, ServerConfig* out, std::string* err);

// Fill derived defaults and check required fields. Exposed for tests.
bool finalize_config(ServerConfig* cfg, std::string* err);

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> split_csv(const std::string& s);

} // namespace cdnd
