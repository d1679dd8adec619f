#include "config.h"
#include "cdnd_util.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cdnd {

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t end = s.find(',', pos);
        if (end == std::string::npos) end = s.size();
        std::string item = trim_ws(s.substr(pos, end - pos));
        if (!item.empty()) out.push_back(std::move(item));
        pos = end + 1;
    }
    return out;
}

static bool parse_port(const std::string& s, int* out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size() || v < 1 || v > 65535) return false;
        *out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_int(const std::string& s, int* out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        *out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool apply_json_file(const std::string& path, ServerConfig* cfg, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) {
        *err = "cannot open config file: " + path;
        return false;
    }

    json j;
    try {
        j = json::parse(f, nullptr, true, /*ignore_comments=*/true);
    } catch (const std::exception& e) {
        *err = "invalid config json in " + path + ": " + e.what();
        return false;
    }
    if (!j.is_object()) {
        *err = "config must be a JSON object: " + path;
        return false;
    }

    auto str = [&](const char* k, std::string& dst) {
        auto it = j.find(k);
        if (it != j.end() && it->is_string()) dst = it->get<std::string>();
    };

    str("data_dir", cfg->data_dir);
    str("repo_dir", cfg->repo_dir);
    str("password_hash", cfg->password_hash);
    str("webhook_secret", cfg->webhook_secret);
    str("bind_host", cfg->bind_host);
    str("deploy_remote", cfg->deploy_remote);
    str("deploy_branch", cfg->deploy_branch);
    str("restart_script", cfg->restart_script);
    str("login_page", cfg->login_page);
    str("audit_dir", cfg->audit_dir);
    str("audit_min_level", cfg->audit_min_level);

    if (j.contains("port") && j["port"].is_number_integer()) {
        cfg->port = j["port"].get<int>();
    }
    if (j.contains("session_sig_hex_len") && j["session_sig_hex_len"].is_number_integer()) {
        cfg->session_sig_hex_len = j["session_sig_hex_len"].get<int>();
    }
    if (j.contains("allowed_origins") && j["allowed_origins"].is_array()) {
        cfg->allowed_origins.clear();
        for (const auto& o : j["allowed_origins"]) {
            if (o.is_string()) cfg->allowed_origins.push_back(o.get<std::string>());
        }
    }
    return true;
}

static bool apply_env(ServerConfig* cfg, std::string* err) {
    if (const char* v = std::getenv("CDND_DATA_DIR")) cfg->data_dir = v;
    if (const char* v = std::getenv("CDND_REPO_DIR")) cfg->repo_dir = v;
    if (const char* v = std::getenv("CDND_PASSWORD_HASH")) cfg->password_hash = trim_ws(v);
    if (const char* v = std::getenv("CDND_WEBHOOK_SECRET")) cfg->webhook_secret = v;
    if (const char* v = std::getenv("CDND_BIND_HOST")) cfg->bind_host = v;
    if (const char* v = std::getenv("CDND_ALLOWED_ORIGINS")) cfg->allowed_origins = split_csv(v);
    if (const char* v = std::getenv("CDND_DEPLOY_REMOTE")) cfg->deploy_remote = v;
    if (const char* v = std::getenv("CDND_DEPLOY_BRANCH")) cfg->deploy_branch = v;
    if (const char* v = std::getenv("CDND_RESTART_SCRIPT")) cfg->restart_script = v;
    if (const char* v = std::getenv("CDND_LOGIN_PAGE")) cfg->login_page = v;
    if (const char* v = std::getenv("CDND_AUDIT_DIR")) cfg->audit_dir = v;
    if (const char* v = std::getenv("CDND_AUDIT_MIN_LEVEL")) cfg->audit_min_level = v;

    if (const char* v = std::getenv("CDND_LISTEN_PORT")) {
        if (!parse_port(v, &cfg->port)) {
            *err = std::string("invalid CDND_LISTEN_PORT: ") + v;
            return false;
        }
    }
    if (const char* v = std::getenv("CDND_SESSION_SIG_HEX_LEN")) {
        if (!parse_int(v, &cfg->session_sig_hex_len)) {
            *err = std::string("invalid CDND_SESSION_SIG_HEX_LEN: ") + v;
            return false;
        }
    }
    return true;
}

bool finalize_config(ServerConfig* cfg, std::string* err) {
    if (cfg->data_dir.empty()) { *err = "data dir is required (--data-dir / CDND_DATA_DIR)"; return false; }
    if (cfg->password_hash.empty()) { *err = "password hash is required (--password-hash / CDND_PASSWORD_HASH)"; return false; }
    if (cfg->port < 1 || cfg->port > 65535) { *err = "port out of range: " + std::to_string(cfg->port); return false; }
    if (cfg->session_sig_hex_len < 16 || cfg->session_sig_hex_len > 64) {
        *err = "session_sig_hex_len must be within 16..64";
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(cfg->data_dir, ec)) {
        *err = "data dir is not a directory: " + cfg->data_dir;
        return false;
    }

    if (!cfg->repo_dir.empty()) {
        const std::filesystem::path repo(cfg->repo_dir);
        if (cfg->restart_script.empty())
            cfg->restart_script = (repo / "scripts" / "start-cdnd.sh").string();
        if (cfg->login_page.empty())
            cfg->login_page = (repo / "server" / "src" / "static" / "login.html").string();
    }
    if (cfg->login_page.empty()) {
        // build/bin/cdnd_server -> <checkout>/server/src/static/login.html
        cfg->login_page = std::filesystem::weakly_canonical(
            std::filesystem::path(exe_dir()) / ".." / ".." / "server" / "src" / "static" / "login.html",
            ec).string();
    }
    if (cfg->audit_dir.empty()) cfg->audit_dir = exe_dir() + "/audit";

    return true;
}

bool load_config(int argc, char** argv, ServerConfig* out, std::string* err) {
    static const std::map<std::string, std::string> kFlags = {
        {"--data-dir", "data_dir"},
        {"--repo-dir", "repo_dir"},
        {"--password-hash", "password_hash"},
        {"--webhook-secret", "webhook_secret"},
        {"--port", "port"},
        {"--config", "config"},
    };

    // Every flag takes a value: "--flag value" or "--flag=value".
    std::map<std::string, std::string> cli;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        std::string v;
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
            v = a.substr(eq + 1);
            a = a.substr(0, eq);
        } else {
            if (i + 1 >= argc) { *err = "missing value for " + a; return false; }
            v = argv[++i];
        }
        auto it = kFlags.find(a);
        if (it == kFlags.end()) { *err = "unknown argument: " + a; return false; }
        cli[it->second] = v;
    }

    ServerConfig cfg;

    std::string config_path;
    if (const char* p = std::getenv("CDND_CONFIG_PATH")) config_path = p;
    if (cli.count("config")) config_path = cli["config"];
    if (!config_path.empty() && !apply_json_file(config_path, &cfg, err)) return false;

    if (!apply_env(&cfg, err)) return false;

    if (cli.count("data_dir")) cfg.data_dir = cli["data_dir"];
    if (cli.count("repo_dir")) cfg.repo_dir = cli["repo_dir"];
    if (cli.count("password_hash")) cfg.password_hash = trim_ws(cli["password_hash"]);
    if (cli.count("webhook_secret")) cfg.webhook_secret = cli["webhook_secret"];
    if (cli.count("port") && !parse_port(cli["port"], &cfg.port)) {
        *err = "invalid --port: " + cli["port"];
        return false;
    }

    if (!finalize_config(&cfg, err)) return false;
    *out = std::move(cfg);
    return true;
}

} // namespace cdnd
