// tests/config/test_config.cpp
//
// Configuration layering: JSON file < CDND_* env < command line, plus
// validation and derived defaults.

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include "config.h"

namespace fs = std::filesystem;

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

static bool load(std::vector<std::string> args, cdnd::ServerConfig* cfg, std::string* err) {
    args.insert(args.begin(), "cdnd_server");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return cdnd::load_config((int)args.size(), argv.data(), cfg, err);
}

int main() {
    for (const char* k : {"CDND_CONFIG_PATH", "CDND_DATA_DIR", "CDND_REPO_DIR", "CDND_PASSWORD_HASH",
                          "CDND_WEBHOOK_SECRET", "CDND_LISTEN_PORT", "CDND_ALLOWED_ORIGINS",
                          "CDND_RESTART_SCRIPT", "CDND_LOGIN_PAGE", "CDND_AUDIT_DIR",
                          "CDND_SESSION_SIG_HEX_LEN"}) {
        unsetenv(k);
    }

    const fs::path base = fs::temp_directory_path() /
        ("cdnd_config_test_" + std::to_string((long)::getpid()));
    std::error_code ec;
    fs::remove_all(base, ec);
    fs::create_directories(base / "data");
    fs::create_directories(base / "repo");

    const std::string data = (base / "data").string();
    const std::string repo = (base / "repo").string();

    // ---- required fields ----------------------------------------------------
    {
        cdnd::ServerConfig cfg;
        std::string err;
        expect(!load({}, &cfg, &err), "no data dir fails");
        expect(err.find("data dir") != std::string::npos, "error names the data dir: " + err);

        expect(!load({"--data-dir", data}, &cfg, &err), "no password hash fails");
        expect(!load({"--data-dir", (base / "nope").string(), "--password-hash", "ab"}, &cfg, &err),
               "missing data dir fails");
        expect(!load({"--data-dir", data, "--password-hash", "ab", "--port", "70000"}, &cfg, &err),
               "port out of range fails");
        expect(!load({"--data-dir", data, "--password-hash", "ab", "--bogus", "1"}, &cfg, &err),
               "unknown flag fails");
        expect(!load({"--data-dir"}, &cfg, &err), "flag without value fails");
    }

    // ---- defaults and derived paths -----------------------------------------
    {
        cdnd::ServerConfig cfg;
        std::string err;
        expect(load({"--data-dir", data, "--repo-dir=" + repo, "--password-hash", " abc \n"}, &cfg, &err),
               "minimal config loads: " + err);
        expect(cfg.port == 8888, "default port");
        expect(cfg.password_hash == "abc", "password hash trimmed");
        expect(cfg.webhook_secret.empty(), "webhook disabled by default");
        expect(cfg.allowed_origins.size() == 2 && cfg.allowed_origins[0] == "https://jkyl.io",
               "default CORS origins");
        expect(cfg.restart_script == (fs::path(repo) / "scripts" / "start-cdnd.sh").string(),
               "restart script defaults into the repo");
        expect(cfg.login_page == (fs::path(repo) / "server" / "src" / "static" / "login.html").string(),
               "login page defaults into the repo");
        expect(!cfg.audit_dir.empty(), "audit dir derived");
        expect(cfg.session_sig_hex_len == 16, "default signature length");
    }

    // ---- layering -----------------------------------------------------------
    {
        const fs::path json_path = base / "cdnd.json";
        {
            std::ofstream f(json_path);
            f << R"({
                // comments are allowed
                "data_dir": ")" << data << R"(",
                "password_hash": "fromfile",
                "port": 9000,
                "deploy_branch": "release",
                "allowed_origins": ["https://a.example"],
                "session_sig_hex_len": 32
            })";
        }

        cdnd::ServerConfig cfg;
        std::string err;
        expect(load({"--config", json_path.string()}, &cfg, &err), "json config loads: " + err);
        expect(cfg.password_hash == "fromfile" && cfg.port == 9000, "json values applied");
        expect(cfg.deploy_branch == "release", "json deploy branch");
        expect(cfg.allowed_origins.size() == 1 && cfg.allowed_origins[0] == "https://a.example",
               "json origins replace defaults");
        expect(cfg.session_sig_hex_len == 32, "json signature length");

        setenv("CDND_LISTEN_PORT", "9100", 1);
        setenv("CDND_ALLOWED_ORIGINS", "https://b.example, https://c.example,", 1);
        expect(load({"--config", json_path.string()}, &cfg, &err), "env over json: " + err);
        expect(cfg.port == 9100, "env port wins over json");
        expect(cfg.allowed_origins.size() == 2 && cfg.allowed_origins[1] == "https://c.example",
               "env origins split on commas");

        expect(load({"--config", json_path.string(), "--port", "9200"}, &cfg, &err), "cli over env: " + err);
        expect(cfg.port == 9200, "cli port wins over env");

        setenv("CDND_LISTEN_PORT", "http", 1);
        expect(!load({"--config", json_path.string()}, &cfg, &err), "bad env port fails");
        unsetenv("CDND_LISTEN_PORT");
        unsetenv("CDND_ALLOWED_ORIGINS");

        setenv("CDND_SESSION_SIG_HEX_LEN", "8", 1);
        expect(!load({"--config", json_path.string()}, &cfg, &err), "signature length below 16 fails");
        unsetenv("CDND_SESSION_SIG_HEX_LEN");

        expect(!load({"--config", (base / "missing.json").string()}, &cfg, &err), "missing config file fails");
    }

    expect(cdnd::split_csv(" a, b,,c ,") == std::vector<std::string>({"a", "b", "c"}), "split_csv");

    fs::remove_all(base, ec);

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: config test passed\n";
    return 0;
}
