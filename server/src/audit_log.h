#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace cdnd {

/*
AuditEvent
==========

One security-relevant event in the audit log.

All fields are strings so JSONL lines stay flat and stable.

IMPORTANT:
- Never store session tokens, cookies, password hashes or webhook secrets.
- Log identifiers, outcomes, and reason codes only.
*/
struct AuditEvent {
    // ISO-8601 UTC with milliseconds, e.g. 2026-01-19T12:34:56.123Z.
    // Filled in by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>", e.g. "login.ok", "webhook.bad_signature".
    std::string event;

    // "ok" | "fail" | "deny"
    std::string outcome;

    // Flat string -> string context (ip, path, reason, http, ...).
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL audit log.

Each line carries:
- prev_hash : line_hash of the previous line (64 zeros at genesis)
- line_hash : SHA-256(prev_hash + json_without_line_hash)

Any modification, insertion, deletion, or reordering of lines breaks the chain
from that point forward. This is tamper evidence, not tamper prevention: an
attacker who can rewrite both the JSONL and the state file can rewrite history.
*/
class AuditLog {
public:
    // Ordering: DEBUG < INFO < SECURITY.
    // Events below the minimum level are dropped.
    enum class Level : int {
        DEBUG    = 0,
        INFO     = 1,
        SECURITY = 2,
    };

    AuditLog(std::string jsonl_path, std::string state_path);

    // Thread-safe; appends are serialized to keep the chain linear.
    void append(const AuditEvent& e, Level level = Level::SECURITY);

    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    const std::string& jsonl_path() const { return jsonl_path_; }

    /*
    Walk a JSONL file and recompute the chain.

    Returns true if the first line links to genesis, every later line links
    to its predecessor, and every line_hash matches. On failure, *err names the first bad line (1-based).
    An empty or missing file verifies trivially.
    */
    static bool verify_file(const std::string& jsonl_path, std::string* err);

private:
    std::atomic<int> min_level_{static_cast<int>(Level::SECURITY)};

    std::string jsonl_path_;
    std::string state_path_;

    std::mutex mu_;

    // 64 hex chars from the state file, else from the last JSONL line,
    // else 64 zeros (genesis).
    std::string load_prev_hash_();
    static std::string last_line_hash_(const std::string& jsonl_path);
    void store_prev_hash_(const std::string& h);

    static std::string json_escape_(const std::string& s);

    // Returns the final line; *out_line_hash receives
    // SHA256(prev_hash + json_without_line_hash).
    static std::string build_json_(const AuditEvent& e,
                                   const std::string& prev_hash,
                                   std::string* out_line_hash);
};

} // namespace cdnd
