#include "audit_log.h"
#include "cdnd_util.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace cdnd {

/*
Audit log (hash-chained JSONL)
=============================

cdnd records login outcomes, rejected sessions, traversal attempts and webhook
decisions here. The format is easy to tail live and to verify afterwards.

Chain:
  H_i = SHA256( H_{i-1} || JSON_i_without_line_hash )

Threading model
---------------
append() is called from httplib worker threads. Writes are serialized with
mu_ so lines never interleave and the chain stays linear.
*/

static const std::string kGenesis(64, '0');

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
  : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

bool AuditLog::set_min_level_str(const std::string& s) {
  const std::string v = lower_ascii(trim_ws(s));
  if (v == "debug")    { min_level_.store((int)Level::DEBUG);    return true; }
  if (v == "info")     { min_level_.store((int)Level::INFO);     return true; }
  if (v == "security") { min_level_.store((int)Level::SECURITY); return true; }
  return false;
}

std::string AuditLog::min_level_str() const {
  switch ((Level)min_level_.load()) {
    case Level::DEBUG: return "DEBUG";
    case Level::INFO:  return "INFO";
    default:           return "SECURITY";
  }
}

/*
The state file stores the last committed line_hash so appends do not re-hash
the whole log. When the state file is missing or malformed, the chain resumes
from the line_hash of the last JSONL line; an empty log starts at genesis.
*/
std::string AuditLog::load_prev_hash_() {
  {
    std::ifstream f(state_path_);
    std::string line;
    if (f.good() && std::getline(f, line) && line.size() == 64) return line;
  }
  return last_line_hash_(jsonl_path_);
}

std::string AuditLog::last_line_hash_(const std::string& jsonl_path) {
  std::ifstream f(jsonl_path);
  if (!f.good()) return kGenesis;

  std::string line, last;
  while (std::getline(f, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return kGenesis;

  try {
    const nlohmann::json j = nlohmann::json::parse(last);
    if (j.is_object() && j.contains("line_hash") && j["line_hash"].is_string()) {
      const std::string h = j["line_hash"].get<std::string>();
      if (h.size() == 64) return h;
    }
  } catch (const std::exception& e) {
    std::cerr << "[audit] WARNING: last line of " << jsonl_path
              << " is not valid json, chain restarts at genesis: " << e.what() << std::endl;
  }
  return kGenesis;
}

void AuditLog::store_prev_hash_(const std::string& h) {
  std::ofstream f(state_path_, std::ios::trunc);
  f << h << "\n";
}

// Minimal escaping: we only ever emit string keys and string values.
std::string AuditLog::json_escape_(const std::string& s) {
  std::ostringstream o;
  for (char c : s) {
    switch (c) {
      case '\"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\b': o << "\\b"; break;
      case '\f': o << "\\f"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << (int)(unsigned char)c << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

/*
Field order is part of the format: ts, event, outcome, prev_hash,
[line_hash], [f]. verify_file() strips the line_hash member to recover the
exact preimage bytes, so both sides must agree on this layout.
*/
std::string AuditLog::build_json_(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  std::string* out_line_hash) {
  std::ostringstream head;
  head << "\"ts\":\"" << json_escape_(e.ts_utc) << "\""
       << ",\"event\":\"" << json_escape_(e.event) << "\""
       << ",\"outcome\":\"" << json_escape_(e.outcome) << "\""
       << ",\"prev_hash\":\"" << prev_hash << "\"";

  std::ostringstream fields;
  if (!e.f.empty()) {
    fields << ",\"f\":{";
    bool first = true;
    for (const auto& kv : e.f) {
      if (!first) fields << ",";
      first = false;
      fields << "\"" << json_escape_(kv.first) << "\":"
             << "\"" << json_escape_(kv.second) << "\"";
    }
    fields << "}";
  }

  const std::string json_without_line_hash = "{" + head.str() + fields.str() + "}";
  *out_line_hash = sha256_hex(prev_hash + json_without_line_hash);

  return "{" + head.str()
       + ",\"line_hash\":\"" + *out_line_hash + "\""
       + fields.str() + "}";
}

void AuditLog::append(const AuditEvent& e_in, Level level) {
  if ((int)level < min_level_.load()) return;

  std::lock_guard<std::mutex> lk(mu_);

  AuditEvent e = e_in;
  if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

  const std::string prev = load_prev_hash_();

  std::string line_hash;
  const std::string line = build_json_(e, prev, &line_hash);

  std::ofstream out(jsonl_path_, std::ios::app);
  out << line << "\n";
  out.flush();

  store_prev_hash_(line_hash);
}

bool AuditLog::verify_file(const std::string& jsonl_path, std::string* err) {
  if (err) err->clear();

  std::ifstream f(jsonl_path);
  if (!f.good()) return true;

  std::string expect_prev = kGenesis;
  std::string line;
  long lineno = 0;

  while (std::getline(f, line)) {
    lineno++;
    if (line.empty()) continue;

    auto fail = [&](const std::string& why) {
      if (err) *err = "line " + std::to_string(lineno) + ": " + why;
      return false;
    };

    nlohmann::json j;
    try {
      j = nlohmann::json::parse(line);
    } catch (const std::exception&) {
      return fail("invalid json");
    }

    if (!j.is_object() ||
        !j.contains("prev_hash") || !j["prev_hash"].is_string() ||
        !j.contains("line_hash") || !j["line_hash"].is_string()) {
      return fail("missing hash fields");
    }

    const std::string prev = j["prev_hash"].get<std::string>();
    const std::string lh   = j["line_hash"].get<std::string>();

    // The first line must start at genesis, so removing lines from the head
    // of the log is detected like any other deletion.
    if (prev != expect_prev) return fail("prev_hash does not link");

    const std::string member = ",\"line_hash\":\"" + lh + "\"";
    const auto pos = line.find(member);
    if (pos == std::string::npos) return fail("line_hash not in canonical position");

    std::string preimage = line;
    preimage.erase(pos, member.size());

    if (sha256_hex(prev + preimage) != lh) return fail("line_hash mismatch");

    expect_prev = lh;
  }

  return true;
}

} // namespace cdnd
