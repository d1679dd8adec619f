#pragma once
#include <httplib.h>

#include <string>
#include <vector>

namespace cdnd {
class AuditLog;
class SessionAuthenticator;
struct ServerConfig;
namespace deploy { class Redeployer; }
} // namespace cdnd

// Everything the HTTP layer needs, owned by main.cpp (or a test) and
// borrowed here. Pointers must outlive the server.
struct RoutesContext {
    const cdnd::ServerConfig* cfg = nullptr;
    const cdnd::SessionAuthenticator* auth = nullptr;

    // null when no repository is configured; /webhook then reports
    // "not configured".
    cdnd::deploy::Redeployer* redeployer = nullptr;

    // optional
    cdnd::AuditLog* audit = nullptr;
};

// Origins allowed to make credentialed cross-origin requests.
bool cors_origin_allowed(const std::vector<std::string>& allowed, const std::string& origin);

// Registers /login.html, /login, /webhook, OPTIONS preflight and the
// catch-all authenticated file route, plus CORS and exception handling.
void register_routes(httplib::Server& srv, const RoutesContext& ctx);
