#include "authz.h"

#include "cdnd_util.h"
#include "file_serve.h"
#include "session_cookie.h"

#include <string>

/*
Session gate for file routes
============================

Authentication here is a single question: does the request carry a
"session" cookie minted by this process? There are no roles; any valid
session may read the whole sandbox root.

Exempt routes (/login.html, /login, /webhook) are registered ahead of the
catch-all file route and never call into this file.
*/

namespace cdnd {

/*
Cookie header parser.

Notes:
- httplib does not provide a structured cookie API, so we parse manually.
- Pairs are split on ';' and the name must match exactly, so "xsession=..."
  is never mistaken for "session=...".
- No quoted values; our own cookie never needs them.
*/
bool get_cookie_value(const httplib::Request& req,
                      const std::string& name,
                      std::string& out) {
    if (!req.has_header("Cookie")) return false;
    const std::string hdr = req.get_header_value("Cookie");

    size_t pos = 0;
    while (pos <= hdr.size()) {
        size_t end = hdr.find(';', pos);
        if (end == std::string::npos) end = hdr.size();

        const std::string pair = trim_ws(hdr.substr(pos, end - pos));
        const auto eq = pair.find('=');
        if (eq != std::string::npos && pair.compare(0, eq, name) == 0 && eq == name.size()) {
            out = pair.substr(eq + 1);
            return true;
        }
        pos = end + 1;
    }
    return false;
}

bool has_valid_session(const httplib::Request& req,
                       const SessionAuthenticator& auth) {
    std::string token;
    if (!get_cookie_value(req, kSessionCookieName, token)) return false;
    return auth.verify_token(token);
}

bool require_session(const httplib::Request& req,
                     httplib::Response& res,
                     const SessionAuthenticator& auth,
                     const std::string& login_page_path) {
    if (has_valid_session(req, auth)) return true;

    // Browser navigation to the site root gets the login form instead of a
    // bare 401.
    if (req.path == "/") {
        serve_static_page(res, login_page_path, "text/html; charset=utf-8");
        return false;
    }

    res.status = 401;
    res.set_content("Unauthorized", "text/plain; charset=utf-8");
    return false;
}

} // namespace cdnd
