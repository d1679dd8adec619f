#pragma once

#include <string>

#include "httplib.h"

namespace cdnd {

class SessionAuthenticator;

// Raw value of cookie `name` from the Cookie header. Integrity is NOT checked.
bool get_cookie_value(const httplib::Request& req,
                      const std::string& name,
                      std::string& out);

// True if the request carries a session cookie that verifies under `auth`.
bool has_valid_session(const httplib::Request& req,
                       const SessionAuthenticator& auth);

// Gate for file routes. Returns true if the request may proceed.
// On failure the response is already written: the login page for "/",
// 401 for everything else.
bool require_session(const httplib::Request& req,
                     httplib::Response& res,
                     const SessionAuthenticator& auth,
                     const std::string& login_page_path);

} // namespace cdnd
