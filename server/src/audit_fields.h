#pragma once
#include <string>

namespace cdnd {

    // Audit/diagnostic fields carry non-secret metadata only.
    //
    // OK to log:
    /// - request path, client ip, user agent (shortened)
    /// - http status, reason codes
    /// - command diagnostics from redeploy (shortened)
    ///
    /// NOT OK:
    /// - session token / cookie value
    /// - submitted or configured password hash
    /// - webhook secret or signature header
    ///

    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

} // namespace cdnd
