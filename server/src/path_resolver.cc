#include "path_resolver.h"

#include <algorithm>
#include <cstdio>
#include <system_error>

namespace cdnd {

/*
================================================================================
Request path resolution: overview
================================================================================

Every GET that passes the session gate lands here with an already URL-decoded
path (httplib decodes %XX before routing, so "/..%2f" arrives as "/../").

Threat model:
  - Reject the *syntax* of traversal, not only its outcome. A request such as
    "/a/../b" stays inside the root once normalized, but is still refused.
  - Containment is lexical (lexically_normal + join). Symlinks placed inside
    the data dir by the operator are followed; the data dir is operator-owned.

Listing:
  - Gathering entries (collect_listing) does the I/O.
  - Rendering (render_listing_html) is a pure function of (entries, path).
================================================================================
*/

static std::string strip_leading_slashes(const std::string& p) {
    size_t i = 0;
    while (i < p.size() && p[i] == '/') i++;
    return p.substr(i);
}

std::string normalize_request_path(const std::string& request_path) {
    const std::string rel = strip_leading_slashes(request_path);
    if (rel.empty()) return "";

    std::string norm = std::filesystem::path(rel).lexically_normal().generic_string();

    // lexically_normal keeps a trailing separator for "dir/" and yields "."
    // for paths that collapse to nothing.
    while (!norm.empty() && norm.back() == '/') norm.pop_back();
    if (norm == ".") norm.clear();
    return norm;
}

bool is_forbidden_request_path(const std::string& request_path) {
    if (request_path.find('\0') != std::string::npos) return true;
    if (request_path.find('\\') != std::string::npos) return true;

    // Raw segment check: refuse any ".." even if it would stay inside root.
    const std::string rel = strip_leading_slashes(request_path);
    size_t start = 0;
    while (start <= rel.size()) {
        size_t end = rel.find('/', start);
        if (end == std::string::npos) end = rel.size();
        if (rel.compare(start, end - start, "..") == 0 && end - start == 2) return true;
        start = end + 1;
    }

    return normalize_request_path(request_path).find("..") != std::string::npos;
}

Resolved resolve_request_path(const std::string& request_path,
                              const std::filesystem::path& sandbox_root) {
    Resolved r;

    if (is_forbidden_request_path(request_path)) {
        r.kind = Resolved::Kind::FORBIDDEN;
        return r;
    }

    const std::string rel = normalize_request_path(request_path);
    r.abs_path = rel.empty() ? sandbox_root : (sandbox_root / rel);

    std::error_code ec;
    const auto st = std::filesystem::status(r.abs_path, ec);
    if (ec) {
        r.kind = Resolved::Kind::NOT_FOUND;
        return r;
    }

    if (std::filesystem::is_directory(st)) {
        r.kind = Resolved::Kind::LISTING;
    } else if (std::filesystem::is_regular_file(st)) {
        r.kind = Resolved::Kind::FILE;
    } else {
        r.kind = Resolved::Kind::NOT_FOUND;
    }
    return r;
}

std::vector<DirEntry> collect_listing(const std::filesystem::path& dir) {
    std::vector<DirEntry> out;

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') continue;

        std::error_code sec;
        if (it->is_directory(sec)) {
            out.push_back(DirEntry{name, true});
        } else if (it->is_regular_file(sec)) {
            out.push_back(DirEntry{name, false});
        }
    }

    return out;
}

std::string html_escape(const std::string& s) {
    std::string o;
    o.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  o += "&amp;";  break;
            case '<':  o += "&lt;";   break;
            case '>':  o += "&gt;";   break;
            case '"':  o += "&quot;"; break;
            case '\'': o += "&#39;";  break;
            default:   o += c;
        }
    }
    return o;
}

std::string url_encode_path(const std::string& s) {
    std::string o;
    o.reserve(s.size());
    for (unsigned char c : s) {
        const bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
        if (keep) {
            o += (char)c;
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            o += buf;
        }
    }
    return o;
}

std::string render_listing_html(std::vector<DirEntry> entries,
                                const std::string& current_path) {
    // stable_partition keeps input order inside each group; the sort below
    // makes the output independent of it.
    auto mid = std::stable_partition(entries.begin(), entries.end(),
                                     [](const DirEntry& e){ return e.is_dir; });
    auto by_name = [](const DirEntry& a, const DirEntry& b){ return a.name < b.name; };
    std::sort(entries.begin(), mid, by_name);
    std::sort(mid, entries.end(), by_name);

    std::string base = current_path;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::string html = "<html><body><h1>" + html_escape(current_path) + "</h1><ul>";
    for (const auto& e : entries) {
        const std::string suffix = e.is_dir ? "/" : "";
        const std::string href = url_encode_path(base + "/" + e.name + suffix);
        html += "<li><a href=\"" + html_escape(href) + "\">"
              + html_escape(e.name + suffix) + "</a></li>";
    }
    html += "</ul></body></html>";
    return html;
}

} // namespace cdnd
