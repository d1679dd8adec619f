// tests/files/test_path_resolver.cpp
//
// Request path -> sandbox resolution, listing collection and rendering.
//
// What it tests:
// 1) normalization of request paths (pure)
// 2) traversal syntax is refused even when it would stay inside the root
// 3) resolve_request_path on a temp tree: LISTING / FILE / NOT_FOUND
// 4) collect_listing hides dot-entries
// 5) render_listing_html ordering, link shape and escaping (pure)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include "path_resolver.h"

namespace fs = std::filesystem;

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

static void write_file(const fs::path& p, const std::string& data) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << data;
}

static fs::path make_temp_root() {
    fs::path base = fs::temp_directory_path() /
        ("cdnd_path_test_" + std::to_string((long)::getpid()));
    std::error_code ec;
    fs::remove_all(base, ec);
    fs::create_directories(base);
    return base;
}

int main() {
    // ---- 1) normalization ---------------------------------------------------
    expect(cdnd::normalize_request_path("/") == "", "root normalizes to empty");
    expect(cdnd::normalize_request_path("") == "", "empty stays empty");
    expect(cdnd::normalize_request_path("///") == "", "only slashes normalize to empty");
    expect(cdnd::normalize_request_path("/music/") == "music", "trailing slash dropped");
    expect(cdnd::normalize_request_path("/music//live/./a.mp3") == "music/live/a.mp3",
           "redundant separators and '.' collapse");
    expect(cdnd::normalize_request_path("/./") == "", "'.' alone is the root");

    // ---- 2) traversal -------------------------------------------------------
    const std::vector<std::string> forbidden = {
        "/..",
        "/../",
        "/../etc/passwd",
        "/a/../b",            // would stay inside, still refused
        "/a/b/..",
        "/..%2f",             // left undecoded: not a segment, but ".." remains
        "/a/..//..",
        std::string("/a\0b", 4),
        "/a\\..\\b",
    };
    for (const auto& p : forbidden) {
        expect(cdnd::is_forbidden_request_path(p), "must be forbidden: " + p);
    }
    const std::vector<std::string> allowed = {
        "/", "/music", "/music/", "/a.b/c.mp3", "/.well-known", "/x/.y",
    };
    for (const auto& p : allowed) {
        expect(!cdnd::is_forbidden_request_path(p), "must be allowed: " + p);
    }

    // ---- 3) resolve on a real tree -----------------------------------------
    const fs::path root = make_temp_root();
    fs::create_directories(root / "music" / "live");
    fs::create_directories(root / "b");
    write_file(root / "readme.txt", "hello");
    write_file(root / "music" / "a.mp3", "ID3");
    write_file(root / ".secret", "nope");
    fs::create_directories(root / ".git");

    {
        const auto r = cdnd::resolve_request_path("/", root);
        expect(r.kind == cdnd::Resolved::Kind::LISTING, "root is a listing");
        expect(r.abs_path == root, "root resolves to sandbox root");
    }
    {
        const auto r = cdnd::resolve_request_path("/music/", root);
        expect(r.kind == cdnd::Resolved::Kind::LISTING, "subdir is a listing");
        expect(r.abs_path == root / "music", "subdir abs path");
    }
    {
        const auto r = cdnd::resolve_request_path("/music/a.mp3", root);
        expect(r.kind == cdnd::Resolved::Kind::FILE, "file resolves as FILE");
        expect(r.abs_path == root / "music" / "a.mp3", "file abs path");
    }
    expect(cdnd::resolve_request_path("/missing.txt", root).kind == cdnd::Resolved::Kind::NOT_FOUND,
           "missing path is NOT_FOUND");
    expect(cdnd::resolve_request_path("/music/a.mp3/x", root).kind == cdnd::Resolved::Kind::NOT_FOUND,
           "path under a file is NOT_FOUND");
    expect(cdnd::resolve_request_path("/music/../b", root).kind == cdnd::Resolved::Kind::FORBIDDEN,
           "in-root traversal is FORBIDDEN");
    expect(cdnd::resolve_request_path("/../" + root.filename().string(), root).kind ==
           cdnd::Resolved::Kind::FORBIDDEN, "escape to parent is FORBIDDEN");

    // ---- 4) listing collection ----------------------------------------------
    {
        const auto entries = cdnd::collect_listing(root);
        bool saw_hidden = false, saw_music = false, saw_readme = false;
        for (const auto& e : entries) {
            if (!e.name.empty() && e.name[0] == '.') saw_hidden = true;
            if (e.name == "music") saw_music = e.is_dir;
            if (e.name == "readme.txt") saw_readme = !e.is_dir;
        }
        expect(!saw_hidden, "dot-entries are not listed");
        expect(saw_music, "directory listed as dir");
        expect(saw_readme, "file listed as file");
        expect(entries.size() == 3, "root has exactly music, b, readme.txt");
    }
    expect(cdnd::collect_listing(root / "nope").empty(), "missing dir lists nothing");

    // ---- 5) rendering -------------------------------------------------------
    {
        std::vector<cdnd::DirEntry> entries = {
            {"zeta.txt", false},
            {"beta", true},
            {"alpha.mp3", false},
            {"alpha", true},
        };
        const std::string html = cdnd::render_listing_html(entries, "/music/");

        const auto p_alpha_dir  = html.find(">alpha/<");
        const auto p_beta_dir   = html.find(">beta/<");
        const auto p_alpha_file = html.find(">alpha.mp3<");
        const auto p_zeta_file  = html.find(">zeta.txt<");
        expect(p_alpha_dir != std::string::npos && p_beta_dir != std::string::npos &&
               p_alpha_file != std::string::npos && p_zeta_file != std::string::npos,
               "all entries rendered");
        expect(p_alpha_dir < p_beta_dir && p_beta_dir < p_alpha_file && p_alpha_file < p_zeta_file,
               "dirs first, then files, each sorted by name");

        expect(html.find("href=\"/music/alpha/\"") != std::string::npos, "dir link has trailing slash");
        expect(html.find("href=\"/music/zeta.txt\"") != std::string::npos, "file link under current path");
        expect(html.find("//") == std::string::npos, "no doubled separators");
        expect(html.find("<h1>/music/</h1>") != std::string::npos, "heading shows current path");

        // Same input in another order renders identically.
        std::vector<cdnd::DirEntry> shuffled = {
            {"alpha", true}, {"zeta.txt", false}, {"alpha.mp3", false}, {"beta", true},
        };
        expect(cdnd::render_listing_html(shuffled, "/music/") == html, "rendering is order-independent");
    }
    {
        const std::string html = cdnd::render_listing_html({}, "/");
        expect(html.find("<h1>/</h1>") != std::string::npos, "empty listing still has heading");
        expect(html.find("<li>") == std::string::npos, "empty listing has no items");
    }
    {
        std::vector<cdnd::DirEntry> entries = {
            {"<script>.txt", false},
            {"a b&c.mp3", false},
        };
        const std::string html = cdnd::render_listing_html(entries, "/<x>");
        expect(html.find("<script>") == std::string::npos, "names are HTML-escaped");
        expect(html.find("&lt;script&gt;.txt") != std::string::npos, "escaped name text");
        expect(html.find("href=\"/%3Cx%3E/a%20b%26c.mp3\"") != std::string::npos, "href is percent-encoded");
        expect(html.find("<h1>&lt;x&gt;") == std::string::npos, "heading keeps the leading slash");
        expect(html.find("<h1>/&lt;x&gt;</h1>") != std::string::npos, "heading is HTML-escaped");
    }

    expect(cdnd::html_escape("a&b\"c'd") == "a&amp;b&quot;c&#39;d", "html_escape");
    expect(cdnd::url_encode_path("/a b/~x.y") == "/a%20b/~x.y", "url_encode_path keeps unreserved");

    std::error_code ec;
    fs::remove_all(root, ec);

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: path resolver test passed\n";
    return 0;
}
