#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cdnd {

struct Resolved {
    enum class Kind {
        LISTING,    // abs_path is a directory inside the root
        FILE,       // abs_path is a regular file inside the root
        FORBIDDEN,  // traversal marker or otherwise unsafe request path
        NOT_FOUND,  // lexically safe, but nothing servable there
    };

    Kind kind = Kind::NOT_FOUND;
    std::filesystem::path abs_path;
};

struct DirEntry {
    std::string name;
    bool is_dir = false;
};

// Lexical normalization of a request path relative to the sandbox root.
// Leading separators are stripped; "." and redundant separators collapse.
// Returns "" for the root itself. Does not touch the filesystem.
std::string normalize_request_path(const std::string& request_path);

// True if the request path must be refused before any filesystem access:
// embedded NUL, any raw ".." segment, or ".." anywhere after normalization.
bool is_forbidden_request_path(const std::string& request_path);

// Map an (already URL-decoded) request path onto sandbox_root.
Resolved resolve_request_path(const std::string& request_path,
                              const std::filesystem::path& sandbox_root);

// Immediate visible children of `dir` (hidden dot-entries excluded; entries
// that are neither directories nor regular files skipped). Unordered.
std::vector<DirEntry> collect_listing(const std::filesystem::path& dir);

// Pure rendering: dirs first, then files, each sorted by name. Links are
// current_path (without trailing '/') + "/" + name, dirs with a trailing '/'.
std::string render_listing_html(std::vector<DirEntry> entries,
                                const std::string& current_path);

std::string html_escape(const std::string& s);

// Percent-encode everything except unreserved characters and '/'.
std::string url_encode_path(const std::string& s);

} // namespace cdnd
