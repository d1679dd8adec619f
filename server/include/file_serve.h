#pragma once
#include "httplib.h"

#include <filesystem>
#include <string>

namespace cdnd {

// ext must be lowercase and include the dot (".mp3").
// Returns "application/octet-stream" for anything unknown.
std::string mime_for_ext(const std::string& ext);

// Stream a regular file. Range requests are answered by httplib from the
// content provider (206 + Content-Range). Returns false and writes 404 if
// the file cannot be opened.
bool serve_file(httplib::Response& res, const std::filesystem::path& abs_path);

// Small fixed page (login.html). Read fully, never cached.
bool serve_static_page(httplib::Response& res,
                       const std::string& abs_path,
                       const std::string& content_type);

} // namespace cdnd
