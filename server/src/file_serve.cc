#include "file_serve.h"
#include "cdnd_util.h"

#include <algorithm>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace cdnd {

static constexpr size_t kChunkBytes = 64 * 1024;

std::string mime_for_ext(const std::string& ext) {
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".js")    return "application/javascript; charset=utf-8";
    if (ext == ".css")   return "text/css; charset=utf-8";
    if (ext == ".json")  return "application/json";
    if (ext == ".txt")   return "text/plain; charset=utf-8";
    if (ext == ".svg")   return "image/svg+xml";
    if (ext == ".png")   return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".webp")  return "image/webp";
    if (ext == ".gif")   return "image/gif";
    if (ext == ".ico")   return "image/x-icon";
    if (ext == ".mp3")   return "audio/mpeg";
    if (ext == ".m4a")   return "audio/mp4";
    if (ext == ".aac")   return "audio/aac";
    if (ext == ".flac")  return "audio/flac";
    if (ext == ".ogg" || ext == ".oga") return "audio/ogg";
    if (ext == ".opus")  return "audio/opus";
    if (ext == ".wav")   return "audio/wav";
    if (ext == ".mp4")   return "video/mp4";
    if (ext == ".webm")  return "video/webm";
    if (ext == ".pdf")   return "application/pdf";
    if (ext == ".zip")   return "application/zip";
    if (ext == ".woff")  return "font/woff";
    if (ext == ".woff2") return "font/woff2";
    return "application/octet-stream";
}

bool serve_file(httplib::Response& res, const std::filesystem::path& abs_path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(abs_path, ec);

    auto in = std::make_shared<std::ifstream>(abs_path, std::ios::in | std::ios::binary);
    if (ec || !in->good()) {
        res.status = 404;
        res.set_content("Not found", "text/plain; charset=utf-8");
        return false;
    }

    const std::string ct = mime_for_ext(lower_ascii(abs_path.extension().string()));

    res.set_header("X-Content-Type-Options", "nosniff");
    res.set_header("Accept-Ranges", "bytes");

    // httplib calls the provider with (offset, length) of the requested
    // range, repeatedly, until `length` bytes of that range are written.
    // A failed sink write means the client went away: stop this transfer.
    res.set_content_provider(
        (size_t)size, ct,
        [in](size_t offset, size_t length, httplib::DataSink& sink) {
            std::vector<char> buf(std::min(length, kChunkBytes));
            in->clear();
            in->seekg((std::streamoff)offset);
            in->read(buf.data(), (std::streamsize)buf.size());
            const std::streamsize n = in->gcount();
            if (n <= 0) return false;
            return sink.write(buf.data(), (size_t)n);
        });

    // Status left unset: httplib picks 200 or 206 from the request ranges.
    return true;
}

bool serve_static_page(httplib::Response& res,
                       const std::string& abs_path,
                       const std::string& content_type) {
    std::string body;
    if (!read_file_to_string(abs_path, body) || body.empty()) {
        res.status = 500;
        res.set_content("Missing static file: " + abs_path, "text/plain; charset=utf-8");
        return false;
    }

    res.set_header("X-Content-Type-Options", "nosniff");
    res.set_header("X-Frame-Options", "DENY");
    res.set_header("Referrer-Policy", "no-referrer");
    res.set_header("Cache-Control", "no-store");

    res.set_content(std::move(body), content_type);
    res.status = 200;
    return true;
}

} // namespace cdnd
