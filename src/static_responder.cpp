#include "static_responder.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>

namespace fs = std::filesystem;

namespace wvb {

const std::unordered_map<std::string, std::string> StaticResponder::mime_types_ = {
    {".html", "text/html"},
    {".htm",  "text/html"},
    {".css",  "text/css"},
    {".js",   "application/javascript"},
    {".mjs",  "application/javascript"},
    {".json", "application/json"},
    {".map",  "application/json"},
    {".txt",  "text/plain"},
    {".xml",  "application/xml"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".webp", "image/webp"},
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
    {".wasm", "application/wasm"},
    {".pdf",  "application/pdf"},
};

namespace {

struct ByteRange {
    std::uintmax_t first = 0;
    std::uintmax_t last = 0;
};

enum class RangeParse { None, Satisfiable, Unsatisfiable };

// Single range only: "bytes=a-b", "bytes=a-" or "bytes=-n". Anything else,
// including multiple ranges, is ignored and the whole file is sent.
RangeParse parse_range(const std::string& header, std::uintmax_t size, ByteRange& out) {
    const std::string unit = "bytes=";
    if (header.compare(0, unit.size(), unit) != 0) return RangeParse::None;
    std::string value = header.substr(unit.size());
    if (value.find(',') != std::string::npos) return RangeParse::None;

    auto dash = value.find('-');
    if (dash == std::string::npos) return RangeParse::None;
    std::string first = value.substr(0, dash);
    std::string last = value.substr(dash + 1);
    auto digits = [](const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
    };

    try {
        if (first.empty()) {
            if (!digits(last)) return RangeParse::None;
            std::uintmax_t suffix = std::stoull(last);
            if (suffix == 0 || size == 0) return RangeParse::Unsatisfiable;
            out.first = suffix >= size ? 0 : size - suffix;
            out.last = size - 1;
            return RangeParse::Satisfiable;
        }
        if (!digits(first) || (!last.empty() && !digits(last))) return RangeParse::None;
        out.first = std::stoull(first);
        if (last.empty()) {
            out.last = size - 1;
        } else {
            std::uintmax_t requested = std::stoull(last);
            // A last byte before the first makes the header invalid, not unsatisfiable
            if (requested < out.first) return RangeParse::None;
            out.last = std::min<std::uintmax_t>(requested, size - 1);
        }
    } catch (const std::out_of_range&) {
        return RangeParse::None;
    }
    if (out.first >= size || out.last < out.first) return RangeParse::Unsatisfiable;
    return RangeParse::Satisfiable;
}

} // namespace

StaticResponder::StaticResponder(const ContentRoots& roots)
    : roots_(roots)
{
}

HttpResponse StaticResponder::respond(const HttpRequest& request) const {
    const std::string path = request.path();
    fs::path response_path;

    if (path.find('\0') != std::string::npos) {
        spdlog::warn("GET \"{}\" 400: NUL byte in path", request.target);
        return error_response(400);
    }

    // Resources that may be requested from the root, "/" or "/name"
    auto slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0) {
        try {
            response_path = roots_.resolve(path);
        } catch (const NotFoundError& e) {
            spdlog::info("GET \"{}\" 404: {}", path, e.what());
            return error_response(404, e.what());
        }
        spdlog::info("Response path \"{}\" \"{}\" root", path, response_path.generic_string());
        return serve_file(request, response_path);
    }

    auto root_index = roots_.match_prefix(path);
    if (!root_index) {
        spdlog::info("GET \"{}\" 403: outside every content root", path);
        return error_response(403);
    }

    // The basename may be found under a different root than the one matched
    try {
        response_path = roots_.resolve(path);
    } catch (const NotFoundError& e) {
        spdlog::info("GET \"{}\" 404: {}", path, e.what());
        return error_response(404, e.what());
    }
    spdlog::info("Response path \"{}\" \"{}\" {}", path, response_path.generic_string(), *root_index);
    return serve_file(request, response_path);
}

std::string StaticResponder::mime_type(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types_.find(ext);
    if (it != mime_types_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

HttpResponse StaticResponder::serve_file(const HttpRequest& request, const fs::path& relative) const {
    const fs::path absolute = roots_.absolute(relative);

    struct stat st{};
    std::ifstream file(absolute, std::ios::binary);
    if (!file.is_open() || ::stat(absolute.c_str(), &st) != 0) {
        spdlog::error("Cannot read \"{}\"", absolute.string());
        return error_response(500, "Cannot read file");
    }

    const std::string etag = fmt::format("\"{:x}-{:x}-{:x}\"",
        static_cast<unsigned long>(st.st_ino),
        static_cast<unsigned long>(st.st_size),
        static_cast<unsigned long>(st.st_mtime));
    const std::string last_modified = http_date(st.st_mtime);

    HttpResponse res;
    res.head_only = request.method == "HEAD";
    res.set_header("Content-Type", mime_type(relative));
    res.set_header("Last-Modified", last_modified);
    res.set_header("ETag", etag);
    res.set_header("Accept-Ranges", "bytes");
    res.set_header("Cache-Control", "no-cache");

    // If-None-Match takes precedence over If-Modified-Since
    if (auto inm = request.header("If-None-Match")) {
        if (*inm == etag || *inm == "*") {
            res.status = 304;
            return res;
        }
    } else if (auto ims = request.header("If-Modified-Since")) {
        auto since = parse_http_date(*ims);
        if (since && st.st_mtime <= *since) {
            res.status = 304;
            return res;
        }
    }

    std::string body((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
    const auto size = static_cast<std::uintmax_t>(body.size());

    if (auto range = request.header("Range")) {
        ByteRange br;
        switch (parse_range(*range, size, br)) {
            case RangeParse::Satisfiable:
                res.status = 206;
                res.set_header("Content-Range", fmt::format("bytes {}-{}/{}", br.first, br.last, size));
                res.body = body.substr(static_cast<std::size_t>(br.first),
                                       static_cast<std::size_t>(br.last - br.first + 1));
                return res;
            case RangeParse::Unsatisfiable: {
                HttpResponse unsatisfiable = error_response(416);
                unsatisfiable.set_header("Content-Range", fmt::format("bytes */{}", size));
                return unsatisfiable;
            }
            case RangeParse::None:
                break;
        }
    }

    res.body = std::move(body);
    return res;
}

} // namespace wvb
