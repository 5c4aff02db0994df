#include "http_message.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <time.h>

namespace wvb {

static bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

static std::optional<std::string> find_header(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return std::nullopt;
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    return find_header(headers, name);
}

std::string HttpRequest::path() const {
    std::string p = target;
    auto cut = p.find_first_of("?#");
    if (cut != std::string::npos) {
        p = p.substr(0, cut);
    }
    return percent_decode(p);
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    return find_header(headers, name);
}

std::string HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n"
        << "Server: " << server_version_token() << "\r\n"
        << "Date: " << http_date(std::time(nullptr)) << "\r\n";
    for (const auto& [key, value] : headers) {
        oss << key << ": " << value << "\r\n";
    }
    if (status != 304 && !header("Content-Length")) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    oss << "Access-Control-Allow-Origin: *\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    if (!head_only && status != 304) {
        oss << body;
    }
    return oss.str();
}

HttpRequest parse_request_head(const std::string& head) {
    HttpRequest req;
    std::istringstream in(head);
    std::string line;

    if (!std::getline(in, line)) {
        throw HttpParseError("Empty request");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // "GET /path HTTP/1.1"
    auto first_space = line.find(' ');
    auto last_space = line.rfind(' ');
    if (first_space == std::string::npos || last_space == first_space) {
        throw HttpParseError("Bad request line: " + line);
    }
    req.method = line.substr(0, first_space);
    req.target = line.substr(first_space + 1, last_space - first_space - 1);
    req.version = line.substr(last_space + 1);
    if (req.target.empty() || req.version.compare(0, 5, "HTTP/") != 0) {
        throw HttpParseError("Bad request line: " + line);
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw HttpParseError("Bad header line: " + line);
        }
        req.headers.emplace_back(line.substr(0, colon), trim(line.substr(colon + 1)));
    }
    return req;
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 416: return "Range Not Satisfiable";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}

HttpResponse error_response(int status, const std::string& message) {
    const std::string title = std::to_string(status) + " " + status_text(status);
    HttpResponse res;
    res.status = status;
    res.set_header("Content-Type", "text/html;charset=utf-8");
    res.body = "<html><head><title>" + title + "</title></head><body><h1>" + title + "</h1>";
    if (!message.empty()) {
        res.body += "<p>" + html_escape(message) + "</p>";
    }
    res.body += "</body></html>";
    return res;
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

std::string html_escape(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:  out.push_back(c);
        }
    }
    return out;
}

std::string http_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buf;
}

std::optional<std::time_t> parse_http_date(const std::string& text) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    if (!end) {
        return std::nullopt;
    }
    return timegm(&tm);
}

} // namespace wvb
