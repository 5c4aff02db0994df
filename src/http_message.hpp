#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wvb {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;
    std::string version = "HTTP/1.1";
    HeaderList headers;
    std::string body;

    // Case-insensitive lookup of the first header with this name
    std::optional<std::string> header(const std::string& name) const;

    // Target without query string or fragment, percent-decoded
    std::string path() const;
};

struct HttpResponse {
    int status = 200;
    HeaderList headers;
    std::string body;
    bool head_only = false; // HEAD: advertise Content-Length, send no body

    void set_header(const std::string& name, const std::string& value);
    std::optional<std::string> header(const std::string& name) const;
    std::string serialize() const;
};

// Parses "METHOD target VERSION" plus header lines, up to the blank line.
// Throws HttpParseError.
HttpRequest parse_request_head(const std::string& head);

const char* status_text(int status);

// Small HTML error page, optionally carrying a message
HttpResponse error_response(int status, const std::string& message = "");

std::string percent_decode(const std::string& text);
std::string html_escape(const std::string& text);

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string http_date(std::time_t t);
std::optional<std::time_t> parse_http_date(const std::string& text);

} // namespace wvb
