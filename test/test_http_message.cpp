#include "errors.hpp"
#include "http_message.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace wvb;

using testing::HasSubstr;
using testing::Not;
using testing::Optional;

class TestHttpMessage : public testing::Test {};

// MARK: - Tests:

TEST_F(TestHttpMessage, parse_request_head) {
    auto req = parse_request_head(
        "POST /some/path?x=1 HTTP/1.1\r\n"
        "Host: localhost:8001\r\n"
        "content-length:  12 \r\n"
        "\r\n");

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.target, "/some/path?x=1");
    EXPECT_EQ(req.version, "HTTP/1.1");
    EXPECT_THAT(req.header("Content-Length"), Optional(std::string("12")));
    EXPECT_THAT(req.header("HOST"), Optional(std::string("localhost:8001")));
    EXPECT_EQ(req.header("Range"), std::nullopt);
}

TEST_F(TestHttpMessage, parse_request_head_rejects_garbage) {
    EXPECT_THROW(parse_request_head(""), HttpParseError);
    EXPECT_THROW(parse_request_head("GET\r\n\r\n"), HttpParseError);
    EXPECT_THROW(parse_request_head("GET / FTP/1.0\r\n\r\n"), HttpParseError);
    EXPECT_THROW(parse_request_head("GET / HTTP/1.1\r\nno colon here\r\n\r\n"), HttpParseError);
}

TEST_F(TestHttpMessage, path_strips_query_and_decodes) {
    HttpRequest req;
    req.target = "/web/my%20page.html?v=2#top";
    EXPECT_EQ(req.path(), "/web/my page.html");

    req.target = "/100%";
    EXPECT_EQ(req.path(), "/100%");
}

TEST_F(TestHttpMessage, serialize_sets_length_and_omits_head_body) {
    HttpResponse res;
    res.set_header("Content-Type", "text/plain");
    res.set_header("content-type", "text/html");
    res.body = "hello";

    const std::string full = res.serialize();
    EXPECT_THAT(full, HasSubstr("HTTP/1.1 200 OK\r\n"));
    EXPECT_THAT(full, HasSubstr("Content-Type: text/html\r\n"));
    EXPECT_THAT(full, Not(HasSubstr("text/plain")));
    EXPECT_THAT(full, HasSubstr("Content-Length: 5\r\n"));
    EXPECT_THAT(full, HasSubstr("Server: WebViewBridge/"));
    EXPECT_EQ(full.substr(full.size() - 9), "\r\n\r\nhello");

    res.head_only = true;
    const std::string head = res.serialize();
    EXPECT_THAT(head, HasSubstr("Content-Length: 5\r\n"));
    EXPECT_EQ(head.substr(head.size() - 4), "\r\n\r\n");
}

TEST_F(TestHttpMessage, error_response_escapes_message) {
    auto res = error_response(404, "File \"<x>.html\" not found.");
    EXPECT_EQ(res.status, 404);
    EXPECT_THAT(res.body, HasSubstr("404 Not Found"));
    EXPECT_THAT(res.body, HasSubstr("File &quot;&lt;x&gt;.html&quot; not found."));
}

TEST_F(TestHttpMessage, http_date_round_trip) {
    const std::time_t t = 784111777;  // Sun, 06 Nov 1994 08:49:37 GMT
    EXPECT_EQ(http_date(t), "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_THAT(parse_http_date("Sun, 06 Nov 1994 08:49:37 GMT"), Optional(t));
    EXPECT_EQ(parse_http_date("yesterday"), std::nullopt);
}

} // namespace
