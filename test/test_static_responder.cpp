#include "static_responder.hpp"
#include "temp_tree.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace wvb;

namespace fs = std::filesystem;

using testing::HasSubstr;
using testing::Optional;

class TestStaticResponder : public testing::Test {
protected:
    void SetUp() override {
        tree_.write("app/web/app.js", "console.log(1);");
        tree_.write("app/web/style.css", "body {}");
        tree_.write("app/web/my page.html", "<p>spaced</p>");
        tree_.write("app/lib/index.html", "<h1>library</h1>");
        tree_.write("app/lib/data.bin", "0123456789");
        tree_.write("app/other/secret.html", "<p>outside</p>");
        roots_ = std::make_unique<ContentRoots>(
            std::vector<fs::path>{tree_.path() / "app/web", tree_.path() / "app/lib"});
        responder_ = std::make_unique<StaticResponder>(*roots_);
    }

    HttpResponse get(const std::string& target, const HeaderList& headers = {}) const {
        HttpRequest req;
        req.method = "GET";
        req.target = target;
        req.headers = headers;
        return responder_->respond(req);
    }

    test::TempTree tree_;
    std::unique_ptr<ContentRoots> roots_;
    std::unique_ptr<StaticResponder> responder_;
};

// MARK: - Tests:

TEST_F(TestStaticResponder, root_serves_index) {
    auto res = get("/");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "<h1>library</h1>");
    EXPECT_THAT(res.header("Content-Type"), Optional(std::string("text/html")));
}

TEST_F(TestStaticResponder, root_level_name_skips_prefix_check) {
    auto res = get("/app.js");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "console.log(1);");
    EXPECT_THAT(res.header("Content-Type"), Optional(std::string("application/javascript")));

    EXPECT_EQ(get("/missing.html").status, 404);
}

// The prefix only has to name an allowed root; the file itself comes from
// whichever root has that basename first.
TEST_F(TestStaticResponder, basename_search_is_global) {
    auto res = get("/web/index.html");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "<h1>library</h1>");

    res = get("/lib/deeper/app.js");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "console.log(1);");
}

TEST_F(TestStaticResponder, outside_every_root_is_forbidden) {
    // index.html exists under lib, but the prefix check comes first
    EXPECT_EQ(get("/other/index.html").status, 403);
    EXPECT_EQ(get("/other/secret.html").status, 403);
}

TEST_F(TestStaticResponder, missing_file_is_not_found_with_message) {
    auto res = get("/web/nope.html");
    EXPECT_EQ(res.status, 404);
    EXPECT_THAT(res.body, HasSubstr("File &quot;nope.html&quot; not found."));
}

TEST_F(TestStaticResponder, query_is_ignored_and_path_decoded) {
    EXPECT_EQ(get("/web/app.js?v=2").body, "console.log(1);");
    EXPECT_EQ(get("/web/my%20page.html").body, "<p>spaced</p>");
}

TEST_F(TestStaticResponder, nul_in_decoded_path_is_bad_request) {
    EXPECT_EQ(get("/web/app.js%00.png").status, 400);
    EXPECT_EQ(get("/app.js%00").status, 400);
}

TEST_F(TestStaticResponder, content_types) {
    EXPECT_THAT(get("/web/style.css").header("Content-Type"), Optional(std::string("text/css")));
    EXPECT_THAT(get("/lib/data.bin").header("Content-Type"), Optional(std::string("application/octet-stream")));
    EXPECT_EQ(StaticResponder::mime_type("X.PNG"), "image/png");
    EXPECT_EQ(StaticResponder::mime_type("x.\xC3\x89TE"), "application/octet-stream");
}

TEST_F(TestStaticResponder, etag_not_modified) {
    auto first = get("/web/app.js");
    auto etag = first.header("ETag");
    ASSERT_TRUE(etag.has_value());

    auto again = get("/web/app.js", {{"If-None-Match", *etag}});
    EXPECT_EQ(again.status, 304);
    EXPECT_TRUE(again.body.empty());

    EXPECT_EQ(get("/web/app.js", {{"If-None-Match", "\"stale\""}}).status, 200);
}

TEST_F(TestStaticResponder, if_modified_since) {
    EXPECT_EQ(get("/web/app.js", {{"If-Modified-Since", "Fri, 01 Jan 2100 00:00:00 GMT"}}).status, 304);
    EXPECT_EQ(get("/web/app.js", {{"If-Modified-Since", "Thu, 01 Jan 1970 00:00:00 GMT"}}).status, 200);
}

TEST_F(TestStaticResponder, byte_ranges) {
    auto res = get("/lib/data.bin", {{"Range", "bytes=2-5"}});
    EXPECT_EQ(res.status, 206);
    EXPECT_EQ(res.body, "2345");
    EXPECT_THAT(res.header("Content-Range"), Optional(std::string("bytes 2-5/10")));

    res = get("/lib/data.bin", {{"Range", "bytes=-3"}});
    EXPECT_EQ(res.status, 206);
    EXPECT_EQ(res.body, "789");

    res = get("/lib/data.bin", {{"Range", "bytes=7-"}});
    EXPECT_EQ(res.body, "789");

    res = get("/lib/data.bin", {{"Range", "bytes=50-60"}});
    EXPECT_EQ(res.status, 416);
    EXPECT_THAT(res.header("Content-Range"), Optional(std::string("bytes */10")));

    // Last byte before the first: the header is ignored
    res = get("/lib/data.bin", {{"Range", "bytes=5-3"}});
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "0123456789");

    res = get("/lib/data.bin", {{"Range", "bytes=10-"}});
    EXPECT_EQ(res.status, 416);

    // Multiple ranges aren't supported; the whole file is sent
    res = get("/lib/data.bin", {{"Range", "bytes=0-1,4-5"}});
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "0123456789");
}

TEST_F(TestStaticResponder, head_has_no_body_on_the_wire) {
    HttpRequest req;
    req.method = "HEAD";
    req.target = "/web/app.js";
    auto res = responder_->respond(req);

    EXPECT_EQ(res.status, 200);
    EXPECT_TRUE(res.head_only);
    const std::string wire = res.serialize();
    EXPECT_THAT(wire, HasSubstr("Content-Length: 15\r\n"));
    EXPECT_EQ(wire.find("console.log"), std::string::npos);
}

TEST_F(TestStaticResponder, repeated_get_is_identical) {
    auto a = get("/web/index.html");
    auto b = get("/web/index.html");
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.headers, b.headers);
    EXPECT_EQ(a.body, b.body);
}

} // namespace
