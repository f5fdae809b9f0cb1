// ============================================================
// test_http.cpp -- HTTP head parsing, forms and byte ranges
// ============================================================

#include "../common/http.hpp"
#include <gtest/gtest.h>

using namespace http;

TEST(HttpParse, RequestHeadWithQueryAndHeaders) {
    std::string buf =
        "GET /files?id=3&token=a%2Bb HTTP/1.1\r\n"
        "Host: 10.0.0.2:8080\r\n"
        "Range: bytes=100-199\r\n"
        "X-Share-Token:  abc \r\n"
        "\r\n"
        "trailing";
    Request req;
    size_t head_len = 0;
    ASSERT_EQ(parse_request_head(buf, req, head_len), ParseResult::OK);
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/files");
    EXPECT_EQ(req.query_param("id"), "3");
    EXPECT_EQ(req.query_param("token"), "a+b");
    EXPECT_EQ(req.header("RANGE"), "bytes=100-199");
    EXPECT_EQ(req.header("x-share-token"), "abc");
    EXPECT_FALSE(req.has_header("if-range"));
    EXPECT_EQ(buf.substr(head_len), "trailing");
}

TEST(HttpParse, IncompleteAndMalformed) {
    Request req;
    size_t head_len = 0;
    EXPECT_EQ(parse_request_head("GET / HTTP/1.1\r\nHost: x\r\n", req, head_len),
              ParseResult::INCOMPLETE);
    EXPECT_EQ(parse_request_head("NONSENSE\r\n\r\n", req, head_len), ParseResult::BAD);
    EXPECT_EQ(parse_request_head("GET nopath HTTP/1.1\r\n\r\n", req, head_len), ParseResult::BAD);
}

TEST(HttpParse, OversizedHeadIsRejected) {
    std::string buf = "GET / HTTP/1.1\r\nX-Filler: " + std::string(MAX_HEAD_BYTES + 10, 'a');
    Request req;
    size_t head_len = 0;
    EXPECT_EQ(parse_request_head(buf, req, head_len), ParseResult::TOO_LARGE);
}

TEST(HttpParse, ResponseHead) {
    std::string buf = "HTTP/1.1 206 Partial Content\r\nContent-Range: bytes 5-9/10\r\n\r\nhello";
    Response resp;
    size_t head_len = 0;
    ASSERT_EQ(parse_response_head(buf, resp, head_len), ParseResult::OK);
    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.header("content-range"), "bytes 5-9/10");
    EXPECT_EQ(buf.substr(head_len), "hello");
}

TEST(HttpCodec, ResponseHeadSerialize) {
    ResponseHead rh(416);
    rh.add("Content-Range", "bytes */1000").content_length(0);
    std::string s = rh.serialize();
    EXPECT_EQ(s.rfind("HTTP/1.1 416 Range Not Satisfiable\r\n", 0), 0u);
    EXPECT_NE(s.find("Content-Range: bytes */1000\r\n"), std::string::npos);
    EXPECT_EQ(s.substr(s.size() - 4), "\r\n\r\n");
}

TEST(HttpCodec, UrlEncodingAndForms) {
    EXPECT_EQ(url_decode("p%40ss1"), "p@ss1");
    EXPECT_EQ(url_decode("a+b"), "a b");
    EXPECT_EQ(url_decode("a+b", false), "a+b");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_encode("My Photo (1).jpg"), "My%20Photo%20%281%29.jpg");
    EXPECT_EQ(url_decode(url_encode("\xC3\xA9t\xC3\xA9.txt")), "\xC3\xA9t\xC3\xA9.txt");

    QueryMap q = parse_query("password=p%40ss1&password=other&flag");
    EXPECT_EQ(q["password"], "p@ss1");
    EXPECT_EQ(q.count("flag"), 1u);
}

TEST(HttpRange, ExplicitAndOpenEnded) {
    ByteRange r;
    ASSERT_EQ(parse_range("bytes=100-199", 1000, r), RangeStatus::OK);
    EXPECT_TRUE(r.partial);
    EXPECT_EQ(r.start, 100u);
    EXPECT_EQ(r.end, 199u);
    EXPECT_EQ(r.length(), 100u);

    ASSERT_EQ(parse_range("bytes=500-", 1000, r), RangeStatus::OK);
    EXPECT_EQ(r.start, 500u);
    EXPECT_EQ(r.end, 999u);

    ASSERT_EQ(parse_range("bytes=900-5000", 1000, r), RangeStatus::OK);
    EXPECT_EQ(r.end, 999u);
}

TEST(HttpRange, SuffixForm) {
    ByteRange r;
    ASSERT_EQ(parse_range("bytes=-100", 1000, r), RangeStatus::OK);
    EXPECT_EQ(r.start, 900u);
    EXPECT_EQ(r.end, 999u);
    EXPECT_EQ(parse_range("bytes=-0", 1000, r), RangeStatus::UNSATISFIABLE);
}

TEST(HttpRange, WholeFileIsNotPartial) {
    ByteRange r;
    ASSERT_EQ(parse_range("bytes=0-", 1000, r), RangeStatus::OK);
    EXPECT_FALSE(r.partial);
}

TEST(HttpRange, MalformedAndUnsatisfiable) {
    ByteRange r;
    EXPECT_EQ(parse_range("bytes=0-1,5-6", 1000, r), RangeStatus::MALFORMED);
    EXPECT_EQ(parse_range("items=0-1", 1000, r), RangeStatus::MALFORMED);
    EXPECT_EQ(parse_range("bytes=20-10", 1000, r), RangeStatus::MALFORMED);
    EXPECT_EQ(parse_range("bytes=abc-", 1000, r), RangeStatus::MALFORMED);
    EXPECT_EQ(parse_range("bytes=1000-", 1000, r), RangeStatus::UNSATISFIABLE);
    EXPECT_EQ(parse_range("bytes=0-10", 0, r), RangeStatus::NONE);
}

TEST(HttpRange, SixtyFourBitOffsets) {
    const u64 five_gib = 5ULL * 1024 * 1024 * 1024;
    ByteRange r;
    ASSERT_EQ(parse_range("bytes=4294967296-", five_gib, r), RangeStatus::OK);
    EXPECT_EQ(r.start, 4294967296ULL);
    EXPECT_EQ(r.end, five_gib - 1);
    EXPECT_EQ(content_range(r.start, r.end, five_gib), "bytes 4294967296-5368709119/5368709120");
}

TEST(HttpMisc, IfRangeUsesStrongComparison) {
    EXPECT_TRUE(etag_strong_match("\"abc\"", "\"abc\""));
    EXPECT_TRUE(etag_strong_match(" \"abc\" ", "\"abc\""));
    EXPECT_FALSE(etag_strong_match("\"abc\"", "\"abd\""));
    EXPECT_FALSE(etag_strong_match("W/\"abc\"", "\"abc\""));
    EXPECT_FALSE(etag_strong_match("\"abc\"", "W/\"abc\""));
    EXPECT_FALSE(etag_strong_match("W/\"abc\"", "W/\"abc\""));
    EXPECT_FALSE(etag_strong_match("", ""));
}

TEST(HttpMisc, BrowserDetection) {
    EXPECT_TRUE(is_browser_user_agent("Mozilla/5.0 (X11; Linux x86_64)"));
    EXPECT_TRUE(is_browser_user_agent("SomethingSAFARI/1"));
    EXPECT_FALSE(is_browser_user_agent("LanShare-Client/1.0"));
    EXPECT_FALSE(is_browser_user_agent(""));
}

TEST(HttpMisc, HtmlEscape) {
    EXPECT_EQ(html_escape("<a href=\"x\">&'"), "&lt;a href=&quot;x&quot;&gt;&amp;&#39;");
}
