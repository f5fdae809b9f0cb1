#pragma once

// ============================================================
// http.hpp -- Minimal HTTP/1.1 message codec
//
// Only what the transfer protocol needs: request/response heads,
// query strings, urlencoded forms and single byte ranges. Bodies
// are streamed by the caller, never parsed here.
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <utility>

namespace http {

// Request heads larger than this are rejected with 431
static constexpr size_t MAX_HEAD_BYTES = 16 * 1024;

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using QueryMap   = std::unordered_map<std::string, std::string>;

enum class ParseResult {
    OK,
    INCOMPLETE, // need more bytes
    BAD,        // malformed
    TOO_LARGE,  // head exceeds MAX_HEAD_BYTES
};

struct Request {
    std::string method;
    std::string target;    // as sent: "/files?id=0"
    std::string path;      // decoded path: "/files"
    std::string version;   // "HTTP/1.1"
    HeaderList  headers;   // names lowercased
    QueryMap    query;

    // Empty string when absent; name is case-insensitive
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;

    std::string query_param(const std::string& name) const;
    bool has_query(const std::string& name) const { return query.count(name) != 0; }
};

struct Response {
    int         status{0};
    std::string reason;
    HeaderList  headers;

    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

// Parse a request head from the start of buf. On OK, head_len is the
// number of bytes consumed including the blank line.
ParseResult parse_request_head(const std::string& buf, Request& out, size_t& head_len);
ParseResult parse_response_head(const std::string& buf, Response& out, size_t& head_len);

// ---- Response head builder ----
class ResponseHead {
public:
    explicit ResponseHead(int status) : status_(status) {}

    ResponseHead& add(const std::string& name, const std::string& value) {
        headers_.emplace_back(name, value);
        return *this;
    }
    ResponseHead& content_length(u64 n) { return add("Content-Length", std::to_string(n)); }
    ResponseHead& content_type(const std::string& ct) { return add("Content-Type", ct); }

    int status() const { return status_; }
    std::string serialize() const;

private:
    int status_;
    HeaderList headers_;
};

const char* status_text(int status);

// ---- URL / form encoding ----
std::string url_decode(const std::string& s, bool plus_as_space = true);
std::string url_encode(const std::string& s);
QueryMap parse_query(const std::string& qs);

// ---- Range (RFC 7233, single range only) ----

struct ByteRange {
    u64  start{0};
    u64  end{0};      // inclusive
    bool partial{false};

    u64 length() const { return end - start + 1; }
};

enum class RangeStatus {
    NONE,           // no Range header (or empty resource): serve everything
    OK,             // range parsed; see ByteRange::partial
    MALFORMED,      // unparseable or multi-range: serve everything
    UNSATISFIABLE,  // start beyond the end: 416
};

RangeStatus parse_range(const std::string& header, u64 total, ByteRange& out);

// "bytes start-end/total"
std::string content_range(u64 start, u64 end, u64 total);

// Strong comparison (RFC 7232 2.3.2): a weak validator on either side never matches
bool etag_strong_match(const std::string& a, const std::string& b);

// Best-effort browser detection from a User-Agent string
bool is_browser_user_agent(const std::string& ua);

// Escape text for inclusion in HTML element content or attributes
std::string html_escape(const std::string& s);

} // namespace http
