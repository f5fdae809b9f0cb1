// ============================================================
// http.cpp -- HTTP/1.1 message codec implementation
// ============================================================

#include "http.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <sstream>

namespace http {

// ---- Header lookup ----

static std::string find_header(const HeaderList& headers, const std::string& name) {
    std::string key = utils::to_lower(name);
    for (const auto& kv : headers) {
        if (kv.first == key) return kv.second;
    }
    return "";
}

static bool contains_header(const HeaderList& headers, const std::string& name) {
    std::string key = utils::to_lower(name);
    for (const auto& kv : headers) {
        if (kv.first == key) return true;
    }
    return false;
}

std::string Request::header(const std::string& name) const  { return find_header(headers, name); }
bool Request::has_header(const std::string& name) const     { return contains_header(headers, name); }
std::string Response::header(const std::string& name) const { return find_header(headers, name); }
bool Response::has_header(const std::string& name) const    { return contains_header(headers, name); }

std::string Request::query_param(const std::string& name) const {
    auto it = query.find(name);
    return it != query.end() ? it->second : "";
}

// ---- Head parsing ----

// Locate the blank line ending the head. Accepts bare LF line endings.
static bool find_head_end(const std::string& buf, size_t& head_len) {
    size_t crlf = buf.find("\r\n\r\n");
    size_t lf   = buf.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) return false;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
        head_len = crlf + 4;
    } else {
        head_len = lf + 2;
    }
    return true;
}

static std::vector<std::string> split_lines(const std::string& head) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < head.size()) {
        size_t nl = head.find('\n', pos);
        if (nl == std::string::npos) nl = head.size();
        std::string line = head.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        pos = nl + 1;
    }
    return lines;
}

static bool parse_header_lines(const std::vector<std::string>& lines, HeaderList& out) {
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        std::string name = utils::to_lower(utils::trim(line.substr(0, colon)));
        std::string value = utils::trim(line.substr(colon + 1));
        if (name.find(' ') != std::string::npos) return false;
        out.emplace_back(std::move(name), std::move(value));
    }
    return true;
}

ParseResult parse_request_head(const std::string& buf, Request& out, size_t& head_len) {
    if (!find_head_end(buf, head_len)) {
        return buf.size() > MAX_HEAD_BYTES ? ParseResult::TOO_LARGE : ParseResult::INCOMPLETE;
    }
    if (head_len > MAX_HEAD_BYTES) return ParseResult::TOO_LARGE;

    auto lines = split_lines(buf.substr(0, head_len));
    if (lines.empty()) return ParseResult::BAD;

    std::istringstream rl(lines[0]);
    Request req;
    if (!(rl >> req.method >> req.target >> req.version)) return ParseResult::BAD;
    if (req.version.rfind("HTTP/1.", 0) != 0) return ParseResult::BAD;
    if (req.target.empty() || req.target[0] != '/') return ParseResult::BAD;

    size_t q = req.target.find('?');
    if (q == std::string::npos) {
        req.path = url_decode(req.target, false);
    } else {
        req.path  = url_decode(req.target.substr(0, q), false);
        req.query = parse_query(req.target.substr(q + 1));
    }

    if (!parse_header_lines(lines, req.headers)) return ParseResult::BAD;

    out = std::move(req);
    return ParseResult::OK;
}

ParseResult parse_response_head(const std::string& buf, Response& out, size_t& head_len) {
    if (!find_head_end(buf, head_len)) {
        return buf.size() > MAX_HEAD_BYTES ? ParseResult::TOO_LARGE : ParseResult::INCOMPLETE;
    }
    if (head_len > MAX_HEAD_BYTES) return ParseResult::TOO_LARGE;

    auto lines = split_lines(buf.substr(0, head_len));
    if (lines.empty()) return ParseResult::BAD;

    // "HTTP/1.1 206 Partial Content"
    const std::string& sl = lines[0];
    if (sl.rfind("HTTP/1.", 0) != 0) return ParseResult::BAD;
    size_t sp1 = sl.find(' ');
    if (sp1 == std::string::npos) return ParseResult::BAD;
    size_t sp2 = sl.find(' ', sp1 + 1);
    std::string code = sl.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    u64 status = 0;
    if (!utils::parse_u64(code, status) || status < 100 || status > 999) return ParseResult::BAD;

    Response resp;
    resp.status = (int)status;
    resp.reason = sp2 == std::string::npos ? "" : sl.substr(sp2 + 1);
    if (!parse_header_lines(lines, resp.headers)) return ParseResult::BAD;

    out = std::move(resp);
    return ParseResult::OK;
}

// ---- Response head ----

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 410: return "Gone";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

std::string ResponseHead::serialize() const {
    std::string out = "HTTP/1.1 " + std::to_string(status_) + " " + status_text(status_) + "\r\n";
    for (const auto& kv : headers_) {
        out += kv.first;
        out += ": ";
        out += kv.second;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

// ---- URL / form encoding ----

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s, bool plus_as_space) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+' && plus_as_space) {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += (char)((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out += (char)c;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0xF];
        }
    }
    return out;
}

QueryMap parse_query(const std::string& qs) {
    QueryMap out;
    size_t pos = 0;
    while (pos <= qs.size()) {
        size_t amp = qs.find('&', pos);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(eq == std::string::npos ? pair : pair.substr(0, eq));
            std::string val = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            // First occurrence wins
            out.emplace(std::move(key), std::move(val));
        }
        pos = amp + 1;
    }
    return out;
}

// ---- Range ----

RangeStatus parse_range(const std::string& header, u64 total, ByteRange& out) {
    out.start   = 0;
    out.end     = total > 0 ? total - 1 : 0;
    out.partial = false;

    if (header.empty() || total == 0) return RangeStatus::NONE;

    std::string h = utils::trim(header);
    if (h.rfind("bytes=", 0) != 0) return RangeStatus::MALFORMED;
    std::string byte_range = utils::trim(h.substr(6));
    if (byte_range.find(',') != std::string::npos) return RangeStatus::MALFORMED;

    size_t dash = byte_range.find('-');
    if (dash == std::string::npos) return RangeStatus::MALFORMED;
    std::string first = utils::trim(byte_range.substr(0, dash));
    std::string last  = utils::trim(byte_range.substr(dash + 1));

    u64 start = 0;
    u64 end   = total - 1;

    if (first.empty()) {
        // Suffix form "bytes=-N": the last N bytes
        u64 n = 0;
        if (!utils::parse_u64(last, n)) return RangeStatus::MALFORMED;
        if (n == 0) return RangeStatus::UNSATISFIABLE;
        start = n >= total ? 0 : total - n;
    } else {
        if (!utils::parse_u64(first, start)) return RangeStatus::MALFORMED;
        if (!last.empty()) {
            if (!utils::parse_u64(last, end)) return RangeStatus::MALFORMED;
            if (end < start) return RangeStatus::MALFORMED;
        }
        if (start >= total) return RangeStatus::UNSATISFIABLE;
        if (end >= total) end = total - 1;
    }

    out.start   = start;
    out.end     = end;
    out.partial = start > 0 || end < total - 1;
    return RangeStatus::OK;
}

std::string content_range(u64 start, u64 end, u64 total) {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) +
           "/" + std::to_string(total);
}

bool etag_strong_match(const std::string& a, const std::string& b) {
    std::string x = utils::trim(a);
    std::string y = utils::trim(b);
    if (x.empty() || x.rfind("W/", 0) == 0 || y.rfind("W/", 0) == 0) return false;
    return x == y;
}

bool is_browser_user_agent(const std::string& ua) {
    std::string lower = utils::to_lower(ua);
    return lower.find("mozilla") != std::string::npos ||
           lower.find("chrome")  != std::string::npos ||
           lower.find("safari")  != std::string::npos;
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;
        }
    }
    return out;
}

} // namespace http
