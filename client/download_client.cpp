// ============================================================
// download_client.cpp -- Resumable HTTP download implementation
// ============================================================

#include "download_client.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

static constexpr size_t MAX_SMALL_BODY = 1024 * 1024;

namespace {

struct ActiveReset {
    std::atomic<bool>& flag;
    ~ActiveReset() { flag.store(false); }
};

} // namespace

std::string DownloadTask::dest_path() const {
    return (fs::path(dest_dir) / file_io::safe_filename(filename)).string();
}

// "bytes 100-199/1000" -> 100
static bool content_range_start(const std::string& value, u64& start) {
    std::string v = utils::trim(value);
    if (v.rfind("bytes ", 0) != 0) return false;
    size_t dash = v.find('-', 6);
    if (dash == std::string::npos) return false;
    return utils::parse_u64(utils::trim(v.substr(6, dash - 6)), start);
}

ResumableDownloadClient::ResumableDownloadClient(ClientConfig config)
    : config_(std::move(config))
{}

std::string ResumableDownloadClient::token() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return config_.token;
}

// ============================================================
// Download lifecycle
// ============================================================

DownloadOutcome ResumableDownloadClient::download(const DownloadTask& task,
                                                  DownloadCallbacks callbacks)
{
    // pause() and cancel() check active_ under the same lock, so a stop
    // request can never land between the claim and the reset
    bool claimed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        bool expected = false;
        if (active_.compare_exchange_strong(expected, true)) {
            claimed = true;
            stop_reason_.store(StopReason::NONE);
            has_task_       = true;
            last_task_      = task;
            last_callbacks_ = callbacks;
        }
    }
    if (!claimed) {
        LOG_WARN("Rejected download of " + task.filename + ": another download is active");
        if (callbacks.on_error) {
            callbacks.on_error(ErrorKind::CONCURRENCY, "A download is already in progress");
        }
        return DownloadOutcome::REJECTED;
    }
    ActiveReset reset{active_};

    std::string path;
    ErrorKind   kind = ErrorKind::NETWORK;
    std::string message;
    try {
        path = run_download(task, callbacks);
    } catch (const TransferError& e) {
        kind    = e.kind();
        message = e.what();
    } catch (const std::exception& e) {
        kind    = ErrorKind::IO;
        message = e.what();
    }

    if (message.empty()) {
        LOG_INFO("Download complete: " + path);
        if (callbacks.on_complete) callbacks.on_complete(path);
        return DownloadOutcome::COMPLETED;
    }

    switch (stop_reason_.load()) {
        case StopReason::PAUSED:
            LOG_INFO("Download paused: " + task.filename);
            if (callbacks.on_error) callbacks.on_error(ErrorKind::NETWORK, "Download paused");
            return DownloadOutcome::PAUSED;
        case StopReason::CANCELLED:
            LOG_INFO("Download cancelled: " + task.filename);
            if (callbacks.on_error) callbacks.on_error(ErrorKind::NETWORK, "Download cancelled");
            return DownloadOutcome::CANCELLED;
        case StopReason::NONE:
            break;
    }

    Logger::get().transfer_error(std::string(error_kind_str(kind)) + ": " + task.filename +
                                 ": " + message);
    if (callbacks.on_error) callbacks.on_error(kind, message);
    return DownloadOutcome::FAILED;
}

void ResumableDownloadClient::pause() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!active_.load()) return;
    stop_reason_.store(StopReason::PAUSED);
    if (active_sock_) active_sock_->shutdown();
}

DownloadOutcome ResumableDownloadClient::resume() {
    DownloadTask task;
    DownloadCallbacks callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!has_task_) return DownloadOutcome::REJECTED;
        task      = last_task_;
        callbacks = last_callbacks_;
    }
    return download(task, callbacks);
}

void ResumableDownloadClient::cancel() {
    std::lock_guard<std::mutex> lk(mutex_);
    has_task_ = false;
    if (!active_.load()) return;
    stop_reason_.store(StopReason::CANCELLED);
    if (active_sock_) active_sock_->shutdown();
}

void ResumableDownloadClient::set_active_socket(TcpSocket* sock) {
    std::lock_guard<std::mutex> lk(mutex_);
    active_sock_ = sock;
}

// ---------------------------------------------------------------
// run_download
//   Throws on any failure; the partial file is left for resume.
// ---------------------------------------------------------------
std::string ResumableDownloadClient::run_download(const DownloadTask& task,
                                                  const DownloadCallbacks& callbacks)
{
    std::string path = task.dest_path();
    u64 existing = file_io::get_file_size(path);
    if (file_io::file_exists(path) && existing >= task.total_size) {
        LOG_INFO(task.filename + " already complete (" + utils::format_bytes(existing) + ")");
        return path;
    }

    TcpSocket sock;
    set_active_socket(&sock);
    struct SocketReset {
        ResumableDownloadClient& client;
        ~SocketReset() { client.set_active_socket(nullptr); }
    } sock_reset{*this};
    if (stop_reason_.load() != StopReason::NONE) throw NetworkError("Download interrupted");

    connect(sock);
    // shutdown() has no effect on a socket that was still connecting
    if (stop_reason_.load() != StopReason::NONE) throw NetworkError("Download interrupted");
    std::string extra;
    if (existing > 0) extra += "Range: bytes=" + std::to_string(existing) + "-\r\n";
    send_request(sock, "GET", "/files?id=" + std::to_string(task.file_id), extra, "");

    http::Response resp;
    std::string leftover;
    read_response_head(sock, resp, leftover);

    file_io::WriteMode mode = file_io::WriteMode::TRUNCATE;
    u64 start_offset = 0;
    switch (resp.status) {
        case 200:
            if (existing > 0) {
                LOG_WARN("Server ignored Range for " + task.filename + ", restarting from 0");
            }
            break;
        case 206: {
            u64 start = 0;
            if (!content_range_start(resp.header("content-range"), start) || start != existing) {
                throw NetworkError("Unexpected Content-Range '" + resp.header("content-range") +
                                   "' for resume at " + std::to_string(existing));
            }
            mode = file_io::WriteMode::APPEND;
            start_offset = existing;
            break;
        }
        case 401:
        case 403:
            throw AuthError("Server refused " + task.filename + ": HTTP " +
                            std::to_string(resp.status));
        default:
            throw NetworkError("Unexpected HTTP " + std::to_string(resp.status) + " " +
                               resp.reason + " for " + task.filename);
    }

    bool has_length = false;
    u64 body_length = 0;
    std::string cl = resp.header("content-length");
    if (!cl.empty()) {
        if (!utils::parse_u64(cl, body_length)) throw NetworkError("Bad Content-Length: " + cl);
        has_length = true;
    }

    LOG_INFO("Downloading " + task.filename + " to " + path +
             (start_offset > 0 ? " (resuming at " + utils::format_bytes(start_offset) + ")" : ""));

    file_io::FileWriter writer;
    writer.open(path, mode);

    ProgressMeter meter(config_.progress_interval_ms, callbacks.on_progress, start_offset);
    u64 received = 0;

    auto consume = [&](const char* data, size_t len) {
        if (has_length && received + len > body_length) len = (size_t)(body_length - received);
        if (len == 0) return;
        writer.write(data, len);
        received += len;
        meter.add(len);
    };

    consume(leftover.data(), leftover.size());

    std::vector<char> buf(CLIENT_RECV_CHUNK);
    while (!has_length || received < body_length) {
        size_t n = sock.recv_some(buf.data(), buf.size());
        if (n == 0) break;
        consume(buf.data(), n);
    }
    meter.flush();

    if (stop_reason_.load() != StopReason::NONE) {
        throw NetworkError("Download interrupted");
    }
    if (has_length && received < body_length) {
        throw NetworkError("Connection closed after " + std::to_string(received) + " of " +
                           std::to_string(body_length) + " bytes");
    }
    writer.close();

    u64 final_size = file_io::get_file_size(path);
    if (final_size != task.total_size) {
        throw SizeMismatchError(task.filename + ": received " + std::to_string(final_size) +
                                " bytes, expected " + std::to_string(task.total_size));
    }
    return path;
}

// ============================================================
// HTTP plumbing
// ============================================================

void ResumableDownloadClient::connect(TcpSocket& sock) {
    sock.connect(config_.host, config_.port, config_.connect_timeout_ms);
    sock.set_recv_timeout_ms(config_.recv_timeout_ms);
    sock.set_send_timeout_ms(config_.recv_timeout_ms);
}

void ResumableDownloadClient::send_request(TcpSocket& sock, const std::string& method,
                                           const std::string& target,
                                           const std::string& extra_headers,
                                           const std::string& body)
{
    std::string token = this->token();
    std::string req = method + " " + target + " HTTP/1.1\r\n";
    req += "Host: " + config_.host + ":" + std::to_string(config_.port) + "\r\n";
    req += "User-Agent: " + config_.user_agent + "\r\n";
    req += "Accept: */*\r\n";
    req += "Connection: close\r\n";
    if (!token.empty()) req += "X-Share-Token: " + token + "\r\n";
    req += extra_headers;
    if (!body.empty() || method == "POST") {
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    req += "\r\n";
    req += body;
    sock.send_all(req);
}

void ResumableDownloadClient::read_response_head(TcpSocket& sock, http::Response& resp,
                                                 std::string& leftover)
{
    std::string buf;
    char tmp[4096];
    for (;;) {
        size_t head_len = 0;
        switch (http::parse_response_head(buf, resp, head_len)) {
            case http::ParseResult::OK:
                leftover = buf.substr(head_len);
                return;
            case http::ParseResult::BAD:
                throw NetworkError("Malformed HTTP response from " + config_.host);
            case http::ParseResult::TOO_LARGE:
                throw NetworkError("HTTP response head too large from " + config_.host);
            case http::ParseResult::INCOMPLETE:
                break;
        }
        size_t n = sock.recv_some(tmp, sizeof(tmp));
        if (n == 0) throw NetworkError("Connection closed before response from " + config_.host);
        buf.append(tmp, n);
    }
}

std::string ResumableDownloadClient::exchange(const std::string& method, const std::string& target,
                                              const std::string& extra_headers,
                                              const std::string& body, http::Response& resp)
{
    TcpSocket sock;
    connect(sock);
    send_request(sock, method, target, extra_headers, body);

    std::string out;
    read_response_head(sock, resp, out);

    u64 length = 0;
    bool has_length = utils::parse_u64(resp.header("content-length"), length);
    if (has_length && length > MAX_SMALL_BODY) {
        throw NetworkError("Response body too large: " + std::to_string(length));
    }
    char tmp[4096];
    while (!has_length || out.size() < length) {
        size_t n = sock.recv_some(tmp, sizeof(tmp));
        if (n == 0) break;
        out.append(tmp, n);
        if (out.size() > MAX_SMALL_BODY) throw NetworkError("Response body too large");
    }
    if (has_length) {
        if (out.size() < length) throw NetworkError("Truncated response body");
        out.resize((size_t)length);
    }
    return out;
}

std::vector<RemoteFile> ResumableDownloadClient::fetch_file_list() {
    http::Response resp;
    std::string body = exchange("GET", "/info", "", "", resp);
    if (resp.status == 401 || resp.status == 403) {
        throw AuthError("File list refused: HTTP " + std::to_string(resp.status));
    }
    if (resp.status != 200) {
        throw NetworkError("File list failed: HTTP " + std::to_string(resp.status));
    }

    std::vector<RemoteFile> files;
    try {
        json list = json::parse(body);
        for (const auto& item : list) {
            RemoteFile rf;
            rf.id   = item.at("id").get<u64>();
            rf.name = item.at("name").get<std::string>();
            rf.size = item.at("size").get<u64>();
            files.push_back(std::move(rf));
        }
    } catch (const json::exception& e) {
        throw NetworkError("Malformed file list: " + std::string(e.what()));
    }
    return files;
}

std::string ResumableDownloadClient::login(const std::string& password) {
    http::Response resp;
    std::string body = exchange("POST", "/",
                                "Content-Type: application/x-www-form-urlencoded\r\n",
                                "password=" + http::url_encode(password), resp);
    if (resp.status == 404) {
        LOG_INFO("Server is not password-protected");
        return "";
    }
    if (resp.status == 401) throw AuthError("Invalid password");
    if (resp.status != 200) {
        throw NetworkError("Login failed: HTTP " + std::to_string(resp.status));
    }

    std::string token;
    try {
        json reply = json::parse(body);
        token = reply.at("token").get<std::string>();
    } catch (const json::exception& e) {
        throw NetworkError("Malformed login response: " + std::string(e.what()));
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        config_.token = token;
    }
    return token;
}
