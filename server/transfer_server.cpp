// ============================================================
// transfer_server.cpp -- LanShare HTTP server implementation
// ============================================================

#include "transfer_server.hpp"
#include "html_pages.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>
#include <vector>

using json = nlohmann::json;

static constexpr size_t MAX_FORM_BYTES = 16 * 1024;
static const char* HTML_TYPE = "text/html; charset=utf-8";
static const char* TEXT_TYPE = "text/plain; charset=utf-8";

namespace {

// Releases the single-flight slot when a transfer handler returns
struct InFlightReset {
    std::atomic<bool>& flag;
    ~InFlightReset() { flag.store(false); }
};

// Removes a temporary bundle once it has been served (or failed)
struct TempFileGuard {
    std::string path;
    ~TempFileGuard() { file_io::remove_quietly(path); }
};

} // namespace

// attachment; filename="<ascii>"; filename*=UTF-8''<pct-encoded>
static std::string content_disposition(const std::string& name) {
    std::string ascii;
    ascii.reserve(name.size());
    bool plain = true;
    for (unsigned char c : name) {
        if (c < 0x20 || c >= 0x7F || c == '"' || c == '\\') {
            ascii += '_';
            plain = false;
        } else {
            ascii += (char)c;
        }
    }
    std::string out = "attachment; filename=\"" + ascii + "\"";
    if (!plain) out += "; filename*=UTF-8''" + http::url_encode(name);
    return out;
}

// ============================================================
// Lifecycle
// ============================================================

TransferServer::TransferServer(ServerConfig config, ServerCallbacks callbacks)
    : config_(std::move(config))
    , callbacks_(std::move(callbacks))
{}

TransferServer::~TransferServer() {
    stop();
}

ServerInfo TransferServer::start(SharedFileList files) {
    if (running_.load()) throw ConcurrencyError("Server already running");

    std::string host = config_.advertise_host.empty() ? utils::first_lan_ipv4()
                                                      : config_.advertise_host;
    if (host.empty()) {
        throw BindError("No non-loopback IPv4 interface to advertise");
    }

    std::unique_ptr<AuthManager> auth;
    if (!config_.password.empty()) auth = std::make_unique<AuthManager>(config_.password);

    try {
        TcpSocket sock;
        sock.bind_and_listen(config_.listen_ip, config_.listen_port);
        listen_sock_ = std::move(sock);
    } catch (const NetworkError& e) {
        throw BindError(e.what());
    }

    ServerInfo info;
    info.host = host;
    info.port = listen_sock_.local_port();
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        files_ = std::move(files);
        auth_  = std::move(auth);
        info_  = info;
    }
    transfer_in_flight_.store(false);
    running_.store(true);

    accept_thread_ = std::thread([this] { accept_loop(); });

    LOG_INFO("LanShare server listening on " + config_.listen_ip + ":" +
             std::to_string(info.port) + " (" + std::to_string(files_.size()) +
             " files) - open " + info.url());
    if (auth_) LOG_INFO("Password protection enabled");
    return info;
}

void TransferServer::stop() {
    if (!running_.exchange(false)) return;

    listen_sock_.shutdown();
    if (accept_thread_.joinable()) accept_thread_.join();
    listen_sock_.close();

    // No connection can be spawned once the accept thread is gone
    std::vector<std::thread> handlers;
    {
        std::lock_guard<std::mutex> lk(conns_mutex_);
        if (active_encoder_) active_encoder_->cancel();
        for (auto& kv : live_conns_) {
            kv.second.sock->shutdown();
            handlers.push_back(std::move(kv.second.thread));
        }
        live_conns_.clear();
        finished_conns_.clear();
    }
    if (!handlers.empty()) {
        LOG_DEBUG("Waiting for " + std::to_string(handlers.size()) + " connection(s)");
    }
    for (auto& t : handlers) {
        if (t.joinable()) t.join();
    }

    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        auth_.reset();
        files_.clear();
        info_ = ServerInfo();
    }
    transfer_in_flight_.store(false);
    LOG_INFO("Server stopped");
}

ServerInfo TransferServer::info() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return info_;
}

std::string TransferServer::token() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return auth_ ? auth_->token() : "";
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop; every accepted socket gets its own thread
//   so a slow client never delays the next accept.
// ---------------------------------------------------------------
void TransferServer::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            LOG_DEBUG("Accepted connection from " + sock.peer_addr());
            spawn_connection(std::move(sock));
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

void TransferServer::spawn_connection(TcpSocket s) {
    reap_connections();

    auto sock = std::make_shared<TcpSocket>(std::move(s));
    u64 id;
    {
        std::lock_guard<std::mutex> lk(conns_mutex_);
        id = next_conn_id_++;
        live_conns_[id].sock = sock;
    }
    try {
        std::thread t([this, sock, id] {
            serve_connection(*sock);
            std::lock_guard<std::mutex> lk(conns_mutex_);
            finished_conns_.push_back(id);
        });
        std::lock_guard<std::mutex> lk(conns_mutex_);
        live_conns_[id].thread = std::move(t);
    } catch (const std::system_error& e) {
        LOG_ERROR("Cannot start connection thread: " + std::string(e.what()));
        std::lock_guard<std::mutex> lk(conns_mutex_);
        live_conns_.erase(id);
    }
}

void TransferServer::reap_connections() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lk(conns_mutex_);
        for (u64 id : finished_conns_) {
            auto it = live_conns_.find(id);
            if (it == live_conns_.end()) continue;
            done.push_back(std::move(it->second.thread));
            live_conns_.erase(it);
        }
        finished_conns_.clear();
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void TransferServer::serve_connection(TcpSocket& sock) {
    std::string peer = sock.peer_addr();
    try {
        sock.tune();
        sock.set_send_timeout_ms(config_.send_timeout_ms);

        http::Request req;
        std::string leftover;
        if (!read_request(sock, req, leftover)) return;

        LOG_DEBUG(peer + " " + req.method + " " + req.path);
        route(sock, req, leftover);
    } catch (const NetworkError& e) {
        LOG_DEBUG("Connection " + peer + ": " + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Connection " + peer + ": " + e.what());
    }
}

// ============================================================
// Request reading
// ============================================================

bool TransferServer::read_request(TcpSocket& sock, http::Request& req, std::string& leftover) {
    sock.set_recv_timeout_ms(config_.head_timeout_ms);
    u64 deadline = utils::now_ms() + (u64)config_.head_timeout_ms;

    std::string buf;
    char tmp[4096];
    for (;;) {
        size_t head_len = 0;
        switch (http::parse_request_head(buf, req, head_len)) {
            case http::ParseResult::OK:
                leftover = buf.substr(head_len);
                return true;
            case http::ParseResult::TOO_LARGE:
                send_text(sock, 431, TEXT_TYPE, "Request header too large\n");
                return false;
            case http::ParseResult::BAD:
                send_text(sock, 400, TEXT_TYPE, "Bad request\n");
                return false;
            case http::ParseResult::INCOMPLETE:
                break;
        }
        if (utils::now_ms() >= deadline) {
            LOG_DEBUG("Request head timed out from " + sock.peer_addr());
            return false;
        }
        size_t n = sock.recv_some(tmp, sizeof(tmp));
        if (n == 0) return false;
        buf.append(tmp, n);
    }
}

bool TransferServer::read_body(TcpSocket& sock, const http::Request& req,
                               std::string leftover, std::string& body)
{
    if (!req.header("transfer-encoding").empty()) return false;

    u64 length = 0;
    std::string cl = req.header("content-length");
    if (cl.empty() || !utils::parse_u64(cl, length) || length > MAX_FORM_BYTES) return false;

    body = std::move(leftover);
    char tmp[4096];
    while (body.size() < length) {
        size_t n = sock.recv_some(tmp, sizeof(tmp));
        if (n == 0) return false;
        body.append(tmp, n);
    }
    body.resize((size_t)length);
    return true;
}

// ============================================================
// Routing and auth
// ============================================================

void TransferServer::route(TcpSocket& sock, const http::Request& req, const std::string& leftover) {
    const std::string& m = req.method;
    bool get_or_head = (m == "GET" || m == "HEAD");

    if (req.path == "/") {
        if (get_or_head)   handle_root_get(sock, req);
        else if (m == "POST") handle_root_post(sock, req, leftover);
        else send_text(sock, 405, TEXT_TYPE, "Method not allowed\n", {{"Allow", "GET, HEAD, POST"}});
    } else if (req.path == "/info") {
        if (get_or_head) handle_info(sock, req);
        else send_text(sock, 405, TEXT_TYPE, "Method not allowed\n", {{"Allow", "GET, HEAD"}});
    } else if (req.path == "/files") {
        if (get_or_head) handle_file(sock, req);
        else send_text(sock, 405, TEXT_TYPE, "Method not allowed\n", {{"Allow", "GET, HEAD"}});
    } else if (req.path == "/download-all") {
        if (m == "GET") handle_download_all(sock, req);
        else send_text(sock, 405, TEXT_TYPE, "Method not allowed\n", {{"Allow", "GET"}});
    } else {
        send_text(sock, 404, TEXT_TYPE, "Not found\n", {}, m == "HEAD");
    }
}

bool TransferServer::is_authenticated(const http::Request& req) const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    if (!auth_) return true;

    std::string qt = req.query_param("token");
    if (!qt.empty() && auth_->validate_token(qt)) return true;

    std::string ht = req.header("x-share-token");
    return !ht.empty() && auth_->validate_token(ht);
}

std::string TransferServer::supplied_token(const http::Request& req) const {
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        if (!auth_) return "";
    }
    std::string qt = req.query_param("token");
    return qt.empty() ? req.header("x-share-token") : qt;
}

// ============================================================
// Handlers
// ============================================================

void TransferServer::handle_root_get(TcpSocket& sock, const http::Request& req) {
    bool head = req.method == "HEAD";
    if (!is_authenticated(req)) {
        send_text(sock, 200, HTML_TYPE, html_pages::password_form(), {}, head);
        return;
    }
    send_text(sock, 200, HTML_TYPE,
              html_pages::listing(files_, supplied_token(req), config_.bundle_name), {}, head);
}

void TransferServer::handle_root_post(TcpSocket& sock, const http::Request& req,
                                      const std::string& leftover)
{
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        if (!auth_) {
            send_text(sock, 404, TEXT_TYPE, "Not found\n");
            return;
        }
    }

    std::string body;
    std::string ctype = utils::to_lower(req.header("content-type"));
    bool form = ctype.empty() || ctype.find("application/x-www-form-urlencoded") != std::string::npos;
    if (!form || !read_body(sock, req, leftover, body)) {
        send_json(sock, 400, json{{"error", "Invalid request"}});
        return;
    }

    http::QueryMap fields = http::parse_query(body);
    std::string password = fields.count("password") ? fields["password"] : "";

    std::string token;
    bool ok;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        ok = auth_ && auth_->validate_password(password);
        if (ok) token = auth_->token();
    }

    if (ok) {
        LOG_INFO("Client " + sock.peer_ip() + " authenticated");
        send_json(sock, 200, json{{"success", true}, {"token", token}});
    } else {
        LOG_WARN("Invalid password from " + sock.peer_ip());
        send_json(sock, 401, json{{"success", false}, {"error", "Invalid password"}});
    }
}

void TransferServer::handle_info(TcpSocket& sock, const http::Request& req) {
    bool head = req.method == "HEAD";
    http::HeaderList cors = {{"Access-Control-Allow-Origin", "*"}};
    if (!is_authenticated(req)) {
        send_json(sock, 401, json{{"error", "Unauthorized"}}, cors, head);
        return;
    }

    json list = json::array();
    for (size_t i = 0; i < files_.size(); ++i) {
        list.push_back(json{{"id", i}, {"name", files_[i]->name()}, {"size", files_[i]->size()}});
    }
    send_json(sock, 200, list, cors, head);
}

http::ByteRange TransferServer::resolve_range(const http::Request& req,
                                              const SharedFile& file) const
{
    http::ByteRange full;
    full.start = 0;
    full.end   = file.size() > 0 ? file.size() - 1 : 0;

    std::string header = req.header("range");
    if (!file.seekable() || header.empty()) return full;

    std::string if_range = req.header("if-range");
    if (!if_range.empty() && !http::etag_strong_match(if_range, file.etag())) {
        LOG_DEBUG("If-Range does not match " + file.name() + ", sending full content");
        return full;
    }

    http::ByteRange r;
    switch (http::parse_range(header, file.size(), r)) {
        case http::RangeStatus::NONE:
        case http::RangeStatus::OK:
            return r;
        case http::RangeStatus::MALFORMED:
            LOG_DEBUG("Ignoring malformed Range '" + header + "' for " + file.name());
            return full;
        case http::RangeStatus::UNSATISFIABLE:
            break;
    }
    throw RangeError("Range '" + header + "' not satisfiable for " +
                     std::to_string(file.size()) + " bytes");
}

void TransferServer::handle_file(TcpSocket& sock, const http::Request& req) {
    bool head = req.method == "HEAD";
    if (!is_authenticated(req)) {
        send_text(sock, 401, HTML_TYPE, html_pages::password_form(), {}, head);
        return;
    }

    u64 id = 0;
    if (req.has_query("id") && !utils::parse_u64(req.query_param("id"), id)) id = files_.size();
    if (id >= files_.size()) {
        send_text(sock, 404, TEXT_TYPE, "File not found\n", {}, head);
        return;
    }
    std::shared_ptr<SharedFile> file = files_[(size_t)id];
    int index = (int)id;

    bool via_browser = http::is_browser_user_agent(req.header("user-agent"));
    if (utils::ends_with_ci(file->name(), ".zip") && !via_browser) {
        send_text(sock, 403, TEXT_TYPE, "Forbidden\n", {}, head);
        return;
    }
    if (!file->seekable() && file->drained()) {
        send_text(sock, 410, TEXT_TYPE, "This stream has already been served\n", {}, head);
        return;
    }

    http::ByteRange range;
    try {
        range = resolve_range(req, *file);
    } catch (const RangeError& e) {
        LOG_DEBUG(e.what());
        send_text(sock, 416, TEXT_TYPE, "Range not satisfiable\n",
                  {{"Content-Range", "bytes */" + std::to_string(file->size())}}, head);
        return;
    }
    u64 length = file->size() == 0 ? 0 : range.length();

    http::ResponseHead rh(range.partial ? 206 : 200);
    rh.content_type("application/octet-stream")
      .content_length(length)
      .add("Content-Disposition", content_disposition(file->name()))
      .add("Connection", "close");
    if (file->seekable()) {
        rh.add("Accept-Ranges", "bytes").add("ETag", file->etag());
    } else {
        rh.add("Accept-Ranges", "none");
    }
    if (range.partial) {
        rh.add("Content-Range", http::content_range(range.start, range.end, file->size()));
    }

    if (head) {
        sock.send_all(rh.serialize());
        return;
    }

    bool expected = false;
    if (!transfer_in_flight_.compare_exchange_strong(expected, true)) {
        send_text(sock, 429, TEXT_TYPE, "Another transfer is in progress\n");
        return;
    }
    InFlightReset reset{transfer_in_flight_};

    std::unique_ptr<file_io::ByteStream> stream;
    if (!file->seekable()) {
        stream = file->take_stream();
        if (!stream) {
            send_text(sock, 410, TEXT_TYPE, "This stream has already been served\n");
            return;
        }
    }

    std::string ip = sock.peer_ip();
    if (callbacks_.on_client_connected) callbacks_.on_client_connected(ip);
    LOG_INFO("Sending " + file->name() + " to " + ip +
             (range.partial ? " (bytes " + std::to_string(range.start) + "-" +
                              std::to_string(range.end) + ")" : ""));

    ProgressMeter meter = make_meter();
    try {
        sock.send_all(rh.serialize());
        u64 sent;
        if (stream) {
            sent = send_stream(sock, *stream, length, meter);
        } else {
            const SharedFile& f = *file;
            sent = send_positional(sock, [&f](u64 off, void* buf, size_t len) {
                return f.read_at(off, buf, len);
            }, range.start, length, meter);
        }
        if (!range.partial && sent == file->size()) {
            LOG_INFO("Completed " + file->name() + " to " + ip);
            if (callbacks_.on_download_complete) callbacks_.on_download_complete(index, via_browser);
        }
    } catch (const std::exception& e) {
        report_error("Transfer of " + file->name() + " to " + ip + " failed: " + e.what());
    }
}

void TransferServer::handle_download_all(TcpSocket& sock, const http::Request& req) {
    if (!is_authenticated(req)) {
        send_text(sock, 401, HTML_TYPE, html_pages::password_form());
        return;
    }
    if (files_.size() < 2) {
        send_text(sock, 404, TEXT_TYPE, "Bundle requires more than one file\n");
        return;
    }
    for (const auto& f : files_) {
        if (!f->seekable() && f->drained()) {
            send_text(sock, 410, TEXT_TYPE, f->name() + " has already been served\n");
            return;
        }
    }

    bool expected = false;
    if (!transfer_in_flight_.compare_exchange_strong(expected, true)) {
        send_text(sock, 429, TEXT_TYPE, "Another transfer is in progress\n");
        return;
    }
    InFlightReset reset{transfer_in_flight_};

    bool via_browser = http::is_browser_user_agent(req.header("user-agent"));
    std::string ip = sock.peer_ip();

    std::vector<ArchiveSource> sources;
    for (const auto& f : files_) {
        if (f->seekable()) {
            sources.push_back(ArchiveSource::from_path(f->path(), f->name()));
            continue;
        }
        auto stream = f->take_stream();
        if (!stream) {
            send_text(sock, 410, TEXT_TYPE, f->name() + " has already been served\n");
            return;
        }
        sources.push_back(ArchiveSource::from_stream(f->name(), f->size(), std::move(stream)));
    }

    if (callbacks_.on_client_connected) callbacks_.on_client_connected(ip);
    LOG_INFO("Building bundle for " + ip);

    TempFileGuard temp;
    ArchiveOptions opts;
    opts.max_archive_bytes = config_.max_archive_bytes;
    ArchiveStreamEncoder encoder(opts);
    try {
        temp.path = file_io::make_temp_path(config_.temp_dir, "lanshare-bundle-", ".zip");
        register_encoder(&encoder);
        encoder.create_archive(std::move(sources), temp.path);
        register_encoder(nullptr);
    } catch (const std::exception& e) {
        register_encoder(nullptr);
        report_error("Bundle build for " + ip + " failed: " + e.what());
        send_text(sock, 500, TEXT_TYPE, "Failed to build archive\n");
        return;
    }

    ProgressMeter meter = make_meter();
    try {
        file_io::FileReader reader(temp.path);
        u64 size = reader.size();

        http::ResponseHead rh(200);
        rh.content_type("application/zip")
          .content_length(size)
          .add("Content-Disposition", content_disposition(config_.bundle_name))
          .add("Connection", "close");
        sock.send_all(rh.serialize());

        u64 sent = send_positional(sock, [&reader](u64 off, void* buf, size_t len) {
            return reader.read_at(off, buf, len);
        }, 0, size, meter);
        if (sent == size) {
            LOG_INFO("Completed bundle to " + ip + " (" + utils::format_bytes(size) + ")");
            if (callbacks_.on_download_complete) {
                callbacks_.on_download_complete(BUNDLE_FILE_INDEX, via_browser);
            }
        }
    } catch (const std::exception& e) {
        report_error("Bundle transfer to " + ip + " failed: " + e.what());
    }
}

// ============================================================
// Body forwarding
// ============================================================

u64 TransferServer::send_positional(TcpSocket& sock, const ReadAtFn& read_at,
                                    u64 start, u64 len, ProgressMeter& meter)
{
    std::vector<u8> buf(SERVE_CHUNK_SIZE);
    u64 sent = 0;
    while (sent < len) {
        size_t want = (size_t)std::min<u64>(buf.size(), len - sent);
        size_t n = read_at(start + sent, buf.data(), want);
        if (n == 0) {
            throw IOError("Source ended at offset " + std::to_string(start + sent) +
                          ", expected " + std::to_string(start + len));
        }
        sock.send_all(buf.data(), n);
        sent += n;
        meter.add(n);
    }
    meter.flush();
    return sent;
}

u64 TransferServer::send_stream(TcpSocket& sock, file_io::ByteStream& stream, u64 len,
                                ProgressMeter& meter)
{
    std::vector<u8> buf(SERVE_CHUNK_SIZE);
    u64 sent = 0;
    while (sent < len) {
        size_t want = (size_t)std::min<u64>(buf.size(), len - sent);
        size_t n = stream.read(buf.data(), want);
        if (n == 0) {
            throw IOError("Stream ended after " + std::to_string(sent) + " of " +
                          std::to_string(len) + " bytes");
        }
        sock.send_all(buf.data(), n);
        sent += n;
        meter.add(n);
    }
    meter.flush();
    return sent;
}

// ============================================================
// Helpers
// ============================================================

// on_bytes_sent and on_progress share the meter's throttle
ProgressMeter TransferServer::make_meter() const {
    ServerCallbacks cb = callbacks_;
    return ProgressMeter(config_.progress_interval_ms, [cb](u64 cumulative, double mbps) {
        if (cb.on_bytes_sent) cb.on_bytes_sent(cumulative);
        if (cb.on_progress) cb.on_progress(cumulative, mbps);
    });
}

void TransferServer::send_text(TcpSocket& sock, int status, const std::string& content_type,
                               const std::string& body, const http::HeaderList& extra,
                               bool head_only)
{
    http::ResponseHead rh(status);
    rh.content_type(content_type)
      .content_length(body.size())
      .add("Connection", "close");
    for (const auto& kv : extra) rh.add(kv.first, kv.second);

    std::string out = rh.serialize();
    if (!head_only) out += body;
    sock.send_all(out);
}

void TransferServer::send_json(TcpSocket& sock, int status, const json& body,
                               const http::HeaderList& extra, bool head_only)
{
    send_text(sock, status, "application/json", body.dump(), extra, head_only);
}

void TransferServer::register_encoder(ArchiveStreamEncoder* encoder) {
    std::lock_guard<std::mutex> lk(conns_mutex_);
    if (encoder && !running_.load()) {
        active_encoder_ = nullptr;
        throw IOError("Server is stopping");
    }
    active_encoder_ = encoder;
}

void TransferServer::report_error(const std::string& message) {
    Logger::get().transfer_error(message);
    if (callbacks_.on_error) callbacks_.on_error(message);
}
