#pragma once

// ============================================================
// transfer_server.hpp -- LanShare HTTP file server
//
// Serves one fixed file list for its lifetime.
//
// Concurrency model:
//   accept_loop()      -> accepts one socket at a time and hands
//                         it to a connection thread.
//   connection threads -> read one request head, serve it, close.
//                         Each is tracked with its socket; finished
//                         ones are joined by the accept loop, the
//                         rest are shut down and joined by stop().
//   bundle requests    -> additionally run an ArchiveStreamEncoder
//                         worker for the duration of the build.
//
// At most one file or bundle transfer is in flight per server;
// others get 429.
// ============================================================

#include "../common/platform.hpp"
#include "../common/http.hpp"
#include "../common/progress.hpp"
#include "../common/socket.hpp"
#include "archive_encoder.hpp"
#include "auth_manager.hpp"
#include "shared_file.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

static constexpr int SERVE_CHUNK_SIZE   = 256 * 1024;
static constexpr int BUNDLE_FILE_INDEX  = -1;

struct ServerConfig {
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{0};              // 0 = ephemeral
    std::string advertise_host;              // "" = first LAN IPv4
    std::string password;                    // "" = unprotected
    u64         progress_interval_ms{400};
    std::string bundle_name{"LanShare_Bundle.zip"};
    std::string temp_dir;                    // "" = system temp directory
    u64         max_archive_bytes{0};        // 0 = unlimited
    int         head_timeout_ms{10000};
    int         send_timeout_ms{30000};
};

struct ServerInfo {
    std::string host;
    u16         port{0};

    std::string url() const { return "http://" + host + ":" + std::to_string(port) + "/"; }
};

struct ServerCallbacks {
    std::function<void(const std::string& ip)>           on_client_connected;
    std::function<void(u64 cumulative_bytes)>            on_bytes_sent;
    ProgressCallback                                     on_progress;
    std::function<void(int file_index, bool via_browser)> on_download_complete;
    std::function<void(const std::string& message)>      on_error;
};

class TransferServer {
public:
    explicit TransferServer(ServerConfig config, ServerCallbacks callbacks = ServerCallbacks());
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Bind, start accepting and return where the server is reachable.
    // Throws BindError when no port or LAN address is available,
    // ConcurrencyError if already running.
    ServerInfo start(SharedFileList files);

    // Close the listener and every live connection, cancel a running
    // bundle build, wait for connection threads and drop auth state.
    void stop();

    bool running() const { return running_.load(); }
    ServerInfo info() const;

    // Current access token; "" when the server is unprotected or stopped
    std::string token() const;

    bool transfer_active() const { return transfer_in_flight_.load(); }

private:
    void accept_loop();
    void spawn_connection(TcpSocket sock);
    // Joins connection threads that have finished
    void reap_connections();
    void serve_connection(TcpSocket& sock);

    // Returns false when the peer went away or sent garbage (already answered)
    bool read_request(TcpSocket& sock, http::Request& req, std::string& leftover);
    bool read_body(TcpSocket& sock, const http::Request& req, std::string leftover,
                   std::string& body);

    void route(TcpSocket& sock, const http::Request& req, const std::string& leftover);

    bool is_authenticated(const http::Request& req) const;
    std::string supplied_token(const http::Request& req) const;

    void handle_root_get(TcpSocket& sock, const http::Request& req);
    void handle_root_post(TcpSocket& sock, const http::Request& req, const std::string& leftover);
    void handle_info(TcpSocket& sock, const http::Request& req);
    void handle_file(TcpSocket& sock, const http::Request& req);
    void handle_download_all(TcpSocket& sock, const http::Request& req);

    // Resolves the byte range to serve. Throws RangeError when unsatisfiable.
    http::ByteRange resolve_range(const http::Request& req, const SharedFile& file) const;

    using ReadAtFn = std::function<size_t(u64 offset, void* buf, size_t len)>;

    // Forward [start, start+len) of a positional source; returns bytes sent.
    // Throws IOError if the source ends early, NetworkError on disconnect.
    u64 send_positional(TcpSocket& sock, const ReadAtFn& read_at, u64 start, u64 len,
                        ProgressMeter& meter);
    u64 send_stream(TcpSocket& sock, file_io::ByteStream& stream, u64 len, ProgressMeter& meter);
    ProgressMeter make_meter() const;

    void send_text(TcpSocket& sock, int status, const std::string& content_type,
                   const std::string& body, const http::HeaderList& extra = http::HeaderList(),
                   bool head_only = false);
    void send_json(TcpSocket& sock, int status, const nlohmann::json& body,
                   const http::HeaderList& extra = http::HeaderList(),
                   bool head_only = false);

    // Makes the running bundle build visible to stop(); nullptr clears it.
    // Throws IOError once stop() has begun.
    void register_encoder(ArchiveStreamEncoder* encoder);

    void report_error(const std::string& message);

    ServerConfig    config_;
    ServerCallbacks callbacks_;

    TcpSocket          listen_sock_{INVALID_SOCKET_VAL};
    std::thread        accept_thread_;
    std::atomic<bool>  running_{false};
    std::atomic<bool>  transfer_in_flight_{false};

    SharedFileList               files_;
    std::unique_ptr<AuthManager> auth_;
    ServerInfo                   info_;
    mutable std::mutex           state_mutex_;

    struct Connection {
        std::shared_ptr<TcpSocket> sock;
        std::thread                thread;
    };

    // Live connections, keyed by a per-server sequence number
    std::mutex                           conns_mutex_;
    std::unordered_map<u64, Connection>  live_conns_;
    std::vector<u64>                     finished_conns_;
    u64                                  next_conn_id_{1};
    ArchiveStreamEncoder*                active_encoder_{nullptr};
};
