#pragma once

// ============================================================
// download_client.hpp -- Resumable single-file HTTP download
//
// Resumes from whatever is already on disk: a partial file is
// extended with "Range: bytes=<size>-" and a server that ignores
// the range (200) causes a clean restart from offset 0.
// One download at a time per instance.
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/http.hpp"
#include "../common/progress.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

static constexpr u64 CLIENT_PROGRESS_INTERVAL_MS = 500;
static constexpr size_t CLIENT_RECV_CHUNK        = 256 * 1024;

struct ClientConfig {
    std::string host;
    u16         port{0};
    std::string token;                          // sent as X-Share-Token
    int         connect_timeout_ms{10000};
    int         recv_timeout_ms{30000};
    u64         progress_interval_ms{CLIENT_PROGRESS_INTERVAL_MS};
    std::string user_agent{"LanShare-Client/1.0"};
};

struct DownloadTask {
    u64         file_id{0};
    std::string dest_dir;
    u64         total_size{0};   // declared by the server's /info
    std::string filename;

    std::string dest_path() const;
};

// One entry of GET /info
struct RemoteFile {
    u64         id{0};
    std::string name;
    u64         size{0};
};

struct DownloadCallbacks {
    // (bytes on disk including resumed ones, MiB/s over the last interval)
    ProgressCallback                                       on_progress;
    std::function<void(const std::string& path)>           on_complete;
    std::function<void(ErrorKind kind, const std::string& message)> on_error;
};

enum class DownloadOutcome {
    COMPLETED,
    FAILED,
    PAUSED,
    CANCELLED,
    REJECTED,    // another download was active, or nothing to resume
};

class ResumableDownloadClient {
public:
    explicit ResumableDownloadClient(ClientConfig config);

    ResumableDownloadClient(const ResumableDownloadClient&) = delete;
    ResumableDownloadClient& operator=(const ResumableDownloadClient&) = delete;

    // Blocking. Exactly one of on_complete / on_error fires per call,
    // including for a rejected concurrent call, a pause and a cancel.
    DownloadOutcome download(const DownloadTask& task, DownloadCallbacks callbacks);

    // Stop the running download; the partial file and task are kept
    void pause();

    // Re-issue the last paused or failed task with its callbacks
    DownloadOutcome resume();

    // Stop the running download and forget the task; the partial file stays
    void cancel();

    bool active() const { return active_.load(); }

    // GET /info. Throws AuthError or NetworkError.
    std::vector<RemoteFile> fetch_file_list();

    // POST / with the password; stores and returns the issued token.
    // Returns "" when the server is not password-protected.
    // Throws AuthError on a wrong password, NetworkError otherwise.
    std::string login(const std::string& password);

    std::string token() const;

private:
    enum class StopReason : u8 { NONE, PAUSED, CANCELLED };

    std::string run_download(const DownloadTask& task, const DownloadCallbacks& callbacks);

    // Connect and send a request. Extra header lines end in "\r\n".
    void send_request(TcpSocket& sock, const std::string& method, const std::string& target,
                      const std::string& extra_headers, const std::string& body);

    // Reads until the head is complete; body bytes already received go to leftover
    void read_response_head(TcpSocket& sock, http::Response& resp, std::string& leftover);

    // Request with a small, fully buffered response body
    std::string exchange(const std::string& method, const std::string& target,
                         const std::string& extra_headers, const std::string& body,
                         http::Response& resp);

    void connect(TcpSocket& sock);
    void set_active_socket(TcpSocket* sock);

    ClientConfig config_;

    std::atomic<bool>       active_{false};
    std::atomic<StopReason> stop_reason_{StopReason::NONE};

    mutable std::mutex  mutex_;
    TcpSocket*          active_sock_{nullptr};
    bool                has_task_{false};
    DownloadTask        last_task_;
    DownloadCallbacks   last_callbacks_;
};
