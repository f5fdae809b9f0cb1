#pragma once

// ============================================================
// archive_encoder.hpp -- Streaming ZIP64 bundle builder
//
// The calling thread (orchestrator) reads sources in bounded
// chunks and moves each chunk into a bounded command channel.
// A worker thread owns the ZipWriter and is the only code that
// touches the output file. Status flows back over an event
// channel:
//
//   orchestrator --START/DATA/END/FINISH/ABORT--> worker
//   orchestrator <--PROGRESS/FILE_DONE/DONE/ERROR-- worker
//
// Peak memory is chunk_size * channel_capacity regardless of
// source or archive size.
// ============================================================

#include "../common/platform.hpp"
#include "../common/channel.hpp"
#include "../common/file_io.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

static constexpr size_t ARCHIVE_CHUNK_SIZE       = 256 * 1024;
static constexpr size_t ARCHIVE_CHANNEL_CAPACITY = 16;

// One input of the bundle. Either a filesystem path (regular file or
// directory, expanded recursively) or a forward-only stream.
struct ArchiveSource {
    std::string name;     // entry name; for a path, defaults to its final component
    std::string path;
    std::unique_ptr<file_io::ByteStream> stream;
    u64         size{0};  // declared size, streams only

    static ArchiveSource from_path(const std::string& path, const std::string& name = "") {
        ArchiveSource s;
        s.path = path;
        s.name = name;
        return s;
    }
    static ArchiveSource from_stream(const std::string& name, u64 size,
                                     std::unique_ptr<file_io::ByteStream> stream) {
        ArchiveSource s;
        s.name   = name;
        s.size   = size;
        s.stream = std::move(stream);
        return s;
    }
};

// ---- Worker protocol ----

enum class ArchiveCmd : u8 {
    START,    // name, size
    DATA,     // data
    END,
    FINISH,
    ABORT,    // text = reason
};

struct ArchiveMsg {
    ArchiveCmd      cmd{ArchiveCmd::DATA};
    std::string     text;
    u64             size{0};
    std::vector<u8> data;
};

enum class ArchiveEventType : u8 {
    PROGRESS,   // processed = archive payload bytes written so far
    FILE_DONE,  // text = entry name
    DONE,       // text = archive path
    ERROR,      // text = message
};

struct ArchiveEvent {
    ArchiveEventType type{ArchiveEventType::PROGRESS};
    u64              processed{0};
    std::string      text;
};

struct ArchiveOptions {
    size_t chunk_size{ARCHIVE_CHUNK_SIZE};
    size_t channel_capacity{ARCHIVE_CHANNEL_CAPACITY};
    u64    max_archive_bytes{0};   // 0 = unlimited; checked against declared sizes
};

// (payload bytes processed, total declared payload bytes)
using ArchiveProgressCallback = std::function<void(u64 processed, u64 total)>;

class ArchiveStreamEncoder {
public:
    explicit ArchiveStreamEncoder(ArchiveOptions opts = ArchiveOptions());
    ~ArchiveStreamEncoder();

    ArchiveStreamEncoder(const ArchiveStreamEncoder&) = delete;
    ArchiveStreamEncoder& operator=(const ArchiveStreamEncoder&) = delete;

    // Build the archive at out_path from the sources, in order. Blocks
    // until the worker reports DONE and returns the archive path.
    // Throws IOError on any source or output failure, on cancellation and
    // when max_archive_bytes is exceeded; ConcurrencyError if a build is
    // already running on this instance. After an I/O failure whatever was
    // written stays at out_path for the caller to remove; a cancelled
    // build is deleted.
    std::string create_archive(std::vector<ArchiveSource> sources,
                               const std::string& out_path,
                               ArchiveProgressCallback on_progress = nullptr);

    // Stop a running build from another thread. create_archive() then
    // joins the worker, deletes the partial archive and throws.
    void cancel();

    // Delete the last finished archive
    void cleanup();

    bool running() const { return running_.load(); }

private:
    struct PlannedEntry {
        std::string name;
        std::string path;
        std::unique_ptr<file_io::ByteStream> stream;
        u64         size{0};
    };

    static std::vector<PlannedEntry> plan_entries(std::vector<ArchiveSource> sources);
    static void run_worker(Channel<ArchiveMsg>& cmds,
                           Channel<ArchiveEvent>& events,
                           const std::string& out_path);

    // Returns false as soon as the worker stops accepting commands
    bool produce(std::vector<PlannedEntry>& plan,
                 Channel<ArchiveMsg>& cmds,
                 Channel<ArchiveEvent>& events,
                 const std::function<bool(const ArchiveEvent&)>& on_event);

    ArchiveOptions opts_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};

    std::mutex                           state_mutex_;
    std::shared_ptr<Channel<ArchiveMsg>> active_cmds_;
    std::string                          finished_path_;
};
