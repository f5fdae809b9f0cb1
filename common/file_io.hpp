#pragma once

// ============================================================
// file_io.hpp -- Positional reads and sequential writes
//
// All failures throw IOError with the path and errno text.
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- FileReader: pread-based, safe to share offsets across calls ----
class FileReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // Read up to len bytes at offset. Returns 0 at end of file.
    size_t read_at(u64 offset, void* buf, size_t len) const;

    u64 size() const { return size_; }
    u64 mtime_ns() const { return mtime_ns_; }
    const std::string& path() const { return path_; }

    void close();

private:
    int fd_{-1};
    u64 size_{0};
    u64 mtime_ns_{0};
    std::string path_;
};

enum class WriteMode {
    TRUNCATE,
    APPEND,
    SPARSE,     // TRUNCATE, and all-zero writes of SPARSE_MIN_RUN or more become holes
};

static constexpr size_t SPARSE_MIN_RUN = 64 * 1024;

// ---- FileWriter: sequential writer with a running position ----
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Creates parent directories and the file if needed
    void open(const std::string& path, WriteMode mode);

    void write(const void* data, size_t len);

    // fsync + close. Throws if either fails.
    void close();

    // Close without reporting errors (error/cancel paths)
    void abandon() noexcept;

    bool is_open() const { return fd_ >= 0; }
    u64 position() const { return pos_; }
    const std::string& path() const { return path_; }

private:
    int fd_{-1};
    u64 pos_{0};
    bool sparse_{false};
    bool hole_at_end_{false};
    std::string path_;
};

// ---- ByteStream: forward-only source (pipe, stdin, generated data) ----
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read up to len bytes. Returns 0 at end of stream. Throws IOError.
    virtual size_t read(void* buf, size_t len) = 0;
};

// ByteStream over a file descriptor (stdin, a pipe, a FIFO)
class FdStream : public ByteStream {
public:
    FdStream(int fd, bool owns_fd) : fd_(fd), owns_(owns_fd) {}
    ~FdStream() override;

    FdStream(const FdStream&) = delete;
    FdStream& operator=(const FdStream&) = delete;

    size_t read(void* buf, size_t len) override;

private:
    int  fd_;
    bool owns_;
};

// ---- Directory scan ----
struct DirFile {
    std::string abs_path;
    std::string rel_path;   // '/'-separated, starts with the directory's own name
    u64         size{0};
};

// Regular files under dir, recursively, in sorted path order.
// Throws IOError if dir cannot be listed.
std::vector<DirFile> scan_directory(const std::string& dir);

// ---- Utility functions ----

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

bool file_exists(const std::string& path);

bool is_directory(const std::string& path);

// Get file modification time as nanoseconds since epoch; 0 if not found
u64 get_mtime_ns(const std::string& path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Best-effort delete; returns true if the file is gone afterwards
bool remove_quietly(const std::string& path);

// Unique path "<dir>/<prefix><random><suffix>" that does not exist yet
std::string make_temp_path(const std::string& dir,
                           const std::string& prefix,
                           const std::string& suffix);

// Keep only the final path component and strip characters that are
// unsafe in a file name ('/', '\\', NUL). Empty input becomes "download".
std::string safe_filename(const std::string& name);

} // namespace file_io
