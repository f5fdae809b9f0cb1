#pragma once

// ============================================================
// shared_file.hpp -- One entry of the served file list
//
// A SharedFile has a name, a declared size and exactly one
// content source: a seekable file (Range-capable, re-servable)
// or a forward-only stream that can be drained exactly once.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class SharedFile {
public:
    // Seekable source. name defaults to the path's final component.
    // Throws IOError if the path cannot be opened or is a directory.
    static std::shared_ptr<SharedFile> from_path(const std::string& path,
                                                 const std::string& name = "");

    // Forward-only source; size is the number of bytes it will yield
    static std::shared_ptr<SharedFile> from_stream(const std::string& name, u64 size,
                                                   std::unique_ptr<file_io::ByteStream> stream);

    SharedFile(const SharedFile&) = delete;
    SharedFile& operator=(const SharedFile&) = delete;

    const std::string& name() const { return name_; }
    u64 size() const { return size_; }
    bool seekable() const { return reader_ != nullptr; }

    // Filesystem path of a seekable source, "" for streams
    const std::string& path() const;

    // Weak validator for seekable sources, "" for streams
    const std::string& etag() const { return etag_; }

    // Seekable sources only. Returns 0 at end of file. Throws IOError.
    size_t read_at(u64 offset, void* buf, size_t len) const;

    // Hands the stream to exactly one consumer; later calls return nullptr.
    // Always nullptr for seekable sources.
    std::unique_ptr<file_io::ByteStream> take_stream();

    // True once a stream source has been handed out
    bool drained() const;

private:
    SharedFile() = default;

    std::string name_;
    u64         size_{0};
    std::string etag_;

    std::unique_ptr<file_io::FileReader> reader_;

    mutable std::mutex                   stream_mutex_;
    std::unique_ptr<file_io::ByteStream> stream_;
    bool                                 stream_taken_{false};
};

using SharedFileList = std::vector<std::shared_ptr<SharedFile>>;
