// ============================================================
// shared_file.cpp -- Served file sources
// ============================================================

#include "shared_file.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"

std::shared_ptr<SharedFile> SharedFile::from_path(const std::string& path,
                                                  const std::string& name)
{
    std::shared_ptr<SharedFile> sf(new SharedFile());
    sf->reader_ = std::make_unique<file_io::FileReader>(path);
    sf->name_   = name.empty() ? fs::path(path).filename().string() : name;
    sf->size_   = sf->reader_->size();
    sf->etag_   = hash::file_etag(sf->name_, sf->size_, sf->reader_->mtime_ns());
    return sf;
}

std::shared_ptr<SharedFile> SharedFile::from_stream(const std::string& name, u64 size,
                                                    std::unique_ptr<file_io::ByteStream> stream)
{
    if (!stream) throw IOError("from_stream: null stream for " + name);
    std::shared_ptr<SharedFile> sf(new SharedFile());
    sf->name_   = name;
    sf->size_   = size;
    sf->stream_ = std::move(stream);
    return sf;
}

const std::string& SharedFile::path() const {
    static const std::string empty;
    return reader_ ? reader_->path() : empty;
}

size_t SharedFile::read_at(u64 offset, void* buf, size_t len) const {
    if (!reader_) throw IOError("read_at on stream-backed file: " + name_);
    return reader_->read_at(offset, buf, len);
}

std::unique_ptr<file_io::ByteStream> SharedFile::take_stream() {
    std::lock_guard<std::mutex> lk(stream_mutex_);
    if (reader_ || stream_taken_) return nullptr;
    stream_taken_ = true;
    return std::move(stream_);
}

bool SharedFile::drained() const {
    std::lock_guard<std::mutex> lk(stream_mutex_);
    return stream_taken_;
}
