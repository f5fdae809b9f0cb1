// ============================================================
// file_io.cpp -- File I/O implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstring>
#include <random>
#include <string>
#include <system_error>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

using namespace file_io;

static std::string errno_str() {
    return std::string(strerror(errno)) + " (errno=" + std::to_string(errno) + ")";
}

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IOError("Cannot open file: " + path + ": " + errno_str());
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        std::string err = errno_str();
        ::close(fd_);
        fd_ = -1;
        throw IOError("fstat failed: " + path + ": " + err);
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw IOError("Is a directory: " + path);
    }
    size_     = (u64)st.st_size;
    mtime_ns_ = (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;

#ifdef POSIX_FADV_SEQUENTIAL
    posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read_at(u64 offset, void* buf, size_t len) const {
    if (fd_ < 0) throw IOError("read on closed file: " + path_);
    for (;;) {
        ssize_t n = ::pread(fd_, buf, len, (off_t)offset);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw IOError("pread failed: " + path_ + ": " + errno_str());
    }
}

void FileReader::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::~FileWriter() {
    abandon();
}

void FileWriter::open(const std::string& path, WriteMode mode) {
    abandon();
    path_ = path;
    ensure_parent_dirs(path);

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == WriteMode::APPEND) ? O_APPEND : O_TRUNC;
    fd_ = ::open(path.c_str(), flags, 0644);
    if (fd_ < 0) {
        throw IOError("Cannot create file: " + path + ": " + errno_str());
    }
    sparse_ = (mode == WriteMode::SPARSE);
    hole_at_end_ = false;

    if (mode == WriteMode::APPEND) {
        struct stat st{};
        if (fstat(fd_, &st) != 0) {
            std::string err = errno_str();
            abandon();
            throw IOError("fstat failed: " + path + ": " + err);
        }
        pos_ = (u64)st.st_size;
    } else {
        pos_ = 0;
    }
}

void FileWriter::write(const void* data, size_t len) {
    if (fd_ < 0) throw IOError("write on closed file: " + path_);
    const char* p = static_cast<const char*>(data);
    if (sparse_ && len >= SPARSE_MIN_RUN && p[0] == 0 && std::memcmp(p, p + 1, len - 1) == 0) {
        if (::lseek(fd_, (off_t)len, SEEK_CUR) < 0) {
            throw IOError("seek failed: " + path_ + ": " + errno_str());
        }
        pos_ += len;
        hole_at_end_ = true;
        return;
    }
    if (len > 0) hole_at_end_ = false;
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IOError("write failed: " + path_ + ": " + errno_str());
        }
        p += n;
        remaining -= (size_t)n;
        pos_ += (u64)n;
    }
}

void FileWriter::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    // A trailing hole only exists once the length is set
    if (hole_at_end_ && ::ftruncate(fd, (off_t)pos_) != 0) {
        std::string err = errno_str();
        ::close(fd);
        throw IOError("truncate failed: " + path_ + ": " + err);
    }
    if (::fsync(fd) != 0 && errno != EINVAL) {
        std::string err = errno_str();
        ::close(fd);
        throw IOError("fsync failed: " + path_ + ": " + err);
    }
    if (::close(fd) != 0) {
        throw IOError("close failed: " + path_ + ": " + errno_str());
    }
}

void FileWriter::abandon() noexcept {
    if (fd_ >= 0) {
        if (hole_at_end_ && ::ftruncate(fd_, (off_t)pos_) != 0) {
            LOG_WARN("truncate failed: " + path_ + ": " + errno_str());
        }
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================
// FdStream
// ============================================================

FdStream::~FdStream() {
    if (owns_ && fd_ >= 0) ::close(fd_);
}

size_t FdStream::read(void* buf, size_t len) {
    for (;;) {
        ssize_t n = ::read(fd_, buf, len);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw IOError("stream read failed: " + errno_str());
    }
}

// ============================================================
// Utilities
// ============================================================

namespace file_io {

u64 get_file_size(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return (u64)st.st_size;
}

bool file_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::vector<DirFile> scan_directory(const std::string& dir) {
    fs::path root(dir);
    // Entry names keep the directory's own name as their first component
    fs::path base = root.has_filename() ? root.parent_path() : root.parent_path().parent_path();

    std::vector<DirFile> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw IOError("Cannot list directory " + dir + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw IOError("Cannot list directory " + dir + ": " + ec.message());
        }
        const fs::directory_entry& entry = *it;
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;
        fs::path rel = base.empty() ? entry.path() : fs::relative(entry.path(), base, fec);
        if (fec) continue;

        DirFile df;
        df.abs_path = entry.path().string();
        df.rel_path = rel.generic_string();
        df.size     = get_file_size(df.abs_path);
        out.push_back(std::move(df));
    }
    std::sort(out.begin(), out.end(),
              [](const DirFile& a, const DirFile& b) { return a.rel_path < b.rel_path; });
    return out;
}

u64 get_mtime_ns(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
}

void ensure_parent_dirs(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw IOError("Cannot create directory " + parent.string() + ": " + ec.message());
    }
}

bool remove_quietly(const std::string& path) {
    if (path.empty()) return true;
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Cannot remove " + path + ": " + ec.message());
        return false;
    }
    return true;
}

std::string make_temp_path(const std::string& dir,
                           const std::string& prefix,
                           const std::string& suffix)
{
    fs::path base = dir.empty() ? fs::temp_directory_path() : fs::path(dir);
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (int attempt = 0; attempt < 16; ++attempt) {
        u64 r = gen();
        char buf[17];
        snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)r);
        fs::path candidate = base / (prefix + buf + suffix);
        if (!file_exists(candidate.string())) return candidate.string();
    }
    throw IOError("Cannot pick a temporary file name in " + base.string());
}

std::string safe_filename(const std::string& name) {
    std::string leaf = name;
    size_t slash = leaf.find_last_of("/\\");
    if (slash != std::string::npos) leaf = leaf.substr(slash + 1);

    std::string out;
    out.reserve(leaf.size());
    for (char c : leaf) {
        if (c == '\0') continue;
        out += c;
    }
    if (out.empty() || out == "." || out == "..") return "download";
    return out;
}

} // namespace file_io
