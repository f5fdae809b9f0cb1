#pragma once

// ============================================================
// zip_writer.hpp -- Sequential store-only ZIP64 writer
//
// Layout per entry:
//   local header (sizes = 0xFFFFFFFF, ZIP64 extra, flag bit 3)
//   raw data
//   64-bit data descriptor (CRC32, actual sizes)
// then the central directory with ZIP64 extras, a ZIP64 EOCD
// record + locator and a legacy EOCD full of sentinels.
// Nothing is ever seeked back to; output is strictly appended.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include <string>
#include <vector>

// Little-endian field builder for ZIP records
class ByteWriter {
public:
    void u16le(u16 v) {
        buf_.push_back((u8)(v & 0xFF));
        buf_.push_back((u8)(v >> 8));
    }
    void u32le(u32 v) {
        for (int i = 0; i < 4; ++i) buf_.push_back((u8)(v >> (8 * i)));
    }
    void u64le(u64 v) {
        for (int i = 0; i < 8; ++i) buf_.push_back((u8)(v >> (8 * i)));
    }
    void bytes(const std::string& s) { buf_.insert(buf_.end(), s.begin(), s.end()); }

    const u8* data() const { return buf_.data(); }
    size_t size() const { return buf_.size(); }
    void clear() { buf_.clear(); }

private:
    std::vector<u8> buf_;
};

namespace zip {

static constexpr u32 SIG_LOCAL_HEADER    = 0x04034b50;
static constexpr u32 SIG_DATA_DESCRIPTOR = 0x08074b50;
static constexpr u32 SIG_CENTRAL_DIR     = 0x02014b50;
static constexpr u32 SIG_ZIP64_EOCD      = 0x06064b50;
static constexpr u32 SIG_ZIP64_LOCATOR   = 0x07064b50;
static constexpr u32 SIG_EOCD            = 0x06054b50;

static constexpr u16 VERSION_ZIP64       = 45;
static constexpr u16 FLAG_DATA_DESCRIPTOR = 0x0008;
static constexpr u16 FLAG_UTF8_NAME      = 0x0800;
static constexpr u16 METHOD_STORE        = 0;
static constexpr u16 EXTRA_ZIP64         = 0x0001;

static constexpr u16 SENTINEL16 = 0xFFFF;
static constexpr u32 SENTINEL32 = 0xFFFFFFFF;

} // namespace zip

class ZipWriter {
public:
    ZipWriter() = default;

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Create/truncate the archive. Throws IOError.
    void open(const std::string& path);

    // Local header for a new entry. declared_size goes into the ZIP64 extra.
    void start_entry(const std::string& name, u64 declared_size);

    // Append entry data; no size limit per call
    void write_data(const void* data, size_t len);

    // Data descriptor with the actual CRC and size.
    // Throws IOError if the size differs from the declared one.
    void end_entry();

    // Central directory + end records, then fsync and close
    void finish();

    // Close without finishing (error paths); the file is left as is
    void abandon() noexcept;

    u64 offset() const { return out_.position(); }
    size_t entry_count() const { return entries_.size(); }
    bool in_entry() const { return in_entry_; }
    const std::string& path() const { return out_.path(); }

private:
    struct Entry {
        std::string name;
        u16         flags{0};
        u32         crc{0};
        u64         size{0};
        u64         declared{0};
        u64         header_offset{0};
    };

    void flush_record(ByteWriter& w);

    file_io::FileWriter out_;
    std::vector<Entry>  entries_;
    Entry               current_;
    bool                in_entry_{false};
};
