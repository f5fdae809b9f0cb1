// ============================================================
// zip_writer.cpp -- ZIP64 record encoding
// ============================================================

#include "zip_writer.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"

using namespace zip;

static bool has_non_ascii(const std::string& s) {
    for (char c : s) {
        if ((unsigned char)c >= 0x80) return true;
    }
    return false;
}

void ZipWriter::open(const std::string& path) {
    entries_.clear();
    in_entry_ = false;
    out_.open(path, file_io::WriteMode::SPARSE);
}

void ZipWriter::flush_record(ByteWriter& w) {
    out_.write(w.data(), w.size());
    w.clear();
}

void ZipWriter::start_entry(const std::string& name, u64 declared_size) {
    if (!out_.is_open()) throw IOError("zip: archive not open");
    if (in_entry_) throw IOError("zip: entry '" + current_.name + "' not ended");
    if (name.empty() || name.size() > 0xFFFF) {
        throw IOError("zip: invalid entry name length " + std::to_string(name.size()));
    }

    current_ = Entry{};
    current_.name          = name;
    current_.declared      = declared_size;
    current_.flags         = (u16)(FLAG_DATA_DESCRIPTOR | (has_non_ascii(name) ? FLAG_UTF8_NAME : 0));
    current_.header_offset = out_.position();
    in_entry_ = true;

    ByteWriter w;
    w.u32le(SIG_LOCAL_HEADER);
    w.u16le(VERSION_ZIP64);
    w.u16le(current_.flags);
    w.u16le(METHOD_STORE);
    w.u16le(0);                   // mod time
    w.u16le(0);                   // mod date
    w.u32le(0);                   // crc, in data descriptor
    w.u32le(SENTINEL32);          // compressed size
    w.u32le(SENTINEL32);          // uncompressed size
    w.u16le((u16)name.size());
    w.u16le(4 + 16);              // extra length
    w.bytes(name);
    w.u16le(EXTRA_ZIP64);
    w.u16le(16);
    w.u64le(declared_size);       // uncompressed
    w.u64le(declared_size);       // compressed
    flush_record(w);
}

void ZipWriter::write_data(const void* data, size_t len) {
    if (!in_entry_) throw IOError("zip: data outside of an entry");
    if (len == 0) return;
    out_.write(data, len);
    current_.crc   = hash::crc32_update(current_.crc, data, len);
    current_.size += len;
}

void ZipWriter::end_entry() {
    if (!in_entry_) throw IOError("zip: end without start");
    if (current_.size != current_.declared) {
        throw IOError("zip: entry '" + current_.name + "' has " + std::to_string(current_.size) +
                      " bytes, declared " + std::to_string(current_.declared));
    }

    ByteWriter w;
    w.u32le(SIG_DATA_DESCRIPTOR);
    w.u32le(current_.crc);
    w.u64le(current_.size);       // compressed
    w.u64le(current_.size);       // uncompressed
    flush_record(w);

    entries_.push_back(std::move(current_));
    current_  = Entry{};
    in_entry_ = false;
}

void ZipWriter::finish() {
    if (!out_.is_open()) throw IOError("zip: archive not open");
    if (in_entry_) throw IOError("zip: finish with entry '" + current_.name + "' still open");

    ByteWriter w;
    u64 cd_offset = out_.position();
    for (const Entry& e : entries_) {
        w.u32le(SIG_CENTRAL_DIR);
        w.u16le(VERSION_ZIP64);   // made by
        w.u16le(VERSION_ZIP64);   // needed
        w.u16le(e.flags);
        w.u16le(METHOD_STORE);
        w.u16le(0);
        w.u16le(0);
        w.u32le(e.crc);
        w.u32le(SENTINEL32);
        w.u32le(SENTINEL32);
        w.u16le((u16)e.name.size());
        w.u16le(4 + 24);          // extra length
        w.u16le(0);               // comment length
        w.u16le(0);               // disk number start
        w.u16le(0);               // internal attributes
        w.u32le(0);               // external attributes
        w.u32le(SENTINEL32);      // local header offset
        w.bytes(e.name);
        w.u16le(EXTRA_ZIP64);
        w.u16le(24);
        w.u64le(e.size);          // uncompressed
        w.u64le(e.size);          // compressed
        w.u64le(e.header_offset);
        flush_record(w);
    }
    u64 cd_size = out_.position() - cd_offset;
    u64 zip64_eocd_offset = out_.position();
    u64 count = entries_.size();

    w.u32le(SIG_ZIP64_EOCD);
    w.u64le(44);                  // size of remaining record
    w.u16le(VERSION_ZIP64);
    w.u16le(VERSION_ZIP64);
    w.u32le(0);                   // this disk
    w.u32le(0);                   // disk with central directory
    w.u64le(count);
    w.u64le(count);
    w.u64le(cd_size);
    w.u64le(cd_offset);

    w.u32le(SIG_ZIP64_LOCATOR);
    w.u32le(0);
    w.u64le(zip64_eocd_offset);
    w.u32le(1);                   // total disks

    w.u32le(SIG_EOCD);
    w.u16le(0);
    w.u16le(0);
    w.u16le(SENTINEL16);
    w.u16le(SENTINEL16);
    w.u32le(SENTINEL32);
    w.u32le(SENTINEL32);
    w.u16le(0);                   // comment length
    flush_record(w);

    out_.close();
}

void ZipWriter::abandon() noexcept {
    out_.abandon();
    in_entry_ = false;
}
