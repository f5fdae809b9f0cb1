// ============================================================
// test_archive_encoder.cpp -- ZIP64 bundle building
// ============================================================

#include "../server/archive_encoder.hpp"
#include "../server/zip_writer.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

using namespace test_util;

namespace {

// In-memory stream source
class StringStream : public file_io::ByteStream {
public:
    explicit StringStream(std::string data) : data_(std::move(data)) {}
    size_t read(void* buf, size_t len) override {
        size_t n = std::min(len, data_.size() - pos_);
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
        return n;
    }
private:
    std::string data_;
    size_t pos_{0};
};

// Never-ending stream that yields small chunks slowly
class SlowStream : public file_io::ByteStream {
public:
    size_t read(void* buf, size_t len) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        size_t n = std::min<size_t>(len, 4096);
        std::memset(buf, 'z', n);
        return n;
    }
};

// Yields `size` zero bytes
class ZeroStream : public file_io::ByteStream {
public:
    explicit ZeroStream(u64 size) : left_(size) {}
    size_t read(void* buf, size_t len) override {
        size_t n = (size_t)std::min<u64>(len, left_);
        std::memset(buf, 0, n);
        left_ -= n;
        return n;
    }
private:
    u64 left_;
};

std::unique_ptr<file_io::ByteStream> string_stream(const std::string& s) {
    return std::make_unique<StringStream>(s);
}

} // namespace

TEST(Crc32, StandardCheckValue) {
    const char* s = "123456789";
    EXPECT_EQ(hash::crc32(s, 9), 0xCBF43926u);
    u32 c = hash::crc32_update(0, s, 4);
    c = hash::crc32_update(c, s + 4, 5);
    EXPECT_EQ(c, 0xCBF43926u);
}

TEST(FileWriter, SparseModeKeepsZeroRunsAsHoles) {
    TempDir dir;
    std::string path = dir.file("sparse.bin");
    std::vector<char> zeros(file_io::SPARSE_MIN_RUN, 0);

    file_io::FileWriter w;
    w.open(path, file_io::WriteMode::SPARSE);
    w.write("head", 4);
    w.write(zeros.data(), zeros.size());
    w.write("mid", 3);
    w.write(zeros.data(), zeros.size());
    w.write(zeros.data(), 10);   // too short for a hole
    w.write(zeros.data(), zeros.size());
    EXPECT_EQ(w.position(), 7 + 3 * zeros.size() + 10);
    w.close();

    // The trailing hole still counts toward the length
    std::string expect = "head" + std::string(zeros.size(), '\0') + "mid" +
                         std::string(2 * zeros.size() + 10, '\0');
    EXPECT_EQ(fs::file_size(path), expect.size());
    EXPECT_EQ(read_file(path), expect);
}

TEST(ArchiveEncoder, RoundTripFilesAndStream) {
    TempDir dir;
    std::string empty = "";
    std::string one   = "x";
    std::string big   = pattern(ARCHIVE_CHUNK_SIZE * 2 + 1234, 7);
    std::string piped = pattern(70000, 9);
    write_file(dir.file("empty.txt"), empty);
    write_file(dir.file("one.bin"), one);
    write_file(dir.file("big.dat"), big);

    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_path(dir.file("empty.txt")));
    sources.push_back(ArchiveSource::from_path(dir.file("one.bin")));
    sources.push_back(ArchiveSource::from_path(dir.file("big.dat"), "renamed.dat"));
    sources.push_back(ArchiveSource::from_stream("stdin.bin", piped.size(), string_stream(piped)));

    u64 last_processed = 0;
    u64 reported_total = 0;
    ArchiveStreamEncoder encoder;
    std::string out = encoder.create_archive(std::move(sources), dir.file("out.zip"),
        [&](u64 processed, u64 total) {
            EXPECT_GE(processed, last_processed);
            last_processed = processed;
            reported_total = total;
        });
    EXPECT_EQ(out, dir.file("out.zip"));
    EXPECT_FALSE(encoder.running());

    u64 payload = empty.size() + one.size() + big.size() + piped.size();
    EXPECT_EQ(last_processed, payload);
    EXPECT_EQ(reported_total, payload);

    auto entries = read_zip_directory(out);
    ASSERT_EQ(entries.size(), 4u);

    const std::string names[]    = {"empty.txt", "one.bin", "renamed.dat", "stdin.bin"};
    const std::string* content[] = {&empty, &one, &big, &piped};
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        EXPECT_EQ(e.name, names[i]);
        EXPECT_EQ(e.method, zip::METHOD_STORE);
        EXPECT_TRUE(e.flags & zip::FLAG_DATA_DESCRIPTOR);
        EXPECT_FALSE(e.flags & zip::FLAG_UTF8_NAME);
        EXPECT_EQ(e.uncompressed, content[i]->size());
        EXPECT_EQ(e.compressed, content[i]->size());
        EXPECT_EQ(e.crc, hash::crc32(content[i]->data(), content[i]->size()));
        EXPECT_EQ(read_zip_entry(out, e), *content[i]);
    }

    if (have_unzip()) EXPECT_TRUE(unzip_verifies(out));

    encoder.cleanup();
    EXPECT_FALSE(fs::exists(out));
}

TEST(ArchiveEncoder, NonAsciiNamesSetUtf8Flag) {
    TempDir dir;
    std::string name = "r\xC3\xA9sum\xC3\xA9.txt";
    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_stream(name, 3, string_stream("abc")));

    ArchiveStreamEncoder encoder;
    std::string out = encoder.create_archive(std::move(sources), dir.file("u.zip"));
    auto entries = read_zip_directory(out);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, name);
    EXPECT_TRUE(entries[0].flags & zip::FLAG_UTF8_NAME);
}

TEST(ArchiveEncoder, EmptySourceListIsValidArchive) {
    TempDir dir;
    ArchiveStreamEncoder encoder;
    std::string out = encoder.create_archive({}, dir.file("empty.zip"));
    EXPECT_TRUE(read_zip_directory(out).empty());
}

TEST(ArchiveEncoder, DirectoriesExpandInSortedOrder) {
    TempDir dir;
    write_file(dir.file("photos/b.txt"), "bbb");
    write_file(dir.file("photos/a/1.txt"), "one");
    write_file(dir.file("photos/a/2.txt"), "two");

    {
        std::vector<ArchiveSource> sources;
        sources.push_back(ArchiveSource::from_path(dir.file("photos")));
        ArchiveStreamEncoder encoder;
        auto entries = read_zip_directory(
            encoder.create_archive(std::move(sources), dir.file("plain.zip")));
        ASSERT_EQ(entries.size(), 3u);
        EXPECT_EQ(entries[0].name, "photos/a/1.txt");
        EXPECT_EQ(entries[1].name, "photos/a/2.txt");
        EXPECT_EQ(entries[2].name, "photos/b.txt");
        EXPECT_EQ(read_zip_entry(dir.file("plain.zip"), entries[2]), "bbb");
    }
    {
        std::vector<ArchiveSource> sources;
        sources.push_back(ArchiveSource::from_path(dir.file("photos"), "album"));
        ArchiveStreamEncoder encoder;
        auto entries = read_zip_directory(
            encoder.create_archive(std::move(sources), dir.file("named.zip")));
        ASSERT_EQ(entries.size(), 3u);
        EXPECT_EQ(entries[0].name, "album/a/1.txt");
        EXPECT_EQ(entries[2].name, "album/b.txt");
    }
}

TEST(ArchiveEncoder, MissingSourceFails) {
    TempDir dir;
    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_path(dir.file("nope.txt")));
    ArchiveStreamEncoder encoder;
    EXPECT_THROW(encoder.create_archive(std::move(sources), dir.file("x.zip")), IOError);
    EXPECT_FALSE(encoder.running());
}

TEST(ArchiveEncoder, ShortStreamFailsAndKeepsPartialOutput) {
    TempDir dir;
    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_stream("short.bin", 100, string_stream("only ten b")));
    ArchiveStreamEncoder encoder;
    EXPECT_THROW(encoder.create_archive(std::move(sources), dir.file("short.zip")), IOError);
    EXPECT_FALSE(encoder.running());

    // Removing the partial archive is up to the caller
    ASSERT_TRUE(fs::exists(dir.file("short.zip")));
    EXPECT_GT(fs::file_size(dir.file("short.zip")), 0u);
}

TEST(ArchiveEncoder, MaxArchiveBytesIsEnforced) {
    TempDir dir;
    write_file(dir.file("a.bin"), pattern(2000));
    ArchiveOptions opts;
    opts.max_archive_bytes = 1000;

    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_path(dir.file("a.bin")));
    ArchiveStreamEncoder encoder(opts);
    EXPECT_THROW(encoder.create_archive(std::move(sources), dir.file("big.zip")), IOError);
    // Rejected before the output is opened
    EXPECT_FALSE(fs::exists(dir.file("big.zip")));
}

TEST(ArchiveEncoder, CancelStopsBuildAndRemovesOutput) {
    TempDir dir;
    ArchiveStreamEncoder encoder;
    std::atomic<bool> progressed{false};

    std::thread canceller([&] {
        while (!progressed.load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        encoder.cancel();
    });

    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_stream(
        "endless.bin", 1ULL << 40, std::make_unique<SlowStream>()));
    EXPECT_THROW(encoder.create_archive(std::move(sources), dir.file("c.zip"),
                                        [&](u64, u64) { progressed.store(true); }),
                 IOError);
    canceller.join();

    EXPECT_FALSE(encoder.running());
    EXPECT_FALSE(fs::exists(dir.file("c.zip")));
}

TEST(ArchiveEncoder, SecondConcurrentBuildIsRejected) {
    TempDir dir;
    ArchiveStreamEncoder encoder;

    std::thread first([&] {
        std::vector<ArchiveSource> sources;
        sources.push_back(ArchiveSource::from_stream(
            "endless.bin", 1ULL << 40, std::make_unique<SlowStream>()));
        EXPECT_THROW(encoder.create_archive(std::move(sources), dir.file("first.zip")), IOError);
    });
    while (!encoder.running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    EXPECT_THROW(encoder.create_archive({}, dir.file("second.zip")), ConcurrencyError);
    EXPECT_FALSE(fs::exists(dir.file("second.zip")));

    encoder.cancel();
    first.join();
}

// Entry larger than 4 GiB followed by a small one whose local header
// sits beyond the 32-bit offset range. The zero payload leaves holes in
// the output, so the archive takes little disk space.
TEST(ArchiveEncoder, LargeEntryBeyondFourGiB) {
    TempDir dir;
    const u64 big_size = (4ULL << 30) + 12345;

    std::vector<ArchiveSource> sources;
    sources.push_back(ArchiveSource::from_stream("huge.bin", big_size,
                                                 std::make_unique<ZeroStream>(big_size)));
    sources.push_back(ArchiveSource::from_stream("tail.txt", 17, string_stream("after the big one")));
    ArchiveStreamEncoder encoder;
    std::string out = encoder.create_archive(std::move(sources), dir.file("large.zip"));

    auto entries = read_zip_directory(out);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].uncompressed, big_size);
    EXPECT_EQ(entries[0].compressed, big_size);
    EXPECT_EQ(entries[0].crc, 0x1E83137Du);   // CRC-32 of big_size zero bytes

    EXPECT_GT(entries[1].local_offset, 0xFFFFFFFFull);
    EXPECT_EQ(read_zip_entry(out, entries[1]), "after the big one");

    if (!have_unzip()) GTEST_SKIP() << "unzip not available for the cross-check";
    EXPECT_TRUE(unzip_verifies(out));
}
