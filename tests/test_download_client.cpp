// ============================================================
// test_download_client.cpp -- Resumable downloads against a live server
// ============================================================

#include "../client/download_client.hpp"
#include "../server/transfer_server.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

using namespace test_util;

namespace {

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

class GateStream : public file_io::ByteStream {
public:
    GateStream(std::string data, std::shared_ptr<std::atomic<bool>> gate)
        : inner_(std::move(data)), gate_(std::move(gate)) {}
    size_t read(void* buf, size_t len) override {
        while (!gate_->load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return inner_.read(buf, len);
    }
private:
    StringStream inner_;
    std::shared_ptr<std::atomic<bool>> gate_;
};

// Records what a download reported
struct Recorder {
    int completes{0};
    int errors{0};
    ErrorKind last_kind{ErrorKind::NETWORK};
    std::string last_error;
    std::string path;
    u64 last_progress{0};
    u64 first_progress{0};
    bool saw_progress{false};

    DownloadCallbacks callbacks() {
        DownloadCallbacks cb;
        cb.on_progress = [this](u64 bytes, double) {
            if (!saw_progress) first_progress = bytes;
            saw_progress  = true;
            last_progress = bytes;
        };
        cb.on_complete = [this](const std::string& p) {
            completes++;
            path = p;
        };
        cb.on_error = [this](ErrorKind kind, const std::string& msg) {
            errors++;
            last_kind  = kind;
            last_error = msg;
        };
        return cb;
    }
};

} // namespace

class DownloadClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_transfer_log("");
    }

    void TearDown() override {
        if (server_) server_->stop();
    }

    std::string make_file(const std::string& name, const std::string& content) {
        write_file(tmp_.file("share/" + name), content);
        return tmp_.file("share/" + name);
    }

    ClientConfig start(SharedFileList files, const std::string& password = "") {
        ServerConfig cfg;
        cfg.listen_ip      = "127.0.0.1";
        cfg.advertise_host = "127.0.0.1";
        cfg.password       = password;
        server_.reset(new TransferServer(cfg));
        ServerInfo info = server_->start(std::move(files));

        ClientConfig cc;
        cc.host = info.host;
        cc.port = info.port;
        return cc;
    }

    DownloadTask task(u64 id, const std::string& name, u64 size) {
        DownloadTask t;
        t.file_id    = id;
        t.dest_dir   = tmp_.file("dest");
        t.total_size = size;
        t.filename   = name;
        return t;
    }

    TempDir tmp_;
    std::unique_ptr<TransferServer> server_;
};

TEST_F(DownloadClientTest, ResumesFromAnyPartialLength) {
    const std::string content = pattern(200000, 3);
    ClientConfig cc = start({SharedFile::from_path(make_file("movie.bin", content))});
    const u64 total = content.size();

    for (u64 k : {u64(0), u64(1), total - 1, total}) {
        SCOPED_TRACE("existing bytes: " + std::to_string(k));
        DownloadTask t = task(0, "movie.bin", total);
        fs::remove(t.dest_path());
        if (k > 0) write_file(t.dest_path(), content.substr(0, (size_t)k));

        ResumableDownloadClient client(cc);
        Recorder rec;
        EXPECT_EQ(client.download(t, rec.callbacks()), DownloadOutcome::COMPLETED);
        EXPECT_EQ(rec.completes, 1);
        EXPECT_EQ(rec.errors, 0);
        EXPECT_EQ(rec.path, t.dest_path());
        EXPECT_EQ(read_file(t.dest_path()), content);
        if (k < total) {
            ASSERT_TRUE(rec.saw_progress);
            EXPECT_GT(rec.first_progress, k);
            EXPECT_EQ(rec.last_progress, total);
        } else {
            EXPECT_FALSE(rec.saw_progress);
        }
    }
}

TEST_F(DownloadClientTest, CompleteFileNeedsNoServer) {
    DownloadTask t = task(0, "done.bin", 4);
    write_file(t.dest_path(), "abcd");

    ClientConfig cc;
    cc.host = "127.0.0.1";
    cc.port = 1;   // nothing listens here
    ResumableDownloadClient client(cc);
    Recorder rec;
    EXPECT_EQ(client.download(t, rec.callbacks()), DownloadOutcome::COMPLETED);
    EXPECT_EQ(rec.completes, 1);
}

TEST_F(DownloadClientTest, LocalFileAtLeastDeclaredSizeIsComplete) {
    DownloadTask t = task(0, "a.bin", 10);
    write_file(t.dest_path(), "fifteen bytes!!");

    ClientConfig cc;
    cc.host = "127.0.0.1";
    cc.port = 1;   // nothing listens here
    ResumableDownloadClient client(cc);
    Recorder rec;
    EXPECT_EQ(client.download(t, rec.callbacks()), DownloadOutcome::COMPLETED);
    EXPECT_EQ(rec.completes, 1);
    EXPECT_EQ(rec.errors, 0);
    EXPECT_EQ(rec.path, t.dest_path());
    EXPECT_EQ(read_file(t.dest_path()), "fifteen bytes!!");
}

TEST_F(DownloadClientTest, RestartsWhenServerIgnoresRange) {
    const std::string content = "fresh content from a pipe";
    auto stream = std::make_unique<StringStream>(content);
    ClientConfig cc = start({SharedFile::from_stream("pipe.txt", content.size(), std::move(stream))});

    DownloadTask t = task(0, "pipe.txt", content.size());
    write_file(t.dest_path(), "STALE");

    ResumableDownloadClient client(cc);
    Recorder rec;
    EXPECT_EQ(client.download(t, rec.callbacks()), DownloadOutcome::COMPLETED);
    EXPECT_EQ(read_file(t.dest_path()), content);
}

TEST_F(DownloadClientTest, SizeMismatchIsReported) {
    const std::string content = pattern(5000);
    ClientConfig cc = start({SharedFile::from_path(make_file("a.bin", content))});

    ResumableDownloadClient client(cc);
    Recorder rec;
    DownloadTask t = task(0, "a.bin", content.size() + 10);
    EXPECT_EQ(client.download(t, rec.callbacks()), DownloadOutcome::FAILED);
    EXPECT_EQ(rec.completes, 0);
    EXPECT_EQ(rec.errors, 1);
    EXPECT_EQ(rec.last_kind, ErrorKind::SIZE_MISMATCH);
}

TEST_F(DownloadClientTest, HttpErrorsMapToKinds) {
    ClientConfig cc = start({SharedFile::from_path(make_file("a.bin", "abc"))}, "p@ss1");
    {
        ResumableDownloadClient client(cc);
        Recorder rec;
        EXPECT_EQ(client.download(task(0, "a.bin", 3), rec.callbacks()), DownloadOutcome::FAILED);
        EXPECT_EQ(rec.last_kind, ErrorKind::AUTH);
        EXPECT_THROW(client.fetch_file_list(), AuthError);
    }
    {
        cc.token = server_->token();
        ResumableDownloadClient client(cc);
        Recorder rec;
        EXPECT_EQ(client.download(task(7, "missing.bin", 3), rec.callbacks()),
                  DownloadOutcome::FAILED);
        EXPECT_EQ(rec.errors, 1);
        EXPECT_EQ(rec.last_kind, ErrorKind::NETWORK);
        EXPECT_NE(rec.last_error.find("404"), std::string::npos);
    }
}

TEST_F(DownloadClientTest, LoginAndListFiles) {
    ClientConfig cc = start({SharedFile::from_path(make_file("a.txt", "hello")),
                             SharedFile::from_path(make_file("b.txt", "world!"))},
                            "p@ss1");
    ResumableDownloadClient client(cc);
    EXPECT_THROW(client.login("p@ss2"), AuthError);
    EXPECT_EQ(client.token(), "");

    std::string token = client.login("p@ss1");
    EXPECT_EQ(token, server_->token());
    EXPECT_EQ(client.token(), token);

    auto files = client.fetch_file_list();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[1].id, 1u);
    EXPECT_EQ(files[1].name, "b.txt");
    EXPECT_EQ(files[1].size, 6u);

    Recorder rec;
    EXPECT_EQ(client.download(task(1, "b.txt", 6), rec.callbacks()), DownloadOutcome::COMPLETED);
    EXPECT_EQ(read_file(rec.path), "world!");
}

TEST_F(DownloadClientTest, LoginOnUnprotectedServerReturnsEmpty) {
    ClientConfig cc = start({SharedFile::from_path(make_file("a.txt", "hello"))});
    ResumableDownloadClient client(cc);
    EXPECT_EQ(client.login("anything"), "");
    EXPECT_EQ(client.fetch_file_list().size(), 1u);
}

TEST_F(DownloadClientTest, SecondConcurrentDownloadIsRejected) {
    auto gate = std::make_shared<std::atomic<bool>>(false);
    auto stream = std::make_unique<GateStream>("gated", gate);
    ClientConfig cc = start({SharedFile::from_stream("gated.txt", 5, std::move(stream))});

    ResumableDownloadClient client(cc);
    Recorder first;
    DownloadOutcome first_outcome = DownloadOutcome::FAILED;
    std::thread t([&] { first_outcome = client.download(task(0, "gated.txt", 5), first.callbacks()); });

    while (!server_->transfer_active()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_TRUE(client.active());

    Recorder second;
    EXPECT_EQ(client.download(task(0, "gated.txt", 5), second.callbacks()),
              DownloadOutcome::REJECTED);
    EXPECT_EQ(second.errors, 1);
    EXPECT_EQ(second.last_kind, ErrorKind::CONCURRENCY);

    gate->store(true);
    t.join();
    EXPECT_EQ(first_outcome, DownloadOutcome::COMPLETED);
    EXPECT_EQ(first.completes, 1);
    EXPECT_FALSE(client.active());
}

// A pause issued once the client reports active must stop that download,
// however early in the call it lands
TEST_F(DownloadClientTest, PauseRightAfterStartIsNeverLost) {
    for (int round = 0; round < 10; ++round) {
        SCOPED_TRACE("round " + std::to_string(round));
        auto gate = std::make_shared<std::atomic<bool>>(false);
        auto stream = std::make_unique<GateStream>("gated", gate);
        ClientConfig cc = start({SharedFile::from_stream("gated.txt", 5, std::move(stream))});

        ResumableDownloadClient client(cc);
        Recorder rec;
        DownloadOutcome outcome = DownloadOutcome::COMPLETED;
        std::thread t([&] { outcome = client.download(task(0, "gated.txt", 5), rec.callbacks()); });

        while (!client.active()) std::this_thread::yield();
        client.pause();

        // Never paused: the body arrives once the gate opens
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (client.active() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        gate->store(true);
        t.join();

        EXPECT_EQ(outcome, DownloadOutcome::PAUSED);
        EXPECT_EQ(rec.completes, 0);
        EXPECT_EQ(rec.last_error, "Download paused");
        server_->stop();
    }
}

TEST_F(DownloadClientTest, PauseKeepsPartialFileAndResumeFinishes) {
    const u64 size = 64ULL * 1024 * 1024;
    std::string path = make_file("zeros.img", "");
    fs::resize_file(path, size);
    ClientConfig cc = start({SharedFile::from_path(path)});
    cc.progress_interval_ms = 0;

    ResumableDownloadClient client(cc);
    Recorder rec;
    DownloadCallbacks cb = rec.callbacks();
    bool paused_once = false;
    auto record_progress = cb.on_progress;
    cb.on_progress = [&](u64 bytes, double mbps) {
        record_progress(bytes, mbps);
        if (!paused_once) {
            paused_once = true;
            client.pause();
        }
    };

    DownloadTask t = task(0, "zeros.img", size);
    EXPECT_EQ(client.download(t, cb), DownloadOutcome::PAUSED);
    EXPECT_EQ(rec.errors, 1);
    EXPECT_EQ(rec.last_error, "Download paused");
    EXPECT_EQ(rec.completes, 0);

    u64 partial = fs::file_size(t.dest_path());
    EXPECT_GT(partial, 0u);
    EXPECT_LT(partial, size);

    // The server notices the dropped connection on its own thread
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (server_->transfer_active() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_EQ(client.resume(), DownloadOutcome::COMPLETED);
    EXPECT_EQ(rec.completes, 1);
    EXPECT_EQ(fs::file_size(t.dest_path()), size);
}

TEST_F(DownloadClientTest, CancelForgetsTask) {
    ClientConfig cc = start({SharedFile::from_path(make_file("a.txt", "hello"))});
    ResumableDownloadClient client(cc);

    EXPECT_EQ(client.resume(), DownloadOutcome::REJECTED);

    Recorder rec;
    EXPECT_EQ(client.download(task(0, "a.txt", 99), rec.callbacks()), DownloadOutcome::FAILED);
    client.cancel();
    EXPECT_EQ(client.resume(), DownloadOutcome::REJECTED);
}

TEST_F(DownloadClientTest, DestinationNameIsSanitized) {
    DownloadTask t = task(0, "../../etc/passwd", 1);
    EXPECT_EQ(fs::path(t.dest_path()).parent_path(), fs::path(tmp_.file("dest")));
    EXPECT_EQ(fs::path(t.dest_path()).filename(), "passwd");
}
