// ============================================================
// archive_encoder.cpp -- Orchestrator and worker for ZIP64 bundles
// ============================================================

#include "archive_encoder.hpp"
#include "zip_writer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <thread>

namespace {

// Clears the build flags on every exit path of create_archive()
struct RunningReset {
    std::atomic<bool>& running;
    std::atomic<bool>& cancelled;
    ~RunningReset() {
        cancelled.store(false);
        running.store(false);
    }
};

} // namespace

ArchiveStreamEncoder::ArchiveStreamEncoder(ArchiveOptions opts)
    : opts_(opts)
{
    if (opts_.chunk_size == 0) opts_.chunk_size = ARCHIVE_CHUNK_SIZE;
    if (opts_.channel_capacity == 0) opts_.channel_capacity = ARCHIVE_CHANNEL_CAPACITY;
}

ArchiveStreamEncoder::~ArchiveStreamEncoder() {
    cancel();
}

// ---------------------------------------------------------------
// plan_entries
//   Resolves every source to one or more concrete entries, in the
//   order given. Directories expand to their regular files.
// ---------------------------------------------------------------
std::vector<ArchiveStreamEncoder::PlannedEntry>
ArchiveStreamEncoder::plan_entries(std::vector<ArchiveSource> sources) {
    std::vector<PlannedEntry> plan;
    for (auto& src : sources) {
        if (src.stream) {
            PlannedEntry e;
            e.name   = src.name;
            e.size   = src.size;
            e.stream = std::move(src.stream);
            plan.push_back(std::move(e));
            continue;
        }
        if (src.path.empty()) {
            throw IOError("Archive source '" + src.name + "' has neither path nor stream");
        }
        if (file_io::is_directory(src.path)) {
            for (auto& df : file_io::scan_directory(src.path)) {
                PlannedEntry e;
                if (src.name.empty()) {
                    e.name = df.rel_path;
                } else {
                    size_t slash = df.rel_path.find('/');
                    e.name = src.name + "/" + df.rel_path.substr(slash + 1);
                }
                e.path = df.abs_path;
                e.size = df.size;
                plan.push_back(std::move(e));
            }
            continue;
        }
        if (!file_io::file_exists(src.path)) {
            throw IOError("Archive source not found: " + src.path);
        }
        PlannedEntry e;
        e.name = src.name.empty() ? fs::path(src.path).filename().string() : src.name;
        e.path = src.path;
        e.size = file_io::get_file_size(src.path);
        plan.push_back(std::move(e));
    }
    return plan;
}

// ---------------------------------------------------------------
// run_worker
//   Applies commands strictly in order. Emits exactly one DONE or
//   ERROR, then closes both channels so neither side can block on
//   the other.
// ---------------------------------------------------------------
void ArchiveStreamEncoder::run_worker(Channel<ArchiveMsg>& cmds,
                                      Channel<ArchiveEvent>& events,
                                      const std::string& out_path)
{
    ZipWriter zip;
    u64 processed = 0;
    try {
        zip.open(out_path);

        bool finished = false;
        ArchiveMsg msg;
        while (!finished && cmds.pop(msg)) {
            switch (msg.cmd) {
                case ArchiveCmd::START:
                    zip.start_entry(msg.text, msg.size);
                    break;
                case ArchiveCmd::DATA: {
                    zip.write_data(msg.data.data(), msg.data.size());
                    processed += msg.data.size();
                    ArchiveEvent ev;
                    ev.type      = ArchiveEventType::PROGRESS;
                    ev.processed = processed;
                    events.push(std::move(ev));
                    break;
                }
                case ArchiveCmd::END: {
                    zip.end_entry();
                    ArchiveEvent ev;
                    ev.type      = ArchiveEventType::FILE_DONE;
                    ev.processed = processed;
                    ev.text      = msg.text;
                    events.push(std::move(ev));
                    break;
                }
                case ArchiveCmd::FINISH:
                    zip.finish();
                    finished = true;
                    break;
                case ArchiveCmd::ABORT:
                    throw IOError(msg.text);
            }
        }
        if (!finished) throw IOError("Archive build cancelled");

        ArchiveEvent done;
        done.type      = ArchiveEventType::DONE;
        done.processed = processed;
        done.text      = out_path;
        events.push(std::move(done));
    } catch (const std::exception& e) {
        zip.abandon();
        ArchiveEvent err;
        err.type      = ArchiveEventType::ERROR;
        err.processed = processed;
        err.text      = e.what();
        events.push(std::move(err));
    }
    cmds.close();
    events.close();
}

bool ArchiveStreamEncoder::produce(std::vector<PlannedEntry>& plan,
                                   Channel<ArchiveMsg>& cmds,
                                   Channel<ArchiveEvent>& events,
                                   const std::function<bool(const ArchiveEvent&)>& on_event)
{
    // Handle whatever the worker reported so far; false on a terminal event
    auto drain = [&]() -> bool {
        ArchiveEvent ev;
        while (events.try_pop(ev)) {
            if (on_event(ev)) return false;
        }
        return true;
    };

    for (auto& entry : plan) {
        ArchiveMsg start;
        start.cmd  = ArchiveCmd::START;
        start.text = entry.name;
        start.size = entry.size;
        if (!cmds.push(std::move(start))) return false;

        std::unique_ptr<file_io::FileReader> reader;
        if (!entry.stream) reader = std::make_unique<file_io::FileReader>(entry.path);

        u64 offset = 0;
        for (;;) {
            if (cancelled_.load()) return false;

            std::vector<u8> buf(opts_.chunk_size);
            size_t n = entry.stream
                ? entry.stream->read(buf.data(), buf.size())
                : reader->read_at(offset, buf.data(), buf.size());
            if (n == 0) break;
            buf.resize(n);
            offset += n;

            ArchiveMsg data;
            data.cmd  = ArchiveCmd::DATA;
            data.data = std::move(buf);
            if (!cmds.push(std::move(data))) return false;
            if (!drain()) return false;
        }

        ArchiveMsg end;
        end.cmd  = ArchiveCmd::END;
        end.text = entry.name;
        if (!cmds.push(std::move(end))) return false;
        if (!drain()) return false;
    }

    ArchiveMsg fin;
    fin.cmd = ArchiveCmd::FINISH;
    return cmds.push(std::move(fin));
}

std::string ArchiveStreamEncoder::create_archive(std::vector<ArchiveSource> sources,
                                                 const std::string& out_path,
                                                 ArchiveProgressCallback on_progress)
{
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw ConcurrencyError("Archive build already in progress");
    }
    RunningReset reset{running_, cancelled_};

    std::vector<PlannedEntry> plan = plan_entries(std::move(sources));
    u64 total = 0;
    for (const auto& e : plan) total += e.size;
    if (opts_.max_archive_bytes > 0 && total > opts_.max_archive_bytes) {
        throw IOError("Archive payload of " + std::to_string(total) +
                      " bytes exceeds the limit of " +
                      std::to_string(opts_.max_archive_bytes));
    }

    LOG_INFO("Building archive " + out_path + ": " + std::to_string(plan.size()) +
             " entries, " + utils::format_bytes(total));

    auto cmds = std::make_shared<Channel<ArchiveMsg>>(opts_.channel_capacity);
    Channel<ArchiveEvent> events;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        active_cmds_ = cmds;
    }
    if (cancelled_.load()) cmds->close();

    std::thread worker([&cmds, &events, &out_path] {
        run_worker(*cmds, events, out_path);
    });

    bool terminal = false;
    std::string result;
    std::string failure;
    auto on_event = [&](const ArchiveEvent& ev) -> bool {
        switch (ev.type) {
            case ArchiveEventType::PROGRESS:
                if (on_progress) {
                    try {
                        on_progress(ev.processed, total);
                    } catch (const std::exception& e) {
                        LOG_WARN("archive progress callback: " + std::string(e.what()));
                    }
                }
                return false;
            case ArchiveEventType::FILE_DONE:
                LOG_DEBUG("archive: added " + ev.text);
                return false;
            case ArchiveEventType::DONE:
                result   = ev.text;
                terminal = true;
                return true;
            case ArchiveEventType::ERROR:
                if (failure.empty()) failure = ev.text;
                terminal = true;
                return true;
        }
        return false;
    };

    try {
        produce(plan, *cmds, events, on_event);
    } catch (const std::exception& e) {
        // A source could not be read: the worker closes the output
        failure = e.what();
        ArchiveMsg abort;
        abort.cmd  = ArchiveCmd::ABORT;
        abort.text = failure;
        cmds->push(std::move(abort));
    }

    ArchiveEvent ev;
    while (!terminal && events.pop(ev)) on_event(ev);
    worker.join();

    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        active_cmds_.reset();
    }

    if (cancelled_.load()) {
        file_io::remove_quietly(out_path);
        throw IOError("Archive build cancelled: " + out_path);
    }
    if (result.empty()) {
        if (failure.empty()) failure = "worker exited without a result";
        LOG_ERROR("Archive build failed: " + failure);
        throw IOError("Archive build failed: " + failure);
    }

    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        finished_path_ = result;
    }
    LOG_INFO("Archive ready: " + result);
    return result;
}

void ArchiveStreamEncoder::cancel() {
    if (!running_.load()) return;
    cancelled_.store(true);
    std::lock_guard<std::mutex> lk(state_mutex_);
    if (active_cmds_) active_cmds_->close();
}

void ArchiveStreamEncoder::cleanup() {
    std::string path;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        path.swap(finished_path_);
    }
    if (!path.empty()) file_io::remove_quietly(path);
}
