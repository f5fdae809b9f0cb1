#pragma once

// ============================================================
// progress.hpp -- Throttled byte-count / throughput meter
//
// Sits on the byte-forwarding path: add() is a couple of integer
// ops and a clock read; the callback fires at most once per
// interval with the cumulative count and the speed over that
// interval in MiB/s.
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <functional>

using ProgressCallback = std::function<void(u64 cumulative_bytes, double mbps)>;

class ProgressMeter {
public:
    ProgressMeter(u64 interval_ms, ProgressCallback cb, u64 start_bytes = 0)
        : interval_ms_(interval_ms)
        , cb_(std::move(cb))
        , cumulative_(start_bytes)
        , last_ms_(utils::now_ms())
    {}

    void add(u64 n) {
        cumulative_ += n;
        pending_    += n;
        u64 now = utils::now_ms();
        if (now - last_ms_ >= interval_ms_) emit(now);
    }

    // Report whatever accumulated since the last emission
    void flush() {
        if (pending_ > 0) emit(utils::now_ms());
    }

    u64 cumulative() const { return cumulative_; }

private:
    void emit(u64 now) {
        u64 elapsed = now - last_ms_;
        double mbps = elapsed > 0
            ? ((double)pending_ / (1024.0 * 1024.0)) / ((double)elapsed / 1000.0)
            : 0.0;
        pending_ = 0;
        last_ms_ = now;
        if (cb_) cb_(cumulative_, mbps);
    }

    u64 interval_ms_;
    ProgressCallback cb_;
    u64 cumulative_{0};
    u64 pending_{0};
    u64 last_ms_;
};
