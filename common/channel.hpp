#pragma once

// ============================================================
// channel.hpp -- Ordered, closable, optionally bounded queue
//
// The only way data crosses a worker-thread boundary. Items are
// moved in and moved out; a bounded channel blocks the producer
// while full, which caps memory held by in-flight chunks.
// ============================================================

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

template<typename T>
class Channel {
public:
    // capacity 0 = unbounded
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while full. Returns false (item dropped) once closed.
    bool push(T item) {
        std::unique_lock<std::mutex> lk(mutex_);
        not_full_.wait(lk, [this] {
            return closed_ || capacity_ == 0 || queue_.size() < capacity_;
        });
        if (closed_) return false;
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks while empty. Returns false when closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mutex_);
        not_empty_.wait(lk, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    // Wakes all waiters. Items already queued can still be popped.
    void close() {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T>           queue_;
    size_t                  capacity_;
    bool                    closed_{false};
};
