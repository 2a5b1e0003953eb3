#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace core {

// ---------------------------------------------------------------------------
// WorkQueue<T> -- bounded multi-producer multi-consumer queue
// ---------------------------------------------------------------------------
// Producers never block: try_push() refuses work when the queue is full or
// closed, so an overloaded server can answer "busy" immediately. Consumers
// wait with a timeout so they can notice shutdown. After close(), queued
// items are still handed out until the queue drains.
// ---------------------------------------------------------------------------
template <typename T>
class WorkQueue {
public:
    /// capacity == 0 means unbounded.
    explicit WorkQueue(size_t capacity = 0) : capacity_(capacity) {}

    WorkQueue(const WorkQueue&)            = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    [[nodiscard]] bool try_push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            if (capacity_ > 0 && items_.size() >= capacity_) return false;
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
        return true;
    }

    /// nullopt on timeout, or once the queue is closed and drained.
    [[nodiscard]] std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout,
                        [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /// True once closed with nothing left to hand out.
    [[nodiscard]] bool finished() const {
        std::lock_guard lock(mutex_);
        return closed_ && items_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable ready_;
    std::deque<T>           items_;
    size_t                  capacity_;
    bool                    closed_{false};
};

} // namespace core
