/**
 * @file event_queue.hpp
 * @brief Closable blocking queue that backs observer streams
 *
 * A producer (e.g. a download worker) pushes snapshots; a consumer drains
 * them with pop(). Once the producer calls close(), pop() keeps returning
 * queued items and then nullopt, which is how a stream signals its end.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace lsync::events {

template<typename T>
class ClosableQueue {
public:
    ClosableQueue() = default;

    ClosableQueue(const ClosableQueue&) = delete;
    ClosableQueue& operator=(const ClosableQueue&) = delete;

    /// Returns false (and drops the item) when the queue is already closed.
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Pushes a final item and closes in one step so no consumer sees a gap.
    bool push_and_close(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
            closed_ = true;
        }
        cv_.notify_all();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /// Blocks until an item arrives or the queue is closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_front();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /// True once closed and every queued item has been consumed.
    bool exhausted() const {
        std::lock_guard lock(mutex_);
        return closed_ && items_.empty();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace lsync::events
