#pragma once

#include "lsync/download/types.hpp"
#include "lsync/events/event_queue.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace lsync::download {

using ProgressQueue = events::ClosableQueue<ProgressSnapshot>;

/**
 * @brief Consumer end of one progress subscription
 *
 * The first item is the task's state at subscription time; the stream
 * ends after the completed, failed or cancelled snapshot. Dropping the
 * stream unsubscribes it. Asking the manager again for the same task
 * yields a fresh stream, so observation can restart at any time.
 */
class ProgressStream {
public:
    explicit ProgressStream(std::shared_ptr<ProgressQueue> queue) : queue_(std::move(queue)) {}

    /// Blocks for the next snapshot; nullopt once the stream has ended.
    std::optional<ProgressSnapshot> next() { return queue_->pop(); }

    /// Like next(), but gives up after timeout (nullopt without ending the stream).
    template<typename Rep, typename Period>
    std::optional<ProgressSnapshot> next_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_->pop_for(timeout);
    }

    /// True once the terminal snapshot has been consumed.
    bool finished() const { return queue_->exhausted(); }

    /// Blocks until the stream ends and returns everything it delivered.
    std::vector<ProgressSnapshot> collect() {
        std::vector<ProgressSnapshot> snapshots;
        while (auto snapshot = next()) {
            snapshots.push_back(*snapshot);
        }
        return snapshots;
    }

private:
    std::shared_ptr<ProgressQueue> queue_;
};

} // namespace lsync::download
