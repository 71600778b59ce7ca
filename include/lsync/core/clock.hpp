#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace lsync {

/// Milliseconds since the Unix epoch. Every persisted timestamp uses this unit.
using Timestamp = std::int64_t;

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

/**
 * @brief Hand-driven clock for deterministic TTL, backoff and staleness tests
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = 1'700'000'000'000) : now_(start) {}

    Timestamp now() const override { return now_.load(); }

    void advance(std::chrono::milliseconds delta) { now_ += delta.count(); }
    void set(Timestamp value) { now_ = value; }

private:
    std::atomic<Timestamp> now_;
};

/// Process-wide wall clock used when a caller does not inject one.
const Clock& system_clock();

} // namespace lsync
