#pragma once

#include "lsync/core/clock.hpp"
#include "lsync/sync/remote_store.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lsync::sync {

/**
 * @brief In-process remote used by the demo and the test suite
 *
 * Every write gets the next value of a global change sequence, which is
 * also the pull cursor. Pushes understand the put, merge and delete
 * action kinds; other kinds are rejected with InvalidArgument.
 *
 * Failure injection:
 * - set_online(false): every call fails with TransientNetwork
 * - fail_next_pushes / fail_next_pulls: the next n calls fail with code
 */
class MemoryRemoteStore final : public RemoteStore {
public:
    explicit MemoryRemoteStore(const Clock& clock, std::size_t page_size = 100);

    Result<PullBatch> pull(const std::string& collection, std::int64_t since_cursor) override;
    Result<void> push(const queue::OfflineAction& action) override;

    void set_online(bool online);
    bool online() const;

    void fail_next_pushes(std::size_t count, ErrorCode code = ErrorCode::TransientNetwork);
    void fail_next_pulls(std::size_t count, ErrorCode code = ErrorCode::TransientNetwork);

    /// Server-side write, as if another device changed the record.
    void upsert(const std::string& collection, const std::string& id, nlohmann::json data);
    void remove(const std::string& collection, const std::string& id);

    std::optional<RemoteRecord> get(const std::string& collection, const std::string& id) const;

    /// Every action accepted so far, in arrival order.
    std::vector<queue::OfflineAction> pushed() const;

    std::int64_t head() const;

private:
    struct Stored {
        RemoteRecord record;
        std::int64_t seq = 0;
    };

    void write_locked(RemoteRecord record);

    const Clock& clock_;
    std::size_t page_size_;

    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, Stored> records_;
    std::int64_t next_seq_ = 1;
    bool online_ = true;
    std::size_t push_failures_ = 0;
    ErrorCode push_failure_code_ = ErrorCode::TransientNetwork;
    std::size_t pull_failures_ = 0;
    ErrorCode pull_failure_code_ = ErrorCode::TransientNetwork;
    std::vector<queue::OfflineAction> pushed_;
    std::set<std::string> applied_action_ids_;
};

} // namespace lsync::sync
