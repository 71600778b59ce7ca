#pragma once

#include "lsync/core/result.hpp"
#include "lsync/queue/action.hpp"
#include "lsync/sync/types.hpp"

#include <cstdint>
#include <string>

namespace lsync::sync {

/**
 * @brief The authoritative backend, as the engine sees it
 *
 * Both calls must be safe to retry: pulling the same window twice returns
 * the same records, and pushing an action twice has the effect of pushing
 * it once. Connection problems are reported as TransientNetwork; a push
 * the remote refuses because its version wins is reported as Conflict.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /// Changes in collection after since_cursor, oldest first.
    virtual Result<PullBatch> pull(const std::string& collection, std::int64_t since_cursor) = 0;

    virtual Result<void> push(const queue::OfflineAction& action) = 0;
};

} // namespace lsync::sync
