#pragma once

#include "lsync/core/clock.hpp"
#include "lsync/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lsync::queue {

/// Well-known action kinds understood by the optimistic local apply and
/// the in-memory remote. Callers may use other kinds; they are pushed as-is.
namespace kind {
inline constexpr const char* kPut = "put";      ///< Replace the entity document
inline constexpr const char* kMerge = "merge";  ///< Overwrite the listed field groups
inline constexpr const char* kDelete = "delete";
} // namespace kind

enum class ActionState {
    Pending,
    Abandoned
};

const char* to_string(ActionState state) noexcept;

/**
 * @brief A mutation recorded locally and replayed against the remote store
 *
 * seq is assigned at enqueue time and defines FIFO order per target_key.
 */
struct OfflineAction {
    std::string id;
    std::uint64_t seq = 0;
    std::string kind;
    std::string target_key;                 ///< "collection/id"
    nlohmann::json payload = nlohmann::json::object();
    Timestamp created_at = 0;
    Timestamp last_attempt_at = 0;
    Timestamp next_attempt_at = 0;          ///< Backoff gate; 0 = ready
    std::uint32_t retry_count = 0;
    std::string last_error;
    std::optional<ErrorCode> last_error_code;
    std::int32_t priority = 0;              ///< Higher drains first across keys
    ActionState state = ActionState::Pending;
};

void to_json(nlohmann::json& j, const OfflineAction& action);
void from_json(const nlohmann::json& j, OfflineAction& action);

/// "act-" followed by the zero-padded sequence, so id order is FIFO order.
std::string make_action_id(std::uint64_t seq);

struct DrainReport {
    std::size_t succeeded = 0;
    std::size_t retried = 0;
    std::size_t conflicts = 0;
    std::size_t skipped = 0;                ///< Not attempted: backoff gate, blocked key or cancellation
    std::vector<OfflineAction> abandoned;   ///< Abandoned during this drain
    std::vector<std::string> applied_keys;  ///< Keys with at least one action removed
    std::vector<std::string> conflict_keys; ///< Keys where the remote version was kept
    std::optional<Error> last_error;

    [[nodiscard]] bool empty() const {
        return succeeded == 0 && retried == 0 && conflicts == 0 && skipped == 0 && abandoned.empty();
    }
};

} // namespace lsync::queue
