#include "lsync/queue/action.hpp"

#include <cstdio>

namespace lsync::queue {

const char* to_string(ActionState state) noexcept {
    switch (state) {
        case ActionState::Pending: return "pending";
        case ActionState::Abandoned: return "abandoned";
    }
    return "pending";
}

std::string make_action_id(std::uint64_t seq) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "act-%012llu", static_cast<unsigned long long>(seq));
    return buffer;
}

void to_json(nlohmann::json& j, const OfflineAction& action) {
    j = nlohmann::json{
        {"id", action.id},
        {"seq", action.seq},
        {"kind", action.kind},
        {"targetKey", action.target_key},
        {"payload", action.payload},
        {"createdAt", action.created_at},
        {"lastAttemptAt", action.last_attempt_at},
        {"nextAttemptAt", action.next_attempt_at},
        {"retryCount", action.retry_count},
        {"lastError", action.last_error},
        {"priority", action.priority},
        {"state", to_string(action.state)},
    };
    if (action.last_error_code) {
        j["lastErrorCode"] = to_string(*action.last_error_code);
    }
}

void from_json(const nlohmann::json& j, OfflineAction& action) {
    j.at("id").get_to(action.id);
    j.at("seq").get_to(action.seq);
    j.at("kind").get_to(action.kind);
    j.at("targetKey").get_to(action.target_key);
    action.payload = j.contains("payload") ? j.at("payload") : nlohmann::json::object();
    action.created_at = j.value("createdAt", Timestamp{0});
    action.last_attempt_at = j.value("lastAttemptAt", Timestamp{0});
    action.next_attempt_at = j.value("nextAttemptAt", Timestamp{0});
    action.retry_count = j.value("retryCount", std::uint32_t{0});
    action.last_error = j.value("lastError", std::string{});
    action.priority = j.value("priority", std::int32_t{0});
    action.state = j.value("state", std::string{"pending"}) == "abandoned" ? ActionState::Abandoned
                                                                          : ActionState::Pending;
    if (j.contains("lastErrorCode")) {
        action.last_error_code = error_code_from_string(j.at("lastErrorCode").get<std::string>());
    } else {
        action.last_error_code.reset();
    }
}

} // namespace lsync::queue
