#pragma once

#include <string>

namespace lsync {

/**
 * @brief Error taxonomy shared by every engine component
 *
 * TransientNetwork is the only family that components retry on their own;
 * everything else is either surfaced to the caller immediately or recorded
 * on the affected action/download so it stays inspectable.
 */
enum class ErrorCode {
    NotFound,
    InvalidArgument,
    InvalidState,
    TransientNetwork,
    QuotaExceeded,
    Conflict,
    CorruptLocalState,
    Abandoned,
    Cancelled,
    Io,
    Storage
};

const char* to_string(ErrorCode code) noexcept;

/// Parses the name produced by to_string(); unknown names map to Storage.
ErrorCode error_code_from_string(const std::string& name) noexcept;

struct Error {
    ErrorCode code = ErrorCode::Storage;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_transient() const noexcept { return code == ErrorCode::TransientNetwork; }

    [[nodiscard]] std::string to_string() const;
};

} // namespace lsync
