#include "lsync/core/error.hpp"

#include <array>
#include <utility>

namespace lsync {
namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 11> kNames{{
    {ErrorCode::NotFound, "NotFound"},
    {ErrorCode::InvalidArgument, "InvalidArgument"},
    {ErrorCode::InvalidState, "InvalidState"},
    {ErrorCode::TransientNetwork, "TransientNetworkError"},
    {ErrorCode::QuotaExceeded, "QuotaExceeded"},
    {ErrorCode::Conflict, "ConflictError"},
    {ErrorCode::CorruptLocalState, "CorruptLocalState"},
    {ErrorCode::Abandoned, "Abandoned"},
    {ErrorCode::Cancelled, "Cancelled"},
    {ErrorCode::Io, "IoError"},
    {ErrorCode::Storage, "StorageError"},
}};

} // namespace

const char* to_string(ErrorCode code) noexcept {
    for (const auto& [value, name] : kNames) {
        if (value == code) {
            return name;
        }
    }
    return "Unknown";
}

ErrorCode error_code_from_string(const std::string& name) noexcept {
    for (const auto& [value, text] : kNames) {
        if (name == text) {
            return value;
        }
    }
    return ErrorCode::Storage;
}

std::string Error::to_string() const {
    return std::string(lsync::to_string(code)) + ": " + message;
}

} // namespace lsync
