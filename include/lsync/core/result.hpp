#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used across module boundaries
 *
 * Components do not throw across their public API. They return a Result
 * whose error side is an lsync::Error, so callers branch on ErrorCode:
 *
 * ```cpp
 * auto record = store.get("courses", "c1");
 * if (record.is_error() && record.error().code == ErrorCode::NotFound) { ... }
 * ```
 *
 * Construct through Ok() / Err(); the OkValue / ErrValue wrappers keep the
 * two constructors apart even when T and E are the same type.
 */

#include "lsync/core/error.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace lsync {

template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
public:
    Result(OkValue<T> ok) : state_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : state_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return state_.index() == 0; }
    bool is_error() const { return !is_ok(); }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    E& error() { return std::get<1>(state_); }
    const E& error() const { return std::get<1>(state_); }

    T value_or(T fallback) const { return is_ok() ? value() : std::move(fallback); }

private:
    std::variant<T, E> state_;
};

/// Success carries nothing; only the error side is stored.
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(OkValue<T>(std::move(value)));
}

template<typename E = Error>
Result<void, E> Ok() {
    return Result<void, E>();
}

template<typename T, typename E>
Result<T, E> Err(E error) {
    return Result<T, E>(ErrValue<E>(std::move(error)));
}

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Err<T>(Error{code, std::move(message)});
}

/// Treats "nothing to remove" as success for idempotent deletes.
inline Result<void> allow_not_found(Result<void> result) {
    if (result.is_error() && result.error().code == ErrorCode::NotFound) {
        return Ok();
    }
    return result;
}

} // namespace lsync
