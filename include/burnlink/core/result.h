#pragma once

#include <optional>
#include <utility>

#include "burnlink/core/error.h"

namespace burnlink::core {

/// @brief Value-or-error return type; modules report failures through it instead of throwing.
///
/// Works with move-only payloads (e.g. storage::BlobHandle): construct from an
/// rvalue and move the payload out with take().
template <typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    const T& value() const { return *value_; }
    T& value() { return *value_; }
    /// Move the payload out; the result must be ok().
    T take() { return std::move(*value_); }

    const Error& error() const { return error_; }
    ErrorCode code() const { return ok() ? ErrorCode::kOk : error_.code; }

private:
    std::optional<T> value_;
    Error error_{ErrorCode::kOk, ""};
};

template <>
class Result<void> {
public:
    Result() : ok_(true) {}
    Result(const Error& error) : ok_(false), error_(error) {}

    bool ok() const { return ok_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return ok_ ? ErrorCode::kOk : error_.code; }

private:
    bool ok_{false};
    Error error_{ErrorCode::kOk, ""};
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace burnlink::core
