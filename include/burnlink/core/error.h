#pragma once

#include <string>

namespace burnlink::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kGone,
    kAlreadyExists,
    kIoError,
    kUnauthorized,
    kTooLarge,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code (used in logs and JSON error bodies).
const char* ErrorCodeName(ErrorCode code);

}  // namespace burnlink::core
