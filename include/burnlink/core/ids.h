#pragma once

#include <string>

namespace burnlink::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate an unguessable identifier (random UUID, 122 bits of entropy).
std::string GenerateRandomId();

}  // namespace burnlink::core
