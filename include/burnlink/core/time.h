#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace burnlink::core {

using SteadyClock = std::chrono::steady_clock;
/// @brief Source of monotonic time; injectable so expiry can be tested without sleeping.
using NowFn = std::function<SteadyClock::time_point()>;

/// @brief Upper bound for link TTLs and sweep intervals (ten years).
///
/// Keeps `now + ttl` on the nanosecond steady clock far below overflow.
inline constexpr std::chrono::seconds kMaxDuration{10LL * 365 * 24 * 60 * 60};

/// @brief Default clock backed by std::chrono::steady_clock.
NowFn SystemNow();

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Returns a UTC ISO8601 timestamp offset from now by delta seconds.
std::string NowIso8601WithOffsetSeconds(long long delta_seconds);

}  // namespace burnlink::core
