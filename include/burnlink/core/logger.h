#pragma once

#include <string>

namespace burnlink::core {

/// @brief Route the `burnlink` logger to the console at the given level
/// (a Poco level name: "trace", "debug", "information", "warning", "error", ...).
void InitLogging(const std::string& level);
bool IsValidLogLevel(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for HTTP requests.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);
/// @brief Log a structured JSON line for a link lifecycle transition.
void LogLinkEvent(const std::string& event, const std::string& link_id,
                  const std::string& detail);

}  // namespace burnlink::core
