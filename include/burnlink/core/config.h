#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace burnlink::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage configuration for local filesystem backend.
struct StorageConfig {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
    bool purge_on_start{true};
};

/// @brief Download budget and lifetime given to every new link.
struct LinksConfig {
    std::uint32_t max_downloads{3};
    std::chrono::seconds ttl{3600};
    /// Prefix for the `url` field of upload responses, e.g. "https://share.example.org".
    std::string public_base_url;
};

/// @brief Background expiry sweep settings.
struct CleanupConfig {
    bool enabled{true};
    std::chrono::seconds sweep_interval{60};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Shared upload secret; empty disables the check.
struct AuthConfig {
    std::string upload_secret;
};

/// @brief Top-level configuration for burnlink.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    LinksConfig links;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
    AuthConfig auth;
};

/// @brief Load server configuration from a JSON file. Throws on invalid values.
Config LoadConfig(const std::string& path);
/// @brief Override fields from process environment variables (ADDRESS, STORAGE_DIR, ...).
void ApplyEnvironmentOverrides(Config& config);
/// @brief Throws std::invalid_argument if the configuration cannot be served.
void ValidateConfig(const Config& config);
/// @brief Convert a value in "seconds" or "minutes" to seconds.
std::chrono::seconds DurationFromUnit(long long value, const std::string& unit);

}  // namespace burnlink::core
