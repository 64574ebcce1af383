#include "burnlink/core/config.h"

#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Environment.h>
#include <Poco/NumberParser.h>
#include <Poco/Util/JSONConfiguration.h>

#include "burnlink/core/logger.h"
#include "burnlink/core/time.h"

namespace burnlink::core {

namespace {

std::string GetEnv(const std::string& name) {
    return Poco::Environment::get(name, "");
}

// Unparseable overrides are logged and ignored so a typo cannot take the service down.
bool ParseEnvInt(const std::string& name, long long* out) {
    const auto raw = GetEnv(name);
    if (raw.empty()) {
        return false;
    }
    Poco::Int64 parsed = 0;
    if (!Poco::NumberParser::tryParse64(raw, parsed)) {
        LogWarning("ignoring invalid " + name + "=" + raw);
        return false;
    }
    *out = parsed;
    return true;
}

void ApplyAddress(const std::string& address, ServerConfig& server) {
    const auto colon = address.rfind(':');
    int port = 0;
    if (colon == std::string::npos || colon == 0 ||
        !Poco::NumberParser::tryParse(address.substr(colon + 1), port) || port <= 0 ||
        port > 65535) {
        LogWarning("invalid ADDRESS value, keeping " + server.host + ":" +
                   std::to_string(server.port));
        return;
    }
    server.host = address.substr(0, colon);
    server.port = port;
}

// Same policy as ParseEnvInt: an out-of-range duration keeps the current value.
void ApplyEnvDuration(const std::string& name, const std::string& unit,
                      std::chrono::seconds* out) {
    long long value = 0;
    if (!ParseEnvInt(name, &value)) {
        return;
    }
    try {
        *out = DurationFromUnit(value, unit);
    } catch (const std::invalid_argument& ex) {
        LogWarning("ignoring " + name + ": " + ex.what());
    }
}

}  // namespace

std::chrono::seconds DurationFromUnit(long long value, const std::string& unit) {
    long long per_unit = 0;
    if (unit == "seconds") {
        per_unit = 1;
    } else if (unit == "minutes") {
        per_unit = 60;
    } else {
        throw std::invalid_argument("unsupported duration unit: " + unit);
    }
    // Compare before multiplying so huge values cannot wrap.
    if (value <= 0 || value > kMaxDuration.count() / per_unit) {
        throw std::invalid_argument("duration must be between 1 second and " +
                                    std::to_string(kMaxDuration.count()) + " seconds, got " +
                                    std::to_string(value) + " " + unit);
    }
    return std::chrono::seconds(value * per_unit);
}

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 268435456));

    config.storage.base_path = cfg->getString("storage.base_path", "data");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");
    config.storage.purge_on_start = cfg->getBool("storage.purge_on_start", true);

    const auto max_downloads = cfg->getInt64("links.max_downloads", 3);
    if (max_downloads <= 0 || max_downloads > 0xFFFFFFFFLL) {
        throw std::invalid_argument("links.max_downloads must be a positive 32-bit value");
    }
    config.links.max_downloads = static_cast<std::uint32_t>(max_downloads);
    config.links.ttl = DurationFromUnit(cfg->getInt64("links.ttl", 3600),
                                        cfg->getString("links.ttl_unit", "seconds"));
    config.links.public_base_url = cfg->getString("links.public_base_url", "");

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.sweep_interval =
        DurationFromUnit(cfg->getInt64("cleanup.sweep_interval", 60),
                         cfg->getString("cleanup.sweep_interval_unit", "seconds"));

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    config.auth.upload_secret = cfg->getString("auth.upload_secret", "");

    ValidateConfig(config);
    return config;
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto address = GetEnv("ADDRESS");
    if (!address.empty()) {
        ApplyAddress(address, config.server);
    }
    const auto storage_dir = GetEnv("STORAGE_DIR");
    if (!storage_dir.empty()) {
        config.storage.base_path = storage_dir;
        config.storage.temp_path = storage_dir + "/tmp";
    }

    long long value = 0;
    if (ParseEnvInt("MAX_DOWNLOADS", &value)) {
        if (value > 0 && value <= 0xFFFFFFFFLL) {
            config.links.max_downloads = static_cast<std::uint32_t>(value);
        } else {
            LogWarning("ignoring out-of-range MAX_DOWNLOADS");
        }
    }
    // Both unit spellings are accepted; when both are set the seconds variant wins.
    ApplyEnvDuration("DEFAULT_TTL_MINS", "minutes", &config.links.ttl);
    ApplyEnvDuration("DEFAULT_TTL_SECS", "seconds", &config.links.ttl);
    ApplyEnvDuration("CLEANUP_INTERVAL_MINS", "minutes", &config.cleanup.sweep_interval);
    ApplyEnvDuration("CLEANUP_INTERVAL_SECS", "seconds", &config.cleanup.sweep_interval);

    const auto secret = GetEnv("UPLOAD_SECRET");
    if (!secret.empty()) {
        config.auth.upload_secret = secret;
    }
}

void ValidateConfig(const Config& config) {
    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.server.tls.enabled &&
        (config.server.tls.certificate.empty() || config.server.tls.private_key.empty())) {
        throw std::invalid_argument("server.tls.enabled=true requires certificate and private_key");
    }
    if (config.links.max_downloads == 0) {
        throw std::invalid_argument("links.max_downloads must be positive");
    }
    if (config.links.ttl.count() <= 0 || config.links.ttl > kMaxDuration) {
        throw std::invalid_argument("links.ttl out of range");
    }
    if (config.cleanup.sweep_interval.count() <= 0 ||
        config.cleanup.sweep_interval > kMaxDuration) {
        throw std::invalid_argument("cleanup.sweep_interval out of range");
    }
    if (!IsValidLogLevel(config.observability.log_level)) {
        throw std::invalid_argument("unknown observability.log_level: " +
                                    config.observability.log_level);
    }
}

}  // namespace burnlink::core
