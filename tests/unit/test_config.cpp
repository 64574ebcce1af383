#include <cstdlib>
#include <limits>
#include <filesystem>
#include <stdexcept>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "burnlink/core/config.h"
#include "burnlink/core/time.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "burnlink_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& links_json,
                 const std::string& cleanup_json) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 8080,\n"
        << "    \"threads\": 1,\n"
        << "    \"tls\": {\"enabled\": false, \"certificate\": \"\", \"private_key\": \"\"},\n"
        << "    \"limits\": {\"max_body_bytes\": 1048576}\n"
        << "  },\n"
        << "  \"storage\": {\"base_path\": \"data\", \"temp_path\": \"data/tmp\"},\n"
        << "  \"links\": " << links_json << ",\n"
        << "  \"cleanup\": " << cleanup_json << ",\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

/// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

}  // namespace

TEST(Config, DefaultsAreServable) {
    burnlink::core::Config config;
    EXPECT_NO_THROW(burnlink::core::ValidateConfig(config));
    EXPECT_EQ(config.links.max_downloads, 3u);
    EXPECT_EQ(config.links.ttl, std::chrono::seconds(3600));
    EXPECT_EQ(config.cleanup.sweep_interval, std::chrono::seconds(60));
    EXPECT_TRUE(config.storage.purge_on_start);
}

TEST(Config, LoadsLinkPolicyInMinutes) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path,
                "{\"max_downloads\": 5, \"ttl\": 30, \"ttl_unit\": \"minutes\", "
                "\"public_base_url\": \"https://share.example.org\"}",
                "{\"enabled\": true, \"sweep_interval\": 2, \"sweep_interval_unit\": \"minutes\"}");

    auto config = burnlink::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.limits.max_body_bytes, 1048576u);
    EXPECT_EQ(config.links.max_downloads, 5u);
    EXPECT_EQ(config.links.ttl, std::chrono::seconds(1800));
    EXPECT_EQ(config.links.public_base_url, "https://share.example.org");
    EXPECT_EQ(config.cleanup.sweep_interval, std::chrono::seconds(120));
    EXPECT_EQ(config.observability.log_level, "warning");

    std::filesystem::remove(path);
}

TEST(Config, RejectsUnknownUnit) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"ttl\": 1, \"ttl_unit\": \"hours\"}", "{}");

    EXPECT_THROW({ (void)burnlink::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsZeroDownloads) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"max_downloads\": 0}", "{}");

    EXPECT_THROW({ (void)burnlink::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsNonPositiveSweepInterval) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{}", "{\"sweep_interval\": 0}");

    EXPECT_THROW({ (void)burnlink::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, EnvironmentOverridesFileValues) {
    ScopedEnv address("ADDRESS", "127.0.0.1:9191");
    ScopedEnv storage("STORAGE_DIR", "/var/lib/burnlink");
    ScopedEnv downloads("MAX_DOWNLOADS", "7");
    ScopedEnv ttl("DEFAULT_TTL_MINS", "10");
    ScopedEnv interval("CLEANUP_INTERVAL_SECS", "15");
    ScopedEnv secret("UPLOAD_SECRET", "hunter2");

    burnlink::core::Config config;
    burnlink::core::ApplyEnvironmentOverrides(config);

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9191);
    EXPECT_EQ(config.storage.base_path, "/var/lib/burnlink");
    EXPECT_EQ(config.storage.temp_path, "/var/lib/burnlink/tmp");
    EXPECT_EQ(config.links.max_downloads, 7u);
    EXPECT_EQ(config.links.ttl, std::chrono::seconds(600));
    EXPECT_EQ(config.cleanup.sweep_interval, std::chrono::seconds(15));
    EXPECT_EQ(config.auth.upload_secret, "hunter2");
}

TEST(Config, SecondsOverrideWinsOverMinutes) {
    ScopedEnv mins("DEFAULT_TTL_MINS", "10");
    ScopedEnv secs("DEFAULT_TTL_SECS", "42");

    burnlink::core::Config config;
    burnlink::core::ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.links.ttl, std::chrono::seconds(42));
}

TEST(Config, InvalidEnvironmentValuesAreIgnored) {
    ScopedEnv address("ADDRESS", "no-port-here");
    ScopedEnv downloads("MAX_DOWNLOADS", "lots");
    ScopedEnv zero("CLEANUP_INTERVAL_SECS", "abc");

    burnlink::core::Config config;
    burnlink::core::ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.links.max_downloads, 3u);
    EXPECT_EQ(config.cleanup.sweep_interval, std::chrono::seconds(60));
}

TEST(Config, RejectsUnknownLogLevel) {
    burnlink::core::Config config;
    config.observability.log_level = "chatty";
    EXPECT_THROW(burnlink::core::ValidateConfig(config), std::invalid_argument);

    config.observability.log_level = "debug";
    EXPECT_NO_THROW(burnlink::core::ValidateConfig(config));
}

TEST(Config, DurationFromUnitRejectsOutOfRangeValues) {
    using burnlink::core::DurationFromUnit;
    EXPECT_THROW(DurationFromUnit(0, "seconds"), std::invalid_argument);
    EXPECT_THROW(DurationFromUnit(-5, "minutes"), std::invalid_argument);
    EXPECT_THROW(DurationFromUnit(std::numeric_limits<long long>::max(), "minutes"),
                 std::invalid_argument);
    EXPECT_THROW(DurationFromUnit(burnlink::core::kMaxDuration.count() + 1, "seconds"),
                 std::invalid_argument);
    EXPECT_EQ(DurationFromUnit(burnlink::core::kMaxDuration.count(), "seconds"),
              burnlink::core::kMaxDuration);
}

TEST(Config, RejectsTtlBeyondMaximum) {
    const auto path = MakeTempConfigPath();
    WriteConfig(path, "{\"ttl\": 9223372036854775807, \"ttl_unit\": \"seconds\"}", "{}");

    EXPECT_THROW({ (void)burnlink::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, OutOfRangeDurationOverridesAreIgnored) {
    ScopedEnv negative("DEFAULT_TTL_SECS", "-5");
    ScopedEnv huge("CLEANUP_INTERVAL_MINS", "9223372036854775807");

    burnlink::core::Config config;
    EXPECT_NO_THROW(burnlink::core::ApplyEnvironmentOverrides(config));
    EXPECT_EQ(config.links.ttl, std::chrono::seconds(3600));
    EXPECT_EQ(config.cleanup.sweep_interval, std::chrono::seconds(60));
    EXPECT_NO_THROW(burnlink::core::ValidateConfig(config));
}

TEST(Config, ValidateRejectsTtlBeyondMaximum) {
    burnlink::core::Config config;
    config.links.ttl = burnlink::core::kMaxDuration + std::chrono::seconds(1);
    EXPECT_THROW(burnlink::core::ValidateConfig(config), std::invalid_argument);
}
