#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <Poco/File.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "burnlink/core/config.h"
#include "burnlink/core/logger.h"
#include "burnlink/http/http_server.h"
#include "burnlink/http/route_registration.h"
#include "burnlink/http/router.h"
#include "burnlink/links/link_registry.h"
#include "burnlink/storage/local_storage.h"

namespace {

constexpr const char* kDefaultConfigPath = "config/server.json";

bool HasArg(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == key) {
            return true;
        }
    }
    return false;
}

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

// The default config file is optional (defaults + environment); an explicit --config is not.
burnlink::core::Config ResolveConfig(int argc, char** argv) {
    const bool explicit_path = HasArg(argc, argv, "--config");
    const std::string config_path = GetArgValue(argc, argv, "--config", kDefaultConfigPath);

    burnlink::core::Config config;
    if (explicit_path || Poco::File(config_path).exists()) {
        config = burnlink::core::LoadConfig(config_path);
    }
    burnlink::core::ApplyEnvironmentOverrides(config);
    burnlink::core::ValidateConfig(config);
    return config;
}

}  // namespace

int main(int argc, char** argv) {
    burnlink::core::Config config;
    try {
        config = ResolveConfig(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "burnlink: invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
    burnlink::core::InitLogging(config.observability.log_level);

    std::shared_ptr<burnlink::storage::LocalStorage> storage;
    try {
        storage = std::make_shared<burnlink::storage::LocalStorage>(config.storage.base_path,
                                                                    config.storage.temp_path);
    } catch (const std::exception& ex) {
        burnlink::core::LogError(std::string("failed to prepare storage: ") + ex.what());
        return 1;
    }
    if (config.storage.purge_on_start) {
        // Links do not survive a restart, so neither may their blobs.
        auto purged = storage->Purge();
        if (!purged.ok()) {
            burnlink::core::LogError(purged.error().message);
            return 1;
        }
        if (purged.value() > 0) {
            burnlink::core::LogInfo("purged " + std::to_string(purged.value()) +
                                    " orphaned files from " + config.storage.base_path);
        }
    }

    auto registry = std::make_shared<burnlink::links::LinkRegistry>();

    burnlink::http::Router router;
    burnlink::http::RegisterDefaultRoutes(router, registry);

    boost::asio::io_context ioc(config.server.threads);
    std::unique_ptr<burnlink::http::HttpServer> server;
    try {
        // TLS material is loaded here and the listener binds in Run(); both may throw.
        server = std::make_unique<burnlink::http::HttpServer>(ioc, config, std::move(router),
                                                              registry, storage);
        server->Run();
    } catch (const std::exception& ex) {
        burnlink::core::LogError(std::string("failed to start server: ") + ex.what());
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&server, &ioc](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        burnlink::core::LogInfo("received signal " + std::to_string(signal_number) +
                                ", shutting down");
        server->Stop();
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
