#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "burnlink/core/config.h"
#include "burnlink/http/router.h"
#include "burnlink/links/access_coordinator.h"
#include "burnlink/links/expiry_sweeper.h"
#include "burnlink/links/link_registry.h"
#include "burnlink/storage/blob_store.h"

namespace burnlink::http {

class Listener;

/// @brief HTTP server bootstrapper (acceptor + TLS context + expiry sweeper).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<links::LinkRegistry> registry,
               std::shared_ptr<storage::BlobStore> store);
    ~HttpServer();

    /// @brief Start accepting connections and schedule the expiry sweep.
    void Run();
    /// @brief Stop accepting connections and cancel the sweep. Thread-safe.
    void Stop();

    const std::shared_ptr<links::AccessCoordinator>& coordinator() const { return coordinator_; }

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<links::LinkRegistry> registry_;
    std::shared_ptr<storage::BlobStore> store_;
    std::shared_ptr<links::AccessCoordinator> coordinator_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<links::ExpirySweeper> sweeper_;
    std::shared_ptr<Listener> listener_;
};

}  // namespace burnlink::http
