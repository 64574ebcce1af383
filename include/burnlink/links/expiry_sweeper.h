#pragma once

#include <atomic>
#include <cstddef>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "burnlink/core/time.h"
#include "burnlink/links/link_registry.h"
#include "burnlink/storage/blob_store.h"

namespace burnlink::links {

/// @brief Counts for one sweep tick.
struct SweepReport {
    std::size_t scanned{0};
    std::size_t removed{0};
    std::size_t failures{0};
};

/// @brief Periodically reclaims links whose TTL has passed.
///
/// Runs on a strand of the server's io_context so ticks never overlap. Must be
/// stopped, and the io_context drained, before it is destroyed.
class ExpirySweeper {
public:
    ExpirySweeper(boost::asio::io_context& ioc, std::shared_ptr<LinkRegistry> registry,
                  std::shared_ptr<storage::BlobStore> store,
                  core::SteadyClock::duration interval);

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void Start();
    /// Thread-safe; cancels the pending tick.
    void Stop();
    bool running() const { return running_.load(); }

    SweepReport RunOnce(core::SteadyClock::time_point now);
    SweepReport RunOnce() { return RunOnce(registry_->Now()); }

private:
    void ScheduleNext();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<LinkRegistry> registry_;
    std::shared_ptr<storage::BlobStore> store_;
    core::SteadyClock::duration interval_;
    std::atomic<bool> running_{false};
};

}  // namespace burnlink::links
