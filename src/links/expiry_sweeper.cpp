#include "burnlink/links/expiry_sweeper.h"

#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

#include "burnlink/core/logger.h"
#include "burnlink/links/reclaim.h"
#include "burnlink/observability/metrics.h"

namespace burnlink::links {

ExpirySweeper::ExpirySweeper(boost::asio::io_context& ioc, std::shared_ptr<LinkRegistry> registry,
                             std::shared_ptr<storage::BlobStore> store,
                             core::SteadyClock::duration interval)
    : strand_(boost::asio::make_strand(ioc)),
      timer_(strand_),
      registry_(std::move(registry)),
      store_(std::move(store)),
      interval_(interval) {}

void ExpirySweeper::Start() {
    if (running_.exchange(true)) {
        return;
    }
    boost::asio::post(strand_, [this] { ScheduleNext(); });
}

void ExpirySweeper::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::asio::post(strand_, [this] { timer_.cancel(); });
}

void ExpirySweeper::ScheduleNext() {
    if (!running_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        const auto report = RunOnce();
        if (report.removed > 0 || report.failures > 0) {
            core::LogInfo("expiry sweep removed " + std::to_string(report.removed) + " of " +
                          std::to_string(report.scanned) + " links (" +
                          std::to_string(report.failures) + " blob delete failures)");
        }
        ScheduleNext();
    });
}

SweepReport ExpirySweeper::RunOnce(core::SteadyClock::time_point now) {
    SweepReport report;
    const auto ids = registry_->ScanExpired(now);
    report.scanned = ids.size();
    for (const auto& id : ids) {
        // A download may have reclaimed the link between the scan and here.
        switch (ReclaimLink(*registry_, *store_, id, now)) {
            case ReclaimStatus::kReclaimed:
                ++report.removed;
                break;
            case ReclaimStatus::kBlobDeleteFailed:
                ++report.removed;
                ++report.failures;
                break;
            case ReclaimStatus::kAlreadyGone:
                break;
        }
    }
    observability::RecordSweep(report.removed);
    return report;
}

}  // namespace burnlink::links
