#include "burnlink/links/reclaim.h"

#include "burnlink/core/logger.h"
#include "burnlink/observability/metrics.h"

namespace burnlink::links {

const char* RemovalReason(const LinkEntry& entry, core::SteadyClock::time_point now) {
    return StateOf(entry, now) == LinkState::kExpired ? "expired" : "exhausted";
}

ReclaimStatus ReclaimLink(LinkRegistry& registry, storage::BlobStore& store,
                          const std::string& link_id, core::SteadyClock::time_point now) {
    auto removed = registry.Remove(link_id);
    if (!removed) {
        return ReclaimStatus::kAlreadyGone;
    }
    const bool expired = StateOf(*removed, now) == LinkState::kExpired;
    observability::RecordLinkRemoved(expired);
    core::LogLinkEvent("removed", link_id, RemovalReason(*removed, now));

    auto deleted = store.Delete(removed->blob.blob_id);
    if (!deleted.ok() && deleted.code() != core::ErrorCode::kNotFound) {
        observability::RecordBlobDeleteFailure();
        core::LogError("failed to delete blob " + removed->blob.blob_id + " of link " + link_id +
                       ": " + deleted.error().message);
        return ReclaimStatus::kBlobDeleteFailed;
    }
    return ReclaimStatus::kReclaimed;
}

}  // namespace burnlink::links
