#include "burnlink/links/access_coordinator.h"

#include "burnlink/core/ids.h"
#include "burnlink/core/logger.h"
#include "burnlink/core/time.h"
#include "burnlink/links/reclaim.h"
#include "burnlink/observability/metrics.h"

namespace burnlink::links {

AccessCoordinator::AccessCoordinator(std::shared_ptr<LinkRegistry> registry,
                                     std::shared_ptr<storage::BlobStore> store,
                                     LinkPolicy policy)
    : registry_(std::move(registry)), store_(std::move(store)), policy_(policy) {}

core::Result<LinkTicket> AccessCoordinator::Publish(std::istream& data, const FileInfo& info) {
    const auto blob_id = core::GenerateRandomId();
    auto stored = store_->Put(blob_id, data);
    if (!stored.ok()) {
        return stored.error();
    }

    BlobRef blob;
    blob.blob_id = blob_id;
    blob.filename = info.filename;
    blob.content_type = info.content_type;
    blob.size_bytes = stored.value().size_bytes;

    auto created = registry_->Create(blob, policy_.max_downloads, policy_.ttl);
    if (!created.ok()) {
        auto cleanup = store_->Delete(blob_id);
        if (!cleanup.ok()) {
            core::LogError("failed to delete unregistered blob " + blob_id + ": " +
                           cleanup.error().message);
        }
        return created.error();
    }
    observability::RecordLinkCreated();

    const auto& entry = created.value();
    LinkTicket ticket;
    ticket.link_id = entry.id;
    ticket.path = LinkPath(entry.id);
    ticket.remaining_downloads = entry.remaining_downloads;
    ticket.expires_in_seconds = policy_.ttl.count();
    ticket.expires_at = core::NowIso8601WithOffsetSeconds(policy_.ttl.count());
    ticket.size_bytes = blob.size_bytes;
    core::LogInfo("published link " + entry.id + " (" + std::to_string(blob.size_bytes) +
                  " bytes, " + std::to_string(entry.remaining_downloads) + " downloads, " +
                  std::to_string(ticket.expires_in_seconds) + "s)");
    return ticket;
}

core::Result<DownloadGrant> AccessCoordinator::HandleDownload(const std::string& link_id) {
    auto outcome = registry_->TryConsume(link_id);
    switch (outcome.status) {
        case ConsumeStatus::kNotFound:
            observability::RecordDownloadDenied();
            return core::Error{core::ErrorCode::kNotFound, "link not found"};
        case ConsumeStatus::kExpired:
        case ConsumeStatus::kExhausted: {
            observability::RecordDownloadDenied();
            const bool expired = outcome.status == ConsumeStatus::kExpired;
            // A claimed entry is left to the download that holds its last grant.
            if (outcome.removal_required) {
                ReclaimLink(*registry_, *store_, link_id, registry_->Now());
            }
            return core::Error{core::ErrorCode::kGone,
                               expired ? "link expired" : "download limit reached"};
        }
        case ConsumeStatus::kGranted:
            break;
    }

    observability::RecordDownloadGranted();
    core::LogLinkEvent("granted", link_id, "remaining=" + std::to_string(outcome.remaining));

    // Open before reclaiming: the descriptor keeps the bytes readable after unlink.
    // A last grant is claimed in the registry, so no sweep or other download can
    // delete the blob before this open.
    auto& entry = *outcome.entry;
    auto blob = store_->Open(entry.blob.blob_id);
    if (outcome.last_grant) {
        ReclaimLink(*registry_, *store_, link_id, registry_->Now());
    }
    if (!blob.ok()) {
        core::LogError("failed to open blob " + entry.blob.blob_id + " for link " + link_id +
                       ": " + blob.error().message);
        return core::Error{core::ErrorCode::kIoError, "failed to open stored file"};
    }

    DownloadGrant grant;
    grant.entry = std::move(entry);
    grant.remaining = outcome.remaining;
    grant.last_grant = outcome.last_grant;
    grant.blob = blob.take();
    return grant;
}

}  // namespace burnlink::links
