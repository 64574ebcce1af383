#pragma once

#include <string>

#include "burnlink/core/time.h"

#include "burnlink/links/link_registry.h"
#include "burnlink/storage/blob_store.h"

namespace burnlink::links {

enum class ReclaimStatus {
    /// Another caller already removed the entry; nothing was done.
    kAlreadyGone,
    kReclaimed,
    /// The entry was removed but its blob could not be deleted (logged).
    kBlobDeleteFailed,
};

/// @brief Remove a link from the registry and delete its blob.
///
/// Shared by the download path and the expiry sweeper. Only the caller whose
/// Remove() returned the entry touches the blob store, so each blob is deleted
/// at most once. Blob deletion is best-effort: failures are logged, never raised.
/// The removal is logged and counted as expired or exhausted according to
/// StateOf(entry, now).
ReclaimStatus ReclaimLink(LinkRegistry& registry, storage::BlobStore& store,
                          const std::string& link_id, core::SteadyClock::time_point now);

/// @brief "expired" or "exhausted"; the label used in logs and metrics.
const char* RemovalReason(const LinkEntry& entry, core::SteadyClock::time_point now);

}  // namespace burnlink::links
