#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "burnlink/core/result.h"
#include "burnlink/core/time.h"

namespace burnlink::links {

/// @brief Descriptive attributes of the uploaded file a link points at.
struct BlobRef {
    std::string blob_id;
    std::string filename;
    std::string content_type;
    std::uint64_t size_bytes{0};
};

/// @brief One uploaded file and its remaining access budget.
struct LinkEntry {
    std::string id;
    BlobRef blob;
    std::uint32_t max_downloads{0};
    std::uint32_t remaining_downloads{0};
    core::SteadyClock::time_point created_at{};
    core::SteadyClock::time_point expires_at{};
    /// Set by the grant that took the counter to zero. That caller owns the
    /// reclaim; nobody else removes the entry while the download opens its blob.
    bool reclaim_claimed{false};
};

enum class LinkState {
    kActive,
    kExhausted,
    kExpired,
};

/// @brief Derived state; expiry wins over exhaustion.
LinkState StateOf(const LinkEntry& entry, core::SteadyClock::time_point now);

enum class ConsumeStatus {
    kGranted,
    kNotFound,
    kExpired,
    kExhausted,
};

/// @brief Result of one TryConsume transaction.
struct ConsumeOutcome {
    ConsumeStatus status{ConsumeStatus::kNotFound};
    /// Downloads left after this grant (only meaningful for kGranted).
    std::uint32_t remaining{0};
    /// This grant took the counter to zero; the caller owns the reclaim and
    /// must call Remove() once it has opened the blob.
    bool last_grant{false};
    /// The entry is terminal and unclaimed; the caller must reclaim it through Remove().
    bool removal_required{false};
    /// Snapshot of the entry taken inside the transaction (absent for kNotFound).
    std::optional<LinkEntry> entry;
};

/// @brief Authoritative in-memory table of live links.
///
/// Entries are spread over lock-striped shards: every transaction on one id is
/// serialized by its shard mutex, while ids in different shards proceed in
/// parallel. No operation performs I/O while holding a shard lock.
class LinkRegistry {
public:
    explicit LinkRegistry(core::NowFn now = core::SystemNow());

    LinkRegistry(const LinkRegistry&) = delete;
    LinkRegistry& operator=(const LinkRegistry&) = delete;

    /// @brief Insert a new entry under a fresh random id.
    core::Result<LinkEntry> Create(const BlobRef& blob, std::uint32_t max_downloads,
                                   std::chrono::seconds ttl);

    /// @brief Atomic check-and-decrement of the download budget.
    ConsumeOutcome TryConsume(const std::string& id);

    /// @brief Idempotent removal. Exactly one caller observes the removed entry.
    std::optional<LinkEntry> Remove(const std::string& id);

    /// @brief Ids that are expired at `now`, or found exhausted, at the time of the scan.
    ///
    /// Entries claimed by a last grant are skipped: their blob may not be open yet.
    std::vector<std::string> ScanExpired(core::SteadyClock::time_point now) const;

    std::size_t Size() const;
    core::SteadyClock::time_point Now() const { return now_(); }

private:
    static constexpr std::size_t kShardCount = 16;

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, LinkEntry> entries;
    };

    Shard& ShardFor(const std::string& id);

    core::NowFn now_;
    std::array<Shard, kShardCount> shards_;
};

}  // namespace burnlink::links
