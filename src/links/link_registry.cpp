#include "burnlink/links/link_registry.h"

#include <functional>
#include <utility>

#include "burnlink/core/ids.h"
#include "burnlink/core/logger.h"

namespace burnlink::links {

namespace {

// Bound on id regeneration; a collision of random UUIDs is not expected in practice.
constexpr int kMaxIdAttempts = 8;

}  // namespace

LinkState StateOf(const LinkEntry& entry, core::SteadyClock::time_point now) {
    if (now >= entry.expires_at) {
        return LinkState::kExpired;
    }
    if (entry.remaining_downloads == 0) {
        return LinkState::kExhausted;
    }
    return LinkState::kActive;
}

LinkRegistry::LinkRegistry(core::NowFn now) : now_(std::move(now)) {}

LinkRegistry::Shard& LinkRegistry::ShardFor(const std::string& id) {
    return shards_[std::hash<std::string>{}(id) % kShardCount];
}

core::Result<LinkEntry> LinkRegistry::Create(const BlobRef& blob, std::uint32_t max_downloads,
                                             std::chrono::seconds ttl) {
    if (max_downloads == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "max_downloads must be positive"};
    }
    if (ttl.count() <= 0 || ttl > core::kMaxDuration) {
        return core::Error{core::ErrorCode::kInvalidArgument, "ttl out of range"};
    }

    LinkEntry entry;
    entry.blob = blob;
    entry.max_downloads = max_downloads;
    entry.remaining_downloads = max_downloads;
    entry.created_at = now_();
    entry.expires_at = entry.created_at + ttl;

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        entry.id = core::GenerateRandomId();
        auto& shard = ShardFor(entry.id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (shard.entries.emplace(entry.id, entry).second) {
            core::LogLinkEvent("created", entry.id,
                               "max_downloads=" + std::to_string(max_downloads) +
                                   " ttl_seconds=" + std::to_string(ttl.count()));
            return entry;
        }
    }
    return core::Error{core::ErrorCode::kInternal, "failed to allocate a unique link id"};
}

ConsumeOutcome LinkRegistry::TryConsume(const std::string& id) {
    ConsumeOutcome outcome;
    auto& shard = ShardFor(id);
    const auto now = now_();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(id);
    if (it == shard.entries.end()) {
        outcome.status = ConsumeStatus::kNotFound;
        return outcome;
    }

    auto& entry = it->second;
    switch (StateOf(entry, now)) {
        case LinkState::kExpired:
            outcome.status = ConsumeStatus::kExpired;
            outcome.removal_required = !entry.reclaim_claimed;
            break;
        case LinkState::kExhausted:
            outcome.status = ConsumeStatus::kExhausted;
            outcome.removal_required = !entry.reclaim_claimed;
            break;
        case LinkState::kActive:
            --entry.remaining_downloads;
            outcome.status = ConsumeStatus::kGranted;
            outcome.remaining = entry.remaining_downloads;
            outcome.last_grant = entry.remaining_downloads == 0;
            entry.reclaim_claimed = outcome.last_grant;
            break;
    }
    outcome.entry = entry;
    return outcome;
}

std::optional<LinkEntry> LinkRegistry::Remove(const std::string& id) {
    auto& shard = ShardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(id);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    LinkEntry removed = std::move(it->second);
    shard.entries.erase(it);
    return removed;
}

std::vector<std::string> LinkRegistry::ScanExpired(core::SteadyClock::time_point now) const {
    std::vector<std::string> ids;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [id, entry] : shard.entries) {
            if (entry.reclaim_claimed) {
                continue;
            }
            // Exhausted entries should already be gone; collect strays the same way.
            if (entry.expires_at <= now || entry.remaining_downloads == 0) {
                ids.push_back(id);
            }
        }
    }
    return ids;
}

std::size_t LinkRegistry::Size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

}  // namespace burnlink::links
