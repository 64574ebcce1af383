#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>

#include "burnlink/core/result.h"
#include "burnlink/links/link_registry.h"
#include "burnlink/storage/blob_store.h"

namespace burnlink::links {

/// @brief Budget applied to every newly published link.
struct LinkPolicy {
    std::uint32_t max_downloads{3};
    std::chrono::seconds ttl{3600};
};

/// @brief Client-supplied description of an upload.
struct FileInfo {
    std::string filename;
    std::string content_type;
};

/// @brief What an uploader gets back; produced from registry state at creation time.
struct LinkTicket {
    std::string link_id;
    std::string path;
    std::uint32_t remaining_downloads{0};
    long long expires_in_seconds{0};
    std::string expires_at;
    std::uint64_t size_bytes{0};
};

/// @brief A granted download: the entry snapshot plus an already-open blob handle.
struct DownloadGrant {
    LinkEntry entry;
    std::uint32_t remaining{0};
    bool last_grant{false};
    storage::BlobHandle blob;
};

/// @brief Bridges upload/download requests to registry transactions and blob I/O.
class AccessCoordinator {
public:
    AccessCoordinator(std::shared_ptr<LinkRegistry> registry,
                      std::shared_ptr<storage::BlobStore> store, LinkPolicy policy);

    /// @brief Store the bytes and register a link for them.
    core::Result<LinkTicket> Publish(std::istream& data, const FileInfo& info);

    /// @brief Consume one download.
    ///
    /// Errors: kNotFound (unknown id), kGone (expired or exhausted; the link is
    /// reclaimed), kIoError (the grant was counted but the blob could not be
    /// opened). A grant is never refunded.
    core::Result<DownloadGrant> HandleDownload(const std::string& link_id);

    const LinkPolicy& policy() const { return policy_; }
    const LinkRegistry& registry() const { return *registry_; }

    static std::string LinkPath(const std::string& link_id) { return "/d/" + link_id; }

private:
    std::shared_ptr<LinkRegistry> registry_;
    std::shared_ptr<storage::BlobStore> store_;
    LinkPolicy policy_;
};

}  // namespace burnlink::links
