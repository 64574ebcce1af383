#pragma once

#include <cstdint>
#include <string>

#include "burnlink/core/error.h"
#include "burnlink/core/result.h"
#include "burnlink/storage/blob_store.h"

namespace burnlink::storage {

/// @brief Local filesystem blob store with atomic writes.
///
/// Blobs live in `<base_path>/blobs/<blob_id>`; writes go to `temp_path` first and
/// are renamed into place once complete, so readers never see partial files.
class LocalStorage : public BlobStore {
public:
    LocalStorage(std::string base_path, std::string temp_path);

    core::Result<StoredBlob> Put(const std::string& blob_id, std::istream& data) override;
    core::Result<BlobHandle> Open(const std::string& blob_id) const override;
    core::Result<void> Delete(const std::string& blob_id) override;

    /// @brief Remove every stored blob and leftover temp file; returns how many were removed.
    core::Result<std::uint64_t> Purge();

    const std::string& base_path() const { return base_path_; }
    const std::string& temp_path() const { return temp_path_; }

    static bool IsSafeName(const std::string& name);
    static std::string BuildBlobPath(const std::string& base_path, const std::string& blob_id);

private:
    std::string base_path_;
    std::string temp_path_;
};

}  // namespace burnlink::storage
