#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

#include "burnlink/core/error.h"
#include "burnlink/core/result.h"

namespace burnlink::storage {

/// @brief Attributes of a blob after it has been fully written.
struct StoredBlob {
    std::string blob_id;
    std::string path;
    std::string etag;
    std::uint64_t size_bytes{0};
};

/// @brief Owned read-only descriptor for a stored blob.
///
/// The descriptor stays valid after the blob is deleted from the store, so a
/// download that already holds a handle completes even if the link is reclaimed
/// concurrently.
class BlobHandle {
public:
    BlobHandle() = default;
    BlobHandle(int fd, std::uint64_t size_bytes);
    ~BlobHandle();

    BlobHandle(BlobHandle&& other) noexcept;
    BlobHandle& operator=(BlobHandle&& other) noexcept;
    BlobHandle(const BlobHandle&) = delete;
    BlobHandle& operator=(const BlobHandle&) = delete;

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    std::uint64_t size_bytes() const { return size_bytes_; }

    /// @brief Read up to `length` bytes; returns 0 at end of file.
    core::Result<std::size_t> Read(char* buffer, std::size_t length);
    /// @brief Give up ownership of the descriptor (e.g. to a Beast file body).
    int Release();

private:
    void Close();

    int fd_{-1};
    std::uint64_t size_bytes_{0};
};

/// @brief Byte storage keyed by blob id.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual core::Result<StoredBlob> Put(const std::string& blob_id, std::istream& data) = 0;
    virtual core::Result<BlobHandle> Open(const std::string& blob_id) const = 0;
    /// Returns kNotFound when the blob is already gone; callers treat that as success.
    virtual core::Result<void> Delete(const std::string& blob_id) = 0;
};

}  // namespace burnlink::storage
