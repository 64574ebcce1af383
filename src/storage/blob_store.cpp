#include "burnlink/storage/blob_store.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <unistd.h>

namespace burnlink::storage {

BlobHandle::BlobHandle(int fd, std::uint64_t size_bytes) : fd_(fd), size_bytes_(size_bytes) {}

BlobHandle::~BlobHandle() { Close(); }

BlobHandle::BlobHandle(BlobHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), size_bytes_(std::exchange(other.size_bytes_, 0)) {}

BlobHandle& BlobHandle::operator=(BlobHandle&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = std::exchange(other.fd_, -1);
        size_bytes_ = std::exchange(other.size_bytes_, 0);
    }
    return *this;
}

core::Result<std::size_t> BlobHandle::Read(char* buffer, std::size_t length) {
    if (fd_ < 0) {
        return core::Error{core::ErrorCode::kIoError, "blob handle is closed"};
    }
    for (;;) {
        const ssize_t n = ::read(fd_, buffer, length);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return core::Error{core::ErrorCode::kIoError,
                               std::string("blob read failed: ") + std::strerror(errno)};
        }
    }
}

int BlobHandle::Release() {
    size_bytes_ = 0;
    return std::exchange(fd_, -1);
}

void BlobHandle::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace burnlink::storage
