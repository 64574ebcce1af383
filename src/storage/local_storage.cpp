#include "burnlink/storage/local_storage.h"

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "burnlink/core/ids.h"

namespace burnlink::storage {

namespace {

constexpr std::size_t kBufferSize = 8192;

core::Error IoError(const std::string& what) {
    return core::Error{core::ErrorCode::kIoError, what + ": " + std::strerror(errno)};
}

bool WriteAll(int fd, const char* data, std::size_t length) {
    while (length > 0) {
        const ssize_t written = ::write(fd, data, length);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        length -= static_cast<std::size_t>(written);
    }
    return true;
}

}  // namespace

LocalStorage::LocalStorage(std::string base_path, std::string temp_path)
    : base_path_(std::move(base_path)), temp_path_(std::move(temp_path)) {
    std::filesystem::create_directories(std::filesystem::path(base_path_) / "blobs");
    std::filesystem::create_directories(temp_path_);
}

core::Result<StoredBlob> LocalStorage::Put(const std::string& blob_id, std::istream& data) {
    if (!IsSafeName(blob_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid blob id"};
    }

    const auto final_path = BuildBlobPath(base_path_, blob_id);
    // Write to a temp file first, then atomically rename into place.
    const auto temp_path =
        (std::filesystem::path(temp_path_) / (core::GenerateRandomId() + ".part")).string();

    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return IoError("failed to open temp file");
    }

    Poco::SHA2Engine256 sha256;
    std::uint64_t total = 0;
    std::array<char, kBufferSize> buffer{};
    while (data) {
        data.read(buffer.data(), buffer.size());
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        if (!WriteAll(fd, buffer.data(), static_cast<std::size_t>(bytes))) {
            auto error = IoError("failed to write temp file");
            ::close(fd);
            ::unlink(temp_path.c_str());
            return error;
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
        total += static_cast<std::uint64_t>(bytes);
    }
    if (data.bad()) {
        ::close(fd);
        ::unlink(temp_path.c_str());
        return core::Error{core::ErrorCode::kIoError, "upload stream failed"};
    }
    if (::fsync(fd) != 0) {
        auto error = IoError("failed to sync temp file");
        ::close(fd);
        ::unlink(temp_path.c_str());
        return error;
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        ::unlink(temp_path.c_str());
        return core::Error{core::ErrorCode::kIoError, "failed to publish blob: " + ec.message()};
    }

    StoredBlob stored;
    stored.blob_id = blob_id;
    stored.path = final_path;
    stored.size_bytes = total;
    stored.etag = Poco::DigestEngine::digestToHex(sha256.digest());
    return stored;
}

core::Result<BlobHandle> LocalStorage::Open(const std::string& blob_id) const {
    if (!IsSafeName(blob_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid blob id"};
    }
    const auto path = BuildBlobPath(base_path_, blob_id);
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return core::Error{core::ErrorCode::kNotFound, "blob not found"};
        }
        return IoError("failed to open blob");
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        auto error = IoError("failed to stat blob");
        ::close(fd);
        return error;
    }
    return BlobHandle(fd, static_cast<std::uint64_t>(st.st_size));
}

core::Result<void> LocalStorage::Delete(const std::string& blob_id) {
    if (!IsSafeName(blob_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid blob id"};
    }
    const auto path = BuildBlobPath(base_path_, blob_id);
    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return core::Error{core::ErrorCode::kNotFound, "blob not found"};
        }
        return IoError("failed to delete blob");
    }
    return core::Ok();
}

core::Result<std::uint64_t> LocalStorage::Purge() {
    std::uint64_t removed = 0;
    std::error_code ec;
    for (const auto& dir : {std::filesystem::path(base_path_) / "blobs",
                            std::filesystem::path(temp_path_)}) {
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            if (std::filesystem::remove(entry.path(), ec)) {
                ++removed;
            }
        }
        if (ec) {
            return core::Error{core::ErrorCode::kIoError,
                               "failed to purge " + dir.string() + ": " + ec.message()};
        }
    }
    return removed;
}

bool LocalStorage::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

std::string LocalStorage::BuildBlobPath(const std::string& base_path, const std::string& blob_id) {
    return (std::filesystem::path(base_path) / "blobs" / blob_id).string();
}

}  // namespace burnlink::storage
