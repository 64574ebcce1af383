#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <Poco/UUIDGenerator.h>

#include "burnlink/core/time.h"
#include "burnlink/storage/blob_store.h"
#include "burnlink/storage/local_storage.h"

namespace burnlink::testing {

/// Monotonic clock that only moves when a test advances it.
class ManualClock {
public:
    ManualClock() : base_(core::SteadyClock::now()) {}

    core::NowFn AsNowFn() {
        return [this] { return base_ + std::chrono::milliseconds(offset_ms_.load()); };
    }
    core::SteadyClock::time_point Now() const {
        return base_ + std::chrono::milliseconds(offset_ms_.load());
    }
    void Advance(std::chrono::milliseconds delta) { offset_ms_ += delta.count(); }

private:
    core::SteadyClock::time_point base_;
    std::atomic<long long> offset_ms_{0};
};

/// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                ("burnlink_test_" + Poco::UUIDGenerator().createOne().toString())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// LocalStorage wrapper that counts deletions per blob and can be told to fail them.
class CountingBlobStore : public storage::BlobStore {
public:
    explicit CountingBlobStore(const std::filesystem::path& root)
        : inner_((root / "data").string(), (root / "tmp").string()) {}

    core::Result<storage::StoredBlob> Put(const std::string& blob_id,
                                          std::istream& data) override {
        return inner_.Put(blob_id, data);
    }

    core::Result<storage::BlobHandle> Open(const std::string& blob_id) const override {
        if (before_open_) {
            // Runs once, to interleave other work between a grant and its open.
            auto hook = std::move(before_open_);
            before_open_ = nullptr;
            hook();
        }
        if (fail_open_) {
            return core::Error{core::ErrorCode::kIoError, "injected open failure"};
        }
        return inner_.Open(blob_id);
    }

    core::Result<void> Delete(const std::string& blob_id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++deletes_[blob_id];
        }
        if (fail_deletes_) {
            return core::Error{core::ErrorCode::kIoError, "injected delete failure"};
        }
        return inner_.Delete(blob_id);
    }

    int DeleteCount(const std::string& blob_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = deletes_.find(blob_id);
        return it == deletes_.end() ? 0 : it->second;
    }

    bool Exists(const std::string& blob_id) const {
        return std::filesystem::exists(
            storage::LocalStorage::BuildBlobPath(inner_.base_path(), blob_id));
    }

    void set_before_open(std::function<void()> hook) { before_open_ = std::move(hook); }
    void set_fail_open(bool fail) { fail_open_ = fail; }
    void set_fail_deletes(bool fail) { fail_deletes_ = fail; }

private:
    storage::LocalStorage inner_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int> deletes_;
    mutable std::function<void()> before_open_;
    std::atomic<bool> fail_open_{false};
    std::atomic<bool> fail_deletes_{false};
};

/// Drain an open blob handle into a string.
inline std::string ReadAll(storage::BlobHandle& handle) {
    std::string out;
    char buffer[4096];
    for (;;) {
        auto n = handle.Read(buffer, sizeof(buffer));
        if (!n.ok() || n.value() == 0) {
            break;
        }
        out.append(buffer, n.value());
    }
    return out;
}

}  // namespace burnlink::testing
