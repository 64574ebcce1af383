#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "burnlink/links/access_coordinator.h"
#include "burnlink/links/expiry_sweeper.h"
#include "test_support.h"

namespace {

using burnlink::core::ErrorCode;
using burnlink::links::AccessCoordinator;
using burnlink::links::FileInfo;
using burnlink::links::LinkPolicy;
using burnlink::links::LinkRegistry;
using burnlink::testing::CountingBlobStore;

class AccessCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<LinkRegistry>(clock_.AsNowFn());
        store_ = std::make_shared<CountingBlobStore>(dir_.path());
    }

    AccessCoordinator MakeCoordinator(std::uint32_t max_downloads,
                                      std::chrono::seconds ttl = std::chrono::seconds(3600)) {
        LinkPolicy policy;
        policy.max_downloads = max_downloads;
        policy.ttl = ttl;
        return AccessCoordinator(registry_, store_, policy);
    }

    std::string PublishBytes(AccessCoordinator& coordinator, const std::string& bytes) {
        std::istringstream input(bytes);
        FileInfo info{"notes.txt", "text/plain"};
        auto ticket = coordinator.Publish(input, info);
        EXPECT_TRUE(ticket.ok());
        return ticket.ok() ? ticket.value().link_id : std::string();
    }

    burnlink::testing::TempDir dir_;
    burnlink::testing::ManualClock clock_;
    std::shared_ptr<LinkRegistry> registry_;
    std::shared_ptr<CountingBlobStore> store_;
};

}  // namespace

TEST_F(AccessCoordinatorTest, PublishReturnsTicket) {
    auto coordinator = MakeCoordinator(3, std::chrono::seconds(600));
    std::istringstream input("payload");
    auto ticket = coordinator.Publish(input, FileInfo{"a.bin", "application/octet-stream"});
    ASSERT_TRUE(ticket.ok());
    EXPECT_FALSE(ticket.value().link_id.empty());
    EXPECT_EQ(ticket.value().path, "/d/" + ticket.value().link_id);
    EXPECT_EQ(ticket.value().remaining_downloads, 3u);
    EXPECT_EQ(ticket.value().expires_in_seconds, 600);
    EXPECT_EQ(ticket.value().size_bytes, 7u);
    EXPECT_FALSE(ticket.value().expires_at.empty());
    EXPECT_EQ(registry_->Size(), 1u);
}

TEST_F(AccessCoordinatorTest, ServesIdenticalBytesUntilExhausted) {
    auto coordinator = MakeCoordinator(3);
    const std::string payload = "the quick brown fox\n" + std::string(10000, 'x');
    const auto id = PublishBytes(coordinator, payload);

    for (std::uint32_t expected_remaining : {2u, 1u, 0u}) {
        auto grant = coordinator.HandleDownload(id);
        ASSERT_TRUE(grant.ok()) << grant.error().message;
        EXPECT_EQ(grant.value().remaining, expected_remaining);
        EXPECT_EQ(grant.value().entry.blob.filename, "notes.txt");
        EXPECT_EQ(grant.value().entry.blob.content_type, "text/plain");
        EXPECT_EQ(burnlink::testing::ReadAll(grant.value().blob), payload);
    }

    // The last grant removed the link; a later request cannot tell it ever existed.
    auto fourth = coordinator.HandleDownload(id);
    ASSERT_FALSE(fourth.ok());
    EXPECT_EQ(fourth.error().code, ErrorCode::kNotFound);
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(AccessCoordinatorTest, UnknownLinkIsNotFound) {
    auto coordinator = MakeCoordinator(3);
    auto grant = coordinator.HandleDownload("never-created");
    ASSERT_FALSE(grant.ok());
    EXPECT_EQ(grant.error().code, ErrorCode::kNotFound);
}

TEST_F(AccessCoordinatorTest, LastGrantStillReadableAfterBlobDeleted) {
    auto coordinator = MakeCoordinator(1);
    const auto id = PublishBytes(coordinator, "single use");

    auto grant = coordinator.HandleDownload(id);
    ASSERT_TRUE(grant.ok());
    EXPECT_TRUE(grant.value().last_grant);
    const auto stored_id = grant.value().entry.blob.blob_id;
    EXPECT_FALSE(store_->Exists(stored_id));
    EXPECT_EQ(store_->DeleteCount(stored_id), 1);
    EXPECT_EQ(burnlink::testing::ReadAll(grant.value().blob), "single use");
}

TEST_F(AccessCoordinatorTest, ExpiredLinkIsGoneAndReclaimed) {
    auto coordinator = MakeCoordinator(3, std::chrono::seconds(1));
    const auto id = PublishBytes(coordinator, "short lived");
    auto first = coordinator.HandleDownload(id);
    ASSERT_TRUE(first.ok());
    const auto stored_id = first.value().entry.blob.blob_id;

    clock_.Advance(std::chrono::seconds(2));
    auto expired = coordinator.HandleDownload(id);
    ASSERT_FALSE(expired.ok());
    EXPECT_EQ(expired.error().code, ErrorCode::kGone);
    EXPECT_FALSE(store_->Exists(stored_id));
    EXPECT_EQ(store_->DeleteCount(stored_id), 1);

    auto after = coordinator.HandleDownload(id);
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error().code, ErrorCode::kNotFound);
}

TEST_F(AccessCoordinatorTest, ConcurrentDownloadsDeleteBlobOnce) {
    auto coordinator = MakeCoordinator(3);
    const auto id = PublishBytes(coordinator, "contended");

    std::atomic<bool> go{false};
    std::atomic<int> granted{0};
    std::atomic<int> denied{0};
    std::vector<std::string> blob_ids(5);
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto grant = coordinator.HandleDownload(id);
            if (grant.ok()) {
                blob_ids[i] = grant.value().entry.blob.blob_id;
                if (burnlink::testing::ReadAll(grant.value().blob) == "contended") {
                    ++granted;
                }
            } else {
                ++denied;
            }
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(granted.load(), 3);
    EXPECT_EQ(denied.load(), 2);
    std::string stored_id;
    for (const auto& blob_id : blob_ids) {
        if (!blob_id.empty()) {
            stored_id = blob_id;
        }
    }
    ASSERT_FALSE(stored_id.empty());
    EXPECT_EQ(store_->DeleteCount(stored_id), 1);
    EXPECT_FALSE(store_->Exists(stored_id));
}

TEST_F(AccessCoordinatorTest, OpenFailureStillConsumesGrant) {
    auto coordinator = MakeCoordinator(2);
    const auto id = PublishBytes(coordinator, "unreadable");

    store_->set_fail_open(true);
    auto failed = coordinator.HandleDownload(id);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::kIoError);

    store_->set_fail_open(false);
    auto second = coordinator.HandleDownload(id);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().remaining, 0u);
    EXPECT_TRUE(second.value().last_grant);
}

TEST_F(AccessCoordinatorTest, OpenFailureOnLastGrantRemovesLink) {
    auto coordinator = MakeCoordinator(1);
    const auto id = PublishBytes(coordinator, "unreadable");

    store_->set_fail_open(true);
    auto failed = coordinator.HandleDownload(id);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::kIoError);
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(AccessCoordinatorTest, FailedBlobDeleteDoesNotFailDownload) {
    auto coordinator = MakeCoordinator(1);
    const auto id = PublishBytes(coordinator, "sticky");

    store_->set_fail_deletes(true);
    auto grant = coordinator.HandleDownload(id);
    ASSERT_TRUE(grant.ok());
    EXPECT_EQ(burnlink::testing::ReadAll(grant.value().blob), "sticky");
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(AccessCoordinatorTest, SweepBetweenLastGrantAndOpenKeepsBlob) {
    auto coordinator = MakeCoordinator(1, std::chrono::seconds(3600));
    const auto id = PublishBytes(coordinator, "one shot");
    boost::asio::io_context ioc;
    burnlink::links::ExpirySweeper sweeper(ioc, registry_, store_, std::chrono::seconds(60));

    burnlink::links::SweepReport before_open;
    store_->set_before_open([&] { before_open = sweeper.RunOnce(); });
    auto grant = coordinator.HandleDownload(id);
    ASSERT_TRUE(grant.ok()) << grant.error().message;
    EXPECT_EQ(before_open.removed, 0u);
    EXPECT_EQ(burnlink::testing::ReadAll(grant.value().blob), "one shot");

    // The download reclaimed the link itself, exactly once.
    const auto stored_id = grant.value().entry.blob.blob_id;
    EXPECT_EQ(store_->DeleteCount(stored_id), 1);
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(AccessCoordinatorTest, ExpiryDuringLastGrantOpenKeepsBlob) {
    auto coordinator = MakeCoordinator(1, std::chrono::seconds(10));
    const auto id = PublishBytes(coordinator, "just in time");
    boost::asio::io_context ioc;
    burnlink::links::ExpirySweeper sweeper(ioc, registry_, store_, std::chrono::seconds(60));

    burnlink::links::SweepReport before_open;
    store_->set_before_open([&] {
        clock_.Advance(std::chrono::seconds(20));
        before_open = sweeper.RunOnce();
        // A concurrent download sees the link as gone but leaves it alone.
        auto other = coordinator.HandleDownload(id);
        EXPECT_EQ(other.code(), ErrorCode::kGone);
    });
    auto grant = coordinator.HandleDownload(id);
    ASSERT_TRUE(grant.ok()) << grant.error().message;
    EXPECT_EQ(before_open.removed, 0u);
    EXPECT_EQ(burnlink::testing::ReadAll(grant.value().blob), "just in time");
    EXPECT_EQ(store_->DeleteCount(grant.value().entry.blob.blob_id), 1);
    EXPECT_EQ(registry_->Size(), 0u);
}
