#include <gtest/gtest.h>
#include "shiplot/volume/destination_registry.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace shiplot;
using namespace shiplot::volume;
using shiplot::testing::FakeDisks;
namespace fs = std::filesystem;

class DestinationRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        disks_.set("/mnt/a", 100);
        disks_.set("/mnt/b", 300);
        disks_.set("/mnt/c", 200);
    }

    FakeDisks disks_;
};

TEST_F(DestinationRegistryTest, ClaimsMostFreeVolumeFirst) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");
    registry.add("/mnt/b");
    registry.add("/mnt/c");

    auto first = registry.select_and_claim();
    auto second = registry.select_and_claim();
    auto third = registry.select_and_claim();

    ASSERT_TRUE(first && second && third);
    EXPECT_EQ(first->path, "/mnt/b");
    EXPECT_EQ(second->path, "/mnt/c");
    EXPECT_EQ(third->path, "/mnt/a");
    EXPECT_FALSE(registry.select_and_claim().has_value());
    EXPECT_EQ(registry.available_count(), 0u);
}

TEST_F(DestinationRegistryTest, EqualFreeSpaceKeepsConfiguredOrder) {
    disks_.set("/mnt/x", 50);
    disks_.set("/mnt/y", 50);
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/x");
    registry.add("/mnt/y");

    auto claimed = registry.select_and_claim();
    ASSERT_TRUE(claimed);
    EXPECT_EQ(claimed->path, "/mnt/x");
}

TEST_F(DestinationRegistryTest, DuplicatePathsAreAddedOnce) {
    DestinationRegistry registry(disks_.as_query());
    EXPECT_TRUE(registry.add("/mnt/a"));
    EXPECT_FALSE(registry.add("/mnt/a"));
    EXPECT_FALSE(registry.add("/mnt/./a"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(DestinationRegistryTest, ReleaseRefreshesFreeSpace) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");
    registry.add("/mnt/b");

    auto claimed = registry.select_and_claim();
    ASSERT_TRUE(claimed);
    ASSERT_EQ(claimed->path, "/mnt/b");

    // The write consumed most of /mnt/b
    disks_.set("/mnt/b", 10);
    registry.release(*claimed, true);

    auto next = registry.select_and_claim();
    ASSERT_TRUE(next);
    EXPECT_EQ(next->path, "/mnt/a");
}

TEST_F(DestinationRegistryTest, EachWriteMovesSelectionToTheNextFreestVolume) {
    disks_.set("/mnt/d", 100);
    disks_.set("/mnt/e", 200);
    disks_.set("/mnt/f", 50);
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/d");
    registry.add("/mnt/e");
    registry.add("/mnt/f");

    auto first = registry.select_and_claim();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->path, "/mnt/e");
    disks_.set("/mnt/e", 20);
    registry.release(*first, true);

    auto second = registry.select_and_claim();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->path, "/mnt/d");
    disks_.set("/mnt/d", 10);
    registry.release(*second, true);

    auto third = registry.select_and_claim();
    ASSERT_TRUE(third);
    EXPECT_EQ(third->path, "/mnt/f");
}

TEST_F(DestinationRegistryTest, ReleaseWithoutRefreshKeepsCachedValue) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");
    registry.add("/mnt/b");

    auto claimed = registry.select_and_claim();
    ASSERT_TRUE(claimed);
    disks_.set("/mnt/b", 10);
    registry.release(*claimed, false);

    auto next = registry.select_and_claim();
    ASSERT_TRUE(next);
    EXPECT_EQ(next->path, "/mnt/b");
    EXPECT_EQ(next->free_bytes, 300u);
}

TEST_F(DestinationRegistryTest, EvictRemovesVolumeAndNotifiesListener) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");
    registry.add("/mnt/b");
    registry.add("/mnt/c");

    std::vector<std::size_t> counts;
    registry.set_count_listener([&counts](std::size_t count) { counts.push_back(count); });

    auto claimed = registry.select_and_claim();
    ASSERT_TRUE(claimed);
    EXPECT_EQ(registry.evict(*claimed), 2u);

    EXPECT_EQ(registry.size(), 2u);
    ASSERT_EQ(counts.size(), 1u);
    EXPECT_EQ(counts[0], 2u);

    for (const auto& volume : registry.volumes()) {
        EXPECT_NE(volume.path, claimed->path);
    }
}

TEST_F(DestinationRegistryTest, ConcurrentClaimsNeverShareAVolume) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");
    registry.add("/mnt/b");
    registry.add("/mnt/c");

    std::mutex mutex;
    std::multiset<std::string> claimed;
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            if (auto volume = registry.select_and_claim()) {
                std::lock_guard lock(mutex);
                claimed.insert(volume->path.string());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(claimed.size(), 3u);
    for (const auto& path : claimed) {
        EXPECT_EQ(claimed.count(path), 1u);
    }
}

TEST_F(DestinationRegistryTest, WaitAndClaimWakesOnRelease) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");

    auto held = registry.select_and_claim();
    ASSERT_TRUE(held);

    std::optional<DestinationVolume> waited;
    std::thread waiter([&] { waited = registry.wait_and_claim(CancellationToken{}); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    registry.release(*held, false);
    waiter.join();

    ASSERT_TRUE(waited);
    EXPECT_EQ(waited->path, "/mnt/a");
}

TEST_F(DestinationRegistryTest, WaitAndClaimReturnsNulloptWhenCancelled) {
    DestinationRegistry registry(disks_.as_query());
    registry.add("/mnt/a");
    auto held = registry.select_and_claim();
    ASSERT_TRUE(held);

    CancellationSource source;
    std::atomic<bool> returned{false};
    std::optional<DestinationVolume> waited;
    std::thread waiter([&] {
        waited = registry.wait_and_claim(source.token());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned);
    source.cancel();
    waiter.join();

    EXPECT_FALSE(waited.has_value());
}

TEST_F(DestinationRegistryTest, PopulateExpandsRealDirectories) {
    auto root = shiplot::testing::create_temp_dir("shiplot_registry");
    fs::create_directories(root / "disk1");
    fs::create_directories(root / "disk2");
    fs::create_directories(root / "lost+found");

    DestinationRegistry registry([](const fs::path&) { return std::uint64_t{1000}; });
    auto result = registry.populate({(root / "*").string(), (root / "disk1").string()});

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(registry.size(), 2u);

    fs::remove_all(root);
}
