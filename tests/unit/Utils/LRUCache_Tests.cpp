/*
 * PhishShape - Compression-Distance Phishing Classifier
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include "../../../src/Utils/LRUCache.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace PhishShape::Utils;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class LRUCacheTest : public ::testing::Test {
protected:
    LRUCache<std::string, size_t> cache{ 3 };
};

// ============================================================================
// BASIC OPERATIONS
// ============================================================================
TEST_F(LRUCacheTest, Get_MissingKey_ReturnsNullopt) {
    EXPECT_FALSE(cache.Get("absent").has_value());
    EXPECT_EQ(cache.MissCount(), 1u);
    EXPECT_EQ(cache.HitCount(), 0u);
}

TEST_F(LRUCacheTest, Put_ThenGet_ReturnsValue) {
    cache.Put("a", 42);

    const auto value = cache.Get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42u);
    EXPECT_EQ(cache.HitCount(), 1u);
}

TEST_F(LRUCacheTest, Put_ExistingKey_OverwritesWithoutGrowing) {
    cache.Put("a", 1);
    cache.Put("a", 2);

    EXPECT_EQ(cache.Size(), 1u);
    EXPECT_EQ(cache.Get("a").value_or(0), 2u);
}

TEST_F(LRUCacheTest, Constructor_ZeroCapacity_ClampsToOne) {
    LRUCache<int, int> tiny(0);
    tiny.Put(1, 10);
    tiny.Put(2, 20);

    EXPECT_EQ(tiny.Capacity(), 1u);
    EXPECT_EQ(tiny.Size(), 1u);
    EXPECT_TRUE(tiny.Contains(2));
}

// ============================================================================
// EVICTION
// ============================================================================
TEST_F(LRUCacheTest, Put_OverCapacity_EvictsLeastRecentlyUsed) {
    cache.Put("a", 1);
    cache.Put("b", 2);
    cache.Put("c", 3);
    cache.Put("d", 4);

    EXPECT_EQ(cache.Size(), 3u);
    EXPECT_FALSE(cache.Contains("a"));
    EXPECT_TRUE(cache.Contains("d"));
    EXPECT_EQ(cache.EvictionCount(), 1u);
}

TEST_F(LRUCacheTest, Get_RefreshesRecency_ProtectsFromEviction) {
    cache.Put("a", 1);
    cache.Put("b", 2);
    cache.Put("c", 3);

    ASSERT_TRUE(cache.Get("a").has_value());
    cache.Put("d", 4);

    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_FALSE(cache.Contains("b"));
}

TEST_F(LRUCacheTest, Clear_RemovesEverything_KeepsCounters) {
    cache.Put("a", 1);
    ASSERT_TRUE(cache.Get("a").has_value());
    cache.Clear();

    EXPECT_EQ(cache.Size(), 0u);
    EXPECT_EQ(cache.HitCount(), 1u);
}

TEST_F(LRUCacheTest, HitRate_MixedLookups_ReportsRatio) {
    EXPECT_DOUBLE_EQ(cache.HitRate(), 0.0);

    cache.Put("a", 1);
    (void)cache.Get("a");
    (void)cache.Get("b");

    EXPECT_DOUBLE_EQ(cache.HitRate(), 0.5);
}

// ============================================================================
// CONCURRENCY
// ============================================================================
TEST_F(LRUCacheTest, ConcurrentPutGet_NeverExceedsCapacity) {
    LRUCache<int, int> shared(64);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&shared, t]() {
            for (int i = 0; i < 1000; ++i) {
                shared.Put(t * 1000 + i, i);
                (void)shared.Get(t * 1000 + i / 2);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_LE(shared.Size(), 64u);
    EXPECT_EQ(shared.HitCount() + shared.MissCount(), 4000u);
}
