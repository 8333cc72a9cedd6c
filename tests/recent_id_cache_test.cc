#include <core/util/recent_id_cache.h>
#include <gtest/gtest.h>

using namespace fileferry::core;

TEST(RecentIdCacheTest, InsertReportsDuplicates) {
    RecentIdCache cache(4);
    EXPECT_TRUE(cache.Insert("a"));
    EXPECT_FALSE(cache.Insert("a"));
    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(RecentIdCacheTest, EvictsLeastRecentlySeen) {
    RecentIdCache cache(3);
    cache.Insert("a");
    cache.Insert("b");
    cache.Insert("c");
    // touching "a" makes "b" the oldest
    EXPECT_FALSE(cache.Insert("a"));
    EXPECT_TRUE(cache.Insert("d"));

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_FALSE(cache.Contains("b"));
    EXPECT_TRUE(cache.Contains("c"));
    EXPECT_TRUE(cache.Contains("d"));
}

TEST(RecentIdCacheTest, ZeroCapacityStillRemembersOne) {
    RecentIdCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
    EXPECT_TRUE(cache.Insert("a"));
    EXPECT_FALSE(cache.Insert("a"));
    EXPECT_TRUE(cache.Insert("b"));
    EXPECT_FALSE(cache.Contains("a"));
}
