#include <gtest/gtest.h>
#include <string>
#include "cache/buffer_cache.hpp"

using namespace mediavault::cache;
using mediavault::store::Variant;

TEST(BufferCacheTest, GetAndPut) {
  BufferCache<std::string> cache(4);
  EXPECT_FALSE(cache.get(Variant::Origin, 1).has_value());

  cache.put(Variant::Origin, 1, "origin-1");
  cache.put(Variant::Exhibition, 1, "exhibition-1");
  EXPECT_EQ(cache.get(Variant::Origin, 1).value(), "origin-1");
  EXPECT_EQ(cache.get(Variant::Exhibition, 1).value(), "exhibition-1");
  EXPECT_FALSE(cache.get(Variant::Thumbnail, 1).has_value());
  EXPECT_EQ(cache.size(), 2u);

  // Replacing keeps a single slot
  cache.put(Variant::Origin, 1, "origin-1b");
  EXPECT_EQ(cache.get(Variant::Origin, 1).value(), "origin-1b");
  EXPECT_EQ(cache.size(), 2u);
}

TEST(BufferCacheTest, EvictsLeastRecentlyUsed) {
  BufferCache<int> cache(2);
  cache.put(Variant::Origin, 1, 10);
  cache.put(Variant::Origin, 2, 20);

  // Touch 1 so 2 becomes the eviction candidate
  ASSERT_TRUE(cache.get(Variant::Origin, 1).has_value());
  cache.put(Variant::Origin, 3, 30);

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_TRUE(cache.get(Variant::Origin, 1).has_value());
  EXPECT_FALSE(cache.get(Variant::Origin, 2).has_value());
  EXPECT_TRUE(cache.get(Variant::Origin, 3).has_value());
}

TEST(BufferCacheTest, ZeroCapacityIsUnbounded) {
  BufferCache<int> cache(0);
  for (int i = 0; i < 500; ++i) {
    cache.put(Variant::Exhibition, i, i);
  }
  EXPECT_EQ(cache.size(), 500u);
  EXPECT_EQ(cache.get(Variant::Exhibition, 0).value(), 0);
}

TEST(BufferCacheTest, RemoveDropsEveryVariant) {
  BufferCache<int> cache(8);
  cache.put(Variant::Origin, 5, 1);
  cache.put(Variant::Exhibition, 5, 2);
  cache.put(Variant::Thumbnail, 5, 3);
  cache.put(Variant::Origin, 6, 4);

  EXPECT_TRUE(cache.remove(5));
  EXPECT_FALSE(cache.remove(5));
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_TRUE(cache.get(Variant::Origin, 6).has_value());

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
}
