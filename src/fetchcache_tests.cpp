// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fetchcache.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace stakex
{
namespace
{

template <typename T>
  std::unique_ptr<FetchCache> CreateCache ();

template <>
  std::unique_ptr<FetchCache>
  CreateCache<MemoryFetchCache> ()
{
  return std::make_unique<MemoryFetchCache> ();
}

template <>
  std::unique_ptr<FetchCache>
  CreateCache<SqliteFetchCache> ()
{
  return std::make_unique<SqliteFetchCache> (":memory:");
}

template <typename T>
  class FetchCacheTests : public testing::Test
{

protected:

  std::unique_ptr<FetchCache> cache;

  FetchCacheTests ()
    : cache(CreateCache<T> ())
  {}

  /**
   * Returns some blocks for the given range, with one transaction in
   * the first block.
   */
  static std::vector<FetchedBlock>
  Blocks (const BlockRange& range)
  {
    std::vector<FetchedBlock> res;
    for (uint64_t h = range.start; h <= range.end; ++h)
      {
        res.emplace_back ();
        res.back ().header.height = h;
        res.back ().header.hash = "block " + std::to_string (h);
      }

    res.front ().transactions.emplace_back ();
    res.front ().transactions.back ().hash = "tx";
    res.front ().transactions.back ().blockHeight = range.start;

    return res;
  }

  /**
   * Returns true if the cache has an entry for the range.
   */
  bool
  Has (const BlockRange& range)
  {
    std::vector<FetchedBlock> blocks;
    return cache->Get (range, blocks);
  }

};

using CacheTypes = testing::Types<MemoryFetchCache, SqliteFetchCache>;
TYPED_TEST_SUITE (FetchCacheTests, CacheTypes);

TYPED_TEST (FetchCacheTests, PutAndGet)
{
  const BlockRange range(10, 14);
  EXPECT_FALSE (this->Has (range));

  this->cache->Put (range, this->Blocks (range));

  std::vector<FetchedBlock> blocks;
  ASSERT_TRUE (this->cache->Get (range, blocks));
  ASSERT_EQ (blocks.size (), 5);
  EXPECT_EQ (blocks[0].header.hash, "block 10");
  EXPECT_EQ (blocks[4].header.height, 14);
  ASSERT_EQ (blocks[0].transactions.size (), 1);
  EXPECT_EQ (blocks[0].transactions[0].hash, "tx");

  EXPECT_FALSE (this->Has (BlockRange (10, 13)));
}

TYPED_TEST (FetchCacheTests, Prune)
{
  for (const auto& r : {BlockRange (0, 4), BlockRange (5, 9),
                        BlockRange (10, 14)})
    this->cache->Put (r, this->Blocks (r));

  this->cache->Prune (9);
  EXPECT_FALSE (this->Has (BlockRange (0, 4)));
  EXPECT_FALSE (this->Has (BlockRange (5, 9)));
  EXPECT_TRUE (this->Has (BlockRange (10, 14)));
}

TEST (SqliteFetchCacheTests, OpenFailure)
{
  EXPECT_THROW (SqliteFetchCache ("/nonexistent/directory/cache.sqlite"),
                PersistenceError);
}

} // anonymous namespace
} // namespace stakex
