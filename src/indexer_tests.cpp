// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "indexer.hpp"

#include "private/zmqpub.hpp"
#include "testutils.hpp"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace stakex
{
namespace
{

constexpr const char* POOL = "pool";

/** Address for the ZMQ socket in the notification test.  */
constexpr const char* ZMQ_ADDR = "tcp://127.0.0.1:49838";

class IndexerTests : public testing::Test
{

protected:

  TestChain chain;
  MemoryDocumentStore docs;
  IndexStore store;
  BatchFetcher fetcher;
  RangeProcessor proc;

  IndexerTests ()
    : store(docs, POOL, 100),
      fetcher(chain, POOL, 2, 5),
      proc(chain, store, fetcher, ApyConfig ())
  {
    proc.SetSleeper ([] (const std::chrono::milliseconds d) {});

    chain.AddBlocks (100, 109, "e1");
    chain.AddBlocks (110, 119, "e2");

    ValidatorInfo info;
    info.accountId = POOL;
    info.blocksProduced = 10;
    info.blocksExpected = 10;
    info.chunksProduced = 10;
    info.chunksExpected = 10;

    ValidatorSet set;
    set.epochStartHeight = 100;
    set.epochHeight = 1;
    set.current.push_back (info);
    chain.SetValidators ("e1", set);
  }

  /**
   * Makes the chain report e1 as its current epoch.
   */
  void
  SetCurrentEpoch ()
  {
    ValidatorSet set;
    set.epochStartHeight = 100;
    set.epochHeight = 1;
    chain.SetValidators ("", set);
  }

  /**
   * Returns the (start, end) ranges of all checkpoints.
   */
  std::vector<BlockRange>
  GetCheckpointRanges () const
  {
    std::vector<BlockRange> res;
    for (const auto& c : store.GetCheckpoints ())
      res.emplace_back (c.startBlock, c.endBlock);
    return res;
  }

};

TEST_F (IndexerTests, StartsAtCurrentEpoch)
{
  SetCurrentEpoch ();
  Indexer idx(chain, store, fetcher, proc, 10, 0);

  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::UP_TO_DATE);

  EXPECT_EQ (GetCheckpointRanges (), std::vector<BlockRange> ({
    BlockRange (100, 109),
    BlockRange (110, 119),
  }));
}

TEST_F (IndexerTests, ConfiguredStartHeight)
{
  Indexer idx(chain, store, fetcher, proc, 10, 105);

  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::UP_TO_DATE);

  EXPECT_EQ (GetCheckpointRanges (), std::vector<BlockRange> ({
    BlockRange (105, 114),
    BlockRange (115, 119),
  }));
}

TEST_F (IndexerTests, FollowsNewBlocks)
{
  Indexer idx(chain, store, fetcher, proc, 100, 100);

  chain.SetFinalHeight (104);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::UP_TO_DATE);

  chain.SetFinalHeight (119);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::UP_TO_DATE);

  EXPECT_EQ (GetCheckpointRanges (), std::vector<BlockRange> ({
    BlockRange (100, 104),
    BlockRange (105, 119),
  }));
}

TEST_F (IndexerTests, UnknownCurrentEpoch)
{
  Indexer idx(chain, store, fetcher, proc, 10, 0);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::FAILED);
  EXPECT_TRUE (store.GetCheckpoints ().empty ());

  SetCurrentEpoch ();
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
}

TEST_F (IndexerTests, FailedRangeIsRetried)
{
  Indexer idx(chain, store, fetcher, proc, 10, 100);

  chain.SetBlockFailure (107, true);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::FAILED);
  EXPECT_TRUE (store.GetCheckpoints ().empty ());

  chain.SetBlockFailure (107, false);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (GetCheckpointRanges (), std::vector<BlockRange> ({
    BlockRange (100, 109),
  }));
}

TEST_F (IndexerTests, BackgroundLoop)
{
  Indexer idx(chain, store, fetcher, proc, 5, 100);
  idx.Start ();

  for (unsigned i = 0; i < 100; ++i)
    {
      EpochSyncState latest;
      if (store.GetLatestCheckpoint (latest) && latest.endBlock == 119)
        break;
      SleepSome ();
    }

  idx.Stop ();

  EXPECT_EQ (GetCheckpointRanges (), std::vector<BlockRange> ({
    BlockRange (100, 104),
    BlockRange (105, 109),
    BlockRange (110, 114),
    BlockRange (115, 119),
  }));
}

TEST_F (IndexerTests, StopCancelsRange)
{
  chain.SetDelay (std::chrono::milliseconds (50));

  Indexer idx(chain, store, fetcher, proc, 20, 100);
  idx.Start ();
  SleepSome ();
  idx.Stop ();

  EXPECT_TRUE (store.GetCheckpoints ().empty ());
}

TEST_F (IndexerTests, ZmqNotifications)
{
  Indexer idx(chain, store, fetcher, proc, 10, 100);
  idx.SetZmqEndpoint (ZMQ_ADDR);

  TestZmqSubscriber sub(ZMQ_ADDR);
  SleepSome ();

  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);
  EXPECT_EQ (idx.UpdateStep (), Indexer::StepResult::PROGRESS);

  const auto checkpoints = sub.AwaitMessages (ZmqPub::TOPIC_EPOCHSYNC, 2);
  ASSERT_EQ (checkpoints.size (), 2);
  EXPECT_EQ (checkpoints[0]["validator_account_id"].asString (), POOL);
  EXPECT_EQ (checkpoints[0]["end_block"].asUInt64 (), 109);
  EXPECT_EQ (checkpoints[1]["end_block"].asUInt64 (), 119);

  const auto metrics = sub.AwaitMessages (ZmqPub::TOPIC_METRICS, 1);
  ASSERT_EQ (metrics.size (), 1);
  EXPECT_EQ (metrics[0]["epoch"].asUInt64 (), 1);
  EXPECT_EQ (metrics[0]["epoch_id"].asString (), "e1");

  SleepSome ();
}

} // anonymous namespace
} // namespace stakex
