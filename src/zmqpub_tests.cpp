// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/zmqpub.hpp"

#include "testutils.hpp"

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace stakex
{
namespace
{

using testing::ElementsAre;

/**
 * Address for the ZMQ socket in tests.  While we could use some non-TCP
 * method here for testing, using TCP is closer to what will be used in
 * production (and doesn't really hurt us much).
 */
constexpr const char* ZMQ_ADDR = "tcp://127.0.0.1:49837";

class ZmqPubTests : public testing::Test
{

protected:

  ZmqPub pub;
  TestZmqSubscriber sub;

  ZmqPubTests ()
    : pub(ZMQ_ADDR), sub(ZMQ_ADDR)
  {
    /* Give the ZMQ publisher and subscriber some time to get connected
       before continuing with the test.  */
    SleepSome ();
  }

  ~ZmqPubTests ()
  {
    /* Sleep some time before destructing the ZMQ subscriber to make
       sure it would receive any unexpected extra messages.  */
    SleepSome ();
  }

  static EpochSyncState
  Checkpoint (const uint64_t start, const uint64_t end)
  {
    EpochSyncState res;
    res.startBlock = start;
    res.endBlock = end;
    res.epochId = "epoch";
    res.epoch = 1;
    res.epochStartBlock = start;
    res.timestamp = 1'000;
    return res;
  }

};

TEST_F (ZmqPubTests, Checkpoints)
{
  pub.SendCheckpoint ("pool", Checkpoint (10, 19));
  pub.SendCheckpoint ("pool", Checkpoint (20, 29));

  EXPECT_THAT (sub.AwaitMessages (ZmqPub::TOPIC_EPOCHSYNC, 2), ElementsAre (
    ParseJson (R"({
      "validator_account_id": "pool",
      "start_block": 10,
      "end_block": 19,
      "epoch_id": "epoch",
      "epoch": 1,
      "epoch_start_block": 10,
      "timestamp": 1000
    })"),
    ParseJson (R"({
      "validator_account_id": "pool",
      "start_block": 20,
      "end_block": 29,
      "epoch_id": "epoch",
      "epoch": 1,
      "epoch_start_block": 20,
      "timestamp": 1000
    })")
  ));
}

TEST_F (ZmqPubTests, Metrics)
{
  ValidatorMetrics m;
  m.validator = "pool";
  m.epoch = 5;
  m.epochId = "epoch";
  m.totalStaked = 1'000;
  m.totalDelegators = 2;
  m.apy = 7.5;
  m.rewards = 10;
  m.timestamp = 123;

  pub.SendMetrics (m);
  pub.SendCheckpoint ("pool", Checkpoint (10, 19));
  m.epoch = 6;
  pub.SendMetrics (m);

  const auto metrics = sub.AwaitMessages (ZmqPub::TOPIC_METRICS, 2);
  ASSERT_EQ (metrics.size (), 2);
  EXPECT_EQ (metrics[0]["epoch"].asUInt64 (), 5);
  EXPECT_EQ (metrics[0]["total_staked"].asString (), "1000");
  EXPECT_TRUE (metrics[0]["uptime"].isNull ());
  EXPECT_EQ (metrics[1]["epoch"].asUInt64 (), 6);

  sub.AwaitMessages (ZmqPub::TOPIC_EPOCHSYNC, 1);
}

} // anonymous namespace
} // namespace stakex
