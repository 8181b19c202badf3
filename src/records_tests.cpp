// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "records.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

namespace stakex
{
namespace
{

TEST (EpochSyncStateTests, Json)
{
  EpochSyncState s;
  s.startBlock = 100;
  s.endBlock = 109;
  s.epochId = "epoch";
  s.epoch = 2;
  s.epochStartBlock = 105;
  s.timestamp = 1'700'000'000'000;

  const auto val = s.ToJson ();
  EXPECT_EQ (val, ParseJson (R"({
    "start_block": 100,
    "end_block": 109,
    "epoch_id": "epoch",
    "epoch": 2,
    "epoch_start_block": 105,
    "timestamp": 1700000000000
  })"));
  EXPECT_EQ (EpochSyncState::FromJson (val), s);
}

TEST (EpochSyncStateTests, EmptyRangeInvalid)
{
  EXPECT_THROW (EpochSyncState::FromJson (ParseJson (R"({
    "start_block": 10,
    "end_block": 9,
    "epoch_id": "epoch",
    "epoch": 1,
    "epoch_start_block": 1,
    "timestamp": 0
  })")), MalformedDataError);
}

TEST (DelegatorSnapshotTests, Json)
{
  DelegatorSnapshot s;
  s.delegatorId = "alice.near";
  s.validator = "pool.near";
  s.epoch = 3;
  s.epochId = "epoch";
  s.startBlock = 100;
  s.endBlock = 150;
  s.initialStake = Amount ("1000000000000000000000000000");
  s.autoCompoundedStake = 20;
  s.totalRewardsEarned = 10;
  s.pendingRewards = 5;
  s.tokensWithdrawn = 1;
  s.unstakedBalance = 2;
  s.lastUpdateBlock = 140;
  s.anomalies = {"unstake exceeds stake"};

  const auto val = s.ToJson ();
  EXPECT_EQ (val, ParseJson (R"({
    "delegator_id": "alice.near",
    "validator_account_id": "pool.near",
    "epoch": 3,
    "epoch_id": "epoch",
    "start_block_height": 100,
    "end_block_height": 150,
    "initial_stake": "1000000000000000000000000000",
    "auto_compounded_stake": "20",
    "total_rewards_earned": "10",
    "pending_rewards": "5",
    "tokens_withdrawn": "1",
    "unstaked_balance": "2",
    "last_update_block": 140,
    "anomalies": ["unstake exceeds stake"]
  })"));
  EXPECT_EQ (DelegatorSnapshot::FromJson (val), s);
  EXPECT_EQ (s.GetStake (), Amount ("1000000000000000000000000020"));
}

TEST (ValidatorMetricsTests, UnknownUptimeIsNull)
{
  ValidatorMetrics m;
  m.validator = "pool.near";
  m.epoch = 1;
  m.epochId = "epoch";
  m.totalStaked = 1'000;
  m.totalDelegators = 2;
  m.apy = 9.5;
  m.rewards = 3;
  m.timestamp = 42;

  auto val = m.ToJson ();
  EXPECT_TRUE (val.isMember ("uptime"));
  EXPECT_TRUE (val["uptime"].isNull ());
  EXPECT_FALSE (ValidatorMetrics::FromJson (val).uptimeKnown);

  m.uptimeKnown = true;
  m.uptime = 0.75;
  val = m.ToJson ();
  EXPECT_EQ (val["uptime"].asDouble (), 0.75);

  const auto restored = ValidatorMetrics::FromJson (val);
  EXPECT_TRUE (restored.uptimeKnown);
  EXPECT_EQ (restored.uptime, 0.75);
  EXPECT_EQ (restored.totalStaked, 1'000);
  EXPECT_EQ (restored.apy, 9.5);
}

TEST (ValidatorPerformanceTests, Json)
{
  ValidatorPerformance p;
  p.validator = "pool.near";
  p.epoch = 4;
  p.epochId = "epoch";
  p.blocksProduced = 9;
  p.blocksExpected = 10;
  p.blockProductionRate = 0.9;
  p.message = "chunk production rate not yet determined";

  const auto restored = ValidatorPerformance::FromJson (p.ToJson ());
  EXPECT_EQ (restored.blocksProduced, 9);
  EXPECT_EQ (restored.blocksExpected, 10);
  EXPECT_EQ (restored.blockProductionRate, 0.9);
  EXPECT_EQ (restored.chunksExpected, 0);
  EXPECT_EQ (restored.message, p.message);
}

TEST (EpochDataTests, Rollup)
{
  EpochData d;
  d.epoch = 2;
  d.epochId = "epoch";
  d.validator = "pool.near";
  d.startBlock = 100;
  d.endBlock = 199;
  d.timestamp = 5;

  d.delegators.resize (2);
  d.delegators[0].delegatorId = "alice.near";
  d.delegators[1].delegatorId = "bob.near";

  d.transactions.resize (1);
  d.transactions[0].hash = "tx";

  const auto val = d.ToJson ();
  EXPECT_EQ (val["epoch"].asUInt64 (), 2);
  EXPECT_EQ (val["validator_account_id"].asString (), "pool.near");
  ASSERT_TRUE (val["delegators"].isObject ());
  EXPECT_EQ (val["delegators"].size (), 2);
  EXPECT_EQ (val["delegators"]["bob.near"]["delegator_id"].asString (),
             "bob.near");
  ASSERT_TRUE (val["transactions"].isArray ());
  EXPECT_EQ (val["transactions"][0]["transaction_hash"].asString (), "tx");
}

} // anonymous namespace
} // namespace stakex
