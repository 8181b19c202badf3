// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chaindata.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

namespace stakex
{
namespace
{

StakingTransaction
ExampleTx ()
{
  StakingTransaction tx;
  tx.hash = "tx hash";
  tx.amount = Amount ("1000000000000000000000000");
  tx.method = "deposit_and_stake";
  tx.action = "FunctionCall";
  tx.type = "stake";
  tx.blockHeight = 42;
  tx.timestamp = 1'700'000'000'123;
  tx.delegator = "alice.near";
  tx.gasFee = 300;
  return tx;
}

TEST (StakingTransactionTests, ToJson)
{
  EXPECT_EQ (ExampleTx ().ToJson (), ParseJson (R"({
    "transaction_hash": "tx hash",
    "amount": "1000000000000000000000000",
    "method": "deposit_and_stake",
    "action": "FunctionCall",
    "type": "stake",
    "block_height": 42,
    "timestamp": 1700000000123,
    "delegator_address": "alice.near",
    "gas_fee": "300"
  })"));
}

TEST (StakingTransactionTests, FromJson)
{
  const auto tx = ExampleTx ();
  EXPECT_EQ (StakingTransaction::FromJson (tx.ToJson ()), tx);
}

TEST (StakingTransactionTests, FromJsonInvalid)
{
  EXPECT_THROW (StakingTransaction::FromJson (ParseJson ("[]")),
                MalformedDataError);

  auto val = ExampleTx ().ToJson ();
  val["amount"] = "-5";
  EXPECT_THROW (StakingTransaction::FromJson (val), MalformedDataError);

  val = ExampleTx ().ToJson ();
  val.removeMember ("delegator_address");
  EXPECT_THROW (StakingTransaction::FromJson (val), MalformedDataError);
}

TEST (ValidatorSetTests, Find)
{
  ValidatorSet set;
  set.current.emplace_back ();
  set.current.back ().accountId = "pool.near";
  set.current.back ().blocksProduced = 10;
  set.current.emplace_back ();
  set.current.back ().accountId = "other.near";

  const auto* found = set.Find ("pool.near");
  ASSERT_NE (found, nullptr);
  EXPECT_EQ (found->blocksProduced, 10);
  EXPECT_EQ (set.Find ("missing.near"), nullptr);
}

TEST (FetchedBlocksSerialisationTests, RoundTrip)
{
  std::vector<FetchedBlock> blocks(2);
  blocks[0].header.height = 42;
  blocks[0].header.hash = "block 42";
  blocks[0].header.prevHash = "block 41";
  blocks[0].header.epochId = "epoch";
  blocks[0].header.timestampNs = 1'700'000'000'123'456'789;
  blocks[0].header.gasPrice = 100'000'000;
  blocks[0].transactions.push_back (ExampleTx ());
  blocks[1].header.height = 44;
  blocks[1].header.hash = "block 44";

  std::vector<FetchedBlock> restored;
  ASSERT_TRUE (DeserialiseFetchedBlocks (SerialiseFetchedBlocks (blocks),
                                         restored));
  ASSERT_EQ (restored.size (), 2);
  EXPECT_EQ (restored[0].header.height, 42);
  EXPECT_EQ (restored[0].header.prevHash, "block 41");
  EXPECT_EQ (restored[0].header.epochId, "epoch");
  EXPECT_EQ (restored[0].header.timestampNs, 1'700'000'000'123'456'789);
  EXPECT_EQ (restored[0].header.gasPrice, 100'000'000);
  ASSERT_EQ (restored[0].transactions.size (), 1);
  EXPECT_EQ (restored[0].transactions[0], ExampleTx ());
  EXPECT_EQ (restored[1].header.hash, "block 44");
  EXPECT_TRUE (restored[1].transactions.empty ());
}

TEST (FetchedBlocksSerialisationTests, Invalid)
{
  std::vector<FetchedBlock> blocks;
  EXPECT_FALSE (DeserialiseFetchedBlocks ("\xff\xff\xff", blocks));
}

} // anonymous namespace
} // namespace stakex
