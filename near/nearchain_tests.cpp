// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "nearchain.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <xayautil/base64.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <glog/logging.h>

namespace stakex
{
namespace
{

using testing::ElementsAre;

/* ************************************************************************** */

TEST (ParseNearBlockTests, Valid)
{
  const auto blk = ParseNearBlock (ParseJson (R"({
    "header": {
      "height": 100,
      "hash": "hash 100",
      "prev_hash": "hash 99",
      "epoch_id": "epoch",
      "timestamp": 1700000000123456789,
      "gas_price": "100000000",
      "other": "ignored"
    },
    "chunks": [
      {"chunk_hash": "c0", "height_included": 100, "shard_id": 0},
      {"chunk_hash": "c1", "height_included": 99, "shard_id": 1}
    ]
  })"));

  EXPECT_EQ (blk.header.height, 100);
  EXPECT_EQ (blk.header.hash, "hash 100");
  EXPECT_EQ (blk.header.prevHash, "hash 99");
  EXPECT_EQ (blk.header.epochId, "epoch");
  EXPECT_EQ (blk.header.GetTimestampMs (), 1'700'000'000'123);
  EXPECT_EQ (blk.header.gasPrice, 100'000'000);

  ASSERT_EQ (blk.chunks.size (), 2);
  EXPECT_EQ (blk.chunks[0].hash, "c0");
  EXPECT_EQ (blk.chunks[0].heightIncluded, 100);
  EXPECT_EQ (blk.chunks[1].hash, "c1");
  EXPECT_EQ (blk.chunks[1].heightIncluded, 99);
  EXPECT_EQ (blk.chunks[1].shardId, 1);
}

TEST (ParseNearBlockTests, Invalid)
{
  for (const std::string str : {
      R"([])",
      R"({"chunks": []})",
      R"({"header": {"height": 1}, "chunks": []})",
      R"({
        "header": {
          "height": -1, "hash": "", "prev_hash": "", "epoch_id": "",
          "timestamp": 0, "gas_price": "1"
        }
      })",
      R"({
        "header": {
          "height": 1, "hash": "", "prev_hash": "", "epoch_id": "",
          "timestamp": 0, "gas_price": "1"
        },
        "chunks": [{"chunk_hash": "c"}]
      })",
    })
    EXPECT_THROW (ParseNearBlock (ParseJson (str)), MalformedDataError)
        << str;
}

TEST (ParseNearChunkTests, Actions)
{
  const auto chunk = ParseNearChunk (ParseJson (R"({
    "header": {"chunk_hash": "chunk"},
    "transactions": [
      {
        "hash": "tx 1",
        "signer_id": "alice",
        "receiver_id": "pool",
        "actions": [
          "CreateAccount",
          {"Transfer": {"deposit": "5"}},
          {
            "FunctionCall":
              {
                "method_name": "unstake",
                "args": "eyJhbW91bnQiOiI1MCJ9",
                "gas": 30000000000000,
                "deposit": "0"
              }
          }
        ]
      }
    ]
  })"));

  EXPECT_EQ (chunk.hash, "chunk");
  ASSERT_EQ (chunk.transactions.size (), 1);

  const auto& tx = chunk.transactions[0];
  EXPECT_EQ (tx.hash, "tx 1");
  EXPECT_EQ (tx.signer, "alice");
  EXPECT_EQ (tx.receiver, "pool");

  ASSERT_EQ (tx.actions.size (), 3);
  EXPECT_EQ (tx.actions[0].kind, "CreateAccount");
  EXPECT_EQ (tx.actions[1].kind, "Transfer");
  EXPECT_EQ (tx.actions[1].deposit, 5);
  EXPECT_EQ (tx.actions[2].kind, "FunctionCall");
  EXPECT_EQ (tx.actions[2].method, "unstake");
  EXPECT_EQ (tx.actions[2].args, R"({"amount":"50"})");
  EXPECT_EQ (tx.actions[2].gas, 30'000'000'000'000);
  EXPECT_EQ (tx.actions[2].deposit, 0);
}

TEST (ParseNearChunkTests, MalformedTransactionsAreSkipped)
{
  const auto chunk = ParseNearChunk (ParseJson (R"({
    "header": {"chunk_hash": "chunk"},
    "transactions": [
      {"hash": "no signer", "receiver_id": "pool", "actions": []},
      {
        "hash": "bad args",
        "signer_id": "alice",
        "receiver_id": "pool",
        "actions": [
          {
            "FunctionCall":
              {
                "method_name": "stake",
                "args": "%%%",
                "gas": 1,
                "deposit": "0"
              }
          }
        ]
      },
      {"hash": "good", "signer_id": "bob", "receiver_id": "pool",
       "actions": []}
    ]
  })"));

  ASSERT_EQ (chunk.transactions.size (), 1);
  EXPECT_EQ (chunk.transactions[0].hash, "good");
}

TEST (ParseNearValidatorsTests, Valid)
{
  const auto set = ParseNearValidators (ParseJson (R"({
    "epoch_start_height": 1000,
    "epoch_height": 42,
    "current_validators": [
      {
        "account_id": "pool",
        "stake": "123456789012345678901234567890",
        "num_produced_blocks": 9,
        "num_expected_blocks": 10,
        "num_produced_chunks": 18,
        "num_expected_chunks": 20
      }
    ],
    "prev_epoch_kickout": [
      {"account_id": "lazy", "reason": {"NotEnoughBlocks": {}}}
    ]
  })"));

  EXPECT_EQ (set.epochStartHeight, 1'000);
  EXPECT_EQ (set.epochHeight, 42);
  EXPECT_THAT (set.kickouts, ElementsAre ("lazy"));

  const auto* info = set.Find ("pool");
  ASSERT_NE (info, nullptr);
  Amount stake;
  ASSERT_TRUE (ParseAmount ("123456789012345678901234567890", stake));
  EXPECT_EQ (info->stake, stake);
  EXPECT_EQ (info->blocksProduced, 9);
  EXPECT_EQ (info->blocksExpected, 10);
  EXPECT_EQ (info->chunksProduced, 18);
  EXPECT_EQ (info->chunksExpected, 20);

  EXPECT_EQ (set.Find ("other"), nullptr);
}

TEST (ParseNearPoolAccountsTests, Valid)
{
  const auto accounts = ParseNearPoolAccounts (ParseJson (R"([
    {
      "account_id": "alice",
      "unstaked_balance": "10",
      "staked_balance": "1000",
      "can_withdraw": true
    }
  ])"));

  ASSERT_EQ (accounts.size (), 1);
  EXPECT_EQ (accounts[0].accountId, "alice");
  EXPECT_EQ (accounts[0].staked, 1'000);
  EXPECT_EQ (accounts[0].unstaked, 10);
  EXPECT_TRUE (accounts[0].canWithdraw);

  EXPECT_THROW (ParseNearPoolAccounts (ParseJson ("{}")), MalformedDataError);
  EXPECT_THROW (ParseNearPoolAccounts (ParseJson (R"([
    {"account_id": "alice", "unstaked_balance": "0", "staked_balance": "0"}
  ])")), MalformedDataError);
}

/* ************************************************************************** */

/**
 * Tests for the NearChain client.  The endpoint answers requests like
 * a NEAR node would with a small fake chain of blocks 10 to 19, where
 * block 15 was skipped.  The secondary endpoint is always down.
 */
class NearChainTests : public testing::Test
{

protected:

  TestEndpoint* endpoint;
  std::unique_ptr<RpcGateway> gw;
  std::unique_ptr<NearChain> chain;

  /** Number of delegators in the pool.  */
  unsigned numDelegators = 3;

  NearChainTests ()
  {
    auto ep = std::make_unique<TestEndpoint> ("node");
    endpoint = ep.get ();
    ep->SetHandler ([this] (const std::string& method,
                            const Json::Value& params)
      {
        return HandleCall (method, params);
      });

    auto secondary = std::make_unique<TestEndpoint> ("secondary");
    secondary->SetDown (true);

    RetryPolicy policy;
    policy.maxAttempts = 2;
    policy.jitter = 0.0;
    policy.cooldownThreshold = 2;

    gw = std::make_unique<RpcGateway> (std::move (ep), std::move (secondary),
                                       policy);
    gw->SetSleeper ([] (const std::chrono::milliseconds d) {});

    chain = std::make_unique<NearChain> (*gw);
  }

  static Json::Value
  BlockJson (const uint64_t height)
  {
    Json::Value header(Json::objectValue);
    header["height"] = static_cast<Json::UInt64> (height);
    header["hash"] = "hash " + std::to_string (height);
    header["prev_hash"] = "hash " + std::to_string (height - 1);
    header["epoch_id"] = height < 15 ? "epoch a" : "epoch b";
    header["timestamp"] = static_cast<Json::UInt64> (height * 1'000'000'000);
    header["gas_price"] = "100";

    Json::Value res(Json::objectValue);
    res["header"] = header;
    res["chunks"] = Json::Value (Json::arrayValue);

    return res;
  }

  Json::Value
  HandleCall (const std::string& method, const Json::Value& params)
  {
    if (method == "block")
      {
        if (params.isMember ("finality"))
          return BlockJson (19);

        const uint64_t height = params["block_id"].asUInt64 ();
        if (height == 15 || height > 19)
          throw RpcResponseError ("UNKNOWN_BLOCK", -32000, true);
        return BlockJson (height);
      }

    if (method == "validators")
      {
        CHECK (params.isArray () && params.size () == 1);
        const auto& ref = params[0];
        if (ref.isNull ())
          throw RpcResponseError ("validators of current epoch requested",
                                  -32000, false);

        const std::string epochId = ref["epoch_id"].asString ();
        if (epochId != "epoch a" && epochId != "epoch b")
          throw RpcResponseError ("UNKNOWN_EPOCH", -32000, true);

        return ParseJson (R"({
          "epoch_start_height": )"
          + std::string (epochId == "epoch a" ? "10" : "15") + R"(,
          "epoch_height": 7,
          "current_validators": []
        })");
      }

    if (method == "query")
      {
        CHECK_EQ (params["request_type"].asString (), "call_function");
        CHECK_EQ (params["method_name"].asString (), "get_accounts");

        std::string argsStr;
        CHECK (xaya::DecodeBase64 (params["args_base64"].asString (),
                                   argsStr));
        const auto args = ParseJson (argsStr);
        const unsigned from = args["from_index"].asUInt ();
        const unsigned limit = args["limit"].asUInt ();

        Json::Value accounts(Json::arrayValue);
        for (unsigned i = from; i < numDelegators && i < from + limit; ++i)
          {
            Json::Value acc(Json::objectValue);
            acc["account_id"] = "delegator " + std::to_string (i);
            acc["staked_balance"] = std::to_string (i + 1);
            acc["unstaked_balance"] = "0";
            acc["can_withdraw"] = true;
            accounts.append (acc);
          }

        const std::string resultStr = accounts.toStyledString ();
        Json::Value bytes(Json::arrayValue);
        for (const unsigned char c : resultStr)
          bytes.append (static_cast<Json::UInt> (c));

        Json::Value res(Json::objectValue);
        res["block_hash"] = params["block_id"];
        res["result"] = bytes;
        return res;
      }

    LOG (FATAL) << "Unexpected method: " << method;
  }

};

TEST_F (NearChainTests, FinalHeight)
{
  EXPECT_EQ (chain->GetFinalHeight (), 19);
}

TEST_F (NearChainTests, GetBlock)
{
  Block blk;
  ASSERT_TRUE (chain->GetBlock (12, blk));
  EXPECT_EQ (blk.header.height, 12);
  EXPECT_EQ (blk.header.hash, "hash 12");
  EXPECT_EQ (blk.header.epochId, "epoch a");
}

TEST_F (NearChainTests, SkippedBlock)
{
  Block blk;
  EXPECT_FALSE (chain->GetBlock (15, blk));
}

TEST_F (NearChainTests, EpochInfo)
{
  const auto info = chain->GetEpochInfo ("epoch a");
  EXPECT_EQ (info.epochId, "epoch a");
  EXPECT_EQ (info.startHeight, 10);
  EXPECT_EQ (info.epochHeight, 7);

  EXPECT_THROW (chain->GetEpochInfo ("invalid"), RpcResponseError);
}

TEST_F (NearChainTests, CurrentEpochInfo)
{
  const auto info = chain->GetEpochInfo ("");
  EXPECT_EQ (info.epochId, "epoch b");
  EXPECT_EQ (info.startHeight, 15);
}

TEST_F (NearChainTests, PoolAccounts)
{
  const auto accounts = chain->GetPoolAccounts ("pool", "hash 12");
  ASSERT_EQ (accounts.size (), 3);
  EXPECT_EQ (accounts[0].accountId, "delegator 0");
  EXPECT_EQ (accounts[2].accountId, "delegator 2");
  EXPECT_EQ (accounts[2].staked, 3);
  EXPECT_EQ (endpoint->GetNumCalls (), 1);
}

TEST_F (NearChainTests, PoolAccountsPaginated)
{
  numDelegators = 2'500;

  const auto accounts = chain->GetPoolAccounts ("pool", "hash 12");
  ASSERT_EQ (accounts.size (), 2'500);
  EXPECT_EQ (accounts.front ().accountId, "delegator 0");
  EXPECT_EQ (accounts[1'000].accountId, "delegator 1000");
  EXPECT_EQ (accounts.back ().accountId, "delegator 2499");
  EXPECT_EQ (endpoint->GetNumCalls (), 3);
}

TEST_F (NearChainTests, NewCycleResetsHealth)
{
  endpoint->SetDown (true);
  EXPECT_THROW (chain->GetFinalHeight (), TerminalRpcError);
  EXPECT_THROW (chain->GetFinalHeight (), TerminalRpcError);
  EXPECT_TRUE (gw->IsCoolingDown (0));

  endpoint->SetDown (false);
  chain->NewCycle ();
  EXPECT_FALSE (gw->IsCoolingDown (0));
  EXPECT_EQ (chain->GetFinalHeight (), 19);
}

} // anonymous namespace
} // namespace stakex
