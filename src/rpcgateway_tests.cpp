// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcgateway.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <jsonrpccpp/common/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <mutex>

namespace stakex
{
namespace
{

using testing::ElementsAre;
using std::chrono::milliseconds;

/* ************************************************************************** */

class RpcGatewayTests : public testing::Test
{

private:

  /** Lock for the recorded sleeps.  */
  std::mutex mut;

  /** All sleeps requested by the gateway.  */
  std::vector<milliseconds> sleeps;

protected:

  TestEndpoint* primary;
  TestEndpoint* secondary;

  std::unique_ptr<RpcGateway> gw;

  RpcGatewayTests ()
  {
    RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.baseDelay = milliseconds (100);
    policy.maxDelay = milliseconds (1'000);
    policy.jitter = 0.0;
    policy.cooldownThreshold = 2;
    policy.cooldown = milliseconds (3'600'000);
    Recreate (policy);
  }

  /**
   * Constructs a fresh gateway with the given policy.
   */
  void
  Recreate (const RetryPolicy& policy)
  {
    auto p = std::make_unique<TestEndpoint> ("primary");
    auto s = std::make_unique<TestEndpoint> ("secondary");
    primary = p.get ();
    secondary = s.get ();

    gw = std::make_unique<RpcGateway> (std::move (p), std::move (s), policy);
    gw->SetSleeper ([this] (const milliseconds d)
      {
        std::lock_guard<std::mutex> lock(mut);
        sleeps.push_back (d);
      });
  }

  /**
   * Returns and clears the recorded sleeps.
   */
  std::vector<milliseconds>
  GetSleeps ()
  {
    std::lock_guard<std::mutex> lock(mut);
    auto res = std::move (sleeps);
    sleeps.clear ();
    return res;
  }

  /**
   * Performs a call and returns the name of the endpoint that answered.
   */
  std::string
  CallEndpoint ()
  {
    return gw->Call ("block", ParseJson ("{}"))["endpoint"].asString ();
  }

};

TEST_F (RpcGatewayTests, PrimarySucceeds)
{
  const auto res = gw->Call ("block", ParseJson (R"({"block_id": 5})"));
  EXPECT_EQ (res, ParseJson (R"({
    "endpoint": "primary",
    "method": "block",
    "params": {"block_id": 5}
  })"));
  EXPECT_EQ (primary->GetNumCalls (), 1);
  EXPECT_EQ (secondary->GetNumCalls (), 0);
  EXPECT_THAT (GetSleeps (), ElementsAre ());
}

TEST_F (RpcGatewayTests, RetriesTransientErrors)
{
  primary->FailNext (2);
  EXPECT_EQ (CallEndpoint (), "primary");
  EXPECT_EQ (primary->GetNumCalls (), 3);
  EXPECT_EQ (secondary->GetNumCalls (), 0);
  EXPECT_THAT (GetSleeps (), ElementsAre (milliseconds (100),
                                          milliseconds (200)));
}

TEST_F (RpcGatewayTests, FailsOver)
{
  primary->SetDown (true);
  EXPECT_EQ (CallEndpoint (), "secondary");
  EXPECT_EQ (primary->GetNumCalls (), 3);
  EXPECT_EQ (secondary->GetNumCalls (), 1);
}

TEST_F (RpcGatewayTests, AllEndpointsDown)
{
  primary->SetDown (true);
  secondary->SetDown (true);
  EXPECT_THROW (CallEndpoint (), TerminalRpcError);
  EXPECT_EQ (primary->GetNumCalls (), 3);
  EXPECT_EQ (secondary->GetNumCalls (), 3);
}

TEST_F (RpcGatewayTests, ResponseErrorIsNotRetried)
{
  primary->SetResponseError ("UNKNOWN_BLOCK");
  EXPECT_THROW (CallEndpoint (), RpcResponseError);
  EXPECT_EQ (primary->GetNumCalls (), 1);
  EXPECT_EQ (secondary->GetNumCalls (), 0);
  EXPECT_FALSE (gw->IsCoolingDown (0));
}

TEST_F (RpcGatewayTests, CooldownAndReset)
{
  primary->SetDown (true);

  EXPECT_EQ (CallEndpoint (), "secondary");
  EXPECT_FALSE (gw->IsCoolingDown (0));
  EXPECT_EQ (CallEndpoint (), "secondary");
  EXPECT_TRUE (gw->IsCoolingDown (0));
  EXPECT_EQ (primary->GetNumCalls (), 6);

  /* While cooling down, the primary is not even tried.  */
  EXPECT_EQ (CallEndpoint (), "secondary");
  EXPECT_EQ (primary->GetNumCalls (), 6);

  /* After resetting, the (now working) primary is used again.  */
  primary->SetDown (false);
  gw->ResetHealth ();
  EXPECT_FALSE (gw->IsCoolingDown (0));
  EXPECT_EQ (CallEndpoint (), "primary");
  EXPECT_EQ (primary->GetNumCalls (), 7);
}

TEST_F (RpcGatewayTests, AllCoolingDown)
{
  primary->SetDown (true);
  secondary->SetDown (true);
  EXPECT_THROW (CallEndpoint (), TerminalRpcError);
  EXPECT_THROW (CallEndpoint (), TerminalRpcError);
  EXPECT_TRUE (gw->IsCoolingDown (0));
  EXPECT_TRUE (gw->IsCoolingDown (1));

  /* When all endpoints cool down, they are tried anyway.  */
  secondary->SetDown (false);
  EXPECT_EQ (CallEndpoint (), "secondary");
  EXPECT_FALSE (gw->IsCoolingDown (1));
}

TEST_F (RpcGatewayTests, BackoffIsCapped)
{
  RetryPolicy policy;
  policy.maxAttempts = 6;
  policy.baseDelay = milliseconds (300);
  policy.maxDelay = milliseconds (1'000);
  policy.jitter = 0.0;
  Recreate (policy);

  primary->FailNext (5);
  EXPECT_EQ (CallEndpoint (), "primary");
  EXPECT_THAT (GetSleeps (), ElementsAre (milliseconds (300),
                                          milliseconds (600),
                                          milliseconds (1'000),
                                          milliseconds (1'000),
                                          milliseconds (1'000)));
}

TEST_F (RpcGatewayTests, JitterStaysInBounds)
{
  RetryPolicy policy;
  policy.maxAttempts = 2;
  policy.baseDelay = milliseconds (1'000);
  policy.maxDelay = milliseconds (1'000);
  policy.jitter = 0.5;
  Recreate (policy);

  for (unsigned i = 0; i < 20; ++i)
    {
      primary->FailNext (1);
      EXPECT_EQ (CallEndpoint (), "primary");
    }

  const auto sleeps = GetSleeps ();
  ASSERT_EQ (sleeps.size (), 20);
  for (const auto d : sleeps)
    {
      EXPECT_GE (d, milliseconds (500));
      EXPECT_LE (d, milliseconds (1'000));
    }
}

/* ************************************************************************** */

TEST (ThrowForRpcErrorTests, NetworkErrorsAreTransient)
{
  EXPECT_THROW (ThrowForRpcError (jsonrpc::Errors::ERROR_CLIENT_CONNECTOR,
                                  "connection refused", Json::Value ()),
                TransientRpcError);
  EXPECT_THROW (ThrowForRpcError (
                    jsonrpc::Errors::ERROR_CLIENT_INVALID_RESPONSE,
                    "bad response", Json::Value ()),
                TransientRpcError);
  EXPECT_THROW (ThrowForRpcError (jsonrpc::Errors::ERROR_RPC_INTERNAL_ERROR,
                                  "HTTP 502", Json::Value ()),
                TransientRpcError);
}

TEST (ThrowForRpcErrorTests, ServerOverload)
{
  EXPECT_THROW (ThrowForRpcError (-32000, "Server error",
                                  ParseJson (R"({"name": "TIMEOUT_ERROR"})")),
                TransientRpcError);
  EXPECT_THROW (ThrowForRpcError (-429, "TooManyRequests", Json::Value ()),
                TransientRpcError);
}

TEST (ThrowForRpcErrorTests, UnknownEntity)
{
  try
    {
      ThrowForRpcError (jsonrpc::Errors::ERROR_RPC_INTERNAL_ERROR,
                        "Server error", ParseJson (R"("UNKNOWN_BLOCK")"));
      FAIL () << "No exception thrown";
    }
  catch (const RpcResponseError& exc)
    {
      EXPECT_TRUE (exc.IsUnknownEntity ());
      EXPECT_EQ (exc.GetCode (), jsonrpc::Errors::ERROR_RPC_INTERNAL_ERROR);
    }
}

TEST (ThrowForRpcErrorTests, OtherErrors)
{
  try
    {
      ThrowForRpcError (-32602, "Invalid params", Json::Value ());
      FAIL () << "No exception thrown";
    }
  catch (const RpcResponseError& exc)
    {
      EXPECT_FALSE (exc.IsUnknownEntity ());
      EXPECT_EQ (exc.GetCode (), -32602);
    }
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace stakex
