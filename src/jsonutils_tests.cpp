// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/jsonutils.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

namespace stakex
{
namespace
{

using JsonUtilsTests = testing::Test;

TEST_F (JsonUtilsTests, RoundTrip)
{
  for (const std::string str : {"0", "\"abc\"", "[1,2,3]", "{\"foo\":42}"})
    EXPECT_EQ (StoreJson (LoadJson (str)), str);
}

TEST_F (JsonUtilsTests, Invalid)
{
  EXPECT_DEATH (LoadJson ("foo"), "Invalid JSON stored");
}

TEST_F (JsonUtilsTests, Untrusted)
{
  Json::Value val;
  ASSERT_TRUE (ParseUntrustedJson ("{\"amount\":\"100\"}", val));
  EXPECT_EQ (val["amount"].asString (), "100");

  EXPECT_FALSE (ParseUntrustedJson ("{\"amount\":", val));
  EXPECT_FALSE (ParseUntrustedJson ("{\"a\":1,\"a\":2}", val));
  EXPECT_FALSE (ParseUntrustedJson ("{} x", val));
}

TEST_F (JsonUtilsTests, Fields)
{
  const auto obj = ParseJson (R"({
    "str": "foo",
    "num": 42,
    "neg": -1,
    "amount": "123456789012345678901234567890"
  })");

  EXPECT_EQ (GetStringField (obj, "str"), "foo");
  EXPECT_EQ (GetUIntField (obj, "num"), 42);
  EXPECT_EQ (GetAmountField (obj, "amount"),
             Amount ("123456789012345678901234567890"));
  EXPECT_EQ (GetAmountField (obj, "num"), 42);

  EXPECT_THROW (GetStringField (obj, "num"), MalformedDataError);
  EXPECT_THROW (GetUIntField (obj, "neg"), MalformedDataError);
  EXPECT_THROW (GetUIntField (obj, "missing"), MalformedDataError);
  EXPECT_THROW (GetAmountField (obj, "str"), MalformedDataError);
  EXPECT_THROW (GetStringField (ParseJson ("[1]"), "str"), MalformedDataError);
}

} // anonymous namespace
} // namespace stakex
