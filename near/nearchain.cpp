// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "nearchain.hpp"

#include "errors.hpp"
#include "private/jsonutils.hpp"

#include <xayautil/base64.hpp>

#include <glog/logging.h>

#include <sstream>

namespace stakex
{

namespace
{

/** Number of accounts requested per get_accounts call.  */
constexpr unsigned ACCOUNTS_PAGE_SIZE = 1'000;

/**
 * Returns the object member with the given key, throwing MalformedDataError
 * if it is missing or not an object.
 */
const Json::Value&
GetObjectField (const Json::Value& obj, const std::string& key)
{
  if (!obj.isObject () || !obj.isMember (key) || !obj[key].isObject ())
    throw MalformedDataError ("missing or invalid object field: " + key);
  return obj[key];
}

/**
 * Returns the array member with the given key.  A missing or null member
 * is treated as empty array.
 */
Json::Value
GetArrayField (const Json::Value& obj, const std::string& key)
{
  if (!obj.isObject ())
    throw MalformedDataError ("expected object with array field " + key);
  const auto& val = obj[key];
  if (val.isNull ())
    return Json::Value (Json::arrayValue);
  if (!val.isArray ())
    throw MalformedDataError ("invalid array field: " + key);
  return val;
}

/**
 * Parses a single action of a transaction.  Actions are either just
 * a string (e.g. "CreateAccount") or an object with the kind as the
 * only key.
 */
ActionData
ParseAction (const Json::Value& val)
{
  ActionData res;

  if (val.isString ())
    {
      res.kind = val.asString ();
      return res;
    }

  if (!val.isObject () || val.size () != 1)
    throw MalformedDataError ("invalid action: " + StoreJson (val));

  res.kind = val.getMemberNames ().front ();
  const auto& data = val[res.kind];
  if (!data.isObject ())
    return res;

  if (data.isMember ("deposit"))
    res.deposit = GetAmountField (data, "deposit");

  if (res.kind != "FunctionCall")
    return res;

  res.method = GetStringField (data, "method_name");
  res.gas = GetUIntField (data, "gas");

  const std::string encoded = GetStringField (data, "args");
  if (!xaya::DecodeBase64 (encoded, res.args))
    throw MalformedDataError ("function-call args are not base64: "
                                + encoded);

  return res;
}

ChunkTransaction
ParseTransaction (const Json::Value& val)
{
  ChunkTransaction res;
  res.hash = GetStringField (val, "hash");
  res.signer = GetStringField (val, "signer_id");
  res.receiver = GetStringField (val, "receiver_id");

  for (const auto& a : GetArrayField (val, "actions"))
    res.actions.push_back (ParseAction (a));

  return res;
}

} // anonymous namespace

Block
ParseNearBlock (const Json::Value& val)
{
  const auto& header = GetObjectField (val, "header");

  Block res;
  res.header.height = GetUIntField (header, "height");
  res.header.hash = GetStringField (header, "hash");
  res.header.prevHash = GetStringField (header, "prev_hash");
  res.header.epochId = GetStringField (header, "epoch_id");
  res.header.timestampNs = GetUIntField (header, "timestamp");
  res.header.gasPrice = GetAmountField (header, "gas_price");

  for (const auto& c : GetArrayField (val, "chunks"))
    {
      ChunkHeader ch;
      ch.hash = GetStringField (c, "chunk_hash");
      ch.heightIncluded = GetUIntField (c, "height_included");
      ch.shardId = GetUIntField (c, "shard_id");
      res.chunks.push_back (ch);
    }

  return res;
}

Chunk
ParseNearChunk (const Json::Value& val)
{
  const auto& header = GetObjectField (val, "header");

  Chunk res;
  res.hash = GetStringField (header, "chunk_hash");

  for (const auto& t : GetArrayField (val, "transactions"))
    {
      try
        {
          res.transactions.push_back (ParseTransaction (t));
        }
      catch (const MalformedDataError& exc)
        {
          LOG (WARNING)
              << "Skipping malformed transaction in chunk " << res.hash
              << ": " << exc.what ();
        }
    }

  return res;
}

ValidatorSet
ParseNearValidators (const Json::Value& val)
{
  ValidatorSet res;
  res.epochStartHeight = GetUIntField (val, "epoch_start_height");
  res.epochHeight = GetUIntField (val, "epoch_height");

  for (const auto& v : GetArrayField (val, "current_validators"))
    {
      ValidatorInfo info;
      info.accountId = GetStringField (v, "account_id");
      info.stake = GetAmountField (v, "stake");
      info.blocksProduced = GetUIntField (v, "num_produced_blocks");
      info.blocksExpected = GetUIntField (v, "num_expected_blocks");
      info.chunksProduced = GetUIntField (v, "num_produced_chunks");
      info.chunksExpected = GetUIntField (v, "num_expected_chunks");
      res.current.push_back (info);
    }

  for (const auto& k : GetArrayField (val, "prev_epoch_kickout"))
    res.kickouts.push_back (GetStringField (k, "account_id"));

  return res;
}

std::vector<PoolAccount>
ParseNearPoolAccounts (const Json::Value& val)
{
  if (!val.isArray ())
    throw MalformedDataError ("get_accounts result is not an array");

  std::vector<PoolAccount> res;
  for (const auto& a : val)
    {
      PoolAccount acc;
      acc.accountId = GetStringField (a, "account_id");
      acc.staked = GetAmountField (a, "staked_balance");
      acc.unstaked = GetAmountField (a, "unstaked_balance");

      const auto& canWithdraw = a["can_withdraw"];
      if (!canWithdraw.isBool ())
        throw MalformedDataError ("invalid can_withdraw for "
                                    + acc.accountId);
      acc.canWithdraw = canWithdraw.asBool ();

      res.push_back (acc);
    }

  return res;
}

/* ************************************************************************** */

void
NearChain::NewCycle ()
{
  rpc.ResetHealth ();
}

Block
NearChain::QueryBlock (const Json::Value& params)
{
  return ParseNearBlock (rpc.Call ("block", params));
}

uint64_t
NearChain::GetFinalHeight ()
{
  Json::Value params(Json::objectValue);
  params["finality"] = "final";
  return QueryBlock (params).header.height;
}

bool
NearChain::GetBlock (const uint64_t height, Block& blk)
{
  Json::Value params(Json::objectValue);
  params["block_id"] = static_cast<Json::UInt64> (height);

  try
    {
      blk = QueryBlock (params);
    }
  catch (const RpcResponseError& exc)
    {
      if (!exc.IsUnknownEntity ())
        throw;
      VLOG (1) << "No block at height " << height << ": " << exc.what ();
      return false;
    }

  if (blk.header.height != height)
    {
      std::ostringstream msg;
      msg << "requested block " << height
          << " but got " << blk.header.height;
      throw MalformedDataError (msg.str ());
    }

  return true;
}

Chunk
NearChain::GetChunk (const std::string& hash)
{
  Json::Value params(Json::objectValue);
  params["chunk_id"] = hash;
  return ParseNearChunk (rpc.Call ("chunk", params));
}

Json::Value
NearChain::QueryValidators (const std::string& epochId)
{
  Json::Value ref;
  if (!epochId.empty ())
    {
      ref = Json::Value (Json::objectValue);
      ref["epoch_id"] = epochId;
    }

  Json::Value params(Json::arrayValue);
  params.append (ref);

  return rpc.Call ("validators", params);
}

ValidatorSet
NearChain::GetValidators (const std::string& epochId)
{
  return ParseNearValidators (QueryValidators (epochId));
}

EpochInfo
NearChain::GetEpochInfo (const std::string& epochId)
{
  EpochInfo res;
  res.epochId = epochId;

  /* The validators result does not contain the epoch ID itself, so for
     the current epoch we take it from the final block.  */
  if (res.epochId.empty ())
    {
      Json::Value params(Json::objectValue);
      params["finality"] = "final";
      res.epochId = QueryBlock (params).header.epochId;
    }

  const auto val = QueryValidators (res.epochId);
  res.startHeight = GetUIntField (val, "epoch_start_height");
  res.epochHeight = GetUIntField (val, "epoch_height");

  return res;
}

std::vector<PoolAccount>
NearChain::GetPoolAccounts (const std::string& pool,
                            const std::string& blockHash)
{
  std::vector<PoolAccount> res;

  for (uint64_t fromIndex = 0; ; fromIndex += ACCOUNTS_PAGE_SIZE)
    {
      Json::Value args(Json::objectValue);
      args["from_index"] = static_cast<Json::UInt64> (fromIndex);
      args["limit"] = ACCOUNTS_PAGE_SIZE;

      Json::Value params(Json::objectValue);
      params["request_type"] = "call_function";
      params["block_id"] = blockHash;
      params["account_id"] = pool;
      params["method_name"] = "get_accounts";
      params["args_base64"] = xaya::EncodeBase64 (StoreJson (args));

      const auto val = rpc.Call ("query", params);

      /* The view call's return value is a JSON string, encoded as
         array of its bytes.  */
      const auto bytes = GetArrayField (val, "result");
      std::string str;
      for (const auto& b : bytes)
        {
          if (!b.isUInt () || b.asUInt () > 0xFF)
            throw MalformedDataError ("invalid byte in view call result");
          str.push_back (static_cast<char> (b.asUInt ()));
        }

      Json::Value page;
      if (!ParseUntrustedJson (str, page))
        throw MalformedDataError ("view call result is not JSON: " + str);

      const auto accounts = ParseNearPoolAccounts (page);
      VLOG (1)
          << "Got " << accounts.size () << " accounts of " << pool
          << " from index " << fromIndex << " at block " << blockHash;
      res.insert (res.end (), accounts.begin (), accounts.end ());

      if (accounts.size () < ACCOUNTS_PAGE_SIZE)
        break;
    }

  return res;
}

} // namespace stakex
