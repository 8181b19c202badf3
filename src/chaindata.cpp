// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chaindata.hpp"

#include "errors.hpp"
#include "private/jsonutils.hpp"
#include "proto/chaindata.pb.h"

#include <glog/logging.h>

namespace stakex
{

const ValidatorInfo*
ValidatorSet::Find (const std::string& accountId) const
{
  for (const auto& v : current)
    if (v.accountId == accountId)
      return &v;
  return nullptr;
}

/* ************************************************************************** */

Json::Value
StakingTransaction::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["transaction_hash"] = hash;
  res["amount"] = FormatAmount (amount);
  res["method"] = method;
  res["action"] = action;
  res["type"] = type;
  res["block_height"] = static_cast<Json::UInt64> (blockHeight);
  res["timestamp"] = static_cast<Json::UInt64> (timestamp);
  res["delegator_address"] = delegator;
  res["gas_fee"] = FormatAmount (gasFee);
  return res;
}

StakingTransaction
StakingTransaction::FromJson (const Json::Value& val)
{
  if (!val.isObject ())
    throw MalformedDataError ("transaction document is not an object");

  StakingTransaction res;
  res.hash = GetStringField (val, "transaction_hash");
  res.amount = GetAmountField (val, "amount");
  res.method = GetStringField (val, "method");
  res.action = GetStringField (val, "action");
  res.type = GetStringField (val, "type");
  res.blockHeight = GetUIntField (val, "block_height");
  res.timestamp = GetUIntField (val, "timestamp");
  res.delegator = GetStringField (val, "delegator_address");
  res.gasFee = GetAmountField (val, "gas_fee");

  return res;
}

std::ostream&
operator<< (std::ostream& out, const StakingTransaction& tx)
{
  out << "Tx " << tx.hash << " at height " << tx.blockHeight << ": "
      << tx.delegator << " " << tx.method << " " << tx.amount;
  return out;
}

/* ************************************************************************** */

namespace
{

bool
ParseProtoAmount (const std::string& str, Amount& out)
{
  if (str.empty ())
    {
      out = 0;
      return true;
    }
  return ParseAmount (str, out);
}

} // anonymous namespace

std::string
SerialiseFetchedBlocks (const std::vector<FetchedBlock>& blocks)
{
  /* We use protocol buffers internally to implement the serialisation,
     but this is not exposed on the outside.  */

  proto::FetchedBatch batch;
  for (const auto& blk : blocks)
    {
      auto& bpb = *batch.add_blocks ();

      auto& hpb = *bpb.mutable_header ();
      hpb.set_height (blk.header.height);
      hpb.set_hash (blk.header.hash);
      hpb.set_prev_hash (blk.header.prevHash);
      hpb.set_epoch_id (blk.header.epochId);
      hpb.set_timestamp_ns (blk.header.timestampNs);
      hpb.set_gas_price (FormatAmount (blk.header.gasPrice));

      for (const auto& tx : blk.transactions)
        {
          auto& tpb = *bpb.add_transactions ();
          tpb.set_hash (tx.hash);
          tpb.set_amount (FormatAmount (tx.amount));
          tpb.set_method (tx.method);
          tpb.set_action (tx.action);
          tpb.set_type (tx.type);
          tpb.set_block_height (tx.blockHeight);
          tpb.set_timestamp (tx.timestamp);
          tpb.set_delegator (tx.delegator);
          tpb.set_gas_fee (FormatAmount (tx.gasFee));
        }
    }

  std::string res;
  CHECK (batch.SerializeToString (&res));
  return res;
}

bool
DeserialiseFetchedBlocks (const std::string& data,
                          std::vector<FetchedBlock>& blocks)
{
  proto::FetchedBatch batch;
  if (!batch.ParseFromString (data))
    {
      LOG (WARNING) << "Failed to parse FetchedBatch protocol buffer";
      return false;
    }

  blocks.clear ();
  for (const auto& bpb : batch.blocks ())
    {
      blocks.emplace_back ();
      auto& blk = blocks.back ();

      const auto& hpb = bpb.header ();
      blk.header.height = hpb.height ();
      blk.header.hash = hpb.hash ();
      blk.header.prevHash = hpb.prev_hash ();
      blk.header.epochId = hpb.epoch_id ();
      blk.header.timestampNs = hpb.timestamp_ns ();
      if (!ParseProtoAmount (hpb.gas_price (), blk.header.gasPrice))
        return false;

      for (const auto& tpb : bpb.transactions ())
        {
          blk.transactions.emplace_back ();
          auto& tx = blk.transactions.back ();
          tx.hash = tpb.hash ();
          tx.method = tpb.method ();
          tx.action = tpb.action ();
          tx.type = tpb.type ();
          tx.blockHeight = tpb.block_height ();
          tx.timestamp = tpb.timestamp ();
          tx.delegator = tpb.delegator ();
          if (!ParseProtoAmount (tpb.amount (), tx.amount)
                || !ParseProtoAmount (tpb.gas_fee (), tx.gasFee))
            return false;
        }
    }

  return true;
}

} // namespace stakex
