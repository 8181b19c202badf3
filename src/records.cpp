// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "records.hpp"

#include "errors.hpp"
#include "private/jsonutils.hpp"

#include <glog/logging.h>

namespace stakex
{

namespace
{

Json::Value
UIntJson (const uint64_t val)
{
  return static_cast<Json::UInt64> (val);
}

double
GetDoubleField (const Json::Value& obj, const std::string& key)
{
  const auto& field = obj[key];
  if (!field.isNumeric ())
    throw MalformedDataError ("missing or invalid number field: " + key);
  return field.asDouble ();
}

void
CheckObject (const Json::Value& val, const std::string& what)
{
  if (!val.isObject ())
    throw MalformedDataError (what + " document is not an object");
}

} // anonymous namespace

/* ************************************************************************** */

Json::Value
EpochSyncState::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["start_block"] = UIntJson (startBlock);
  res["end_block"] = UIntJson (endBlock);
  res["epoch_id"] = epochId;
  res["epoch"] = UIntJson (epoch);
  res["epoch_start_block"] = UIntJson (epochStartBlock);
  res["timestamp"] = UIntJson (timestamp);
  return res;
}

EpochSyncState
EpochSyncState::FromJson (const Json::Value& val)
{
  CheckObject (val, "epoch sync");

  EpochSyncState res;
  res.startBlock = GetUIntField (val, "start_block");
  res.endBlock = GetUIntField (val, "end_block");
  res.epochId = GetStringField (val, "epoch_id");
  res.epoch = GetUIntField (val, "epoch");
  res.epochStartBlock = GetUIntField (val, "epoch_start_block");
  res.timestamp = GetUIntField (val, "timestamp");

  if (res.startBlock > res.endBlock)
    throw MalformedDataError ("epoch sync range is empty");

  return res;
}

std::ostream&
operator<< (std::ostream& out, const EpochSyncState& s)
{
  out << "[" << s.startBlock << ", " << s.endBlock << "] (epoch " << s.epoch
      << ", " << s.epochId << ")";
  return out;
}

/* ************************************************************************** */

Json::Value
DelegatorSnapshot::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["delegator_id"] = delegatorId;
  res["validator_account_id"] = validator;
  res["epoch"] = UIntJson (epoch);
  res["epoch_id"] = epochId;
  res["start_block_height"] = UIntJson (startBlock);
  res["end_block_height"] = UIntJson (endBlock);
  res["initial_stake"] = FormatAmount (initialStake);
  res["auto_compounded_stake"] = FormatAmount (autoCompoundedStake);
  res["total_rewards_earned"] = FormatAmount (totalRewardsEarned);
  res["pending_rewards"] = FormatAmount (pendingRewards);
  res["tokens_withdrawn"] = FormatAmount (tokensWithdrawn);
  res["unstaked_balance"] = FormatAmount (unstakedBalance);
  res["last_update_block"] = UIntJson (lastUpdateBlock);

  Json::Value anom(Json::arrayValue);
  for (const auto& a : anomalies)
    anom.append (a);
  res["anomalies"] = anom;

  return res;
}

DelegatorSnapshot
DelegatorSnapshot::FromJson (const Json::Value& val)
{
  CheckObject (val, "delegator");

  DelegatorSnapshot res;
  res.delegatorId = GetStringField (val, "delegator_id");
  res.validator = GetStringField (val, "validator_account_id");
  res.epoch = GetUIntField (val, "epoch");
  res.epochId = GetStringField (val, "epoch_id");
  res.startBlock = GetUIntField (val, "start_block_height");
  res.endBlock = GetUIntField (val, "end_block_height");
  res.initialStake = GetAmountField (val, "initial_stake");
  res.autoCompoundedStake = GetAmountField (val, "auto_compounded_stake");
  res.totalRewardsEarned = GetAmountField (val, "total_rewards_earned");
  res.pendingRewards = GetAmountField (val, "pending_rewards");
  res.tokensWithdrawn = GetAmountField (val, "tokens_withdrawn");
  res.unstakedBalance = GetAmountField (val, "unstaked_balance");
  res.lastUpdateBlock = GetUIntField (val, "last_update_block");

  const auto& anom = val["anomalies"];
  if (!anom.isNull ())
    {
      if (!anom.isArray ())
        throw MalformedDataError ("anomalies is not an array");
      for (const auto& a : anom)
        {
          if (!a.isString ())
            throw MalformedDataError ("anomaly entry is not a string");
          res.anomalies.push_back (a.asString ());
        }
    }

  return res;
}

std::ostream&
operator<< (std::ostream& out, const DelegatorSnapshot& s)
{
  out << "Delegator " << s.delegatorId << " in epoch " << s.epoch
      << ": initial " << s.initialStake
      << ", compounded " << s.autoCompoundedStake
      << ", rewards " << s.totalRewardsEarned
      << " (pending " << s.pendingRewards << ")"
      << ", withdrawn " << s.tokensWithdrawn
      << ", unstaked " << s.unstakedBalance
      << ", last update " << s.lastUpdateBlock;
  return out;
}

/* ************************************************************************** */

Json::Value
ValidatorMetrics::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["validator_account_id"] = validator;
  res["epoch"] = UIntJson (epoch);
  res["epoch_id"] = epochId;
  res["total_staked"] = FormatAmount (totalStaked);
  res["total_delegators"] = UIntJson (totalDelegators);
  res["apy"] = apy;
  res["rewards"] = FormatAmount (rewards);
  if (uptimeKnown)
    res["uptime"] = uptime;
  else
    res["uptime"] = Json::Value ();
  res["timestamp"] = UIntJson (timestamp);
  return res;
}

ValidatorMetrics
ValidatorMetrics::FromJson (const Json::Value& val)
{
  CheckObject (val, "validator metrics");

  ValidatorMetrics res;
  res.validator = GetStringField (val, "validator_account_id");
  res.epoch = GetUIntField (val, "epoch");
  res.epochId = GetStringField (val, "epoch_id");
  res.totalStaked = GetAmountField (val, "total_staked");
  res.totalDelegators = GetUIntField (val, "total_delegators");
  res.apy = GetDoubleField (val, "apy");
  res.rewards = GetAmountField (val, "rewards");
  res.uptimeKnown = !val["uptime"].isNull ();
  if (res.uptimeKnown)
    res.uptime = GetDoubleField (val, "uptime");
  res.timestamp = GetUIntField (val, "timestamp");

  return res;
}

/* ************************************************************************** */

Json::Value
ValidatorPerformance::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["validator_id"] = validator;
  res["epoch"] = UIntJson (epoch);
  res["epoch_id"] = epochId;
  res["blocks_produced"] = UIntJson (blocksProduced);
  res["blocks_expected"] = UIntJson (blocksExpected);
  res["block_production_rate"] = blockProductionRate;
  res["chunks_produced"] = UIntJson (chunksProduced);
  res["chunks_expected"] = UIntJson (chunksExpected);
  res["chunk_production_rate"] = chunkProductionRate;
  res["message"] = message;
  return res;
}

ValidatorPerformance
ValidatorPerformance::FromJson (const Json::Value& val)
{
  CheckObject (val, "validator performance");

  ValidatorPerformance res;
  res.validator = GetStringField (val, "validator_id");
  res.epoch = GetUIntField (val, "epoch");
  res.epochId = GetStringField (val, "epoch_id");
  res.blocksProduced = GetUIntField (val, "blocks_produced");
  res.blocksExpected = GetUIntField (val, "blocks_expected");
  res.blockProductionRate = GetDoubleField (val, "block_production_rate");
  res.chunksProduced = GetUIntField (val, "chunks_produced");
  res.chunksExpected = GetUIntField (val, "chunks_expected");
  res.chunkProductionRate = GetDoubleField (val, "chunk_production_rate");
  res.message = GetStringField (val, "message");

  return res;
}

/* ************************************************************************** */

Json::Value
EpochData::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["epoch"] = UIntJson (epoch);
  res["epoch_id"] = epochId;
  res["validator_account_id"] = validator;
  res["start_block_height"] = UIntJson (startBlock);
  res["end_block_height"] = UIntJson (endBlock);
  res["timestamp"] = UIntJson (timestamp);

  Json::Value dels(Json::objectValue);
  for (const auto& d : delegators)
    {
      CHECK (!dels.isMember (d.delegatorId))
          << "Duplicate delegator in epoch rollup: " << d.delegatorId;
      dels[d.delegatorId] = d.ToJson ();
    }
  res["delegators"] = dels;

  Json::Value txs(Json::arrayValue);
  for (const auto& tx : transactions)
    txs.append (tx.ToJson ());
  res["transactions"] = txs;

  return res;
}

} // namespace stakex
