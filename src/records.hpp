// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_RECORDS_HPP
#define STAKEX_RECORDS_HPP

#include "amount.hpp"
#include "chaindata.hpp"

#include <json/json.h>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace stakex
{

/**
 * A checkpoint of a fully processed, contiguous block range.  This is
 * stored in the "epoch_sync" collection.
 */
struct EpochSyncState
{

  /** First block height of the range (inclusive).  */
  uint64_t startBlock = 0;

  /** Last block height of the range (inclusive).  */
  uint64_t endBlock = 0;

  /** Epoch ID of the last block in the range.  */
  std::string epochId;

  /** Sequence number of the epoch of the last block in the range.  */
  uint64_t epoch = 0;

  /** First observed block height of that epoch.  */
  uint64_t epochStartBlock = 0;

  /** Timestamp of the last block in milliseconds.  */
  uint64_t timestamp = 0;

  Json::Value ToJson () const;
  static EpochSyncState FromJson (const Json::Value& val);

  friend bool
  operator== (const EpochSyncState& a, const EpochSyncState& b)
  {
    return a.startBlock == b.startBlock && a.endBlock == b.endBlock
            && a.epochId == b.epochId && a.epoch == b.epoch
            && a.epochStartBlock == b.epochStartBlock
            && a.timestamp == b.timestamp;
  }

  friend bool
  operator!= (const EpochSyncState& a, const EpochSyncState& b)
  {
    return !(a == b);
  }

};

std::ostream& operator<< (std::ostream& out, const EpochSyncState& s);

/**
 * The stake and reward state of one delegator with the validator
 * for one epoch.  This is stored in the "delegators" collection.
 */
struct DelegatorSnapshot
{

  std::string delegatorId;
  std::string validator;

  /** Sequence number of the epoch.  */
  uint64_t epoch = 0;
  std::string epochId;

  /** First block height of the epoch.  */
  uint64_t startBlock = 0;
  /** Last block height of the epoch processed so far.  */
  uint64_t endBlock = 0;

  /** The stake when the delegator was first seen.  */
  Amount initialStake;

  /** Stake added (or removed) since then, including compounded rewards.  */
  Amount autoCompoundedStake;

  /** All rewards received up to the start of this epoch.  */
  Amount totalRewardsEarned;

  /** Rewards earned in this epoch, folded in when it ends.  */
  Amount pendingRewards;

  /** Total tokens withdrawn from the pool.  */
  Amount tokensWithdrawn;

  /** Tokens unstaked but not yet withdrawn.  */
  Amount unstakedBalance;

  /** Height of the last transaction or boundary applied.  */
  uint64_t lastUpdateBlock = 0;

  /** Consistency problems seen for this delegator in this epoch.  */
  std::vector<std::string> anomalies;

  /**
   * Returns the delegator's total stake.
   */
  Amount
  GetStake () const
  {
    return initialStake + autoCompoundedStake;
  }

  Json::Value ToJson () const;
  static DelegatorSnapshot FromJson (const Json::Value& val);

  friend bool
  operator== (const DelegatorSnapshot& a, const DelegatorSnapshot& b)
  {
    return a.delegatorId == b.delegatorId && a.validator == b.validator
            && a.epoch == b.epoch && a.epochId == b.epochId
            && a.startBlock == b.startBlock && a.endBlock == b.endBlock
            && a.initialStake == b.initialStake
            && a.autoCompoundedStake == b.autoCompoundedStake
            && a.totalRewardsEarned == b.totalRewardsEarned
            && a.pendingRewards == b.pendingRewards
            && a.tokensWithdrawn == b.tokensWithdrawn
            && a.unstakedBalance == b.unstakedBalance
            && a.lastUpdateBlock == b.lastUpdateBlock
            && a.anomalies == b.anomalies;
  }

  friend bool
  operator!= (const DelegatorSnapshot& a, const DelegatorSnapshot& b)
  {
    return !(a == b);
  }

};

std::ostream& operator<< (std::ostream& out, const DelegatorSnapshot& s);

/**
 * Aggregate metrics of the validator for one epoch.
 */
struct ValidatorMetrics
{

  std::string validator;

  uint64_t epoch = 0;
  std::string epochId;

  Amount totalStaked;
  uint64_t totalDelegators = 0;

  /** The APY in percent, rounded to two decimals.  */
  double apy = 0.0;

  /** Rewards earned by all delegators in the epoch.  */
  Amount rewards;

  /** The uptime as fraction in [0, 1], if it could be determined.  */
  bool uptimeKnown = false;
  double uptime = 0.0;

  /** Timestamp of the epoch's last block in milliseconds.  */
  uint64_t timestamp = 0;

  Json::Value ToJson () const;
  static ValidatorMetrics FromJson (const Json::Value& val);

};

/**
 * Block and chunk production of the validator in one epoch.
 */
struct ValidatorPerformance
{

  std::string validator;

  uint64_t epoch = 0;
  std::string epochId;

  uint64_t blocksProduced = 0;
  uint64_t blocksExpected = 0;
  double blockProductionRate = 0.0;

  uint64_t chunksProduced = 0;
  uint64_t chunksExpected = 0;
  double chunkProductionRate = 0.0;

  /** Human-readable notes, e.g. if a rate could not be determined.  */
  std::string message;

  Json::Value ToJson () const;
  static ValidatorPerformance FromJson (const Json::Value& val);

};

/**
 * Rollup of everything that happened with the validator in one epoch.
 */
struct EpochData
{

  uint64_t epoch = 0;
  std::string epochId;
  std::string validator;

  uint64_t startBlock = 0;
  uint64_t endBlock = 0;
  uint64_t timestamp = 0;

  /** Final delegator snapshots of the epoch.  */
  std::vector<DelegatorSnapshot> delegators;

  /** The staking transactions of the epoch.  */
  std::vector<StakingTransaction> transactions;

  Json::Value ToJson () const;

};

} // namespace stakex

#endif // STAKEX_RECORDS_HPP
