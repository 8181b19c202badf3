// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <sstream>

namespace stakex
{

DelegatorLedger::DelegatorLedger (const std::string& v)
  : validator(v)
{}

DelegatorSnapshot&
DelegatorLedger::GetOrCreate (const std::string& delegator, bool& created)
{
  auto mit = snapshots.find (delegator);
  if (mit != snapshots.end ())
    {
      created = false;
      return mit->second;
    }

  created = true;
  DelegatorSnapshot s;
  s.delegatorId = delegator;
  s.validator = validator;
  s.epoch = epoch;
  s.epochId = epochId;
  s.startBlock = epochStart;
  s.endBlock = epochStart;

  return snapshots.emplace (delegator, std::move (s)).first->second;
}

void
DelegatorLedger::Flag (DelegatorSnapshot& s, const uint64_t height,
                       const std::string& txHash, const std::string& message)
{
  LOG (WARNING)
      << "Consistency error for delegator " << s.delegatorId
      << " at height " << height
      << (txHash.empty () ? "" : " in transaction " + txHash)
      << ": " << message;

  std::ostringstream anomaly;
  anomaly << message << " (height " << height;
  if (!txHash.empty ())
    anomaly << ", tx " << txHash;
  anomaly << ")";
  s.anomalies.push_back (anomaly.str ());

  ConsistencyIssue issue;
  issue.delegator = s.delegatorId;
  issue.blockHeight = height;
  issue.txHash = txHash;
  issue.message = message;
  issues.push_back (std::move (issue));
}

void
DelegatorLedger::Load (const uint64_t ep, const std::string& id,
                       const uint64_t start,
                       const std::vector<DelegatorSnapshot>& persisted,
                       const uint64_t mark)
{
  VLOG (1)
      << "Loading " << persisted.size () << " snapshots of epoch " << ep
      << " (" << id << ") with watermark " << mark;

  hasEpoch = true;
  epoch = ep;
  epochId = id;
  epochStart = start;
  watermark = mark;
  lastHeight = 0;
  lastHash.clear ();

  snapshots.clear ();
  for (const auto& s : persisted)
    {
      CHECK_EQ (s.validator, validator);
      CHECK_EQ (s.epoch, ep) << "Snapshot of wrong epoch for " << s.delegatorId;
      watermark = std::max (watermark, s.lastUpdateBlock);
      snapshots.emplace (s.delegatorId, s);
    }
}

void
DelegatorLedger::OpenEpoch (const uint64_t ep, const std::string& id,
                            const uint64_t start)
{
  if (hasEpoch)
    CHECK_GT (ep, epoch) << "Epochs must be opened in order";

  VLOG (1)
      << "Opening epoch " << ep << " (" << id << ") at height " << start;

  hasEpoch = true;
  epoch = ep;
  epochId = id;
  epochStart = start;

  for (auto& entry : snapshots)
    {
      auto& s = entry.second;

      s.totalRewardsEarned += s.pendingRewards;
      s.autoCompoundedStake += s.pendingRewards;
      s.pendingRewards = 0;

      s.epoch = ep;
      s.epochId = id;
      s.startBlock = start;
      s.endBlock = start;
      s.anomalies.clear ();
    }
}

void
DelegatorLedger::Seed (const std::vector<PoolAccount>& accounts,
                       const uint64_t height)
{
  CHECK (hasEpoch) << "No epoch opened";

  for (const auto& a : accounts)
    {
      if (a.staked == 0 && a.unstaked == 0)
        continue;

      bool created;
      auto& s = GetOrCreate (a.accountId, created);
      if (!created)
        continue;

      s.initialStake = a.staked;
      s.unstakedBalance = a.unstaked;
      s.lastUpdateBlock = height;
      s.endBlock = std::max (s.endBlock, height);
    }

  LOG (INFO)
      << "Seeded ledger with " << snapshots.size ()
      << " delegators at height " << height;
}

bool
DelegatorLedger::Apply (StakingTransaction& tx)
{
  CHECK (hasEpoch) << "No epoch opened";

  if (tx.blockHeight <= watermark)
    {
      VLOG (1)
          << "Skipping transaction " << tx.hash << " at height "
          << tx.blockHeight << ", watermark is " << watermark;
      return false;
    }

  CHECK (lastHash.empty () || lastHeight < tx.blockHeight
            || (lastHeight == tx.blockHeight && lastHash < tx.hash))
      << "Transactions applied out of order: " << tx.hash
      << " at height " << tx.blockHeight << " after " << lastHash
      << " at height " << lastHeight;
  lastHeight = tx.blockHeight;
  lastHash = tx.hash;

  bool created;
  auto& s = GetOrCreate (tx.delegator, created);

  const auto& m = tx.method;
  if (m == "deposit")
    s.unstakedBalance += tx.amount;
  else if (m == "stake" || m == "stake_all" || m == "deposit_and_stake")
    {
      if (m == "stake_all")
        tx.amount = s.unstakedBalance;

      /* Plain stake calls move tokens from the deposited (unstaked)
         balance into the stake.  */
      if (m != "deposit_and_stake")
        s.unstakedBalance -= std::min (s.unstakedBalance, tx.amount);

      /* The first stake of a delegator without any stake is their
         initial stake, also if they deposited before.  */
      if (s.GetStake () == 0)
        s.initialStake = tx.amount;
      else
        s.autoCompoundedStake += tx.amount;
    }
  else if (m == "unstake" || m == "unstake_all")
    {
      if (m == "unstake_all")
        tx.amount = s.GetStake ();

      /* Unstaking uses up the compounded part of the stake first.  */
      const Amount fromCompounded
          = std::min (s.autoCompoundedStake, tx.amount);
      s.autoCompoundedStake -= fromCompounded;
      s.initialStake -= tx.amount - fromCompounded;
      s.unstakedBalance += tx.amount;

      if (s.initialStake < 0)
        {
          std::ostringstream msg;
          msg << "unstaked " << FormatAmount (tx.amount)
              << " exceeds stake by " << FormatAmount (-s.initialStake);
          s.initialStake = 0;
          Flag (s, tx.blockHeight, tx.hash, msg.str ());
        }
    }
  else if (m == "withdraw" || m == "withdraw_all")
    {
      if (m == "withdraw_all")
        tx.amount = s.unstakedBalance;

      s.tokensWithdrawn += tx.amount;
      if (tx.amount > s.unstakedBalance)
        {
          std::ostringstream msg;
          msg << "withdrawn " << FormatAmount (tx.amount)
              << " exceeds unstaked balance "
              << FormatAmount (s.unstakedBalance)
              << " (total withdrawn " << FormatAmount (s.tokensWithdrawn)
              << ")";
          s.unstakedBalance = 0;
          Flag (s, tx.blockHeight, tx.hash, msg.str ());
        }
      else
        s.unstakedBalance -= tx.amount;
    }
  else
    LOG (FATAL) << "Unexpected staking method: " << m;

  s.lastUpdateBlock = tx.blockHeight;
  s.endBlock = std::max (s.endBlock, tx.blockHeight);

  VLOG (2)
      << "Applied " << m << " of " << FormatAmount (tx.amount)
      << " by " << tx.delegator << ", stake now "
      << FormatAmount (s.GetStake ());

  return true;
}

void
DelegatorLedger::AccrueRewards (const std::vector<PoolAccount>& accounts,
                                const uint64_t boundary)
{
  CHECK (hasEpoch) << "No epoch opened";

  if (boundary <= watermark)
    {
      VLOG (1) << "Skipping reward update at boundary " << boundary;
      return;
    }

  Amount total = 0;
  for (const auto& a : accounts)
    {
      bool created;
      auto& s = GetOrCreate (a.accountId, created);
      if (created)
        {
          if (a.staked == 0 && a.unstaked == 0)
            {
              snapshots.erase (a.accountId);
              continue;
            }

          LOG (WARNING)
              << "Delegator " << a.accountId
              << " reported by the pool is unknown to the ledger";
          s.initialStake = a.staked;
          s.unstakedBalance = a.unstaked;
          continue;
        }

      const Amount reward = a.staked - s.GetStake ();
      if (reward < 0)
        {
          LOG (WARNING)
              << "Reported stake of " << a.accountId << " is "
              << FormatAmount (-reward) << " below the ledger's,"
              << " not accruing rewards";
          continue;
        }

      s.pendingRewards = reward;
      total += reward;
    }

  LOG (INFO)
      << "Accrued " << FormatAmount (total) << " rewards in epoch " << epoch;
}

std::vector<DelegatorSnapshot>
DelegatorLedger::CloseEpoch (const uint64_t endBlock)
{
  CHECK (hasEpoch) << "No epoch opened";

  AdvanceTo (endBlock);
  for (auto& entry : snapshots)
    entry.second.lastUpdateBlock
        = std::max (entry.second.lastUpdateBlock, endBlock);

  VLOG (1) << "Closing epoch " << epoch << " at height " << endBlock;
  return GetSnapshots ();
}

void
DelegatorLedger::AdvanceTo (const uint64_t height)
{
  for (auto& entry : snapshots)
    entry.second.endBlock = std::max (entry.second.endBlock, height);
}

std::vector<DelegatorSnapshot>
DelegatorLedger::GetSnapshots () const
{
  std::vector<DelegatorSnapshot> res;
  res.reserve (snapshots.size ());
  for (const auto& entry : snapshots)
    res.push_back (entry.second);

  return res;
}

bool
DelegatorLedger::GetSnapshot (const std::string& delegator,
                              DelegatorSnapshot& out) const
{
  const auto mit = snapshots.find (delegator);
  if (mit == snapshots.end ())
    return false;

  out = mit->second;
  return true;
}

} // namespace stakex
