// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_LEDGER_HPP
#define STAKEX_LEDGER_HPP

#include "chaindata.hpp"
#include "records.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stakex
{

/**
 * A consistency problem found while applying a transaction (or reward
 * update) to the ledger.  These are not fatal, they are reported and
 * recorded on the affected snapshot.
 */
struct ConsistencyIssue
{

  std::string delegator;

  uint64_t blockHeight = 0;

  /** The transaction that caused it, if any.  */
  std::string txHash;

  std::string message;

};

/**
 * The per-delegator stake and reward state of the validator, for the
 * epoch currently being processed.  Transactions must be applied in
 * ascending (height, hash) order; transactions at or below the watermark
 * are ignored, so that replaying already processed blocks does
 * not change anything.
 *
 * This is not thread-safe; it is only ever used by the single thread
 * that processes fetched blocks.
 */
class DelegatorLedger
{

private:

  /** The validator account.  */
  const std::string validator;

  /** Set once an epoch has been loaded or opened.  */
  bool hasEpoch = false;

  /** Sequence number of the current epoch.  */
  uint64_t epoch = 0;

  /** ID of the current epoch.  */
  std::string epochId;

  /** First block of the current epoch.  */
  uint64_t epochStart = 0;

  /** Blocks at or below this height have been processed already.  */
  uint64_t watermark = 0;

  /** Height and hash of the last transaction applied.  */
  uint64_t lastHeight = 0;
  std::string lastHash;

  /** The snapshots for the current epoch by delegator.  */
  std::map<std::string, DelegatorSnapshot> snapshots;

  /** All consistency issues found so far.  */
  std::vector<ConsistencyIssue> issues;

  /**
   * Returns the snapshot for a delegator, creating an empty one if it
   * does not exist yet.  Sets created accordingly.
   */
  DelegatorSnapshot& GetOrCreate (const std::string& delegator,
                                  bool& created);

  /**
   * Records a consistency issue for the given snapshot.
   */
  void Flag (DelegatorSnapshot& s, uint64_t height, const std::string& txHash,
             const std::string& message);

public:

  explicit DelegatorLedger (const std::string& v);

  DelegatorLedger () = delete;
  DelegatorLedger (const DelegatorLedger&) = delete;
  void operator= (const DelegatorLedger&) = delete;

  /**
   * Sets the state from persisted snapshots of the given epoch.  Blocks
   * up to (and including) the watermark are treated as processed.
   */
  void Load (uint64_t ep, const std::string& id, uint64_t start,
             const std::vector<DelegatorSnapshot>& persisted,
             uint64_t mark);

  /**
   * Starts a new epoch.  If there is a previous epoch, its pending
   * rewards are folded into the totals (and compounded into the stake),
   * and all snapshots are carried over.
   */
  void OpenEpoch (uint64_t ep, const std::string& id, uint64_t start);

  /**
   * Creates snapshots for delegators that are not known yet from the
   * balances reported by the pool contract.
   */
  void Seed (const std::vector<PoolAccount>& accounts, uint64_t height);

  /**
   * Applies a staking transaction.  For the "*_all" methods, the amount
   * of the transaction is filled in from the delegator's balance.  Returns
   * false if the transaction was skipped because it is at or below
   * the watermark.
   */
  bool Apply (StakingTransaction& tx);

  /**
   * Computes the rewards of the current epoch by comparing the balances
   * reported by the pool contract at its end with our own state.  The
   * boundary is the height of the first block of the next epoch; if it is
   * at or below the watermark, nothing is done.
   */
  void AccrueRewards (const std::vector<PoolAccount>& accounts,
                      uint64_t boundary);

  /**
   * Marks the current epoch as ending at the given block and returns
   * its final snapshots.
   */
  std::vector<DelegatorSnapshot> CloseEpoch (uint64_t endBlock);

  /**
   * Marks all blocks up to the given height as processed, updating the
   * end block of all snapshots.
   */
  void AdvanceTo (uint64_t height);

  /**
   * Returns all snapshots of the current epoch, ordered by delegator.
   */
  std::vector<DelegatorSnapshot> GetSnapshots () const;

  /**
   * Returns the snapshot of one delegator.  Returns false if it does
   * not exist.
   */
  bool GetSnapshot (const std::string& delegator,
                    DelegatorSnapshot& out) const;

  const std::vector<ConsistencyIssue>&
  GetIssues () const
  {
    return issues;
  }

  bool
  HasEpoch () const
  {
    return hasEpoch;
  }

  uint64_t
  GetEpoch () const
  {
    return epoch;
  }

  const std::string&
  GetEpochId () const
  {
    return epochId;
  }

  uint64_t
  GetEpochStart () const
  {
    return epochStart;
  }

  uint64_t
  GetWatermark () const
  {
    return watermark;
  }

};

} // namespace stakex

#endif // STAKEX_LEDGER_HPP
