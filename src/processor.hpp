// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_PROCESSOR_HPP
#define STAKEX_PROCESSOR_HPP

#include "chainclient.hpp"
#include "fetchcache.hpp"
#include "fetcher.hpp"
#include "indexstore.hpp"
#include "metrics.hpp"
#include "planner.hpp"
#include "records.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace stakex
{

/**
 * Processes planned block ranges:  The blocks are fetched, their staking
 * transactions applied to the delegator ledger, metrics computed for
 * every finished epoch, and everything is persisted together with a new
 * checkpoint in a single atomic batch.
 */
class RangeProcessor
{

public:

  /** The outcome of processing a range.  */
  enum class Result
  {
    /** The range has been processed and checkpointed.  */
    SYNCED,
    /** Fetching or processing failed, nothing was written.  */
    FAILED,
    /** Processing was cancelled, nothing was written.  */
    CANCELLED,
  };

  /**
   * Data about what has been written for a range, which is used
   * for notifications.
   */
  struct Output
  {

    /** The checkpoint written (if any).  */
    bool hasCheckpoint = false;
    EpochSyncState checkpoint;

    /** Metrics of all epochs finished in the range.  */
    std::vector<ValidatorMetrics> metrics;

    /** Number of staking transactions in the range.  */
    size_t numTransactions = 0;

  };

  /** Function used for sleeping between store retries.  */
  using Sleeper = std::function<void (std::chrono::milliseconds)>;

private:

  /** Everything that is written at the end of a range.  */
  struct PendingWrites;

  /** Ledger position carried from block to block.  */
  struct Position;

  ChainClient& chain;
  IndexStore& store;
  BatchFetcher& fetcher;

  /** The fetch cache used by the fetcher, if any.  */
  FetchCache* cache = nullptr;

  /** The APY settings.  */
  const ApyConfig apyConfig;

  /** Calculator for finished epochs.  */
  ValidatorMetricsCalculator calculator;

  /** Function for sleeping.  */
  Sleeper sleeper;

  /**
   * Processes a range that lies entirely below the latest checkpoint (a gap
   * or a replay).  Only transactions are stored in that case, and
   * a checkpoint if the range does not overlap any.
   */
  Result Backfill (const BlockRange& range, Output& out);

  /**
   * Closes the current epoch at the given position and opens the one
   * starting with the given block.
   */
  void HandleEpochBoundary (Position& pos, const BlockHeader& next,
                            PendingWrites& writes);

  /**
   * Writes everything in one batch, retrying on PersistenceError.  Returns
   * false if it kept failing.
   */
  bool Persist (const PendingWrites& writes);

public:

  explicit RangeProcessor (ChainClient& c, IndexStore& s, BatchFetcher& f,
                           const ApyConfig& cfg);

  RangeProcessor () = delete;
  RangeProcessor (const RangeProcessor&) = delete;
  void operator= (const RangeProcessor&) = delete;

  /**
   * Sets the fetch cache that is pruned after each synced range.
   */
  void
  SetCache (FetchCache* c)
  {
    cache = c;
  }

  /**
   * Overrides the function used for sleeping, which is useful for tests.
   */
  void SetSleeper (const Sleeper& s);

  /**
   * Processes the given range.  Throws CheckpointError if the range
   * conflicts with the existing checkpoints.
   */
  Result Process (const BlockRange& range, Output& out);

};

} // namespace stakex

#endif // STAKEX_PROCESSOR_HPP
