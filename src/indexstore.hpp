// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_INDEXSTORE_HPP
#define STAKEX_INDEXSTORE_HPP

#include "chaindata.hpp"
#include "docstore.hpp"
#include "records.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stakex
{

/**
 * Typed access to the collections of indexed data for one validator
 * on top of a generic DocumentStore.  Each record type is mapped to its
 * collection with the right unique key and ordering.
 */
class IndexStore
{

public:

  /* Names of the collections we use.  */
  static constexpr const char* EPOCH_SYNC = "epoch_sync";
  static constexpr const char* TRANSACTIONS = "transactions";
  static constexpr const char* DELEGATORS = "delegators";
  static constexpr const char* VALIDATOR_METRICS = "validator_metrics";
  static constexpr const char* VALIDATOR_PERFORMANCE = "validator_performance";
  static constexpr const char* EPOCH_DATA = "epoch_data";

private:

  /** The underlying document store.  */
  DocumentStore& store;

  /** The validator account whose data this is.  */
  const std::string validator;

  /** Number of delegator snapshots written in one go.  */
  const unsigned delegatorBatchSize;

public:

  explicit IndexStore (DocumentStore& s, const std::string& v,
                       unsigned delegatorBatch);

  IndexStore () = delete;
  IndexStore (const IndexStore&) = delete;
  void operator= (const IndexStore&) = delete;

  DocumentStore&
  GetDocumentStore ()
  {
    return store;
  }

  const std::string&
  GetValidator () const
  {
    return validator;
  }

  /**
   * Returns all checkpoints, ordered by start block.  Throws
   * MalformedDataError if a stored checkpoint is invalid.
   */
  std::vector<EpochSyncState> GetCheckpoints () const;

  /**
   * Returns the checkpoint with the highest start block, if any.
   */
  bool GetLatestCheckpoint (EpochSyncState& out) const;

  /**
   * Adds a new checkpoint.  Checkpoints are append-only; returns false
   * if one with the same start block exists already.
   */
  bool AddCheckpoint (const EpochSyncState& s);

  /**
   * Stores a transaction unless one with the same hash exists already.
   * Returns true if it was new.
   */
  bool AddTransaction (const StakingTransaction& tx);

  /**
   * Returns all transactions in the given (inclusive) height range, ordered
   * by height and hash.
   */
  std::vector<StakingTransaction> GetTransactions (uint64_t fromHeight,
                                                   uint64_t toHeight) const;

  /**
   * Inserts or replaces the given delegator snapshots.
   */
  void PutDelegators (const std::vector<DelegatorSnapshot>& snapshots);

  /**
   * Returns all delegator snapshots for the given epoch.
   */
  std::vector<DelegatorSnapshot> GetDelegators (uint64_t epoch) const;

  void PutMetrics (const ValidatorMetrics& m);
  bool GetMetrics (uint64_t epoch, ValidatorMetrics& m) const;

  void PutPerformance (const ValidatorPerformance& p);
  bool GetPerformance (uint64_t epoch, ValidatorPerformance& p) const;

  void PutEpochData (const EpochData& d);

};

} // namespace stakex

#endif // STAKEX_INDEXSTORE_HPP
