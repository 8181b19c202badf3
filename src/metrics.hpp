// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_METRICS_HPP
#define STAKEX_METRICS_HPP

#include "amount.hpp"
#include "chainclient.hpp"
#include "records.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stakex
{

/**
 * Settings for computing the APY.
 */
struct ApyConfig
{

  /**
   * Number of epochs per year.  If zero, it is derived from the observed
   * block times of the epoch.
   */
  double epochsPerYear = 730.0;

  /** If true, the APY assumes per-epoch compounding.  */
  bool compounding = false;

  /** Number of blocks in an epoch, for deriving epochs per year.  */
  uint64_t epochBlocks = 43'200;

  /**
   * Constructs the config from the command-line flags and the given
   * number of blocks per epoch.
   */
  static ApyConfig FromFlags (uint64_t epochBlocks);

};

/**
 * Data about an epoch that has been fully processed.
 */
struct FinishedEpoch
{

  uint64_t epoch = 0;
  std::string epochId;

  /** First and last block heights observed in the epoch.  */
  uint64_t startBlock = 0;
  uint64_t endBlock = 0;

  /** Timestamps (in milliseconds) of the first and last blocks.  */
  uint64_t startTimestamp = 0;
  uint64_t endTimestamp = 0;

};

/**
 * Computes the APY in percent (rounded to two decimals) from the rewards
 * of an epoch relative to the stake.
 */
double ComputeApy (const Amount& rewards, const Amount& totalStaked,
                   double epochsPerYear, bool compounding);

/**
 * Computes a production rate clamped to [0, 1].  Returns false (and sets
 * the rate to zero) if expected is zero, i.e. the rate is not yet
 * determined.
 */
bool ComputeProductionRate (uint64_t produced, uint64_t expected,
                            double& rate);

/**
 * Derives validator metrics and performance records for finished epochs.
 */
class ValidatorMetricsCalculator
{

private:

  /** The chain to query validator data from.  */
  ChainClient& chain;

  /** The validator we compute metrics for.  */
  const std::string validator;

  /** APY settings.  */
  const ApyConfig apyConfig;

  /**
   * Returns the number of epochs per year to use for the given epoch.
   */
  double GetEpochsPerYear (const FinishedEpoch& ep) const;

public:

  explicit ValidatorMetricsCalculator (ChainClient& c, const std::string& v,
                                       const ApyConfig& cfg);

  ValidatorMetricsCalculator () = delete;
  ValidatorMetricsCalculator (const ValidatorMetricsCalculator&) = delete;
  void operator= (const ValidatorMetricsCalculator&) = delete;

  /**
   * Computes the metrics and performance of a finished epoch, given the
   * final delegator snapshots of the epoch.  Throws TerminalRpcError if
   * the chain cannot be reached.
   */
  void Compute (const FinishedEpoch& ep,
                const std::vector<DelegatorSnapshot>& snapshots,
                ValidatorMetrics& metrics, ValidatorPerformance& perf);

};

} // namespace stakex

#endif // STAKEX_METRICS_HPP
