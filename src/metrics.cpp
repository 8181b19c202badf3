// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "metrics.hpp"

#include "errors.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cmath>
#include <sstream>

namespace stakex
{

DEFINE_double (epochs_per_year, 730.0,
               "number of epochs per year for computing the APY;"
               " zero to derive it from observed block times");
DEFINE_bool (compound_apy, false,
             "if true, compute the APY with per-epoch compounding");

namespace
{

/** Milliseconds in a (non-leap) year.  */
constexpr double MS_PER_YEAR = 365.0 * 24 * 60 * 60 * 1'000;

/**
 * Rounds a value to two decimals.
 */
double
RoundCents (const double val)
{
  return std::round (val * 100.0) / 100.0;
}

} // anonymous namespace

ApyConfig
ApyConfig::FromFlags (const uint64_t epochBlocks)
{
  CHECK_GE (FLAGS_epochs_per_year, 0.0);
  CHECK_GT (epochBlocks, 0);

  ApyConfig res;
  res.epochsPerYear = FLAGS_epochs_per_year;
  res.compounding = FLAGS_compound_apy;
  res.epochBlocks = epochBlocks;

  return res;
}

double
ComputeApy (const Amount& rewards, const Amount& totalStaked,
            const double epochsPerYear, const bool compounding)
{
  if (totalStaked <= 0 || rewards <= 0)
    return 0.0;

  const double rate = AmountToDouble (rewards) / AmountToDouble (totalStaked);
  if (compounding)
    return RoundCents ((std::pow (1.0 + rate, epochsPerYear) - 1.0) * 100.0);

  return RoundCents (rate * epochsPerYear * 100.0);
}

bool
ComputeProductionRate (const uint64_t produced, const uint64_t expected,
                       double& rate)
{
  if (expected == 0)
    {
      rate = 0.0;
      return false;
    }

  rate = static_cast<double> (produced) / expected;
  if (rate > 1.0)
    rate = 1.0;

  return true;
}

/* ************************************************************************** */

ValidatorMetricsCalculator::ValidatorMetricsCalculator (ChainClient& c,
                                                        const std::string& v,
                                                        const ApyConfig& cfg)
  : chain(c), validator(v), apyConfig(cfg)
{}

double
ValidatorMetricsCalculator::GetEpochsPerYear (const FinishedEpoch& ep) const
{
  if (apyConfig.epochsPerYear > 0.0)
    return apyConfig.epochsPerYear;

  if (ep.endBlock > ep.startBlock && ep.endTimestamp > ep.startTimestamp)
    {
      const double msPerBlock
          = static_cast<double> (ep.endTimestamp - ep.startTimestamp)
              / (ep.endBlock - ep.startBlock);
      const double epochMs = msPerBlock * apyConfig.epochBlocks;
      VLOG (1)
          << "Derived " << msPerBlock << " ms per block for epoch "
          << ep.epoch;
      return MS_PER_YEAR / epochMs;
    }

  const double fallback = ApyConfig ().epochsPerYear;
  LOG (WARNING)
      << "Cannot derive epochs per year from epoch " << ep.epoch
      << ", using " << fallback;
  return fallback;
}

void
ValidatorMetricsCalculator::Compute (
    const FinishedEpoch& ep, const std::vector<DelegatorSnapshot>& snapshots,
    ValidatorMetrics& metrics, ValidatorPerformance& perf)
{
  metrics = ValidatorMetrics ();
  metrics.validator = validator;
  metrics.epoch = ep.epoch;
  metrics.epochId = ep.epochId;
  metrics.timestamp = ep.endTimestamp;

  for (const auto& s : snapshots)
    {
      const Amount stake = s.GetStake ();
      metrics.totalStaked += stake;
      if (stake > 0)
        ++metrics.totalDelegators;
      metrics.rewards += s.pendingRewards;
    }

  metrics.apy = ComputeApy (metrics.rewards, metrics.totalStaked,
                            GetEpochsPerYear (ep), apyConfig.compounding);

  LOG (INFO)
      << "Epoch " << ep.epoch << ": staked "
      << FormatAmount (metrics.totalStaked) << " by "
      << metrics.totalDelegators << " delegators, rewards "
      << FormatAmount (metrics.rewards) << ", APY " << metrics.apy << "%";

  perf = ValidatorPerformance ();
  perf.validator = validator;
  perf.epoch = ep.epoch;
  perf.epochId = ep.epochId;

  ValidatorSet set;
  try
    {
      set = chain.GetValidators (ep.epochId);
    }
  catch (const RpcResponseError& exc)
    {
      LOG (WARNING)
          << "Could not get validators of epoch " << ep.epochId << ": "
          << exc.what ();
      perf.message = "validator data for the epoch is not available";
      return;
    }

  const ValidatorInfo* info = set.Find (validator);
  if (info == nullptr)
    {
      LOG (WARNING)
          << validator << " is not in the validator set of epoch "
          << ep.epochId;
      perf.message = "validator is not in the validator set of the epoch";
      return;
    }

  perf.blocksProduced = info->blocksProduced;
  perf.blocksExpected = info->blocksExpected;
  perf.chunksProduced = info->chunksProduced;
  perf.chunksExpected = info->chunksExpected;

  const bool blocksKnown
      = ComputeProductionRate (perf.blocksProduced, perf.blocksExpected,
                               perf.blockProductionRate);
  const bool chunksKnown
      = ComputeProductionRate (perf.chunksProduced, perf.chunksExpected,
                               perf.chunkProductionRate);

  std::ostringstream msg;
  if (!blocksKnown)
    msg << "block production rate not yet determined";
  if (!chunksKnown)
    {
      if (!blocksKnown)
        msg << "; ";
      msg << "chunk production rate not yet determined";
    }
  perf.message = msg.str ();

  if (blocksKnown && chunksKnown)
    metrics.uptime
        = (perf.blockProductionRate + perf.chunkProductionRate) / 2.0;
  else if (blocksKnown)
    metrics.uptime = perf.blockProductionRate;
  else if (chunksKnown)
    metrics.uptime = perf.chunkProductionRate;
  metrics.uptimeKnown = blocksKnown || chunksKnown;
}

} // namespace stakex
