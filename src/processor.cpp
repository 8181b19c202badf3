// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "processor.hpp"

#include "errors.hpp"
#include "ledger.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <thread>

namespace stakex
{

DEFINE_int32 (store_retries, 3,
              "number of times writing a processed range is retried");
DEFINE_int32 (store_retry_delay_ms, 500,
              "delay before the first retry of writing a processed range");

/* ************************************************************************** */

struct RangeProcessor::PendingWrites
{

  std::vector<StakingTransaction> transactions;
  std::vector<DelegatorSnapshot> snapshots;
  std::vector<ValidatorMetrics> metrics;
  std::vector<ValidatorPerformance> performance;
  std::vector<EpochData> epochData;

  bool hasCheckpoint = false;
  EpochSyncState checkpoint;

};

struct RangeProcessor::Position
{

  /** The ledger with the delegator state.  */
  DelegatorLedger ledger;

  /** Set once there is a previous block (and thus an epoch).  */
  bool started = false;

  /** Data about the last block processed.  */
  uint64_t prevHeight = 0;
  std::string prevEpochId;
  uint64_t prevTimestamp = 0;

  /** Timestamp of the current epoch's first block, zero if not known.  */
  uint64_t epochStartTimestamp = 0;

  explicit Position (const std::string& validator)
    : ledger(validator)
  {}

};

/* ************************************************************************** */

RangeProcessor::RangeProcessor (ChainClient& c, IndexStore& s,
                                BatchFetcher& f, const ApyConfig& cfg)
  : chain(c), store(s), fetcher(f), apyConfig(cfg),
    calculator(c, s.GetValidator (), cfg)
{
  sleeper = [] (const std::chrono::milliseconds d)
    {
      std::this_thread::sleep_for (d);
    };
}

void
RangeProcessor::SetSleeper (const Sleeper& s)
{
  sleeper = s;
}

namespace
{

/**
 * Runs a fetch and converts errors thrown by the consumer into
 * a failed status.
 */
BatchFetcher::Status
RunFetch (BatchFetcher& fetcher, const BlockRange& range,
          const BatchFetcher::Consumer& consumer)
{
  try
    {
      return fetcher.Fetch (range, consumer);
    }
  catch (const RpcError& exc)
    {
      LOG (ERROR) << "RPC error while processing " << range << ": "
                  << exc.what ();
    }
  catch (const MalformedDataError& exc)
    {
      LOG (ERROR) << "Malformed data while processing " << range << ": "
                  << exc.what ();
    }

  return BatchFetcher::Status::FAILED;
}

} // anonymous namespace

void
RangeProcessor::HandleEpochBoundary (Position& pos, const BlockHeader& next,
                                     PendingWrites& writes)
{
  auto& ledger = pos.ledger;

  FinishedEpoch ep;
  ep.epoch = ledger.GetEpoch ();
  ep.epochId = ledger.GetEpochId ();
  ep.startBlock = ledger.GetEpochStart ();
  ep.endBlock = pos.prevHeight;
  ep.startTimestamp = pos.epochStartTimestamp;
  ep.endTimestamp = pos.prevTimestamp;

  LOG (INFO)
      << "Epoch " << ep.epoch << " (" << ep.epochId << ") ended at height "
      << ep.endBlock << ", next epoch is " << next.epochId;

  ledger.AccrueRewards (
      chain.GetPoolAccounts (store.GetValidator (), next.prevHash),
      next.height);
  const auto closed = ledger.CloseEpoch (ep.endBlock);

  if (ep.startTimestamp == 0 && apyConfig.epochsPerYear == 0.0)
    {
      Block first;
      if (chain.GetBlock (ep.startBlock, first))
        ep.startTimestamp = first.header.GetTimestampMs ();
    }

  ValidatorMetrics metrics;
  ValidatorPerformance perf;
  calculator.Compute (ep, closed, metrics, perf);

  EpochData data;
  data.epoch = ep.epoch;
  data.epochId = ep.epochId;
  data.validator = store.GetValidator ();
  data.startBlock = ep.startBlock;
  data.endBlock = ep.endBlock;
  data.timestamp = ep.endTimestamp;
  data.delegators = closed;

  /* The epoch's transactions are partly stored already (from earlier
     ranges) and partly still pending.  */
  std::map<std::pair<uint64_t, std::string>, StakingTransaction> txs;
  for (auto& tx : store.GetTransactions (ep.startBlock, ep.endBlock))
    txs.emplace (std::make_pair (tx.blockHeight, tx.hash), tx);
  for (const auto& tx : writes.transactions)
    if (tx.blockHeight >= ep.startBlock && tx.blockHeight <= ep.endBlock)
      txs.emplace (std::make_pair (tx.blockHeight, tx.hash), tx);
  for (auto& entry : txs)
    data.transactions.push_back (std::move (entry.second));

  writes.snapshots.insert (writes.snapshots.end (),
                           closed.begin (), closed.end ());
  writes.metrics.push_back (std::move (metrics));
  writes.performance.push_back (std::move (perf));
  writes.epochData.push_back (std::move (data));

  ledger.OpenEpoch (ep.epoch + 1, next.epochId, next.height);
  pos.epochStartTimestamp = next.GetTimestampMs ();
}

bool
RangeProcessor::Persist (const PendingWrites& writes)
{
  CheckpointWriter checkpoints(store);

  std::chrono::milliseconds delay(FLAGS_store_retry_delay_ms);
  for (int attempt = 0; ; ++attempt)
    {
      try
        {
          DocumentStore::Batch batch(store.GetDocumentStore ());

          unsigned newTx = 0;
          for (const auto& tx : writes.transactions)
            if (store.AddTransaction (tx))
              ++newTx;
          if (newTx < writes.transactions.size ())
            VLOG (1)
                << (writes.transactions.size () - newTx)
                << " transactions were stored already";

          store.PutDelegators (writes.snapshots);
          for (const auto& m : writes.metrics)
            store.PutMetrics (m);
          for (const auto& p : writes.performance)
            store.PutPerformance (p);
          for (const auto& d : writes.epochData)
            store.PutEpochData (d);

          if (writes.hasCheckpoint)
            checkpoints.Write (writes.checkpoint);

          batch.Commit ();
          return true;
        }
      catch (const PersistenceError& exc)
        {
          LOG (WARNING)
              << "Failed to write processed data (attempt " << (attempt + 1)
              << "): " << exc.what ();
          if (attempt >= FLAGS_store_retries)
            {
              LOG (ERROR) << "Giving up on writing processed data";
              return false;
            }

          sleeper (delay);
          delay *= 2;
        }
    }
}

RangeProcessor::Result
RangeProcessor::Backfill (const BlockRange& range, Output& out)
{
  const auto checkpoints = store.GetCheckpoints ();

  bool overlaps = false;
  const EpochSyncState* before = nullptr;
  for (const auto& cp : checkpoints)
    {
      if (cp.startBlock <= range.end && range.start <= cp.endBlock)
        overlaps = true;
      if (cp.endBlock < range.start)
        before = &cp;
    }

  LOG (WARNING)
      << "Range " << range << " is below the latest checkpoint, only"
      << " storing its transactions";

  PendingWrites writes;
  EpochSyncState cp;
  cp.startBlock = range.start;
  cp.endBlock = range.end;
  if (before != nullptr)
    {
      cp.epoch = before->epoch;
      cp.epochId = before->epochId;
      cp.epochStartBlock = before->epochStartBlock;
      cp.timestamp = before->timestamp;
    }

  const auto consumer = [&] (const BlockRange& batch,
                             std::vector<FetchedBlock>&& blocks)
    {
      for (auto& blk : blocks)
        {
          const auto& h = blk.header;
          if (h.epochId != cp.epochId)
            {
              if (!cp.epochId.empty ())
                ++cp.epoch;
              cp.epochId = h.epochId;
              cp.epochStartBlock = h.height;
            }
          cp.timestamp = h.GetTimestampMs ();

          for (auto& tx : blk.transactions)
            writes.transactions.push_back (std::move (tx));
        }
    };

  switch (RunFetch (fetcher, range, consumer))
    {
    case BatchFetcher::Status::COMPLETE:
      break;
    case BatchFetcher::Status::FAILED:
      return Result::FAILED;
    case BatchFetcher::Status::CANCELLED:
      return Result::CANCELLED;
    }

  if (!overlaps)
    {
      writes.hasCheckpoint = true;
      writes.checkpoint = cp;
    }

  if (!Persist (writes))
    return Result::FAILED;

  out.hasCheckpoint = writes.hasCheckpoint;
  out.checkpoint = writes.checkpoint;
  out.numTransactions = writes.transactions.size ();

  return Result::SYNCED;
}

RangeProcessor::Result
RangeProcessor::Process (const BlockRange& range, Output& out)
{
  CHECK_LE (range.start, range.end);
  out = Output ();

  EpochSyncState latest;
  const bool hasLatest = store.GetLatestCheckpoint (latest);
  if (hasLatest && range.end <= latest.endBlock)
    return Backfill (range, out);
  if (hasLatest && range.start != latest.endBlock + 1)
    {
      std::ostringstream msg;
      msg << "Range " << range << " does not continue checkpoint " << latest;
      throw CheckpointError (msg.str ());
    }

  const std::string& validator = store.GetValidator ();
  Position pos(validator);
  if (hasLatest && latest.epoch > 0)
    {
      pos.ledger.Load (latest.epoch, latest.epochId, latest.epochStartBlock,
                       store.GetDelegators (latest.epoch), latest.endBlock);
      pos.started = true;
      pos.prevHeight = latest.endBlock;
      pos.prevEpochId = latest.epochId;
      pos.prevTimestamp = latest.timestamp;
    }

  PendingWrites writes;
  const auto consumer = [&] (const BlockRange& batch,
                             std::vector<FetchedBlock>&& blocks)
    {
      for (auto& blk : blocks)
        {
          const auto& h = blk.header;
          if (!pos.started)
            {
              LOG (INFO)
                  << "Starting to index " << validator << " at height "
                  << h.height << " in epoch " << h.epochId;
              pos.ledger.OpenEpoch (1, h.epochId, h.height);
              pos.ledger.Seed (chain.GetPoolAccounts (validator, h.prevHash),
                               h.height);
              pos.epochStartTimestamp = h.GetTimestampMs ();
              pos.started = true;
            }
          else if (h.epochId != pos.prevEpochId)
            HandleEpochBoundary (pos, h, writes);

          for (auto& tx : blk.transactions)
            if (pos.ledger.Apply (tx))
              writes.transactions.push_back (std::move (tx));

          pos.prevHeight = h.height;
          pos.prevEpochId = h.epochId;
          pos.prevTimestamp = h.GetTimestampMs ();
        }

      VLOG (1) << "Processed sub-batch " << batch;
    };

  switch (RunFetch (fetcher, range, consumer))
    {
    case BatchFetcher::Status::COMPLETE:
      break;
    case BatchFetcher::Status::FAILED:
      LOG (WARNING) << "Range " << range << " stays pending";
      return Result::FAILED;
    case BatchFetcher::Status::CANCELLED:
      return Result::CANCELLED;
    }

  pos.ledger.AdvanceTo (range.end);
  for (const auto& s : pos.ledger.GetSnapshots ())
    writes.snapshots.push_back (s);

  if (!pos.ledger.GetIssues ().empty ())
    LOG (WARNING)
        << "Found " << pos.ledger.GetIssues ().size ()
        << " ledger inconsistencies in " << range;

  writes.hasCheckpoint = true;
  writes.checkpoint.startBlock = range.start;
  writes.checkpoint.endBlock = range.end;
  writes.checkpoint.epochId = pos.ledger.GetEpochId ();
  writes.checkpoint.epoch = pos.ledger.GetEpoch ();
  writes.checkpoint.epochStartBlock = pos.ledger.GetEpochStart ();
  writes.checkpoint.timestamp = pos.prevTimestamp;

  if (!Persist (writes))
    return Result::FAILED;

  if (cache != nullptr)
    cache->Prune (range.end);

  out.hasCheckpoint = true;
  out.checkpoint = writes.checkpoint;
  out.metrics = writes.metrics;
  out.numTransactions = writes.transactions.size ();

  LOG (INFO)
      << "Synced " << range << " with " << out.numTransactions
      << " staking transactions and " << out.metrics.size ()
      << " finished epochs";

  return Result::SYNCED;
}

} // namespace stakex
