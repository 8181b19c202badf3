// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "indexer.hpp"

#include "errors.hpp"
#include "private/zmqpub.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>

namespace stakex
{

DEFINE_int32 (poll_interval_ms, 5'000,
              "time to wait for new final blocks when fully synced");
DEFINE_int32 (failure_backoff_ms, 10'000,
              "time to wait before retrying a range that failed");

namespace
{

/**
 * Time to sleep between update steps while still catching up.  This just
 * makes sure the lock is released regularly.
 */
constexpr auto WAIT_BETWEEN_STEPS = std::chrono::milliseconds (1);

} // anonymous namespace

Indexer::Indexer (ChainClient& c, IndexStore& s, BatchFetcher& f,
                  RangeProcessor& p, const uint64_t epochBlocks,
                  const uint64_t start)
  : chain(c), store(s), fetcher(f), processor(p),
    planner(epochBlocks), startHeight(start)
{}

Indexer::~Indexer ()
{
  Stop ();
}

void
Indexer::SetZmqEndpoint (const std::string& addr)
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (updater == nullptr) << "ZMQ must be set up before starting";
  zmq = std::make_unique<ZmqPub> (addr);
}

uint64_t
Indexer::GetStartHeight ()
{
  if (startHeight == 0)
    {
      const EpochInfo info = chain.GetEpochInfo ("");
      startHeight = info.startHeight;
      LOG (INFO)
          << "Starting at the current epoch " << info.epochId
          << " with height " << startHeight;
    }

  return startHeight;
}

void
Indexer::Notify (const RangeProcessor::Output& out)
{
  if (zmq == nullptr)
    return;

  /* The range is committed already, so a failed notification is only
     logged and does not fail the update step.  */
  try
    {
      for (const auto& m : out.metrics)
        zmq->SendMetrics (m);
      if (out.hasCheckpoint)
        zmq->SendCheckpoint (store.GetValidator (), out.checkpoint);
    }
  catch (const zmq::error_t& exc)
    {
      LOG (ERROR) << "Failed to send ZMQ notification: " << exc.what ();
    }
}

Indexer::StepResult
Indexer::UpdateStep ()
{
  try
    {
      chain.NewCycle ();

      const uint64_t head = chain.GetFinalHeight ();
      const auto checkpoints = store.GetCheckpoints ();
      const uint64_t start = checkpoints.empty () ? GetStartHeight () : 0;

      BlockRange range;
      if (!planner.PlanNext (checkpoints, head, start, range))
        {
          VLOG (1) << "Synced up to the final height " << head;
          return StepResult::UP_TO_DATE;
        }

      LOG (INFO) << "Processing range " << range << " (head: " << head << ")";

      RangeProcessor::Output out;
      switch (processor.Process (range, out))
        {
        case RangeProcessor::Result::SYNCED:
          Notify (out);
          return StepResult::PROGRESS;

        case RangeProcessor::Result::CANCELLED:
          return StepResult::UP_TO_DATE;

        case RangeProcessor::Result::FAILED:
          LOG (WARNING) << "Processing " << range << " failed";
          return StepResult::FAILED;
        }
    }
  catch (const RpcError& exc)
    {
      LOG (ERROR) << "RPC error during update: " << exc.what ();
    }
  catch (const MalformedDataError& exc)
    {
      LOG (ERROR) << "Malformed chain data: " << exc.what ();
    }
  catch (const PersistenceError& exc)
    {
      LOG (ERROR) << "Store error during update: " << exc.what ();
    }
  catch (const CheckpointError& exc)
    {
      LOG (ERROR) << "Inconsistent checkpoints: " << exc.what ();
    }

  return StepResult::FAILED;
}

void
Indexer::Start ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (updater == nullptr);

  shouldStop = false;

  updater = std::make_unique<std::thread> ([this] ()
    {
      std::unique_lock<std::mutex> lock(mut);
      while (!shouldStop)
        {
          lock.unlock ();
          const StepResult res = UpdateStep ();
          lock.lock ();

          if (shouldStop)
            break;

          switch (res)
            {
            case StepResult::PROGRESS:
              cv.wait_for (lock, WAIT_BETWEEN_STEPS);
              break;
            case StepResult::UP_TO_DATE:
              cv.wait_for (lock,
                           std::chrono::milliseconds (FLAGS_poll_interval_ms));
              break;
            case StepResult::FAILED:
              cv.wait_for (lock,
                           std::chrono::milliseconds (FLAGS_failure_backoff_ms));
              break;
            }
        }
    });

  LOG (INFO) << "Started indexing for " << store.GetValidator ();
}

void
Indexer::Stop ()
{
  std::unique_lock<std::mutex> lock(mut);
  if (updater == nullptr)
    return;

  LOG (INFO) << "Stopping the indexer";
  shouldStop = true;
  fetcher.Cancel ();
  cv.notify_all ();

  lock.unlock ();
  updater->join ();
  lock.lock ();

  updater.reset ();
}

} // namespace stakex
