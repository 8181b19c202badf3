// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fetcher.hpp"

#include "errors.hpp"
#include "staking.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <memory>
#include <thread>

namespace stakex
{

std::vector<BlockRange>
PartitionRange (const BlockRange& range, const uint64_t batchSize)
{
  CHECK_GT (batchSize, 0);
  CHECK_LE (range.start, range.end);

  std::vector<BlockRange> res;
  uint64_t start = range.start;
  while (true)
    {
      const uint64_t end = std::min (range.end, start + batchSize - 1);
      res.emplace_back (start, end);
      if (end == range.end)
        break;
      start = end + 1;
    }

  return res;
}

/* ************************************************************************** */

struct BatchFetcher::BatchResult
{

  /** The sub-batch this is for.  */
  BlockRange batch;

  /** Set to true if the sub-batch was fetched successfully.  */
  bool success = false;

  /** The blocks fetched.  */
  std::vector<FetchedBlock> blocks;

};

BatchFetcher::BatchFetcher (ChainClient& c, const std::string& p,
                            const unsigned parallel, const uint64_t batch)
  : chain(c), pool(p), parallelLimit(parallel), batchSize(batch),
    semaphore(parallel), cancelled(false)
{
  CHECK_GT (parallelLimit, 0);
  CHECK_GT (batchSize, 0);
}

bool
BatchFetcher::FetchBlock (const uint64_t height, FetchedBlock& out)
{
  Block blk;
  if (!chain.GetBlock (height, blk))
    {
      VLOG (1) << "No block at height " << height;
      return false;
    }
  if (blk.header.height != height)
    throw MalformedDataError ("got block at wrong height "
                                + std::to_string (blk.header.height)
                                + " for " + std::to_string (height));

  out.header = blk.header;
  out.transactions.clear ();

  for (const auto& ch : blk.chunks)
    {
      /* Shards that did not produce a chunk in this block repeat
         their previous one, which we have seen already.  */
      if (ch.heightIncluded != height)
        continue;

      try
        {
          const Chunk chunk = chain.GetChunk (ch.hash);
          for (auto& tx : ExtractStakingTransactions (pool, blk.header, chunk))
            out.transactions.push_back (std::move (tx));
        }
      catch (const MalformedDataError& exc)
        {
          LOG (WARNING)
              << "Skipping malformed chunk " << ch.hash << " at height "
              << height << ": " << exc.what ();
        }
    }

  std::sort (out.transactions.begin (), out.transactions.end (),
             [] (const StakingTransaction& a, const StakingTransaction& b)
               {
                 return a.hash < b.hash;
               });

  return true;
}

bool
BatchFetcher::FetchBatch (const BlockRange& batch,
                          std::vector<FetchedBlock>& out)
{
  if (cache != nullptr && cache->Get (batch, out))
    return true;

  out.clear ();
  for (uint64_t h = batch.start; h <= batch.end; ++h)
    {
      if (cancelled)
        return false;

      FetchedBlock blk;
      if (FetchBlock (h, blk))
        out.push_back (std::move (blk));
    }

  if (cache != nullptr)
    cache->Put (batch, out);

  VLOG (1) << "Fetched sub-batch " << batch << " with " << out.size ()
           << " blocks";
  return true;
}

BatchFetcher::Status
BatchFetcher::Fetch (const BlockRange& range, const Consumer& consumer)
{
  if (cancelled)
    return Status::CANCELLED;

  const auto batches = PartitionRange (range, batchSize);
  const unsigned numWorkers
      = std::min<size_t> (parallelLimit, batches.size ());
  LOG (INFO)
      << "Fetching " << range << " in " << batches.size ()
      << " sub-batches with " << numWorkers << " workers";

  OrderedChannel<BatchResult> channel;
  {
    std::lock_guard<std::mutex> lock(mutChannel);
    CHECK (currentChannel == nullptr) << "Concurrent fetches are not allowed";
    currentChannel = &channel;
  }

  std::atomic<size_t> nextBatch(0);
  const auto worker = [&] ()
    {
      while (!cancelled)
        {
          const size_t ind = nextBatch++;
          if (ind >= batches.size ())
            break;

          BatchResult res;
          res.batch = batches[ind];
          {
            CountingSemaphore::Guard slot(semaphore);
            try
              {
                res.success = FetchBatch (res.batch, res.blocks);
              }
            catch (const RpcError& exc)
              {
                LOG (ERROR)
                    << "Failed to fetch sub-batch " << res.batch << ": "
                    << exc.what ();
              }
            catch (const MalformedDataError& exc)
              {
                LOG (ERROR)
                    << "Malformed data in sub-batch " << res.batch << ": "
                    << exc.what ();
              }
          }

          channel.Push (ind, std::move (res));
        }
    };

  std::vector<std::thread> workers;
  for (unsigned i = 0; i < numWorkers; ++i)
    workers.emplace_back (worker);

  const auto joinWorkers = [&] ()
    {
      for (auto& w : workers)
        w.join ();

      std::lock_guard<std::mutex> lock(mutChannel);
      currentChannel = nullptr;
    };

  Status status = Status::COMPLETE;
  size_t consumed = 0;
  try
    {
      for (; consumed < batches.size (); ++consumed)
        {
          BatchResult res;
          if (!channel.PopNext (res))
            {
              status = Status::CANCELLED;
              break;
            }

          if (!res.success)
            {
              status = cancelled ? Status::CANCELLED : Status::FAILED;
              break;
            }

          consumer (res.batch, std::move (res.blocks));
        }
    }
  catch (...)
    {
      /* Stop handing out new sub-batches, and make sure the workers are
         done before the exception leaves this function.  */
      nextBatch = batches.size ();
      joinWorkers ();
      throw;
    }

  /* Without a cache, the remaining sub-batches are of no use after
     a failure.  With a cache, the workers go on, so that their results
     are available for the next attempt.  */
  if (status != Status::COMPLETE && cache == nullptr)
    nextBatch = batches.size ();
  joinWorkers ();

  if (status == Status::FAILED)
    LOG (WARNING)
        << "Fetching " << range << " failed after " << consumed
        << " of " << batches.size () << " sub-batches";
  else if (status == Status::CANCELLED)
    LOG (INFO) << "Fetching " << range << " was cancelled";

  return status;
}

void
BatchFetcher::Cancel ()
{
  LOG (INFO) << "Cancelling block fetcher";
  cancelled = true;

  std::lock_guard<std::mutex> lock(mutChannel);
  if (currentChannel != nullptr)
    currentChannel->Close ();
}

} // namespace stakex
