// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_FETCHER_HPP
#define STAKEX_FETCHER_HPP

#include "chainclient.hpp"
#include "chaindata.hpp"
#include "fetchcache.hpp"
#include "planner.hpp"
#include "private/workqueue.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace stakex
{

/**
 * Splits a range into contiguous sub-batches of the given size (the last
 * one may be shorter).
 */
std::vector<BlockRange> PartitionRange (const BlockRange& range,
                                        uint64_t batchSize);

/**
 * Fetches the blocks of a range from the chain, using a pool of worker
 * threads that each retrieve one sub-batch at a time.  The extracted data
 * is handed to a consumer on the calling thread, strictly in height order.
 */
class BatchFetcher
{

public:

  /** The result of fetching a range.  */
  enum class Status
  {
    /** All blocks were fetched and consumed.  */
    COMPLETE,
    /** Some sub-batch failed, the range is incomplete.  */
    FAILED,
    /** The fetch was cancelled.  */
    CANCELLED,
  };

  /**
   * Function called for the data of each sub-batch, in order.
   */
  using Consumer
      = std::function<void (const BlockRange& batch,
                            std::vector<FetchedBlock>&& blocks)>;

private:

  /** The result of one sub-batch as passed from a worker.  */
  struct BatchResult;

  /** The chain we fetch from.  */
  ChainClient& chain;

  /** The pool account whose transactions we extract.  */
  const std::string pool;

  /** Maximum number of sub-batches fetched at the same time.  */
  const unsigned parallelLimit;

  /** Number of blocks per sub-batch.  */
  const uint64_t batchSize;

  /** Optional cache for fetched sub-batches.  */
  FetchCache* cache = nullptr;

  /** Semaphore gating the active workers.  */
  CountingSemaphore semaphore;

  /** Set when the fetcher has been cancelled.  */
  std::atomic<bool> cancelled;

  /**
   * Lock protecting the channel of the currently running fetch, so that
   * Cancel can close it.
   */
  std::mutex mutChannel;

  /** The channel of the currently running fetch, if any.  */
  OrderedChannel<BatchResult>* currentChannel = nullptr;

  /**
   * Fetches a single sub-batch from the chain (or cache).  Throws
   * on failure.  Returns false if cancelled while fetching.
   */
  bool FetchBatch (const BlockRange& batch, std::vector<FetchedBlock>& out);

  /**
   * Fetches one block and its new chunks.  Returns false if the chain
   * has no block at that height.
   */
  bool FetchBlock (uint64_t height, FetchedBlock& out);

public:

  explicit BatchFetcher (ChainClient& c, const std::string& p,
                         unsigned parallel, uint64_t batch);

  BatchFetcher () = delete;
  BatchFetcher (const BatchFetcher&) = delete;
  void operator= (const BatchFetcher&) = delete;

  /**
   * Sets a cache to use.
   */
  void
  SetCache (FetchCache* c)
  {
    cache = c;
  }

  /**
   * Fetches all blocks in the range and passes them to the consumer.  When
   * a sub-batch fails, the consumer is not called for it or any later
   * sub-batches, but the other workers still finish (so their results
   * are cached for the next attempt).
   */
  Status Fetch (const BlockRange& range, const Consumer& consumer);

  /**
   * Cancels the running and all future fetches.  This can be called from
   * any thread.
   */
  void Cancel ();

  /**
   * Returns the highest number of sub-batches fetched at the same time.
   */
  unsigned
  GetPeakConcurrency () const
  {
    return semaphore.GetPeak ();
  }

};

} // namespace stakex

#endif // STAKEX_FETCHER_HPP
