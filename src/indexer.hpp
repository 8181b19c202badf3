// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_INDEXER_HPP
#define STAKEX_INDEXER_HPP

#include "chainclient.hpp"
#include "fetcher.hpp"
#include "indexstore.hpp"
#include "planner.hpp"
#include "processor.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace stakex
{

class ZmqPub;

/**
 * The main sync loop.  It repeatedly plans the next range from the
 * persisted checkpoints, lets the range processor handle it and announces
 * the results.  The loop runs on a background thread between Start
 * and Stop.
 */
class Indexer
{

public:

  /** Result of a single update step.  */
  enum class StepResult
  {
    /** A range has been synced, there may be more to do right away.  */
    PROGRESS,
    /** Everything up to the final block is synced.  */
    UP_TO_DATE,
    /** The step failed and should be retried after a backoff.  */
    FAILED,
  };

private:

  ChainClient& chain;
  IndexStore& store;
  BatchFetcher& fetcher;
  RangeProcessor& processor;

  /** The planner for the next ranges.  */
  EpochRangePlanner planner;

  /**
   * The configured start height.  Zero means that the start of the
   * current epoch is used, which is looked up once and cached here.
   */
  uint64_t startHeight;

  /** ZMQ publisher for notifications, if enabled.  */
  std::unique_ptr<ZmqPub> zmq;

  /** Lock for the run state.  */
  std::mutex mut;

  /** Condition variable to wake up the loop when it should stop.  */
  std::condition_variable cv;

  /** Set to true when the loop should stop.  */
  bool shouldStop;

  /** The background thread running the loop.  */
  std::unique_ptr<std::thread> updater;

  /**
   * Determines the height at which indexing starts when there are
   * no checkpoints yet.
   */
  uint64_t GetStartHeight ();

  /**
   * Sends out notifications for a synced range.
   */
  void Notify (const RangeProcessor::Output& out);

public:

  explicit Indexer (ChainClient& c, IndexStore& s, BatchFetcher& f,
                    RangeProcessor& p, uint64_t epochBlocks,
                    uint64_t start);

  ~Indexer ();

  Indexer () = delete;
  Indexer (const Indexer&) = delete;
  void operator= (const Indexer&) = delete;

  /**
   * Enables ZMQ notifications on the given endpoint.  Must be called
   * before Start.
   */
  void SetZmqEndpoint (const std::string& addr);

  /**
   * Runs one update step synchronously:  The next range is planned
   * and processed.  Errors are logged and reported as FAILED.
   */
  StepResult UpdateStep ();

  /**
   * Starts the background loop.
   */
  void Start ();

  /**
   * Stops the background loop, cancelling a running range.  Returns
   * when the loop has finished.
   */
  void Stop ();

};

} // namespace stakex

#endif // STAKEX_INDEXER_HPP
