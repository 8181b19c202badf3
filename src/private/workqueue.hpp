// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_WORKQUEUE_HPP
#define STAKEX_WORKQUEUE_HPP

#include <glog/logging.h>

#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <utility>

namespace stakex
{

/**
 * Counting semaphore that limits how many workers can be active at the
 * same time.  It also records the highest number of concurrent holders
 * seen, so that the limit can be verified.
 */
class CountingSemaphore
{

private:

  /** Lock for this instance.  */
  mutable std::mutex mut;

  /** Notified when a slot is released.  */
  std::condition_variable cv;

  /** Maximum number of concurrent holders.  */
  const unsigned limit;

  /** Current number of holders.  */
  unsigned inUse = 0;

  /** Highest value of inUse seen so far.  */
  unsigned peak = 0;

public:

  class Guard;

  explicit CountingSemaphore (unsigned l);

  CountingSemaphore () = delete;
  CountingSemaphore (const CountingSemaphore&) = delete;
  void operator= (const CountingSemaphore&) = delete;

  /**
   * Blocks until a slot is free and takes it.
   */
  void Acquire ();

  /**
   * Releases a slot taken before.
   */
  void Release ();

  /**
   * Returns the highest number of concurrent holders so far.
   */
  unsigned GetPeak () const;

};

/**
 * RAII helper that holds a slot of a semaphore while it is alive.
 */
class CountingSemaphore::Guard
{

private:

  CountingSemaphore& sem;

public:

  explicit Guard (CountingSemaphore& s)
    : sem(s)
  {
    sem.Acquire ();
  }

  ~Guard ()
  {
    sem.Release ();
  }

  Guard () = delete;
  Guard (const Guard&) = delete;
  void operator= (const Guard&) = delete;

};

/**
 * Channel that receives results tagged with a sequence index from multiple
 * producers in any order, and hands them out to a single consumer strictly
 * in index order.
 */
template <typename T>
  class OrderedChannel
{

private:

  /** Lock for this instance.  */
  std::mutex mut;

  /** Notified when a new item is pushed or the channel is closed.  */
  std::condition_variable cv;

  /** Items received but not yet consumed, by index.  */
  std::map<size_t, T> pending;

  /** The index of the next item to hand out.  */
  size_t next = 0;

  /** Set when the channel has been closed.  */
  bool closed = false;

public:

  OrderedChannel () = default;

  OrderedChannel (const OrderedChannel<T>&) = delete;
  void operator= (const OrderedChannel<T>&) = delete;

  /**
   * Adds the item with the given index.  Items pushed after the channel
   * has been closed are dropped.
   */
  void
  Push (const size_t index, T&& val)
  {
    std::lock_guard<std::mutex> lock(mut);
    if (closed)
      return;

    CHECK_GE (index, next) << "Item " << index << " was already consumed";
    CHECK (pending.emplace (index, std::move (val)).second)
        << "Duplicate item " << index;
    cv.notify_all ();
  }

  /**
   * Waits for the next item in order and returns it.  Returns false if
   * the channel was closed before the item became available.
   */
  bool
  PopNext (T& out)
  {
    std::unique_lock<std::mutex> lock(mut);
    while (true)
      {
        if (closed)
          return false;

        auto mit = pending.find (next);
        if (mit != pending.end ())
          {
            out = std::move (mit->second);
            pending.erase (mit);
            ++next;
            return true;
          }

        cv.wait (lock);
      }
  }

  /**
   * Closes the channel, waking up a waiting consumer.
   */
  void
  Close ()
  {
    std::lock_guard<std::mutex> lock(mut);
    closed = true;
    pending.clear ();
    cv.notify_all ();
  }

};

} // namespace stakex

#endif // STAKEX_WORKQUEUE_HPP
