// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/workqueue.hpp"

#include <algorithm>

namespace stakex
{

CountingSemaphore::CountingSemaphore (const unsigned l)
  : limit(l)
{
  CHECK_GT (limit, 0);
}

void
CountingSemaphore::Acquire ()
{
  std::unique_lock<std::mutex> lock(mut);
  while (inUse >= limit)
    cv.wait (lock);

  ++inUse;
  peak = std::max (peak, inUse);
}

void
CountingSemaphore::Release ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK_GT (inUse, 0);
  --inUse;
  cv.notify_one ();
}

unsigned
CountingSemaphore::GetPeak () const
{
  std::lock_guard<std::mutex> lock(mut);
  return peak;
}

} // namespace stakex
