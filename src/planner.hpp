// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_PLANNER_HPP
#define STAKEX_PLANNER_HPP

#include "indexstore.hpp"
#include "records.hpp"

#include <cstdint>
#include <ostream>
#include <vector>

namespace stakex
{

/**
 * A contiguous range of block heights (both ends inclusive).
 */
struct BlockRange
{

  uint64_t start = 0;
  uint64_t end = 0;

  BlockRange () = default;

  explicit BlockRange (const uint64_t s, const uint64_t e)
    : start(s), end(e)
  {}

  uint64_t
  Size () const
  {
    return end - start + 1;
  }

  friend bool
  operator== (const BlockRange& a, const BlockRange& b)
  {
    return a.start == b.start && a.end == b.end;
  }

  friend bool
  operator!= (const BlockRange& a, const BlockRange& b)
  {
    return !(a == b);
  }

  friend std::ostream&
  operator<< (std::ostream& out, const BlockRange& r)
  {
    out << "[" << r.start << ", " << r.end << "]";
    return out;
  }

};

/**
 * Decides which block range should be processed next, based on the
 * checkpoints already persisted.
 */
class EpochRangePlanner
{

private:

  /** Maximum number of blocks in a planned range.  */
  const uint64_t epochBlocks;

public:

  explicit EpochRangePlanner (uint64_t eb);

  EpochRangePlanner () = delete;
  EpochRangePlanner (const EpochRangePlanner&) = delete;
  void operator= (const EpochRangePlanner&) = delete;

  /**
   * Plans the next range given the checkpoints (ordered by start block),
   * the current chain head and the height to start at if there are no
   * checkpoints yet.  Gaps between checkpoints are planned first.  Returns
   * false if everything up to the head is synced already.
   *
   * Throws CheckpointError if the checkpoints overlap.
   */
  bool PlanNext (const std::vector<EpochSyncState>& checkpoints,
                 uint64_t head, uint64_t startHeight,
                 BlockRange& out) const;

};

/**
 * Records completed ranges as new checkpoints, verifying that they do not
 * overlap with any existing checkpoint.
 */
class CheckpointWriter
{

private:

  IndexStore& store;

public:

  explicit CheckpointWriter (IndexStore& s)
    : store(s)
  {}

  CheckpointWriter () = delete;
  CheckpointWriter (const CheckpointWriter&) = delete;
  void operator= (const CheckpointWriter&) = delete;

  /**
   * Writes a checkpoint.  Throws CheckpointError if it would overlap
   * an existing one.
   */
  void Write (const EpochSyncState& s);

};

} // namespace stakex

#endif // STAKEX_PLANNER_HPP
