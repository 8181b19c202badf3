// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "planner.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <sstream>

namespace stakex
{

namespace
{

/**
 * Returns true if the two (inclusive) ranges overlap.
 */
bool
Overlaps (const uint64_t aStart, const uint64_t aEnd,
          const uint64_t bStart, const uint64_t bEnd)
{
  return aStart <= bEnd && bStart <= aEnd;
}

} // anonymous namespace

EpochRangePlanner::EpochRangePlanner (const uint64_t eb)
  : epochBlocks(eb)
{
  CHECK_GT (epochBlocks, 0);
}

bool
EpochRangePlanner::PlanNext (const std::vector<EpochSyncState>& checkpoints,
                             const uint64_t head, const uint64_t startHeight,
                             BlockRange& out) const
{
  for (size_t i = 1; i < checkpoints.size (); ++i)
    {
      const auto& prev = checkpoints[i - 1];
      const auto& cur = checkpoints[i];
      CHECK_LE (prev.startBlock, cur.startBlock)
          << "Checkpoints are not ordered";

      if (cur.startBlock <= prev.endBlock)
        {
          std::ostringstream msg;
          msg << "Overlapping checkpoints " << prev << " and " << cur;
          throw CheckpointError (msg.str ());
        }

      if (cur.startBlock > prev.endBlock + 1)
        {
          out.start = prev.endBlock + 1;
          out.end = std::min (cur.startBlock - 1, out.start + epochBlocks - 1);
          LOG (WARNING)
              << "Found gap " << out << " between checkpoints " << prev
              << " and " << cur;
          return true;
        }
    }

  uint64_t nextStart = startHeight;
  if (!checkpoints.empty ())
    nextStart = checkpoints.back ().endBlock + 1;

  if (nextStart > head)
    {
      VLOG (1) << "Nothing to sync, next height " << nextStart
               << " is above head " << head;
      return false;
    }

  out.start = nextStart;
  out.end = std::min (nextStart + epochBlocks - 1, head);
  return true;
}

void
CheckpointWriter::Write (const EpochSyncState& s)
{
  CHECK_LE (s.startBlock, s.endBlock);

  for (const auto& existing : store.GetCheckpoints ())
    if (Overlaps (existing.startBlock, existing.endBlock,
                  s.startBlock, s.endBlock))
      {
        std::ostringstream msg;
        msg << "New checkpoint " << s << " overlaps " << existing;
        throw CheckpointError (msg.str ());
      }

  /* AddCheckpoint can only fail for an existing start block, which
     would have been detected as overlap already.  */
  CHECK (store.AddCheckpoint (s));
  LOG (INFO) << "Recorded checkpoint " << s;
}

} // namespace stakex
