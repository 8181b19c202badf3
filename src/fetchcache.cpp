// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fetchcache.hpp"

#include "errors.hpp"
#include "private/database.hpp"

#include <glog/logging.h>

namespace stakex
{

/* ************************************************************************** */

bool
FetchCache::Get (const BlockRange& range, std::vector<FetchedBlock>& blocks)
{
  std::string data;
  try
    {
      if (!Retrieve (range, data))
        return false;
    }
  catch (const PersistenceError& exc)
    {
      LOG (WARNING) << "Failed to read fetch cache for " << range
                    << ": " << exc.what ();
      return false;
    }

  if (!DeserialiseFetchedBlocks (data, blocks))
    {
      LOG (WARNING) << "Ignoring invalid fetch cache entry for " << range;
      return false;
    }

  VLOG (1) << "Using cached data for sub-batch " << range;
  return true;
}

void
FetchCache::Put (const BlockRange& range,
                 const std::vector<FetchedBlock>& blocks)
{
  try
    {
      Store (range, SerialiseFetchedBlocks (blocks));
    }
  catch (const PersistenceError& exc)
    {
      LOG (WARNING) << "Failed to write fetch cache for " << range
                    << ": " << exc.what ();
    }
}

void
FetchCache::Prune (const uint64_t upTo)
{
  try
    {
      Remove (upTo);
    }
  catch (const PersistenceError& exc)
    {
      LOG (WARNING) << "Failed to prune fetch cache: " << exc.what ();
    }
}

/* ************************************************************************** */

bool
MemoryFetchCache::Retrieve (const BlockRange& range, std::string& data)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = entries.find (std::make_pair (range.start, range.end));
  if (mit == entries.end ())
    return false;

  data = mit->second;
  return true;
}

void
MemoryFetchCache::Store (const BlockRange& range, const std::string& data)
{
  std::lock_guard<std::mutex> lock(mut);
  entries[std::make_pair (range.start, range.end)] = data;
}

void
MemoryFetchCache::Remove (const uint64_t upTo)
{
  std::lock_guard<std::mutex> lock(mut);
  for (auto it = entries.begin (); it != entries.end (); )
    if (it->first.second <= upTo)
      it = entries.erase (it);
    else
      ++it;
}

size_t
MemoryFetchCache::GetSize ()
{
  std::lock_guard<std::mutex> lock(mut);
  return entries.size ();
}

/* ************************************************************************** */

SqliteFetchCache::SqliteFetchCache (const std::string& file)
  : db(std::make_unique<Database> (file))
{
  db->Execute (R"(
    CREATE TABLE IF NOT EXISTS `fetch_cache` (
      `start` INTEGER NOT NULL,
      `end` INTEGER NOT NULL,
      `data` BLOB NOT NULL,
      PRIMARY KEY (`start`, `end`)
    );
  )");
}

SqliteFetchCache::~SqliteFetchCache () = default;

bool
SqliteFetchCache::Retrieve (const BlockRange& range, std::string& data)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->PrepareRo (R"(
    SELECT `data`
      FROM `fetch_cache`
      WHERE `start` = ?1 AND `end` = ?2
  )");
  stmt.Bind (1, range.start);
  stmt.Bind (2, range.end);

  if (!stmt.Step ())
    return false;

  data = stmt.GetBlob (0);
  CHECK (!stmt.Step ());

  return true;
}

void
SqliteFetchCache::Store (const BlockRange& range, const std::string& data)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->Prepare (R"(
    INSERT OR REPLACE INTO `fetch_cache`
      (`start`, `end`, `data`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, range.start);
  stmt.Bind (2, range.end);
  stmt.BindBlob (3, data);
  stmt.Execute ();
}

void
SqliteFetchCache::Remove (const uint64_t upTo)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = db->Prepare (R"(
    DELETE FROM `fetch_cache`
      WHERE `end` <= ?1
  )");
  stmt.Bind (1, upTo);
  stmt.Execute ();

  VLOG (1) << "Pruned " << db->RowsModified ()
           << " fetch cache entries up to height " << upTo;
}

/* ************************************************************************** */

} // namespace stakex
