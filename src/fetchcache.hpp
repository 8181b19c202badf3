// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_FETCHCACHE_HPP
#define STAKEX_FETCHCACHE_HPP

#include "chaindata.hpp"
#include "planner.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace stakex
{

class Database;

/**
 * Cache for the results of fetching sub-batches of blocks.  When a range
 * fails partially and is retried, the sub-batches that succeeded already
 * are served from here instead of fetching them again.  Entries are
 * dropped once the range they belong to has been checkpointed.
 *
 * The cached data is serialised with protocol buffers.  Subclasses
 * implement the actual storage of the bytes, and must be thread-safe.
 */
class FetchCache
{

protected:

  /**
   * Looks up the serialised data for a sub-batch.  Returns false if there
   * is no entry for it.
   */
  virtual bool Retrieve (const BlockRange& range, std::string& data) = 0;

  /**
   * Stores serialised data for a sub-batch.
   */
  virtual void Store (const BlockRange& range, const std::string& data) = 0;

  /**
   * Removes the entries of all sub-batches ending at or below
   * the given height.
   */
  virtual void Remove (uint64_t upTo) = 0;

public:

  FetchCache () = default;
  virtual ~FetchCache () = default;

  FetchCache (const FetchCache&) = delete;
  void operator= (const FetchCache&) = delete;

  /**
   * Returns the cached blocks for a sub-batch, if there are any.  Errors
   * in the underlying storage are logged and treated as a cache miss.
   */
  bool Get (const BlockRange& range, std::vector<FetchedBlock>& blocks);

  /**
   * Caches the blocks of a sub-batch.  Errors are logged and ignored.
   */
  void Put (const BlockRange& range, const std::vector<FetchedBlock>& blocks);

  /**
   * Removes all entries for sub-batches ending at or below the
   * given height.  Errors are logged and ignored.
   */
  void Prune (uint64_t upTo);

};

/**
 * Fetch cache that holds the data in memory.
 */
class MemoryFetchCache : public FetchCache
{

private:

  std::mutex mut;

  /** The cached entries, keyed by (start, end).  */
  std::map<std::pair<uint64_t, uint64_t>, std::string> entries;

protected:

  bool Retrieve (const BlockRange& range, std::string& data) override;
  void Store (const BlockRange& range, const std::string& data) override;
  void Remove (uint64_t upTo) override;

public:

  MemoryFetchCache () = default;

  /**
   * Returns the number of cached entries.
   */
  size_t GetSize ();

};

/**
 * Fetch cache stored in an SQLite database file.
 */
class SqliteFetchCache : public FetchCache
{

private:

  std::mutex mut;

  /** The underlying database.  */
  std::unique_ptr<Database> db;

protected:

  bool Retrieve (const BlockRange& range, std::string& data) override;
  void Store (const BlockRange& range, const std::string& data) override;
  void Remove (uint64_t upTo) override;

public:

  /**
   * Opens or creates the database file.  Throws PersistenceError on
   * failure.
   */
  explicit SqliteFetchCache (const std::string& file);

  ~SqliteFetchCache ();

};

} // namespace stakex

#endif // STAKEX_FETCHCACHE_HPP
