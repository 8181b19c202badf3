// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_CHAINCLIENT_HPP
#define STAKEX_CHAINCLIENT_HPP

#include "chaindata.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stakex
{

/**
 * Interface for the chain data that the indexer needs.  Implementations
 * (like the NEAR JSON-RPC client) translate the chain's responses into
 * our own data types.  All methods must be safe to call from multiple
 * threads concurrently.
 *
 * Failures are reported as exceptions:  TerminalRpcError if the chain
 * could not be reached, RpcResponseError if the chain rejected the request
 * and MalformedDataError if the response could not be understood.
 */
class ChainClient
{

public:

  ChainClient () = default;
  virtual ~ChainClient () = default;

  ChainClient (const ChainClient&) = delete;
  void operator= (const ChainClient&) = delete;

  /**
   * Called at the start of every sync cycle, before any other call.
   * Implementations can use this e.g. to reset connection health.
   */
  virtual void
  NewCycle ()
  {}

  /**
   * Returns the height of the latest final block.
   */
  virtual uint64_t GetFinalHeight () = 0;

  /**
   * Retrieves the block at the given height.  Returns false if the chain
   * does not have a block at that height (it was skipped).
   */
  virtual bool GetBlock (uint64_t height, Block& blk) = 0;

  /**
   * Retrieves a chunk by its hash.
   */
  virtual Chunk GetChunk (const std::string& hash) = 0;

  /**
   * Returns the validator set for the given epoch.  If the epoch ID
   * is empty, returns the data for the current epoch.
   */
  virtual ValidatorSet GetValidators (const std::string& epochId) = 0;

  /**
   * Returns basic info about an epoch (or the current one if the ID
   * is empty).
   */
  virtual EpochInfo GetEpochInfo (const std::string& epochId) = 0;

  /**
   * Queries the state of all delegator accounts of the given pool
   * contract, as of the block with the given hash.
   */
  virtual std::vector<PoolAccount> GetPoolAccounts (
      const std::string& pool, const std::string& blockHash) = 0;

};

} // namespace stakex

#endif // STAKEX_CHAINCLIENT_HPP
