// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_NEAR_NEARCHAIN_HPP
#define STAKEX_NEAR_NEARCHAIN_HPP

#include "chainclient.hpp"
#include "chaindata.hpp"
#include "rpcgateway.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace stakex
{

/**
 * Parses a block as returned by the "block" RPC method.  Throws
 * MalformedDataError if the data is invalid.
 */
Block ParseNearBlock (const Json::Value& val);

/**
 * Parses a chunk as returned by the "chunk" RPC method.  Transactions
 * that are malformed are logged and skipped.
 */
Chunk ParseNearChunk (const Json::Value& val);

/**
 * Parses the result of the "validators" RPC method.
 */
ValidatorSet ParseNearValidators (const Json::Value& val);

/**
 * Parses one page of the pool contract's get_accounts view call.
 */
std::vector<PoolAccount> ParseNearPoolAccounts (const Json::Value& val);

/**
 * ChainClient implementation that talks to NEAR nodes through their
 * JSON-RPC interface, using an RpcGateway for retries and failover.
 */
class NearChain : public ChainClient
{

private:

  /** The gateway used for all requests.  */
  RpcGateway& rpc;

  /**
   * Fetches the block referenced by the given parameters.
   */
  Block QueryBlock (const Json::Value& params);

  /**
   * Fetches the raw validators result for an epoch (or the current
   * one if the ID is empty).
   */
  Json::Value QueryValidators (const std::string& epochId);

public:

  explicit NearChain (RpcGateway& r)
    : rpc(r)
  {}

  /**
   * Resets the endpoint health of the gateway, so that the primary
   * endpoint is tried again in each sync cycle.
   */
  void NewCycle () override;

  uint64_t GetFinalHeight () override;
  bool GetBlock (uint64_t height, Block& blk) override;
  Chunk GetChunk (const std::string& hash) override;
  ValidatorSet GetValidators (const std::string& epochId) override;
  EpochInfo GetEpochInfo (const std::string& epochId) override;
  std::vector<PoolAccount> GetPoolAccounts (
      const std::string& pool, const std::string& blockHash) override;

};

} // namespace stakex

#endif // STAKEX_NEAR_NEARCHAIN_HPP
