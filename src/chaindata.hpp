// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_CHAINDATA_HPP
#define STAKEX_CHAINDATA_HPP

#include "amount.hpp"

#include <json/json.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace stakex
{

/**
 * The parts of a block header that we need.
 */
struct BlockHeader
{

  /** The block's height.  */
  uint64_t height = 0;

  /** The block's hash.  */
  std::string hash;

  /** The hash of the previous block.  */
  std::string prevHash;

  /** The ID of the epoch the block is part of.  */
  std::string epochId;

  /** The block's timestamp in nanoseconds since the Unix epoch.  */
  uint64_t timestampNs = 0;

  /** The gas price of the block.  */
  Amount gasPrice;

  /**
   * Returns the block's timestamp in milliseconds.
   */
  uint64_t
  GetTimestampMs () const
  {
    return timestampNs / 1'000'000;
  }

};

/**
 * Reference to a chunk as it appears inside a block.
 */
struct ChunkHeader
{

  /** The chunk hash, which is used to request it.  */
  std::string hash;

  /**
   * The height at which the chunk was included.  If the shard did not
   * produce a new chunk in a block, the old one is repeated with an
   * older inclusion height.
   */
  uint64_t heightIncluded = 0;

  /** The shard this chunk belongs to.  */
  uint64_t shardId = 0;

};

/**
 * A block as returned by the chain.
 */
struct Block
{

  BlockHeader header;

  /** The chunks of this block.  */
  std::vector<ChunkHeader> chunks;

};

/**
 * A single action of a transaction.  We only care about function calls
 * in detail, all other action kinds are just recorded by name.
 */
struct ActionData
{

  /** The action kind, e.g. "FunctionCall" or "Transfer".  */
  std::string kind;

  /** For function calls, the method being called.  */
  std::string method;

  /** For function calls, the raw (decoded) call arguments.  */
  std::string args;

  /** Tokens attached to the action.  */
  Amount deposit;

  /** Gas attached to the action.  */
  uint64_t gas = 0;

};

/**
 * A signed transaction inside a chunk.
 */
struct ChunkTransaction
{

  std::string hash;
  std::string signer;
  std::string receiver;

  std::vector<ActionData> actions;

};

/**
 * A chunk with its transactions.
 */
struct Chunk
{

  std::string hash;

  std::vector<ChunkTransaction> transactions;

};

/**
 * Information about one validator in an epoch.
 */
struct ValidatorInfo
{

  std::string accountId;

  /** The validator's stake.  */
  Amount stake;

  uint64_t blocksProduced = 0;
  uint64_t blocksExpected = 0;
  uint64_t chunksProduced = 0;
  uint64_t chunksExpected = 0;

};

/**
 * The validator set of an epoch.
 */
struct ValidatorSet
{

  /** Height of the first block of the epoch.  */
  uint64_t epochStartHeight = 0;

  /** The epoch's sequence number as reported by the chain.  */
  uint64_t epochHeight = 0;

  /** The validators of the epoch.  */
  std::vector<ValidatorInfo> current;

  /** Account IDs of validators kicked out at the start of the epoch.  */
  std::vector<std::string> kickouts;

  /**
   * Looks up a validator by account ID.  Returns nullptr if it is not
   * part of the set.
   */
  const ValidatorInfo* Find (const std::string& accountId) const;

};

/**
 * Basic data about an epoch.
 */
struct EpochInfo
{

  std::string epochId;

  /** Height of the first block of the epoch.  */
  uint64_t startHeight = 0;

  /** The epoch's sequence number as reported by the chain.  */
  uint64_t epochHeight = 0;

};

/**
 * The state of a delegator account as reported by the pool contract.
 */
struct PoolAccount
{

  std::string accountId;

  Amount staked;
  Amount unstaked;

  bool canWithdraw = false;

};

/**
 * A staking-related transaction sent to the pool we index.  This is what
 * gets stored into the "transactions" collection.
 */
struct StakingTransaction
{

  std::string hash;

  /**
   * The amount of the transaction.  This is zero for the "*_all" methods
   * until the ledger resolves it based on the delegator's balance.
   */
  Amount amount;

  /** The pool method called, e.g. "deposit_and_stake".  */
  std::string method;

  /** The action kind this came from (usually "FunctionCall").  */
  std::string action;

  /** Direction of the stake change, "stake" or "unstake".  */
  std::string type;

  uint64_t blockHeight = 0;

  /** The block timestamp in milliseconds.  */
  uint64_t timestamp = 0;

  /** The delegator (signer of the transaction).  */
  std::string delegator;

  /** Upper bound for the fee paid (gas attached times gas price).  */
  Amount gasFee;

  /**
   * Returns the document form of this transaction.
   */
  Json::Value ToJson () const;

  /**
   * Parses the document form.  Throws MalformedDataError if it is invalid.
   */
  static StakingTransaction FromJson (const Json::Value& val);

  friend bool
  operator== (const StakingTransaction& a, const StakingTransaction& b)
  {
    return a.hash == b.hash && a.amount == b.amount && a.method == b.method
            && a.action == b.action && a.type == b.type
            && a.blockHeight == b.blockHeight && a.timestamp == b.timestamp
            && a.delegator == b.delegator && a.gasFee == b.gasFee;
  }

  friend bool
  operator!= (const StakingTransaction& a, const StakingTransaction& b)
  {
    return !(a == b);
  }

};

std::ostream& operator<< (std::ostream& out, const StakingTransaction& tx);

/**
 * The data extracted from one block during fetching:  The header and
 * all staking transactions for our pool.
 */
struct FetchedBlock
{

  BlockHeader header;

  std::vector<StakingTransaction> transactions;

};

/**
 * Serialises a list of fetched blocks into a byte string.
 */
std::string SerialiseFetchedBlocks (const std::vector<FetchedBlock>& blocks);

/**
 * Parses a list of fetched blocks from its serialised form.  Returns false
 * if the data is invalid.
 */
bool DeserialiseFetchedBlocks (const std::string& data,
                               std::vector<FetchedBlock>& blocks);

} // namespace stakex

#endif // STAKEX_CHAINDATA_HPP
