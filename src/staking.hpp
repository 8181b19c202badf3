// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_STAKING_HPP
#define STAKEX_STAKING_HPP

#include "chaindata.hpp"

#include <string>
#include <vector>

namespace stakex
{

/**
 * Returns true if the given method name is one of the staking-pool methods
 * that we index.
 */
bool IsStakingMethod (const std::string& method);

/**
 * Returns true if the given staking method operates on the delegator's
 * whole balance (and thus has no explicit amount).
 */
bool IsAllBalanceMethod (const std::string& method);

/**
 * Returns the coarse direction ("stake" or "unstake") of a staking method.
 */
std::string GetStakeDirection (const std::string& method);

/**
 * Tries to extract a staking transaction for the given pool from a
 * transaction included in the given block.  Returns false if the transaction
 * is not a staking transaction to the pool.  Malformed staking calls
 * (e.g. with an unparsable amount) are logged and skipped as well.
 */
bool ExtractStakingTransaction (const std::string& pool,
                                const BlockHeader& header,
                                const ChunkTransaction& tx,
                                StakingTransaction& out);

/**
 * Extracts all staking transactions for the pool from a chunk.
 */
std::vector<StakingTransaction> ExtractStakingTransactions (
    const std::string& pool, const BlockHeader& header, const Chunk& chunk);

} // namespace stakex

#endif // STAKEX_STAKING_HPP
