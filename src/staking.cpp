// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "staking.hpp"

#include "private/jsonutils.hpp"

#include <glog/logging.h>

#include <set>

namespace stakex
{

namespace
{

/** The action kind of function calls.  */
constexpr const char* FUNCTION_CALL = "FunctionCall";

/** All staking-pool methods we index.  */
const std::set<std::string> STAKING_METHODS =
  {
    "stake",
    "stake_all",
    "deposit",
    "deposit_and_stake",
    "unstake",
    "unstake_all",
    "withdraw",
    "withdraw_all",
  };

/**
 * Determines the amount of a staking action.  Returns false if the
 * action is malformed.
 */
bool
GetActionAmount (const ActionData& action, Amount& out)
{
  if (action.method == "deposit" || action.method == "deposit_and_stake")
    {
      out = action.deposit;
      return true;
    }

  if (IsAllBalanceMethod (action.method))
    {
      out = 0;
      return true;
    }

  Json::Value args;
  if (!ParseUntrustedJson (action.args, args) || !args.isObject ())
    return false;

  return ParseAmount (args["amount"], out);
}

} // anonymous namespace

bool
IsStakingMethod (const std::string& method)
{
  return STAKING_METHODS.count (method) > 0;
}

bool
IsAllBalanceMethod (const std::string& method)
{
  return method == "stake_all" || method == "unstake_all"
            || method == "withdraw_all";
}

std::string
GetStakeDirection (const std::string& method)
{
  CHECK (IsStakingMethod (method)) << "Not a staking method: " << method;

  if (method.find ("stake") == 0 || method.find ("deposit") == 0)
    return "stake";
  return "unstake";
}

bool
ExtractStakingTransaction (const std::string& pool, const BlockHeader& header,
                           const ChunkTransaction& tx, StakingTransaction& out)
{
  if (tx.receiver != pool)
    return false;

  /* A transaction may contain multiple actions (e.g. a deposit followed
     by a stake).  We record the transaction once, based on the first
     staking call that is not a plain deposit, if there is one.  */
  const ActionData* chosen = nullptr;
  uint64_t totalGas = 0;
  for (const auto& action : tx.actions)
    {
      totalGas += action.gas;
      if (action.kind != FUNCTION_CALL || !IsStakingMethod (action.method))
        continue;

      if (chosen == nullptr
            || (chosen->method == "deposit" && action.method != "deposit"))
        chosen = &action;
    }

  if (chosen == nullptr)
    return false;

  Amount amount;
  if (!GetActionAmount (*chosen, amount))
    {
      LOG (WARNING)
          << "Ignoring malformed " << chosen->method << " call in " << tx.hash
          << " at height " << header.height << ":\n" << chosen->args;
      return false;
    }

  out = StakingTransaction ();
  out.hash = tx.hash;
  out.amount = amount;
  out.method = chosen->method;
  out.action = chosen->kind;
  out.type = GetStakeDirection (chosen->method);
  out.blockHeight = header.height;
  out.timestamp = header.GetTimestampMs ();
  out.delegator = tx.signer;
  out.gasFee = header.gasPrice * totalGas;

  VLOG (1) << "Found staking transaction: " << out;
  return true;
}

std::vector<StakingTransaction>
ExtractStakingTransactions (const std::string& pool, const BlockHeader& header,
                            const Chunk& chunk)
{
  std::vector<StakingTransaction> res;
  for (const auto& tx : chunk.transactions)
    {
      StakingTransaction stx;
      if (ExtractStakingTransaction (pool, header, tx, stx))
        res.push_back (std::move (stx));
    }

  return res;
}

} // namespace stakex
