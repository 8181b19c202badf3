// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_RPCUTILS_HPP
#define STAKEX_RPCUTILS_HPP

#include <map>
#include <string>

namespace stakex
{

/** A list of headers that can be added to the requests.  */
using RpcHeaders = std::map<std::string, std::string>;

/**
 * Parses a string into a list of headers.  The format is:
 *  header1=value1;header2=value2;...
 */
RpcHeaders ParseRpcHeaders (const std::string& str);

/**
 * Returns the endpoint URL with user credentials (if any) and the
 * query string removed, so that it can be logged safely.  Providers often
 * put API keys into one of those.
 */
std::string RedactRpcUrl (const std::string& url);

} // namespace stakex

#endif // STAKEX_RPCUTILS_HPP
