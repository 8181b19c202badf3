// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_AMOUNT_HPP
#define STAKEX_AMOUNT_HPP

#include <boost/multiprecision/cpp_int.hpp>

#include <json/json.h>

#include <string>

namespace stakex
{

/**
 * Token amounts in the smallest unit of the chain (yocto).  They do not
 * fit into 64 bits, so we use an arbitrary precision integer.
 */
using Amount = boost::multiprecision::cpp_int;

/**
 * Parses a decimal amount string.  Surrounding whitespace and quotes are
 * ignored, and so is a fractional part (".123") if present.  Returns false
 * if the string is not a valid non-negative integer.
 */
bool ParseAmount (const std::string& str, Amount& out);

/**
 * Parses an amount from a JSON value, which may be a string or an
 * unsigned integer.
 */
bool ParseAmount (const Json::Value& val, Amount& out);

/**
 * Formats an amount as decimal string.
 */
std::string FormatAmount (const Amount& a);

/**
 * Converts an amount to double, e.g. for computing ratios.
 */
double AmountToDouble (const Amount& a);

} // namespace stakex

#endif // STAKEX_AMOUNT_HPP
