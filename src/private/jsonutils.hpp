// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_JSONUTILS_HPP
#define STAKEX_JSONUTILS_HPP

#include "amount.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>

namespace stakex
{

/**
 * Converts a JSON value to a serialised string, in the way we do that for
 * storing JSON into e.g. a database.
 */
std::string StoreJson (const Json::Value& val);

/**
 * Tries to parse JSON from a string that was stored in a database or otherwise
 * saved with StoreJson previously.  CHECK fails if it is invalid.
 */
Json::Value LoadJson (const std::string& str);

/**
 * Parses JSON that comes from an untrusted source (e.g. function-call
 * arguments inside a transaction).  Returns false if the string is not
 * valid JSON.
 */
bool ParseUntrustedJson (const std::string& str, Json::Value& val);

/**
 * Extracts a string member from a JSON object.  Throws MalformedDataError
 * if it is missing or not a string.
 */
std::string GetStringField (const Json::Value& obj, const std::string& key);

/**
 * Extracts an unsigned integer member from a JSON object.  Throws
 * MalformedDataError if it is missing or invalid.
 */
uint64_t GetUIntField (const Json::Value& obj, const std::string& key);

/**
 * Extracts an amount (decimal string or integer) from a JSON object.
 * Throws MalformedDataError if it is missing or invalid.
 */
Amount GetAmountField (const Json::Value& obj, const std::string& key);

} // namespace stakex

#endif // STAKEX_JSONUTILS_HPP
