// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/jsonutils.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace stakex
{

namespace
{

/**
 * Returns the reader settings we use for all parsing.
 */
Json::CharReaderBuilder
GetReaderBuilder ()
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  return rbuilder;
}

/**
 * Looks up a member of a JSON object, throwing if the value is not
 * an object at all.
 */
const Json::Value&
GetMember (const Json::Value& obj, const std::string& key)
{
  if (!obj.isObject ())
    throw MalformedDataError ("expected JSON object for field " + key);
  return obj[key];
}

} // anonymous namespace

std::string
StoreJson (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;
  wbuilder["dropNullPlaceholders"] = false;
  wbuilder["useSpecialFloats"] = false;

  return Json::writeString (wbuilder, val);
}

Json::Value
LoadJson (const std::string& str)
{
  Json::Value res;
  std::string parseErrs;
  std::istringstream in(str);
  CHECK (Json::parseFromStream (GetReaderBuilder (), in, &res, &parseErrs))
      << "Invalid JSON stored: " << parseErrs << "\n" << str;

  return res;
}

bool
ParseUntrustedJson (const std::string& str, Json::Value& val)
{
  std::string parseErrs;
  std::istringstream in(str);
  if (!Json::parseFromStream (GetReaderBuilder (), in, &val, &parseErrs))
    {
      VLOG (1) << "Failed to parse JSON: " << parseErrs << "\n" << str;
      return false;
    }

  return true;
}

std::string
GetStringField (const Json::Value& obj, const std::string& key)
{
  const auto& field = GetMember (obj, key);
  if (!field.isString ())
    throw MalformedDataError ("missing or invalid string field: " + key);
  return field.asString ();
}

uint64_t
GetUIntField (const Json::Value& obj, const std::string& key)
{
  const auto& field = GetMember (obj, key);
  if (!field.isUInt64 ())
    throw MalformedDataError ("missing or invalid integer field: " + key);
  return field.asUInt64 ();
}

Amount
GetAmountField (const Json::Value& obj, const std::string& key)
{
  Amount res;
  if (!ParseAmount (GetMember (obj, key), res))
    throw MalformedDataError ("missing or invalid amount field: " + key);
  return res;
}

} // namespace stakex
