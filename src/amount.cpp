// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.hpp"

#include <glog/logging.h>

#include <cctype>

namespace stakex
{

bool
ParseAmount (const std::string& str, Amount& out)
{
  size_t begin = 0;
  size_t end = str.size ();
  const auto isPadding = [&str] (const size_t i)
    {
      const unsigned char c = str[i];
      return std::isspace (c) || c == '"';
    };
  while (begin < end && isPadding (begin))
    ++begin;
  while (end > begin && isPadding (end - 1))
    --end;

  const size_t dot = str.find ('.', begin);
  if (dot != std::string::npos && dot < end)
    end = dot;

  if (begin == end)
    return false;

  for (size_t i = begin; i < end; ++i)
    if (!std::isdigit (static_cast<unsigned char> (str[i])))
      return false;

  out = Amount (str.substr (begin, end - begin));
  return true;
}

bool
ParseAmount (const Json::Value& val, Amount& out)
{
  if (val.isString ())
    return ParseAmount (val.asString (), out);

  if (val.isUInt64 ())
    {
      out = val.asUInt64 ();
      return true;
    }

  return false;
}

std::string
FormatAmount (const Amount& a)
{
  return a.str ();
}

double
AmountToDouble (const Amount& a)
{
  return a.convert_to<double> ();
}

} // namespace stakex
