// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcutils.hpp"

#include <glog/logging.h>

namespace stakex
{

RpcHeaders
ParseRpcHeaders (const std::string& str)
{
  RpcHeaders res;

  if (str.empty ())
    return res;

  size_t pos = 0;
  while (true)
    {
      size_t keyEnd = str.find ('=', pos);
      if (keyEnd == std::string::npos)
        {
          LOG (WARNING)
              << "Ignoring invalid tail for headers: "
              << str.substr (pos);
          return res;
        }

      size_t valueEnd = str.find (';', pos);
      if (valueEnd < keyEnd)
        {
          LOG (WARNING)
              << "Ignoring invalid tail for headers: "
              << str.substr (pos);
          return res;
        }
      CHECK_GT (valueEnd, keyEnd);

      const std::string key = str.substr (pos, keyEnd - pos);
      const std::string value = str.substr (keyEnd + 1, valueEnd - keyEnd - 1);
      res.emplace (key, value);

      if (valueEnd == std::string::npos)
        return res;

      pos = valueEnd + 1;
    }

  return res;
}

std::string
RedactRpcUrl (const std::string& url)
{
  std::string res = url;

  const size_t query = res.find ('?');
  if (query != std::string::npos)
    res = res.substr (0, query);

  size_t hostStart = res.find ("://");
  if (hostStart == std::string::npos)
    hostStart = 0;
  else
    hostStart += 3;

  const size_t hostEnd = res.find ('/', hostStart);
  const size_t at = res.rfind ('@', hostEnd);
  if (at != std::string::npos && at >= hostStart)
    res = res.substr (0, hostStart) + res.substr (at + 1);

  return res;
}

} // namespace stakex
