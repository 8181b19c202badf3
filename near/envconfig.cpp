// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "envconfig.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace stakex
{

namespace
{

/** Characters treated as whitespace when trimming.  */
constexpr const char* WHITESPACE = " \t\r";

std::string
Trim (const std::string& str)
{
  const auto start = str.find_first_not_of (WHITESPACE);
  if (start == std::string::npos)
    return "";
  const auto end = str.find_last_not_of (WHITESPACE);
  return str.substr (start, end - start + 1);
}

} // anonymous namespace

Environment::Environment ()
  : lookup([] (const std::string& key, std::string& value)
      {
        const char* val = std::getenv (key.c_str ());
        if (val == nullptr)
          return false;
        value = val;
        return true;
      })
{}

bool
Environment::LoadFile (const std::string& path)
{
  std::ifstream in(path);
  if (!in)
    return false;

  std::string line;
  unsigned lineNum = 0;
  while (std::getline (in, line))
    {
      ++lineNum;

      line = Trim (line);
      if (line.empty () || line[0] == '#')
        continue;

      if (line.compare (0, 7, "export ") == 0)
        line = Trim (line.substr (7));

      const auto eq = line.find ('=');
      const std::string key = Trim (line.substr (0, eq));
      if (eq == std::string::npos || key.empty ())
        {
          std::ostringstream msg;
          msg << path << ":" << lineNum << ": expected KEY=VALUE";
          throw std::runtime_error (msg.str ());
        }

      std::string value = Trim (line.substr (eq + 1));
      if (value.size () >= 2
            && (value.front () == '"' || value.front () == '\'')
            && value.back () == value.front ())
        value = value.substr (1, value.size () - 2);

      fileValues[key] = value;
    }

  LOG (INFO) << "Loaded " << fileValues.size () << " values from " << path;
  return true;
}

bool
Environment::Get (const std::string& key, std::string& value) const
{
  if (lookup (key, value))
    return true;

  const auto mit = fileValues.find (key);
  if (mit == fileValues.end ())
    return false;

  value = mit->second;
  return true;
}

unsigned
ApplyEnvironment (const Environment& env, const std::vector<EnvFlag>& bindings)
{
  unsigned res = 0;
  for (const auto& b : bindings)
    {
      std::string value;
      if (!env.Get (b.env, value))
        continue;

      const std::string set = gflags::SetCommandLineOptionWithMode (
          b.flag.c_str (), value.c_str (), gflags::SET_FLAGS_DEFAULT);
      if (set.empty ())
        throw std::runtime_error ("invalid value for " + b.env + ": " + value);

      VLOG (1) << "Default for --" << b.flag << " taken from " << b.env;
      ++res;
    }

  return res;
}

} // namespace stakex
