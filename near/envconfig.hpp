// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_NEAR_ENVCONFIG_HPP
#define STAKEX_NEAR_ENVCONFIG_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace stakex
{

/**
 * Binds an environment variable to the command-line flag whose default
 * value it provides.
 */
struct EnvFlag
{
  std::string env;
  std::string flag;
};

/**
 * Source of environment-style configuration values.  Values set in the
 * process environment take precedence over those loaded from a file.
 */
class Environment
{

public:

  /**
   * Function that looks up a variable in the process environment.  It
   * returns false if the variable is not set.
   */
  using Lookup = std::function<bool (const std::string&, std::string&)>;

private:

  /** Lookup in the process environment.  */
  const Lookup lookup;

  /** Values loaded from files.  */
  std::map<std::string, std::string> fileValues;

public:

  /**
   * Constructs an instance based on the real process environment.
   */
  Environment ();

  explicit Environment (const Lookup& l)
    : lookup(l)
  {}

  Environment (const Environment&) = delete;
  void operator= (const Environment&) = delete;

  /**
   * Loads KEY=VALUE lines from a file like ".env".  Empty lines and
   * comments starting with '#' are ignored, and values may be quoted.
   * Returns false if the file does not exist, and throws std::runtime_error
   * if it is malformed.
   */
  bool LoadFile (const std::string& path);

  /**
   * Looks up a variable.  Returns false if it is not set anywhere.
   */
  bool Get (const std::string& key, std::string& value) const;

};

/**
 * Sets the default values of the given flags from the environment, so that
 * values explicitly passed on the command line still win when the flags are
 * parsed afterwards.  Returns the number of flags that were set.  Throws
 * std::runtime_error if a value is invalid for its flag.
 */
unsigned ApplyEnvironment (const Environment& env,
                           const std::vector<EnvFlag>& bindings);

} // namespace stakex

#endif // STAKEX_NEAR_ENVCONFIG_HPP
