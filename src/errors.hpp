// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_ERRORS_HPP
#define STAKEX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stakex
{

/**
 * Base class for all errors that come from talking to the chain RPC
 * endpoints.
 */
class RpcError : public std::runtime_error
{

public:

  using std::runtime_error::runtime_error;

};

/**
 * A failure that is expected to go away if the call is retried, like
 * a timeout, a refused connection, an HTTP server error or rate limiting.
 */
class TransientRpcError : public RpcError
{

public:

  using RpcError::RpcError;

};

/**
 * Thrown by the RPC gateway when a call failed on all endpoints after
 * their retry budget has been exhausted.
 */
class TerminalRpcError : public RpcError
{

public:

  using RpcError::RpcError;

};

/**
 * The chain answered the request, but with an error that will not go
 * away by retrying (e.g. the requested block does not exist).
 */
class RpcResponseError : public RpcError
{

private:

  /** The JSON-RPC error code.  */
  int code;

  /**
   * Set if the error indicates that the requested entity (block, chunk,
   * epoch) is not known to the node.
   */
  bool unknownEntity;

public:

  explicit RpcResponseError (const std::string& msg, const int c,
                             const bool unknown)
    : RpcError(msg), code(c), unknownEntity(unknown)
  {}

  int
  GetCode () const
  {
    return code;
  }

  bool
  IsUnknownEntity () const
  {
    return unknownEntity;
  }

};

/**
 * Data returned from the chain has an unexpected shape.  The offending
 * record is skipped by the caller.
 */
class MalformedDataError : public std::runtime_error
{

public:

  using std::runtime_error::runtime_error;

};

/**
 * The persisted checkpoints are inconsistent (e.g. overlapping ranges),
 * or a new checkpoint would make them so.
 */
class CheckpointError : public std::runtime_error
{

public:

  using std::runtime_error::runtime_error;

};

/**
 * Error reading from or writing to the document store.
 */
class PersistenceError : public std::runtime_error
{

public:

  using std::runtime_error::runtime_error;

};

} // namespace stakex

#endif // STAKEX_ERRORS_HPP
