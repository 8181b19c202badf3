// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_RPCGATEWAY_HPP
#define STAKEX_RPCGATEWAY_HPP

#include "rpcutils.hpp"

#include <json/json.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace stakex
{

/**
 * A single JSON-RPC endpoint of a chain node.  Implementations must be
 * safe to call from multiple threads at the same time.
 */
class RpcEndpoint
{

public:

  RpcEndpoint () = default;
  virtual ~RpcEndpoint () = default;

  RpcEndpoint (const RpcEndpoint&) = delete;
  void operator= (const RpcEndpoint&) = delete;

  /**
   * Returns a name for the endpoint that is used in log messages.
   */
  virtual std::string GetName () const = 0;

  /**
   * Performs a single call of the given method.  Failures are reported
   * as TransientRpcError (if they may go away on a retry) or as
   * RpcResponseError (if the node answered with a definite error).
   */
  virtual Json::Value Call (const std::string& method,
                            const Json::Value& params) = 0;

};

/**
 * RpcEndpoint talking JSON-RPC 2.0 over HTTP.
 */
class HttpRpcEndpoint : public RpcEndpoint
{

private:

  /** The URL to connect to.  */
  const std::string url;

  /** Extra headers sent with each request.  */
  const RpcHeaders headers;

public:

  explicit HttpRpcEndpoint (const std::string& u, const RpcHeaders& h)
    : url(u), headers(h)
  {}

  std::string GetName () const override;
  Json::Value Call (const std::string& method,
                    const Json::Value& params) override;

};

/**
 * Converts an error returned from a JSON-RPC call into the right
 * exception type and throws it.  Network-level errors as well as errors
 * that indicate an overloaded node become TransientRpcError, and all others
 * RpcResponseError.
 */
[[noreturn]] void ThrowForRpcError (int code, const std::string& msg,
                                    const Json::Value& data);

/**
 * The policy for retrying failed calls on one endpoint and for
 * putting endpoints into cooldown.
 */
struct RetryPolicy
{

  /** Number of attempts per endpoint (including the first one).  */
  unsigned maxAttempts = 3;

  /** Delay before the first retry.  Doubles for every following retry.  */
  std::chrono::milliseconds baseDelay{200};

  /** Upper bound for the retry delay.  */
  std::chrono::milliseconds maxDelay{5'000};

  /**
   * Relative jitter applied to each delay.  With a jitter of 0.2, the
   * actual delay is chosen uniformly between 80% and 100% of the
   * nominal value.
   */
  double jitter = 0.2;

  /**
   * Number of consecutive failed calls after which an endpoint is put
   * into cooldown.
   */
  unsigned cooldownThreshold = 3;

  /** How long an endpoint stays in cooldown.  */
  std::chrono::milliseconds cooldown{60'000};

  /**
   * Constructs the policy based on the command-line flags.
   */
  static RetryPolicy FromFlags ();

};

/**
 * Uniform access to the chain through a primary and a secondary (failover)
 * endpoint, with retries and a simple circuit breaker.  This is safe to
 * use from multiple threads.
 */
class RpcGateway
{

public:

  using Clock = std::chrono::steady_clock;

  /** Function used for sleeping between retries.  */
  using Sleeper = std::function<void (std::chrono::milliseconds)>;

private:

  /**
   * Data about one of the endpoints we use.
   */
  struct EndpointState
  {

    /** The endpoint itself.  */
    std::unique_ptr<RpcEndpoint> endpoint;

    /** Number of calls that failed since the last successful one.  */
    unsigned consecutiveFailures = 0;

    /** If set, the time until which this endpoint is cooling down.  */
    Clock::time_point coolingUntil;

  };

  /** The endpoints, in order of preference.  */
  std::vector<EndpointState> endpoints;

  /** The retry policy.  */
  const RetryPolicy policy;

  /** The function used for sleeping.  */
  Sleeper sleeper;

  /** Lock for the health state and random generator.  */
  mutable std::mutex mut;

  /** Random generator for jitter.  */
  std::mt19937_64 rnd;

  /**
   * Returns the indices of endpoints in the order they should be tried
   * for the next call.  Endpoints that are cooling down are skipped,
   * unless all of them are.
   */
  std::vector<size_t> GetCallOrder () const;

  /**
   * Computes the (jittered) delay before the given retry (counting
   * from zero).
   */
  std::chrono::milliseconds GetRetryDelay (unsigned retry);

  /**
   * Updates the health state for a call that succeeded.
   */
  void RecordSuccess (size_t ind);

  /**
   * Updates the health state after all attempts of a call failed on
   * the given endpoint.
   */
  void RecordFailure (size_t ind);

public:

  explicit RpcGateway (std::unique_ptr<RpcEndpoint> primary,
                       std::unique_ptr<RpcEndpoint> secondary,
                       const RetryPolicy& p);

  RpcGateway () = delete;
  RpcGateway (const RpcGateway&) = delete;
  void operator= (const RpcGateway&) = delete;

  /**
   * Overrides the function used for sleeping, which is useful for tests.
   */
  void SetSleeper (const Sleeper& s);

  /**
   * Performs a call.  Transient failures are retried and then failed
   * over to the secondary endpoint.  Throws TerminalRpcError if all
   * endpoints failed, and passes on RpcResponseError right away.
   */
  Json::Value Call (const std::string& method, const Json::Value& params);

  /**
   * Clears all health state, so that all endpoints are tried again (in
   * order of preference) on the next call.
   */
  void ResetHealth ();

  /**
   * Returns true if the endpoint with the given index (0 for primary,
   * 1 for secondary) is currently cooling down.
   */
  bool IsCoolingDown (size_t ind) const;

};

} // namespace stakex

#endif // STAKEX_RPCGATEWAY_HPP
