// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcgateway.hpp"

#include "errors.hpp"
#include "private/jsonutils.hpp"

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/client/connectors/httpclient.h>
#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <sstream>
#include <thread>

namespace stakex
{

DEFINE_int32 (rpc_timeout_ms, 30'000,
              "timeout for a single RPC call to a chain node");
DEFINE_int32 (rpc_max_attempts, 3,
              "number of attempts per endpoint for a failing RPC call");
DEFINE_int32 (rpc_base_delay_ms, 200,
              "delay before the first retry of a failed RPC call");
DEFINE_int32 (rpc_max_delay_ms, 5'000,
              "maximum delay between retries of a failed RPC call");
DEFINE_double (rpc_jitter, 0.2,
               "relative random jitter applied to RPC retry delays");
DEFINE_int32 (rpc_cooldown_threshold, 3,
              "consecutive failed calls after which an endpoint is skipped");
DEFINE_int32 (rpc_cooldown_ms, 60'000,
              "how long a failing endpoint is skipped");

/* ************************************************************************** */

namespace
{

/**
 * Error strings returned by nodes for requests that refer to blocks,
 * chunks or epochs that are not known (yet or anymore).
 */
const char* const UNKNOWN_ENTITY_ERRORS[] =
  {
    "UNKNOWN_BLOCK",
    "UNKNOWN_CHUNK",
    "UNKNOWN_EPOCH",
    "DB Not Found",
  };

/**
 * Error strings that indicate a temporary problem on the node (overload,
 * timeouts) even though it answered.
 */
const char* const TRANSIENT_SERVER_ERRORS[] =
  {
    "TIMEOUT_ERROR",
    "Timeout",
    "TooManyRequests",
    "NOT_SYNCED_YET",
  };

/**
 * Returns true if the text contains any of the given needles.
 */
template <size_t N>
  bool
  ContainsAny (const std::string& text, const char* const (&needles)[N])
{
  for (const auto* n : needles)
    if (text.find (n) != std::string::npos)
      return true;
  return false;
}

} // anonymous namespace

void
ThrowForRpcError (const int code, const std::string& msg,
                  const Json::Value& data)
{
  std::ostringstream full;
  full << "RPC error " << code << ": " << msg;
  std::string dataStr;
  if (!data.isNull ())
    {
      dataStr = data.isString () ? data.asString () : StoreJson (data);
      full << " (" << dataStr << ")";
    }
  const std::string text = msg + " " + dataStr;

  /* The error constants of libjson-rpc-cpp are not constant expressions,
     so we can't use a switch here.  */
  if (code == jsonrpc::Errors::ERROR_CLIENT_CONNECTOR
        || code == jsonrpc::Errors::ERROR_CLIENT_INVALID_RESPONSE
        || code == jsonrpc::Errors::ERROR_RPC_JSON_PARSE_ERROR)
    throw TransientRpcError (full.str ());

  /* libjson-rpc-cpp reports non-2xx HTTP status codes as internal error,
     and nodes use it for their own internal failures as well.  */
  if (code == jsonrpc::Errors::ERROR_RPC_INTERNAL_ERROR
        && !ContainsAny (text, UNKNOWN_ENTITY_ERRORS))
    throw TransientRpcError (full.str ());

  if (ContainsAny (text, UNKNOWN_ENTITY_ERRORS))
    throw RpcResponseError (full.str (), code, true);
  if (ContainsAny (text, TRANSIENT_SERVER_ERRORS))
    throw TransientRpcError (full.str ());

  throw RpcResponseError (full.str (), code, false);
}

/* ************************************************************************** */

std::string
HttpRpcEndpoint::GetName () const
{
  return RedactRpcUrl (url);
}

Json::Value
HttpRpcEndpoint::Call (const std::string& method, const Json::Value& params)
{
  /* A fresh connection is used for each call, so that calls from
     multiple fetch workers do not share any state.  */
  jsonrpc::HttpClient http(url);
  http.SetTimeout (FLAGS_rpc_timeout_ms);
  for (const auto& h : headers)
    http.AddHeader (h.first, h.second);

  jsonrpc::Client rpc(http, jsonrpc::JSONRPC_CLIENT_V2);
  try
    {
      return rpc.CallMethod (method, params);
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      ThrowForRpcError (exc.GetCode (), exc.GetMessage (), exc.GetData ());
    }
}

/* ************************************************************************** */

RetryPolicy
RetryPolicy::FromFlags ()
{
  CHECK_GT (FLAGS_rpc_max_attempts, 0);
  CHECK_GE (FLAGS_rpc_base_delay_ms, 0);
  CHECK_GE (FLAGS_rpc_max_delay_ms, FLAGS_rpc_base_delay_ms);
  CHECK (FLAGS_rpc_jitter >= 0.0 && FLAGS_rpc_jitter <= 1.0);
  CHECK_GT (FLAGS_rpc_cooldown_threshold, 0);

  RetryPolicy res;
  res.maxAttempts = FLAGS_rpc_max_attempts;
  res.baseDelay = std::chrono::milliseconds (FLAGS_rpc_base_delay_ms);
  res.maxDelay = std::chrono::milliseconds (FLAGS_rpc_max_delay_ms);
  res.jitter = FLAGS_rpc_jitter;
  res.cooldownThreshold = FLAGS_rpc_cooldown_threshold;
  res.cooldown = std::chrono::milliseconds (FLAGS_rpc_cooldown_ms);

  return res;
}

/* ************************************************************************** */

RpcGateway::RpcGateway (std::unique_ptr<RpcEndpoint> primary,
                        std::unique_ptr<RpcEndpoint> secondary,
                        const RetryPolicy& p)
  : policy(p), rnd(std::random_device () ())
{
  CHECK (primary != nullptr);
  CHECK (secondary != nullptr);
  CHECK_GT (policy.maxAttempts, 0);

  endpoints.resize (2);
  endpoints[0].endpoint = std::move (primary);
  endpoints[1].endpoint = std::move (secondary);

  sleeper = [] (const std::chrono::milliseconds d)
    {
      std::this_thread::sleep_for (d);
    };

  LOG (INFO)
      << "Using RPC endpoints " << endpoints[0].endpoint->GetName ()
      << " (primary) and " << endpoints[1].endpoint->GetName ()
      << " (secondary)";
}

void
RpcGateway::SetSleeper (const Sleeper& s)
{
  std::lock_guard<std::mutex> lock(mut);
  sleeper = s;
}

std::vector<size_t>
RpcGateway::GetCallOrder () const
{
  std::lock_guard<std::mutex> lock(mut);
  const auto now = Clock::now ();

  std::vector<size_t> res;
  for (size_t i = 0; i < endpoints.size (); ++i)
    if (endpoints[i].coolingUntil <= now)
      res.push_back (i);

  if (res.empty ())
    {
      VLOG (1) << "All endpoints are cooling down, trying them anyway";
      for (size_t i = 0; i < endpoints.size (); ++i)
        res.push_back (i);
    }

  return res;
}

std::chrono::milliseconds
RpcGateway::GetRetryDelay (const unsigned retry)
{
  using std::chrono::milliseconds;

  milliseconds nominal = policy.baseDelay;
  for (unsigned i = 0; i < retry && nominal < policy.maxDelay; ++i)
    nominal *= 2;
  nominal = std::min (nominal, policy.maxDelay);

  std::lock_guard<std::mutex> lock(mut);
  std::uniform_real_distribution<double> dist(1.0 - policy.jitter, 1.0);
  return milliseconds (static_cast<int64_t> (nominal.count () * dist (rnd)));
}

void
RpcGateway::RecordSuccess (const size_t ind)
{
  std::lock_guard<std::mutex> lock(mut);
  auto& ep = endpoints[ind];
  ep.consecutiveFailures = 0;
  ep.coolingUntil = Clock::time_point ();
}

void
RpcGateway::RecordFailure (const size_t ind)
{
  std::lock_guard<std::mutex> lock(mut);
  auto& ep = endpoints[ind];

  ++ep.consecutiveFailures;
  if (ep.consecutiveFailures >= policy.cooldownThreshold)
    {
      LOG (WARNING)
          << "Endpoint " << ep.endpoint->GetName () << " failed "
          << ep.consecutiveFailures << " calls in a row, cooling down for "
          << policy.cooldown.count () << " ms";
      ep.coolingUntil = Clock::now () + policy.cooldown;
    }
}

Json::Value
RpcGateway::Call (const std::string& method, const Json::Value& params)
{
  std::string lastError;
  for (const size_t ind : GetCallOrder ())
    {
      RpcEndpoint& ep = *endpoints[ind].endpoint;

      for (unsigned attempt = 0; attempt < policy.maxAttempts; ++attempt)
        {
          if (attempt > 0)
            {
              const auto delay = GetRetryDelay (attempt - 1);
              VLOG (1)
                  << "Retrying " << method << " on " << ep.GetName ()
                  << " after " << delay.count () << " ms";
              Sleeper s;
              {
                std::lock_guard<std::mutex> lock(mut);
                s = sleeper;
              }
              s (delay);
            }

          try
            {
              Json::Value res = ep.Call (method, params);
              RecordSuccess (ind);
              return res;
            }
          catch (const RpcResponseError& exc)
            {
              /* The node is working, it just does not like our request.  */
              RecordSuccess (ind);
              throw;
            }
          catch (const TransientRpcError& exc)
            {
              LOG (WARNING)
                  << "Call to " << method << " on " << ep.GetName ()
                  << " failed (attempt " << (attempt + 1) << "/"
                  << policy.maxAttempts << "): " << exc.what ();
              lastError = exc.what ();
            }
        }

      RecordFailure (ind);
      LOG (WARNING)
          << "Giving up on " << ep.GetName () << " for " << method;
    }

  throw TerminalRpcError ("RPC call " + method
                            + " failed on all endpoints: " + lastError);
}

void
RpcGateway::ResetHealth ()
{
  std::lock_guard<std::mutex> lock(mut);
  for (auto& ep : endpoints)
    {
      ep.consecutiveFailures = 0;
      ep.coolingUntil = Clock::time_point ();
    }
}

bool
RpcGateway::IsCoolingDown (const size_t ind) const
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK_LT (ind, endpoints.size ());
  return endpoints[ind].coolingUntil > Clock::now ();
}

/* ************************************************************************** */

} // namespace stakex
