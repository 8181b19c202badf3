// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "errors.hpp"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <sstream>

namespace stakex
{

namespace fs = std::experimental::filesystem;

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

void
SleepSome ()
{
  std::this_thread::sleep_for (std::chrono::milliseconds (10));
}

/* ************************************************************************** */

TempDirectory::TempDirectory ()
{
  static std::atomic<unsigned> counter(0);

  std::ostringstream name;
  name << "stakex-test-" << getpid () << "-" << counter++;

  path = fs::temp_directory_path () / name.str ();
  fs::remove_all (path);
  CHECK (fs::create_directories (path))
      << "Failed to create temporary directory " << path;
  VLOG (1) << "Created temporary directory " << path;
}

TempDirectory::~TempDirectory ()
{
  std::error_code ec;
  fs::remove_all (path, ec);
  if (ec)
    LOG (WARNING)
        << "Failed to remove temporary directory " << path
        << ": " << ec.message ();
}

std::string
TempDirectory::GetPath (const std::string& name) const
{
  return (path / name).string ();
}

/* ************************************************************************** */

void
TestEndpoint::SetHandler (const Handler& h)
{
  std::lock_guard<std::mutex> lock(mut);
  handler = h;
}

void
TestEndpoint::FailNext (const unsigned n)
{
  std::lock_guard<std::mutex> lock(mut);
  failNext = n;
}

void
TestEndpoint::SetDown (const bool d)
{
  std::lock_guard<std::mutex> lock(mut);
  down = d;
}

void
TestEndpoint::SetResponseError (const std::string& msg)
{
  std::lock_guard<std::mutex> lock(mut);
  responseError = msg;
}

unsigned
TestEndpoint::GetNumCalls () const
{
  std::lock_guard<std::mutex> lock(mut);
  return numCalls;
}

std::string
TestEndpoint::GetName () const
{
  return name;
}

Json::Value
TestEndpoint::Call (const std::string& method, const Json::Value& params)
{
  Handler h;
  {
    std::lock_guard<std::mutex> lock(mut);
    ++numCalls;

    if (down)
      throw TransientRpcError (name + " is down");
    if (failNext > 0)
      {
        --failNext;
        throw TransientRpcError (name + " timed out");
      }
    if (!responseError.empty ())
      throw RpcResponseError (responseError, -32000, false);

    h = handler;
  }

  if (h)
    return h (method, params);

  Json::Value res(Json::objectValue);
  res["endpoint"] = name;
  res["method"] = method;
  res["params"] = params;

  return res;
}

/* ************************************************************************** */

Block
TestChain::AddBlock (const uint64_t height, const std::string& epochId)
{
  std::lock_guard<std::mutex> lock(mut);

  Block blk;
  blk.header.height = height;
  blk.header.hash = "block " + std::to_string (height);
  blk.header.epochId = epochId;
  blk.header.timestampNs = height * 1'000'000'000;
  blk.header.gasPrice = 100;

  if (!blocks.empty ())
    {
      const auto& prev = blocks.rbegin ()->second;
      CHECK_LT (prev.header.height, height) << "Blocks added out of order";
      blk.header.prevHash = prev.header.hash;
    }
  else
    blk.header.prevHash = "block " + std::to_string (height - 1);

  ChunkHeader ch;
  ch.hash = "chunk " + std::to_string (height);
  ch.heightIncluded = height;
  blk.chunks.push_back (ch);

  Chunk chunk;
  chunk.hash = ch.hash;
  chunks[ch.hash] = chunk;

  blocks[height] = blk;
  finalHeight = height;

  return blk;
}

void
TestChain::AddBlocks (const uint64_t from, const uint64_t to,
                      const std::string& epochId)
{
  for (uint64_t h = from; h <= to; ++h)
    AddBlock (h, epochId);
}

void
TestChain::AddTransaction (const uint64_t height, const ChunkTransaction& tx)
{
  std::lock_guard<std::mutex> lock(mut);
  chunks.at ("chunk " + std::to_string (height)).transactions.push_back (tx);
}

void
TestChain::AddPoolCall (const uint64_t height, const std::string& hash,
                        const std::string& signer, const std::string& pool,
                        const std::string& method, const std::string& args,
                        const Amount& deposit)
{
  ActionData action;
  action.kind = "FunctionCall";
  action.method = method;
  action.args = args;
  action.deposit = deposit;
  action.gas = 1'000;

  ChunkTransaction tx;
  tx.hash = hash;
  tx.signer = signer;
  tx.receiver = pool;
  tx.actions.push_back (action);

  AddTransaction (height, tx);
}

void
TestChain::SetFinalHeight (const uint64_t h)
{
  std::lock_guard<std::mutex> lock(mut);
  finalHeight = h;
}

void
TestChain::SetValidators (const std::string& epochId, const ValidatorSet& v)
{
  std::lock_guard<std::mutex> lock(mut);
  validators[epochId] = v;
}

void
TestChain::SetPoolAccounts (const std::string& blockHash,
                            const std::vector<PoolAccount>& accounts)
{
  std::lock_guard<std::mutex> lock(mut);
  poolAccounts[blockHash] = accounts;
}

void
TestChain::SetBlockFailure (const uint64_t height, const bool fail)
{
  std::lock_guard<std::mutex> lock(mut);
  if (fail)
    failingHeights.insert (height);
  else
    failingHeights.erase (height);
}

void
TestChain::SetDelay (const std::chrono::milliseconds d)
{
  std::lock_guard<std::mutex> lock(mut);
  delay = d;
}

unsigned
TestChain::GetNumBlockCalls () const
{
  std::lock_guard<std::mutex> lock(mut);
  return numBlockCalls;
}

unsigned
TestChain::GetNumCycles () const
{
  std::lock_guard<std::mutex> lock(mut);
  return numCycles;
}

void
TestChain::NewCycle ()
{
  std::lock_guard<std::mutex> lock(mut);
  ++numCycles;
}

uint64_t
TestChain::GetFinalHeight ()
{
  std::lock_guard<std::mutex> lock(mut);
  return finalHeight;
}

bool
TestChain::GetBlock (const uint64_t height, Block& blk)
{
  std::chrono::milliseconds d;
  {
    std::lock_guard<std::mutex> lock(mut);
    ++numBlockCalls;
    d = delay;
  }

  if (d.count () > 0)
    std::this_thread::sleep_for (d);

  std::lock_guard<std::mutex> lock(mut);

  if (failingHeights.count (height) > 0)
    throw TerminalRpcError ("block " + std::to_string (height) + " failed");

  const auto mit = blocks.find (height);
  if (mit == blocks.end ())
    return false;

  blk = mit->second;
  return true;
}

Chunk
TestChain::GetChunk (const std::string& hash)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = chunks.find (hash);
  if (mit == chunks.end ())
    throw RpcResponseError ("UNKNOWN_CHUNK", -32000, true);

  return mit->second;
}

ValidatorSet
TestChain::GetValidators (const std::string& epochId)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = validators.find (epochId);
  if (mit == validators.end ())
    throw RpcResponseError ("UNKNOWN_EPOCH", -32000, true);

  return mit->second;
}

EpochInfo
TestChain::GetEpochInfo (const std::string& epochId)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = validators.find (epochId);
  if (mit == validators.end ())
    throw RpcResponseError ("UNKNOWN_EPOCH", -32000, true);

  EpochInfo res;
  res.epochId = epochId;
  res.startHeight = mit->second.epochStartHeight;
  res.epochHeight = mit->second.epochHeight;

  return res;
}

std::vector<PoolAccount>
TestChain::GetPoolAccounts (const std::string& pool,
                            const std::string& blockHash)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = poolAccounts.find (blockHash);
  if (mit == poolAccounts.end ())
    return {};

  return mit->second;
}

/* ************************************************************************** */

void
TestDocumentStore::MaybeFail ()
{
  std::lock_guard<std::mutex> lock(mutFail);
  ++numWrites;
  if (failWrites == 0)
    return;

  --failWrites;
  throw PersistenceError ("injected write failure");
}

void
TestDocumentStore::FailWrites (const unsigned n)
{
  std::lock_guard<std::mutex> lock(mutFail);
  failWrites = n;
}

unsigned
TestDocumentStore::GetNumWrites ()
{
  std::lock_guard<std::mutex> lock(mutFail);
  return numWrites;
}

void
TestDocumentStore::Upsert (const std::string& collection, const Document& doc)
{
  MaybeFail ();
  MemoryDocumentStore::Upsert (collection, doc);
}

void
TestDocumentStore::UpsertMany (const std::string& collection,
                               const std::vector<Document>& docs)
{
  MaybeFail ();
  MemoryDocumentStore::UpsertMany (collection, docs);
}

bool
TestDocumentStore::InsertIfAbsent (const std::string& collection,
                                   const Document& doc)
{
  MaybeFail ();
  return MemoryDocumentStore::InsertIfAbsent (collection, doc);
}

/* ************************************************************************** */

TestZmqSubscriber::TestZmqSubscriber (const std::string& addr)
  : sock(ctx, ZMQ_SUB)
{
  std::lock_guard<std::mutex> lock(mut);

  sock.connect (addr);
  sock.set (zmq::sockopt::subscribe, "");
  LOG (INFO) << "Connected ZMQ subscriber to " << addr;

  shouldStop = false;
  receiver = std::make_unique<std::thread> ([this] ()
    {
      ReceiveLoop ();
    });
}

TestZmqSubscriber::~TestZmqSubscriber ()
{
  std::unique_lock<std::mutex> lock(mut);

  shouldStop = true;
  lock.unlock ();
  receiver->join ();
  lock.lock ();

  receiver.reset ();
  sock.close ();

  for (const auto& m : messages)
    EXPECT_TRUE (m.second.empty ())
        << "Unexpected messages for " << m.first << " received";
}

void
TestZmqSubscriber::ReceiveLoop ()
{
  std::unique_lock<std::mutex> lock(mut);
  while (!shouldStop)
    {
      zmq::message_t msg;
      if (!sock.recv (msg, zmq::recv_flags::dontwait))
        {
          /* No messages available.  Just sleep a bit and try again.  */
          lock.unlock ();
          std::this_thread::sleep_for (std::chrono::milliseconds (1));
          lock.lock ();
          continue;
        }

      const std::string topic = msg.to_string ();
      VLOG (1) << "Received notification: " << topic;
      ASSERT_EQ (sock.get (zmq::sockopt::rcvmore), 1);

      /* Messages are delivered atomically, so the other parts must be here.  */
      ASSERT_TRUE (sock.recv (msg, zmq::recv_flags::dontwait));
      const std::string data = msg.to_string ();
      ASSERT_EQ (sock.get (zmq::sockopt::rcvmore), 1);

      ASSERT_TRUE (sock.recv (msg, zmq::recv_flags::dontwait));
      const uint8_t* seqBytes = static_cast<const uint8_t*> (msg.data ());
      uint32_t seq = 0;
      ASSERT_EQ (msg.size (), sizeof (seq)) << "Invalid sized sequence number";
      ASSERT_EQ (sock.get (zmq::sockopt::rcvmore), 0);
      for (unsigned i = 0; i < sizeof (seq); ++i)
        seq |= seqBytes[i] << (8 * i);

      /* Check that the sequence number matches.  */
      ASSERT_EQ (seq, nextSeq[topic]);
      ++nextSeq[topic];

      /* Parse and enqueue the message.  */
      messages[topic].push (ParseJson (data));
      cv.notify_all ();
    }
}

std::vector<Json::Value>
TestZmqSubscriber::AwaitMessages (const std::string& cmd, const size_t num)
{
  std::unique_lock<std::mutex> lock(mut);

  std::vector<Json::Value> res;
  while (res.size () < num)
    {
      while (messages[cmd].empty ())
        cv.wait (lock);

      auto& received = messages[cmd];
      res.push_back (std::move (received.front ()));
      received.pop ();
    }

  return res;
}

void
TestZmqSubscriber::ForgetAll ()
{
  std::lock_guard<std::mutex> lock(mut);
  messages.clear ();
}

/* ************************************************************************** */

} // namespace stakex
