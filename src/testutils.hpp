// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_TESTUTILS_HPP
#define STAKEX_TESTUTILS_HPP

#include "chainclient.hpp"
#include "chaindata.hpp"
#include "docstore.hpp"
#include "rpcgateway.hpp"

#include <json/json.h>
#include <zmq.hpp>

#include <experimental/filesystem>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace stakex
{

/**
 * Parses a string as JSON, for use in testing when JSON values are needed.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Sleeps for a short amount of time (but enough to trigger other threads).
 */
void SleepSome ();

/**
 * A temporary directory that is created on construction and removed
 * (including all content) when the instance is destructed.
 */
class TempDirectory
{

private:

  /** The path of the directory.  */
  std::experimental::filesystem::path path;

public:

  TempDirectory ();
  ~TempDirectory ();

  TempDirectory (const TempDirectory&) = delete;
  void operator= (const TempDirectory&) = delete;

  /**
   * Returns the full path of a file with the given name inside
   * the directory.
   */
  std::string GetPath (const std::string& name) const;

};

/**
 * An RpcEndpoint that answers calls locally.  By default, each call
 * returns an object echoing the endpoint's name, the method and the params.
 * A custom handler can be installed, and failures can be injected.
 */
class TestEndpoint : public RpcEndpoint
{

public:

  /** A handler for calls.  */
  using Handler
      = std::function<Json::Value (const std::string&, const Json::Value&)>;

private:

  /** The name of this endpoint.  */
  const std::string name;

  /** Lock for the member fields.  */
  mutable std::mutex mut;

  /** The handler for calls, if one is set.  */
  Handler handler;

  /** Number of calls received (including failed ones).  */
  unsigned numCalls = 0;

  /** Number of upcoming calls that should fail with a transient error.  */
  unsigned failNext = 0;

  /** If true, all calls fail with a transient error.  */
  bool down = false;

  /** If non-empty, all calls fail with this response error.  */
  std::string responseError;

public:

  explicit TestEndpoint (const std::string& n)
    : name(n)
  {}

  /**
   * Installs a custom handler for successful calls.
   */
  void SetHandler (const Handler& h);

  /**
   * Makes the next n calls fail with a TransientRpcError.
   */
  void FailNext (unsigned n);

  /**
   * Sets whether or not the endpoint is down, i.e. fails all calls with
   * a TransientRpcError.
   */
  void SetDown (bool d);

  /**
   * Makes all calls fail with an RpcResponseError with the given message.
   * An empty string turns this off again.
   */
  void SetResponseError (const std::string& msg);

  /**
   * Returns the number of calls received so far.
   */
  unsigned GetNumCalls () const;

  std::string GetName () const override;
  Json::Value Call (const std::string& method,
                    const Json::Value& params) override;

};

/**
 * An in-memory ChainClient for tests.  Blocks are added explicitly,
 * each with a single chunk (so that transactions can be added to it).
 * Block hashes are "block <height>", and chunk hashes "chunk <height>".
 */
class TestChain : public ChainClient
{

private:

  /** Lock for the member fields.  */
  mutable std::mutex mut;

  /** All blocks by height.  */
  std::map<uint64_t, Block> blocks;

  /** All chunks by hash.  */
  std::map<std::string, Chunk> chunks;

  /** Validator sets by epoch ID.  */
  std::map<std::string, ValidatorSet> validators;

  /** Pool accounts returned by block hash.  */
  std::map<std::string, std::vector<PoolAccount>> poolAccounts;

  /** The final height, if set explicitly.  */
  uint64_t finalHeight = 0;

  /** Heights for which GetBlock throws a TerminalRpcError.  */
  std::set<uint64_t> failingHeights;

  /** Delay applied to each GetBlock call.  */
  std::chrono::milliseconds delay{0};

  /** Number of GetBlock calls made.  */
  unsigned numBlockCalls = 0;

  /** Number of NewCycle calls made.  */
  unsigned numCycles = 0;

public:

  TestChain () = default;

  /**
   * Adds a block at the given height in the given epoch.  Its parent
   * is the block with the next-lower height that exists.  Blocks have to
   * be added in ascending order.  Also sets the final height to the new
   * block's.  Returns the new block.
   */
  Block AddBlock (uint64_t height, const std::string& epochId);

  /**
   * Adds blocks for all heights in the given range.
   */
  void AddBlocks (uint64_t from, uint64_t to, const std::string& epochId);

  /**
   * Adds a transaction to the chunk of the block at the given height.
   */
  void AddTransaction (uint64_t height, const ChunkTransaction& tx);

  /**
   * Adds a transaction calling a method on the pool with the given
   * (JSON) arguments and attached deposit.
   */
  void AddPoolCall (uint64_t height, const std::string& hash,
                    const std::string& signer, const std::string& pool,
                    const std::string& method, const std::string& args,
                    const Amount& deposit);

  void SetFinalHeight (uint64_t h);

  void SetValidators (const std::string& epochId, const ValidatorSet& v);

  void SetPoolAccounts (const std::string& blockHash,
                        const std::vector<PoolAccount>& accounts);

  /**
   * Sets whether or not requests for the block at the given height fail.
   */
  void SetBlockFailure (uint64_t height, bool fail);

  /**
   * Sets a delay applied to each GetBlock call.
   */
  void SetDelay (std::chrono::milliseconds d);

  unsigned GetNumBlockCalls () const;
  unsigned GetNumCycles () const;

  void NewCycle () override;
  uint64_t GetFinalHeight () override;
  bool GetBlock (uint64_t height, Block& blk) override;
  Chunk GetChunk (const std::string& hash) override;
  ValidatorSet GetValidators (const std::string& epochId) override;
  EpochInfo GetEpochInfo (const std::string& epochId) override;
  std::vector<PoolAccount> GetPoolAccounts (
      const std::string& pool, const std::string& blockHash) override;

};

/**
 * A MemoryDocumentStore where write failures can be injected.
 */
class TestDocumentStore : public MemoryDocumentStore
{

private:

  /** Lock for the failure counter.  */
  std::mutex mutFail;

  /** Number of upcoming writes that fail.  */
  unsigned failWrites = 0;

  /** Number of write calls made so far.  */
  unsigned numWrites = 0;

  /**
   * Throws a PersistenceError if the write should fail.
   */
  void MaybeFail ();

public:

  TestDocumentStore () = default;

  /**
   * Makes the next n writes throw a PersistenceError.
   */
  void FailWrites (unsigned n);

  /**
   * Returns the number of write calls (successful or not) made so far.
   */
  unsigned GetNumWrites ();

  void Upsert (const std::string& collection, const Document& doc) override;
  void UpsertMany (const std::string& collection,
                   const std::vector<Document>& docs) override;
  bool InsertIfAbsent (const std::string& collection,
                       const Document& doc) override;

};

/**
 * ZMQ subscriber that can be connected to a ZmqPub instance for testing
 * the notifications we receive.  It automatically verifies that sequence
 * numbers are correct.
 */
class TestZmqSubscriber
{

private:

  zmq::context_t ctx;
  zmq::socket_t sock;

  /** Mutex for this instance.  */
  std::mutex mut;

  /** Condition variable notified when new messages are received.  */
  std::condition_variable cv;

  /** Expected next sequence number for each command.  */
  std::map<std::string, unsigned> nextSeq;

  /** For each command, the queue of not-yet-expected messages.  */
  std::map<std::string, std::queue<Json::Value>> messages;

  /** Background thread that polls the ZMQ socket and notifies waiters.  */
  std::unique_ptr<std::thread> receiver;

  /** Set to true when the receiver thread should stop.  */
  bool shouldStop;

  /**
   * Worker method that is run on the receiver thread.
   */
  void ReceiveLoop ();

public:

  /**
   * Constructs the subscriber and connects it to a socket at the given address.
   */
  explicit TestZmqSubscriber (const std::string& addr);

  /**
   * Cleans up everything, expecting that no unexpected messages have been
   * received in the mean time.
   */
  ~TestZmqSubscriber ();

  /**
   * Expects num messages to be received with the given topic (waiting until
   * we get them), and returns all associated JSON data.
   */
  std::vector<Json::Value> AwaitMessages (const std::string& cmd, size_t num);

  /**
   * Forgets / ignores all unexpected messages.
   */
  void ForgetAll ();

};

} // namespace stakex

#endif // STAKEX_TESTUTILS_HPP
