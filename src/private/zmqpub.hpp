// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_ZMQPUB_HPP
#define STAKEX_ZMQPUB_HPP

#include "records.hpp"

#include <json/json.h>
#include <zmq.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

namespace stakex
{

/**
 * ZMQ publisher that announces newly written checkpoints and validator
 * metrics.  Each message consists of the topic, the JSON data and a
 * per-topic sequence number (32-bit little endian).
 */
class ZmqPub
{

private:

  zmq::context_t ctx;
  zmq::socket_t sock;

  /**
   * Lock for this instance, mainly for the ZMQ socket and the in-memory map
   * of sequence numbers.
   */
  std::mutex mut;

  /** Next sequence number per topic string.  */
  std::unordered_map<std::string, uint32_t> nextSeq;

  /**
   * Sends a multipart message consisting of topic, JSON data and the right
   * sequence number.  The caller must hold the lock.
   */
  void SendMessage (const std::string& topic, const Json::Value& data);

public:

  /** Topic for new checkpoints.  */
  static constexpr const char* TOPIC_EPOCHSYNC = "stakex-epochsync json";
  /** Topic for the metrics of finished epochs.  */
  static constexpr const char* TOPIC_METRICS = "stakex-metrics json";

  /**
   * Constructs the publisher, binding to the given address.
   */
  explicit ZmqPub (const std::string& addr);

  /**
   * Stops the publisher and cleans up the connection.
   */
  ~ZmqPub ();

  ZmqPub () = delete;
  ZmqPub (const ZmqPub&) = delete;
  void operator= (const ZmqPub&) = delete;

  /**
   * Announces a checkpoint that has been written for the given validator.
   */
  void SendCheckpoint (const std::string& validator, const EpochSyncState& s);

  /**
   * Announces the metrics of a finished epoch.
   */
  void SendMetrics (const ValidatorMetrics& m);

};

} // namespace stakex

#endif // STAKEX_ZMQPUB_HPP
