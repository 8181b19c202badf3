// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/zmqpub.hpp"

#include <glog/logging.h>

namespace stakex
{

namespace
{

/** High-water mark used for sending.  */
constexpr int SEND_HWM = 1'000;

} // anonymous namespace

ZmqPub::ZmqPub (const std::string& addr)
  : sock(ctx, zmq::socket_type::pub)
{
  LOG (INFO) << "Binding ZMQ publisher to " << addr;
  sock.set (zmq::sockopt::sndhwm, SEND_HWM);
  sock.set (zmq::sockopt::tcp_keepalive, 1);
  sock.bind (addr);
}

ZmqPub::~ZmqPub ()
{
  std::lock_guard<std::mutex> lock(mut);

  /* Make sure we close the socket right away.  */
  sock.set (zmq::sockopt::linger, 0);
  sock.close ();
}

void
ZmqPub::SendMessage (const std::string& topic, const Json::Value& data)
{
  auto mitSeq = nextSeq.find (topic);
  if (mitSeq == nextSeq.end ())
    mitSeq = nextSeq.emplace (topic, 0).first;

  uint32_t seq = mitSeq->second;
  uint8_t seqBytes[sizeof (seq)];
  for (unsigned i = 0; i < sizeof (seq); ++i)
    {
      seqBytes[i] = seq & 0xFF;
      seq >>= 8;
    }
  CHECK_EQ (seq, 0);

  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;
  wbuilder["dropNullPlaceholders"] = false;
  wbuilder["useSpecialFloats"] = false;
  const std::string dataStr = Json::writeString (wbuilder, data);

  /* We want to handle EAGAIN in the same way as other errors.  */
  if (!sock.send (zmq::message_t (topic), zmq::send_flags::sndmore))
    throw zmq::error_t ();

  VLOG (1) << "Sent ZMQ message: " << topic;
  VLOG (2) << "Payload data:\n" << data;

  /* Once the first send succeeded, ZMQ guarantees atomic delivery of
     the further parts.  */
  CHECK (sock.send (zmq::message_t (dataStr), zmq::send_flags::sndmore));
  CHECK (sock.send (zmq::message_t (seqBytes, sizeof (seq)),
                    zmq::send_flags::none));

  /* Increase the sequence number at the end.  If the sending fails and
     throws, we want to keep the previous one.  */
  ++mitSeq->second;
}

void
ZmqPub::SendCheckpoint (const std::string& validator, const EpochSyncState& s)
{
  Json::Value data = s.ToJson ();
  data["validator_account_id"] = validator;

  std::lock_guard<std::mutex> lock(mut);
  SendMessage (TOPIC_EPOCHSYNC, data);
}

void
ZmqPub::SendMetrics (const ValidatorMetrics& m)
{
  std::lock_guard<std::mutex> lock(mut);
  SendMessage (TOPIC_METRICS, m.ToJson ());
}

} // namespace stakex
