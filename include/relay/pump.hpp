// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "irc/codec.hpp"
#include "network/connection.hpp"
#include "relay/sanitizer.hpp"
#include <atomic>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ircguard {
namespace relay {

class Pump;
using PumpPtr = std::shared_ptr<Pump>;

// Pump - moves messages one way between two connections
//
// Loop: decode one message from source, sanitize it, encode it to
// destination, repeat. Exactly one message is in flight; arrival order is
// kept. The loop ends at the first decode, sanitize or encode error and the
// completion handler receives that error. A message that fails
// sanitization is dropped, never forwarded.
//
// The pump never closes either connection; that is its owner's job. Closing
// a connection is how an owner stops a pump: the outstanding decode or
// encode fails and the loop exits.
//
// IMPORTANT: Pump is single-use. start() may be called exactly once.
class Pump : public std::enable_shared_from_this<Pump> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  using CompletionHandler = std::function<void(const boost::system::error_code &ec)>;

  // rules must outlive the pump
  static PumpPtr create(std::string direction, network::ConnectionPtr source,
                        network::ConnectionPtr destination, const RuleTable &rules);

  Pump(PrivateTag, std::string direction, network::ConnectionPtr source,
       network::ConnectionPtr destination, const RuleTable &rules);

  Pump(const Pump &) = delete;
  Pump &operator=(const Pump &) = delete;

  void start(CompletionHandler handler);

  const std::string &direction() const { return direction_; }
  uint64_t messages_forwarded() const { return messages_forwarded_.load(); }
  bool is_finished() const { return finished_.load(); }

private:
  void decode_next();
  void on_decoded(const boost::system::error_code &ec, irc::Message msg);
  void on_encoded(const boost::system::error_code &ec);
  void finish(const boost::system::error_code &ec);

  std::string direction_;
  irc::Decoder decoder_;
  irc::Encoder encoder_;
  const RuleTable &rules_;

  CompletionHandler handler_;
  std::atomic<bool> started_{false};
  std::atomic<bool> finished_{false};
  std::atomic<uint64_t> messages_forwarded_{0};
};

} // namespace relay
} // namespace ircguard
