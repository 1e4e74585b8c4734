// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "relay/pump.hpp"
#include "util/logging.hpp"

namespace ircguard {
namespace relay {

PumpPtr Pump::create(std::string direction, network::ConnectionPtr source,
                     network::ConnectionPtr destination, const RuleTable &rules) {
  return std::make_shared<Pump>(PrivateTag{}, std::move(direction), std::move(source),
                                std::move(destination), rules);
}

Pump::Pump(PrivateTag, std::string direction, network::ConnectionPtr source,
           network::ConnectionPtr destination, const RuleTable &rules)
    : direction_(std::move(direction)), decoder_(std::move(source)),
      encoder_(std::move(destination)), rules_(rules) {}

void Pump::start(CompletionHandler handler) {
  if (started_.exchange(true)) {
    LOG_RELAY_WARN("pump {} already started", direction_);
    return;
  }
  handler_ = std::move(handler);
  decode_next();
}

void Pump::decode_next() {
  decoder_.async_decode(
      [self = shared_from_this()](const boost::system::error_code &ec, irc::Message msg) {
        self->on_decoded(ec, std::move(msg));
      });
}

void Pump::on_decoded(const boost::system::error_code &ec, irc::Message msg) {
  if (ec) {
    finish(ec);
    return;
  }

  if (auto sanitize_ec = SanitizeMessage(rules_, msg)) {
    LOG_RELAY_DEBUG("{}: dropping {} with {} params: {}", direction_, msg.command,
                    msg.params.size(), sanitize_ec.message());
    finish(sanitize_ec);
    return;
  }

  // The message is handed over; nothing here touches it again
  encoder_.async_encode(std::move(msg),
                        [self = shared_from_this()](const boost::system::error_code &ec) {
                          self->on_encoded(ec);
                        });
}

void Pump::on_encoded(const boost::system::error_code &ec) {
  if (ec) {
    finish(ec);
    return;
  }
  messages_forwarded_.fetch_add(1);
  decode_next();
}

void Pump::finish(const boost::system::error_code &ec) {
  if (finished_.exchange(true)) {
    return;
  }
  LOG_RELAY_TRACE("{}: stopped after {} messages: {}", direction_,
                  messages_forwarded_.load(), ec.message());

  // Move the handler out so any cycle through captured owners is broken
  CompletionHandler handler = std::move(handler_);
  handler_ = nullptr;
  if (handler) {
    handler(ec);
  }
}

} // namespace relay
} // namespace ircguard
