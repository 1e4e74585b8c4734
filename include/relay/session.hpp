// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "network/connection.hpp"
#include "relay/pump.hpp"
#include "relay/sanitizer.hpp"
#include <atomic>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ircguard {
namespace relay {

// Session lifecycle
enum class SessionState {
  ESTABLISHING, // dialing upstream
  RELAYING,     // both pumps running
  CLOSED        // both connections closed, result delivered
};

std::string SessionStateName(SessionState state);

// True for errors that mean one side simply went away (EOF, TLS truncation,
// reset, local close)
bool IsDisconnect(const boost::system::error_code &ec);

class Session;
using SessionPtr = std::shared_ptr<Session>;

/**
 * Session - relays one client connection to the upstream server
 *
 * start() dials the upstream. On success two pumps run concurrently:
 * client->upstream and upstream->client. The first error from either pump
 * ends the session: both connections are closed exactly once, which makes
 * the other pump's outstanding operation fail, and the completion handler
 * receives that first error. Later pump errors are ignored.
 *
 * If the dial fails the client is closed, no pump is started and the dial
 * error is the session result. close() ends the session with
 * boost::asio::error::operation_aborted; an upstream that finishes dialing
 * after that is closed immediately.
 *
 * IMPORTANT: Session is single-use. start() may be called exactly once.
 */
class Session : public std::enable_shared_from_this<Session> {
private:
  struct PrivateTag {};

public:
  using CompletionHandler = std::function<void(const boost::system::error_code &ec)>;

  static SessionPtr create(network::ConnectionPtr client,
                           std::shared_ptr<network::Dialer> dialer,
                           std::string upstream_address,
                           const RuleTable &rules = DefaultRuleTable());

  Session(PrivateTag, network::ConnectionPtr client,
          std::shared_ptr<network::Dialer> dialer, std::string upstream_address,
          const RuleTable &rules);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  void start(CompletionHandler handler);

  // End the session now (operation_aborted). No-op once finished.
  void close();

  uint64_t id() const { return id_; }
  SessionState state() const;
  boost::system::error_code result() const;

  const network::ConnectionPtr &client() const { return client_; }
  const std::string &upstream_address() const { return upstream_address_; }

  // Messages forwarded per direction (0 before the pumps start)
  uint64_t messages_to_upstream() const;
  uint64_t messages_to_client() const;

  std::chrono::milliseconds duration() const;

private:
  void on_dialed(const boost::system::error_code &ec, network::ConnectionPtr upstream);
  void finish(const boost::system::error_code &ec);

  const uint64_t id_;
  network::ConnectionPtr client_;
  std::shared_ptr<network::Dialer> dialer_;
  std::string upstream_address_;
  const RuleTable &rules_;

  mutable std::mutex mutex_;
  SessionState state_{SessionState::ESTABLISHING};
  bool started_{false};
  bool finished_{false};
  boost::system::error_code result_;
  network::ConnectionPtr upstream_;
  PumpPtr to_upstream_;
  PumpPtr to_client_;
  CompletionHandler handler_;
  std::chrono::steady_clock::time_point start_time_;
  std::chrono::steady_clock::time_point end_time_;

  static std::atomic<uint64_t> next_id_;
};

} // namespace relay
} // namespace ircguard
