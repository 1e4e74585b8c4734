// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "relay/session.hpp"
#include "util/logging.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>

namespace ircguard {
namespace relay {

std::atomic<uint64_t> Session::next_id_{1};

std::string SessionStateName(SessionState state) {
  switch (state) {
  case SessionState::ESTABLISHING:
    return "establishing";
  case SessionState::RELAYING:
    return "relaying";
  case SessionState::CLOSED:
    return "closed";
  }
  return "unknown";
}

bool IsDisconnect(const boost::system::error_code &ec) {
  return ec == boost::asio::error::eof || ec == boost::asio::error::operation_aborted ||
         ec == boost::asio::error::connection_reset ||
         ec == boost::asio::ssl::error::stream_truncated;
}

SessionPtr Session::create(network::ConnectionPtr client,
                           std::shared_ptr<network::Dialer> dialer,
                           std::string upstream_address, const RuleTable &rules) {
  return std::make_shared<Session>(PrivateTag{}, std::move(client), std::move(dialer),
                                   std::move(upstream_address), rules);
}

Session::Session(PrivateTag, network::ConnectionPtr client,
                 std::shared_ptr<network::Dialer> dialer, std::string upstream_address,
                 const RuleTable &rules)
    : id_(next_id_.fetch_add(1)), client_(std::move(client)), dialer_(std::move(dialer)),
      upstream_address_(std::move(upstream_address)), rules_(rules),
      start_time_(std::chrono::steady_clock::now()), end_time_(start_time_) {}

void Session::start(CompletionHandler handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
      LOG_RELAY_WARN("session {} already started", id_);
      return;
    }
    started_ = true;
    handler_ = std::move(handler);
    start_time_ = std::chrono::steady_clock::now();
  }

  LOG_RELAY_DEBUG("session {}: client {}:{} connected, dialing {}", id_,
                  client_->remote_address(), client_->remote_port(), upstream_address_);

  dialer_->async_dial(upstream_address_,
                      [self = shared_from_this()](const boost::system::error_code &ec,
                                                  network::ConnectionPtr upstream) {
                        self->on_dialed(ec, std::move(upstream));
                      });
}

void Session::on_dialed(const boost::system::error_code &ec,
                        network::ConnectionPtr upstream) {
  if (ec || !upstream) {
    LOG_RELAY_DEBUG("session {}: dial {} failed: {}", id_, upstream_address_,
                    ec ? ec.message() : "no connection");
    finish(ec ? ec : boost::asio::error::make_error_code(boost::asio::error::not_connected));
    return;
  }

  PumpPtr to_upstream;
  PumpPtr to_client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_) {
      upstream_ = upstream;
      state_ = SessionState::RELAYING;
      to_upstream_ = Pump::create("client->upstream", client_, upstream_, rules_);
      to_client_ = Pump::create("upstream->client", upstream_, client_, rules_);
      to_upstream = to_upstream_;
      to_client = to_client_;
    }
  }

  if (!to_upstream) {
    // Session ended while the dial was in flight
    LOG_RELAY_DEBUG("session {}: closing upstream dialed after close", id_);
    upstream->close();
    return;
  }

  LOG_RELAY_DEBUG("session {}: relaying {}:{} <-> {}", id_, client_->remote_address(),
                  client_->remote_port(), upstream_address_);

  auto self = shared_from_this();
  to_upstream->start([self](const boost::system::error_code &pump_ec) {
    self->finish(pump_ec);
  });
  to_client->start([self](const boost::system::error_code &pump_ec) {
    self->finish(pump_ec);
  });
}

void Session::close() { finish(boost::asio::error::operation_aborted); }

void Session::finish(const boost::system::error_code &ec) {
  network::ConnectionPtr upstream;
  CompletionHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      return;
    }
    finished_ = true;
    state_ = SessionState::CLOSED;
    result_ = ec;
    end_time_ = std::chrono::steady_clock::now();
    upstream = upstream_;
    handler = std::move(handler_);
    handler_ = nullptr;
  }

  // Closing both ends unblocks whichever pump is still waiting
  client_->close();
  if (upstream) {
    upstream->close();
  }

  LOG_RELAY_TRACE("session {}: closed ({})", id_, ec.message());

  if (handler) {
    handler(ec);
  }
}

SessionState Session::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

boost::system::error_code Session::result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

uint64_t Session::messages_to_upstream() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return to_upstream_ ? to_upstream_->messages_forwarded() : 0;
}

uint64_t Session::messages_to_client() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return to_client_ ? to_client_->messages_forwarded() : 0;
}

std::chrono::milliseconds Session::duration() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto end = finished_ ? end_time_ : std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - start_time_);
}

} // namespace relay
} // namespace ircguard
