// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "relay/relay_server.hpp"
#include "network/tls_dialer.hpp"
#include "util/logging.hpp"

namespace ircguard {
namespace relay {

RelayServer::RelayServer(Config config, DialerFactory dialer_factory)
    : config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()) {
  if (dialer_factory) {
    dialer_ = dialer_factory(*io_context_);
  } else {
    dialer_ = std::make_shared<network::TlsDialer>(*io_context_, config_.connect_timeout);
  }
}

RelayServer::~RelayServer() { stop(); }

bool RelayServer::listen() {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  const uint16_t port = config_.listen_port;
  using tcp = boost::asio::ip::tcp;
  acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

  // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
  boost::system::error_code ec;
  acceptor_->open(tcp::v6(), ec);
  if (!ec) acceptor_->set_option(boost::asio::ip::v6_only(false), ec);
  if (!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_->bind(tcp::endpoint(tcp::v6(), port), ec);
  if (!ec) acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);

  if (ec) {
    LOG_NET_TRACE("dual-stack listen failed ({}), trying IPv4", ec.message());
    boost::system::error_code close_ec;
    acceptor_->close(close_ec);
    ec.clear();
    acceptor_->open(tcp::v4(), ec);
    if (!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_->bind(tcp::endpoint(tcp::v4(), port), ec);
    if (!ec) acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
  }

  if (ec) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, ec.message());
    // Ensure a failed attempt does not leave a half-initialized acceptor_
    boost::system::error_code close_ec;
    acceptor_->close(close_ec);
    acceptor_.reset();
    return false;
  }

  // Record the actual bound port (handles ephemeral port 0)
  auto ep = acceptor_->local_endpoint(ec);
  last_listen_port_ = ec ? 0 : ep.port();

  LOG_NET_INFO("listening on port {}, relaying to {}",
               last_listen_port_ ? last_listen_port_.load() : port,
               config_.upstream_address);
  start_accept();
  return true;
}

void RelayServer::start_accept() {
  if (!acceptor_)
    return;

  // stop_listening()/stop() cancel the pending accept before destruction
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RelayServer::handle_accept(const boost::system::error_code &ec,
                                boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  // Best-effort socket options
  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  auto client = network::SocketConnection::create_inbound(*io_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {}:{} accepted", client->remote_address(),
                client->remote_port());

  auto session = Session::create(client, dialer_, config_.upstream_address);
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[session->id()] = session;
  }
  total_sessions_.fetch_add(1);

  // The handler holds a weak reference; the registry owns the session
  std::weak_ptr<Session> weak_session = session;
  session->start([this, weak_session](const boost::system::error_code &session_ec) {
    if (auto s = weak_session.lock()) {
      on_session_closed(s, session_ec);
    }
  });

  start_accept();
}

void RelayServer::on_session_closed(const SessionPtr &session,
                                    const boost::system::error_code &ec) {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session->id());
  }

  const auto &client = session->client();
  if (ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated) {
    LOG_RELAY_DEBUG("session {} ({}:{}) ended after {} ms: {} ({} to upstream, {} to client)",
                    session->id(), client->remote_address(), client->remote_port(),
                    session->duration().count(), ec.message(),
                    session->messages_to_upstream(), session->messages_to_client());
  } else {
    LOG_RELAY_INFO("session {} ({}:{}) ended after {} ms: {} ({} to upstream, {} to client)",
                   session->id(), client->remote_address(), client->remote_port(),
                   session->duration().count(), ec.message(),
                   session->messages_to_upstream(), session->messages_to_client());
  }
}

size_t RelayServer::active_sessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

void RelayServer::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
}

void RelayServer::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < config_.io_threads; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void RelayServer::stop() {
  running_.store(false);

  // Don't log here - this is called from destructor, logger may be shut down

  stop_listening();

  // Session::close() runs the completion handler, which erases from the
  // registry, so close from a snapshot
  std::vector<SessionPtr> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto &[id, session] : sessions_) {
      sessions.push_back(session);
    }
  }
  for (const auto &session : sessions) {
    session->close();
  }

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Session::close() above only queued the socket closes on each connection's
  // strand; the io threads may have stopped before running them. Drain every
  // ready handler here so the sockets are closed and the pumps finish.
  if (io_context_) {
    io_context_->restart();
    while (io_context_->poll() > 0) {
    }
  }

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
  }

  // io_context_ is destroyed only in ~RelayServer(), so it outlives every
  // connection, strand and timer still referencing it
}

} // namespace relay
} // namespace ircguard
