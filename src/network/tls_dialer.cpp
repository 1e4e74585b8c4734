// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "network/tls_dialer.hpp"
#include "irc/protocol.hpp"
#include "network/socket_connection.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <boost/asio/post.hpp>

namespace ircguard {
namespace network {

namespace {

std::shared_ptr<boost::asio::ssl::context> MakeClientContext() {
  auto ctx = std::make_shared<boost::asio::ssl::context>(
      boost::asio::ssl::context::tls_client);
  ctx->set_options(boost::asio::ssl::context::default_workarounds |
                   boost::asio::ssl::context::no_sslv2 |
                   boost::asio::ssl::context::no_sslv3);
  ctx->set_verify_mode(boost::asio::ssl::verify_none);
  return ctx;
}

} // namespace

TlsDialer::TlsDialer(boost::asio::io_context &io_context,
                     std::chrono::milliseconds connect_timeout)
    : io_context_(io_context), tls_context_(MakeClientContext()),
      connect_timeout_(connect_timeout) {}

void TlsDialer::async_dial(const std::string &address, DialHandler handler) {
  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(address, host, port, protocol::ports::TLS)) {
    LOG_NET_ERROR("invalid upstream address: {}", address);
    boost::asio::post(io_context_, [handler = std::move(handler)]() {
      handler(boost::asio::error::invalid_argument, nullptr);
    });
    return;
  }

  LOG_NET_DEBUG("dialing {}:{} (tls)", host, port);
  SocketConnection::create_outbound(io_context_, host, port, tls_context_,
                                    connect_timeout_, std::move(handler));
}

} // namespace network
} // namespace ircguard
