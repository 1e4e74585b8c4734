// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "network/connection.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace ircguard {
namespace network {

/**
 * TlsDialer - opens TLS client connections to the upstream server
 *
 * Accepts "host:port", "[IPv6]:port" or a bare host (port 6697). Server
 * certificates are not verified (verify_none): the upstream is trusted on
 * first use. SNI is sent for host names.
 */
class TlsDialer : public Dialer {
public:
  TlsDialer(boost::asio::io_context &io_context,
            std::chrono::milliseconds connect_timeout);

  void async_dial(const std::string &address, DialHandler handler) override;

  std::chrono::milliseconds connect_timeout() const { return connect_timeout_; }

private:
  boost::asio::io_context &io_context_;
  std::shared_ptr<boost::asio::ssl::context> tls_context_;
  std::chrono::milliseconds connect_timeout_;
};

} // namespace network
} // namespace ircguard
