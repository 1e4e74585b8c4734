// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "network/connection.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace ircguard {
namespace network {

/**
 * SocketConnection - TCP socket implementation of Connection
 *
 * Wraps boost::asio::ip::tcp::socket, optionally layered under an
 * ssl::stream when created with a TLS context. All socket operations run on
 * a per-connection strand, which keeps the one outstanding read and the one
 * outstanding write from racing on the TLS state.
 */
class SocketConnection
    : public Connection,
      public std::enable_shared_from_this<SocketConnection> {
public:
  static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{30000};

  /**
   * Create inbound connection (already connected, plaintext)
   */
  static ConnectionPtr create_inbound(boost::asio::io_context &io_context,
                                      boost::asio::ip::tcp::socket socket);

  /**
   * Create outbound connection: resolve, connect and, when tls_context is
   * set, run the TLS client handshake. The handler receives the connection
   * only once it is ready for I/O. The whole sequence is bounded by
   * connect_timeout (boost::asio::error::timed_out).
   */
  static void create_outbound(boost::asio::io_context &io_context,
                              const std::string &host, uint16_t port,
                              std::shared_ptr<boost::asio::ssl::context> tls_context,
                              std::chrono::milliseconds connect_timeout,
                              DialHandler handler);

  ~SocketConnection() override = default;

  // Non-copyable, non-movable (connections are not reusable)
  SocketConnection(const SocketConnection &) = delete;
  SocketConnection &operator=(const SocketConnection &) = delete;
  SocketConnection(SocketConnection &&) = delete;
  SocketConnection &operator=(SocketConnection &&) = delete;

  // Connection interface
  void async_read_some(boost::asio::mutable_buffer buffer,
                       ReadHandler handler) override;
  void async_write(std::string data, WriteHandler handler) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  uint64_t connection_id() const override { return id_; }

  bool is_inbound() const { return is_inbound_; }
  bool is_tls() const { return tls_ != nullptr; }

private:
  SocketConnection(boost::asio::io_context &io_context, bool is_inbound,
                   std::shared_ptr<boost::asio::ssl::context> tls_context);

  // Strand-serialized internals (must be called on strand_)
  void do_connect(const std::string &host, uint16_t port,
                  std::chrono::milliseconds timeout, DialHandler handler);
  void do_handshake(const std::string &host, DialHandler handler);
  void complete_connect(const boost::system::error_code &ec, DialHandler handler);
  void close_impl();

  boost::asio::ip::tcp::socket &lowest_layer();

  boost::asio::io_context &io_context_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  // Plaintext connections use socket_; TLS connections use the socket owned
  // by tls_ and leave socket_ unopened.
  boost::asio::ip::tcp::socket socket_;
  std::shared_ptr<boost::asio::ssl::context> tls_context_;
  std::unique_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> tls_;

  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;
  std::atomic<bool> open_{false};

  // Connect state (accessed only on strand_)
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;
  bool connect_done_ = false;

  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

} // namespace network
} // namespace ircguard
