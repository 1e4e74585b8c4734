// Copyright (c) 2025 The ircguard developers
// TCP/TLS connection implementation using boost::asio sockets

#include "network/socket_connection.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <cassert>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace ircguard {
namespace network {

std::atomic<uint64_t> SocketConnection::next_id_{1};

ConnectionPtr SocketConnection::create_inbound(boost::asio::io_context &io_context,
                                               boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<SocketConnection>(
      new SocketConnection(io_context, true, nullptr));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (ec) {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  } else {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  }

  return conn;
}

void SocketConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &host, uint16_t port,
    std::shared_ptr<boost::asio::ssl::context> tls_context,
    std::chrono::milliseconds connect_timeout, DialHandler handler) {
  auto conn = std::shared_ptr<SocketConnection>(
      new SocketConnection(io_context, false, std::move(tls_context)));
  // Defer do_connect onto the strand so shared_from_this() is safe and the
  // handler never runs inside this call.
  boost::asio::post(conn->strand_, [conn, host, port, connect_timeout,
                                    handler = std::move(handler)]() mutable {
    conn->do_connect(host, port, connect_timeout, std::move(handler));
  });
}

SocketConnection::SocketConnection(boost::asio::io_context &io_context, bool is_inbound,
                                   std::shared_ptr<boost::asio::ssl::context> tls_context)
    : io_context_(io_context), strand_(io_context.get_executor()),
      socket_(io_context), tls_context_(std::move(tls_context)),
      is_inbound_(is_inbound), id_(next_id_++),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {
  if (tls_context_) {
    tls_ = std::make_unique<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(
        io_context, *tls_context_);
  }
}

boost::asio::ip::tcp::socket &SocketConnection::lowest_layer() {
  return tls_ ? tls_->next_layer() : socket_;
}

void SocketConnection::do_connect(const std::string &host, uint16_t port,
                                  std::chrono::milliseconds timeout,
                                  DialHandler handler) {
  remote_addr_ = host;
  remote_port_ = port;
  connect_done_ = false;

  if (timeout.count() > 0) {
    connect_timer_->expires_after(timeout);
    connect_timer_->async_wait(boost::asio::bind_executor(
        strand_, [this, self = shared_from_this(), handler,
                  timeout](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted || connect_done_) {
            return; // timer canceled or connect already finished
          }
          LOG_NET_WARN("connect timeout to {}:{} after {} ms", remote_addr_,
                       remote_port_, timeout.count());
          complete_connect(boost::asio::error::timed_out, handler);
        }));
  }

  // Resolve address (store resolver_ to allow cancellation)
  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      host, std::to_string(port),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(), host, handler](
              const boost::system::error_code &ec,
              boost::asio::ip::tcp::resolver::results_type results) {
            if (connect_done_) return; // timed out
            if (ec) {
              LOG_NET_DEBUG("failed to resolve {}: {}", host, ec.message());
              complete_connect(ec, handler);
              return;
            }

            boost::asio::async_connect(
                lowest_layer(), results,
                boost::asio::bind_executor(
                    strand_,
                    [this, self, host, handler](const boost::system::error_code &ec,
                                                const boost::asio::ip::tcp::endpoint &ep) {
                      if (connect_done_) return; // timed out
                      if (ec) {
                        LOG_NET_DEBUG("failed to connect to {}:{}: {}", remote_addr_,
                                      remote_port_, ec.message());
                        complete_connect(ec, handler);
                        return;
                      }

                      // Best-effort socket options
                      boost::system::error_code opt_ec;
                      lowest_layer().set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
                      lowest_layer().set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

                      // Canonicalize remote address/port from the actual endpoint
                      remote_addr_ = ep.address().to_string();
                      remote_port_ = ep.port();
                      LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);

                      if (tls_) {
                        do_handshake(host, handler);
                      } else {
                        complete_connect({}, handler);
                      }
                    }));
          }));
}

void SocketConnection::do_handshake(const std::string &host, DialHandler handler) {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  // Send SNI for host names; IP literals are not allowed in server_name
  if (!util::IsValidIPAddress(host)) {
    if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str())) {
      boost::system::error_code ec(static_cast<int>(::ERR_get_error()),
                                   boost::asio::error::get_ssl_category());
      LOG_NET_DEBUG("failed to set SNI host name {}: {}", host, ec.message());
      complete_connect(ec, handler);
      return;
    }
  }

  tls_->async_handshake(
      boost::asio::ssl::stream_base::client,
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(), handler](const boost::system::error_code &ec) {
            if (connect_done_) return; // timed out
            if (ec) {
              LOG_NET_DEBUG("TLS handshake with {}:{} failed: {}", remote_addr_,
                            remote_port_, ec.message());
            } else {
              LOG_NET_TRACE("TLS handshake with {}:{} complete", remote_addr_, remote_port_);
            }
            complete_connect(ec, handler);
          }));
}

void SocketConnection::complete_connect(const boost::system::error_code &ec,
                                        DialHandler handler) {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  connect_done_ = true;
  (void)connect_timer_->cancel();
  resolver_.reset();

  if (ec) {
    boost::system::error_code ignored;
    lowest_layer().close(ignored);
    handler(ec, nullptr);
    return;
  }

  open_ = true;
  handler(ec, shared_from_this());
}

void SocketConnection::async_read_some(boost::asio::mutable_buffer buffer,
                                       ReadHandler handler) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), buffer,
                                  handler = std::move(handler)]() mutable {
    if (!open_) {
      boost::asio::post(strand_, [handler = std::move(handler)]() {
        handler(boost::asio::error::not_connected, 0);
      });
      return;
    }

    auto on_read = boost::asio::bind_executor(
        strand_, [this, self, handler = std::move(handler)](
                     const boost::system::error_code &ec, size_t bytes_transferred) {
          if (ec && ec != boost::asio::error::eof &&
              ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_,
                          ec.message());
          }
          handler(ec, bytes_transferred);
        });

    if (tls_) {
      tls_->async_read_some(buffer, std::move(on_read));
    } else {
      socket_.async_read_some(buffer, std::move(on_read));
    }
  });
}

void SocketConnection::async_write(std::string data, WriteHandler handler) {
  // Keep the payload alive until the write completes
  auto payload = std::make_shared<std::string>(std::move(data));
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload,
                                  handler = std::move(handler)]() mutable {
    if (!open_) {
      boost::asio::post(strand_, [handler = std::move(handler)]() {
        handler(boost::asio::error::not_connected);
      });
      return;
    }

    auto on_write = boost::asio::bind_executor(
        strand_, [this, self, payload, handler = std::move(handler)](
                     const boost::system::error_code &ec, size_t) {
          if (ec && ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                          ec.message());
          }
          handler(ec);
        });

    if (tls_) {
      boost::asio::async_write(*tls_, boost::asio::buffer(*payload), std::move(on_write));
    } else {
      boost::asio::async_write(socket_, boost::asio::buffer(*payload), std::move(on_write));
    }
  });
}

void SocketConnection::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    close_impl();
  });
}

void SocketConnection::close_impl() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (!open_.exchange(false)) {
    return; // Already closed
  }

  LOG_NET_TRACE("closing connection {} ({}:{})", id_, remote_addr_, remote_port_);

  // Cancel outstanding reads/writes; their handlers hold shared_from_this()
  // and run with operation_aborted. No TLS close_notify is sent: teardown
  // must not wait on the peer.
  boost::system::error_code ignored;
  auto &socket = lowest_layer();
  socket.cancel(ignored);
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
}

} // namespace network
} // namespace ircguard
