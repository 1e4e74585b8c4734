// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ircguard {
namespace network {

/*
 Stream interfaces

 The relay only sees these two abstractions:
 - SocketConnection / TlsDialer: TCP (optionally TLS) via boost::asio
 - MockConnection / MockDialer: in-memory streams for tests (in test/)
*/

class Connection;
using ConnectionPtr = std::shared_ptr<Connection>;

// Callback types for stream events
using ReadHandler =
    std::function<void(const boost::system::error_code &ec, size_t bytes_transferred)>;
using WriteHandler = std::function<void(const boost::system::error_code &ec)>;
using DialHandler =
    std::function<void(const boost::system::error_code &ec, ConnectionPtr connection)>;

/**
 * Connection - Abstract bidirectional byte stream
 *
 * Semantics:
 * - At most one read and one write may be outstanding at a time. A read and
 *   a write may be outstanding together (one per relay direction).
 * - Handlers are never invoked from inside the initiating call.
 * - close() is idempotent. Outstanding operations complete with an error
 *   (typically boost::asio::error::operation_aborted); operations started
 *   afterwards fail with boost::asio::error::not_connected.
 */
class Connection {
public:
  virtual ~Connection() = default;

  // Read at least one byte into buffer. The buffer must stay valid until the
  // handler runs. A clean end of stream is reported as
  // boost::asio::error::eof.
  virtual void async_read_some(boost::asio::mutable_buffer buffer,
                               ReadHandler handler) = 0;

  // Write all of data; the handler runs once everything is written or the
  // write failed
  virtual void async_write(std::string data, WriteHandler handler) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual uint64_t connection_id() const = 0;
};

/**
 * Dialer - Factory for outbound connections
 */
class Dialer {
public:
  virtual ~Dialer() = default;

  // Connect to address ("host:port"). The handler receives an open
  // connection on success, or an error and nullptr.
  virtual void async_dial(const std::string &address, DialHandler handler) = 0;
};

} // namespace network
} // namespace ircguard
