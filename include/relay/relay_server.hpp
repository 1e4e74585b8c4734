// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "irc/protocol.hpp"
#include "network/connection.hpp"
#include "network/socket_connection.hpp"
#include "relay/session.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ircguard {
namespace relay {

/**
 * RelayServer - accepts IRC clients and runs one Session per client
 *
 * Listens on a plaintext TCP port; every accepted connection gets its own
 * Session relaying to the configured upstream. A session ending (for any
 * reason) is logged and removed; the accept loop keeps going.
 *
 * Owns the io_context and its worker threads.
 */
class RelayServer {
public:
  struct Config {
    uint16_t listen_port = protocol::ports::PLAINTEXT; // 0 = ephemeral
    std::string upstream_address;
    size_t io_threads = 1;
    std::chrono::milliseconds connect_timeout =
        network::SocketConnection::DEFAULT_CONNECT_TIMEOUT;
  };

  // Builds the dialer used for every session. Default: TlsDialer.
  using DialerFactory =
      std::function<std::shared_ptr<network::Dialer>(boost::asio::io_context &)>;

  explicit RelayServer(Config config, DialerFactory dialer_factory = {});
  ~RelayServer();

  RelayServer(const RelayServer &) = delete;
  RelayServer &operator=(const RelayServer &) = delete;

  // Bind and start accepting on config.listen_port. Dual-stack when the
  // host allows it, IPv4 otherwise.
  bool listen();
  void stop_listening();

  // Start the io threads
  void run();

  // Close every session, stop accepting and join the io threads
  void stop();

  bool is_running() const { return running_; }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const { return last_listen_port_; }

  size_t active_sessions() const;
  uint64_t total_sessions() const { return total_sessions_; }

  const Config &config() const { return config_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);
  void on_session_closed(const SessionPtr &session, const boost::system::error_code &ec);

  Config config_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};

  std::shared_ptr<network::Dialer> dialer_;

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::atomic<uint16_t> last_listen_port_{0};

  mutable std::mutex sessions_mutex_;
  std::map<uint64_t, SessionPtr> sessions_;
  std::atomic<uint64_t> total_sessions_{0};
};

} // namespace relay
} // namespace ircguard
