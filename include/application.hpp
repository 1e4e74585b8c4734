// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "relay/relay_server.hpp"
#include <atomic>
#include <csignal>
#include <memory>

namespace ircguard {
namespace app {

struct AppConfig {
  // Listen port, upstream address, io threads, dial timeout
  relay::RelayServer::Config relay_config;
};

// Application - owns the relay server for the lifetime of the process
//
// initialize() validates the upstream and builds the server, start() binds
// the listener and installs SIGINT/SIGTERM handlers, wait_for_shutdown()
// blocks until a signal arrives and then closes every session.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  static void signal_handler(int signal);

private:
  void shutdown();
  void setup_signal_handlers();

  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<relay::RelayServer> relay_server_;

  // Target of signal_handler
  static Application *instance_;
};

} // namespace app
} // namespace ircguard
