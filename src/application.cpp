// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace ircguard {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

bool Application::initialize() {
  const auto &relay_config = config_.relay_config;

  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(relay_config.upstream_address, host, port,
                           protocol::ports::TLS)) {
    LOG_APP_ERROR("Invalid upstream address: '{}'", relay_config.upstream_address);
    return false;
  }

  // Print startup banner (use std::cout for immediate visibility)
  std::cout << GetStartupBanner(relay_config.listen_port, relay_config.upstream_address)
            << std::flush;

  LOG_APP_INFO("Initializing ircguard...");
  LOG_APP_INFO("Upstream {}:{} over TLS, connect timeout {} ms, {} io thread(s)", host,
               port, relay_config.connect_timeout.count(), relay_config.io_threads);

  relay_server_ = std::make_unique<relay::RelayServer>(relay_config);

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!relay_server_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  LOG_APP_INFO("Starting ircguard...");

  // Setup signal handlers
  setup_signal_handlers();

  if (!relay_server_->listen()) {
    LOG_APP_ERROR("Failed to listen on port {}", config_.relay_config.listen_port);
    return false;
  }
  relay_server_->run();

  running_ = true;

  LOG_APP_INFO("ircguard started, listening on port {}", relay_server_->listening_port());
  LOG_APP_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down ircguard...");

  running_ = false;

  if (relay_server_) {
    LOG_APP_INFO("Stopping relay server ({} active session(s), {} total)...",
                 relay_server_->active_sessions(), relay_server_->total_sessions());
    relay_server_->stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17); // Literal length avoids strlen()
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace ircguard
