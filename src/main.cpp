// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <upstream-host[:port]>\n"
      << "\n"
      << "Relays IRC clients connecting on a plaintext port to a TLS upstream\n"
      << "server, sanitizing identifiers and message bodies on the way.\n"
      << "The upstream port defaults to 6697.\n"
      << "\n"
      << "Options:\n"
      << "  --port=<port>        Listen port (default: 6667)\n"
      << "  --threads=<n>        Number of I/O threads (default: 1, max 64)\n"
      << "  --connect-timeout=<s> Upstream dial timeout in seconds (default: 30)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, relay, app, all\n"
      << "                       Can be comma-separated: --debug=network,relay\n"
      << "  --logfile=<path>     Also write the log to a rotating file\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    ircguard::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << ircguard::GetFullVersionString() << std::endl;
        std::cout << ircguard::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--port=") == 0) {
        auto port_opt = ircguard::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.relay_config.listen_port = *port_opt;
      } else if (arg.find("--threads=") == 0) {
        auto threads_opt = ircguard::util::SafeParseInt(arg.substr(10), 1, 64);
        if (!threads_opt) {
          std::cerr << "Error: Invalid thread count: " << arg.substr(10) << std::endl;
          std::cerr << "Threads must be a number between 1 and 64" << std::endl;
          return 1;
        }
        config.relay_config.io_threads = static_cast<size_t>(*threads_opt);
      } else if (arg.find("--connect-timeout=") == 0) {
        auto timeout_opt = ircguard::util::SafeParseInt(arg.substr(18), 1, 3600);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid connect timeout: " << arg.substr(18) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 3600" << std::endl;
          return 1;
        }
        config.relay_config.connect_timeout = std::chrono::seconds(*timeout_opt);
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
        if (log_file.empty()) {
          std::cerr << "Error: --logfile requires a path" << std::endl;
          return 1;
        }
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=network,relay
        for (const auto &component : ircguard::util::SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else if (arg.find("--") == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else {
        positional.push_back(arg);
      }
    }

    if (positional.size() != 1) {
      std::cerr << "Error: expected exactly one upstream address" << std::endl;
      print_usage(argv[0]);
      return 1;
    }
    config.relay_config.upstream_address = positional.front();

    // Reject a bad upstream before anything starts
    {
      std::string host;
      uint16_t port = 0;
      if (!ircguard::util::ParseHostPort(config.relay_config.upstream_address, host, port,
                                         ircguard::protocol::ports::TLS)) {
        std::cerr << "Error: Invalid upstream address: " << config.relay_config.upstream_address
                  << std::endl;
        std::cerr << "Expected host, host:port or [IPv6]:port" << std::endl;
        return 1;
      }
    }

    for (const auto &component : debug_components) {
      if (component != "all" && component != "net" &&
          !ircguard::util::LogManager::IsKnownComponent(component)) {
        std::cerr << "Error: Unknown debug component: " << component << std::endl;
        return 1;
      }
    }

    // Initialize logging system
    ircguard::util::LogManager::Initialize(log_level, !log_file.empty(),
                                           log_file.empty() ? "ircguard.log" : log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        ircguard::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        ircguard::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        ircguard::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents async callbacks from logging after the logger is destroyed
    {
      ircguard::app::Application app(config);

      if (!app.initialize()) {
        LOG_APP_ERROR("Failed to initialize application");
        ircguard::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.start()) {
        LOG_APP_ERROR("Failed to start application");
        app.stop();
        ircguard::util::LogManager::Shutdown();
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();

      // app destructor runs here, stopping all network operations
    }

    // Shutdown logging AFTER app is fully destroyed
    ircguard::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    ircguard::util::LogManager::Shutdown();
    return 1;
  }
}
