// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace ircguard {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The ircguard developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "ircguard version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";
} // namespace colors

// Startup banner: version, listen port and upstream
inline std::string GetStartupBanner(uint16_t listen_port, const std::string &upstream) {
  auto row = [](const std::string &label, const std::string &value) {
    std::string line = "|  " + label + value;
    // Box is 50 chars wide; long values simply overflow the frame
    if (line.size() < 49) {
      line += std::string(49 - line.size(), ' ');
    }
    return line + "|\n";
  };

  std::string banner;
  banner += "\n";
  banner += colors::CYAN;
  banner += "+------------------------------------------------+\n";
  banner += "|                                                |\n";
  banner += "|   ircguard - sanitizing IRC relay              |\n";
  banner += "|                                                |\n";
  banner += "+------------------------------------------------+\n";
  banner += row("Version:  ", GetVersionString());
  banner += row("Listen:   ", std::to_string(listen_port));
  banner += row("Upstream: ", upstream + " (TLS)");
  banner += "+------------------------------------------------+\n";
  banner += row("", GetCopyrightString());
  banner += "+------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace ircguard
