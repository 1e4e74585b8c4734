// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>
#include <cctype>

namespace ircguard {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // Normalize IPv4-mapped IPv6 addresses to IPv4 format
  // Example: ::ffff:192.168.1.1 -> 192.168.1.1
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool IsValidHostname(const std::string& host) {
  if (host.empty() || host.size() > 253) {
    return false;
  }

  size_t label_length = 0;
  for (char c : host) {
    if (c == '.') {
      if (label_length == 0) {
        return false; // empty label ("..", leading dot)
      }
      label_length = 0;
      continue;
    }
    unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '-' && c != '_') {
      return false;
    }
    if (++label_length > 63) {
      return false;
    }
  }
  // A single trailing dot (fully qualified form) is fine
  return true;
}

// Accept either an IP literal (normalized) or a host name
static std::optional<std::string> ValidateHost(const std::string& host) {
  if (auto ip = ValidateAndNormalizeIP(host)) {
    return ip;
  }
  if (IsValidHostname(host)) {
    return host;
  }
  return std::nullopt;
}

bool ParseHostPort(const std::string& address, std::string& out_host,
                   uint16_t& out_port, uint16_t default_port) {
  if (address.empty()) {
    return false;
  }

  std::string host;
  std::optional<uint16_t> port;

  // IPv6 format: "[IPv6]:port" or "[IPv6]"
  if (address[0] == '[') {
    size_t bracket_end = address.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false; // Missing closing bracket or empty brackets
    }
    host = address.substr(1, bracket_end - 1);
    if (!ValidateAndNormalizeIP(host)) {
      return false; // Brackets only make sense around an IP literal
    }

    if (bracket_end + 1 == address.size()) {
      port = default_port;
    } else if (address[bracket_end + 1] == ':') {
      port = SafeParsePort(address.substr(bracket_end + 2));
    }
  } else {
    size_t first_colon = address.find(':');
    if (first_colon == std::string::npos) {
      host = address;
      port = default_port;
    } else {
      if (address.find(':', first_colon + 1) != std::string::npos) {
        // Multiple colons: IPv6 without brackets, which is ambiguous
        return false;
      }
      host = address.substr(0, first_colon);
      port = SafeParsePort(address.substr(first_colon + 1));
    }
  }

  if (!port || *port == 0) {
    return false;
  }

  auto normalized = ValidateHost(host);
  if (!normalized) {
    return false;
  }

  out_host = *normalized;
  out_port = *port;
  return true;
}

} // namespace util
} // namespace ircguard
