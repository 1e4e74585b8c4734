// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split the upstream "host:port" option into its parts

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - ParseHostPort: Split "host:port", "[IPv6]:port" or bare "host"
*/

#include <cstdint>
#include <optional>
#include <string>

namespace ircguard {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 format (::ffff:1.2.3.4 -> 1.2.3.4).
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "irc.example.net" -> std::nullopt (hostnames are not IPs)
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

/**
 * Check a DNS host name: dot separated labels of letters, digits, '-' and
 * '_', each 1-63 characters, total at most 253.
 */
bool IsValidHostname(const std::string& host);

/**
 * Parse "host:port" string into separate host and port components
 *
 * Supported forms:
 * - "irc.example.net:6697"
 * - "192.168.1.1:6697"
 * - "[2001:db8::1]:6697"
 * - "irc.example.net" (port = default_port)
 *
 * IP literals are normalized with ValidateAndNormalizeIP. Unbracketed IPv6
 * is rejected because the port would be ambiguous.
 *
 * @return true if successfully parsed, false otherwise (outputs untouched)
 */
bool ParseHostPort(const std::string& address, std::string& out_host,
                   uint16_t& out_port, uint16_t default_port);

} // namespace util
} // namespace ircguard
