// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace ircguard {
namespace util {

namespace {

// Shared strtol front end: whole string must be consumed
std::optional<long> ParseLong(const std::string& str) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseLong(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseLong(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::vector<std::string> SplitList(const std::string& str, char separator) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(separator, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      items.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return items;
}

} // namespace util
} // namespace ircguard
