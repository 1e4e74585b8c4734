// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "irc/message.hpp"
#include "irc/protocol.hpp"
#include <cctype>

namespace ircguard {
namespace irc {

namespace {

// Strip line terminators and leading spaces. Trailing spaces are kept: they
// may belong to a trailing parameter.
std::string TrimFrame(const std::string &line) {
  size_t begin = 0;
  size_t end = line.size();
  while (begin < end && line[begin] == ' ') {
    ++begin;
  }
  while (end > begin && (line[end - 1] == '\r' || line[end - 1] == '\n')) {
    --end;
  }
  return line.substr(begin, end - begin);
}

size_t SkipSpaces(const std::string &s, size_t idx) {
  while (idx < s.size() && s[idx] == ' ') {
    ++idx;
  }
  return idx;
}

// Returns the token starting at idx and advances idx past it
std::string NextToken(const std::string &s, size_t &idx) {
  size_t end = s.find(' ', idx);
  if (end == std::string::npos) {
    end = s.size();
  }
  std::string token = s.substr(idx, end - idx);
  idx = end;
  return token;
}

std::string CanonicalCommand(std::string command) {
  for (char &c : command) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return command;
}

bool NeedsTrailing(const std::string &param) {
  return param.empty() || param.find(' ') != std::string::npos ||
         param[0] == protocol::TRAILING_MARKER;
}

} // namespace

Prefix ParsePrefix(const std::string &raw) {
  Prefix prefix;
  size_t user = raw.find(protocol::PREFIX_USER);
  size_t host = raw.find(protocol::PREFIX_HOST);

  // Positions of 0 mean an empty name; such separators are treated as part
  // of the name.
  bool has_user = user != std::string::npos && user > 0;
  bool has_host = host != std::string::npos && host > 0;

  if (has_user && has_host && host > user) {
    prefix.name = raw.substr(0, user);
    prefix.user = raw.substr(user + 1, host - user - 1);
    prefix.host = raw.substr(host + 1);
  } else if (has_user) {
    prefix.name = raw.substr(0, user);
    prefix.user = raw.substr(user + 1);
  } else if (has_host) {
    prefix.name = raw.substr(0, host);
    prefix.host = raw.substr(host + 1);
  } else {
    prefix.name = raw;
  }
  return prefix;
}

std::string SerializePrefix(const Prefix &prefix) {
  std::string out = prefix.name;
  if (!prefix.user.empty()) {
    out += protocol::PREFIX_USER;
    out += prefix.user;
  }
  if (!prefix.host.empty()) {
    out += protocol::PREFIX_HOST;
    out += prefix.host;
  }
  return out;
}

std::optional<Message> ParseMessage(const std::string &line) {
  const std::string frame = TrimFrame(line);
  if (frame.empty()) {
    return std::nullopt;
  }

  Message msg;
  size_t idx = 0;

  if (frame[idx] == protocol::TAGS_MARKER) {
    ++idx;
    msg.tags = NextToken(frame, idx);
    idx = SkipSpaces(frame, idx);
  }

  if (idx < frame.size() && frame[idx] == protocol::PREFIX_MARKER) {
    ++idx;
    msg.prefix = ParsePrefix(NextToken(frame, idx));
    idx = SkipSpaces(frame, idx);
  }

  if (idx >= frame.size()) {
    return std::nullopt; // tags and/or prefix without a command
  }
  msg.command = CanonicalCommand(NextToken(frame, idx));

  while (true) {
    idx = SkipSpaces(frame, idx);
    if (idx >= frame.size()) {
      break;
    }
    if (frame[idx] == protocol::TRAILING_MARKER) {
      msg.params.push_back(frame.substr(idx + 1));
      break;
    }
    msg.params.push_back(NextToken(frame, idx));
  }

  return msg;
}

std::string SerializeMessage(const Message &msg) {
  std::string out;
  if (!msg.tags.empty()) {
    out += protocol::TAGS_MARKER;
    out += msg.tags;
    out += ' ';
  }
  if (msg.prefix) {
    out += protocol::PREFIX_MARKER;
    out += SerializePrefix(*msg.prefix);
    out += ' ';
  }
  out += msg.command;

  for (size_t i = 0; i < msg.params.size(); ++i) {
    out += ' ';
    const std::string &param = msg.params[i];
    if (i + 1 == msg.params.size() && NeedsTrailing(param)) {
      out += protocol::TRAILING_MARKER;
    }
    out += param;
  }
  return out;
}

} // namespace irc
} // namespace ircguard
