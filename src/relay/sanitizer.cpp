// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "relay/sanitizer.hpp"
#include "relay/error.hpp"

namespace ircguard {
namespace relay {

size_t RequiredParams(RuleKind kind) {
  switch (kind) {
  case RuleKind::IDENTIFIER:
    return 1;
  case RuleKind::BODY_LENGTH:
    return 2;
  }
  return 0;
}

const RuleTable &DefaultRuleTable() {
  static const RuleTable table = {
      {protocol::commands::NICK, RuleKind::IDENTIFIER},
      {protocol::commands::MODE, RuleKind::IDENTIFIER},
      {protocol::commands::SERVICE, RuleKind::IDENTIFIER},
      {protocol::commands::INVITE, RuleKind::IDENTIFIER},
      {protocol::commands::PRIVMSG, RuleKind::BODY_LENGTH},
      {protocol::commands::NOTICE, RuleKind::BODY_LENGTH},
  };
  return table;
}

bool IsIdentifierChar(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  // RFC 2812: special = %x5B-60 / %x7B-7D, plus '-'
  switch (c) {
  case '-':
  case '[':
  case ']':
  case '\\':
  case '`':
  case '_':
  case '^':
  case '{':
  case '|':
  case '}':
    return true;
  default:
    return false;
  }
}

std::string NormalizeIdentifier(const std::string &identifier) {
  std::string out = identifier;
  for (char &c : out) {
    if (!IsIdentifierChar(c)) {
      c = '_';
    }
  }
  return out;
}

std::string ClampBody(const std::string &body, size_t max_length) {
  if (body.size() <= max_length) {
    return body;
  }
  return body.substr(0, max_length);
}

boost::system::error_code ApplyRule(const RuleTable &rules, irc::Message &msg) {
  auto it = rules.find(msg.command);
  if (it == rules.end()) {
    return {};
  }

  const RuleKind kind = it->second;
  if (msg.params.size() < RequiredParams(kind)) {
    return Errc::not_enough_params;
  }

  switch (kind) {
  case RuleKind::IDENTIFIER:
    msg.params[0] = NormalizeIdentifier(msg.params[0]);
    break;
  case RuleKind::BODY_LENGTH:
    msg.params[1] = ClampBody(msg.params[1]);
    break;
  }
  return {};
}

void NormalizeSender(irc::Message &msg) {
  if (msg.prefix) {
    msg.prefix->user = NormalizeIdentifier(msg.prefix->user);
  }
}

boost::system::error_code SanitizeMessage(const RuleTable &rules, irc::Message &msg) {
  NormalizeSender(msg);
  return ApplyRule(rules, msg);
}

} // namespace relay
} // namespace ircguard
