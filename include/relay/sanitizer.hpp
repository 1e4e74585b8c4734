// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "irc/message.hpp"
#include "irc/protocol.hpp"
#include <boost/system/error_code.hpp>
#include <map>
#include <string>

namespace ircguard {
namespace relay {

/*
 Message sanitization

 Two rewrite rules keep forwarded messages inside the protocol grammar:
 - identifier normalization (nickname grammar, RFC 2812 2.3.1)
 - body clamp (PRIVMSG/NOTICE text)

 A RuleTable maps command tokens to the rule applied to that command. It is
 built once and only ever read, so a single table is shared by all
 sessions.
*/

enum class RuleKind {
  IDENTIFIER,  // normalize params[0]
  BODY_LENGTH, // clamp params[1]
};

// Parameters a message needs before the rule can apply
size_t RequiredParams(RuleKind kind);

using RuleTable = std::map<std::string, RuleKind>;

// NICK, MODE, SERVICE, INVITE -> IDENTIFIER; PRIVMSG, NOTICE -> BODY_LENGTH
const RuleTable &DefaultRuleTable();

/**
 * Replace every byte outside the identifier alphabet with '_'
 *
 * Alphabet: ASCII letters, digits and - [ ] \ ` _ ^ { | }
 * Output has the same length as the input. Bytes of non-ASCII sequences are
 * replaced one by one. Idempotent.
 *
 * Example: "foo bar!" -> "foo_bar_"
 */
std::string NormalizeIdentifier(const std::string &identifier);

bool IsIdentifierChar(char c);

/**
 * Truncate body to max_length bytes
 *
 * A plain byte clamp: it does not account for the rest of the line and may
 * cut a multi-byte character.
 */
std::string ClampBody(const std::string &body,
                      size_t max_length = protocol::MAX_BODY_LENGTH);

/**
 * Apply the rule for msg.command, if any
 *
 * @return Errc::not_enough_params if the rule needs more parameters than
 *         msg has (msg is left untouched), success otherwise
 */
boost::system::error_code ApplyRule(const RuleTable &rules, irc::Message &msg);

// Normalize the identifier (user) field of the sender prefix, if present
void NormalizeSender(irc::Message &msg);

// NormalizeSender followed by ApplyRule
boost::system::error_code SanitizeMessage(const RuleTable &rules, irc::Message &msg);

} // namespace relay
} // namespace ircguard
