// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ircguard {
namespace irc {

/**
 * Prefix - message source, ":name!user@host" on the wire
 *
 * name is the nickname or server name. user and host are optional and
 * empty when absent.
 */
struct Prefix {
  std::string name;
  std::string user;
  std::string host;

  bool operator==(const Prefix &other) const {
    return name == other.name && user == other.user && host == other.host;
  }
  bool operator!=(const Prefix &other) const { return !(*this == other); }
};

/**
 * Message - one parsed frame
 *
 * Wire form: ["@" tags SP] [":" prefix SP] command *(SP param)
 * The last parameter may be a trailing parameter (":" followed by text that
 * can contain spaces). Once parsed the parameter count never changes; the
 * relay only rewrites parameter contents.
 */
struct Message {
  std::string tags;             // IRCv3 tag section without '@', passed through
  std::optional<Prefix> prefix; // absent when the frame had no prefix
  std::string command;          // upper-cased for alphabetic commands
  std::vector<std::string> params;
};

// Parse "name!user@host" (without the leading ':')
Prefix ParsePrefix(const std::string &raw);

std::string SerializePrefix(const Prefix &prefix);

/**
 * Parse one frame (line delimiter already stripped)
 *
 * Trailing CR/LF and leading spaces are tolerated. Alphabetic commands
 * are canonicalized to upper case so rule lookup is exact.
 *
 * @return Parsed message, or std::nullopt if the frame carries no command
 *
 * Examples:
 *   ":nick!user@host PRIVMSG #chan :hi there"
 *      -> prefix {nick, user, host}, command PRIVMSG, params {"#chan", "hi there"}
 *   "nick foo"      -> command NICK, params {"foo"}
 *   ":server.only"  -> std::nullopt
 */
std::optional<Message> ParseMessage(const std::string &line);

/**
 * Serialize a message without the line terminator
 *
 * The last parameter is written in trailing form when it is empty,
 * contains a space, or starts with ':'.
 */
std::string SerializeMessage(const Message &msg);

} // namespace irc
} // namespace ircguard
