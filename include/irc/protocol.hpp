// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace ircguard {
namespace protocol {

namespace ports {
constexpr uint16_t PLAINTEXT = 6667; // default listen port
constexpr uint16_t TLS = 6697;       // default upstream port
} // namespace ports

// Command tokens the relay rewrites (RFC 2812 section 3)
namespace commands {
constexpr const char *NICK = "NICK";
constexpr const char *MODE = "MODE";
constexpr const char *SERVICE = "SERVICE";
constexpr const char *INVITE = "INVITE";
constexpr const char *PRIVMSG = "PRIVMSG";
constexpr const char *NOTICE = "NOTICE";
} // namespace commands

// Wire delimiters
constexpr char LINE_DELIMITER = '\n';
constexpr const char *LINE_TERMINATOR = "\r\n";
constexpr char TAGS_MARKER = '@';
constexpr char PREFIX_MARKER = ':';
constexpr char TRAILING_MARKER = ':';
constexpr char PREFIX_USER = '!';
constexpr char PREFIX_HOST = '@';

// ============================================================================
// LIMITS
// ============================================================================

// Maximum message body forwarded in PRIVMSG/NOTICE, in bytes. A plain clamp,
// not RFC 2812 line-length accounting.
constexpr size_t MAX_BODY_LENGTH = 512;

// Longest frame the decoder buffers while looking for a line delimiter.
// Covers IRCv3 tags (8191) plus a full message with room to spare.
constexpr size_t MAX_FRAME_LENGTH = 16 * 1024;

// Bytes requested from the socket per read
constexpr size_t READ_CHUNK_SIZE = 4096;

} // namespace protocol
} // namespace ircguard
