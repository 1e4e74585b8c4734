// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include "irc/message.hpp"
#include "irc/protocol.hpp"
#include "network/connection.hpp"
#include <array>
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace ircguard {
namespace irc {

/**
 * Decoder - reads one Message at a time from a connection
 *
 * Frames are delimited by LF; a preceding CR is dropped. Blank lines are
 * skipped. Bytes after the last complete frame stay buffered for the next
 * call. Errors:
 * - boost::asio::error::eof: the peer closed the stream (any unterminated
 *   partial frame is discarded)
 * - Errc::malformed_frame: a frame without a command
 * - Errc::frame_too_long: no delimiter within max_frame_length bytes
 * - anything else: transport error from the connection
 *
 * One decode may be outstanding at a time. The decoder must outlive it; the
 * usual arrangement is for the handler to own the decoder's owner. When a
 * complete frame is already buffered the handler runs before async_decode
 * returns.
 */
class Decoder {
public:
  using DecodeHandler =
      std::function<void(const boost::system::error_code &ec, Message msg)>;

  explicit Decoder(network::ConnectionPtr source,
                   size_t max_frame_length = protocol::MAX_FRAME_LENGTH);

  Decoder(const Decoder &) = delete;
  Decoder &operator=(const Decoder &) = delete;

  void async_decode(DecodeHandler handler);

  size_t buffered_bytes() const { return buffer_.size(); }

private:
  // Pops the next complete frame (without delimiter) off buffer_
  bool next_frame(std::string &frame);

  network::ConnectionPtr source_;
  size_t max_frame_length_;
  std::string buffer_;
  std::array<char, protocol::READ_CHUNK_SIZE> chunk_;
};

/**
 * Encoder - writes one Message at a time (serialized form plus CRLF)
 */
class Encoder {
public:
  using EncodeHandler = std::function<void(const boost::system::error_code &ec)>;

  explicit Encoder(network::ConnectionPtr destination);

  // Takes the message by value: it is serialized immediately and dropped
  void async_encode(Message msg, EncodeHandler handler);

private:
  network::ConnectionPtr destination_;
};

} // namespace irc
} // namespace ircguard
