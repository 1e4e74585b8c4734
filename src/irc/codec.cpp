// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "irc/codec.hpp"
#include "irc/error.hpp"
#include <algorithm>
#include <boost/asio/buffer.hpp>

namespace ircguard {
namespace irc {

namespace {

bool IsBlank(const std::string &frame) {
  return std::all_of(frame.begin(), frame.end(),
                     [](char c) { return c == ' ' || c == '\r'; });
}

} // namespace

Decoder::Decoder(network::ConnectionPtr source, size_t max_frame_length)
    : source_(std::move(source)), max_frame_length_(max_frame_length) {}

bool Decoder::next_frame(std::string &frame) {
  size_t pos = buffer_.find(protocol::LINE_DELIMITER);
  if (pos == std::string::npos) {
    return false;
  }
  size_t end = pos;
  if (end > 0 && buffer_[end - 1] == '\r') {
    --end;
  }
  frame.assign(buffer_, 0, end);
  buffer_.erase(0, pos + 1);
  return true;
}

void Decoder::async_decode(DecodeHandler handler) {
  std::string frame;
  while (next_frame(frame)) {
    if (IsBlank(frame)) {
      continue;
    }
    if (frame.size() > max_frame_length_) {
      handler(Errc::frame_too_long, Message{});
      return;
    }
    auto msg = ParseMessage(frame);
    if (!msg) {
      handler(Errc::malformed_frame, Message{});
      return;
    }
    handler({}, std::move(*msg));
    return;
  }

  // Still no delimiter: refuse to buffer without bound
  if (buffer_.size() > max_frame_length_) {
    handler(Errc::frame_too_long, Message{});
    return;
  }

  source_->async_read_some(
      boost::asio::buffer(chunk_),
      [this, handler = std::move(handler)](const boost::system::error_code &ec,
                                           size_t bytes_transferred) mutable {
        if (ec) {
          handler(ec, Message{});
          return;
        }
        buffer_.append(chunk_.data(), bytes_transferred);
        async_decode(std::move(handler));
      });
}

Encoder::Encoder(network::ConnectionPtr destination)
    : destination_(std::move(destination)) {}

void Encoder::async_encode(Message msg, EncodeHandler handler) {
  std::string wire = SerializeMessage(msg);
  wire += protocol::LINE_TERMINATOR;
  destination_->async_write(std::move(wire), std::move(handler));
}

} // namespace irc
} // namespace ircguard
