// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "irc/error.hpp"
#include <string>

namespace ircguard {
namespace irc {

namespace {

class CodecCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "irc.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::malformed_frame:
      return "malformed frame";
    case Errc::frame_too_long:
      return "frame too long";
    }
    return "unknown codec error";
  }
};

} // namespace

const boost::system::error_category &codec_category() {
  static const CodecCategory category;
  return category;
}

boost::system::error_code make_error_code(Errc e) {
  return boost::system::error_code(static_cast<int>(e), codec_category());
}

} // namespace irc
} // namespace ircguard
