// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace ircguard {
namespace irc {

// Codec failures, reported through boost::system::error_code so they travel
// the same path as transport errors
enum class Errc {
  malformed_frame = 1, // frame has no command token
  frame_too_long = 2,  // no line delimiter within protocol::MAX_FRAME_LENGTH
};

const boost::system::error_category &codec_category();

boost::system::error_code make_error_code(Errc e);

} // namespace irc
} // namespace ircguard

namespace boost {
namespace system {
template <>
struct is_error_code_enum<ircguard::irc::Errc> : std::true_type {};
} // namespace system
} // namespace boost
