// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace ircguard {
namespace relay {

enum class Errc {
  // A sanitization rule matched but the message lacks the parameter the
  // rule rewrites (e.g. NICK without a nickname)
  not_enough_params = 1,
};

const boost::system::error_category &relay_category();

boost::system::error_code make_error_code(Errc e);

} // namespace relay
} // namespace ircguard

namespace boost {
namespace system {
template <>
struct is_error_code_enum<ircguard::relay::Errc> : std::true_type {};
} // namespace system
} // namespace boost
