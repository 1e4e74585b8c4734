// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#include "relay/error.hpp"
#include <string>

namespace ircguard {
namespace relay {

namespace {

class RelayCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "relay"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::not_enough_params:
      return "not enough parameters";
    }
    return "unknown relay error";
  }
};

} // namespace

const boost::system::error_category &relay_category() {
  static const RelayCategory category;
  return category;
}

boost::system::error_code make_error_code(Errc e) {
  return boost::system::error_code(static_cast<int>(e), relay_category());
}

} // namespace relay
} // namespace ircguard
