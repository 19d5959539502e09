#pragma once

#include <algorithm>
#include <string_view>

#include "tlsdial/toupperlower.hpp"

namespace tlsdial {

// ASCII case insensitive comparison, used for URL schemes.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, [](char lhsCh, char rhsCh) { return tolower(lhsCh) == tolower(rhsCh); });
}

}  // namespace tlsdial
