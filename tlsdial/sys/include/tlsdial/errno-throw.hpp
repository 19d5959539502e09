#pragma once

#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>

namespace tlsdial {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("socketpair failed for {}", name);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, std::vformat(fmt, std::make_format_args(args...)));
}

}  // namespace tlsdial
