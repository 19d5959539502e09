#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tlsdial {

// What to connect to: the scheme decides plaintext vs TLS, host and port where to connect.
struct Destination {
  static constexpr uint16_t kDefaultHttpPort = 80;
  static constexpr uint16_t kDefaultHttpsPort = 443;

  // Build a destination from an absolute URI "scheme://host[:port][/path...]".
  // IPv6 literals must be bracketed ("https://[::1]:8443/"), brackets are not kept in host.
  // Port defaults to 80 for http and 443 for https.
  // Throws std::invalid_argument on malformed input.
  static Destination Parse(std::string_view uri);

  // True only for the "https" scheme (case insensitive).
  [[nodiscard]] bool isSecure() const noexcept;

  // "host:port", with brackets around IPv6 literals.
  [[nodiscard]] std::string authority() const;

  bool operator==(const Destination&) const noexcept = default;

  std::string scheme;
  std::string host;
  uint16_t port{0};
};

// True if host is an IPv4 or IPv6 numeric literal (without brackets).
bool IsIpLiteral(std::string_view host) noexcept;

}  // namespace tlsdial
