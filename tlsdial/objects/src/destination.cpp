#include "tlsdial/destination.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <charconv>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "tlsdial/string-equal-ignore-case.hpp"
#include "tlsdial/toupperlower.hpp"

namespace tlsdial {

namespace {

constexpr std::string_view kSchemeSep = "://";

uint16_t ParsePort(std::string_view portStr, std::string_view uri) {
  uint32_t port = 0;
  const auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (portStr.empty() || ec != std::errc{} || ptr != portStr.data() + portStr.size() || port == 0 ||
      port > UINT16_MAX) {
    throw std::invalid_argument(std::format("Invalid port '{}' in '{}'", portStr, uri));
  }
  return static_cast<uint16_t>(port);
}

}  // namespace

Destination Destination::Parse(std::string_view uri) {
  const auto schemeEnd = uri.find(kSchemeSep);
  if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
    throw std::invalid_argument(std::format("Missing scheme in '{}'", uri));
  }

  Destination dest;
  dest.scheme.reserve(schemeEnd);
  for (char ch : uri.substr(0, schemeEnd)) {
    dest.scheme.push_back(tolower(ch));
  }

  std::string_view authority = uri.substr(schemeEnd + kSchemeSep.size());
  authority = authority.substr(0, authority.find_first_of("/?#"));
  if (const auto atPos = authority.rfind('@'); atPos != std::string_view::npos) {
    authority.remove_prefix(atPos + 1);
  }

  std::string_view portStr;
  if (authority.starts_with('[')) {
    const auto closing = authority.find(']');
    if (closing == std::string_view::npos) {
      throw std::invalid_argument(std::format("Unterminated IPv6 literal in '{}'", uri));
    }
    dest.host = authority.substr(1, closing - 1);
    std::string_view rest = authority.substr(closing + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        throw std::invalid_argument(std::format("Unexpected characters after IPv6 literal in '{}'", uri));
      }
      portStr = rest.substr(1);
      if (portStr.empty()) {
        throw std::invalid_argument(std::format("Empty port in '{}'", uri));
      }
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      portStr = authority.substr(colon + 1);
      if (portStr.empty()) {
        throw std::invalid_argument(std::format("Empty port in '{}'", uri));
      }
      authority = authority.substr(0, colon);
    }
    dest.host = authority;
  }
  if (dest.host.empty()) {
    throw std::invalid_argument(std::format("Missing host in '{}'", uri));
  }

  if (!portStr.empty()) {
    dest.port = ParsePort(portStr, uri);
  } else if (dest.scheme == "https") {
    dest.port = kDefaultHttpsPort;
  } else if (dest.scheme == "http") {
    dest.port = kDefaultHttpPort;
  } else {
    throw std::invalid_argument(std::format("No port and no default port for scheme '{}'", dest.scheme));
  }
  return dest;
}

bool Destination::isSecure() const noexcept { return CaseInsensitiveEqual(scheme, "https"); }

std::string Destination::authority() const {
  if (host.find(':') != std::string::npos) {
    return std::format("[{}]:{}", host, port);
  }
  return std::format("{}:{}", host, port);
}

bool IsIpLiteral(std::string_view host) noexcept {
  char buf[INET6_ADDRSTRLEN + 1];
  if (host.empty() || host.size() >= sizeof(buf)) {
    return false;
  }
  host.copy(buf, host.size());
  buf[host.size()] = '\0';
  unsigned char addr[sizeof(in6_addr)];
  return ::inet_pton(AF_INET, buf, addr) == 1 || ::inet_pton(AF_INET6, buf, addr) == 1;
}

}  // namespace tlsdial
