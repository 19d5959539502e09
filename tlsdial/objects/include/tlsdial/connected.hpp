#pragma once

#include <string>
#include <string_view>

namespace tlsdial {

// Metadata about an established connection, handed over to the connection pool with the stream.
struct Connected {
  // true if the server selected HTTP/2 through ALPN.
  [[nodiscard]] bool negotiatedH2() const noexcept { return negotiatedAlpn == std::string_view("h2"); }

  bool operator==(const Connected&) const noexcept = default;

  std::string remoteAddress;  // numeric "ip:port" when known
  std::string negotiatedAlpn;
  bool proxied{false};
  bool isTls{false};
};

}  // namespace tlsdial
