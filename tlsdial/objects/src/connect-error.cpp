#include "tlsdial/connect-error.hpp"

#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace tlsdial {

ConnectError ConnectError::Connect(int sysErrno, std::string_view message) {
  std::error_code code(sysErrno, std::system_category());
  return {Kind::Connect, code, 0, std::format("{}: {}", message, code.message())};
}

ConnectError ConnectError::HandshakeFailure(unsigned long backendCode, std::string_view message) {
  return {Kind::HandshakeFailure, std::make_error_code(std::errc::protocol_error), backendCode, std::string(message)};
}

ConnectError ConnectError::ProtocolPolicy(std::string_view scheme) {
  return {Kind::ProtocolPolicy, std::make_error_code(std::errc::protocol_not_supported), 0,
          std::format("HTTPS is enforced but destination scheme is '{}'", scheme)};
}

std::string_view KindName(ConnectError::Kind kind) noexcept {
  switch (kind) {
    case ConnectError::Kind::Connect:
      return "Connect";
    case ConnectError::Kind::HandshakeFailure:
      return "HandshakeFailure";
    case ConnectError::Kind::ProtocolPolicy:
      return "ProtocolPolicy";
    default:
      return "Unknown";
  }
}

}  // namespace tlsdial
