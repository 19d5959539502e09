#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tlsdial {

// Failure of a connect operation, as surfaced by a failed poll.
class ConnectError {
 public:
  enum class Kind : std::uint8_t {
    Connect,           // raw transport failure, passed through verbatim from the raw connector
    HandshakeFailure,  // terminal TLS negotiation error (certificate validation, protocol mismatch, ...)
    ProtocolPolicy     // forceHttps is enabled but the destination scheme is plaintext
  };

  // Raw transport failure described by an errno value.
  static ConnectError Connect(int sysErrno, std::string_view message);

  // backendCode is the TLS backend specific error (OpenSSL error code or X509 verification result).
  static ConnectError HandshakeFailure(unsigned long backendCode, std::string_view message);

  static ConnectError ProtocolPolicy(std::string_view scheme);

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] std::error_code code() const noexcept { return _code; }

  [[nodiscard]] unsigned long backendCode() const noexcept { return _backendCode; }

  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  bool operator==(const ConnectError&) const noexcept = default;

 private:
  ConnectError(Kind kind, std::error_code code, unsigned long backendCode, std::string message)
      : _kind(kind), _code(code), _backendCode(backendCode), _message(std::move(message)) {}

  Kind _kind;
  std::error_code _code;
  unsigned long _backendCode;
  std::string _message;
};

std::string_view KindName(ConnectError::Kind kind) noexcept;

}  // namespace tlsdial
