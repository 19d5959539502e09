#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <variant>

#include "tlsdial/tls-stream.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Byte stream handed to the HTTP layer, either plaintext or TLS protected.
// Both variants share the non-blocking semantics of RawTransport.
class MaybeTlsStream {
 public:
  explicit MaybeTlsStream(std::unique_ptr<RawTransport> plain) noexcept : _stream(std::move(plain)) {}

  explicit MaybeTlsStream(TlsStream tls) noexcept : _stream(std::move(tls)) {}

  TransportResult read(char* buf, std::size_t len);

  TransportResult write(std::string_view data);

  TransportHint flush();

  // Plain: shuts the transport down. Tls: close_notify first, then the transport (see TlsStream::shutdown).
  TransportHint shutdown();

  [[nodiscard]] bool isTls() const noexcept { return std::holds_alternative<TlsStream>(_stream); }

  // nullptr for a plaintext stream.
  [[nodiscard]] TlsStream* tlsStream() noexcept { return std::get_if<TlsStream>(&_stream); }
  [[nodiscard]] const TlsStream* tlsStream() const noexcept { return std::get_if<TlsStream>(&_stream); }

  [[nodiscard]] int fd() const noexcept;

 private:
  std::variant<std::unique_ptr<RawTransport>, TlsStream> _stream;
};

}  // namespace tlsdial
