#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <variant>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Abstract TLS capability consumed by the connector. A backend adapter (OpenSSL today) implements
// ITlsContext (client side), ITlsAcceptor (server side), IPartialSession and ITlsSession.

class ITlsSession;
class IPartialSession;

struct HandshakeParams {
  std::string_view hostname;
  // Check the peer certificate against hostname. Chain verification is configured on the context.
  bool verifyHostname{true};
};

// Non-blocking handshake step could not complete without more I/O.
struct HandshakeInterrupted {
  std::unique_ptr<IPartialSession> partial;
  TransportHint want;  // ReadReady or WriteReady
};

// Outcome of one non-blocking handshake step.
using HandshakeOutcome = std::variant<std::unique_ptr<ITlsSession>, HandshakeInterrupted, ConnectError>;

// Established encrypted session. Owns the raw transport beneath it, which is never exposed.
class ITlsSession {
 public:
  virtual ~ITlsSession() = default;

  // Same semantics as RawTransport::read, on decrypted data.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Same semantics as RawTransport::write, data is encrypted before being sent.
  virtual TransportResult write(std::string_view data) = 0;

  virtual TransportHint flush() = 0;

  // Send the TLS close_notify alert. None once sent, ReadReady / WriteReady to be called again.
  virtual TransportHint closeNotify() = 0;

  // Shut down the raw transport beneath the session.
  virtual TransportHint shutdownTransport() = 0;

  [[nodiscard]] virtual std::string_view negotiatedAlpn() const noexcept = 0;
  [[nodiscard]] virtual std::string_view negotiatedVersion() const noexcept = 0;
  [[nodiscard]] virtual std::string_view negotiatedCipher() const noexcept = 0;

  // RFC 2253 subject of the peer certificate, empty if none.
  [[nodiscard]] virtual std::string_view peerSubject() const noexcept = 0;

  // Backend specific handle (SSL* for OpenSSL).
  [[nodiscard]] virtual void* nativeHandle() const noexcept = 0;

  [[nodiscard]] virtual int fd() const noexcept = 0;
};

// Handshake in progress, waiting for the transport readiness reported with it.
class IPartialSession {
 public:
  virtual ~IPartialSession() = default;

  // Perform exactly one more non-blocking handshake step.
  virtual HandshakeOutcome resumeHandshake() = 0;

  [[nodiscard]] virtual int fd() const noexcept = 0;
};

// Shared, read-only TLS configuration from which client sessions are created.
class ITlsContext {
 public:
  virtual ~ITlsContext() = default;

  // Take ownership of the raw transport and perform the first non-blocking handshake step.
  virtual HandshakeOutcome beginHandshake(const HandshakeParams& params,
                                          std::unique_ptr<RawTransport> transport) const = 0;
};

// Shared, read-only TLS configuration from which server sessions are created on accepted transports.
class ITlsAcceptor {
 public:
  virtual ~ITlsAcceptor() = default;

  // Take ownership of the raw transport and perform the first non-blocking server handshake step.
  virtual HandshakeOutcome beginAccept(std::unique_ptr<RawTransport> transport) const = 0;
};

}  // namespace tlsdial
