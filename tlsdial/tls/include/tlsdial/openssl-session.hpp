#pragma once

#include <openssl/ssl.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-raii.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Perform one non-blocking SSL_do_handshake step on an SSL whose BIO forwards to transport.
// Takes ownership of both; they are handed over to the resulting session or partial session.
HandshakeOutcome StepOpenSslHandshake(std::unique_ptr<RawTransport> transport, SslPtr ssl);

// OpenSSL handshake (client or server side) waiting for transport readiness.
class OpenSslPartialSession : public IPartialSession {
 public:
  OpenSslPartialSession(std::unique_ptr<RawTransport> transport, SslPtr ssl) noexcept
      : _transport(std::move(transport)), _ssl(std::move(ssl)) {}

  HandshakeOutcome resumeHandshake() override;

  [[nodiscard]] int fd() const noexcept override { return _transport ? _transport->fd() : -1; }

 private:
  // Destruction order matters: the SSL (and its BIO) must be freed before the transport it points to.
  std::unique_ptr<RawTransport> _transport;
  SslPtr _ssl;
};

// Established OpenSSL session, client or server side.
class OpenSslSession : public ITlsSession {
 public:
  OpenSslSession(std::unique_ptr<RawTransport> transport, SslPtr ssl);

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportHint flush() override { return _transport->flush(); }

  TransportHint closeNotify() override;

  TransportHint shutdownTransport() override { return _transport->shutdown(); }

  [[nodiscard]] std::string_view negotiatedAlpn() const noexcept override { return _alpn; }
  [[nodiscard]] std::string_view negotiatedVersion() const noexcept override { return _version; }
  [[nodiscard]] std::string_view negotiatedCipher() const noexcept override { return _cipher; }
  [[nodiscard]] std::string_view peerSubject() const noexcept override { return _peerSubject; }

  [[nodiscard]] void* nativeHandle() const noexcept override { return _ssl.get(); }

  [[nodiscard]] SSL* ssl() const noexcept { return _ssl.get(); }

  [[nodiscard]] int fd() const noexcept override { return _transport->fd(); }

 private:
  void logErrorIfAny() const noexcept;

  std::unique_ptr<RawTransport> _transport;
  SslPtr _ssl;
  std::string _alpn;
  std::string _version;
  std::string _cipher;
  std::string _peerSubject;
};

}  // namespace tlsdial
