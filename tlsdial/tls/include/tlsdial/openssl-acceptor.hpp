#pragma once

#include <openssl/ssl.h>

#include <memory>
#include <string>

#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-raii.hpp"
#include "tlsdial/tls-server-config.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// OpenSSL adapter of the server side TLS capability: a server SSL_CTX built once from a TlsServerConfig,
// accepting TLS on raw transports that are already established.
// The SSL_CTX keeps a pointer to this object for ALPN selection, so it is neither copyable nor movable.
class OpenSslAcceptor : public ITlsAcceptor {
 public:
  // Throws std::invalid_argument if config is invalid, std::runtime_error on OpenSSL failures.
  explicit OpenSslAcceptor(const TlsServerConfig& config);

  OpenSslAcceptor(const OpenSslAcceptor&) = delete;
  OpenSslAcceptor(OpenSslAcceptor&&) = delete;
  OpenSslAcceptor& operator=(const OpenSslAcceptor&) = delete;
  OpenSslAcceptor& operator=(OpenSslAcceptor&&) = delete;

  ~OpenSslAcceptor() override = default;

  HandshakeOutcome beginAccept(std::unique_ptr<RawTransport> transport) const override;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

 private:
  static int SelectAlpn(SSL* ssl, const unsigned char** out, unsigned char* outlen, const unsigned char* in,
                        unsigned int inlen, void* arg);

  std::string _alpnWire;  // [len][bytes]...[len][bytes], in server preference order
  bool _alpnMustMatch{false};
  SslCtxPtr _ctx;
};

}  // namespace tlsdial
