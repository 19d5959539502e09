#pragma once

#include <openssl/ssl.h>

#include <memory>

#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-client-config.hpp"
#include "tlsdial/tls-raii.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// OpenSSL adapter of the TLS capability: a client SSL_CTX built once from a TlsClientConfig and
// shared read-only by all connections.
class OpenSslContext : public ITlsContext {
 public:
  // Context with peer verification against the system default trust store.
  static std::shared_ptr<const OpenSslContext> BuildDefault();

  // Throws std::invalid_argument if config is invalid, std::runtime_error on OpenSSL failures.
  explicit OpenSslContext(const TlsClientConfig& config);

  HandshakeOutcome beginHandshake(const HandshakeParams& params,
                                  std::unique_ptr<RawTransport> transport) const override;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

 private:
  SslCtxPtr _ctx;
};

}  // namespace tlsdial
