#include "tlsdial/openssl-acceptor.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/tls1.h>

#include <cstring>
#include <memory>
#include <utility>

#include "tlsdial/log.hpp"
#include "tlsdial/openssl-bio.hpp"
#include "tlsdial/openssl-ctx-setup.hpp"
#include "tlsdial/openssl-session.hpp"
#include "tlsdial/tls-raii.hpp"
#include "tlsdial/tls-server-config.hpp"

namespace tlsdial {

OpenSslAcceptor::OpenSslAcceptor(const TlsServerConfig& config)
    : _alpnWire(openssl::EncodeAlpnWire(config.alpnProtocols())),
      _alpnMustMatch(config.alpnMustMatch),
      _ctx(MakeSslCtx(::TLS_server_method())) {
  config.validate();
  openssl::ConfigureNonBlockingModes(_ctx.get());
  openssl::ConfigureProtocolBounds(_ctx.get(), config.minVersion, config.maxVersion);
  openssl::ConfigureCipherList(_ctx.get(), config.cipherList());
  openssl::UseCertificateAndKey(_ctx.get(), config.certPem(), config.keyPem(), "server");

  if (config.requestClientCert) {
    int verifyMode = SSL_VERIFY_PEER | SSL_VERIFY_CLIENT_ONCE;
    if (config.requireClientCert) {
      verifyMode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
    ::SSL_CTX_set_verify(_ctx.get(), verifyMode, nullptr);
    openssl::AddTrustedCertificates(_ctx.get(), config.trustedClientCertsPem(), "trusted client");
  }

  if (!_alpnWire.empty()) {
    ::SSL_CTX_set_alpn_select_cb(_ctx.get(), &OpenSslAcceptor::SelectAlpn, this);
  }
  ::ERR_clear_error();
}

HandshakeOutcome OpenSslAcceptor::beginAccept(std::unique_ptr<RawTransport> transport) const {
  auto ssl = MakeSsl(::SSL_new(_ctx.get()));
  auto bio = MakeTransportBio(*transport);
  // SSL takes ownership of a single reference when rbio == wbio
  ::SSL_set_bio(ssl.get(), bio.get(), bio.get());
  static_cast<void>(bio.release());
  ::SSL_set_accept_state(ssl.get());
  log::debug("TLS accept fd # {}: handshake started", transport->fd());
  return StepOpenSslHandshake(std::move(transport), std::move(ssl));
}

int OpenSslAcceptor::SelectAlpn([[maybe_unused]] SSL* ssl, const unsigned char** out, unsigned char* outlen,
                                const unsigned char* in, unsigned int inlen, void* arg) {
  const auto* self = static_cast<const OpenSslAcceptor*>(arg);
  const auto* ptr = reinterpret_cast<const unsigned char*>(self->_alpnWire.data());
  const auto prefLen = static_cast<unsigned int>(self->_alpnWire.size());
  for (unsigned int prefIndex = 0; prefIndex < prefLen;) {
    const unsigned char* val = ptr + prefIndex + 1;
    const unsigned int len = ptr[prefIndex];
    for (unsigned int clientIndex = 0; clientIndex < inlen;) {
      const unsigned int clen = in[clientIndex];
      const unsigned char* cval = in + clientIndex + 1;
      if (clen == len && std::memcmp(val, cval, len) == 0) {
        *out = val;
        *outlen = static_cast<unsigned char>(len);
        return SSL_TLSEXT_ERR_OK;
      }
      clientIndex += 1 + clen;
    }
    prefIndex += 1 + len;
  }
  if (self->_alpnMustMatch) {
    log::warn("TLS accept: no ALPN protocol in common with the client, rejecting handshake");
    return SSL_TLSEXT_ERR_ALERT_FATAL;
  }
  return SSL_TLSEXT_ERR_NOACK;
}

}  // namespace tlsdial
