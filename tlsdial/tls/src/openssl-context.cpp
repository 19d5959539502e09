#include "tlsdial/openssl-context.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/destination.hpp"
#include "tlsdial/log.hpp"
#include "tlsdial/openssl-bio.hpp"
#include "tlsdial/openssl-ctx-setup.hpp"
#include "tlsdial/openssl-session.hpp"
#include "tlsdial/tls-client-config.hpp"
#include "tlsdial/tls-raii.hpp"

namespace tlsdial {

namespace {

void ConfigureTrust(SSL_CTX* ctx, const TlsClientConfig& cfg) {
  if (cfg.useDefaultVerifyPaths && ::SSL_CTX_set_default_verify_paths(ctx) != 1) {
    throw std::runtime_error("Failed to load default certificate verify paths");
  }
  if (!cfg.caFile().empty() && ::SSL_CTX_load_verify_locations(ctx, cfg.caFile().c_str(), nullptr) != 1) {
    throw std::runtime_error("Failed to load CA file " + cfg.caFile());
  }
  openssl::AddTrustedCertificates(ctx, cfg.trustedCertsPem(), "trusted");
  ::SSL_CTX_set_verify(ctx, cfg.verifyPeer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
}

void ConfigureAlpn(SSL_CTX* ctx, const TlsClientConfig& cfg) {
  if (cfg.alpnProtocols().empty()) {
    return;
  }
  const std::string wire = openssl::EncodeAlpnWire(cfg.alpnProtocols());
  // returns 0 on success, unlike most OpenSSL functions
  if (::SSL_CTX_set_alpn_protos(ctx, reinterpret_cast<const unsigned char*>(wire.data()),
                                static_cast<unsigned int>(wire.size())) != 0) {
    throw std::runtime_error("Failed to set ALPN protocols");
  }
}

}  // namespace

std::shared_ptr<const OpenSslContext> OpenSslContext::BuildDefault() {
  return std::make_shared<OpenSslContext>(TlsClientConfig{});
}

OpenSslContext::OpenSslContext(const TlsClientConfig& config) : _ctx(MakeSslCtx(::TLS_client_method())) {
  config.validate();
  openssl::ConfigureNonBlockingModes(_ctx.get());
  openssl::ConfigureProtocolBounds(_ctx.get(), config.minVersion, config.maxVersion);
  openssl::ConfigureCipherList(_ctx.get(), config.cipherList());
  ConfigureTrust(_ctx.get(), config);
  ConfigureAlpn(_ctx.get(), config);
  if (!config.clientCertPem().empty()) {
    openssl::UseCertificateAndKey(_ctx.get(), config.clientCertPem(), config.clientKeyPem(), "client");
  }
  ::ERR_clear_error();
}

HandshakeOutcome OpenSslContext::beginHandshake(const HandshakeParams& params,
                                                std::unique_ptr<RawTransport> transport) const {
  auto ssl = MakeSsl(::SSL_new(_ctx.get()));
  auto bio = MakeTransportBio(*transport);
  // SSL takes ownership of a single reference when rbio == wbio
  ::SSL_set_bio(ssl.get(), bio.get(), bio.get());
  static_cast<void>(bio.release());
  ::SSL_set_connect_state(ssl.get());

  const std::string hostname(params.hostname);
  const bool isIp = IsIpLiteral(hostname);
  if (!isIp && !hostname.empty() && SSL_set_tlsext_host_name(ssl.get(), hostname.c_str()) != 1) {
    return ConnectError::HandshakeFailure(::ERR_get_error(), "Failed to set SNI host name " + hostname);
  }
  if (params.verifyHostname) {
    X509_VERIFY_PARAM* verifyParam = ::SSL_get0_param(ssl.get());
    ::X509_VERIFY_PARAM_set_hostflags(verifyParam, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
    const int rc = isIp ? ::X509_VERIFY_PARAM_set1_ip_asc(verifyParam, hostname.c_str())
                        : ::X509_VERIFY_PARAM_set1_host(verifyParam, hostname.c_str(), hostname.size());
    if (rc != 1) {
      return ConnectError::HandshakeFailure(::ERR_get_error(), "Failed to set expected peer host " + hostname);
    }
  } else {
    log::debug("TLS handshake fd # {}: hostname verification disabled for {}", transport->fd(), hostname);
  }

  return StepOpenSslHandshake(std::move(transport), std::move(ssl));
}

}  // namespace tlsdial
