#pragma once

#include <openssl/ssl.h>

#include <string>
#include <string_view>
#include <vector>

#include "tlsdial/tls-common.hpp"

// SSL_CTX configuration steps shared by the client context and the server acceptor.
// All of them throw std::runtime_error on OpenSSL failure.
namespace tlsdial::openssl {

// Non-blocking transport: SSL_read reports WANT_READ instead of retrying internally, writes may be partial
// and may be retried from a different buffer holding the same bytes.
void ConfigureNonBlockingModes(SSL_CTX* ctx) noexcept;

void ConfigureProtocolBounds(SSL_CTX* ctx, TlsVersion minVersion, TlsVersion maxVersion);

// Empty cipherList keeps the OpenSSL default.
void ConfigureCipherList(SSL_CTX* ctx, std::string_view cipherList);

// ALPN wire format: length prefixed protocol names.
std::string EncodeAlpnWire(const std::vector<std::string>& protos);

// Add each PEM certificate to the context's trust store. what names the certificates in errors.
void AddTrustedCertificates(SSL_CTX* ctx, const std::vector<std::string>& certsPem, std::string_view what);

void UseCertificateAndKey(SSL_CTX* ctx, std::string_view certPem, std::string_view keyPem, std::string_view what);

}  // namespace tlsdial::openssl
