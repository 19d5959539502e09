#include "tlsdial/openssl-ctx-setup.hpp"

#include <openssl/ssl.h>
#include <openssl/tls1.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tlsdial/tls-common.hpp"
#include "tlsdial/tls-raii.hpp"

namespace tlsdial::openssl {

namespace {

int ProtoVersion(TlsVersion ver) {
  switch (ver) {
    case TlsVersion::TLS_1_2:
      return TLS1_2_VERSION;
    case TlsVersion::TLS_1_3:
      return TLS1_3_VERSION;
    default:
      return 0;  // not set
  }
}

}  // namespace

void ConfigureNonBlockingModes(SSL_CTX* ctx) noexcept {
  SSL_CTX_clear_mode(ctx, SSL_MODE_AUTO_RETRY);
  SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
}

void ConfigureProtocolBounds(SSL_CTX* ctx, TlsVersion minVersion, TlsVersion maxVersion) {
  if (minVersion != TlsVersion::Unspecified && SSL_CTX_set_min_proto_version(ctx, ProtoVersion(minVersion)) != 1) {
    throw std::runtime_error("Failed to set minimum TLS version");
  }
  if (maxVersion != TlsVersion::Unspecified && SSL_CTX_set_max_proto_version(ctx, ProtoVersion(maxVersion)) != 1) {
    throw std::runtime_error("Failed to set maximum TLS version");
  }
}

void ConfigureCipherList(SSL_CTX* ctx, std::string_view cipherList) {
  if (cipherList.empty()) {
    return;
  }
  const std::string nullTerminated(cipherList);
  if (::SSL_CTX_set_cipher_list(ctx, nullTerminated.c_str()) != 1) {
    throw std::runtime_error("Failed to set cipher list");
  }
}

std::string EncodeAlpnWire(const std::vector<std::string>& protos) {
  std::string wire;
  for (const auto& proto : protos) {
    wire.push_back(static_cast<char>(proto.size()));
    wire.append(proto);
  }
  return wire;
}

void AddTrustedCertificates(SSL_CTX* ctx, const std::vector<std::string>& certsPem, std::string_view what) {
  for (std::string_view pem : certsPem) {
    auto cert = ReadPemCertificate(pem, what);
    X509_STORE* store = ::SSL_CTX_get_cert_store(ctx);
    if (store == nullptr) {
      throw std::runtime_error("No cert store available in SSL_CTX");
    }
    if (::X509_STORE_add_cert(store, cert.get()) != 1) {
      throw std::runtime_error("Failed to add " + std::string(what) + " certificate to store");
    }
  }
}

void UseCertificateAndKey(SSL_CTX* ctx, std::string_view certPem, std::string_view keyPem, std::string_view what) {
  auto cert = ReadPemCertificate(certPem, what);
  auto pkey = ReadPemPrivateKey(keyPem, what);
  if (::SSL_CTX_use_certificate(ctx, cert.get()) != 1) {
    throw std::runtime_error("Failed to use in-memory " + std::string(what) + " certificate");
  }
  if (::SSL_CTX_use_PrivateKey(ctx, pkey.get()) != 1) {
    throw std::runtime_error("Failed to use in-memory " + std::string(what) + " private key");
  }
  if (::SSL_CTX_check_private_key(ctx) != 1) {
    throw std::runtime_error("The " + std::string(what) + " private key does not match its certificate");
  }
}

}  // namespace tlsdial::openssl
