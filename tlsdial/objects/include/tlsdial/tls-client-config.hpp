#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlsdial/tls-common.hpp"

namespace tlsdial {

// Client side TLS configuration, consumed by OpenSslContext.
class TlsClientConfig {
 public:
  using Version = TlsVersion;

  // Throws std::invalid_argument on inconsistent settings.
  void validate() const;

  TlsClientConfig& withTlsMinVersion(std::string_view ver);

  TlsClientConfig& withTlsMaxVersion(std::string_view ver);

  // Optional OpenSSL cipher list string for TLS <= 1.2 (empty -> OpenSSL default)
  TlsClientConfig& withCipherList(std::string_view cipherList) {
    _cipherList = cipherList;
    return *this;
  }

  // Set (overwrite) ALPN protocol preference list, in preference order.
  TlsClientConfig& withTlsAlpnProtocols(std::vector<std::string> protos) {
    _alpnProtocols = std::move(protos);
    return *this;
  }

  // Append a trust anchor (PEM) on top of the system default trust store.
  TlsClientConfig& withTrustedCertPem(std::string_view certPem) {
    _trustedCertsPem.emplace_back(certPem);
    return *this;
  }

  // File of concatenated PEM CA certificates to trust.
  TlsClientConfig& withCaFile(std::string_view caFile) {
    _caFile = caFile;
    return *this;
  }

  // Whether the system default trust store (OpenSSL default verify paths) is loaded.
  TlsClientConfig& withDefaultVerifyPaths(bool enable = true) {
    useDefaultVerifyPaths = enable;
    return *this;
  }

  // Verification of the peer certificate chain. Think twice before disabling it.
  TlsClientConfig& withVerifyPeer(bool enable = true) {
    verifyPeer = enable;
    return *this;
  }

  // In-memory client certificate and private key (PEM) for mutual TLS.
  TlsClientConfig& withClientCertKeyPem(std::string_view certPem, std::string_view keyPem) {
    _clientCertPem = certPem;
    _clientKeyPem = keyPem;
    return *this;
  }

  [[nodiscard]] std::string_view cipherList() const noexcept { return _cipherList; }
  [[nodiscard]] const std::vector<std::string>& alpnProtocols() const noexcept { return _alpnProtocols; }
  [[nodiscard]] const std::vector<std::string>& trustedCertsPem() const noexcept { return _trustedCertsPem; }
  [[nodiscard]] const std::string& caFile() const noexcept { return _caFile; }
  [[nodiscard]] std::string_view clientCertPem() const noexcept { return _clientCertPem; }
  [[nodiscard]] std::string_view clientKeyPem() const noexcept { return _clientKeyPem; }

  bool operator==(const TlsClientConfig&) const noexcept = default;

  Version minVersion{Version::Unspecified};
  Version maxVersion{Version::Unspecified};
  bool useDefaultVerifyPaths{true};
  bool verifyPeer{true};

 private:
  std::string _cipherList;
  std::vector<std::string> _alpnProtocols;
  std::vector<std::string> _trustedCertsPem;
  std::string _caFile;
  std::string _clientCertPem;
  std::string _clientKeyPem;
};

}  // namespace tlsdial
