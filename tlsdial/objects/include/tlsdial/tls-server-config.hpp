#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlsdial/tls-common.hpp"

namespace tlsdial {

// Server side TLS configuration, consumed by OpenSslAcceptor to accept TLS on already established
// raw transports.
class TlsServerConfig {
 public:
  using Version = TlsVersion;

  // Throws std::invalid_argument on inconsistent settings.
  void validate() const;

  // In-memory PEM certificate (may contain chain)
  TlsServerConfig& withCertPem(std::string_view certPem) {
    _certPem = certPem;
    return *this;
  }

  // In-memory PEM private key
  TlsServerConfig& withKeyPem(std::string_view keyPem) {
    _keyPem = keyPem;
    return *this;
  }

  TlsServerConfig& withCipherList(std::string_view cipherList) {
    _cipherList = cipherList;
    return *this;
  }

  TlsServerConfig& withTlsMinVersion(std::string_view ver) {
    minVersion = ParseTlsVersion(ver);
    return *this;
  }

  TlsServerConfig& withTlsMaxVersion(std::string_view ver) {
    maxVersion = ParseTlsVersion(ver);
    return *this;
  }

  // Set (overwrite) ALPN protocol preference list. Order matters; first matching protocol is selected.
  TlsServerConfig& withTlsAlpnProtocols(std::vector<std::string> protos) {
    _alpnProtocols = std::move(protos);
    return *this;
  }

  // Fail the handshake if the client offers no protocol of the ALPN list.
  TlsServerConfig& withTlsAlpnMustMatch(bool mustMatch = true) {
    alpnMustMatch = mustMatch;
    return *this;
  }

  // Append a trusted client certificate (PEM) to the list used for client cert validation.
  TlsServerConfig& withTlsTrustedClientCert(std::string_view certPem) {
    _trustedClientCertsPem.emplace_back(certPem);
    return *this;
  }

  TlsServerConfig& withTlsRequestClientCert(bool request = true) {
    requestClientCert = request;
    return *this;
  }

  // Strict mutual TLS. Implies requestClientCert.
  TlsServerConfig& withTlsRequireClientCert(bool require = true) {
    requireClientCert = require;
    if (require) {
      requestClientCert = true;
    }
    return *this;
  }

  [[nodiscard]] std::string_view certPem() const noexcept { return _certPem; }
  [[nodiscard]] std::string_view keyPem() const noexcept { return _keyPem; }
  [[nodiscard]] std::string_view cipherList() const noexcept { return _cipherList; }
  [[nodiscard]] const std::vector<std::string>& alpnProtocols() const noexcept { return _alpnProtocols; }
  [[nodiscard]] const std::vector<std::string>& trustedClientCertsPem() const noexcept {
    return _trustedClientCertsPem;
  }

  bool operator==(const TlsServerConfig&) const noexcept = default;

  Version minVersion{Version::Unspecified};
  Version maxVersion{Version::Unspecified};
  bool alpnMustMatch{false};
  bool requestClientCert{false};  // Request (but not require) a client certificate
  bool requireClientCert{false};  // Require + verify client certificate

 private:
  std::string _certPem;
  std::string _keyPem;
  std::string _cipherList;
  std::vector<std::string> _alpnProtocols;
  std::vector<std::string> _trustedClientCertsPem;
};

}  // namespace tlsdial
