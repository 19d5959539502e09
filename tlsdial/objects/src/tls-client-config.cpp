#include "tlsdial/tls-client-config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "tlsdial/tls-common.hpp"

namespace tlsdial {

TlsClientConfig& TlsClientConfig::withTlsMinVersion(std::string_view ver) {
  minVersion = ParseTlsVersion(ver);
  return *this;
}

TlsClientConfig& TlsClientConfig::withTlsMaxVersion(std::string_view ver) {
  maxVersion = ParseTlsVersion(ver);
  return *this;
}

void TlsClientConfig::validate() const {
  ValidateTlsVersionBounds(minVersion, maxVersion);

  ValidateAlpnProtocols(_alpnProtocols);

  if (std::ranges::any_of(_trustedCertsPem, [](std::string_view pem) { return pem.empty(); })) {
    throw std::invalid_argument("Empty trusted certificate PEM provided");
  }

  if (_clientCertPem.empty() != _clientKeyPem.empty()) {
    throw std::invalid_argument("Client certificate and private key must be provided together");
  }

  if (verifyPeer && !useDefaultVerifyPaths && _trustedCertsPem.empty() && _caFile.empty()) {
    throw std::invalid_argument("Peer verification enabled but no trust anchor configured");
  }
}

}  // namespace tlsdial
