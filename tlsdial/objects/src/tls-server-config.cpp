#include "tlsdial/tls-server-config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "tlsdial/tls-common.hpp"

namespace tlsdial {

void TlsServerConfig::validate() const {
  if (_certPem.empty() || _keyPem.empty()) {
    throw std::invalid_argument("TLS server requires both a certificate and a private key");
  }

  ValidateTlsVersionBounds(minVersion, maxVersion);

  ValidateAlpnProtocols(_alpnProtocols);
  if (alpnMustMatch && _alpnProtocols.empty()) {
    throw std::invalid_argument("alpnMustMatch is true but alpnProtocols is empty");
  }

  if (std::ranges::any_of(_trustedClientCertsPem, [](std::string_view pem) { return pem.empty(); })) {
    throw std::invalid_argument("Empty trusted client certificate PEM provided");
  }
  if (requireClientCert && _trustedClientCertsPem.empty()) {
    throw std::invalid_argument("requireClientCert=true but no trustedClientCertsPem configured");
  }
}

}  // namespace tlsdial
