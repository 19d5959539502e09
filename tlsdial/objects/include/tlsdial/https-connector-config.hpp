#pragma once

#include <cstdint>
#include <utility>

#include "tlsdial/tls-client-config.hpp"

namespace tlsdial {

struct HttpsConnectorConfig {
  // Throws std::invalid_argument on inconsistent settings.
  void validate() const;

  HttpsConnectorConfig& withResolverThreads(uint32_t nbThreads) {
    resolverThreads = nbThreads;
    return *this;
  }

  // Disabling hostname verification removes the guarantee that the peer is the requested host.
  HttpsConnectorConfig& withDangerDisableHostnameVerification(bool disable = true) {
    hostnameVerification = !disable;
    return *this;
  }

  HttpsConnectorConfig& withForceHttps(bool enable = true) {
    forceHttps = enable;
    return *this;
  }

  HttpsConnectorConfig& withTls(TlsClientConfig tlsConfig) {
    tls = std::move(tlsConfig);
    return *this;
  }

  bool operator==(const HttpsConnectorConfig&) const noexcept = default;

  // Number of DNS worker threads of the raw connector. 0 resolves inline, blocking the first connect call.
  uint32_t resolverThreads{1};
  bool hostnameVerification{true};
  bool forceHttps{false};
  TlsClientConfig tls;
};

}  // namespace tlsdial
