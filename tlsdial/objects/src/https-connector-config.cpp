#include "tlsdial/https-connector-config.hpp"

#include <cstdint>
#include <stdexcept>

namespace tlsdial {

namespace {
constexpr uint32_t kMaxResolverThreads = 256;
}  // namespace

void HttpsConnectorConfig::validate() const {
  if (resolverThreads > kMaxResolverThreads) {
    throw std::invalid_argument("Too many resolver threads");
  }
  if (hostnameVerification && !tls.verifyPeer) {
    // OpenSSL only enforces the host check as part of chain verification.
    throw std::invalid_argument("Hostname verification requires peer certificate verification");
  }
  tls.validate();
}

}  // namespace tlsdial
