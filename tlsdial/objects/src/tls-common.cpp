#include "tlsdial/tls-common.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlsdial/log.hpp"
#include "tlsdial/string-equal-ignore-case.hpp"

namespace tlsdial {

TlsVersion ParseTlsVersion(std::string_view ver) {
  if (CaseInsensitiveEqual(ver, "TLS1.2")) {
    return TlsVersion::TLS_1_2;
  }
  if (CaseInsensitiveEqual(ver, "TLS1.3")) {
    return TlsVersion::TLS_1_3;
  }
  log::critical("Unsupported TLS version '{}', allowed: TLS1.2, TLS1.3", ver);
  throw std::invalid_argument("Unsupported TLS version");
}

void ValidateTlsVersionBounds(TlsVersion minVersion, TlsVersion maxVersion) {
  if (minVersion != TlsVersion::Unspecified && maxVersion != TlsVersion::Unspecified && maxVersion < minVersion) {
    throw std::invalid_argument("TLS maxVersion is lower than minVersion");
  }
}

void ValidateAlpnProtocols(const std::vector<std::string>& protos) {
  if (std::ranges::any_of(protos, [](std::string_view proto) { return proto.empty(); })) {
    throw std::invalid_argument("ALPN protocol entries must be non-empty");
  }
  if (std::ranges::any_of(protos,
                          [](std::string_view proto) { return std::cmp_less(kMaxAlpnProtocolLength, proto.size()); })) {
    throw std::invalid_argument("ALPN protocol entry exceeds maximum length");
  }
}

}  // namespace tlsdial
