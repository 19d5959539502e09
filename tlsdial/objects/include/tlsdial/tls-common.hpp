#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tlsdial {

// RFC 7301 (ALPN) protocol identifier length is encoded in a single octet => maximum 255 bytes.
inline constexpr std::size_t kMaxAlpnProtocolLength = 255;

enum class TlsVersion : std::uint8_t { Unspecified, TLS_1_2, TLS_1_3 };

// Accepted values: "TLS1.2", "TLS1.3" (case insensitive). Throws std::invalid_argument otherwise.
TlsVersion ParseTlsVersion(std::string_view ver);

// Throws std::invalid_argument if both bounds are set and max is lower than min.
void ValidateTlsVersionBounds(TlsVersion minVersion, TlsVersion maxVersion);

// Throws std::invalid_argument if an entry is empty or longer than kMaxAlpnProtocolLength.
void ValidateAlpnProtocols(const std::vector<std::string>& protos);

}  // namespace tlsdial
