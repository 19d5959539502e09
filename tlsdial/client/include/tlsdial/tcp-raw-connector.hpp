#pragma once

#include <cstdint>
#include <memory>

#include "tlsdial/destination.hpp"
#include "tlsdial/dns-resolver.hpp"
#include "tlsdial/raw-connector.hpp"

namespace tlsdial {

// Non-blocking TCP connector. Host names are resolved by a pool of resolverThreads DNS threads shared by all
// clones, or inline (blocking the connect call) when resolverThreads is 0. Each resolved address is tried in
// turn until one connects.
class TcpRawConnector : public RawConnector {
 public:
  // Throws std::system_error if the resolver threads cannot be started.
  explicit TcpRawConnector(uint32_t resolverThreads = 1);

  // When enabled (default), destinations whose scheme is not http are rejected with EINVAL.
  TcpRawConnector& enforceHttp(bool enable) noexcept {
    _enforceHttp = enable;
    return *this;
  }

  [[nodiscard]] bool enforcesHttp() const noexcept { return _enforceHttp; }

  [[nodiscard]] std::unique_ptr<RawConnecting> connect(const Destination& destination) const override;

  [[nodiscard]] std::unique_ptr<RawConnector> clone() const override;

  [[nodiscard]] uint32_t resolverThreads() const noexcept {
    return _resolver ? static_cast<uint32_t>(_resolver->nbThreads()) : 0U;
  }

 private:
  std::shared_ptr<DnsResolver> _resolver;
  bool _enforceHttp{true};
};

}  // namespace tlsdial
