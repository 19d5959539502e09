#include "tlsdial/memory-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "tlsdial/transport.hpp"

namespace tlsdial::test {

TransportResult MemoryTransport::read(char* buf, std::size_t len) {
  std::string& in = _isA ? _pipe->bToA : _pipe->aToB;
  const bool peerShutdown = _isA ? _pipe->bShutdown : _pipe->aShutdown;
  if (_broken) {
    _pipe->journal.push_back(std::format("{}:read-error", name()));
    return {0, TransportHint::Error};
  }
  if (in.empty()) {
    return {0, peerShutdown ? TransportHint::None : TransportHint::ReadReady};
  }
  const std::size_t nbRead = std::min(len, in.size());
  std::copy_n(in.data(), nbRead, buf);
  in.erase(0, nbRead);
  _pipe->journal.push_back(std::format("{}:read {}", name(), nbRead));
  return {nbRead, TransportHint::None};
}

TransportResult MemoryTransport::write(std::string_view data) {
  if (_broken) {
    _pipe->journal.push_back(std::format("{}:write-error", name()));
    return {0, TransportHint::Error};
  }
  if (_writeBlocked) {
    return {0, TransportHint::WriteReady};
  }
  std::string& out = _isA ? _pipe->aToB : _pipe->bToA;
  out.append(data);
  _pipe->journal.push_back(std::format("{}:write {}", name(), data.size()));
  return {data.size(), TransportHint::None};
}

TransportHint MemoryTransport::flush() {
  _pipe->journal.push_back(std::format("{}:flush", name()));
  return TransportHint::None;
}

TransportHint MemoryTransport::shutdown() {
  ++_nbShutdowns;
  (_isA ? _pipe->aShutdown : _pipe->bShutdown) = true;
  _pipe->journal.push_back(std::format("{}:shutdown", name()));
  return TransportHint::None;
}

std::pair<std::unique_ptr<MemoryTransport>, std::unique_ptr<MemoryTransport>> MakeMemoryTransportPair() {
  auto pipe = std::make_shared<MemoryTransport::Pipe>();
  return {std::make_unique<MemoryTransport>(pipe, true), std::make_unique<MemoryTransport>(pipe, false)};
}

}  // namespace tlsdial::test
