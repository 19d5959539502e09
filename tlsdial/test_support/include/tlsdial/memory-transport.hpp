#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlsdial/transport.hpp"

namespace tlsdial::test {

// In-memory RawTransport, one end of a pipe created by MakeMemoryTransportPair.
// Behaves like a non-blocking socket: reading an empty pipe returns ReadReady, reading after the peer
// shut down returns 0 with None. Every call is recorded in the shared journal, prefixed by the end name.
class MemoryTransport : public RawTransport {
 public:
  struct Pipe {
    std::string aToB;
    std::string bToA;
    bool aShutdown{false};
    bool bShutdown{false};
    std::vector<std::string> journal;
  };

  MemoryTransport(std::shared_ptr<Pipe> pipe, bool isA) : _pipe(std::move(pipe)), _isA(isA) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportHint flush() override;

  TransportHint shutdown() override;

  [[nodiscard]] int fd() const noexcept override { return -1; }

  // Next write calls return WriteReady without writing anything while blocked.
  void setWriteBlocked(bool blocked) noexcept { _writeBlocked = blocked; }

  // Next read and write calls return Error.
  void setBroken(bool broken) noexcept { _broken = broken; }

  [[nodiscard]] uint32_t nbShutdowns() const noexcept { return _nbShutdowns; }

  [[nodiscard]] const std::vector<std::string>& journal() const noexcept { return _pipe->journal; }

  [[nodiscard]] std::string_view name() const noexcept { return _isA ? "a" : "b"; }

 private:
  std::shared_ptr<Pipe> _pipe;
  bool _isA;
  bool _writeBlocked{false};
  bool _broken{false};
  uint32_t _nbShutdowns{0};
};

// Returns both ends of a new in-memory pipe.
std::pair<std::unique_ptr<MemoryTransport>, std::unique_ptr<MemoryTransport>> MakeMemoryTransportPair();

}  // namespace tlsdial::test
