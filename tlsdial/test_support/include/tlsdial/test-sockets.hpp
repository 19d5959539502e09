#pragma once

#include <cstdint>
#include <utility>

#include "tlsdial/base-fd.hpp"

namespace tlsdial::test {

// Connected AF_UNIX stream socket pair, both ends non-blocking and close-on-exec.
// Throws std::system_error on failure.
std::pair<BaseFd, BaseFd> MakeSocketPair();

// Blocking TCP listener on 127.0.0.1 with an ephemeral port.
class LoopbackListener {
 public:
  // Throws std::system_error on failure.
  LoopbackListener();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Blocking accept. Returns a closed BaseFd on failure.
  [[nodiscard]] BaseFd accept() const;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
  uint16_t _port{0};
};

// Port on 127.0.0.1 that is very likely to refuse connections (bound then closed).
uint16_t UnusedLoopbackPort();

}  // namespace tlsdial::test
