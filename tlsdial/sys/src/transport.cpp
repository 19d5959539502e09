#include "tlsdial/transport.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string_view>

#include "tlsdial/log.hpp"

namespace tlsdial {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

TransportResult TcpTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, TransportHint::None};
  while (true) {
    const auto nbRead = ::read(_baseFd.fd(), buf, len);
    if (nbRead >= 0) [[likely]] {
      ret.bytesProcessed = static_cast<std::size_t>(nbRead);
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN) {
      ret.want = TransportHint::ReadReady;
    } else {
      log::debug("read on fd # {} failed: {}", _baseFd.fd(), std::strerror(errno));
      ret.want = TransportHint::Error;
    }
    break;
  }
  return ret;
}

TransportResult TcpTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};

  while (ret.bytesProcessed < data.size()) {
    const auto nbWritten = ::send(_baseFd.fd(), data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed,
                                  MSG_NOSIGNAL);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        // Kernel send buffer full - caller should wait for writable event
        ret.want = TransportHint::WriteReady;
      } else {
        // Fatal error (ECONNRESET, EPIPE, etc.)
        log::debug("write on fd # {} failed: {}", _baseFd.fd(), std::strerror(errno));
        ret.want = TransportHint::Error;
      }
      break;
    }

    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

TransportHint TcpTransport::shutdown() {
  if (::shutdown(_baseFd.fd(), SHUT_WR) == 0) {
    log::debug("fd # {} write side shut down", _baseFd.fd());
    return TransportHint::None;
  }
  const int err = errno;
  if (err == ENOTCONN) {
    // Peer already went away: nothing left to shut down.
    return TransportHint::None;
  }
  log::error("shutdown on fd # {} failed: {}", _baseFd.fd(), std::strerror(err));
  return TransportHint::Error;
}

}  // namespace tlsdial
