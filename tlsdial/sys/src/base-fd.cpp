#include "tlsdial/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "tlsdial/log.hpp"

namespace tlsdial {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  const int fd = std::exchange(_fd, kClosedFd);
  if (fd == kClosedFd) {
    return;
  }
  // Linux releases the descriptor even when close fails, so it is never retried.
  if (::close(fd) != 0) {
    log::error("close fd # {} failed: {}", fd, std::strerror(errno));
  }
}

}  // namespace tlsdial
