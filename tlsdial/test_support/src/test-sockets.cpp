#include "tlsdial/test-sockets.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <utility>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/errno-throw.hpp"

namespace tlsdial::test {

std::pair<BaseFd, BaseFd> MakeSocketPair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) != 0) {
    throw_errno("socketpair failed");
  }
  return {BaseFd(fds[0]), BaseFd(fds[1])};
}

LoopbackListener::LoopbackListener() : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw_errno("socket failed");
  }
  static constexpr int kEnable = 1;
  if (::setsockopt(_baseFd.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(_baseFd.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed");
  }
  if (::listen(_baseFd.fd(), 16) != 0) {
    throw_errno("listen failed");
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(_baseFd.fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    throw_errno("getsockname failed");
  }
  _port = ntohs(addr.sin_port);
}

BaseFd LoopbackListener::accept() const {
  return BaseFd(::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_CLOEXEC));
}

uint16_t UnusedLoopbackPort() {
  LoopbackListener listener;
  return listener.port();
}

}  // namespace tlsdial::test
