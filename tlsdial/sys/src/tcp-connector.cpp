#include "tlsdial/tcp-connector.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <string>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/log.hpp"

namespace tlsdial {

ResolveResult ResolveTCP(const char* host, const char* port, int family) {
  addrinfo* res = nullptr;

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  const int gai = ::getaddrinfo(host, port, &hints, &res);
  ResolveResult resolveResult{AddrInfoPtr(res, &::freeaddrinfo), gai, gai == EAI_SYSTEM ? errno : 0};
  if (gai != 0) [[unlikely]] {
    log::error("ResolveTCP: getaddrinfo('{}', '{}') failed: {}", host, port, ::gai_strerror(gai));
    resolveResult.addresses.reset();
  }
  return resolveResult;
}

int ResolveErrno(const ResolveResult& result) noexcept {
  if (result.gaiError == EAI_SYSTEM && result.sysErrno != 0) {
    return result.sysErrno;
  }
  return EHOSTUNREACH;
}

ConnectResult StartConnect(const addrinfo& address) {
  ConnectResult connectResult;
  const int socktype = address.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

  connectResult.cnx = BaseFd(::socket(address.ai_family, socktype, address.ai_protocol));
  if (!connectResult.cnx) [[unlikely]] {
    connectResult.error = errno;
    log::error("StartConnect: socket() failed (family={}, socktype={}, protocol={}): errno={}, msg={}",
               address.ai_family, address.ai_socktype, address.ai_protocol, connectResult.error,
               std::strerror(connectResult.error));
    return connectResult;
  }

  while (::connect(connectResult.cnx.fd(), address.ai_addr, address.ai_addrlen) != 0) {
    const int connectErr = errno;
    switch (connectErr) {
      case EINTR:
        // Interrupted: the kernel may still be connecting in the background, a retry tells us how it went.
        continue;
      case EISCONN:
        return connectResult;
      case EINPROGRESS:
        [[fallthrough]];
      case EALREADY:
        // Non-blocking connect started -> completion will be signalled via poll/epoll
        connectResult.connectPending = true;
        return connectResult;
      default:
        log::debug("StartConnect: connect() failed on fd # {}: errno={}, msg={}", connectResult.cnx.fd(), connectErr,
                   std::strerror(connectErr));
        connectResult.cnx.close();
        connectResult.error = connectErr;
        return connectResult;
    }
  }
  // connected immediately (typical for loopback)
  return connectResult;
}

int PendingConnectError(int fd) noexcept {
  int soError = 0;
  socklen_t len = sizeof(soError);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
    return errno;
  }
  return soError;
}

int PendingConnectStatus(int fd, int nbReady, int pollErrno) noexcept {
  if (nbReady == 0) {
    return EINPROGRESS;
  }
  if (nbReady < 0) {
    return pollErrno == EINTR ? EINPROGRESS : pollErrno;
  }
  return PendingConnectError(fd);
}

int CheckPendingConnect(int fd) noexcept {
  pollfd pfd{fd, POLLOUT, 0};
  const int nbReady = ::poll(&pfd, 1, 0);
  return PendingConnectStatus(fd, nbReady, nbReady < 0 ? errno : 0);
}

std::string FormatAddress(const addrinfo& address) {
  char host[INET6_ADDRSTRLEN]{};
  if (address.ai_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(address.ai_addr);
    if (::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host)) != nullptr) {
      return std::format("{}:{}", host, ntohs(in->sin_port));
    }
  } else if (address.ai_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(address.ai_addr);
    if (::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host)) != nullptr) {
      return std::format("[{}]:{}", host, ntohs(in6->sin6_port));
    }
  }
  return {};
}

}  // namespace tlsdial
