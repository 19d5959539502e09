#pragma once

#include <memory>
#include <string>

#include "tlsdial/base-fd.hpp"

struct addrinfo;

namespace tlsdial {

using AddrInfoPtr = std::unique_ptr<addrinfo, void (*)(addrinfo*)>;

struct ResolveResult {
  AddrInfoPtr addresses;
  int gaiError{0};  // getaddrinfo return code, 0 on success
  int sysErrno{0};  // errno captured by the resolving thread when gaiError is EAI_SYSTEM
};

// errno value describing a failed resolution: the captured errno for EAI_SYSTEM, EHOSTUNREACH otherwise.
int ResolveErrno(const ResolveResult& result) noexcept;

struct ConnectResult {
  BaseFd cnx;
  bool connectPending{false};
  int error{0};  // errno of the failed attempt, 0 when cnx is connected or pending
};

// Resolve host:port into a list of stream socket addresses (blocking getaddrinfo).
// Note: the default family value is 0 (unspecified). We avoid using
// platform macros like AF_UNSPEC in the header to keep includes minimal.
ResolveResult ResolveTCP(const char* host, const char* port, int family = 0);

// Open a non-blocking socket for the given address and start connecting it.
// On success returns the socket and a flag indicating whether the connect is still pending (EINPROGRESS).
// On failure cnx is closed and error holds the errno value.
ConnectResult StartConnect(const addrinfo& address);

// Once a pending connect reports writable, returns its outcome (SO_ERROR): 0 on success, errno value otherwise.
int PendingConnectError(int fd) noexcept;

// Outcome of a pending connect from the return value of a poll(POLLOUT) on fd and the errno it left:
// EINPROGRESS while not writable or when the poll was interrupted, the poll errno if it failed,
// PendingConnectError(fd) once writable.
int PendingConnectStatus(int fd, int nbReady, int pollErrno) noexcept;

// Non-blocking check of a pending connect, see PendingConnectStatus.
int CheckPendingConnect(int fd) noexcept;

// Human readable "ip:port" of the given address, empty if it cannot be formatted.
std::string FormatAddress(const addrinfo& address);

}  // namespace tlsdial
