#pragma once

#include <cerrno>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/event-loop.hpp"
#include "tlsdial/event.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Minimal executor: polls op until it resolves, waiting in between on the descriptor and readiness it reports.
// op needs poll() returning a PollResult and fd(). If no readiness is reported within the loop poll timeout,
// the result is a Connect error with ETIMEDOUT and op is left pending (drop it to cancel).
template <class Op>
auto RunToCompletion(Op& op, EventLoop& eventLoop) -> decltype(op.poll()) {
  using Result = decltype(op.poll());

  int registeredFd = -1;
  while (true) {
    Result res = op.poll();
    if (registeredFd != -1) {
      eventLoop.del(registeredFd);
      registeredFd = -1;
    }
    if (!res.isPending()) {
      return res;
    }

    const int fd = op.fd();
    if (fd == -1) {
      return Result::Failed(ConnectError::Connect(EBADF, "pending operation has no descriptor to wait on"));
    }
    const EventBmp events = res.want() == TransportHint::WriteReady ? EventOut : EventIn;
    if (!eventLoop.add(fd, events)) {
      return Result::Failed(ConnectError::Connect(EBADF, "cannot register pending operation in event loop"));
    }
    registeredFd = fd;

    if (eventLoop.poll().empty()) {
      eventLoop.del(registeredFd);
      return Result::Failed(ConnectError::Connect(ETIMEDOUT, "no progress before poll timeout"));
    }
  }
}

}  // namespace tlsdial
