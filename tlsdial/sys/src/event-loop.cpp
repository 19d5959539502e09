#include "tlsdial/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/errno-throw.hpp"
#include "tlsdial/event.hpp"
#include "tlsdial/log.hpp"

namespace tlsdial {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

EventLoop::EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity)
    : _pollTimeout(pollTimeout),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _epollEvents(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

bool EventLoop::add(int fd, EventBmp eventBmp) const {
  epoll_event ev{eventBmp, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", fd, eventBmp, err,
               std::strerror(err));
    return false;
  }
  return true;
}

bool EventLoop::mod(int fd, EventBmp eventBmp) const {
  epoll_event ev{eventBmp, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", fd, eventBmp, err,
               std::strerror(err));
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // DEL failures are usually benign if fd already closed; log at debug to avoid noise.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll() {
  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()),
                                      static_cast<int>(_pollTimeout.count()));
  _readyEvents.clear();
  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return {};
    }
    throw_errno("epoll_wait failed (timeout_ms={})", _pollTimeout.count());
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _readyEvents.push_back(Event{_epollEvents[static_cast<std::size_t>(idx)].data.fd,
                                 static_cast<EventBmp>(_epollEvents[static_cast<std::size_t>(idx)].events)});
  }

  // If saturated, grow buffer for subsequent polls.
  if (std::cmp_equal(nbReadyFds, _epollEvents.size())) {
    _epollEvents.resize(_epollEvents.size() * 2U);
  }

  return _readyEvents;
}

}  // namespace tlsdial
