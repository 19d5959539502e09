#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/event.hpp"

namespace tlsdial {

// Thin RAII wrapper over epoll, the readiness source an executor uses to know when to re-poll
// a pending connect operation.
//
// Design notes:
//  * Event buffer starts with kInitialCapacity slots. On saturation (returned events == current capacity)
//    the capacity is doubled, it never shrinks.
//  * add()/mod()/del() return success/failure and log details on failure; caller decides the policy.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 16;

  struct Event {
    int fd;
    EventBmp eventBmp;
  };

  // Throws std::system_error if the epoll instance cannot be created.
  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept = default;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept = default;

  ~EventLoop() = default;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(int fd, EventBmp eventBmp) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(int fd, EventBmp eventBmp) const;

  // Delete fd from monitoring.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  //  - On success: returns a non-empty span of ready events (valid until next poll()).
  //  - On timeout or EINTR: returns an empty span.
  //  - On unrecoverable failure: throws std::system_error.
  [[nodiscard]] std::span<const Event> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  [[nodiscard]] std::chrono::milliseconds pollTimeout() const noexcept { return _pollTimeout; }

 private:
  std::chrono::milliseconds _pollTimeout;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<Event> _readyEvents;
};

}  // namespace tlsdial
