#pragma once

#include "tlsdial/base-fd.hpp"

namespace tlsdial {

// Simple RAII class wrapping a Linux eventfd (non-blocking, close-on-exec).
class EventFd {
 public:
  // Create the wakeup fd.
  // Throws std::system_error on failure.
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tlsdial
