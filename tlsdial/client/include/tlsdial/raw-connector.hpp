#pragma once

#include <memory>

#include "tlsdial/connected.hpp"
#include "tlsdial/destination.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Established plaintext connection with its metadata.
struct RawConnection {
  std::unique_ptr<RawTransport> transport;
  Connected connected;
};

// Pending raw connection. Once poll() returned a ready or failed result, polling again is a contract violation.
class RawConnecting {
 public:
  virtual ~RawConnecting() = default;

  virtual PollResult<RawConnection> poll() = 0;

  // Descriptor to wait on with the readiness returned by the last pending poll, -1 if none.
  [[nodiscard]] virtual int fd() const noexcept = 0;
};

// Produces raw (plaintext) connections to destinations.
class RawConnector {
 public:
  virtual ~RawConnector() = default;

  // Starts connecting to the destination host and port. Failures, including rejected destinations,
  // are reported by the returned operation.
  [[nodiscard]] virtual std::unique_ptr<RawConnecting> connect(const Destination& destination) const = 0;

  [[nodiscard]] virtual std::unique_ptr<RawConnector> clone() const = 0;
};

}  // namespace tlsdial
