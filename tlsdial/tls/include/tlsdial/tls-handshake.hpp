#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "tlsdial/poll-result.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-stream.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Drives a non-blocking TLS handshake, client or server side, to completion over repeated poll() calls.
//
//   Started   - holds the outcome of the first handshake step, run at construction
//   Suspended - holds the partial session, waiting for transport readiness
//   Complete  - terminal, the TlsStream was handed out
//   Failed    - terminal, the handshake error was handed out
//
// Polling a terminal handshake is a contract violation and aborts the process.
// Destroying the handshake in any state releases the partial session and its raw transport.
class TlsHandshake {
 public:
  enum class State : uint8_t { Started, Suspended, Complete, Failed };

  // Start the handshake: takes the raw transport and runs the first step immediately.
  TlsHandshake(const ITlsContext& context, const HandshakeParams& params, std::unique_ptr<RawTransport> transport);

  // Server side: accept TLS on an established raw transport, running the first step immediately.
  TlsHandshake(const ITlsAcceptor& acceptor, std::unique_ptr<RawTransport> transport);

  // Wrap the outcome of an already started handshake.
  explicit TlsHandshake(HandshakeOutcome outcome) noexcept : _outcome(std::move(outcome)) {}

  PollResult<TlsStream> poll();

  [[nodiscard]] State state() const noexcept { return _state; }

  // Descriptor to wait on while pending, -1 once resolved.
  [[nodiscard]] int fd() const noexcept;

 private:
  PollResult<TlsStream> resolve(HandshakeOutcome outcome);

  HandshakeOutcome _outcome;
  State _state{State::Started};
};

}  // namespace tlsdial
