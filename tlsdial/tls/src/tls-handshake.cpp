#include "tlsdial/tls-handshake.hpp"

#include <memory>
#include <utility>
#include <variant>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/contract-violation.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-stream.hpp"

namespace tlsdial {

TlsHandshake::TlsHandshake(const ITlsContext& context, const HandshakeParams& params,
                           std::unique_ptr<RawTransport> transport)
    : _outcome(context.beginHandshake(params, std::move(transport))) {}

TlsHandshake::TlsHandshake(const ITlsAcceptor& acceptor, std::unique_ptr<RawTransport> transport)
    : _outcome(acceptor.beginAccept(std::move(transport))) {}

PollResult<TlsStream> TlsHandshake::poll() {
  switch (_state) {
    case State::Started: {
      auto* interrupted = std::get_if<HandshakeInterrupted>(&_outcome);
      if (interrupted == nullptr) {
        return resolve(std::move(_outcome));
      }
      // first step was interrupted: one more step now
      return resolve(interrupted->partial->resumeHandshake());
    }
    case State::Suspended:
      return resolve(std::get<HandshakeInterrupted>(_outcome).partial->resumeHandshake());
    case State::Complete:
      ContractViolation("TlsHandshake polled after completion");
    case State::Failed:
      ContractViolation("TlsHandshake polled after failure");
    default:
      ContractViolation("TlsHandshake in unknown state");
  }
}

PollResult<TlsStream> TlsHandshake::resolve(HandshakeOutcome outcome) {
  if (auto* session = std::get_if<std::unique_ptr<ITlsSession>>(&outcome)) {
    _state = State::Complete;
    _outcome = std::unique_ptr<ITlsSession>();
    return PollResult<TlsStream>::Ready(TlsStream(std::move(*session)));
  }
  if (auto* error = std::get_if<ConnectError>(&outcome)) {
    _state = State::Failed;
    _outcome = std::unique_ptr<ITlsSession>();
    return PollResult<TlsStream>::Failed(std::move(*error));
  }
  auto& interrupted = std::get<HandshakeInterrupted>(outcome);
  const TransportHint want = interrupted.want;
  _state = State::Suspended;
  _outcome = std::move(outcome);
  return PollResult<TlsStream>::NotReady(want);
}

int TlsHandshake::fd() const noexcept {
  if (const auto* interrupted = std::get_if<HandshakeInterrupted>(&_outcome)) {
    return interrupted->partial->fd();
  }
  return -1;
}

}  // namespace tlsdial
