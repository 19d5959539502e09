#include "tlsdial/fake-tls.hpp"

#include <memory>
#include <string>
#include <utility>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial::test {

FakeTlsSession::FakeTlsSession(std::unique_ptr<RawTransport> transport, std::shared_ptr<FakeTlsScript> script)
    : _transport(std::move(transport)), _script(std::move(script)) {
  ++_script->nbSessionAlive;
}

FakeTlsSession::~FakeTlsSession() { --_script->nbSessionAlive; }

TransportHint FakeTlsSession::closeNotify() {
  TransportHint hint = TransportHint::None;
  if (!_script->closeNotifyHints.empty()) {
    hint = _script->closeNotifyHints.front();
    _script->closeNotifyHints.pop_front();
  }
  _script->events.emplace_back("close_notify");
  return hint;
}

TransportHint FakeTlsSession::shutdownTransport() {
  _script->events.emplace_back("transport_shutdown");
  return _transport->shutdown();
}

FakePartialSession::FakePartialSession(std::unique_ptr<RawTransport> transport, std::shared_ptr<FakeTlsScript> script)
    : _transport(std::move(transport)), _script(std::move(script)) {
  ++_script->nbPartialAlive;
}

FakePartialSession::~FakePartialSession() { --_script->nbPartialAlive; }

HandshakeOutcome FakePartialSession::resumeHandshake() {
  ++_script->nbResume;
  _script->events.emplace_back("resume");
  return NextFakeStep(std::move(_transport), _script);
}

HandshakeOutcome FakeTlsContext::beginHandshake(const HandshakeParams& params,
                                                std::unique_ptr<RawTransport> transport) const {
  ++_script->nbBegin;
  _script->events.emplace_back("begin");
  _script->lastHostname = params.hostname;
  _script->lastVerifyHostname = params.verifyHostname;
  return NextFakeStep(std::move(transport), _script);
}

HandshakeOutcome NextFakeStep(std::unique_ptr<RawTransport> transport, std::shared_ptr<FakeTlsScript> script) {
  FakeStep step = FakeStep::Succeed;
  if (!script->steps.empty()) {
    step = script->steps.front();
    script->steps.pop_front();
  }
  switch (step) {
    case FakeStep::WantRead:
      return HandshakeInterrupted{std::make_unique<FakePartialSession>(std::move(transport), std::move(script)),
                                  TransportHint::ReadReady};
    case FakeStep::WantWrite:
      return HandshakeInterrupted{std::make_unique<FakePartialSession>(std::move(transport), std::move(script)),
                                  TransportHint::WriteReady};
    case FakeStep::Fail:
      return ConnectError::HandshakeFailure(42, "scripted handshake failure");
    default:
      return std::unique_ptr<ITlsSession>(std::make_unique<FakeTlsSession>(std::move(transport), std::move(script)));
  }
}

}  // namespace tlsdial::test
