#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlsdial/tls-backend.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial::test {

enum class FakeStep : uint8_t { WantRead, WantWrite, Succeed, Fail };

// Shared, inspectable state of the fake TLS backend below.
struct FakeTlsScript {
  std::deque<FakeStep> steps;                   // consumed one per handshake step, Succeed once empty
  std::deque<TransportHint> closeNotifyHints;   // consumed one per closeNotify call, None once empty
  std::string alpn;                             // reported by established sessions
  std::vector<std::string> events;              // journal of handshake and shutdown calls
  std::string lastHostname;
  bool lastVerifyHostname{false};
  uint32_t nbBegin{0};
  uint32_t nbResume{0};
  int32_t nbPartialAlive{0};
  int32_t nbSessionAlive{0};
};

// Plaintext pass-through session recording its close sequence.
class FakeTlsSession : public ITlsSession {
 public:
  FakeTlsSession(std::unique_ptr<RawTransport> transport, std::shared_ptr<FakeTlsScript> script);

  FakeTlsSession(const FakeTlsSession&) = delete;
  FakeTlsSession(FakeTlsSession&&) noexcept = delete;
  FakeTlsSession& operator=(const FakeTlsSession&) = delete;
  FakeTlsSession& operator=(FakeTlsSession&&) noexcept = delete;

  ~FakeTlsSession() override;

  TransportResult read(char* buf, std::size_t len) override { return _transport->read(buf, len); }

  TransportResult write(std::string_view data) override { return _transport->write(data); }

  TransportHint flush() override { return _transport->flush(); }

  TransportHint closeNotify() override;

  TransportHint shutdownTransport() override;

  [[nodiscard]] std::string_view negotiatedAlpn() const noexcept override { return _script->alpn; }
  [[nodiscard]] std::string_view negotiatedVersion() const noexcept override { return "FAKE"; }
  [[nodiscard]] std::string_view negotiatedCipher() const noexcept override { return "NULL"; }
  [[nodiscard]] std::string_view peerSubject() const noexcept override { return "CN=fake"; }
  [[nodiscard]] void* nativeHandle() const noexcept override { return nullptr; }
  [[nodiscard]] int fd() const noexcept override { return _transport->fd(); }

 private:
  std::unique_ptr<RawTransport> _transport;
  std::shared_ptr<FakeTlsScript> _script;
};

class FakePartialSession : public IPartialSession {
 public:
  FakePartialSession(std::unique_ptr<RawTransport> transport, std::shared_ptr<FakeTlsScript> script);

  FakePartialSession(const FakePartialSession&) = delete;
  FakePartialSession(FakePartialSession&&) noexcept = delete;
  FakePartialSession& operator=(const FakePartialSession&) = delete;
  FakePartialSession& operator=(FakePartialSession&&) noexcept = delete;

  ~FakePartialSession() override;

  HandshakeOutcome resumeHandshake() override;

  [[nodiscard]] int fd() const noexcept override { return _transport ? _transport->fd() : -1; }

 private:
  std::unique_ptr<RawTransport> _transport;
  std::shared_ptr<FakeTlsScript> _script;
};

// TLS context whose handshakes follow script->steps.
class FakeTlsContext : public ITlsContext {
 public:
  explicit FakeTlsContext(std::shared_ptr<FakeTlsScript> script) : _script(std::move(script)) {}

  HandshakeOutcome beginHandshake(const HandshakeParams& params,
                                  std::unique_ptr<RawTransport> transport) const override;

  [[nodiscard]] FakeTlsScript& script() const noexcept { return *_script; }

 private:
  std::shared_ptr<FakeTlsScript> _script;
};

// Run the next scripted handshake step.
HandshakeOutcome NextFakeStep(std::unique_ptr<RawTransport> transport, std::shared_ptr<FakeTlsScript> script);

}  // namespace tlsdial::test
