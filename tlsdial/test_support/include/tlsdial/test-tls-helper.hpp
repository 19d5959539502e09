#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "tlsdial/memory-transport.hpp"
#include "tlsdial/openssl-acceptor.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/test-sockets.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-stream.hpp"

namespace tlsdial::test {

// Ephemeral self-signed certificates generated entirely in memory, for tests only.
// Returns {certPem, keyPem}. Default is RSA 2048-bit, 1h validity.
enum class KeyAlgorithm : uint8_t { Rsa2048, EcdsaP256 };

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost", int validSeconds = 3600,
                                                         KeyAlgorithm alg = KeyAlgorithm::Rsa2048);

// Both sides of a handshake run in lock step over an in-memory pipe.
struct LoopbackHandshake {
  PollResult<TlsStream> client;
  PollResult<TlsStream> server;  // still pending if the client never let the server finish
  // Client end of the pipe, owned by the client stream. Dangling once the client stream is gone.
  MemoryTransport* clientTransport;
};

// Polls both handshakes alternately, server first, until both resolve or a round limit is hit.
LoopbackHandshake RunLoopbackHandshake(const ITlsContext& context, const HandshakeParams& params,
                                       const ITlsAcceptor& acceptor);

// Reads until some data is available, retrying on ReadReady a bounded number of times.
std::string ReadSome(TlsStream& stream);

// TLS echo server on 127.0.0.1 running in its own thread, serving connections one after the other.
class TlsEchoServer {
 public:
  TlsEchoServer(std::string_view certPem, std::string_view keyPem, std::vector<std::string> alpn = {});

  TlsEchoServer(const TlsEchoServer&) = delete;
  TlsEchoServer(TlsEchoServer&&) noexcept = delete;
  TlsEchoServer& operator=(const TlsEchoServer&) = delete;
  TlsEchoServer& operator=(TlsEchoServer&&) noexcept = delete;

  ~TlsEchoServer();

  [[nodiscard]] uint16_t port() const noexcept { return _listener.port(); }

  [[nodiscard]] std::size_t nbHandshakesSucceeded() const noexcept {
    return _nbHandshakesSucceeded.load(std::memory_order_acquire);
  }
  [[nodiscard]] std::size_t nbHandshakesFailed() const noexcept {
    return _nbHandshakesFailed.load(std::memory_order_acquire);
  }

 private:
  void serve(std::stop_token stopToken);

  void echo(int fd);

  LoopbackListener _listener;
  OpenSslAcceptor _acceptor;
  std::atomic<std::size_t> _nbHandshakesSucceeded{0};
  std::atomic<std::size_t> _nbHandshakesFailed{0};
  std::jthread _thread;
};

}  // namespace tlsdial::test
