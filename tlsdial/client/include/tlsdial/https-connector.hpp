#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/connected.hpp"
#include "tlsdial/destination.hpp"
#include "tlsdial/https-connector-config.hpp"
#include "tlsdial/maybe-tls-stream.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/raw-connector.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-handshake.hpp"

namespace tlsdial {

struct HttpsConnection {
  MaybeTlsStream stream;
  Connected connected;
};

// Pending connection produced by HttpsConnector::connect: raw connect, then TLS handshake for https.
// Dropping it cancels the operation and releases everything it holds.
class HttpsConnecting {
 public:
  enum class State : uint8_t { Rejected, Connecting, Handshaking, Done };

  // Advance the operation without blocking. Polling once it returned a ready or failed result is a
  // contract violation and aborts the process.
  PollResult<HttpsConnection> poll();

  // Descriptor to wait on with the readiness returned by the last pending poll, -1 if none.
  [[nodiscard]] int fd() const noexcept;

  [[nodiscard]] State state() const noexcept { return _state; }

 private:
  friend class HttpsConnector;

  explicit HttpsConnecting(ConnectError rejection);

  HttpsConnecting(std::unique_ptr<RawConnecting> raw, std::shared_ptr<const ITlsContext> tlsContext,
                  const Destination& destination, bool verifyHostname);

  PollResult<HttpsConnection> pollRaw();

  PollResult<HttpsConnection> pollHandshake();

  std::optional<ConnectError> _rejection;
  std::unique_ptr<RawConnecting> _raw;
  std::shared_ptr<const ITlsContext> _tlsContext;
  std::optional<TlsHandshake> _handshake;
  Connected _connected;
  std::string _host;
  bool _secure{false};
  bool _verifyHostname{true};
  State _state;
};

// Connector producing plaintext or TLS streams depending on the destination scheme, for an HTTP client's
// connection pool. Configure it before sharing it: copies are cheap (they share the TLS context), setters
// must not be called concurrently with connect.
class HttpsConnector {
 public:
  // TCP connector with concurrencyHint DNS threads (0: inline resolution) and a TLS context trusting the
  // system default certificates. Same as a default HttpsConnectorConfig with that many resolver threads.
  // Throws std::invalid_argument above the resolver thread limit, std::system_error / std::runtime_error
  // on failure.
  explicit HttpsConnector(uint32_t concurrencyHint = 1);

  // Throws std::invalid_argument if the config is invalid.
  explicit HttpsConnector(const HttpsConnectorConfig& config);

  // Assemble from an existing raw connector and TLS context. Throws std::invalid_argument if one is null.
  HttpsConnector(std::unique_ptr<RawConnector> rawConnector, std::shared_ptr<const ITlsContext> tlsContext);

  // Clones the raw connector, shares the TLS context.
  HttpsConnector(const HttpsConnector& other);
  HttpsConnector(HttpsConnector&&) noexcept = default;
  HttpsConnector& operator=(const HttpsConnector& other);
  HttpsConnector& operator=(HttpsConnector&&) noexcept = default;

  ~HttpsConnector() = default;

  // Accept certificates that are not valid for the destination host. The chain itself is still verified
  // unless disabled in the TLS context.
  HttpsConnector& dangerDisableHostnameVerification(bool disable);

  // Reject destinations whose scheme is not https, before any network I/O.
  HttpsConnector& forceHttps(bool enable) noexcept {
    _forceHttps = enable;
    return *this;
  }

  [[nodiscard]] HttpsConnecting connect(const Destination& destination) const;

  [[nodiscard]] bool hostnameVerification() const noexcept { return _hostnameVerification; }

  [[nodiscard]] bool forceHttps() const noexcept { return _forceHttps; }

  [[nodiscard]] const std::shared_ptr<const ITlsContext>& tlsContext() const noexcept { return _tlsContext; }

  [[nodiscard]] const RawConnector& rawConnector() const noexcept { return *_rawConnector; }

  // "HttpsConnector { hostname_verification: true, force_https: false }"
  [[nodiscard]] std::string describe() const;

 private:
  std::unique_ptr<RawConnector> _rawConnector;
  std::shared_ptr<const ITlsContext> _tlsContext;
  bool _hostnameVerification{true};
  bool _forceHttps{false};
};

}  // namespace tlsdial
