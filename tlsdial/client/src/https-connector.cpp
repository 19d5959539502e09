#include "tlsdial/https-connector.hpp"

#include <cstdint>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/contract-violation.hpp"
#include "tlsdial/destination.hpp"
#include "tlsdial/https-connector-config.hpp"
#include "tlsdial/log.hpp"
#include "tlsdial/maybe-tls-stream.hpp"
#include "tlsdial/openssl-context.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/raw-connector.hpp"
#include "tlsdial/tcp-raw-connector.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-handshake.hpp"
#include "tlsdial/tls-stream.hpp"

namespace tlsdial {

namespace {

// Scheme policy belongs to the HTTPS connector, the TCP layer accepts any scheme.
std::unique_ptr<RawConnector> MakeTcpRawConnector(uint32_t resolverThreads) {
  auto rawConnector = std::make_unique<TcpRawConnector>(resolverThreads);
  rawConnector->enforceHttp(false);
  return rawConnector;
}

}  // namespace

HttpsConnecting::HttpsConnecting(ConnectError rejection)
    : _rejection(std::move(rejection)), _state(State::Rejected) {}

HttpsConnecting::HttpsConnecting(std::unique_ptr<RawConnecting> raw, std::shared_ptr<const ITlsContext> tlsContext,
                                 const Destination& destination, bool verifyHostname)
    : _raw(std::move(raw)),
      _tlsContext(std::move(tlsContext)),
      _host(destination.host),
      _secure(destination.isSecure()),
      _verifyHostname(verifyHostname),
      _state(State::Connecting) {}

PollResult<HttpsConnection> HttpsConnecting::poll() {
  switch (_state) {
    case State::Rejected:
      _state = State::Done;
      return PollResult<HttpsConnection>::Failed(std::move(*_rejection));
    case State::Connecting:
      return pollRaw();
    case State::Handshaking:
      return pollHandshake();
    case State::Done:
      ContractViolation("HttpsConnecting polled after completion");
    default:
      ContractViolation("HttpsConnecting in unknown state");
  }
}

PollResult<HttpsConnection> HttpsConnecting::pollRaw() {
  auto res = _raw->poll();
  if (res.isPending()) {
    return std::move(res).propagate<HttpsConnection>();
  }
  _raw.reset();
  if (res.isFailed()) {
    _state = State::Done;
    return std::move(res).propagate<HttpsConnection>();
  }

  RawConnection raw = std::move(res).value();
  _connected = std::move(raw.connected);
  if (!_secure) {
    _state = State::Done;
    return PollResult<HttpsConnection>::Ready(
        HttpsConnection{MaybeTlsStream(std::move(raw.transport)), std::move(_connected)});
  }

  _handshake.emplace(*_tlsContext, HandshakeParams{_host, _verifyHostname}, std::move(raw.transport));
  _state = State::Handshaking;
  return pollHandshake();
}

PollResult<HttpsConnection> HttpsConnecting::pollHandshake() {
  auto res = _handshake->poll();
  if (res.isPending()) {
    return std::move(res).propagate<HttpsConnection>();
  }
  _state = State::Done;
  if (res.isFailed()) {
    _handshake.reset();
    return std::move(res).propagate<HttpsConnection>();
  }
  TlsStream stream = std::move(res).value();
  _handshake.reset();
  _connected.isTls = true;
  _connected.negotiatedAlpn = stream.session().negotiatedAlpn();
  return PollResult<HttpsConnection>::Ready(HttpsConnection{MaybeTlsStream(std::move(stream)), std::move(_connected)});
}

int HttpsConnecting::fd() const noexcept {
  switch (_state) {
    case State::Connecting:
      return _raw->fd();
    case State::Handshaking:
      return _handshake->fd();
    default:
      return -1;
  }
}

HttpsConnector::HttpsConnector(uint32_t concurrencyHint)
    : HttpsConnector(HttpsConnectorConfig{}.withResolverThreads(concurrencyHint)) {}

HttpsConnector::HttpsConnector(const HttpsConnectorConfig& config)
    : _hostnameVerification(config.hostnameVerification), _forceHttps(config.forceHttps) {
  config.validate();
  _rawConnector = MakeTcpRawConnector(config.resolverThreads);
  _tlsContext = std::make_shared<OpenSslContext>(config.tls);
  if (!_hostnameVerification) {
    log::warn("HttpsConnector: hostname verification is disabled");
  }
}

HttpsConnector::HttpsConnector(std::unique_ptr<RawConnector> rawConnector,
                               std::shared_ptr<const ITlsContext> tlsContext)
    : _rawConnector(std::move(rawConnector)), _tlsContext(std::move(tlsContext)) {
  if (!_rawConnector || !_tlsContext) {
    throw std::invalid_argument("HttpsConnector requires a raw connector and a TLS context");
  }
}

HttpsConnector::HttpsConnector(const HttpsConnector& other)
    : _rawConnector(other._rawConnector->clone()),
      _tlsContext(other._tlsContext),
      _hostnameVerification(other._hostnameVerification),
      _forceHttps(other._forceHttps) {}

HttpsConnector& HttpsConnector::operator=(const HttpsConnector& other) {
  if (this != &other) {
    _rawConnector = other._rawConnector->clone();
    _tlsContext = other._tlsContext;
    _hostnameVerification = other._hostnameVerification;
    _forceHttps = other._forceHttps;
  }
  return *this;
}

HttpsConnector& HttpsConnector::dangerDisableHostnameVerification(bool disable) {
  _hostnameVerification = !disable;
  if (disable) {
    log::warn("HttpsConnector: hostname verification is disabled, peers are no longer authenticated by name");
  }
  return *this;
}

HttpsConnecting HttpsConnector::connect(const Destination& destination) const {
  if (_forceHttps && !destination.isSecure()) {
    log::debug("HttpsConnector: rejecting '{}' destination {}, HTTPS is enforced", destination.scheme,
               destination.authority());
    return HttpsConnecting(ConnectError::ProtocolPolicy(destination.scheme));
  }
  return {_rawConnector->connect(destination), _tlsContext, destination, _hostnameVerification};
}

std::string HttpsConnector::describe() const {
  return std::format("HttpsConnector {{ hostname_verification: {}, force_https: {} }}", _hostnameVerification,
                     _forceHttps);
}

}  // namespace tlsdial
