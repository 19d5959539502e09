#include "tlsdial/tcp-raw-connector.hpp"

#include <netdb.h>

#include <cerrno>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/connect-error.hpp"
#include "tlsdial/connected.hpp"
#include "tlsdial/contract-violation.hpp"
#include "tlsdial/destination.hpp"
#include "tlsdial/dns-resolver.hpp"
#include "tlsdial/log.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/raw-connector.hpp"
#include "tlsdial/string-equal-ignore-case.hpp"
#include "tlsdial/tcp-connector.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

namespace {

class TcpConnecting : public RawConnecting {
 public:
  // Rejected before any I/O.
  explicit TcpConnecting(ConnectError error) : _error(std::move(error)) {}

  // Resolution already done (inline resolver).
  TcpConnecting(const Destination& destination, ResolveResult resolved)
      : _authority(destination.authority()), _resolved(std::move(resolved)) {
    if (_resolved.gaiError != 0) {
      _error = resolveError();
    }
  }

  // Resolution in progress on the resolver threads.
  TcpConnecting(const Destination& destination, std::shared_ptr<DnsResolver::Request> request)
      : _authority(destination.authority()), _request(std::move(request)) {}

  PollResult<RawConnection> poll() override;

  [[nodiscard]] int fd() const noexcept override {
    if (_request) {
      return _request->fd();
    }
    return _cnx.fd();
  }

 private:
  ConnectError resolveError() const {
    const char* reason = ::gai_strerror(_resolved.gaiError);
    log::debug("TcpConnecting: resolution of {} failed: {}", _authority, reason);
    return ConnectError::Connect(ResolveErrno(_resolved), std::format("resolve {} ({})", _authority, reason));
  }

  PollResult<RawConnection> fail(ConnectError error) {
    _done = true;
    return PollResult<RawConnection>::Failed(std::move(error));
  }

  PollResult<RawConnection> connected();

  // Start connecting to address, then to the following ones until one is connected or pending.
  PollResult<RawConnection> tryFrom(const addrinfo* address);

  std::string _authority;
  std::shared_ptr<DnsResolver::Request> _request;
  ResolveResult _resolved{AddrInfoPtr(nullptr, nullptr), 0, 0};
  const addrinfo* _current{nullptr};
  BaseFd _cnx;
  std::optional<ConnectError> _error;
  int _lastErrno{EHOSTUNREACH};
  bool _started{false};
  bool _done{false};
};

PollResult<RawConnection> TcpConnecting::poll() {
  if (_done) {
    ContractViolation("TcpConnecting polled after completion");
  }
  if (_error) {
    return fail(std::move(*_error));
  }
  if (_request) {
    if (!_request->done()) {
      return PollResult<RawConnection>::NotReady(TransportHint::ReadReady);
    }
    _resolved = std::move(_request->result());
    _request.reset();
    if (_resolved.gaiError != 0) {
      return fail(resolveError());
    }
  }
  if (!_started) {
    _started = true;
    return tryFrom(_resolved.addresses.get());
  }

  // connect in progress: completed once the socket is writable
  const int err = CheckPendingConnect(_cnx.fd());
  if (err == EINPROGRESS) {
    return PollResult<RawConnection>::NotReady(TransportHint::WriteReady);
  }
  if (err == 0) {
    return connected();
  }
  log::debug("TcpConnecting: connect to {} failed on fd # {}: {}", FormatAddress(*_current), _cnx.fd(),
             std::error_code(err, std::system_category()).message());
  _lastErrno = err;
  _cnx.close();
  return tryFrom(_current->ai_next);
}

PollResult<RawConnection> TcpConnecting::tryFrom(const addrinfo* address) {
  for (; address != nullptr; address = address->ai_next) {
    _current = address;
    ConnectResult connectResult = StartConnect(*address);
    if (!connectResult.cnx) {
      _lastErrno = connectResult.error;
      continue;
    }
    _cnx = std::move(connectResult.cnx);
    if (!connectResult.connectPending) {
      return connected();
    }
    return PollResult<RawConnection>::NotReady(TransportHint::WriteReady);
  }
  return fail(ConnectError::Connect(_lastErrno, std::format("connect to {}", _authority)));
}

PollResult<RawConnection> TcpConnecting::connected() {
  _done = true;
  Connected connected;
  connected.remoteAddress = FormatAddress(*_current);
  log::debug("TcpConnecting: fd # {} connected to {}", _cnx.fd(), connected.remoteAddress);
  return PollResult<RawConnection>::Ready(
      RawConnection{std::make_unique<TcpTransport>(std::move(_cnx)), std::move(connected)});
}

}  // namespace

TcpRawConnector::TcpRawConnector(uint32_t resolverThreads) {
  if (resolverThreads != 0) {
    _resolver = std::make_shared<DnsResolver>(resolverThreads);
  }
}

std::unique_ptr<RawConnecting> TcpRawConnector::connect(const Destination& destination) const {
  if (_enforceHttp && !CaseInsensitiveEqual(destination.scheme, "http")) {
    return std::make_unique<TcpConnecting>(
        ConnectError::Connect(EINVAL, std::format("invalid URL, scheme '{}' is not http", destination.scheme)));
  }
  const std::string port = std::to_string(destination.port);
  if (_resolver) {
    return std::make_unique<TcpConnecting>(destination, _resolver->resolve(destination.host, port));
  }
  return std::make_unique<TcpConnecting>(destination, ResolveTCP(destination.host.c_str(), port.c_str()));
}

std::unique_ptr<RawConnector> TcpRawConnector::clone() const { return std::make_unique<TcpRawConnector>(*this); }

}  // namespace tlsdial
