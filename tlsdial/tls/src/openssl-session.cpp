#include "tlsdial/openssl-session.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <cerrno>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/log.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-raii.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {

inline bool IsRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }

inline TransportHint RetryHint(int code) {
  return code == SSL_ERROR_WANT_WRITE ? TransportHint::WriteReady : TransportHint::ReadReady;
}

std::string PeerSubject(const SSL* ssl) {
  std::string subject;
  if (X509* peerRaw = ::SSL_get1_peer_certificate(ssl)) {
    auto peer = AdoptX509(peerRaw);
    if (X509_NAME* name = ::X509_get_subject_name(peer.get())) {
      auto memBio = MakeMemoryBio();
      if (::X509_NAME_print_ex(memBio.get(), name, 0, XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB) >= 0) {
        BUF_MEM* bptr = nullptr;
        BIO_get_mem_ptr(memBio.get(), &bptr);
        if (bptr != nullptr) {
          subject.assign(bptr->data, bptr->length);
        }
      }
    }
  }
  return subject;
}

// Drains the OpenSSL error queue of this thread into a single message. Returns the first error code.
unsigned long DrainErrorQueue(std::string& message) {
  unsigned long firstErr = 0;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    if (firstErr == 0) {
      firstErr = errVal;
    } else {
      message.append("; ");
    }
    message.append(errBuf);
  }
  return firstErr;
}

ConnectError HandshakeError(const SSL* ssl, int sslErr) {
  const long verifyResult = ::SSL_get_verify_result(ssl);
  if (verifyResult != X509_V_OK) {
    ::ERR_clear_error();
    return ConnectError::HandshakeFailure(
        static_cast<unsigned long>(verifyResult),
        std::format("certificate verify failed: {}", ::X509_verify_cert_error_string(verifyResult)));
  }
  std::string message;
  const unsigned long errCode = DrainErrorQueue(message);
  if (errCode == 0) {
    message = sslErr == SSL_ERROR_SYSCALL || sslErr == SSL_ERROR_ZERO_RETURN
                  ? "connection closed or transport error during TLS handshake"
                  : std::format("TLS handshake failed (SSL error {})", sslErr);
  }
  return ConnectError::HandshakeFailure(errCode, message);
}

}  // namespace

HandshakeOutcome StepOpenSslHandshake(std::unique_ptr<RawTransport> transport, SslPtr ssl) {
  ::ERR_clear_error();
  const int rc = ::SSL_do_handshake(ssl.get());
  if (rc == 1) {
    return std::unique_ptr<ITlsSession>(std::make_unique<OpenSslSession>(std::move(transport), std::move(ssl)));
  }
  const int err = ::SSL_get_error(ssl.get(), rc);
  if (IsRetry(err)) {
    return HandshakeInterrupted{std::make_unique<OpenSslPartialSession>(std::move(transport), std::move(ssl)),
                                RetryHint(err)};
  }
  ConnectError error = HandshakeError(ssl.get(), err);
  log::error("TLS handshake fd # {} failed: {}", transport->fd(), error.message());
  return error;
}

HandshakeOutcome OpenSslPartialSession::resumeHandshake() {
  return StepOpenSslHandshake(std::move(_transport), std::move(_ssl));
}

OpenSslSession::OpenSslSession(std::unique_ptr<RawTransport> transport, SslPtr ssl)
    : _transport(std::move(transport)), _ssl(std::move(ssl)), _peerSubject(PeerSubject(_ssl.get())) {
  const unsigned char* sel = nullptr;
  unsigned int slen = 0;
  ::SSL_get0_alpn_selected(_ssl.get(), &sel, &slen);
  if (sel != nullptr) {
    _alpn.assign(reinterpret_cast<const char*>(sel), slen);
  }
  if (const char* cipher = SSL_get_cipher_name(_ssl.get())) {
    _cipher = cipher;
  }
  if (const char* vers = ::SSL_get_version(_ssl.get())) {
    _version = vers;
  }
  log::debug("TLS handshake fd # {} ver={} cipher={} alpn={} peer={}", _transport->fd(), _version, _cipher, _alpn,
             _peerSubject);
}

TransportResult OpenSslSession::read(char* buf, std::size_t len) {
  TransportResult ret{0, TransportHint::None};
  ::ERR_clear_error();
  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) [[likely]] {
    return ret;
  }

  ret.bytesProcessed = 0;

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // Clean shutdown from the peer.
    return ret;
  }
  if (IsRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && ::ERR_peek_error() == 0) {
    // EOF without close_notify: reported as an orderly close, the HTTP layer detects truncation.
    log::debug("TLS read fd # {}: peer closed without close_notify", _transport->fd());
    return ret;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

TransportResult OpenSslSession::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};

  // Avoid calling OpenSSL with a zero-length buffer.
  ::ERR_clear_error();
  if (data.empty() || ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &ret.bytesProcessed) == 1) {
    return ret;
  }

  ret.bytesProcessed = 0;  // caller retries with same data
  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (IsRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }

  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

TransportHint OpenSslSession::closeNotify() {
  // SSL_shutdown returns 0 once our close_notify is sent, 1 if the peer's one was already received.
  // We do not wait for the peer's close_notify.
  ::ERR_clear_error();
  const int rc = ::SSL_shutdown(_ssl.get());
  if (rc >= 0) {
    return TransportHint::None;
  }
  const int err = ::SSL_get_error(_ssl.get(), rc);
  if (IsRetry(err)) {
    return RetryHint(err);
  }
  logErrorIfAny();
  return TransportHint::Error;
}

void OpenSslSession::logErrorIfAny() const noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("TLS session fd # {} OpenSSL error: {}", _transport->fd(), std::string_view(errBuf));
  }
}

}  // namespace tlsdial
