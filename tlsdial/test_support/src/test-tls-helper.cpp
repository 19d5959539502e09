#include "tlsdial/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/log.hpp"
#include "tlsdial/memory-transport.hpp"
#include "tlsdial/openssl-acceptor.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/tls-backend.hpp"
#include "tlsdial/tls-handshake.hpp"
#include "tlsdial/tls-raii.hpp"
#include "tlsdial/tls-server-config.hpp"
#include "tlsdial/tls-stream.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial::test {

namespace {

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;

PKeyPtr GenerateKey(KeyAlgorithm alg) {
  EVP_PKEY* pkey = nullptr;
  if (alg == KeyAlgorithm::Rsa2048) {
    PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), ::EVP_PKEY_CTX_free);
    if (kctx == nullptr) {
      return {nullptr, ::EVP_PKEY_free};
    }
    if (::EVP_PKEY_keygen_init(kctx.get()) != 1 || ::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) != 1 ||
        ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
      return {nullptr, ::EVP_PKEY_free};
    }
    return {pkey, ::EVP_PKEY_free};
  }

  // ECDSA P-256
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr) {
    return {nullptr, ::EVP_PKEY_free};
  }
  if (::EVP_PKEY_keygen_init(kctx.get()) != 1 ||
      ::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1 ||
      ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    return {nullptr, ::EVP_PKEY_free};
  }
  return {pkey, ::EVP_PKEY_free};
}

std::string ToPem(auto writer) {
  std::string pem;
  auto bio = MakeMemoryBio();
  if (writer(bio.get()) == 1) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    pem.assign(data, static_cast<std::size_t>(len));
  }
  return pem;
}

constexpr int kMaxLoopbackRounds = 32;

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds, KeyAlgorithm alg) {
  auto pkey = GenerateKey(alg);
  if (!pkey) {
    return {"", ""};
  }

  std::unique_ptr<X509, decltype(&X509_free)> x509Ptr(X509_new(), &X509_free);

  X509* x509 = x509Ptr.get();
  if (x509 == nullptr) {
    return {"", ""};
  }
  ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
  X509_gmtime_adj(X509_get_notBefore(x509), 0);
  X509_gmtime_adj(X509_get_notAfter(x509), validSeconds);
  X509_set_pubkey(x509, pkey.get());
  X509_NAME* name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "C", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("XX"), -1, -1, 0);
  X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("TlsdialTest"), -1, -1, 0);
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1, 0);
  X509_set_issuer_name(x509, name);
  if (X509_sign(x509, pkey.get(), EVP_sha256()) <= 0) {
    return {"", ""};
  }

  std::string certPem = ToPem([x509](BIO* bio) { return PEM_write_bio_X509(bio, x509); });
  std::string keyPem = ToPem([&pkey](BIO* bio) {
    return PEM_write_bio_PrivateKey(bio, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr);
  });
  return {std::move(certPem), std::move(keyPem)};
}

LoopbackHandshake RunLoopbackHandshake(const ITlsContext& context, const HandshakeParams& params,
                                       const ITlsAcceptor& acceptor) {
  auto [client, server] = MakeMemoryTransportPair();
  MemoryTransport* clientTransport = client.get();
  TlsHandshake serverHandshake(acceptor, std::move(server));
  TlsHandshake clientHandshake(context, params, std::move(client));
  auto serverRes = PollResult<TlsStream>::NotReady(TransportHint::ReadReady);
  auto clientRes = PollResult<TlsStream>::NotReady(TransportHint::ReadReady);
  for (int round = 0; round < kMaxLoopbackRounds && (serverRes.isPending() || clientRes.isPending()); ++round) {
    if (serverRes.isPending()) {
      serverRes = serverHandshake.poll();
    }
    if (clientRes.isPending()) {
      clientRes = clientHandshake.poll();
    }
  }
  return {std::move(clientRes), std::move(serverRes), clientTransport};
}

std::string ReadSome(TlsStream& stream) {
  char buf[256];
  for (int round = 0; round < kMaxLoopbackRounds; ++round) {
    auto res = stream.read(buf, sizeof(buf));
    if (res.bytesProcessed > 0) {
      return {buf, res.bytesProcessed};
    }
    if (res.want != TransportHint::ReadReady) {
      break;
    }
  }
  return {};
}

TlsEchoServer::TlsEchoServer(std::string_view certPem, std::string_view keyPem, std::vector<std::string> alpn)
    : _acceptor(TlsServerConfig{}.withCertPem(certPem).withKeyPem(keyPem).withTlsAlpnProtocols(std::move(alpn))),
      _thread([this](std::stop_token stopToken) { serve(std::move(stopToken)); }) {}

TlsEchoServer::~TlsEchoServer() {
  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
}

void TlsEchoServer::serve(std::stop_token stopToken) {
  while (!stopToken.stop_requested()) {
    pollfd pfd{_listener.fd(), POLLIN, 0};
    if (::poll(&pfd, 1, 50) != 1) {
      continue;
    }
    BaseFd cnx = _listener.accept();
    if (!cnx) {
      continue;
    }
    echo(cnx.fd());
  }
}

void TlsEchoServer::echo(int fd) {
  timeval timeout{5, 0};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

  SslPtr ssl(::SSL_new(_acceptor.raw()), ::SSL_free);
  if (!ssl || ::SSL_set_fd(ssl.get(), fd) != 1) {
    return;
  }
  // plain blocking socket here
  SSL_set_mode(ssl.get(), SSL_MODE_AUTO_RETRY);
  ::ERR_clear_error();
  if (::SSL_accept(ssl.get()) != 1) {
    ++_nbHandshakesFailed;
    log::debug("TlsEchoServer: handshake failed on fd # {}", fd);
    ::ERR_clear_error();
    return;
  }
  ++_nbHandshakesSucceeded;

  char buf[4096];
  std::size_t nbRead = 0;
  bool open = true;
  while (open && ::SSL_read_ex(ssl.get(), buf, sizeof(buf), &nbRead) == 1) {
    // partial writes are enabled on the acceptor context
    for (std::size_t pos = 0; pos < nbRead;) {
      std::size_t nbWritten = 0;
      if (::SSL_write_ex(ssl.get(), buf + pos, nbRead - pos, &nbWritten) != 1) {
        open = false;
        break;
      }
      pos += nbWritten;
    }
  }
  ::SSL_shutdown(ssl.get());
  ::ERR_clear_error();
}

}  // namespace tlsdial::test
