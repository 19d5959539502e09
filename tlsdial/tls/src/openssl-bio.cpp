#include "tlsdial/openssl-bio.hpp"

#include <openssl/bio.h>

#include <cstddef>
#include <new>
#include <string_view>

#include "tlsdial/tls-raii.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

namespace {

RawTransport* Transport(BIO* bio) { return static_cast<RawTransport*>(::BIO_get_data(bio)); }

int TransportBioWrite(BIO* bio, const char* data, int len) {
  BIO_clear_retry_flags(bio);
  auto* transport = Transport(bio);
  if (transport == nullptr || len < 0) {
    return -1;
  }
  const auto [nbWritten, want] = transport->write(std::string_view(data, static_cast<std::size_t>(len)));
  if (nbWritten > 0) {
    return static_cast<int>(nbWritten);
  }
  if (want == TransportHint::WriteReady || want == TransportHint::ReadReady) {
    BIO_set_retry_write(bio);
  }
  return -1;
}

int TransportBioRead(BIO* bio, char* buf, int len) {
  BIO_clear_retry_flags(bio);
  auto* transport = Transport(bio);
  if (transport == nullptr || len < 0) {
    return -1;
  }
  const auto [nbRead, want] = transport->read(buf, static_cast<std::size_t>(len));
  if (nbRead > 0) {
    return static_cast<int>(nbRead);
  }
  switch (want) {
    case TransportHint::None:
      // orderly close from the peer
      return 0;
    case TransportHint::ReadReady:
      [[fallthrough]];
    case TransportHint::WriteReady:
      BIO_set_retry_read(bio);
      return -1;
    default:
      return -1;
  }
}

int TransportBioPuts(BIO* bio, const char* str) {
  return TransportBioWrite(bio, str, static_cast<int>(std::string_view(str).size()));
}

long TransportBioCtrl(BIO* bio, int cmd, [[maybe_unused]] long num, [[maybe_unused]] void* ptr) {
  switch (cmd) {
    case BIO_CTRL_FLUSH: {
      auto* transport = Transport(bio);
      return transport != nullptr && transport->flush() != TransportHint::Error ? 1 : 0;
    }
    case BIO_CTRL_DUP:
      return 1;
    default:
      return 0;
  }
}

int TransportBioCreate(BIO* bio) {
  ::BIO_set_init(bio, 1);
  return 1;
}

int TransportBioDestroy(BIO* bio) {
  // the transport is owned by the TLS session, not by the BIO
  ::BIO_set_data(bio, nullptr);
  return 1;
}

BIO_METHOD* CreateTransportBioMethod() {
  BIO_METHOD* method = ::BIO_meth_new(::BIO_get_new_index() | BIO_TYPE_SOURCE_SINK, "tlsdial transport");
  if (method == nullptr) {
    throw std::bad_alloc();
  }
  ::BIO_meth_set_write(method, &TransportBioWrite);
  ::BIO_meth_set_read(method, &TransportBioRead);
  ::BIO_meth_set_puts(method, &TransportBioPuts);
  ::BIO_meth_set_ctrl(method, &TransportBioCtrl);
  ::BIO_meth_set_create(method, &TransportBioCreate);
  ::BIO_meth_set_destroy(method, &TransportBioDestroy);
  return method;
}

const BIO_METHOD* TransportBioMethod() {
  static const BioMethodPtr kMethod(CreateTransportBioMethod(), ::BIO_meth_free);
  return kMethod.get();
}

}  // namespace

BioPtr MakeTransportBio(RawTransport& transport) {
  auto bio = MakeBio(::BIO_new(TransportBioMethod()));
  ::BIO_set_data(bio.get(), &transport);
  return bio;
}

}  // namespace tlsdial
