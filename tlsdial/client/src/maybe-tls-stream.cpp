#include "tlsdial/maybe-tls-stream.hpp"

#include <cstddef>
#include <string_view>
#include <variant>

#include "tlsdial/tls-stream.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

TransportResult MaybeTlsStream::read(char* buf, std::size_t len) {
  if (auto* tls = std::get_if<TlsStream>(&_stream)) {
    return tls->read(buf, len);
  }
  return std::get<0>(_stream)->read(buf, len);
}

TransportResult MaybeTlsStream::write(std::string_view data) {
  if (auto* tls = std::get_if<TlsStream>(&_stream)) {
    return tls->write(data);
  }
  return std::get<0>(_stream)->write(data);
}

TransportHint MaybeTlsStream::flush() {
  if (auto* tls = std::get_if<TlsStream>(&_stream)) {
    return tls->flush();
  }
  return std::get<0>(_stream)->flush();
}

TransportHint MaybeTlsStream::shutdown() {
  if (auto* tls = std::get_if<TlsStream>(&_stream)) {
    return tls->shutdown();
  }
  return std::get<0>(_stream)->shutdown();
}

int MaybeTlsStream::fd() const noexcept {
  if (const auto* tls = std::get_if<TlsStream>(&_stream)) {
    return tls->fd();
  }
  return std::get<0>(_stream)->fd();
}

}  // namespace tlsdial
