#include "tlsdial/tls-stream.hpp"

#include "tlsdial/log.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

TransportHint TlsStream::shutdown() {
  if (!_closeNotifyDone) {
    const TransportHint hint = _session->closeNotify();
    if (hint != TransportHint::None) {
      if (hint == TransportHint::Error) {
        log::warn("TLS shutdown fd # {}: close_notify failed, transport not shut down", _session->fd());
      }
      return hint;
    }
    _closeNotifyDone = true;
  }
  return _session->shutdownTransport();
}

}  // namespace tlsdial
