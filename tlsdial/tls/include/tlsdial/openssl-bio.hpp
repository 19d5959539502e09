#pragma once

#include <openssl/bio.h>

#include "tlsdial/tls-raii.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Create a BIO forwarding OpenSSL record I/O to the given transport, which must outlive the BIO.
// Would-block hints of the transport are translated into BIO retry flags, so SSL_get_error reports
// SSL_ERROR_WANT_READ / SSL_ERROR_WANT_WRITE as it would on a non-blocking socket BIO.
// Throws std::bad_alloc on allocation failure.
BioPtr MakeTransportBio(RawTransport& transport);

}  // namespace tlsdial
