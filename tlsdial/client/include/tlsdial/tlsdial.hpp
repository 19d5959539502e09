// tlsdial Umbrella Header
//
// Include this single header to pull in the public connector API:
//   - HttpsConnector / HttpsConnecting and their result types
//   - Configuration types (HttpsConnectorConfig, TlsClientConfig, TlsServerConfig)
//   - Streams (MaybeTlsStream, TlsStream), the TLS backend interfaces and the server side acceptor
//   - A minimal event loop and RunToCompletion to drive operations without an external executor
//
// Usage Example:
//    #include <tlsdial/tlsdial.hpp>
//    using namespace tlsdial;
//    int main() {
//      HttpsConnector connector;
//      EventLoop eventLoop(std::chrono::seconds(10));
//      auto connecting = connector.connect(Destination::Parse("https://example.com/"));
//      auto res = RunToCompletion(connecting, eventLoop);
//    }

#pragma once

// Connector
#include "tlsdial/connect-error.hpp"     // IWYU pragma: export
#include "tlsdial/connected.hpp"         // IWYU pragma: export
#include "tlsdial/destination.hpp"       // IWYU pragma: export
#include "tlsdial/https-connector.hpp"   // IWYU pragma: export
#include "tlsdial/poll-result.hpp"       // IWYU pragma: export
#include "tlsdial/raw-connector.hpp"     // IWYU pragma: export
#include "tlsdial/tcp-raw-connector.hpp"  // IWYU pragma: export

// Configuration
#include "tlsdial/https-connector-config.hpp"  // IWYU pragma: export
#include "tlsdial/tls-client-config.hpp"       // IWYU pragma: export
#include "tlsdial/tls-server-config.hpp"       // IWYU pragma: export

// Streams & TLS backend
#include "tlsdial/maybe-tls-stream.hpp"  // IWYU pragma: export
#include "tlsdial/openssl-acceptor.hpp"  // IWYU pragma: export
#include "tlsdial/openssl-context.hpp"   // IWYU pragma: export
#include "tlsdial/tls-handshake.hpp"     // IWYU pragma: export
#include "tlsdial/tls-backend.hpp"       // IWYU pragma: export
#include "tlsdial/tls-stream.hpp"        // IWYU pragma: export
#include "tlsdial/transport.hpp"         // IWYU pragma: export

// Driving
#include "tlsdial/event-loop.hpp"         // IWYU pragma: export
#include "tlsdial/run-to-completion.hpp"  // IWYU pragma: export
