#include <poll.h>

#include <chrono>
#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <tlsdial/tlsdial.hpp>

using namespace tlsdial;

namespace {

bool WaitFor(int fd, TransportHint want) {
  pollfd pfd{fd, static_cast<short>(want == TransportHint::WriteReady ? POLLOUT : POLLIN), 0};
  return ::poll(&pfd, 1, 10000) == 1;
}

}  // namespace

// Usage: https-get <url> [--insecure]
// Connects to url, sends a GET request and prints the raw response on stdout.
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <http(s)://host[:port]/path> [--insecure]\n";
    return 2;
  }
  const std::string_view url = argv[1];
  const bool insecure = argc > 2 && std::string_view(argv[2]) == "--insecure";

  try {
    const Destination destination = Destination::Parse(url);
    auto pathPos = url.find('/', url.find("://") + 3);
    const std::string_view path = pathPos == std::string_view::npos ? "/" : url.substr(pathPos);

    HttpsConnectorConfig config;
    config.withTls(TlsClientConfig{}.withTlsAlpnProtocols({"http/1.1"}));
    if (insecure) {
      config.withDangerDisableHostnameVerification();
    }
    HttpsConnector connector(config);
    std::cerr << connector.describe() << '\n';

    EventLoop eventLoop(std::chrono::seconds(10));
    auto connecting = connector.connect(destination);
    auto res = RunToCompletion(connecting, eventLoop);
    if (res.isFailed()) {
      std::cerr << "Connection failed [" << KindName(res.error().kind()) << "]: " << res.error().message() << '\n';
      return 1;
    }

    HttpsConnection& connection = res.value();
    std::cerr << std::format("Connected to {} (tls={}, alpn='{}')\n", connection.connected.remoteAddress,
                             connection.connected.isTls, connection.connected.negotiatedAlpn);

    std::string request =
        std::format("GET {} HTTP/1.1\r\nHost: {}\r\nConnection: close\r\nUser-Agent: tlsdial\r\n\r\n", path,
                    destination.host);
    std::string_view toSend = request;
    while (!toSend.empty()) {
      const auto [nbWritten, want] = connection.stream.write(toSend);
      toSend.remove_prefix(nbWritten);
      if (want == TransportHint::Error || (want != TransportHint::None && !WaitFor(connection.stream.fd(), want))) {
        std::cerr << "Write failed\n";
        return 1;
      }
    }

    char buf[16384];
    while (true) {
      const auto [nbRead, want] = connection.stream.read(buf, sizeof(buf));
      std::cout.write(buf, static_cast<std::streamsize>(nbRead));
      if (want == TransportHint::Error) {
        std::cerr << "Read failed\n";
        return 1;
      }
      if (nbRead == 0 && want == TransportHint::None) {
        break;
      }
      if (want != TransportHint::None && !WaitFor(connection.stream.fd(), want)) {
        std::cerr << "Read timed out\n";
        return 1;
      }
    }

    for (TransportHint hint = connection.stream.shutdown(); hint == TransportHint::ReadReady ||
                                                             hint == TransportHint::WriteReady;
         hint = connection.stream.shutdown()) {
      if (!WaitFor(connection.stream.fd(), hint)) {
        break;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
