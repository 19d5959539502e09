#include "tlsdial/openssl-context.hpp"

#include <gtest/gtest.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/memory-transport.hpp"
#include "tlsdial/openssl-acceptor.hpp"
#include "tlsdial/test-tls-helper.hpp"
#include "tlsdial/tls-client-config.hpp"
#include "tlsdial/tls-handshake.hpp"
#include "tlsdial/tls-server-config.hpp"
#include "tlsdial/tls-stream.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

namespace {

const std::pair<std::string, std::string>& LocalhostCertKey() {
  static const auto kCertKey = test::MakeEphemeralCertKey("localhost");
  return kCertKey;
}

class OpenSslLoopbackTest : public ::testing::Test {
 protected:
  OpenSslLoopbackTest()
      : acceptor(TlsServerConfig{}
                     .withCertPem(LocalhostCertKey().first)
                     .withKeyPem(LocalhostCertKey().second)
                     .withTlsAlpnProtocols({"h2"})) {}

  TlsClientConfig trustingConfig() const {
    TlsClientConfig cfg;
    cfg.withDefaultVerifyPaths(false).withTrustedCertPem(LocalhostCertKey().first);
    return cfg;
  }

  // Runs both handshake sides in lock step. The server stream, if any, is kept in serverStream.
  PollResult<TlsStream> handshake(const OpenSslContext& clientCtx, std::string_view host, bool verifyHostname) {
    auto loop = test::RunLoopbackHandshake(clientCtx, HandshakeParams{host, verifyHostname}, acceptor);
    EXPECT_FALSE(loop.client.isPending()) << "handshake did not resolve";
    clientTransport = loop.clientTransport;
    if (loop.server.isReady()) {
      serverStream = std::make_unique<TlsStream>(std::move(loop.server).value());
    }
    return std::move(loop.client);
  }

  OpenSslAcceptor acceptor;
  test::MemoryTransport* clientTransport{nullptr};
  std::unique_ptr<TlsStream> serverStream;
};

}  // namespace

TEST(OpenSslContextTest, BuildDefault) {
  auto ctx = OpenSslContext::BuildDefault();
  ASSERT_NE(ctx, nullptr);
  ASSERT_NE(ctx->raw(), nullptr);
  EXPECT_EQ(::SSL_CTX_get_verify_mode(ctx->raw()), SSL_VERIFY_PEER);
}

TEST(OpenSslContextTest, InvalidConfigThrows) {
  TlsClientConfig cfg;
  cfg.withTlsAlpnProtocols({""});
  EXPECT_THROW(OpenSslContext{cfg}, std::invalid_argument);
}

TEST(OpenSslContextTest, UnknownCipherListThrows) {
  TlsClientConfig cfg;
  cfg.withCipherList("NOT-A-CIPHER");
  EXPECT_THROW(OpenSslContext{cfg}, std::runtime_error);
}

TEST(OpenSslContextTest, UnparsableTrustedPemThrows) {
  TlsClientConfig cfg;
  cfg.withDefaultVerifyPaths(false).withTrustedCertPem(
      "-----BEGIN CERTIFICATE-----\nFAKE\n-----END CERTIFICATE-----\n");
  EXPECT_THROW(OpenSslContext{cfg}, std::runtime_error);
}

TEST(OpenSslContextTest, ClientCertificateLoaded) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey("client.test");
  TlsClientConfig cfg;
  cfg.withClientCertKeyPem(certPem, keyPem);
  OpenSslContext ctx(cfg);
  EXPECT_NE(::SSL_CTX_get0_certificate(ctx.raw()), nullptr);
}

TEST(OpenSslContextTest, VersionBounds) {
  TlsClientConfig cfg;
  cfg.withTlsMinVersion("TLS1.2").withTlsMaxVersion("TLS1.2");
  OpenSslContext ctx(cfg);
  EXPECT_EQ(SSL_CTX_get_min_proto_version(ctx.raw()), TLS1_2_VERSION);
  EXPECT_EQ(SSL_CTX_get_max_proto_version(ctx.raw()), TLS1_2_VERSION);
}

TEST_F(OpenSslLoopbackTest, HandshakeAndRoundTrip) {
  TlsClientConfig cfg = trustingConfig();
  cfg.withTlsAlpnProtocols({"h2", "http/1.1"});
  OpenSslContext clientCtx(cfg);

  auto res = handshake(clientCtx, "localhost", true);
  ASSERT_TRUE(res.isReady()) << res.error().message();
  TlsStream& stream = res.value();
  EXPECT_EQ(stream.session().negotiatedAlpn(), "h2");
  EXPECT_FALSE(stream.session().negotiatedVersion().empty());
  EXPECT_FALSE(stream.session().negotiatedCipher().empty());
  EXPECT_NE(stream.session().peerSubject().find("CN=localhost"), std::string_view::npos);
  EXPECT_NE(stream.session().nativeHandle(), nullptr);

  ASSERT_NE(serverStream, nullptr);
  EXPECT_EQ(stream.write("ping").bytesProcessed, 4U);
  EXPECT_EQ(test::ReadSome(*serverStream), "ping");
  EXPECT_EQ(serverStream->write("pong").bytesProcessed, 4U);
  EXPECT_EQ(test::ReadSome(stream), "pong");
}

TEST_F(OpenSslLoopbackTest, WriteRetryMayUseAnotherBufferWithSameBytes) {
  OpenSslContext clientCtx(trustingConfig());
  auto res = handshake(clientCtx, "localhost", true);
  ASSERT_TRUE(res.isReady()) << res.error().message();
  ASSERT_NE(serverStream, nullptr);
  TlsStream& stream = res.value();

  const std::string payload(100, 'x');
  clientTransport->setWriteBlocked(true);
  {
    const std::string firstAttempt(payload);
    auto blocked = stream.write(firstAttempt);
    EXPECT_EQ(blocked.bytesProcessed, 0U);
    EXPECT_EQ(blocked.want, TransportHint::WriteReady);
  }
  clientTransport->setWriteBlocked(false);

  const std::string retry(payload);
  auto written = stream.write(retry);
  EXPECT_EQ(written.want, TransportHint::None);
  EXPECT_EQ(written.bytesProcessed, payload.size());
  EXPECT_EQ(test::ReadSome(*serverStream), payload);
}

TEST_F(OpenSslLoopbackTest, HostnameMismatchFailsWhenVerified) {
  OpenSslContext clientCtx(trustingConfig());
  auto res = handshake(clientCtx, "example.com", true);
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().kind(), ConnectError::Kind::HandshakeFailure);
  EXPECT_EQ(res.error().backendCode(), static_cast<unsigned long>(X509_V_ERR_HOSTNAME_MISMATCH));
  EXPECT_NE(res.error().message().find("certificate verify failed"), std::string_view::npos);
}

TEST_F(OpenSslLoopbackTest, HostnameMismatchAcceptedWhenVerificationDisabled) {
  OpenSslContext clientCtx(trustingConfig());
  auto res = handshake(clientCtx, "example.com", false);
  ASSERT_TRUE(res.isReady()) << res.error().message();
}

TEST_F(OpenSslLoopbackTest, IpLiteralIsCheckedAgainstCertificate) {
  OpenSslContext clientCtx(trustingConfig());
  auto res = handshake(clientCtx, "127.0.0.1", true);
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().backendCode(), static_cast<unsigned long>(X509_V_ERR_IP_ADDRESS_MISMATCH));
}

TEST_F(OpenSslLoopbackTest, UntrustedCertificateFails) {
  OpenSslContext clientCtx(TlsClientConfig{});
  auto res = handshake(clientCtx, "localhost", true);
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().backendCode(), static_cast<unsigned long>(X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT));
}

TEST_F(OpenSslLoopbackTest, BrokenTransportFailsHandshake) {
  OpenSslContext clientCtx(trustingConfig());
  auto [client, server] = test::MakeMemoryTransportPair();
  client->setBroken(true);
  TlsHandshake clientHandshake(clientCtx, HandshakeParams{"localhost", true}, std::move(client));
  auto res = clientHandshake.poll();
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().kind(), ConnectError::Kind::HandshakeFailure);
}

TEST_F(OpenSslLoopbackTest, ShutdownSendsCloseNotifyBeforeTransportShutdown) {
  OpenSslContext clientCtx(trustingConfig());
  auto res = handshake(clientCtx, "localhost", true);
  ASSERT_TRUE(res.isReady()) << res.error().message();
  const auto& journal = clientTransport->journal();
  const std::size_t before = journal.size();

  EXPECT_EQ(res.value().shutdown(), TransportHint::None);
  EXPECT_EQ(clientTransport->nbShutdowns(), 1U);

  const auto closeNotifyIt = std::find_if(journal.begin() + static_cast<std::ptrdiff_t>(before), journal.end(),
                                          [](const std::string& event) { return event.starts_with("a:write"); });
  const auto shutdownIt = std::find(journal.begin(), journal.end(), "a:shutdown");
  ASSERT_NE(closeNotifyIt, journal.end());
  ASSERT_NE(shutdownIt, journal.end());
  EXPECT_LT(closeNotifyIt, shutdownIt);
}

}  // namespace tlsdial
