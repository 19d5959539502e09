#include "tlsdial/tls-server-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "tlsdial/tls-common.hpp"

namespace tlsdial {

namespace {

TlsServerConfig WithCertAndKey() {
  TlsServerConfig cfg;
  cfg.withCertPem("CERT").withKeyPem("KEY");
  return cfg;
}

}  // namespace

TEST(TlsServerConfigTest, CertificateAndKeyAreRequired) {
  TlsServerConfig cfg;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withCertPem("CERT");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withKeyPem("KEY");
  EXPECT_NO_THROW(cfg.validate());
}

TEST(TlsServerConfigTest, InvertedVersionBoundsThrow) {
  TlsServerConfig cfg = WithCertAndKey();
  cfg.withTlsMinVersion("TLS1.3").withTlsMaxVersion("TLS1.2");
  EXPECT_EQ(cfg.minVersion, TlsServerConfig::Version::TLS_1_3);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(TlsServerConfigTest, AlpnEntriesAreChecked) {
  TlsServerConfig cfg = WithCertAndKey();
  cfg.withTlsAlpnProtocols({"h2", std::string(kMaxAlpnProtocolLength + 1, 'a')});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(TlsServerConfigTest, AlpnMustMatchNeedsProtocols) {
  TlsServerConfig cfg = WithCertAndKey();
  cfg.withTlsAlpnMustMatch();
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withTlsAlpnProtocols({"h2"});
  EXPECT_NO_THROW(cfg.validate());
}

TEST(TlsServerConfigTest, RequireClientCertImpliesRequestAndNeedsTrust) {
  TlsServerConfig cfg = WithCertAndKey();
  cfg.withTlsRequireClientCert();
  EXPECT_TRUE(cfg.requestClientCert);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withTlsTrustedClientCert("CLIENT-CERT");
  EXPECT_NO_THROW(cfg.validate());
}

TEST(TlsServerConfigTest, EmptyTrustedClientCertThrows) {
  TlsServerConfig cfg = WithCertAndKey();
  cfg.withTlsTrustedClientCert("");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

}  // namespace tlsdial
