#include "tlsdial/https-connector-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "tlsdial/tls-client-config.hpp"

namespace tlsdial {

TEST(HttpsConnectorConfigTest, Defaults) {
  HttpsConnectorConfig cfg;
  EXPECT_EQ(cfg.resolverThreads, 1U);
  EXPECT_TRUE(cfg.hostnameVerification);
  EXPECT_FALSE(cfg.forceHttps);
  EXPECT_NO_THROW(cfg.validate());
}

TEST(HttpsConnectorConfigTest, Builders) {
  HttpsConnectorConfig cfg;
  cfg.withResolverThreads(4).withForceHttps().withDangerDisableHostnameVerification();
  EXPECT_EQ(cfg.resolverThreads, 4U);
  EXPECT_TRUE(cfg.forceHttps);
  EXPECT_FALSE(cfg.hostnameVerification);
  EXPECT_NO_THROW(cfg.validate());
}

TEST(HttpsConnectorConfigTest, HostnameVerificationNeedsPeerVerification) {
  HttpsConnectorConfig cfg;
  cfg.withTls(TlsClientConfig{}.withVerifyPeer(false));
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withDangerDisableHostnameVerification();
  EXPECT_NO_THROW(cfg.validate());
}

TEST(HttpsConnectorConfigTest, TooManyResolverThreads) {
  HttpsConnectorConfig cfg;
  cfg.withResolverThreads(100000);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(HttpsConnectorConfigTest, PropagatesTlsValidation) {
  HttpsConnectorConfig cfg;
  cfg.withTls(TlsClientConfig{}.withTlsAlpnProtocols({""}));
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

}  // namespace tlsdial
