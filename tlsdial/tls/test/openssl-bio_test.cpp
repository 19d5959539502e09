#include "tlsdial/openssl-bio.hpp"

#include <gtest/gtest.h>
#include <openssl/bio.h>

#include <string>

#include "tlsdial/memory-transport.hpp"

namespace tlsdial {

TEST(TransportBioTest, ForwardsWritesAndReads) {
  auto [client, server] = test::MakeMemoryTransportPair();
  auto bio = MakeTransportBio(*client);

  EXPECT_EQ(::BIO_write(bio.get(), "hello", 5), 5);
  char buf[16];
  auto res = server->read(buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, res.bytesProcessed), "hello");

  EXPECT_EQ(server->write("world").bytesProcessed, 5U);
  EXPECT_EQ(::BIO_read(bio.get(), buf, sizeof(buf)), 5);
  EXPECT_EQ(std::string(buf, 5), "world");
  EXPECT_EQ(BIO_flush(bio.get()), 1);
}

TEST(TransportBioTest, WouldBlockSetsRetryFlags) {
  auto [client, server] = test::MakeMemoryTransportPair();
  auto bio = MakeTransportBio(*client);

  char buf[16];
  EXPECT_EQ(::BIO_read(bio.get(), buf, sizeof(buf)), -1);
  EXPECT_TRUE(BIO_should_retry(bio.get()));
  EXPECT_TRUE(BIO_should_read(bio.get()));

  client->setWriteBlocked(true);
  EXPECT_EQ(::BIO_write(bio.get(), "x", 1), -1);
  EXPECT_TRUE(BIO_should_retry(bio.get()));
  EXPECT_TRUE(BIO_should_write(bio.get()));
}

TEST(TransportBioTest, PeerShutdownIsEof) {
  auto [client, server] = test::MakeMemoryTransportPair();
  auto bio = MakeTransportBio(*client);
  server->shutdown();
  char buf[16];
  EXPECT_EQ(::BIO_read(bio.get(), buf, sizeof(buf)), 0);
  EXPECT_FALSE(BIO_should_retry(bio.get()));
}

TEST(TransportBioTest, TransportErrorIsNotRetried) {
  auto [client, server] = test::MakeMemoryTransportPair();
  auto bio = MakeTransportBio(*client);
  client->setBroken(true);
  char buf[16];
  EXPECT_EQ(::BIO_read(bio.get(), buf, sizeof(buf)), -1);
  EXPECT_FALSE(BIO_should_retry(bio.get()));
  EXPECT_EQ(::BIO_write(bio.get(), "x", 1), -1);
  EXPECT_FALSE(BIO_should_retry(bio.get()));
}

}  // namespace tlsdial
