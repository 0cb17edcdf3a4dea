#include "anvil/server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace anvil {

TEST(ServerConfigTest, DefaultIsValid) {
  ServerConfig config;
  EXPECT_EQ(config.ipAddress, "0.0.0.0");
  EXPECT_EQ(config.port, 0);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, FluentSetters) {
  ServerConfig config;
  config.withIpAddress("127.0.0.1")
      .withPort(8080)
      .withReuseAddress(false)
      .withTcpNoDelay()
      .withMaxHeaderBytes(4096)
      .withMaxBodyBytes(512)
      .withReadTimeout(std::chrono::seconds{5})
      .withPollInterval(std::chrono::milliseconds{20});

  EXPECT_EQ(config.ipAddress, "127.0.0.1");
  EXPECT_EQ(config.port, 8080);
  EXPECT_FALSE(config.reuseAddress);
  EXPECT_TRUE(config.tcpNoDelay);
  EXPECT_EQ(config.maxHeaderBytes, 4096U);
  EXPECT_EQ(config.maxBodyBytes, 512U);
  EXPECT_EQ(config.readTimeout, std::chrono::seconds{5});
  EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{20});
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, IPv6AddressIsValid) {
  ServerConfig config;
  config.withIpAddress("::1");
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, InvalidIpAddress) {
  ServerConfig config;
  config.withIpAddress("not-an-ip");
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.withIpAddress("256.1.1.1");
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.withIpAddress("");
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ServerConfigTest, HeaderLimitTooSmall) {
  ServerConfig config;
  config.withMaxHeaderBytes(127);
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.withMaxHeaderBytes(128);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, ZeroBodyLimit) {
  ServerConfig config;
  config.withMaxBodyBytes(0);
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ServerConfigTest, ReadTimeout) {
  ServerConfig config;
  EXPECT_EQ(config.readTimeout, std::chrono::seconds{30});
  config.withReadTimeout(std::chrono::milliseconds{0});
  EXPECT_NO_THROW(config.validate());
  config.withReadTimeout(std::chrono::milliseconds{-1});
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ServerConfigTest, NonPositivePollInterval) {
  ServerConfig config;
  config.withPollInterval(std::chrono::milliseconds{0});
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.withPollInterval(std::chrono::milliseconds{-5});
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

}  // namespace anvil
