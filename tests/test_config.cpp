// Tests for configuration validation.
#include "arrowctl/control_client.h"
#include "arrowctl/control_server.h"
#include "arrowctl/device_registry.h"
#include "arrowctl/discovery.h"
#include "test_support.h"

#include <gtest/gtest.h>

using arrowctl::fakes::MakeController;
using arrowctl::fakes::MakeTarget;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

arrowctl::ServerConfig ValidServerConfig() {
  arrowctl::ServerConfig config;
  config.controller_id = "ctrl";
  return config;
}

arrowctl::ClientConfig ValidClientConfig() {
  arrowctl::ClientConfig config;
  config.device = MakeTarget("t1");
  return config;
}

}  // namespace

TEST(ServerConfigTest, AcceptsDefaultsWithId) {
  std::string error;
  EXPECT_TRUE(ValidServerConfig().Validate(&error)) << error;
}

TEST(ServerConfigTest, RejectsMissingIdentity) {
  arrowctl::ServerConfig config;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "controller_id"));

  config = ValidServerConfig();
  config.controller_name.clear();
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "controller_name"));
}

TEST(ServerConfigTest, RejectsBadBindAndInterval) {
  auto config = ValidServerConfig();
  config.bind_address = "300.1.1.1";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "bind_address"));

  config = ValidServerConfig();
  config.ping_interval = std::chrono::milliseconds(0);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "ping_interval"));

  // A null error pointer is allowed.
  EXPECT_FALSE(config.Validate());
}

TEST(RegistryConfigTest, RejectsNonPositiveValues) {
  arrowctl::RegistryConfig config;
  std::string error;
  EXPECT_TRUE(config.Validate(&error)) << error;

  config.pairing_token_ttl = std::chrono::milliseconds(0);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "pairing_token_ttl"));

  config = arrowctl::RegistryConfig();
  config.token_bytes = 0;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "token_bytes"));
}

TEST(ClientConfigTest, RequiresTargetIdentity) {
  std::string error;
  EXPECT_TRUE(ValidClientConfig().Validate(&error)) << error;

  auto config = ValidClientConfig();
  config.device.id.clear();
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "device.id"));

  config = ValidClientConfig();
  config.device.type = arrowctl::DeviceType::kController;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "device.type"));
}

TEST(ClientConfigTest, RejectsInconsistentTiming) {
  auto config = ValidClientConfig();
  config.heartbeat_interval = std::chrono::milliseconds(-1);
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "heartbeat_interval"));

  config = ValidClientConfig();
  config.reconnect_base_delay = std::chrono::milliseconds(5000);
  config.reconnect_max_delay = std::chrono::milliseconds(1000);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "reconnect_max_delay"));

  config = ValidClientConfig();
  config.max_reconnect_attempts = -1;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "max_reconnect_attempts"));
}

TEST(BroadcasterConfigTest, RequiresControllerIdentity) {
  arrowctl::BroadcasterConfig config;
  config.controller = MakeController("ctrl");
  std::string error;
  EXPECT_TRUE(config.Validate(&error)) << error;

  config.controller = MakeTarget("t1");
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "controller.type"));
}

TEST(BroadcasterConfigTest, RejectsBadAddressesAndPorts) {
  arrowctl::BroadcasterConfig config;
  config.controller = MakeController("ctrl");
  config.broadcast_address = "not-an-ip";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "broadcast_address"));

  config.broadcast_address = "255.255.255.255";
  config.control_port = 0;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "control_port"));

  config.control_port = arrowctl::kDefaultControlPort;
  config.peer_ttl = std::chrono::milliseconds(0);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "peer timeouts"));
}

TEST(ListenerConfigTest, ValidatesIdentityAndInterval) {
  arrowctl::ListenerConfig config;
  config.device = MakeTarget("t1");
  std::string error;
  EXPECT_TRUE(config.Validate(&error)) << error;

  config.bind_address = "10.0.0";
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "bind_address"));

  config.bind_address = "0.0.0.0";
  config.register_interval = std::chrono::milliseconds(-5);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "register_interval"));

  config.register_interval = std::chrono::milliseconds(0);
  config.device = MakeController("ctrl");
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_TRUE(Contains(error, "device.type"));
}
