// Tests for the Beast WebSocket transports over a loopback socket.
#include "arrowctl/websocket.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using arrowctl::ConnectionStatus;
using arrowctl::fakes::MakeTarget;
using arrowctl::fakes::QuietLog;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

// Poll `predicate` on the loop thread until it holds or five seconds pass.
bool WaitUntil(arrowctl::EventLoop& loop, const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    bool done = false;
    loop.RunSync([&]() { done = predicate(); });
    if (done) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(10));
  }
  return false;
}

struct Target {
  std::unique_ptr<arrowctl::WebSocketClientTransport> transport;
  arrowctl::fakes::RecordingExecutor executor;
  std::unique_ptr<arrowctl::ControlClient> client;
};

class WebSocketLoopbackTest : public ::testing::Test {
 protected:
  WebSocketLoopbackTest()
      : loop(QuietLog()),
        registry(MakeRegistryConfig()),
        server(MakeServerConfig(), registry, loop) {}

  static arrowctl::RegistryConfig MakeRegistryConfig() {
    arrowctl::RegistryConfig config;
    config.log_callback = QuietLog();
    return config;
  }

  static arrowctl::ServerConfig MakeServerConfig() {
    arrowctl::ServerConfig config;
    config.controller_id = "ctrl";
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.ping_interval = seconds(30);
    config.log_callback = QuietLog();
    return config;
  }

  void SetUp() override {
    registry.SetEventCallback([this](const arrowctl::RegistryEvent& event) {
      if (event.type == arrowctl::RegistryEventType::kDisconnected) {
        ++disconnects;
      }
    });
    server.SetCommandResultCallback(
        [this](const arrowctl::CommandResultEvent& event) { results.push_back(event); });
    ASSERT_TRUE(loop.Start()) << loop.GetLastError();
    bool started = false;
    loop.RunSync([&]() {
      started = server.Start();
      listener =
          std::make_unique<arrowctl::WebSocketServer>(loop.context(), server, QuietLog());
      started = started && listener->Start("127.0.0.1", 0);
      port = listener->port();
    });
    ASSERT_TRUE(started);
    ASSERT_NE(port, 0);
  }

  void TearDown() override {
    loop.RunSync([&]() {
      raw_transport.reset();
      for (auto& target : targets) {
        target->client.reset();
        target->transport.reset();
      }
      if (listener) {
        listener->Stop();
      }
      server.Shutdown();
    });
    loop.Stop();
  }

  Target& AddTarget(const std::string& id) {
    auto target = std::make_unique<Target>();
    arrowctl::ClientConfig config;
    config.device = MakeTarget(id, "127.0.0.1");
    config.auto_accept_pairing = true;
    config.auto_reconnect = false;
    config.log_callback = QuietLog();
    Target* raw = target.get();
    loop.RunSync([&]() {
      raw->transport =
          std::make_unique<arrowctl::WebSocketClientTransport>(loop.context(), QuietLog());
      raw->client = std::make_unique<arrowctl::ControlClient>(config, *raw->transport, loop,
                                                              raw->executor);
    });
    targets.push_back(std::move(target));
    return *raw;
  }

  bool Connect(Target& target) {
    bool ok = false;
    loop.RunSync([&]() { ok = target.client->Connect("127.0.0.1", port); });
    return ok;
  }

  ConnectionStatus StatusOf(Target& target) {
    ConnectionStatus status = ConnectionStatus::kDisconnected;
    loop.RunSync([&]() { status = target.client->status(); });
    return status;
  }

  // A bare transport whose handlers only count opens and closes.
  void OpenRawTransport(uint16_t target_port) {
    loop.RunSync([&]() {
      raw_transport =
          std::make_unique<arrowctl::WebSocketClientTransport>(loop.context(), QuietLog());
      arrowctl::ClientTransport::Handlers handlers;
      handlers.on_open = [this]() { ++raw_opens; };
      handlers.on_close = [this](const std::string&) { ++raw_closes; };
      raw_transport->SetHandlers(std::move(handlers));
      raw_transport->Open("127.0.0.1", target_port);
    });
  }

  size_t ConnectionCount() {
    size_t count = 0;
    loop.RunSync([&]() { count = server.ConnectionCount(); });
    return count;
  }

  arrowctl::EventLoop loop;
  arrowctl::DeviceRegistry registry;
  arrowctl::ControlServer server;
  std::unique_ptr<arrowctl::WebSocketServer> listener;
  uint16_t port = 0;
  std::vector<std::unique_ptr<Target>> targets;
  std::unique_ptr<arrowctl::WebSocketClientTransport> raw_transport;
  std::atomic<int> raw_opens{0};
  std::atomic<int> raw_closes{0};
  std::atomic<int> disconnects{0};
  std::vector<arrowctl::CommandResultEvent> results;
};

}  // namespace

TEST_F(WebSocketLoopbackTest, PairsAndExecutesCommand) {
  Target& target = AddTarget("t1");
  ASSERT_TRUE(Connect(target));
  ASSERT_TRUE(WaitUntil(loop, [&]() {
    return target.client->status() == ConnectionStatus::kPaired;
  }));
  const auto device = registry.GetDeviceById("t1");
  ASSERT_TRUE(device.has_value());
  EXPECT_TRUE(device->paired);
  EXPECT_TRUE(device->connection_id.has_value());

  arrowctl::CommandOutcome outcome;
  arrowctl::ArrowCommandParameters parameters;
  parameters.repeat = 2;
  loop.RunSync([&]() {
    outcome = server.SendArrowCommand("t1", arrowctl::ArrowDirection::kLeft, parameters);
  });
  ASSERT_TRUE(outcome.success) << outcome.error;
  ASSERT_TRUE(WaitUntil(loop, [&]() { return results.size() == 1; }));
  loop.RunSync([&]() {
    ASSERT_EQ(target.executor.presses.size(), 1u);
    EXPECT_EQ(target.executor.presses[0].key, "left");
    EXPECT_EQ(target.executor.presses[0].options.repeat, 2);
    EXPECT_EQ(results[0].device_id, "t1");
    EXPECT_EQ(results[0].command_type, "arrow_left");
    EXPECT_TRUE(results[0].success);
  });
}

TEST_F(WebSocketLoopbackTest, ShutdownDisconnectsDeviceOnce) {
  Target& target = AddTarget("t1");
  ASSERT_TRUE(Connect(target));
  ASSERT_TRUE(WaitUntil(loop, [&]() {
    return target.client->status() == ConnectionStatus::kPaired;
  }));

  loop.RunSync([&]() { server.Shutdown(); });
  EXPECT_EQ(disconnects.load(), 1);
  ASSERT_TRUE(WaitUntil(loop, [&]() {
    return target.client->status() == ConnectionStatus::kDisconnected;
  }));
  // The session's own close report must not disconnect the device again.
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(disconnects.load(), 1);
  EXPECT_EQ(ConnectionCount(), 0u);
}

TEST_F(WebSocketLoopbackTest, ReconnectingDeviceSupersedesOldSession) {
  Target& first = AddTarget("t1");
  ASSERT_TRUE(Connect(first));
  ASSERT_TRUE(WaitUntil(loop, [&]() {
    return first.client->status() == ConnectionStatus::kPaired;
  }));

  Target& second = AddTarget("t1");
  ASSERT_TRUE(Connect(second));
  ASSERT_TRUE(WaitUntil(loop, [&]() {
    return second.client->status() == ConnectionStatus::kPaired &&
           first.client->status() == ConnectionStatus::kDisconnected;
  }));
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(ConnectionCount(), 1u);
  EXPECT_EQ(disconnects.load(), 0);
  const auto device = registry.GetDeviceById("t1");
  ASSERT_TRUE(device.has_value());
  EXPECT_TRUE(device->connection_id.has_value());
}

TEST_F(WebSocketLoopbackTest, AnsweredPingsKeepSessionAlive) {
  Target& target = AddTarget("t1");
  ASSERT_TRUE(Connect(target));
  ASSERT_TRUE(WaitUntil(loop, [&]() {
    return target.client->status() == ConnectionStatus::kPaired;
  }));

  loop.RunSync([&]() { server.RunLivenessSweep(); });
  std::this_thread::sleep_for(milliseconds(300));
  loop.RunSync([&]() { server.RunLivenessSweep(); });
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(ConnectionCount(), 1u);
  EXPECT_EQ(StatusOf(target), ConnectionStatus::kPaired);
  EXPECT_EQ(disconnects.load(), 0);
}

TEST_F(WebSocketLoopbackTest, LocalCloseIsNotReportedBack) {
  OpenRawTransport(port);
  ASSERT_TRUE(WaitUntil(loop, [&]() { return raw_opens.load() == 1; }));
  ASSERT_TRUE(WaitUntil(loop, [&]() { return server.ConnectionCount() == 1; }));

  loop.RunSync([&]() { raw_transport->Close(); });
  ASSERT_TRUE(WaitUntil(loop, [&]() { return server.ConnectionCount() == 0; }));
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(raw_closes.load(), 0);
  bool sent = true;
  loop.RunSync([&]() { sent = raw_transport->Send("{}"); });
  EXPECT_FALSE(sent);
}

TEST_F(WebSocketLoopbackTest, RefusedConnectReportsClose) {
  OpenRawTransport(1);
  ASSERT_TRUE(WaitUntil(loop, [&]() { return raw_closes.load() == 1; }));
  EXPECT_EQ(raw_opens.load(), 0);
}
