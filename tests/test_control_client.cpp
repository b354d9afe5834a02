// Tests for the target-side connection state machine and key press executor.
#include "arrowctl/control_client.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using arrowctl::ClientEventType;
using arrowctl::ConnectionStatus;
using arrowctl::MessageType;
using nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

const arrowctl::Sender kController{"ctrl", arrowctl::DeviceType::kController};

arrowctl::ClientConfig MakeClientConfig() {
  arrowctl::ClientConfig config;
  config.device = arrowctl::fakes::MakeTarget("t1");
  config.heartbeat_interval = seconds(30);
  config.reconnect_base_delay = milliseconds(1000);
  config.reconnect_max_delay = milliseconds(30000);
  config.max_reconnect_attempts = 10;
  config.log_callback = arrowctl::fakes::QuietLog();
  return config;
}

struct ClientFixture {
  explicit ClientFixture(arrowctl::ClientConfig config = MakeClientConfig())
      : client(std::move(config), transport, scheduler, executor) {
    client.SetEventCallback(
        [this](const arrowctl::ClientEvent& event) { events.push_back(event); });
  }

  void ConnectAndOpen() {
    ASSERT_TRUE(client.Connect("10.0.0.1", 8080));
    transport.SimulateOpen();
  }

  void Registered(bool pairing_required, const std::string& token = "") {
    arrowctl::RegisteredPayload payload;
    payload.device_id = "t1";
    payload.pairing_required = pairing_required;
    if (!token.empty()) {
      payload.pairing_token = token;
    }
    transport.SimulateMessage(arrowctl::BuildRegistered(kController, payload));
  }

  void Command(const std::string& command_type, const json& parameters) {
    arrowctl::CommandPayload payload;
    payload.command_type = command_type;
    payload.parameters = parameters;
    transport.SimulateMessage(arrowctl::BuildCommand(kController, payload));
    // Deliver completions handed back to the scheduler.
    scheduler.AdvanceBy(milliseconds(0));
  }

  void ControllerError(arrowctl::ErrorCode code, const std::string& text) {
    arrowctl::ErrorPayload payload;
    payload.code = code;
    payload.message = text;
    transport.SimulateMessage(arrowctl::BuildError(kController, payload));
  }

  std::vector<arrowctl::ClientEvent> EventsOf(ClientEventType type) const {
    std::vector<arrowctl::ClientEvent> out;
    for (const auto& event : events) {
      if (event.type == type) {
        out.push_back(event);
      }
    }
    return out;
  }

  arrowctl::fakes::FakeTransport transport;
  arrowctl::fakes::ManualScheduler scheduler;
  arrowctl::fakes::RecordingExecutor executor;
  std::vector<arrowctl::ClientEvent> events;
  arrowctl::ControlClient client;
};

arrowctl::CommandResultPayload LastResult(const arrowctl::fakes::FakeTransport& transport) {
  arrowctl::CommandResultPayload payload;
  EXPECT_TRUE(arrowctl::ParseCommandResult(transport.Last(), &payload));
  return payload;
}

}  // namespace

TEST(ReconnectDelayTest, DoublesUpToCap) {
  const milliseconds base(1000);
  const milliseconds cap(30000);
  EXPECT_EQ(arrowctl::ReconnectDelay(0, base, cap), milliseconds(1000));
  EXPECT_EQ(arrowctl::ReconnectDelay(1, base, cap), milliseconds(2000));
  EXPECT_EQ(arrowctl::ReconnectDelay(4, base, cap), milliseconds(16000));
  EXPECT_EQ(arrowctl::ReconnectDelay(5, base, cap), milliseconds(30000));
  EXPECT_EQ(arrowctl::ReconnectDelay(60, base, cap), milliseconds(30000));
}

TEST(ControlClientTest, ConnectRegistersAndStartsHeartbeat) {
  ClientFixture f;
  ASSERT_TRUE(f.client.Connect("10.0.0.1", 8080));
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnecting);
  ASSERT_EQ(f.transport.opens.size(), 1u);
  EXPECT_EQ(f.transport.opens[0].first, "10.0.0.1");
  EXPECT_EQ(f.transport.opens[0].second, 8080);

  f.transport.SimulateOpen();
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
  const auto messages = f.transport.Messages();
  ASSERT_GE(messages.size(), 2u);
  EXPECT_EQ(messages[0].type, MessageType::kRegister);
  EXPECT_EQ(messages[0].sender.id, "t1");
  EXPECT_EQ(messages[0].sender.type, arrowctl::DeviceType::kTarget);
  EXPECT_EQ(messages[0].data["deviceInfo"]["id"], "t1");
  EXPECT_EQ(messages[1].type, MessageType::kHeartbeat);

  f.scheduler.AdvanceBy(seconds(90));
  EXPECT_EQ(f.transport.CountOfType(MessageType::kHeartbeat), 4u);
}

TEST(ControlClientTest, ConnectRejectsInvalidConfigAndDuplicateConnect) {
  auto config = MakeClientConfig();
  config.device.type = arrowctl::DeviceType::kController;
  ClientFixture bad(config);
  EXPECT_FALSE(bad.client.Connect("10.0.0.1", 8080));
  EXPECT_NE(bad.client.GetLastError().find("device.type"), std::string::npos);
  EXPECT_TRUE(bad.transport.opens.empty());

  ClientFixture f;
  ASSERT_TRUE(f.client.Connect("10.0.0.1", 8080));
  EXPECT_FALSE(f.client.Connect("10.0.0.1", 8080));
  EXPECT_EQ(f.transport.opens.size(), 1u);
}

TEST(ControlClientTest, ConnectToUsesDiscoveredEndpoint) {
  ClientFixture f;
  arrowctl::ControllerEndpoint endpoint;
  endpoint.controller_id = "ctrl";
  endpoint.ip = "192.168.5.9";
  endpoint.control_port = 9001;
  ASSERT_TRUE(f.client.ConnectTo(endpoint));
  ASSERT_EQ(f.transport.opens.size(), 1u);
  EXPECT_EQ(f.transport.opens[0].first, "192.168.5.9");
  EXPECT_EQ(f.transport.opens[0].second, 9001);
}

TEST(ControlClientTest, PairingRequiredSurfacesToken) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(true, "abc");

  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
  EXPECT_EQ(f.client.pairing_token(), std::optional<std::string>("abc"));
  const auto required = f.EventsOf(ClientEventType::kPairingRequired);
  ASSERT_EQ(required.size(), 1u);
  EXPECT_EQ(required[0].pairing_token, std::optional<std::string>("abc"));
  EXPECT_EQ(f.transport.CountOfType(MessageType::kPairingRequest), 0u);

  ASSERT_TRUE(f.client.SendPairingRequest());
  const auto request = f.transport.Last();
  EXPECT_EQ(request.type, MessageType::kPairingRequest);
  EXPECT_EQ(request.data, (json{{"pairingToken", "abc"}}));
}

TEST(ControlClientTest, AutoAcceptSendsPairingRequestImmediately) {
  auto config = MakeClientConfig();
  config.auto_accept_pairing = true;
  ClientFixture f(config);
  f.ConnectAndOpen();
  f.Registered(true, "abc");
  EXPECT_EQ(f.transport.Last().type, MessageType::kPairingRequest);
}

TEST(ControlClientTest, AcceptedPairingResponsePairs) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(true, "abc");

  arrowctl::PairingResponsePayload payload;
  payload.accepted = true;
  payload.auth_token = "xyz";
  f.transport.SimulateMessage(arrowctl::BuildPairingResponse(kController, payload));

  EXPECT_EQ(f.client.status(), ConnectionStatus::kPaired);
  EXPECT_EQ(f.client.auth_token(), std::optional<std::string>("xyz"));
  EXPECT_FALSE(f.client.pairing_token().has_value());
  EXPECT_EQ(f.EventsOf(ClientEventType::kPairingAccepted).size(), 1u);
}

TEST(ControlClientTest, RejectedPairingResponseKeepsConnected) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(true, "abc");

  arrowctl::PairingResponsePayload payload;
  payload.accepted = false;
  payload.error = "Invalid pairing token";
  f.transport.SimulateMessage(arrowctl::BuildPairingResponse(kController, payload));

  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
  const auto rejected = f.EventsOf(ClientEventType::kPairingRejected);
  ASSERT_EQ(rejected.size(), 1u);
  EXPECT_EQ(rejected[0].error, std::optional<std::string>("Invalid pairing token"));
}

TEST(ControlClientTest, RegisteredWithoutPairingGoesStraightToPaired) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(false);
  EXPECT_EQ(f.client.status(), ConnectionStatus::kPaired);
  EXPECT_FALSE(f.client.SendPairingRequest());
}

TEST(ControlClientTest, IgnoresRegistrationForAnotherDevice) {
  ClientFixture f;
  f.ConnectAndOpen();
  arrowctl::RegisteredPayload payload;
  payload.device_id = "someone-else";
  payload.pairing_required = false;
  f.transport.SimulateMessage(arrowctl::BuildRegistered(kController, payload));
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
}

TEST(ControlClientTest, SendPairingRequestNeedsSessionAndToken) {
  ClientFixture f;
  EXPECT_FALSE(f.client.SendPairingRequest());
  f.ConnectAndOpen();
  EXPECT_FALSE(f.client.SendPairingRequest());
}

TEST(ControlClientTest, ExecutesArrowCommandAndReportsResult) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(false);

  f.Command("arrow_left", json{{"repeat", 2}, {"holdTime", 0}});
  ASSERT_EQ(f.executor.presses.size(), 1u);
  EXPECT_EQ(f.executor.presses[0].key, "left");
  EXPECT_EQ(f.executor.presses[0].options.repeat, 2);
  EXPECT_EQ(f.executor.presses[0].options.hold_time_ms, 0);

  const auto result = f.transport.Last();
  ASSERT_EQ(result.type, MessageType::kCommandResult);
  EXPECT_EQ(result.data, (json{{"commandType", "arrow_left"}, {"success", true}}));

  f.Command("arrow_right", json::object());
  ASSERT_EQ(f.executor.presses.size(), 2u);
  EXPECT_EQ(f.executor.presses[1].key, "right");
  EXPECT_EQ(f.executor.presses[1].options.repeat, 1);
  EXPECT_EQ(f.executor.presses[1].options.hold_time_ms, 0);
}

TEST(ControlClientTest, RejectsUnsupportedCommandWithoutExecuting) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(false);

  f.Command("launch_rocket", json::object());
  EXPECT_TRUE(f.executor.presses.empty());
  auto result = LastResult(f.transport);
  EXPECT_EQ(result.command_type, "launch_rocket");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, std::optional<std::string>("Unsupported command"));

  auto config = MakeClientConfig();
  config.device.supported_commands = {arrowctl::kCommandArrowLeft};
  ClientFixture left_only(config);
  left_only.ConnectAndOpen();
  left_only.Command("arrow_right", json::object());
  EXPECT_TRUE(left_only.executor.presses.empty());
  EXPECT_FALSE(LastResult(left_only.transport).success);
}

TEST(ControlClientTest, RejectsInvalidParametersWithoutExecuting) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Command("arrow_left", json{{"repeat", 0}});
  EXPECT_TRUE(f.executor.presses.empty());
  auto result = LastResult(f.transport);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, std::optional<std::string>("repeat must be a positive integer"));
}

TEST(ControlClientTest, ReportsExecutorFailures) {
  ClientFixture f;
  f.ConnectAndOpen();

  f.executor.result = false;
  f.Command("arrow_left", json::object());
  EXPECT_EQ(LastResult(f.transport).error,
            std::optional<std::string>("Command execution failed"));

  f.executor.throw_on_press = true;
  f.Command("arrow_left", json::object());
  auto result = LastResult(f.transport);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, std::optional<std::string>("Internal error"));
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
}

TEST(ControlClientTest, HeartbeatContinuesWhileKeyPressIsHeld) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(false);
  f.executor.defer = true;

  f.Command("arrow_right", json{{"repeat", 1}, {"holdTime", 5000}});
  ASSERT_EQ(f.executor.pending.size(), 1u);
  const size_t heartbeats = f.transport.CountOfType(MessageType::kHeartbeat);

  f.scheduler.AdvanceBy(seconds(30));
  EXPECT_EQ(f.transport.CountOfType(MessageType::kHeartbeat), heartbeats + 1);
  EXPECT_EQ(f.transport.CountOfType(MessageType::kCommandResult), 0u);

  // The result is reported from the scheduler, not from the completing thread.
  f.executor.Finish(true);
  EXPECT_EQ(f.transport.CountOfType(MessageType::kCommandResult), 0u);
  f.scheduler.AdvanceBy(milliseconds(0));
  auto result = LastResult(f.transport);
  EXPECT_EQ(result.command_type, "arrow_right");
  EXPECT_TRUE(result.success);
  ASSERT_EQ(f.EventsOf(ClientEventType::kCommandExecuted).size(), 1u);
}

TEST(ControlClientTest, DeferredFailureIsReported) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.executor.defer = true;
  f.Command("arrow_left", json::object());
  f.executor.Finish(false);
  f.scheduler.AdvanceBy(milliseconds(0));
  EXPECT_EQ(LastResult(f.transport).error,
            std::optional<std::string>("Command execution failed"));
}

TEST(ControlClientTest, CompletionAfterDestructionIsDropped) {
  arrowctl::fakes::FakeTransport transport;
  arrowctl::fakes::ManualScheduler scheduler;
  arrowctl::fakes::RecordingExecutor executor;
  executor.defer = true;
  auto client = std::make_unique<arrowctl::ControlClient>(MakeClientConfig(), transport,
                                                          scheduler, executor);
  ASSERT_TRUE(client->Connect("10.0.0.1", 8080));
  transport.SimulateOpen();
  arrowctl::CommandPayload payload;
  payload.command_type = "arrow_left";
  transport.SimulateMessage(arrowctl::BuildCommand(kController, payload));
  ASSERT_EQ(executor.pending.size(), 1u);

  client.reset();
  executor.Finish(true);
  scheduler.AdvanceBy(seconds(1));
  EXPECT_EQ(transport.CountOfType(MessageType::kCommandResult), 0u);
}

TEST(ControlClientTest, ErrorCodeOutOfRangeLeavesTokensAlone) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(true, "abc");
  f.transport.SimulateRaw(
      R"({"type":"error","version":"1.0.0","timestamp":1,)"
      R"("sender":{"id":"ctrl","type":"controller"},)"
      R"("data":{"code":4294967397,"message":"bogus"}})");
  EXPECT_EQ(f.client.pairing_token(), std::optional<std::string>("abc"));
  EXPECT_TRUE(f.EventsOf(ClientEventType::kControllerError).empty());
}

TEST(ControlClientTest, ControllerErrorsDemotePairedClient) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.Registered(false);
  ASSERT_EQ(f.client.status(), ConnectionStatus::kPaired);

  f.ControllerError(arrowctl::ErrorCode::kNotPaired, "Device not paired");
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
  auto errors = f.EventsOf(ClientEventType::kControllerError);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].error_code, std::optional<arrowctl::ErrorCode>(
                                      arrowctl::ErrorCode::kNotPaired));

  f.Registered(true, "abc");
  f.ControllerError(arrowctl::ErrorCode::kAuthenticationFailed, "Authentication failed");
  EXPECT_FALSE(f.client.pairing_token().has_value());
  EXPECT_FALSE(f.client.auth_token().has_value());

  f.ControllerError(arrowctl::ErrorCode::kInvalidMessage, "Invalid JSON");
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);
  EXPECT_EQ(f.EventsOf(ClientEventType::kControllerError).size(), 3u);
}

TEST(ControlClientTest, UnexpectedCloseSchedulesBackoffReconnects) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.transport.SimulateClose();

  EXPECT_EQ(f.client.status(), ConnectionStatus::kDisconnected);
  EXPECT_TRUE(f.client.IsReconnectPending());
  EXPECT_EQ(f.scheduler.PendingCount(), 1u);

  const milliseconds expected[] = {milliseconds(1000), milliseconds(2000),
                                   milliseconds(4000), milliseconds(8000),
                                   milliseconds(16000), milliseconds(30000)};
  for (size_t attempt = 0; attempt < 6; ++attempt) {
    const auto scheduled = f.EventsOf(ClientEventType::kReconnectScheduled);
    ASSERT_EQ(scheduled.size(), attempt + 1);
    EXPECT_EQ(scheduled.back().reconnect_delay, expected[attempt]);
    EXPECT_EQ(scheduled.back().attempt, static_cast<int>(attempt + 1));

    const size_t opens = f.transport.opens.size();
    f.scheduler.AdvanceBy(expected[attempt] - milliseconds(1));
    EXPECT_EQ(f.transport.opens.size(), opens);
    f.scheduler.AdvanceBy(milliseconds(1));
    ASSERT_EQ(f.transport.opens.size(), opens + 1);
    EXPECT_EQ(f.client.status(), ConnectionStatus::kConnecting);
    f.transport.SimulateClose("connection refused");
  }
}

TEST(ControlClientTest, GivesUpAfterMaxAttemptsLeavingNoTimer) {
  auto config = MakeClientConfig();
  config.max_reconnect_attempts = 3;
  ClientFixture f(config);
  f.ConnectAndOpen();
  f.transport.SimulateClose();

  for (int i = 0; i < 3; ++i) {
    f.scheduler.AdvanceBy(seconds(60));
    f.transport.SimulateClose("connection refused");
  }

  EXPECT_EQ(f.transport.opens.size(), 4u);
  EXPECT_EQ(f.client.status(), ConnectionStatus::kError);
  EXPECT_FALSE(f.client.IsReconnectPending());
  EXPECT_EQ(f.scheduler.PendingCount(), 0u);
  ASSERT_EQ(f.EventsOf(ClientEventType::kGaveUp).size(), 1u);
  EXPECT_EQ(f.EventsOf(ClientEventType::kReconnectScheduled).size(), 3u);

  f.scheduler.AdvanceBy(seconds(600));
  EXPECT_EQ(f.transport.opens.size(), 4u);
}

TEST(ControlClientTest, SuccessfulOpenResetsAttemptCounter) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.transport.SimulateClose();
  f.scheduler.AdvanceBy(seconds(1));
  f.transport.SimulateClose();
  EXPECT_EQ(f.client.reconnect_attempts(), 2);

  f.scheduler.AdvanceBy(seconds(2));
  f.transport.SimulateOpen();
  EXPECT_EQ(f.client.reconnect_attempts(), 0);
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnected);

  f.transport.SimulateClose();
  const auto scheduled = f.EventsOf(ClientEventType::kReconnectScheduled);
  EXPECT_EQ(scheduled.back().reconnect_delay, milliseconds(1000));
}

TEST(ControlClientTest, CloseStopsHeartbeat) {
  ClientFixture f;
  f.ConnectAndOpen();
  const size_t heartbeats = f.transport.CountOfType(MessageType::kHeartbeat);
  f.transport.SimulateClose();
  // Only the reconnect timer remains.
  EXPECT_EQ(f.scheduler.PendingCount(), 1u);
  f.client.Disconnect();
  f.scheduler.AdvanceBy(seconds(120));
  EXPECT_EQ(f.transport.CountOfType(MessageType::kHeartbeat), heartbeats);
}

TEST(ControlClientTest, ManualDisconnectNeverReconnects) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.client.Disconnect();
  EXPECT_EQ(f.transport.closes, 1);
  EXPECT_EQ(f.client.status(), ConnectionStatus::kDisconnected);

  f.transport.SimulateClose("closed by peer");
  EXPECT_FALSE(f.client.IsReconnectPending());
  EXPECT_EQ(f.scheduler.PendingCount(), 0u);
}

TEST(ControlClientTest, DisconnectCancelsPendingReconnect) {
  ClientFixture f;
  f.ConnectAndOpen();
  f.transport.SimulateClose();
  ASSERT_TRUE(f.client.IsReconnectPending());

  f.client.Disconnect();
  EXPECT_FALSE(f.client.IsReconnectPending());
  f.scheduler.AdvanceBy(seconds(60));
  EXPECT_EQ(f.transport.opens.size(), 1u);
}

TEST(ControlClientTest, AutoReconnectDisabledStaysDisconnected) {
  auto config = MakeClientConfig();
  config.auto_reconnect = false;
  ClientFixture f(config);
  f.ConnectAndOpen();
  f.transport.SimulateClose();
  EXPECT_EQ(f.client.status(), ConnectionStatus::kDisconnected);
  EXPECT_EQ(f.scheduler.PendingCount(), 0u);
}

TEST(ControlClientTest, AnnounceRetriesAfterGivingUp) {
  auto config = MakeClientConfig();
  config.max_reconnect_attempts = 1;
  ClientFixture f(config);
  arrowctl::ControllerEndpoint endpoint;
  endpoint.controller_id = "ctrl";
  endpoint.ip = "10.0.0.1";
  endpoint.control_port = 8080;

  ASSERT_TRUE(f.client.OnControllerAnnounced(endpoint));
  f.transport.SimulateOpen();
  EXPECT_FALSE(f.client.OnControllerAnnounced(endpoint));

  f.transport.SimulateClose();
  ASSERT_TRUE(f.client.IsReconnectPending());
  EXPECT_FALSE(f.client.OnControllerAnnounced(endpoint));
  EXPECT_EQ(f.transport.opens.size(), 1u);

  f.scheduler.AdvanceBy(seconds(1));
  f.transport.SimulateClose("connection refused");
  ASSERT_EQ(f.client.status(), ConnectionStatus::kError);
  EXPECT_EQ(f.transport.opens.size(), 2u);

  // A later announce starts a fresh cycle with a reset attempt budget.
  ASSERT_TRUE(f.client.OnControllerAnnounced(endpoint));
  EXPECT_EQ(f.transport.opens.size(), 3u);
  EXPECT_EQ(f.client.status(), ConnectionStatus::kConnecting);
  EXPECT_EQ(f.client.reconnect_attempts(), 0);
  f.transport.SimulateClose("connection refused");
  EXPECT_TRUE(f.client.IsReconnectPending());
}

TEST(LoggingKeyPressExecutorTest, CompletesOnWorkerThread) {
  arrowctl::LoggingKeyPressExecutor executor(arrowctl::fakes::QuietLog());
  std::promise<std::pair<bool, std::thread::id>> finished;
  arrowctl::KeyPressOptions options;
  options.repeat = 2;
  options.hold_time_ms = 10;
  executor.Press("left", options, [&](bool success) {
    finished.set_value({success, std::this_thread::get_id()});
  });
  auto future = finished.get_future();
  ASSERT_EQ(future.wait_for(seconds(2)), std::future_status::ready);
  const auto outcome = future.get();
  EXPECT_TRUE(outcome.first);
  EXPECT_NE(outcome.second, std::this_thread::get_id());
}

TEST(LoggingKeyPressExecutorTest, DestructionInterruptsLongHold) {
  std::atomic<int> completions{0};
  const auto start = std::chrono::steady_clock::now();
  {
    arrowctl::LoggingKeyPressExecutor executor(arrowctl::fakes::QuietLog());
    arrowctl::KeyPressOptions options;
    options.hold_time_ms = 60000;
    executor.Press("right", options, [&](bool) { ++completions; });
    executor.Press("right", options, [&](bool) { ++completions; });
    std::this_thread::sleep_for(milliseconds(20));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, seconds(5));
  EXPECT_EQ(completions.load(), 0);
}
