// Target: connects to a controller (configured or discovered), pairs, and executes arrow commands.
#include "arrowctl/control_client.h"
#include "arrowctl/discovery.h"
#include "arrowctl/event_loop.h"
#include "arrowctl/key_press.h"
#include "arrowctl/utils.h"
#include "arrowctl/websocket.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorGreen = "\033[32m";
const char* kColorYellow = "\033[33m";
const char* kColorRed = "\033[31m";

std::atomic<bool> g_running{true};

void HandleSignal(int) { g_running = false; }

void InstallSignalHandlers() {
  struct sigaction action {};
  action.sa_handler = HandleSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return (value && *value) ? std::string(value) : fallback;
}

long EnvNumber(const char* name, long fallback, long min, long max) {
  const char* value = std::getenv(name);
  if (!value || !*value) {
    return fallback;
  }
  char* end = nullptr;
  const long number = std::strtol(value, &end, 10);
  if (*end != '\0' || number < min || number > max) {
    std::cerr << "Ignoring invalid " << name << "=" << value << "\n";
    return fallback;
  }
  return number;
}

bool EnvFlag(const char* name) {
  const std::string value = EnvOr(name, "");
  return value == "1" || value == "true" || value == "yes";
}

void OnClientEvent(const arrowctl::ClientEvent& event) {
  using arrowctl::ClientEventType;
  switch (event.type) {
    case ClientEventType::kStatusChanged:
      std::cout << "[status: " << arrowctl::ToString(event.status) << "]\n";
      break;
    case ClientEventType::kPairingRequired:
      std::cout << kColorYellow << kColorBold << "Pairing token: "
                << event.pairing_token.value_or("") << kColorReset
                << "\nType 'y' to accept pairing.\n";
      break;
    case ClientEventType::kPairingAccepted:
      std::cout << kColorGreen << "Paired with controller\n" << kColorReset;
      break;
    case ClientEventType::kPairingRejected:
      std::cout << kColorRed << "Pairing rejected: " << event.error.value_or("")
                << "\n" << kColorReset;
      break;
    case ClientEventType::kCommandExecuted:
      std::cout << (event.success ? kColorGreen : kColorRed) << event.command_type
                << (event.success ? " executed" : " failed: " + event.error.value_or(""))
                << "\n" << kColorReset;
      break;
    case ClientEventType::kControllerError:
      std::cout << kColorRed << "Controller error: " << event.error.value_or("") << "\n"
                << kColorReset;
      break;
    case ClientEventType::kReconnectScheduled:
      std::cout << kColorYellow << "Reconnecting in " << event.reconnect_delay.count()
                << " ms (attempt " << event.attempt << ")\n" << kColorReset;
      break;
    case ClientEventType::kGaveUp:
      std::cout << kColorRed << "Gave up reconnecting after " << event.attempt
                << " attempts\n" << kColorReset;
      break;
  }
}

}  // namespace

int main() {
  InstallSignalHandlers();

  arrowctl::ClientConfig config;
  config.device.id = EnvOr("DEVICE_ID", arrowctl::GenerateDeviceId());
  config.device.name = EnvOr("DEVICE_NAME", "arrowctl-target");
  config.device.ip = arrowctl::GetLocalIpv4Address().value_or("");
  config.device.type = arrowctl::DeviceType::kTarget;
  config.device.supported_commands = {arrowctl::kCommandArrowLeft,
                                      arrowctl::kCommandArrowRight};
  config.heartbeat_interval =
      std::chrono::milliseconds(EnvNumber("HEARTBEAT_INTERVAL", 30000, 1, 3600000));
  config.auto_accept_pairing = EnvFlag("AUTO_ACCEPT_PAIRING");

  const std::string controller_ip = EnvOr("CONTROLLER_IP", "");
  const auto controller_port = static_cast<uint16_t>(
      EnvNumber("CONTROLLER_PORT", arrowctl::kDefaultControlPort, 1, 65535));

  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Configuration error: " << error << "\n";
    return 1;
  }

  arrowctl::EventLoop loop;
  if (!loop.Start()) {
    std::cerr << "Failed to start event loop: " << loop.GetLastError() << "\n";
    return 1;
  }

  arrowctl::WebSocketClientTransport transport(loop.context());
  arrowctl::LoggingKeyPressExecutor executor;
  arrowctl::ControlClient client(config, transport, loop, executor);
  client.SetEventCallback(OnClientEvent);

  std::cout << kColorBold << "arrowctl target " << config.device.name << kColorReset
            << " (" << config.device.id << ")\n";

  std::unique_ptr<arrowctl::DiscoveryListener> listener;
  if (!controller_ip.empty()) {
    bool connecting = false;
    loop.RunSync([&]() { connecting = client.Connect(controller_ip, controller_port); });
    if (!connecting) {
      std::cerr << "Failed to connect: " << client.GetLastError() << "\n";
    }
  } else {
    arrowctl::ListenerConfig listener_config;
    listener_config.device = config.device;
    listener = std::make_unique<arrowctl::DiscoveryListener>(listener_config);
    // Every announce is a chance to retry, including after the client gave up.
    listener->SetAnnounceCallback([&](const arrowctl::ControllerEndpoint& endpoint) {
      loop.Post([&client, endpoint]() { client.OnControllerAnnounced(endpoint); });
    });
    if (!listener->Start()) {
      std::cerr << "Discovery failed: " << listener->GetLastError() << "\n";
    } else {
      std::cout << "Waiting for a controller announce...\n";
      listener->SendRegister();
    }
  }

  std::string line;
  while (g_running && std::getline(std::cin, line)) {
    try {
      if (line == "y" || line == "Y") {
        bool sent = false;
        loop.RunSync([&]() { sent = client.SendPairingRequest(); });
        if (!sent) {
          std::cout << kColorRed << "No pairing token to accept\n" << kColorReset;
        }
      } else if (line == "status") {
        arrowctl::ConnectionStatus status = arrowctl::ConnectionStatus::kDisconnected;
        loop.RunSync([&]() { status = client.status(); });
        std::cout << arrowctl::ToString(status) << "\n";
      } else if (line == "quit" || line == "exit") {
        break;
      }
    } catch (const std::exception& e) {
      std::cout << kColorRed << "Error: " << e.what() << "\n" << kColorReset;
    }
  }

  std::cout << "\nShutting down...\n";
  if (listener) {
    listener->Stop();
  }
  try {
    loop.RunSync([&]() { client.Disconnect(); });
  } catch (const std::exception& e) {
    std::cerr << "Shutdown error: " << e.what() << "\n";
  }
  loop.Stop();
  return 0;
}
