// Controller: accepts target sessions, tracks pairing and sends arrow commands typed on stdin.
#include "arrowctl/control_server.h"
#include "arrowctl/device_registry.h"
#include "arrowctl/discovery.h"
#include "arrowctl/event_loop.h"
#include "arrowctl/utils.h"
#include "arrowctl/websocket.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorGreen = "\033[32m";
const char* kColorYellow = "\033[33m";
const char* kColorCyan = "\033[36m";
const char* kColorRed = "\033[31m";

std::atomic<bool> g_running{true};

void HandleSignal(int) { g_running = false; }

// No SA_RESTART so a blocked getline returns on SIGINT/SIGTERM.
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

uint16_t EnvPort(const char* name, uint16_t fallback) {
  const char* value = std::getenv(name);
  if (!value || !*value) {
    return fallback;
  }
  char* end = nullptr;
  const long port = std::strtol(value, &end, 10);
  if (*end != '\0' || port <= 0 || port > 65535) {
    std::cerr << "Ignoring invalid " << name << "=" << value << "\n";
    return fallback;
  }
  return static_cast<uint16_t>(port);
}

bool ParseCount(const std::string& text, int* out) {
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || value < 0 || value > 1000000) {
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

void PrintBanner(const arrowctl::ServerConfig& config, const std::string& ip,
                 uint16_t port, uint16_t discovery_port) {
  std::cout << kColorBold << kColorCyan;
  std::cout << "arrowctl controller\n";
  std::cout << kColorReset;
  std::cout << "  Name:      " << config.controller_name << "\n";
  std::cout << "  Id:        " << config.controller_id << "\n";
  std::cout << "  Control:   ws://" << ip << ":" << port << "\n";
  std::cout << "  Discovery: udp " << discovery_port << "\n\n";
}

void PrintHelp() {
  std::cout << kColorBold << "Commands:\n" << kColorReset;
  std::cout << "  list                          Show known devices\n";
  std::cout << "  left <id> [repeat] [hold_ms]  Send arrow_left\n";
  std::cout << "  right <id> [repeat] [hold_ms] Send arrow_right\n";
  std::cout << "  unpair <id>                   Revoke a device's pairing\n";
  std::cout << "  cleanup                       Forget devices unseen for 24 h\n";
  std::cout << "  quit                          Shut down\n";
}

void PrintDevices(const arrowctl::DeviceRegistry& registry) {
  const auto devices = registry.GetAllDevices();
  std::cout << kColorBold << "Devices (" << devices.size() << "):\n" << kColorReset;
  if (devices.empty()) {
    std::cout << kColorYellow << "  none registered yet\n" << kColorReset;
    return;
  }
  for (const auto& device : devices) {
    std::cout << "  " << std::left << std::setw(12) << arrowctl::ToString(device.status)
              << device.info.name << " (" << device.info.id << ") @ " << device.info.ip;
    if (device.pairing_token.has_value()) {
      std::cout << "  pairing token: " << device.pairing_token.value();
    }
    std::cout << "\n";
  }
}

void HandleArrow(arrowctl::EventLoop& loop, arrowctl::ControlServer& server,
                 arrowctl::ArrowDirection direction,
                 const std::vector<std::string>& args) {
  if (args.size() < 2) {
    std::cout << kColorRed << "Usage: " << args[0] << " <id> [repeat] [hold_ms]\n"
              << kColorReset;
    return;
  }
  arrowctl::ArrowCommandParameters parameters;
  if ((args.size() > 2 && !ParseCount(args[2], &parameters.repeat)) ||
      (args.size() > 3 && !ParseCount(args[3], &parameters.hold_time_ms))) {
    std::cout << kColorRed << "repeat and hold_ms must be non-negative integers\n"
              << kColorReset;
    return;
  }
  arrowctl::CommandOutcome outcome;
  if (!loop.RunSync([&]() {
        outcome = server.SendArrowCommand(args[1], direction, parameters);
      })) {
    std::cout << kColorRed << "Event loop is not running\n" << kColorReset;
    return;
  }
  if (outcome.success) {
    std::cout << kColorGreen << "Sent " << arrowctl::CommandTypeFor(direction) << " to "
              << args[1] << "\n" << kColorReset;
  } else {
    std::cout << kColorRed << "Failed: " << outcome.error << "\n" << kColorReset;
  }
}

}  // namespace

int main() {
  InstallSignalHandlers();

  const std::string ip = arrowctl::GetLocalIpv4Address().value_or("127.0.0.1");

  arrowctl::ServerConfig server_config;
  server_config.controller_id = EnvOr("CONTROLLER_ID", arrowctl::GenerateDeviceId());
  server_config.controller_name = EnvOr("CONTROLLER_NAME", server_config.controller_name);
  server_config.port = EnvPort("WEBSOCKET_PORT", arrowctl::kDefaultControlPort);

  arrowctl::BroadcasterConfig discovery_config;
  discovery_config.controller.id = server_config.controller_id;
  discovery_config.controller.name = server_config.controller_name;
  discovery_config.controller.ip = ip;
  discovery_config.controller.type = arrowctl::DeviceType::kController;
  discovery_config.listen_port =
      EnvPort("DISCOVERY_PORT", arrowctl::kDefaultControllerDiscoveryPort);
  discovery_config.control_port = server_config.port;

  std::string error;
  if (!server_config.Validate(&error) || !discovery_config.Validate(&error)) {
    std::cerr << "Configuration error: " << error << "\n";
    return 1;
  }

  arrowctl::EventLoop loop;
  if (!loop.Start()) {
    std::cerr << "Failed to start event loop: " << loop.GetLastError() << "\n";
    return 1;
  }

  arrowctl::DeviceRegistry registry;
  registry.SetEventCallback([](const arrowctl::RegistryEvent& event) {
    if (event.type == arrowctl::RegistryEventType::kRegistered &&
        event.device.pairing_token.has_value()) {
      std::cout << kColorYellow << "\n[" << event.device.info.name
                << " wants to pair, token " << event.device.pairing_token.value()
                << "]\n" << kColorReset;
    } else if (event.type == arrowctl::RegistryEventType::kPaired) {
      std::cout << kColorGreen << "\n[Paired: " << event.device.info.name << " ("
                << event.device.info.id << ")]\n" << kColorReset;
    }
  });

  arrowctl::ControlServer server(server_config, registry, loop);
  server.SetCommandResultCallback([](const arrowctl::CommandResultEvent& event) {
    std::cout << (event.success ? kColorGreen : kColorRed) << "\n["
              << event.device_name << ": " << event.command_type
              << (event.success ? " ok" : " failed")
              << (event.error.has_value() ? " (" + event.error.value() + ")" : "")
              << "]\n" << kColorReset;
  });

  arrowctl::WebSocketServer websocket(loop.context(), server);
  bool started = false;
  if (!loop.RunSync([&]() {
        started = server.Start() &&
                  websocket.Start(server_config.bind_address, server_config.port);
      }) ||
      !started) {
    std::cerr << "Failed to start control server: "
              << (server.GetLastError().empty() ? websocket.GetLastError()
                                                : server.GetLastError())
              << "\n";
    loop.Stop();
    return 1;
  }

  arrowctl::DiscoveryBroadcaster broadcaster(discovery_config);
  broadcaster.SetPeerEventCallback([](const arrowctl::DiscoveryEvent& event) {
    if (event.type == arrowctl::DiscoveryEventType::kSeen) {
      std::cout << kColorCyan << "\n[Target on network: " << event.peer.info.name
                << " @ " << event.peer.info.ip << "]\n" << kColorReset;
    }
  });
  if (!broadcaster.Start()) {
    std::cerr << "Discovery disabled: " << broadcaster.GetLastError() << "\n";
  }

  PrintBanner(server_config, ip, websocket.port(), discovery_config.listen_port);
  PrintHelp();

  std::string line;
  while (g_running) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    std::istringstream iss(line);
    std::vector<std::string> args;
    for (std::string word; iss >> word;) {
      args.push_back(word);
    }
    if (args.empty()) {
      continue;
    }
    const std::string& cmd = args[0];
    try {
      if (cmd == "list") {
        PrintDevices(registry);
      } else if (cmd == "left") {
        HandleArrow(loop, server, arrowctl::ArrowDirection::kLeft, args);
      } else if (cmd == "right") {
        HandleArrow(loop, server, arrowctl::ArrowDirection::kRight, args);
      } else if (cmd == "unpair" && args.size() > 1) {
        const auto result = registry.UnpairDevice(args[1]);
        if (result.success) {
          std::cout << "Unpaired; new pairing token "
                    << result.device->pairing_token.value_or("") << "\n";
        } else {
          std::cout << kColorRed << result.error << "\n" << kColorReset;
        }
      } else if (cmd == "cleanup") {
        const auto removed = registry.CleanupOldDevices();
        std::cout << "Removed " << removed.size() << " stale device(s)\n";
      } else if (cmd == "quit" || cmd == "exit") {
        break;
      } else {
        PrintHelp();
      }
    } catch (const std::exception& e) {
      std::cout << kColorRed << "Error: " << e.what() << "\n" << kColorReset;
    }
  }

  std::cout << "\nShutting down...\n";
  broadcaster.Stop();
  try {
    loop.RunSync([&]() {
      websocket.Stop();
      server.Shutdown();
    });
  } catch (const std::exception& e) {
    std::cerr << "Shutdown error: " << e.what() << "\n";
  }
  loop.Stop();
  return 0;
}
