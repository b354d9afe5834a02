#pragma once

#include "arrowctl/device_registry.h"
#include "arrowctl/event_loop.h"
#include "arrowctl/logging.h"
#include "arrowctl/protocol.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace arrowctl {

/**
 * Server-side handle for one live control session. Owned by the transport;
 * the ControlServer only borrows it through its connection table.
 */
class SessionTransport {
 public:
  virtual ~SessionTransport() = default;

  /// Queue one text frame. False if the session can no longer send.
  virtual bool Send(const std::string& text) = 0;
  /// Queue a transport-level ping. False if the session can no longer send.
  virtual bool Ping() = 0;
  /// Close the session without a handshake.
  virtual void Terminate() = 0;
  virtual std::string RemoteAddress() const = 0;
};

/**
 * Controller identity and control-channel settings.
 */
struct ServerConfig {
  /// Controller id used as the sender of every outgoing message.
  std::string controller_id;
  std::string controller_name = "arrowctl-controller";
  /// Local bind address for the WebSocket listener.
  std::string bind_address = "0.0.0.0";
  /// WebSocket listen port; 0 picks an ephemeral port.
  uint16_t port = kDefaultControlPort;
  /// Liveness sweep period. A connection missing two sweeps is terminated.
  std::chrono::milliseconds ping_interval{30000};
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Distinct precondition failures of SendArrowCommand, in check order.
 */
enum class CommandError {
  kNone,
  kInvalidParameters,
  kDeviceNotFound,
  kDeviceNotConnected,
  kDeviceNotPaired,
  kCommandNotSupported,
  kNoActiveConnection,
  kSendFailed,
};

const char* ToString(CommandError error);

/**
 * Result of a command dispatch. Success means the frame was handed to the
 * transport, not that the target executed it.
 */
struct CommandOutcome {
  bool success = false;
  CommandError error_code = CommandError::kNone;
  std::string error;
};

enum class ConnectionEventType {
  kOpened,
  kClosed,
  kTerminated,
};

struct ConnectionEvent {
  ConnectionEventType type = ConnectionEventType::kOpened;
  std::string connection_id;
  std::string remote_address;
  /// Device bound to the connection at the time of the event.
  std::optional<std::string> device_id;
};

/**
 * Execution report from a target, correlated by device and command type.
 */
struct CommandResultEvent {
  std::string device_id;
  std::string device_name;
  std::string command_type;
  bool success = false;
  std::optional<std::string> error;
};

/**
 * Controller-side protocol handler.
 *
 * Not thread-safe: every method, including the On* entry points fed by the
 * transport, must run on the thread that drives `scheduler`.
 */
class ControlServer {
 public:
  using CommandResultCallback = std::function<void(const CommandResultEvent&)>;
  using ConnectionCallback = std::function<void(const ConnectionEvent&)>;

  ControlServer(ServerConfig config, DeviceRegistry& registry,
                TaskScheduler& scheduler);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  /// Validate configuration and start the liveness sweep.
  bool Start();
  /// Cancel the sweep, terminate every session and disconnect bound devices.
  void Shutdown();

  void SetCommandResultCallback(CommandResultCallback cb);
  void SetConnectionCallback(ConnectionCallback cb);

  /// Track a new session; returns its connection id.
  std::string OnSessionOpened(std::shared_ptr<SessionTransport> session);
  /// Handle one inbound text frame.
  void OnSessionMessage(const std::string& connection_id, const std::string& text);
  /// Mark a connection alive after a transport pong.
  void OnSessionPong(const std::string& connection_id);
  /// Forget a connection closed by the peer or the transport.
  void OnSessionClosed(const std::string& connection_id);

  /**
   * Send an arrow command to a paired, connected device.
   *
   * Checks, in order: parameters, device known, device connected, device
   * paired, command advertised, live connection bound.
   */
  CommandOutcome SendArrowCommand(
      const std::string& device_id, ArrowDirection direction,
      const ArrowCommandParameters& parameters = ArrowCommandParameters());

  /**
   * One liveness cycle: terminate connections that missed the previous
   * ping, then mark the rest not-alive and ping them.
   */
  void RunLivenessSweep();

  size_t ConnectionCount() const;
  /// Device bound to a connection, if any.
  std::optional<std::string> GetBoundDevice(const std::string& connection_id) const;
  const ServerConfig& config() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace arrowctl
