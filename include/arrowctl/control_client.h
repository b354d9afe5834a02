#pragma once

#include "arrowctl/event_loop.h"
#include "arrowctl/key_press.h"
#include "arrowctl/logging.h"
#include "arrowctl/protocol.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace arrowctl {

/**
 * Target-side message channel to a controller.
 *
 * Handlers run on the scheduler thread. Once Close() or a new Open() has been
 * called, no handler fires for the previous session.
 */
class ClientTransport {
 public:
  struct Handlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_message;
    /// Connect failure, read error or peer close, with a reason.
    std::function<void(const std::string&)> on_close;
  };

  virtual ~ClientTransport() = default;

  virtual void SetHandlers(Handlers handlers) = 0;
  /// Begin connecting; completion is reported through on_open or on_close.
  virtual void Open(const std::string& host, uint16_t port) = 0;
  /// Queue one text frame. False if no session is open.
  virtual bool Send(const std::string& text) = 0;
  virtual void Close() = 0;
};

/**
 * Target identity, heartbeat and reconnect policy.
 */
struct ClientConfig {
  /// Identity sent in `register`; type must be target.
  DeviceInfo device;
  /// Reconnect with backoff after an unexpected close.
  bool auto_reconnect = true;
  /// Echo the pairing token as soon as it arrives.
  bool auto_accept_pairing = false;
  std::chrono::milliseconds heartbeat_interval{30000};
  /// First reconnect delay; doubled per attempt.
  std::chrono::milliseconds reconnect_base_delay{1000};
  /// Upper bound on the reconnect delay.
  std::chrono::milliseconds reconnect_max_delay{30000};
  /// Attempts before giving up permanently.
  int max_reconnect_attempts = 10;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/// min(base * 2^attempt, cap) for a zero-based attempt index.
std::chrono::milliseconds ReconnectDelay(int attempt, std::chrono::milliseconds base,
                                         std::chrono::milliseconds cap);

enum class ClientEventType {
  kStatusChanged,
  kPairingRequired,
  kPairingAccepted,
  kPairingRejected,
  kCommandExecuted,
  kControllerError,
  kReconnectScheduled,
  kGaveUp,
};

const char* ToString(ClientEventType type);

struct ClientEvent {
  ClientEventType type = ClientEventType::kStatusChanged;
  /// Client status after the event.
  ConnectionStatus status = ConnectionStatus::kDisconnected;
  /// Set for kPairingRequired.
  std::optional<std::string> pairing_token;
  /// Set for kCommandExecuted.
  std::string command_type;
  bool success = false;
  /// Reason text for rejections, failed commands and controller errors.
  std::optional<std::string> error;
  /// Set for kControllerError.
  std::optional<ErrorCode> error_code;
  /// Set for kReconnectScheduled.
  std::chrono::milliseconds reconnect_delay{0};
  int attempt = 0;
};

/**
 * Target-side connection state machine:
 * disconnected -> connecting -> connected -> paired, with backoff reconnect
 * after unexpected closes.
 *
 * Not thread-safe: every method must run on the thread that drives
 * `scheduler` and the transport handlers.
 */
class ControlClient {
 public:
  using EventCallback = std::function<void(const ClientEvent&)>;

  ControlClient(ClientConfig config, ClientTransport& transport,
                TaskScheduler& scheduler, KeyPressExecutor& executor);
  ~ControlClient();

  ControlClient(const ControlClient&) = delete;
  ControlClient& operator=(const ControlClient&) = delete;

  void SetEventCallback(EventCallback cb);

  /// Start connecting to a known address. False if config is invalid or a
  /// session is already connecting or open.
  bool Connect(const std::string& host, uint16_t port);
  /// Start connecting to a discovered controller.
  bool ConnectTo(const ControllerEndpoint& endpoint);
  /**
   * Feed one controller announce. Starts a fresh connect cycle when the client
   * is idle (disconnected, or in error after giving up) and no reconnect timer
   * is pending; otherwise does nothing.
   *
   * @return true if a connect attempt was started.
   */
  bool OnControllerAnnounced(const ControllerEndpoint& endpoint);
  /// Close the session; never followed by an automatic reconnect.
  void Disconnect();

  /// Echo the held pairing token to the controller.
  bool SendPairingRequest();

  ConnectionStatus status() const;
  /// True while a reconnect timer is pending.
  bool IsReconnectPending() const;
  int reconnect_attempts() const;
  std::optional<std::string> pairing_token() const;
  std::optional<std::string> auth_token() const;
  const ClientConfig& config() const;
  /// Return the last Connect() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace arrowctl
