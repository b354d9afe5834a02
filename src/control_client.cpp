#include "arrowctl/control_client.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>

namespace arrowctl {

bool ClientConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (device.id.empty()) {
    return fail("device.id must not be empty");
  }
  if (device.name.empty()) {
    return fail("device.name must not be empty");
  }
  if (device.type != DeviceType::kTarget) {
    return fail("device.type must be target");
  }
  if (heartbeat_interval.count() <= 0) {
    return fail("heartbeat_interval must be positive");
  }
  if (reconnect_base_delay.count() <= 0 || reconnect_max_delay.count() <= 0) {
    return fail("reconnect delays must be positive");
  }
  if (reconnect_max_delay < reconnect_base_delay) {
    return fail("reconnect_max_delay must be >= reconnect_base_delay");
  }
  if (max_reconnect_attempts < 0) {
    return fail("max_reconnect_attempts must be non-negative");
  }
  return true;
}

std::chrono::milliseconds ReconnectDelay(int attempt, std::chrono::milliseconds base,
                                         std::chrono::milliseconds cap) {
  std::chrono::milliseconds delay = base;
  for (int i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  return std::min(delay, cap);
}

const char* ToString(ClientEventType type) {
  switch (type) {
    case ClientEventType::kStatusChanged:
      return "status_changed";
    case ClientEventType::kPairingRequired:
      return "pairing_required";
    case ClientEventType::kPairingAccepted:
      return "pairing_accepted";
    case ClientEventType::kPairingRejected:
      return "pairing_rejected";
    case ClientEventType::kCommandExecuted:
      return "command_executed";
    case ClientEventType::kControllerError:
      return "controller_error";
    case ClientEventType::kReconnectScheduled:
      return "reconnect_scheduled";
    case ClientEventType::kGaveUp:
      return "gave_up";
  }
  return "status_changed";
}

struct ControlClient::Impl {
  Impl(ClientConfig config, ClientTransport& transport, TaskScheduler& scheduler,
       KeyPressExecutor& executor)
      : config_(std::move(config)),
        transport_(transport),
        scheduler_(scheduler),
        executor_(executor),
        logger_("ControlClient", config_.log_callback),
        sender_{config_.device.id, DeviceType::kTarget} {}

  void BindTransport() {
    ClientTransport::Handlers handlers;
    handlers.on_open = [this]() { OnOpen(); };
    handlers.on_message = [this](const std::string& text) { OnMessage(text); };
    handlers.on_close = [this](const std::string& reason) { OnClose(reason); };
    transport_.SetHandlers(std::move(handlers));
  }

  bool Connect(const std::string& host, uint16_t port) {
    last_error_.clear();
    std::string error;
    if (!config_.Validate(&error)) {
      last_error_ = error;
      logger_.Error(error);
      return false;
    }
    if (host.empty() || port == 0) {
      last_error_ = "controller address must be set";
      logger_.Error(last_error_);
      return false;
    }
    if (status_ == ConnectionStatus::kConnecting ||
        status_ == ConnectionStatus::kConnected ||
        status_ == ConnectionStatus::kPaired) {
      last_error_ = "already connecting or connected";
      logger_.Warn(last_error_);
      return false;
    }
    CancelReconnect();
    host_ = host;
    port_ = port;
    manual_close_ = false;
    attempts_ = 0;
    StartConnecting();
    return true;
  }

  void StartConnecting() {
    SetStatus(ConnectionStatus::kConnecting);
    logger_.Info("Connecting to " + host_ + ":" + std::to_string(port_));
    transport_.Open(host_, port_);
  }

  void Disconnect() {
    manual_close_ = true;
    CancelReconnect();
    StopHeartbeat();
    transport_.Close();
    if (status_ != ConnectionStatus::kDisconnected) {
      logger_.Info("Disconnected by request");
    }
    SetStatus(ConnectionStatus::kDisconnected);
  }

  void OnOpen() {
    if (status_ != ConnectionStatus::kConnecting) {
      logger_.Debug("Ignoring open outside of connecting state");
      return;
    }
    attempts_ = 0;
    SetStatus(ConnectionStatus::kConnected);
    RegisterPayload payload;
    payload.device_info = config_.device;
    Send(BuildRegister(sender_, payload));
    StartHeartbeat();
  }

  void OnClose(const std::string& reason) {
    StopHeartbeat();
    logger_.Warn("Connection closed: " + reason);
    SetStatus(ConnectionStatus::kDisconnected);
    if (manual_close_ || !config_.auto_reconnect) {
      return;
    }
    ScheduleReconnect();
  }

  void ScheduleReconnect() {
    CancelReconnect();
    if (attempts_ >= config_.max_reconnect_attempts) {
      logger_.Error("Giving up after " + std::to_string(attempts_) +
                    " reconnect attempts");
      SetStatus(ConnectionStatus::kError);
      ClientEvent event;
      event.type = ClientEventType::kGaveUp;
      event.attempt = attempts_;
      Emit(event);
      return;
    }
    const auto delay = ReconnectDelay(attempts_, config_.reconnect_base_delay,
                                      config_.reconnect_max_delay);
    ++attempts_;
    reconnect_task_ = scheduler_.ScheduleAfter(delay, [this]() {
      reconnect_task_ = kInvalidTaskId;
      StartConnecting();
    });
    logger_.Info("Reconnect attempt " + std::to_string(attempts_) + " in " +
                 std::to_string(delay.count()) + " ms");
    ClientEvent event;
    event.type = ClientEventType::kReconnectScheduled;
    event.reconnect_delay = delay;
    event.attempt = attempts_;
    Emit(event);
  }

  void CancelReconnect() {
    if (reconnect_task_ != kInvalidTaskId) {
      scheduler_.Cancel(reconnect_task_);
      reconnect_task_ = kInvalidTaskId;
    }
  }

  void StartHeartbeat() {
    StopHeartbeat();
    Send(BuildHeartbeat(sender_));
    ScheduleHeartbeat();
  }

  void ScheduleHeartbeat() {
    heartbeat_task_ = scheduler_.ScheduleAfter(config_.heartbeat_interval, [this]() {
      heartbeat_task_ = kInvalidTaskId;
      if (!IsSessionOpen()) {
        return;
      }
      Send(BuildHeartbeat(sender_));
      ScheduleHeartbeat();
    });
  }

  void StopHeartbeat() {
    if (heartbeat_task_ != kInvalidTaskId) {
      scheduler_.Cancel(heartbeat_task_);
      heartbeat_task_ = kInvalidTaskId;
    }
  }

  bool IsSessionOpen() const {
    return status_ == ConnectionStatus::kConnected ||
           status_ == ConnectionStatus::kPaired;
  }

  void OnMessage(const std::string& text) {
    ProtocolMessage message;
    std::string error;
    if (!DecodeMessage(text, &message, &error)) {
      logger_.Warn("Invalid message from controller: " + error);
      return;
    }
    switch (message.type) {
      case MessageType::kRegistered:
        HandleRegistered(message);
        return;
      case MessageType::kPairingResponse:
        HandlePairingResponse(message);
        return;
      case MessageType::kCommand:
        HandleCommand(message);
        return;
      case MessageType::kHeartbeatAck:
        logger_.Debug("Heartbeat acknowledged");
        return;
      case MessageType::kError:
        HandleError(message);
        return;
      default:
        logger_.Warn(std::string("Unexpected message type from controller: ") +
                     ToString(message.type));
        return;
    }
  }

  void HandleRegistered(const ProtocolMessage& message) {
    RegisteredPayload payload;
    std::string error;
    if (!ParseRegistered(message, &payload, &error)) {
      logger_.Warn("Invalid registered message: " + error);
      return;
    }
    if (payload.device_id != config_.device.id) {
      logger_.Warn("Ignoring registration for another device: " + payload.device_id);
      return;
    }
    if (!payload.pairing_required) {
      pairing_token_.reset();
      logger_.Info("Registered with controller, already paired");
      SetStatus(ConnectionStatus::kPaired);
      return;
    }
    auth_token_.reset();
    pairing_token_ = payload.pairing_token;
    SetStatus(ConnectionStatus::kConnected);
    if (!pairing_token_.has_value()) {
      logger_.Warn("Pairing required but no pairing token was issued");
      return;
    }
    logger_.Info("Pairing required, token: " + pairing_token_.value());
    ClientEvent event;
    event.type = ClientEventType::kPairingRequired;
    event.pairing_token = pairing_token_;
    Emit(event);
    if (config_.auto_accept_pairing) {
      SendPairingRequest();
    }
  }

  void HandlePairingResponse(const ProtocolMessage& message) {
    PairingResponsePayload payload;
    std::string error;
    if (!ParsePairingResponse(message, &payload, &error)) {
      logger_.Warn("Invalid pairing response: " + error);
      return;
    }
    ClientEvent event;
    if (!payload.accepted) {
      const std::string reason = payload.error.value_or("Pairing rejected");
      logger_.Warn("Pairing rejected: " + reason);
      event.type = ClientEventType::kPairingRejected;
      event.error = reason;
      Emit(event);
      return;
    }
    auth_token_ = payload.auth_token;
    pairing_token_.reset();
    logger_.Info("Pairing accepted");
    SetStatus(ConnectionStatus::kPaired);
    event.type = ClientEventType::kPairingAccepted;
    Emit(event);
  }

  void HandleError(const ProtocolMessage& message) {
    ErrorPayload payload;
    std::string error;
    if (!ParseError(message, &payload, &error)) {
      logger_.Warn("Invalid error message: " + error);
      return;
    }
    logger_.Error("Controller error " + std::to_string(static_cast<int>(payload.code)) +
                  ": " + payload.message);
    if (payload.code == ErrorCode::kAuthenticationFailed) {
      pairing_token_.reset();
      auth_token_.reset();
    }
    if ((payload.code == ErrorCode::kAuthenticationFailed ||
         payload.code == ErrorCode::kNotPaired) &&
        status_ == ConnectionStatus::kPaired) {
      SetStatus(ConnectionStatus::kConnected);
    }
    ClientEvent event;
    event.type = ClientEventType::kControllerError;
    event.error_code = payload.code;
    event.error = payload.message;
    Emit(event);
  }

  void HandleCommand(const ProtocolMessage& message) {
    CommandPayload payload;
    std::string error;
    if (!ParseCommand(message, &payload, &error)) {
      logger_.Warn("Invalid command message: " + error);
      return;
    }
    const auto direction = DirectionForCommand(payload.command_type);
    if (!direction.has_value() || !config_.device.Supports(payload.command_type)) {
      logger_.Warn("Unsupported command: " + payload.command_type);
      ReportCommand(payload.command_type, false, std::string("Unsupported command"));
      return;
    }
    ArrowCommandParameters parameters;
    if (!ParseArrowParameters(payload.parameters, &parameters, &error)) {
      logger_.Warn("Invalid parameters for " + payload.command_type + ": " + error);
      ReportCommand(payload.command_type, false, error);
      return;
    }
    KeyPressOptions options;
    options.repeat = parameters.repeat;
    options.hold_time_ms = parameters.hold_time_ms;
    const std::string command_type = payload.command_type;
    try {
      executor_.Press(KeyNameFor(direction.value()), options,
                      MakeCompletion(command_type));
    } catch (const std::exception& ex) {
      logger_.Error("Key press failed for " + command_type + ": " + ex.what());
      ReportCommand(command_type, false, std::string("Internal error"));
    }
  }

  // The executor may finish on any thread; the result is handed back to the
  // scheduler thread and dropped if this client is gone by then.
  KeyPressExecutor::Completion MakeCompletion(const std::string& command_type) {
    std::weak_ptr<char> alive = lifetime_;
    TaskScheduler* scheduler = &scheduler_;
    return [this, alive, scheduler, command_type](bool success) {
      if (alive.expired()) {
        return;
      }
      scheduler->ScheduleAfter(std::chrono::milliseconds(0),
                               [this, alive, command_type, success]() {
                                 if (!alive.expired()) {
                                   FinishCommand(command_type, success);
                                 }
                               });
    };
  }

  void FinishCommand(const std::string& command_type, bool success) {
    if (!success) {
      logger_.Warn("Command execution failed: " + command_type);
      ReportCommand(command_type, false, std::string("Command execution failed"));
      return;
    }
    logger_.Info("Executed " + command_type);
    ReportCommand(command_type, true, std::nullopt);
  }

  void ReportCommand(const std::string& command_type, bool success,
                     const std::optional<std::string>& error) {
    CommandResultPayload payload;
    payload.command_type = command_type;
    payload.success = success;
    payload.error = error;
    Send(BuildCommandResult(sender_, payload));
    ClientEvent event;
    event.type = ClientEventType::kCommandExecuted;
    event.command_type = command_type;
    event.success = success;
    event.error = error;
    Emit(event);
  }

  bool SendPairingRequest() {
    if (!IsSessionOpen()) {
      logger_.Warn("Cannot send pairing request: not connected");
      return false;
    }
    if (!pairing_token_.has_value()) {
      logger_.Warn("Cannot send pairing request: no pairing token");
      return false;
    }
    PairingRequestPayload payload;
    payload.pairing_token = pairing_token_.value();
    logger_.Info("Sending pairing request");
    return Send(BuildPairingRequest(sender_, payload));
  }

  bool Send(const ProtocolMessage& message) {
    if (!transport_.Send(EncodeMessage(message))) {
      logger_.Warn(std::string("Failed to send ") + ToString(message.type));
      return false;
    }
    return true;
  }

  void SetStatus(ConnectionStatus status) {
    if (status_ == status) {
      return;
    }
    logger_.Info(std::string("Status ") + ToString(status_) + " -> " + ToString(status));
    status_ = status;
    ClientEvent event;
    event.type = ClientEventType::kStatusChanged;
    Emit(event);
  }

  void Emit(ClientEvent event) {
    event.status = status_;
    EventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = event_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(event);
    } catch (const std::exception&) {
      logger_.CallbackException("ClientEventCallback");
    }
  }

  ClientConfig config_;
  ClientTransport& transport_;
  TaskScheduler& scheduler_;
  KeyPressExecutor& executor_;
  Logger logger_;
  Sender sender_;

  ConnectionStatus status_ = ConnectionStatus::kDisconnected;
  std::string host_;
  uint16_t port_ = 0;
  bool manual_close_ = false;
  int attempts_ = 0;
  TaskId reconnect_task_ = kInvalidTaskId;
  TaskId heartbeat_task_ = kInvalidTaskId;
  std::optional<std::string> pairing_token_;
  std::optional<std::string> auth_token_;
  std::string last_error_;
  // Expires with the client; pending key press completions check it.
  std::shared_ptr<char> lifetime_ = std::make_shared<char>(0);

  std::mutex callback_mutex_;
  EventCallback event_cb_;
};

ControlClient::ControlClient(ClientConfig config, ClientTransport& transport,
                             TaskScheduler& scheduler, KeyPressExecutor& executor)
    : impl_(new Impl(std::move(config), transport, scheduler, executor)) {
  impl_->BindTransport();
}

ControlClient::~ControlClient() {
  impl_->lifetime_.reset();
  impl_->CancelReconnect();
  impl_->StopHeartbeat();
  impl_->transport_.SetHandlers(ClientTransport::Handlers());
}

void ControlClient::SetEventCallback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->event_cb_ = std::move(cb);
}

bool ControlClient::Connect(const std::string& host, uint16_t port) {
  return impl_->Connect(host, port);
}

bool ControlClient::ConnectTo(const ControllerEndpoint& endpoint) {
  return impl_->Connect(endpoint.ip, endpoint.control_port);
}

bool ControlClient::OnControllerAnnounced(const ControllerEndpoint& endpoint) {
  const auto status = impl_->status_;
  if (status != ConnectionStatus::kDisconnected && status != ConnectionStatus::kError) {
    return false;
  }
  if (IsReconnectPending()) {
    return false;
  }
  return impl_->Connect(endpoint.ip, endpoint.control_port);
}

void ControlClient::Disconnect() { impl_->Disconnect(); }

bool ControlClient::SendPairingRequest() { return impl_->SendPairingRequest(); }

ConnectionStatus ControlClient::status() const { return impl_->status_; }

bool ControlClient::IsReconnectPending() const {
  return impl_->reconnect_task_ != kInvalidTaskId;
}

int ControlClient::reconnect_attempts() const { return impl_->attempts_; }

std::optional<std::string> ControlClient::pairing_token() const {
  return impl_->pairing_token_;
}

std::optional<std::string> ControlClient::auth_token() const {
  return impl_->auth_token_;
}

const ClientConfig& ControlClient::config() const { return impl_->config_; }

std::string ControlClient::GetLastError() const { return impl_->last_error_; }

}  // namespace arrowctl
