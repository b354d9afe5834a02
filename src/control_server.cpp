#include "arrowctl/control_server.h"
#include "arrowctl/utils.h"

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace arrowctl {

const char* ToString(CommandError error) {
  switch (error) {
    case CommandError::kNone:
      return "";
    case CommandError::kInvalidParameters:
      return "Invalid command parameters";
    case CommandError::kDeviceNotFound:
      return "Device not found";
    case CommandError::kDeviceNotConnected:
      return "Device not connected";
    case CommandError::kDeviceNotPaired:
      return "Device not paired";
    case CommandError::kCommandNotSupported:
      return "Command not supported by device";
    case CommandError::kNoActiveConnection:
      return "No active connection for device";
    case CommandError::kSendFailed:
      return "Failed to send command";
  }
  return "";
}

bool ServerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (controller_id.empty()) {
    return fail("controller_id must not be empty");
  }
  if (controller_name.empty()) {
    return fail("controller_name must not be empty");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0" &&
      !IsValidIpv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (ping_interval.count() <= 0) {
    return fail("ping_interval must be positive");
  }
  return true;
}

struct ControlServer::Impl {
  Impl(ServerConfig config, DeviceRegistry& registry, TaskScheduler& scheduler)
      : config_(std::move(config)),
        registry_(registry),
        scheduler_(scheduler),
        logger_("ControlServer", config_.log_callback),
        sender_{config_.controller_id, DeviceType::kController} {}

  // Per-session record. The session handle never leaves this table.
  struct Connection {
    std::string id;
    std::shared_ptr<SessionTransport> session;
    std::string remote_address;
    bool is_alive = true;
    std::chrono::steady_clock::time_point last_activity;
    std::optional<std::string> device_id;
  };

  bool Start() {
    start_error_.clear();
    std::string error;
    if (!config_.Validate(&error)) {
      start_error_ = error;
      logger_.Error(error);
      return false;
    }
    if (running_) {
      return true;
    }
    running_ = true;
    ScheduleSweep();
    logger_.Info("Control server started for " + config_.controller_name + " (" +
                 config_.controller_id + ")");
    return true;
  }

  void Shutdown() {
    if (!running_ && connections_.empty()) {
      return;
    }
    running_ = false;
    if (sweep_task_ != kInvalidTaskId) {
      scheduler_.Cancel(sweep_task_);
      sweep_task_ = kInvalidTaskId;
    }
    std::vector<std::string> ids;
    for (const auto& entry : connections_) {
      ids.push_back(entry.first);
    }
    for (const auto& id : ids) {
      TerminateConnection(id, "server shutdown");
    }
    logger_.Info("Control server stopped");
  }

  void ScheduleSweep() {
    sweep_task_ = scheduler_.ScheduleAfter(config_.ping_interval, [this]() {
      sweep_task_ = kInvalidTaskId;
      if (!running_) {
        return;
      }
      RunLivenessSweep();
      ScheduleSweep();
    });
  }

  std::string OnSessionOpened(std::shared_ptr<SessionTransport> session) {
    if (!session) {
      return std::string();
    }
    Connection connection;
    connection.id = "conn-" + std::to_string(++next_connection_);
    connection.remote_address = session->RemoteAddress();
    connection.session = std::move(session);
    connection.last_activity = std::chrono::steady_clock::now();
    const std::string id = connection.id;
    const std::string address = connection.remote_address;
    connections_.emplace(id, std::move(connection));
    logger_.Info("Connection opened (" + id + ") from " + address);
    EmitConnection({ConnectionEventType::kOpened, id, address, std::nullopt});
    return id;
  }

  void OnSessionClosed(const std::string& connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    Connection connection = std::move(it->second);
    connections_.erase(it);
    logger_.Info("Connection closed (" + connection_id + ")");
    if (connection.device_id.has_value()) {
      ReleaseDevice(connection.device_id.value(), connection_id);
    }
    EmitConnection({ConnectionEventType::kClosed, connection_id,
                    connection.remote_address, connection.device_id});
  }

  void OnSessionPong(const std::string& connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    it->second.is_alive = true;
    it->second.last_activity = std::chrono::steady_clock::now();
  }

  // Remove a connection, close its socket and disconnect its device.
  void TerminateConnection(const std::string& connection_id, const char* reason) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    Connection connection = std::move(it->second);
    connections_.erase(it);
    logger_.Warn("Terminating connection (" + connection_id + "): " + reason);
    connection.session->Terminate();
    if (connection.device_id.has_value()) {
      ReleaseDevice(connection.device_id.value(), connection_id);
    }
    EmitConnection({ConnectionEventType::kTerminated, connection_id,
                    connection.remote_address, connection.device_id});
  }

  // Disconnect a device only while this connection is still its binding.
  void ReleaseDevice(const std::string& device_id, const std::string& connection_id) {
    const auto device = registry_.GetDeviceById(device_id);
    if (!device.has_value() || device->connection_id != connection_id) {
      return;
    }
    registry_.DisconnectDevice(device_id);
  }

  void OnSessionMessage(const std::string& connection_id, const std::string& text) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      logger_.Debug("Message for unknown connection (" + connection_id + ")");
      return;
    }
    it->second.last_activity = std::chrono::steady_clock::now();

    ProtocolMessage message;
    std::string error;
    if (!DecodeMessage(text, &message, &error)) {
      logger_.Warn("Invalid message from connection (" + connection_id + "): " + error);
      SendError(connection_id, ErrorCode::kInvalidMessage, error);
      return;
    }
    try {
      Dispatch(connection_id, message);
    } catch (const std::exception& ex) {
      logger_.Error("Error handling message from connection (" + connection_id +
                    "): " + ex.what());
      SendError(connection_id, ErrorCode::kInternalError, "Internal server error");
    }
  }

  void Dispatch(const std::string& connection_id, const ProtocolMessage& message) {
    switch (message.type) {
      case MessageType::kRegister:
        HandleRegister(connection_id, message);
        return;
      case MessageType::kPairingRequest:
        HandlePairingRequest(connection_id, message);
        return;
      case MessageType::kHeartbeat:
        HandleHeartbeat(connection_id);
        return;
      case MessageType::kCommandResult:
        HandleCommandResult(connection_id, message);
        return;
      default:
        logger_.Warn(std::string("Unsupported message type from connection (") +
                     connection_id + "): " + ToString(message.type));
        SendError(connection_id, ErrorCode::kInvalidMessage,
                  std::string("Unsupported message type: ") + ToString(message.type));
        return;
    }
  }

  void HandleRegister(const std::string& connection_id, const ProtocolMessage& message) {
    RegisterPayload payload;
    if (!ParseRegister(message, &payload)) {
      logger_.Warn("Invalid register message from connection (" + connection_id + ")");
      SendError(connection_id, ErrorCode::kInvalidMessage, "Invalid device info");
      return;
    }
    if (message.sender.type != DeviceType::kTarget ||
        payload.device_info.type != DeviceType::kTarget) {
      logger_.Warn("Non-target register from connection (" + connection_id + ")");
      SendError(connection_id, ErrorCode::kInvalidMessage,
                "Only target devices can register");
      return;
    }
    DeviceInfo info = std::move(payload.device_info);
    if (info.ip.empty()) {
      info.ip = connections_.at(connection_id).remote_address;
    }

    const RegisteredDevice device = registry_.RegisterDevice(info);
    const std::string& device_id = device.info.id;

    // One live session per device: drop any other session bound to it.
    std::vector<std::string> superseded;
    for (const auto& entry : connections_) {
      if (entry.first == connection_id) {
        continue;
      }
      if (entry.second.device_id == device_id || device.connection_id == entry.first) {
        superseded.push_back(entry.first);
      }
    }
    for (const auto& id : superseded) {
      auto old = connections_.find(id);
      old->second.device_id.reset();
      TerminateConnection(id, "superseded by a new registration");
    }

    auto& connection = connections_.at(connection_id);
    if (connection.device_id.has_value() && connection.device_id.value() != device_id) {
      const std::string previous = connection.device_id.value();
      connection.device_id.reset();
      ReleaseDevice(previous, connection_id);
    }
    connection.device_id = device_id;
    const auto connected = registry_.ConnectDevice(device_id, connection_id);
    const RegisteredDevice& current = connected.has_value() ? connected.value() : device;

    RegisteredPayload reply;
    reply.device_id = device_id;
    reply.pairing_required = !current.paired;
    reply.pairing_token = current.pairing_token;
    Send(connection_id, BuildRegistered(sender_, reply));
    logger_.Info("Device registered on connection (" + connection_id + "): " +
                 current.info.name + " (" + device_id + ")");
  }

  void HandlePairingRequest(const std::string& connection_id,
                            const ProtocolMessage& message) {
    const auto& connection = connections_.at(connection_id);
    if (!connection.device_id.has_value()) {
      logger_.Warn("Pairing request from unregistered connection (" + connection_id + ")");
      SendError(connection_id, ErrorCode::kInvalidMessage, "Device not registered");
      return;
    }
    PairingRequestPayload payload;
    if (!ParsePairingRequest(message, &payload)) {
      logger_.Warn("Invalid pairing request from connection (" + connection_id + ")");
      SendError(connection_id, ErrorCode::kInvalidMessage, "Missing pairing token");
      return;
    }
    const std::string device_id = connection.device_id.value();
    const RegistryResult result = registry_.PairDevice(device_id, payload.pairing_token);
    PairingResponsePayload reply;
    reply.accepted = result.success;
    if (result.success) {
      reply.auth_token = result.device->auth_token;
      logger_.Info("Device paired: " + result.device->info.name + " (" + device_id + ")");
    } else {
      reply.error = result.error;
    }
    Send(connection_id, BuildPairingResponse(sender_, reply));
  }

  void HandleHeartbeat(const std::string& connection_id) {
    auto& connection = connections_.at(connection_id);
    connection.is_alive = true;
    connection.last_activity = std::chrono::steady_clock::now();
    if (connection.device_id.has_value()) {
      registry_.TouchDevice(connection.device_id.value());
    }
    Send(connection_id, BuildHeartbeatAck(sender_));
  }

  void HandleCommandResult(const std::string& connection_id,
                           const ProtocolMessage& message) {
    const auto& connection = connections_.at(connection_id);
    if (!connection.device_id.has_value()) {
      logger_.Warn("Command result from unregistered connection (" + connection_id + ")");
      return;
    }
    CommandResultPayload payload;
    std::string error;
    if (!ParseCommandResult(message, &payload, &error)) {
      logger_.Warn("Invalid command result from connection (" + connection_id +
                   "): " + error);
      return;
    }
    const auto device = registry_.GetDeviceById(connection.device_id.value());
    if (!device.has_value()) {
      logger_.Warn("Command result from unknown device (" +
                   connection.device_id.value() + ")");
      return;
    }
    logger_.Info("Command result from " + device->info.name + ": " +
                 payload.command_type + (payload.success ? " succeeded" : " failed") +
                 (payload.error.has_value() ? " (" + payload.error.value() + ")" : ""));

    CommandResultEvent event;
    event.device_id = device->info.id;
    event.device_name = device->info.name;
    event.command_type = payload.command_type;
    event.success = payload.success;
    event.error = payload.error;
    CommandResultCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = command_result_cb_;
    }
    if (cb_copy) {
      try {
        cb_copy(event);
      } catch (const std::exception&) {
        logger_.CallbackException("CommandResultCallback");
      }
    }
  }

  static CommandOutcome Reject(CommandError code) {
    CommandOutcome outcome;
    outcome.error_code = code;
    outcome.error = ToString(code);
    return outcome;
  }

  CommandOutcome SendArrowCommand(const std::string& device_id,
                                  ArrowDirection direction,
                                  const ArrowCommandParameters& parameters) {
    const std::string command_type = CommandTypeFor(direction);
    CommandOutcome outcome = CheckCommand(device_id, command_type, parameters);
    if (outcome.error_code != CommandError::kNone) {
      logger_.Warn("Cannot send " + command_type + " to " + device_id + ": " +
                   outcome.error);
      return outcome;
    }
    CommandPayload payload;
    payload.command_type = command_type;
    payload.parameters = ArrowParametersToJson(parameters);
    const std::string connection_id = FindConnectionFor(device_id).value();
    if (!Send(connection_id, BuildCommand(sender_, payload))) {
      outcome = Reject(CommandError::kSendFailed);
      logger_.Warn("Cannot send " + command_type + " to " + device_id + ": " +
                   outcome.error);
      return outcome;
    }
    logger_.Info("Sent " + command_type + " to " + device_id + " (repeat " +
                 std::to_string(parameters.repeat) + ", hold " +
                 std::to_string(parameters.hold_time_ms) + " ms)");
    outcome.success = true;
    return outcome;
  }

  CommandOutcome CheckCommand(const std::string& device_id,
                              const std::string& command_type,
                              const ArrowCommandParameters& parameters) const {
    if (!ValidateArrowParameters(parameters)) {
      return Reject(CommandError::kInvalidParameters);
    }
    const auto device = registry_.GetDeviceById(device_id);
    if (!device.has_value()) {
      return Reject(CommandError::kDeviceNotFound);
    }
    if (device->status != ConnectionStatus::kConnected &&
        device->status != ConnectionStatus::kPaired) {
      return Reject(CommandError::kDeviceNotConnected);
    }
    if (!device->paired) {
      return Reject(CommandError::kDeviceNotPaired);
    }
    if (!device->info.Supports(command_type)) {
      return Reject(CommandError::kCommandNotSupported);
    }
    if (!FindConnectionFor(device_id).has_value()) {
      return Reject(CommandError::kNoActiveConnection);
    }
    return CommandOutcome();
  }

  std::optional<std::string> FindConnectionFor(const std::string& device_id) const {
    for (const auto& entry : connections_) {
      if (entry.second.device_id == device_id) {
        return entry.first;
      }
    }
    return std::nullopt;
  }

  void RunLivenessSweep() {
    std::vector<std::string> dead;
    for (const auto& entry : connections_) {
      if (!entry.second.is_alive) {
        dead.push_back(entry.first);
      }
    }
    for (const auto& id : dead) {
      TerminateConnection(id, "missed liveness ping");
    }
    for (auto& entry : connections_) {
      entry.second.is_alive = false;
      if (!entry.second.session->Ping()) {
        logger_.Debug("Ping failed for connection (" + entry.first + ")");
      }
    }
  }

  bool Send(const std::string& connection_id, const ProtocolMessage& message) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return false;
    }
    if (!it->second.session->Send(EncodeMessage(message))) {
      logger_.Warn(std::string("Failed to send ") + ToString(message.type) +
                   " to connection (" + connection_id + ")");
      return false;
    }
    return true;
  }

  void SendError(const std::string& connection_id, ErrorCode code,
                 const std::string& text) {
    ErrorPayload payload;
    payload.code = code;
    payload.message = text;
    Send(connection_id, BuildError(sender_, payload));
  }

  void EmitConnection(const ConnectionEvent& event) {
    ConnectionCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = connection_cb_;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(event);
    } catch (const std::exception&) {
      logger_.CallbackException("ConnectionCallback");
    }
  }

  ServerConfig config_;
  DeviceRegistry& registry_;
  TaskScheduler& scheduler_;
  Logger logger_;
  Sender sender_;

  bool running_ = false;
  TaskId sweep_task_ = kInvalidTaskId;
  uint64_t next_connection_ = 0;
  std::map<std::string, Connection> connections_;
  std::string start_error_;

  std::mutex callback_mutex_;
  CommandResultCallback command_result_cb_;
  ConnectionCallback connection_cb_;
};

ControlServer::ControlServer(ServerConfig config, DeviceRegistry& registry,
                             TaskScheduler& scheduler)
    : impl_(new Impl(std::move(config), registry, scheduler)) {}

ControlServer::~ControlServer() = default;

bool ControlServer::Start() { return impl_->Start(); }
void ControlServer::Shutdown() { impl_->Shutdown(); }

void ControlServer::SetCommandResultCallback(CommandResultCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->command_result_cb_ = std::move(cb);
}

void ControlServer::SetConnectionCallback(ConnectionCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->connection_cb_ = std::move(cb);
}

std::string ControlServer::OnSessionOpened(std::shared_ptr<SessionTransport> session) {
  return impl_->OnSessionOpened(std::move(session));
}

void ControlServer::OnSessionMessage(const std::string& connection_id,
                                     const std::string& text) {
  impl_->OnSessionMessage(connection_id, text);
}

void ControlServer::OnSessionPong(const std::string& connection_id) {
  impl_->OnSessionPong(connection_id);
}

void ControlServer::OnSessionClosed(const std::string& connection_id) {
  impl_->OnSessionClosed(connection_id);
}

CommandOutcome ControlServer::SendArrowCommand(const std::string& device_id,
                                               ArrowDirection direction,
                                               const ArrowCommandParameters& parameters) {
  return impl_->SendArrowCommand(device_id, direction, parameters);
}

void ControlServer::RunLivenessSweep() { impl_->RunLivenessSweep(); }

size_t ControlServer::ConnectionCount() const { return impl_->connections_.size(); }

std::optional<std::string> ControlServer::GetBoundDevice(
    const std::string& connection_id) const {
  auto it = impl_->connections_.find(connection_id);
  if (it == impl_->connections_.end()) {
    return std::nullopt;
  }
  return it->second.device_id;
}

const ServerConfig& ControlServer::config() const { return impl_->config_; }

std::string ControlServer::GetLastError() const { return impl_->start_error_; }

}  // namespace arrowctl
