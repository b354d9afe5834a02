#include "arrowctl/protocol.h"
#include "arrowctl/utils.h"

#include <limits>

namespace arrowctl {
namespace {

using nlohmann::json;

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool IsNonEmptyString(const json& object, const char* key) {
  auto it = object.find(key);
  return it != object.end() && it->is_string() &&
         !it->get_ref<const std::string&>().empty();
}

// Optional string fields tolerate absence and explicit null.
std::optional<std::string> OptionalString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string StringOr(const json& object, const char* key,
                     const std::string& fallback) {
  return OptionalString(object, key).value_or(fallback);
}

// Integers only; unsigned values above INT64_MAX are rejected.
bool ReadInt64(const json& value, int64_t* out) {
  if (value.is_number_unsigned()) {
    const uint64_t raw = value.get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return false;
    }
    *out = static_cast<int64_t>(raw);
    return true;
  }
  if (!value.is_number_integer()) {
    return false;
  }
  *out = value.get<int64_t>();
  return true;
}

// Fractional timestamps are truncated; values outside int64 range are rejected.
bool ReadTimestamp(const json& value, int64_t* out) {
  if (!value.is_number_float()) {
    return ReadInt64(value, out);
  }
  constexpr double kLimit = 9223372036854775808.0;  // 2^63
  const double raw = value.get<double>();
  if (!(raw >= -kLimit && raw < kLimit)) {
    return false;
  }
  *out = static_cast<int64_t>(raw);
  return true;
}

bool ReadPort(const json& object, const char* key, uint16_t* out) {
  auto it = object.find(key);
  int64_t value = 0;
  if (it == object.end() || !ReadInt64(*it, &value)) {
    return false;
  }
  if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
    return false;
  }
  *out = static_cast<uint16_t>(value);
  return true;
}

// Reads an integer parameter; absent keeps the default already in `out`.
bool ReadIntParameter(const json& parameters, const char* key, int* out) {
  auto it = parameters.find(key);
  if (it == parameters.end() || it->is_null()) {
    return true;
  }
  int64_t value = 0;
  if (!ReadInt64(*it, &value)) {
    return false;
  }
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

bool ExpectType(const ProtocolMessage& message, MessageType type,
                std::string* error) {
  if (message.type != type) {
    return Fail(error, std::string("Expected ") + ToString(type) + " message");
  }
  return true;
}

}  // namespace

const char* ToString(DeviceType type) {
  switch (type) {
    case DeviceType::kController:
      return "controller";
    case DeviceType::kTarget:
      return "target";
  }
  return "target";
}

const char* ToString(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kDisconnected:
      return "disconnected";
    case ConnectionStatus::kConnecting:
      return "connecting";
    case ConnectionStatus::kConnected:
      return "connected";
    case ConnectionStatus::kPaired:
      return "paired";
    case ConnectionStatus::kError:
      return "error";
  }
  return "error";
}

const char* ToString(MessageType type) {
  switch (type) {
    case MessageType::kAnnounce:
      return "announce";
    case MessageType::kRegister:
      return "register";
    case MessageType::kRegistered:
      return "registered";
    case MessageType::kPairingRequest:
      return "pairing_request";
    case MessageType::kPairingResponse:
      return "pairing_response";
    case MessageType::kCommand:
      return "command";
    case MessageType::kCommandResult:
      return "command_result";
    case MessageType::kHeartbeat:
      return "heartbeat";
    case MessageType::kHeartbeatAck:
      return "heartbeat_ack";
    case MessageType::kError:
      return "error";
  }
  return "error";
}

std::optional<DeviceType> ParseDeviceType(const std::string& value) {
  if (value == "controller") {
    return DeviceType::kController;
  }
  if (value == "target") {
    return DeviceType::kTarget;
  }
  return std::nullopt;
}

std::optional<MessageType> ParseMessageType(const std::string& value) {
  static const MessageType kAll[] = {
      MessageType::kAnnounce,        MessageType::kRegister,
      MessageType::kRegistered,      MessageType::kPairingRequest,
      MessageType::kPairingResponse, MessageType::kCommand,
      MessageType::kCommandResult,   MessageType::kHeartbeat,
      MessageType::kHeartbeatAck,    MessageType::kError,
  };
  for (const auto type : kAll) {
    if (value == ToString(type)) {
      return type;
    }
  }
  return std::nullopt;
}

const char* CommandTypeFor(ArrowDirection direction) {
  return direction == ArrowDirection::kLeft ? kCommandArrowLeft
                                            : kCommandArrowRight;
}

const char* KeyNameFor(ArrowDirection direction) {
  return direction == ArrowDirection::kLeft ? "left" : "right";
}

std::optional<ArrowDirection> DirectionForCommand(const std::string& command_type) {
  if (command_type == kCommandArrowLeft) {
    return ArrowDirection::kLeft;
  }
  if (command_type == kCommandArrowRight) {
    return ArrowDirection::kRight;
  }
  return std::nullopt;
}

bool DeviceInfo::Supports(const std::string& command_type) const {
  return supported_commands.count(command_type) != 0;
}

ProtocolMessage MakeMessage(MessageType type, const Sender& sender, json data) {
  ProtocolMessage message;
  message.type = type;
  message.version = kProtocolVersion;
  message.timestamp = NowMillis();
  message.sender = sender;
  message.data = std::move(data);
  return message;
}

std::string EncodeMessage(const ProtocolMessage& message) {
  json value = {
      {"type", ToString(message.type)},
      {"version", message.version},
      {"timestamp", message.timestamp},
      {"sender", {{"id", message.sender.id}, {"type", ToString(message.sender.type)}}},
      {"data", message.data.is_null() ? json::object() : message.data},
  };
  return value.dump();
}

bool DecodeMessage(const std::string& text, ProtocolMessage* out,
                   std::string* error) {
  if (!out) {
    return Fail(error, "No output message");
  }
  json value = json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    return Fail(error, "Invalid JSON");
  }
  if (!value.is_object()) {
    return Fail(error, "Message must be an object");
  }
  if (!IsNonEmptyString(value, "type")) {
    return Fail(error, "Message missing required field: type");
  }
  if (!IsNonEmptyString(value, "version")) {
    return Fail(error, "Message missing required field: version");
  }
  auto timestamp = value.find("timestamp");
  int64_t timestamp_ms = 0;
  if (timestamp == value.end() || !ReadTimestamp(*timestamp, &timestamp_ms)) {
    return Fail(error, "Message missing required field: timestamp");
  }
  auto sender = value.find("sender");
  if (sender == value.end() || !sender->is_object()) {
    return Fail(error, "Message missing required field: sender");
  }
  if (!IsNonEmptyString(*sender, "id")) {
    return Fail(error, "Sender missing required field: id");
  }
  if (!IsNonEmptyString(*sender, "type")) {
    return Fail(error, "Sender missing required field: type");
  }
  const auto sender_type = ParseDeviceType((*sender)["type"].get<std::string>());
  if (!sender_type.has_value()) {
    return Fail(error, "Invalid sender type");
  }
  const std::string type_name = value["type"].get<std::string>();
  const auto type = ParseMessageType(type_name);
  if (!type.has_value()) {
    return Fail(error, "Unsupported message type: " + type_name);
  }
  auto data = value.find("data");
  if (data != value.end() && !data->is_null() && !data->is_object()) {
    return Fail(error, "Message data must be an object");
  }

  out->type = type.value();
  out->version = value["version"].get<std::string>();
  out->timestamp = timestamp_ms;
  out->sender.id = (*sender)["id"].get<std::string>();
  out->sender.type = sender_type.value();
  out->data = (data == value.end() || data->is_null()) ? json::object() : *data;
  return true;
}

json DeviceInfoToJson(const DeviceInfo& info) {
  json value = {
      {"id", info.id},
      {"name", info.name},
      {"ip", info.ip},
      {"type", ToString(info.type)},
      {"supportedCommands", json::array()},
  };
  if (info.mac.has_value()) {
    value["mac"] = info.mac.value();
  }
  for (const auto& command : info.supported_commands) {
    value["supportedCommands"].push_back(command);
  }
  return value;
}

bool DeviceInfoFromJson(const json& value, DeviceInfo* out, std::string* error) {
  if (!out || !value.is_object()) {
    return Fail(error, "Invalid device info");
  }
  if (!IsNonEmptyString(value, "id") || !IsNonEmptyString(value, "type")) {
    return Fail(error, "Invalid device info");
  }
  const auto type = ParseDeviceType(value["type"].get<std::string>());
  if (!type.has_value()) {
    return Fail(error, "Invalid device type");
  }
  DeviceInfo info;
  info.id = value["id"].get<std::string>();
  info.type = type.value();
  info.name = StringOr(value, "name", info.id);
  info.ip = StringOr(value, "ip", "");
  info.mac = OptionalString(value, "mac");
  if (info.mac.has_value() && info.mac->empty()) {
    info.mac.reset();
  }
  auto commands = value.find("supportedCommands");
  if (commands != value.end() && commands->is_array()) {
    for (const auto& command : *commands) {
      if (command.is_string()) {
        info.supported_commands.insert(command.get<std::string>());
      }
    }
  }
  *out = std::move(info);
  return true;
}

bool ParseArrowParameters(const json& parameters, ArrowCommandParameters* out,
                          std::string* error) {
  if (!out) {
    return Fail(error, "No output parameters");
  }
  ArrowCommandParameters result;
  if (!parameters.is_null()) {
    if (!parameters.is_object()) {
      return Fail(error, "Command parameters must be an object");
    }
    if (!ReadIntParameter(parameters, "repeat", &result.repeat)) {
      return Fail(error, "repeat must be a positive integer");
    }
    if (!ReadIntParameter(parameters, "holdTime", &result.hold_time_ms)) {
      return Fail(error, "holdTime must be a non-negative integer");
    }
  }
  if (!ValidateArrowParameters(result, error)) {
    return false;
  }
  *out = result;
  return true;
}

bool ValidateArrowParameters(const ArrowCommandParameters& parameters,
                             std::string* error) {
  if (parameters.repeat < 1) {
    return Fail(error, "repeat must be a positive integer");
  }
  if (parameters.hold_time_ms < 0) {
    return Fail(error, "holdTime must be a non-negative integer");
  }
  return true;
}

json ArrowParametersToJson(const ArrowCommandParameters& parameters) {
  return {{"repeat", parameters.repeat}, {"holdTime", parameters.hold_time_ms}};
}

ProtocolMessage BuildAnnounce(const Sender& sender, const AnnouncePayload& payload) {
  return MakeMessage(MessageType::kAnnounce, sender,
                     {{"controllerInfo", DeviceInfoToJson(payload.controller_info)},
                      {"discoveryPort", payload.discovery_port},
                      {"controlPort", payload.control_port}});
}

ProtocolMessage BuildRegister(const Sender& sender, const RegisterPayload& payload) {
  return MakeMessage(MessageType::kRegister, sender,
                     {{"deviceInfo", DeviceInfoToJson(payload.device_info)}});
}

ProtocolMessage BuildRegistered(const Sender& sender,
                                const RegisteredPayload& payload) {
  json data = {{"deviceId", payload.device_id},
               {"pairingRequired", payload.pairing_required}};
  if (payload.pairing_token.has_value()) {
    data["pairingToken"] = payload.pairing_token.value();
  }
  return MakeMessage(MessageType::kRegistered, sender, std::move(data));
}

ProtocolMessage BuildPairingRequest(const Sender& sender,
                                    const PairingRequestPayload& payload) {
  return MakeMessage(MessageType::kPairingRequest, sender,
                     {{"pairingToken", payload.pairing_token}});
}

ProtocolMessage BuildPairingResponse(const Sender& sender,
                                     const PairingResponsePayload& payload) {
  json data = {{"accepted", payload.accepted}};
  if (payload.auth_token.has_value()) {
    data["authToken"] = payload.auth_token.value();
  }
  if (payload.error.has_value()) {
    data["error"] = payload.error.value();
  }
  return MakeMessage(MessageType::kPairingResponse, sender, std::move(data));
}

ProtocolMessage BuildCommand(const Sender& sender, const CommandPayload& payload) {
  return MakeMessage(MessageType::kCommand, sender,
                     {{"commandType", payload.command_type},
                      {"parameters", payload.parameters}});
}

ProtocolMessage BuildCommandResult(const Sender& sender,
                                   const CommandResultPayload& payload) {
  json data = {{"commandType", payload.command_type},
               {"success", payload.success}};
  if (payload.error.has_value()) {
    data["error"] = payload.error.value();
  }
  return MakeMessage(MessageType::kCommandResult, sender, std::move(data));
}

ProtocolMessage BuildHeartbeat(const Sender& sender) {
  return MakeMessage(MessageType::kHeartbeat, sender);
}

ProtocolMessage BuildHeartbeatAck(const Sender& sender) {
  return MakeMessage(MessageType::kHeartbeatAck, sender);
}

ProtocolMessage BuildError(const Sender& sender, const ErrorPayload& payload) {
  return MakeMessage(MessageType::kError, sender,
                     {{"code", static_cast<int>(payload.code)},
                      {"message", payload.message}});
}

bool ParseAnnounce(const ProtocolMessage& message, AnnouncePayload* out,
                   std::string* error) {
  if (!out || !ExpectType(message, MessageType::kAnnounce, error)) {
    return false;
  }
  AnnouncePayload payload;
  auto info = message.data.find("controllerInfo");
  if (info == message.data.end() ||
      !DeviceInfoFromJson(*info, &payload.controller_info, error)) {
    return Fail(error, "Invalid controller info");
  }
  if (!ReadPort(message.data, "controlPort", &payload.control_port)) {
    return Fail(error, "Invalid control port");
  }
  if (!ReadPort(message.data, "discoveryPort", &payload.discovery_port)) {
    return Fail(error, "Invalid discovery port");
  }
  *out = std::move(payload);
  return true;
}

bool ParseRegister(const ProtocolMessage& message, RegisterPayload* out,
                   std::string* error) {
  if (!out || !ExpectType(message, MessageType::kRegister, error)) {
    return false;
  }
  auto info = message.data.find("deviceInfo");
  if (info == message.data.end()) {
    return Fail(error, "Invalid device info");
  }
  return DeviceInfoFromJson(*info, &out->device_info, error);
}

bool ParseRegistered(const ProtocolMessage& message, RegisteredPayload* out,
                     std::string* error) {
  if (!out || !ExpectType(message, MessageType::kRegistered, error)) {
    return false;
  }
  if (!IsNonEmptyString(message.data, "deviceId")) {
    return Fail(error, "Missing device id");
  }
  auto required = message.data.find("pairingRequired");
  if (required == message.data.end() || !required->is_boolean()) {
    return Fail(error, "Missing pairingRequired flag");
  }
  out->device_id = message.data["deviceId"].get<std::string>();
  out->pairing_required = required->get<bool>();
  out->pairing_token = OptionalString(message.data, "pairingToken");
  return true;
}

bool ParsePairingRequest(const ProtocolMessage& message,
                         PairingRequestPayload* out, std::string* error) {
  if (!out || !ExpectType(message, MessageType::kPairingRequest, error)) {
    return false;
  }
  if (!IsNonEmptyString(message.data, "pairingToken")) {
    return Fail(error, "Missing pairing token");
  }
  out->pairing_token = message.data["pairingToken"].get<std::string>();
  return true;
}

bool ParsePairingResponse(const ProtocolMessage& message,
                          PairingResponsePayload* out, std::string* error) {
  if (!out || !ExpectType(message, MessageType::kPairingResponse, error)) {
    return false;
  }
  auto accepted = message.data.find("accepted");
  if (accepted == message.data.end() || !accepted->is_boolean()) {
    return Fail(error, "Missing accepted flag");
  }
  out->accepted = accepted->get<bool>();
  out->auth_token = OptionalString(message.data, "authToken");
  out->error = OptionalString(message.data, "error");
  return true;
}

bool ParseCommand(const ProtocolMessage& message, CommandPayload* out,
                  std::string* error) {
  if (!out || !ExpectType(message, MessageType::kCommand, error)) {
    return false;
  }
  if (!IsNonEmptyString(message.data, "commandType")) {
    return Fail(error, "Missing command type");
  }
  out->command_type = message.data["commandType"].get<std::string>();
  auto parameters = message.data.find("parameters");
  out->parameters = (parameters == message.data.end() || parameters->is_null())
                        ? json::object()
                        : *parameters;
  return true;
}

bool ParseCommandResult(const ProtocolMessage& message,
                        CommandResultPayload* out, std::string* error) {
  if (!out || !ExpectType(message, MessageType::kCommandResult, error)) {
    return false;
  }
  if (!IsNonEmptyString(message.data, "commandType")) {
    return Fail(error, "Missing command type");
  }
  auto success = message.data.find("success");
  if (success == message.data.end() || !success->is_boolean()) {
    return Fail(error, "Missing success flag");
  }
  out->command_type = message.data["commandType"].get<std::string>();
  out->success = success->get<bool>();
  out->error = OptionalString(message.data, "error");
  return true;
}

bool ParseError(const ProtocolMessage& message, ErrorPayload* out,
                std::string* error) {
  if (!out || !ExpectType(message, MessageType::kError, error)) {
    return false;
  }
  auto code = message.data.find("code");
  int64_t code_value = 0;
  if (code == message.data.end() || !ReadInt64(*code, &code_value)) {
    return Fail(error, "Missing error code");
  }
  if (code_value < std::numeric_limits<int>::min() ||
      code_value > std::numeric_limits<int>::max()) {
    return Fail(error, "Invalid error code");
  }
  out->code = static_cast<ErrorCode>(code_value);
  out->message = StringOr(message.data, "message", "");
  return true;
}

}  // namespace arrowctl
