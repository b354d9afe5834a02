#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace arrowctl {

/// Carried by every message.
constexpr char kProtocolVersion[] = "1.0.0";

/**
 * Well-known ports.
 */
constexpr uint16_t kDefaultControlPort = 8080;
constexpr uint16_t kDefaultControllerDiscoveryPort = 3000;
constexpr uint16_t kDefaultTargetDiscoveryPort = 8081;

/**
 * Command identifiers advertised in DeviceInfo::supported_commands.
 */
constexpr char kCommandArrowLeft[] = "arrow_left";
constexpr char kCommandArrowRight[] = "arrow_right";

enum class DeviceType {
  kController,
  kTarget,
};

/**
 * Connection/pairing state of a device as seen by either role.
 */
enum class ConnectionStatus {
  kDisconnected,
  kConnecting,
  kConnected,
  kPaired,
  kError,
};

enum class MessageType {
  kAnnounce,
  kRegister,
  kRegistered,
  kPairingRequest,
  kPairingResponse,
  kCommand,
  kCommandResult,
  kHeartbeat,
  kHeartbeatAck,
  kError,
};

/**
 * Numeric codes carried by error messages.
 */
enum class ErrorCode : int {
  kInvalidMessage = 100,
  kAuthenticationFailed = 101,
  kInvalidCommand = 102,
  kInternalError = 103,
  kNotPaired = 104,
};

enum class ArrowDirection {
  kLeft,
  kRight,
};

const char* ToString(DeviceType type);
const char* ToString(ConnectionStatus status);
const char* ToString(MessageType type);
std::optional<DeviceType> ParseDeviceType(const std::string& value);
std::optional<MessageType> ParseMessageType(const std::string& value);

/// Command identifier for a direction ("arrow_left" / "arrow_right").
const char* CommandTypeFor(ArrowDirection direction);
/// Key name handed to the key-press executor ("left" / "right").
const char* KeyNameFor(ArrowDirection direction);
/// Direction for an arrow command identifier, if it is one.
std::optional<ArrowDirection> DirectionForCommand(const std::string& command_type);

/**
 * Identity a peer announces about itself.
 */
struct DeviceInfo {
  /// Stable peer-generated identifier.
  std::string id;
  /// Human readable name.
  std::string name;
  /// IPv4 address the peer reports for itself.
  std::string ip;
  /// Hardware address, when the peer knows it.
  std::optional<std::string> mac;
  DeviceType type = DeviceType::kTarget;
  /// Command identifiers this peer can execute.
  std::set<std::string> supported_commands;

  bool Supports(const std::string& command_type) const;
};

/**
 * Parameters of an arrow command.
 */
struct ArrowCommandParameters {
  /// Number of discrete key taps (>= 1).
  int repeat = 1;
  /// Hold duration per tap in ms; 0 is an instantaneous tap.
  int hold_time_ms = 0;
};

struct Sender {
  std::string id;
  DeviceType type = DeviceType::kController;
};

/**
 * Envelope shared by every message. `data` holds the type-specific payload.
 */
struct ProtocolMessage {
  MessageType type = MessageType::kHeartbeat;
  std::string version = kProtocolVersion;
  /// Milliseconds since the Unix epoch at the sender.
  int64_t timestamp = 0;
  Sender sender;
  nlohmann::json data = nlohmann::json::object();
};

struct AnnouncePayload {
  DeviceInfo controller_info;
  uint16_t discovery_port = kDefaultControllerDiscoveryPort;
  uint16_t control_port = kDefaultControlPort;
};

/**
 * Where a target can reach a controller, whether configured up front or
 * learned from an announce.
 */
struct ControllerEndpoint {
  std::string controller_id;
  std::string name;
  /// Address to connect to (the announce's source address when discovered).
  std::string ip;
  uint16_t control_port = kDefaultControlPort;
  uint16_t discovery_port = kDefaultControllerDiscoveryPort;
};

struct RegisterPayload {
  DeviceInfo device_info;
};

struct RegisteredPayload {
  std::string device_id;
  bool pairing_required = true;
  std::optional<std::string> pairing_token;
};

struct PairingRequestPayload {
  std::string pairing_token;
};

struct PairingResponsePayload {
  bool accepted = false;
  std::optional<std::string> auth_token;
  std::optional<std::string> error;
};

struct CommandPayload {
  std::string command_type;
  /// Raw parameters object; validated by the executing side.
  nlohmann::json parameters = nlohmann::json::object();
};

struct CommandResultPayload {
  std::string command_type;
  bool success = false;
  std::optional<std::string> error;
};

struct ErrorPayload {
  ErrorCode code = ErrorCode::kInternalError;
  std::string message;
};

/// Build an envelope stamped with the current time.
ProtocolMessage MakeMessage(MessageType type, const Sender& sender,
                            nlohmann::json data = nlohmann::json::object());

/// Serialize a message as one JSON object.
std::string EncodeMessage(const ProtocolMessage& message);

/**
 * Parse and validate one JSON frame.
 *
 * Checks, in order: valid JSON object, `type`, `version`, `timestamp`,
 * `sender`, `sender.id`, `sender.type` in {controller, target}, a known
 * message type, and an object `data` when present.
 *
 * @param error Optional output naming the first violated constraint.
 * @return true if `out` holds a valid message.
 */
bool DecodeMessage(const std::string& text, ProtocolMessage* out,
                   std::string* error = nullptr);

nlohmann::json DeviceInfoToJson(const DeviceInfo& info);
bool DeviceInfoFromJson(const nlohmann::json& value, DeviceInfo* out,
                        std::string* error = nullptr);

/**
 * Read `repeat`/`holdTime` from a parameters object, applying defaults for
 * absent fields. Rejects non-integer, non-positive repeat, negative holdTime.
 */
bool ParseArrowParameters(const nlohmann::json& parameters,
                          ArrowCommandParameters* out,
                          std::string* error = nullptr);
bool ValidateArrowParameters(const ArrowCommandParameters& parameters,
                             std::string* error = nullptr);
nlohmann::json ArrowParametersToJson(const ArrowCommandParameters& parameters);

ProtocolMessage BuildAnnounce(const Sender& sender, const AnnouncePayload& payload);
ProtocolMessage BuildRegister(const Sender& sender, const RegisterPayload& payload);
ProtocolMessage BuildRegistered(const Sender& sender, const RegisteredPayload& payload);
ProtocolMessage BuildPairingRequest(const Sender& sender,
                                    const PairingRequestPayload& payload);
ProtocolMessage BuildPairingResponse(const Sender& sender,
                                     const PairingResponsePayload& payload);
ProtocolMessage BuildCommand(const Sender& sender, const CommandPayload& payload);
ProtocolMessage BuildCommandResult(const Sender& sender,
                                   const CommandResultPayload& payload);
ProtocolMessage BuildHeartbeat(const Sender& sender);
ProtocolMessage BuildHeartbeatAck(const Sender& sender);
ProtocolMessage BuildError(const Sender& sender, const ErrorPayload& payload);

bool ParseAnnounce(const ProtocolMessage& message, AnnouncePayload* out,
                   std::string* error = nullptr);
bool ParseRegister(const ProtocolMessage& message, RegisterPayload* out,
                   std::string* error = nullptr);
bool ParseRegistered(const ProtocolMessage& message, RegisteredPayload* out,
                     std::string* error = nullptr);
bool ParsePairingRequest(const ProtocolMessage& message,
                         PairingRequestPayload* out,
                         std::string* error = nullptr);
bool ParsePairingResponse(const ProtocolMessage& message,
                          PairingResponsePayload* out,
                          std::string* error = nullptr);
bool ParseCommand(const ProtocolMessage& message, CommandPayload* out,
                  std::string* error = nullptr);
bool ParseCommandResult(const ProtocolMessage& message,
                        CommandResultPayload* out,
                        std::string* error = nullptr);
bool ParseError(const ProtocolMessage& message, ErrorPayload* out,
                std::string* error = nullptr);

}  // namespace arrowctl
