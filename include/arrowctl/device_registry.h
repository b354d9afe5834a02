#pragma once

#include "arrowctl/logging.h"
#include "arrowctl/protocol.h"
#include "arrowctl/utils.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arrowctl {

/**
 * Controller-side record of a target device.
 *
 * Invariants: `auth_token` is set iff `paired`; `pairing_token` and
 * `pairing_expiration` are set together and only while unpaired.
 */
struct RegisteredDevice {
  DeviceInfo info;
  ConnectionStatus status = ConnectionStatus::kDisconnected;
  std::chrono::steady_clock::time_point first_seen;
  /// Never moves backwards for a given record.
  std::chrono::steady_clock::time_point last_seen;
  /// Live control session bound to this device, if any.
  std::optional<std::string> connection_id;
  bool paired = false;
  /// One-time secret the target echoes back to pair.
  std::optional<std::string> pairing_token;
  std::optional<std::chrono::steady_clock::time_point> pairing_expiration;
  /// Opaque secret issued on successful pairing.
  std::optional<std::string> auth_token;
};

enum class RegistryError {
  kNone,
  kDeviceNotFound,
  kPairingNotSupported,
  kInvalidPairingToken,
  kPairingTokenExpired,
};

/// Operator-facing reason text ("Device not found", ...).
const char* ToString(RegistryError error);

struct RegistryResult {
  bool success = false;
  std::optional<RegisteredDevice> device;
  RegistryError error_code = RegistryError::kNone;
  std::string error;
};

enum class RegistryEventType {
  kRegistered,
  kUpdated,
  kConnected,
  kDisconnected,
  kPaired,
  kUnpaired,
  kRemoved,
};

const char* ToString(RegistryEventType type);

struct RegistryEvent {
  RegistryEventType type = RegistryEventType::kRegistered;
  RegisteredDevice device;
};

struct RegistryConfig {
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using TokenGenerator = std::function<std::string()>;

  /// Lifetime of an issued pairing token.
  std::chrono::milliseconds pairing_token_ttl{std::chrono::minutes(5)};
  /// When false, new devices are paired on first registration.
  bool require_pairing = true;
  /// Random bytes per generated token (hex doubles the length).
  size_t token_bytes = kDefaultTokenBytes;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;
  /// Time source; steady_clock::now when unset.
  Clock clock;
  /// Token source; GenerateToken(token_bytes) when unset.
  TokenGenerator token_generator;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Authoritative map of known devices keyed by device id.
 *
 * Thread-safe. All accessors return copies; the event callback runs outside
 * the registry lock and may call back into the registry.
 */
class DeviceRegistry {
 public:
  using EventCallback = std::function<void(const RegistryEvent&)>;

  explicit DeviceRegistry(RegistryConfig config = RegistryConfig());
  ~DeviceRegistry();

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  /// Set callback invoked on every device lifecycle transition.
  void SetEventCallback(EventCallback cb);

  /**
   * Insert or update a device.
   *
   * An unknown id whose ip (or, failing that, mac) matches an existing record
   * migrates that record to the new id instead of creating a duplicate. An
   * unpaired record without a live pairing token is issued a fresh one.
   */
  RegisteredDevice RegisterDevice(const DeviceInfo& info);

  /// Bind a session; status becomes paired or connected. nullopt if unknown.
  std::optional<RegisteredDevice> ConnectDevice(const std::string& device_id,
                                                const std::string& connection_id);
  /// Clear the session binding; status becomes disconnected, pairing is kept.
  std::optional<RegisteredDevice> DisconnectDevice(const std::string& device_id);

  /// Consume the outstanding pairing token and issue an auth token.
  RegistryResult PairDevice(const std::string& device_id,
                            const std::string& pairing_token);
  /// Revoke the auth token and issue a new pairing token.
  RegistryResult UnpairDevice(const std::string& device_id);

  /// Refresh last_seen. False if the device is unknown.
  bool TouchDevice(const std::string& device_id);
  bool RemoveDevice(const std::string& device_id);

  std::optional<RegisteredDevice> GetDeviceById(const std::string& device_id) const;
  std::optional<RegisteredDevice> GetDeviceByIp(const std::string& ip) const;
  std::optional<RegisteredDevice> GetDeviceByMac(const std::string& mac) const;
  std::optional<RegisteredDevice> GetDeviceByConnectionId(
      const std::string& connection_id) const;

  std::vector<RegisteredDevice> GetAllDevices() const;
  /// Devices whose status is connected or paired.
  std::vector<RegisteredDevice> GetConnectedDevices() const;
  /// Devices that are paired and currently in status paired.
  std::vector<RegisteredDevice> GetPairedDevices() const;

  /// Remove devices unseen for longer than max_age and return them.
  std::vector<RegisteredDevice> CleanupOldDevices(
      std::chrono::milliseconds max_age = std::chrono::hours(24));

  size_t DeviceCount() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace arrowctl
