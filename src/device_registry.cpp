#include "arrowctl/device_registry.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <utility>

namespace arrowctl {

const char* ToString(RegistryError error) {
  switch (error) {
    case RegistryError::kNone:
      return "";
    case RegistryError::kDeviceNotFound:
      return "Device not found";
    case RegistryError::kPairingNotSupported:
      return "Device does not support pairing";
    case RegistryError::kInvalidPairingToken:
      return "Invalid pairing token";
    case RegistryError::kPairingTokenExpired:
      return "Pairing token expired";
  }
  return "";
}

const char* ToString(RegistryEventType type) {
  switch (type) {
    case RegistryEventType::kRegistered:
      return "registered";
    case RegistryEventType::kUpdated:
      return "updated";
    case RegistryEventType::kConnected:
      return "connected";
    case RegistryEventType::kDisconnected:
      return "disconnected";
    case RegistryEventType::kPaired:
      return "paired";
    case RegistryEventType::kUnpaired:
      return "unpaired";
    case RegistryEventType::kRemoved:
      return "removed";
  }
  return "updated";
}

bool RegistryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (pairing_token_ttl.count() <= 0) {
    return fail("pairing_token_ttl must be positive");
  }
  if (token_bytes == 0) {
    return fail("token_bytes must be positive");
  }
  return true;
}

struct DeviceRegistry::Impl {
  explicit Impl(RegistryConfig config)
      : config_(std::move(config)),
        logger_("DeviceRegistry", config_.log_callback) {}

  using TimePoint = std::chrono::steady_clock::time_point;

  TimePoint Now() const {
    return config_.clock ? config_.clock() : std::chrono::steady_clock::now();
  }

  std::string NewToken() const {
    return config_.token_generator ? config_.token_generator()
                                   : GenerateToken(config_.token_bytes);
  }

  static void Touch(RegisteredDevice& record, TimePoint now) {
    record.last_seen = std::max(record.last_seen, now);
  }

  void IssuePairingToken(RegisteredDevice& record, TimePoint now) const {
    std::string token = NewToken();
    record.pairing_token = std::move(token);
    record.pairing_expiration = now + config_.pairing_token_ttl;
  }

  // An unpaired record always holds a live pairing token after registration.
  void EnsurePairingToken(RegisteredDevice& record, TimePoint now) const {
    if (record.paired) {
      return;
    }
    const bool expired = record.pairing_expiration.has_value() &&
                         now > record.pairing_expiration.value();
    if (!record.pairing_token.has_value() || expired) {
      IssuePairingToken(record, now);
    }
  }

  static void MergeInfo(RegisteredDevice& record, const DeviceInfo& info) {
    std::optional<std::string> mac = record.info.mac;
    record.info = info;
    if (!info.mac.has_value()) {
      record.info.mac = std::move(mac);
    }
  }

  std::map<std::string, RegisteredDevice>::iterator FindMigrationCandidate(
      const DeviceInfo& info) {
    if (!info.ip.empty()) {
      auto it = std::find_if(devices_.begin(), devices_.end(),
                             [&](const auto& entry) {
                               return entry.second.info.ip == info.ip;
                             });
      if (it != devices_.end()) {
        return it;
      }
    }
    if (info.mac.has_value() && !info.mac->empty()) {
      return std::find_if(devices_.begin(), devices_.end(),
                          [&](const auto& entry) {
                            return entry.second.info.mac == info.mac;
                          });
    }
    return devices_.end();
  }

  RegisteredDevice RegisterDevice(const DeviceInfo& info) {
    const auto now = Now();
    RegistryEvent event;
    std::string migrated_from;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(info.id);
      if (it != devices_.end()) {
        MergeInfo(it->second, info);
        Touch(it->second, now);
        EnsurePairingToken(it->second, now);
        event = {RegistryEventType::kUpdated, it->second};
      } else {
        auto candidate = FindMigrationCandidate(info);
        if (candidate != devices_.end()) {
          migrated_from = candidate->first;
          RegisteredDevice record = std::move(candidate->second);
          devices_.erase(candidate);
          MergeInfo(record, info);
          Touch(record, now);
          EnsurePairingToken(record, now);
          auto inserted = devices_.emplace(info.id, std::move(record));
          event = {RegistryEventType::kUpdated, inserted.first->second};
        } else {
          RegisteredDevice record;
          record.info = info;
          record.first_seen = now;
          record.last_seen = now;
          if (config_.require_pairing) {
            IssuePairingToken(record, now);
          } else {
            record.auth_token = NewToken();
            record.paired = true;
          }
          auto inserted = devices_.emplace(info.id, std::move(record));
          event = {RegistryEventType::kRegistered, inserted.first->second};
        }
      }
    }
    if (!migrated_from.empty()) {
      logger_.Info("Device " + migrated_from + " re-registered as " + info.id);
    }
    Publish({event});
    return event.device;
  }

  std::optional<RegisteredDevice> ConnectDevice(const std::string& device_id,
                                                const std::string& connection_id) {
    const auto now = Now();
    std::optional<RegisteredDevice> snapshot;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(device_id);
      if (it != devices_.end()) {
        // A connection id is bound to at most one device.
        for (auto& entry : devices_) {
          if (entry.first != device_id && entry.second.connection_id == connection_id) {
            entry.second.connection_id.reset();
          }
        }
        auto& record = it->second;
        record.status =
            record.paired ? ConnectionStatus::kPaired : ConnectionStatus::kConnected;
        record.connection_id = connection_id;
        Touch(record, now);
        snapshot = record;
      }
    }
    if (!snapshot.has_value()) {
      logger_.Warn("Cannot connect unknown device: " + device_id);
      return std::nullopt;
    }
    Publish({{RegistryEventType::kConnected, snapshot.value()}});
    return snapshot;
  }

  std::optional<RegisteredDevice> DisconnectDevice(const std::string& device_id) {
    const auto now = Now();
    std::optional<RegisteredDevice> snapshot;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(device_id);
      if (it != devices_.end()) {
        it->second.status = ConnectionStatus::kDisconnected;
        it->second.connection_id.reset();
        Touch(it->second, now);
        snapshot = it->second;
      }
    }
    if (!snapshot.has_value()) {
      logger_.Warn("Cannot disconnect unknown device: " + device_id);
      return std::nullopt;
    }
    Publish({{RegistryEventType::kDisconnected, snapshot.value()}});
    return snapshot;
  }

  static RegistryResult Failure(RegistryError error) {
    RegistryResult result;
    result.error_code = error;
    result.error = ToString(error);
    return result;
  }

  RegistryResult PairDevice(const std::string& device_id,
                            const std::string& pairing_token) {
    const auto now = Now();
    RegistryResult result;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(device_id);
      if (it == devices_.end()) {
        result = Failure(RegistryError::kDeviceNotFound);
      } else {
        auto& record = it->second;
        if (!record.pairing_token.has_value()) {
          result = Failure(RegistryError::kPairingNotSupported);
        } else if (record.pairing_token.value() != pairing_token) {
          result = Failure(RegistryError::kInvalidPairingToken);
        } else if (record.pairing_expiration.has_value() &&
                   now > record.pairing_expiration.value()) {
          result = Failure(RegistryError::kPairingTokenExpired);
        } else {
          record.auth_token = NewToken();
          record.paired = true;
          record.pairing_token.reset();
          record.pairing_expiration.reset();
          if (record.status == ConnectionStatus::kConnected) {
            record.status = ConnectionStatus::kPaired;
          }
          result.success = true;
          result.device = record;
        }
      }
    }
    if (!result.success) {
      logger_.Warn("Pairing failed for " + device_id + ": " + result.error);
      return result;
    }
    Publish({{RegistryEventType::kPaired, result.device.value()}});
    return result;
  }

  RegistryResult UnpairDevice(const std::string& device_id) {
    const auto now = Now();
    RegistryResult result;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(device_id);
      if (it == devices_.end()) {
        result = Failure(RegistryError::kDeviceNotFound);
      } else {
        auto& record = it->second;
        IssuePairingToken(record, now);
        record.paired = false;
        record.auth_token.reset();
        if (record.status == ConnectionStatus::kPaired) {
          record.status = ConnectionStatus::kConnected;
        }
        result.success = true;
        result.device = record;
      }
    }
    if (!result.success) {
      logger_.Warn("Cannot unpair unknown device: " + device_id);
      return result;
    }
    Publish({{RegistryEventType::kUnpaired, result.device.value()}});
    return result;
  }

  bool TouchDevice(const std::string& device_id) {
    const auto now = Now();
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
      return false;
    }
    Touch(it->second, now);
    return true;
  }

  bool RemoveDevice(const std::string& device_id) {
    RegisteredDevice snapshot;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(device_id);
      if (it == devices_.end()) {
        return false;
      }
      snapshot = std::move(it->second);
      devices_.erase(it);
    }
    Publish({{RegistryEventType::kRemoved, snapshot}});
    return true;
  }

  template <typename Predicate>
  std::optional<RegisteredDevice> FindFirst(Predicate predicate) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for (const auto& entry : devices_) {
      if (predicate(entry.second)) {
        return entry.second;
      }
    }
    return std::nullopt;
  }

  template <typename Predicate>
  std::vector<RegisteredDevice> FindAll(Predicate predicate) const {
    std::vector<RegisteredDevice> out;
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for (const auto& entry : devices_) {
      if (predicate(entry.second)) {
        out.push_back(entry.second);
      }
    }
    return out;
  }

  std::vector<RegisteredDevice> CleanupOldDevices(std::chrono::milliseconds max_age) {
    const auto now = Now();
    std::vector<RegisteredDevice> removed;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.begin();
      while (it != devices_.end()) {
        if (now - it->second.last_seen > max_age) {
          removed.push_back(std::move(it->second));
          it = devices_.erase(it);
        } else {
          ++it;
        }
      }
    }
    if (!removed.empty()) {
      std::vector<RegistryEvent> events;
      events.reserve(removed.size());
      for (const auto& device : removed) {
        events.push_back({RegistryEventType::kRemoved, device});
      }
      Publish(events);
      logger_.Info("Cleaned up " + std::to_string(removed.size()) + " old devices");
    }
    return removed;
  }

  void LogEvent(const RegistryEvent& event) const {
    const auto& info = event.device.info;
    logger_.Info(std::string("Device ") + ToString(event.type) + ": " + info.name +
                 " (" + info.id + ")");
  }

  void Publish(const std::vector<RegistryEvent>& events) {
    EventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = event_cb_;
    }
    for (const auto& event : events) {
      LogEvent(event);
      if (!cb_copy) {
        continue;
      }
      try {
        cb_copy(event);
      } catch (const std::exception& ex) {
        logger_.CallbackException("RegistryEventCallback");
        logger_.Debug(ex.what());
      }
    }
  }

  RegistryConfig config_;
  Logger logger_;

  mutable std::mutex devices_mutex_;
  std::map<std::string, RegisteredDevice> devices_;

  std::mutex callback_mutex_;
  EventCallback event_cb_;
};

DeviceRegistry::DeviceRegistry(RegistryConfig config)
    : impl_(new Impl(std::move(config))) {}

DeviceRegistry::~DeviceRegistry() = default;

void DeviceRegistry::SetEventCallback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->event_cb_ = std::move(cb);
}

RegisteredDevice DeviceRegistry::RegisterDevice(const DeviceInfo& info) {
  return impl_->RegisterDevice(info);
}

std::optional<RegisteredDevice> DeviceRegistry::ConnectDevice(
    const std::string& device_id, const std::string& connection_id) {
  return impl_->ConnectDevice(device_id, connection_id);
}

std::optional<RegisteredDevice> DeviceRegistry::DisconnectDevice(
    const std::string& device_id) {
  return impl_->DisconnectDevice(device_id);
}

RegistryResult DeviceRegistry::PairDevice(const std::string& device_id,
                                          const std::string& pairing_token) {
  return impl_->PairDevice(device_id, pairing_token);
}

RegistryResult DeviceRegistry::UnpairDevice(const std::string& device_id) {
  return impl_->UnpairDevice(device_id);
}

bool DeviceRegistry::TouchDevice(const std::string& device_id) {
  return impl_->TouchDevice(device_id);
}

bool DeviceRegistry::RemoveDevice(const std::string& device_id) {
  return impl_->RemoveDevice(device_id);
}

std::optional<RegisteredDevice> DeviceRegistry::GetDeviceById(
    const std::string& device_id) const {
  return impl_->FindFirst(
      [&](const RegisteredDevice& d) { return d.info.id == device_id; });
}

std::optional<RegisteredDevice> DeviceRegistry::GetDeviceByIp(
    const std::string& ip) const {
  if (ip.empty()) {
    return std::nullopt;
  }
  return impl_->FindFirst([&](const RegisteredDevice& d) { return d.info.ip == ip; });
}

std::optional<RegisteredDevice> DeviceRegistry::GetDeviceByMac(
    const std::string& mac) const {
  if (mac.empty()) {
    return std::nullopt;
  }
  return impl_->FindFirst(
      [&](const RegisteredDevice& d) { return d.info.mac == mac; });
}

std::optional<RegisteredDevice> DeviceRegistry::GetDeviceByConnectionId(
    const std::string& connection_id) const {
  return impl_->FindFirst([&](const RegisteredDevice& d) {
    return d.connection_id == connection_id;
  });
}

std::vector<RegisteredDevice> DeviceRegistry::GetAllDevices() const {
  return impl_->FindAll([](const RegisteredDevice&) { return true; });
}

std::vector<RegisteredDevice> DeviceRegistry::GetConnectedDevices() const {
  return impl_->FindAll([](const RegisteredDevice& d) {
    return d.status == ConnectionStatus::kConnected ||
           d.status == ConnectionStatus::kPaired;
  });
}

std::vector<RegisteredDevice> DeviceRegistry::GetPairedDevices() const {
  return impl_->FindAll([](const RegisteredDevice& d) {
    return d.paired && d.status == ConnectionStatus::kPaired;
  });
}

std::vector<RegisteredDevice> DeviceRegistry::CleanupOldDevices(
    std::chrono::milliseconds max_age) {
  return impl_->CleanupOldDevices(max_age);
}

size_t DeviceRegistry::DeviceCount() const {
  std::lock_guard<std::mutex> lock(impl_->devices_mutex_);
  return impl_->devices_.size();
}

}  // namespace arrowctl
