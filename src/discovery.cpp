#include "arrowctl/discovery.h"
#include "arrowctl/test_hooks.h"
#include "arrowctl/utils.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace arrowctl {
namespace {

constexpr size_t kMaxDatagramSize = 4096;

// Convert a string address and port into a sockaddr_in.
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0" ||
      inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return std::string(buffer);
  }
  return std::string();
}

struct MetricsAtomic {
  std::atomic<uint64_t> datagrams_received{0};
  std::atomic<uint64_t> datagrams_sent{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> callback_exceptions{0};

  DiscoveryMetrics Snapshot() const {
    DiscoveryMetrics snapshot;
    snapshot.datagrams_received = datagrams_received.load();
    snapshot.datagrams_sent = datagrams_sent.load();
    snapshot.parse_errors = parse_errors.load();
    snapshot.send_errors = send_errors.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

/**
 * One broadcast-capable datagram descriptor. A select() thread feeds the
 * handler; Spawn()ed senders sleep through WaitFor() so Stop() wakes them.
 */
class DatagramChannel {
 public:
  using Handler = std::function<void(const std::string& payload,
                                     const std::string& source_ip)>;

  explicit DatagramChannel(const Logger& logger) : logger_(logger) {}
  ~DatagramChannel() { Stop(); }

  DatagramChannel(const DatagramChannel&) = delete;
  DatagramChannel& operator=(const DatagramChannel&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, std::string* error) {
    if (fd_ >= 0) {
      return true;
    }
    auto fail = [&](const std::string& what) {
      *error = what + " failed: " + std::strerror(errno);
      CloseDescriptor();
      return false;
    };
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      return fail("socket()");
    }
    const int on = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
      return fail("SO_REUSEADDR");
    }
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
      return fail("SO_BROADCAST");
    }
    const sockaddr_in local = MakeSockaddr(bind_address, port);
    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
      return fail("bind " + bind_address + ":" + std::to_string(port));
    }
    return true;
  }

  bool StartReceiving(Handler handler) {
    handler_ = std::move(handler);
    running_ = true;
    try {
      recv_thread_ = std::thread([this]() { RecvLoop(); });
    } catch (const std::system_error& ex) {
      logger_.Error(std::string("thread start failed: ") + ex.what());
      running_ = false;
      CloseDescriptor();
      return false;
    }
    return true;
  }

  /// Spawn a helper thread that shares this channel's lifetime.
  bool Spawn(std::function<void()> body) {
    try {
      workers_.emplace_back(std::move(body));
    } catch (const std::system_error& ex) {
      logger_.Error(std::string("thread start failed: ") + ex.what());
      return false;
    }
    return true;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      if (!running_.exchange(false)) {
        CloseDescriptor();
        return;
      }
    }
    stop_cv_.notify_all();
    if (recv_thread_.joinable()) {
      recv_thread_.join();
    }
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    workers_.clear();
    CloseDescriptor();
  }

  bool running() const { return running_; }

  /// Sleep for `period`; false once Stop() has been requested.
  bool WaitFor(std::chrono::milliseconds period) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, period, [this]() { return !running_.load(); });
  }

  bool SendTo(const std::string& payload, const std::string& address, uint16_t port,
              const char* kind) {
    if (fd_ < 0) {
      metrics_.send_errors++;
      logger_.Warn(std::string("Cannot send ") + kind + ": socket not open");
      return false;
    }
    const sockaddr_in dest = MakeSockaddr(address, port);
    const ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent != static_cast<ssize_t>(payload.size())) {
      metrics_.send_errors++;
      std::ostringstream oss;
      oss << "Send " << kind << " to " << address << ":" << port << " failed: "
          << (sent < 0 ? std::strerror(errno) : "short write");
      logger_.Warn(oss.str());
      return false;
    }
    metrics_.datagrams_sent++;
    return true;
  }

  MetricsAtomic& metrics() { return metrics_; }
  const MetricsAtomic& metrics() const { return metrics_; }

 private:
  void CloseDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  void RecvLoop() {
    std::array<char, kMaxDatagramSize> buffer{};
    while (running_) {
      if (fd_ < 0) {
        logger_.Error("RecvLoop: no valid socket, stopping");
        return;
      }
      fd_set readfds;
      FD_ZERO(&readfds);
      FD_SET(fd_, &readfds);
      timeval tv{};
      tv.tv_usec = 200000;
      if (::select(fd_ + 1, &readfds, nullptr, nullptr, &tv) <= 0) {
        continue;
      }
      sockaddr_in from{};
      socklen_t from_len = sizeof(from);
      const ssize_t bytes = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                       reinterpret_cast<sockaddr*>(&from), &from_len);
      if (bytes <= 0) {
        continue;
      }
      metrics_.datagrams_received++;
      handler_(std::string(buffer.data(), static_cast<size_t>(bytes)),
               AddrToString(from));
    }
  }

  const Logger& logger_;
  int fd_ = -1;
  Handler handler_;
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread recv_thread_;
  std::vector<std::thread> workers_;
  MetricsAtomic metrics_;
};

bool ValidateEndpoint(const std::string& bind_address,
                      const std::string& broadcast_address,
                      const std::function<bool(const std::string&)>& fail) {
  if (!bind_address.empty() && bind_address != "0.0.0.0" &&
      !IsValidIpv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (!IsValidIpv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  return true;
}

std::string AnnounceDatagram(const BroadcasterConfig& config) {
  AnnouncePayload payload;
  payload.controller_info = config.controller;
  payload.discovery_port = config.listen_port;
  payload.control_port = config.control_port;
  const Sender sender{config.controller.id, DeviceType::kController};
  return EncodeMessage(BuildAnnounce(sender, payload));
}

std::string RegisterDatagram(const DeviceInfo& device) {
  RegisterPayload payload;
  payload.device_info = device;
  const Sender sender{device.id, DeviceType::kTarget};
  return EncodeMessage(BuildRegister(sender, payload));
}

}  // namespace

bool BroadcasterConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (controller.id.empty()) {
    return fail("controller.id must not be empty");
  }
  if (controller.type != DeviceType::kController) {
    return fail("controller.type must be controller");
  }
  if (!ValidateEndpoint(bind_address, broadcast_address, fail)) {
    return false;
  }
  if (announce_port == 0 || control_port == 0) {
    return fail("announce_port and control_port must be non-zero");
  }
  if (announce_interval.count() <= 0) {
    return fail("announce_interval must be positive");
  }
  if (peer_ttl.count() <= 0 || prune_interval.count() <= 0) {
    return fail("peer timeouts must be positive");
  }
  return true;
}

bool ListenerConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (device.id.empty()) {
    return fail("device.id must not be empty");
  }
  if (device.type != DeviceType::kTarget) {
    return fail("device.type must be target");
  }
  if (!ValidateEndpoint(bind_address, broadcast_address, fail)) {
    return false;
  }
  if (register_port == 0) {
    return fail("register_port must be non-zero");
  }
  if (register_interval.count() < 0) {
    return fail("register_interval must be non-negative");
  }
  return true;
}

struct DiscoveryBroadcaster::Impl {
  explicit Impl(BroadcasterConfig config)
      : config_(std::move(config)),
        logger_("Discovery", config_.log_callback),
        channel_(logger_) {}

  bool Start() {
    if (channel_.running()) {
      return true;
    }
    start_error_.clear();
    std::string error;
    if (!config_.Validate(&error) ||
        !channel_.Open(config_.listen_port, config_.bind_address, &error)) {
      start_error_ = error;
      logger_.Error(error);
      return false;
    }
    if (!channel_.StartReceiving([this](const std::string& payload,
                                        const std::string& source_ip) {
          HandleDatagram(payload, source_ip);
        })) {
      start_error_ = "failed to start discovery receive thread";
      return false;
    }
    bool started = channel_.Spawn([this]() { PruneLoop(); });
    if (config_.send_announces) {
      started = started && channel_.Spawn([this]() { AnnounceLoop(); });
    }
    if (!started) {
      start_error_ = "failed to start discovery threads";
      channel_.Stop();
      return false;
    }
    logger_.Info("Discovery listening on port " + std::to_string(config_.listen_port) +
                 ", announcing to " + config_.broadcast_address + ":" +
                 std::to_string(config_.announce_port));
    return true;
  }

  void Stop() { channel_.Stop(); }

  bool SendAnnounce() {
    return channel_.SendTo(AnnounceDatagram(config_), config_.broadcast_address,
                           config_.announce_port, "announce");
  }

  // Announce once at start, then every announce_interval.
  void AnnounceLoop() {
    do {
      SendAnnounce();
    } while (channel_.WaitFor(config_.announce_interval));
  }

  void PruneLoop() {
    while (channel_.WaitFor(config_.prune_interval)) {
      RunPrune(std::chrono::steady_clock::now());
    }
  }

  void HandleDatagram(const std::string& payload, const std::string& source_ip) {
    ProtocolMessage message;
    std::string error;
    if (!DecodeMessage(payload, &message, &error)) {
      channel_.metrics().parse_errors++;
      logger_.Debug("Invalid datagram from " + source_ip + ": " + error);
      return;
    }
    if (message.type == MessageType::kAnnounce) {
      return;
    }
    RegisterPayload registration;
    if (message.type != MessageType::kRegister ||
        message.sender.type != DeviceType::kTarget ||
        !ParseRegister(message, &registration, &error)) {
      channel_.metrics().parse_errors++;
      logger_.Debug("Ignoring datagram from " + source_ip);
      return;
    }
    UpdatePeer(registration.device_info, source_ip);
  }

  void UpdatePeer(const DeviceInfo& info, const std::string& source_ip) {
    const auto now = std::chrono::steady_clock::now();
    DiscoveredPeer snapshot;
    bool should_notify = false;
    DiscoveryEventType event_type = DiscoveryEventType::kSeen;
    {
      std::lock_guard<std::mutex> lock(peers_mutex_);
      auto it = peers_.find(info.id);
      if (it == peers_.end()) {
        DiscoveredPeer peer;
        peer.info = info;
        peer.source_ip = source_ip;
        if (peer.info.ip.empty()) {
          peer.info.ip = source_ip;
        }
        it = peers_.emplace(info.id, std::move(peer)).first;
        should_notify = true;
      } else {
        auto& peer = it->second;
        const std::string ip = info.ip.empty() ? source_ip : info.ip;
        if (peer.info.name != info.name || peer.info.ip != ip ||
            peer.source_ip != source_ip) {
          peer.info = info;
          peer.info.ip = ip;
          peer.source_ip = source_ip;
          should_notify = true;
          event_type = DiscoveryEventType::kUpdated;
        }
      }
      it->second.last_seen = now;
      snapshot = it->second;
    }
    if (should_notify) {
      logger_.Info(std::string("Discovered target ") +
                   (event_type == DiscoveryEventType::kSeen ? "seen: " : "updated: ") +
                   snapshot.info.name + " (" + snapshot.info.id + ") at " +
                   snapshot.info.ip);
      Notify({{event_type, snapshot}});
    }
  }

  void RunPrune(std::chrono::steady_clock::time_point now) {
    std::vector<DiscoveryEvent> expired;
    {
      std::lock_guard<std::mutex> lock(peers_mutex_);
      auto it = peers_.begin();
      while (it != peers_.end()) {
        if (now - it->second.last_seen > config_.peer_ttl) {
          expired.push_back({DiscoveryEventType::kExpired, it->second});
          it = peers_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto& event : expired) {
      logger_.Info("Discovered target expired: " + event.peer.info.id);
    }
    Notify(expired);
  }

  void Notify(const std::vector<DiscoveryEvent>& events) {
    PeerEventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = peer_event_cb_;
    }
    if (!cb_copy) {
      return;
    }
    for (const auto& event : events) {
      try {
        cb_copy(event);
      } catch (const std::exception&) {
        channel_.metrics().callback_exceptions++;
        logger_.CallbackException("PeerEventCallback");
      }
    }
  }

  BroadcasterConfig config_;
  Logger logger_;
  DatagramChannel channel_;
  std::string start_error_;

  mutable std::mutex peers_mutex_;
  std::map<std::string, DiscoveredPeer> peers_;

  std::mutex callback_mutex_;
  PeerEventCallback peer_event_cb_;
};

DiscoveryBroadcaster::DiscoveryBroadcaster(BroadcasterConfig config)
    : impl_(new Impl(std::move(config))) {}

DiscoveryBroadcaster::~DiscoveryBroadcaster() { impl_->Stop(); }

bool DiscoveryBroadcaster::Start() { return impl_->Start(); }
void DiscoveryBroadcaster::Stop() { impl_->Stop(); }

void DiscoveryBroadcaster::SetPeerEventCallback(PeerEventCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->peer_event_cb_ = std::move(cb);
}

bool DiscoveryBroadcaster::SendAnnounce() { return impl_->SendAnnounce(); }

std::vector<DiscoveredPeer> DiscoveryBroadcaster::GetPeers() const {
  std::vector<DiscoveredPeer> out;
  std::lock_guard<std::mutex> lock(impl_->peers_mutex_);
  for (const auto& entry : impl_->peers_) {
    out.push_back(entry.second);
  }
  return out;
}

DiscoveryMetrics DiscoveryBroadcaster::GetMetrics() const {
  return impl_->channel_.metrics().Snapshot();
}

std::string DiscoveryBroadcaster::GetLastError() const { return impl_->start_error_; }

struct DiscoveryListener::Impl {
  explicit Impl(ListenerConfig config)
      : config_(std::move(config)),
        logger_("Discovery", config_.log_callback),
        channel_(logger_) {}

  bool Start() {
    if (channel_.running()) {
      return true;
    }
    start_error_.clear();
    std::string error;
    if (!config_.Validate(&error) ||
        !channel_.Open(config_.listen_port, config_.bind_address, &error)) {
      start_error_ = error;
      logger_.Error(error);
      return false;
    }
    if (!channel_.StartReceiving([this](const std::string& payload,
                                        const std::string& source_ip) {
          HandleDatagram(payload, source_ip);
        })) {
      start_error_ = "failed to start discovery receive thread";
      return false;
    }
    if (config_.register_interval.count() > 0 &&
        !channel_.Spawn([this]() { RegisterLoop(); })) {
      start_error_ = "failed to start discovery threads";
      channel_.Stop();
      return false;
    }
    logger_.Info("Listening for controller announces on port " +
                 std::to_string(config_.listen_port));
    return true;
  }

  void Stop() { channel_.Stop(); }

  bool SendRegister() {
    return channel_.SendTo(RegisterDatagram(config_.device), config_.broadcast_address,
                           config_.register_port, "register");
  }

  void RegisterLoop() {
    do {
      SendRegister();
    } while (channel_.WaitFor(config_.register_interval));
  }

  void HandleDatagram(const std::string& payload, const std::string& source_ip) {
    ProtocolMessage message;
    std::string error;
    if (!DecodeMessage(payload, &message, &error)) {
      channel_.metrics().parse_errors++;
      logger_.Debug("Invalid datagram from " + source_ip + ": " + error);
      return;
    }
    if (message.type == MessageType::kRegister) {
      return;
    }
    AnnouncePayload announce;
    if (message.type != MessageType::kAnnounce ||
        message.sender.type != DeviceType::kController ||
        !ParseAnnounce(message, &announce, &error)) {
      channel_.metrics().parse_errors++;
      logger_.Debug("Ignoring datagram from " + source_ip);
      return;
    }
    ControllerEndpoint endpoint;
    endpoint.controller_id = announce.controller_info.id;
    endpoint.name = announce.controller_info.name;
    endpoint.ip = source_ip.empty() ? announce.controller_info.ip : source_ip;
    endpoint.control_port = announce.control_port;
    endpoint.discovery_port = announce.discovery_port;
    UpdateController(endpoint);
    Invoke(announce_cb_, endpoint, "AnnounceCallback");
  }

  void UpdateController(const ControllerEndpoint& endpoint) {
    bool changed = false;
    {
      std::lock_guard<std::mutex> lock(controllers_mutex_);
      auto it = controllers_.find(endpoint.controller_id);
      if (it == controllers_.end()) {
        controllers_.emplace(endpoint.controller_id, endpoint);
        changed = true;
      } else if (it->second.ip != endpoint.ip ||
                 it->second.control_port != endpoint.control_port ||
                 it->second.name != endpoint.name) {
        it->second = endpoint;
        changed = true;
      }
    }
    if (!changed) {
      return;
    }
    logger_.Info("Controller " + endpoint.name + " (" + endpoint.controller_id +
                 ") at " + endpoint.ip + ":" + std::to_string(endpoint.control_port));
    Invoke(controller_cb_, endpoint, "ControllerCallback");
  }

  void Invoke(const ControllerCallback& slot, const ControllerEndpoint& endpoint,
              const char* name) {
    ControllerCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = slot;
    }
    if (!cb_copy) {
      return;
    }
    try {
      cb_copy(endpoint);
    } catch (const std::exception&) {
      channel_.metrics().callback_exceptions++;
      logger_.CallbackException(name);
    }
  }

  ListenerConfig config_;
  Logger logger_;
  DatagramChannel channel_;
  std::string start_error_;

  mutable std::mutex controllers_mutex_;
  std::map<std::string, ControllerEndpoint> controllers_;

  std::mutex callback_mutex_;
  ControllerCallback controller_cb_;
  ControllerCallback announce_cb_;
};

DiscoveryListener::DiscoveryListener(ListenerConfig config)
    : impl_(new Impl(std::move(config))) {}

DiscoveryListener::~DiscoveryListener() { impl_->Stop(); }

bool DiscoveryListener::Start() { return impl_->Start(); }
void DiscoveryListener::Stop() { impl_->Stop(); }

void DiscoveryListener::SetControllerCallback(ControllerCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->controller_cb_ = std::move(cb);
}

void DiscoveryListener::SetAnnounceCallback(ControllerCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->announce_cb_ = std::move(cb);
}

bool DiscoveryListener::SendRegister() { return impl_->SendRegister(); }

std::vector<ControllerEndpoint> DiscoveryListener::GetControllers() const {
  std::vector<ControllerEndpoint> out;
  std::lock_guard<std::mutex> lock(impl_->controllers_mutex_);
  for (const auto& entry : impl_->controllers_) {
    out.push_back(entry.second);
  }
  return out;
}

DiscoveryMetrics DiscoveryListener::GetMetrics() const {
  return impl_->channel_.metrics().Snapshot();
}

std::string DiscoveryListener::GetLastError() const { return impl_->start_error_; }

#ifdef ARROWCTL_TESTING
namespace test {

void InjectDatagram(DiscoveryBroadcaster& broadcaster, const std::string& payload,
                    const std::string& source_ip) {
  broadcaster.impl_->HandleDatagram(payload, source_ip);
}

void InjectDatagram(DiscoveryListener& listener, const std::string& payload,
                    const std::string& source_ip) {
  listener.impl_->HandleDatagram(payload, source_ip);
}

void SetPeerLastSeen(DiscoveryBroadcaster& broadcaster, const std::string& peer_id,
                     std::chrono::steady_clock::time_point when) {
  std::lock_guard<std::mutex> lock(broadcaster.impl_->peers_mutex_);
  auto it = broadcaster.impl_->peers_.find(peer_id);
  if (it != broadcaster.impl_->peers_.end()) {
    it->second.last_seen = when;
  }
}

void PrunePeers(DiscoveryBroadcaster& broadcaster,
                std::chrono::steady_clock::time_point now) {
  broadcaster.impl_->RunPrune(now);
}

size_t GetPeerRecordCount(DiscoveryBroadcaster& broadcaster) {
  std::lock_guard<std::mutex> lock(broadcaster.impl_->peers_mutex_);
  return broadcaster.impl_->peers_.size();
}

std::string BuildAnnounceDatagram(const BroadcasterConfig& config) {
  return AnnounceDatagram(config);
}

std::string BuildRegisterDatagram(const DeviceInfo& device) {
  return RegisterDatagram(device);
}

}  // namespace test
#endif

}  // namespace arrowctl
