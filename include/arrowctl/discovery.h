#pragma once

#include "arrowctl/logging.h"
#include "arrowctl/protocol.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arrowctl {

class DiscoveryBroadcaster;
class DiscoveryListener;
struct BroadcasterConfig;

#ifdef ARROWCTL_TESTING
namespace test {
void InjectDatagram(DiscoveryBroadcaster& broadcaster, const std::string& payload,
                    const std::string& source_ip);
void InjectDatagram(DiscoveryListener& listener, const std::string& payload,
                    const std::string& source_ip);
void SetPeerLastSeen(DiscoveryBroadcaster& broadcaster, const std::string& peer_id,
                     std::chrono::steady_clock::time_point when);
void PrunePeers(DiscoveryBroadcaster& broadcaster,
                std::chrono::steady_clock::time_point now);
size_t GetPeerRecordCount(DiscoveryBroadcaster& broadcaster);
std::string BuildAnnounceDatagram(const BroadcasterConfig& config);
}  // namespace test
#endif

/**
 * A target seen through a raw `register` broadcast, before any session.
 */
struct DiscoveredPeer {
  DeviceInfo info;
  /// Source address of the last datagram.
  std::string source_ip;
  /// Last time a datagram was observed from this peer.
  std::chrono::steady_clock::time_point last_seen;
};

/**
 * Peer lifecycle events emitted by discovery tracking.
 */
enum class DiscoveryEventType {
  kSeen,
  kUpdated,
  kExpired,
};

struct DiscoveryEvent {
  DiscoveryEventType type = DiscoveryEventType::kSeen;
  DiscoveredPeer peer;
};

/**
 * Lightweight counters for datagram flow and error reporting.
 */
struct DiscoveryMetrics {
  uint64_t datagrams_received = 0;
  uint64_t datagrams_sent = 0;
  uint64_t parse_errors = 0;
  uint64_t send_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Controller-side discovery socket settings.
 */
struct BroadcasterConfig {
  /// Identity carried in every announce; type must be controller.
  DeviceInfo controller;
  /// Local bind address for the discovery socket.
  std::string bind_address = "0.0.0.0";
  /// Port the controller listens on for target register broadcasts.
  uint16_t listen_port = kDefaultControllerDiscoveryPort;
  /// Port targets listen on for announces.
  uint16_t announce_port = kDefaultTargetDiscoveryPort;
  /// Broadcast address used for announces.
  std::string broadcast_address = "255.255.255.255";
  /// WebSocket control port advertised in announces.
  uint16_t control_port = kDefaultControlPort;
  std::chrono::milliseconds announce_interval{5000};
  /// Peers unseen for this long are expired.
  std::chrono::milliseconds peer_ttl{std::chrono::minutes(5)};
  /// How often to check for peer expiry.
  std::chrono::milliseconds prune_interval{30000};
  /// Enable periodic announces.
  bool send_announces = true;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Periodically broadcasts `announce` and tracks targets that broadcast
 * `register` on the same socket. Performs no authorization.
 */
class DiscoveryBroadcaster {
 public:
  using PeerEventCallback = std::function<void(const DiscoveryEvent&)>;

  explicit DiscoveryBroadcaster(BroadcasterConfig config);
  /// Stop background threads and close the socket.
  ~DiscoveryBroadcaster();

  DiscoveryBroadcaster(const DiscoveryBroadcaster&) = delete;
  DiscoveryBroadcaster& operator=(const DiscoveryBroadcaster&) = delete;

  /// Open the socket and start background threads.
  bool Start();
  void Stop();

  /// Set callback invoked on peer lifecycle events (seen/updated/expired).
  void SetPeerEventCallback(PeerEventCallback cb);

  /// Immediately broadcast one announce.
  bool SendAnnounce();

  /// Return the peers currently tracked.
  std::vector<DiscoveredPeer> GetPeers() const;
  DiscoveryMetrics GetMetrics() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef ARROWCTL_TESTING
  friend void test::InjectDatagram(DiscoveryBroadcaster& broadcaster,
                                   const std::string& payload,
                                   const std::string& source_ip);
  friend void test::SetPeerLastSeen(DiscoveryBroadcaster& broadcaster,
                                    const std::string& peer_id,
                                    std::chrono::steady_clock::time_point when);
  friend void test::PrunePeers(DiscoveryBroadcaster& broadcaster,
                               std::chrono::steady_clock::time_point now);
  friend size_t test::GetPeerRecordCount(DiscoveryBroadcaster& broadcaster);
#endif
};

/**
 * Target-side discovery socket settings.
 */
struct ListenerConfig {
  /// Identity carried in register broadcasts; type must be target.
  DeviceInfo device;
  std::string bind_address = "0.0.0.0";
  /// Port to receive announces on.
  uint16_t listen_port = kDefaultTargetDiscoveryPort;
  std::string broadcast_address = "255.255.255.255";
  /// Controller discovery port register broadcasts go to.
  uint16_t register_port = kDefaultControllerDiscoveryPort;
  /// Period of register broadcasts; 0 disables the periodic broadcast.
  std::chrono::milliseconds register_interval{0};
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Listens for controller announces and turns them into connectable
 * endpoints.
 */
class DiscoveryListener {
 public:
  using ControllerCallback = std::function<void(const ControllerEndpoint&)>;

  explicit DiscoveryListener(ListenerConfig config);
  ~DiscoveryListener();

  DiscoveryListener(const DiscoveryListener&) = delete;
  DiscoveryListener& operator=(const DiscoveryListener&) = delete;

  bool Start();
  void Stop();

  /// Set callback invoked when a controller is first seen or its endpoint changes.
  void SetControllerCallback(ControllerCallback cb);
  /// Set callback invoked for every valid announce, repeats included.
  void SetAnnounceCallback(ControllerCallback cb);

  /// Immediately broadcast one register datagram.
  bool SendRegister();

  /// Every controller endpoint heard so far.
  std::vector<ControllerEndpoint> GetControllers() const;
  DiscoveryMetrics GetMetrics() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef ARROWCTL_TESTING
  friend void test::InjectDatagram(DiscoveryListener& listener,
                                   const std::string& payload,
                                   const std::string& source_ip);
#endif
};

}  // namespace arrowctl
