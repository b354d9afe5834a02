#pragma once

#include "arrowctl/discovery.h"
#include "arrowctl/protocol.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace arrowctl {

#ifdef ARROWCTL_TESTING
namespace test {

/// Encoded announce datagram exactly as the broadcaster would send it.
std::string BuildAnnounceDatagram(const BroadcasterConfig& config);

/// Encoded register datagram exactly as the listener would send it.
std::string BuildRegisterDatagram(const DeviceInfo& device);

void InjectDatagram(DiscoveryBroadcaster& broadcaster, const std::string& payload,
                    const std::string& source_ip);

void InjectDatagram(DiscoveryListener& listener, const std::string& payload,
                    const std::string& source_ip);

void SetPeerLastSeen(DiscoveryBroadcaster& broadcaster, const std::string& peer_id,
                     std::chrono::steady_clock::time_point when);

void PrunePeers(DiscoveryBroadcaster& broadcaster,
                std::chrono::steady_clock::time_point now);

size_t GetPeerRecordCount(DiscoveryBroadcaster& broadcaster);

}  // namespace test
#endif

}  // namespace arrowctl
