#include "arrowctl/utils.h"

#include <array>
#include <chrono>
#include <stdexcept>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <openssl/rand.h>

namespace arrowctl {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::vector<uint8_t> RandomBytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return bytes;
}

std::string ToHex(const uint8_t* data, size_t length) {
  std::string out;
  out.reserve(length * 2);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(kHexDigits[(data[i] >> 4) & 0x0f]);
    out.push_back(kHexDigits[data[i] & 0x0f]);
  }
  return out;
}

}  // namespace

std::string GenerateToken(size_t num_bytes) {
  const auto bytes = RandomBytes(num_bytes);
  return ToHex(bytes.data(), bytes.size());
}

std::string GenerateDeviceId() {
  auto bytes = RandomBytes(16);
  // Version 4, variant 10xx.
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);
  const std::string hex = ToHex(bytes.data(), bytes.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<std::string> GetLocalIpv4Address() {
  ifaddrs* interfaces = nullptr;
  if (::getifaddrs(&interfaces) != 0) {
    return std::nullopt;
  }
  std::optional<std::string> result;
  for (ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    if ((ntohl(addr->sin_addr.s_addr) >> 24) == 127) {
      continue;
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      result = buffer;
      break;
    }
  }
  ::freeifaddrs(interfaces);
  return result;
}

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

}  // namespace arrowctl
