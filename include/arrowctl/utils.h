#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace arrowctl {

/// Default number of random bytes in pairing and auth tokens.
constexpr size_t kDefaultTokenBytes = 32;

/**
 * Generate a hex-encoded token from a cryptographically secure RNG.
 *
 * @param num_bytes Number of random bytes (the string is twice as long).
 * @throws std::runtime_error if the RNG cannot produce bytes.
 */
std::string GenerateToken(size_t num_bytes = kDefaultTokenBytes);

/// Generate a random RFC 4122 version 4 UUID string.
std::string GenerateDeviceId();

/// First non-loopback IPv4 address of this host, if any.
std::optional<std::string> GetLocalIpv4Address();

/// Milliseconds since the Unix epoch, used for message timestamps.
int64_t NowMillis();

/// True if the string parses as a dotted-quad IPv4 address.
bool IsValidIpv4(const std::string& address);

}  // namespace arrowctl
