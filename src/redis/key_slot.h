#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace Ftsb {

/// Hash slots of a Redis Cluster
constexpr uint16_t kClusterSlots = 16384;

/**
 * CRC16-CCITT (XMODEM), as used for Redis Cluster key distribution.
 */
uint16_t Crc16(const char* buf, size_t len);

/**
 * Cluster slot of a key. When the key holds a non-empty "{tag}", only the
 * tag is hashed.
 */
uint16_t KeyHashSlot(const std::string& key);

}  // namespace Ftsb
