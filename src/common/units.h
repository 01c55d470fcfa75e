#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace Ftsb {

/**
 * Formats a byte count with a single-letter binary unit (B, K, M, G, T, P, E),
 * one decimal place, trailing ".0" removed. 1536 -> "1.5K", 0 -> "0B".
 */
std::string FormatByteSize(uint64_t bytes);

/**
 * Parses a duration such as "1s", "250ms", "1m30s" or "0".
 * Accepted units: ns, us, ms, s, m, h.
 * @throws std::invalid_argument on malformed input
 */
std::chrono::nanoseconds ParseDuration(const std::string& text);

/**
 * Formats a duration the way ParseDuration reads it back ("1s", "500ms").
 */
std::string FormatDuration(std::chrono::nanoseconds d);

}  // namespace Ftsb
