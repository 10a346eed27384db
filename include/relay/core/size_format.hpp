#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relay {

/**
 * @brief Human readable byte counts ("0 B", "512 B", "1.50 KiB", "250.00 MiB")
 *
 * Binary units, two decimals above the byte range.
 */
std::string format_bytes(std::uint64_t bytes);

/**
 * @brief Transfer rate for `bytes` moved in `elapsed` ("12.30 MiB/s")
 *
 * A zero duration is reported as "--/s" rather than dividing by zero.
 */
std::string format_rate(std::uint64_t bytes, std::chrono::milliseconds elapsed);

/**
 * @brief Integer percentage of done/total, clamped to [0, 100]. total == 0 is 100%.
 */
unsigned percent_of(std::uint64_t done, std::uint64_t total);

/// Plain decimal byte count; nothing for signs, trailing garbage or overflow
std::optional<std::uint64_t> parse_byte_count(const std::string& text);

} // namespace relay
