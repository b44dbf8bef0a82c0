#ifndef INCLUDE_PULID_CORE_TIMESTAMP_HPP
#define INCLUDE_PULID_CORE_TIMESTAMP_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace pulid::core
{

// 2^48 - 1 ms after the Unix epoch, in the year 10889.
constexpr std::uint64_t g_maxTimestamp{ (std::uint64_t{ 1U } << 48U) - 1U };

[[nodiscard]] constexpr bool isValidTimestamp(std::uint64_t timestampMs) noexcept
{
    return timestampMs <= g_maxTimestamp;
}

// Throws PulidError(Range) when timestampMs does not fit in 48 bits.
void requireValidTimestamp(std::uint64_t timestampMs);

// Throws PulidError(Range) for instants before the epoch or past g_maxTimestamp.
[[nodiscard]] std::uint64_t timestampFromTimePoint(std::chrono::system_clock::time_point tp);

// Millisecond resolution: the full 48-bit range does not fit in system_clock::duration.
[[nodiscard]] std::chrono::sys_time<std::chrono::milliseconds>
timePointFromTimestamp(std::uint64_t timestampMs) noexcept;

// UTC, millisecond precision: 2016-07-30T22:36:16.385Z
[[nodiscard]] std::string formatIso8601(std::uint64_t timestampMs);

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_TIMESTAMP_HPP
