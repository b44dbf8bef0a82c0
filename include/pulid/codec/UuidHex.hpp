#ifndef INCLUDE_PULID_CODEC_UUIDHEX_HPP
#define INCLUDE_PULID_CODEC_UUIDHEX_HPP

#include "pulid/core/FieldLayout.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pulid::codec
{

constexpr std::size_t g_uuidChars{ 36U };
// Hyphen positions of the 8-4-4-4-12 grouping.
constexpr std::array<std::size_t, 4> g_uuidHyphenPositions{ 8U, 13U, 18U, 23U };

// Lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
[[nodiscard]] std::string encodeUuid(std::span<const std::uint8_t, pulid::core::g_pulidBytes> bytes);

// Case-insensitive. Throws PulidError(Format) on wrong length, misplaced hyphens or non-hex digits.
[[nodiscard]] pulid::core::PulidBytes decodeUuid(std::string_view text);

} // namespace pulid::codec

#endif // INCLUDE_PULID_CODEC_UUIDHEX_HPP
