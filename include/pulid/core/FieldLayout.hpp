#ifndef INCLUDE_PULID_CORE_FIELDLAYOUT_HPP
#define INCLUDE_PULID_CORE_FIELDLAYOUT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pulid::core
{

constexpr std::size_t g_timestampBytes{ 6U };
constexpr std::size_t g_scopeBytes{ 2U };
constexpr std::size_t g_entropyBytes{ 8U };
constexpr std::size_t g_pulidBytes{ g_timestampBytes + g_scopeBytes + g_entropyBytes };

constexpr std::size_t g_timestampOffset{ 0U };
constexpr std::size_t g_scopeOffset{ g_timestampOffset + g_timestampBytes };
constexpr std::size_t g_entropyOffset{ g_scopeOffset + g_scopeBytes };

using PulidBytes = std::array<std::uint8_t, g_pulidBytes>;
using EntropyBytes = std::array<std::uint8_t, g_entropyBytes>;

struct PulidFields final
{
    std::uint64_t timestamp{ 0U };
    std::uint16_t storedScope{ 0U };
    EntropyBytes entropy{};
};

// Big-endian layout: [0,6) timestamp, [6,8) stored scope, [8,16) entropy.
// Only the low 48 bits of timestamp are written; range checks belong to the caller.
[[nodiscard]] PulidBytes packFields(std::uint64_t timestamp, std::uint16_t storedScope,
                                    std::span<const std::uint8_t, g_entropyBytes> entropy) noexcept;

[[nodiscard]] PulidFields unpackFields(std::span<const std::uint8_t, g_pulidBytes> bytes) noexcept;

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_FIELDLAYOUT_HPP
