#ifndef PULID_SRC_CORE_BIGENDIAN_HPP
#define PULID_SRC_CORE_BIGENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace pulid::core::detail
{

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

// Writes the low N bytes of v, most significant first.
template <std::size_t N>
    requires(N <= sizeof(std::uint64_t))
inline void writeUintBE(std::span<std::uint8_t, N> out, std::uint64_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(N - 1U - i) * g_kBitsPerByte };
        out[i] = static_cast<std::uint8_t>((v >> shiftBits) & g_kByteMaskU64);
    }
}

template <std::size_t N>
    requires(N <= sizeof(std::uint64_t))
[[nodiscard]] inline std::uint64_t readUintBE(std::span<const std::uint8_t, N> in) noexcept
{
    std::uint64_t v{ 0U };
    for (std::size_t i{}; i < in.size(); ++i)
    {
        v = (v << g_kBitsPerByte) | static_cast<std::uint64_t>(in[i]);
    }
    return v;
}

} // namespace pulid::core::detail

#endif // PULID_SRC_CORE_BIGENDIAN_HPP
