#include "pulid/codec/Base32.hpp"
#include "pulid/core/PulidError.hpp"

#include <array>

namespace pulid::codec
{
namespace
{

constexpr std::uint8_t g_kInvalid{ 0xFFU };
constexpr std::uint8_t g_kGroupMask{ 0x1FU };
constexpr std::uint32_t g_kBitsPerGroup{ 5U };
constexpr std::uint32_t g_kBitsPerByte{ 8U };
constexpr std::uint32_t g_kLeadingBits{ 3U };
constexpr std::uint8_t g_kAliasUValue{ 22U };

// Position of every 5-bit group inside the 16-byte value. Group 0 holds the top 3 bits of byte 0;
// group i >= 1 starts at data bit 5i - 2 and is read through the 16-bit window bytes[byteIndex..byteIndex+1].
struct GroupSlot final
{
    std::uint8_t byteIndex{};
    std::uint8_t shift{};
};

constexpr std::array<GroupSlot, g_base32Chars> makeGroupSlots() noexcept
{
    std::array<GroupSlot, g_base32Chars> slots{};
    slots[0] = GroupSlot{ 0U, static_cast<std::uint8_t>(g_kBitsPerByte - g_kLeadingBits) };
    for (std::size_t i{ 1U }; i < slots.size(); ++i)
    {
        const auto startBit{ static_cast<std::uint32_t>(i) * g_kBitsPerGroup - (g_kBitsPerGroup - g_kLeadingBits) };
        const auto bitInByte{ startBit % g_kBitsPerByte };
        slots[i] = GroupSlot{ static_cast<std::uint8_t>(startBit / g_kBitsPerByte),
                              static_cast<std::uint8_t>(2U * g_kBitsPerByte - g_kBitsPerGroup - bitInByte) };
    }
    return slots;
}

constexpr std::array<GroupSlot, g_base32Chars> g_kSlots{ makeGroupSlots() };

constexpr std::array<std::uint8_t, 256> makeDecodeTable() noexcept
{
    std::array<std::uint8_t, 256> table{};
    for (auto& v : table)
    {
        v = g_kInvalid;
    }

    constexpr char kCaseOffset{ 'a' - 'A' };
    auto set = [&table](char c, std::uint8_t value)
    {
        table[static_cast<unsigned char>(c)] = value;
        if (c >= 'A' && c <= 'Z')
        {
            table[static_cast<unsigned char>(c + kCaseOffset)] = value;
        }
    };

    for (std::size_t i{}; i < g_base32Alphabet.size(); ++i)
    {
        set(g_base32Alphabet[i], static_cast<std::uint8_t>(i));
    }
    set('I', 1U);
    set('L', 1U);
    set('O', 0U);
    set('U', g_kAliasUValue);
    return table;
}

constexpr std::array<std::uint8_t, 256> g_kDecode{ makeDecodeTable() };

[[nodiscard]] std::uint32_t readWindow(std::span<const std::uint8_t, pulid::core::g_pulidBytes> bytes,
                                       std::size_t byteIndex) noexcept
{
    const std::uint32_t hi{ bytes[byteIndex] };
    const std::uint32_t lo{ (byteIndex + 1U < bytes.size()) ? bytes[byteIndex + 1U] : 0U };
    return (hi << g_kBitsPerByte) | lo;
}

} // namespace

[[nodiscard]] std::string encodeBase32(std::span<const std::uint8_t, pulid::core::g_pulidBytes> bytes)
{
    std::string out(g_base32Chars, '0');

    out[0] = g_base32Alphabet[bytes[0] >> g_kSlots[0].shift];
    for (std::size_t i{ 1U }; i < g_base32Chars; ++i)
    {
        const auto& slot{ g_kSlots[i] };
        const std::uint32_t value{ (readWindow(bytes, slot.byteIndex) >> slot.shift) & g_kGroupMask };
        out[i] = g_base32Alphabet[value];
    }

    return out;
}

[[nodiscard]] pulid::core::PulidBytes decodeBase32(std::string_view text)
{
    using pulid::core::PulidError;
    using pulid::core::PulidErrorKind;

    if (text.size() != g_base32Chars)
    {
        throw PulidError{ PulidErrorKind::Format, "base32: expected " + std::to_string(g_base32Chars) +
                                                      " characters, got " + std::to_string(text.size()) };
    }

    std::array<std::uint8_t, g_base32Chars> values{};
    for (std::size_t i{}; i < text.size(); ++i)
    {
        const std::uint8_t value{ g_kDecode[static_cast<unsigned char>(text[i])] };
        if (value == g_kInvalid)
        {
            throw PulidError{ PulidErrorKind::Format,
                              "base32: invalid character at position " + std::to_string(i) };
        }
        values[i] = value;
    }

    if (values[0] > g_base32MaxLeadingValue)
    {
        throw PulidError{ PulidErrorKind::Format, "base32: leading character overflows 128 bits" };
    }

    pulid::core::PulidBytes out{};
    out[0] = static_cast<std::uint8_t>(values[0] << g_kSlots[0].shift);
    for (std::size_t i{ 1U }; i < g_base32Chars; ++i)
    {
        const auto& slot{ g_kSlots[i] };
        const std::uint32_t window{ static_cast<std::uint32_t>(values[i]) << slot.shift };
        out[slot.byteIndex] |= static_cast<std::uint8_t>(window >> g_kBitsPerByte);
        if (slot.byteIndex + 1U < out.size())
        {
            out[slot.byteIndex + 1U] |= static_cast<std::uint8_t>(window & 0xFFU);
        }
    }

    return out;
}

[[nodiscard]] std::string canonicalBase32(std::string_view text)
{
    const auto bytes{ decodeBase32(text) };
    return encodeBase32(std::span<const std::uint8_t, pulid::core::g_pulidBytes>{ bytes });
}

} // namespace pulid::codec
