#include "pulid/codec/UuidHex.hpp"
#include "pulid/core/PulidError.hpp"

#include <algorithm>
#include <optional>

namespace pulid::codec
{
namespace
{

constexpr char g_kHex[] = "0123456789abcdef";
constexpr std::uint8_t g_kNibbleShift{ 4U };
constexpr std::uint8_t g_kNibbleMask{ 0x0FU };
constexpr std::uint8_t g_kDecimalDigits{ 10U };

[[nodiscard]] bool isHyphenPosition(std::size_t pos) noexcept
{
    return std::find(g_uuidHyphenPositions.begin(), g_uuidHyphenPositions.end(), pos) != g_uuidHyphenPositions.end();
}

[[nodiscard]] std::optional<std::uint8_t> hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + g_kDecimalDigits);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + g_kDecimalDigits);
    }
    return std::nullopt;
}

} // namespace

[[nodiscard]] std::string encodeUuid(std::span<const std::uint8_t, pulid::core::g_pulidBytes> bytes)
{
    std::string out{};
    out.reserve(g_uuidChars);
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        if (isHyphenPosition(out.size()))
        {
            out.push_back('-');
        }
        out.push_back(g_kHex[(bytes[i] >> g_kNibbleShift) & g_kNibbleMask]);
        out.push_back(g_kHex[bytes[i] & g_kNibbleMask]);
    }
    return out;
}

[[nodiscard]] pulid::core::PulidBytes decodeUuid(std::string_view text)
{
    using pulid::core::PulidError;
    using pulid::core::PulidErrorKind;

    if (text.size() != g_uuidChars)
    {
        throw PulidError{ PulidErrorKind::Format, "uuid: expected " + std::to_string(g_uuidChars) +
                                                      " characters, got " + std::to_string(text.size()) };
    }

    std::array<std::uint8_t, pulid::core::g_pulidBytes * 2U> nibbles{};
    std::size_t count{};
    for (std::size_t pos{}; pos < text.size(); ++pos)
    {
        if (isHyphenPosition(pos))
        {
            if (text[pos] != '-')
            {
                throw PulidError{ PulidErrorKind::Format, "uuid: expected '-' at position " + std::to_string(pos) };
            }
            continue;
        }

        const auto nibble{ hexValue(text[pos]) };
        if (!nibble)
        {
            throw PulidError{ PulidErrorKind::Format, "uuid: invalid hex digit at position " + std::to_string(pos) };
        }
        nibbles[count++] = *nibble;
    }

    pulid::core::PulidBytes out{};
    for (std::size_t i{}; i < out.size(); ++i)
    {
        out[i] = static_cast<std::uint8_t>((nibbles[2U * i] << g_kNibbleShift) | nibbles[2U * i + 1U]);
    }
    return out;
}

} // namespace pulid::codec
