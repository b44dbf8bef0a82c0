#ifndef INCLUDE_PULID_CODEC_BASE32_HPP
#define INCLUDE_PULID_CODEC_BASE32_HPP

#include "pulid/core/FieldLayout.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pulid::codec
{

// Crockford alphabet: no I, L, O, U.
constexpr std::string_view g_base32Alphabet{ "0123456789ABCDEFGHJKMNPQRSTVWXYZ" };
constexpr std::size_t g_base32Chars{ 26U };
// 128 = 25 * 5 + 3: the leading character carries 3 bits, so it must decode to 0..7.
constexpr std::uint8_t g_base32MaxLeadingValue{ 7U };

[[nodiscard]] std::string encodeBase32(std::span<const std::uint8_t, pulid::core::g_pulidBytes> bytes);

// Accepts lowercase and the aliases I/L -> 1, O -> 0, U -> value 22.
// Throws PulidError(Format) on wrong length, unknown characters or a leading character above '7'.
// Every character is validated before any output byte is assembled.
[[nodiscard]] pulid::core::PulidBytes decodeBase32(std::string_view text);

// Uppercase, alias-free spelling of a decodable string.
[[nodiscard]] std::string canonicalBase32(std::string_view text);

} // namespace pulid::codec

#endif // INCLUDE_PULID_CODEC_BASE32_HPP
