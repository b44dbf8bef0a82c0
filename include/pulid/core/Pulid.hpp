#ifndef INCLUDE_PULID_CORE_PULID_HPP
#define INCLUDE_PULID_CORE_PULID_HPP

#include "pulid/core/FieldLayout.hpp"
#include <chrono>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pulid::core
{

// Immutable 128-bit identifier: 48-bit ms timestamp, 16-bit scope, 64-bit entropy.
// Ordering and equality follow the stored bytes, which is also the order of toBase32() strings.
class Pulid final
{
public:
    // Validates the timestamp, maps the public scope to its stored form and requires 8 entropy bytes.
    // Throws PulidError(Range) or PulidError(Format) for a wrong entropy length.
    Pulid(std::uint64_t timestampMs, std::int64_t publicScope, std::span<const std::uint8_t> entropy);

    // Parsers throw PulidError(Format) for malformed input and PulidError(ReservedValue) for stored scope 0.
    [[nodiscard]] static Pulid fromBase32(std::string_view text);
    [[nodiscard]] static Pulid fromUuid(std::string_view text);
    [[nodiscard]] static Pulid fromBytes(std::span<const std::uint8_t> bytes);

    // Picks the codec by length: 26 characters Base32, 36 characters UUID.
    [[nodiscard]] static Pulid parse(std::string_view text);

    [[nodiscard]] static bool isValid(std::string_view text) noexcept;

    [[nodiscard]] std::string toBase32() const;
    [[nodiscard]] std::string toUuid() const;
    [[nodiscard]] const PulidBytes& toBytes() const noexcept
    {
        return m_bytes;
    }

    [[nodiscard]] std::uint64_t timestamp() const noexcept;
    [[nodiscard]] std::chrono::sys_time<std::chrono::milliseconds> time() const noexcept;
    // Public scope. Input 0 was stored as 65535 and reads back as 65535.
    [[nodiscard]] std::uint16_t scope() const noexcept;
    [[nodiscard]] std::uint16_t storedScope() const noexcept;
    [[nodiscard]] EntropyBytes entropy() const noexcept;

    friend bool operator==(const Pulid&, const Pulid&) = default;
    friend std::strong_ordering operator<=>(const Pulid&, const Pulid&) = default;

private:
    explicit Pulid(const PulidBytes& bytes);

    PulidBytes m_bytes{};
};

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_PULID_HPP
