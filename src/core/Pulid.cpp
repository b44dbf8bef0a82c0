#include "pulid/core/Pulid.hpp"
#include "pulid/codec/Base32.hpp"
#include "pulid/codec/UuidHex.hpp"
#include "pulid/core/PulidError.hpp"
#include "pulid/core/Scope.hpp"
#include "pulid/core/Timestamp.hpp"
#include <new>

namespace pulid::core
{
namespace
{

[[nodiscard]] std::span<const std::uint8_t, g_pulidBytes> asFixed(const PulidBytes& bytes) noexcept
{
    return std::span<const std::uint8_t, g_pulidBytes>{ bytes };
}

} // namespace

Pulid::Pulid(std::uint64_t timestampMs, std::int64_t publicScope, std::span<const std::uint8_t> entropy)
{
    requireValidTimestamp(timestampMs);
    const std::uint16_t stored{ toStoredScope(publicScope) };
    if (entropy.size() != g_entropyBytes)
    {
        throw PulidError{ PulidErrorKind::Format, "entropy: expected " + std::to_string(g_entropyBytes) +
                                                      " bytes, got " + std::to_string(entropy.size()) };
    }

    m_bytes = packFields(timestampMs, stored, entropy.first<g_entropyBytes>());
}

// Shared tail of every parsing path.
Pulid::Pulid(const PulidBytes& bytes) : m_bytes(bytes)
{
    const auto fields{ unpackFields(asFixed(m_bytes)) };
    requireValidTimestamp(fields.timestamp);
    static_cast<void>(toPublicScope(fields.storedScope));
}

[[nodiscard]] Pulid Pulid::fromBase32(std::string_view text)
{
    return Pulid{ pulid::codec::decodeBase32(text) };
}

[[nodiscard]] Pulid Pulid::fromUuid(std::string_view text)
{
    return Pulid{ pulid::codec::decodeUuid(text) };
}

[[nodiscard]] Pulid Pulid::fromBytes(std::span<const std::uint8_t> bytes)
{
    if (bytes.size() != g_pulidBytes)
    {
        throw PulidError{ PulidErrorKind::Format, "bytes: expected " + std::to_string(g_pulidBytes) + ", got " +
                                                      std::to_string(bytes.size()) };
    }

    PulidBytes copy{};
    for (std::size_t i{}; i < copy.size(); ++i)
    {
        copy[i] = bytes[i];
    }
    return Pulid{ copy };
}

[[nodiscard]] Pulid Pulid::parse(std::string_view text)
{
    if (text.size() == pulid::codec::g_base32Chars)
    {
        return fromBase32(text);
    }
    if (text.size() == pulid::codec::g_uuidChars)
    {
        return fromUuid(text);
    }
    throw PulidError{ PulidErrorKind::Format, "expected " + std::to_string(pulid::codec::g_base32Chars) + " or " +
                                                  std::to_string(pulid::codec::g_uuidChars) + " characters, got " +
                                                  std::to_string(text.size()) };
}

[[nodiscard]] bool Pulid::isValid(std::string_view text) noexcept
{
    try
    {
        static_cast<void>(parse(text));
        return true;
    }
    catch (const PulidError&)
    {
        return false;
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
}

[[nodiscard]] std::string Pulid::toBase32() const
{
    return pulid::codec::encodeBase32(asFixed(m_bytes));
}

[[nodiscard]] std::string Pulid::toUuid() const
{
    return pulid::codec::encodeUuid(asFixed(m_bytes));
}

[[nodiscard]] std::uint64_t Pulid::timestamp() const noexcept
{
    return unpackFields(asFixed(m_bytes)).timestamp;
}

[[nodiscard]] std::chrono::sys_time<std::chrono::milliseconds> Pulid::time() const noexcept
{
    return timePointFromTimestamp(timestamp());
}

[[nodiscard]] std::uint16_t Pulid::scope() const noexcept
{
    // Construction rejected stored 0, so the public mapping is the identity here.
    return storedScope();
}

[[nodiscard]] std::uint16_t Pulid::storedScope() const noexcept
{
    return unpackFields(asFixed(m_bytes)).storedScope;
}

[[nodiscard]] EntropyBytes Pulid::entropy() const noexcept
{
    return unpackFields(asFixed(m_bytes)).entropy;
}

} // namespace pulid::core
