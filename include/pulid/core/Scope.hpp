#ifndef INCLUDE_PULID_CORE_SCOPE_HPP
#define INCLUDE_PULID_CORE_SCOPE_HPP

#include <cstdint>

namespace pulid::core
{

constexpr std::uint16_t g_maxScope{ 0xFFFFU };
constexpr std::uint16_t g_reservedStoredScope{ 0U };
// Public input meaning "no specific scope"; stored as g_maxScope.
constexpr std::int64_t g_unscopedPublicScope{ 0 };

// Public -> stored. 0 maps to g_maxScope, 1..65535 pass through.
// Throws PulidError(Range) for negative values or values above g_maxScope.
[[nodiscard]] std::uint16_t toStoredScope(std::int64_t publicScope);

// Stored -> public. Identity on 1..65535; g_maxScope is not folded back to 0.
// Throws PulidError(ReservedValue) for a stored 0.
[[nodiscard]] std::uint16_t toPublicScope(std::uint16_t storedScope);

[[nodiscard]] bool isValidPublicScope(std::int64_t publicScope) noexcept;

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_SCOPE_HPP
