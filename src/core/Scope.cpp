#include "pulid/core/Scope.hpp"
#include "pulid/core/PulidError.hpp"

#include <string>

namespace pulid::core
{

[[nodiscard]] bool isValidPublicScope(std::int64_t publicScope) noexcept
{
    return publicScope >= 0 && publicScope <= static_cast<std::int64_t>(g_maxScope);
}

[[nodiscard]] std::uint16_t toStoredScope(std::int64_t publicScope)
{
    if (!isValidPublicScope(publicScope))
    {
        throw PulidError{ PulidErrorKind::Range, "scope " + std::to_string(publicScope) + " outside 0.." +
                                                     std::to_string(g_maxScope) };
    }
    if (publicScope == g_unscopedPublicScope)
    {
        return g_maxScope;
    }
    return static_cast<std::uint16_t>(publicScope);
}

[[nodiscard]] std::uint16_t toPublicScope(std::uint16_t storedScope)
{
    if (storedScope == g_reservedStoredScope)
    {
        throw PulidError{ PulidErrorKind::ReservedValue, "stored scope 0 is reserved" };
    }
    return storedScope;
}

} // namespace pulid::core
