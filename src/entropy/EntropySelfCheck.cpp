#include "pulid/entropy/IEntropySource.hpp"
#include "pulid/core/FieldLayout.hpp"

#include <array>

namespace pulid::entropy
{

[[nodiscard]] bool entropySelfCheck(IEntropySource& source) noexcept
{
    pulid::core::EntropyBytes first{};
    pulid::core::EntropyBytes second{};
    if (!source.randomBytes(std::span<std::uint8_t>{ first }) ||
        !source.randomBytes(std::span<std::uint8_t>{ second }))
    {
        return false;
    }
    return first != second;
}

} // namespace pulid::entropy
