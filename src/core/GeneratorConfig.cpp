#include "pulid/core/GeneratorConfig.hpp"
#include <chrono>

namespace pulid::core
{

[[nodiscard]] GeneratorConfig defaultGeneratorConfig() noexcept
{
    return GeneratorConfig{
        .defaultScope = g_defaultPublicScope,
    };
}

[[nodiscard]] std::uint64_t systemClockMillis() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto now{ Clock::now() };
    const auto ms{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) };
    const auto count{ ms.count() };
    if (count < 0)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(count);
}

} // namespace pulid::core
