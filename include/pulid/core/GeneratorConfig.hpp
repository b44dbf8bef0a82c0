#ifndef INCLUDE_PULID_CORE_GENERATORCONFIG_HPP
#define INCLUDE_PULID_CORE_GENERATORCONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <functional>

namespace pulid::core
{

constexpr std::int64_t g_defaultPublicScope{ 1 };
constexpr std::size_t g_maxBatchSize{ 1'000'000U };

struct GeneratorConfig final
{
    // Public scope used by generate() without an explicit scope.
    std::int64_t defaultScope{ g_defaultPublicScope };
};

[[nodiscard]] GeneratorConfig defaultGeneratorConfig() noexcept;

// Milliseconds since the Unix epoch.
using MillisClock = std::function<std::uint64_t()>;

[[nodiscard]] std::uint64_t systemClockMillis() noexcept;

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_GENERATORCONFIG_HPP
