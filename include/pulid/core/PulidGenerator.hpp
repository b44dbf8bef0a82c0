#ifndef INCLUDE_PULID_CORE_PULIDGENERATOR_HPP
#define INCLUDE_PULID_CORE_PULIDGENERATOR_HPP

#include "pulid/core/FieldLayout.hpp"
#include "pulid/core/GeneratorConfig.hpp"
#include "pulid/core/Pulid.hpp"
#include "pulid/core/PulidError.hpp"
#include "pulid/entropy/IEntropySource.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pulid::core
{

struct SelfTestReport final
{
    bool entropy{ false };
    bool base32RoundTrip{ false };
    bool uuidRoundTrip{ false };

    [[nodiscard]] bool passed() const noexcept
    {
        return entropy && base32RoundTrip && uuidRoundTrip;
    }
};

// Every call draws fresh entropy. There is no per-millisecond counter, so two ids generated in the same
// millisecond are only distinct through their random bytes.
class PulidGenerator final
{
public:
    // Throws PulidError(Range) when config.defaultScope is not a valid public scope.
    PulidGenerator(pulid::entropy::IEntropySource& entropy, GeneratorConfig config,
                   MillisClock clock = systemClockMillis);

    [[nodiscard]] PulidResult<Pulid> generate() noexcept;
    [[nodiscard]] PulidResult<Pulid> generate(std::int64_t publicScope) noexcept;

    [[nodiscard]] PulidResult<Pulid> generateAt(std::uint64_t timestampMs, std::int64_t publicScope) noexcept;
    [[nodiscard]] PulidResult<Pulid> generateAt(std::chrono::system_clock::time_point tp,
                                                std::int64_t publicScope) noexcept;

    // No randomness is drawn; same validation as generate().
    [[nodiscard]] PulidResult<Pulid> generateWithEntropy(std::uint64_t timestampMs, std::int64_t publicScope,
                                                         std::span<const std::uint8_t> entropy) const noexcept;

    // Aborts on the first failure. count must be in 1..g_maxBatchSize.
    [[nodiscard]] PulidResult<std::vector<Pulid>> generateBatch(std::size_t count, std::int64_t publicScope);

    [[nodiscard]] SelfTestReport selfTest() noexcept;

    [[nodiscard]] std::int64_t defaultScope() const noexcept
    {
        return m_config.defaultScope;
    }

    [[nodiscard]] const pulid::entropy::IEntropySource& entropySource() const noexcept
    {
        return *m_entropy;
    }

private:
    pulid::entropy::IEntropySource* m_entropy{ nullptr };
    GeneratorConfig m_config{};
    MillisClock m_clock;
};

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_PULIDGENERATOR_HPP
