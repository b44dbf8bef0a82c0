#include "pulid/core/PulidGenerator.hpp"
#include "pulid/core/Scope.hpp"
#include "pulid/core/Timestamp.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pulid::core
{
namespace
{

constexpr std::int64_t g_kSelfTestScope{ 100 };

} // namespace

PulidGenerator::PulidGenerator(pulid::entropy::IEntropySource& entropy, GeneratorConfig config, MillisClock clock)
    : m_entropy(&entropy), m_config(config), m_clock(std::move(clock))
{
    if (!m_clock)
    {
        throw std::invalid_argument("PulidGenerator: clock must be callable");
    }
    if (!isValidPublicScope(m_config.defaultScope))
    {
        throw PulidError{ PulidErrorKind::Range,
                          "default scope " + std::to_string(m_config.defaultScope) + " is not a valid scope" };
    }
}

[[nodiscard]] PulidResult<Pulid> PulidGenerator::generate() noexcept
{
    return generate(m_config.defaultScope);
}

[[nodiscard]] PulidResult<Pulid> PulidGenerator::generate(std::int64_t publicScope) noexcept
{
    return generateAt(m_clock(), publicScope);
}

[[nodiscard]] PulidResult<Pulid> PulidGenerator::generateAt(std::uint64_t timestampMs,
                                                            std::int64_t publicScope) noexcept
{
    // Arguments are checked before drawing so a rejected call never consumes entropy.
    try
    {
        requireValidTimestamp(timestampMs);
        static_cast<void>(toStoredScope(publicScope));
    }
    catch (const PulidError& e)
    {
        return e;
    }

    EntropyBytes entropy{};
    if (!m_entropy->randomBytes(std::span<std::uint8_t>{ entropy }))
    {
        return PulidError{ PulidErrorKind::EntropySource,
                           "entropy source '" + std::string{ m_entropy->name() } + "' unavailable" };
    }

    return generateWithEntropy(timestampMs, publicScope, entropy);
}

[[nodiscard]] PulidResult<Pulid> PulidGenerator::generateAt(std::chrono::system_clock::time_point tp,
                                                            std::int64_t publicScope) noexcept
{
    std::uint64_t timestampMs{};
    try
    {
        timestampMs = timestampFromTimePoint(tp);
    }
    catch (const PulidError& e)
    {
        return e;
    }
    return generateAt(timestampMs, publicScope);
}

[[nodiscard]] PulidResult<Pulid>
PulidGenerator::generateWithEntropy(std::uint64_t timestampMs, std::int64_t publicScope,
                                   std::span<const std::uint8_t> entropy) const noexcept
{
    try
    {
        return Pulid{ timestampMs, publicScope, entropy };
    }
    catch (const PulidError& e)
    {
        return e;
    }
}

[[nodiscard]] PulidResult<std::vector<Pulid>> PulidGenerator::generateBatch(std::size_t count,
                                                                             std::int64_t publicScope)
{
    if (count == 0U || count > g_maxBatchSize)
    {
        return PulidError{ PulidErrorKind::Range, "batch size " + std::to_string(count) + " outside 1.." +
                                                      std::to_string(g_maxBatchSize) };
    }

    std::vector<Pulid> out{};
    out.reserve(count);
    for (std::size_t i{}; i < count; ++i)
    {
        auto res{ generate(publicScope) };
        if (auto* err = std::get_if<PulidError>(&res))
        {
            return std::move(*err);
        }
        out.push_back(std::get<Pulid>(std::move(res)));
    }
    return out;
}

[[nodiscard]] SelfTestReport PulidGenerator::selfTest() noexcept
{
    SelfTestReport report{};
    report.entropy = pulid::entropy::entropySelfCheck(*m_entropy);

    const auto res{ generate(g_kSelfTestScope) };
    const auto* id = std::get_if<Pulid>(&res);
    if (id == nullptr)
    {
        return report;
    }

    try
    {
        const auto fromText{ Pulid::fromBase32(id->toBase32()) };
        report.base32RoundTrip = (fromText == *id) && (fromText.scope() == g_kSelfTestScope);

        const auto fromUuid{ Pulid::fromUuid(id->toUuid()) };
        report.uuidRoundTrip = (fromUuid == *id) && (fromUuid.scope() == g_kSelfTestScope);
    }
    catch (const PulidError&)
    {
        report.base32RoundTrip = false;
        report.uuidRoundTrip = false;
    }
    return report;
}

} // namespace pulid::core
