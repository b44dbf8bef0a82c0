#include "pulid/core/Timestamp.hpp"
#include "pulid/core/PulidError.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace pulid::core
{
namespace
{

constexpr std::uint64_t g_kMillisPerSecond{ 1000U };

} // namespace

void requireValidTimestamp(std::uint64_t timestampMs)
{
    if (!isValidTimestamp(timestampMs))
    {
        throw PulidError{ PulidErrorKind::Range, "timestamp " + std::to_string(timestampMs) + " exceeds " +
                                                     std::to_string(g_maxTimestamp) };
    }
}

[[nodiscard]] std::uint64_t timestampFromTimePoint(std::chrono::system_clock::time_point tp)
{
    const auto ms{ std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() };
    if (ms < 0)
    {
        throw PulidError{ PulidErrorKind::Range, "timestamp " + std::to_string(ms) + " is before the epoch" };
    }
    const auto timestampMs{ static_cast<std::uint64_t>(ms) };
    requireValidTimestamp(timestampMs);
    return timestampMs;
}

[[nodiscard]] std::chrono::sys_time<std::chrono::milliseconds>
timePointFromTimestamp(std::uint64_t timestampMs) noexcept
{
    return std::chrono::sys_time<std::chrono::milliseconds>{ std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(timestampMs) } };
}

[[nodiscard]] std::string formatIso8601(std::uint64_t timestampMs)
{
    const auto seconds{ static_cast<std::time_t>(timestampMs / g_kMillisPerSecond) };
    const auto millis{ timestampMs % g_kMillisPerSecond };

    std::tm utc{};
#if defined(_WIN32)
    if (gmtime_s(&utc, &seconds) != 0)
#else
    if (gmtime_r(&seconds, &utc) == nullptr)
#endif
    {
        throw PulidError{ PulidErrorKind::Range, "timestamp " + std::to_string(timestampMs) + " not representable" };
    }

    std::ostringstream out{};
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

} // namespace pulid::core
