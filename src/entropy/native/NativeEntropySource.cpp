#include "pulid/entropy/providers/NativeEntropySourceFactory.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace pulid::entropy::providers
{
namespace
{

[[nodiscard]] bool fillFromOs(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };
#if defined(_WIN32)

    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };

        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(outPtr), static_cast<ULONG>(chunk),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }

        remaining -= chunk;
        outPtr += chunk;
    }

#elif defined(__linux__)
    while (remaining > 0U)
    {
        const ssize_t received{ ::getrandom(outPtr, remaining, 0) };

        if (received > 0)
        {
            const auto count{ static_cast<std::size_t>(received) };
            if (count > remaining)
            {
                return false;
            }
            remaining -= count;
            outPtr += count;
            continue;
        }

        // 0 bytes without an error would spin forever.
        if (received == 0 || errno != EINTR)
        {
            return false;
        }
    }

#endif
    return true;
}

class NativeEntropySource final : public pulid::entropy::IEntropySource
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        if (out.empty())
        {
            return true;
        }
        return fillFromOs(out);
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "native";
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> makeNativeEntropySource()
{
    return std::make_unique<NativeEntropySource>();
}

} // namespace pulid::entropy::providers
