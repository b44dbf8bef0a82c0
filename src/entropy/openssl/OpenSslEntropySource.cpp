#include "pulid/entropy/providers/OpenSslEntropySourceFactory.hpp"
#include <cstddef>
#include <limits>
#include <openssl/rand.h>

namespace pulid::entropy::providers
{
namespace
{

class OpenSslEntropySource final : public pulid::entropy::IEntropySource
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<int>::max()) };

        std::uint8_t* outPtr{ out.data() };
        std::size_t remaining{ out.size() };
        while (remaining > 0U)
        {
            const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
            // RAND_bytes returns 1 on success; 0 or -1 mean the DRBG is unseeded or unsupported.
            if (RAND_bytes(outPtr, static_cast<int>(chunk)) != 1)
            {
                return false;
            }
            remaining -= chunk;
            outPtr += chunk;
        }
        return true;
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "openssl";
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> makeOpenSslEntropySource()
{
    return std::make_unique<OpenSslEntropySource>();
}

} // namespace pulid::entropy::providers
