#include "pulid/core/FieldLayout.hpp"

#include "BigEndian.hpp"

namespace pulid::core
{

[[nodiscard]] PulidBytes packFields(std::uint64_t timestamp, std::uint16_t storedScope,
                                    std::span<const std::uint8_t, g_entropyBytes> entropy) noexcept
{
    PulidBytes out{};

    detail::writeUintBE(std::span<std::uint8_t, g_timestampBytes>{ out.data() + g_timestampOffset, g_timestampBytes },
                        timestamp);
    detail::writeUintBE(std::span<std::uint8_t, g_scopeBytes>{ out.data() + g_scopeOffset, g_scopeBytes },
                        storedScope);

    for (std::size_t i{}; i < entropy.size(); ++i)
    {
        out[g_entropyOffset + i] = entropy[i];
    }

    return out;
}

[[nodiscard]] PulidFields unpackFields(std::span<const std::uint8_t, g_pulidBytes> bytes) noexcept
{
    PulidFields fields{};

    fields.timestamp = detail::readUintBE(
        std::span<const std::uint8_t, g_timestampBytes>{ bytes.data() + g_timestampOffset, g_timestampBytes });
    fields.storedScope = static_cast<std::uint16_t>(
        detail::readUintBE(std::span<const std::uint8_t, g_scopeBytes>{ bytes.data() + g_scopeOffset, g_scopeBytes }));

    for (std::size_t i{}; i < fields.entropy.size(); ++i)
    {
        fields.entropy[i] = bytes[g_entropyOffset + i];
    }

    return fields;
}

} // namespace pulid::core
