#ifndef INCLUDE_PULID_ENTROPY_IENTROPYSOURCE_HPP
#define INCLUDE_PULID_ENTROPY_IENTROPYSOURCE_HPP

#include <cstdint>
#include <span>
#include <string_view>

namespace pulid::entropy
{

class IEntropySource
{
public:
    IEntropySource() = default;
    IEntropySource(const IEntropySource&) = delete;
    IEntropySource& operator=(const IEntropySource&) = delete;
    IEntropySource(IEntropySource&&) = delete;
    IEntropySource& operator=(IEntropySource&&) = delete;
    virtual ~IEntropySource() = default;

    // Fills out with cryptographically secure bytes. Returns false when the source is unavailable;
    // callers must treat that as fatal for the current generation and never fall back to a weaker source.
    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// Two 8-byte draws succeed and differ.
[[nodiscard]] bool entropySelfCheck(IEntropySource& source) noexcept;

} // namespace pulid::entropy

#endif // INCLUDE_PULID_ENTROPY_IENTROPYSOURCE_HPP
