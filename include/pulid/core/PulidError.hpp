#ifndef INCLUDE_PULID_CORE_PULIDERROR_HPP
#define INCLUDE_PULID_CORE_PULIDERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace pulid::core
{

enum class PulidErrorKind : std::uint8_t
{
    Format,
    Range,
    ReservedValue,
    EntropySource,
};

[[nodiscard]] std::string_view toString(PulidErrorKind kind) noexcept;

// Single error type for every failing path; branch on kind(), read the detail from what().
class PulidError final : public std::runtime_error
{
public:
    PulidError(PulidErrorKind kind, const std::string& detail) : std::runtime_error(detail), m_kind(kind)
    {
    }

    [[nodiscard]] PulidErrorKind kind() const noexcept
    {
        return m_kind;
    }

private:
    PulidErrorKind m_kind;
};

template <class T> using PulidResult = std::variant<T, PulidError>;

} // namespace pulid::core

#endif // INCLUDE_PULID_CORE_PULIDERROR_HPP
