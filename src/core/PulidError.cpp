#include "pulid/core/PulidError.hpp"

namespace pulid::core
{

std::string_view toString(PulidErrorKind kind) noexcept
{
    switch (kind)
    {
    case PulidErrorKind::Format:
        return "format";
    case PulidErrorKind::Range:
        return "range";
    case PulidErrorKind::ReservedValue:
        return "reserved value";
    case PulidErrorKind::EntropySource:
        return "entropy source";
    }
    return "unknown";
}

} // namespace pulid::core
