#ifndef INCLUDE_PULID_ENTROPY_PROVIDERS_NATIVEENTROPYSOURCEFACTORY_HPP
#define INCLUDE_PULID_ENTROPY_PROVIDERS_NATIVEENTROPYSOURCEFACTORY_HPP

#include "pulid/entropy/IEntropySource.hpp"
#include <memory>

namespace pulid::entropy::providers
{

// getrandom(2) on Linux, BCryptGenRandom on Windows.
[[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> makeNativeEntropySource();

} // namespace pulid::entropy::providers

#endif // INCLUDE_PULID_ENTROPY_PROVIDERS_NATIVEENTROPYSOURCEFACTORY_HPP
