#ifndef INCLUDE_PULID_ENTROPY_PROVIDERS_OPENSSLENTROPYSOURCEFACTORY_HPP
#define INCLUDE_PULID_ENTROPY_PROVIDERS_OPENSSLENTROPYSOURCEFACTORY_HPP

#include "pulid/entropy/IEntropySource.hpp"
#include <memory>

namespace pulid::entropy::providers
{

[[nodiscard]] std::unique_ptr<pulid::entropy::IEntropySource> makeOpenSslEntropySource();

} // namespace pulid::entropy::providers

#endif // INCLUDE_PULID_ENTROPY_PROVIDERS_OPENSSLENTROPYSOURCEFACTORY_HPP
