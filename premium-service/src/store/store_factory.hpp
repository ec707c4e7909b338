#ifndef PREMIUM_STORE_STORE_FACTORY_HPP
#define PREMIUM_STORE_STORE_FACTORY_HPP

#include "premium_store.hpp"
#include "../service_config.hpp"
#include <memory>
#include <vector>

namespace premium {

/**
 * @brief Create the store selected by config.store
 *
 * @throws ConfigError if the backend is unknown or was not compiled in
 * @throws StoreError if the backend cannot be reached
 */
std::unique_ptr<PremiumStore> create_premium_store(const ServiceConfig& config);

/**
 * @brief Backends compiled into this build
 */
std::vector<std::string> available_store_backends();

} // namespace premium

#endif // PREMIUM_STORE_STORE_FACTORY_HPP
