/**
 * @file premium_store.hpp
 * @brief Abstract interface for premium rate storage
 *
 * The service reads rates through this interface so the HTTP layer does
 * not depend on where the table lives. Implementations:
 * - MemoryPremiumStore: in-process, for single instances and tests
 * - RedisPremiumStore: shared by every service instance
 *
 * Implementations must be safe to call from several server threads.
 */

#ifndef PREMIUM_STORE_PREMIUM_STORE_HPP
#define PREMIUM_STORE_PREMIUM_STORE_HPP

#include "../../../premium-engine/src/premium_table.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace premium {

/**
 * @brief Raised when the backing store cannot be read or written
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Store backend identifiers
 */
namespace StoreBackend {
    constexpr const char* MEMORY = "memory";
    constexpr const char* REDIS = "redis";
}

/**
 * @brief Premium rates keyed by rate key and age band score
 */
class PremiumStore {
public:
    virtual ~PremiumStore() = default;

    /**
     * @brief Replace every stored rate with the rates of a table
     *
     * Readers see either the previous rates or the new ones.
     *
     * @throws StoreError
     */
    virtual void replace_rates(const PremiumTable& table) = 0;

    /**
     * @brief Look up one premium
     *
     * @param key Rate key "<code>:<sumInsured>"
     * @param score Age band score
     * @return Premium, or nullopt when no rate is stored
     * @throws StoreError
     */
    virtual std::optional<double> find_premium(const std::string& key, int score) = 0;

    /**
     * @brief Whether any rate is stored
     *
     * @throws StoreError
     */
    virtual bool has_rates() = 0;

    /**
     * @brief Remove every stored rate
     *
     * @return Number of rate keys removed
     * @throws StoreError
     */
    virtual size_t clear() = 0;

    /**
     * @brief Backend identifier, one of StoreBackend
     */
    virtual std::string backend_name() const = 0;
};

} // namespace premium

#endif // PREMIUM_STORE_PREMIUM_STORE_HPP
