#ifndef PREMIUM_STORE_REDIS_STORE_HPP
#define PREMIUM_STORE_REDIS_STORE_HPP

#include "premium_store.hpp"
#include "../service_config.hpp"
#include <sw/redis++/redis++.h>
#include <memory>
#include <vector>

namespace premium {

/**
 * @brief Rate store shared through Redis
 *
 * Layout: one hash per rate key, named <prefix><code>:<sumInsured>, with
 * the age band score as field and the premium as value:
 *
 *   HSET premium:1A:100000 1 350 2 500 3 750 ...
 *
 * replace_rates() runs as one MULTI/EXEC transaction, so other service
 * instances never observe a partially written table. Only keys under the
 * prefix are touched.
 */
class RedisPremiumStore : public PremiumStore {
public:
    /**
     * @brief Connect and verify the server answers PING
     *
     * @throws StoreError if the server is unreachable
     */
    explicit RedisPremiumStore(const RedisConfig& config);

    void replace_rates(const PremiumTable& table) override;
    std::optional<double> find_premium(const std::string& key, int score) override;
    bool has_rates() override;
    size_t clear() override;
    std::string backend_name() const override { return StoreBackend::REDIS; }

    const std::string& key_prefix() const { return key_prefix_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::string key_prefix_;

    // Keys under the prefix; max_keys = 0 collects all
    std::vector<std::string> scan_keys(size_t max_keys);
};

} // namespace premium

#endif // PREMIUM_STORE_REDIS_STORE_HPP
