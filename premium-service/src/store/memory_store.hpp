#ifndef PREMIUM_STORE_MEMORY_STORE_HPP
#define PREMIUM_STORE_MEMORY_STORE_HPP

#include "premium_store.hpp"
#include <map>
#include <shared_mutex>
#include <utility>

namespace premium {

/**
 * @brief In-process rate store
 *
 * Lookups share a lock; replace_rates() and clear() hold it exclusively.
 */
class MemoryPremiumStore : public PremiumStore {
public:
    void replace_rates(const PremiumTable& table) override;
    std::optional<double> find_premium(const std::string& key, int score) override;
    bool has_rates() override;
    size_t clear() override;
    std::string backend_name() const override { return StoreBackend::MEMORY; }

private:
    std::shared_mutex mutex_;
    std::map<std::pair<std::string, int>, double> rates_;
    size_t key_count_ = 0;
};

} // namespace premium

#endif // PREMIUM_STORE_MEMORY_STORE_HPP
