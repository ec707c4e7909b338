#include "memory_store.hpp"
#include <mutex>

namespace premium {

void MemoryPremiumStore::replace_rates(const PremiumTable& table) {
    std::map<std::pair<std::string, int>, double> rates;
    for (const auto& rate : table.rates()) {
        rates[{rate.key, rate.score}] = rate.premium;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    rates_.swap(rates);
    key_count_ = table.key_count();
}

std::optional<double> MemoryPremiumStore::find_premium(const std::string& key, int score) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rates_.find({key, score});
    if (it == rates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryPremiumStore::has_rates() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return !rates_.empty();
}

size_t MemoryPremiumStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = key_count_;
    rates_.clear();
    key_count_ = 0;
    return removed;
}

} // namespace premium
