#include "store_factory.hpp"
#include "memory_store.hpp"
#include "../logger.hpp"

#ifdef PREMIUM_HAVE_REDIS
#include "redis_store.hpp"
#endif

namespace premium {

std::vector<std::string> available_store_backends() {
    std::vector<std::string> backends = {StoreBackend::MEMORY};
#ifdef PREMIUM_HAVE_REDIS
    backends.push_back(StoreBackend::REDIS);
#endif
    return backends;
}

std::unique_ptr<PremiumStore> create_premium_store(const ServiceConfig& config) {
    Logger& logger = Logger::get_instance();

    if (config.store == StoreBackend::MEMORY) {
        auto store = std::make_unique<MemoryPremiumStore>();
        logger.log_store_connected(store->backend_name(), "");
        return store;
    }

    if (config.store == StoreBackend::REDIS) {
#ifdef PREMIUM_HAVE_REDIS
        auto store = std::make_unique<RedisPremiumStore>(config.redis);
        logger.log_store_connected(store->backend_name(),
                                   config.redis.host + ":" + std::to_string(config.redis.port),
                                   config.redis.password);
        return store;
#else
        throw ConfigError("Store backend 'redis' is not available: built without redis-plus-plus");
#endif
    }

    std::string available;
    for (const auto& name : available_store_backends()) {
        if (!available.empty()) available += ", ";
        available += name;
    }
    throw ConfigError("Unknown store backend: " + config.store + ". Available backends: " + available);
}

} // namespace premium
