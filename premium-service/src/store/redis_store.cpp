#include "redis_store.hpp"
#include <chrono>
#include <iterator>
#include <map>
#include <unordered_map>

namespace premium {

namespace {

constexpr long long SCAN_BATCH = 256;

std::string store_failure(const std::string& operation, const sw::redis::Error& e) {
    return "Redis " + operation + " failed: " + e.what();
}

} // anonymous namespace

RedisPremiumStore::RedisPremiumStore(const RedisConfig& config)
    : key_prefix_(config.key_prefix) {
    sw::redis::ConnectionOptions connection;
    connection.host = config.host;
    connection.port = config.port;
    connection.password = config.password;
    connection.db = config.db;
    connection.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    connection.socket_timeout = std::chrono::milliseconds(config.socket_timeout_ms);

    sw::redis::ConnectionPoolOptions pool;
    pool.size = config.pool_size;

    try {
        redis_ = std::make_unique<sw::redis::Redis>(connection, pool);
        redis_->ping();
    } catch (const sw::redis::Error& e) {
        throw StoreError("Cannot connect to Redis at " + config.host + ":" +
                         std::to_string(config.port) + ": " + e.what());
    }
}

std::vector<std::string> RedisPremiumStore::scan_keys(size_t max_keys) {
    std::vector<std::string> keys;
    std::string pattern = key_prefix_ + "*";
    long long cursor = 0;

    do {
        cursor = redis_->scan(cursor, pattern, SCAN_BATCH, std::back_inserter(keys));
        if (max_keys > 0 && keys.size() >= max_keys) {
            break;
        }
    } while (cursor != 0);

    return keys;
}

void RedisPremiumStore::replace_rates(const PremiumTable& table) {
    // Group rates by hash
    std::map<std::string, std::unordered_map<std::string, std::string>> hashes;
    for (const auto& rate : table.rates()) {
        hashes[key_prefix_ + rate.key][std::to_string(rate.score)] = encode_amount(rate.premium);
    }

    try {
        std::vector<std::string> existing = scan_keys(0);

        auto tx = redis_->transaction();
        if (!existing.empty()) {
            tx.del(existing.begin(), existing.end());
        }
        for (const auto& [key, fields] : hashes) {
            tx.hmset(key, fields.begin(), fields.end());
        }
        tx.exec();
    } catch (const sw::redis::Error& e) {
        throw StoreError(store_failure("replace", e));
    }
}

std::optional<double> RedisPremiumStore::find_premium(const std::string& key, int score) {
    sw::redis::OptionalString value;
    try {
        value = redis_->hget(key_prefix_ + key, std::to_string(score));
    } catch (const sw::redis::Error& e) {
        throw StoreError(store_failure("HGET " + key, e));
    }

    if (!value) {
        return std::nullopt;
    }

    try {
        return parse_amount(*value);
    } catch (const std::invalid_argument&) {
        throw StoreError("Redis holds a non-numeric premium for " + key +
                         " band " + std::to_string(score) + ": '" + *value + "'");
    }
}

bool RedisPremiumStore::has_rates() {
    try {
        return !scan_keys(1).empty();
    } catch (const sw::redis::Error& e) {
        throw StoreError(store_failure("SCAN", e));
    }
}

size_t RedisPremiumStore::clear() {
    try {
        std::vector<std::string> keys = scan_keys(0);
        if (keys.empty()) {
            return 0;
        }
        return static_cast<size_t>(redis_->del(keys.begin(), keys.end()));
    } catch (const sw::redis::Error& e) {
        throw StoreError(store_failure("clear", e));
    }
}

} // namespace premium
