#include <catch2/catch_test_macros.hpp>
#include "../src/store/redis_store.hpp"
#include <cstdlib>
#include <string>
#include <unistd.h>

using namespace premium;

// Runs against a live server named by PREMIUM_TEST_REDIS_HOST
TEST_CASE("RedisPremiumStore against a live server", "[redis_store]") {
    const char* host = std::getenv("PREMIUM_TEST_REDIS_HOST");
    if (!host || std::string(host).empty()) {
        WARN("PREMIUM_TEST_REDIS_HOST not set, skipping");
        return;
    }

    RedisConfig config;
    config.host = host;
    config.key_prefix = "premium-test:" + std::to_string(getpid()) + ":";

    RedisPremiumStore store(config);
    REQUIRE(store.backend_name() == "redis");
    REQUIRE(store.key_prefix() == config.key_prefix);
    store.clear();
    REQUIRE_FALSE(store.has_rates());

    PremiumTable table;
    table.add(PremiumRate("1A:100000", 1, 350.0));
    table.add(PremiumRate("1A:100000", 3, 750.0));
    table.add(PremiumRate("1B:100000", 1, 437.5));
    store.replace_rates(table);

    REQUIRE(store.has_rates());
    REQUIRE(store.find_premium("1A:100000", 3).value() == 750.0);
    REQUIRE(store.find_premium("1B:100000", 1).value() == 437.5);
    REQUIRE_FALSE(store.find_premium("1A:100000", 2).has_value());

    PremiumTable replacement;
    replacement.add(PremiumRate("2A:100000", 1, 525.0));
    store.replace_rates(replacement);
    REQUIRE_FALSE(store.find_premium("1A:100000", 3).has_value());

    REQUIRE(store.clear() == 1);
    REQUIRE_FALSE(store.has_rates());
}

TEST_CASE("RedisPremiumStore unreachable server", "[redis_store]") {
    RedisConfig config;
    config.host = "127.0.0.1";
    config.port = 1;  // nothing listens here
    config.connect_timeout_ms = 200;

    REQUIRE_THROWS_AS(RedisPremiumStore(config), StoreError);
}
