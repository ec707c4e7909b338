#include <catch2/catch_test_macros.hpp>
#include "../src/store/memory_store.hpp"
#include "../src/store/store_factory.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace premium;

namespace {

PremiumTable make_table(double scale) {
    PremiumTable table;
    table.add(PremiumRate("1A:100000", 1, 350.0 * scale));
    table.add(PremiumRate("1A:100000", 2, 500.0 * scale));
    table.add(PremiumRate("1A:100000", 3, 750.0 * scale));
    table.add(PremiumRate("1B:100000", 1, 437.5 * scale));
    return table;
}

} // anonymous namespace

TEST_CASE("MemoryPremiumStore", "[premium_store]") {
    MemoryPremiumStore store;

    REQUIRE(store.backend_name() == "memory");
    REQUIRE_FALSE(store.has_rates());
    REQUIRE_FALSE(store.find_premium("1A:100000", 3).has_value());
    REQUIRE(store.clear() == 0);

    store.replace_rates(make_table(1.0));
    REQUIRE(store.has_rates());
    REQUIRE(store.find_premium("1A:100000", 3).value() == 750.0);
    REQUIRE(store.find_premium("1B:100000", 1).value() == 437.5);
    REQUIRE_FALSE(store.find_premium("1B:100000", 2).has_value());

    SECTION("Replacing drops rates absent from the new table") {
        PremiumTable smaller;
        smaller.add(PremiumRate("2A:100000", 1, 525.0));
        store.replace_rates(smaller);

        REQUIRE_FALSE(store.find_premium("1A:100000", 3).has_value());
        REQUIRE(store.find_premium("2A:100000", 1).value() == 525.0);
        REQUIRE(store.clear() == 1);
    }

    SECTION("Clear reports removed keys") {
        REQUIRE(store.clear() == 2);
        REQUIRE_FALSE(store.has_rates());
        REQUIRE_FALSE(store.find_premium("1A:100000", 3).has_value());
    }
}

TEST_CASE("MemoryPremiumStore readers never see a partial table", "[premium_store]") {
    MemoryPremiumStore store;
    store.replace_rates(make_table(1.0));

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!done) {
                // Every rate exists in both tables
                if (!store.find_premium("1A:100000", 3) || !store.find_premium("1B:100000", 1)) {
                    ++inconsistent;
                }
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        store.replace_rates(make_table(i % 2 == 0 ? 2.0 : 1.0));
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    REQUIRE(inconsistent == 0);
}

TEST_CASE("Store factory", "[premium_store]") {
    ServiceConfig config;

    SECTION("Memory backend") {
        config.store = "memory";
        auto store = create_premium_store(config);
        REQUIRE(store->backend_name() == "memory");
    }

    SECTION("Unknown backend") {
        config.store = "sqlite";
        REQUIRE_THROWS_AS(create_premium_store(config), ConfigError);
    }

    SECTION("Available backends") {
        auto backends = available_store_backends();
        REQUIRE(std::find(backends.begin(), backends.end(), "memory") != backends.end());
#ifndef PREMIUM_HAVE_REDIS
        config.store = "redis";
        REQUIRE_THROWS_AS(create_premium_store(config), ConfigError);
#endif
    }
}
