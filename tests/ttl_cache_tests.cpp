#include "nhdsync/cache/ttl_cache.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using nhdsync::TtlCache;
using namespace std::chrono_literals;

namespace {

using Cache = TtlCache<std::string, int>;

struct ManualClock {
    Cache::Clock::time_point now{Cache::Clock::time_point{} + 1h};

    Cache::TimeSource source() {
        return [this] { return now; };
    }
};

}  // namespace

TEST_CASE("TtlCache serves fresh entries until the ttl elapses", "[cache]") {
    ManualClock clock;
    Cache cache(clock.source());
    int calls = 0;
    auto fetch = [&] { return ++calls; };

    REQUIRE(cache.get_or_fetch("descriptors", 600s, fetch) == 1);

    clock.now += 599s;
    REQUIRE(cache.get_or_fetch("descriptors", 600s, fetch) == 1);
    REQUIRE(calls == 1);

    clock.now += 2s;
    REQUIRE(cache.get_or_fetch("descriptors", 600s, fetch) == 2);
    REQUIRE(calls == 2);
}

TEST_CASE("TtlCache shares one fetch between concurrent misses", "[cache]") {
    Cache cache;
    std::atomic_int calls{0};
    std::promise<void> release;
    auto released = release.get_future().share();

    auto fetch = [&] {
        ++calls;
        released.wait();
        return 42;
    };

    auto leader = std::async(std::launch::async, [&] { return cache.get_or_fetch("key", 10min, fetch); });
    while (calls.load() == 0) {
        std::this_thread::yield();
    }

    std::vector<std::future<int>> waiters;
    for (int i = 0; i < 8; ++i) {
        waiters.push_back(std::async(std::launch::async, [&] { return cache.get_or_fetch("key", 10min, fetch); }));
    }
    std::this_thread::sleep_for(20ms);
    release.set_value();

    REQUIRE(leader.get() == 42);
    for (auto& waiter : waiters) {
        REQUIRE(waiter.get() == 42);
    }
    REQUIRE(calls.load() == 1);
}

TEST_CASE("TtlCache hands a shared fetch failure to every waiter", "[cache]") {
    Cache cache;
    std::atomic_int calls{0};
    std::promise<void> release;
    auto released = release.get_future().share();

    auto fetch = [&]() -> int {
        ++calls;
        released.wait();
        throw std::runtime_error("controller timeout");
    };

    auto leader = std::async(std::launch::async, [&] { return cache.get_or_fetch("key", 10min, fetch); });
    while (calls.load() == 0) {
        std::this_thread::yield();
    }

    std::vector<std::future<int>> waiters;
    for (int i = 0; i < 8; ++i) {
        waiters.push_back(std::async(std::launch::async, [&] { return cache.get_or_fetch("key", 10min, fetch); }));
    }
    std::this_thread::sleep_for(50ms);
    release.set_value();

    REQUIRE_THROWS_AS(leader.get(), std::runtime_error);
    for (auto& waiter : waiters) {
        REQUIRE_THROWS_AS(waiter.get(), std::runtime_error);
    }
    REQUIRE(calls.load() == 1);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("TtlCache does not cache failed fetches", "[cache]") {
    ManualClock clock;
    Cache cache(clock.source());
    int calls = 0;

    REQUIRE_THROWS_AS(cache.get_or_fetch("key", 1min,
                                         [&]() -> int {
                                             ++calls;
                                             throw std::runtime_error("timeout");
                                         }),
                      std::runtime_error);
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.peek("key").has_value());

    REQUIRE(cache.get_or_fetch("key", 1min, [&] { return ++calls; }) == 2);
}

TEST_CASE("TtlCache falls back to the expired entry when asked to", "[cache]") {
    ManualClock clock;
    Cache cache(clock.source());
    auto failing = []() -> int { throw std::runtime_error("timeout"); };

    SECTION("stale value is returned and flagged") {
        cache.get_or_fetch("key", 1min, [] { return 7; });
        clock.now += 2min;

        auto lookup = cache.get_or_stale("key", 1min, failing);
        REQUIRE(lookup.value == 7);
        REQUIRE(lookup.stale);
    }

    SECTION("fresh value is not flagged") {
        auto lookup = cache.get_or_stale("key", 1min, [] { return 9; });
        REQUIRE(lookup.value == 9);
        REQUIRE_FALSE(lookup.stale);
    }

    SECTION("error propagates when nothing was ever cached") {
        REQUIRE_THROWS_AS(cache.get_or_stale("key", 1min, failing), std::runtime_error);
    }
}

TEST_CASE("TtlCache invalidate forces the next read to fetch", "[cache]") {
    ManualClock clock;
    Cache cache(clock.source());
    int calls = 0;
    auto fetch = [&] { return ++calls; };

    cache.get_or_fetch("key", 10min, fetch);
    REQUIRE(cache.peek("key") == 1);

    cache.invalidate("key");
    REQUIRE_FALSE(cache.peek("key").has_value());
    REQUIRE(cache.size() == 1);

    REQUIRE(cache.get_or_fetch("key", 10min, fetch) == 2);

    cache.clear();
    REQUIRE(cache.size() == 0);
}
