#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <mediadex/core/bounded_cache.h>

using namespace mediadex;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    using duration = std::chrono::milliseconds;
    using rep = duration::rep;
    using period = duration::period;
    using time_point = std::chrono::time_point<FakeClock>;
    static constexpr bool is_steady = true;

    static inline time_point current{};
    static time_point now() { return current; }
    static void advance(duration d) { current += d; }
};

using TestCache = BoundedCache<std::string, int, std::hash<std::string>, FakeClock>;

} // namespace

TEST_CASE("BoundedCache: get and set", "[unit][core][cache]") {
    TestCache cache({3, 1000ms});

    SECTION("missing key is a miss") {
        CHECK_FALSE(cache.get("a").has_value());
        CHECK(cache.stats().misses == 1);
    }

    SECTION("stored key is a hit") {
        cache.set("a", 1);
        auto v = cache.get("a");
        REQUIRE(v.has_value());
        CHECK(*v == 1);
        CHECK(cache.stats().hits == 1);
    }

    SECTION("overwrite replaces the value without growing") {
        cache.set("a", 1);
        cache.set("a", 2);
        CHECK(cache.size() == 1);
        CHECK(cache.get("a").value() == 2);
    }
}

TEST_CASE("BoundedCache: evicts the oldest insertion at capacity", "[unit][core][cache]") {
    TestCache cache({2, 60'000ms});

    cache.set("first", 1);
    FakeClock::advance(1ms);
    cache.set("second", 2);
    FakeClock::advance(1ms);

    // Reading does not protect an entry from eviction
    CHECK(cache.get("first").has_value());

    cache.set("third", 3);
    CHECK(cache.size() == 2);
    CHECK_FALSE(cache.get("first").has_value());
    CHECK(cache.get("second").value() == 2);
    CHECK(cache.get("third").value() == 3);
    CHECK(cache.stats().evictions == 1);
}

TEST_CASE("BoundedCache: entries expire after the TTL", "[unit][core][cache]") {
    TestCache cache({10, 500ms});
    cache.set("k", 7);

    FakeClock::advance(499ms);
    CHECK(cache.get("k").has_value());

    FakeClock::advance(1ms);
    CHECK_FALSE(cache.get("k").has_value());
    CHECK(cache.size() == 0);

    SECTION("overwriting refreshes the age") {
        cache.set("k", 8);
        FakeClock::advance(400ms);
        cache.set("k", 9);
        FakeClock::advance(400ms);
        CHECK(cache.get("k").value() == 9);
    }
}

TEST_CASE("BoundedCache: clear and invalidate", "[unit][core][cache]") {
    TestCache cache({4, 1000ms});
    cache.set("a", 1);
    cache.set("b", 2);
    (void)cache.get("a");

    cache.invalidate("a");
    CHECK_FALSE(cache.get("a").has_value());
    CHECK(cache.get("b").has_value());

    cache.clear();
    auto stats = cache.stats();
    CHECK(stats.size == 0);
    CHECK(stats.hits == 0);
    CHECK(stats.misses == 0);
}

TEST_CASE("BoundedCache: zero capacity is clamped to one", "[unit][core][cache]") {
    TestCache cache({0, 1000ms});
    cache.set("a", 1);
    cache.set("b", 2);
    CHECK(cache.size() == 1);
    CHECK(cache.config().maxSize == 1);
}

TEST_CASE("BoundedCache: concurrent writers stay within capacity", "[unit][core][cache]") {
    BoundedCache<int, int> cache({32, 60'000ms});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                cache.set(t * 1000 + i, i);
                (void)cache.get(t * 1000 + i / 2);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(cache.size() <= 32);
}
