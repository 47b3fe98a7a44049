#include "../SessionCache.h"
#include <boost/test/unit_test.hpp>
#include <thread>

BOOST_AUTO_TEST_SUITE(session_cache_test_suite)
    BOOST_AUTO_TEST_CASE(test_get_returns_stored_value) {
        SessionCache<std::string> cache(std::chrono::seconds(60));

        BOOST_CHECK(!cache.get("missing").has_value());

        cache.put("header", "portal");
        BOOST_CHECK_EQUAL(cache.get("header").value(), "portal");

        cache.put("header", "ops");
        BOOST_CHECK_EQUAL(cache.get("header").value(), "ops");
        BOOST_CHECK_EQUAL(cache.size(), 1);

        cache.erase("header");
        BOOST_CHECK(!cache.get("header").has_value());
    }

    BOOST_AUTO_TEST_CASE(test_idle_entries_lapse_on_lookup) {
        SessionCache<int> cache(std::chrono::milliseconds(50));
        cache.put("a", 1);

        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        BOOST_CHECK(!cache.get("a").has_value());
        BOOST_CHECK_EQUAL(cache.size(), 0);
    }

    BOOST_AUTO_TEST_CASE(test_use_restarts_idle_period) {
        SessionCache<int> cache(std::chrono::milliseconds(200));
        cache.put("a", 1);

        for (auto i = 0; i < 5; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(60));
            BOOST_CHECK_EQUAL(cache.get("a").value_or(0), 1);
        }
    }

    BOOST_AUTO_TEST_CASE(test_sweep_drops_only_lapsed_entries) {
        SessionCache<int> cache(std::chrono::milliseconds(100));
        cache.put("old1", 1);
        cache.put("old2", 2);

        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cache.put("fresh", 3);

        BOOST_CHECK_EQUAL(cache.sweep(), 2);
        BOOST_CHECK_EQUAL(cache.size(), 1);
        BOOST_CHECK_EQUAL(cache.get("fresh").value(), 3);

        // Nothing left to drop
        BOOST_CHECK_EQUAL(cache.sweep(), 0);
    }
BOOST_AUTO_TEST_SUITE_END()
