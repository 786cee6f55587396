/*
 * Conduit Power Request Tests
 *
 * Tests for request construction, the nothing sentinel and priority ordering.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "conduit/power_request.h"
#include <vector>

using Catch::Approx;

/* ============================================================================
 * Construction
 * ============================================================================ */

TEST_CASE("Power request construction", "[power_request][basic]") {
    int target = 0;

    SECTION("Fields are stored") {
        Conduit_PowerRequest req = conduit_power_request_make(CONDUIT_PRIORITY_HIGH, 40.0f, &target);
        REQUIRE(req.priority == CONDUIT_PRIORITY_HIGH);
        REQUIRE(req.amount == Approx(40.0f));
        REQUIRE(req.target == &target);
        REQUIRE_FALSE(req.external);
        REQUIRE_FALSE(conduit_power_request_is_nothing(&req));
    }

    SECTION("Negative amounts clamp to zero") {
        Conduit_PowerRequest req = conduit_power_request_make(CONDUIT_PRIORITY_HIGH, -5.0f, &target);
        REQUIRE(req.amount == 0.0f);
        REQUIRE(conduit_power_request_is_nothing(&req));
    }

    SECTION("Priority constants are ordered") {
        REQUIRE(CONDUIT_PRIORITY_BACKUP < CONDUIT_PRIORITY_LOWEST);
        REQUIRE(CONDUIT_PRIORITY_LOWEST < CONDUIT_PRIORITY_LOW);
        REQUIRE(CONDUIT_PRIORITY_LOW < CONDUIT_PRIORITY_MEDIUM);
        REQUIRE(CONDUIT_PRIORITY_MEDIUM < CONDUIT_PRIORITY_HIGH);
        REQUIRE(CONDUIT_PRIORITY_HIGH < CONDUIT_PRIORITY_HIGHEST);
    }
}

TEST_CASE("Power request nothing sentinel", "[power_request][sentinel]") {
    SECTION("Sentinel is nothing") {
        Conduit_PowerRequest none = conduit_power_request_nothing();
        REQUIRE(conduit_power_request_is_nothing(&none));
        REQUIRE(none.target == nullptr);
    }

    SECTION("Zero amount at high priority is still nothing") {
        int target = 0;
        Conduit_PowerRequest req = conduit_power_request_make(CONDUIT_PRIORITY_HIGHEST, 0.0f, &target);
        REQUIRE(conduit_power_request_is_nothing(&req));
    }

    SECTION("NULL is nothing") {
        REQUIRE(conduit_power_request_is_nothing(nullptr));
    }
}

/* ============================================================================
 * Ordering
 * ============================================================================ */

TEST_CASE("Power request ordering", "[power_request][sort]") {
    SECTION("Descending priority") {
        const int32_t priorities[] = { 3, 1, 4, 1, 5 };
        std::vector<Conduit_PowerRequest> reqs;
        for (int i = 0; i < 5; i++) {
            reqs.push_back(conduit_power_request_make(priorities[i], 1.0f, nullptr));
        }

        conduit_power_request_sort(reqs.data(), (int)reqs.size());

        const int32_t expected[] = { 5, 4, 3, 1, 1 };
        for (int i = 0; i < 5; i++) {
            REQUIRE(reqs[i].priority == expected[i]);
        }
    }

    SECTION("Equal priorities keep their order") {
        int a = 0, b = 0, c = 0;
        std::vector<Conduit_PowerRequest> reqs;
        reqs.push_back(conduit_power_request_make(CONDUIT_PRIORITY_LOW, 1.0f, &a));
        reqs.push_back(conduit_power_request_make(CONDUIT_PRIORITY_HIGH, 1.0f, &b));
        reqs.push_back(conduit_power_request_make(CONDUIT_PRIORITY_LOW, 1.0f, &c));

        conduit_power_request_sort(reqs.data(), (int)reqs.size());

        REQUIRE(reqs[0].target == &b);
        REQUIRE(reqs[1].target == &a);
        REQUIRE(reqs[2].target == &c);
    }

    SECTION("Backup sorts last") {
        std::vector<Conduit_PowerRequest> reqs;
        reqs.push_back(conduit_power_request_make(CONDUIT_PRIORITY_BACKUP, 1.0f, nullptr));
        reqs.push_back(conduit_power_request_make(CONDUIT_PRIORITY_LOWEST, 1.0f, nullptr));

        conduit_power_request_sort(reqs.data(), (int)reqs.size());

        REQUIRE(reqs[0].priority == CONDUIT_PRIORITY_LOWEST);
        REQUIRE(reqs[1].priority == CONDUIT_PRIORITY_BACKUP);
    }

    SECTION("Compare") {
        Conduit_PowerRequest hi = conduit_power_request_make(CONDUIT_PRIORITY_HIGH, 1.0f, nullptr);
        Conduit_PowerRequest lo = conduit_power_request_make(CONDUIT_PRIORITY_LOW, 1.0f, nullptr);
        REQUIRE(conduit_power_request_compare(&hi, &lo) < 0);
        REQUIRE(conduit_power_request_compare(&lo, &hi) > 0);
        REQUIRE(conduit_power_request_compare(&lo, &lo) == 0);
    }

    SECTION("Degenerate inputs") {
        conduit_power_request_sort(nullptr, 5);
        Conduit_PowerRequest one = conduit_power_request_make(1, 1.0f, nullptr);
        conduit_power_request_sort(&one, 1);
        REQUIRE(one.priority == 1);
    }
}

TEST_CASE("Power request total", "[power_request][total]") {
    Conduit_PowerRequest reqs[3] = {
        conduit_power_request_make(1, 10.0f, nullptr),
        conduit_power_request_make(2, 2.5f, nullptr),
        conduit_power_request_nothing(),
    };
    REQUIRE(conduit_power_request_total(reqs, 3) == Approx(12.5f));
    REQUIRE(conduit_power_request_total(nullptr, 3) == 0.0f);
}
