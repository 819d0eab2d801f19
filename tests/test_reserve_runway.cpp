#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "reserve_runway.hpp"

using namespace retireplan;
using Catch::Approx;

TEST_CASE("Years of coverage", "[runway]") {
    SECTION("No need is unlimited") {
        RunwayYears runway = years_of_coverage(100000.0, 0.0, 0.03);
        REQUIRE(runway.unlimited);
    }

    SECTION("Empty reserve covers nothing") {
        RunwayYears runway = years_of_coverage(0.0, 10000.0, 0.03);
        REQUIRE_FALSE(runway.unlimited);
        REQUIRE(runway.years == 0);
    }

    SECTION("Flat need divides evenly") {
        REQUIRE(years_of_coverage(100000.0, 10000.0, 0.0).years == 10);
    }

    SECTION("Inflation shortens the runway") {
        REQUIRE(years_of_coverage(100000.0, 10000.0, 0.10).years == 6);
    }

    SECTION("Capped at the maximum") {
        REQUIRE(years_of_coverage(1e9, 1.0, 0.0).years == MAX_RUNWAY_YEARS);
    }
}

TEST_CASE("Runway descriptions", "[runway]") {
    REQUIRE(describe_runway(RunwayYears::unlimited_runway(), 0.0, 0.0) ==
            "Guaranteed income covers all essential expenses");
    REQUIRE(describe_runway(RunwayYears::of(30), 0.0, 0.0) == "30+ years");
    REQUIRE(describe_runway(RunwayYears::of(12), 0.0, 0.0) == "~12 years");
    REQUIRE(describe_runway(RunwayYears::of(1), 0.0, 0.0) == "~1 year");
    REQUIRE(describe_runway(RunwayYears::of(0), 5000.0, 12000.0) == "~5 months");
}

TEST_CASE("Reserve runway against expenses and income", "[runway]") {
    SECTION("Income covers essentials") {
        ReserveRunway runway = calculate_reserve_runway(200000.0, 30000.0, 10000.0, 35000.0, 0.0);
        REQUIRE(runway.essential_gap == 0.0);
        REQUIRE(runway.essentials_runway.unlimited);
        REQUIRE_FALSE(runway.full_spending_runway.unlimited);
        REQUIRE(runway.full_spending_runway.years == 40);
        REQUIRE(runway.description == "Guaranteed income covers all essential expenses");
    }

    SECTION("Reserve funds the gap") {
        ReserveRunway runway = calculate_reserve_runway(200000.0, 30000.0, 10000.0, 10000.0, 0.0);
        REQUIRE(runway.reserve_amount == 200000.0);
        REQUIRE(runway.essential_gap == Approx(20000.0));
        REQUIRE(runway.essentials_runway.years == 10);
        REQUIRE(runway.full_spending_runway.years == 6);
        REQUIRE(runway.description == "~10 years");
    }
}
