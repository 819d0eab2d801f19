#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "assumptions.hpp"
#include <cmath>
#include <stdexcept>

using namespace retireplan;
using Catch::Approx;

TEST_CASE("Default assumptions", "[assumptions]") {
    const AssumptionDefaults& defaults = default_assumptions();
    REQUIRE(defaults.inflation_rate == Approx(0.025));
    REQUIRE(defaults.max_age == 90);
    REQUIRE(defaults.social_security_age == 67);
    REQUIRE(defaults.contribution_allocation == ContributionAllocation(60.0, 30.0, 10.0));
    REQUIRE(defaults.healthcare_inflation_rate == Approx(0.05));
    REQUIRE(defaults.debt_payoff_years == 10);
}

TEST_CASE("Expected return by risk tolerance", "[assumptions]") {
    REQUIRE(expected_return_for(RiskTolerance::Conservative) == Approx(0.04));
    REQUIRE(expected_return_for(RiskTolerance::Moderate) == Approx(0.06));
    REQUIRE(expected_return_for(RiskTolerance::Aggressive) == Approx(0.08));

    REQUIRE(risk_tolerance_from_string("aggressive") == RiskTolerance::Aggressive);
    REQUIRE(risk_tolerance_to_string(RiskTolerance::Conservative) == "conservative");
    REQUIRE_THROWS_AS(risk_tolerance_from_string("reckless"), std::invalid_argument);
}

TEST_CASE("Healthcare cost estimate by age band", "[assumptions]") {
    REQUIRE(estimate_healthcare_costs(55) == 8000.0);
    REQUIRE(estimate_healthcare_costs(64) == 8000.0);
    REQUIRE(estimate_healthcare_costs(65) == 6500.0);
    REQUIRE(estimate_healthcare_costs(74) == 6500.0);
    REQUIRE(estimate_healthcare_costs(75) == 12000.0);
}

TEST_CASE("Social Security estimate", "[assumptions]") {
    SECTION("First tier") {
        REQUIRE(estimate_social_security_monthly(25000.0) == Approx(25000.0 * 0.55 * 0.8 / 12.0));
    }

    SECTION("Second tier") {
        REQUIRE(estimate_social_security_monthly(60000.0) == Approx(1900.0));
    }

    SECTION("Capped at the monthly maximum") {
        REQUIRE(estimate_social_security_monthly(500000.0) == Approx(4500.0));
    }

    SECTION("No income") {
        REQUIRE(estimate_social_security_monthly(0.0) == 0.0);
        REQUIRE(estimate_social_security_monthly(-100.0) == 0.0);
    }
}

TEST_CASE("Expenses derived from income", "[assumptions]") {
    REQUIRE(derive_annual_expenses(100000.0, 30.0) == Approx(70000.0));
    // Never more than 80% of income
    REQUIRE(derive_annual_expenses(100000.0, 10.0) == Approx(80000.0));
    REQUIRE(derive_annual_expenses(0.0, 10.0) == 0.0);
}

TEST_CASE("Debt payment estimate", "[assumptions]") {
    REQUIRE(estimate_annual_debt_payment(10000.0, 0.0) == Approx(1000.0));
    REQUIRE(estimate_annual_debt_payment(0.0, 0.05) == 0.0);

    const double growth = std::pow(1.05, 10);
    REQUIRE(estimate_annual_debt_payment(10000.0, 0.05) == Approx(10000.0 * 0.05 * growth / (growth - 1.0)));
    REQUIRE(estimate_annual_debt_payment(10000.0, 0.05) == Approx(1295.05).margin(0.01));
}

TEST_CASE("RMD start age by birth year", "[assumptions]") {
    REQUIRE(rmd_start_age_for_birth_year(1945) == 72);
    REQUIRE(rmd_start_age_for_birth_year(1950) == 72);
    REQUIRE(rmd_start_age_for_birth_year(1951) == 73);
    REQUIRE(rmd_start_age_for_birth_year(1959) == 73);
    REQUIRE(rmd_start_age_for_birth_year(1960) == 75);
    REQUIRE(rmd_start_age_for_birth_year(1985) == 75);
}
