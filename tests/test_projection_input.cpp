#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "projection_input.hpp"
#include <string>

using namespace retireplan;
using Catch::Approx;

// ============================================================================
// Helper functions
// ============================================================================

namespace {

IncomeStream make_stream(const std::string& id, double amount, int start_age) {
    IncomeStream stream;
    stream.id = id;
    stream.name = id;
    stream.type = IncomeStreamType::Pension;
    stream.annual_amount = amount;
    stream.start_age = start_age;
    stream.is_guaranteed = true;
    return stream;
}

// Runs validation and returns the field of the ValidationError, or "" if none
std::string validation_field(const ProjectionInput& input) {
    try {
        validate_projection_input(input);
    } catch (const ValidationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("ProjectionInput defaults are valid", "[projection_input]") {
    ProjectionInput input;
    REQUIRE(input.current_age == 30);
    REQUIRE(input.retirement_age == 65);
    REQUIRE(input.max_age == 90);
    REQUIRE(input.rmd.enabled);
    REQUIRE(input.rmd.start_age == DEFAULT_RMD_START_AGE);
    REQUIRE_NOTHROW(validate_projection_input(input));
}

TEST_CASE("ValidationError carries field and invariant", "[projection_input]") {
    ValidationError error("maxAge", "must not exceed 120");
    REQUIRE(error.field() == "maxAge");
    REQUIRE(error.invariant() == "must not exceed 120");
    REQUIRE(std::string(error.what()).find("maxAge") != std::string::npos);
}

// ============================================================================
// Expense base
// ============================================================================

TEST_CASE("Expense base prefers the essential/discretionary split", "[projection_input]") {
    ProjectionInput input;

    SECTION("Split present") {
        input.annual_essential_expenses = 40000.0;
        input.annual_discretionary_expenses = 15000.0;
        input.annual_expenses = 99999.0;
        REQUIRE(input.base_essential_expenses() == 40000.0);
        REQUIRE(input.base_discretionary_expenses() == 15000.0);
    }

    SECTION("Legacy flat figure is all essential") {
        input.annual_expenses = 50000.0;
        REQUIRE(input.base_essential_expenses() == 50000.0);
        REQUIRE(input.base_discretionary_expenses() == 0.0);
    }
}

TEST_CASE("Debt payments stop at the payoff age", "[projection_input]") {
    ProjectionInput input;
    REQUIRE_FALSE(input.debt_payments_active(40));

    input.annual_debt_payments = 5000.0;
    REQUIRE(input.debt_payments_active(40));

    input.debt_payoff_age = 45;
    REQUIRE(input.debt_payments_active(44));
    REQUIRE_FALSE(input.debt_payments_active(45));
}

TEST_CASE("Phases enabled only with an enabled, non-empty config", "[projection_input]") {
    ProjectionInput input;
    REQUIRE_FALSE(input.phases_enabled());

    SpendingPhaseConfig config;
    config.phases = default_spending_phases();
    input.spending_phase_config = config;
    REQUIRE_FALSE(input.phases_enabled());

    input.spending_phase_config->enabled = true;
    REQUIRE(input.phases_enabled());
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Age invariants", "[projection_input][validation]") {
    ProjectionInput input;

    SECTION("Retirement before current age") {
        input.current_age = 50;
        input.retirement_age = 45;
        REQUIRE(validation_field(input) == "retirementAge");
    }

    SECTION("Retirement after max age") {
        input.retirement_age = 95;
        REQUIRE(validation_field(input) == "retirementAge");
    }

    SECTION("Max age above 120") {
        input.max_age = 121;
        REQUIRE(validation_field(input) == "maxAge");
    }

    SECTION("Already retired is allowed") {
        input.current_age = 65;
        input.retirement_age = 65;
        REQUIRE(validation_field(input).empty());
    }
}

TEST_CASE("Allocation must sum to 100", "[projection_input][validation]") {
    ProjectionInput input;

    SECTION("Short of 100 is rejected, not normalized") {
        input.contribution_allocation = ContributionAllocation(60.0, 30.0, 9.0);
        REQUIRE(validation_field(input) == "contributionAllocation");
        REQUIRE(input.contribution_allocation.taxable == 9.0);
    }

    SECTION("Over 100 is rejected") {
        input.contribution_allocation = ContributionAllocation(60.0, 30.0, 20.0);
        REQUIRE(validation_field(input) == "contributionAllocation");
    }

    SECTION("Single-category allocation is valid") {
        input.contribution_allocation = ContributionAllocation(0.0, 0.0, 100.0);
        REQUIRE(validation_field(input).empty());
    }
}

TEST_CASE("Non-negative amounts and rates", "[projection_input][validation]") {
    ProjectionInput input;

    SECTION("Negative balance") {
        input.balances_by_type.taxable = -1.0;
        REQUIRE(validation_field(input) == "balancesByType.taxable");
    }

    SECTION("Negative contribution") {
        input.annual_contribution = -100.0;
        REQUIRE(validation_field(input) == "annualContribution");
    }

    SECTION("Negative return") {
        input.expected_return = -0.01;
        REQUIRE(validation_field(input) == "expectedReturn");
    }

    SECTION("Negative reserve floor") {
        input.reserve_floor = -5.0;
        REQUIRE(validation_field(input) == "reserveFloor");
    }
}

TEST_CASE("Income stream invariants", "[projection_input][validation]") {
    ProjectionInput input;

    SECTION("Duplicate ids") {
        input.income_streams = {make_stream("pension", 10000.0, 65), make_stream("pension", 5000.0, 70)};
        REQUIRE(validation_field(input) == "incomeStreams[1].id");
    }

    SECTION("Empty id") {
        input.income_streams = {make_stream("", 10000.0, 65)};
        REQUIRE(validation_field(input) == "incomeStreams[0].id");
    }

    SECTION("End before start") {
        IncomeStream stream = make_stream("bridge", 10000.0, 65);
        stream.end_age = 60;
        input.income_streams = {stream};
        REQUIRE(validation_field(input) == "incomeStreams[0].endAge");
    }

    SECTION("Start age out of range") {
        input.income_streams = {make_stream("late", 10000.0, 130)};
        REQUIRE(validation_field(input) == "incomeStreams[0].startAge");
    }
}

TEST_CASE("Spending phase invariants", "[projection_input][validation]") {
    ProjectionInput input;
    SpendingPhaseConfig config;
    config.enabled = true;

    SECTION("At most four phases") {
        for (int i = 0; i < 5; ++i) {
            config.phases.push_back(SpendingPhase("p" + std::to_string(i), "Phase", 65 + 5 * i, 1.0, 1.0));
        }
        input.spending_phase_config = config;
        REQUIRE(validation_field(input) == "spendingPhaseConfig.phases");
    }

    SECTION("Enabled config needs a phase") {
        input.spending_phase_config = config;
        REQUIRE(validation_field(input) == "spendingPhaseConfig.phases");
    }

    SECTION("Start ages must be unique") {
        config.phases = {SpendingPhase("a", "A", 65, 1.0, 1.0), SpendingPhase("b", "B", 65, 1.0, 0.8)};
        input.spending_phase_config = config;
        REQUIRE(validation_field(input) == "spendingPhaseConfig.phases[1].startAge");
    }

    SECTION("Disabled config is not checked") {
        config.enabled = false;
        input.spending_phase_config = config;
        REQUIRE(validation_field(input).empty());
    }
}

TEST_CASE("Depletion target invariants", "[projection_input][validation]") {
    ProjectionInput input;
    DepletionTarget target;
    target.enabled = true;

    SECTION("Target age must follow retirement") {
        target.target_age = 60;
        input.depletion_target = target;
        REQUIRE(validation_field(input) == "depletionTarget.targetAge");
    }

    SECTION("Percentage above 100") {
        target.target_percentage_spent = 120.0;
        input.depletion_target = target;
        REQUIRE(validation_field(input) == "depletionTarget.targetPercentageSpent");
    }

    SECTION("Percentage reserve above 100") {
        target.reserve.type = ReserveType::Percentage;
        target.reserve.amount = 150.0;
        input.depletion_target = target;
        REQUIRE(validation_field(input) == "depletionTarget.reserve.amount");
    }

    SECTION("Valid target") {
        input.depletion_target = target;
        REQUIRE(validation_field(input).empty());
    }
}

TEST_CASE("Enum string conversions", "[projection_input]") {
    REQUIRE(income_stream_type_from_string("social_security") == IncomeStreamType::SocialSecurity);
    REQUIRE(income_stream_type_to_string(IncomeStreamType::PartTime) == "part_time");
    REQUIRE_THROWS_AS(income_stream_type_from_string("lottery"), std::invalid_argument);

    REQUIRE(reserve_type_from_string("absolute") == ReserveType::Absolute);
    REQUIRE(reserve_purpose_to_string(ReservePurpose::LongTermCare) == "long-term-care");
    REQUIRE_THROWS_AS(reserve_purpose_from_string("vacation"), std::invalid_argument);

    REQUIRE(default_is_guaranteed(IncomeStreamType::SocialSecurity));
    REQUIRE(default_is_guaranteed(IncomeStreamType::Annuity));
    REQUIRE_FALSE(default_is_guaranteed(IncomeStreamType::Rental));
}

TEST_CASE("extract_assumptions copies the rate assumptions", "[projection_input]") {
    ProjectionInput input;
    input.expected_return = 0.07;
    input.inflation_rate = 0.03;
    input.retirement_age = 62;

    ProjectionAssumptions assumptions = extract_assumptions(input);
    REQUIRE(assumptions.expected_return == Approx(0.07));
    REQUIRE(assumptions.inflation_rate == Approx(0.03));
    REQUIRE(assumptions.retirement_age == 62);
    REQUIRE(assumptions.max_age == 90);
}
