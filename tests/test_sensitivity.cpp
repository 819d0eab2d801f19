#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sensitivity.hpp"
#include <algorithm>
#include <cmath>
#include <set>

using namespace retireplan;
using Catch::Approx;

namespace {

ProjectionInput make_saver() {
    ProjectionInput input;
    input.current_age = 30;
    input.retirement_age = 65;
    input.max_age = 90;
    input.annual_contribution = 20000.0;
    input.contribution_allocation = ContributionAllocation(0.0, 0.0, 100.0);
    input.expected_return = 0.07;
    input.inflation_rate = 0.025;
    return input;
}

ProjectionInput make_retiree() {
    ProjectionInput input;
    input.current_age = 65;
    input.retirement_age = 65;
    input.max_age = 90;
    input.balances_by_type = BalanceByType(0.0, 0.0, 400000.0);
    input.annual_expenses = 30000.0;
    input.annual_healthcare_costs = 6000.0;
    input.healthcare_inflation_rate = 0.05;
    input.expected_return = 0.04;
    input.inflation_rate = 0.03;
    input.rmd.enabled = false;
    return input;
}

std::set<std::string> lever_names(const std::vector<LeverImpact>& levers) {
    std::set<std::string> names;
    for (const LeverImpact& impact : levers) {
        names.insert(impact.name);
    }
    return names;
}

LeverImpact make_impact(LeverKind lever, double impact_on_balance) {
    LeverImpact impact;
    impact.lever = lever;
    impact.name = lever_kind_to_string(lever);
    impact.impact_on_balance = impact_on_balance;
    return impact;
}

} // anonymous namespace

// ============================================================================
// Perturbations
// ============================================================================

TEST_CASE("Lever perturbations use fixed steps", "[sensitivity]") {
    ProjectionInput input = make_retiree();
    input.annual_contribution = 5000.0;
    input.current_age = 60;

    SECTION("Expected return rises one point") {
        auto p = perturb_lever(input, LeverKind::ExpectedReturn);
        REQUIRE(p);
        REQUIRE(p->expected_return == Approx(0.05));
    }

    SECTION("Inflation falls half a point") {
        auto p = perturb_lever(input, LeverKind::InflationRate);
        REQUIRE(p);
        REQUIRE(p->inflation_rate == Approx(0.025));
    }

    SECTION("Retirement moves one year later") {
        auto p = perturb_lever(input, LeverKind::RetirementAge);
        REQUIRE(p);
        REQUIRE(p->retirement_age == 66);
    }

    SECTION("Healthcare costs fall by a thousand") {
        auto p = perturb_lever(input, LeverKind::AnnualHealthcareCosts);
        REQUIRE(p);
        REQUIRE(p->annual_healthcare_costs == Approx(5000.0));
    }

    SECTION("Healthcare inflation falls one point") {
        auto p = perturb_lever(input, LeverKind::HealthcareInflationRate);
        REQUIRE(p);
        REQUIRE(p->healthcare_inflation_rate == Approx(0.04));
    }

    SECTION("Contributions rise ten percent") {
        auto p = perturb_lever(input, LeverKind::AnnualContribution);
        REQUIRE(p);
        REQUIRE(p->annual_contribution == Approx(5500.0));
    }

    SECTION("Spending falls ten percent") {
        auto p = perturb_lever(input, LeverKind::AnnualExpenses);
        REQUIRE(p);
        REQUIRE(lever_value(*p, LeverKind::AnnualExpenses) == Approx(27000.0));
    }
}

TEST_CASE("Levers that cannot apply are skipped", "[sensitivity]") {
    ProjectionInput input = make_saver();

    REQUIRE_FALSE(perturb_lever(input, LeverKind::AnnualHealthcareCosts));
    REQUIRE_FALSE(perturb_lever(input, LeverKind::HealthcareInflationRate));
    REQUIRE_FALSE(perturb_lever(input, LeverKind::AnnualExpenses));

    input.annual_contribution = 0.0;
    REQUIRE_FALSE(perturb_lever(input, LeverKind::AnnualContribution));
    REQUIRE_FALSE(perturb_lever(input, LeverKind::ContributionGrowthRate));

    input.inflation_rate = 0.0;
    REQUIRE_FALSE(perturb_lever(input, LeverKind::InflationRate));

    input.retirement_age = 90;
    REQUIRE_FALSE(perturb_lever(input, LeverKind::RetirementAge));
}

TEST_CASE("Later retirement disables a target it would overrun", "[sensitivity]") {
    ProjectionInput input = make_saver();
    DepletionTarget target;
    target.enabled = true;
    target.target_age = 66;
    input.depletion_target = target;

    auto p = perturb_lever(input, LeverKind::RetirementAge);
    REQUIRE(p);
    REQUIRE_FALSE(p->depletion_target->enabled);
    REQUIRE_NOTHROW(validate_projection_input(*p));
}

// ============================================================================
// Analysis
// ============================================================================

TEST_CASE("Lever impacts match an independent rerun", "[sensitivity]") {
    ProjectionInput input = make_retiree();
    SensitivityConfig config;
    config.metric = OutcomeMetric::EndingBalance;

    SensitivityResult result = analyze_sensitivity(input, config);
    const ProjectionResult baseline = run_projection(input, config.projection);

    REQUIRE(result.baseline_balance == Approx(baseline.summary.ending_balance));
    REQUIRE_FALSE(result.all_levers.empty());

    for (const LeverImpact& impact : result.all_levers) {
        auto perturbed = perturb_lever(input, impact.lever);
        REQUIRE(perturbed);
        const ProjectionResult rerun = run_projection(*perturbed, config.projection);

        REQUIRE(impact.perturbed_balance == Approx(rerun.summary.ending_balance));
        REQUIRE(impact.impact_on_balance == Approx(impact.perturbed_balance - result.baseline_balance));
        REQUIRE(impact.test_delta == Approx(impact.test_value - impact.baseline_value));
    }
}

TEST_CASE("Top levers are ranked by absolute impact", "[sensitivity]") {
    ProjectionInput input = make_saver();
    SensitivityResult result = analyze_sensitivity(input);

    REQUIRE(result.metric == OutcomeMetric::RetirementBalance);
    REQUIRE(result.all_levers.size() == 5);
    REQUIRE(result.top_levers.size() == 3);

    const std::set<std::string> names = lever_names(result.all_levers);
    REQUIRE(names.count("annualHealthcareCosts") == 0);
    REQUIRE(names.count("healthcareInflationRate") == 0);
    REQUIRE(names.count("annualExpenses") == 0);

    for (size_t i = 1; i < result.top_levers.size(); ++i) {
        REQUIRE(std::abs(result.top_levers[i - 1].impact_on_balance) >=
                std::abs(result.top_levers[i].impact_on_balance));
    }
    REQUIRE(result.top_levers.front().lever == LeverKind::ExpectedReturn);
    REQUIRE(result.top_levers.front().percent_impact > 0.0);
}

TEST_CASE("Ties keep declaration order", "[sensitivity]") {
    // Nothing saved and nothing invested: no lever moves the outcome
    ProjectionInput input;
    input.current_age = 40;
    input.retirement_age = 65;
    input.max_age = 80;

    SensitivityResult result = analyze_sensitivity(input);

    REQUIRE(result.top_levers.size() == 3);
    REQUIRE(result.top_levers[0].lever == LeverKind::ExpectedReturn);
    REQUIRE(result.top_levers[1].lever == LeverKind::InflationRate);
    REQUIRE(result.top_levers[2].lever == LeverKind::RetirementAge);
    for (const LeverImpact& impact : result.all_levers) {
        REQUIRE(impact.impact_on_balance == 0.0);
        REQUIRE(impact.percent_impact == 0.0);
    }
}

TEST_CASE("Depletion shifts are reported in years", "[sensitivity]") {
    ProjectionInput input = make_retiree();
    input.balances_by_type = BalanceByType(0.0, 0.0, 200000.0);
    SensitivityConfig config;
    config.metric = OutcomeMetric::EndingBalance;

    SensitivityResult result = analyze_sensitivity(input, config);
    REQUIRE(result.baseline_depletion_age.has_value());

    const auto it = std::find_if(result.all_levers.begin(), result.all_levers.end(),
                                 [](const LeverImpact& impact) {
                                     return impact.lever == LeverKind::ExpectedReturn;
                                 });
    REQUIRE(it != result.all_levers.end());
    REQUIRE(it->impact_on_depletion.has_value());
    REQUIRE(*it->impact_on_depletion >= 0);
}

// ============================================================================
// Sensitive assumptions
// ============================================================================

TEST_CASE("Sensitive assumptions are scored against the strongest lever", "[sensitivity]") {
    SensitivityResult result;
    result.all_levers.push_back(make_impact(LeverKind::ExpectedReturn, 1000.0));
    result.all_levers.push_back(make_impact(LeverKind::InflationRate, -500.0));
    result.all_levers.push_back(make_impact(LeverKind::RetirementAge, 250.0));

    SECTION("Default keeps the two strongest") {
        auto assumptions = identify_sensitive_assumptions(result);
        REQUIRE(assumptions.size() == 2);
        REQUIRE(assumptions[0].sensitivity_score == 100);
        REQUIRE(assumptions[0].display_name == "Expected return");
        REQUIRE(assumptions[1].sensitivity_score == 50);
        REQUIRE(assumptions[1].name == "inflationRate");
        REQUIRE_FALSE(assumptions[1].suggestion.empty());
    }

    SECTION("Larger count") {
        auto assumptions = identify_sensitive_assumptions(result, 5);
        REQUIRE(assumptions.size() == 3);
        REQUIRE(assumptions[2].sensitivity_score == 25);
    }

    SECTION("No movement scores zero") {
        SensitivityResult flat;
        flat.all_levers.push_back(make_impact(LeverKind::ExpectedReturn, 0.0));
        auto assumptions = identify_sensitive_assumptions(flat);
        REQUIRE(assumptions.size() == 1);
        REQUIRE(assumptions[0].sensitivity_score == 0);
    }
}

// ============================================================================
// Low-friction wins
// ============================================================================

TEST_CASE("Low-friction wins for a saver", "[sensitivity][wins]") {
    ProjectionInput input = make_saver();

    SECTION("Default config keeps the three largest") {
        auto wins = identify_low_friction_wins(input);
        REQUIRE(wins.size() == 3);
        for (size_t i = 1; i < wins.size(); ++i) {
            REQUIRE(wins[i - 1].potential_impact >= wins[i].potential_impact);
        }
        for (const LowFrictionWin& win : wins) {
            REQUIRE(win.id != "trim-spending-5pct");
            REQUIRE(win.potential_impact > 5000.0);
            REQUIRE_FALSE(win.description.empty());
        }
    }

    SECTION("Materiality filters smaller wins") {
        LowFrictionConfig config;
        config.materiality_percent = 9.0;
        auto wins = identify_low_friction_wins(input, config);
        REQUIRE(wins.size() == 2);
        REQUIRE(wins[0].id == "escalate-contributions");
        REQUIRE(wins[0].effort == EffortLevel::Minimal);
        REQUIRE(wins[1].id == "increase-savings-10pct");
        REQUIRE(wins[1].percent_impact == Approx(10.0));
    }
}

TEST_CASE("Retirees only see spending wins", "[sensitivity][wins]") {
    ProjectionInput input = make_retiree();
    input.retirement_age = 70;
    input.current_age = 70;

    auto wins = identify_low_friction_wins(input);
    for (const LowFrictionWin& win : wins) {
        REQUIRE(win.id == "trim-spending-5pct");
        REQUIRE(win.lever == LeverKind::AnnualExpenses);
    }
}

// ============================================================================
// Formatting
// ============================================================================

TEST_CASE("Currency formatting", "[sensitivity][format]") {
    REQUIRE(format_currency(0.0) == "$0");
    REQUIRE(format_currency(950.0) == "$950");
    REQUIRE(format_currency(12000.0) == "$12K");
    REQUIRE(format_currency(1300000.0) == "$1.3M");
    REQUIRE(format_currency(-5000.0) == "-$5K");
}

TEST_CASE("Lever delta formatting", "[sensitivity][format]") {
    LeverImpact impact;

    impact.lever = LeverKind::ExpectedReturn;
    impact.test_delta = 0.01;
    REQUIRE(format_lever_delta(impact) == "+1.0%");

    impact.lever = LeverKind::InflationRate;
    impact.test_delta = -0.005;
    REQUIRE(format_lever_delta(impact) == "-0.5%");

    impact.lever = LeverKind::RetirementAge;
    impact.test_delta = 1.0;
    REQUIRE(format_lever_delta(impact) == "+1 year");

    impact.lever = LeverKind::AnnualHealthcareCosts;
    impact.test_delta = -1000.0;
    REQUIRE(format_lever_delta(impact) == "-$1,000");

    impact.lever = LeverKind::AnnualContribution;
    impact.baseline_value = 20000.0;
    impact.test_delta = 2000.0;
    REQUIRE(format_lever_delta(impact) == "+10%");
}

TEST_CASE("Lever names", "[sensitivity]") {
    REQUIRE(lever_kind_to_string(LeverKind::AnnualContribution) == "annualContribution");
    REQUIRE(lever_display_name(LeverKind::AnnualContribution) == "Annual savings");
    REQUIRE(outcome_metric_from_string("endingBalance") == OutcomeMetric::EndingBalance);
    REQUIRE_THROWS_AS(outcome_metric_from_string("median"), std::invalid_argument);
}
