#ifndef RETIREPLAN_INPUT_BUILDER_HPP
#define RETIREPLAN_INPUT_BUILDER_HPP

#include "assumptions.hpp"
#include "balances.hpp"
#include "projection_input.hpp"
#include <optional>
#include <string>
#include <vector>

namespace retireplan {

// ============================================================================
// Financial snapshot
// ============================================================================

// Account types as stored by the planner: 401k, IRA, Roth_IRA, Brokerage, Cash, Other
TaxCategory tax_category_for_account_type(const std::string& account_type);

struct InvestmentAccount {
    std::string name;
    std::string type;
    double balance;
    double monthly_contribution;

    InvestmentAccount();
};

struct Debt {
    std::string name;
    double balance;
    std::optional<double> interest_rate;    // Percent, e.g. 6.5

    Debt();
};

// Persisted household data the engine is built from
struct FinancialSnapshot {
    int birth_year;
    int target_retirement_age;
    RiskTolerance risk_tolerance;
    double annual_income;
    double savings_rate;                    // Percent of income
    std::optional<double> monthly_essential;
    std::optional<double> monthly_discretionary;
    std::vector<InvestmentAccount> accounts;
    std::vector<Debt> debts;
    std::vector<IncomeStream> income_streams;
    std::optional<SpendingPhaseConfig> spending_phase_config;
    std::optional<DepletionTarget> depletion_target;

    FinancialSnapshot();
};

// ============================================================================
// Overrides
// ============================================================================

// Request-level adjustments; every set value wins over the snapshot default
struct ProjectionOverrides {
    std::optional<double> expected_return;
    std::optional<double> inflation_rate;
    std::optional<int> retirement_age;
    std::optional<int> max_age;
    std::optional<double> contribution_growth_rate;
    std::optional<ContributionAllocation> contribution_allocation;
    std::optional<double> annual_healthcare_costs;
    std::optional<double> healthcare_inflation_rate;
    std::optional<std::vector<IncomeStream>> income_streams;
    std::optional<int> social_security_age;         // Used only for the estimated stream
    std::optional<double> social_security_monthly;
    std::optional<SpendingPhaseConfig> spending_phase_config;
    std::optional<DepletionTarget> depletion_target;
    std::optional<double> reserve_floor;

    ProjectionOverrides();
};

// Accepted override ranges
constexpr double MAX_OVERRIDE_EXPECTED_RETURN = 0.30;
constexpr double MAX_OVERRIDE_INFLATION_RATE = 0.10;
constexpr int MIN_OVERRIDE_RETIREMENT_AGE = 30;
constexpr int MAX_OVERRIDE_RETIREMENT_AGE = 80;
constexpr int MIN_OVERRIDE_MAX_AGE = 50;
constexpr double MAX_OVERRIDE_CONTRIBUTION_GROWTH = 0.10;
constexpr double MAX_OVERRIDE_HEALTHCARE_COSTS = 100000.0;

// Throws ValidationError on the first override outside its accepted range
void validate_overrides(const ProjectionOverrides& overrides);

// Id of the Social Security stream estimated from income when no streams are given
extern const char* const ESTIMATED_SOCIAL_SECURITY_ID;

// Income streams from the overrides, else the snapshot, else a single
// estimated Social Security stream (none when the estimate is zero)
std::vector<IncomeStream> resolve_income_streams(const FinancialSnapshot& snapshot,
                                                 const ProjectionOverrides& overrides);

// Derive a ProjectionInput from a snapshot as of a calendar year.
// Overrides are validated first. The result is validated before it is returned.
ProjectionInput build_projection_input_from_snapshot(
    const FinancialSnapshot& snapshot,
    const ProjectionOverrides& overrides,
    int as_of_year
);

} // namespace retireplan

#endif // RETIREPLAN_INPUT_BUILDER_HPP
