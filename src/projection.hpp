#ifndef RETIREPLAN_PROJECTION_HPP
#define RETIREPLAN_PROJECTION_HPP

#include "balances.hpp"
#include "projection_input.hpp"
#include "rmd_table.hpp"
#include "withdrawal.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace retireplan {

// Required vs. actually withdrawn from tax-deferred accounts
struct RmdDetail {
    double required;
    double taken;
    double reinvested;              // Portion moved to taxable because it exceeded the need

    RmdDetail();
};

// How far spending was cut to keep the portfolio above the reserve floor
enum class ReductionStage {
    None,
    DiscretionaryReduced,
    EssentialsOnly,
    EssentialsReduced
};

std::string reduction_stage_to_string(ReductionStage stage);
ReductionStage reduction_stage_from_string(const std::string& str);

// One simulated year. Balances are end-of-year, after draws and growth.
struct ProjectionRecord {
    int age;
    int year;                       // Calendar year
    bool retired;                   // Decumulation year
    double starting_balance;        // Total carried in from the prior year
    double balance;                 // Total at year end
    BalanceByType balance_by_type;
    double inflows;                 // Contributions, or income once retired
    double outflows;                // Spending actually funded once retired
    double contribution;
    double withdrawal;              // Net draw that left the portfolio
    std::optional<BalanceByType> withdrawals_by_type;  // Gross draw per category, decumulation only
    double income;
    double essential_expenses;      // Planned, nominal
    double discretionary_expenses;
    double healthcare_expenses;
    double debt_payments;
    double actual_essential_spending;
    double actual_discretionary_spending;
    std::string active_phase_name;
    std::optional<RmdDetail> rmd;
    bool reserve_constrained;
    ReductionStage reduction_stage;
    double spending_shortfall;
    std::optional<double> reserve_balance;  // Balance above the floor, when a floor is set
    double investment_growth;

    ProjectionRecord();
};

struct ProjectionSummary {
    double starting_balance;
    double projected_retirement_balance;    // Balance carried into the retirement year
    double ending_balance;
    double total_contributions;
    double total_withdrawals;
    std::optional<int> years_until_depletion;  // Measured from retirement_age
    std::optional<int> depletion_age;
    std::optional<double> reserve_floor;
    int years_reserve_constrained;
    std::optional<int> first_reserve_constraint_age;

    ProjectionSummary();
};

struct ProjectionResult {
    std::vector<ProjectionRecord> records;
    ProjectionSummary summary;
    ProjectionAssumptions assumptions;

    ProjectionResult();
    ProjectionResult(std::vector<ProjectionRecord>&& records_, const ProjectionSummary& summary_,
                     const ProjectionAssumptions& assumptions_);

    // Record for an age, or nullptr when the age is outside the projection
    const ProjectionRecord* record_at(int age) const;
};

// Reference data and strategy injected into a run
struct ProjectionConfig {
    int start_year;                 // Calendar year of the current_age record
    std::shared_ptr<const RmdTable> rmd_table;
    std::shared_ptr<const WithdrawalPolicy> withdrawal_policy;

    ProjectionConfig();
};

std::shared_ptr<const RmdTable> default_rmd_table();

// Simulate one portfolio year by year from current_age to max_age inclusive.
//
// Each year:
// - Before retirement_age: add the (growing) contribution net of debt
//   payments split by allocation, take any RMD, then grow every category.
// - From retirement_age: inflate phase-adjusted spending and healthcare from
//   the retirement baseline, add debt payments, subtract income, draw the
//   net need through the withdrawal policy (surplus goes to taxable), then
//   grow every category.
// - Once a retirement year ends at zero the portfolio stays at zero.
//
// Throws ValidationError if the input breaks an invariant. Output depends only
// on the input and config.
ProjectionResult run_projection(
    const ProjectionInput& input,
    const ProjectionConfig& config = ProjectionConfig()
);

} // namespace retireplan

#endif // RETIREPLAN_PROJECTION_HPP
