#ifndef RETIREPLAN_SPENDING_COMPARISON_HPP
#define RETIREPLAN_SPENDING_COMPARISON_HPP

#include "projection.hpp"
#include "projection_input.hpp"
#include <optional>
#include <string>
#include <vector>

namespace retireplan {

constexpr int DEFAULT_EARLY_YEARS = 10;

// Cumulative spending within this many dollars counts as broken even
constexpr double BREAK_EVEN_TOLERANCE = 100.0;

// Funded spending in one retirement year
struct YearlySpending {
    int age;
    double amount;
    std::string phase_name;         // Empty for the flat series

    YearlySpending();
};

struct SpendingStrategyOutcome {
    double total_lifetime_spending;     // Sum of retirement-year outflows
    std::optional<int> depletion_age;
    double ending_balance;
    std::vector<YearlySpending> yearly_spending;

    SpendingStrategyOutcome();
};

struct SpendingComparison {
    SpendingStrategyOutcome flat;
    SpendingStrategyOutcome phased;
    int early_years;
    double early_years_bonus;           // Phased minus flat spending over the early years
    std::optional<int> break_even_age;  // Where cumulative phased spending meets flat
    int longevity_difference;           // Years the phased portfolio outlasts the flat one

    SpendingComparison();
};

// Run the plan twice, once with spending phases removed and once as given,
// and compare what each strategy actually lets the holder spend.
// A plan that never depletes counts as lasting to max_age + 1.
SpendingComparison calculate_spending_comparison(
    const ProjectionInput& input,
    int early_years = DEFAULT_EARLY_YEARS,
    const ProjectionConfig& config = ProjectionConfig()
);

} // namespace retireplan

#endif // RETIREPLAN_SPENDING_COMPARISON_HPP
