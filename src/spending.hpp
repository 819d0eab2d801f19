#ifndef RETIREPLAN_SPENDING_HPP
#define RETIREPLAN_SPENDING_HPP

#include "projection_input.hpp"
#include <string>
#include <vector>

namespace retireplan {

// Essential/discretionary spending for one year
struct PhaseAdjustedExpenses {
    double essential;
    double discretionary;
    std::string phase_name;         // Empty when spending is flat

    PhaseAdjustedExpenses();

    double total() const { return essential + discretionary; }
};

// Phases ordered by ascending start age
std::vector<SpendingPhase> sorted_phases(const SpendingPhaseConfig& config);

// Phase in effect at an age: the latest phase starting at or before it.
// Ages before the first phase fall into the first phase. Returns nullptr
// when the config has no phases.
const SpendingPhase* find_active_phase(const std::vector<SpendingPhase>& sorted, int age);

// Spending at an age in today's dollars (no inflation applied)
PhaseAdjustedExpenses real_expenses_at(const ProjectionInput& input, int age);

// Spending at an age in nominal dollars, inflated from the retirement-age
// baseline by (1 + inflation)^(age - retirement_age)
PhaseAdjustedExpenses nominal_expenses_at(const ProjectionInput& input, int age);

// Healthcare costs inflated from retirement by the healthcare inflation rate
double healthcare_cost_at(const ProjectionInput& input, int age);

// Scale every spending line (split, legacy flat figure, absolute phase overrides)
void scale_spending(ProjectionInput& input, double factor);

// (1 + inflation)^(age - retirement_age), 1.0 before retirement
double retirement_inflation_factor(const ProjectionInput& input, int age);

} // namespace retireplan

#endif // RETIREPLAN_SPENDING_HPP
