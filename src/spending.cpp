#include "spending.hpp"
#include <algorithm>
#include <cmath>

namespace retireplan {

PhaseAdjustedExpenses::PhaseAdjustedExpenses() : essential(0.0), discretionary(0.0) {}

std::vector<SpendingPhase> sorted_phases(const SpendingPhaseConfig& config) {
    std::vector<SpendingPhase> phases = config.phases;
    std::stable_sort(phases.begin(), phases.end(), [](const SpendingPhase& a, const SpendingPhase& b) {
        return a.start_age < b.start_age;
    });
    return phases;
}

const SpendingPhase* find_active_phase(const std::vector<SpendingPhase>& sorted, int age) {
    if (sorted.empty()) {
        return nullptr;
    }
    const SpendingPhase* active = &sorted.front();
    for (const SpendingPhase& phase : sorted) {
        if (phase.start_age <= age) {
            active = &phase;
        } else {
            break;
        }
    }
    return active;
}

PhaseAdjustedExpenses real_expenses_at(const ProjectionInput& input, int age) {
    PhaseAdjustedExpenses expenses;
    const double base_essential = input.base_essential_expenses();
    const double base_discretionary = input.base_discretionary_expenses();

    if (!input.phases_enabled()) {
        expenses.essential = base_essential;
        expenses.discretionary = base_discretionary;
        return expenses;
    }

    const std::vector<SpendingPhase> phases = sorted_phases(*input.spending_phase_config);
    const SpendingPhase* phase = find_active_phase(phases, age);

    // Absolute overrides replace base * multiplier
    expenses.essential = phase->absolute_essential
        ? *phase->absolute_essential
        : base_essential * phase->essential_multiplier;
    expenses.discretionary = phase->absolute_discretionary
        ? *phase->absolute_discretionary
        : base_discretionary * phase->discretionary_multiplier;
    expenses.phase_name = phase->name;
    return expenses;
}

double retirement_inflation_factor(const ProjectionInput& input, int age) {
    if (age <= input.retirement_age) {
        return 1.0;
    }
    return std::pow(1.0 + input.inflation_rate, age - input.retirement_age);
}

PhaseAdjustedExpenses nominal_expenses_at(const ProjectionInput& input, int age) {
    PhaseAdjustedExpenses expenses = real_expenses_at(input, age);
    const double factor = retirement_inflation_factor(input, age);
    expenses.essential *= factor;
    expenses.discretionary *= factor;
    return expenses;
}

void scale_spending(ProjectionInput& input, double factor) {
    input.annual_essential_expenses *= factor;
    input.annual_discretionary_expenses *= factor;
    input.annual_expenses *= factor;
    if (input.spending_phase_config) {
        for (SpendingPhase& phase : input.spending_phase_config->phases) {
            if (phase.absolute_essential) *phase.absolute_essential *= factor;
            if (phase.absolute_discretionary) *phase.absolute_discretionary *= factor;
        }
    }
}

double healthcare_cost_at(const ProjectionInput& input, int age) {
    if (input.annual_healthcare_costs <= 0.0) {
        return 0.0;
    }
    const int years = std::max(0, age - input.retirement_age);
    return input.annual_healthcare_costs * std::pow(1.0 + input.healthcare_inflation_rate, years);
}

} // namespace retireplan
