#include "spending_comparison.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retireplan {

YearlySpending::YearlySpending() : age(0), amount(0.0) {}

SpendingStrategyOutcome::SpendingStrategyOutcome()
    : total_lifetime_spending(0.0), ending_balance(0.0) {}

SpendingComparison::SpendingComparison()
    : early_years(DEFAULT_EARLY_YEARS),
      early_years_bonus(0.0),
      longevity_difference(0) {}

namespace {

double round_cents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

SpendingStrategyOutcome summarize_strategy(const ProjectionResult& result, int retirement_age,
                                           bool with_phase_names) {
    SpendingStrategyOutcome outcome;
    outcome.depletion_age = result.summary.depletion_age;
    outcome.ending_balance = result.summary.ending_balance;

    for (const ProjectionRecord& record : result.records) {
        if (record.age < retirement_age) {
            continue;
        }
        outcome.total_lifetime_spending += record.outflows;

        YearlySpending year;
        year.age = record.age;
        year.amount = round_cents(record.outflows);
        if (with_phase_names) {
            year.phase_name = record.active_phase_name;
        }
        outcome.yearly_spending.push_back(year);
    }
    return outcome;
}

double early_spending(const ProjectionResult& result, int retirement_age, int years) {
    double total = 0.0;
    for (const ProjectionRecord& record : result.records) {
        if (record.age >= retirement_age && record.age < retirement_age + years) {
            total += record.outflows;
        }
    }
    return total;
}

// First retirement age where the cumulative difference changes sign or closes
// back within the tolerance after having opened beyond it
std::optional<int> find_break_even_age(const ProjectionResult& flat, const ProjectionResult& phased,
                                       int retirement_age) {
    double flat_cumulative = 0.0;
    double phased_cumulative = 0.0;
    bool diverged = false;

    const size_t count = std::min(flat.records.size(), phased.records.size());
    for (size_t i = 0; i < count; ++i) {
        const ProjectionRecord& flat_record = flat.records[i];
        if (flat_record.age < retirement_age) {
            continue;
        }
        const double previous_diff = phased_cumulative - flat_cumulative;
        flat_cumulative += flat_record.outflows;
        phased_cumulative += phased.records[i].outflows;
        const double diff = phased_cumulative - flat_cumulative;

        if ((previous_diff > 0.0 && diff <= 0.0) || (previous_diff < 0.0 && diff >= 0.0)) {
            return flat_record.age;
        }
        if (diverged && std::abs(diff) < BREAK_EVEN_TOLERANCE) {
            return flat_record.age;
        }
        if (std::abs(diff) >= BREAK_EVEN_TOLERANCE) {
            diverged = true;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

SpendingComparison calculate_spending_comparison(const ProjectionInput& input, int early_years,
                                                 const ProjectionConfig& config) {
    if (early_years < 0) {
        throw std::invalid_argument("early_years must be non-negative");
    }

    ProjectionInput flat_input = input;
    flat_input.spending_phase_config.reset();

    const ProjectionResult flat = run_projection(flat_input, config);
    const ProjectionResult phased = run_projection(input, config);

    SpendingComparison comparison;
    comparison.flat = summarize_strategy(flat, input.retirement_age, false);
    comparison.phased = summarize_strategy(phased, input.retirement_age, true);
    comparison.early_years = early_years;
    comparison.early_years_bonus = early_spending(phased, input.retirement_age, early_years) -
                                   early_spending(flat, input.retirement_age, early_years);
    comparison.break_even_age = find_break_even_age(flat, phased, input.retirement_age);

    const int never = input.max_age + 1;
    comparison.longevity_difference = phased.summary.depletion_age.value_or(never) -
                                      flat.summary.depletion_age.value_or(never);
    return comparison;
}

} // namespace retireplan
