#ifndef RETIREPLAN_INCOME_STREAMS_HPP
#define RETIREPLAN_INCOME_STREAMS_HPP

#include "projection_input.hpp"
#include <vector>

namespace retireplan {

enum class IncomeFilter {
    All,
    GuaranteedOnly
};

// A stream applies when start_age <= age and (no end_age or age <= end_age)
bool stream_active_at(const IncomeStream& stream, int age);

// Annual amount one stream pays at an age. Inflation-adjusted streams grow by
// (1 + inflation)^(age - start_age); the rest stay nominal and erode in real terms.
double stream_income_at(const IncomeStream& stream, int age, double inflation_rate);

// Total annual income from all applicable streams at an age
double resolve_income(
    const std::vector<IncomeStream>& streams,
    int age,
    double inflation_rate,
    IncomeFilter filter = IncomeFilter::All
);

// Sum of nominal guaranteed amounts regardless of age
double total_guaranteed_income(const std::vector<IncomeStream>& streams);

bool has_guaranteed_income(const std::vector<IncomeStream>& streams);

// Earliest age at which any guaranteed stream pays, or -1 when none exists
int earliest_guaranteed_start_age(const std::vector<IncomeStream>& streams);

} // namespace retireplan

#endif // RETIREPLAN_INCOME_STREAMS_HPP
