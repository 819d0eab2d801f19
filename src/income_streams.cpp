#include "income_streams.hpp"
#include <cmath>

namespace retireplan {

bool stream_active_at(const IncomeStream& stream, int age) {
    if (age < stream.start_age) {
        return false;
    }
    return !stream.end_age || age <= *stream.end_age;
}

double stream_income_at(const IncomeStream& stream, int age, double inflation_rate) {
    if (!stream_active_at(stream, age)) {
        return 0.0;
    }
    if (!stream.inflation_adjusted) {
        return stream.annual_amount;
    }
    return stream.annual_amount * std::pow(1.0 + inflation_rate, age - stream.start_age);
}

double resolve_income(
    const std::vector<IncomeStream>& streams,
    int age,
    double inflation_rate,
    IncomeFilter filter)
{
    double total = 0.0;
    for (const IncomeStream& stream : streams) {
        if (filter == IncomeFilter::GuaranteedOnly && !stream.is_guaranteed) {
            continue;
        }
        total += stream_income_at(stream, age, inflation_rate);
    }
    return total;
}

double total_guaranteed_income(const std::vector<IncomeStream>& streams) {
    double total = 0.0;
    for (const IncomeStream& stream : streams) {
        if (stream.is_guaranteed) {
            total += stream.annual_amount;
        }
    }
    return total;
}

bool has_guaranteed_income(const std::vector<IncomeStream>& streams) {
    for (const IncomeStream& stream : streams) {
        if (stream.is_guaranteed && stream.annual_amount > 0.0) {
            return true;
        }
    }
    return false;
}

int earliest_guaranteed_start_age(const std::vector<IncomeStream>& streams) {
    int earliest = -1;
    for (const IncomeStream& stream : streams) {
        if (!stream.is_guaranteed || stream.annual_amount <= 0.0) {
            continue;
        }
        if (earliest < 0 || stream.start_age < earliest) {
            earliest = stream.start_age;
        }
    }
    return earliest;
}

} // namespace retireplan
