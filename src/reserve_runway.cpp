#include "reserve_runway.hpp"
#include <algorithm>
#include <cmath>

namespace retireplan {

RunwayYears::RunwayYears() : unlimited(false), years(0) {}

RunwayYears RunwayYears::unlimited_runway() {
    RunwayYears runway;
    runway.unlimited = true;
    return runway;
}

RunwayYears RunwayYears::of(int years) {
    RunwayYears runway;
    runway.years = years;
    return runway;
}

ReserveRunway::ReserveRunway() : reserve_amount(0.0), essential_gap(0.0) {}

RunwayYears years_of_coverage(double reserve, double annual_need, double inflation_rate) {
    if (annual_need <= 0.0) {
        return RunwayYears::unlimited_runway();
    }
    if (reserve <= 0.0) {
        return RunwayYears::of(0);
    }

    double remaining = reserve;
    double need = annual_need;
    int years = 0;
    while (years < MAX_RUNWAY_YEARS) {
        remaining -= need;
        if (remaining < 0.0) {
            break;
        }
        ++years;
        need *= (1.0 + inflation_rate);
    }
    return RunwayYears::of(years);
}

std::string describe_runway(const RunwayYears& runway, double reserve, double annual_need) {
    if (runway.unlimited) {
        return "Guaranteed income covers all essential expenses";
    }
    if (runway.years >= 30) {
        return "30+ years";
    }
    if (runway.years >= 1) {
        return "~" + std::to_string(runway.years) + (runway.years == 1 ? " year" : " years");
    }
    // Less than a year: express as months of the first year's need
    const int months = annual_need > 0.0
        ? static_cast<int>(std::floor(reserve / (annual_need / 12.0)))
        : 0;
    return "~" + std::to_string(months) + (months == 1 ? " month" : " months");
}

ReserveRunway calculate_reserve_runway(
    double reserve_amount,
    double essential_expenses,
    double discretionary_expenses,
    double guaranteed_income,
    double inflation_rate)
{
    ReserveRunway runway;
    runway.reserve_amount = reserve_amount;
    runway.essential_gap = std::max(0.0, essential_expenses - guaranteed_income);

    runway.essentials_runway = years_of_coverage(reserve_amount, runway.essential_gap, inflation_rate);

    const double full_need = std::max(0.0, essential_expenses + discretionary_expenses - guaranteed_income);
    runway.full_spending_runway = years_of_coverage(reserve_amount, full_need, inflation_rate);

    runway.description = describe_runway(runway.essentials_runway, reserve_amount, runway.essential_gap);
    return runway;
}

} // namespace retireplan
