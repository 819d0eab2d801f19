#ifndef RETIREPLAN_RESERVE_RUNWAY_HPP
#define RETIREPLAN_RESERVE_RUNWAY_HPP

#include <string>

namespace retireplan {

// Years a reserve lasts. `unlimited` is set when guaranteed income covers the
// need outright; `years` is then meaningless and left at 0.
struct RunwayYears {
    bool unlimited;
    int years;

    RunwayYears();

    static RunwayYears unlimited_runway();
    static RunwayYears of(int years);
};

struct ReserveRunway {
    double reserve_amount;
    double essential_gap;           // Essential expenses not met by guaranteed income
    RunwayYears essentials_runway;  // Covering only the essential gap
    RunwayYears full_spending_runway;  // Covering the gap plus discretionary spending
    std::string description;        // Human-readable essentials runway

    ReserveRunway();
};

constexpr int MAX_RUNWAY_YEARS = 100;

// Years a reserve covers a yearly need that grows with inflation. The need
// is subtracted, then inflated, until the reserve is exhausted; partial
// years do not count. Capped at MAX_RUNWAY_YEARS.
RunwayYears years_of_coverage(double reserve, double annual_need, double inflation_rate);

ReserveRunway calculate_reserve_runway(
    double reserve_amount,
    double essential_expenses,
    double discretionary_expenses,
    double guaranteed_income,
    double inflation_rate
);

// "Guaranteed income covers all essential expenses", "30+ years", "~12 years", "~8 months"
std::string describe_runway(const RunwayYears& runway, double reserve, double annual_need);

} // namespace retireplan

#endif // RETIREPLAN_RESERVE_RUNWAY_HPP
