#ifndef RETIREPLAN_ASSUMPTIONS_HPP
#define RETIREPLAN_ASSUMPTIONS_HPP

#include "balances.hpp"
#include <string>

namespace retireplan {

enum class RiskTolerance {
    Conservative,
    Moderate,
    Aggressive
};

std::string risk_tolerance_to_string(RiskTolerance risk);
RiskTolerance risk_tolerance_from_string(const std::string& str);

// Defaults applied when a snapshot or override does not supply a value
struct AssumptionDefaults {
    double inflation_rate;
    int max_age;
    int social_security_age;
    ContributionAllocation contribution_allocation;
    double contribution_growth_rate;
    double healthcare_inflation_rate;
    double debt_interest_rate;
    int debt_payoff_years;

    AssumptionDefaults();
};

const AssumptionDefaults& default_assumptions();

// Nominal expected return by risk tolerance: 4% / 6% / 8%
double expected_return_for(RiskTolerance risk);

// Annual out-of-pocket healthcare cost for an age: pre-Medicare (<65),
// early Medicare (65-74), later years (75+)
double estimate_healthcare_costs(int age);

// Monthly Social Security benefit estimate from annual income. Uses tiered
// replacement rates (55% to 30k, 40% to 80k, 30% above), an 80% benefit
// factor, and the monthly maximum. Returns 0 for non-positive income.
double estimate_social_security_monthly(double annual_income);

// Annual spending implied by income and savings rate (percent), capped at 80% of income
double derive_annual_expenses(double annual_income, double savings_rate_percent);

// Annual payment that retires a balance over the default payoff horizon.
// A rate of 0 falls back to straight-line repayment.
double estimate_annual_debt_payment(double balance, double annual_rate);

// RMD trigger age under current law for a birth year
int rmd_start_age_for_birth_year(int birth_year);

} // namespace retireplan

#endif // RETIREPLAN_ASSUMPTIONS_HPP
