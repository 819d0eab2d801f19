#include "assumptions.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retireplan {

namespace {

// Social Security estimation
constexpr double SS_TIER1_LIMIT = 30000.0;
constexpr double SS_TIER2_LIMIT = 80000.0;
constexpr double SS_TIER1_RATE = 0.55;
constexpr double SS_TIER2_RATE = 0.40;
constexpr double SS_TIER3_RATE = 0.30;
constexpr double SS_BENEFIT_FACTOR = 0.8;
constexpr double SS_MAX_MONTHLY = 4500.0;

constexpr double MAX_EXPENSE_SHARE_OF_INCOME = 0.8;

} // anonymous namespace

std::string risk_tolerance_to_string(RiskTolerance risk) {
    switch (risk) {
        case RiskTolerance::Conservative: return "conservative";
        case RiskTolerance::Moderate: return "moderate";
        case RiskTolerance::Aggressive: return "aggressive";
    }
    return "moderate";
}

RiskTolerance risk_tolerance_from_string(const std::string& str) {
    if (str == "conservative") return RiskTolerance::Conservative;
    if (str == "moderate") return RiskTolerance::Moderate;
    if (str == "aggressive") return RiskTolerance::Aggressive;
    throw std::invalid_argument("Unknown risk tolerance: " + str);
}

AssumptionDefaults::AssumptionDefaults()
    : inflation_rate(0.025),
      max_age(90),
      social_security_age(67),
      contribution_allocation(60.0, 30.0, 10.0),
      contribution_growth_rate(0.0),
      healthcare_inflation_rate(0.05),
      debt_interest_rate(0.05),
      debt_payoff_years(10) {}

const AssumptionDefaults& default_assumptions() {
    static const AssumptionDefaults defaults;
    return defaults;
}

double expected_return_for(RiskTolerance risk) {
    switch (risk) {
        case RiskTolerance::Conservative: return 0.04;
        case RiskTolerance::Moderate: return 0.06;
        case RiskTolerance::Aggressive: return 0.08;
    }
    return 0.06;
}

double estimate_healthcare_costs(int age) {
    if (age < 65) {
        return 8000.0;
    }
    if (age < 75) {
        return 6500.0;
    }
    return 12000.0;
}

double estimate_social_security_monthly(double annual_income) {
    if (annual_income <= 0.0) {
        return 0.0;
    }

    double annual_benefit = 0.0;
    if (annual_income <= SS_TIER1_LIMIT) {
        annual_benefit = annual_income * SS_TIER1_RATE;
    } else if (annual_income <= SS_TIER2_LIMIT) {
        annual_benefit = SS_TIER1_LIMIT * SS_TIER1_RATE +
                         (annual_income - SS_TIER1_LIMIT) * SS_TIER2_RATE;
    } else {
        annual_benefit = SS_TIER1_LIMIT * SS_TIER1_RATE +
                         (SS_TIER2_LIMIT - SS_TIER1_LIMIT) * SS_TIER2_RATE +
                         (annual_income - SS_TIER2_LIMIT) * SS_TIER3_RATE;
    }

    const double monthly = annual_benefit * SS_BENEFIT_FACTOR / 12.0;
    return std::min(monthly, SS_MAX_MONTHLY);
}

double derive_annual_expenses(double annual_income, double savings_rate_percent) {
    if (annual_income <= 0.0) {
        return 0.0;
    }
    const double rate = std::clamp(savings_rate_percent, 0.0, 100.0);
    const double after_savings = annual_income * (1.0 - rate / 100.0);
    return std::min(after_savings, annual_income * MAX_EXPENSE_SHARE_OF_INCOME);
}

double estimate_annual_debt_payment(double balance, double annual_rate) {
    if (balance <= 0.0) {
        return 0.0;
    }
    const int years = default_assumptions().debt_payoff_years;
    if (annual_rate <= 0.0) {
        return balance / years;
    }
    // Level payment that amortizes the balance over the payoff horizon
    const double growth = std::pow(1.0 + annual_rate, years);
    return balance * annual_rate * growth / (growth - 1.0);
}

int rmd_start_age_for_birth_year(int birth_year) {
    if (birth_year >= 1960) {
        return 75;
    }
    if (birth_year >= 1951) {
        return 73;
    }
    return 72;
}

} // namespace retireplan
