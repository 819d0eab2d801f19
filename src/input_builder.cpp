#include "input_builder.hpp"
#include <cmath>
#include <sstream>

namespace retireplan {

TaxCategory tax_category_for_account_type(const std::string& account_type) {
    if (account_type == "401k" || account_type == "IRA") {
        return TaxCategory::TaxDeferred;
    }
    if (account_type == "Roth_IRA") {
        return TaxCategory::TaxFree;
    }
    // Brokerage, Cash, Other and anything unrecognised
    return TaxCategory::Taxable;
}

InvestmentAccount::InvestmentAccount() : balance(0.0), monthly_contribution(0.0) {}

Debt::Debt() : balance(0.0) {}

FinancialSnapshot::FinancialSnapshot()
    : birth_year(1990),
      target_retirement_age(65),
      risk_tolerance(RiskTolerance::Moderate),
      annual_income(0.0),
      savings_rate(0.0) {}

ProjectionOverrides::ProjectionOverrides() = default;

namespace {

void check_range(double value, double min, double max, const std::string& field) {
    if (!std::isfinite(value) || value < min || value > max) {
        std::ostringstream invariant;
        invariant << "must be between " << min << " and " << max;
        throw ValidationError(field, invariant.str());
    }
}

void check_range(int value, int min, int max, const std::string& field) {
    if (value < min || value > max) {
        throw ValidationError(field, "must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
}

} // anonymous namespace

void validate_overrides(const ProjectionOverrides& overrides) {
    if (overrides.expected_return) {
        check_range(*overrides.expected_return, 0.0, MAX_OVERRIDE_EXPECTED_RETURN, "expectedReturn");
    }
    if (overrides.inflation_rate) {
        check_range(*overrides.inflation_rate, 0.0, MAX_OVERRIDE_INFLATION_RATE, "inflationRate");
    }
    if (overrides.retirement_age) {
        check_range(*overrides.retirement_age, MIN_OVERRIDE_RETIREMENT_AGE, MAX_OVERRIDE_RETIREMENT_AGE,
                    "retirementAge");
    }
    if (overrides.max_age) {
        check_range(*overrides.max_age, MIN_OVERRIDE_MAX_AGE, MAX_PROJECTION_AGE, "maxAge");
    }
    if (overrides.contribution_growth_rate) {
        check_range(*overrides.contribution_growth_rate, 0.0, MAX_OVERRIDE_CONTRIBUTION_GROWTH,
                    "contributionGrowthRate");
    }
    if (overrides.annual_healthcare_costs) {
        check_range(*overrides.annual_healthcare_costs, 0.0, MAX_OVERRIDE_HEALTHCARE_COSTS,
                    "annualHealthcareCosts");
    }
    if (overrides.healthcare_inflation_rate) {
        check_range(*overrides.healthcare_inflation_rate, 0.0, 1.0, "healthcareInflationRate");
    }
    if (overrides.social_security_age) {
        check_range(*overrides.social_security_age, 62, 70, "socialSecurityAge");
    }
    if (overrides.social_security_monthly) {
        check_range(*overrides.social_security_monthly, 0.0, 10000.0, "socialSecurityMonthly");
    }
    if (overrides.reserve_floor) {
        if (!std::isfinite(*overrides.reserve_floor) || *overrides.reserve_floor < 0.0) {
            throw ValidationError("reserveFloor", "must be non-negative");
        }
    }

    if (overrides.contribution_allocation) {
        const ContributionAllocation& alloc = *overrides.contribution_allocation;
        check_range(alloc.tax_deferred, 0.0, 100.0, "contributionAllocation.taxDeferred");
        check_range(alloc.tax_free, 0.0, 100.0, "contributionAllocation.taxFree");
        check_range(alloc.taxable, 0.0, 100.0, "contributionAllocation.taxable");
        if (alloc.sum() != 100.0) {
            throw ValidationError("contributionAllocation", "percentages must sum to exactly 100");
        }
    }

    if (overrides.spending_phase_config) {
        const std::vector<SpendingPhase>& phases = overrides.spending_phase_config->phases;
        if (phases.size() > MAX_SPENDING_PHASES) {
            throw ValidationError("spendingPhaseConfig.phases", "must contain at most 4 phases");
        }
        for (size_t i = 1; i < phases.size(); ++i) {
            if (phases[i].start_age <= phases[i - 1].start_age) {
                throw ValidationError("spendingPhaseConfig.phases[" + std::to_string(i) + "].startAge",
                                      "start ages must be strictly ascending");
            }
        }
    }

    if (overrides.income_streams) {
        const std::vector<IncomeStream>& streams = *overrides.income_streams;
        for (size_t i = 0; i < streams.size(); ++i) {
            const std::string base = "incomeStreams[" + std::to_string(i) + "]";
            check_range(streams[i].start_age, 0, MAX_PROJECTION_AGE, base + ".startAge");
            if (streams[i].end_age) {
                check_range(*streams[i].end_age, 0, MAX_PROJECTION_AGE, base + ".endAge");
            }
        }
    }
}

const char* const ESTIMATED_SOCIAL_SECURITY_ID = "ss-auto";

std::vector<IncomeStream> resolve_income_streams(const FinancialSnapshot& snapshot,
                                                 const ProjectionOverrides& overrides) {
    if (overrides.income_streams && !overrides.income_streams->empty()) {
        return *overrides.income_streams;
    }
    if (!snapshot.income_streams.empty()) {
        return snapshot.income_streams;
    }

    const double monthly = overrides.social_security_monthly.value_or(
        estimate_social_security_monthly(snapshot.annual_income));
    if (monthly <= 0.0) {
        return {};
    }

    IncomeStream stream;
    stream.id = ESTIMATED_SOCIAL_SECURITY_ID;
    stream.name = "Social Security";
    stream.type = IncomeStreamType::SocialSecurity;
    stream.annual_amount = monthly * 12.0;
    stream.start_age = overrides.social_security_age.value_or(default_assumptions().social_security_age);
    stream.inflation_adjusted = true;
    stream.is_guaranteed = true;
    return {stream};
}

ProjectionInput build_projection_input_from_snapshot(
    const FinancialSnapshot& snapshot,
    const ProjectionOverrides& overrides,
    int as_of_year)
{
    validate_overrides(overrides);
    const AssumptionDefaults& defaults = default_assumptions();

    ProjectionInput input;
    input.current_age = as_of_year - snapshot.birth_year;
    input.retirement_age = overrides.retirement_age.value_or(snapshot.target_retirement_age);
    input.max_age = overrides.max_age.value_or(defaults.max_age);

    // Balances and contributions by account tax treatment
    input.balances_by_type = BalanceByType();
    input.annual_contribution = 0.0;
    for (const InvestmentAccount& account : snapshot.accounts) {
        input.balances_by_type.add(tax_category_for_account_type(account.type), account.balance);
        input.annual_contribution += account.monthly_contribution * 12.0;
    }
    input.contribution_allocation = overrides.contribution_allocation.value_or(defaults.contribution_allocation);

    input.expected_return = overrides.expected_return.value_or(expected_return_for(snapshot.risk_tolerance));
    input.inflation_rate = overrides.inflation_rate.value_or(defaults.inflation_rate);
    input.contribution_growth_rate = overrides.contribution_growth_rate.value_or(defaults.contribution_growth_rate);

    // Stated monthly budget wins; otherwise spending is inferred from income and savings rate
    if (snapshot.monthly_essential || snapshot.monthly_discretionary) {
        input.annual_essential_expenses = snapshot.monthly_essential.value_or(0.0) * 12.0;
        input.annual_discretionary_expenses = snapshot.monthly_discretionary.value_or(0.0) * 12.0;
        input.annual_expenses = input.annual_essential_expenses + input.annual_discretionary_expenses;
    } else {
        input.annual_expenses = derive_annual_expenses(snapshot.annual_income, snapshot.savings_rate);
    }

    input.annual_healthcare_costs =
        overrides.annual_healthcare_costs.value_or(estimate_healthcare_costs(input.retirement_age));
    input.healthcare_inflation_rate =
        overrides.healthcare_inflation_rate.value_or(defaults.healthcare_inflation_rate);

    input.income_streams = resolve_income_streams(snapshot, overrides);

    input.annual_debt_payments = 0.0;
    for (const Debt& debt : snapshot.debts) {
        const double rate = debt.interest_rate ? *debt.interest_rate / 100.0 : defaults.debt_interest_rate;
        input.annual_debt_payments += estimate_annual_debt_payment(debt.balance, rate);
    }
    if (input.annual_debt_payments > 0.0) {
        input.debt_payoff_age = input.current_age + defaults.debt_payoff_years;
    }

    input.spending_phase_config = overrides.spending_phase_config
        ? overrides.spending_phase_config
        : snapshot.spending_phase_config;
    input.depletion_target = overrides.depletion_target
        ? overrides.depletion_target
        : snapshot.depletion_target;
    input.reserve_floor = overrides.reserve_floor;

    input.rmd.enabled = true;
    input.rmd.start_age = rmd_start_age_for_birth_year(snapshot.birth_year);

    validate_projection_input(input);
    return input;
}

} // namespace retireplan
