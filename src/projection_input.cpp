#include "projection_input.hpp"
#include <cmath>
#include <set>
#include <sstream>

namespace retireplan {

ValidationError::ValidationError(const std::string& field, const std::string& invariant)
    : std::invalid_argument("Invalid projection input: " + field + ": " + invariant),
      field_(field),
      invariant_(invariant) {}

// ============================================================================
// Enum conversions
// ============================================================================

std::string income_stream_type_to_string(IncomeStreamType type) {
    switch (type) {
        case IncomeStreamType::SocialSecurity: return "social_security";
        case IncomeStreamType::Pension: return "pension";
        case IncomeStreamType::Rental: return "rental";
        case IncomeStreamType::Annuity: return "annuity";
        case IncomeStreamType::PartTime: return "part_time";
        case IncomeStreamType::Other: return "other";
    }
    return "other";
}

IncomeStreamType income_stream_type_from_string(const std::string& str) {
    if (str == "social_security") return IncomeStreamType::SocialSecurity;
    if (str == "pension") return IncomeStreamType::Pension;
    if (str == "rental") return IncomeStreamType::Rental;
    if (str == "annuity") return IncomeStreamType::Annuity;
    if (str == "part_time") return IncomeStreamType::PartTime;
    if (str == "other") return IncomeStreamType::Other;
    throw std::invalid_argument("Unknown income stream type: " + str);
}

bool default_is_guaranteed(IncomeStreamType type) {
    return type == IncomeStreamType::SocialSecurity ||
           type == IncomeStreamType::Pension ||
           type == IncomeStreamType::Annuity;
}

std::string reserve_type_to_string(ReserveType type) {
    switch (type) {
        case ReserveType::Derived: return "derived";
        case ReserveType::Percentage: return "percentage";
        case ReserveType::Absolute: return "absolute";
    }
    return "derived";
}

ReserveType reserve_type_from_string(const std::string& str) {
    if (str == "derived") return ReserveType::Derived;
    if (str == "percentage") return ReserveType::Percentage;
    if (str == "absolute") return ReserveType::Absolute;
    throw std::invalid_argument("Unknown reserve type: " + str);
}

std::string reserve_purpose_to_string(ReservePurpose purpose) {
    switch (purpose) {
        case ReservePurpose::LongTermCare: return "long-term-care";
        case ReservePurpose::Legacy: return "legacy";
        case ReservePurpose::Emergency: return "emergency";
        case ReservePurpose::PeaceOfMind: return "peace-of-mind";
    }
    return "peace-of-mind";
}

ReservePurpose reserve_purpose_from_string(const std::string& str) {
    if (str == "long-term-care") return ReservePurpose::LongTermCare;
    if (str == "legacy") return ReservePurpose::Legacy;
    if (str == "emergency") return ReservePurpose::Emergency;
    if (str == "peace-of-mind") return ReservePurpose::PeaceOfMind;
    throw std::invalid_argument("Unknown reserve purpose: " + str);
}

// ============================================================================
// Value type constructors and comparisons
// ============================================================================

IncomeStream::IncomeStream()
    : type(IncomeStreamType::Other),
      annual_amount(0.0),
      start_age(0),
      inflation_adjusted(false),
      is_guaranteed(false) {}

bool IncomeStream::operator==(const IncomeStream& other) const {
    return id == other.id &&
           name == other.name &&
           type == other.type &&
           annual_amount == other.annual_amount &&
           start_age == other.start_age &&
           end_age == other.end_age &&
           inflation_adjusted == other.inflation_adjusted &&
           is_guaranteed == other.is_guaranteed &&
           is_spouse == other.is_spouse;
}

SpendingPhase::SpendingPhase()
    : start_age(0), essential_multiplier(1.0), discretionary_multiplier(1.0) {}

SpendingPhase::SpendingPhase(const std::string& id_, const std::string& name_, int start_age_,
                             double essential_multiplier_, double discretionary_multiplier_)
    : id(id_), name(name_), start_age(start_age_),
      essential_multiplier(essential_multiplier_),
      discretionary_multiplier(discretionary_multiplier_) {}

bool SpendingPhase::operator==(const SpendingPhase& other) const {
    return id == other.id &&
           name == other.name &&
           start_age == other.start_age &&
           essential_multiplier == other.essential_multiplier &&
           discretionary_multiplier == other.discretionary_multiplier &&
           absolute_essential == other.absolute_essential &&
           absolute_discretionary == other.absolute_discretionary;
}

SpendingPhaseConfig::SpendingPhaseConfig() : enabled(false) {}

bool SpendingPhaseConfig::operator==(const SpendingPhaseConfig& other) const {
    return enabled == other.enabled && phases == other.phases;
}

std::vector<SpendingPhase> default_spending_phases() {
    return {
        SpendingPhase("go-go", "Go-Go Years", 65, 1.0, 1.1),
        SpendingPhase("slow-go", "Slow-Go Years", 75, 0.95, 0.75),
        SpendingPhase("no-go", "No-Go Years", 85, 0.9, 0.5)
    };
}

ReserveConfig::ReserveConfig() : type(ReserveType::Derived), amount(0.0) {}

bool ReserveConfig::operator==(const ReserveConfig& other) const {
    return type == other.type &&
           amount == other.amount &&
           purposes == other.purposes &&
           note == other.note;
}

DepletionTarget::DepletionTarget()
    : enabled(false), target_percentage_spent(80.0), target_age(85) {}

bool DepletionTarget::operator==(const DepletionTarget& other) const {
    return enabled == other.enabled &&
           target_percentage_spent == other.target_percentage_spent &&
           target_age == other.target_age &&
           reserve == other.reserve;
}

RmdConfig::RmdConfig() : enabled(true), start_age(DEFAULT_RMD_START_AGE) {}

bool RmdConfig::operator==(const RmdConfig& other) const {
    return enabled == other.enabled && start_age == other.start_age;
}

// ============================================================================
// ProjectionInput Implementation
// ============================================================================

ProjectionInput::ProjectionInput()
    : current_age(30),
      retirement_age(65),
      max_age(90),
      annual_contribution(0.0),
      expected_return(0.06),
      inflation_rate(0.025),
      contribution_growth_rate(0.0),
      annual_essential_expenses(0.0),
      annual_discretionary_expenses(0.0),
      annual_expenses(0.0),
      annual_healthcare_costs(0.0),
      healthcare_inflation_rate(0.05),
      annual_debt_payments(0.0) {}

double ProjectionInput::base_essential_expenses() const {
    if (annual_essential_expenses + annual_discretionary_expenses > 0.0) {
        return annual_essential_expenses;
    }
    // Without a split the flat figure is treated as all essential
    return annual_expenses;
}

double ProjectionInput::base_discretionary_expenses() const {
    if (annual_essential_expenses + annual_discretionary_expenses > 0.0) {
        return annual_discretionary_expenses;
    }
    return 0.0;
}

bool ProjectionInput::phases_enabled() const {
    return spending_phase_config && spending_phase_config->enabled &&
           !spending_phase_config->phases.empty();
}

bool ProjectionInput::debt_payments_active(int age) const {
    if (annual_debt_payments <= 0.0) {
        return false;
    }
    return !debt_payoff_age || age < *debt_payoff_age;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void require(bool condition, const std::string& field, const std::string& invariant) {
    if (!condition) {
        throw ValidationError(field, invariant);
    }
}

void require_non_negative(double value, const std::string& field) {
    require(std::isfinite(value), field, "must be a finite number");
    require(value >= 0.0, field, "must be non-negative");
}

void require_percentage(double value, const std::string& field) {
    require_non_negative(value, field);
    require(value <= 100.0, field, "must not exceed 100");
}

void validate_income_streams(const std::vector<IncomeStream>& streams) {
    std::set<std::string> ids;
    for (size_t i = 0; i < streams.size(); ++i) {
        const IncomeStream& stream = streams[i];
        std::ostringstream prefix;
        prefix << "incomeStreams[" << i << "]";
        const std::string base = prefix.str();

        require(!stream.id.empty(), base + ".id", "must not be empty");
        require(ids.insert(stream.id).second, base + ".id", "must be unique (duplicate '" + stream.id + "')");
        require_non_negative(stream.annual_amount, base + ".annualAmount");
        require(stream.start_age >= 0 && stream.start_age <= MAX_PROJECTION_AGE,
                base + ".startAge", "must be between 0 and 120");
        if (stream.end_age) {
            require(*stream.end_age >= stream.start_age && *stream.end_age <= MAX_PROJECTION_AGE,
                    base + ".endAge", "must be between startAge and 120");
        }
    }
}

void validate_spending_phases(const SpendingPhaseConfig& config) {
    if (!config.enabled) {
        return;
    }
    require(!config.phases.empty(), "spendingPhaseConfig.phases",
            "must contain at least one phase when enabled");
    require(config.phases.size() <= MAX_SPENDING_PHASES, "spendingPhaseConfig.phases",
            "must contain at most 4 phases");

    std::set<int> start_ages;
    for (size_t i = 0; i < config.phases.size(); ++i) {
        const SpendingPhase& phase = config.phases[i];
        const std::string base = "spendingPhaseConfig.phases[" + std::to_string(i) + "]";

        require(start_ages.insert(phase.start_age).second, base + ".startAge",
                "start ages must be unique");
        require_non_negative(phase.essential_multiplier, base + ".essentialMultiplier");
        require_non_negative(phase.discretionary_multiplier, base + ".discretionaryMultiplier");
        if (phase.absolute_essential) {
            require_non_negative(*phase.absolute_essential, base + ".absoluteEssential");
        }
        if (phase.absolute_discretionary) {
            require_non_negative(*phase.absolute_discretionary, base + ".absoluteDiscretionary");
        }
    }
}

void validate_depletion_target(const DepletionTarget& target, const ProjectionInput& input) {
    if (!target.enabled) {
        return;
    }
    require_percentage(target.target_percentage_spent, "depletionTarget.targetPercentageSpent");
    require(target.target_age > input.retirement_age && target.target_age <= input.max_age,
            "depletionTarget.targetAge", "must be after retirementAge and no later than maxAge");

    if (target.reserve.type == ReserveType::Percentage) {
        require_percentage(target.reserve.amount, "depletionTarget.reserve.amount");
    } else {
        require_non_negative(target.reserve.amount, "depletionTarget.reserve.amount");
    }
}

} // anonymous namespace

void validate_projection_input(const ProjectionInput& input) {
    // Ages
    require(input.current_age >= 0, "currentAge", "must be non-negative");
    require(input.max_age <= MAX_PROJECTION_AGE, "maxAge", "must not exceed 120");
    require(input.retirement_age >= input.current_age, "retirementAge",
            "must be between currentAge and maxAge");
    require(input.retirement_age <= input.max_age, "retirementAge",
            "must be between currentAge and maxAge");

    // Balances and flows
    require_non_negative(input.balances_by_type.tax_deferred, "balancesByType.taxDeferred");
    require_non_negative(input.balances_by_type.tax_free, "balancesByType.taxFree");
    require_non_negative(input.balances_by_type.taxable, "balancesByType.taxable");
    require_non_negative(input.annual_contribution, "annualContribution");

    const ContributionAllocation& alloc = input.contribution_allocation;
    require_percentage(alloc.tax_deferred, "contributionAllocation.taxDeferred");
    require_percentage(alloc.tax_free, "contributionAllocation.taxFree");
    require_percentage(alloc.taxable, "contributionAllocation.taxable");
    require(std::abs(alloc.sum() - 100.0) < 1e-9, "contributionAllocation",
            "percentages must sum to 100");

    // Rates are non-negative fractions
    require_non_negative(input.expected_return, "expectedReturn");
    require_non_negative(input.inflation_rate, "inflationRate");
    require_non_negative(input.contribution_growth_rate, "contributionGrowthRate");
    require_non_negative(input.healthcare_inflation_rate, "healthcareInflationRate");

    require_non_negative(input.annual_essential_expenses, "annualEssentialExpenses");
    require_non_negative(input.annual_discretionary_expenses, "annualDiscretionaryExpenses");
    require_non_negative(input.annual_expenses, "annualExpenses");
    require_non_negative(input.annual_healthcare_costs, "annualHealthcareCosts");
    require_non_negative(input.annual_debt_payments, "annualDebtPayments");
    if (input.debt_payoff_age) {
        require(*input.debt_payoff_age >= 0, "debtPayoffAge", "must be non-negative");
    }

    validate_income_streams(input.income_streams);

    if (input.spending_phase_config) {
        validate_spending_phases(*input.spending_phase_config);
    }
    if (input.depletion_target) {
        validate_depletion_target(*input.depletion_target, input);
    }
    if (input.reserve_floor) {
        require_non_negative(*input.reserve_floor, "reserveFloor");
    }

    require(input.rmd.start_age >= 0 && input.rmd.start_age <= MAX_PROJECTION_AGE,
            "rmd.startAge", "must be between 0 and 120");
}

// ============================================================================
// ProjectionAssumptions Implementation
// ============================================================================

ProjectionAssumptions::ProjectionAssumptions()
    : expected_return(0.0),
      inflation_rate(0.0),
      healthcare_inflation_rate(0.0),
      contribution_growth_rate(0.0),
      retirement_age(0),
      max_age(0) {}

ProjectionAssumptions extract_assumptions(const ProjectionInput& input) {
    ProjectionAssumptions assumptions;
    assumptions.expected_return = input.expected_return;
    assumptions.inflation_rate = input.inflation_rate;
    assumptions.healthcare_inflation_rate = input.healthcare_inflation_rate;
    assumptions.contribution_growth_rate = input.contribution_growth_rate;
    assumptions.retirement_age = input.retirement_age;
    assumptions.max_age = input.max_age;
    return assumptions;
}

} // namespace retireplan
