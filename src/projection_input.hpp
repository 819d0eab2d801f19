#ifndef RETIREPLAN_PROJECTION_INPUT_HPP
#define RETIREPLAN_PROJECTION_INPUT_HPP

#include "balances.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace retireplan {

// ============================================================================
// Validation error
// ============================================================================

// Raised when an input breaks one of the engine's invariants. Thrown before
// any simulation work so a projection is never partially computed.
class ValidationError : public std::invalid_argument {
public:
    ValidationError(const std::string& field, const std::string& invariant);

    const std::string& field() const { return field_; }
    const std::string& invariant() const { return invariant_; }

private:
    std::string field_;
    std::string invariant_;
};

// ============================================================================
// Income streams
// ============================================================================

enum class IncomeStreamType {
    SocialSecurity,
    Pension,
    Rental,
    Annuity,
    PartTime,
    Other
};

std::string income_stream_type_to_string(IncomeStreamType type);
IncomeStreamType income_stream_type_from_string(const std::string& str);

// Social Security, pensions and annuities are non-market income
bool default_is_guaranteed(IncomeStreamType type);

struct IncomeStream {
    std::string id;
    std::string name;
    IncomeStreamType type;
    double annual_amount;           // Nominal amount in start-age dollars
    int start_age;
    std::optional<int> end_age;     // Inclusive; open-ended when unset
    bool inflation_adjusted;        // COLA: grows with inflation from start_age
    bool is_guaranteed;
    std::optional<bool> is_spouse;

    IncomeStream();

    bool operator==(const IncomeStream& other) const;
    bool operator!=(const IncomeStream& other) const { return !(*this == other); }
};

// ============================================================================
// Spending phases
// ============================================================================

struct SpendingPhase {
    std::string id;
    std::string name;
    int start_age;
    double essential_multiplier;
    double discretionary_multiplier;
    std::optional<double> absolute_essential;       // Today's dollars, replaces base * multiplier
    std::optional<double> absolute_discretionary;

    SpendingPhase();
    SpendingPhase(const std::string& id_, const std::string& name_, int start_age_,
                  double essential_multiplier_, double discretionary_multiplier_);

    bool operator==(const SpendingPhase& other) const;
    bool operator!=(const SpendingPhase& other) const { return !(*this == other); }
};

constexpr std::size_t MAX_SPENDING_PHASES = 4;

struct SpendingPhaseConfig {
    bool enabled;
    std::vector<SpendingPhase> phases;

    SpendingPhaseConfig();

    bool operator==(const SpendingPhaseConfig& other) const;
    bool operator!=(const SpendingPhaseConfig& other) const { return !(*this == other); }
};

// Go-Go / Slow-Go / No-Go template starting at 65
std::vector<SpendingPhase> default_spending_phases();

// ============================================================================
// Depletion target and reserve
// ============================================================================

enum class ReserveType {
    Derived,        // Whatever the target leaves unspent
    Percentage,     // Custom percentage of the portfolio
    Absolute        // Fixed dollar floor
};

enum class ReservePurpose {
    LongTermCare,
    Legacy,
    Emergency,
    PeaceOfMind
};

std::string reserve_type_to_string(ReserveType type);
ReserveType reserve_type_from_string(const std::string& str);
std::string reserve_purpose_to_string(ReservePurpose purpose);
ReservePurpose reserve_purpose_from_string(const std::string& str);

struct ReserveConfig {
    ReserveType type;
    double amount;                  // Percentage (0-100) or dollars, by type
    std::vector<ReservePurpose> purposes;
    std::optional<std::string> note;

    ReserveConfig();

    bool operator==(const ReserveConfig& other) const;
    bool operator!=(const ReserveConfig& other) const { return !(*this == other); }
};

struct DepletionTarget {
    bool enabled;
    double target_percentage_spent; // 0-100
    int target_age;
    ReserveConfig reserve;

    DepletionTarget();

    bool operator==(const DepletionTarget& other) const;
    bool operator!=(const DepletionTarget& other) const { return !(*this == other); }
};

// ============================================================================
// RMD configuration
// ============================================================================

constexpr int DEFAULT_RMD_START_AGE = 73;

struct RmdConfig {
    bool enabled;
    int start_age;

    RmdConfig();

    bool operator==(const RmdConfig& other) const;
    bool operator!=(const RmdConfig& other) const { return !(*this == other); }
};

// ============================================================================
// Projection input
// ============================================================================

constexpr int MAX_PROJECTION_AGE = 120;

// Immutable per-run snapshot consumed by the simulator and every analyzer
struct ProjectionInput {
    int current_age;
    int retirement_age;
    int max_age;

    BalanceByType balances_by_type;
    double annual_contribution;
    ContributionAllocation contribution_allocation;

    double expected_return;
    double inflation_rate;
    double contribution_growth_rate;

    double annual_essential_expenses;
    double annual_discretionary_expenses;
    double annual_expenses;         // Legacy flat figure, used when the split above is empty

    double annual_healthcare_costs;
    double healthcare_inflation_rate;

    std::vector<IncomeStream> income_streams;

    double annual_debt_payments;
    std::optional<int> debt_payoff_age;     // Payments stop at this age

    std::optional<SpendingPhaseConfig> spending_phase_config;
    std::optional<DepletionTarget> depletion_target;
    std::optional<double> reserve_floor;    // Dollar balance withdrawals never breach

    RmdConfig rmd;

    ProjectionInput();

    // Retirement-age expense base in today's dollars
    double base_essential_expenses() const;
    double base_discretionary_expenses() const;

    bool phases_enabled() const;
    bool debt_payments_active(int age) const;
};

// Throws ValidationError naming the first violated invariant
void validate_projection_input(const ProjectionInput& input);

// ============================================================================
// Projection assumptions
// ============================================================================

// Human-readable subset persisted alongside results
struct ProjectionAssumptions {
    double expected_return;
    double inflation_rate;
    double healthcare_inflation_rate;
    double contribution_growth_rate;
    int retirement_age;
    int max_age;

    ProjectionAssumptions();
};

ProjectionAssumptions extract_assumptions(const ProjectionInput& input);

} // namespace retireplan

#endif // RETIREPLAN_PROJECTION_INPUT_HPP
