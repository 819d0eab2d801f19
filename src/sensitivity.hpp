#ifndef RETIREPLAN_SENSITIVITY_HPP
#define RETIREPLAN_SENSITIVITY_HPP

#include "projection.hpp"
#include "projection_input.hpp"
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace retireplan {

// Assumptions whose perturbation is measured, in declaration order.
// Declaration order is the ranking tie-break.
enum class LeverKind {
    ExpectedReturn,
    InflationRate,
    RetirementAge,
    ContributionGrowthRate,
    HealthcareInflationRate,
    AnnualHealthcareCosts,
    AnnualContribution,
    AnnualExpenses
};

enum class ImpactDirection {
    Increase,
    Decrease
};

// Which projected balance a lever is judged on
enum class OutcomeMetric {
    RetirementBalance,
    EndingBalance
};

std::string lever_kind_to_string(LeverKind lever);     // JSON key, e.g. "expectedReturn"
std::string lever_display_name(LeverKind lever);       // e.g. "Expected return"
std::string impact_direction_to_string(ImpactDirection direction);
std::string outcome_metric_to_string(OutcomeMetric metric);
OutcomeMetric outcome_metric_from_string(const std::string& str);

struct LeverImpact {
    LeverKind lever;
    std::string name;
    double baseline_value;
    double test_value;
    double test_delta;              // test_value - baseline_value
    ImpactDirection direction;
    double perturbed_balance;
    double impact_on_balance;       // perturbed_balance - baseline balance
    double percent_impact;          // impact / baseline * 100, 0 for a non-positive baseline
    std::optional<int> perturbed_depletion_age;
    std::optional<int> impact_on_depletion;  // Years of depletion postponed (+) or advanced (-)

    LeverImpact();
};

struct SensitivityResult {
    OutcomeMetric metric;
    double baseline_balance;
    std::optional<int> baseline_depletion;      // years_until_depletion of the baseline run
    std::optional<int> baseline_depletion_age;
    std::vector<LeverImpact> top_levers;        // Strongest first
    std::vector<LeverImpact> all_levers;        // Declaration order, skipped levers omitted

    SensitivityResult();
};

struct SensitivityConfig {
    OutcomeMetric metric;
    size_t top_count;
    ProjectionConfig projection;

    SensitivityConfig();
};

// Apply one lever's fixed perturbation. Returns nullopt when the lever does
// not apply to this input (e.g. no contribution to grow).
std::optional<ProjectionInput> perturb_lever(const ProjectionInput& input, LeverKind lever);

// Value of a lever in an input (percentages as fractions, ages in years)
double lever_value(const ProjectionInput& input, LeverKind lever);

// The balance a run is judged on under a metric
double outcome_balance(const ProjectionResult& result, OutcomeMetric metric);

// Rerun the simulator once per lever and rank by |impact_on_balance|.
// Reruns are independent and may execute in parallel; the ranking is a stable
// sort so ties keep declaration order.
SensitivityResult analyze_sensitivity(
    const ProjectionInput& input,
    const SensitivityConfig& config = SensitivityConfig()
);

// ============================================================================
// Low-friction wins
// ============================================================================

enum class EffortLevel {
    Minimal,
    Low,
    Moderate
};

std::string effort_level_to_string(EffortLevel effort);

struct LowFrictionWin {
    std::string id;
    std::string title;
    std::string description;
    LeverKind lever;
    EffortLevel effort;
    double change;                  // Perturbation magnitude in the lever's units
    double potential_impact;
    double percent_impact;

    LowFrictionWin();
};

struct LowFrictionConfig {
    double materiality_percent;     // Minimum percent impact to count
    size_t max_wins;
    ProjectionConfig projection;

    LowFrictionConfig();
};

// Small, realistic changes whose effect on the projection is outsized
std::vector<LowFrictionWin> identify_low_friction_wins(
    const ProjectionInput& input,
    const LowFrictionConfig& config = LowFrictionConfig()
);

// ============================================================================
// Sensitive assumptions
// ============================================================================

struct SensitiveAssumption {
    LeverKind lever;
    std::string name;
    std::string display_name;
    int sensitivity_score;          // 0-100, relative to the strongest lever
    double impact_on_balance;
    double percent_impact;
    std::string explanation;
    std::string suggestion;

    SensitiveAssumption();
};

// Score every lever against the strongest one: round(|impact| / max * 100)
std::vector<SensitiveAssumption> identify_sensitive_assumptions(
    const SensitivityResult& result,
    size_t max_count = 2
);

// ============================================================================
// Formatting helpers
// ============================================================================

// $950, $12K, $1.3M
std::string format_currency(double amount);

// "+1.0%", "-0.5%", "+1 year", "-$1,000", "+10%"
std::string format_lever_delta(const LeverImpact& impact);

std::string describe_lever_impact(const LeverImpact& impact, OutcomeMetric metric);

std::string review_suggestion(LeverKind lever);

} // namespace retireplan

#endif // RETIREPLAN_SENSITIVITY_HPP
