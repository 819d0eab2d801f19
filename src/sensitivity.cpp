#include "sensitivity.hpp"
#include "spending.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace retireplan {

// ============================================================================
// Names
// ============================================================================

std::string lever_kind_to_string(LeverKind lever) {
    switch (lever) {
        case LeverKind::ExpectedReturn: return "expectedReturn";
        case LeverKind::InflationRate: return "inflationRate";
        case LeverKind::RetirementAge: return "retirementAge";
        case LeverKind::ContributionGrowthRate: return "contributionGrowthRate";
        case LeverKind::HealthcareInflationRate: return "healthcareInflationRate";
        case LeverKind::AnnualHealthcareCosts: return "annualHealthcareCosts";
        case LeverKind::AnnualContribution: return "annualContribution";
        case LeverKind::AnnualExpenses: return "annualExpenses";
    }
    return "unknown";
}

std::string lever_display_name(LeverKind lever) {
    switch (lever) {
        case LeverKind::ExpectedReturn: return "Expected return";
        case LeverKind::InflationRate: return "Inflation rate";
        case LeverKind::RetirementAge: return "Retirement age";
        case LeverKind::ContributionGrowthRate: return "Contribution growth";
        case LeverKind::HealthcareInflationRate: return "Healthcare inflation";
        case LeverKind::AnnualHealthcareCosts: return "Healthcare costs";
        case LeverKind::AnnualContribution: return "Annual savings";
        case LeverKind::AnnualExpenses: return "Annual spending";
    }
    return "Unknown";
}

std::string impact_direction_to_string(ImpactDirection direction) {
    return direction == ImpactDirection::Increase ? "increase" : "decrease";
}

std::string outcome_metric_to_string(OutcomeMetric metric) {
    return metric == OutcomeMetric::RetirementBalance ? "retirementBalance" : "endingBalance";
}

OutcomeMetric outcome_metric_from_string(const std::string& str) {
    if (str == "retirementBalance") return OutcomeMetric::RetirementBalance;
    if (str == "endingBalance") return OutcomeMetric::EndingBalance;
    throw std::invalid_argument("Unknown outcome metric: " + str);
}

std::string effort_level_to_string(EffortLevel effort) {
    switch (effort) {
        case EffortLevel::Minimal: return "minimal";
        case EffortLevel::Low: return "low";
        case EffortLevel::Moderate: return "moderate";
    }
    return "moderate";
}

// ============================================================================
// Result type constructors
// ============================================================================

LeverImpact::LeverImpact()
    : lever(LeverKind::ExpectedReturn),
      baseline_value(0.0),
      test_value(0.0),
      test_delta(0.0),
      direction(ImpactDirection::Increase),
      perturbed_balance(0.0),
      impact_on_balance(0.0),
      percent_impact(0.0) {}

SensitivityResult::SensitivityResult()
    : metric(OutcomeMetric::RetirementBalance), baseline_balance(0.0) {}

SensitivityConfig::SensitivityConfig()
    : metric(OutcomeMetric::RetirementBalance), top_count(3) {}

LowFrictionWin::LowFrictionWin()
    : lever(LeverKind::RetirementAge),
      effort(EffortLevel::Moderate),
      change(0.0),
      potential_impact(0.0),
      percent_impact(0.0) {}

LowFrictionConfig::LowFrictionConfig() : materiality_percent(1.0), max_wins(3) {}

SensitiveAssumption::SensitiveAssumption()
    : lever(LeverKind::ExpectedReturn),
      sensitivity_score(0),
      impact_on_balance(0.0),
      percent_impact(0.0) {}

// ============================================================================
// Perturbations
// ============================================================================

namespace {

constexpr double RATE_STEP = 0.01;
constexpr double INFLATION_STEP = 0.005;
constexpr double HEALTHCARE_COST_STEP = 1000.0;
constexpr double CONTRIBUTION_SCALE = 1.10;
constexpr double EXPENSE_SCALE = 0.90;

const LeverKind ALL_LEVERS[] = {
    LeverKind::ExpectedReturn,
    LeverKind::InflationRate,
    LeverKind::RetirementAge,
    LeverKind::ContributionGrowthRate,
    LeverKind::HealthcareInflationRate,
    LeverKind::AnnualHealthcareCosts,
    LeverKind::AnnualContribution,
    LeverKind::AnnualExpenses
};

ImpactDirection lever_direction(LeverKind lever) {
    switch (lever) {
        case LeverKind::InflationRate:
        case LeverKind::HealthcareInflationRate:
        case LeverKind::AnnualHealthcareCosts:
        case LeverKind::AnnualExpenses:
            return ImpactDirection::Decrease;
        default:
            return ImpactDirection::Increase;
    }
}

// Later retirement must still leave room before the depletion target age.
// The target does not feed the simulator, so switching it off changes nothing else.
void shift_retirement_age(ProjectionInput& input, int years) {
    input.retirement_age += years;
    if (input.depletion_target && input.depletion_target->enabled &&
        input.depletion_target->target_age <= input.retirement_age) {
        input.depletion_target->enabled = false;
    }
}

std::optional<int> depletion_delta(const std::optional<int>& baseline_age,
                                   const std::optional<int>& perturbed_age,
                                   int max_age) {
    if (!baseline_age && !perturbed_age) {
        return std::nullopt;
    }
    // A run that never depletes counts as lasting one year past the horizon
    const int never = max_age + 1;
    return perturbed_age.value_or(never) - baseline_age.value_or(never);
}

double percent_of(double impact, double baseline) {
    if (baseline <= 0.0) {
        return 0.0;
    }
    return impact / baseline * 100.0;
}

// Run every perturbed input; results land at the matching index.
std::vector<ProjectionResult> run_all(const std::vector<ProjectionInput>& inputs,
                                      const ProjectionConfig& config) {
    std::vector<ProjectionResult> results(inputs.size());
    std::vector<std::exception_ptr> errors(inputs.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long i = 0; i < static_cast<long>(inputs.size()); ++i) {
        try {
            results[static_cast<size_t>(i)] = run_projection(inputs[static_cast<size_t>(i)], config);
        } catch (...) {
            errors[static_cast<size_t>(i)] = std::current_exception();
        }
    }

    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}

} // anonymous namespace

double lever_value(const ProjectionInput& input, LeverKind lever) {
    switch (lever) {
        case LeverKind::ExpectedReturn: return input.expected_return;
        case LeverKind::InflationRate: return input.inflation_rate;
        case LeverKind::RetirementAge: return static_cast<double>(input.retirement_age);
        case LeverKind::ContributionGrowthRate: return input.contribution_growth_rate;
        case LeverKind::HealthcareInflationRate: return input.healthcare_inflation_rate;
        case LeverKind::AnnualHealthcareCosts: return input.annual_healthcare_costs;
        case LeverKind::AnnualContribution: return input.annual_contribution;
        case LeverKind::AnnualExpenses:
            return input.base_essential_expenses() + input.base_discretionary_expenses();
    }
    return 0.0;
}

std::optional<ProjectionInput> perturb_lever(const ProjectionInput& input, LeverKind lever) {
    ProjectionInput perturbed = input;

    switch (lever) {
        case LeverKind::ExpectedReturn:
            perturbed.expected_return += RATE_STEP;
            break;
        case LeverKind::InflationRate:
            if (input.inflation_rate <= 0.0) return std::nullopt;
            perturbed.inflation_rate = std::max(0.0, input.inflation_rate - INFLATION_STEP);
            break;
        case LeverKind::RetirementAge:
            if (input.retirement_age + 1 > input.max_age) return std::nullopt;
            shift_retirement_age(perturbed, 1);
            break;
        case LeverKind::ContributionGrowthRate:
            if (input.annual_contribution <= 0.0) return std::nullopt;
            perturbed.contribution_growth_rate += RATE_STEP;
            break;
        case LeverKind::HealthcareInflationRate:
            if (input.healthcare_inflation_rate <= 0.0 || input.annual_healthcare_costs <= 0.0) {
                return std::nullopt;
            }
            perturbed.healthcare_inflation_rate = std::max(0.0, input.healthcare_inflation_rate - RATE_STEP);
            break;
        case LeverKind::AnnualHealthcareCosts:
            if (input.annual_healthcare_costs <= 0.0) return std::nullopt;
            perturbed.annual_healthcare_costs = std::max(0.0, input.annual_healthcare_costs - HEALTHCARE_COST_STEP);
            break;
        case LeverKind::AnnualContribution:
            if (input.annual_contribution <= 0.0) return std::nullopt;
            perturbed.annual_contribution *= CONTRIBUTION_SCALE;
            break;
        case LeverKind::AnnualExpenses:
            if (lever_value(input, LeverKind::AnnualExpenses) <= 0.0) return std::nullopt;
            scale_spending(perturbed, EXPENSE_SCALE);
            break;
    }
    return perturbed;
}

double outcome_balance(const ProjectionResult& result, OutcomeMetric metric) {
    return metric == OutcomeMetric::RetirementBalance
        ? result.summary.projected_retirement_balance
        : result.summary.ending_balance;
}

// ============================================================================
// Sensitivity analysis
// ============================================================================

SensitivityResult analyze_sensitivity(const ProjectionInput& input, const SensitivityConfig& config) {
    const ProjectionResult baseline = run_projection(input, config.projection);

    SensitivityResult result;
    result.metric = config.metric;
    result.baseline_balance = outcome_balance(baseline, config.metric);
    result.baseline_depletion = baseline.summary.years_until_depletion;
    result.baseline_depletion_age = baseline.summary.depletion_age;

    std::vector<LeverKind> levers;
    std::vector<ProjectionInput> perturbed_inputs;
    for (LeverKind lever : ALL_LEVERS) {
        std::optional<ProjectionInput> perturbed = perturb_lever(input, lever);
        if (perturbed) {
            levers.push_back(lever);
            perturbed_inputs.push_back(std::move(*perturbed));
        }
    }

    const std::vector<ProjectionResult> runs = run_all(perturbed_inputs, config.projection);

    for (size_t i = 0; i < levers.size(); ++i) {
        LeverImpact impact;
        impact.lever = levers[i];
        impact.name = lever_kind_to_string(levers[i]);
        impact.baseline_value = lever_value(input, levers[i]);
        impact.test_value = lever_value(perturbed_inputs[i], levers[i]);
        impact.test_delta = impact.test_value - impact.baseline_value;
        impact.direction = lever_direction(levers[i]);
        impact.perturbed_balance = outcome_balance(runs[i], config.metric);
        impact.impact_on_balance = impact.perturbed_balance - result.baseline_balance;
        impact.percent_impact = percent_of(impact.impact_on_balance, result.baseline_balance);
        impact.perturbed_depletion_age = runs[i].summary.depletion_age;
        impact.impact_on_depletion = depletion_delta(
            baseline.summary.depletion_age, runs[i].summary.depletion_age, input.max_age);
        result.all_levers.push_back(impact);
    }

    std::vector<LeverImpact> ranked = result.all_levers;
    std::stable_sort(ranked.begin(), ranked.end(), [](const LeverImpact& a, const LeverImpact& b) {
        return std::abs(a.impact_on_balance) > std::abs(b.impact_on_balance);
    });
    if (ranked.size() > config.top_count) {
        ranked.resize(config.top_count);
    }
    result.top_levers = std::move(ranked);
    return result;
}

// ============================================================================
// Low-friction wins
// ============================================================================

namespace {

struct WinCandidate {
    std::string id;
    std::string title;
    LeverKind lever;
    EffortLevel effort;
    OutcomeMetric metric;           // Spending changes only show after retirement
    double change;
    double small_change_limit;
    double min_dollar_impact;
    ProjectionInput perturbed;
};

std::vector<WinCandidate> win_candidates(const ProjectionInput& input) {
    std::vector<WinCandidate> candidates;

    if (input.retirement_age < 70 && input.retirement_age + 1 <= input.max_age) {
        WinCandidate c{"retire-one-year-later", "Work one more year", LeverKind::RetirementAge,
                       EffortLevel::Moderate, OutcomeMetric::RetirementBalance, 1.0, 1.0, 10000.0, input};
        shift_retirement_age(c.perturbed, 1);
        candidates.push_back(std::move(c));
    }

    const double expenses = lever_value(input, LeverKind::AnnualExpenses);
    if (expenses > 0.0) {
        WinCandidate c{"trim-spending-5pct", "Trim spending by 5%", LeverKind::AnnualExpenses,
                       EffortLevel::Low, OutcomeMetric::EndingBalance, 0.05, 0.05, 5000.0, input};
        scale_spending(c.perturbed, 0.95);
        candidates.push_back(std::move(c));
    }

    if (input.annual_contribution > 0.0 && input.current_age < input.retirement_age) {
        WinCandidate c{"increase-savings-10pct", "Save 10% more each year", LeverKind::AnnualContribution,
                       EffortLevel::Low, OutcomeMetric::RetirementBalance, 0.10, 0.10, 5000.0, input};
        c.perturbed.annual_contribution *= 1.10;
        candidates.push_back(std::move(c));

        WinCandidate e{"escalate-contributions", "Raise contributions 1% a year",
                       LeverKind::ContributionGrowthRate, EffortLevel::Minimal,
                       OutcomeMetric::RetirementBalance, 0.01, 0.01, 5000.0, input};
        e.perturbed.contribution_growth_rate += 0.01;
        candidates.push_back(std::move(e));
    }

    return candidates;
}

std::string describe_win(const WinCandidate& candidate, double impact) {
    std::ostringstream oss;
    oss << candidate.title << " could add about " << format_currency(impact) << " to your "
        << (candidate.metric == OutcomeMetric::RetirementBalance ? "balance at retirement"
                                                                  : "balance at the end of the plan");
    return oss.str();
}

} // anonymous namespace

std::vector<LowFrictionWin> identify_low_friction_wins(const ProjectionInput& input,
                                                       const LowFrictionConfig& config) {
    const ProjectionResult baseline = run_projection(input, config.projection);
    std::vector<WinCandidate> candidates = win_candidates(input);

    std::vector<ProjectionInput> inputs;
    inputs.reserve(candidates.size());
    for (const WinCandidate& candidate : candidates) {
        inputs.push_back(candidate.perturbed);
    }
    const std::vector<ProjectionResult> runs = run_all(inputs, config.projection);

    std::vector<LowFrictionWin> wins;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const WinCandidate& candidate = candidates[i];
        if (candidate.change > candidate.small_change_limit) {
            continue;
        }

        const double base = outcome_balance(baseline, candidate.metric);
        const double impact = outcome_balance(runs[i], candidate.metric) - base;
        const double percent = percent_of(impact, base);
        if (impact <= candidate.min_dollar_impact || percent < config.materiality_percent) {
            continue;
        }

        LowFrictionWin win;
        win.id = candidate.id;
        win.title = candidate.title;
        win.description = describe_win(candidate, impact);
        win.lever = candidate.lever;
        win.effort = candidate.effort;
        win.change = candidate.change;
        win.potential_impact = impact;
        win.percent_impact = percent;
        wins.push_back(win);
    }

    std::stable_sort(wins.begin(), wins.end(), [](const LowFrictionWin& a, const LowFrictionWin& b) {
        return a.potential_impact > b.potential_impact;
    });
    if (wins.size() > config.max_wins) {
        wins.resize(config.max_wins);
    }
    return wins;
}

// ============================================================================
// Sensitive assumptions
// ============================================================================

std::vector<SensitiveAssumption> identify_sensitive_assumptions(const SensitivityResult& result,
                                                                size_t max_count) {
    double max_impact = 0.0;
    for (const LeverImpact& impact : result.all_levers) {
        max_impact = std::max(max_impact, std::abs(impact.impact_on_balance));
    }
    // Avoid dividing by zero when nothing moves the outcome
    const double denominator = std::max(max_impact, 1.0);

    std::vector<SensitiveAssumption> assumptions;
    for (const LeverImpact& impact : result.all_levers) {
        SensitiveAssumption assumption;
        assumption.lever = impact.lever;
        assumption.name = impact.name;
        assumption.display_name = lever_display_name(impact.lever);
        assumption.sensitivity_score = static_cast<int>(
            std::lround(std::abs(impact.impact_on_balance) / denominator * 100.0));
        assumption.impact_on_balance = impact.impact_on_balance;
        assumption.percent_impact = impact.percent_impact;
        assumption.explanation = describe_lever_impact(impact, result.metric);
        assumption.suggestion = review_suggestion(impact.lever);
        assumptions.push_back(assumption);
    }

    std::stable_sort(assumptions.begin(), assumptions.end(),
                     [](const SensitiveAssumption& a, const SensitiveAssumption& b) {
                         return a.sensitivity_score > b.sensitivity_score;
                     });
    if (assumptions.size() > max_count) {
        assumptions.resize(max_count);
    }
    return assumptions;
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

std::string with_thousands(long long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.insert(out.begin(), ',');
        }
        out.insert(out.begin(), *it);
        ++count;
    }
    return out;
}

std::string signed_percent(double fraction, int precision) {
    std::ostringstream oss;
    oss << (fraction >= 0 ? "+" : "-") << std::fixed << std::setprecision(precision)
        << std::abs(fraction) * 100.0 << "%";
    return oss.str();
}

} // anonymous namespace

std::string format_currency(double amount) {
    const double magnitude = std::abs(amount);
    const std::string sign = amount < 0 ? "-" : "";
    std::ostringstream oss;

    if (magnitude >= 1000000.0) {
        oss << sign << "$" << std::fixed << std::setprecision(1) << magnitude / 1000000.0 << "M";
    } else if (magnitude >= 1000.0) {
        oss << sign << "$" << std::llround(magnitude / 1000.0) << "K";
    } else {
        oss << sign << "$" << std::llround(magnitude);
    }
    return oss.str();
}

std::string format_lever_delta(const LeverImpact& impact) {
    switch (impact.lever) {
        case LeverKind::ExpectedReturn:
        case LeverKind::InflationRate:
        case LeverKind::ContributionGrowthRate:
        case LeverKind::HealthcareInflationRate:
            return signed_percent(impact.test_delta, 1);
        case LeverKind::RetirementAge: {
            const long years = std::lround(impact.test_delta);
            return (years >= 0 ? "+" : "-") + std::to_string(std::labs(years)) +
                   (std::labs(years) == 1 ? " year" : " years");
        }
        case LeverKind::AnnualHealthcareCosts:
            return (impact.test_delta >= 0 ? "+$" : "-$") +
                   with_thousands(std::llround(std::abs(impact.test_delta)));
        case LeverKind::AnnualContribution:
        case LeverKind::AnnualExpenses:
            if (impact.baseline_value <= 0.0) {
                return "0%";
            }
            return signed_percent(impact.test_delta / impact.baseline_value, 0);
    }
    return "";
}

std::string describe_lever_impact(const LeverImpact& impact, OutcomeMetric metric) {
    std::ostringstream oss;
    oss << lever_display_name(impact.lever) << " " << format_lever_delta(impact) << " changes your "
        << (metric == OutcomeMetric::RetirementBalance ? "retirement balance" : "ending balance")
        << " by " << (impact.impact_on_balance >= 0 ? "+" : "")
        << format_currency(impact.impact_on_balance);
    if (impact.percent_impact != 0.0) {
        oss << " (" << std::fixed << std::setprecision(1) << impact.percent_impact << "%)";
    }
    return oss.str();
}

std::string review_suggestion(LeverKind lever) {
    switch (lever) {
        case LeverKind::ExpectedReturn:
            return "Review your investment mix and fees; small return differences compound for decades.";
        case LeverKind::InflationRate:
            return "Stress-test the plan with higher inflation and consider inflation-protected income.";
        case LeverKind::RetirementAge:
            return "Compare a few retirement dates; each extra working year adds savings and shortens drawdown.";
        case LeverKind::ContributionGrowthRate:
            return "Set contributions to rise automatically with each raise.";
        case LeverKind::HealthcareInflationRate:
            return "Plan for healthcare costs rising faster than general prices.";
        case LeverKind::AnnualHealthcareCosts:
            return "Check Medicare and supplemental coverage options to firm up healthcare estimates.";
        case LeverKind::AnnualContribution:
            return "Look for room to save more, such as capturing the full employer match.";
        case LeverKind::AnnualExpenses:
            return "Separate essential from discretionary spending and revisit the discretionary budget.";
    }
    return "";
}

} // namespace retireplan
