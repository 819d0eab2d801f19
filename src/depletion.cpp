#include "depletion.hpp"
#include "income_streams.hpp"
#include "spending.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace retireplan {

std::string trajectory_status_to_string(TrajectoryStatus status) {
    switch (status) {
        case TrajectoryStatus::OnTrack: return "on_track";
        case TrajectoryStatus::Underspending: return "underspending";
        case TrajectoryStatus::Overspending: return "overspending";
    }
    return "on_track";
}

PhaseSpending::PhaseSpending()
    : start_age(0), end_age(0), years(0), annual_spending(0.0), monthly_spending(0.0) {}

DepletionFeedback::DepletionFeedback()
    : enabled(false),
      current_portfolio(0.0),
      target_percentage_spent(0.0),
      target_age(0),
      reserve_amount(0.0),
      sustainable_annual_spending(0.0),
      sustainable_monthly_spending(0.0),
      planned_annual_spending(0.0),
      spending_ratio(0.0),
      trajectory_status(TrajectoryStatus::OnTrack),
      projected_balance_at_target(0.0) {}

double calculate_reserve_amount(const DepletionTarget& target, double portfolio) {
    switch (target.reserve.type) {
        case ReserveType::Derived:
            return std::max(0.0, portfolio * (1.0 - target.target_percentage_spent / 100.0));
        case ReserveType::Percentage:
            return std::max(0.0, portfolio * target.reserve.amount / 100.0);
        case ReserveType::Absolute:
            return std::max(0.0, target.reserve.amount);
    }
    return 0.0;
}

TrajectoryStatus classify_trajectory(double planned, double sustainable, double tolerance) {
    if (sustainable <= 0.0) {
        return planned > 0.0 ? TrajectoryStatus::Overspending : TrajectoryStatus::OnTrack;
    }
    const double ratio = planned / sustainable;
    if (ratio <= 1.0 - tolerance) {
        return TrajectoryStatus::Underspending;
    }
    if (ratio >= 1.0 + tolerance) {
        return TrajectoryStatus::Overspending;
    }
    return TrajectoryStatus::OnTrack;
}

double planned_real_spending(const ProjectionInput& input, int through_age) {
    const int last = std::min(through_age, input.max_age);
    if (last < input.retirement_age) {
        return 0.0;
    }
    double total = 0.0;
    for (int age = input.retirement_age; age <= last; ++age) {
        total += real_expenses_at(input, age).total();
    }
    return total / static_cast<double>(last - input.retirement_age + 1);
}

namespace {

constexpr int SEARCH_ITERATIONS = 50;
constexpr double SEARCH_CEILING = 1e12;
constexpr double FUNDING_EPSILON = 1e-6;

// Wraps the simulator for the spending search. Spending is expressed as a
// mean real annual amount; the input's own spending shape is scaled to it.
class SpendingSearch {
public:
    SpendingSearch(const ProjectionInput& input, const ProjectionConfig& config,
                   int target_age, double target_balance)
        : base_(input), config_(config), target_age_(target_age), target_balance_(target_balance)
    {
        // The search measures the unconstrained path; a floor would mask overspending
        base_.reserve_floor.reset();
        planned_ = planned_real_spending(base_, target_age_);
    }

    double planned() const { return planned_; }

    ProjectionInput input_for(double annual_spending) const {
        ProjectionInput candidate = base_;
        if (planned_ > 0.0) {
            scale_spending(candidate, annual_spending / planned_);
        } else {
            // Nothing planned: search over a flat essential budget
            candidate.annual_essential_expenses = 0.0;
            candidate.annual_discretionary_expenses = 0.0;
            candidate.annual_expenses = annual_spending;
            candidate.spending_phase_config.reset();
        }
        return candidate;
    }

    // Every year through the target age is paid for and the reserve survives
    bool funded(double annual_spending) const {
        const ProjectionResult result = run_projection(input_for(annual_spending), config_);
        for (const ProjectionRecord& record : result.records) {
            if (record.age > target_age_) {
                break;
            }
            if (record.retired && record.spending_shortfall > FUNDING_EPSILON) {
                return false;
            }
        }
        const ProjectionRecord* at_target = result.record_at(target_age_);
        return at_target && at_target->balance + FUNDING_EPSILON >= target_balance_;
    }

    double solve() const {
        if (!funded(0.0)) {
            return 0.0;
        }
        double low = 0.0;
        double high = std::max(planned_, 1000.0);
        while (funded(high) && high < SEARCH_CEILING) {
            low = high;
            high *= 2.0;
        }
        for (int i = 0; i < SEARCH_ITERATIONS; ++i) {
            const double mid = 0.5 * (low + high);
            if (funded(mid)) {
                low = mid;
            } else {
                high = mid;
            }
        }
        return low;
    }

private:
    ProjectionInput base_;
    const ProjectionConfig& config_;
    int target_age_;
    double target_balance_;
    double planned_;
};

std::vector<PhaseSpending> phase_breakdown(const ProjectionInput& input, int target_age, double scale) {
    std::vector<PhaseSpending> breakdown;
    if (!input.phases_enabled()) {
        return breakdown;
    }

    const std::vector<SpendingPhase> phases = sorted_phases(*input.spending_phase_config);
    for (size_t i = 0; i < phases.size(); ++i) {
        // The first phase also covers any retirement years before it starts
        const int start = (i == 0) ? input.retirement_age : std::max(phases[i].start_age, input.retirement_age);
        const int end = (i + 1 < phases.size()) ? std::min(phases[i + 1].start_age - 1, target_age) : target_age;
        if (end < start) {
            continue;
        }

        PhaseSpending entry;
        entry.phase_id = phases[i].id;
        entry.phase_name = phases[i].name;
        entry.start_age = start;
        entry.end_age = end;
        entry.years = end - start + 1;
        entry.annual_spending = real_expenses_at(input, start).total() * scale;
        entry.monthly_spending = entry.annual_spending / 12.0;
        breakdown.push_back(entry);
    }
    return breakdown;
}

std::string percent_text(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << value << "%";
    return oss.str();
}

std::string status_message_for(TrajectoryStatus status, const DepletionFeedback& feedback) {
    std::ostringstream oss;
    switch (status) {
        case TrajectoryStatus::OnTrack:
            oss << "Your planned spending is on track to use about "
                << percent_text(feedback.target_percentage_spent)
                << " of your portfolio by age " << feedback.target_age << ".";
            break;
        case TrajectoryStatus::Underspending:
            oss << "You could spend more. Your plan supports about $"
                << std::llround(feedback.sustainable_monthly_spending)
                << " per month while still protecting your reserve.";
            break;
        case TrajectoryStatus::Overspending:
            oss << "Your planned spending would dip into your reserve before age "
                << feedback.target_age << ".";
            break;
    }
    return oss.str();
}

std::vector<std::string> feedback_warnings(const DepletionFeedback& feedback,
                                           const ProjectionInput& input) {
    std::vector<std::string> warnings;

    if (feedback.reserve_amount > feedback.current_portfolio) {
        warnings.push_back("Protected reserve is larger than your current portfolio.");
    }
    if (feedback.projected_depletion_age && *feedback.projected_depletion_age <= feedback.target_age) {
        warnings.push_back("Portfolio is projected to run out at age " +
                           std::to_string(*feedback.projected_depletion_age) +
                           ", before your target age of " + std::to_string(feedback.target_age) + ".");
    }
    if (feedback.trajectory_status == TrajectoryStatus::Overspending && feedback.sustainable_annual_spending > 0.0) {
        const double excess = (feedback.spending_ratio - 1.0) * 100.0;
        warnings.push_back("Planned spending is " + percent_text(excess) + " above the sustainable level.");
    }
    if (feedback.sustainable_annual_spending <= 0.0) {
        warnings.push_back("Fixed costs alone exhaust the portfolio before the target age.");
    }
    if (feedback.target_age >= input.max_age) {
        warnings.push_back("Target age is at the end of the plan, leaving no years after the target.");
    }
    return warnings;
}

} // anonymous namespace

DepletionFeedback calculate_depletion_feedback(const ProjectionInput& input, const ProjectionConfig& config) {
    validate_projection_input(input);

    DepletionFeedback feedback;
    if (!input.depletion_target || !input.depletion_target->enabled) {
        feedback.status_message = "Depletion target is not enabled.";
        return feedback;
    }

    const DepletionTarget& target = *input.depletion_target;
    feedback.enabled = true;
    feedback.current_portfolio = input.balances_by_type.total();
    feedback.target_percentage_spent = target.target_percentage_spent;
    feedback.target_age = target.target_age;
    feedback.reserve_amount = calculate_reserve_amount(target, feedback.current_portfolio);

    const SpendingSearch search(input, config, target.target_age, feedback.reserve_amount);
    feedback.planned_annual_spending = search.planned();
    feedback.sustainable_annual_spending = search.solve();
    feedback.sustainable_monthly_spending = feedback.sustainable_annual_spending / 12.0;
    feedback.spending_ratio = feedback.sustainable_annual_spending > 0.0
        ? feedback.planned_annual_spending / feedback.sustainable_annual_spending
        : 0.0;
    feedback.trajectory_status = classify_trajectory(feedback.planned_annual_spending,
                                                     feedback.sustainable_annual_spending);

    const ProjectionResult baseline = run_projection(input, config);
    if (const ProjectionRecord* at_target = baseline.record_at(target.target_age)) {
        feedback.projected_balance_at_target = at_target->balance;
    }
    feedback.projected_depletion_age = baseline.summary.depletion_age;

    const double scale = feedback.planned_annual_spending > 0.0
        ? feedback.sustainable_annual_spending / feedback.planned_annual_spending
        : 1.0;
    feedback.phase_breakdown = phase_breakdown(input, target.target_age, scale);

    const PhaseAdjustedExpenses at_retirement = real_expenses_at(input, input.retirement_age);
    const double guaranteed = resolve_income(input.income_streams, input.retirement_age,
                                             input.inflation_rate, IncomeFilter::GuaranteedOnly);
    feedback.reserve_runway = calculate_reserve_runway(
        feedback.reserve_amount, at_retirement.essential, at_retirement.discretionary,
        guaranteed, input.inflation_rate);

    feedback.status_message = status_message_for(feedback.trajectory_status, feedback);
    feedback.warnings = feedback_warnings(feedback, input);
    return feedback;
}

} // namespace retireplan
