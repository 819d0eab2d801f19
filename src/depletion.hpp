#ifndef RETIREPLAN_DEPLETION_HPP
#define RETIREPLAN_DEPLETION_HPP

#include "projection.hpp"
#include "projection_input.hpp"
#include "reserve_runway.hpp"
#include <optional>
#include <string>
#include <vector>

namespace retireplan {

enum class TrajectoryStatus {
    OnTrack,
    Underspending,
    Overspending
};

std::string trajectory_status_to_string(TrajectoryStatus status);

// Planned spending within this fraction of the sustainable level is on track
constexpr double TRAJECTORY_TOLERANCE = 0.05;

struct PhaseSpending {
    std::string phase_id;
    std::string phase_name;
    int start_age;
    int end_age;                    // Inclusive
    int years;
    double annual_spending;         // Sustainable, today's dollars
    double monthly_spending;

    PhaseSpending();
};

struct DepletionFeedback {
    bool enabled;
    double current_portfolio;
    double target_percentage_spent;
    int target_age;
    double reserve_amount;
    double sustainable_annual_spending;     // Today's dollars, averaged over retirement to target age
    double sustainable_monthly_spending;
    double planned_annual_spending;
    double spending_ratio;                  // planned / sustainable, 0 when nothing is sustainable
    TrajectoryStatus trajectory_status;
    double projected_balance_at_target;
    std::optional<int> projected_depletion_age;
    std::vector<PhaseSpending> phase_breakdown;
    std::optional<ReserveRunway> reserve_runway;
    std::string status_message;
    std::vector<std::string> warnings;

    DepletionFeedback();
};

// Dollar reserve a depletion target protects:
//   derived    = portfolio * (1 - target_percentage_spent / 100)
//   percentage = portfolio * amount / 100
//   absolute   = amount
double calculate_reserve_amount(const DepletionTarget& target, double portfolio);

TrajectoryStatus classify_trajectory(double planned, double sustainable,
                                     double tolerance = TRAJECTORY_TOLERANCE);

// Mean phase-adjusted essential + discretionary spending in today's dollars
// over retirement_age..through_age
double planned_real_spending(const ProjectionInput& input, int through_age);

// Find the spending level that leaves exactly the reserve at the target age.
// The search reruns the simulator with every spending line scaled together,
// so phase shapes, income, healthcare and RMDs all follow the projection's
// own model. Returns disabled feedback when no target is enabled.
DepletionFeedback calculate_depletion_feedback(
    const ProjectionInput& input,
    const ProjectionConfig& config = ProjectionConfig()
);

} // namespace retireplan

#endif // RETIREPLAN_DEPLETION_HPP
