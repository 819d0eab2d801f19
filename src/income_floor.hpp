#ifndef RETIREPLAN_INCOME_FLOOR_HPP
#define RETIREPLAN_INCOME_FLOOR_HPP

#include "projection_input.hpp"
#include <optional>
#include <string>
#include <vector>

namespace retireplan {

enum class IncomeFloorStatus {
    FullyCovered,
    Partial,
    Insufficient
};

std::string income_floor_status_to_string(IncomeFloorStatus status);

constexpr double FULL_COVERAGE_THRESHOLD = 1.0;
constexpr double PARTIAL_COVERAGE_THRESHOLD = 0.5;

// Guaranteed income vs. essential expenses at one age
struct IncomeFloorCoverage {
    int age;
    double guaranteed_income;
    double essential_expenses;
    double coverage_ratio;
    IncomeFloorStatus status;

    IncomeFloorCoverage();
};

struct IncomeFloorAnalysis {
    double guaranteed_income_at_retirement;
    double essential_expenses_at_retirement;
    double coverage_ratio_at_retirement;
    IncomeFloorStatus status;
    std::optional<int> floor_established_age;  // Earliest age with ratio >= 1
    std::vector<IncomeFloorCoverage> coverage_by_age;  // retirement_age..max_age
    std::string insight;

    IncomeFloorAnalysis();
};

// Guaranteed income / essential expenses. With no essential expenses any
// income is full coverage.
double coverage_ratio(double guaranteed_income, double essential_expenses);

// fully-covered at ratio >= 1, partial below that while some guaranteed income
// exists now or is scheduled to start later, insufficient otherwise
IncomeFloorStatus classify_coverage(double ratio, bool guaranteed_income_pending);

// Compare guaranteed income with inflated essential expenses for every
// retirement year. Returns nullopt when no guaranteed stream exists or
// essential expenses at retirement are zero.
std::optional<IncomeFloorAnalysis> analyze_income_floor(const ProjectionInput& input);

} // namespace retireplan

#endif // RETIREPLAN_INCOME_FLOOR_HPP
