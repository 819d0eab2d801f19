#include "income_floor.hpp"
#include "income_streams.hpp"
#include "spending.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace retireplan {

std::string income_floor_status_to_string(IncomeFloorStatus status) {
    switch (status) {
        case IncomeFloorStatus::FullyCovered: return "fully-covered";
        case IncomeFloorStatus::Partial: return "partial";
        case IncomeFloorStatus::Insufficient: return "insufficient";
    }
    return "insufficient";
}

IncomeFloorCoverage::IncomeFloorCoverage()
    : age(0),
      guaranteed_income(0.0),
      essential_expenses(0.0),
      coverage_ratio(0.0),
      status(IncomeFloorStatus::Insufficient) {}

IncomeFloorAnalysis::IncomeFloorAnalysis()
    : guaranteed_income_at_retirement(0.0),
      essential_expenses_at_retirement(0.0),
      coverage_ratio_at_retirement(0.0),
      status(IncomeFloorStatus::Insufficient) {}

double coverage_ratio(double guaranteed_income, double essential_expenses) {
    if (essential_expenses <= 0.0) {
        return guaranteed_income > 0.0 ? std::numeric_limits<double>::infinity() : 1.0;
    }
    return guaranteed_income / essential_expenses;
}

IncomeFloorStatus classify_coverage(double ratio, bool guaranteed_income_pending) {
    if (ratio >= FULL_COVERAGE_THRESHOLD) {
        return IncomeFloorStatus::FullyCovered;
    }
    if (ratio > 0.0 || guaranteed_income_pending) {
        return IncomeFloorStatus::Partial;
    }
    return IncomeFloorStatus::Insufficient;
}

namespace {

// A guaranteed stream not yet paying at `age` will start within the plan
bool guaranteed_income_starts_later(const ProjectionInput& input, int age) {
    for (const IncomeStream& stream : input.income_streams) {
        if (stream.is_guaranteed && stream.annual_amount > 0.0 &&
            stream.start_age > age && stream.start_age <= input.max_age) {
            return true;
        }
    }
    return false;
}

int whole_percent(double ratio) {
    return static_cast<int>(std::lround(ratio * 100.0));
}

std::string build_insight(const IncomeFloorAnalysis& analysis) {
    std::ostringstream oss;
    const double ratio = analysis.coverage_ratio_at_retirement;

    if (ratio >= FULL_COVERAGE_THRESHOLD) {
        oss << "Guaranteed income covers all of your essential expenses from the start of retirement, "
            << "so market swings only affect discretionary spending.";
    } else if (analysis.floor_established_age) {
        const double gap = analysis.essential_expenses_at_retirement - analysis.guaranteed_income_at_retirement;
        oss << "Guaranteed income fully covers essential expenses from age "
            << *analysis.floor_established_age << ". Until then your portfolio bridges a gap of about $"
            << std::llround(gap) << " a year.";
    } else if (ratio >= PARTIAL_COVERAGE_THRESHOLD) {
        oss << "Guaranteed income covers " << whole_percent(ratio)
            << "% of essential expenses at retirement. The rest depends on your portfolio.";
    } else {
        oss << "Guaranteed income covers only " << whole_percent(ratio)
            << "% of essential expenses at retirement, leaving most essentials dependent on your portfolio.";
    }
    return oss.str();
}

} // anonymous namespace

std::optional<IncomeFloorAnalysis> analyze_income_floor(const ProjectionInput& input) {
    validate_projection_input(input);

    if (!has_guaranteed_income(input.income_streams)) {
        return std::nullopt;
    }
    const double essential_at_retirement = nominal_expenses_at(input, input.retirement_age).essential;
    if (essential_at_retirement <= 0.0) {
        return std::nullopt;
    }

    IncomeFloorAnalysis analysis;
    for (int age = input.retirement_age; age <= input.max_age; ++age) {
        IncomeFloorCoverage coverage;
        coverage.age = age;
        coverage.guaranteed_income = resolve_income(input.income_streams, age, input.inflation_rate,
                                                    IncomeFilter::GuaranteedOnly);
        coverage.essential_expenses = nominal_expenses_at(input, age).essential;
        coverage.coverage_ratio = coverage_ratio(coverage.guaranteed_income, coverage.essential_expenses);
        coverage.status = classify_coverage(coverage.coverage_ratio,
                                            guaranteed_income_starts_later(input, age));

        if (!analysis.floor_established_age && coverage.coverage_ratio >= FULL_COVERAGE_THRESHOLD) {
            analysis.floor_established_age = age;
        }
        analysis.coverage_by_age.push_back(coverage);
    }

    const IncomeFloorCoverage& first = analysis.coverage_by_age.front();
    analysis.guaranteed_income_at_retirement = first.guaranteed_income;
    analysis.essential_expenses_at_retirement = first.essential_expenses;
    analysis.coverage_ratio_at_retirement = first.coverage_ratio;
    analysis.status = first.status;
    analysis.insight = build_insight(analysis);
    return analysis;
}

} // namespace retireplan
