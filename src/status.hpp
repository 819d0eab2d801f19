#ifndef RETIREPLAN_STATUS_HPP
#define RETIREPLAN_STATUS_HPP

#include "projection.hpp"
#include "projection_input.hpp"
#include <string>
#include <vector>

namespace retireplan {

enum class RetirementStatus {
    OnTrack,
    NeedsAdjustment,
    AtRisk
};

std::string retirement_status_to_string(RetirementStatus status);

// Depletion this many years or fewer after retirement is at risk
constexpr int AT_RISK_RUNWAY_YEARS = 20;

struct RetirementStatusResult {
    RetirementStatus status;
    std::string label;
    std::string description;

    RetirementStatusResult();
};

// on-track when the plan never depletes, needs-adjustment when it lasts more
// than AT_RISK_RUNWAY_YEARS into retirement, at-risk otherwise
RetirementStatusResult determine_retirement_status(const ProjectionSummary& summary,
                                                   const ProjectionInput& input);

enum class WarningSeverity {
    Info,
    Warning
};

std::string warning_severity_to_string(WarningSeverity severity);

// Advisory note on an input that is valid but unusual
struct ProjectionWarning {
    std::string field;
    std::string message;
    WarningSeverity severity;

    ProjectionWarning();
    ProjectionWarning(const std::string& field_, const std::string& message_, WarningSeverity severity_);
};

std::vector<ProjectionWarning> generate_projection_warnings(const ProjectionInput& input);

} // namespace retireplan

#endif // RETIREPLAN_STATUS_HPP
