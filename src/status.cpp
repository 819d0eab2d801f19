#include "status.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace retireplan {

std::string retirement_status_to_string(RetirementStatus status) {
    switch (status) {
        case RetirementStatus::OnTrack: return "on-track";
        case RetirementStatus::NeedsAdjustment: return "needs-adjustment";
        case RetirementStatus::AtRisk: return "at-risk";
    }
    return "at-risk";
}

std::string warning_severity_to_string(WarningSeverity severity) {
    return severity == WarningSeverity::Warning ? "warning" : "info";
}

RetirementStatusResult::RetirementStatusResult() : status(RetirementStatus::OnTrack) {}

ProjectionWarning::ProjectionWarning() : severity(WarningSeverity::Info) {}

ProjectionWarning::ProjectionWarning(const std::string& field_, const std::string& message_,
                                     WarningSeverity severity_)
    : field(field_), message(message_), severity(severity_) {}

RetirementStatusResult determine_retirement_status(const ProjectionSummary& summary,
                                                   const ProjectionInput& input) {
    RetirementStatusResult result;

    if (!summary.years_until_depletion) {
        result.status = RetirementStatus::OnTrack;
        result.label = "On Track";
        result.description = "Your retirement savings are projected to last through age " +
                             std::to_string(input.max_age) + ".";
        return result;
    }

    const int depletion_age = summary.depletion_age
        ? *summary.depletion_age
        : input.retirement_age + *summary.years_until_depletion;

    if (*summary.years_until_depletion > AT_RISK_RUNWAY_YEARS) {
        result.status = RetirementStatus::NeedsAdjustment;
        result.label = "Needs Adjustment";
        result.description = "Funds may run out at age " + std::to_string(depletion_age) +
                             ". Consider increasing savings.";
    } else {
        result.status = RetirementStatus::AtRisk;
        result.label = "At Risk of Shortfall";
        result.description = "Funds projected to run out at age " + std::to_string(depletion_age) +
                             ". Action recommended.";
    }
    return result;
}

namespace {

std::string percent_one_decimal(double rate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << rate * 100.0 << "%";
    return oss.str();
}

std::string whole_dollars(double amount) {
    std::string digits = std::to_string(std::llround(amount));
    for (int pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<size_t>(pos), ",");
    }
    return "$" + digits;
}

} // anonymous namespace

std::vector<ProjectionWarning> generate_projection_warnings(const ProjectionInput& input) {
    std::vector<ProjectionWarning> warnings;

    if (input.inflation_rate > 0.08) {
        warnings.emplace_back("inflationRate",
            "Inflation rate of " + percent_one_decimal(input.inflation_rate) +
            " is higher than historical averages. Consider using a more conservative estimate (2-4% is typical).",
            WarningSeverity::Warning);
    }

    if (input.expected_return < 0.02) {
        warnings.emplace_back("expectedReturn",
            "Expected return of " + percent_one_decimal(input.expected_return) +
            " is quite conservative. Historical stock market returns average 7-10% before inflation.",
            WarningSeverity::Info);
    }

    if (input.balances_by_type.total() == 0.0 && input.annual_contribution == 0.0) {
        warnings.emplace_back("savings",
            "Starting with no savings and no contributions will result in relying entirely on other "
            "income sources in retirement.",
            WarningSeverity::Warning);
    }

    if (input.annual_debt_payments > 0.0 && input.annual_contribution > 0.0 &&
        input.annual_contribution - input.annual_debt_payments <= 0.0) {
        warnings.emplace_back("debt",
            "Your debt payments exceed your retirement contributions. Consider prioritizing debt reduction.",
            WarningSeverity::Info);
    }

    const int years_to_retirement = input.retirement_age - input.current_age;
    if (years_to_retirement > 0 && years_to_retirement <= 5) {
        warnings.emplace_back("retirementAge",
            "You're " + std::to_string(years_to_retirement) +
            (years_to_retirement == 1 ? " year" : " years") +
            " from retirement. Focus on preserving capital and finalizing your income strategy.",
            WarningSeverity::Info);
    }

    const int rmd_age = input.rmd.start_age;
    if (input.rmd.enabled && input.current_age >= rmd_age - 3 && input.current_age < rmd_age &&
        input.balances_by_type.tax_deferred > 100000.0) {
        warnings.emplace_back("rmd",
            "You're approaching age " + std::to_string(rmd_age) +
            " when Required Minimum Distributions (RMDs) begin. With " +
            whole_dollars(input.balances_by_type.tax_deferred) +
            " in tax-deferred accounts, you'll be required to withdraw a minimum amount each year starting at age " +
            std::to_string(rmd_age) + ".",
            WarningSeverity::Info);
    }

    return warnings;
}

} // namespace retireplan
