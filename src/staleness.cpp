#include "staleness.hpp"
#include "io/json_codec.hpp"

namespace retireplan {

StalenessResult::StalenessResult() : is_stale(false) {}

const std::vector<std::string>& tracked_input_fields() {
    static const std::vector<std::string> fields = {
        "currentAge",
        "retirementAge",
        "maxAge",
        "balancesByType",
        "annualContribution",
        "contributionAllocation",
        "expectedReturn",
        "inflationRate",
        "contributionGrowthRate",
        "annualEssentialExpenses",
        "annualDiscretionaryExpenses",
        "annualExpenses",
        "annualHealthcareCosts",
        "healthcareInflationRate",
        "incomeStreams",
        "annualDebtPayments",
        "debtPayoffAge",
        "spendingPhaseConfig",
        "depletionTarget",
        "reserveFloor",
        "rmd"
    };
    return fields;
}

namespace {

nlohmann::json field_value(const nlohmann::json& input, const std::string& field) {
    auto it = input.find(field);
    return it == input.end() ? nlohmann::json() : *it;
}

} // anonymous namespace

StalenessResult check_projection_staleness(const ProjectionInput& stored, const ProjectionInput& current) {
    const nlohmann::json previous_json = io::canonical_projection_input_json(stored);
    const nlohmann::json current_json = io::canonical_projection_input_json(current);

    StalenessResult result;
    for (const std::string& field : tracked_input_fields()) {
        FieldChange change;
        change.field = field;
        change.previous = field_value(previous_json, field);
        change.current = field_value(current_json, field);
        if (change.previous != change.current) {
            result.changed_fields.push_back(field);
            result.changes.push_back(change);
        }
    }
    result.is_stale = !result.changed_fields.empty();
    return result;
}

} // namespace retireplan
