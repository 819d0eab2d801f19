#ifndef RETIREPLAN_IO_JSON_CODEC_HPP
#define RETIREPLAN_IO_JSON_CODEC_HPP

#include "../depletion.hpp"
#include "../income_floor.hpp"
#include "../input_builder.hpp"
#include "../projection.hpp"
#include "../projection_input.hpp"
#include "../reserve_runway.hpp"
#include "../sensitivity.hpp"
#include "../spending_comparison.hpp"
#include "../staleness.hpp"
#include "../status.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace retireplan {

// ============================================================================
// nlohmann::json hooks (found by ADL). Keys are camelCase and stable; absent
// optionals are omitted on write and default on read.
// ============================================================================

// Enumerations travel as their string names
void to_json(nlohmann::json& j, IncomeStreamType type);
void from_json(const nlohmann::json& j, IncomeStreamType& type);
void to_json(nlohmann::json& j, ReserveType type);
void from_json(const nlohmann::json& j, ReserveType& type);
void to_json(nlohmann::json& j, ReservePurpose purpose);
void from_json(const nlohmann::json& j, ReservePurpose& purpose);
void to_json(nlohmann::json& j, RiskTolerance risk);
void from_json(const nlohmann::json& j, RiskTolerance& risk);

// Input model
void to_json(nlohmann::json& j, const BalanceByType& balances);
void from_json(const nlohmann::json& j, BalanceByType& balances);
void to_json(nlohmann::json& j, const ContributionAllocation& alloc);
void from_json(const nlohmann::json& j, ContributionAllocation& alloc);
void to_json(nlohmann::json& j, const IncomeStream& stream);
void from_json(const nlohmann::json& j, IncomeStream& stream);
void to_json(nlohmann::json& j, const SpendingPhase& phase);
void from_json(const nlohmann::json& j, SpendingPhase& phase);
void to_json(nlohmann::json& j, const SpendingPhaseConfig& config);
void from_json(const nlohmann::json& j, SpendingPhaseConfig& config);
void to_json(nlohmann::json& j, const ReserveConfig& reserve);
void from_json(const nlohmann::json& j, ReserveConfig& reserve);
void to_json(nlohmann::json& j, const DepletionTarget& target);
void from_json(const nlohmann::json& j, DepletionTarget& target);
void to_json(nlohmann::json& j, const RmdConfig& rmd);
void from_json(const nlohmann::json& j, RmdConfig& rmd);
void to_json(nlohmann::json& j, const ProjectionInput& input);
void from_json(const nlohmann::json& j, ProjectionInput& input);
void to_json(nlohmann::json& j, const ProjectionAssumptions& assumptions);

// Snapshot and overrides (read-only)
void from_json(const nlohmann::json& j, InvestmentAccount& account);
void from_json(const nlohmann::json& j, Debt& debt);
void from_json(const nlohmann::json& j, FinancialSnapshot& snapshot);
void from_json(const nlohmann::json& j, ProjectionOverrides& overrides);

// Results (write-only)
void to_json(nlohmann::json& j, const RmdDetail& rmd);
void to_json(nlohmann::json& j, const ProjectionRecord& record);
void to_json(nlohmann::json& j, const ProjectionSummary& summary);
void to_json(nlohmann::json& j, const ProjectionResult& result);
void to_json(nlohmann::json& j, const LeverImpact& impact);
void to_json(nlohmann::json& j, const SensitivityResult& result);
void to_json(nlohmann::json& j, const LowFrictionWin& win);
void to_json(nlohmann::json& j, const SensitiveAssumption& assumption);
void to_json(nlohmann::json& j, const RunwayYears& runway);
void to_json(nlohmann::json& j, const ReserveRunway& runway);
void to_json(nlohmann::json& j, const PhaseSpending& phase);
void to_json(nlohmann::json& j, const DepletionFeedback& feedback);
void to_json(nlohmann::json& j, const IncomeFloorCoverage& coverage);
void to_json(nlohmann::json& j, const IncomeFloorAnalysis& analysis);
void to_json(nlohmann::json& j, const YearlySpending& year);
void to_json(nlohmann::json& j, const SpendingStrategyOutcome& outcome);
void to_json(nlohmann::json& j, const SpendingComparison& comparison);
void to_json(nlohmann::json& j, const FieldChange& change);
void to_json(nlohmann::json& j, const StalenessResult& result);
void to_json(nlohmann::json& j, const RetirementStatusResult& status);
void to_json(nlohmann::json& j, const ProjectionWarning& warning);

namespace io {

// Decode entry points. Missing or mistyped fields raise ValidationError
// naming the field; the decoded input is not validated further.
ProjectionInput projection_input_from_json(const nlohmann::json& j);
FinancialSnapshot financial_snapshot_from_json(const nlohmann::json& j);
ProjectionOverrides projection_overrides_from_json(const nlohmann::json& j);

// Order-independent form used for hashing and staleness: income streams
// sorted by id, phases by start age, and a disabled phase config dropped.
nlohmann::json canonical_projection_input_json(const ProjectionInput& input);

// Parse a JSON document from disk
// Throws std::runtime_error if the file cannot be opened or parsed
nlohmann::json read_json_file(const std::string& filepath);

void write_json(std::ostream& os, const nlohmann::json& j, bool pretty_print = true);
void write_json(const std::string& filepath, const nlohmann::json& j, bool pretty_print = true);

} // namespace io
} // namespace retireplan

#endif // RETIREPLAN_IO_JSON_CODEC_HPP
