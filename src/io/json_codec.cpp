#include "json_codec.hpp"
#include <algorithm>
#include <fstream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace retireplan {

namespace {

// ============================================================================
// Field readers
// ============================================================================

void expect_object(const json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ValidationError(context, "must be a JSON object");
    }
}

template <typename T>
void decode_value(const json& value, const std::string& key, T& out) {
    try {
        value.get_to(out);
    } catch (const ValidationError&) {
        throw;
    } catch (const json::exception&) {
        throw ValidationError(key, "has the wrong type (" + std::string(value.type_name()) + ")");
    } catch (const std::invalid_argument& e) {
        throw ValidationError(key, e.what());
    }
}

template <typename T>
void read_required(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw ValidationError(key, "is required");
    }
    decode_value(*it, key, out);
}

template <typename T>
void read_optional(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        decode_value(*it, key, out);
    }
}

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    T value;
    decode_value(*it, key, value);
    out = value;
}

template <typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
json optional_or_null(const std::optional<T>& value) {
    return value ? json(*value) : json();
}

} // anonymous namespace

// ============================================================================
// Enumerations
// ============================================================================

void to_json(json& j, IncomeStreamType type) { j = income_stream_type_to_string(type); }
void from_json(const json& j, IncomeStreamType& type) { type = income_stream_type_from_string(j.get<std::string>()); }
void to_json(json& j, ReserveType type) { j = reserve_type_to_string(type); }
void from_json(const json& j, ReserveType& type) { type = reserve_type_from_string(j.get<std::string>()); }
void to_json(json& j, ReservePurpose purpose) { j = reserve_purpose_to_string(purpose); }
void from_json(const json& j, ReservePurpose& purpose) { purpose = reserve_purpose_from_string(j.get<std::string>()); }
void to_json(json& j, RiskTolerance risk) { j = risk_tolerance_to_string(risk); }
void from_json(const json& j, RiskTolerance& risk) { risk = risk_tolerance_from_string(j.get<std::string>()); }

// ============================================================================
// Input model
// ============================================================================

void to_json(json& j, const BalanceByType& balances) {
    j = json{
        {"taxDeferred", balances.tax_deferred},
        {"taxFree", balances.tax_free},
        {"taxable", balances.taxable}
    };
}

void from_json(const json& j, BalanceByType& balances) {
    expect_object(j, "balancesByType");
    balances = BalanceByType();
    read_optional(j, "taxDeferred", balances.tax_deferred);
    read_optional(j, "taxFree", balances.tax_free);
    read_optional(j, "taxable", balances.taxable);
}

void to_json(json& j, const ContributionAllocation& alloc) {
    j = json{
        {"taxDeferred", alloc.tax_deferred},
        {"taxFree", alloc.tax_free},
        {"taxable", alloc.taxable}
    };
}

// All three percentages are required; a partial allocation cannot sum to 100
void from_json(const json& j, ContributionAllocation& alloc) {
    expect_object(j, "contributionAllocation");
    read_required(j, "taxDeferred", alloc.tax_deferred);
    read_required(j, "taxFree", alloc.tax_free);
    read_required(j, "taxable", alloc.taxable);
}

void to_json(json& j, const IncomeStream& stream) {
    j = json{
        {"id", stream.id},
        {"name", stream.name},
        {"type", stream.type},
        {"annualAmount", stream.annual_amount},
        {"startAge", stream.start_age},
        {"inflationAdjusted", stream.inflation_adjusted},
        {"isGuaranteed", stream.is_guaranteed}
    };
    write_optional(j, "endAge", stream.end_age);
    write_optional(j, "isSpouse", stream.is_spouse);
}

void from_json(const json& j, IncomeStream& stream) {
    expect_object(j, "incomeStreams");
    stream = IncomeStream();
    read_required(j, "id", stream.id);
    read_optional(j, "name", stream.name);
    read_required(j, "type", stream.type);
    read_required(j, "annualAmount", stream.annual_amount);
    read_required(j, "startAge", stream.start_age);
    read_optional(j, "endAge", stream.end_age);
    read_optional(j, "inflationAdjusted", stream.inflation_adjusted);
    stream.is_guaranteed = default_is_guaranteed(stream.type);
    read_optional(j, "isGuaranteed", stream.is_guaranteed);
    read_optional(j, "isSpouse", stream.is_spouse);
}

void to_json(json& j, const SpendingPhase& phase) {
    j = json{
        {"id", phase.id},
        {"name", phase.name},
        {"startAge", phase.start_age},
        {"essentialMultiplier", phase.essential_multiplier},
        {"discretionaryMultiplier", phase.discretionary_multiplier}
    };
    write_optional(j, "absoluteEssential", phase.absolute_essential);
    write_optional(j, "absoluteDiscretionary", phase.absolute_discretionary);
}

void from_json(const json& j, SpendingPhase& phase) {
    expect_object(j, "phases");
    phase = SpendingPhase();
    read_optional(j, "id", phase.id);
    read_optional(j, "name", phase.name);
    read_required(j, "startAge", phase.start_age);
    read_optional(j, "essentialMultiplier", phase.essential_multiplier);
    read_optional(j, "discretionaryMultiplier", phase.discretionary_multiplier);
    read_optional(j, "absoluteEssential", phase.absolute_essential);
    read_optional(j, "absoluteDiscretionary", phase.absolute_discretionary);
}

void to_json(json& j, const SpendingPhaseConfig& config) {
    j = json{{"enabled", config.enabled}, {"phases", config.phases}};
}

void from_json(const json& j, SpendingPhaseConfig& config) {
    expect_object(j, "spendingPhaseConfig");
    config = SpendingPhaseConfig();
    read_optional(j, "enabled", config.enabled);
    read_optional(j, "phases", config.phases);
}

void to_json(json& j, const ReserveConfig& reserve) {
    j = json{
        {"type", reserve.type},
        {"amount", reserve.amount},
        {"purposes", reserve.purposes}
    };
    write_optional(j, "note", reserve.note);
}

void from_json(const json& j, ReserveConfig& reserve) {
    expect_object(j, "reserve");
    reserve = ReserveConfig();
    read_optional(j, "type", reserve.type);
    read_optional(j, "amount", reserve.amount);
    read_optional(j, "purposes", reserve.purposes);
    read_optional(j, "note", reserve.note);
}

void to_json(json& j, const DepletionTarget& target) {
    j = json{
        {"enabled", target.enabled},
        {"targetPercentageSpent", target.target_percentage_spent},
        {"targetAge", target.target_age},
        {"reserve", target.reserve}
    };
}

void from_json(const json& j, DepletionTarget& target) {
    expect_object(j, "depletionTarget");
    target = DepletionTarget();
    read_optional(j, "enabled", target.enabled);
    read_optional(j, "targetPercentageSpent", target.target_percentage_spent);
    read_optional(j, "targetAge", target.target_age);
    read_optional(j, "reserve", target.reserve);
}

void to_json(json& j, const RmdConfig& rmd) {
    j = json{{"enabled", rmd.enabled}, {"startAge", rmd.start_age}};
}

void from_json(const json& j, RmdConfig& rmd) {
    expect_object(j, "rmd");
    rmd = RmdConfig();
    read_optional(j, "enabled", rmd.enabled);
    read_optional(j, "startAge", rmd.start_age);
}

void to_json(json& j, const ProjectionInput& input) {
    j = json{
        {"currentAge", input.current_age},
        {"retirementAge", input.retirement_age},
        {"maxAge", input.max_age},
        {"balancesByType", input.balances_by_type},
        {"annualContribution", input.annual_contribution},
        {"contributionAllocation", input.contribution_allocation},
        {"expectedReturn", input.expected_return},
        {"inflationRate", input.inflation_rate},
        {"contributionGrowthRate", input.contribution_growth_rate},
        {"annualEssentialExpenses", input.annual_essential_expenses},
        {"annualDiscretionaryExpenses", input.annual_discretionary_expenses},
        {"annualExpenses", input.annual_expenses},
        {"annualHealthcareCosts", input.annual_healthcare_costs},
        {"healthcareInflationRate", input.healthcare_inflation_rate},
        {"incomeStreams", input.income_streams},
        {"annualDebtPayments", input.annual_debt_payments},
        {"rmd", input.rmd}
    };
    write_optional(j, "debtPayoffAge", input.debt_payoff_age);
    write_optional(j, "spendingPhaseConfig", input.spending_phase_config);
    write_optional(j, "depletionTarget", input.depletion_target);
    write_optional(j, "reserveFloor", input.reserve_floor);
}

void from_json(const json& j, ProjectionInput& input) {
    expect_object(j, "input");
    input = ProjectionInput();
    read_required(j, "currentAge", input.current_age);
    read_required(j, "retirementAge", input.retirement_age);
    read_optional(j, "maxAge", input.max_age);
    read_optional(j, "balancesByType", input.balances_by_type);
    read_optional(j, "annualContribution", input.annual_contribution);
    read_optional(j, "contributionAllocation", input.contribution_allocation);
    read_optional(j, "expectedReturn", input.expected_return);
    read_optional(j, "inflationRate", input.inflation_rate);
    read_optional(j, "contributionGrowthRate", input.contribution_growth_rate);
    read_optional(j, "annualEssentialExpenses", input.annual_essential_expenses);
    read_optional(j, "annualDiscretionaryExpenses", input.annual_discretionary_expenses);
    read_optional(j, "annualExpenses", input.annual_expenses);
    read_optional(j, "annualHealthcareCosts", input.annual_healthcare_costs);
    read_optional(j, "healthcareInflationRate", input.healthcare_inflation_rate);
    read_optional(j, "incomeStreams", input.income_streams);
    read_optional(j, "annualDebtPayments", input.annual_debt_payments);
    read_optional(j, "debtPayoffAge", input.debt_payoff_age);
    read_optional(j, "spendingPhaseConfig", input.spending_phase_config);
    read_optional(j, "depletionTarget", input.depletion_target);
    read_optional(j, "reserveFloor", input.reserve_floor);
    read_optional(j, "rmd", input.rmd);
}

void to_json(json& j, const ProjectionAssumptions& assumptions) {
    j = json{
        {"expectedReturn", assumptions.expected_return},
        {"inflationRate", assumptions.inflation_rate},
        {"healthcareInflationRate", assumptions.healthcare_inflation_rate},
        {"contributionGrowthRate", assumptions.contribution_growth_rate},
        {"retirementAge", assumptions.retirement_age},
        {"maxAge", assumptions.max_age}
    };
}

// ============================================================================
// Snapshot and overrides
// ============================================================================

void from_json(const json& j, InvestmentAccount& account) {
    expect_object(j, "investmentAccounts");
    account = InvestmentAccount();
    read_optional(j, "name", account.name);
    read_required(j, "type", account.type);
    read_required(j, "balance", account.balance);
    read_optional(j, "monthlyContribution", account.monthly_contribution);
}

void from_json(const json& j, Debt& debt) {
    expect_object(j, "debts");
    debt = Debt();
    read_optional(j, "name", debt.name);
    read_required(j, "balance", debt.balance);
    read_optional(j, "interestRate", debt.interest_rate);
}

void from_json(const json& j, FinancialSnapshot& snapshot) {
    expect_object(j, "snapshot");
    snapshot = FinancialSnapshot();
    read_required(j, "birthYear", snapshot.birth_year);
    read_required(j, "targetRetirementAge", snapshot.target_retirement_age);
    read_optional(j, "riskTolerance", snapshot.risk_tolerance);
    read_optional(j, "annualIncome", snapshot.annual_income);
    read_optional(j, "savingsRate", snapshot.savings_rate);

    auto budget = j.find("incomeExpenses");
    if (budget != j.end() && !budget->is_null()) {
        expect_object(*budget, "incomeExpenses");
        read_optional(*budget, "monthlyEssential", snapshot.monthly_essential);
        read_optional(*budget, "monthlyDiscretionary", snapshot.monthly_discretionary);
    }

    read_optional(j, "investmentAccounts", snapshot.accounts);
    read_optional(j, "debts", snapshot.debts);
    read_optional(j, "incomeStreams", snapshot.income_streams);
    read_optional(j, "spendingPhaseConfig", snapshot.spending_phase_config);
    read_optional(j, "depletionTarget", snapshot.depletion_target);
}

void from_json(const json& j, ProjectionOverrides& overrides) {
    expect_object(j, "overrides");
    overrides = ProjectionOverrides();
    read_optional(j, "expectedReturn", overrides.expected_return);
    read_optional(j, "inflationRate", overrides.inflation_rate);
    read_optional(j, "retirementAge", overrides.retirement_age);
    read_optional(j, "maxAge", overrides.max_age);
    read_optional(j, "contributionGrowthRate", overrides.contribution_growth_rate);
    read_optional(j, "contributionAllocation", overrides.contribution_allocation);
    read_optional(j, "annualHealthcareCosts", overrides.annual_healthcare_costs);
    read_optional(j, "healthcareInflationRate", overrides.healthcare_inflation_rate);
    read_optional(j, "incomeStreams", overrides.income_streams);
    read_optional(j, "socialSecurityAge", overrides.social_security_age);
    read_optional(j, "socialSecurityMonthly", overrides.social_security_monthly);
    read_optional(j, "spendingPhaseConfig", overrides.spending_phase_config);
    read_optional(j, "depletionTarget", overrides.depletion_target);
    read_optional(j, "reserveFloor", overrides.reserve_floor);
}

// ============================================================================
// Projection results
// ============================================================================

void to_json(json& j, const RmdDetail& rmd) {
    j = json{
        {"rmdRequired", rmd.required},
        {"rmdTaken", rmd.taken},
        {"reinvested", rmd.reinvested}
    };
}

void to_json(json& j, const ProjectionRecord& record) {
    j = json{
        {"age", record.age},
        {"year", record.year},
        {"retired", record.retired},
        {"startingBalance", record.starting_balance},
        {"balance", record.balance},
        {"balanceByType", record.balance_by_type},
        {"inflows", record.inflows},
        {"outflows", record.outflows},
        {"contribution", record.contribution},
        {"withdrawal", record.withdrawal},
        {"income", record.income},
        {"essentialExpenses", record.essential_expenses},
        {"discretionaryExpenses", record.discretionary_expenses},
        {"healthcareExpenses", record.healthcare_expenses},
        {"debtPayments", record.debt_payments},
        {"actualEssentialSpending", record.actual_essential_spending},
        {"actualDiscretionarySpending", record.actual_discretionary_spending},
        {"reserveConstrained", record.reserve_constrained},
        {"reductionStage", reduction_stage_to_string(record.reduction_stage)},
        {"spendingShortfall", record.spending_shortfall},
        {"investmentGrowth", record.investment_growth}
    };
    if (!record.active_phase_name.empty()) {
        j["activePhaseName"] = record.active_phase_name;
    }
    write_optional(j, "withdrawalsByType", record.withdrawals_by_type);
    write_optional(j, "rmd", record.rmd);
    write_optional(j, "reserveBalance", record.reserve_balance);
}

void to_json(json& j, const ProjectionSummary& summary) {
    j = json{
        {"startingBalance", summary.starting_balance},
        {"projectedRetirementBalance", summary.projected_retirement_balance},
        {"endingBalance", summary.ending_balance},
        {"totalContributions", summary.total_contributions},
        {"totalWithdrawals", summary.total_withdrawals},
        {"yearsUntilDepletion", optional_or_null(summary.years_until_depletion)},
        {"depletionAge", optional_or_null(summary.depletion_age)},
        {"yearsReserveConstrained", summary.years_reserve_constrained}
    };
    write_optional(j, "reserveFloor", summary.reserve_floor);
    write_optional(j, "firstReserveConstraintAge", summary.first_reserve_constraint_age);
}

void to_json(json& j, const ProjectionResult& result) {
    j = json{
        {"records", result.records},
        {"summary", result.summary},
        {"assumptions", result.assumptions}
    };
}

// ============================================================================
// Analyzer results
// ============================================================================

void to_json(json& j, const LeverImpact& impact) {
    j = json{
        {"lever", lever_kind_to_string(impact.lever)},
        {"name", impact.name},
        {"baselineValue", impact.baseline_value},
        {"testValue", impact.test_value},
        {"testDelta", impact.test_delta},
        {"direction", impact_direction_to_string(impact.direction)},
        {"perturbedBalance", impact.perturbed_balance},
        {"impactOnBalance", impact.impact_on_balance},
        {"percentImpact", impact.percent_impact},
        {"perturbedDepletionAge", optional_or_null(impact.perturbed_depletion_age)},
        {"impactOnDepletion", optional_or_null(impact.impact_on_depletion)}
    };
}

void to_json(json& j, const SensitivityResult& result) {
    j = json{
        {"metric", outcome_metric_to_string(result.metric)},
        {"baselineBalance", result.baseline_balance},
        {"baselineDepletion", optional_or_null(result.baseline_depletion)},
        {"baselineDepletionAge", optional_or_null(result.baseline_depletion_age)},
        {"topLevers", result.top_levers},
        {"allLevers", result.all_levers}
    };
}

void to_json(json& j, const LowFrictionWin& win) {
    j = json{
        {"id", win.id},
        {"title", win.title},
        {"description", win.description},
        {"lever", lever_kind_to_string(win.lever)},
        {"effort", effort_level_to_string(win.effort)},
        {"change", win.change},
        {"potentialImpact", win.potential_impact},
        {"percentImpact", win.percent_impact}
    };
}

void to_json(json& j, const SensitiveAssumption& assumption) {
    j = json{
        {"lever", lever_kind_to_string(assumption.lever)},
        {"name", assumption.name},
        {"displayName", assumption.display_name},
        {"sensitivityScore", assumption.sensitivity_score},
        {"impactOnBalance", assumption.impact_on_balance},
        {"percentImpact", assumption.percent_impact},
        {"explanation", assumption.explanation},
        {"suggestion", assumption.suggestion}
    };
}

// Unlimited runway is explicit; years is null rather than a magic number
void to_json(json& j, const RunwayYears& runway) {
    j = json{
        {"unlimited", runway.unlimited},
        {"years", runway.unlimited ? json() : json(runway.years)}
    };
}

void to_json(json& j, const ReserveRunway& runway) {
    j = json{
        {"reserveAmount", runway.reserve_amount},
        {"essentialGap", runway.essential_gap},
        {"essentialsRunway", runway.essentials_runway},
        {"fullSpendingRunway", runway.full_spending_runway},
        {"description", runway.description}
    };
}

void to_json(json& j, const PhaseSpending& phase) {
    j = json{
        {"phaseId", phase.phase_id},
        {"phaseName", phase.phase_name},
        {"startAge", phase.start_age},
        {"endAge", phase.end_age},
        {"years", phase.years},
        {"annualSpending", phase.annual_spending},
        {"monthlySpending", phase.monthly_spending}
    };
}

void to_json(json& j, const DepletionFeedback& feedback) {
    j = json{
        {"enabled", feedback.enabled},
        {"currentPortfolio", feedback.current_portfolio},
        {"targetPercentageSpent", feedback.target_percentage_spent},
        {"targetAge", feedback.target_age},
        {"reserveAmount", feedback.reserve_amount},
        {"sustainableAnnualSpending", feedback.sustainable_annual_spending},
        {"sustainableMonthlySpending", feedback.sustainable_monthly_spending},
        {"plannedAnnualSpending", feedback.planned_annual_spending},
        {"spendingRatio", feedback.spending_ratio},
        {"trajectoryStatus", trajectory_status_to_string(feedback.trajectory_status)},
        {"projectedBalanceAtTarget", feedback.projected_balance_at_target},
        {"projectedDepletionAge", optional_or_null(feedback.projected_depletion_age)},
        {"phaseBreakdown", feedback.phase_breakdown},
        {"reserveRunway", optional_or_null(feedback.reserve_runway)},
        {"statusMessage", feedback.status_message},
        {"warnings", feedback.warnings}
    };
}

void to_json(json& j, const IncomeFloorCoverage& coverage) {
    j = json{
        {"age", coverage.age},
        {"guaranteedIncome", coverage.guaranteed_income},
        {"essentialExpenses", coverage.essential_expenses},
        {"coverageRatio", coverage.coverage_ratio},
        {"status", income_floor_status_to_string(coverage.status)}
    };
}

void to_json(json& j, const IncomeFloorAnalysis& analysis) {
    j = json{
        {"guaranteedIncomeAtRetirement", analysis.guaranteed_income_at_retirement},
        {"essentialExpensesAtRetirement", analysis.essential_expenses_at_retirement},
        {"coverageRatioAtRetirement", analysis.coverage_ratio_at_retirement},
        {"status", income_floor_status_to_string(analysis.status)},
        {"floorEstablishedAge", optional_or_null(analysis.floor_established_age)},
        {"coverageByAge", analysis.coverage_by_age},
        {"insight", analysis.insight}
    };
}

void to_json(json& j, const YearlySpending& year) {
    j = json{{"age", year.age}, {"amount", year.amount}};
    if (!year.phase_name.empty()) {
        j["phase"] = year.phase_name;
    }
}

void to_json(json& j, const SpendingStrategyOutcome& outcome) {
    j = json{
        {"totalLifetimeSpending", outcome.total_lifetime_spending},
        {"portfolioDepletionAge", optional_or_null(outcome.depletion_age)},
        {"endingBalance", outcome.ending_balance},
        {"yearlySpending", outcome.yearly_spending}
    };
}

void to_json(json& j, const SpendingComparison& comparison) {
    j = json{
        {"flatSpending", comparison.flat},
        {"phasedSpending", comparison.phased},
        {"earlyYearsCount", comparison.early_years},
        {"earlyYearsBonus", comparison.early_years_bonus},
        {"breakEvenAge", optional_or_null(comparison.break_even_age)},
        {"longevityDifference", comparison.longevity_difference}
    };
}

void to_json(json& j, const FieldChange& change) {
    j = json{
        {"field", change.field},
        {"previous", change.previous},
        {"current", change.current}
    };
}

void to_json(json& j, const StalenessResult& result) {
    j = json{
        {"isStale", result.is_stale},
        {"changedFields", result.changed_fields},
        {"changes", result.changes}
    };
}

void to_json(json& j, const RetirementStatusResult& status) {
    j = json{
        {"status", retirement_status_to_string(status.status)},
        {"label", status.label},
        {"description", status.description}
    };
}

void to_json(json& j, const ProjectionWarning& warning) {
    j = json{
        {"field", warning.field},
        {"message", warning.message},
        {"severity", warning_severity_to_string(warning.severity)}
    };
}

namespace io {

namespace {

template <typename T>
T decode_document(const json& j) {
    T value;
    decode_value(j, "document", value);
    return value;
}

} // anonymous namespace

ProjectionInput projection_input_from_json(const json& j) {
    return decode_document<ProjectionInput>(j);
}

FinancialSnapshot financial_snapshot_from_json(const json& j) {
    return decode_document<FinancialSnapshot>(j);
}

ProjectionOverrides projection_overrides_from_json(const json& j) {
    return decode_document<ProjectionOverrides>(j);
}

json canonical_projection_input_json(const ProjectionInput& input) {
    ProjectionInput canonical = input;

    std::stable_sort(canonical.income_streams.begin(), canonical.income_streams.end(),
                     [](const IncomeStream& a, const IncomeStream& b) { return a.id < b.id; });

    if (canonical.spending_phase_config) {
        if (!canonical.spending_phase_config->enabled) {
            canonical.spending_phase_config.reset();
        } else {
            std::vector<SpendingPhase>& phases = canonical.spending_phase_config->phases;
            std::stable_sort(phases.begin(), phases.end(),
                             [](const SpendingPhase& a, const SpendingPhase& b) {
                                 return a.start_age < b.start_age;
                             });
        }
    }

    return json(canonical);
}

json read_json_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open JSON file: " + filepath);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
    }
}

void write_json(std::ostream& os, const json& j, bool pretty_print) {
    if (pretty_print) {
        os << j.dump(2) << "\n";
    } else {
        os << j.dump() << "\n";
    }
}

void write_json(const std::string& filepath, const json& j, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_json(file, j, pretty_print);
}

} // namespace io
} // namespace retireplan
