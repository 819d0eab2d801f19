#include "projection.hpp"
#include "income_streams.hpp"
#include "spending.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retireplan {

// ============================================================================
// Record types
// ============================================================================

RmdDetail::RmdDetail() : required(0.0), taken(0.0), reinvested(0.0) {}

std::string reduction_stage_to_string(ReductionStage stage) {
    switch (stage) {
        case ReductionStage::None: return "none";
        case ReductionStage::DiscretionaryReduced: return "discretionary_reduced";
        case ReductionStage::EssentialsOnly: return "essentials_only";
        case ReductionStage::EssentialsReduced: return "essentials_reduced";
    }
    return "none";
}

ReductionStage reduction_stage_from_string(const std::string& str) {
    if (str == "none") return ReductionStage::None;
    if (str == "discretionary_reduced") return ReductionStage::DiscretionaryReduced;
    if (str == "essentials_only") return ReductionStage::EssentialsOnly;
    if (str == "essentials_reduced") return ReductionStage::EssentialsReduced;
    throw std::invalid_argument("Unknown reduction stage: " + str);
}

ProjectionRecord::ProjectionRecord()
    : age(0),
      year(0),
      retired(false),
      starting_balance(0.0),
      balance(0.0),
      inflows(0.0),
      outflows(0.0),
      contribution(0.0),
      withdrawal(0.0),
      income(0.0),
      essential_expenses(0.0),
      discretionary_expenses(0.0),
      healthcare_expenses(0.0),
      debt_payments(0.0),
      actual_essential_spending(0.0),
      actual_discretionary_spending(0.0),
      reserve_constrained(false),
      reduction_stage(ReductionStage::None),
      spending_shortfall(0.0),
      investment_growth(0.0) {}

ProjectionSummary::ProjectionSummary()
    : starting_balance(0.0),
      projected_retirement_balance(0.0),
      ending_balance(0.0),
      total_contributions(0.0),
      total_withdrawals(0.0),
      years_reserve_constrained(0) {}

ProjectionResult::ProjectionResult() = default;

ProjectionResult::ProjectionResult(std::vector<ProjectionRecord>&& records_,
                                   const ProjectionSummary& summary_,
                                   const ProjectionAssumptions& assumptions_)
    : records(std::move(records_)), summary(summary_), assumptions(assumptions_) {}

const ProjectionRecord* ProjectionResult::record_at(int age) const {
    if (records.empty()) {
        return nullptr;
    }
    const int index = age - records.front().age;
    if (index < 0 || static_cast<size_t>(index) >= records.size()) {
        return nullptr;
    }
    return &records[static_cast<size_t>(index)];
}

// ============================================================================
// ProjectionConfig Implementation
// ============================================================================

std::shared_ptr<const RmdTable> default_rmd_table() {
    static const std::shared_ptr<const RmdTable> table =
        std::make_shared<RmdTable>(RmdTable::uniform_lifetime());
    return table;
}

ProjectionConfig::ProjectionConfig()
    : start_year(2025),
      rmd_table(default_rmd_table()),
      withdrawal_policy(default_withdrawal_policy()) {}

// ============================================================================
// Simulation
// ============================================================================

namespace {

// Per-run state threaded through the yearly steps
struct SimulationState {
    BalanceByType balances;
    bool depleted;

    SimulationState() : depleted(false) {}
};

double rmd_requirement(const ProjectionInput& input, const RmdTable& table,
                       double prior_tax_deferred, int age) {
    if (!input.rmd.enabled || age < input.rmd.start_age) {
        return 0.0;
    }
    return table.required_distribution(prior_tax_deferred, age);
}

bool rmd_applies(const ProjectionInput& input, int age) {
    return input.rmd.enabled && age >= input.rmd.start_age;
}

void record_rmd(ProjectionRecord& record, const WithdrawalResult& draw) {
    RmdDetail detail;
    detail.required = draw.rmd_required;
    detail.taken = draw.rmd_taken;
    detail.reinvested = draw.reinvested;
    record.rmd = detail;
}

void apply_draw(BalanceByType& balances, const WithdrawalResult& draw) {
    for (TaxCategory category : all_tax_categories()) {
        balances.add(category, -draw.withdrawn.get(category));
    }
    balances.taxable += draw.reinvested;
}

void grow(SimulationState& state, ProjectionRecord& record, double rate) {
    const double before = state.balances.total();
    state.balances.apply_growth(rate);
    record.investment_growth = state.balances.total() - before;
}

void simulate_accumulation_year(
    const ProjectionInput& input,
    const ProjectionConfig& config,
    SimulationState& state,
    ProjectionRecord& record)
{
    const int years_from_start = record.age - input.current_age;
    double contribution = input.annual_contribution *
        std::pow(1.0 + input.contribution_growth_rate, years_from_start);

    if (input.debt_payments_active(record.age)) {
        record.debt_payments = input.annual_debt_payments;
        contribution -= input.annual_debt_payments;
    }
    contribution = std::max(0.0, contribution);

    const double prior_tax_deferred = state.balances.tax_deferred;
    const BalanceByType split = allocate(contribution, input.contribution_allocation);
    for (TaxCategory category : all_tax_categories()) {
        state.balances.add(category, split.get(category));
    }
    record.contribution = contribution;
    record.inflows = contribution;

    // Still working past the RMD age: the distribution is forced out and reinvested
    if (rmd_applies(input, record.age)) {
        WithdrawalRequest request;
        request.need = 0.0;
        request.balances = state.balances;
        request.age = record.age;
        request.rmd_required = rmd_requirement(input, *config.rmd_table, prior_tax_deferred, record.age);

        const WithdrawalResult draw = config.withdrawal_policy->withdraw(request);
        apply_draw(state.balances, draw);
        record.withdrawal = draw.spendable();
        record_rmd(record, draw);
    }

    state.balances.clamp_dust();
    grow(state, record, input.expected_return);
}

// Unfunded spending comes out of discretionary first, then essentials
ReductionStage cut_spending(ProjectionRecord& record, double shortfall) {
    record.spending_shortfall = shortfall;

    const double discretionary_cut = std::min(shortfall, record.actual_discretionary_spending);
    const double essential_cut = shortfall - discretionary_cut;

    record.actual_discretionary_spending -= discretionary_cut;
    record.actual_essential_spending = std::max(0.0, record.actual_essential_spending - essential_cut);

    if (essential_cut > 0.0) {
        return ReductionStage::EssentialsReduced;
    }
    if (record.actual_discretionary_spending <= 0.0) {
        return ReductionStage::EssentialsOnly;
    }
    return ReductionStage::DiscretionaryReduced;
}

void apply_reserve_reduction(ProjectionRecord& record, double shortfall) {
    record.reserve_constrained = true;
    record.reduction_stage = cut_spending(record, shortfall);
}

void simulate_decumulation_year(
    const ProjectionInput& input,
    const ProjectionConfig& config,
    SimulationState& state,
    ProjectionRecord& record)
{
    const PhaseAdjustedExpenses expenses = nominal_expenses_at(input, record.age);
    record.essential_expenses = expenses.essential;
    record.discretionary_expenses = expenses.discretionary;
    record.active_phase_name = expenses.phase_name;
    record.healthcare_expenses = healthcare_cost_at(input, record.age);
    record.debt_payments = input.debt_payments_active(record.age) ? input.annual_debt_payments : 0.0;
    record.income = resolve_income(input.income_streams, record.age, input.inflation_rate);
    record.inflows = record.income;

    record.actual_essential_spending = record.essential_expenses;
    record.actual_discretionary_spending = record.discretionary_expenses;

    const double gross_spending = record.essential_expenses + record.discretionary_expenses +
                                  record.healthcare_expenses + record.debt_payments;
    const double need = gross_spending - record.income;

    if (state.depleted) {
        // Nothing left to draw; surplus income is spent rather than reinvested
        if (need > 0.0) {
            cut_spending(record, need);
        }
        record.outflows = gross_spending - record.spending_shortfall;
        record.withdrawals_by_type = BalanceByType();
        if (rmd_applies(input, record.age)) {
            record.rmd = RmdDetail();
        }
        if (input.reserve_floor) {
            record.reserve_balance = 0.0;
        }
        return;
    }

    const double total = state.balances.total();
    double draw_need = std::max(0.0, need);

    if (input.reserve_floor && draw_need > 0.0) {
        const double available = std::max(0.0, total - *input.reserve_floor);
        if (draw_need > available) {
            apply_reserve_reduction(record, draw_need - available);
            draw_need = available;
        }
    }

    WithdrawalRequest request;
    request.need = draw_need;
    request.balances = state.balances;
    request.age = record.age;
    request.rmd_required = rmd_requirement(input, *config.rmd_table, state.balances.tax_deferred, record.age);

    const WithdrawalResult draw = config.withdrawal_policy->withdraw(request);
    apply_draw(state.balances, draw);
    if (need < 0.0) {
        state.balances.taxable += -need;
    }

    record.withdrawal = draw.spendable();
    record.withdrawals_by_type = draw.withdrawn;
    if (rmd_applies(input, record.age)) {
        record_rmd(record, draw);
    }

    // Without a floor an uncovered need means the money ran out
    if (!record.reserve_constrained && draw.shortfall > 0.0) {
        cut_spending(record, draw.shortfall);
    }
    record.outflows = gross_spending - record.spending_shortfall;

    state.balances.clamp_dust();
    grow(state, record, input.expected_return);

    if (state.balances.total() <= 0.0) {
        state.depleted = true;
    }
    if (input.reserve_floor) {
        record.reserve_balance = std::max(0.0, state.balances.total() - *input.reserve_floor);
    }
}

ProjectionSummary summarize(const ProjectionInput& input, const std::vector<ProjectionRecord>& records) {
    ProjectionSummary summary;
    summary.reserve_floor = input.reserve_floor;

    for (const ProjectionRecord& record : records) {
        summary.total_contributions += record.contribution;
        summary.total_withdrawals += record.withdrawal;

        if (record.age == input.retirement_age) {
            summary.projected_retirement_balance = record.starting_balance;
        }
        if (record.retired && !summary.depletion_age && record.balance <= 0.0) {
            summary.depletion_age = record.age;
            summary.years_until_depletion = record.age - input.retirement_age;
        }
        if (record.reserve_constrained) {
            ++summary.years_reserve_constrained;
            if (!summary.first_reserve_constraint_age) {
                summary.first_reserve_constraint_age = record.age;
            }
        }
    }

    if (!records.empty()) {
        summary.starting_balance = records.front().starting_balance;
        summary.ending_balance = records.back().balance;
    }
    return summary;
}

} // anonymous namespace

ProjectionResult run_projection(const ProjectionInput& input, const ProjectionConfig& config) {
    validate_projection_input(input);
    if (!config.rmd_table) {
        throw std::invalid_argument("ProjectionConfig.rmd_table must not be null");
    }
    if (!config.withdrawal_policy) {
        throw std::invalid_argument("ProjectionConfig.withdrawal_policy must not be null");
    }

    std::vector<ProjectionRecord> records;
    records.reserve(static_cast<size_t>(input.max_age - input.current_age + 1));

    SimulationState state;
    state.balances = input.balances_by_type;

    for (int age = input.current_age; age <= input.max_age; ++age) {
        ProjectionRecord record;
        record.age = age;
        record.year = config.start_year + (age - input.current_age);
        record.retired = age >= input.retirement_age;
        record.starting_balance = state.balances.total();

        if (record.retired) {
            simulate_decumulation_year(input, config, state, record);
        } else {
            simulate_accumulation_year(input, config, state, record);
        }

        record.balance_by_type = state.balances;
        record.balance = state.balances.total();
        records.push_back(std::move(record));
    }

    ProjectionSummary summary = summarize(input, records);
    return ProjectionResult(std::move(records), summary, extract_assumptions(input));
}

} // namespace retireplan
