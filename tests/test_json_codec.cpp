#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "io/json_codec.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace retireplan;
using Catch::Approx;
using json = nlohmann::json;

namespace {

std::string decode_error_field(const json& j) {
    try {
        io::projection_input_from_json(j);
    } catch (const ValidationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

TEST_CASE("Decode a minimal input", "[json]") {
    json j = {{"currentAge", 40}, {"retirementAge", 67}};

    ProjectionInput input = io::projection_input_from_json(j);
    REQUIRE(input.current_age == 40);
    REQUIRE(input.retirement_age == 67);
    REQUIRE(input.max_age == 90);
    REQUIRE(input.expected_return == Approx(0.06));
    REQUIRE(input.contribution_allocation == ContributionAllocation());
    REQUIRE(input.rmd.enabled);
    REQUIRE_FALSE(input.spending_phase_config.has_value());
}

TEST_CASE("Decode a full input", "[json]") {
    json j = json::parse(R"({
        "currentAge": 60,
        "retirementAge": 65,
        "maxAge": 95,
        "balancesByType": {"taxDeferred": 400000, "taxFree": 100000, "taxable": 50000},
        "annualContribution": 20000,
        "contributionAllocation": {"taxDeferred": 70, "taxFree": 20, "taxable": 10},
        "annualEssentialExpenses": 40000,
        "annualDiscretionaryExpenses": 15000,
        "incomeStreams": [
            {"id": "ss", "name": "Social Security", "type": "social_security",
             "annualAmount": 30000, "startAge": 67, "inflationAdjusted": true},
            {"id": "rent", "type": "rental", "annualAmount": 12000, "startAge": 60, "endAge": 80}
        ],
        "annualDebtPayments": 5000,
        "debtPayoffAge": 63,
        "spendingPhaseConfig": {"enabled": true, "phases": [
            {"id": "go", "name": "Go-Go", "startAge": 65, "essentialMultiplier": 1.0, "discretionaryMultiplier": 1.2}
        ]},
        "depletionTarget": {"enabled": true, "targetPercentageSpent": 90, "targetAge": 90,
                            "reserve": {"type": "absolute", "amount": 50000, "purposes": ["legacy"]}},
        "reserveFloor": 60000,
        "rmd": {"enabled": true, "startAge": 75}
    })");

    ProjectionInput input = io::projection_input_from_json(j);
    REQUIRE_NOTHROW(validate_projection_input(input));

    REQUIRE(input.balances_by_type == BalanceByType(400000.0, 100000.0, 50000.0));
    REQUIRE(input.contribution_allocation == ContributionAllocation(70.0, 20.0, 10.0));
    REQUIRE(input.income_streams.size() == 2);
    REQUIRE(input.income_streams[0].type == IncomeStreamType::SocialSecurity);
    REQUIRE(input.income_streams[0].is_guaranteed);
    REQUIRE(input.income_streams[1].type == IncomeStreamType::Rental);
    REQUIRE_FALSE(input.income_streams[1].is_guaranteed);
    REQUIRE(input.income_streams[1].end_age == 80);
    REQUIRE(input.debt_payoff_age == 63);
    REQUIRE(input.phases_enabled());
    REQUIRE(input.depletion_target->reserve.type == ReserveType::Absolute);
    REQUIRE(input.depletion_target->reserve.purposes.size() == 1);
    REQUIRE(input.reserve_floor == 60000.0);
    REQUIRE(input.rmd.start_age == 75);

    SECTION("Encoding and decoding again preserves the input") {
        const json encoded = input;
        const ProjectionInput decoded = io::projection_input_from_json(encoded);
        REQUIRE(json(decoded) == encoded);
    }
}

TEST_CASE("Decode errors name the field", "[json]") {
    REQUIRE(decode_error_field(json{{"retirementAge", 65}}) == "currentAge");
    REQUIRE(decode_error_field(json{{"currentAge", 40}, {"retirementAge", "sixty"}}) == "retirementAge");
    REQUIRE(decode_error_field(json::array()) == "input");

    json bad_type = {{"currentAge", 40}, {"retirementAge", 65},
                     {"incomeStreams", json::array({{{"id", "x"}, {"type", "lottery"},
                                                     {"annualAmount", 1}, {"startAge", 65}}})}};
    REQUIRE(decode_error_field(bad_type) == "type");

    json partial_alloc = {{"currentAge", 40}, {"retirementAge", 65},
                          {"contributionAllocation", {{"taxDeferred", 100}}}};
    REQUIRE(decode_error_field(partial_alloc) == "taxFree");
}

TEST_CASE("Canonical form ignores ordering", "[json]") {
    ProjectionInput a;
    IncomeStream s1;
    s1.id = "b";
    IncomeStream s2;
    s2.id = "a";
    a.income_streams = {s1, s2};

    ProjectionInput b = a;
    std::swap(b.income_streams[0], b.income_streams[1]);

    const json canonical = io::canonical_projection_input_json(a);
    REQUIRE(canonical == io::canonical_projection_input_json(b));
    REQUIRE(canonical["incomeStreams"][0]["id"] == "a");
}

TEST_CASE("Result encoding", "[json]") {
    SECTION("Projection record keys") {
        ProjectionRecord record;
        record.age = 70;
        json j = record;
        REQUIRE(j["age"] == 70);
        REQUIRE(j["reductionStage"] == "none");
        REQUIRE_FALSE(j.contains("rmd"));
        REQUIRE_FALSE(j.contains("reserveBalance"));

        RmdDetail rmd;
        rmd.required = 100.0;
        record.rmd = rmd;
        j = record;
        REQUIRE(j["rmd"]["rmdRequired"] == 100.0);
    }

    SECTION("Summary depletion is null when never depleted") {
        ProjectionSummary summary;
        json j = summary;
        REQUIRE(j["depletionAge"].is_null());
        REQUIRE(j["yearsUntilDepletion"].is_null());
    }

    SECTION("Unlimited runway has no year count") {
        json j = RunwayYears::unlimited_runway();
        REQUIRE(j["unlimited"] == true);
        REQUIRE(j["years"].is_null());

        j = RunwayYears::of(12);
        REQUIRE(j["years"] == 12);
    }

    SECTION("Infinite coverage ratio serializes as null") {
        IncomeFloorCoverage coverage;
        coverage.coverage_ratio = coverage_ratio(1000.0, 0.0);
        REQUIRE(json::parse(json(coverage).dump())["coverageRatio"].is_null());
    }
}

TEST_CASE("Snapshot and overrides decoding", "[json]") {
    json snapshot_json = json::parse(R"({
        "birthYear": 1975,
        "targetRetirementAge": 62,
        "riskTolerance": "conservative",
        "annualIncome": 90000,
        "incomeExpenses": {"monthlyEssential": 3500},
        "investmentAccounts": [{"name": "Work", "type": "401k", "balance": 250000, "monthlyContribution": 1000}],
        "debts": [{"name": "Mortgage", "balance": 120000, "interestRate": 3.5}]
    })");

    FinancialSnapshot snapshot = io::financial_snapshot_from_json(snapshot_json);
    REQUIRE(snapshot.birth_year == 1975);
    REQUIRE(snapshot.risk_tolerance == RiskTolerance::Conservative);
    REQUIRE(snapshot.monthly_essential == 3500.0);
    REQUIRE_FALSE(snapshot.monthly_discretionary.has_value());
    REQUIRE(snapshot.accounts.size() == 1);
    REQUIRE(snapshot.debts[0].interest_rate == 3.5);

    ProjectionOverrides overrides = io::projection_overrides_from_json(
        json{{"expectedReturn", 0.05}, {"socialSecurityAge", 70}});
    REQUIRE(overrides.expected_return == 0.05);
    REQUIRE(overrides.social_security_age == 70);
    REQUIRE_FALSE(overrides.retirement_age.has_value());
}

TEST_CASE("JSON files", "[json]") {
    const std::string path = "test_json_codec_tmp.json";

    io::write_json(path, json{{"currentAge", 50}, {"retirementAge", 60}});
    const json loaded = io::read_json_file(path);
    REQUIRE(loaded["currentAge"] == 50);
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(io::read_json_file("does_not_exist.json"), std::runtime_error);

    {
        std::ofstream broken(path);
        broken << "{not json";
    }
    REQUIRE_THROWS_AS(io::read_json_file(path), std::runtime_error);
    std::remove(path.c_str());

    std::ostringstream compact;
    io::write_json(compact, json{{"a", 1}}, false);
    REQUIRE(compact.str() == "{\"a\":1}\n");
}
