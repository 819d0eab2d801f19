#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "withdrawal.hpp"
#include <stdexcept>

using namespace retireplan;
using Catch::Approx;

// ============================================================================
// Helper functions
// ============================================================================

namespace {

WithdrawalRequest make_request(double need, const BalanceByType& balances, double rmd_required = 0.0) {
    WithdrawalRequest request;
    request.need = need;
    request.balances = balances;
    request.age = 75;
    request.rmd_required = rmd_required;
    return request;
}

} // anonymous namespace

TEST_CASE("Default order drains taxable, then tax-deferred, then tax-free", "[withdrawal]") {
    TaxEfficientWithdrawalPolicy policy;
    REQUIRE(policy.order() == default_withdrawal_order());
    REQUIRE(policy.excess_handling() == RmdExcessHandling::ReinvestTaxable);

    SECTION("Need covered by taxable") {
        WithdrawalResult result = policy.withdraw(make_request(80.0, BalanceByType(100.0, 100.0, 100.0)));
        REQUIRE(result.withdrawn.taxable == Approx(80.0));
        REQUIRE(result.withdrawn.tax_deferred == 0.0);
        REQUIRE(result.withdrawn.tax_free == 0.0);
        REQUIRE(result.shortfall == 0.0);
    }

    SECTION("Need spills into tax-deferred and tax-free") {
        WithdrawalResult result = policy.withdraw(make_request(250.0, BalanceByType(100.0, 100.0, 100.0)));
        REQUIRE(result.withdrawn.taxable == Approx(100.0));
        REQUIRE(result.withdrawn.tax_deferred == Approx(100.0));
        REQUIRE(result.withdrawn.tax_free == Approx(50.0));
        REQUIRE(result.total_withdrawn() == Approx(250.0));
    }

    SECTION("Need beyond every balance leaves a shortfall") {
        WithdrawalResult result = policy.withdraw(make_request(400.0, BalanceByType(100.0, 100.0, 100.0)));
        REQUIRE(result.total_withdrawn() == Approx(300.0));
        REQUIRE(result.shortfall == Approx(100.0));
    }

    SECTION("Non-positive need withdraws nothing") {
        WithdrawalResult result = policy.withdraw(make_request(-50.0, BalanceByType(100.0, 100.0, 100.0)));
        REQUIRE(result.total_withdrawn() == 0.0);
        REQUIRE(result.shortfall == 0.0);
    }
}

TEST_CASE("RMD is taken from tax-deferred before the order applies", "[withdrawal]") {
    TaxEfficientWithdrawalPolicy policy;

    SECTION("RMD covers part of the need") {
        WithdrawalResult result = policy.withdraw(make_request(100.0, BalanceByType(1000.0, 0.0, 1000.0), 40.0));
        REQUIRE(result.rmd_required == Approx(40.0));
        REQUIRE(result.withdrawn.tax_deferred == Approx(40.0));
        REQUIRE(result.withdrawn.taxable == Approx(60.0));
        REQUIRE(result.rmd_taken == Approx(40.0));
        REQUIRE(result.reinvested == 0.0);
        REQUIRE(result.spendable() == Approx(100.0));
    }

    SECTION("Excess RMD is reinvested in taxable") {
        WithdrawalResult result = policy.withdraw(make_request(10.0, BalanceByType(1000.0, 0.0, 0.0), 40.0));
        REQUIRE(result.rmd_taken == Approx(40.0));
        REQUIRE(result.reinvested == Approx(30.0));
        REQUIRE(result.spendable() == Approx(10.0));
    }

    SECTION("Excess RMD can be spent instead") {
        TaxEfficientWithdrawalPolicy spend(default_withdrawal_order(), RmdExcessHandling::Spend);
        WithdrawalResult result = spend.withdraw(make_request(10.0, BalanceByType(1000.0, 0.0, 0.0), 40.0));
        REQUIRE(result.rmd_taken == Approx(40.0));
        REQUIRE(result.reinvested == 0.0);
        REQUIRE(result.spendable() == Approx(40.0));
    }

    SECTION("RMD is capped at the tax-deferred balance") {
        WithdrawalResult result = policy.withdraw(make_request(0.0, BalanceByType(25.0, 0.0, 0.0), 40.0));
        REQUIRE(result.rmd_required == Approx(25.0));
        REQUIRE(result.rmd_taken == Approx(25.0));
    }

    SECTION("Taken never falls short of required") {
        WithdrawalResult result = policy.withdraw(make_request(500.0, BalanceByType(300.0, 300.0, 0.0), 12.0));
        REQUIRE(result.rmd_taken >= result.rmd_required);
        REQUIRE(result.rmd_taken == Approx(300.0));
        REQUIRE(result.withdrawn.tax_free == Approx(200.0));
    }
}

TEST_CASE("Custom withdrawal order", "[withdrawal]") {
    WithdrawalOrder order = {TaxCategory::TaxFree, TaxCategory::Taxable, TaxCategory::TaxDeferred};
    TaxEfficientWithdrawalPolicy policy(order, RmdExcessHandling::ReinvestTaxable);

    WithdrawalResult result = policy.withdraw(make_request(150.0, BalanceByType(100.0, 100.0, 100.0)));
    REQUIRE(result.withdrawn.tax_free == Approx(100.0));
    REQUIRE(result.withdrawn.taxable == Approx(50.0));
    REQUIRE(result.withdrawn.tax_deferred == 0.0);

    REQUIRE(policy.name() == "tax-efficient(taxFree,taxable,taxDeferred;reinvest)");
}

TEST_CASE("Withdrawal order must name each category once", "[withdrawal]") {
    WithdrawalOrder order = {TaxCategory::Taxable, TaxCategory::Taxable, TaxCategory::TaxFree};
    REQUIRE_THROWS_AS(TaxEfficientWithdrawalPolicy(order, RmdExcessHandling::Spend), std::invalid_argument);
}

TEST_CASE("Default policy is shared", "[withdrawal]") {
    REQUIRE(default_withdrawal_policy() == default_withdrawal_policy());
    REQUIRE(default_withdrawal_policy()->name() == "tax-efficient(taxable,taxDeferred,taxFree;reinvest)");
}
