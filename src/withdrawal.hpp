#ifndef RETIREPLAN_WITHDRAWAL_HPP
#define RETIREPLAN_WITHDRAWAL_HPP

#include "balances.hpp"
#include <array>
#include <memory>
#include <string>

namespace retireplan {

// One year's draw request handed to a WithdrawalPolicy
struct WithdrawalRequest {
    double need;                    // Net cash need after income (>= 0)
    BalanceByType balances;         // Balances before the draw
    int age;
    double rmd_required;            // Minimum that must leave tax-deferred accounts

    WithdrawalRequest();
};

struct WithdrawalResult {
    BalanceByType withdrawn;        // Amount drawn from each category
    double rmd_required;            // Requirement after capping at the available balance
    double rmd_taken;               // Total drawn from tax-deferred
    double reinvested;              // RMD excess moved into taxable
    double shortfall;               // Need no category could cover

    WithdrawalResult();

    double total_withdrawn() const { return withdrawn.total(); }
    // Cash that actually funds spending
    double spendable() const { return withdrawn.total() - reinvested; }
};

// Decides how a year's cash need is drawn across tax categories.
// Implementations must be stateless; the simulator shares one instance
// across years and runs.
class WithdrawalPolicy {
public:
    virtual ~WithdrawalPolicy() = default;

    virtual WithdrawalResult withdraw(const WithdrawalRequest& request) const = 0;
    virtual std::string name() const = 0;
};

// What happens to an RMD larger than the year's need
enum class RmdExcessHandling {
    ReinvestTaxable,    // Moved into the taxable category
    Spend               // Leaves the portfolio
};

using WithdrawalOrder = std::array<TaxCategory, TAX_CATEGORY_COUNT>;

// Drains categories in a fixed order (taxable, tax-deferred, tax-free by
// default). The RMD is always taken from tax-deferred first regardless of
// the order.
class TaxEfficientWithdrawalPolicy : public WithdrawalPolicy {
public:
    TaxEfficientWithdrawalPolicy();
    TaxEfficientWithdrawalPolicy(const WithdrawalOrder& order, RmdExcessHandling excess_handling);

    WithdrawalResult withdraw(const WithdrawalRequest& request) const override;
    std::string name() const override;

    const WithdrawalOrder& order() const { return order_; }
    RmdExcessHandling excess_handling() const { return excess_handling_; }

private:
    WithdrawalOrder order_;
    RmdExcessHandling excess_handling_;
};

WithdrawalOrder default_withdrawal_order();

std::shared_ptr<const WithdrawalPolicy> default_withdrawal_policy();

} // namespace retireplan

#endif // RETIREPLAN_WITHDRAWAL_HPP
