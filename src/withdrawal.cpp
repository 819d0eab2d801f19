#include "withdrawal.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace retireplan {

WithdrawalRequest::WithdrawalRequest() : need(0.0), age(0), rmd_required(0.0) {}

WithdrawalResult::WithdrawalResult()
    : rmd_required(0.0), rmd_taken(0.0), reinvested(0.0), shortfall(0.0) {}

WithdrawalOrder default_withdrawal_order() {
    return {TaxCategory::Taxable, TaxCategory::TaxDeferred, TaxCategory::TaxFree};
}

// ============================================================================
// TaxEfficientWithdrawalPolicy Implementation
// ============================================================================

TaxEfficientWithdrawalPolicy::TaxEfficientWithdrawalPolicy()
    : order_(default_withdrawal_order()),
      excess_handling_(RmdExcessHandling::ReinvestTaxable) {}

TaxEfficientWithdrawalPolicy::TaxEfficientWithdrawalPolicy(
    const WithdrawalOrder& order, RmdExcessHandling excess_handling)
    : order_(order), excess_handling_(excess_handling)
{
    std::set<TaxCategory> seen(order_.begin(), order_.end());
    if (seen.size() != TAX_CATEGORY_COUNT) {
        throw std::invalid_argument("Withdrawal order must name each tax category exactly once");
    }
}

WithdrawalResult TaxEfficientWithdrawalPolicy::withdraw(const WithdrawalRequest& request) const {
    WithdrawalResult result;
    BalanceByType available = request.balances;
    double remaining_need = std::max(0.0, request.need);

    // RMD comes out of tax-deferred before any ordering applies
    const double rmd = std::min(std::max(0.0, request.rmd_required), available.tax_deferred);
    result.rmd_required = rmd;
    if (rmd > 0.0) {
        result.withdrawn.tax_deferred += rmd;
        available.tax_deferred -= rmd;

        if (rmd >= remaining_need) {
            const double excess = rmd - remaining_need;
            remaining_need = 0.0;
            if (excess_handling_ == RmdExcessHandling::ReinvestTaxable) {
                result.reinvested = excess;
            }
        } else {
            remaining_need -= rmd;
        }
    }

    for (TaxCategory category : order_) {
        if (remaining_need <= 0.0) {
            break;
        }
        const double take = std::min(available.get(category), remaining_need);
        if (take <= 0.0) {
            continue;
        }
        result.withdrawn.add(category, take);
        available.add(category, -take);
        remaining_need -= take;
    }

    result.shortfall = std::max(0.0, remaining_need);
    result.rmd_taken = result.withdrawn.tax_deferred;
    return result;
}

std::string TaxEfficientWithdrawalPolicy::name() const {
    std::string label = "tax-efficient(";
    for (size_t i = 0; i < order_.size(); ++i) {
        if (i > 0) label += ",";
        label += tax_category_to_string(order_[i]);
    }
    label += excess_handling_ == RmdExcessHandling::ReinvestTaxable ? ";reinvest)" : ";spend)";
    return label;
}

std::shared_ptr<const WithdrawalPolicy> default_withdrawal_policy() {
    static const std::shared_ptr<const WithdrawalPolicy> policy =
        std::make_shared<TaxEfficientWithdrawalPolicy>();
    return policy;
}

} // namespace retireplan
