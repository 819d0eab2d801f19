#include "balances.hpp"
#include <stdexcept>

namespace retireplan {

namespace {

// Half a cent. Anything smaller is float residue from repeated withdrawals.
constexpr double DUST_THRESHOLD = 0.005;

double dust_to_zero(double value) {
    return value < DUST_THRESHOLD ? 0.0 : value;
}

} // anonymous namespace

std::string tax_category_to_string(TaxCategory category) {
    switch (category) {
        case TaxCategory::TaxDeferred: return "taxDeferred";
        case TaxCategory::TaxFree: return "taxFree";
        case TaxCategory::Taxable: return "taxable";
    }
    return "unknown";
}

TaxCategory tax_category_from_string(const std::string& str) {
    if (str == "taxDeferred") return TaxCategory::TaxDeferred;
    if (str == "taxFree") return TaxCategory::TaxFree;
    if (str == "taxable") return TaxCategory::Taxable;
    throw std::invalid_argument("Unknown tax category: " + str);
}

const std::array<TaxCategory, TAX_CATEGORY_COUNT>& all_tax_categories() {
    static const std::array<TaxCategory, TAX_CATEGORY_COUNT> categories = {
        TaxCategory::TaxDeferred, TaxCategory::TaxFree, TaxCategory::Taxable
    };
    return categories;
}

// ============================================================================
// BalanceByType Implementation
// ============================================================================

BalanceByType::BalanceByType() : tax_deferred(0.0), tax_free(0.0), taxable(0.0) {}

BalanceByType::BalanceByType(double tax_deferred_, double tax_free_, double taxable_)
    : tax_deferred(tax_deferred_), tax_free(tax_free_), taxable(taxable_) {}

double BalanceByType::total() const {
    return tax_deferred + tax_free + taxable;
}

double BalanceByType::get(TaxCategory category) const {
    switch (category) {
        case TaxCategory::TaxDeferred: return tax_deferred;
        case TaxCategory::TaxFree: return tax_free;
        case TaxCategory::Taxable: return taxable;
    }
    return 0.0;
}

void BalanceByType::set(TaxCategory category, double amount) {
    switch (category) {
        case TaxCategory::TaxDeferred: tax_deferred = amount; break;
        case TaxCategory::TaxFree: tax_free = amount; break;
        case TaxCategory::Taxable: taxable = amount; break;
    }
}

void BalanceByType::add(TaxCategory category, double amount) {
    set(category, get(category) + amount);
}

void BalanceByType::apply_growth(double rate) {
    // Categories grow independently so each can later carry its own return
    tax_deferred *= (1.0 + rate);
    tax_free *= (1.0 + rate);
    taxable *= (1.0 + rate);
}

void BalanceByType::clamp_dust() {
    tax_deferred = dust_to_zero(tax_deferred);
    tax_free = dust_to_zero(tax_free);
    taxable = dust_to_zero(taxable);
}

bool BalanceByType::operator==(const BalanceByType& other) const {
    return tax_deferred == other.tax_deferred &&
           tax_free == other.tax_free &&
           taxable == other.taxable;
}

// ============================================================================
// ContributionAllocation Implementation
// ============================================================================

ContributionAllocation::ContributionAllocation()
    : tax_deferred(60.0), tax_free(30.0), taxable(10.0) {}

ContributionAllocation::ContributionAllocation(double tax_deferred_, double tax_free_, double taxable_)
    : tax_deferred(tax_deferred_), tax_free(tax_free_), taxable(taxable_) {}

double ContributionAllocation::sum() const {
    return tax_deferred + tax_free + taxable;
}

double ContributionAllocation::get(TaxCategory category) const {
    switch (category) {
        case TaxCategory::TaxDeferred: return tax_deferred;
        case TaxCategory::TaxFree: return tax_free;
        case TaxCategory::Taxable: return taxable;
    }
    return 0.0;
}

bool ContributionAllocation::operator==(const ContributionAllocation& other) const {
    return tax_deferred == other.tax_deferred &&
           tax_free == other.tax_free &&
           taxable == other.taxable;
}

BalanceByType allocate(double amount, const ContributionAllocation& allocation) {
    return BalanceByType(
        amount * allocation.tax_deferred / 100.0,
        amount * allocation.tax_free / 100.0,
        amount * allocation.taxable / 100.0
    );
}

} // namespace retireplan
