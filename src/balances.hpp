#ifndef RETIREPLAN_BALANCES_HPP
#define RETIREPLAN_BALANCES_HPP

#include <array>
#include <string>

namespace retireplan {

// Tax treatment of an account. Traditional 401k/IRA are tax-deferred,
// Roth accounts are tax-free, brokerage and cash are taxable.
enum class TaxCategory : int {
    TaxDeferred = 0,
    TaxFree = 1,
    Taxable = 2
};

constexpr std::size_t TAX_CATEGORY_COUNT = 3;

std::string tax_category_to_string(TaxCategory category);
TaxCategory tax_category_from_string(const std::string& str);

// Portfolio split across the three tax categories
struct BalanceByType {
    double tax_deferred;
    double tax_free;
    double taxable;

    BalanceByType();
    BalanceByType(double tax_deferred_, double tax_free_, double taxable_);

    double total() const;
    double get(TaxCategory category) const;
    void set(TaxCategory category, double amount);
    void add(TaxCategory category, double amount);

    // Multiply every category by (1 + rate)
    void apply_growth(double rate);

    // Replace values below the cent threshold (and any negative residue) with zero
    void clamp_dust();

    bool operator==(const BalanceByType& other) const;
    bool operator!=(const BalanceByType& other) const { return !(*this == other); }
};

// Contribution split in whole percentages; must sum to 100
struct ContributionAllocation {
    double tax_deferred;
    double tax_free;
    double taxable;

    ContributionAllocation();
    ContributionAllocation(double tax_deferred_, double tax_free_, double taxable_);

    double sum() const;
    double get(TaxCategory category) const;

    bool operator==(const ContributionAllocation& other) const;
    bool operator!=(const ContributionAllocation& other) const { return !(*this == other); }
};

// Split an amount across categories according to an allocation
BalanceByType allocate(double amount, const ContributionAllocation& allocation);

// Categories in declaration order, for loops over a BalanceByType
const std::array<TaxCategory, TAX_CATEGORY_COUNT>& all_tax_categories();

} // namespace retireplan

#endif // RETIREPLAN_BALANCES_HPP
