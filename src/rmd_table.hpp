#ifndef RETIREPLAN_RMD_TABLE_HPP
#define RETIREPLAN_RMD_TABLE_HPP

#include <array>
#include <istream>
#include <string>

namespace retireplan {

// RmdTable: life-expectancy divisors by age (0-120) used for required
// minimum distributions. RMD for a year = prior year-end tax-deferred balance
// divided by the divisor for the holder's age. Ages without a divisor carry
// no requirement.
//
// The table is reference data that changes with tax law, so it is loaded
// rather than compiled in; uniform_lifetime() is the current IRS edition.
class RmdTable {
public:
    static constexpr int MAX_AGE = 120;
    static constexpr size_t NUM_AGES = MAX_AGE + 1;  // 0 to 120 inclusive

    RmdTable();

    // Set/get the distribution period for an age. A divisor of 0 means none.
    void set_divisor(int age, double divisor);
    double get_divisor(int age) const;
    bool has_divisor(int age) const;

    // Required distribution for an age given the prior year-end balance.
    // Ages above MAX_AGE use the MAX_AGE divisor.
    double required_distribution(double prior_balance, int age) const;

    const std::string& edition() const { return edition_; }
    void set_edition(const std::string& edition) { edition_ = edition; }

    // IRS Uniform Lifetime Table (Treas. Reg. 1.401(a)(9)-9, effective 2022)
    static RmdTable uniform_lifetime();

    // Load from CSV: expects columns age,divisor
    static RmdTable load_from_csv(const std::string& filepath);
    static RmdTable load_from_csv(std::istream& is);

private:
    std::array<double, NUM_AGES> divisors_;
    std::string edition_;
};

} // namespace retireplan

#endif // RETIREPLAN_RMD_TABLE_HPP
