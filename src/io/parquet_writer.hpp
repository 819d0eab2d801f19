#ifndef RETIREPLAN_PARQUET_WRITER_HPP
#define RETIREPLAN_PARQUET_WRITER_HPP

#include "../projection.hpp"
#include <string>

namespace retireplan {

class ParquetWriter {
public:
    /**
     * Write projection records to a Parquet file, one row per simulated year.
     *
     * Output schema:
     *   - age, year: int32
     *   - retired, reserve_constrained: bool
     *   - starting_balance, balance, tax_deferred, tax_free, taxable: float64
     *   - inflows, outflows, contribution, withdrawal, income: float64
     *   - essential_expenses, discretionary_expenses, healthcare_expenses,
     *     debt_payments, spending_shortfall, investment_growth: float64
     *   - rmd_required, rmd_taken: float64 (null when no RMD applies)
     *   - active_phase_name, reduction_stage: utf8
     *
     * @param result ProjectionResult to export
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written or Arrow is unavailable
     */
    static void write_records(const ProjectionResult& result, const std::string& filepath);
};

} // namespace retireplan

#endif // RETIREPLAN_PARQUET_WRITER_HPP
