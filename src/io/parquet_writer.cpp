#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <vector>
#endif

namespace retireplan {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " column");
    return array;
}

// One float64 column filled from a record accessor
struct DoubleColumn {
    std::string name;
    double (*value)(const ProjectionRecord&);
};

const std::vector<DoubleColumn>& double_columns() {
    static const std::vector<DoubleColumn> columns = {
        {"starting_balance", [](const ProjectionRecord& r) { return r.starting_balance; }},
        {"balance", [](const ProjectionRecord& r) { return r.balance; }},
        {"tax_deferred", [](const ProjectionRecord& r) { return r.balance_by_type.tax_deferred; }},
        {"tax_free", [](const ProjectionRecord& r) { return r.balance_by_type.tax_free; }},
        {"taxable", [](const ProjectionRecord& r) { return r.balance_by_type.taxable; }},
        {"inflows", [](const ProjectionRecord& r) { return r.inflows; }},
        {"outflows", [](const ProjectionRecord& r) { return r.outflows; }},
        {"contribution", [](const ProjectionRecord& r) { return r.contribution; }},
        {"withdrawal", [](const ProjectionRecord& r) { return r.withdrawal; }},
        {"income", [](const ProjectionRecord& r) { return r.income; }},
        {"essential_expenses", [](const ProjectionRecord& r) { return r.essential_expenses; }},
        {"discretionary_expenses", [](const ProjectionRecord& r) { return r.discretionary_expenses; }},
        {"healthcare_expenses", [](const ProjectionRecord& r) { return r.healthcare_expenses; }},
        {"debt_payments", [](const ProjectionRecord& r) { return r.debt_payments; }},
        {"spending_shortfall", [](const ProjectionRecord& r) { return r.spending_shortfall; }},
        {"investment_growth", [](const ProjectionRecord& r) { return r.investment_growth; }}
    };
    return columns;
}

} // anonymous namespace

void ParquetWriter::write_records(const ProjectionResult& result, const std::string& filepath) {
    if (result.records.empty()) {
        throw std::runtime_error("ProjectionResult has no records to write");
    }
    const int64_t rows = static_cast<int64_t>(result.records.size());

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    // Integer and flag columns
    arrow::Int32Builder age_builder;
    arrow::Int32Builder year_builder;
    arrow::BooleanBuilder retired_builder;
    arrow::BooleanBuilder constrained_builder;
    check(age_builder.Reserve(rows), "reserve age column");
    check(year_builder.Reserve(rows), "reserve year column");
    check(retired_builder.Reserve(rows), "reserve retired column");
    check(constrained_builder.Reserve(rows), "reserve reserve_constrained column");
    for (const ProjectionRecord& record : result.records) {
        check(age_builder.Append(record.age), "append age");
        check(year_builder.Append(record.year), "append year");
        check(retired_builder.Append(record.retired), "append retired");
        check(constrained_builder.Append(record.reserve_constrained), "append reserve_constrained");
    }
    fields.push_back(arrow::field("age", arrow::int32()));
    arrays.push_back(finish(age_builder, "age"));
    fields.push_back(arrow::field("year", arrow::int32()));
    arrays.push_back(finish(year_builder, "year"));
    fields.push_back(arrow::field("retired", arrow::boolean()));
    arrays.push_back(finish(retired_builder, "retired"));
    fields.push_back(arrow::field("reserve_constrained", arrow::boolean()));
    arrays.push_back(finish(constrained_builder, "reserve_constrained"));

    // Money columns
    for (const DoubleColumn& column : double_columns()) {
        arrow::DoubleBuilder builder;
        check(builder.Reserve(rows), "reserve " + column.name + " column");
        for (const ProjectionRecord& record : result.records) {
            check(builder.Append(column.value(record)), "append " + column.name);
        }
        fields.push_back(arrow::field(column.name, arrow::float64()));
        arrays.push_back(finish(builder, column.name));
    }

    // RMD detail is null for years without a requirement
    arrow::DoubleBuilder rmd_required_builder;
    arrow::DoubleBuilder rmd_taken_builder;
    for (const ProjectionRecord& record : result.records) {
        if (record.rmd) {
            check(rmd_required_builder.Append(record.rmd->required), "append rmd_required");
            check(rmd_taken_builder.Append(record.rmd->taken), "append rmd_taken");
        } else {
            check(rmd_required_builder.AppendNull(), "append rmd_required");
            check(rmd_taken_builder.AppendNull(), "append rmd_taken");
        }
    }
    fields.push_back(arrow::field("rmd_required", arrow::float64(), true));
    arrays.push_back(finish(rmd_required_builder, "rmd_required"));
    fields.push_back(arrow::field("rmd_taken", arrow::float64(), true));
    arrays.push_back(finish(rmd_taken_builder, "rmd_taken"));

    arrow::StringBuilder phase_builder;
    arrow::StringBuilder stage_builder;
    for (const ProjectionRecord& record : result.records) {
        check(phase_builder.Append(record.active_phase_name), "append active_phase_name");
        check(stage_builder.Append(reduction_stage_to_string(record.reduction_stage)), "append reduction_stage");
    }
    fields.push_back(arrow::field("active_phase_name", arrow::utf8()));
    arrays.push_back(finish(phase_builder, "active_phase_name"));
    fields.push_back(arrow::field("reduction_stage", arrow::utf8()));
    arrays.push_back(finish(stage_builder, "reduction_stage"));

    auto table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_records(const ProjectionResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace retireplan
