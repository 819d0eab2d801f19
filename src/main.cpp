#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "depletion.hpp"
#include "income_floor.hpp"
#include "input_builder.hpp"
#include "input_hash.hpp"
#include "logger.hpp"
#include "projection.hpp"
#include "rmd_table.hpp"
#include "sensitivity.hpp"
#include "spending_comparison.hpp"
#include "staleness.hpp"
#include "status.hpp"
#include "withdrawal.hpp"
#include "io/json_codec.hpp"
#include "io/parquet_writer.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string input_path;                // ProjectionInput JSON
    std::string snapshot_path;             // FinancialSnapshot JSON (alternative to --input)
    std::string overrides_path;            // ProjectionOverrides JSON, with --snapshot
    std::string config_path;               // Engine config JSON
    std::string rmd_table_path;            // RMD divisor CSV
    std::string stored_input_path;         // Previously persisted input, for staleness
    std::string analyses;                  // Comma-separated analysis names
    std::string output_path;
    std::string records_parquet_path;
    std::string plan_id;
    std::string log_level;
    std::string log_file;
    int start_year = 0;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RetirePlan Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options (one of --input or --snapshot is required):\n";
    std::cerr << "  --input <path>              ProjectionInput JSON file\n";
    std::cerr << "  --snapshot <path>           Financial snapshot JSON file\n";
    std::cerr << "  --overrides <path>          Projection overrides JSON (with --snapshot)\n";
    std::cerr << "  --stored-input <path>       Previously stored ProjectionInput, for staleness\n\n";
    std::cerr << "Engine options:\n";
    std::cerr << "  --config <path>             Engine configuration JSON file\n";
    std::cerr << "  --rmd-table <path>          CSV file with age,divisor RMD table\n";
    std::cerr << "                              (default: IRS Uniform Lifetime Table, 2022)\n";
    std::cerr << "  --analysis <list>           Comma-separated analyses (default: projection)\n";
    std::cerr << "                              projection, sensitivity, low-friction-wins,\n";
    std::cerr << "                              sensitive-assumptions, depletion, income-floor,\n";
    std::cerr << "                              spending-comparison, staleness, status\n";
    std::cerr << "  --start-year <yyyy>         Calendar year of the first record (default: this year)\n";
    std::cerr << "  --plan-id <id>              Plan identifier attached to log events\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --records-parquet <path>    Also write projection records to Parquet\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Projection and sensitivity for a plan:\n";
    std::cerr << "     " << program_name << " --input data/sample_plan.json \\\n";
    std::cerr << "         --analysis projection,sensitivity --output results.json\n\n";
    std::cerr << "  2. Build from a snapshot and check a cached projection:\n";
    std::cerr << "     " << program_name << " --snapshot data/sample_snapshot.json \\\n";
    std::cerr << "         --overrides data/sample_overrides.json \\\n";
    std::cerr << "         --stored-input stored.json --analysis staleness\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--snapshot" && i + 1 < argc) {
            args.snapshot_path = argv[++i];
        } else if (arg == "--overrides" && i + 1 < argc) {
            args.overrides_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--rmd-table" && i + 1 < argc) {
            args.rmd_table_path = argv[++i];
        } else if (arg == "--stored-input" && i + 1 < argc) {
            args.stored_input_path = argv[++i];
        } else if (arg == "--analysis" && i + 1 < argc) {
            args.analyses = argv[++i];
        } else if (arg == "--start-year" && i + 1 < argc) {
            try {
                args.start_year = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --start-year expects a year, got '" << argv[i] << "'\n";
                return false;
            }
        } else if (arg == "--plan-id" && i + 1 < argc) {
            args.plan_id = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--records-parquet" && i + 1 < argc) {
            args.records_parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    const bool has_input = !args.input_path.empty();
    const bool has_snapshot = !args.snapshot_path.empty();
    if (!has_input && !has_snapshot) {
        std::cerr << "Error: Must provide either --input or --snapshot\n";
        valid = false;
    } else if (has_input && has_snapshot) {
        std::cerr << "Error: --input and --snapshot are mutually exclusive\n";
        valid = false;
    }

    if (has_input && !file_exists(args.input_path)) {
        std::cerr << "Error: Input file not found: " << args.input_path << "\n";
        valid = false;
    }
    if (has_snapshot && !file_exists(args.snapshot_path)) {
        std::cerr << "Error: Snapshot file not found: " << args.snapshot_path << "\n";
        valid = false;
    }
    if (!args.overrides_path.empty()) {
        if (!has_snapshot) {
            std::cerr << "Error: --overrides requires --snapshot\n";
            valid = false;
        } else if (!file_exists(args.overrides_path)) {
            std::cerr << "Error: Overrides file not found: " << args.overrides_path << "\n";
            valid = false;
        }
    }
    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }
    if (!args.rmd_table_path.empty() && !file_exists(args.rmd_table_path)) {
        std::cerr << "Error: RMD table file not found: " << args.rmd_table_path << "\n";
        valid = false;
    }
    if (!args.stored_input_path.empty() && !file_exists(args.stored_input_path)) {
        std::cerr << "Error: Stored input file not found: " << args.stored_input_path << "\n";
        valid = false;
    }

    for (const std::string& name : split_list(args.analyses)) {
        if (!retireplan::is_known_analysis(name)) {
            std::cerr << "Error: Unknown analysis: " << name << "\n";
            valid = false;
        }
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

int current_calendar_year() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    gmtime_r(&now, &tm_buf);
    return tm_buf.tm_year + 1900;
}

bool contains(const std::vector<std::string>& items, const std::string& item) {
    for (const std::string& candidate : items) {
        if (candidate == item) {
            return true;
        }
    }
    return false;
}

// Times one analysis and logs its completion
class AnalysisTimer {
public:
    AnalysisTimer(retireplan::RunContext& ctx, const std::string& analysis)
        : ctx_(ctx), start_(std::chrono::steady_clock::now())
    {
        ctx_.analysis = analysis;
    }

    void complete(const std::map<std::string, std::string>& details) {
        auto end = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start_).count();
        retireplan::Logger::get_instance().log_analysis_complete(ctx_, ms, details);
        ctx_.analysis.clear();
    }

private:
    retireplan::RunContext& ctx_;
    std::chrono::steady_clock::time_point start_;
};

std::string money(double amount) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << amount;
    return oss.str();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    retireplan::Logger& logger = retireplan::Logger::get_instance();
    retireplan::RunContext ctx(args.plan_id);

    try {
        // Engine config, then CLI flags on top
        retireplan::EngineConfig config;
        if (!args.config_path.empty()) {
            config = retireplan::parse_engine_config_from_file(args.config_path);
        }
        if (!args.log_level.empty()) {
            config.logging.min_level = retireplan::string_to_level(args.log_level);
        }
        if (!args.log_file.empty()) {
            config.logging.enable_file = true;
            config.logging.log_file_path = args.log_file;
        }
        if (!args.analyses.empty()) {
            config.analyses = split_list(args.analyses);
        }
        if (!args.rmd_table_path.empty()) {
            config.rmd_table_path = args.rmd_table_path;
        }
        if (args.start_year != 0) {
            config.start_year = args.start_year;
        }
        logger.configure(config.logging);

        const std::vector<std::string>& analyses = config.analyses;
        logger.log_run_start(ctx, args.input_path.empty() ? args.snapshot_path : args.input_path, analyses);

        if (contains(analyses, "staleness") && args.stored_input_path.empty()) {
            throw std::runtime_error("The staleness analysis requires --stored-input");
        }

        // Reference data and policy
        retireplan::ProjectionConfig projection_config;
        projection_config.start_year = config.start_year.value_or(current_calendar_year());
        if (!config.rmd_table_path.empty()) {
            projection_config.rmd_table = std::make_shared<const retireplan::RmdTable>(
                retireplan::RmdTable::load_from_csv(config.rmd_table_path));
        }
        projection_config.withdrawal_policy = std::make_shared<const retireplan::TaxEfficientWithdrawalPolicy>(
            config.withdrawal.order, config.withdrawal.rmd_excess);

        // Build the input
        retireplan::ProjectionInput input;
        if (!args.input_path.empty()) {
            input = retireplan::io::projection_input_from_json(retireplan::io::read_json_file(args.input_path));
        } else {
            retireplan::FinancialSnapshot snapshot = retireplan::io::financial_snapshot_from_json(
                retireplan::io::read_json_file(args.snapshot_path));
            retireplan::ProjectionOverrides overrides;
            if (!args.overrides_path.empty()) {
                overrides = retireplan::io::projection_overrides_from_json(
                    retireplan::io::read_json_file(args.overrides_path));
            }
            input = retireplan::build_projection_input_from_snapshot(
                snapshot, overrides, projection_config.start_year);
        }
        retireplan::validate_projection_input(input);

        ctx.input_hash = retireplan::hash_projection_input(input);
        logger.log_input_loaded(ctx, input.current_age, input.retirement_age, input.max_age,
                                input.income_streams.size());

        const std::vector<retireplan::ProjectionWarning> warnings = retireplan::generate_projection_warnings(input);
        for (const retireplan::ProjectionWarning& warning : warnings) {
            logger.log_projection_warning(ctx, warning.field, warning.message);
        }

        json output;
        output["inputHash"] = ctx.input_hash;
        output["inputs"] = input;
        output["warnings"] = warnings;

        // Run the requested analyses
        std::unique_ptr<retireplan::ProjectionResult> projection;
        auto ensure_projection = [&]() -> const retireplan::ProjectionResult& {
            if (!projection) {
                projection = std::make_unique<retireplan::ProjectionResult>(
                    retireplan::run_projection(input, projection_config));
            }
            return *projection;
        };

        std::unique_ptr<retireplan::SensitivityResult> sensitivity;
        retireplan::SensitivityConfig sensitivity_config;
        sensitivity_config.metric = config.sensitivity_metric;
        sensitivity_config.top_count = config.sensitivity_top_count;
        sensitivity_config.projection = projection_config;
        auto ensure_sensitivity = [&]() -> const retireplan::SensitivityResult& {
            if (!sensitivity) {
                sensitivity = std::make_unique<retireplan::SensitivityResult>(
                    retireplan::analyze_sensitivity(input, sensitivity_config));
            }
            return *sensitivity;
        };

        for (const std::string& analysis : analyses) {
            AnalysisTimer timer(ctx, analysis);
            std::map<std::string, std::string> details;

            if (analysis == "projection") {
                const retireplan::ProjectionResult& result = ensure_projection();
                output["projection"] = result;
                details["records"] = std::to_string(result.records.size());
                details["retirement_balance"] = money(result.summary.projected_retirement_balance);
                details["ending_balance"] = money(result.summary.ending_balance);
            } else if (analysis == "sensitivity") {
                const retireplan::SensitivityResult& result = ensure_sensitivity();
                output["sensitivity"] = result;
                details["levers"] = std::to_string(result.all_levers.size());
                if (!result.top_levers.empty()) {
                    details["top_lever"] = result.top_levers.front().name;
                }
            } else if (analysis == "low-friction-wins") {
                retireplan::LowFrictionConfig low_friction;
                low_friction.materiality_percent = config.materiality_percent;
                low_friction.max_wins = config.max_low_friction_wins;
                low_friction.projection = projection_config;
                const std::vector<retireplan::LowFrictionWin> wins =
                    retireplan::identify_low_friction_wins(input, low_friction);
                output["lowFrictionWins"] = wins;
                details["wins"] = std::to_string(wins.size());
            } else if (analysis == "sensitive-assumptions") {
                const std::vector<retireplan::SensitiveAssumption> assumptions =
                    retireplan::identify_sensitive_assumptions(ensure_sensitivity());
                output["sensitiveAssumptions"] = assumptions;
                details["assumptions"] = std::to_string(assumptions.size());
            } else if (analysis == "depletion") {
                const retireplan::DepletionFeedback feedback =
                    retireplan::calculate_depletion_feedback(input, projection_config);
                output["depletionFeedback"] = feedback;
                details["enabled"] = feedback.enabled ? "true" : "false";
                details["trajectory"] = retireplan::trajectory_status_to_string(feedback.trajectory_status);
            } else if (analysis == "income-floor") {
                const std::optional<retireplan::IncomeFloorAnalysis> floor =
                    retireplan::analyze_income_floor(input);
                output["incomeFloor"] = floor ? json(*floor) : json();
                details["status"] = floor ? retireplan::income_floor_status_to_string(floor->status) : "n/a";
            } else if (analysis == "spending-comparison") {
                const retireplan::SpendingComparison comparison =
                    retireplan::calculate_spending_comparison(input, config.early_years, projection_config);
                output["spendingComparison"] = comparison;
                details["early_years_bonus"] = money(comparison.early_years_bonus);
            } else if (analysis == "staleness") {
                const retireplan::ProjectionInput stored = retireplan::io::projection_input_from_json(
                    retireplan::io::read_json_file(args.stored_input_path));
                const retireplan::StalenessResult staleness = retireplan::check_projection_staleness(stored, input);
                output["staleness"] = staleness;
                details["stale"] = staleness.is_stale ? "true" : "false";
                details["changed_fields"] = std::to_string(staleness.changed_fields.size());
            } else if (analysis == "status") {
                const retireplan::RetirementStatusResult status =
                    retireplan::determine_retirement_status(ensure_projection().summary, input);
                output["status"] = status;
                details["status"] = retireplan::retirement_status_to_string(status.status);
            }

            timer.complete(details);
        }

        if (!args.records_parquet_path.empty()) {
            retireplan::ParquetWriter::write_records(ensure_projection(), args.records_parquet_path);
            logger.log_output_written(ctx, args.records_parquet_path, "parquet");
        }

        // Write JSON output
        if (args.output_path.empty()) {
            retireplan::io::write_json(std::cout, output);
        } else {
            retireplan::io::write_json(args.output_path, output);
            logger.log_output_written(ctx, args.output_path, "json");
        }

        logger.flush();
        return 0;
    } catch (const retireplan::ValidationError& e) {
        logger.log_error(ctx, e.what(), e.field());
        logger.flush();
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        return 1;
    }
}
