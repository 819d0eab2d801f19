/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace retireplan;

namespace {

// Flat JSON line with string values only, as the logger writes it
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

void configure_file_logger(const std::string& path, LogLevel level = LogLevel::DEBUG) {
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

void finish(const std::string& path) {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.log_file_path == "retireplan-engine.log");
        REQUIRE(config.enable_json == true);
    }

    SECTION("Log level filtering") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }
}

TEST_CASE("Logger Run Events", "[logger]") {
    const std::string path = "test_run_events.log";
    configure_file_logger(path);
    Logger& logger = Logger::get_instance();

    RunContext ctx("plan-42");
    ctx.input_hash = "0123456789abcdef";

    SECTION("Run start") {
        logger.log_run_start(ctx, "plan.json", {"projection", "sensitivity"});

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        auto fields = parse_json_log(lines[0]);

        REQUIRE(fields["event"] == "run_start");
        REQUIRE(fields["level"] == "INFO");
        REQUIRE(fields["plan_id"] == "plan-42");
        REQUIRE(fields["input_hash"] == "0123456789abcdef");
        REQUIRE(fields["input_source"] == "plan.json");
        REQUIRE(fields["analyses"] == "projection,sensitivity");
        REQUIRE(fields.count("analysis") == 0);
        REQUIRE_FALSE(fields["timestamp"].empty());
    }

    SECTION("Input loaded") {
        logger.log_input_loaded(ctx, 45, 65, 95, 2);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "input_loaded");
        REQUIRE(fields["current_age"] == "45");
        REQUIRE(fields["retirement_age"] == "65");
        REQUIRE(fields["max_age"] == "95");
        REQUIRE(fields["income_streams"] == "2");
        REQUIRE(fields["projected_years"] == "51");
    }

    SECTION("Analysis complete") {
        ctx.analysis = "sensitivity";
        std::map<std::string, std::string> details;
        details["top_lever"] = "expectedReturn";
        details["baseline_balance"] = "1250000.00";

        logger.log_analysis_complete(ctx, 12.5, details);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "analysis_complete");
        REQUIRE(fields["analysis"] == "sensitivity");
        REQUIRE(fields["result.top_lever"] == "expectedReturn");
        REQUIRE(fields["result.baseline_balance"] == "1250000.00");
        REQUIRE(fields.count("details_truncated") == 0);
        REQUIRE(fields["execution_time_ms"].find("12.5") == 0);
    }

    SECTION("Analysis details are truncated") {
        std::map<std::string, std::string> details;
        for (int i = 0; i < 12; ++i) {
            details["figure_" + std::to_string(10 + i)] = std::to_string(i);
        }

        logger.log_analysis_complete(ctx, 1.0, details);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["details_truncated"] == "true");
        REQUIRE(fields.count("result.figure_19") == 1);
        REQUIRE(fields.count("result.figure_20") == 0);
    }

    SECTION("Input warning") {
        logger.log_projection_warning(ctx, "expectedReturn", "Expected return above 12% is unusually optimistic");

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "input_warning");
        REQUIRE(fields["level"] == "WARN");
        REQUIRE(fields["field"] == "expectedReturn");
        REQUIRE(fields["message"] == "Expected return above 12% is unusually optimistic");
    }

    SECTION("Error with field") {
        logger.log_error(ctx, "Invalid projection input: maxAge: must not exceed 120", "maxAge");

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "error");
        REQUIRE(fields["level"] == "ERROR");
        REQUIRE(fields["field"] == "maxAge");
        REQUIRE(fields["error_message"] == "Invalid projection input: maxAge: must not exceed 120");
    }

    finish(path);
}

TEST_CASE("Logger Level Filtering", "[logger]") {
    const std::string path = "test_level_filter.log";
    configure_file_logger(path, LogLevel::WARN);
    Logger& logger = Logger::get_instance();

    RunContext ctx("plan-7");
    logger.log_run_start(ctx, "plan.json", {"projection"});
    logger.log_output_written(ctx, "out.json", "json");
    logger.log_projection_warning(ctx, "maxAge", "Plan ends before age 85");
    logger.log_error(ctx, "disk full");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(parse_json_log(lines[0])["event"] == "input_warning");

    auto error_fields = parse_json_log(lines[1]);
    REQUIRE(error_fields["event"] == "error");
    REQUIRE(error_fields.count("field") == 0);

    finish(path);
}

TEST_CASE("Logger Output Events", "[logger]") {
    const std::string path = "test_output_events.log";
    configure_file_logger(path);

    RunContext ctx;
    Logger::get_instance().log_output_written(ctx, "records.parquet", "parquet");

    auto fields = parse_json_log(read_lines(path).at(0));
    REQUIRE(fields["event"] == "output_written");
    REQUIRE(fields["level"] == "DEBUG");
    REQUIRE(fields["path"] == "records.parquet");
    REQUIRE(fields["format"] == "parquet");
    REQUIRE(fields.count("plan_id") == 0);

    finish(path);
}

TEST_CASE("Logger Plain Text Output", "[logger]") {
    const std::string path = "test_plain_text.log";
    std::filesystem::remove(path);

    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = false;
    config.log_file_path = path;
    Logger::get_instance().configure(config);

    Logger::get_instance().log_run_start(RunContext("plan-1"), "snapshot.json", {"status"});

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Starting projection run") != std::string::npos);
    REQUIRE(lines[0].find("plan_id=plan-1") != std::string::npos);

    finish(path);
}
