/**
 * @file logger.hpp
 * @brief Structured logging for the engine driver with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Run context tracking (plan id, input hash, analysis)
 *
 * The projection library itself never logs; only the CLI driver does.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef RETIREPLAN_LOGGER_HPP
#define RETIREPLAN_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace retireplan {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (per-lever results, intermediate values)
    INFO,    ///< Informational messages (run start, analysis completion)
    WARN,    ///< Warning messages (unusual but valid inputs)
    ERROR    ///< Error messages (validation failures, I/O errors)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Run context attached to every event
 */
struct RunContext {
    std::string plan_id;             ///< Caller-supplied plan identifier (may be empty)
    std::string input_hash;          ///< Content hash of the ProjectionInput
    std::string analysis;            ///< Analysis currently running (projection, sensitivity, ...)

    RunContext() {}

    explicit RunContext(const std::string& plan)
        : plan_id(plan) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("retireplan-engine.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("plan-42");
 *   logger.log_run_start(ctx, "plan.json", {"projection", "sensitivity"});
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a CLI run
     *
     * @param ctx Run context
     * @param input_source Path of the plan or snapshot being read
     * @param analyses Analyses requested for this run
     */
    void log_run_start(
        const RunContext& ctx,
        const std::string& input_source,
        const std::vector<std::string>& analyses
    );

    /**
     * @brief Log a successfully built and validated ProjectionInput
     *
     * @param ctx Run context (input_hash should be set)
     * @param current_age Holder's current age
     * @param retirement_age Planned retirement age
     * @param max_age Last projected age
     * @param income_stream_count Number of income streams
     */
    void log_input_loaded(
        const RunContext& ctx,
        int current_age,
        int retirement_age,
        int max_age,
        size_t income_stream_count
    );

    /**
     * @brief Log completion of one analysis
     *
     * @param ctx Run context (analysis should be set)
     * @param execution_time_ms Wall time spent in the analysis
     * @param details Headline figures to attach (already formatted)
     */
    void log_analysis_complete(
        const RunContext& ctx,
        double execution_time_ms,
        const std::map<std::string, std::string>& details
    );

    /**
     * @brief Log an advisory warning about the input
     *
     * @param ctx Run context
     * @param field Input field the warning concerns
     * @param message Warning text
     */
    void log_projection_warning(
        const RunContext& ctx,
        const std::string& field,
        const std::string& message
    );

    /**
     * @brief Log an output file written by the run
     *
     * @param ctx Run context
     * @param path Output path
     * @param format Output format (json, parquet)
     */
    void log_output_written(
        const RunContext& ctx,
        const std::string& path,
        const std::string& format
    );

    /**
     * @brief Log error with context
     *
     * @param ctx Run context
     * @param error_message Error message
     * @param field Offending input field, when the error is a validation failure
     */
    void log_error(
        const RunContext& ctx,
        const std::string& error_message,
        const std::string& field = ""
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     *
     * @param level Minimum level to output
     */
    void set_min_level(LogLevel level) { config_.min_level = level; }

    /**
     * @brief Get current log level
     *
     * @return Current minimum log level
     */
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields, const RunContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace retireplan

#endif // RETIREPLAN_LOGGER_HPP
