#ifndef RETIREPLAN_CONFIG_HPP
#define RETIREPLAN_CONFIG_HPP

#include "logger.hpp"
#include "sensitivity.hpp"
#include "withdrawal.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace retireplan {

/**
 * @brief Exception thrown when engine config parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Analyses the CLI driver can run, by config/CLI name
 *
 * projection, sensitivity, low-friction-wins, sensitive-assumptions,
 * depletion, income-floor, spending-comparison, staleness, status
 */
const std::vector<std::string>& known_analyses();

bool is_known_analysis(const std::string& name);

/**
 * @brief Withdrawal policy settings
 */
struct WithdrawalSettings {
    WithdrawalOrder order;
    RmdExcessHandling rmd_excess;

    WithdrawalSettings();
};

/**
 * @brief Engine driver configuration
 *
 * Example:
 *   @code
 *   {
 *     "logging": {"level": "INFO", "json": true, "file": "run.log"},
 *     "rmd_table": "uniform_lifetime_2022.csv",
 *     "analyses": ["projection", "sensitivity"],
 *     "start_year": 2025,
 *     "early_years": 10,
 *     "sensitivity": {"metric": "retirementBalance", "top_count": 3},
 *     "low_friction": {"materiality_percent": 1.0, "max_wins": 3},
 *     "withdrawal": {"order": ["taxable", "taxDeferred", "taxFree"], "rmd_excess": "reinvest"}
 *   }
 *   @endcode
 */
struct EngineConfig {
    LoggerConfig logging;
    std::string rmd_table_path;              ///< Empty: built-in IRS Uniform Lifetime Table
    std::vector<std::string> analyses;
    std::optional<int> start_year;           ///< Calendar year of the current-age record
    int early_years;                         ///< Spending-comparison early window
    OutcomeMetric sensitivity_metric;
    size_t sensitivity_top_count;
    double materiality_percent;
    size_t max_low_friction_wins;
    WithdrawalSettings withdrawal;

    EngineConfig();
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * Relative rmd_table and log file paths are resolved against the config
 * file's directory.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed engine configuration
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed engine configuration
 * @throws ConfigParseError if JSON is invalid or a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace retireplan

#endif // RETIREPLAN_CONFIG_HPP
