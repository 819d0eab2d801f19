#include "config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace retireplan {

const std::vector<std::string>& known_analyses() {
    static const std::vector<std::string> names = {
        "projection",
        "sensitivity",
        "low-friction-wins",
        "sensitive-assumptions",
        "depletion",
        "income-floor",
        "spending-comparison",
        "staleness",
        "status"
    };
    return names;
}

bool is_known_analysis(const std::string& name) {
    const std::vector<std::string>& names = known_analyses();
    return std::find(names.begin(), names.end(), name) != names.end();
}

WithdrawalSettings::WithdrawalSettings()
    : order(default_withdrawal_order()),
      rmd_excess(RmdExcessHandling::ReinvestTaxable) {}

EngineConfig::EngineConfig()
    : analyses{"projection"},
      early_years(10),
      sensitivity_metric(OutcomeMetric::RetirementBalance),
      sensitivity_top_count(3),
      materiality_percent(1.0),
      max_low_friction_wins(3) {}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    // Resolve relative to the directory containing the config file
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

void parse_logging(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        const std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("logging.level must be one of DEBUG, INFO, WARN, ERROR (got '" + level + "')");
        }
        logging.min_level = string_to_level(level);
    }
    if (j.contains("json")) {
        logging.enable_json = j["json"].get<bool>();
    }
    if (j.contains("console")) {
        logging.enable_console = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path = j["file"].get<std::string>();
    }
}

void parse_withdrawal(const json& j, WithdrawalSettings& withdrawal) {
    if (j.contains("order")) {
        const std::vector<std::string> names = j["order"].get<std::vector<std::string>>();
        if (names.size() != TAX_CATEGORY_COUNT) {
            throw ConfigParseError("withdrawal.order must name all three tax categories");
        }
        std::set<std::string> seen;
        for (size_t i = 0; i < names.size(); ++i) {
            if (!seen.insert(names[i]).second) {
                throw ConfigParseError("withdrawal.order names '" + names[i] + "' twice");
            }
            try {
                withdrawal.order[i] = tax_category_from_string(names[i]);
            } catch (const std::invalid_argument& e) {
                throw ConfigParseError(std::string("withdrawal.order: ") + e.what());
            }
        }
    }
    if (j.contains("rmd_excess")) {
        const std::string handling = j["rmd_excess"].get<std::string>();
        if (handling == "reinvest") {
            withdrawal.rmd_excess = RmdExcessHandling::ReinvestTaxable;
        } else if (handling == "spend") {
            withdrawal.rmd_excess = RmdExcessHandling::Spend;
        } else {
            throw ConfigParseError("withdrawal.rmd_excess must be 'reinvest' or 'spend' (got '" + handling + "')");
        }
    }
}

} // anonymous namespace

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Engine config must be a JSON object");
        }

        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }

        if (j.contains("rmd_table")) {
            config.rmd_table_path = j["rmd_table"].get<std::string>();
        }

        if (j.contains("analyses")) {
            config.analyses = j["analyses"].get<std::vector<std::string>>();
            for (const std::string& name : config.analyses) {
                if (!is_known_analysis(name)) {
                    throw ConfigParseError("Unknown analysis: " + name);
                }
            }
        }

        if (j.contains("start_year")) {
            config.start_year = j["start_year"].get<int>();
        }

        if (j.contains("early_years")) {
            config.early_years = j["early_years"].get<int>();
            if (config.early_years < 0) {
                throw ConfigParseError("early_years must be non-negative");
            }
        }

        if (j.contains("sensitivity")) {
            const json& sensitivity = j["sensitivity"];
            if (sensitivity.contains("metric")) {
                try {
                    config.sensitivity_metric = outcome_metric_from_string(sensitivity["metric"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(std::string("sensitivity.metric: ") + e.what());
                }
            }
            if (sensitivity.contains("top_count")) {
                config.sensitivity_top_count = sensitivity["top_count"].get<size_t>();
            }
        }

        if (j.contains("low_friction")) {
            const json& low_friction = j["low_friction"];
            if (low_friction.contains("materiality_percent")) {
                config.materiality_percent = low_friction["materiality_percent"].get<double>();
                if (config.materiality_percent < 0.0) {
                    throw ConfigParseError("low_friction.materiality_percent must be non-negative");
                }
            }
            if (low_friction.contains("max_wins")) {
                config.max_low_friction_wins = low_friction["max_wins"].get<size_t>();
            }
        }

        if (j.contains("withdrawal")) {
            parse_withdrawal(j["withdrawal"], config.withdrawal);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    // Resolve relative paths
    if (!config.rmd_table_path.empty()) {
        config.rmd_table_path = resolve_relative_path(config.rmd_table_path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace retireplan
