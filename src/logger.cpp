/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace retireplan {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(
    const RunContext& ctx,
    const std::string& input_source,
    const std::vector<std::string>& analyses
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    add_context(fields, ctx);
    fields["input_source"] = input_source;

    std::string joined;
    for (const std::string& analysis : analyses) {
        if (!joined.empty()) joined += ",";
        joined += analysis;
    }
    fields["analyses"] = joined;

    log(LogLevel::INFO, "Starting projection run", fields);
}

void Logger::log_input_loaded(
    const RunContext& ctx,
    int current_age,
    int retirement_age,
    int max_age,
    size_t income_stream_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "input_loaded";
    add_context(fields, ctx);
    fields["current_age"] = std::to_string(current_age);
    fields["retirement_age"] = std::to_string(retirement_age);
    fields["max_age"] = std::to_string(max_age);
    fields["income_streams"] = std::to_string(income_stream_count);
    fields["projected_years"] = std::to_string(max_age - current_age + 1);

    log(LogLevel::INFO, "Projection input loaded", fields);
}

void Logger::log_analysis_complete(
    const RunContext& ctx,
    double execution_time_ms,
    const std::map<std::string, std::string>& details
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_complete";
    add_context(fields, ctx);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    // Limit attached figures to keep lines short
    size_t count = 0;
    for (const auto& [key, value] : details) {
        if (count++ >= 10) {
            fields["details_truncated"] = "true";
            break;
        }
        fields["result." + key] = value;
    }

    log(LogLevel::INFO, "Analysis completed", fields);
}

void Logger::log_projection_warning(
    const RunContext& ctx,
    const std::string& field,
    const std::string& message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "input_warning";
    add_context(fields, ctx);
    fields["field"] = field;
    fields["warning"] = message;

    log(LogLevel::WARN, message, fields);
}

void Logger::log_output_written(
    const RunContext& ctx,
    const std::string& path,
    const std::string& format
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    add_context(fields, ctx);
    fields["path"] = path;
    fields["format"] = format;

    log(LogLevel::DEBUG, "Output written", fields);
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message,
    const std::string& field
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    if (!field.empty()) {
        fields["field"] = field;
    }

    log(LogLevel::ERROR, "Engine error", fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

void Logger::add_context(std::map<std::string, std::string>& fields, const RunContext& ctx) const {
    if (!ctx.plan_id.empty()) {
        fields["plan_id"] = ctx.plan_id;
    }
    if (!ctx.input_hash.empty()) {
        fields["input_hash"] = ctx.input_hash;
    }
    if (!ctx.analysis.empty()) {
        fields["analysis"] = ctx.analysis;
    }
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace retireplan
