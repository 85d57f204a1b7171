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

namespace loancalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_streams();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_streams();
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_simulation_start(const LoanParameters& params, const RepaymentPlan& plan) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_start";
    fields["start_date"] = params.start_date.to_string();
    fields["write_off_date"] = params.write_off_date.to_string();
    fields["principal"] = format_amount(params.principal);
    fields["initial_salary"] = format_amount(params.initial_salary);
    fields["salary_growth"] = format_amount(params.salary_growth.amount);
    fields["growth_mode"] = growth_mode_to_string(params.salary_growth.mode);
    fields["repayment_threshold"] = format_amount(params.repayment_rule.threshold);
    fields["repayment_rate"] = std::to_string(params.repayment_rule.rate);
    fields["interest_rate"] = std::to_string(params.annual_interest_rate);
    fields["upfront"] = format_amount(plan.upfront);
    fields["monthly_fixed"] = format_amount(plan.monthly_fixed);

    log(LogLevel::INFO, "Starting simulation", fields);
}

void Logger::log_period(int month_index, const MonthlySnapshot& snapshot, double repayment) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "period";
    fields["month"] = std::to_string(month_index);
    fields["date"] = snapshot.date.to_string();
    fields["salary"] = format_amount(snapshot.salary);
    fields["balance"] = format_amount(snapshot.balance);
    fields["repayment"] = format_amount(repayment);
    fields["total_repaid"] = format_amount(snapshot.total_repaid);
    fields["net_salary_lost"] = format_amount(snapshot.net_salary_lost);

    log(LogLevel::DEBUG, "Simulated month", fields);
}

void Logger::log_simulation_complete(const SimulationState& state, size_t history_size, double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["months_elapsed"] = std::to_string(state.months_elapsed);
    fields["history_size"] = std::to_string(history_size);
    fields["balance"] = format_amount(state.balance);
    fields["total_repaid"] = format_amount(state.total_repaid);
    fields["net_salary_lost"] = format_amount(state.net_salary_lost);
    fields["repaid_in_full"] = state.repaid_in_full ? "true" : "false";
    fields["written_off"] = state.written_off ? "true" : "false";
    fields["final_date"] = state.final_date.to_string();
    fields["execution_time_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Simulation completed", fields);
}

void Logger::log_config_loaded(const std::string& config_path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["path"] = config_path;

    log(LogLevel::INFO, "Loaded configuration", fields);
}

void Logger::log_output_written(const std::string& kind, const std::string& path, size_t rows) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["kind"] = kind;
    fields["path"] = path;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Output written", fields);
}

void Logger::log_info(const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "info";

    log(LogLevel::INFO, message, fields);
}

void Logger::log_warning(const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& error_message, const std::string& detail) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    if (!detail.empty()) {
        fields["detail"] = detail;
    }

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_streams();
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level;
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::flush_streams() {
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
    std::lock_guard<std::mutex> lock(mutex_);
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

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string Logger::format_amount(double value) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
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

} // namespace loancalc
