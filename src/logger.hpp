/**
 * @file logger.hpp
 * @brief Structured logging for the loan simulator
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Console (stderr) and file sinks
 * - Simulation events (start, per-month detail, completion, outputs)
 */

#ifndef LOANCALC_LOGGER_HPP
#define LOANCALC_LOGGER_HPP

#include "loan_parameters.hpp"
#include "simulation.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace loancalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-month state detail
    INFO,    ///< Run start/end, configuration, outputs written
    WARN,    ///< Non-fatal issues (e.g. nothing to chart)
    ERROR    ///< Failures
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
 *
 * @throws std::invalid_argument for names other than DEBUG, INFO, WARN, ERROR
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level '" + level_str + "' (expected DEBUG, INFO, WARN or ERROR)");
}

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
          log_file_path("loancalc.log"),
          enable_json(false) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   Logger::get_instance().log_simulation_start(params, plan);
 *   @endcode
 *
 * Thread-safe: concurrent simulations may share one logger. Each line is
 * written whole.
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings (reopens the file sink)
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the inputs of a simulation run
     */
    void log_simulation_start(const LoanParameters& params, const RepaymentPlan& plan);

    /**
     * @brief Log one simulated month (DEBUG)
     *
     * @param month_index 0-based period number
     * @param snapshot State recorded at the start of the month
     * @param repayment Cash repaid in the month
     */
    void log_period(int month_index, const MonthlySnapshot& snapshot, double repayment);

    /**
     * @brief Log the outcome of a simulation run
     *
     * @param state Final state
     * @param history_size Number of recorded snapshots
     * @param elapsed_ms Wall-clock time of the run
     */
    void log_simulation_complete(const SimulationState& state, size_t history_size, double elapsed_ms);

    /**
     * @brief Log a configuration file being applied
     */
    void log_config_loaded(const std::string& config_path);

    /**
     * @brief Log an output artefact being written
     *
     * @param kind Output kind (json, history_csv, history_parquet)
     * @param path Destination path
     * @param rows Rows written
     */
    void log_output_written(const std::string& kind, const std::string& path, size_t rows);

    void log_info(const std::string& message);
    void log_warning(const std::string& warning_message);
    void log_error(const std::string& error_message, const std::string& detail = "");

    void flush();

    bool is_enabled(LogLevel level) const;
    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    std::string format_amount(double value) const;
    void flush_streams();
    void write_output(const std::string& output);
};

} // namespace loancalc

#endif // LOANCALC_LOGGER_HPP
