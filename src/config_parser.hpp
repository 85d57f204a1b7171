#ifndef LOANCALC_CONFIG_PARSER_HPP
#define LOANCALC_CONFIG_PARSER_HPP

#include "deductions.hpp"
#include "loan_parameters.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <string>

namespace loancalc {

/**
 * @brief Exception thrown when a configuration cannot be read or is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Output destinations; empty paths are skipped
 */
struct OutputConfig {
    std::string json_path;
    std::string history_csv_path;
    std::string history_parquet_path;
    bool include_history;            ///< Embed the monthly history in the JSON result

    OutputConfig() : include_history(true) {}
};

/**
 * @brief Everything needed for one simulation run
 */
struct RunConfig {
    LoanParameters loan;
    RepaymentPlan plan;
    std::string income_tax_bands_path;       ///< CSV band table; empty = UK 2023-24
    std::string social_insurance_bands_path; ///< CSV band table; empty = UK 2023-24
    DeductionRules deductions;
    LoggerConfig logging;
    OutputConfig output;
};

/**
 * @brief Parses a run configuration from a JSON string
 *
 * All sections are optional; missing values keep their defaults.
 * Band table paths are stored but not loaded (see load_deduction_tables).
 *
 * @throws ConfigParseError if the JSON is malformed or a value has the wrong type
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative paths (band tables, outputs, log file) are resolved against the
 * directory containing the config file.
 *
 * @throws ConfigParseError if the file cannot be read or parsed
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Loads the band tables named in the config into config.deductions
 *
 * @throws ConfigParseError if a table cannot be read or is malformed
 */
void load_deduction_tables(RunConfig& config);

/**
 * @brief Rejects unusable loan parameters and repayment plans
 *
 * @throws ConfigParseError listing every problem found
 */
void validate_run_config(const RunConfig& config);

/**
 * @brief Expands ${VAR} and $VAR references from the environment
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Strips a "local://" source prefix
 *
 * @throws ConfigParseError for unsupported source schemes
 */
std::string strip_source_prefix(const std::string& source);

/**
 * @brief Resolves a path relative to the directory containing the config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace loancalc

#endif // LOANCALC_CONFIG_PARSER_HPP
