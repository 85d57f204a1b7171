#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include "calendar_date.hpp"
#include "chart_series.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "simulation.hpp"
#include "summary.hpp"
#include "io/history_csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

// Command-line values; unset options leave the config file (or defaults) alone
struct CLIArgs {
    std::string config_path;
    std::optional<double> principal;
    std::optional<std::string> start_date;
    std::optional<std::string> write_off_date;
    std::optional<double> salary;
    std::optional<double> salary_growth;
    std::optional<std::string> growth_mode;
    std::optional<double> threshold;
    std::optional<double> repayment_rate;
    std::optional<double> interest_rate;
    std::optional<double> upfront;
    std::optional<double> monthly;
    std::string tax_bands_path;
    std::string ni_bands_path;
    std::string output_path;
    std::string history_csv_path;
    std::string history_parquet_path;
    std::string log_level;
    std::string log_file;
    bool log_json = false;
    bool no_history = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LoanCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>             JSON run configuration (options below override it)\n\n";
    std::cerr << "Loan options:\n";
    std::cerr << "  --principal <amount>        Initial loan balance\n";
    std::cerr << "  --start-date <YYYY-MM-DD>   First repayment month\n";
    std::cerr << "  --write-off-date <date>     Date the remaining balance is written off\n";
    std::cerr << "  --interest-rate <rate>      Nominal annual interest rate (default: 0.043)\n\n";
    std::cerr << "Salary options:\n";
    std::cerr << "  --salary <amount>           Initial gross annual salary\n";
    std::cerr << "  --salary-growth <value>     Annual salary growth (default: 0)\n";
    std::cerr << "  --growth-mode <mode>        percent or fixed (default: percent)\n\n";
    std::cerr << "Repayment options:\n";
    std::cerr << "  --threshold <amount>        Repayment threshold (default: 27295)\n";
    std::cerr << "  --repayment-rate <rate>     Rate on income above threshold (default: 0.09)\n";
    std::cerr << "  --upfront <amount>          One-time upfront payment (default: 0)\n";
    std::cerr << "  --monthly <amount>          Fixed extra payment every month (default: 0)\n\n";
    std::cerr << "Deduction tables:\n";
    std::cerr << "  --tax-bands <path>          CSV income tax bands (default: UK 2023-24)\n";
    std::cerr << "  --ni-bands <path>           CSV National Insurance bands (default: UK 2023-24)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON result file\n";
    std::cerr << "  --history-csv <path>        Monthly history as CSV (for charting)\n";
    std::cerr << "  --history-parquet <path>    Monthly history as Parquet\n";
    std::cerr << "  --no-history                Omit the monthly history from the JSON result\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  Emit log lines as JSON\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --principal 40000 --salary 30000 --salary-growth 3 \\\n";
    std::cerr << "      --start-date 2024-04-30 --write-off-date 2054-04-30 \\\n";
    std::cerr << "      --history-csv history.csv\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--principal" && i + 1 < argc) {
            args.principal = std::stod(argv[++i]);
        } else if (arg == "--start-date" && i + 1 < argc) {
            args.start_date = argv[++i];
        } else if (arg == "--write-off-date" && i + 1 < argc) {
            args.write_off_date = argv[++i];
        } else if (arg == "--interest-rate" && i + 1 < argc) {
            args.interest_rate = std::stod(argv[++i]);
        } else if (arg == "--salary" && i + 1 < argc) {
            args.salary = std::stod(argv[++i]);
        } else if (arg == "--salary-growth" && i + 1 < argc) {
            args.salary_growth = std::stod(argv[++i]);
        } else if (arg == "--growth-mode" && i + 1 < argc) {
            args.growth_mode = argv[++i];
        } else if (arg == "--threshold" && i + 1 < argc) {
            args.threshold = std::stod(argv[++i]);
        } else if (arg == "--repayment-rate" && i + 1 < argc) {
            args.repayment_rate = std::stod(argv[++i]);
        } else if (arg == "--upfront" && i + 1 < argc) {
            args.upfront = std::stod(argv[++i]);
        } else if (arg == "--monthly" && i + 1 < argc) {
            args.monthly = std::stod(argv[++i]);
        } else if (arg == "--tax-bands" && i + 1 < argc) {
            args.tax_bands_path = argv[++i];
        } else if (arg == "--ni-bands" && i + 1 < argc) {
            args.ni_bands_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--history-csv" && i + 1 < argc) {
            args.history_csv_path = argv[++i];
        } else if (arg == "--history-parquet" && i + 1 < argc) {
            args.history_parquet_path = argv[++i];
        } else if (arg == "--no-history") {
            args.no_history = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Apply command-line overrides on top of the loaded configuration
void apply_overrides(const CLIArgs& args, loancalc::RunConfig& config) {
    if (args.principal) config.loan.principal = *args.principal;
    if (args.start_date) config.loan.start_date = loancalc::Date::parse(*args.start_date);
    if (args.write_off_date) config.loan.write_off_date = loancalc::Date::parse(*args.write_off_date);
    if (args.interest_rate) config.loan.annual_interest_rate = *args.interest_rate;
    if (args.salary) config.loan.initial_salary = *args.salary;
    if (args.salary_growth) config.loan.salary_growth.amount = *args.salary_growth;
    if (args.growth_mode) config.loan.salary_growth.mode = loancalc::growth_mode_from_string(*args.growth_mode);
    if (args.threshold) config.loan.repayment_rule.threshold = *args.threshold;
    if (args.repayment_rate) config.loan.repayment_rule.rate = *args.repayment_rate;
    if (args.upfront) config.plan.upfront = *args.upfront;
    if (args.monthly) config.plan.monthly_fixed = *args.monthly;

    if (!args.tax_bands_path.empty()) config.income_tax_bands_path = args.tax_bands_path;
    if (!args.ni_bands_path.empty()) config.social_insurance_bands_path = args.ni_bands_path;

    if (!args.output_path.empty()) config.output.json_path = args.output_path;
    if (!args.history_csv_path.empty()) config.output.history_csv_path = args.history_csv_path;
    if (!args.history_parquet_path.empty()) config.output.history_parquet_path = args.history_parquet_path;
    if (args.no_history) config.output.include_history = false;

    if (!args.log_level.empty()) {
        try {
            config.logging.min_level = loancalc::string_to_level(args.log_level);
        } catch (const std::invalid_argument& e) {
            throw loancalc::ConfigParseError(e.what());
        }
    }
    if (args.log_json) config.logging.enable_json = true;
    if (!args.log_file.empty()) {
        config.logging.enable_file = true;
        config.logging.log_file_path = args.log_file;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    loancalc::Logger& logger = loancalc::Logger::get_instance();

    try {
        loancalc::RunConfig config;
        if (!args.config_path.empty()) {
            config = loancalc::parse_run_config_from_file(args.config_path);
        }

        apply_overrides(args, config);
        logger.configure(config.logging);
        if (!args.config_path.empty()) {
            logger.log_config_loaded(args.config_path);
        }

        loancalc::validate_run_config(config);
        loancalc::load_deduction_tables(config);

        loancalc::SimulationResult result =
            loancalc::simulate(config.loan, config.plan, config.deductions);
        loancalc::LoanSummary summary = loancalc::summarize(result.state, config.plan);

        loancalc::write_summary(std::cout, summary);

        if (!config.output.json_path.empty()) {
            loancalc::io::write_simulation_result_json(
                config.output.json_path, result, summary, config.output.include_history);
            logger.log_output_written("json", config.output.json_path, result.history.size());
        }

        loancalc::ChartSeries series = loancalc::extract_chart_series(result.history);

        if (!config.output.history_csv_path.empty()) {
            loancalc::io::write_history_csv(config.output.history_csv_path, series);
        }

        if (!config.output.history_parquet_path.empty()) {
            if (series.has_data()) {
                loancalc::ParquetWriter::write_history(series, config.output.history_parquet_path);
                logger.log_output_written("history_parquet", config.output.history_parquet_path,
                                          series.size());
            } else {
                logger.log_warning("No simulation data found. Parquet history not written.");
            }
        }

        logger.flush();
        return 0;
    } catch (const loancalc::ConfigParseError& e) {
        logger.log_error("Configuration error", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.log_error("Run failed", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
