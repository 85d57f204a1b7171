#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace loancalc {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string strip_source_prefix(const std::string& source) {
    const std::string local_prefix = "local://";
    if (source.compare(0, local_prefix.size(), local_prefix) == 0) {
        return source.substr(local_prefix.size());
    }
    size_t scheme = source.find("://");
    if (scheme != std::string::npos) {
        throw ConfigParseError("Unsupported source '" + source + "'. Use local:// or a plain path.");
    }
    return source;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

Date parse_date_field(const json& section, const char* key) {
    try {
        return Date::parse(section[key].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Field '") + key + "': " + e.what());
    }
}

std::string path_field(const json& section, const char* key) {
    return strip_source_prefix(expand_environment_variables(section[key].get<std::string>()));
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("loan")) {
            const json& loan = j["loan"];
            if (loan.contains("principal")) config.loan.principal = loan["principal"].get<double>();
            if (loan.contains("start_date")) config.loan.start_date = parse_date_field(loan, "start_date");
            if (loan.contains("write_off_date")) config.loan.write_off_date = parse_date_field(loan, "write_off_date");
            if (loan.contains("interest_rate")) config.loan.annual_interest_rate = loan["interest_rate"].get<double>();
        }

        if (j.contains("salary")) {
            const json& salary = j["salary"];
            if (salary.contains("initial")) config.loan.initial_salary = salary["initial"].get<double>();
            if (salary.contains("growth")) config.loan.salary_growth.amount = salary["growth"].get<double>();
            if (salary.contains("growth_mode")) {
                try {
                    config.loan.salary_growth.mode =
                        growth_mode_from_string(salary["growth_mode"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(e.what());
                }
            }
        }

        if (j.contains("repayment")) {
            const json& repayment = j["repayment"];
            if (repayment.contains("threshold")) config.loan.repayment_rule.threshold = repayment["threshold"].get<double>();
            if (repayment.contains("rate")) config.loan.repayment_rule.rate = repayment["rate"].get<double>();
        }

        if (j.contains("plan")) {
            const json& plan = j["plan"];
            if (plan.contains("upfront")) config.plan.upfront = plan["upfront"].get<double>();
            if (plan.contains("monthly")) config.plan.monthly_fixed = plan["monthly"].get<double>();
        }

        if (j.contains("deductions")) {
            const json& deductions = j["deductions"];
            if (deductions.contains("income_tax")) {
                config.income_tax_bands_path = path_field(deductions, "income_tax");
            }
            if (deductions.contains("social_insurance")) {
                config.social_insurance_bands_path = path_field(deductions, "social_insurance");
            }
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                try {
                    config.logging.min_level = string_to_level(logging["level"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(e.what());
                }
            }
            if (logging.contains("json")) config.logging.enable_json = logging["json"].get<bool>();
            if (logging.contains("file")) {
                std::string file = expand_environment_variables(logging["file"].get<std::string>());
                config.logging.enable_file = !file.empty();
                if (!file.empty()) config.logging.log_file_path = file;
            }
        }

        if (j.contains("output")) {
            const json& output = j["output"];
            if (output.contains("json")) config.output.json_path = path_field(output, "json");
            if (output.contains("history_csv")) config.output.history_csv_path = path_field(output, "history_csv");
            if (output.contains("history_parquet")) {
                config.output.history_parquet_path = path_field(output, "history_parquet");
            }
            if (output.contains("include_history")) {
                config.output.include_history = output["include_history"].get<bool>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    auto resolve = [&file_path](std::string& path) {
        if (!path.empty()) {
            path = resolve_relative_path(path, file_path);
        }
    };
    resolve(config.income_tax_bands_path);
    resolve(config.social_insurance_bands_path);
    resolve(config.output.json_path);
    resolve(config.output.history_csv_path);
    resolve(config.output.history_parquet_path);
    if (config.logging.enable_file) {
        resolve(config.logging.log_file_path);
    }

    return config;
}

void load_deduction_tables(RunConfig& config) {
    try {
        if (!config.income_tax_bands_path.empty()) {
            config.deductions.income_tax_bands = BandSchedule::load_from_csv(config.income_tax_bands_path);
        }
        if (!config.social_insurance_bands_path.empty()) {
            config.deductions.social_insurance_bands =
                BandSchedule::load_from_csv(config.social_insurance_bands_path);
        }
    } catch (const std::exception& e) {
        throw ConfigParseError(std::string("Failed to load band table: ") + e.what());
    }
}

void validate_run_config(const RunConfig& config) {
    std::vector<std::string> problems = config.loan.validate();

    if (config.plan.upfront < 0.0) {
        problems.push_back("upfront payment must be non-negative");
    }
    if (config.plan.monthly_fixed < 0.0) {
        problems.push_back("monthly fixed payment must be non-negative");
    }

    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Invalid configuration:";
        for (const std::string& problem : problems) {
            oss << "\n  - " << problem;
        }
        throw ConfigParseError(oss.str());
    }
}

} // namespace loancalc
