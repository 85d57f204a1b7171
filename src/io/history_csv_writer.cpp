#include "history_csv_writer.hpp"
#include "../logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace loancalc {
namespace io {

namespace {

const char* const kNoDataMessage = "No simulation data found. Please run the simulation first.";

} // anonymous namespace

bool write_history_csv(std::ostream& os, const ChartSeries& series) {
    if (!series.has_data()) {
        Logger::get_instance().log_warning(kNoDataMessage);
        return false;
    }

    // Formatting is restored before returning
    std::ios_base::fmtflags saved_flags = os.flags();
    std::streamsize saved_precision = os.precision();

    os << "date,salary,balance,total_repaid,net_salary_lost,salary_after_tax\n";
    os << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < series.size(); ++i) {
        os << series.dates[i].to_string() << ","
           << series.salary[i] << ","
           << series.balance[i] << ","
           << series.total_repaid[i] << ","
           << series.net_salary_lost[i] << ","
           << series.salary_after_tax[i] << "\n";
    }

    os.flags(saved_flags);
    os.precision(saved_precision);
    return true;
}

bool write_history_csv(const std::string& filepath, const ChartSeries& series) {
    if (!series.has_data()) {
        Logger::get_instance().log_warning(kNoDataMessage);
        return false;
    }

    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open history file: " + filepath);
    }
    write_history_csv(file, series);
    Logger::get_instance().log_output_written("history_csv", filepath, series.size());
    return true;
}

} // namespace io
} // namespace loancalc
