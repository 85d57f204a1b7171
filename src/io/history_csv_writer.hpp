#ifndef LOANCALC_IO_HISTORY_CSV_WRITER_HPP
#define LOANCALC_IO_HISTORY_CSV_WRITER_HPP

#include <ostream>
#include <string>
#include "../chart_series.hpp"

namespace loancalc {
namespace io {

// Write chart series as CSV:
//   date,salary,balance,total_repaid,net_salary_lost,salary_after_tax
// Returns false without writing anything (and logs a warning) when the
// series has no data.
bool write_history_csv(std::ostream& os, const ChartSeries& series);

// Write chart series to a CSV file; the file is not created when there is no data
bool write_history_csv(const std::string& filepath, const ChartSeries& series);

} // namespace io
} // namespace loancalc

#endif // LOANCALC_IO_HISTORY_CSV_WRITER_HPP
