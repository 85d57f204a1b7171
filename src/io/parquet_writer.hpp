#ifndef LOANCALC_PARQUET_WRITER_HPP
#define LOANCALC_PARQUET_WRITER_HPP

#include "../chart_series.hpp"
#include <string>

namespace loancalc {

class ParquetWriter {
public:
    /**
     * Write simulation history to a Parquet file.
     *
     * Output schema:
     *   - date: utf8 (YYYY-MM-DD)
     *   - salary: float64
     *   - balance: float64
     *   - total_repaid: float64
     *   - net_salary_lost: float64
     *   - salary_after_tax: float64
     *
     * @param series Chart series extracted from the run history
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the series is empty, Arrow support is not
     *         compiled in, or the file cannot be written
     */
    static void write_history(const ChartSeries& series, const std::string& filepath);
};

} // namespace loancalc

#endif // LOANCALC_PARQUET_WRITER_HPP
