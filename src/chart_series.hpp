#ifndef LOANCALC_CHART_SERIES_HPP
#define LOANCALC_CHART_SERIES_HPP

#include "calendar_date.hpp"
#include "simulation.hpp"
#include <vector>

namespace loancalc {

// Parallel time series for plotting, one point per simulated month.
// Points hold their value until the next point (step-wise rendering).
struct ChartSeries {
    std::vector<Date> dates;
    std::vector<double> salary;
    std::vector<double> balance;
    std::vector<double> total_repaid;
    std::vector<double> net_salary_lost;
    std::vector<double> salary_after_tax;

    size_t size() const { return dates.size(); }

    // False when no simulation has produced history
    bool has_data() const { return !dates.empty(); }
};

ChartSeries extract_chart_series(const std::vector<MonthlySnapshot>& history);

} // namespace loancalc

#endif // LOANCALC_CHART_SERIES_HPP
