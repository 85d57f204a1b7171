#include "chart_series.hpp"

namespace loancalc {

ChartSeries extract_chart_series(const std::vector<MonthlySnapshot>& history) {
    ChartSeries series;
    series.dates.reserve(history.size());
    series.salary.reserve(history.size());
    series.balance.reserve(history.size());
    series.total_repaid.reserve(history.size());
    series.net_salary_lost.reserve(history.size());
    series.salary_after_tax.reserve(history.size());

    for (const MonthlySnapshot& snapshot : history) {
        series.dates.push_back(snapshot.date);
        series.salary.push_back(snapshot.salary);
        series.balance.push_back(snapshot.balance);
        series.total_repaid.push_back(snapshot.total_repaid);
        series.net_salary_lost.push_back(snapshot.net_salary_lost);
        series.salary_after_tax.push_back(snapshot.salary_after_tax);
    }

    return series;
}

} // namespace loancalc
