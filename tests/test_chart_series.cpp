#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "chart_series.hpp"
#include "io/history_csv_writer.hpp"
#include "simulation.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

using namespace loancalc;
using Catch::Approx;

namespace {

LoanParameters make_short_loan() {
    LoanParameters params;
    params.start_date = Date(2024, 1, 31);
    params.write_off_date = Date(2025, 1, 31);
    params.principal = 40000.0;
    params.initial_salary = 30000.0;
    return params;
}

std::vector<std::string> read_lines(std::istream& is) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

TEST_CASE("extract_chart_series mirrors history", "[chart]") {
    SimulationResult result = simulate(make_short_loan(), RepaymentPlan());
    ChartSeries series = extract_chart_series(result.history);

    REQUIRE(series.has_data());
    REQUIRE(series.size() == 12);
    REQUIRE(series.salary.size() == 12);
    REQUIRE(series.balance.size() == 12);
    REQUIRE(series.total_repaid.size() == 12);
    REQUIRE(series.net_salary_lost.size() == 12);
    REQUIRE(series.salary_after_tax.size() == 12);

    for (size_t i = 0; i < series.size(); ++i) {
        REQUIRE(series.dates[i] == result.history[i].date);
        REQUIRE(series.balance[i] == result.history[i].balance);
        REQUIRE(series.salary_after_tax[i] == result.history[i].salary_after_tax);
    }

    REQUIRE(series.dates.front() == Date(2024, 1, 31));
    REQUIRE(series.dates.back() == Date(2024, 12, 31));
    REQUIRE(series.balance.front() == 40000.0);
    REQUIRE(series.total_repaid.front() == 0.0);
}

TEST_CASE("Empty history has no chart data", "[chart]") {
    ChartSeries series = extract_chart_series({});
    REQUIRE_FALSE(series.has_data());
    REQUIRE(series.size() == 0);
}

TEST_CASE("Upfront payoff produces no chart data", "[chart]") {
    SimulationResult result = simulate(make_short_loan(), RepaymentPlan(40000.0, 0.0));
    ChartSeries series = extract_chart_series(result.history);
    REQUIRE_FALSE(series.has_data());
}

TEST_CASE("History CSV output", "[chart][io]") {
    SimulationResult result = simulate(make_short_loan(), RepaymentPlan());
    ChartSeries series = extract_chart_series(result.history);

    SECTION("Stream output has header and one row per month") {
        std::ostringstream oss;
        REQUIRE(io::write_history_csv(oss, series));

        std::istringstream iss(oss.str());
        auto lines = read_lines(iss);
        REQUIRE(lines.size() == 13);
        REQUIRE(lines[0] == "date,salary,balance,total_repaid,net_salary_lost,salary_after_tax");
        REQUIRE(lines[1].rfind("2024-01-31,30000.00,40000.00,0.00,0.00,", 0) == 0);
        REQUIRE(lines[12].rfind("2024-12-31,", 0) == 0);
    }

    SECTION("File output") {
        std::string path = "test_history_output.csv";
        std::filesystem::remove(path);

        REQUIRE(io::write_history_csv(path, series));
        REQUIRE(std::filesystem::exists(path));

        std::ifstream file(path);
        auto lines = read_lines(file);
        file.close();
        REQUIRE(lines.size() == 13);

        std::filesystem::remove(path);
    }
}

TEST_CASE("History CSV leaves the caller's stream formatting alone", "[chart][io]") {
    SimulationResult result = simulate(make_short_loan(), RepaymentPlan());
    ChartSeries series = extract_chart_series(result.history);

    std::ostringstream oss;
    oss << std::setprecision(4);
    REQUIRE(io::write_history_csv(oss, series));

    REQUIRE(oss.precision() == 4);
    REQUIRE((oss.flags() & std::ios_base::floatfield) == std::ios_base::fmtflags());

    oss.str("");
    oss << 1.0 / 3.0;
    REQUIRE(oss.str() == "0.3333");
}

TEST_CASE("History CSV without data writes nothing", "[chart][io]") {
    ChartSeries empty;

    SECTION("Stream") {
        std::ostringstream oss;
        REQUIRE_FALSE(io::write_history_csv(oss, empty));
        REQUIRE(oss.str().empty());
    }

    SECTION("File is not created") {
        std::string path = "test_history_empty.csv";
        std::filesystem::remove(path);

        REQUIRE_FALSE(io::write_history_csv(path, empty));
        REQUIRE_FALSE(std::filesystem::exists(path));
    }
}

TEST_CASE("History CSV to an unwritable path throws", "[chart][io]") {
    SimulationResult result = simulate(make_short_loan(), RepaymentPlan());
    ChartSeries series = extract_chart_series(result.history);

    REQUIRE_THROWS_AS(io::write_history_csv("/nonexistent_dir/history.csv", series), std::runtime_error);
}
