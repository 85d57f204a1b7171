#include <catch2/catch_test_macros.hpp>
#include "io/json_writer.hpp"
#include "simulation.hpp"
#include "summary.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace loancalc;

namespace {

SimulationResult run_quick_payoff() {
    LoanParameters params;
    params.start_date = Date(2024, 4, 30);
    params.write_off_date = Date(2054, 4, 30);
    params.principal = 1000.0;
    params.initial_salary = 20000.0;
    return simulate(params, RepaymentPlan(0.0, 100.0));
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

} // anonymous namespace

TEST_CASE("JSON result contains summary and final state", "[json][io]") {
    SimulationResult result = run_quick_payoff();
    LoanSummary summary = summarize(result.state, RepaymentPlan(0.0, 100.0));

    std::ostringstream oss;
    io::write_simulation_result_json(oss, result, summary);
    std::string out = oss.str();

    REQUIRE(out.front() == '{');
    REQUIRE(contains(out, "\"summary\": {"));
    REQUIRE(contains(out, "\"total_repaid\": 1016.49"));
    REQUIRE(contains(out, "\"net_salary_lost\": 0.00"));
    REQUIRE(contains(out, "\"repaid_in_full\": true"));
    REQUIRE(contains(out, "\"months_repaying\": 11"));
    REQUIRE(contains(out, "\"years_repaying\": 1"));
    REQUIRE(contains(out, "\"total_net_loss_plus_repayments\": 1100.00"));

    REQUIRE(contains(out, "\"final_state\": {"));
    REQUIRE(contains(out, "\"written_off\": false"));
    REQUIRE(contains(out, "\"history_length\": 11"));
}

TEST_CASE("JSON result history", "[json][io]") {
    SimulationResult result = run_quick_payoff();
    LoanSummary summary = summarize(result.state, RepaymentPlan(0.0, 100.0));

    SECTION("Included by default") {
        std::ostringstream oss;
        io::write_simulation_result_json(oss, result, summary);
        std::string out = oss.str();

        REQUIRE(contains(out, "\"history\": ["));
        REQUIRE(count_occurrences(out, "\"date\":") == 11);
        REQUIRE(contains(out, "\"date\": \"2024-04-30\""));
        REQUIRE(contains(out, "\"balance\": 1000.00"));
    }

    SECTION("Omitted on request") {
        std::ostringstream oss;
        io::write_simulation_result_json(oss, result, summary, false);
        std::string out = oss.str();

        REQUIRE_FALSE(contains(out, "\"history\""));
        REQUIRE(contains(out, "\"history_length\": 11"));
    }

    SECTION("Compact output has no newlines or padding") {
        std::ostringstream oss;
        io::write_simulation_result_json(oss, result, summary, true, false);
        std::string out = oss.str();

        REQUIRE(out.find('\n') == std::string::npos);
        REQUIRE(contains(out, "\"months_repaying\":11"));
    }
}

TEST_CASE("JSON result leaves the caller's stream formatting alone", "[json][io]") {
    SimulationResult result = run_quick_payoff();
    LoanSummary summary = summarize(result.state, RepaymentPlan(0.0, 100.0));

    std::ostringstream oss;
    io::write_simulation_result_json(oss, result, summary);

    REQUIRE(oss.precision() == 6);
    REQUIRE((oss.flags() & std::ios_base::floatfield) == std::ios_base::fmtflags());

    oss.str("");
    oss << 2.5;
    REQUIRE(oss.str() == "2.5");
}

TEST_CASE("JSON result for an upfront payoff has empty history", "[json][io]") {
    LoanParameters params;
    params.start_date = Date(2024, 4, 30);
    params.write_off_date = Date(2054, 4, 30);
    params.principal = 5000.0;
    params.initial_salary = 30000.0;
    RepaymentPlan plan(5000.0, 0.0);

    SimulationResult result = simulate(params, plan);
    LoanSummary summary = summarize(result.state, plan);

    std::ostringstream oss;
    io::write_simulation_result_json(oss, result, summary);
    std::string out = oss.str();

    REQUIRE(contains(out, "\"history_length\": 0"));
    REQUIRE(contains(out, "\"history\": []"));
    REQUIRE(contains(out, "\"repaid_in_full\": false"));
}

TEST_CASE("JSON result file output", "[json][io]") {
    SimulationResult result = run_quick_payoff();
    LoanSummary summary = summarize(result.state, RepaymentPlan(0.0, 100.0));

    SECTION("Writes file") {
        std::string path = "test_result_output.json";
        io::write_simulation_result_json(path, result, summary);

        std::ifstream file(path);
        REQUIRE(file.is_open());
        std::ostringstream contents;
        contents << file.rdbuf();
        file.close();
        REQUIRE(contains(contents.str(), "\"final_date\": \"2025-03-31\""));

        std::filesystem::remove(path);
    }

    SECTION("Unwritable path throws") {
        REQUIRE_THROWS_AS(
            io::write_simulation_result_json("/nonexistent_dir/result.json", result, summary),
            std::runtime_error
        );
    }
}
