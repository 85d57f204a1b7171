#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "simulation.hpp"
#include "summary.hpp"
#include <sstream>

using namespace loancalc;
using Catch::Approx;

namespace {

SimulationState make_state(int months, double net_lost, double repaid, double balance, bool repaid_in_full) {
    SimulationState state;
    state.months_elapsed = months;
    state.net_salary_lost = net_lost;
    state.total_repaid = repaid;
    state.balance = balance;
    state.repaid_in_full = repaid_in_full;
    return state;
}

} // anonymous namespace

TEST_CASE("years_repaying rounds partial years up", "[summary]") {
    REQUIRE(years_repaying(0) == 0);
    REQUIRE(years_repaying(1) == 1);
    REQUIRE(years_repaying(12) == 1);
    REQUIRE(years_repaying(13) == 2);
    REQUIRE(years_repaying(24) == 2);
    REQUIRE(years_repaying(25) == 3);
    REQUIRE(years_repaying(360) == 30);
}

TEST_CASE("round_to_cents", "[summary]") {
    REQUIRE(round_to_cents(1.005) == Approx(1.0).margin(0.011));
    REQUIRE(round_to_cents(2.345678) == Approx(2.35));
    REQUIRE(round_to_cents(-2.345678) == Approx(-2.35));
    REQUIRE(round_to_cents(100.0) == 100.0);
}

TEST_CASE("summarize copies state totals", "[summary]") {
    SimulationState state = make_state(37, 2397.43, 10639.2, 0.0, true);
    LoanSummary summary = summarize(state, RepaymentPlan());

    REQUIRE(summary.total_repaid == 10639.2);
    REQUIRE(summary.net_salary_lost == 2397.43);
    REQUIRE(summary.remaining_balance == 0.0);
    REQUIRE(summary.repaid_in_full);
    REQUIRE(summary.months_repaying == 37);
    REQUIRE(summary.years_repaying == 4);
}

TEST_CASE("Net loss total counts plan payments, not income repayments", "[summary]") {
    SimulationState state = make_state(37, 2397.43, 10639.2, 0.0, true);
    RepaymentPlan plan(500.0, 200.0);

    LoanSummary summary = summarize(state, plan);

    REQUIRE(summary.total_net_loss_plus_repayments == Approx(2397.43 + 500.0 + 200.0 * 37));
    REQUIRE(summary.total_net_loss_plus_repayments != Approx(2397.43 + 10639.2));
}

TEST_CASE("Net loss total without a plan equals net salary lost", "[summary]") {
    SimulationState state = make_state(360, 34161.4, 55399.39, 55515.51, false);
    LoanSummary summary = summarize(state, RepaymentPlan());
    REQUIRE(summary.total_net_loss_plus_repayments == Approx(34161.4));
}

TEST_CASE("Upfront-only payoff summarises with zero months", "[summary]") {
    SimulationState state = make_state(0, 0.0, 40000.0, 0.0, false);
    LoanSummary summary = summarize(state, RepaymentPlan(50000.0, 100.0));

    REQUIRE(summary.months_repaying == 0);
    REQUIRE(summary.years_repaying == 0);
    REQUIRE_FALSE(summary.repaid_in_full);
    // Uses the requested upfront amount, not the capped payment
    REQUIRE(summary.total_net_loss_plus_repayments == Approx(50000.0));
}

TEST_CASE("labelled_values keeps order and rounds amounts", "[summary]") {
    SimulationState state = make_state(25, 1234.5678, 9876.543, 12.3456, false);
    LoanSummary summary = summarize(state, RepaymentPlan(0.0, 10.0));

    auto values = summary.labelled_values();
    REQUIRE(values.size() == 7);

    REQUIRE(values[0].first == "Total repaid");
    REQUIRE(values[0].second == "9876.54");
    REQUIRE(values[1].first == "Net salary lost (after tax + NI)");
    REQUIRE(values[1].second == "1234.57");
    REQUIRE(values[2].first == "Remaining loan balance");
    REQUIRE(values[2].second == "12.35");
    REQUIRE(values[3].first == "Loan repaid in full");
    REQUIRE(values[3].second == "False");
    REQUIRE(values[4].first == "Months repaying");
    REQUIRE(values[4].second == "25");
    REQUIRE(values[5].first == "Years repaying (approx)");
    REQUIRE(values[5].second == "3");
    REQUIRE(values[6].first == "Total net salary lost + repayments");
    REQUIRE(values[6].second == "1484.57");
}

TEST_CASE("write_summary prints one labelled line per value", "[summary]") {
    SimulationState state = make_state(12, 100.0, 200.0, 0.0, true);
    LoanSummary summary = summarize(state, RepaymentPlan());

    std::ostringstream oss;
    write_summary(oss, summary);

    const std::string expected =
        "Total repaid: 200.00\n"
        "Net salary lost (after tax + NI): 100.00\n"
        "Remaining loan balance: 0.00\n"
        "Loan repaid in full: True\n"
        "Months repaying: 12\n"
        "Years repaying (approx): 1\n"
        "Total net salary lost + repayments: 100.00\n";
    REQUIRE(oss.str() == expected);
}

TEST_CASE("Summary of a simulated run", "[summary][simulation]") {
    LoanParameters params;
    params.start_date = Date(2024, 4, 30);
    params.write_off_date = Date(2054, 4, 30);
    params.principal = 10000.0;
    params.initial_salary = 40000.0;

    RepaymentPlan plan(0.0, 200.0);
    SimulationResult result = simulate(params, plan);
    LoanSummary summary = summarize(result.state, plan);

    REQUIRE(summary.repaid_in_full);
    REQUIRE(summary.months_repaying == 37);
    REQUIRE(summary.years_repaying == 4);
    REQUIRE(summary.labelled_values()[6].second == "9797.43");
}
