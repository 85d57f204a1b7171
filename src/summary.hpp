#ifndef LOANCALC_SUMMARY_HPP
#define LOANCALC_SUMMARY_HPP

#include "loan_parameters.hpp"
#include "simulation.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace loancalc {

// Scalar reduction of a simulation run
struct LoanSummary {
    double total_repaid;
    double net_salary_lost;
    double remaining_balance;
    bool repaid_in_full;
    int months_repaying;
    int years_repaying;                     // Months rounded up to whole years
    double total_net_loss_plus_repayments;  // net_salary_lost + upfront + monthly_fixed * months

    LoanSummary();

    // Ordered label/value pairs for console output; amounts rounded to 2 d.p.
    std::vector<std::pair<std::string, std::string>> labelled_values() const;
};

// Whole years covering the given number of months (ceiling)
int years_repaying(int months);

// Round half away from zero to 2 decimal places
double round_to_cents(double value);

// The net-loss total counts plan payments (upfront + fixed monthly) only,
// not the income-based repayments included in total_repaid.
LoanSummary summarize(const SimulationState& state, const RepaymentPlan& plan);

// Print "label: value" lines
void write_summary(std::ostream& os, const LoanSummary& summary);

} // namespace loancalc

#endif // LOANCALC_SUMMARY_HPP
