#ifndef LOANCALC_SIMULATION_HPP
#define LOANCALC_SIMULATION_HPP

#include "calendar_date.hpp"
#include "deductions.hpp"
#include "loan_parameters.hpp"
#include <vector>

namespace loancalc {

// Snapshot recorded at the start of each simulated month.
// balance / total_repaid / net_salary_lost are the values before the
// month's changes; salary_after_tax is computed during the month.
struct MonthlySnapshot {
    Date date;
    double salary;
    double balance;
    double total_repaid;
    double net_salary_lost;
    double salary_after_tax;    // After tax and NI, with income-based repayment deducted

    MonthlySnapshot();
};

// Aggregate state at the end of a run
struct SimulationState {
    double balance;             // Outstanding balance (never negative)
    double total_repaid;        // All payments applied to the balance, upfront included
    double net_salary_lost;     // Cumulative after-tax income lost to income-based repayment
    int months_elapsed;         // Completed periods
    bool repaid_in_full;        // Balance exhausted inside the monthly loop
    bool written_off;           // Loop reached the write-off date with balance > 0
    Date final_date;            // Date the loop stopped at
    double final_salary;        // Salary after the last growth application

    SimulationState();
};

// Result of a single simulation run
struct SimulationResult {
    SimulationState state;
    std::vector<MonthlySnapshot> history;   // One entry per simulated month, chronological

    SimulationResult();
    SimulationResult(const SimulationState& final_state, std::vector<MonthlySnapshot>&& snapshots);
};

// Configuration options for simulation
struct SimulationConfig {
    bool record_history;        // If false, history is left empty

    SimulationConfig();
};

// Simulate the loan month by month until repaid in full or written off.
//
// Before the loop the upfront payment (capped at the principal) is applied.
// Each month, while date < write-off date and balance > 0:
//   1. Record snapshot
//   2. Net salary lost += (net without repayment - net with repayment) / 12,
//      where the repayment is deducted from salary before tax and NI
//   3. Repay min(income-based monthly repayment + fixed monthly, balance)
//   4. Apply interest to the post-repayment balance (annual rate / 12)
//   5. Apply salary growth once when the date's year passes the tracked year
//   6. Advance to the last day of the next month
//   7. Stop with repaid_in_full if balance <= 0 (balance clamped to 0)
//
// An upfront payment that clears the loan leaves months_elapsed == 0 and
// repaid_in_full == false. Each call starts from scratch.
SimulationResult simulate(
    const LoanParameters& params,
    const RepaymentPlan& plan,
    const DeductionRules& deductions = DeductionRules::uk_2023_24(),
    const SimulationConfig& config = SimulationConfig()
);

} // namespace loancalc

#endif // LOANCALC_SIMULATION_HPP
