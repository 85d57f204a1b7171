#include "simulation.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace loancalc {

// ============================================================================
// Result types
// ============================================================================

MonthlySnapshot::MonthlySnapshot()
    : date(),
      salary(0.0),
      balance(0.0),
      total_repaid(0.0),
      net_salary_lost(0.0),
      salary_after_tax(0.0) {}

SimulationState::SimulationState()
    : balance(0.0),
      total_repaid(0.0),
      net_salary_lost(0.0),
      months_elapsed(0),
      repaid_in_full(false),
      written_off(false),
      final_date(),
      final_salary(0.0) {}

SimulationResult::SimulationResult() = default;

SimulationResult::SimulationResult(const SimulationState& final_state,
                                   std::vector<MonthlySnapshot>&& snapshots)
    : state(final_state), history(std::move(snapshots)) {}

SimulationConfig::SimulationConfig() : record_history(true) {}

// ============================================================================
// Simulation
// ============================================================================

SimulationResult simulate(
    const LoanParameters& params,
    const RepaymentPlan& plan,
    const DeductionRules& deductions,
    const SimulationConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    logger.log_simulation_start(params, plan);

    SimulationState state;
    std::vector<MonthlySnapshot> history;

    state.balance = params.principal;

    // Upfront payment is applied once, before the first period
    double upfront_payment = std::min(plan.upfront, state.balance);
    state.balance -= upfront_payment;
    state.total_repaid += upfront_payment;

    Date current_date = params.start_date;
    double salary = params.initial_salary;

    // Salary grows when the date's year passes this one
    int salary_year = current_date.year;

    while (current_date < params.write_off_date && state.balance > 0.0) {
        MonthlySnapshot snapshot;
        snapshot.date = current_date;
        snapshot.salary = salary;
        snapshot.balance = state.balance;
        snapshot.total_repaid = state.total_repaid;
        snapshot.net_salary_lost = state.net_salary_lost;

        // After-tax salary without repayment vs. with repayment deducted
        // before tax and NI
        double annual_repayment = params.repayment_rule.annual_repayment(salary);
        double net_without_repayment = deductions.net_salary(salary);
        double net_with_repayment = deductions.net_salary(salary - annual_repayment);
        snapshot.salary_after_tax = net_with_repayment;

        state.net_salary_lost += (net_without_repayment - net_with_repayment) / 12.0;

        // Cash repayment for the month, never more than the balance
        double monthly_income_repayment = params.repayment_rule.monthly_repayment(salary);
        double total_monthly_repayment = monthly_income_repayment + plan.monthly_fixed;
        double actual_repayment = std::min(total_monthly_repayment, state.balance);

        state.balance -= actual_repayment;
        state.total_repaid += actual_repayment;

        // Interest accrues on the post-repayment balance
        state.balance *= (1.0 + params.monthly_interest_rate());

        if (current_date.year > salary_year) {
            salary = params.salary_growth.apply(salary);
            salary_year = current_date.year;
        }

        logger.log_period(state.months_elapsed, snapshot, actual_repayment);

        if (config.record_history) {
            history.push_back(snapshot);
        }

        state.months_elapsed += 1;
        current_date = last_day_of_next_month(current_date);

        if (state.balance <= 0.0) {
            state.balance = 0.0;
            state.repaid_in_full = true;
            break;
        }
    }

    state.written_off = !state.repaid_in_full && state.balance > 0.0;
    state.final_date = current_date;
    state.final_salary = salary;

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    logger.log_simulation_complete(state, history.size(), elapsed_ms);

    return SimulationResult(state, std::move(history));
}

} // namespace loancalc
