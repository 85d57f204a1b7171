#include "summary.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace loancalc {

namespace {

std::string format_money(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << round_to_cents(value);
    return oss.str();
}

} // anonymous namespace

LoanSummary::LoanSummary()
    : total_repaid(0.0),
      net_salary_lost(0.0),
      remaining_balance(0.0),
      repaid_in_full(false),
      months_repaying(0),
      years_repaying(0),
      total_net_loss_plus_repayments(0.0) {}

std::vector<std::pair<std::string, std::string>> LoanSummary::labelled_values() const {
    return {
        {"Total repaid", format_money(total_repaid)},
        {"Net salary lost (after tax + NI)", format_money(net_salary_lost)},
        {"Remaining loan balance", format_money(remaining_balance)},
        {"Loan repaid in full", repaid_in_full ? "True" : "False"},
        {"Months repaying", std::to_string(months_repaying)},
        {"Years repaying (approx)", std::to_string(years_repaying)},
        {"Total net salary lost + repayments", format_money(total_net_loss_plus_repayments)}
    };
}

int years_repaying(int months) {
    return months / 12 + (months % 12 != 0 ? 1 : 0);
}

double round_to_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

LoanSummary summarize(const SimulationState& state, const RepaymentPlan& plan) {
    LoanSummary summary;
    summary.total_repaid = state.total_repaid;
    summary.net_salary_lost = state.net_salary_lost;
    summary.remaining_balance = state.balance;
    summary.repaid_in_full = state.repaid_in_full;
    summary.months_repaying = state.months_elapsed;
    summary.years_repaying = years_repaying(state.months_elapsed);

    double plan_repayments = plan.upfront + plan.monthly_fixed * state.months_elapsed;
    summary.total_net_loss_plus_repayments = state.net_salary_lost + plan_repayments;

    return summary;
}

void write_summary(std::ostream& os, const LoanSummary& summary) {
    for (const auto& [label, value] : summary.labelled_values()) {
        os << label << ": " << value << "\n";
    }
}

} // namespace loancalc
