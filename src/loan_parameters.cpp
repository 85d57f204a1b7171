#include "loan_parameters.hpp"
#include <algorithm>
#include <stdexcept>

namespace loancalc {

// ============================================================================
// GrowthMode
// ============================================================================

std::string growth_mode_to_string(GrowthMode mode) {
    switch (mode) {
        case GrowthMode::Percentage: return "percent";
        case GrowthMode::FixedAmount: return "fixed";
    }
    return "percent";
}

GrowthMode growth_mode_from_string(const std::string& text) {
    if (text == "percent" || text == "percentage") return GrowthMode::Percentage;
    if (text == "fixed" || text == "fixed_amount") return GrowthMode::FixedAmount;
    throw std::invalid_argument("Unknown salary growth mode '" + text + "' (expected percent or fixed)");
}

// ============================================================================
// SalaryGrowth Implementation
// ============================================================================

SalaryGrowth::SalaryGrowth() : amount(0.0), mode(GrowthMode::Percentage) {}

SalaryGrowth::SalaryGrowth(double amt, GrowthMode m) : amount(amt), mode(m) {}

double SalaryGrowth::apply(double salary) const {
    if (mode == GrowthMode::Percentage) {
        return salary * (1.0 + amount / 100.0);
    }
    return salary + amount;
}

// ============================================================================
// RepaymentRule Implementation
// ============================================================================

RepaymentRule::RepaymentRule() : threshold(DEFAULT_THRESHOLD), rate(DEFAULT_RATE) {}

RepaymentRule::RepaymentRule(double thresh, double r) : threshold(thresh), rate(r) {}

double RepaymentRule::annual_repayment(double gross_annual_salary) const {
    double repayable_income = std::max(0.0, gross_annual_salary - threshold);
    return repayable_income * rate;
}

double RepaymentRule::monthly_repayment(double gross_annual_salary) const {
    return annual_repayment(gross_annual_salary) / 12.0;
}

// ============================================================================
// RepaymentPlan Implementation
// ============================================================================

RepaymentPlan::RepaymentPlan() : upfront(0.0), monthly_fixed(0.0) {}

RepaymentPlan::RepaymentPlan(double up, double monthly) : upfront(up), monthly_fixed(monthly) {}

bool RepaymentPlan::operator==(const RepaymentPlan& other) const {
    return upfront == other.upfront && monthly_fixed == other.monthly_fixed;
}

// ============================================================================
// LoanParameters Implementation
// ============================================================================

LoanParameters::LoanParameters()
    : start_date(),
      write_off_date(),
      principal(0.0),
      initial_salary(0.0),
      salary_growth(),
      repayment_rule(),
      annual_interest_rate(DEFAULT_INTEREST_RATE) {}

std::vector<std::string> LoanParameters::validate() const {
    std::vector<std::string> problems;

    if (!start_date.is_valid()) {
        problems.push_back("start date " + start_date.to_string() + " is not a valid calendar date");
    }
    if (!write_off_date.is_valid()) {
        problems.push_back("write-off date " + write_off_date.to_string() + " is not a valid calendar date");
    }
    if (write_off_date <= start_date) {
        problems.push_back("write-off date must be after start date");
    }
    if (principal < 0.0) {
        problems.push_back("principal must be non-negative");
    }
    if (initial_salary < 0.0) {
        problems.push_back("initial salary must be non-negative");
    }
    if (repayment_rule.threshold < 0.0) {
        problems.push_back("repayment threshold must be non-negative");
    }
    if (repayment_rule.rate < 0.0 || repayment_rule.rate > 1.0) {
        problems.push_back("repayment rate must be between 0 and 1");
    }
    if (annual_interest_rate < 0.0) {
        problems.push_back("interest rate must be non-negative");
    }

    return problems;
}

} // namespace loancalc
