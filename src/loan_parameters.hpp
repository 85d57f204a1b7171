#ifndef LOANCALC_LOAN_PARAMETERS_HPP
#define LOANCALC_LOAN_PARAMETERS_HPP

#include "calendar_date.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace loancalc {

enum class GrowthMode : uint8_t {
    Percentage = 0,   // salary *= 1 + amount / 100
    FixedAmount = 1   // salary += amount
};

// "percent" / "fixed"
std::string growth_mode_to_string(GrowthMode mode);
GrowthMode growth_mode_from_string(const std::string& text);

// Annual salary growth, applied once per calendar-year boundary
struct SalaryGrowth {
    double amount;
    GrowthMode mode;

    SalaryGrowth();
    SalaryGrowth(double amt, GrowthMode m = GrowthMode::Percentage);

    double apply(double salary) const;
};

// Income-contingent repayment: rate applied to income above threshold
struct RepaymentRule {
    static constexpr double DEFAULT_THRESHOLD = 27295.0;
    static constexpr double DEFAULT_RATE = 0.09;

    double threshold;
    double rate;

    RepaymentRule();
    RepaymentRule(double thresh, double r);

    double annual_repayment(double gross_annual_salary) const;

    // Always derived from the annual figure
    double monthly_repayment(double gross_annual_salary) const;
};

// Payer-chosen overrides layered on top of income-based repayment
struct RepaymentPlan {
    double upfront;         // Applied once before the first period
    double monthly_fixed;   // Added to every period's income-based repayment

    RepaymentPlan();
    RepaymentPlan(double up, double monthly);

    bool operator==(const RepaymentPlan& other) const;
};

struct LoanParameters {
    static constexpr double DEFAULT_INTEREST_RATE = 0.043;

    Date start_date;
    Date write_off_date;
    double principal;
    double initial_salary;
    SalaryGrowth salary_growth;
    RepaymentRule repayment_rule;
    double annual_interest_rate;   // Nominal; applied monthly as rate / 12

    LoanParameters();

    double monthly_interest_rate() const { return annual_interest_rate / 12.0; }

    // Human-readable list of problems; empty when the parameters are usable
    std::vector<std::string> validate() const;
};

} // namespace loancalc

#endif // LOANCALC_LOAN_PARAMETERS_HPP
