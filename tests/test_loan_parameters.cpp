#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "loan_parameters.hpp"
#include <algorithm>
#include <stdexcept>

using namespace loancalc;
using Catch::Approx;

namespace {

bool mentions(const std::vector<std::string>& problems, const std::string& text) {
    return std::any_of(problems.begin(), problems.end(), [&text](const std::string& p) {
        return p.find(text) != std::string::npos;
    });
}

LoanParameters make_valid_parameters() {
    LoanParameters params;
    params.start_date = Date(2024, 4, 30);
    params.write_off_date = Date(2054, 4, 30);
    params.principal = 40000.0;
    params.initial_salary = 30000.0;
    return params;
}

} // anonymous namespace

TEST_CASE("LoanParameters defaults", "[parameters]") {
    LoanParameters params;
    REQUIRE(params.repayment_rule.threshold == 27295.0);
    REQUIRE(params.repayment_rule.rate == 0.09);
    REQUIRE(params.annual_interest_rate == 0.043);
    REQUIRE(params.salary_growth.mode == GrowthMode::Percentage);
    REQUIRE(params.salary_growth.amount == 0.0);
    REQUIRE(params.monthly_interest_rate() == Approx(0.043 / 12.0));
}

TEST_CASE("SalaryGrowth applies percentage or fixed amounts", "[parameters][salary]") {
    SECTION("Percentage is expressed in percent") {
        SalaryGrowth growth(3.0, GrowthMode::Percentage);
        REQUIRE(growth.apply(30000.0) == Approx(30900.0));
    }

    SECTION("Fixed amount is additive") {
        SalaryGrowth growth(1500.0, GrowthMode::FixedAmount);
        REQUIRE(growth.apply(30000.0) == Approx(31500.0));
    }

    SECTION("Zero growth leaves salary unchanged") {
        SalaryGrowth growth;
        REQUIRE(growth.apply(30000.0) == 30000.0);
    }
}

TEST_CASE("growth mode string conversion", "[parameters][salary]") {
    REQUIRE(growth_mode_from_string("percent") == GrowthMode::Percentage);
    REQUIRE(growth_mode_from_string("fixed") == GrowthMode::FixedAmount);
    REQUIRE(growth_mode_to_string(GrowthMode::Percentage) == "percent");
    REQUIRE(growth_mode_to_string(GrowthMode::FixedAmount) == "fixed");
    REQUIRE_THROWS_AS(growth_mode_from_string("compound"), std::invalid_argument);
}

TEST_CASE("RepaymentRule charges income above threshold", "[parameters][repayment]") {
    RepaymentRule rule;

    SECTION("Below threshold repays nothing") {
        REQUIRE(rule.annual_repayment(20000.0) == 0.0);
        REQUIRE(rule.annual_repayment(27295.0) == 0.0);
    }

    SECTION("Above threshold") {
        REQUIRE(rule.annual_repayment(30000.0) == Approx((30000.0 - 27295.0) * 0.09));
    }

    SECTION("Monthly figure is the annual figure over 12") {
        REQUIRE(rule.monthly_repayment(30000.0) == Approx((30000.0 - 27295.0) * 0.09 / 12.0));
    }

    SECTION("Custom threshold and rate") {
        RepaymentRule custom(20000.0, 0.06);
        REQUIRE(custom.annual_repayment(25000.0) == Approx(300.0));
    }
}

TEST_CASE("RepaymentPlan defaults to no extra payments", "[parameters][plan]") {
    RepaymentPlan plan;
    REQUIRE(plan.upfront == 0.0);
    REQUIRE(plan.monthly_fixed == 0.0);
    REQUIRE(plan == RepaymentPlan(0.0, 0.0));
    REQUIRE_FALSE(plan == RepaymentPlan(100.0, 0.0));
}

TEST_CASE("LoanParameters::validate", "[parameters][validation]") {
    SECTION("Valid parameters report no problems") {
        REQUIRE(make_valid_parameters().validate().empty());
    }

    SECTION("Write-off on or before start") {
        LoanParameters params = make_valid_parameters();
        params.write_off_date = params.start_date;
        REQUIRE(mentions(params.validate(), "write-off date must be after start date"));
    }

    SECTION("Negative amounts") {
        LoanParameters params = make_valid_parameters();
        params.principal = -1.0;
        params.initial_salary = -1.0;
        auto problems = params.validate();
        REQUIRE(mentions(problems, "principal"));
        REQUIRE(mentions(problems, "initial salary"));
    }

    SECTION("Repayment rate out of range") {
        LoanParameters params = make_valid_parameters();
        params.repayment_rule.rate = 1.5;
        REQUIRE(mentions(params.validate(), "repayment rate"));
    }

    SECTION("Impossible date") {
        LoanParameters params = make_valid_parameters();
        params.start_date = Date(2023, 2, 30);
        REQUIRE(mentions(params.validate(), "start date"));
    }
}
