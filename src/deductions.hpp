#ifndef LOANCALC_DEDUCTIONS_HPP
#define LOANCALC_DEDUCTIONS_HPP

#include <istream>
#include <limits>
#include <string>
#include <vector>

namespace loancalc {

// One band of a progressive schedule: income up to upper_bound
// (above the previous band's bound) is charged at rate.
struct Band {
    double upper_bound;
    double rate;

    Band();
    Band(double upper, double r);

    bool unbounded() const;
    bool operator==(const Band& other) const;
};

// Ordered progressive schedule used for income tax and social insurance.
// Bands are stored in ascending order of upper bound; the last band may be
// unbounded (upper_bound = +infinity).
class BandSchedule {
public:
    static constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

    BandSchedule();
    explicit BandSchedule(const std::vector<Band>& bands);

    // Append a band. Throws std::invalid_argument if the upper bound does not
    // exceed the previous one, the rate is negative, or the schedule is
    // already closed by an unbounded band.
    void add_band(double upper_bound, double rate);

    // Total charge on an annual income
    double apply(double annual_income) const;

    const std::vector<Band>& bands() const { return bands_; }
    size_t size() const { return bands_.size(); }
    bool empty() const { return bands_.empty(); }

    bool operator==(const BandSchedule& other) const;

    // Load from CSV: expects columns upper_bound,rate ("inf" for the open band)
    static BandSchedule load_from_csv(const std::string& filepath);
    static BandSchedule load_from_csv(std::istream& is);

private:
    std::vector<Band> bands_;
};

// Statutory deductions taken from gross salary
struct DeductionRules {
    BandSchedule income_tax_bands;
    BandSchedule social_insurance_bands;

    DeductionRules();
    DeductionRules(BandSchedule tax, BandSchedule insurance);

    double income_tax(double gross_annual_salary) const;
    double social_insurance(double gross_annual_salary) const;

    // Gross salary less income tax and social insurance
    double net_salary(double gross_annual_salary) const;

    // UK 2023-24: personal allowance 12,570, basic 20% to 50,270,
    // higher 40% to 125,140, additional 45%; NI 12% to 50,270 then 2%
    static BandSchedule uk_income_tax_2023_24();
    static BandSchedule uk_national_insurance_2023_24();
    static DeductionRules uk_2023_24();
};

// Convenience wrappers over the default UK 2023-24 tables
double income_tax(double gross_annual_salary);
double social_insurance(double gross_annual_salary);

} // namespace loancalc

#endif // LOANCALC_DEDUCTIONS_HPP
