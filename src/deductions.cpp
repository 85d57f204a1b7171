#include "deductions.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace loancalc {

// ============================================================================
// Band Implementation
// ============================================================================

Band::Band() : upper_bound(0.0), rate(0.0) {}

Band::Band(double upper, double r) : upper_bound(upper), rate(r) {}

bool Band::unbounded() const {
    return std::isinf(upper_bound);
}

bool Band::operator==(const Band& other) const {
    return upper_bound == other.upper_bound && rate == other.rate;
}

// ============================================================================
// BandSchedule Implementation
// ============================================================================

BandSchedule::BandSchedule() = default;

BandSchedule::BandSchedule(const std::vector<Band>& bands) {
    bands_.reserve(bands.size());
    for (const Band& band : bands) {
        add_band(band.upper_bound, band.rate);
    }
}

void BandSchedule::add_band(double upper_bound, double rate) {
    if (std::isnan(upper_bound) || std::isnan(rate)) {
        throw std::invalid_argument("Band bound and rate must be numbers");
    }
    if (rate < 0.0) {
        throw std::invalid_argument("Band rate must be non-negative");
    }
    if (upper_bound <= 0.0) {
        throw std::invalid_argument("Band upper bound must be positive");
    }
    if (!bands_.empty()) {
        if (bands_.back().unbounded()) {
            throw std::invalid_argument("Cannot add a band after an unbounded band");
        }
        if (upper_bound <= bands_.back().upper_bound) {
            throw std::invalid_argument("Band upper bounds must be strictly ascending");
        }
    }
    bands_.emplace_back(upper_bound, rate);
}

double BandSchedule::apply(double annual_income) const {
    double total = 0.0;
    double previous_bound = 0.0;
    double remaining = annual_income;

    for (const Band& band : bands_) {
        double taxable = std::min(band.upper_bound - previous_bound, remaining);
        if (taxable <= 0.0) {
            break;
        }
        total += taxable * band.rate;
        remaining -= taxable;
        previous_bound = band.upper_bound;
    }

    return total;
}

bool BandSchedule::operator==(const BandSchedule& other) const {
    return bands_ == other.bands_;
}

BandSchedule BandSchedule::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open band schedule file: " + filepath);
    }
    return load_from_csv(file);
}

BandSchedule BandSchedule::load_from_csv(std::istream& is) {
    BandSchedule schedule;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw std::runtime_error("Band schedule CSV requires columns: upper_bound,rate (line " +
                                     std::to_string(reader.line_number()) + ")");
        }

        std::string bound_text = row[0];
        std::transform(bound_text.begin(), bound_text.end(), bound_text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        double upper = (bound_text == "inf" || bound_text == "infinity")
            ? UNBOUNDED
            : std::stod(row[0]);
        double rate = std::stod(row[1]);

        schedule.add_band(upper, rate);
    }

    if (schedule.empty()) {
        throw std::runtime_error("Band schedule CSV contains no bands");
    }

    return schedule;
}

// ============================================================================
// DeductionRules Implementation
// ============================================================================

DeductionRules::DeductionRules()
    : income_tax_bands(uk_income_tax_2023_24()),
      social_insurance_bands(uk_national_insurance_2023_24()) {}

DeductionRules::DeductionRules(BandSchedule tax, BandSchedule insurance)
    : income_tax_bands(std::move(tax)),
      social_insurance_bands(std::move(insurance)) {}

double DeductionRules::income_tax(double gross_annual_salary) const {
    return income_tax_bands.apply(gross_annual_salary);
}

double DeductionRules::social_insurance(double gross_annual_salary) const {
    return social_insurance_bands.apply(gross_annual_salary);
}

double DeductionRules::net_salary(double gross_annual_salary) const {
    return gross_annual_salary
        - income_tax(gross_annual_salary)
        - social_insurance(gross_annual_salary);
}

BandSchedule DeductionRules::uk_income_tax_2023_24() {
    return BandSchedule({
        Band(12570.0, 0.0),
        Band(50270.0, 0.20),
        Band(125140.0, 0.40),
        Band(BandSchedule::UNBOUNDED, 0.45)
    });
}

BandSchedule DeductionRules::uk_national_insurance_2023_24() {
    return BandSchedule({
        Band(12570.0, 0.0),
        Band(50270.0, 0.12),
        Band(BandSchedule::UNBOUNDED, 0.02)
    });
}

DeductionRules DeductionRules::uk_2023_24() {
    return DeductionRules(uk_income_tax_2023_24(), uk_national_insurance_2023_24());
}

double income_tax(double gross_annual_salary) {
    static const BandSchedule bands = DeductionRules::uk_income_tax_2023_24();
    return bands.apply(gross_annual_salary);
}

double social_insurance(double gross_annual_salary) {
    static const BandSchedule bands = DeductionRules::uk_national_insurance_2023_24();
    return bands.apply(gross_annual_salary);
}

} // namespace loancalc
