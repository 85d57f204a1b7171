#ifndef LOANCALC_CALENDAR_DATE_HPP
#define LOANCALC_CALENDAR_DATE_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace loancalc {

// Gregorian calendar date. Months and days are 1-based.
struct Date {
    int year;
    uint8_t month;
    uint8_t day;

    Date();
    Date(int y, uint8_t m, uint8_t d);

    bool is_valid() const;

    // Parse ISO-8601 "YYYY-MM-DD"; throws std::invalid_argument on bad input
    static Date parse(const std::string& text);

    // Format as "YYYY-MM-DD"
    std::string to_string() const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
    bool operator>(const Date& other) const;
    bool operator>=(const Date& other) const;
};

std::ostream& operator<<(std::ostream& os, const Date& date);

bool is_leap_year(int year);

// Number of days in the given month (1-12) of the given year
uint8_t days_in_month(int year, uint8_t month);

// Last calendar day of the month following the given date.
// December rolls over into January of the next year.
Date last_day_of_next_month(const Date& date);

} // namespace loancalc

#endif // LOANCALC_CALENDAR_DATE_HPP
