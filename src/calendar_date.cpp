#include "calendar_date.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace loancalc {

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, uint8_t m, uint8_t d) : year(y), month(m), day(d) {}

bool Date::is_valid() const {
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

Date Date::parse(const std::string& text) {
    // Expect exactly YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date '" + text + "': expected YYYY-MM-DD");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid date '" + text + "': expected YYYY-MM-DD");
        }
    }

    int y = std::stoi(text.substr(0, 4));
    int m = std::stoi(text.substr(5, 2));
    int d = std::stoi(text.substr(8, 2));

    if (m < 1 || m > 12) {
        throw std::invalid_argument("Invalid date '" + text + "': month out of range");
    }
    Date date(y, static_cast<uint8_t>(m), static_cast<uint8_t>(d));
    if (!date.is_valid()) {
        throw std::invalid_argument("Invalid date '" + text + "': day out of range");
    }
    return date;
}

std::string Date::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << static_cast<int>(month) << "-"
        << std::setw(2) << static_cast<int>(day);
    return oss.str();
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

bool Date::operator>(const Date& other) const {
    return other < *this;
}

bool Date::operator>=(const Date& other) const {
    return !(*this < other);
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

uint8_t days_in_month(int year, uint8_t month) {
    static const uint8_t kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 1 and 12");
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

Date last_day_of_next_month(const Date& date) {
    uint8_t next_month = static_cast<uint8_t>(date.month % 12 + 1);
    int next_year = next_month > date.month ? date.year : date.year + 1;
    return Date(next_year, next_month, days_in_month(next_year, next_month));
}

} // namespace loancalc
