#include "date.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace premium {

namespace {

constexpr int MIN_YEAR = 1800;
constexpr int MAX_YEAR = 9999;

int parse_digits(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            throw std::invalid_argument("Invalid date '" + text + "': expected YYYY-MM-DD");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // anonymous namespace

CalendarDate::CalendarDate()
    : year(1970), month(1), day(1) {}

CalendarDate::CalendarDate(int y, int m, int d)
    : year(y), month(m), day(d) {
    if (!is_valid(y, m, d)) {
        std::ostringstream oss;
        oss << "Invalid calendar date " << y << "-" << m << "-" << d;
        throw std::invalid_argument(oss.str());
    }
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool CalendarDate::operator!=(const CalendarDate& other) const {
    return !(*this == other);
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

std::string CalendarDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    return oss.str();
}

CalendarDate CalendarDate::parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date '" + text + "': expected YYYY-MM-DD");
    }

    int y = parse_digits(text, 0, 4);
    int m = parse_digits(text, 5, 2);
    int d = parse_digits(text, 8, 2);

    if (!is_valid(y, m, d)) {
        throw std::invalid_argument("Invalid date '" + text + "': no such calendar day");
    }
    return CalendarDate(y, m, d);
}

CalendarDate CalendarDate::today() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif

    return CalendarDate(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
}

bool CalendarDate::is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int CalendarDate::days_in_month(int y, int m) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) {
        throw std::out_of_range("Month " + std::to_string(m) + " must be between 1 and 12");
    }
    if (m == 2 && is_leap_year(y)) {
        return 29;
    }
    return DAYS[m - 1];
}

bool CalendarDate::is_valid(int y, int m, int d) {
    if (y < MIN_YEAR || y > MAX_YEAR) return false;
    if (m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

int age_on(const CalendarDate& date_of_birth, const CalendarDate& on) {
    if (on < date_of_birth) {
        throw std::invalid_argument("Date of birth " + date_of_birth.to_string() +
                                    " is after " + on.to_string());
    }

    int years = on.year - date_of_birth.year;

    // Birthday not reached yet this year. A 29 February birthday is
    // reached on 1 March in non-leap years.
    if (on.month < date_of_birth.month ||
        (on.month == date_of_birth.month && on.day < date_of_birth.day)) {
        --years;
    }
    return years;
}

} // namespace premium
