#ifndef PREMIUM_DATE_HPP
#define PREMIUM_DATE_HPP

#include <string>

namespace premium {

// Gregorian calendar date without time zone
struct CalendarDate {
    int year;
    int month;  // 1-12
    int day;    // 1-31

    CalendarDate();
    CalendarDate(int y, int m, int d);

    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const;
    bool operator<(const CalendarDate& other) const;

    // ISO-8601 "YYYY-MM-DD"
    std::string to_string() const;

    // Strict ISO-8601 calendar date parsing ("YYYY-MM-DD", zero padded).
    // Throws std::invalid_argument for malformed or impossible dates.
    static CalendarDate parse(const std::string& text);

    // Current date in the local time zone
    static CalendarDate today();

    static bool is_leap_year(int year);
    static int days_in_month(int year, int month);
    static bool is_valid(int year, int month, int day);
};

// Age in completed years on the given date.
// Throws std::invalid_argument if date_of_birth is after on.
int age_on(const CalendarDate& date_of_birth, const CalendarDate& on);

} // namespace premium

#endif // PREMIUM_DATE_HPP
