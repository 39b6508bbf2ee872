#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace salescast {

/**
 * Date that could not be parsed as a calendar date
 */
class DateParseError : public std::runtime_error {
public:
    explicit DateParseError(const std::string& message)
        : std::runtime_error(message) {}
};

struct CalendarDate {
    int year = 1970;
    int month = 1;   // 1-12
    int day = 1;     // 1-31

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

/**
 * Parse a date string into a Unix timestamp (UTC).
 * Accepted: raw Unix timestamp, yyyy-mm-dd [HH:MM:SS], dd/mm/yyyy,
 * dd month yyyy (FR/EN month names). Throws DateParseError.
 */
int64_t convertDateToTimestamp(const std::string& dateString);

/// Calendar date of a date string (see convertDateToTimestamp)
CalendarDate parseDate(const std::string& dateString);

CalendarDate dateFromTimestamp(int64_t timestamp);

int daysInMonth(int year, int month);

/// Last day of the month containing `date`
CalendarDate monthEnd(const CalendarDate& date);

/// Month end `months` months after the month of `date`
CalendarDate addMonths(const CalendarDate& date, int months);

/// Months since year 0, for month arithmetic
int monthIndex(const CalendarDate& date);

/// yyyy-mm-dd
std::string formatDate(const CalendarDate& date);

int quarterOf(const CalendarDate& date);

/// "2024Q3"
std::string quarterLabel(const CalendarDate& date);

} // namespace salescast
