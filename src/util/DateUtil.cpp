#include "util/DateUtil.hpp"
#include <sstream>
#include <iomanip>
#include <map>
#include <cctype>
#include <ctime>

namespace salescast {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int toInt(const std::string& text, const std::string& dateString) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::logic_error&) {
        throw DateParseError("Unable to parse date: '" + dateString + "'");
    }
    if (pos != text.size()) {
        throw DateParseError("Unable to parse date: '" + dateString + "'");
    }
    return value;
}

bool isAllDigits(const std::string& s) {
    size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// yyyymmdd sur 8 chiffres, seulement si c'est une date réelle
bool parseCompactDate(const std::string& s, int& year, int& month, int& day) {
    if (s.size() != 8 || s[0] == '-') return false;
    int y = std::stoi(s.substr(0, 4));
    int m = std::stoi(s.substr(4, 2));
    int d = std::stoi(s.substr(6, 2));
    if (y < 1000 || m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) return false;
    year = y;
    month = m;
    day = d;
    return true;
}

} // anonymous namespace

int64_t convertDateToTimestamp(const std::string& rawDate) {
    std::string dateString = rawDate;
    dateString.erase(0, dateString.find_first_not_of(" \t\r\n"));
    dateString.erase(dateString.find_last_not_of(" \t\r\n") + 1);

    if (dateString.empty()) {
        throw DateParseError("Empty date value");
    }

    int day = 0, month = 0, year = 0;
    int hour = 0, min = 0, sec = 0;

    // 1. Numeric: compact yyyymmdd, else raw Unix timestamp
    if (isAllDigits(dateString)) {
        if (!parseCompactDate(dateString, year, month, day)) {
            try {
                return std::stoll(dateString);
            } catch (const std::out_of_range&) {
                throw DateParseError("Date out of range: '" + dateString + "'");
            }
        }
    }
    // 2. ISO: yyyy-mm-dd [HH:MM:SS[.ffffff]]
    else if (dateString.size() >= 10 && dateString[4] == '-' && dateString[7] == '-') {
        year = toInt(dateString.substr(0, 4), dateString);
        month = toInt(dateString.substr(5, 2), dateString);
        day = toInt(dateString.substr(8, 2), dateString);

        if (dateString.size() > 10) {
            if (dateString.size() < 19 || (dateString[10] != ' ' && dateString[10] != 'T')) {
                throw DateParseError("Unable to parse date: '" + dateString + "'");
            }
            hour = toInt(dateString.substr(11, 2), dateString);
            min = toInt(dateString.substr(14, 2), dateString);
            sec = toInt(dateString.substr(17, 2), dateString);
            // Fractional seconds ignored
        }
    }
    // 3. Slash: dd/mm/yyyy or dd/mm/yy
    else if (dateString.find('/') != std::string::npos) {
        size_t pos1 = dateString.find('/');
        size_t pos2 = dateString.find('/', pos1 + 1);
        if (pos2 == std::string::npos) {
            throw DateParseError("Unable to parse date: '" + dateString + "'");
        }
        day = toInt(dateString.substr(0, pos1), dateString);
        month = toInt(dateString.substr(pos1 + 1, pos2 - pos1 - 1), dateString);
        std::string yearPart = dateString.substr(pos2 + 1);
        size_t space = yearPart.find(' ');
        if (space != std::string::npos) {
            yearPart = yearPart.substr(0, space);
        }
        year = toInt(yearPart, dateString);
        if (year < 100) {
            year += (year < 70) ? 2000 : 1900;
        }
    }
    // 4. Text: dd month yyyy (FR/EN with abbreviations)
    else if (dateString.find(' ') != std::string::npos) {
        static const std::map<std::string, int> months = {
            {"janvier", 1}, {"january", 1}, {"jan", 1},
            {"février", 2}, {"february", 2}, {"feb", 2}, {"fevrier", 2},
            {"mars", 3}, {"march", 3}, {"mar", 3},
            {"avril", 4}, {"april", 4}, {"apr", 4},
            {"mai", 5}, {"may", 5},
            {"juin", 6}, {"june", 6}, {"jun", 6},
            {"juillet", 7}, {"july", 7}, {"jul", 7},
            {"août", 8}, {"august", 8}, {"aug", 8}, {"aout", 8},
            {"septembre", 9}, {"september", 9}, {"sep", 9},
            {"octobre", 10}, {"october", 10}, {"oct", 10},
            {"novembre", 11}, {"november", 11}, {"nov", 11},
            {"décembre", 12}, {"december", 12}, {"dec", 12}, {"decembre", 12}
        };

        std::istringstream iss(dateString);
        std::string dayStr, monthStr, yearStr;
        iss >> dayStr >> monthStr >> yearStr;

        if (dayStr.empty() || monthStr.empty() || yearStr.empty()) {
            throw DateParseError("Unable to parse date: '" + dateString + "'");
        }

        day = toInt(dayStr, dateString);
        year = toInt(yearStr, dateString);

        std::string monthLower;
        for (char c : monthStr) {
            monthLower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        auto it = months.find(monthLower);
        if (it == months.end()) {
            throw DateParseError("Unknown month '" + monthStr + "' in date '" + dateString + "'");
        }
        month = it->second;
    } else {
        throw DateParseError("Unable to parse date: '" + dateString + "'");
    }

    // timegm normalise silencieusement le 30 février: on refuse avant
    if (year <= 0 || month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour < 0 || hour > 23 || min < 0 || min > 59 || sec < 0 || sec > 60) {
        throw DateParseError("Invalid calendar date: '" + dateString + "'");
    }

    struct tm timeinfo = {};
    timeinfo.tm_mday = day;
    timeinfo.tm_mon = month - 1;
    timeinfo.tm_year = year - 1900;
    timeinfo.tm_hour = hour;
    timeinfo.tm_min = min;
    timeinfo.tm_sec = sec;

    return static_cast<int64_t>(timegm(&timeinfo));
}

CalendarDate dateFromTimestamp(int64_t timestamp) {
    time_t t = static_cast<time_t>(timestamp);
    struct tm timeinfo = {};
    if (gmtime_r(&t, &timeinfo) == nullptr) {
        throw DateParseError("Timestamp out of range: " + std::to_string(timestamp));
    }
    return CalendarDate{timeinfo.tm_year + 1900, timeinfo.tm_mon + 1, timeinfo.tm_mday};
}

CalendarDate parseDate(const std::string& dateString) {
    return dateFromTimestamp(convertDateToTimestamp(dateString));
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

CalendarDate monthEnd(const CalendarDate& date) {
    return CalendarDate{date.year, date.month, daysInMonth(date.year, date.month)};
}

CalendarDate addMonths(const CalendarDate& date, int months) {
    int index = monthIndex(date) + months;
    int year = index / 12;
    int month = index % 12 + 1;
    return CalendarDate{year, month, daysInMonth(year, month)};
}

int monthIndex(const CalendarDate& date) {
    return date.year * 12 + (date.month - 1);
}

std::string formatDate(const CalendarDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day;
    return oss.str();
}

int quarterOf(const CalendarDate& date) {
    return (date.month - 1) / 3 + 1;
}

std::string quarterLabel(const CalendarDate& date) {
    return std::to_string(date.year) + "Q" + std::to_string(quarterOf(date));
}

} // namespace salescast
