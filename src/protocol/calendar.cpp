#include "calendar.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace protocol {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw CalendarError("Month out of range: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

bool is_valid_date(int year, int month, int day) {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= days_in_month(year, month);
}

CalendarDate make_date(int year, int month, int day) {
    if (!is_valid_date(year, month, day)) {
        throw CalendarError("Invalid calendar date: " + std::to_string(year) + "-" +
                            std::to_string(month) + "-" + std::to_string(day));
    }
    CalendarDate d;
    d.year = year;
    d.month = month;
    d.day = day;
    return d;
}

std::string to_string(const CalendarDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << "-"
        << std::setw(2) << date.month << "-"
        << std::setw(2) << date.day;
    return oss.str();
}

CalendarDate parse_date(const std::string& text) {
    // YYYY-MM-DD, digits only apart from the two dashes
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw CalendarError("Expected date in YYYY-MM-DD format, got '" + text + "'");
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (text[i] < '0' || text[i] > '9') {
            throw CalendarError("Expected date in YYYY-MM-DD format, got '" + text + "'");
        }
    }
    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));
    return make_date(year, month, day);
}

CalendarDate next_day(const CalendarDate& date) {
    CalendarDate d = make_date(date.year, date.month, date.day);
    if (d.day < days_in_month(d.year, d.month)) {
        ++d.day;
        return d;
    }
    d.day = 1;
    if (d.month < 12) {
        ++d.month;
        return d;
    }
    d.month = 1;
    if (d.year == 9999) {
        throw CalendarError("Date overflow past 9999-12-31");
    }
    ++d.year;
    return d;
}

CalendarDate previous_day(const CalendarDate& date) {
    CalendarDate d = make_date(date.year, date.month, date.day);
    if (d.day > 1) {
        --d.day;
        return d;
    }
    if (d.month > 1) {
        --d.month;
    } else {
        if (d.year == 1) {
            throw CalendarError("Date underflow before 0001-01-01");
        }
        --d.year;
        d.month = 12;
    }
    d.day = days_in_month(d.year, d.month);
    return d;
}

CalendarDate local_today() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_local{};

#ifdef _WIN32
    localtime_s(&tm_local, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_local);
#endif

    return make_date(tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday);
}

} // namespace protocol
