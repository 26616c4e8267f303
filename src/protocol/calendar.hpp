#ifndef KEYGATE_PROTOCOL_CALENDAR_HPP
#define KEYGATE_PROTOCOL_CALENDAR_HPP

#include <functional>
#include <stdexcept>
#include <string>

namespace protocol {

class CalendarError : public std::runtime_error {
public:
    explicit CalendarError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// CalendarDate - proleptic Gregorian date, year 1..9999
// -----------------------------------------------------------------------------
struct CalendarDate {
    int year  = 1970;
    int month = 1;   // 1..12
    int day   = 1;   // 1..days_in_month(year, month)

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

// Callable that supplies "today" to the validator.
using DateSource = std::function<CalendarDate()>;

bool is_leap_year(int year);
int days_in_month(int year, int month);
bool is_valid_date(int year, int month, int day);

// Checked construction. Throws CalendarError on an out-of-range field.
CalendarDate make_date(int year, int month, int day);

// Zero-padded "YYYY-MM-DD".
std::string to_string(const CalendarDate& date);

// Strict "YYYY-MM-DD" parser. Throws CalendarError.
CalendarDate parse_date(const std::string& text);

CalendarDate next_day(const CalendarDate& date);
CalendarDate previous_day(const CalendarDate& date);

// Host local date at the moment of the call.
CalendarDate local_today();

} // namespace protocol

#endif // KEYGATE_PROTOCOL_CALENDAR_HPP
