#ifndef mfds_calendar_util_h
#define mfds_calendar_util_h

/// @file

#include "mfds_config.h"

#include <iosfwd>
#include <string>

/// A calendar date, the default is 1970-01-01 12:00:00
struct MFDS_EXPORT mfds_date
{
    mfds_date() : year(1970), month(1), day(1),
        hour(12), minute(0), second(0.0) {}

    mfds_date(int y, int mo, int d, int h = 0, int mi = 0, double s = 0.0) :
        year(y), month(mo), day(d), hour(h), minute(mi), second(s) {}

    bool operator==(const mfds_date &o) const
    {
        return (year == o.year) && (month == o.month) && (day == o.day) &&
            (hour == o.hour) && (minute == o.minute) && (second == o.second);
    }

    int year;
    int month;
    int day;
    int hour;
    int minute;
    double second;
};

/// send the date to the stream as YYYY-MM-DD hh:mm:ss
MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_date &date);

/** Codes dealing with dates in the standard calendar (proleptic Gregorian)
 * and CF style time units, eg. "hours since 2000-01-01 00:00:00".
 */
namespace mfds_calendar_util
{
/// returns true if year is a leap year
MFDS_EXPORT
bool is_leap_year(int year);

/// returns the number of days in the month (1-12) of the year
MFDS_EXPORT
int days_in_month(int year, int month);

/// returns the number of days between 1970-01-01 and the date
MFDS_EXPORT
long days_from_civil(int year, int month, int day);

/// the inverse of days_from_civil
MFDS_EXPORT
void civil_from_days(long days, int &year, int &month, int &day);

/** convert the day of the year (1-366) to a month and day. returns non-zero
 * if the day is out of range.
 */
MFDS_EXPORT
int day_of_year_to_date(int year, int doy, int &month, int &day);

/** validate the fields of the date. returns non-zero and an error message
 * if a field is out of range.
 */
MFDS_EXPORT
int validate(const mfds_date &date, std::string &errstr);

/** parse a date written as YYYY-MM-DD[ hh:mm[:ss]] or YYYY-MM-DDThh:mm:ss.
 * returns non-zero if the text is not a date.
 */
MFDS_EXPORT
int parse_date(const std::string &text, mfds_date &date);

/** parse CF style time units "<unit> since <date>". unit is one of
 * seconds, minutes, hours or days (singular forms and common abbreviations
 * are accepted). the length of one unit in seconds and the reference date
 * are returned. returns non-zero if the units are not time units.
 */
MFDS_EXPORT
int parse_time_units(const std::string &units, double &unit_seconds,
    mfds_date &ref);

/** returns true if the CF calendar name is one of standard, gregorian,
 * proleptic_gregorian, or empty. dates before 1582-10-15 are treated as
 * proleptic Gregorian in every one of them.
 */
MFDS_EXPORT
bool is_standard_calendar(const std::string &calendar);

/// returns true if the units are CF style time units
MFDS_EXPORT
bool is_time_units(const std::string &units);

/// convert a date to a value in the given time units
MFDS_EXPORT
int date_to_value(const mfds_date &date, const std::string &units,
    double &value);

/// convert a value in the given time units to a date
MFDS_EXPORT
int value_to_date(double value, const std::string &units, mfds_date &date);
};

#endif
