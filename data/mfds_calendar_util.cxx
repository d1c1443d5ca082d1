#include "mfds_calendar_util.h"
#include "mfds_common.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

// **************************************************************************
std::ostream &operator<<(std::ostream &os, const mfds_date &date)
{
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << "-"
        << std::setw(2) << date.month << "-" << std::setw(2) << date.day
        << " " << std::setw(2) << date.hour << ":" << std::setw(2)
        << date.minute << ":" << std::setw(2) << long(date.second);
    os << oss.str();
    return os;
}

namespace mfds_calendar_util
{
// **************************************************************************
bool is_leap_year(int year)
{
    return ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
}

// **************************************************************************
int days_in_month(int year, int month)
{
    static const int dpm[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if ((month < 1) || (month > 12))
        return 0;
    return dpm[month-1] + (((month == 2) && is_leap_year(year)) ? 1 : 0);
}

// **************************************************************************
long days_from_civil(int year, int month, int day)
{
    // see H. Hinnant, chrono-Compatible Low-Level Date Algorithms
    long y = month <= 2 ? year - 1 : year;
    long era = (y >= 0 ? y : y - 399)/400;
    long yoe = y - era*400;
    long mp = month > 2 ? month - 3 : month + 9;
    long doy = (153*mp + 2)/5 + day - 1;
    long doe = yoe*365 + yoe/4 - yoe/100 + doy;
    return era*146097 + doe - 719468;
}

// **************************************************************************
void civil_from_days(long days, int &year, int &month, int &day)
{
    days += 719468;
    long era = (days >= 0 ? days : days - 146096)/146097;
    long doe = days - era*146097;
    long yoe = (doe - doe/1460 + doe/36524 - doe/146096)/365;
    long doy = doe - (365*yoe + yoe/4 - yoe/100);
    long mp = (5*doy + 2)/153;
    day = doy - (153*mp + 2)/5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = yoe + era*400 + (month <= 2 ? 1 : 0);
}

// **************************************************************************
int day_of_year_to_date(int year, int doy, int &month, int &day)
{
    int n_days = is_leap_year(year) ? 366 : 365;
    if ((doy < 1) || (doy > n_days))
        return -1;

    month = 1;
    int dim = days_in_month(year, month);
    while (doy > dim)
    {
        doy -= dim;
        ++month;
        dim = days_in_month(year, month);
    }
    day = doy;

    return 0;
}

// **************************************************************************
int validate(const mfds_date &date, std::string &errstr)
{
    std::ostringstream oss;
    if ((date.month < 1) || (date.month > 12))
        oss << "month " << date.month << " is out of range";
    else if ((date.day < 1) || (date.day > days_in_month(date.year, date.month)))
        oss << "day " << date.day << " is out of range for "
            << date.year << "-" << date.month;
    else if ((date.hour < 0) || (date.hour > 23))
        oss << "hour " << date.hour << " is out of range";
    else if ((date.minute < 0) || (date.minute > 59))
        oss << "minute " << date.minute << " is out of range";
    else if ((date.second < 0.0) || (date.second >= 61.0))
        oss << "second " << date.second << " is out of range";
    else
        return 0;

    errstr = oss.str();
    return -1;
}

// **************************************************************************
int parse_date(const std::string &text, mfds_date &date)
{
    int y = 0;
    int mo = 0;
    int d = 0;
    int h = 0;
    int mi = 0;
    double s = 0.0;
    char sep = ' ';

    int n = sscanf(text.c_str(), "%d-%d-%d%c%d:%d:%lf",
        &y, &mo, &d, &sep, &h, &mi, &s);

    if ((n < 3) || ((n > 3) && (sep != ' ') && (sep != 'T')) || (n == 5))
        return -1;

    date = mfds_date(y, mo, d, h, mi, s);

    std::string errstr;
    return validate(date, errstr);
}

// **************************************************************************
int parse_time_units(const std::string &units, double &unit_seconds,
    mfds_date &ref)
{
    size_t pos = units.find(" since ");
    if (pos == std::string::npos)
        return -1;

    std::string unit = units.substr(0, pos);
    size_t b = unit.find_first_not_of(' ');
    if (b == std::string::npos)
        return -1;
    unit = unit.substr(b);

    if ((unit == "seconds") || (unit == "second") || (unit == "secs")
        || (unit == "sec") || (unit == "s"))
        unit_seconds = 1.0;
    else if ((unit == "minutes") || (unit == "minute") || (unit == "mins")
        || (unit == "min"))
        unit_seconds = 60.0;
    else if ((unit == "hours") || (unit == "hour") || (unit == "hrs")
        || (unit == "hr") || (unit == "h"))
        unit_seconds = 3600.0;
    else if ((unit == "days") || (unit == "day") || (unit == "d"))
        unit_seconds = 86400.0;
    else
        return -1;

    return parse_date(units.substr(pos + 7), ref);
}

// **************************************************************************
bool is_standard_calendar(const std::string &calendar)
{
    std::string cal(calendar);
    std::transform(cal.begin(), cal.end(), cal.begin(),
        [](unsigned char c) { return std::tolower(c); });

    return cal.empty() || (cal == "standard") || (cal == "gregorian") ||
        (cal == "proleptic_gregorian");
}

// **************************************************************************
bool is_time_units(const std::string &units)
{
    double unit_seconds = 0.0;
    mfds_date ref;
    return parse_time_units(units, unit_seconds, ref) == 0;
}

// **************************************************************************
int date_to_value(const mfds_date &date, const std::string &units,
    double &value)
{
    double unit_seconds = 0.0;
    mfds_date ref;
    if (parse_time_units(units, unit_seconds, ref))
    {
        MFDS_ERROR("\"" << units << "\" are not valid time units")
        return -1;
    }

    double days = days_from_civil(date.year, date.month, date.day)
        - days_from_civil(ref.year, ref.month, ref.day);

    double secs = days*86400.0
        + (date.hour - ref.hour)*3600.0
        + (date.minute - ref.minute)*60.0
        + (date.second - ref.second);

    value = secs/unit_seconds;
    return 0;
}

// **************************************************************************
int value_to_date(double value, const std::string &units, mfds_date &date)
{
    double unit_seconds = 0.0;
    mfds_date ref;
    if (parse_time_units(units, unit_seconds, ref))
    {
        MFDS_ERROR("\"" << units << "\" are not valid time units")
        return -1;
    }

    // seconds since the start of the reference day, rounded to the
    // millisecond to absorb float error
    double secs = value*unit_seconds + ref.hour*3600.0 + ref.minute*60.0
        + ref.second;
    secs = std::round(secs*1000.0)/1000.0;

    double days = std::floor(secs/86400.0);
    secs -= days*86400.0;

    civil_from_days(days_from_civil(ref.year, ref.month, ref.day) + long(days),
        date.year, date.month, date.day);

    date.hour = int(secs/3600.0);
    secs -= date.hour*3600.0;
    date.minute = int(secs/60.0);
    date.second = secs - date.minute*60.0;

    return 0;
}
};
