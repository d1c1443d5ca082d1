#include "mfds_coordinate_util.h"
#include "mfds_common.h"
#include "mfds_calendar_util.h"

#include <algorithm>
#include <mutex>
#include <sstream>

#if defined(MFDS_HAS_UDUNITS)
#include <udunits2.h>
#endif

namespace mfds_coordinate_util
{
// **************************************************************************
int check_strictly_increasing(const std::vector<double> &values,
    double tol, size_t &bad_id)
{
    size_t n = values.size();
    for (size_t i = 1; i < n; ++i)
    {
        if (values[i] - values[i-1] <= tol)
        {
            bad_id = i;
            return -1;
        }
    }
    return 0;
}

// **************************************************************************
int index_of(const std::vector<double> &values, double val, double tol,
    long &id)
{
    std::vector<double>::const_iterator it =
        std::lower_bound(values.begin(), values.end(), val - tol);

    if ((it == values.end()) || !equal_tol(*it, val, tol))
        return -1;

    id = it - values.begin();
    return 0;
}

// **************************************************************************
int index_of(const std::vector<double> &values, double val, int loc,
    double tol, long &id)
{
    long n = values.size();
    if (n < 1)
        return -1;

    if (!index_of(values, val, tol, id))
        return 0;

    // first element above the value
    long above = std::upper_bound(values.begin(), values.end(), val)
        - values.begin();
    long below = above - 1;

    if (loc == 1)
    {
        if (below < 0)
            return -1;
        id = below;
    }
    else if (loc == 2)
    {
        if (above >= n)
            return -1;
        id = above;
    }
    else
    {
        if (below < 0)
            id = 0;
        else if (above >= n)
            id = n - 1;
        else
            id = (val - values[below]) <= (values[above] - val) ? below : above;
    }

    return 0;
}

// **************************************************************************
std::vector<double> merge_union(const std::vector<double> &a,
    const std::vector<double> &b, double tol)
{
    std::vector<double> out;
    out.reserve(a.size() + b.size());

    size_t i = 0;
    size_t j = 0;
    size_t na = a.size();
    size_t nb = b.size();
    while ((i < na) || (j < nb))
    {
        if ((j >= nb) || ((i < na) && (a[i] < b[j] - tol)))
        {
            out.push_back(a[i]);
            ++i;
        }
        else if ((i >= na) || (b[j] < a[i] - tol))
        {
            out.push_back(b[j]);
            ++j;
        }
        else
        {
            out.push_back(a[i]);
            ++i;
            ++j;
        }
    }

    return out;
}

// **************************************************************************
std::vector<double> merge_intersection(const std::vector<double> &a,
    const std::vector<double> &b, double tol)
{
    std::vector<double> out;

    size_t i = 0;
    size_t j = 0;
    size_t na = a.size();
    size_t nb = b.size();
    while ((i < na) && (j < nb))
    {
        if (a[i] < b[j] - tol)
        {
            ++i;
        }
        else if (b[j] < a[i] - tol)
        {
            ++j;
        }
        else
        {
            out.push_back(a[i]);
            ++i;
            ++j;
        }
    }

    return out;
}

// **************************************************************************
bool have_unit_conversion()
{
#if defined(MFDS_HAS_UDUNITS)
    return true;
#else
    return false;
#endif
}

#if defined(MFDS_HAS_UDUNITS)
namespace
{
// the unit system is loaded once and shared, udunits is not thread safe
std::mutex &get_udunits_mutex()
{
    static std::mutex udunits_mutex;
    return udunits_mutex;
}

ut_system *get_unit_system()
{
    static ut_system *sys = nullptr;
    if (!sys)
    {
        ut_set_error_message_handler(ut_ignore);
        sys = ut_read_xml(nullptr);
    }
    return sys;
}
}
#endif

// **************************************************************************
int convert_units(const std::string &from, const std::string &to,
    std::vector<double> &values, std::string &errstr)
{
    // time units in the standard calendar are handled directly
    double from_secs = 0.0;
    double to_secs = 0.0;
    mfds_date from_ref;
    mfds_date to_ref;
    if (!mfds_calendar_util::parse_time_units(from, from_secs, from_ref) &&
        !mfds_calendar_util::parse_time_units(to, to_secs, to_ref))
    {
        double offset = 0.0;
        if (mfds_calendar_util::date_to_value(from_ref, to, offset))
        {
            errstr = "Failed to convert the reference date of \""
                + from + "\" to \"" + to + "\"";
            return -1;
        }

        size_t n = values.size();
        for (size_t i = 0; i < n; ++i)
            values[i] = values[i]*from_secs/to_secs + offset;

        return 0;
    }

#if defined(MFDS_HAS_UDUNITS)
    std::lock_guard<std::mutex> lock(get_udunits_mutex());

    ut_system *sys = get_unit_system();
    if (!sys)
    {
        errstr = "Failed to load the UDUnits unit system";
        return -1;
    }

    ut_unit *ufrom = ut_parse(sys, from.c_str(), UT_UTF8);
    if (!ufrom)
    {
        errstr = "Failed to parse units \"" + from + "\"";
        return -1;
    }

    ut_unit *uto = ut_parse(sys, to.c_str(), UT_UTF8);
    if (!uto)
    {
        ut_free(ufrom);
        errstr = "Failed to parse units \"" + to + "\"";
        return -1;
    }

    cv_converter *conv = ut_get_converter(ufrom, uto);
    if (!conv)
    {
        ut_free(ufrom);
        ut_free(uto);
        errstr = "Units \"" + from + "\" can not be converted to \"" + to + "\"";
        return -1;
    }

    size_t n = values.size();
    cv_convert_doubles(conv, values.data(), n, values.data());

    cv_free(conv);
    ut_free(ufrom);
    ut_free(uto);

    return 0;
#else
    (void)values;
    errstr = "Converting \"" + from + "\" to \"" + to
        + "\" requires UDUnits, which was not found at build time";
    return -1;
#endif
}
};
