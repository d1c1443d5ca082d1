#include "mfds_numeric_coordinate.h"
#include "mfds_coordinate_util.h"
#include "mfds_key.h"
#include "mfds_common.h"
#include "mfds_binary_stream.h"

#include <algorithm>
#include <ostream>

// --------------------------------------------------------------------------
p_mfds_numeric_coordinate mfds_numeric_coordinate::New(
    const std::string &name, const std::string &units)
{
    p_mfds_numeric_coordinate coord = mfds_numeric_coordinate::New();
    coord->set_name(name);
    coord->set_units(units);
    return coord;
}

// --------------------------------------------------------------------------
p_mfds_coordinate mfds_numeric_coordinate::new_copy() const
{
    return p_mfds_numeric_coordinate(new mfds_numeric_coordinate(*this));
}

// --------------------------------------------------------------------------
int mfds_numeric_coordinate::set_values(const std::vector<double> &values)
{
    size_t bad_id = 0;
    if (mfds_coordinate_util::check_strictly_increasing(values,
        m_tolerance, bad_id))
    {
        MFDS_ERROR("The values of coordinate \"" << m_name << "\" are not"
            " strictly increasing at index " << bad_id << ", "
            << values[bad_id-1] << " followed by " << values[bad_id])
        return -1;
    }

    m_values = values;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_numeric_coordinate::get_index(double value, long &idx, int loc) const
{
    if (mfds_coordinate_util::index_of(m_values, value, loc, m_tolerance, idx))
    {
        MFDS_ERROR("Value " << value << " is outside of coordinate \""
            << m_name << "\"")
        return -1;
    }
    return 0;
}

// --------------------------------------------------------------------------
int mfds_numeric_coordinate::subset(double vmin, double vmax,
    mfds_key &key) const
{
    if (vmin > vmax)
        std::swap(vmin, vmax);

    long i0 = 0;
    long i1 = 0;
    if (mfds_coordinate_util::index_of(m_values, vmin, above, m_tolerance, i0)
        || mfds_coordinate_util::index_of(m_values, vmax, below, m_tolerance, i1)
        || (i1 < i0))
    {
        MFDS_ERROR("No value of coordinate \"" << m_name << "\" is in the"
            " range [" << vmin << ", " << vmax << "]")
        return -1;
    }

    key = mfds_key(i0, i1 + 1, 1);
    key.set_parent_size(m_values.size());
    return 0;
}

// --------------------------------------------------------------------------
void mfds_numeric_coordinate::to_stream(mfds_binary_stream &bs) const
{
    this->mfds_coordinate::to_stream(bs);
    bs.pack(m_values);
}

// --------------------------------------------------------------------------
int mfds_numeric_coordinate::from_stream(mfds_binary_stream &bs)
{
    if (this->mfds_coordinate::from_stream(bs))
        return -1;
    bs.unpack(m_values);
    return 0;
}

// --------------------------------------------------------------------------
void mfds_numeric_coordinate::print(std::ostream &os) const
{
    os << m_name;
    if (!m_units.empty())
        os << " (" << m_units << ")";
    long n = m_values.size();
    os << ": " << n << " values";
    if (n)
        os << " from " << m_values[0] << " to " << m_values[n-1];
}



// --------------------------------------------------------------------------
p_mfds_time_coordinate mfds_time_coordinate::New(const std::string &name,
    const std::string &units)
{
    p_mfds_time_coordinate coord = mfds_time_coordinate::New();
    coord->set_name(name);
    coord->set_units(units);
    return coord;
}

// --------------------------------------------------------------------------
p_mfds_coordinate mfds_time_coordinate::new_copy() const
{
    return p_mfds_time_coordinate(new mfds_time_coordinate(*this));
}

// --------------------------------------------------------------------------
int mfds_time_coordinate::get_value_of_date(const mfds_date &date,
    double &value) const
{
    return mfds_calendar_util::date_to_value(date, m_units, value);
}

// --------------------------------------------------------------------------
int mfds_time_coordinate::get_date(long i, mfds_date &date) const
{
    long n = m_values.size();
    if ((i < 0) || (i >= n))
    {
        MFDS_ERROR("Index " << i << " is out of bounds of \"" << m_name << "\"")
        return -1;
    }

    return mfds_calendar_util::value_to_date(m_values[i], m_units, date);
}

// --------------------------------------------------------------------------
int mfds_time_coordinate::get_index_of_date(const mfds_date &date,
    long &idx, int loc) const
{
    double value = 0.0;
    if (this->get_value_of_date(date, value))
        return -1;

    return this->get_index(value, idx, loc);
}

// --------------------------------------------------------------------------
void mfds_time_coordinate::print(std::ostream &os) const
{
    os << m_name << " (" << m_units << "): " << m_values.size() << " values";

    mfds_date first;
    mfds_date last;
    if (!m_values.empty() && !this->get_date(0, first)
        && !this->get_date(m_values.size() - 1, last))
        os << " from " << first << " to " << last;
}
