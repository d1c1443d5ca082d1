#include "mfds_coordinate.h"
#include "mfds_numeric_coordinate.h"
#include "mfds_string_coordinate.h"
#include "mfds_common.h"
#include "mfds_binary_stream.h"

#include <algorithm>
#include <ostream>

// --------------------------------------------------------------------------
mfds_coordinate::mfds_coordinate() : m_tolerance(1e-5)
{}

// --------------------------------------------------------------------------
p_mfds_coordinate mfds_coordinate::New(const std::string &type)
{
    if (type == "numeric")
        return mfds_numeric_coordinate::New();
    else if (type == "time")
        return mfds_time_coordinate::New();
    else if (type == "string")
        return mfds_string_coordinate::New();

    return nullptr;
}

// --------------------------------------------------------------------------
bool mfds_coordinate::has_name(const std::string &name) const
{
    return (name == m_name) || (std::find(m_alt_names.begin(),
        m_alt_names.end(), name) != m_alt_names.end());
}

// --------------------------------------------------------------------------
int mfds_coordinate::set_values(const std::vector<double> &)
{
    MFDS_ERROR("Coordinate \"" << m_name << "\" does not hold numeric values")
    return -1;
}

// --------------------------------------------------------------------------
const std::vector<double> &mfds_coordinate::get_values() const
{
    static const std::vector<double> empty;
    return empty;
}

// --------------------------------------------------------------------------
int mfds_coordinate::get_index(double, long &, int) const
{
    MFDS_ERROR("Coordinate \"" << m_name << "\" does not hold numeric values")
    return -1;
}

// --------------------------------------------------------------------------
int mfds_coordinate::subset(double, double, mfds_key &) const
{
    MFDS_ERROR("Coordinate \"" << m_name << "\" does not hold numeric values")
    return -1;
}

// --------------------------------------------------------------------------
int mfds_coordinate::set_names(const std::vector<std::string> &)
{
    MFDS_ERROR("Coordinate \"" << m_name << "\" does not hold names")
    return -1;
}

// --------------------------------------------------------------------------
const std::vector<std::string> &mfds_coordinate::get_names() const
{
    static const std::vector<std::string> empty;
    return empty;
}

// --------------------------------------------------------------------------
int mfds_coordinate::get_index_of_name(const std::string &, long &) const
{
    MFDS_ERROR("Coordinate \"" << m_name << "\" does not hold names")
    return -1;
}

// --------------------------------------------------------------------------
std::string mfds_coordinate::get_name_of_index(long) const
{
    MFDS_ERROR("Coordinate \"" << m_name << "\" does not hold names")
    return std::string();
}

// --------------------------------------------------------------------------
void mfds_coordinate::to_stream(mfds_binary_stream &bs) const
{
    bs.pack(m_name);
    bs.pack(m_units);
    bs.pack(m_alt_names);
    bs.pack(m_tolerance);
}

// --------------------------------------------------------------------------
int mfds_coordinate::from_stream(mfds_binary_stream &bs)
{
    bs.unpack(m_name);
    bs.unpack(m_units);
    bs.unpack(m_alt_names);
    bs.unpack(m_tolerance);
    return 0;
}

// **************************************************************************
std::ostream &operator<<(std::ostream &os, const mfds_coordinate &coord)
{
    coord.print(os);
    return os;
}

// --------------------------------------------------------------------------
int mfds_coordinate_registry::add(const p_mfds_coordinate &coord)
{
    if (!coord)
    {
        MFDS_ERROR("Attempt to register a null coordinate")
        return -1;
    }

    // alternate names may be shadowed, exact names are unique
    const std::string &name = coord->get_name();
    size_t n = m_coords.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_coords[i]->get_name() != name)
            continue;

        MFDS_ERROR("A coordinate named \"" << coord->get_name()
            << "\" is already registered")
        return -1;
    }

    m_coords.push_back(coord);
    return 0;
}

// --------------------------------------------------------------------------
p_mfds_coordinate mfds_coordinate_registry::get(const std::string &name) const
{
    // exact names take precedence over alternate names
    size_t n = m_coords.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_coords[i]->get_name() == name)
            return m_coords[i];
    }

    for (size_t i = 0; i < n; ++i)
    {
        if (m_coords[i]->has_name(name))
            return m_coords[i];
    }

    return nullptr;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_coordinate_registry::get_names() const
{
    std::vector<std::string> names;
    size_t n = m_coords.size();
    for (size_t i = 0; i < n; ++i)
        names.push_back(m_coords[i]->get_name());
    return names;
}

// --------------------------------------------------------------------------
std::map<std::string, long> mfds_coordinate_registry::get_sizes() const
{
    std::map<std::string, long> sizes;
    size_t n = m_coords.size();
    for (size_t i = 0; i < n; ++i)
        sizes[m_coords[i]->get_name()] = m_coords[i]->get_size();
    return sizes;
}

// --------------------------------------------------------------------------
mfds_coordinate_registry mfds_coordinate_registry::new_copy() const
{
    mfds_coordinate_registry reg;
    size_t n = m_coords.size();
    for (size_t i = 0; i < n; ++i)
        reg.m_coords.push_back(m_coords[i]->new_copy());
    return reg;
}

// --------------------------------------------------------------------------
void mfds_coordinate_registry::to_stream(mfds_binary_stream &bs) const
{
    unsigned long n = m_coords.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
    {
        bs.pack(std::string(m_coords[i]->get_type_name()));
        m_coords[i]->to_stream(bs);
    }
}

// --------------------------------------------------------------------------
int mfds_coordinate_registry::from_stream(mfds_binary_stream &bs)
{
    m_coords.clear();

    unsigned long n = 0;
    bs.unpack(n);
    for (unsigned long i = 0; i < n; ++i)
    {
        std::string type;
        bs.unpack(type);

        p_mfds_coordinate coord = mfds_coordinate::New(type);
        if (!coord)
        {
            MFDS_ERROR("Invalid stream, unknown coordinate type \""
                << type << "\"")
            return -1;
        }

        if (coord->from_stream(bs))
            return -1;

        m_coords.push_back(coord);
    }

    return 0;
}
