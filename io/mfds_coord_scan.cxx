#include "mfds_coord_scan.h"
#include "mfds_coordinate_util.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"
#include "mfds_common.h"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <sstream>

// --------------------------------------------------------------------------
mfds_coord_scan::mfds_coord_scan(const p_mfds_coordinate &coord, bool shared) :
    m_coord(coord), m_shared(shared), m_has_constant_in_idx(false),
    m_constant_in_idx(-1), m_manual(false), m_force_descending(false),
    m_tolerance(-1.0), m_selection_kind(no_selection), m_selection_min(0.0),
    m_selection_max(0.0), m_status(unscanned), m_n_files(0),
    m_descending(false), m_available_size(0)
{}

// --------------------------------------------------------------------------
double mfds_coord_scan::get_tolerance() const
{
    return m_tolerance < 0.0 ? m_coord->get_tolerance() : m_tolerance;
}

// --------------------------------------------------------------------------
int mfds_coord_scan::add_scan_function(const mfds_scan_function_info &info)
{
    if (!info.function)
    {
        MFDS_ERROR("Scan function \"" << info.name << "\" of coordinate \""
            << this->get_name() << "\" is empty")
        return -1;
    }

    if ((info.kind == mfds_scan_function_info::filename) && !m_shared
        && m_matchers.empty())
    {
        MFDS_ERROR("Filename scan function \"" << info.name << "\" added to"
            " coordinate \"" << this->get_name() << "\" which has no matcher")
        return -1;
    }

    m_functions.push_back(info);
    return 0;
}

// --------------------------------------------------------------------------
bool mfds_coord_scan::needs_file() const
{
    size_t n = m_functions.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_functions[i].kind == mfds_scan_function_info::in_file)
            return true;
    }
    return false;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::set_manual_values(const std::vector<double> &values)
{
    m_manual = true;
    m_manual_values = values;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::set_manual_names(const std::vector<std::string> &names)
{
    m_manual = true;
    m_manual_names = names;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::set_selection(const mfds_key &key)
{
    m_selection_kind = index_selection;
    m_selection = key;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::set_selection_range(double vmin, double vmax)
{
    m_selection_kind = range_selection;
    m_selection_min = std::min(vmin, vmax);
    m_selection_max = std::max(vmin, vmax);
}

// --------------------------------------------------------------------------
void mfds_coord_scan::reset()
{
    m_status = unscanned;
    m_n_files = 0;
    m_seen.clear();
    m_values.clear();
    m_names.clear();
    m_in_idx.clear();
    m_in_names.clear();
    m_matches.clear();
    m_units.clear();
    m_descending = false;
    m_contains.clear();
    m_available_size = 0;
}

// --------------------------------------------------------------------------
bool mfds_coord_scan::wants_file(const std::vector<std::string> &captures) const
{
    if (this->is_empty())
        return false;

    if (!m_shared)
        return (m_n_files == 0) && !m_functions.empty();

    return m_seen.find(captures) == m_seen.end();
}

// --------------------------------------------------------------------------
int mfds_coord_scan::scan_file(mfds_scan_context &ctx, mfds_diagnostics &diag)
{
    m_status = scanning;

    bool is_str = this->is_string();
    bool have_values = false;
    bool have_idx = false;

    mfds_scan_result acc;
    size_t n_funcs = m_functions.size();
    for (size_t i = 0; i < n_funcs; ++i)
    {
        const mfds_scan_function_info &info = m_functions[i];

        ctx.prior = &acc;

        mfds_scan_result res;
        if (info.function(ctx, res, diag))
        {
            MFDS_DIAG_ERROR(diag, "Scan function \"" << info.name << "\" failed"
                " on \"" << ctx.filename << "\" for coordinate \""
                << this->get_name() << "\"")
            return mfds_error::scan_error;
        }

        if (info.elements & mfds_scan_function_info::values)
        {
            acc.values.swap(res.values);
            acc.names.swap(res.names);
            if (!res.units.empty())
                acc.units = res.units;
            have_values = true;
        }

        if (info.elements & mfds_scan_function_info::in_idx)
        {
            acc.in_idx.swap(res.in_idx);
            acc.in_names.swap(res.in_names);
            have_idx = true;
        }
    }

    ctx.prior = nullptr;

    // the number of entries found in this file
    long n = 0;
    if (m_manual)
    {
        n = m_shared ? 1 :
            (is_str ? m_manual_names.size() : m_manual_values.size());
    }
    else if (have_values)
    {
        n = is_str ? acc.names.size() : acc.values.size();
    }
    else
    {
        MFDS_DIAG_ERROR(diag, "No scan function of coordinate \""
            << this->get_name() << "\" provides values")
        return mfds_error::scan_error;
    }

    if (!m_manual && (long(is_str ? acc.names.size() : acc.values.size()) != n))
    {
        MFDS_DIAG_ERROR(diag, "Coordinate \"" << this->get_name()
            << "\" scanned values are inconsistent in \"" << ctx.filename << "\"")
        return mfds_error::scan_error;
    }

    // in-file indices
    if (have_idx && !acc.in_idx.empty())
    {
        if (long(acc.in_idx.size()) != n)
        {
            MFDS_DIAG_ERROR(diag, "Coordinate \"" << this->get_name() << "\" has "
                << n << " values but " << acc.in_idx.size() << " in-file"
                " indices in \"" << ctx.filename << "\"")
            return mfds_error::scan_error;
        }
    }
    else
    {
        long idx = m_has_constant_in_idx ? m_constant_in_idx : -1;
        acc.in_idx.resize(n);
        for (long i = 0; i < n; ++i)
            acc.in_idx[i] = (m_has_constant_in_idx || m_shared) ? idx : i;
    }

    if (is_str)
    {
        if (acc.in_names.empty())
            acc.in_names = m_manual ? m_manual_names : acc.names;

        if (m_manual && m_shared)
            acc.in_names.resize(1);

        if (long(acc.in_names.size()) != n)
        {
            MFDS_DIAG_ERROR(diag, "Coordinate \"" << this->get_name() << "\" has "
                << n << " names but " << acc.in_names.size() << " in-file"
                " names in \"" << ctx.filename << "\"")
            return mfds_error::scan_error;
        }
    }

    if (!acc.units.empty())
    {
        if (m_units.empty())
        {
            m_units = acc.units;
        }
        else if (m_units != acc.units)
        {
            MFDS_DIAG_WARNING(diag, "Coordinate \"" << this->get_name()
                << "\" is in \"" << acc.units << "\" in \"" << ctx.filename
                << "\" while \"" << m_units << "\" was found before")
        }
    }

    if (!m_manual)
    {
        m_values.insert(m_values.end(), acc.values.begin(), acc.values.end());
        m_names.insert(m_names.end(), acc.names.begin(), acc.names.end());
    }

    m_in_idx.insert(m_in_idx.end(), acc.in_idx.begin(), acc.in_idx.end());
    m_in_names.insert(m_in_names.end(), acc.in_names.begin(), acc.in_names.end());

    if (m_shared)
    {
        m_matches.insert(m_matches.end(), n, ctx.captures);
        m_seen.insert(ctx.captures);
    }

    ++m_n_files;

    MFDS_DIAG_DEBUG(diag, "Scanned " << n << " entries of \""
        << this->get_name() << "\" in \"" << ctx.filename << "\"")

    return 0;
}

// --------------------------------------------------------------------------
long mfds_coord_scan::size() const
{
    return this->is_string() ? m_names.size() : m_values.size();
}

// --------------------------------------------------------------------------
void mfds_coord_scan::take(const std::vector<long> &ids)
{
    size_t n = ids.size();

    if (!m_values.empty())
    {
        std::vector<double> tmp(n);
        for (size_t i = 0; i < n; ++i)
            tmp[i] = m_values[ids[i]];
        m_values.swap(tmp);
    }

    if (!m_names.empty())
    {
        std::vector<std::string> tmp(n);
        for (size_t i = 0; i < n; ++i)
            tmp[i] = m_names[ids[i]];
        m_names.swap(tmp);
    }

    if (!m_in_idx.empty())
    {
        std::vector<long> tmp(n);
        for (size_t i = 0; i < n; ++i)
            tmp[i] = m_in_idx[ids[i]];
        m_in_idx.swap(tmp);
    }

    if (!m_in_names.empty())
    {
        std::vector<std::string> tmp(n);
        for (size_t i = 0; i < n; ++i)
            tmp[i] = m_in_names[ids[i]];
        m_in_names.swap(tmp);
    }

    if (!m_matches.empty())
    {
        std::vector<std::vector<std::string>> tmp(n);
        for (size_t i = 0; i < n; ++i)
            tmp[i] = m_matches[ids[i]];
        m_matches.swap(tmp);
    }
}

// --------------------------------------------------------------------------
int mfds_coord_scan::finish(mfds_diagnostics &diag)
{
    if (this->is_empty())
    {
        this->reset();
        m_status = scanned;
        return 0;
    }

    bool is_str = this->is_string();

    if (m_manual)
    {
        long n_manual = is_str ? m_manual_names.size() : m_manual_values.size();

        if (!m_shared && (m_n_files == 0))
        {
            // nothing was read from the files
            m_in_idx.resize(n_manual);
            for (long i = 0; i < n_manual; ++i)
                m_in_idx[i] = m_has_constant_in_idx ? m_constant_in_idx : i;

            if (is_str)
                m_in_names = m_manual_names;
        }

        if (long(m_in_idx.size()) != n_manual)
        {
            MFDS_DIAG_ERROR(diag, "Coordinate \"" << this->get_name() << "\" was"
                " given " << n_manual << " values but "
                << (m_shared ? "distinct filenames matched" : "in-file indices"
                " were found") << " for " << m_in_idx.size())
            return mfds_error::scan_error;
        }

        if (is_str)
            m_names = m_manual_names;
        else
            m_values = m_manual_values;

        if (is_str && m_shared)
            m_in_names = m_manual_names;
    }

    long n = this->size();
    if (n == 0)
    {
        MFDS_DIAG_ERROR(diag, "No values were found for coordinate \""
            << this->get_name() << "\"")
        return mfds_error::scan_error;
    }

    if (is_str)
    {
        // the variable dimension keeps the order of discovery
        std::set<std::string> unique;
        for (long i = 0; i < n; ++i)
        {
            if (!unique.insert(m_names[i]).second)
            {
                MFDS_DIAG_ERROR(diag, "Duplicate name \"" << m_names[i]
                    << "\" found for coordinate \"" << this->get_name() << "\"")
                return mfds_error::scan_error;
            }
        }
    }
    else
    {
        std::vector<long> perm(n);
        std::iota(perm.begin(), perm.end(), 0);
        std::stable_sort(perm.begin(), perm.end(),
            [this](long a, long b) { return m_values[a] < m_values[b]; });
        this->take(perm);

        // unit conversion
        const std::string &units = m_coord->get_units();
        if (!m_units.empty() && !units.empty() && (m_units != units))
        {
            if (m_converter)
            {
                if (m_converter(m_units, units, m_values))
                {
                    MFDS_DIAG_ERROR(diag, "Failed to convert coordinate \""
                        << this->get_name() << "\" from \"" << m_units
                        << "\" to \"" << units << "\"")
                    return mfds_error::scan_error;
                }
                MFDS_DIAG_INFO(diag, "Converted coordinate \"" << this->get_name()
                    << "\" from \"" << m_units << "\" to \"" << units << "\"")
            }
            else
            {
                std::string errstr;
                std::vector<double> tmp(m_values);
                if (mfds_coordinate_util::convert_units(m_units, units, tmp, errstr))
                {
                    MFDS_DIAG_WARNING(diag, "Coordinate \"" << this->get_name()
                        << "\" is kept in \"" << m_units << "\", it could not be"
                        " converted to \"" << units << "\". " << errstr)
                }
                else
                {
                    m_values.swap(tmp);
                    MFDS_DIAG_INFO(diag, "Converted coordinate \""
                        << this->get_name() << "\" from \"" << m_units
                        << "\" to \"" << units << "\"")
                }
            }
        }

        size_t bad_id = 0;
        if (mfds_coordinate_util::check_strictly_increasing(m_values,
            this->get_tolerance(), bad_id))
        {
            std::ostringstream where;
            if (!m_matches.empty())
                where << ", matched by " << m_matches[bad_id-1]
                    << " and " << m_matches[bad_id];

            MFDS_DIAG_ERROR(diag, "Coordinate \"" << this->get_name() << "\" has"
                " duplicate values, " << m_values[bad_id] << " at " << bad_id
                << " and " << m_values[bad_id-1] << " at " << bad_id - 1
                << where.str())
            return mfds_error::scan_error;
        }

        // indices running opposite to the values
        m_descending = false;
        if (!m_shared && (n > 1) && (m_in_idx[0] >= 0)
            && (m_in_idx[n-1] >= 0) && (m_in_idx[0] > m_in_idx[n-1]))
            m_descending = true;
    }

    int ierr = 0;
    if (this->has_selection() && (ierr = this->apply_selection(diag)))
        return ierr;

    m_status = m_manual ? manually_set : scanned;

    return 0;
}

// --------------------------------------------------------------------------
int mfds_coord_scan::apply_selection(mfds_diagnostics &diag)
{
    long n = this->size();
    std::vector<long> ids;

    if (m_selection_kind == index_selection)
    {
        std::vector<long> all(n);
        std::iota(all.begin(), all.end(), 0);

        if (m_selection.apply(all, ids))
        {
            MFDS_DIAG_ERROR(diag, "Selection " << m_selection << " is not valid"
                " for coordinate \"" << this->get_name() << "\" of size " << n)
            return mfds_error::scan_error;
        }

        // the scan stays in value order
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    }
    else
    {
        if (this->is_string())
        {
            MFDS_DIAG_ERROR(diag, "A range of values can not select coordinate \""
                << this->get_name() << "\"")
            return mfds_error::config_error;
        }

        double tol = this->get_tolerance();
        for (long i = 0; i < n; ++i)
        {
            if ((m_values[i] >= m_selection_min - tol) &&
                (m_values[i] <= m_selection_max + tol))
                ids.push_back(i);
        }
    }

    if (ids.empty())
    {
        MFDS_DIAG_ERROR(diag, "The selection of coordinate \""
            << this->get_name() << "\" is empty")
        return mfds_error::scan_error;
    }

    this->take(ids);

    MFDS_DIAG_INFO(diag, "Selected " << ids.size() << " of " << n
        << " values of coordinate \"" << this->get_name() << "\"")

    return 0;
}

// --------------------------------------------------------------------------
bool mfds_coord_scan::is_index_descending() const
{
    if (this->is_empty())
        return m_force_descending;
    return m_descending;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::set_contains(const std::vector<long> &contains,
    long available_size)
{
    m_available_size = available_size;
    if (this->is_empty() && contains.empty())
    {
        m_contains.resize(available_size);
        std::iota(m_contains.begin(), m_contains.end(), 0);
    }
    else
    {
        m_contains = contains;
    }
}

// --------------------------------------------------------------------------
int mfds_coord_scan::get_in_index(long i, long &in_idx, long &scan_idx) const
{
    if ((i < 0) || (i >= long(m_contains.size())) || (m_contains[i] < 0))
        return -1;

    if (this->is_empty())
    {
        scan_idx = i;
        if (m_has_constant_in_idx)
            in_idx = m_constant_in_idx;
        else
            in_idx = m_force_descending ? m_available_size - i - 1 : i;
        return 0;
    }

    scan_idx = m_contains[i];
    in_idx = m_in_idx[scan_idx];
    return 0;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::to_stream(mfds_binary_stream &bs) const
{
    bs.pack("mfds_coord_scan", 15);
    bs.pack(this->get_name());
    bs.pack(m_shared);
    bs.pack(m_status);
    bs.pack(m_values);
    bs.pack(m_names);
    bs.pack(m_in_idx);
    bs.pack(m_in_names);
    bs.pack(m_matches);
    bs.pack(m_units);
    bs.pack(m_tolerance);
    bs.pack(m_descending);
    bs.pack(m_contains);
    bs.pack(m_available_size);
}

// --------------------------------------------------------------------------
int mfds_coord_scan::from_stream(mfds_binary_stream &bs)
{
    if (bs.expect("mfds_coord_scan"))
    {
        MFDS_ERROR("invalid stream")
        return -1;
    }

    std::string name;
    bs.unpack(name);
    if (name != this->get_name())
    {
        MFDS_ERROR("The stream holds coordinate \"" << name
            << "\" not \"" << this->get_name() << "\"")
        return -1;
    }

    bs.unpack(m_shared);
    bs.unpack(m_status);
    bs.unpack(m_values);
    bs.unpack(m_names);
    bs.unpack(m_in_idx);
    bs.unpack(m_in_names);
    bs.unpack(m_matches);
    bs.unpack(m_units);
    bs.unpack(m_tolerance);
    bs.unpack(m_descending);
    bs.unpack(m_contains);
    bs.unpack(m_available_size);

    return 0;
}

// --------------------------------------------------------------------------
void mfds_coord_scan::print(std::ostream &os) const
{
    static const char *status_names[] =
        {"unscanned", "scanning", "scanned", "manually set"};

    os << this->get_name() << " (" << (m_shared ? "shared" : "in") << ", "
        << status_names[m_status] << "): ";

    long n = this->size();
    if (this->is_empty())
    {
        os << "empty";
    }
    else if (n == 0)
    {
        os << "no values";
    }
    else if (this->is_string())
    {
        os << n << " names [" << m_names << "]";
    }
    else
    {
        os << n << " values [" << m_values[0];
        if (n > 1)
            os << " .. " << m_values[n-1];
        os << "]";
        const std::string &units = m_coord->get_units();
        if (!units.empty())
            os << " " << units;
    }

    if (this->is_index_descending())
        os << ", index descending";
}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const mfds_coord_scan &cs)
{
    cs.print(os);
    return os;
}
