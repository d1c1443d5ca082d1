#include "mfds_key.h"
#include "mfds_coordinate.h"
#include "mfds_binary_stream.h"

#include <algorithm>
#include <ostream>

constexpr long mfds_key::nil;

// --------------------------------------------------------------------------
mfds_key::mfds_key() : m_type(none_type), m_str(false), m_int(0),
    m_start(nil), m_stop(nil), m_step(1), m_parent_size(nil)
{}

// --------------------------------------------------------------------------
mfds_key::mfds_key(long i) : m_type(int_type), m_str(false), m_int(i),
    m_start(nil), m_stop(nil), m_step(1), m_parent_size(nil)
{}

// --------------------------------------------------------------------------
mfds_key::mfds_key(const std::vector<long> &l) : m_type(list_type),
    m_str(false), m_int(0), m_list(l), m_start(nil), m_stop(nil),
    m_step(1), m_parent_size(nil)
{}

// --------------------------------------------------------------------------
mfds_key::mfds_key(long start, long stop, long step) : m_type(slice_type),
    m_str(false), m_int(0), m_start(start), m_stop(stop),
    m_step(step == nil ? 1 : step), m_parent_size(nil)
{
    if (m_step == 0)
    {
        MFDS_ERROR("slice step cannot be zero, using 1")
        m_step = 1;
    }
}

// --------------------------------------------------------------------------
mfds_key mfds_key::all()
{
    return mfds_key(nil, nil, 1);
}

// --------------------------------------------------------------------------
mfds_key mfds_key::from_name(const std::string &name)
{
    mfds_key key;
    key.m_type = int_type;
    key.m_str = true;
    key.m_names = {name};
    return key;
}

// --------------------------------------------------------------------------
mfds_key mfds_key::from_names(const std::vector<std::string> &names)
{
    mfds_key key;
    key.m_type = list_type;
    key.m_str = true;
    key.m_names = names;
    return key;
}

// --------------------------------------------------------------------------
mfds_key mfds_key::from_name_slice(const std::string &start,
    const std::string &stop, long step)
{
    mfds_key key(nil, nil, step);
    key.m_str = true;
    key.m_names = {start, stop};
    return key;
}

// --------------------------------------------------------------------------
bool mfds_key::is_full_slice() const
{
    if ((m_type != slice_type) || (m_step != 1))
        return false;

    if (m_str)
        return m_names[0].empty() && m_names[1].empty();

    return ((m_start == nil) || (m_start == 0)) && (m_stop == nil);
}

// --------------------------------------------------------------------------
void mfds_key::slice_indices(long start, long stop, long step, long n,
    long &first, long &count)
{
    if (step > 0)
    {
        long b = start == nil ? 0 : (start < 0 ? start + n : start);
        long e = stop == nil ? n : (stop < 0 ? stop + n : stop);
        b = std::min(std::max(b, 0l), n);
        e = std::min(std::max(e, 0l), n);
        first = b;
        count = e > b ? (e - b + step - 1)/step : 0;
    }
    else
    {
        long b = start == nil ? n - 1 : (start < 0 ? start + n : start);
        long e = stop == nil ? -1 : (stop < 0 ? stop + n : stop);
        b = std::min(std::max(b, -1l), n - 1);
        e = std::min(std::max(e, -1l), n - 1);
        first = b;
        count = b > e ? (b - e - step - 1)/(-step) : 0;
    }
}

// --------------------------------------------------------------------------
bool mfds_key::is_shape_estimated() const
{
    return (m_type == slice_type) && (m_str || (m_parent_size == nil));
}

// --------------------------------------------------------------------------
long mfds_key::get_shape() const
{
    switch (m_type)
    {
    case none_type:
    case int_type:
        return 0;
    case list_type:
        return m_str ? m_names.size() : m_list.size();
    }

    if (m_parent_size != nil)
    {
        // the names in the range are not known here
        if (m_str)
            return m_parent_size;

        long first = 0;
        long count = 0;
        slice_indices(m_start, m_stop, m_step, m_parent_size, first, count);
        return count;
    }

    std::vector<long> ids;
    if (!m_str && !this->to_list(ids))
        return ids.size();

    return 0;
}

// --------------------------------------------------------------------------
int mfds_key::to_list(std::vector<long> &ids) const
{
    if (m_str)
    {
        MFDS_ERROR("Key " << *this << " holds names, convert it to indices first")
        return -1;
    }

    switch (m_type)
    {
    case none_type:
        MFDS_ERROR("A none key does not select indices")
        return -1;
    case int_type:
        ids.push_back(m_int);
        return 0;
    case list_type:
        ids.insert(ids.end(), m_list.begin(), m_list.end());
        return 0;
    }

    if (m_parent_size != nil)
    {
        long first = 0;
        long count = 0;
        slice_indices(m_start, m_stop, m_step, m_parent_size, first, count);
        for (long i = 0; i < count; ++i)
            ids.push_back(first + i*m_step);
        return 0;
    }

    // without the parent size a list can be determined only when the
    // bounds do not wrap around the end of the sequence
    long b = m_start;
    long e = m_stop;
    if (m_step > 0)
    {
        if ((b == nil) && (e != nil) && (e >= 0))
            b = 0;
        else if ((e == nil) && (b != nil) && (b < 0))
            e = 0;
    }
    else
    {
        if ((e == nil) && (b != nil) && (b >= 0))
            e = -1;
        else if ((b == nil) && (e != nil) && (e < 0))
            b = -1;
    }

    bool same_sign = (b != nil) && (e != nil) &&
        (((b >= 0) && (e >= 0)) || ((b < 0) && (e <= 0)) ||
        ((m_step < 0) && (b >= 0) && (e == -1) && (m_stop == nil)));

    if (!same_sign)
    {
        MFDS_ERROR("The indices of slice " << *this
            << " can not be determined without the parent size")
        return -1;
    }

    if (m_step > 0)
    {
        for (long i = b; i < e; i += m_step)
            ids.push_back(i);
    }
    else
    {
        for (long i = b; i > e; i += m_step)
            ids.push_back(i);
    }

    return 0;
}

// --------------------------------------------------------------------------
bool mfds_key::list_to_slice(const std::vector<long> &l,
    long &start, long &stop, long &step)
{
    size_t n = l.size();
    if (n < 2)
        return false;

    bool have_neg = false;
    bool have_pos = false;
    for (size_t i = 0; i < n; ++i)
    {
        have_neg |= l[i] < 0;
        have_pos |= l[i] >= 0;
    }
    if (have_neg && have_pos)
        return false;

    long d = l[1] - l[0];
    if (d == 0)
        return false;

    for (size_t i = 2; i < n; ++i)
    {
        if (l[i] - l[i-1] != d)
            return false;
    }

    start = l[0];
    step = d;
    stop = l[n-1] + (d > 0 ? 1 : -1);

    // the stop past either end of the sequence is left open
    if (((d > 0) && (stop == 0)) || ((d < 0) && (stop == -1)))
        stop = nil;

    return true;
}

// --------------------------------------------------------------------------
void mfds_key::simplify()
{
    if ((m_type != list_type) || m_str)
        return;

    long start = 0;
    long stop = 0;
    long step = 0;
    if (list_to_slice(m_list, start, stop, step))
    {
        m_type = slice_type;
        m_list.clear();
        m_start = start;
        m_stop = stop;
        m_step = step;
    }
}

// --------------------------------------------------------------------------
int mfds_key::make_list()
{
    if (m_type == int_type)
    {
        this->make_int_list();
        return 0;
    }

    if (m_type != slice_type)
        return 0;

    if (m_str)
    {
        MFDS_ERROR("A slice of names can not be converted to a list"
            " without the coordinate")
        return -1;
    }

    std::vector<long> ids;
    if (this->to_list(ids))
        return -1;

    m_type = list_type;
    m_list.swap(ids);
    m_start = nil;
    m_stop = nil;
    m_step = 1;

    return 0;
}

// --------------------------------------------------------------------------
void mfds_key::reverse_slice(long &start, long &stop, long &step)
{
    if ((step > 0) && ((start == nil) || (start >= 0)) &&
        (stop != nil) && (stop >= 0))
    {
        long first = start == nil ? 0 : start;
        if (stop <= first)
            return;

        // the last selected index becomes the start
        long last = first + ((stop - first - 1)/step)*step;
        start = last;
        stop = first > 0 ? first - 1 : nil;
        step = -step;
        return;
    }

    if ((step < 0) && (start != nil) && (start >= 0) &&
        ((stop == nil) || (stop >= 0)))
    {
        long lo = stop == nil ? -1 : stop;
        if (start <= lo)
            return;

        long last = start + ((start - lo - 1)/(-step))*step;
        stop = start + 1;
        start = last;
        step = -step;
        return;
    }

    // bounds counted from the end, exact for unit steps only
    long shift = step > 0 ? -1 : 1;
    long over = step > 0 ? 0 : -1;

    if (start != nil)
        start = start == over ? nil : start + shift;

    if (stop != nil)
        stop = stop == over ? nil : stop + shift;

    step = -step;
    std::swap(start, stop);
}

// --------------------------------------------------------------------------
void mfds_key::reverse()
{
    if (m_type == list_type)
    {
        std::reverse(m_list.begin(), m_list.end());
        std::reverse(m_names.begin(), m_names.end());
    }
    else if (m_type == slice_type)
    {
        if (m_str)
        {
            std::swap(m_names[0], m_names[1]);
            m_step = -m_step;
        }
        else if (m_parent_size != nil)
        {
            // with a known size the bounds are resolved first
            long first = 0;
            long count = 0;
            slice_indices(m_start, m_stop, m_step, m_parent_size, first, count);
            if (count < 1)
                return;

            long last = first + (count - 1)*m_step;
            m_start = last;
            m_step = -m_step;
            m_stop = last + count*m_step;
            if (m_stop < 0)
                m_stop = nil;
        }
        else
        {
            reverse_slice(m_start, m_stop, m_step);
        }
    }
}

// --------------------------------------------------------------------------
void mfds_key::make_list_int()
{
    if (m_type != list_type)
        return;

    if (m_str && (m_names.size() == 1))
    {
        m_type = int_type;
    }
    else if (!m_str && (m_list.size() == 1))
    {
        m_type = int_type;
        m_int = m_list[0];
        m_list.clear();
    }
}

// --------------------------------------------------------------------------
void mfds_key::make_int_list()
{
    if (m_type != int_type)
        return;

    m_type = list_type;
    if (!m_str)
    {
        m_list = {m_int};
        m_int = 0;
    }
}

// --------------------------------------------------------------------------
int mfds_key::compose(const mfds_key &other, mfds_key &out) const
{
    if (this->is_full_slice())
    {
        out = other;
        if (out.m_parent_size == nil)
            out.m_parent_size = m_parent_size;
        return 0;
    }

    if (other.is_full_slice())
    {
        out = *this;
        return 0;
    }

    if ((m_type == none_type) || (other.m_type == none_type))
    {
        MFDS_ERROR("Cannot compose none keys")
        return -1;
    }

    if (other.m_str && !m_str)
    {
        MFDS_ERROR("Cannot restrict an integer indices key " << *this
            << " by a string indices key " << other)
        return -1;
    }

    int out_type = slice_type;
    if ((m_type == int_type) || (other.m_type == int_type))
        out_type = int_type;
    else if ((m_type == list_type) || (other.m_type == list_type))
        out_type = list_type;

    if (m_str)
    {
        if (m_type == slice_type)
        {
            MFDS_ERROR("Cannot restrict the slice of names " << *this
                << ", convert it to indices first")
            return -1;
        }

        std::vector<std::string> names;
        if (other.m_str)
        {
            if (other.m_type == slice_type)
            {
                MFDS_ERROR("Cannot restrict by the slice of names " << other
                    << ", convert it to indices first")
                return -1;
            }

            // names present in both, in the order of this key
            size_t n = m_names.size();
            for (size_t i = 0; i < n; ++i)
            {
                if (std::find(other.m_names.begin(), other.m_names.end(),
                    m_names[i]) != other.m_names.end())
                    names.push_back(m_names[i]);
            }
        }
        else if (other.apply(m_names, names))
        {
            return -1;
        }

        if ((out_type == int_type) && (names.size() != 1))
        {
            MFDS_ERROR("Composing " << *this << " and " << other
                << " did not select a single name")
            return -1;
        }

        out = out_type == int_type ? mfds_key::from_name(names[0]) :
            mfds_key::from_names(names);

        return 0;
    }

    std::vector<long> a;
    if (this->to_list(a))
        return -1;

    std::vector<long> ids;
    if (other.apply(a, ids))
        return -1;

    if (out_type == int_type)
    {
        if (ids.size() != 1)
        {
            MFDS_ERROR("Composing " << *this << " and " << other
                << " did not select a single index")
            return -1;
        }
        out = mfds_key(ids[0]);
    }
    else
    {
        out = mfds_key(ids);
        if (out_type == slice_type)
            out.simplify();
    }

    out.m_parent_size = m_parent_size;

    return 0;
}

// --------------------------------------------------------------------------
int mfds_key::append(const mfds_key &other, mfds_key &out) const
{
    if (m_str || other.m_str)
    {
        if (!m_str || !other.m_str || (m_type == slice_type) ||
            (other.m_type == slice_type))
        {
            MFDS_ERROR("Cannot append " << other << " to " << *this)
            return -1;
        }

        std::vector<std::string> names(m_names);
        names.insert(names.end(), other.m_names.begin(), other.m_names.end());
        out = mfds_key::from_names(names);
        return 0;
    }

    std::vector<long> ids;
    if (this->to_list(ids) || other.to_list(ids))
        return -1;

    out = mfds_key(ids);
    if ((m_type == slice_type) || (other.m_type == slice_type))
        out.simplify();

    out.m_parent_size = m_parent_size;

    return 0;
}

// --------------------------------------------------------------------------
int mfds_key::make_str_idx(const mfds_coordinate &coord)
{
    long n = coord.get_size();
    if (m_str)
    {
        if (m_type == int_type)
        {
            long i = 0;
            if (coord.get_index_of_name(m_names[0], i))
                return -1;
            *this = mfds_key(i);
        }
        else if (m_type == list_type)
        {
            std::vector<long> ids;
            size_t n_names = m_names.size();
            for (size_t j = 0; j < n_names; ++j)
            {
                long i = 0;
                if (coord.get_index_of_name(m_names[j], i))
                    return -1;
                ids.push_back(i);
            }
            *this = mfds_key(ids);
        }
        else if (m_type == slice_type)
        {
            if (n < 1)
            {
                MFDS_ERROR("The values of coordinate \"" << coord.get_name()
                    << "\" are needed to resolve the slice " << *this)
                return -1;
            }

            long start = nil;
            long stop = nil;
            if (!m_names[0].empty() && coord.get_index_of_name(m_names[0], start))
                return -1;

            if (!m_names[1].empty())
            {
                if (coord.get_index_of_name(m_names[1], stop))
                    return -1;
                // the stop name is included
                stop += m_step > 0 ? 1 : -1;
                if (stop < 0)
                    stop = nil;
            }

            *this = mfds_key(start, stop, m_step);
        }
    }

    m_parent_size = n;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_key::make_idx_str(const mfds_coordinate &coord)
{
    long n = coord.get_size();
    if (!m_str)
    {
        if (m_type == int_type)
        {
            long i = m_int < 0 ? m_int + n : m_int;
            if ((i < 0) || (i >= n))
            {
                MFDS_ERROR("Index " << m_int << " is out of bounds of \""
                    << coord.get_name() << "\"")
                return -1;
            }
            *this = mfds_key::from_name(coord.get_name_of_index(i));
        }
        else if ((m_type == list_type) || (m_type == slice_type))
        {
            mfds_key tmp(*this);
            tmp.set_parent_size(n);

            std::vector<long> ids;
            if (tmp.to_list(ids))
                return -1;

            std::vector<std::string> names;
            size_t n_ids = ids.size();
            for (size_t j = 0; j < n_ids; ++j)
            {
                long i = ids[j] < 0 ? ids[j] + n : ids[j];
                if ((i < 0) || (i >= n))
                {
                    MFDS_ERROR("Index " << ids[j] << " is out of bounds of \""
                        << coord.get_name() << "\"")
                    return -1;
                }
                names.push_back(coord.get_name_of_index(i));
            }
            *this = mfds_key::from_names(names);
        }
    }

    m_parent_size = n;
    return 0;
}

// --------------------------------------------------------------------------
bool mfds_key::operator==(const mfds_key &other) const
{
    if ((m_type != other.m_type) || (m_str != other.m_str))
        return false;

    if (m_str)
        return (m_names == other.m_names) &&
            ((m_type != slice_type) || (m_step == other.m_step));

    switch (m_type)
    {
    case none_type:
        return true;
    case int_type:
        return m_int == other.m_int;
    case list_type:
        return m_list == other.m_list;
    }

    return (m_start == other.m_start) && (m_stop == other.m_stop)
        && (m_step == other.m_step);
}

// --------------------------------------------------------------------------
void mfds_key::to_stream(mfds_binary_stream &bs) const
{
    bs.pack(m_type);
    bs.pack(m_str);
    bs.pack(m_int);
    bs.pack(m_list);
    bs.pack(m_start);
    bs.pack(m_stop);
    bs.pack(m_step);
    bs.pack(m_names);
    bs.pack(m_parent_size);
}

// --------------------------------------------------------------------------
void mfds_key::from_stream(mfds_binary_stream &bs)
{
    bs.unpack(m_type);
    bs.unpack(m_str);
    bs.unpack(m_int);
    bs.unpack(m_list);
    bs.unpack(m_start);
    bs.unpack(m_stop);
    bs.unpack(m_step);
    bs.unpack(m_names);
    bs.unpack(m_parent_size);
}

// **************************************************************************
std::ostream &operator<<(std::ostream &os, const mfds_key &key)
{
    if (key.is_str())
    {
        const std::vector<std::string> &names = key.get_names();
        if (key.is_int())
        {
            os << "'" << names[0] << "'";
        }
        else if (key.is_list())
        {
            os << "[";
            for (size_t i = 0; i < names.size(); ++i)
                os << (i ? ", '" : "'") << names[i] << "'";
            os << "]";
        }
        else
        {
            os << "slice('" << names[0] << "', '" << names[1]
                << "', " << key.get_step() << ")";
        }
        return os;
    }

    switch (key.get_type())
    {
    case mfds_key::none_type:
        os << "None";
        break;
    case mfds_key::int_type:
        os << key.get_int();
        break;
    case mfds_key::list_type:
        os << "[" << key.get_list() << "]";
        break;
    case mfds_key::slice_type:
        os << "slice(";
        if (key.get_start() == mfds_key::nil)
            os << "None";
        else
            os << key.get_start();
        os << ", ";
        if (key.get_stop() == mfds_key::nil)
            os << "None";
        else
            os << key.get_stop();
        os << ", " << key.get_step() << ")";
        break;
    }

    return os;
}
