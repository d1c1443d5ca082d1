#include "mfds_string_coordinate.h"
#include "mfds_common.h"
#include "mfds_binary_stream.h"

#include <algorithm>
#include <ostream>

// --------------------------------------------------------------------------
p_mfds_string_coordinate mfds_string_coordinate::New(const std::string &name)
{
    p_mfds_string_coordinate coord = mfds_string_coordinate::New();
    coord->set_name(name);
    return coord;
}

// --------------------------------------------------------------------------
p_mfds_coordinate mfds_string_coordinate::new_copy() const
{
    return p_mfds_string_coordinate(new mfds_string_coordinate(*this));
}

// --------------------------------------------------------------------------
int mfds_string_coordinate::set_names(const std::vector<std::string> &names)
{
    size_t n = names.size();
    for (size_t i = 1; i < n; ++i)
    {
        if (std::find(names.begin(), names.begin() + i, names[i])
            != names.begin() + i)
        {
            MFDS_ERROR("\"" << names[i] << "\" is repeated in coordinate \""
                << m_name << "\"")
            return -1;
        }
    }

    m_names = names;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_string_coordinate::get_index_of_name(const std::string &name,
    long &idx) const
{
    std::vector<std::string>::const_iterator it =
        std::find(m_names.begin(), m_names.end(), name);

    if (it == m_names.end())
    {
        MFDS_ERROR("\"" << name << "\" is not in coordinate \""
            << m_name << "\"")
        return -1;
    }

    idx = it - m_names.begin();
    return 0;
}

// --------------------------------------------------------------------------
std::string mfds_string_coordinate::get_name_of_index(long i) const
{
    long n = m_names.size();
    if (i < 0)
        i += n;

    if ((i < 0) || (i >= n))
    {
        MFDS_ERROR("Index " << i << " is out of bounds of \"" << m_name << "\"")
        return std::string();
    }

    return m_names[i];
}

// --------------------------------------------------------------------------
void mfds_string_coordinate::to_stream(mfds_binary_stream &bs) const
{
    this->mfds_coordinate::to_stream(bs);
    bs.pack(m_names);
}

// --------------------------------------------------------------------------
int mfds_string_coordinate::from_stream(mfds_binary_stream &bs)
{
    if (this->mfds_coordinate::from_stream(bs))
        return -1;
    bs.unpack(m_names);
    return 0;
}

// --------------------------------------------------------------------------
void mfds_string_coordinate::print(std::ostream &os) const
{
    os << m_name << ": " << m_names.size() << " names";
    if (!m_names.empty())
        os << " " << m_names;
}
