#include "mfds_keyring.h"
#include "mfds_coordinate.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"

#include <algorithm>
#include <ostream>

// --------------------------------------------------------------------------
mfds_keyring::mfds_keyring(std::initializer_list<value_type> keys)
{
    for (const value_type &kv : keys)
        this->set(kv.first, kv.second);
}

// --------------------------------------------------------------------------
const mfds_key *mfds_keyring::find(const std::string &dim) const
{
    size_t n = m_keys.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_keys[i].first == dim)
            return &m_keys[i].second;
    }
    return nullptr;
}

// --------------------------------------------------------------------------
mfds_key *mfds_keyring::find(const std::string &dim)
{
    return const_cast<mfds_key*>(
        static_cast<const mfds_keyring*>(this)->find(dim));
}

// --------------------------------------------------------------------------
bool mfds_keyring::has(const std::string &dim) const
{
    return this->find(dim) != nullptr;
}

// --------------------------------------------------------------------------
int mfds_keyring::get(const std::string &dim, mfds_key &key) const
{
    const mfds_key *k = this->find(dim);
    if (!k)
        return -1;
    key = *k;
    return 0;
}

// --------------------------------------------------------------------------
void mfds_keyring::set(const std::string &dim, const mfds_key &key)
{
    mfds_key *k = this->find(dim);
    if (k)
        *k = key;
    else
        m_keys.emplace_back(dim, key);
}

// --------------------------------------------------------------------------
mfds_key &mfds_keyring::operator[](const std::string &dim)
{
    mfds_key *k = this->find(dim);
    if (k)
        return *k;

    m_keys.emplace_back(dim, mfds_key());
    return m_keys.back().second;
}

// --------------------------------------------------------------------------
int mfds_keyring::remove(const std::string &dim)
{
    std::vector<value_type>::iterator it = std::find_if(m_keys.begin(),
        m_keys.end(), [&dim](const value_type &kv) { return kv.first == dim; });

    if (it == m_keys.end())
        return -1;

    m_keys.erase(it);
    return 0;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_keyring::get_dims() const
{
    std::vector<std::string> dims;
    dims.reserve(m_keys.size());
    for (const value_type &kv : m_keys)
        dims.push_back(kv.first);
    return dims;
}

// --------------------------------------------------------------------------
void mfds_keyring::make_full(const std::vector<std::string> &dims,
    mfds_diagnostics *diag)
{
    if (diag)
    {
        for (const value_type &kv : m_keys)
        {
            if (std::find(dims.begin(), dims.end(), kv.first) == dims.end())
                MFDS_DIAG_WARNING(*diag, "\"" << kv.first << "\" dimension in"
                    " keyring is not in the full list of dimensions, and might"
                    " be unwanted")
        }
    }

    size_t n_dims = dims.size();
    for (size_t i = 0; i < n_dims; ++i)
    {
        if (!this->has(dims[i]))
            m_keys.emplace_back(dims[i], mfds_key::all());
    }
}

// --------------------------------------------------------------------------
void mfds_keyring::make_total(const std::map<std::string, long> &sizes)
{
    for (value_type &kv : m_keys)
    {
        std::map<std::string, long>::const_iterator it = sizes.find(kv.first);
        if (it == sizes.end())
            continue;

        mfds_key &key = kv.second;
        if (key.is_full_slice() && !key.is_str())
            key = mfds_key(0, it->second, 1);

        key.set_parent_size(it->second);
    }
}

// --------------------------------------------------------------------------
void mfds_keyring::make_int_list()
{
    for (value_type &kv : m_keys)
        kv.second.make_int_list();
}

// --------------------------------------------------------------------------
void mfds_keyring::make_list_int()
{
    for (value_type &kv : m_keys)
        kv.second.make_list_int();
}

// --------------------------------------------------------------------------
void mfds_keyring::simplify()
{
    for (value_type &kv : m_keys)
        kv.second.simplify();
}

// --------------------------------------------------------------------------
int mfds_keyring::make_list()
{
    for (value_type &kv : m_keys)
    {
        if (kv.second.make_list())
        {
            MFDS_ERROR("Failed to convert the key of \"" << kv.first
                << "\" to a list")
            return -1;
        }
    }
    return 0;
}

// --------------------------------------------------------------------------
std::vector<long> mfds_keyring::get_shape(mfds_diagnostics *diag) const
{
    std::vector<long> shape;
    for (const value_type &kv : m_keys)
    {
        const mfds_key &key = kv.second;
        if (key.is_int() || key.is_none())
            continue;

        if (diag && key.is_shape_estimated())
            MFDS_DIAG_NOTICE(*diag, "The size of \"" << kv.first << "\" key "
                << key << " is an estimate")

        shape.push_back(key.get_shape());
    }
    return shape;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_keyring::get_non_zeros() const
{
    std::vector<std::string> dims;
    for (const value_type &kv : m_keys)
    {
        const mfds_key &key = kv.second;
        if (key.is_shape_estimated() || (key.get_shape() > 0))
            dims.push_back(kv.first);
    }
    return dims;
}

// --------------------------------------------------------------------------
bool mfds_keyring::is_shape_equivalent(const mfds_keyring &other) const
{
    std::vector<long> a = this->get_shape();
    std::vector<long> b = other.get_shape();

    if (a.size() != b.size())
        return false;

    size_t n = a.size();
    for (size_t i = 0; i < n; ++i)
    {
        if ((a[i] > 0) && (b[i] > 0) && (a[i] != b[i]))
            return false;
    }

    return true;
}

// --------------------------------------------------------------------------
int mfds_keyring::compose(const mfds_keyring &other, mfds_keyring &out) const
{
    mfds_keyring res;
    for (const value_type &kv : m_keys)
    {
        const mfds_key *okey = other.find(kv.first);
        if (!okey)
        {
            res.m_keys.push_back(kv);
            continue;
        }

        mfds_key key;
        if (kv.second.compose(*okey, key))
        {
            MFDS_ERROR("Failed to compose the keys of \"" << kv.first << "\"")
            return -1;
        }
        res.m_keys.emplace_back(kv.first, key);
    }

    out = res;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_keyring::append(const mfds_keyring &other, mfds_keyring &out) const
{
    mfds_keyring res(*this);
    for (const value_type &kv : other.m_keys)
    {
        mfds_key *key = res.find(kv.first);
        if (!key)
        {
            res.m_keys.push_back(kv);
            continue;
        }

        mfds_key tmp;
        if (key->append(kv.second, tmp))
        {
            MFDS_ERROR("Failed to append the keys of \"" << kv.first << "\"")
            return -1;
        }
        *key = tmp;
    }

    out = res;
    return 0;
}

// --------------------------------------------------------------------------
mfds_keyring mfds_keyring::subset(const std::vector<std::string> &dims) const
{
    mfds_keyring res;
    size_t n_dims = dims.size();
    for (size_t i = 0; i < n_dims; ++i)
    {
        const mfds_key *key = this->find(dims[i]);
        if (key)
            res.m_keys.emplace_back(dims[i], *key);
    }
    return res;
}

// --------------------------------------------------------------------------
void mfds_keyring::sort_by(const std::vector<std::string> &order)
{
    std::vector<value_type> keys;
    keys.reserve(m_keys.size());

    size_t n_dims = order.size();
    for (size_t i = 0; i < n_dims; ++i)
    {
        const mfds_key *key = this->find(order[i]);
        if (key)
            keys.emplace_back(order[i], *key);
    }

    for (const value_type &kv : m_keys)
    {
        if (std::find(order.begin(), order.end(), kv.first) == order.end())
            keys.push_back(kv);
    }

    m_keys.swap(keys);
}

// --------------------------------------------------------------------------
int mfds_keyring::make_str_idx(const mfds_coordinate_registry &coords)
{
    for (value_type &kv : m_keys)
    {
        p_mfds_coordinate coord = coords.get(kv.first);
        if (!coord || !coord->is_string())
            continue;

        if (kv.second.make_str_idx(*coord))
        {
            MFDS_ERROR("Failed to convert names to indices for \""
                << kv.first << "\"")
            return -1;
        }
    }
    return 0;
}

// --------------------------------------------------------------------------
int mfds_keyring::make_idx_str(const mfds_coordinate_registry &coords)
{
    for (value_type &kv : m_keys)
    {
        p_mfds_coordinate coord = coords.get(kv.first);
        if (!coord || !coord->is_string())
            continue;

        if (kv.second.make_idx_str(*coord))
        {
            MFDS_ERROR("Failed to convert indices to names for \""
                << kv.first << "\"")
            return -1;
        }
    }
    return 0;
}

// --------------------------------------------------------------------------
void mfds_keyring::to_stream(mfds_binary_stream &bs) const
{
    bs.pack("mfds_keyring", 12);
    unsigned long n = m_keys.size();
    bs.pack(n);
    for (const value_type &kv : m_keys)
    {
        bs.pack(kv.first);
        kv.second.to_stream(bs);
    }
}

// --------------------------------------------------------------------------
void mfds_keyring::from_stream(mfds_binary_stream &bs)
{
    m_keys.clear();

    if (bs.expect("mfds_keyring"))
    {
        MFDS_ERROR("Invalid stream, mfds_keyring expected")
        return;
    }

    unsigned long n = 0;
    bs.unpack(n);
    for (unsigned long i = 0; (i < n) && bs.good(); ++i)
    {
        value_type kv;
        bs.unpack(kv.first);
        kv.second.from_stream(bs);
        m_keys.push_back(kv);
    }

    if (!bs.good())
    {
        MFDS_ERROR("The stream ends inside a keyring")
        m_keys.clear();
    }
}

// **************************************************************************
std::ostream &operator<<(std::ostream &os, const mfds_keyring &keyring)
{
    os << "{";
    bool first = true;
    for (const mfds_keyring::value_type &kv : keyring)
    {
        os << (first ? "" : ", ") << kv.first << ": " << kv.second;
        first = false;
    }
    os << "}";
    return os;
}
