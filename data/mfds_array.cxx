#include "mfds_array.h"
#include "mfds_keyring.h"
#include "mfds_common.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>

// --------------------------------------------------------------------------
mfds_array::mfds_array(const std::vector<std::string> &dims,
    const std::vector<long> &shape)
{
    this->resize(dims, shape);
}

// --------------------------------------------------------------------------
void mfds_array::resize(const std::vector<std::string> &dims,
    const std::vector<long> &shape)
{
    m_dims = dims;
    m_shape = shape;

    size_t n = 1;
    size_t n_dims = shape.size();
    for (size_t i = 0; i < n_dims; ++i)
        n *= shape[i];

    m_data.assign(n, std::numeric_limits<double>::quiet_NaN());
}

// --------------------------------------------------------------------------
void mfds_array::clear()
{
    m_dims.clear();
    m_shape.clear();
    m_data.clear();
}

// --------------------------------------------------------------------------
int mfds_array::get_dim_id(const std::string &dim) const
{
    std::vector<std::string>::const_iterator it =
        std::find(m_dims.begin(), m_dims.end(), dim);

    if (it == m_dims.end())
        return -1;

    return it - m_dims.begin();
}

// --------------------------------------------------------------------------
std::vector<long> mfds_array::get_strides() const
{
    long n_dims = m_shape.size();
    std::vector<long> strides(n_dims, 1);
    for (long i = n_dims - 1; i > 0; --i)
        strides[i-1] = strides[i]*m_shape[i];
    return strides;
}

// --------------------------------------------------------------------------
double &mfds_array::at(const std::vector<long> &idx)
{
    size_t off = 0;
    size_t n_dims = m_shape.size();
    for (size_t i = 0; i < n_dims; ++i)
        off = off*m_shape[i] + idx[i];
    return m_data[off];
}

// --------------------------------------------------------------------------
double mfds_array::at(const std::vector<long> &idx) const
{
    return const_cast<mfds_array*>(this)->at(idx);
}

// --------------------------------------------------------------------------
void mfds_array::fill(double val)
{
    std::fill(m_data.begin(), m_data.end(), val);
}

// --------------------------------------------------------------------------
size_t mfds_array::count_valid() const
{
    return std::count_if(m_data.begin(), m_data.end(),
        [](double v) { return !std::isnan(v); });
}

// --------------------------------------------------------------------------
int mfds_array::transpose(const std::vector<std::string> &order,
    mfds_array &out) const
{
    size_t n_dims = m_dims.size();
    if (order.size() != n_dims)
    {
        MFDS_ERROR("Can not transpose dimensions [" << m_dims << "] to ["
            << order << "]")
        return -1;
    }

    // axis of the source for each axis of the output
    std::vector<long> perm(n_dims);
    std::vector<long> out_shape(n_dims);
    for (size_t i = 0; i < n_dims; ++i)
    {
        int j = this->get_dim_id(order[i]);
        if ((j < 0) || (std::count(order.begin(), order.end(), order[i]) != 1))
        {
            MFDS_ERROR("Can not transpose dimensions [" << m_dims << "] to ["
                << order << "]")
            return -1;
        }
        perm[i] = j;
        out_shape[i] = m_shape[j];
    }

    mfds_array tmp(order, out_shape);

    std::vector<long> strides = this->get_strides();
    std::vector<long> idx(n_dims, 0);
    size_t n = m_data.size();
    for (size_t k = 0; k < n; ++k)
    {
        size_t off = 0;
        for (size_t i = 0; i < n_dims; ++i)
            off += idx[i]*strides[perm[i]];

        tmp.m_data[k] = m_data[off];

        for (long i = long(n_dims) - 1; i >= 0; --i)
        {
            if (++idx[i] < out_shape[i])
                break;
            idx[i] = 0;
        }
    }

    out = std::move(tmp);
    return 0;
}

// --------------------------------------------------------------------------
int mfds_array::expand_dims(const std::string &dim, size_t pos)
{
    if ((pos > m_dims.size()) || (this->get_dim_id(dim) >= 0))
    {
        MFDS_ERROR("Can not insert dimension \"" << dim << "\" at " << pos
            << " in [" << m_dims << "]")
        return -1;
    }

    m_dims.insert(m_dims.begin() + pos, dim);
    m_shape.insert(m_shape.begin() + pos, 1);

    if (m_data.empty())
        m_data.assign(1, std::numeric_limits<double>::quiet_NaN());

    return 0;
}

// --------------------------------------------------------------------------
int mfds_array::rename_dim(const std::string &from, const std::string &to)
{
    if (from == to)
        return 0;

    int id = this->get_dim_id(from);
    if ((id < 0) || (this->get_dim_id(to) >= 0))
    {
        MFDS_ERROR("Can not rename dimension \"" << from << "\" to \""
            << to << "\" in [" << m_dims << "]")
        return -1;
    }

    m_dims[id] = to;
    return 0;
}

// **************************************************************************
std::ostream &operator<<(std::ostream &os, const mfds_array &arr)
{
    os << "array(";
    size_t n_dims = arr.get_ndim();
    for (size_t i = 0; i < n_dims; ++i)
        os << (i ? ", " : "") << arr.get_dims()[i] << "=" << arr.get_shape()[i];
    os << ")";
    return os;
}

namespace mfds_array_access
{
namespace internal
{
// **************************************************************************
int resolve_indices(const mfds_array &arr, const mfds_keyring &keys,
    std::vector<std::vector<long>> &ids, std::vector<bool> &squeeze)
{
    for (const mfds_keyring::value_type &kv : keys)
    {
        if (arr.get_dim_id(kv.first) < 0)
        {
            MFDS_ERROR("Key on \"" << kv.first << "\" but the array has"
                " dimensions [" << arr.get_dims() << "]")
            return -1;
        }
    }

    const std::vector<std::string> &dims = arr.get_dims();
    const std::vector<long> &shape = arr.get_shape();

    size_t n_dims = dims.size();
    ids.resize(n_dims);
    squeeze.assign(n_dims, false);

    for (size_t i = 0; i < n_dims; ++i)
    {
        mfds_key key = mfds_key::all();
        const mfds_key *pkey = keys.find(dims[i]);
        if (pkey)
            key = *pkey;

        if (key.is_none() || key.is_str())
        {
            MFDS_ERROR("Key " << key << " on \"" << dims[i]
                << "\" does not select array indices")
            return -1;
        }

        key.set_parent_size(shape[i]);

        std::vector<long> &did = ids[i];
        did.clear();
        if (key.to_list(did))
            return -1;

        size_t n_ids = did.size();
        for (size_t j = 0; j < n_ids; ++j)
        {
            long id = did[j] < 0 ? did[j] + shape[i] : did[j];
            if ((id < 0) || (id >= shape[i]))
            {
                MFDS_ERROR("Index " << did[j] << " is out of bounds for \""
                    << dims[i] << "\" of size " << shape[i])
                return -1;
            }
            did[j] = id;
        }

        squeeze[i] = key.is_int();
    }

    return 0;
}

// **************************************************************************
void get_taken_shape(const mfds_array &arr,
    const std::vector<std::vector<long>> &ids, const std::vector<bool> &squeeze,
    std::vector<std::string> &dims, std::vector<long> &shape)
{
    size_t n_dims = ids.size();
    for (size_t i = 0; i < n_dims; ++i)
    {
        if (squeeze[i])
            continue;
        dims.push_back(arr.get_dims()[i]);
        shape.push_back(ids[i].size());
    }
}

// **************************************************************************
int check_chunk(const mfds_array &dst, const mfds_array &chunk,
    const std::vector<std::vector<long>> &ids, const std::vector<bool> &squeeze)
{
    std::vector<std::string> dims;
    std::vector<long> shape;
    get_taken_shape(dst, ids, squeeze, dims, shape);

    if ((shape != chunk.get_shape()) ||
        (!chunk.get_dims().empty() && (dims != chunk.get_dims())))
    {
        MFDS_ERROR("The chunk " << chunk << " does not match the selection "
            "of shape [" << shape << "] over [" << dims << "]")
        return -1;
    }

    return 0;
}
};

// **************************************************************************
bool has_direct_access(const mfds_keyring &keys)
{
    int n_list = 0;
    int n_int = 0;
    for (const mfds_keyring::value_type &kv : keys)
    {
        n_list += kv.second.is_list() ? 1 : 0;
        n_int += kv.second.is_int() ? 1 : 0;
    }

    return (n_list < 2) && !((n_list == 1) && (n_int > 0));
}

// **************************************************************************
int take_direct(const mfds_array &src, const mfds_keyring &keys,
    mfds_array &out)
{
    std::vector<std::vector<long>> ids;
    std::vector<bool> squeeze;
    if (internal::resolve_indices(src, keys, ids, squeeze))
        return -1;

    std::vector<std::string> dims;
    std::vector<long> shape;
    internal::get_taken_shape(src, ids, squeeze, dims, shape);

    mfds_array tmp(dims, shape);

    std::vector<long> strides = src.get_strides();
    long n_dims = ids.size();
    std::vector<long> idx(n_dims, 0);

    const double *psrc = src.data();
    double *pout = tmp.data();
    size_t n = tmp.size();
    for (size_t k = 0; k < n; ++k)
    {
        long off = 0;
        for (long i = 0; i < n_dims; ++i)
            off += ids[i][idx[i]]*strides[i];

        pout[k] = psrc[off];

        for (long i = n_dims - 1; i >= 0; --i)
        {
            if (++idx[i] < long(ids[i].size()))
                break;
            idx[i] = 0;
        }
    }

    out = std::move(tmp);
    return 0;
}

// **************************************************************************
int take_compound(const mfds_array &src, const mfds_keyring &keys,
    mfds_array &out)
{
    std::vector<std::vector<long>> ids;
    std::vector<bool> squeeze;
    if (internal::resolve_indices(src, keys, ids, squeeze))
        return -1;

    mfds_array cur(src);
    size_t n_dims = ids.size();
    for (size_t d = 0; d < n_dims; ++d)
    {
        // take along dimension d
        std::vector<long> shape = cur.get_shape();

        long n_outer = 1;
        for (size_t i = 0; i < d; ++i)
            n_outer *= shape[i];

        long n_inner = 1;
        for (size_t i = d + 1; i < n_dims; ++i)
            n_inner *= shape[i];

        long n_in = shape[d];
        long n_sel = ids[d].size();
        shape[d] = n_sel;

        mfds_array next(cur.get_dims(), shape);

        const double *pcur = cur.data();
        double *pnext = next.data();
        for (long o = 0; o < n_outer; ++o)
        {
            for (long j = 0; j < n_sel; ++j)
            {
                const double *pin = pcur + (o*n_in + ids[d][j])*n_inner;
                double *pdst = pnext + (o*n_sel + j)*n_inner;
                std::copy(pin, pin + n_inner, pdst);
            }
        }

        cur = std::move(next);
    }

    // drop the dimensions selected by an integer, they have size 1 now
    std::vector<std::string> dims;
    std::vector<long> shape;
    internal::get_taken_shape(cur, ids, squeeze, dims, shape);

    out.resize(dims, shape);
    std::copy(cur.data(), cur.data() + cur.size(), out.data());

    return 0;
}

// **************************************************************************
int place_direct(mfds_array &dst, const mfds_keyring &keys,
    const mfds_array &chunk)
{
    std::vector<std::vector<long>> ids;
    std::vector<bool> squeeze;
    if (internal::resolve_indices(dst, keys, ids, squeeze) ||
        internal::check_chunk(dst, chunk, ids, squeeze))
        return -1;

    std::vector<long> strides = dst.get_strides();
    long n_dims = ids.size();
    std::vector<long> idx(n_dims, 0);

    double *pdst = dst.data();
    const double *pchunk = chunk.data();
    size_t n = chunk.size();
    for (size_t k = 0; k < n; ++k)
    {
        long off = 0;
        for (long i = 0; i < n_dims; ++i)
            off += ids[i][idx[i]]*strides[i];

        pdst[off] = pchunk[k];

        for (long i = n_dims - 1; i >= 0; --i)
        {
            if (++idx[i] < long(ids[i].size()))
                break;
            idx[i] = 0;
        }
    }

    return 0;
}

// **************************************************************************
int place_compound(mfds_array &dst, const mfds_keyring &keys,
    const mfds_array &chunk)
{
    std::vector<std::vector<long>> ids;
    std::vector<bool> squeeze;
    if (internal::resolve_indices(dst, keys, ids, squeeze) ||
        internal::check_chunk(dst, chunk, ids, squeeze))
        return -1;

    const std::vector<long> &chunk_shape = chunk.get_shape();
    size_t n_dims = ids.size();
    size_t n_chunk_dims = chunk_shape.size();

    std::vector<long> chunk_idx(n_chunk_dims);
    std::vector<long> dst_idx(n_dims);

    size_t n = chunk.size();
    for (size_t k = 0; k < n; ++k)
    {
        // chunk multi-index of element k
        size_t rem = k;
        for (long i = long(n_chunk_dims) - 1; i >= 0; --i)
        {
            chunk_idx[i] = rem % chunk_shape[i];
            rem /= chunk_shape[i];
        }

        // the destination element it goes to
        for (size_t i = 0, j = 0; i < n_dims; ++i)
            dst_idx[i] = squeeze[i] ? ids[i][0] : ids[i][chunk_idx[j++]];

        dst.at(dst_idx) = chunk.at(chunk_idx);
    }

    return 0;
}

// **************************************************************************
int take(const mfds_array &src, const mfds_keyring &keys, mfds_array &out)
{
    mfds_keyring skeys(keys);
    skeys.simplify();

    if (has_direct_access(skeys))
        return take_direct(src, skeys, out);

    return take_compound(src, skeys, out);
}

// **************************************************************************
int place(mfds_array &dst, const mfds_keyring &keys, const mfds_array &chunk)
{
    mfds_keyring skeys(keys);
    skeys.simplify();

    if (has_direct_access(skeys))
        return place_direct(dst, skeys, chunk);

    return place_compound(dst, skeys, chunk);
}
};
