#ifndef mfds_key_h
#define mfds_key_h

/// @file

#include "mfds_config.h"
#include "mfds_common.h"

#include <iosfwd>
#include <limits>
#include <string>
#include <vector>

class mfds_coordinate;
class mfds_binary_stream;

/** @brief
 * The selection along one dimension.
 *
 * @details
 * A key is one of
 *
 * | Type       | Meaning |
 * |------------|---------|
 * | none_type  | no index, the dimension is absent |
 * | int_type   | a single index, the dimension is squeezed |
 * | list_type  | a list of indices |
 * | slice_type | start, stop, step, with open bounds marked by mfds_key::nil |
 *
 * Keys used with string valued coordinates (the variable dimension) may hold
 * names instead of indices: a name (int_type), a list of names (list_type),
 * or a slice bounded by names (slice_type, stop included). Names are
 * converted to indices with make_str_idx.
 *
 * The shape of a key is the number of elements it selects, 0 for int and
 * none keys. Slices need the size of the parent sequence to compute their
 * shape, when it is not known the shape is estimated.
 */
class MFDS_EXPORT mfds_key
{
public:
    enum
    {
        none_type = 0,
        int_type = 1,
        list_type = 2,
        slice_type = 3
    };

    /// marks an open slice bound or an unknown parent size
    static constexpr long nil = std::numeric_limits<long>::min();

    /// a none key
    mfds_key();

    /// an integer key
    mfds_key(long i);

    /// a list key
    mfds_key(const std::vector<long> &l);

    /// a slice key. use mfds_key::nil for open bounds
    mfds_key(long start, long stop, long step);

    /// the full slice, selecting everything
    static mfds_key all();

    /// a single variable name
    static mfds_key from_name(const std::string &name);

    /// a list of variable names
    static mfds_key from_names(const std::vector<std::string> &names);

    /** a slice bounded by variable names, both included. An empty name
     * leaves the bound open.
     */
    static mfds_key from_name_slice(const std::string &start,
        const std::string &stop, long step = 1);

    int get_type() const { return m_type; }
    bool is_none() const { return m_type == none_type; }
    bool is_int() const { return m_type == int_type; }
    bool is_list() const { return m_type == list_type; }
    bool is_slice() const { return m_type == slice_type; }

    /// true if the key holds variable names
    bool is_str() const { return m_str; }

    /// true for a slice selecting everything
    bool is_full_slice() const;

    long get_int() const { return m_int; }
    const std::vector<long> &get_list() const { return m_list; }
    long get_start() const { return m_start; }
    long get_stop() const { return m_stop; }
    long get_step() const { return m_step; }
    const std::vector<std::string> &get_names() const { return m_names; }

    /// set/get the size of the sequence the key applies to
    void set_parent_size(long n) { m_parent_size = n; }
    long get_parent_size() const { return m_parent_size; }

    /** returns the number of elements selected. For slices without a parent
     * size the value is an estimate (see is_shape_estimated), 0 when no
     * estimate is possible. Slices of names with a parent size return the
     * parent size, an upper bound also flagged as an estimate.
     */
    long get_shape() const;

    /// true if get_shape can only estimate
    bool is_shape_estimated() const;

    /** convert to the list of selected indices. int keys produce one index.
     * returns non-zero if the indices can not be determined, for instance a
     * slice with open bounds and no parent size.
     */
    int to_list(std::vector<long> &indices) const;

    /** select elements of a sequence. returns non-zero if an index is out of
     * bounds or the key can not be converted to a list.
     */
    template <typename T>
    int apply(const std::vector<T> &seq, std::vector<T> &out) const;

    /// rewrite a list as a slice when the list has a constant step
    void simplify();

    /// convert a slice into a list. returns non-zero if it is not possible
    int make_list();

    /// reverse the order in which indices are taken
    void reverse();

    /// make a list of one element an int
    void make_list_int();

    /// make an int a list of one element
    void make_int_list();

    /** restrict this key by other, which is expressed in the space this key
     * selects. If B = A[this] and C = B[other] then C = A[out]. The result
     * is of the strongest type of the two (int > list > slice).
     * returns non-zero on error.
     */
    int compose(const mfds_key &other, mfds_key &out) const;

    /** concatenate the selections of two keys, the result is a list or a
     * slice when one of the arguments is a slice and it can be written as
     * one.
     */
    int append(const mfds_key &other, mfds_key &out) const;

    /** convert names to indices using the string coordinate. a slice of
     * names requires all the coordinate's values. returns non-zero if a
     * name is not found.
     */
    int make_str_idx(const mfds_coordinate &coord);

    /// convert indices to names using the string coordinate
    int make_idx_str(const mfds_coordinate &coord);

    bool operator==(const mfds_key &other) const;
    bool operator!=(const mfds_key &other) const
    { return !(*this == other); }

    /// serialize/deserialize to/from the stream
    void to_stream(mfds_binary_stream &bs) const;
    void from_stream(mfds_binary_stream &bs);

    /** the list2slice rewrite. returns true and the slice if the list of at
     * least two indices has a constant non-zero step and does not mix
     * negative and positive indices.
     */
    static bool list_to_slice(const std::vector<long> &l,
        long &start, long &stop, long &step);

    /** compute the first index and the number of elements selected by a
     * slice applied to a sequence of size n. negative start and stop count
     * from the end and are clamped to the sequence, nil takes the default
     * for the direction of the step.
     */
    static void slice_indices(long start, long stop, long step, long n,
        long &first, long &count);

    /// reverse the order of a slice, the selected indices are unchanged
    static void reverse_slice(long &start, long &stop, long &step);

private:
    int m_type;
    bool m_str;
    long m_int;
    std::vector<long> m_list;
    long m_start;
    long m_stop;
    long m_step;
    std::vector<std::string> m_names;
    long m_parent_size;
};

/** send the key to the stream, eg. None, 3, [0, 2], slice(0, 5, 2), 'SSH'
 * or ['u', 'v']
 */
MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_key &key);

// --------------------------------------------------------------------------
template <typename T>
int mfds_key::apply(const std::vector<T> &seq, std::vector<T> &out) const
{
    mfds_key tmp(*this);
    tmp.set_parent_size(seq.size());

    std::vector<long> ids;
    if (tmp.to_list(ids))
        return -1;

    long n = seq.size();
    size_t n_ids = ids.size();
    out.reserve(out.size() + n_ids);
    for (size_t i = 0; i < n_ids; ++i)
    {
        long j = ids[i] < 0 ? ids[i] + n : ids[i];
        if ((j < 0) || (j >= n))
        {
            MFDS_ERROR("Index " << ids[i] << " is out of bounds [0, " << n << ")")
            return -1;
        }
        out.push_back(seq[j]);
    }

    return 0;
}

#endif
