#ifndef mfds_array_h
#define mfds_array_h

/// @file

#include "mfds_config.h"

#include <iosfwd>
#include <string>
#include <vector>

class mfds_keyring;

/** @brief
 * A dense N-d array of doubles with named dimensions.
 *
 * @details
 * Elements are stored in row major order, the last dimension varies
 * fastest. Allocation fills the array with NaN so that elements that are
 * not loaded can be told apart.
 */
class MFDS_EXPORT mfds_array
{
public:
    mfds_array() = default;
    mfds_array(const std::vector<std::string> &dims,
        const std::vector<long> &shape);

    /// allocate the array. elements are set to NaN
    void resize(const std::vector<std::string> &dims,
        const std::vector<long> &shape);

    /// release the memory
    void clear();

    const std::vector<std::string> &get_dims() const { return m_dims; }
    const std::vector<long> &get_shape() const { return m_shape; }

    /// the number of dimensions
    size_t get_ndim() const { return m_shape.size(); }

    /// the number of elements
    size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }

    /// the position of a dimension or -1 if it is not found
    int get_dim_id(const std::string &dim) const;

    /// the distance in elements between consecutive indices of each dimension
    std::vector<long> get_strides() const;

    double *data() { return m_data.data(); }
    const double *data() const { return m_data.data(); }

    /// access an element by its multi-index
    double &at(const std::vector<long> &idx);
    double at(const std::vector<long> &idx) const;

    /// set every element
    void fill(double val);

    /** reorder the dimensions. order must be a permutation of the dimension
     * names. returns non-zero otherwise.
     */
    int transpose(const std::vector<std::string> &order, mfds_array &out) const;

    /** insert a dimension of size 1 before position pos. returns non-zero if
     * the dimension already exists or pos is out of range.
     */
    int expand_dims(const std::string &dim, size_t pos);

    /** rename a dimension. returns non-zero if it is not found or the new
     * name is in use.
     */
    int rename_dim(const std::string &from, const std::string &to);

    /// the number of elements that are not NaN
    size_t count_valid() const;

private:
    std::vector<std::string> m_dims;
    std::vector<long> m_shape;
    std::vector<double> m_data;
};

MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_array &arr);

/** @brief
 * Moving data between arrays through a keyring.
 *
 * @details
 * Keys are matched to the array dimensions by name, dimensions without a
 * key are taken whole. An integer key selects one index and the dimension
 * is dropped from the taken array (it is absent from the placed chunk).
 * Two strategies select identical elements: the direct strategy does one
 * combined pass computing offsets from the strides, the compound strategy
 * takes one dimension at a time and places with an explicit loop over the
 * destination elements. The direct strategy is only used when
 * has_direct_access is true.
 */
namespace mfds_array_access
{
/** false if more than one key is a list, or a list coexists with an
 * integer key.
 */
MFDS_EXPORT
bool has_direct_access(const mfds_keyring &keys);

/// take the elements selected by keys with a single strided pass
MFDS_EXPORT
int take_direct(const mfds_array &src, const mfds_keyring &keys,
    mfds_array &out);

/// take the elements selected by keys one dimension at a time
MFDS_EXPORT
int take_compound(const mfds_array &src, const mfds_keyring &keys,
    mfds_array &out);

/// place the chunk into the elements of dst selected by keys in one pass
MFDS_EXPORT
int place_direct(mfds_array &dst, const mfds_keyring &keys,
    const mfds_array &chunk);

/// place the chunk into dst looping explicitly over the selected elements
MFDS_EXPORT
int place_compound(mfds_array &dst, const mfds_keyring &keys,
    const mfds_array &chunk);

/** simplify the keys and take using the direct strategy when possible,
 * the compound strategy otherwise.
 */
MFDS_EXPORT
int take(const mfds_array &src, const mfds_keyring &keys, mfds_array &out);

/// simplify the keys and place using the appropriate strategy
MFDS_EXPORT
int place(mfds_array &dst, const mfds_keyring &keys, const mfds_array &chunk);
};

#endif
