#ifndef mfds_keyring_h
#define mfds_keyring_h

/// @file

#include "mfds_config.h"
#include "mfds_key.h"

#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

class mfds_diagnostics;
class mfds_coordinate_registry;
class mfds_binary_stream;

/** @brief
 * An ordered mapping from dimension name to mfds_key.
 *
 * @details
 * The keyring is a value type describing a selection over several
 * dimensions. Insertion order is preserved, sort_by reorders the keys.
 * A dimension absent from the keyring is not selected, make_full adds the
 * missing dimensions as full slices.
 */
class MFDS_EXPORT mfds_keyring
{
public:
    using value_type = std::pair<std::string, mfds_key>;
    using iterator = std::vector<value_type>::iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    mfds_keyring() = default;
    mfds_keyring(std::initializer_list<value_type> keys);

    /// returns true if the dimension has a key
    bool has(const std::string &dim) const;

    /// get a key. returns non-zero if the dimension is not present
    int get(const std::string &dim, mfds_key &key) const;

    /// returns a pointer to the key, or nullptr if not present
    mfds_key *find(const std::string &dim);
    const mfds_key *find(const std::string &dim) const;

    /// set a key, appended if the dimension is not present
    void set(const std::string &dim, const mfds_key &key);

    /// access a key, a none key is appended if not present
    mfds_key &operator[](const std::string &dim);

    /// remove a key. returns non-zero if the dimension is not present
    int remove(const std::string &dim);

    size_t size() const { return m_keys.size(); }
    bool empty() const { return m_keys.empty(); }
    void clear() { m_keys.clear(); }

    /// the dimensions in order
    std::vector<std::string> get_dims() const;

    iterator begin() { return m_keys.begin(); }
    iterator end() { return m_keys.end(); }
    const_iterator begin() const { return m_keys.begin(); }
    const_iterator end() const { return m_keys.end(); }

    /** add the dimensions not present as full slices. dimensions present
     * in the keyring but not in the list are reported as unwanted through
     * diag when it is given.
     */
    void make_full(const std::vector<std::string> &dims,
        mfds_diagnostics *diag = nullptr);

    /** set the parent size of each key from the map. full slices on
     * dimensions found in the map are rewritten as explicit slices
     * 0:size.
     */
    void make_total(const std::map<std::string, long> &sizes);

    /// turn integer keys into lists of one element
    void make_int_list();

    /// turn lists of one element into integer keys
    void make_list_int();

    /// rewrite lists as slices where possible
    void simplify();

    /// turn every slice into a list. returns non-zero on error
    int make_list();

    /** returns the shape of the selection. dimensions with a scalar key
     * (int or none) are omitted. when a slice size has to be estimated a
     * notice is sent to diag.
     */
    std::vector<long> get_shape(mfds_diagnostics *diag = nullptr) const;

    /// dimensions that are not squeezed, ie whose key shape is not 0
    std::vector<std::string> get_non_zeros() const;

    /** true if the shapes match. dimensions whose size can not be
     * determined match any size.
     */
    bool is_shape_equivalent(const mfds_keyring &other) const;

    /** restrict this keyring by other, expressed in the space this keyring
     * selects. dimensions absent from other are kept unchanged. returns
     * non-zero on error.
     */
    int compose(const mfds_keyring &other, mfds_keyring &out) const;

    /** concatenate the selections of two keyrings dimension by dimension.
     * dimensions only in other are added.
     */
    int append(const mfds_keyring &other, mfds_keyring &out) const;

    /// a copy holding only the given dimensions, those absent are skipped
    mfds_keyring subset(const std::vector<std::string> &dims) const;

    /** order the keys by the given dimensions. dimensions not in the list
     * are moved to the end keeping their relative order.
     */
    void sort_by(const std::vector<std::string> &order);

    /// convert names to indices for the string coordinates in the registry
    int make_str_idx(const mfds_coordinate_registry &coords);

    /// convert indices to names for the string coordinates in the registry
    int make_idx_str(const mfds_coordinate_registry &coords);

    bool operator==(const mfds_keyring &other) const
    { return m_keys == other.m_keys; }

    bool operator!=(const mfds_keyring &other) const
    { return !(*this == other); }

    /// serialize/deserialize to/from the stream
    void to_stream(mfds_binary_stream &bs) const;
    void from_stream(mfds_binary_stream &bs);

private:
    std::vector<value_type> m_keys;
};

/// send the keyring to the stream, eg. {time: slice(0, 5, 2), depth: 0}
MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_keyring &keyring);

#endif
