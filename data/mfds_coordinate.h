#ifndef mfds_coordinate_h
#define mfds_coordinate_h

/// @file

#include "mfds_config.h"

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

class mfds_key;
class mfds_binary_stream;
class mfds_coordinate;

using p_mfds_coordinate = std::shared_ptr<mfds_coordinate>;
using const_p_mfds_coordinate = std::shared_ptr<const mfds_coordinate>;

/** @brief
 * The interface to a coordinate, the ordered values identifying positions
 * along one dimension of the dataset.
 *
 * @details
 * A coordinate has a name, units, alternate names and a tolerance used when
 * comparing values. Numeric coordinates (see mfds_numeric_coordinate and
 * mfds_time_coordinate) hold strictly increasing values and support
 * locating values. String coordinates (see mfds_string_coordinate) hold
 * names, they are used for the variable dimension. The capability methods
 * of the other kind report an error.
 */
class MFDS_EXPORT mfds_coordinate
{
public:
    /// location policy used by get_index
    enum
    {
        closest = 0,
        below = 1,
        above = 2
    };

    virtual ~mfds_coordinate() {}

    /** construct a coordinate of the named type, one of numeric, time or
     * string. returns nullptr if the type is not known.
     */
    static p_mfds_coordinate New(const std::string &type);

    /// the type name passed to New
    virtual const char *get_type_name() const = 0;

    /// a deep copy
    virtual p_mfds_coordinate new_copy() const = 0;

    /// true for string valued coordinates
    virtual bool is_string() const = 0;

    /// true for time coordinates
    virtual bool is_time() const { return false; }

    /// the number of values
    virtual long get_size() const = 0;

    void set_name(const std::string &name) { m_name = name; }
    const std::string &get_name() const { return m_name; }

    void set_units(const std::string &units) { m_units = units; }
    const std::string &get_units() const { return m_units; }

    void set_alt_names(const std::vector<std::string> &names)
    { m_alt_names = names; }

    const std::vector<std::string> &get_alt_names() const
    { return m_alt_names; }

    /// set the tolerance used when comparing values, the default is 1e-5
    void set_tolerance(double tol) { m_tolerance = tol; }
    double get_tolerance() const { return m_tolerance; }

    /// true if name is the name of the coordinate or one of its alt names
    bool has_name(const std::string &name) const;

    /** @name numeric capability
     * Methods supported by numeric coordinates.
     */
    ///@{
    /** set the values. returns non-zero if they are not strictly
     * increasing.
     */
    virtual int set_values(const std::vector<double> &values);
    virtual const std::vector<double> &get_values() const;

    /** locate a value. loc is one of closest, below or above. returns
     * non-zero if no index satisfies the policy.
     */
    virtual int get_index(double value, long &idx, int loc = closest) const;

    /** get a slice key selecting the values in [vmin, vmax]. returns
     * non-zero if no value is in the range.
     */
    virtual int subset(double vmin, double vmax, mfds_key &key) const;
    ///@}

    /** @name string capability
     * Methods supported by string coordinates.
     */
    ///@{
    virtual int set_names(const std::vector<std::string> &names);
    virtual const std::vector<std::string> &get_names() const;

    /// returns non-zero if the name is not found
    virtual int get_index_of_name(const std::string &name, long &idx) const;

    /// returns the i-th name
    virtual std::string get_name_of_index(long i) const;
    ///@}

    /// serialize/deserialize to/from the stream
    virtual void to_stream(mfds_binary_stream &bs) const;
    virtual int from_stream(mfds_binary_stream &bs);

    /// send a human readable description to the stream
    virtual void print(std::ostream &os) const = 0;

protected:
    mfds_coordinate();
    mfds_coordinate(const mfds_coordinate &) = default;
    mfds_coordinate &operator=(const mfds_coordinate &) = default;

protected:
    std::string m_name;
    std::string m_units;
    std::vector<std::string> m_alt_names;
    double m_tolerance;
};

MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_coordinate &coord);

/** @brief
 * Coordinates of a dataset, looked up by name.
 *
 * @details
 * The registry keeps the coordinates in insertion order. Lookups match the
 * name or any of the alternate names.
 */
class MFDS_EXPORT mfds_coordinate_registry
{
public:
    /// add a coordinate. returns non-zero if the name is already in use
    int add(const p_mfds_coordinate &coord);

    /// returns the coordinate or nullptr if there is none by that name
    p_mfds_coordinate get(const std::string &name) const;

    bool has(const std::string &name) const
    { return this->get(name) != nullptr; }

    size_t size() const { return m_coords.size(); }
    const p_mfds_coordinate &get(size_t i) const { return m_coords[i]; }

    /// the coordinate names in insertion order
    std::vector<std::string> get_names() const;

    /// the size of each coordinate
    std::map<std::string, long> get_sizes() const;

    /// a registry holding deep copies of the coordinates
    mfds_coordinate_registry new_copy() const;

    void clear() { m_coords.clear(); }

    /// serialize/deserialize to/from the stream
    void to_stream(mfds_binary_stream &bs) const;
    int from_stream(mfds_binary_stream &bs);

private:
    std::vector<p_mfds_coordinate> m_coords;
};

#endif
