#ifndef mfds_dataset_h
#define mfds_dataset_h

/// @file

#include "mfds_config.h"
#include "mfds_coordinate.h"
#include "mfds_filegroup.h"
#include "mfds_available_space.h"
#include "mfds_program_options.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

class mfds_array;
class mfds_keyring;
class mfds_diagnostics;
class mfds_binary_stream;
class mfds_dataset;

using p_mfds_dataset = std::shared_ptr<mfds_dataset>;
using const_p_mfds_dataset = std::shared_ptr<const mfds_dataset>;

/** @brief
 * A collection of filegroups seen as one array addressed by coordinates.
 *
 * @details
 * The dataset owns the coordinates, one per dimension, and the filegroups.
 * scan_all scans every filegroup and reconciles the results into the
 * available space. A selection over the available space, a keyring with one
 * key per dimension, is then loaded with plan_and_load.
 *
 * The dimensions of the loaded array are always the dimensions of the
 * dataset in order, an integer key gives a dimension of size one.
 *
 * ### properties
 *
 * | name             | description                                        |
 * | ---------------- | -------------------------------------------------- |
 * | mode             | default (intersection) or advanced (union)         |
 * | duplicate_policy | reject or keep_first                               |
 * | verbose          | report the properties set from the command line    |
 */
class MFDS_EXPORT mfds_dataset
{
public:
    static p_mfds_dataset New()
    { return p_mfds_dataset(new mfds_dataset); }

#if defined(MFDS_HAS_BOOST)
    MFDS_GET_PROPERTIES_DESCRIPTION()
    MFDS_SET_PROPERTIES()
#endif

    /** @name mode
     * the reconciliation mode, "default" intersects the coordinates of the
     * filegroups, "advanced" takes their union.
     */
    ///@{
    void set_mode(const std::string &mode) { m_mode = mode; }
    const std::string &get_mode() const { return m_mode; }
    ///@}

    /** @name duplicate_policy
     * "reject" makes duplicate data in two filegroups an error,
     * "keep_first" loads it from the first filegroup only.
     */
    ///@{
    void set_duplicate_policy(const std::string &policy)
    { m_duplicate_policy = policy; }

    const std::string &get_duplicate_policy() const
    { return m_duplicate_policy; }
    ///@}

    void set_verbose(int val) { m_verbose = val; }
    int get_verbose() const { return m_verbose; }

    /// add a coordinate. returns non-zero if the name is in use
    int add_coordinate(const p_mfds_coordinate &coord);

    mfds_coordinate_registry &get_coordinates() { return m_coords; }
    const mfds_coordinate_registry &get_coordinates() const { return m_coords; }

    /// the dimensions in order. each must name a coordinate
    void set_dims(const std::vector<std::string> &dims) { m_dims = dims; }
    const std::vector<std::string> &get_dims() const { return m_dims; }

    /// add a filegroup. returns non-zero if the name is in use
    int add_filegroup(const p_mfds_filegroup &fg);

    const std::vector<p_mfds_filegroup> &get_filegroups() const
    { return m_filegroups; }

    /// get a filegroup by name, nullptr if there is none
    p_mfds_filegroup get_filegroup(const std::string &name) const;

    /** scan the filegroups and compute the available space. returns
     * mfds_error::config_error, mfds_error::scan_error or
     * mfds_error::reconciliation_error on failure.
     */
    int scan_all(mfds_diagnostics &diag);

    bool is_scanned() const { return !m_space.empty(); }

    const mfds_available_space &get_available_space() const
    { return m_space; }

    /** normalize a selection over the available space: a key for every
     * dimension in order, names converted to indices, every key a list.
     * returns mfds_error::load_error if the selection is invalid.
     */
    int normalize(const mfds_keyring &request, mfds_keyring &keys,
        mfds_diagnostics &diag) const;

    /** the shape of the array plan_and_load would fill, one entry per
     * dimension. returns mfds_error::load_error if the selection is invalid.
     */
    int get_load_shape(const mfds_keyring &request, std::vector<long> &shape,
        mfds_diagnostics &diag) const;

    /** the load commands of each filegroup for a selection. returns
     * mfds_error::load_error on failure.
     */
    int get_load_commands(const mfds_keyring &request,
        std::vector<std::vector<mfds_load_command>> &commands,
        mfds_diagnostics &diag) const;

    /** load a selection into dst. an empty dst is allocated, otherwise its
     * dimensions and shape must match the selection. a failing file does
     * not stop the others. returns mfds_error::load_error once every
     * command ran if any failed.
     */
    int plan_and_load(const mfds_keyring &request, mfds_array &dst,
        mfds_diagnostics &diag) const;

    /// serialize the coordinates and the scanned state
    void to_stream(mfds_binary_stream &bs) const;

    void print(std::ostream &os) const;

protected:
    mfds_dataset();

private:
    std::string m_mode;
    std::string m_duplicate_policy;
    int m_verbose;
    mfds_coordinate_registry m_coords;
    std::vector<std::string> m_dims;
    std::vector<p_mfds_filegroup> m_filegroups;
    mfds_available_space m_space;
};

MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_dataset &ds);

#endif
