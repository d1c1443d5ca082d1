#ifndef mfds_available_space_h
#define mfds_available_space_h

/// @file

#include "mfds_config.h"
#include "mfds_filegroup.h"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

class mfds_coordinate_registry;
class mfds_diagnostics;
class mfds_binary_stream;

/** @brief
 * The values of every coordinate available across the filegroups of a
 * dataset.
 *
 * @details
 * compute reconciles the scans of every filegroup. Numeric coordinates are
 * intersected by default, in advanced mode their union is taken and a
 * filegroup may hold only part of the values. The variable dimension is
 * always the union of the variables in discovery order. Scans that are
 * empty take whatever the others found. When every scan of a coordinate is
 * empty the values set on the coordinate are used.
 *
 * The values found are set on the coordinates, and each scan is told which
 * available index it holds. Finally filegroups holding a common point in
 * every dimension are reported as duplicates. With the keep_first policy
 * the common variables are removed from the later filegroup.
 */
class MFDS_EXPORT mfds_available_space
{
public:
    /// reconciliation modes
    enum
    {
        default_mode = 0,   ///< intersection of the numeric coordinates
        advanced_mode = 1   ///< union of the numeric coordinates
    };

    /// how filegroups with common data are treated
    enum
    {
        reject = 0,         ///< a reconciliation error
        keep_first = 1      ///< the first filegroup keeps the data
    };

    mfds_available_space() = default;

    /** reconcile the scans of the filegroups along each of dims. returns
     * mfds_error::config_error if a coordinate or a scan is missing,
     * mfds_error::scan_error if a coordinate has no value at all and
     * mfds_error::reconciliation_error if the filegroups have no value in
     * common or hold duplicate data under the reject policy.
     */
    int compute(mfds_coordinate_registry &coords,
        const std::vector<p_mfds_filegroup> &filegroups,
        const std::vector<std::string> &dims, int mode,
        int duplicate_policy, mfds_diagnostics &diag);

    void clear() { m_dims.clear(); }
    bool empty() const { return m_dims.empty(); }

    /// the dimensions in dataset order
    std::vector<std::string> get_dims() const;

    /// the number of available values, -1 if the dimension is not known
    long get_size(const std::string &dim) const;
    std::map<std::string, long> get_sizes() const;

    /// the tolerance used to compare values of the dimension
    double get_tolerance(const std::string &dim) const;

    /// the available values. empty for the variable dimension
    const std::vector<double> &get_values(const std::string &dim) const;

    /// the available variables. empty for numeric dimensions
    const std::vector<std::string> &get_names(const std::string &dim) const;

    void to_stream(mfds_binary_stream &bs) const;

    void print(std::ostream &os) const;

    /// parse the name of a mode, returns non-zero if it is not known
    static int get_mode(const std::string &name, int &mode);

    /// parse the name of a duplicate policy, returns non-zero if not known
    static int get_duplicate_policy(const std::string &name, int &policy);

private:
    struct dim_t
    {
        std::string name;
        bool is_string;
        double tolerance;
        std::vector<double> values;
        std::vector<std::string> names;
    };

    const dim_t *find(const std::string &name) const;

    int reconcile(const mfds_coordinate &coord,
        const std::vector<p_mfds_filegroup> &filegroups,
        const std::vector<p_mfds_coord_scan> &scans, int mode, dim_t &dim,
        mfds_diagnostics &diag);

    int check_duplicates(const std::vector<p_mfds_filegroup> &filegroups,
        int duplicate_policy, mfds_diagnostics &diag);

private:
    std::vector<dim_t> m_dims;
};

MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_available_space &space);

#endif
