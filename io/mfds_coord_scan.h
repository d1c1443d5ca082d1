#ifndef mfds_coord_scan_h
#define mfds_coord_scan_h

/// @file

#include "mfds_config.h"
#include "mfds_coordinate.h"
#include "mfds_key.h"
#include "mfds_scan_library.h"

#include <functional>
#include <iosfwd>
#include <memory>
#include <set>
#include <string>
#include <vector>

class mfds_diagnostics;
class mfds_binary_stream;
class mfds_coord_scan;

using p_mfds_coord_scan = std::shared_ptr<mfds_coord_scan>;
using const_p_mfds_coord_scan = std::shared_ptr<const mfds_coord_scan>;

/// converts values between units, returns non-zero on error
using mfds_unit_converter = std::function<int(const std::string &from,
    const std::string &to, std::vector<double> &values)>;

/** @brief
 * The scanning state of one coordinate in one filegroup.
 *
 * @details
 * Position i of the scan holds the i-th value (a name for string
 * coordinates), its index in the file (-1 when the coordinate is not
 * represented in the file, the variable name for string coordinates) and,
 * for shared coordinates, the text the matchers captured in the name of
 * the file holding it. These are kept in lockstep.
 *
 * An in coordinate varies inside the files, only the first file is
 * scanned. A shared coordinate varies across files, every file is scanned
 * and files whose captures were already seen are skipped.
 *
 * The scan functions run in the order they were added, each sets the
 * elements it declares. Values may instead be set manually: the i-th
 * distinct capture tuple is then associated with the i-th value.
 *
 * Once finished, the values are sorted, checked for strict monotonicity
 * and converted to the units of the coordinate. A scan with neither scan
 * functions nor manual values is empty: it takes whatever the available
 * space holds.
 *
 * After reconciliation contains maps each index of the available space to
 * an index of the scan, or -1.
 */
class MFDS_EXPORT mfds_coord_scan
{
public:
    /// scan status
    enum
    {
        unscanned = 0,
        scanning = 1,
        scanned = 2,
        manually_set = 3
    };

    static p_mfds_coord_scan New(const p_mfds_coordinate &coord, bool shared)
    { return p_mfds_coord_scan(new mfds_coord_scan(coord, shared)); }

    /// a deep copy, sharing the coordinate
    p_mfds_coord_scan new_copy() const
    { return p_mfds_coord_scan(new mfds_coord_scan(*this)); }

    const p_mfds_coordinate &get_coordinate() const { return m_coord; }
    const std::string &get_name() const { return m_coord->get_name(); }

    bool is_shared() const { return m_shared; }
    bool is_string() const { return m_coord->is_string(); }

    /** add a scan function. returns non-zero if a filename function is
     * added to a coordinate that has no matcher, or if the function is
     * empty.
     */
    int add_scan_function(const mfds_scan_function_info &info);

    const std::vector<mfds_scan_function_info> &get_scan_functions() const
    { return m_functions; }

    /// true if a function needs the file opened
    bool needs_file() const;

    /// the matchers of the filegroup's pre-regex bound to this coordinate
    void set_matchers(const std::vector<int> &ids) { m_matchers = ids; }
    const std::vector<int> &get_matchers() const { return m_matchers; }

    /** fix the in-file index of every value, used when no function
     * provides it. -1 marks the coordinate as not represented in the file.
     */
    void set_constant_in_idx(long idx)
    { m_constant_in_idx = idx; m_has_constant_in_idx = true; }

    bool has_constant_in_idx() const { return m_has_constant_in_idx; }
    long get_constant_in_idx() const { return m_constant_in_idx; }

    /** set the values manually. shared coordinates still match the file
     * names, the i-th distinct capture tuple takes the i-th value.
     */
    void set_manual_values(const std::vector<double> &values);
    void set_manual_names(const std::vector<std::string> &names);
    bool is_manual() const { return m_manual; }

    /// set a function converting the scanned values to the coordinate units
    void set_unit_converter(const mfds_unit_converter &conv)
    { m_converter = conv; }

    /** mirror the in-file indices of an empty scan, i -> size - i - 1.
     * scans with values find the direction from the in-file indices.
     */
    void set_force_index_descending(bool val) { m_force_descending = val; }
    bool get_force_index_descending() const { return m_force_descending; }

    /** set the tolerance used to compare the values of this scan. when
     * unset, or negative, the tolerance of the coordinate is used.
     */
    void set_tolerance(double tol) { m_tolerance = tol; }
    double get_tolerance() const;

    /// select by index before reconciliation
    void set_selection(const mfds_key &key);

    /// select the values in [vmin, vmax] before reconciliation
    void set_selection_range(double vmin, double vmax);

    bool has_selection() const { return m_selection_kind != no_selection; }

    /// forget the scanned state, the configuration is kept
    void reset();

    /// true if there is nothing to scan
    bool is_empty() const { return m_functions.empty() && !m_manual; }

    /** true if the file should be scanned. in coordinates scan one file,
     * shared coordinates scan files with unseen captures.
     */
    bool wants_file(const std::vector<std::string> &captures) const;

    /** run the scan functions on one file. returns mfds_error::scan_error
     * if a function fails or the elements found are inconsistent.
     */
    int scan_file(mfds_scan_context &ctx, mfds_diagnostics &diag);

    /** finish scanning: associate manual values, sort, check monotonicity,
     * convert units, apply the selection. returns mfds_error::scan_error on
     * failure.
     */
    int finish(mfds_diagnostics &diag);

    int get_status() const { return m_status; }

    /// the number of values
    long size() const;

    const std::vector<double> &get_values() const { return m_values; }
    const std::vector<std::string> &get_names() const { return m_names; }
    const std::vector<long> &get_in_idx() const { return m_in_idx; }
    const std::vector<std::string> &get_in_names() const { return m_in_names; }
    const std::vector<std::vector<std::string>> &get_matches() const
    { return m_matches; }

    /// the units the values were scanned in
    const std::string &get_scanned_units() const { return m_units; }

    /** true if the in-file indices run opposite to the values. this is
     * the case of empty scans flagged with set_force_index_descending.
     */
    bool is_index_descending() const;

    /** set the mapping from available index to scan index, -1 where the
     * scan does not hold the available value. an empty contains on an
     * empty scan maps every available index to itself.
     */
    void set_contains(const std::vector<long> &contains, long available_size);
    const std::vector<long> &get_contains() const { return m_contains; }
    long get_available_size() const { return m_available_size; }

    /** the in-file index of the value at available index i, -1 when the
     * coordinate is not in the file. returns non-zero if the scan does not
     * hold the value.
     */
    int get_in_index(long i, long &in_idx, long &scan_idx) const;

    /// serialize the scanned state
    void to_stream(mfds_binary_stream &bs) const;
    int from_stream(mfds_binary_stream &bs);

    /// send a summary to the stream
    void print(std::ostream &os) const;

protected:
    mfds_coord_scan(const p_mfds_coordinate &coord, bool shared);
    mfds_coord_scan(const mfds_coord_scan &) = default;

    int apply_selection(mfds_diagnostics &diag);
    void take(const std::vector<long> &ids);

private:
    enum
    {
        no_selection = 0,
        index_selection = 1,
        range_selection = 2
    };

    p_mfds_coordinate m_coord;
    bool m_shared;
    std::vector<mfds_scan_function_info> m_functions;
    std::vector<int> m_matchers;
    bool m_has_constant_in_idx;
    long m_constant_in_idx;
    bool m_manual;
    std::vector<double> m_manual_values;
    std::vector<std::string> m_manual_names;
    mfds_unit_converter m_converter;
    bool m_force_descending;
    double m_tolerance;
    int m_selection_kind;
    mfds_key m_selection;
    double m_selection_min;
    double m_selection_max;

    int m_status;
    long m_n_files;
    std::set<std::vector<std::string>> m_seen;
    std::vector<double> m_values;
    std::vector<std::string> m_names;
    std::vector<long> m_in_idx;
    std::vector<std::string> m_in_names;
    std::vector<std::vector<std::string>> m_matches;
    std::string m_units;
    bool m_descending;
    std::vector<long> m_contains;
    long m_available_size;
};

MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_coord_scan &cs);

#endif
