#ifndef mfds_dataset_config_h
#define mfds_dataset_config_h

/// @file

#include "mfds_config.h"
#include "mfds_mpi.h"
#include "mfds_dataset.h"
#include "mfds_file_util.h"

#include <string>
#include <vector>

class mfds_diagnostics;
class mfds_binary_stream;

/** @brief
 * Reads the description of a dataset from a configuration file.
 *
 * @details
 * The file holds global settings followed by sections. Lines starting with
 * # are comments. For instance:
 *
 * ```
 * data_root = /data/ocean
 * dims = time, lat, lon, var
 * mode = default
 * duplicate_policy = reject
 *
 * [coordinate]
 * name = time
 * type = time
 * units = hours since 1970-01-01 00:00:00
 *
 * [coordinate]
 * name = var
 * type = string
 *
 * [filegroup]
 * name = ssh
 * root = %data_root%/SSH
 * pattern = SSH_%(time:x)\.nc
 * format = netcdf
 * in = lat, lon, var
 * shared = time
 * variables = SSH
 * scan = time:filename_date, lat:in_file_values, lon:in_file_values
 * ```
 *
 * Global settings: data_root, substituted for %data_root% in the roots of
 * the filegroups, dims, the dimensions in order, mode and duplicate_policy.
 *
 * [coordinate] sections: name, type (numeric, time or string), units,
 * alt_names, tolerance and values. The values are used when no filegroup
 * scans the coordinate.
 *
 * [filegroup] sections: name, root, pattern (a pre-regex), format, in and
 * shared (the coordinates varying inside and across files), variables
 * (the variables held, fixed instead of scanned), max_depth, scan
 * (coord:function pairs from the scan library), index (coord:value, a
 * constant in-file index, "none" when the coordinate is not in the files),
 * mirror (coordinates whose in-file indices run backward), order (the
 * order of the axes in the files), select (coord:lo:hi ranges kept) and
 * tolerance (coord:value, overrides the tolerance of the coordinate for
 * this filegroup).
 *
 * read parses the file on rank 0 and broadcasts the result.
 */
class MFDS_EXPORT mfds_dataset_config
{
public:
    /// the options of a [coordinate] section
    struct MFDS_EXPORT coordinate_options
    {
        coordinate_options() : type("numeric"), tolerance(-1.0) {}

        int parse_line(char *line, unsigned long line_no);

        void to_stream(mfds_binary_stream &bs) const;
        int from_stream(mfds_binary_stream &bs);

        std::string name;
        std::string type;
        std::string units;
        std::vector<std::string> alt_names;
        double tolerance;
        std::vector<std::string> values;
    };

    /// the options of a [filegroup] section
    struct MFDS_EXPORT filegroup_options
    {
        filegroup_options() : max_depth(-1) {}

        int parse_line(char *line, unsigned long line_no);

        void to_stream(mfds_binary_stream &bs) const;
        int from_stream(mfds_binary_stream &bs);

        std::string name;
        std::string root;
        std::string pattern;
        std::string format;
        std::vector<std::string> in;
        std::vector<std::string> shared;
        std::vector<std::string> variables;
        int max_depth;
        std::vector<std::string> scan;
        std::vector<std::string> index;
        std::vector<std::string> mirror;
        std::vector<std::string> order;
        std::vector<std::string> select;
        std::vector<std::string> tolerance;
    };

    mfds_dataset_config() = default;

    /** read the file on rank 0 of comm and broadcast it. returns
     * mfds_error::config_error if it can not be read or parsed.
     */
    int read(const std::string &file_name, MPI_Comm comm,
        mfds_diagnostics &diag);

    /** parse the text of a configuration. returns mfds_error::config_error
     * on a syntax error.
     */
    int parse(const std::string &text, mfds_diagnostics &diag);

    /** create the coordinates and filegroups of the dataset. returns
     * mfds_error::config_error if the options are inconsistent.
     */
    int configure(mfds_dataset &ds, mfds_diagnostics &diag) const;

    const std::string &get_data_root() const { return m_data_root; }
    const std::vector<std::string> &get_dims() const { return m_dims; }
    const std::string &get_mode() const { return m_mode; }
    const std::string &get_duplicate_policy() const { return m_duplicate_policy; }

    const std::vector<coordinate_options> &get_coordinates() const
    { return m_coordinates; }

    const std::vector<filegroup_options> &get_filegroups() const
    { return m_filegroups; }

    void to_stream(mfds_binary_stream &bs) const;
    int from_stream(mfds_binary_stream &bs);

protected:
    int parse_lines(mfds_file_util::line_buffer &lines, mfds_diagnostics &diag);

    int configure_filegroup(mfds_dataset &ds, const filegroup_options &opts,
        mfds_diagnostics &diag) const;

private:
    std::string m_data_root;
    std::vector<std::string> m_dims;
    std::string m_mode;
    std::string m_duplicate_policy;
    std::vector<coordinate_options> m_coordinates;
    std::vector<filegroup_options> m_filegroups;
};

#endif
