#ifndef mfds_filegroup_h
#define mfds_filegroup_h

/// @file

#include "mfds_config.h"
#include "mfds_coord_scan.h"
#include "mfds_file_format.h"
#include "mfds_load_command.h"
#include "mfds_pre_regex.h"

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

class mfds_array;
class mfds_keyring;
class mfds_diagnostics;
class mfds_binary_stream;
class mfds_filegroup;

using p_mfds_filegroup = std::shared_ptr<mfds_filegroup>;
using const_p_mfds_filegroup = std::shared_ptr<const mfds_filegroup>;

/** @brief
 * A group of files sharing a format and an internal layout.
 *
 * @details
 * The files are found below the root directory and selected by the
 * pre-regex, matched against their path relative to the root. Each
 * coordinate of the dataset is scanned by one mfds_coord_scan. In
 * coordinates vary inside the files, shared coordinates vary across the
 * files and must be bound to a matcher of the pre-regex. The string
 * coordinate holds the variables.
 *
 * Once the available space is known, a selection over it is turned into
 * load commands, one per file (one per file and variable when the format
 * reads one variable at a time), and the commands are executed through
 * the format.
 */
class MFDS_EXPORT mfds_filegroup
{
public:
    static p_mfds_filegroup New(const std::string &name = "")
    { return p_mfds_filegroup(new mfds_filegroup(name)); }

    void set_name(const std::string &name) { m_name = name; }
    const std::string &get_name() const { return m_name; }

    /// the directory searched for files
    void set_root(const std::string &root) { m_root = root; }
    const std::string &get_root() const { return m_root; }

    /// the maximum depth of sub directories searched, 3 by default
    void set_max_depth(int depth) { m_max_depth = depth; }
    int get_max_depth() const { return m_max_depth; }

    void set_pre_regex(const std::string &pre_regex)
    { m_pre_regex_text = pre_regex; m_setup = false; }

    const std::string &get_pre_regex_text() const { return m_pre_regex_text; }

    /// constant text substituted for the matchers of a coordinate
    void set_replacement(const std::string &coord, const std::string &text)
    { m_replacements[coord] = text; m_setup = false; }

    /// the elements available to matchers, the global registry by default
    void set_element_registry(const mfds_element_registry &reg)
    { m_elements = std::make_shared<mfds_element_registry>(reg); m_setup = false; }

    void set_format(const p_mfds_file_format &format) { m_format = format; }
    const p_mfds_file_format &get_format() const { return m_format; }

    /** the order of the axes in the files, used when the format can not
     * report it. names are those of the coordinates.
     */
    void set_dim_order(const std::vector<std::string> &order)
    { m_dim_order = order; }

    const std::vector<std::string> &get_dim_order() const { return m_dim_order; }

    /** add a coordinate, in or shared. returns the scan, or nullptr if the
     * coordinate was already added.
     */
    p_mfds_coord_scan add_coordinate(const p_mfds_coordinate &coord,
        bool shared);

    /// get the scan of a coordinate by name, nullptr if there is none
    p_mfds_coord_scan get_coord_scan(const std::string &name) const;

    const std::vector<p_mfds_coord_scan> &get_coord_scans() const
    { return m_scans; }

    /// the names of the in or of the shared coordinates
    std::vector<std::string> get_coordinate_names(bool shared) const;

    /** add a scan function to a coordinate, compiling the pre-regex first
     * when the function reads the file name. returns mfds_error::config_error
     * on failure.
     */
    int add_scan_function(const std::string &coord,
        const mfds_scan_function_info &info, mfds_diagnostics &diag);

    /** compile the pre-regex and bind the matchers to the coordinates.
     * returns mfds_error::config_error if the pre-regex is invalid, a
     * matcher names an unknown coordinate, a shared coordinate has no
     * matcher carrying a value, or there is no string coordinate.
     */
    int setup(mfds_diagnostics &diag);

    const mfds_pre_regex &get_pre_regex() const { return m_pre_regex; }

    /** find the files and scan every coordinate. returns
     * mfds_error::config_error or mfds_error::scan_error on failure.
     */
    int scan(mfds_diagnostics &diag);

    /// the files matched by the last scan, relative to the root
    const std::vector<std::string> &get_files() const { return m_files; }

    /** build the load commands for a selection over the available space.
     * request has one key per dimension of dims, a list of available
     * indices. memory keys index the array the selection is loaded into.
     * returns non-zero on error, no command is made when the filegroup holds
     * none of the selection.
     */
    int get_commands(const mfds_keyring &request,
        const std::vector<std::string> &dims,
        std::vector<mfds_load_command> &commands, mfds_diagnostics &diag) const;

    /** execute a load command placing data into dst. returns
     * mfds_error::load_error if the file can not be opened or read.
     */
    int execute(const mfds_load_command &cmd, mfds_array &dst,
        mfds_diagnostics &diag) const;

    /// the name of the variable dimension
    const std::string &get_var_dim() const { return m_var_dim; }

    /// serialize the scanned state
    void to_stream(mfds_binary_stream &bs) const;

    /// send a summary to the stream
    void print(std::ostream &os) const;

protected:
    mfds_filegroup(const std::string &name);

    // find the scan of the coordinate the axis belongs to
    p_mfds_coord_scan get_scan_of_axis(const std::string &axis) const;

    int read_variable(const p_mfds_file_handle &handle,
        const std::string &variable, const mfds_keyring &infile,
        const mfds_keyring &memory, mfds_array &dst,
        mfds_diagnostics &diag) const;

private:
    std::string m_name;
    std::string m_root;
    int m_max_depth;
    std::string m_pre_regex_text;
    std::map<std::string, std::string> m_replacements;
    std::shared_ptr<mfds_element_registry> m_elements;
    p_mfds_file_format m_format;
    std::vector<std::string> m_dim_order;
    std::vector<p_mfds_coord_scan> m_scans;
    std::string m_var_dim;

    bool m_setup;
    mfds_pre_regex m_pre_regex;
    std::vector<std::string> m_files;
    std::vector<std::string> m_first_captures;
};

MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_filegroup &fg);

#endif
