#ifndef mfds_test_util_h
#define mfds_test_util_h

#include "mfds_config.h"
#include "mfds_array.h"
#include "mfds_file_format.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mfds_test_util
{
/// the contents of a file known to the test format
struct test_file
{
    /// add an axis and its size
    void add_dim(const std::string &name, long size)
    { dims.push_back(std::make_pair(name, size)); }

    /// add a coordinate variable, the axis is added when not yet present
    void add_coordinate(const std::string &name,
        const std::vector<double> &values, const std::string &units = "");

    /** add a data variable. the values are filled with
     * base + the flat index of the element.
     */
    void add_variable(const std::string &name,
        const std::vector<std::string> &var_dims, double base);

    std::vector<std::pair<std::string, long>> dims;
    std::map<std::string, std::pair<std::vector<double>, std::string>> coords;
    std::map<std::string, std::string> calendars;
    std::vector<std::string> var_names;
    std::map<std::string, mfds_array> vars;
};

class test_format;
using p_test_format = std::shared_ptr<test_format>;

/** @brief
 * A file format serving files described in memory.
 *
 * @details
 * Files are registered by path. The files themselves must exist on disk so
 * that filegroups find them, their content is ignored. Opens and reads are
 * counted and the keys of every read are recorded.
 */
class test_format : public mfds_file_format
{
public:
    static p_test_format New()
    { return p_test_format(new test_format); }

    /// make the format available as "test", every New returns this one
    static void register_format(const p_test_format &fmt);

    void add_file(const std::string &path, const test_file &file)
    { m_files[path] = file; }

    void set_multiple_variables(bool val) { m_multiple = val; }

    long get_n_open() const { return m_n_open; }
    long get_n_close() const { return m_n_close; }
    long get_n_read() const { return m_n_read; }

    /// "path:variable" and the keys of each read, in order
    const std::vector<std::pair<std::string, std::string>> &get_reads() const
    { return m_reads; }

    void reset_counters();

    const char *get_name() const override { return "test"; }

    int open(const std::string &path, p_mfds_file_handle &handle,
        mfds_diagnostics &diag) override;

    int close(p_mfds_file_handle &handle, mfds_diagnostics &diag) override;

    int read(const p_mfds_file_handle &handle, const std::string &variable,
        const mfds_keyring &keys, mfds_array &chunk,
        mfds_diagnostics &diag) override;

    int get_axis_order(const p_mfds_file_handle &handle,
        const std::string &variable, std::vector<std::string> &order,
        mfds_diagnostics &diag) override;

    int get_dim_size(const p_mfds_file_handle &handle, const std::string &dim,
        long &size, mfds_diagnostics &diag) override;

    int get_coordinate_values(const p_mfds_file_handle &handle,
        const std::string &name, std::vector<double> &values,
        std::string &units, mfds_diagnostics &diag) override;

    int get_coordinate_calendar(const p_mfds_file_handle &handle,
        const std::string &name, std::string &calendar,
        mfds_diagnostics &diag) override;

    int get_variables(const p_mfds_file_handle &handle,
        std::vector<std::string> &names, mfds_diagnostics &diag) override;

    bool can_read_multiple_variables() const override { return m_multiple; }

protected:
    test_format() : m_multiple(false), m_n_open(0), m_n_close(0),
        m_n_read(0) {}

    const test_file *get_file(const p_mfds_file_handle &handle,
        mfds_diagnostics &diag) const;

private:
    std::map<std::string, test_file> m_files;
    bool m_multiple;
    long m_n_open;
    long m_n_close;
    long m_n_read;
    std::vector<std::pair<std::string, std::string>> m_reads;
};

/** create the directory and empty files in it. returns non-zero if
 * something could not be created.
 */
int make_files(const std::string &dir, const std::vector<std::string> &names);

/// compare with a tolerance, NaN equals NaN
bool equal(double a, double b, double tol = 1e-9);
}

#endif
