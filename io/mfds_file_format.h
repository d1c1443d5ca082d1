#ifndef mfds_file_format_h
#define mfds_file_format_h

/// @file

#include "mfds_config.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class mfds_array;
class mfds_keyring;
class mfds_diagnostics;
class mfds_file_format;
class mfds_file_handle;

using p_mfds_file_format = std::shared_ptr<mfds_file_format>;
using p_mfds_file_handle = std::shared_ptr<mfds_file_handle>;

/// The state of an open file, specialized by each format.
class MFDS_EXPORT mfds_file_handle
{
public:
    virtual ~mfds_file_handle() {}

    /// the path the file was opened with
    const std::string &get_path() const { return m_path; }
    void set_path(const std::string &path) { m_path = path; }

protected:
    std::string m_path;
};

/** @brief
 * The interface to a file format.
 *
 * @details
 * A format opens files, reports what they contain and reads chunks of a
 * variable. Reads are described by a keyring with one key per axis of the
 * variable, keyed by the name of the axis in the file and given in file
 * order. An integer key selects one index and squeezes the axis, list and
 * slice keys select several. The chunk returned has the axes that are not
 * squeezed, in file order, named as in the file.
 *
 * Formats are created by name with New. The netcdf format is registered
 * when the library is built with NetCDF, others may be added with
 * register_format.
 */
class MFDS_EXPORT mfds_file_format
{
public:
    /// a function that creates a format
    using factory_t = std::function<p_mfds_file_format()>;

    virtual ~mfds_file_format() {}

    /// create a format by name. returns nullptr if the name is not known
    static p_mfds_file_format New(const std::string &name);

    /// make a format available to New
    static void register_format(const std::string &name, const factory_t &factory);

    /// the names of the registered formats
    static std::vector<std::string> get_format_names();

    /// the name the format is registered under
    virtual const char *get_name() const = 0;

    /// open a file. returns non-zero if it could not be opened
    virtual int open(const std::string &path, p_mfds_file_handle &handle,
        mfds_diagnostics &diag) = 0;

    /// close a file. returns non-zero if an error occurred
    virtual int close(p_mfds_file_handle &handle, mfds_diagnostics &diag) = 0;

    /** read a chunk of a variable. keys holds one key per axis of the
     * variable in file order. returns non-zero if the read failed.
     */
    virtual int read(const p_mfds_file_handle &handle,
        const std::string &variable, const mfds_keyring &keys,
        mfds_array &chunk, mfds_diagnostics &diag) = 0;

    /** get the names of the axes of a variable in file order. the default
     * reports that the order is not known by returning non-zero.
     */
    virtual int get_axis_order(const p_mfds_file_handle &handle,
        const std::string &variable, std::vector<std::string> &order,
        mfds_diagnostics &diag);

    /// get the length of an axis. returns non-zero if it is not in the file
    virtual int get_dim_size(const p_mfds_file_handle &handle,
        const std::string &dim, long &size, mfds_diagnostics &diag) = 0;

    /** read the values and units of a coordinate variable. the default
     * reports an error.
     */
    virtual int get_coordinate_values(const p_mfds_file_handle &handle,
        const std::string &name, std::vector<double> &values,
        std::string &units, mfds_diagnostics &diag);

    /** get the CF calendar of a coordinate variable, empty when the file
     * does not name one. the default names none.
     */
    virtual int get_coordinate_calendar(const p_mfds_file_handle &handle,
        const std::string &name, std::string &calendar,
        mfds_diagnostics &diag);

    /** list the data variables, the variables that are not coordinates.
     * the default reports an error.
     */
    virtual int get_variables(const p_mfds_file_handle &handle,
        std::vector<std::string> &names, mfds_diagnostics &diag);

    /// true if a single command may read several variables of a file
    virtual bool can_read_multiple_variables() const { return false; }

protected:
    static std::map<std::string, factory_t> &get_registry();
};

/** @brief
 * A file kept open while the object exists.
 *
 * @details
 * The file is closed when the scope ends, whatever the exit path.
 */
class MFDS_EXPORT mfds_file_scope
{
public:
    mfds_file_scope(const p_mfds_file_format &format, mfds_diagnostics &diag);
    ~mfds_file_scope();

    mfds_file_scope(const mfds_file_scope &) = delete;
    void operator=(const mfds_file_scope &) = delete;

    /// open the file. returns non-zero if it could not be opened
    int open(const std::string &path);

    /// close the file. returns non-zero if an error occurred
    int close();

    const p_mfds_file_handle &get_handle() const { return m_handle; }

    /// true while a file is open
    operator bool() const { return m_handle != nullptr; }

private:
    p_mfds_file_format m_format;
    p_mfds_file_handle m_handle;
    mfds_diagnostics &m_diag;
};

#endif
