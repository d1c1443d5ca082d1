#ifndef mfds_netcdf_util_h
#define mfds_netcdf_util_h

/// @file

#include "mfds_config.h"

#include <mutex>
#include <string>
#include <vector>

#include <netcdf.h>

class mfds_diagnostics;

/// Codes dealing with NetCDF I/O calls
namespace mfds_netcdf_util
{
/** To deal with fortran fixed length strings which are not properly nulll
 * terminated.
 */
MFDS_EXPORT
void crtrim(char *s, long n);

/** NetCDF 3 is not threadsafe. The HDF5 C-API can be compiled to be
 * threadsafe, but it is usually not. NetCDF uses HDF5-HL API to access HDF5,
 * but HDF5-HL API is not threadsafe without the --enable-unsupported flag. For
 * all those reasons it's best for the time being to protect all NetCDF I/O.
 */
MFDS_EXPORT
std::mutex &get_netcdf_mutex();

/// A RAII class for managing NETCDF files. The file is kept open while the object exists.
class MFDS_EXPORT netcdf_handle
{
public:
    netcdf_handle() : m_handle(0)
    {}

    /** Initialize with a handle returned from nc_open/nc_create etc. */
    netcdf_handle(int h) : m_handle(h)
    {}

    /** Close the file during destruction. */
    ~netcdf_handle()
    { this->close(); }

    /**
     * This is a move only class, and should
     * only be initialized with an valid handle.
     */
    netcdf_handle(const netcdf_handle &) = delete;
    void operator=(const netcdf_handle &) = delete;

    /** Move construction takes ownership from the other object. */
    netcdf_handle(netcdf_handle &&other)
    {
        m_handle = other.m_handle;
        other.m_handle = 0;
    }

    /** Move assignment takes ownership from the other object. */
    void operator=(netcdf_handle &&other)
    {
        this->close();
        m_handle = other.m_handle;
        other.m_handle = 0;
    }

    /** Open the file. Returns 0 on success. */
    int open(const std::string &file_path, int mode, mfds_diagnostics &diag);

    /** Close the file. */
    int close();

    /** Returns a reference to the handle. */
    int &get()
    { return m_handle; }

    /** Test if the handle is valid. */
    operator bool() const
    { return m_handle > 0; }

private:
    int m_handle;
};

/** Read a text attribute of a variable. Returns non-zero if the attribute is
 * not present or is not text.
 */
MFDS_EXPORT
int read_text_attribute(netcdf_handle &fh, int var_id,
    const std::string &att_name, std::string &value);

/** Get the id, the dimension names and the dimension lengths of a variable.
 * Returns non-zero if the variable is not in the file.
 */
MFDS_EXPORT
int get_variable_dims(netcdf_handle &fh, const std::string &var_name,
    int &var_id, std::vector<std::string> &dim_names,
    std::vector<size_t> &dim_lens, mfds_diagnostics &diag);
}

#endif
