#ifndef mfds_netcdf_format_h
#define mfds_netcdf_format_h

/// @file

#include "mfds_config.h"
#include "mfds_file_format.h"

#include <memory>
#include <string>
#include <vector>

class mfds_netcdf_format;
using p_mfds_netcdf_format = std::shared_ptr<mfds_netcdf_format>;

/** @brief
 * Reads NetCDF files.
 *
 * @details
 * Chunks are read with one nc_get_vara call covering the bounding box of
 * the keys, the selected elements are then taken from the box. Coordinate
 * values are read from the one dimensional variable named after the
 * coordinate and its units attribute. The data variables are the variables
 * that are not named after a dimension.
 */
class MFDS_EXPORT mfds_netcdf_format : public mfds_file_format
{
public:
    static p_mfds_netcdf_format New()
    { return p_mfds_netcdf_format(new mfds_netcdf_format); }

    const char *get_name() const override { return "netcdf"; }

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

protected:
    mfds_netcdf_format() = default;
};

#endif
