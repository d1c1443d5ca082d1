#include "mfds_netcdf_format.h"
#include "mfds_netcdf_util.h"
#include "mfds_array.h"
#include "mfds_keyring.h"
#include "mfds_diagnostics.h"

#include <algorithm>

namespace
{
// the state of an open NetCDF file
class netcdf_file_handle : public mfds_file_handle
{
public:
    mfds_netcdf_util::netcdf_handle fh;
};

// **************************************************************************
netcdf_file_handle *get_netcdf_handle(const p_mfds_file_handle &handle,
    mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = dynamic_cast<netcdf_file_handle*>(handle.get());
    if (!nh || !nh->fh)
    {
        MFDS_DIAG_ERROR(diag, "Not an open NetCDF file")
        return nullptr;
    }
    return nh;
}
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::open(const std::string &path,
    p_mfds_file_handle &handle, mfds_diagnostics &diag)
{
    std::shared_ptr<netcdf_file_handle> nh =
        std::make_shared<netcdf_file_handle>();

    if (nh->fh.open(path, NC_NOWRITE, diag))
        return -1;

    nh->set_path(path);
    handle = nh;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::close(p_mfds_file_handle &handle,
    mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = dynamic_cast<netcdf_file_handle*>(handle.get());
    if (!nh)
    {
        MFDS_DIAG_ERROR(diag, "Not a NetCDF file")
        return -1;
    }

    int ierr = nh->fh.close();
    if (ierr)
    {
        MFDS_DIAG_ERROR(diag, "Failed to close \"" << nh->get_path() << "\"")
    }

    handle = nullptr;
    return ierr;
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::read(const p_mfds_file_handle &handle,
    const std::string &variable, const mfds_keyring &keys,
    mfds_array &chunk, mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = get_netcdf_handle(handle, diag);
    if (!nh)
        return -1;

    int var_id = 0;
    std::vector<std::string> dim_names;
    std::vector<size_t> dim_lens;
    if (mfds_netcdf_util::get_variable_dims(nh->fh, variable,
        var_id, dim_names, dim_lens, diag))
        return -1;

    size_t n_dims = dim_names.size();
    if (keys.get_dims() != dim_names)
    {
        MFDS_DIAG_ERROR(diag, "The keys " << keys << " do not match the"
            " dimensions [" << dim_names << "] of \"" << variable << "\" in \""
            << nh->get_path() << "\"")
        return -1;
    }

    // the bounding box of the selection and the keys relative to it
    std::vector<size_t> start(n_dims, 0);
    std::vector<size_t> count(n_dims, 1);
    std::vector<long> box_shape(n_dims, 1);
    mfds_keyring box_keys;

    mfds_keyring::const_iterator it = keys.begin();
    for (size_t i = 0; i < n_dims; ++i, ++it)
    {
        mfds_key key(it->second);
        key.set_parent_size(dim_lens[i]);

        std::vector<long> ids;
        if (key.is_none() || key.to_list(ids) || ids.empty())
        {
            MFDS_DIAG_ERROR(diag, "Invalid key " << it->second << " for"
                " dimension \"" << dim_names[i] << "\" of \"" << variable << "\"")
            return -1;
        }

        long n = dim_lens[i];
        for (size_t j = 0; j < ids.size(); ++j)
        {
            if (ids[j] < 0)
                ids[j] += n;

            if ((ids[j] < 0) || (ids[j] >= n))
            {
                MFDS_DIAG_ERROR(diag, "Index " << ids[j] << " is out of bounds"
                    " for dimension \"" << dim_names[i] << "\" of size " << n)
                return -1;
            }
        }

        long i0 = *std::min_element(ids.begin(), ids.end());
        long i1 = *std::max_element(ids.begin(), ids.end());

        start[i] = i0;
        count[i] = i1 - i0 + 1;
        box_shape[i] = count[i];

        for (size_t j = 0; j < ids.size(); ++j)
            ids[j] -= i0;

        if (key.is_int())
            box_keys.set(dim_names[i], mfds_key(ids[0]));
        else
            box_keys.set(dim_names[i], mfds_key(ids));
    }

    mfds_array box(dim_names, box_shape);

    int ierr = 0;
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_get_vara_double(nh->fh.get(), var_id,
        start.data(), count.data(), box.data())) != NC_NOERR)
    {
        MFDS_DIAG_ERROR(diag, "Failed to read \"" << variable << "\" from \""
            << nh->get_path() << "\". " << nc_strerror(ierr))
        return -1;
    }
    }

    if (mfds_array_access::take(box, box_keys, chunk))
    {
        MFDS_DIAG_ERROR(diag, "Failed to select " << keys << " from \""
            << variable << "\"")
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::get_axis_order(const p_mfds_file_handle &handle,
    const std::string &variable, std::vector<std::string> &order,
    mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = get_netcdf_handle(handle, diag);
    if (!nh)
        return -1;

    int var_id = 0;
    std::vector<size_t> dim_lens;
    return mfds_netcdf_util::get_variable_dims(nh->fh, variable,
        var_id, order, dim_lens, diag);
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::get_dim_size(const p_mfds_file_handle &handle,
    const std::string &dim, long &size, mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = get_netcdf_handle(handle, diag);
    if (!nh)
        return -1;

    int ierr = 0;
    int dim_id = 0;
    size_t dim_len = 0;
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_inq_dimid(nh->fh.get(), dim.c_str(), &dim_id)) != NC_NOERR)
        || ((ierr = nc_inq_dimlen(nh->fh.get(), dim_id, &dim_len)) != NC_NOERR))
        return -1;

    size = dim_len;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::get_coordinate_values(const p_mfds_file_handle &handle,
    const std::string &name, std::vector<double> &values,
    std::string &units, mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = get_netcdf_handle(handle, diag);
    if (!nh)
        return -1;

    int var_id = 0;
    std::vector<std::string> dim_names;
    std::vector<size_t> dim_lens;
    if (mfds_netcdf_util::get_variable_dims(nh->fh, name,
        var_id, dim_names, dim_lens, diag))
        return -1;

    if (dim_names.size() != 1)
    {
        MFDS_DIAG_ERROR(diag, "Coordinate variable \"" << name << "\" in \""
            << nh->get_path() << "\" has " << dim_names.size()
            << " dimensions, 1 expected")
        return -1;
    }

    values.resize(dim_lens[0]);

    int ierr = 0;
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_get_var_double(nh->fh.get(), var_id,
        values.data())) != NC_NOERR)
    {
        MFDS_DIAG_ERROR(diag, "Failed to read coordinate \"" << name
            << "\" from \"" << nh->get_path() << "\". " << nc_strerror(ierr))
        return -1;
    }
    }

    units.clear();
    if (mfds_netcdf_util::read_text_attribute(nh->fh, var_id, "units", units))
    {
        MFDS_DIAG_DEBUG(diag, "Coordinate \"" << name << "\" in \""
            << nh->get_path() << "\" has no units")
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::get_coordinate_calendar(
    const p_mfds_file_handle &handle, const std::string &name,
    std::string &calendar, mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = get_netcdf_handle(handle, diag);
    if (!nh)
        return -1;

    int var_id = 0;
    std::vector<std::string> dim_names;
    std::vector<size_t> dim_lens;
    if (mfds_netcdf_util::get_variable_dims(nh->fh, name,
        var_id, dim_names, dim_lens, diag))
        return -1;

    // the attribute is optional
    calendar.clear();
    if (mfds_netcdf_util::read_text_attribute(nh->fh, var_id, "calendar",
        calendar))
        calendar.clear();

    return 0;
}

// --------------------------------------------------------------------------
int mfds_netcdf_format::get_variables(const p_mfds_file_handle &handle,
    std::vector<std::string> &names, mfds_diagnostics &diag)
{
    netcdf_file_handle *nh = get_netcdf_handle(handle, diag);
    if (!nh)
        return -1;

    int ierr = 0;
    int n_vars = 0;
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_inq_nvars(nh->fh.get(), &n_vars)) != NC_NOERR)
    {
        MFDS_DIAG_ERROR(diag, "Failed to get the number of variables in \""
            << nh->get_path() << "\". " << nc_strerror(ierr))
        return -1;
    }

    for (int i = 0; i < n_vars; ++i)
    {
        char var_name[NC_MAX_NAME + 1] = {'\0'};
        if ((ierr = nc_inq_varname(nh->fh.get(), i, var_name)) != NC_NOERR)
        {
            MFDS_DIAG_ERROR(diag, "Failed to get the name of the " << i
                << "th variable in \"" << nh->get_path() << "\". "
                << nc_strerror(ierr))
            return -1;
        }

        // coordinate variables are named after their dimension
        int dim_id = 0;
        if (nc_inq_dimid(nh->fh.get(), var_name, &dim_id) == NC_NOERR)
            continue;

        names.push_back(var_name);
    }

    return 0;
}
