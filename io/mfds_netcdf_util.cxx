#include "mfds_netcdf_util.h"
#include "mfds_common.h"
#include "mfds_diagnostics.h"

#include <cstdlib>
#include <cstring>

static std::mutex g_netcdf_mutex;

namespace mfds_netcdf_util
{

// **************************************************************************
void crtrim(char *s, long n)
{
    if (!s || (n == 0)) return;
    char c = s[--n];
    while ((n > 0) && ((c == ' ') || (c == '\n') ||
        (c == '\t') || (c == '\r')))
    {
        s[n] = '\0';
        c = s[--n];
    }
}

// **************************************************************************
std::mutex &get_netcdf_mutex()
{
    return g_netcdf_mutex;
}

// --------------------------------------------------------------------------
int netcdf_handle::open(const std::string &file_path, int mode,
    mfds_diagnostics &diag)
{
    if (m_handle)
    {
        MFDS_DIAG_ERROR(diag, "Handle in use, close before re-opening")
        return -1;
    }

    int ierr = 0;
#if !defined(HDF5_THREAD_SAFE)
     std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_open(file_path.c_str(), mode, &m_handle)) != NC_NOERR)
    {
        m_handle = 0;
        MFDS_DIAG_ERROR(diag, "Failed to open \"" << file_path << "\". "
            << nc_strerror(ierr))
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int netcdf_handle::close()
{
    if (m_handle)
    {
#if !defined(HDF5_THREAD_SAFE)
        std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
        int ierr = nc_close(m_handle);
        m_handle = 0;
        if (ierr != NC_NOERR)
        {
            MFDS_ERROR("Failed to close the file. " << nc_strerror(ierr))
            return -1;
        }
    }
    return 0;
}

// **************************************************************************
int read_text_attribute(netcdf_handle &fh, int var_id,
    const std::string &att_name, std::string &value)
{
    int ierr = 0;
    nc_type att_type = 0;
    size_t att_len = 0;
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_inq_att(fh.get(), var_id, att_name.c_str(),
        &att_type, &att_len)) != NC_NOERR)
        return -1;

    if (att_type == NC_CHAR)
    {
        char *tmp = static_cast<char*>(malloc(att_len + 1));
        tmp[att_len] = '\0';
        if ((ierr = nc_get_att_text(fh.get(), var_id,
            att_name.c_str(), tmp)) != NC_NOERR)
        {
            free(tmp);
            MFDS_ERROR("Failed get text from attribute \"" << att_name
                << "\" of variable " << var_id << std::endl
                << nc_strerror(ierr))
            return -1;
        }
        crtrim(tmp, att_len);
        value = tmp;
        free(tmp);
        return 0;
    }
    else if (att_type == NC_STRING)
    {
        char *strs[1] = {nullptr};
        if ((ierr = nc_get_att_string(fh.get(), var_id,
            att_name.c_str(), strs)) != NC_NOERR)
        {
            MFDS_ERROR("Failed get string from attribute \"" << att_name
                << "\" of variable " << var_id << std::endl
                << nc_strerror(ierr))
            return -1;
        }
        value = strs[0] ? strs[0] : "";
        nc_free_string(1, strs);
        return 0;
    }

    return -1;
}

// **************************************************************************
int get_variable_dims(netcdf_handle &fh, const std::string &var_name,
    int &var_id, std::vector<std::string> &dim_names,
    std::vector<size_t> &dim_lens, mfds_diagnostics &diag)
{
    int ierr = 0;
    int n_dims = 0;
    int dim_id[NC_MAX_VAR_DIMS] = {0};

#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(mfds_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_inq_varid(fh.get(), var_name.c_str(), &var_id)) != NC_NOERR)
        || ((ierr = nc_inq_varndims(fh.get(), var_id, &n_dims)) != NC_NOERR)
        || ((ierr = nc_inq_vardimid(fh.get(), var_id, dim_id)) != NC_NOERR))
    {
        MFDS_DIAG_ERROR(diag, "Failed to query \"" << var_name << "\" variable. "
            << nc_strerror(ierr))
        return -1;
    }

    dim_names.resize(n_dims);
    dim_lens.resize(n_dims);
    for (int i = 0; i < n_dims; ++i)
    {
        char dim_name[NC_MAX_NAME + 1] = {'\0'};
        size_t dim_len = 0;
        if ((ierr = nc_inq_dim(fh.get(), dim_id[i], dim_name, &dim_len)) != NC_NOERR)
        {
            MFDS_DIAG_ERROR(diag, "Failed to query " << i << "th dimension of"
                " variable \"" << var_name << "\". " << nc_strerror(ierr))
            return -1;
        }
        dim_names[i] = dim_name;
        dim_lens[i] = dim_len;
    }

    return 0;
}
}
