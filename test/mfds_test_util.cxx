#include "mfds_test_util.h"
#include "mfds_keyring.h"
#include "mfds_file_util.h"
#include "mfds_diagnostics.h"
#include "mfds_common.h"

#include <cmath>
#include <sstream>

namespace mfds_test_util
{
// --------------------------------------------------------------------------
void test_file::add_coordinate(const std::string &name,
    const std::vector<double> &values, const std::string &units)
{
    bool have_dim = false;
    for (size_t i = 0; i < dims.size(); ++i)
        have_dim |= dims[i].first == name;

    if (!have_dim)
        this->add_dim(name, values.size());

    coords[name] = std::make_pair(values, units);
}

// --------------------------------------------------------------------------
void test_file::add_variable(const std::string &name,
    const std::vector<std::string> &var_dims, double base)
{
    std::vector<long> shape;
    for (size_t i = 0; i < var_dims.size(); ++i)
    {
        for (size_t j = 0; j < dims.size(); ++j)
        {
            if (dims[j].first == var_dims[i])
                shape.push_back(dims[j].second);
        }
    }

    mfds_array arr(var_dims, shape);
    double *parr = arr.data();
    size_t n = arr.size();
    for (size_t i = 0; i < n; ++i)
        parr[i] = base + i;

    var_names.push_back(name);
    vars[name] = arr;
}

// --------------------------------------------------------------------------
void test_format::register_format(const p_test_format &fmt)
{
    mfds_file_format::register_format("test",
        [fmt]() -> p_mfds_file_format { return fmt; });
}

// --------------------------------------------------------------------------
void test_format::reset_counters()
{
    m_n_open = 0;
    m_n_close = 0;
    m_n_read = 0;
    m_reads.clear();
}

// --------------------------------------------------------------------------
const test_file *test_format::get_file(const p_mfds_file_handle &handle,
    mfds_diagnostics &diag) const
{
    if (!handle)
    {
        MFDS_DIAG_ERROR(diag, "The file is not open")
        return nullptr;
    }

    std::map<std::string, test_file>::const_iterator it =
        m_files.find(handle->get_path());

    if (it == m_files.end())
    {
        MFDS_DIAG_ERROR(diag, "\"" << handle->get_path() << "\" is not known")
        return nullptr;
    }

    return &it->second;
}

// --------------------------------------------------------------------------
int test_format::open(const std::string &path, p_mfds_file_handle &handle,
    mfds_diagnostics &diag)
{
    if (!m_files.count(path))
    {
        MFDS_DIAG_ERROR(diag, "Failed to open \"" << path << "\"")
        return -1;
    }

    handle = std::make_shared<mfds_file_handle>();
    handle->set_path(path);

    ++m_n_open;
    return 0;
}

// --------------------------------------------------------------------------
int test_format::close(p_mfds_file_handle &handle, mfds_diagnostics &diag)
{
    (void)diag;
    handle = nullptr;
    ++m_n_close;
    return 0;
}

// --------------------------------------------------------------------------
int test_format::read(const p_mfds_file_handle &handle,
    const std::string &variable, const mfds_keyring &keys, mfds_array &chunk,
    mfds_diagnostics &diag)
{
    const test_file *file = this->get_file(handle, diag);
    if (!file)
        return -1;

    std::map<std::string, mfds_array>::const_iterator it =
        file->vars.find(variable);

    if (it == file->vars.end())
    {
        MFDS_DIAG_ERROR(diag, "No variable \"" << variable << "\" in \""
            << handle->get_path() << "\"")
        return -1;
    }

    std::ostringstream oss;
    oss << keys;
    m_reads.push_back(std::make_pair(handle->get_path() + ":" + variable,
        oss.str()));

    ++m_n_read;

    if (mfds_array_access::take(it->second, keys, chunk))
    {
        MFDS_DIAG_ERROR(diag, "Failed to read " << keys << " from \""
            << variable << "\"")
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int test_format::get_axis_order(const p_mfds_file_handle &handle,
    const std::string &variable, std::vector<std::string> &order,
    mfds_diagnostics &diag)
{
    const test_file *file = this->get_file(handle, diag);
    if (!file)
        return -1;

    std::map<std::string, mfds_array>::const_iterator it =
        file->vars.find(variable);

    if (it == file->vars.end())
        return -1;

    order = it->second.get_dims();
    return 0;
}

// --------------------------------------------------------------------------
int test_format::get_dim_size(const p_mfds_file_handle &handle,
    const std::string &dim, long &size, mfds_diagnostics &diag)
{
    const test_file *file = this->get_file(handle, diag);
    if (!file)
        return -1;

    for (size_t i = 0; i < file->dims.size(); ++i)
    {
        if (file->dims[i].first == dim)
        {
            size = file->dims[i].second;
            return 0;
        }
    }

    return -1;
}

// --------------------------------------------------------------------------
int test_format::get_coordinate_values(const p_mfds_file_handle &handle,
    const std::string &name, std::vector<double> &values,
    std::string &units, mfds_diagnostics &diag)
{
    const test_file *file = this->get_file(handle, diag);
    if (!file)
        return -1;

    std::map<std::string, std::pair<std::vector<double>, std::string>>
        ::const_iterator it = file->coords.find(name);

    if (it == file->coords.end())
    {
        MFDS_DIAG_ERROR(diag, "No coordinate \"" << name << "\" in \""
            << handle->get_path() << "\"")
        return -1;
    }

    values = it->second.first;
    units = it->second.second;
    return 0;
}

// --------------------------------------------------------------------------
int test_format::get_coordinate_calendar(const p_mfds_file_handle &handle,
    const std::string &name, std::string &calendar, mfds_diagnostics &diag)
{
    const test_file *file = this->get_file(handle, diag);
    if (!file)
        return -1;

    std::map<std::string, std::string>::const_iterator it =
        file->calendars.find(name);

    calendar = it == file->calendars.end() ? std::string() : it->second;
    return 0;
}

// --------------------------------------------------------------------------
int test_format::get_variables(const p_mfds_file_handle &handle,
    std::vector<std::string> &names, mfds_diagnostics &diag)
{
    const test_file *file = this->get_file(handle, diag);
    if (!file)
        return -1;

    names = file->var_names;
    return 0;
}

// **************************************************************************
int make_files(const std::string &dir, const std::vector<std::string> &names)
{
    if (mfds_file_util::make_directory(dir))
        return -1;

    size_t n = names.size();
    for (size_t i = 0; i < n; ++i)
    {
        std::string path = mfds_file_util::join(dir, names[i]);
        std::string parent = mfds_file_util::path(path);
        if (mfds_file_util::make_directory(parent) ||
            mfds_file_util::touch_file(path))
            return -1;
    }

    return 0;
}

// **************************************************************************
bool equal(double a, double b, double tol)
{
    if (std::isnan(a) || std::isnan(b))
        return std::isnan(a) && std::isnan(b);
    return std::fabs(a - b) <= tol;
}
}
