#include "mfds_file_format.h"
#include "mfds_diagnostics.h"

#if defined(MFDS_HAS_NETCDF)
#include "mfds_netcdf_format.h"
#endif

#include <mutex>

namespace
{
std::mutex g_registry_mutex;
}

// --------------------------------------------------------------------------
std::map<std::string, mfds_file_format::factory_t> &
mfds_file_format::get_registry()
{
    static std::map<std::string, factory_t> registry =
    {
#if defined(MFDS_HAS_NETCDF)
        {"netcdf", []() -> p_mfds_file_format
            { return mfds_netcdf_format::New(); }}
#endif
    };
    return registry;
}

// --------------------------------------------------------------------------
p_mfds_file_format mfds_file_format::New(const std::string &name)
{
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    std::map<std::string, factory_t> &registry = get_registry();
    std::map<std::string, factory_t>::iterator it = registry.find(name);
    if (it == registry.end())
        return nullptr;
    return it->second();
}

// --------------------------------------------------------------------------
void mfds_file_format::register_format(const std::string &name,
    const factory_t &factory)
{
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    get_registry()[name] = factory;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_file_format::get_format_names()
{
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    std::vector<std::string> names;
    std::map<std::string, factory_t> &registry = get_registry();
    std::map<std::string, factory_t>::iterator it = registry.begin();
    for (; it != registry.end(); ++it)
        names.push_back(it->first);
    return names;
}

// --------------------------------------------------------------------------
int mfds_file_format::get_axis_order(const p_mfds_file_handle &handle,
    const std::string &variable, std::vector<std::string> &order,
    mfds_diagnostics &diag)
{
    (void)handle;
    (void)variable;
    (void)order;
    (void)diag;
    return -1;
}

// --------------------------------------------------------------------------
int mfds_file_format::get_coordinate_calendar(const p_mfds_file_handle &handle,
    const std::string &name, std::string &calendar, mfds_diagnostics &diag)
{
    (void)handle;
    (void)name;
    (void)diag;
    calendar.clear();
    return 0;
}

// --------------------------------------------------------------------------
int mfds_file_format::get_coordinate_values(const p_mfds_file_handle &handle,
    const std::string &name, std::vector<double> &values,
    std::string &units, mfds_diagnostics &diag)
{
    (void)values;
    (void)units;
    MFDS_DIAG_ERROR(diag, "The " << this->get_name() << " format can not read"
        " coordinate \"" << name << "\" from \""
        << (handle ? handle->get_path() : std::string()) << "\"")
    return -1;
}

// --------------------------------------------------------------------------
int mfds_file_format::get_variables(const p_mfds_file_handle &handle,
    std::vector<std::string> &names, mfds_diagnostics &diag)
{
    (void)names;
    MFDS_DIAG_ERROR(diag, "The " << this->get_name() << " format can not list"
        " the variables of \"" << (handle ? handle->get_path() : std::string())
        << "\"")
    return -1;
}

// --------------------------------------------------------------------------
mfds_file_scope::mfds_file_scope(const p_mfds_file_format &format,
    mfds_diagnostics &diag) : m_format(format), m_handle(nullptr), m_diag(diag)
{}

// --------------------------------------------------------------------------
mfds_file_scope::~mfds_file_scope()
{
    this->close();
}

// --------------------------------------------------------------------------
int mfds_file_scope::open(const std::string &path)
{
    if (m_handle)
    {
        MFDS_DIAG_ERROR(m_diag, "Handle in use, close \""
            << m_handle->get_path() << "\" before opening \"" << path << "\"")
        return -1;
    }

    if (!m_format)
    {
        MFDS_DIAG_ERROR(m_diag, "No format to open \"" << path << "\"")
        return -1;
    }

    p_mfds_file_handle handle;
    if (m_format->open(path, handle, m_diag) || !handle)
        return -1;

    handle->set_path(path);
    m_handle = handle;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_file_scope::close()
{
    if (!m_handle)
        return 0;

    int ierr = m_format->close(m_handle, m_diag);
    m_handle = nullptr;
    return ierr;
}
