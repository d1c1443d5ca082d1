#include "mfds_available_space.h"
#include "mfds_coordinate.h"
#include "mfds_coordinate_util.h"
#include "mfds_coord_scan.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"
#include "mfds_common.h"

#include <algorithm>
#include <ostream>

namespace
{
// **************************************************************************
bool overlaps(const std::vector<long> &a, const std::vector<long> &b)
{
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i)
    {
        if ((a[i] >= 0) && (b[i] >= 0))
            return true;
    }
    return false;
}
}

// --------------------------------------------------------------------------
int mfds_available_space::get_mode(const std::string &name, int &mode)
{
    if (name == "default")
        mode = default_mode;
    else if (name == "advanced")
        mode = advanced_mode;
    else
        return -1;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_available_space::get_duplicate_policy(const std::string &name,
    int &policy)
{
    if (name == "reject")
        policy = reject;
    else if (name == "keep_first")
        policy = keep_first;
    else
        return -1;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_available_space::compute(mfds_coordinate_registry &coords,
    const std::vector<p_mfds_filegroup> &filegroups,
    const std::vector<std::string> &dims, int mode, int duplicate_policy,
    mfds_diagnostics &diag)
{
    m_dims.clear();

    size_t n_dims = dims.size();
    size_t n_fg = filegroups.size();
    for (size_t i = 0; i < n_dims; ++i)
    {
        p_mfds_coordinate coord = coords.get(dims[i]);
        if (!coord)
        {
            MFDS_DIAG_ERROR(diag, "No coordinate named \"" << dims[i] << "\"")
            return mfds_error::config_error;
        }

        std::vector<p_mfds_coord_scan> scans(n_fg);
        for (size_t j = 0; j < n_fg; ++j)
        {
            if (!(scans[j] = filegroups[j]->get_coord_scan(dims[i])))
            {
                MFDS_DIAG_ERROR(diag, "Filegroup \"" << filegroups[j]->get_name()
                    << "\" does not scan coordinate \"" << dims[i] << "\"")
                return mfds_error::config_error;
            }
        }

        dim_t dim;
        int ierr = 0;
        if ((ierr = this->reconcile(*coord, filegroups, scans, mode, dim, diag)))
        {
            m_dims.clear();
            return ierr;
        }

        // pass the values on to the coordinate
        if ((dim.is_string && coord->set_names(dim.names)) ||
            (!dim.is_string && coord->set_values(dim.values)))
        {
            MFDS_DIAG_ERROR(diag, "Failed to set the available values of"
                " coordinate \"" << dims[i] << "\"")
            m_dims.clear();
            return mfds_error::reconciliation_error;
        }

        // tell each scan which of the values it holds
        long n_avail = dim.is_string ? dim.names.size() : dim.values.size();
        for (size_t j = 0; j < n_fg; ++j)
        {
            mfds_coord_scan &cs = *scans[j];
            if (cs.is_empty())
            {
                cs.set_contains(std::vector<long>(), n_avail);
                continue;
            }

            std::vector<long> contains(n_avail, -1);
            for (long k = 0; k < n_avail; ++k)
            {
                if (dim.is_string)
                {
                    const std::vector<std::string> &names = cs.get_names();
                    std::vector<std::string>::const_iterator it =
                        std::find(names.begin(), names.end(), dim.names[k]);
                    if (it != names.end())
                        contains[k] = it - names.begin();
                }
                else
                {
                    long id = -1;
                    if (!mfds_coordinate_util::index_of(cs.get_values(),
                        dim.values[k], dim.tolerance, id))
                        contains[k] = id;
                }
            }

            cs.set_contains(contains, n_avail);
        }

        MFDS_DIAG_DEBUG(diag, "Available space of \"" << dim.name << "\" has "
            << n_avail << " values")

        m_dims.push_back(dim);
    }

    int ierr = 0;
    if ((ierr = this->check_duplicates(filegroups, duplicate_policy, diag)))
    {
        m_dims.clear();
        return ierr;
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_available_space::reconcile(const mfds_coordinate &coord,
    const std::vector<p_mfds_filegroup> &filegroups,
    const std::vector<p_mfds_coord_scan> &scans, int mode, dim_t &dim,
    mfds_diagnostics &diag)
{
    dim.name = coord.get_name();
    dim.is_string = coord.is_string();
    dim.tolerance = coord.get_tolerance();

    // values are compared at the largest tolerance of the filegroups
    size_t n_fg = scans.size();
    for (size_t j = 0; j < n_fg; ++j)
    {
        if (!scans[j]->is_empty())
            dim.tolerance = std::max(dim.tolerance, scans[j]->get_tolerance());
    }

    bool first = true;
    for (size_t j = 0; j < n_fg; ++j)
    {
        const mfds_coord_scan &cs = *scans[j];
        if (cs.is_empty())
            continue;

        if (dim.is_string)
        {
            // union in order of discovery
            const std::vector<std::string> &names = cs.get_names();
            size_t n = names.size();
            for (size_t k = 0; k < n; ++k)
            {
                if (std::find(dim.names.begin(), dim.names.end(), names[k])
                    == dim.names.end())
                    dim.names.push_back(names[k]);
            }
            first = false;
            continue;
        }

        if (first)
            dim.values = cs.get_values();
        else if (mode == advanced_mode)
            dim.values = mfds_coordinate_util::merge_union(dim.values,
                cs.get_values(), dim.tolerance);
        else
            dim.values = mfds_coordinate_util::merge_intersection(dim.values,
                cs.get_values(), dim.tolerance);

        first = false;
    }

    // no filegroup scanned the coordinate
    if (first)
    {
        long n = coord.get_size();
        if (n < 1)
        {
            MFDS_DIAG_ERROR(diag, "Coordinate \"" << dim.name << "\" is not"
                " scanned by any filegroup and has no values")
            return mfds_error::scan_error;
        }

        if (dim.is_string)
            dim.names = coord.get_names();
        else
            dim.values = coord.get_values();

        MFDS_DIAG_INFO(diag, "Coordinate \"" << dim.name << "\" is not"
            " scanned, its " << n << " values are used")

        return 0;
    }

    long n_avail = dim.is_string ? dim.names.size() : dim.values.size();
    if (n_avail < 1)
    {
        MFDS_DIAG_ERROR(diag, "The filegroups have no value of coordinate \""
            << dim.name << "\" in common")
        return mfds_error::reconciliation_error;
    }

    // report what the intersection left out
    if (!dim.is_string && (mode == default_mode))
    {
        for (size_t j = 0; j < n_fg; ++j)
        {
            const mfds_coord_scan &cs = *scans[j];
            if (!cs.is_empty() && (cs.size() > n_avail))
            {
                MFDS_DIAG_WARNING(diag, "Coordinate \"" << dim.name
                    << "\" of filegroup \"" << filegroups[j]->get_name()
                    << "\" was trimmed from " << cs.size() << " to "
                    << n_avail << " values")
            }
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_available_space::check_duplicates(
    const std::vector<p_mfds_filegroup> &filegroups, int duplicate_policy,
    mfds_diagnostics &diag)
{
    size_t n_fg = filegroups.size();
    size_t n_dims = m_dims.size();
    for (size_t a = 0; a < n_fg; ++a)
    {
        for (size_t b = a + 1; b < n_fg; ++b)
        {
            bool common = true;
            for (size_t i = 0; common && (i < n_dims); ++i)
            {
                const std::string &name = m_dims[i].name;
                common = overlaps(
                    filegroups[a]->get_coord_scan(name)->get_contains(),
                    filegroups[b]->get_coord_scan(name)->get_contains());
            }

            if (!common)
                continue;

            if (duplicate_policy == reject)
            {
                MFDS_DIAG_ERROR(diag, "Filegroups \"" << filegroups[a]->get_name()
                    << "\" and \"" << filegroups[b]->get_name()
                    << "\" hold data at common coordinates")
                return mfds_error::reconciliation_error;
            }

            // the later filegroup loses the common variables
            const dim_t *var = nullptr;
            for (size_t i = 0; !var && (i < n_dims); ++i)
            {
                if (m_dims[i].is_string)
                    var = &m_dims[i];
            }

            if (!var)
            {
                MFDS_DIAG_ERROR(diag, "Filegroups \"" << filegroups[a]->get_name()
                    << "\" and \"" << filegroups[b]->get_name()
                    << "\" hold data at common coordinates and the dataset"
                    " has no variable dimension")
                return mfds_error::reconciliation_error;
            }
            const std::string &var_dim = var->name;

            p_mfds_coord_scan va = filegroups[a]->get_coord_scan(var_dim);
            p_mfds_coord_scan vb = filegroups[b]->get_coord_scan(var_dim);

            std::vector<long> contains(vb->get_contains());
            std::vector<std::string> removed;
            size_t n = std::min(contains.size(), va->get_contains().size());
            for (size_t k = 0; k < n; ++k)
            {
                if ((contains[k] >= 0) && (va->get_contains()[k] >= 0))
                {
                    contains[k] = -1;
                    removed.push_back(var->names[k]);
                }
            }

            vb->set_contains(contains, vb->get_available_size());

            MFDS_DIAG_WARNING(diag, "Filegroups \"" << filegroups[a]->get_name()
                << "\" and \"" << filegroups[b]->get_name() << "\" hold data at"
                " common coordinates, variables [" << removed << "] are"
                " loaded from \"" << filegroups[a]->get_name() << "\" only")
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
const mfds_available_space::dim_t *mfds_available_space::find(
    const std::string &name) const
{
    size_t n = m_dims.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_dims[i].name == name)
            return &m_dims[i];
    }
    return nullptr;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_available_space::get_dims() const
{
    std::vector<std::string> dims;
    size_t n = m_dims.size();
    for (size_t i = 0; i < n; ++i)
        dims.push_back(m_dims[i].name);
    return dims;
}

// --------------------------------------------------------------------------
long mfds_available_space::get_size(const std::string &name) const
{
    const dim_t *dim = this->find(name);
    if (!dim)
        return -1;
    return dim->is_string ? dim->names.size() : dim->values.size();
}

// --------------------------------------------------------------------------
std::map<std::string, long> mfds_available_space::get_sizes() const
{
    std::map<std::string, long> sizes;
    size_t n = m_dims.size();
    for (size_t i = 0; i < n; ++i)
        sizes[m_dims[i].name] = this->get_size(m_dims[i].name);
    return sizes;
}

// --------------------------------------------------------------------------
double mfds_available_space::get_tolerance(const std::string &name) const
{
    const dim_t *dim = this->find(name);
    return dim ? dim->tolerance : 0.0;
}

// --------------------------------------------------------------------------
const std::vector<double> &mfds_available_space::get_values(
    const std::string &name) const
{
    static const std::vector<double> none;
    const dim_t *dim = this->find(name);
    return dim ? dim->values : none;
}

// --------------------------------------------------------------------------
const std::vector<std::string> &mfds_available_space::get_names(
    const std::string &name) const
{
    static const std::vector<std::string> none;
    const dim_t *dim = this->find(name);
    return dim ? dim->names : none;
}

// --------------------------------------------------------------------------
void mfds_available_space::to_stream(mfds_binary_stream &bs) const
{
    bs.pack("mfds_available_space", 20);

    unsigned long n = m_dims.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
    {
        const dim_t &dim = m_dims[i];
        bs.pack(dim.name);
        bs.pack(dim.is_string);
        bs.pack(dim.tolerance);
        bs.pack(dim.values);
        bs.pack(dim.names);
    }
}

// --------------------------------------------------------------------------
void mfds_available_space::print(std::ostream &os) const
{
    size_t n = m_dims.size();
    for (size_t i = 0; i < n; ++i)
    {
        const dim_t &dim = m_dims[i];

        if (i)
            os << std::endl;

        os << dim.name << ": ";
        if (dim.is_string)
        {
            os << "[" << dim.names << "]";
        }
        else if (dim.values.empty())
        {
            os << "[]";
        }
        else
        {
            os << dim.values.size() << " values in ["
                << dim.values.front() << ", " << dim.values.back() << "]";
        }
    }
}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const mfds_available_space &space)
{
    space.print(os);
    return os;
}
