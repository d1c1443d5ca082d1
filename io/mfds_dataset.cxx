#include "mfds_dataset.h"
#include "mfds_array.h"
#include "mfds_keyring.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"
#include "mfds_common.h"

#include <algorithm>
#include <ostream>
#include <sstream>

#if defined(MFDS_HAS_BOOST)
#include <boost/program_options.hpp>
#endif

// --------------------------------------------------------------------------
mfds_dataset::mfds_dataset() : m_mode("default"),
    m_duplicate_policy("reject"), m_verbose(0)
{}

#if defined(MFDS_HAS_BOOST)
// --------------------------------------------------------------------------
void mfds_dataset::get_properties_description(const std::string &prefix,
    options_description &global_opts)
{
    options_description opts("Options for "
        + (prefix.empty()?"mfds_dataset":prefix));

    opts.add_options()
        MFDS_POPTS_GET(std::string, prefix, mode,
            "How the coordinates of the filegroups are reconciled. \"default\""
            " keeps the values found in every filegroup, \"advanced\" keeps the"
            " values found in any filegroup")
        MFDS_POPTS_GET(std::string, prefix, duplicate_policy,
            "What to do when two filegroups hold data at the same coordinates."
            " \"reject\" fails the scan, \"keep_first\" loads the data from the"
            " first filegroup")
        MFDS_POPTS_GET(int, prefix, verbose,
            "If set then status messages are sent to the terminal.")
        ;

    global_opts.add(opts);
}

// --------------------------------------------------------------------------
void mfds_dataset::set_properties(const std::string &prefix,
    variables_map &opts)
{
    MFDS_POPTS_SET(opts, std::string, prefix, mode)
    MFDS_POPTS_SET(opts, std::string, prefix, duplicate_policy)
    MFDS_POPTS_SET(opts, int, prefix, verbose)
}
#endif

// --------------------------------------------------------------------------
int mfds_dataset::add_coordinate(const p_mfds_coordinate &coord)
{
    return m_coords.add(coord);
}

// --------------------------------------------------------------------------
int mfds_dataset::add_filegroup(const p_mfds_filegroup &fg)
{
    if (!fg || this->get_filegroup(fg->get_name()))
    {
        MFDS_ERROR("Invalid filegroup or the name \""
            << (fg ? fg->get_name() : std::string()) << "\" is in use")
        return -1;
    }

    m_filegroups.push_back(fg);
    m_space.clear();

    return 0;
}

// --------------------------------------------------------------------------
p_mfds_filegroup mfds_dataset::get_filegroup(const std::string &name) const
{
    size_t n = m_filegroups.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_filegroups[i]->get_name() == name)
            return m_filegroups[i];
    }
    return nullptr;
}

// --------------------------------------------------------------------------
int mfds_dataset::scan_all(mfds_diagnostics &diag)
{
    m_space.clear();

    int mode = 0;
    int policy = 0;
    if (mfds_available_space::get_mode(m_mode, mode))
    {
        MFDS_DIAG_ERROR(diag, "Invalid mode \"" << m_mode << "\"")
        return mfds_error::config_error;
    }

    if (mfds_available_space::get_duplicate_policy(m_duplicate_policy, policy))
    {
        MFDS_DIAG_ERROR(diag, "Invalid duplicate policy \""
            << m_duplicate_policy << "\"")
        return mfds_error::config_error;
    }

    if (m_dims.empty())
    {
        MFDS_DIAG_ERROR(diag, "The dataset has no dimension")
        return mfds_error::config_error;
    }

    if (m_filegroups.empty())
    {
        MFDS_DIAG_ERROR(diag, "The dataset has no filegroup")
        return mfds_error::config_error;
    }

    size_t n_dims = m_dims.size();
    int n_string = 0;
    for (size_t i = 0; i < n_dims; ++i)
    {
        p_mfds_coordinate coord = m_coords.get(m_dims[i]);
        if (!coord || (coord->get_name() != m_dims[i]))
        {
            MFDS_DIAG_ERROR(diag, "Dimension \"" << m_dims[i] << "\" has no"
                " coordinate")
            return mfds_error::config_error;
        }
        n_string += coord->is_string() ? 1 : 0;
    }

    if (n_string != 1)
    {
        MFDS_DIAG_ERROR(diag, "The dataset needs exactly one variable"
            " dimension, found " << n_string)
        return mfds_error::config_error;
    }

    size_t n_fg = m_filegroups.size();
    for (size_t j = 0; j < n_fg; ++j)
    {
        mfds_filegroup &fg = *m_filegroups[j];

        // every scanned coordinate must be a dimension
        const std::vector<p_mfds_coord_scan> &scans = fg.get_coord_scans();
        size_t n_scans = scans.size();
        for (size_t k = 0; k < n_scans; ++k)
        {
            if (std::find(m_dims.begin(), m_dims.end(), scans[k]->get_name())
                == m_dims.end())
            {
                MFDS_DIAG_ERROR(diag, "Coordinate \"" << scans[k]->get_name()
                    << "\" of filegroup \"" << fg.get_name() << "\" is not a"
                    " dimension of the dataset")
                return mfds_error::config_error;
            }
        }

        // dimensions the filegroup does not scan take the available values
        for (size_t i = 0; i < n_dims; ++i)
        {
            if (!fg.get_coord_scan(m_dims[i]))
                fg.add_coordinate(m_coords.get(m_dims[i]), false);
        }

        int ierr = 0;
        if ((ierr = fg.scan(diag)))
        {
            MFDS_DIAG_ERROR(diag, "Failed to scan filegroup \""
                << fg.get_name() << "\"")
            return ierr;
        }
    }

    int ierr = 0;
    if ((ierr = m_space.compute(m_coords, m_filegroups, m_dims, mode,
        policy, diag)))
        return ierr;

    MFDS_DIAG_INFO(diag, "Available space:" << std::endl << m_space)

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset::normalize(const mfds_keyring &request, mfds_keyring &keys,
    mfds_diagnostics &diag) const
{
    if (m_space.empty())
    {
        MFDS_DIAG_ERROR(diag, "The dataset has not been scanned")
        return mfds_error::load_error;
    }

    keys = request;

    std::vector<std::string> dims = keys.get_dims();
    size_t n = dims.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (std::find(m_dims.begin(), m_dims.end(), dims[i]) == m_dims.end())
        {
            MFDS_DIAG_ERROR(diag, "\"" << dims[i] << "\" is not a dimension of"
                " the dataset")
            return mfds_error::load_error;
        }
    }

    keys.make_full(m_dims);
    keys.sort_by(m_dims);

    if (keys.make_str_idx(m_coords))
    {
        MFDS_DIAG_ERROR(diag, "Invalid variables in " << request)
        return mfds_error::load_error;
    }

    std::map<std::string, long> sizes = m_space.get_sizes();
    keys.make_total(sizes);
    keys.make_int_list();

    // every index must be available
    mfds_keyring::iterator it = keys.begin();
    for (; it != keys.end(); ++it)
    {
        long size = sizes[it->first];

        std::vector<long> ids;
        if (it->second.to_list(ids))
        {
            MFDS_DIAG_ERROR(diag, "Invalid key " << it->second << " for \""
                << it->first << "\"")
            return mfds_error::load_error;
        }

        size_t n_ids = ids.size();
        for (size_t k = 0; k < n_ids; ++k)
        {
            long id = ids[k] < 0 ? ids[k] + size : ids[k];
            if ((id < 0) || (id >= size))
            {
                MFDS_DIAG_ERROR(diag, "Index " << ids[k] << " of \""
                    << it->first << "\" is out of bounds, the size is "
                    << size)
                return mfds_error::load_error;
            }
            ids[k] = id;
        }

        it->second = mfds_key(ids);
        it->second.set_parent_size(size);
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset::get_load_shape(const mfds_keyring &request,
    std::vector<long> &shape, mfds_diagnostics &diag) const
{
    mfds_keyring keys;
    int ierr = 0;
    if ((ierr = this->normalize(request, keys, diag)))
        return ierr;

    shape.clear();
    mfds_keyring::const_iterator it = keys.begin();
    for (; it != keys.end(); ++it)
        shape.push_back(it->second.get_shape());

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset::get_load_commands(const mfds_keyring &request,
    std::vector<std::vector<mfds_load_command>> &commands,
    mfds_diagnostics &diag) const
{
    mfds_keyring keys;
    int ierr = 0;
    if ((ierr = this->normalize(request, keys, diag)))
        return ierr;

    size_t n_fg = m_filegroups.size();
    commands.resize(n_fg);
    for (size_t j = 0; j < n_fg; ++j)
    {
        commands[j].clear();
        if (m_filegroups[j]->get_commands(keys, m_dims, commands[j], diag))
        {
            MFDS_DIAG_ERROR(diag, "Failed to plan the load of " << request
                << " from filegroup \"" << m_filegroups[j]->get_name() << "\"")
            return mfds_error::load_error;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset::plan_and_load(const mfds_keyring &request, mfds_array &dst,
    mfds_diagnostics &diag) const
{
    std::vector<long> shape;
    int ierr = 0;
    if ((ierr = this->get_load_shape(request, shape, diag)))
        return ierr;

    if (dst.empty())
    {
        dst.resize(m_dims, shape);
    }
    else if ((dst.get_dims() != m_dims) || (dst.get_shape() != shape))
    {
        MFDS_DIAG_ERROR(diag, "The destination " << dst << " does not match"
            " the selection " << request << " of shape [" << shape << "]")
        return mfds_error::load_error;
    }

    std::vector<std::vector<mfds_load_command>> commands;
    if ((ierr = this->get_load_commands(request, commands, diag)))
        return ierr;

    std::ostringstream failed;
    size_t n_failed = 0;
    size_t n_done = 0;

    size_t n_fg = m_filegroups.size();
    for (size_t j = 0; j < n_fg; ++j)
    {
        const mfds_filegroup &fg = *m_filegroups[j];

        size_t n_cmds = commands[j].size();
        for (size_t k = 0; k < n_cmds; ++k)
        {
            const mfds_load_command &cmd = commands[j][k];

            MFDS_DIAG_DEBUG(diag, "Executing " << cmd)

            if (fg.execute(cmd, dst, diag))
            {
                failed << std::endl << "    " << fg.get_name() << ": "
                    << cmd.get_filename();
                size_t n_keys = cmd.size();
                for (size_t i = 0; i < n_keys; ++i)
                    failed << (i ? ", " : " into ") << cmd.get_keys(i).memory;
                ++n_failed;
                continue;
            }

            ++n_done;
        }
    }

    if (n_failed)
    {
        MFDS_DIAG_ERROR(diag, "Failed to load " << n_failed << " of "
            << n_failed + n_done << " files:" << failed.str())
        return mfds_error::load_error;
    }

    MFDS_DIAG_INFO(diag, "Executed " << n_done << " load commands for "
        << request)

    return 0;
}

// --------------------------------------------------------------------------
void mfds_dataset::to_stream(mfds_binary_stream &bs) const
{
    bs.pack("mfds_dataset", 12);
    bs.pack(m_mode);
    bs.pack(m_duplicate_policy);
    bs.pack(m_dims);
    m_coords.to_stream(bs);

    unsigned long n = m_filegroups.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
        m_filegroups[i]->to_stream(bs);

    m_space.to_stream(bs);
}

// --------------------------------------------------------------------------
void mfds_dataset::print(std::ostream &os) const
{
    os << "dataset [" << m_dims << "] in " << m_mode << " mode";

    size_t n = m_filegroups.size();
    for (size_t i = 0; i < n; ++i)
        os << std::endl << *m_filegroups[i];

    if (!m_space.empty())
        os << std::endl << "available space:" << std::endl << m_space;
}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const mfds_dataset &ds)
{
    ds.print(os);
    return os;
}
