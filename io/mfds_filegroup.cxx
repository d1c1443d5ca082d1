#include "mfds_filegroup.h"
#include "mfds_array.h"
#include "mfds_keyring.h"
#include "mfds_file_util.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"
#include "mfds_common.h"

#include <algorithm>
#include <map>
#include <ostream>
#include <set>

namespace
{
// the part of a selection a filegroup holds along one dimension
struct selected
{
    long mem_idx;
    long scan_idx;
    long in_idx;
};

// the in-file name of a variable. an empty scan holds the available names
std::string get_in_name(const mfds_coord_scan &cs, long scan_idx)
{
    if (cs.is_empty())
        return cs.get_coordinate()->get_name_of_index(scan_idx);
    return cs.get_in_names()[scan_idx];
}
}

// --------------------------------------------------------------------------
mfds_filegroup::mfds_filegroup(const std::string &name) : m_name(name),
    m_max_depth(3), m_setup(false)
{}

// --------------------------------------------------------------------------
p_mfds_coord_scan mfds_filegroup::add_coordinate(const p_mfds_coordinate &coord,
    bool shared)
{
    if (this->get_coord_scan(coord->get_name()))
        return nullptr;

    p_mfds_coord_scan cs = mfds_coord_scan::New(coord, shared);
    m_scans.push_back(cs);
    m_setup = false;

    return cs;
}

// --------------------------------------------------------------------------
p_mfds_coord_scan mfds_filegroup::get_coord_scan(const std::string &name) const
{
    size_t n = m_scans.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_scans[i]->get_name() == name)
            return m_scans[i];
    }
    return nullptr;
}

// --------------------------------------------------------------------------
p_mfds_coord_scan mfds_filegroup::get_scan_of_axis(const std::string &axis) const
{
    p_mfds_coord_scan cs = this->get_coord_scan(axis);
    if (cs)
        return cs;

    size_t n = m_scans.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_scans[i]->get_coordinate()->has_name(axis))
            return m_scans[i];
    }

    return nullptr;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_filegroup::get_coordinate_names(bool shared) const
{
    std::vector<std::string> names;
    size_t n = m_scans.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_scans[i]->is_shared() == shared)
            names.push_back(m_scans[i]->get_name());
    }
    return names;
}

// --------------------------------------------------------------------------
int mfds_filegroup::add_scan_function(const std::string &coord,
    const mfds_scan_function_info &info, mfds_diagnostics &diag)
{
    p_mfds_coord_scan cs = this->get_coord_scan(coord);
    if (!cs)
    {
        MFDS_DIAG_ERROR(diag, "Filegroup \"" << m_name << "\" has no coordinate \""
            << coord << "\"")
        return mfds_error::config_error;
    }

    // the matchers are needed to check filename functions
    int ierr = 0;
    if ((info.kind == mfds_scan_function_info::filename) && !m_setup &&
        (ierr = this->setup(diag)))
        return ierr;

    if (cs->add_scan_function(info))
    {
        MFDS_DIAG_ERROR(diag, "Failed to add scan function \"" << info.name
            << "\" to coordinate \"" << coord << "\" of filegroup \""
            << m_name << "\"")
        return mfds_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_filegroup::setup(mfds_diagnostics &diag)
{
    m_setup = false;

    const mfds_element_registry &elements =
        m_elements ? *m_elements : mfds_element_registry::get_global();

    int ierr = 0;
    if ((ierr = m_pre_regex.compile(m_pre_regex_text, m_replacements,
        elements, diag)))
        return ierr;

    // bind the matchers to the coordinates
    size_t n_scans = m_scans.size();
    std::vector<std::vector<int>> matchers(n_scans);

    const std::vector<mfds_matcher> &all = m_pre_regex.get_matchers();
    size_t n_matchers = all.size();
    for (size_t i = 0; i < n_matchers; ++i)
    {
        size_t j = 0;
        for (; j < n_scans; ++j)
        {
            if (m_scans[j]->get_coordinate()->has_name(all[i].coord))
                break;
        }

        if (j == n_scans)
        {
            MFDS_DIAG_ERROR(diag, "Matcher " << i << " of filegroup \"" << m_name
                << "\" refers to coordinate \"" << all[i].coord << "\" which"
                " is not in the filegroup")
            return mfds_error::config_error;
        }

        matchers[j].push_back(i);
    }

    int n_shared = 0;
    for (size_t j = 0; j < n_scans; ++j)
    {
        m_scans[j]->set_matchers(matchers[j]);

        if (!m_scans[j]->is_shared())
            continue;

        ++n_shared;

        bool has_value = false;
        size_t n = matchers[j].size();
        for (size_t k = 0; k < n; ++k)
            has_value |= !all[matchers[j][k]].dummy;

        if (!has_value && !m_replacements.count(m_scans[j]->get_name()))
        {
            MFDS_DIAG_ERROR(diag, "Shared coordinate \"" << m_scans[j]->get_name()
                << "\" of filegroup \"" << m_name << "\" has no matcher in \""
                << m_pre_regex_text << "\"")
            return mfds_error::config_error;
        }
    }

    if (m_pre_regex.has_regex_tokens() && (n_shared > 1))
    {
        MFDS_DIAG_WARNING(diag, "The pre-regex of filegroup \"" << m_name
            << "\" has regular expression tokens outside of matchers and "
            << n_shared << " shared coordinates. The text they match is taken"
            " from the first file, the matchers must not depend on it.")
    }

    m_setup = true;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_filegroup::scan(mfds_diagnostics &diag)
{
    int ierr = 0;
    if (!m_setup && (ierr = this->setup(diag)))
        return ierr;

    // the variable dimension
    m_var_dim.clear();
    size_t n_scans = m_scans.size();
    for (size_t j = 0; j < n_scans; ++j)
    {
        p_mfds_coord_scan &cs = m_scans[j];

        if (cs->is_string())
        {
            if (!m_var_dim.empty())
            {
                MFDS_DIAG_ERROR(diag, "Filegroup \"" << m_name << "\" has more"
                    " than one string coordinate, \"" << m_var_dim << "\" and \""
                    << cs->get_name() << "\"")
                return mfds_error::config_error;
            }
            m_var_dim = cs->get_name();
        }

        if (cs->is_shared() && cs->is_empty())
        {
            MFDS_DIAG_ERROR(diag, "Shared coordinate \"" << cs->get_name()
                << "\" of filegroup \"" << m_name << "\" has neither scan"
                " functions nor values")
            return mfds_error::config_error;
        }

        if (cs->needs_file() && !m_format)
        {
            MFDS_DIAG_ERROR(diag, "Filegroup \"" << m_name << "\" has no format"
                " to scan coordinate \"" << cs->get_name() << "\" in the files")
            return mfds_error::config_error;
        }

        cs->reset();
    }

    if (m_var_dim.empty())
    {
        MFDS_DIAG_ERROR(diag, "Filegroup \"" << m_name << "\" has no variable"
            " coordinate")
        return mfds_error::config_error;
    }

    // find the files
    std::vector<std::string> files;
    if (!mfds_file_util::is_directory(m_root.c_str()) ||
        mfds_file_util::locate_files_recursive(m_root, files, m_max_depth))
    {
        MFDS_DIAG_ERROR(diag, "Failed to list the files of filegroup \""
            << m_name << "\" in \"" << m_root << "\"")
        return mfds_error::scan_error;
    }

    if (files.empty())
    {
        MFDS_DIAG_ERROR(diag, "No file found in \"" << m_root << "\" for"
            " filegroup \"" << m_name << "\"")
        return mfds_error::scan_error;
    }

    m_files.clear();
    m_first_captures.clear();

    size_t n_skipped = 0;
    size_t n_files = files.size();
    for (size_t i = 0; i < n_files; ++i)
    {
        const std::string &file = files[i];

        std::vector<std::string> captures;
        if (m_pre_regex.match(file, captures))
        {
            MFDS_DIAG_WARNING(diag, "\"" << file << "\" does not match the"
                " pre-regex of filegroup \"" << m_name << "\" and is skipped")
            ++n_skipped;
            continue;
        }

        if (m_files.empty())
        {
            m_pre_regex.set_segments(file);
            m_first_captures = captures;
        }

        m_files.push_back(file);

        std::string path = mfds_file_util::join(m_root, file);
        mfds_file_scope fh(m_format, diag);

        for (size_t j = 0; j < n_scans; ++j)
        {
            p_mfds_coord_scan &cs = m_scans[j];

            // the captures and elements of this coordinate's matchers
            mfds_scan_context ctx;
            ctx.filename = file;
            ctx.path = path;
            ctx.coord = cs->get_coordinate().get();

            const std::vector<int> &ids = cs->get_matchers();
            size_t n_ids = ids.size();
            for (size_t k = 0; k < n_ids; ++k)
            {
                ctx.captures.push_back(captures[ids[k]]);

                if (m_pre_regex.get_matchers()[ids[k]].dummy)
                    continue;

                mfds_element_values vals;
                if (m_pre_regex.parse(ids[k], captures[ids[k]], vals))
                {
                    MFDS_DIAG_ERROR(diag, "Failed to parse \"" << captures[ids[k]]
                        << "\" captured in \"" << file << "\" for coordinate \""
                        << cs->get_name() << "\"")
                    return mfds_error::scan_error;
                }
                ctx.elements.merge(vals);
            }

            if (!cs->wants_file(ctx.captures))
                continue;

            if (cs->needs_file())
            {
                if (!fh && fh.open(path))
                {
                    MFDS_DIAG_ERROR(diag, "Failed to open \"" << path
                        << "\" to scan coordinate \"" << cs->get_name() << "\"")
                    return mfds_error::scan_error;
                }
                ctx.format = m_format.get();
                ctx.handle = &fh.get_handle();
            }

            if ((ierr = cs->scan_file(ctx, diag)))
                return ierr;
        }
    }

    if (m_files.empty())
    {
        MFDS_DIAG_ERROR(diag, "None of the " << n_files << " files in \""
            << m_root << "\" matches the pre-regex \"" << m_pre_regex_text
            << "\" of filegroup \"" << m_name << "\"")
        return mfds_error::scan_error;
    }

    if (n_skipped)
    {
        MFDS_DIAG_INFO(diag, "Filegroup \"" << m_name << "\" skipped "
            << n_skipped << " files not matching \"" << m_pre_regex_text << "\"")
    }

    for (size_t j = 0; j < n_scans; ++j)
    {
        if ((ierr = m_scans[j]->finish(diag)))
        {
            MFDS_DIAG_ERROR(diag, "Failed to scan coordinate \""
                << m_scans[j]->get_name() << "\" of filegroup \"" << m_name
                << "\"")
            return ierr;
        }
    }

    MFDS_DIAG_INFO(diag, "Scanned " << m_files.size() << " files of filegroup \""
        << m_name << "\"")

    return 0;
}

// --------------------------------------------------------------------------
int mfds_filegroup::get_commands(const mfds_keyring &request,
    const std::vector<std::string> &dims,
    std::vector<mfds_load_command> &commands, mfds_diagnostics &diag) const
{
    // the part of the selection held along each dimension
    size_t n_dims = dims.size();
    std::vector<p_mfds_coord_scan> scans(n_dims);
    std::vector<std::vector<selected>> sel(n_dims);
    for (size_t i = 0; i < n_dims; ++i)
    {
        scans[i] = this->get_coord_scan(dims[i]);
        if (!scans[i])
        {
            MFDS_DIAG_ERROR(diag, "Filegroup \"" << m_name << "\" has no"
                " coordinate \"" << dims[i] << "\"")
            return mfds_error::load_error;
        }

        const mfds_key *key = request.find(dims[i]);
        std::vector<long> ids;
        if (!key || key->to_list(ids))
        {
            MFDS_DIAG_ERROR(diag, "Invalid selection of \"" << dims[i] << "\" in "
                << request)
            return mfds_error::load_error;
        }

        size_t n_ids = ids.size();
        for (size_t p = 0; p < n_ids; ++p)
        {
            selected s;
            s.mem_idx = p;
            if (!scans[i]->get_in_index(ids[p], s.in_idx, s.scan_idx))
                sel[i].push_back(s);
        }

        if (sel[i].empty())
        {
            MFDS_DIAG_DEBUG(diag, "Filegroup \"" << m_name << "\" holds none of"
                " the selection of \"" << dims[i] << "\"")
            return 0;
        }
    }

    // keys of the in coordinates, the same for every file
    mfds_keyring in_infile;
    mfds_keyring in_memory;
    std::vector<size_t> shared;
    for (size_t i = 0; i < n_dims; ++i)
    {
        if (scans[i]->is_shared())
        {
            shared.push_back(i);
            continue;
        }

        std::vector<long> mem;
        std::vector<long> in;
        std::vector<std::string> in_names;
        bool absent = false;

        size_t n_sel = sel[i].size();
        for (size_t k = 0; k < n_sel; ++k)
        {
            mem.push_back(sel[i][k].mem_idx);
            in.push_back(sel[i][k].in_idx);
            absent |= sel[i][k].in_idx < 0;

            if (scans[i]->is_string())
                in_names.push_back(get_in_name(*scans[i], sel[i][k].scan_idx));
        }

        in_memory.set(dims[i], mfds_key(mem));

        if (scans[i]->is_string())
            in_infile.set(dims[i], mfds_key::from_names(in_names));
        else if (absent)
            in_infile.set(dims[i], mfds_key());
        else
            in_infile.set(dims[i], mfds_key(in));
    }

    // one pair of keyrings per combination of the shared coordinates
    std::map<std::string, size_t> file_ids;
    std::vector<mfds_load_command> cmds;

    size_t n_shared = shared.size();
    std::vector<size_t> pos(n_shared, 0);
    bool done = false;
    while (!done)
    {
        std::vector<std::string> captures(m_first_captures);
        mfds_keyring infile(in_infile);
        mfds_keyring memory(in_memory);

        for (size_t j = 0; j < n_shared; ++j)
        {
            size_t i = shared[j];
            const p_mfds_coord_scan &cs = scans[i];
            const selected &s = sel[i][pos[j]];

            const std::vector<int> &ids = cs->get_matchers();
            const std::vector<std::string> &match = cs->get_matches()[s.scan_idx];
            size_t n_ids = ids.size();
            for (size_t k = 0; k < n_ids; ++k)
                captures[ids[k]] = match[k];

            memory.set(dims[i], mfds_key(std::vector<long>(1, s.mem_idx)));

            if (cs->is_string())
                infile.set(dims[i], mfds_key::from_names(
                    std::vector<std::string>(1, get_in_name(*cs, s.scan_idx))));
            else if (s.in_idx < 0)
                infile.set(dims[i], mfds_key());
            else
                infile.set(dims[i], mfds_key(std::vector<long>(1, s.in_idx)));
        }

        std::string filename;
        if (m_pre_regex.make_filename(captures, filename))
        {
            MFDS_DIAG_ERROR(diag, "Failed to make a file name for filegroup \""
                << m_name << "\"")
            return mfds_error::load_error;
        }

        std::map<std::string, size_t>::iterator it = file_ids.find(filename);
        if (it == file_ids.end())
        {
            it = file_ids.insert(std::make_pair(filename, cmds.size())).first;
            cmds.push_back(mfds_load_command(filename));
        }

        infile.sort_by(dims);
        memory.sort_by(dims);
        cmds[it->second].add_keys(infile, memory);

        // next combination
        done = true;
        for (size_t j = 0; j < n_shared; ++j)
        {
            if (++pos[j] < sel[shared[j]].size())
            {
                done = false;
                break;
            }
            pos[j] = 0;
        }
    }

    bool separate = !m_format || !m_format->can_read_multiple_variables();

    size_t n_cmds = cmds.size();
    for (size_t i = 0; i < n_cmds; ++i)
    {
        mfds_load_command &cmd = cmds[i];

        if (cmd.merge())
        {
            MFDS_DIAG_ERROR(diag, "Failed to merge the keys of \""
                << cmd.get_filename() << "\"")
            return mfds_error::load_error;
        }

        cmd.simplify();
        cmd.sort_by(dims);

        if (separate)
        {
            if (cmd.separate_variables(m_var_dim, commands))
            {
                MFDS_DIAG_ERROR(diag, "Failed to separate the variables of \""
                    << cmd.get_filename() << "\"")
                return mfds_error::load_error;
            }
        }
        else
        {
            commands.push_back(cmd);
        }
    }

    MFDS_DIAG_DEBUG(diag, "Filegroup \"" << m_name << "\" made "
        << commands.size() << " load commands")

    return 0;
}

// --------------------------------------------------------------------------
int mfds_filegroup::execute(const mfds_load_command &cmd, mfds_array &dst,
    mfds_diagnostics &diag) const
{
    std::string path = mfds_file_util::join(m_root, cmd.get_filename());

    mfds_file_scope fh(m_format, diag);
    if (fh.open(path))
    {
        MFDS_DIAG_ERROR(diag, "Failed to open \"" << path << "\"")
        return mfds_error::load_error;
    }

    size_t n_keys = cmd.size();
    for (size_t i = 0; i < n_keys; ++i)
    {
        const mfds_command_keys &keys = cmd.get_keys(i);

        const mfds_key *in_var = keys.infile.find(m_var_dim);
        const mfds_key *mem_var = keys.memory.find(m_var_dim);

        std::vector<long> mem_ids;
        mfds_key tmp;
        if (mem_var)
            tmp = *mem_var;

        if (!in_var || !mem_var || !in_var->is_str() || tmp.to_list(mem_ids)
            || (mem_ids.size() != in_var->get_names().size()))
        {
            MFDS_DIAG_ERROR(diag, "No variable to read from \"" << path
                << "\" in " << keys.infile)
            return mfds_error::load_error;
        }

        const std::vector<std::string> &names = in_var->get_names();
        size_t n_vars = names.size();
        for (size_t j = 0; j < n_vars; ++j)
        {
            mfds_keyring infile(keys.infile);
            infile.remove(m_var_dim);

            mfds_keyring memory(keys.memory);
            memory.set(m_var_dim, mfds_key(mem_ids[j]));

            if (this->read_variable(fh.get_handle(), names[j], infile,
                memory, dst, diag))
            {
                MFDS_DIAG_ERROR(diag, "Failed to load \"" << names[j]
                    << "\" from \"" << path << "\" into " << memory)
                return mfds_error::load_error;
            }
        }
    }

    if (fh.close())
    {
        MFDS_DIAG_ERROR(diag, "Failed to close \"" << path << "\"")
        return mfds_error::load_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_filegroup::read_variable(const p_mfds_file_handle &handle,
    const std::string &variable, const mfds_keyring &infile,
    const mfds_keyring &memory, mfds_array &dst, mfds_diagnostics &diag) const
{
    // the axes of the variable in the file
    std::vector<std::string> axes;
    if (m_format->get_axis_order(handle, variable, axes, diag))
    {
        if (!m_dim_order.empty())
        {
            axes = m_dim_order;
        }
        else
        {
            mfds_keyring::const_iterator it = infile.begin();
            for (; it != infile.end(); ++it)
            {
                if (!it->second.is_none())
                    axes.push_back(it->first);
            }
        }
    }

    // one key per axis. axes of unknown coordinates are read at 0
    mfds_keyring read_keys;
    std::vector<std::pair<std::string, std::string>> renames;
    std::set<std::string> read_dims;
    size_t n_axes = axes.size();
    for (size_t i = 0; i < n_axes; ++i)
    {
        p_mfds_coord_scan cs = this->get_scan_of_axis(axes[i]);
        const mfds_key *key = cs ? infile.find(cs->get_name()) : nullptr;

        if (!key || key->is_none())
        {
            long size = 0;
            if (!m_format->get_dim_size(handle, axes[i], size, diag) && (size > 1))
            {
                MFDS_DIAG_WARNING(diag, "Dimension \"" << axes[i] << "\" of \""
                    << variable << "\" in \"" << handle->get_path() << "\" has "
                    << size << " elements, only the first is read")
            }
            read_keys.set(axes[i], mfds_key(0));
            continue;
        }

        read_keys.set(axes[i], *key);
        read_dims.insert(cs->get_name());

        if (!key->is_int())
            renames.push_back(std::make_pair(axes[i], cs->get_name()));
    }

    // keys for coordinates the file does not have
    mfds_keyring::const_iterator it = infile.begin();
    for (; it != infile.end(); ++it)
    {
        const mfds_key &key = it->second;
        if (!key.is_none() && !read_dims.count(it->first) &&
            (key.get_shape() > 1))
        {
            MFDS_DIAG_ERROR(diag, "Coordinate \"" << it->first << "\" selects "
                << key << " but is not a dimension of \"" << variable << "\"")
            return -1;
        }
    }

    mfds_array chunk;
    if (m_format->read(handle, variable, read_keys, chunk, diag))
        return -1;

    size_t n_renames = renames.size();
    for (size_t i = 0; i < n_renames; ++i)
    {
        if (chunk.rename_dim(renames[i].first, renames[i].second))
            return -1;
    }

    // size one axes for coordinates the file does not have. the chunk is
    // repeated along those selecting more than one element
    std::vector<std::string> order;
    std::vector<std::string> repeat;
    mfds_keyring::const_iterator mit = memory.begin();
    for (; mit != memory.end(); ++mit)
    {
        if (mit->second.is_int())
            continue;

        if (chunk.get_dim_id(mit->first) < 0)
        {
            if (chunk.expand_dims(mit->first, chunk.get_ndim()))
                return -1;

            if (mit->second.get_shape() != 1)
                repeat.push_back(mit->first);
        }

        order.push_back(mit->first);
    }

    mfds_array tchunk;
    if (chunk.transpose(order, tchunk))
    {
        MFDS_DIAG_ERROR(diag, "Can not order " << chunk << " as ["
            << order << "]")
        return -1;
    }

    std::vector<mfds_keyring> places(1, memory);
    size_t n_repeat = repeat.size();
    for (size_t i = 0; i < n_repeat; ++i)
    {
        mfds_key key(*memory.find(repeat[i]));
        key.set_parent_size(dst.get_shape()[dst.get_dim_id(repeat[i])]);

        std::vector<long> ids;
        if (key.to_list(ids))
            return -1;

        std::vector<mfds_keyring> next;
        size_t n_places = places.size();
        size_t n_ids = ids.size();
        for (size_t j = 0; j < n_places; ++j)
        {
            for (size_t k = 0; k < n_ids; ++k)
            {
                next.push_back(places[j]);
                next.back().set(repeat[i], mfds_key(std::vector<long>(1, ids[k])));
            }
        }
        places.swap(next);
    }

    size_t n_places = places.size();
    for (size_t i = 0; i < n_places; ++i)
    {
        if (mfds_array_access::place(dst, places[i], tchunk))
        {
            MFDS_DIAG_ERROR(diag, "Failed to place " << tchunk << " at "
                << places[i] << " in " << dst)
            return -1;
        }
    }

    MFDS_DIAG_DEBUG(diag, "Read \"" << variable << "\" " << read_keys
        << " from \"" << handle->get_path() << "\" into " << memory)

    return 0;
}

// --------------------------------------------------------------------------
void mfds_filegroup::to_stream(mfds_binary_stream &bs) const
{
    bs.pack("mfds_filegroup", 14);
    bs.pack(m_name);
    bs.pack(m_files);
    bs.pack(m_pre_regex.get_segments());

    unsigned long n = m_scans.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
        m_scans[i]->to_stream(bs);
}

// --------------------------------------------------------------------------
void mfds_filegroup::print(std::ostream &os) const
{
    os << "filegroup " << m_name << ": " << m_files.size() << " files in "
        << m_root << " matching " << m_pre_regex_text;

    size_t n = m_scans.size();
    for (size_t i = 0; i < n; ++i)
        os << std::endl << "    " << *m_scans[i];
}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const mfds_filegroup &fg)
{
    fg.print(os);
    return os;
}
