#include "mfds_dataset_config.h"
#include "mfds_coordinate.h"
#include "mfds_filegroup.h"
#include "mfds_file_format.h"
#include "mfds_scan_library.h"
#include "mfds_string_util.h"
#include "mfds_binary_stream.h"
#include "mfds_diagnostics.h"
#include "mfds_common.h"

#include <cstring>

namespace
{
// **************************************************************************
bool is_label(const char *line, const char *label)
{
    size_t n = strlen(label);
    if (strncmp(line, label, n) != 0)
        return false;

    const char *p = line + n;
    while ((*p == ' ') || (*p == '\t'))
        ++p;

    return *p == '=';
}

// **************************************************************************
int parse_string(char *line, unsigned long line_no, const char *label,
    std::string &val)
{
    if (!val.empty())
    {
        MFDS_ERROR("Duplicate " << label << " label found on line " << line_no)
        return -1;
    }

    if (mfds_string_util::extract_value<std::string>(line, val))
    {
        MFDS_ERROR("Syntax error when parsing " << label << " on line " << line_no)
        return -1;
    }

    return 0;
}

// **************************************************************************
int parse_list(char *line, unsigned long line_no, const char *label,
    std::vector<std::string> &vals)
{
    if (!vals.empty())
    {
        MFDS_ERROR("Duplicate " << label << " label found on line " << line_no)
        return -1;
    }

    if (mfds_string_util::extract_values<std::string>(line, vals))
    {
        MFDS_ERROR("Syntax error when parsing " << label << " on line " << line_no)
        return -1;
    }

    return 0;
}

// **************************************************************************
int parse_number(const std::string &text, double &val)
{
    return mfds_string_util::string_tt<double>::convert(text.c_str(), val);
}
}

// --------------------------------------------------------------------------
int mfds_dataset_config::coordinate_options::parse_line(char *line,
    unsigned long line_no)
{
    if (is_label(line, "name"))
    {
        return parse_string(line, line_no, "name", name);
    }
    else if (is_label(line, "type"))
    {
        if (mfds_string_util::extract_value<std::string>(line, type))
        {
            MFDS_ERROR("Syntax error when parsing type on line " << line_no)
            return -1;
        }
    }
    else if (is_label(line, "units"))
    {
        return parse_string(line, line_no, "units", units);
    }
    else if (is_label(line, "alt_names"))
    {
        return parse_list(line, line_no, "alt_names", alt_names);
    }
    else if (is_label(line, "tolerance"))
    {
        if (mfds_string_util::extract_value<double>(line, tolerance) ||
            (tolerance < 0.0))
        {
            MFDS_ERROR("Syntax error when parsing tolerance on line " << line_no)
            return -1;
        }
    }
    else if (is_label(line, "values"))
    {
        return parse_list(line, line_no, "values", values);
    }
    else
    {
        MFDS_ERROR("Invalid label \"" << line << "\" in [coordinate] section"
            " on line " << line_no)
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
void mfds_dataset_config::coordinate_options::to_stream(
    mfds_binary_stream &bs) const
{
    bs.pack(name);
    bs.pack(type);
    bs.pack(units);
    bs.pack(alt_names);
    bs.pack(tolerance);
    bs.pack(values);
}

// --------------------------------------------------------------------------
int mfds_dataset_config::coordinate_options::from_stream(
    mfds_binary_stream &bs)
{
    bs.unpack(name);
    bs.unpack(type);
    bs.unpack(units);
    bs.unpack(alt_names);
    bs.unpack(tolerance);
    bs.unpack(values);
    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset_config::filegroup_options::parse_line(char *line,
    unsigned long line_no)
{
    if (is_label(line, "name"))
        return parse_string(line, line_no, "name", name);
    else if (is_label(line, "root"))
        return parse_string(line, line_no, "root", root);
    else if (is_label(line, "pattern"))
        return parse_string(line, line_no, "pattern", pattern);
    else if (is_label(line, "format"))
        return parse_string(line, line_no, "format", format);
    else if (is_label(line, "in"))
        return parse_list(line, line_no, "in", in);
    else if (is_label(line, "shared"))
        return parse_list(line, line_no, "shared", shared);
    else if (is_label(line, "variables"))
        return parse_list(line, line_no, "variables", variables);
    else if (is_label(line, "scan"))
        return parse_list(line, line_no, "scan", scan);
    else if (is_label(line, "index"))
        return parse_list(line, line_no, "index", index);
    else if (is_label(line, "mirror"))
        return parse_list(line, line_no, "mirror", mirror);
    else if (is_label(line, "order"))
        return parse_list(line, line_no, "order", order);
    else if (is_label(line, "select"))
        return parse_list(line, line_no, "select", select);
    else if (is_label(line, "tolerance"))
        return parse_list(line, line_no, "tolerance", tolerance);
    else if (is_label(line, "max_depth"))
    {
        if (mfds_string_util::extract_value<int>(line, max_depth) ||
            (max_depth < 0))
        {
            MFDS_ERROR("Syntax error when parsing max_depth on line " << line_no)
            return -1;
        }
        return 0;
    }

    MFDS_ERROR("Invalid label \"" << line << "\" in [filegroup] section"
        " on line " << line_no)
    return -1;
}

// --------------------------------------------------------------------------
void mfds_dataset_config::filegroup_options::to_stream(
    mfds_binary_stream &bs) const
{
    bs.pack(name);
    bs.pack(root);
    bs.pack(pattern);
    bs.pack(format);
    bs.pack(in);
    bs.pack(shared);
    bs.pack(variables);
    bs.pack(max_depth);
    bs.pack(scan);
    bs.pack(index);
    bs.pack(mirror);
    bs.pack(order);
    bs.pack(select);
    bs.pack(tolerance);
}

// --------------------------------------------------------------------------
int mfds_dataset_config::filegroup_options::from_stream(
    mfds_binary_stream &bs)
{
    bs.unpack(name);
    bs.unpack(root);
    bs.unpack(pattern);
    bs.unpack(format);
    bs.unpack(in);
    bs.unpack(shared);
    bs.unpack(variables);
    bs.unpack(max_depth);
    bs.unpack(scan);
    bs.unpack(index);
    bs.unpack(mirror);
    bs.unpack(order);
    bs.unpack(select);
    bs.unpack(tolerance);
    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset_config::read(const std::string &file_name, MPI_Comm comm,
    mfds_diagnostics &diag)
{
    int rank = mfds_mpi::get_comm_rank(comm);

    mfds_binary_stream bs;
    if (rank == 0)
    {
        int ierr = 0;
        mfds_file_util::line_buffer lines;
        if (lines.initialize(file_name.c_str()))
        {
            MFDS_DIAG_ERROR(diag, "Failed to read \"" << file_name << "\"")
            ierr = mfds_error::config_error;
        }
        else if ((ierr = this->parse_lines(lines, diag)))
        {
            MFDS_DIAG_ERROR(diag, "Failed to parse \"" << file_name << "\"")
        }

        // the other ranks learn of the failure through the stream
        bs.pack(ierr);
        if (!ierr)
            this->to_stream(bs);
    }

    if ((mfds_mpi::get_comm_size(comm) > 1) && bs.broadcast(comm))
    {
        MFDS_DIAG_ERROR(diag, "Failed to broadcast the configuration")
        return mfds_error::config_error;
    }

    int ierr = 0;
    bs.unpack(ierr);
    if (ierr)
        return ierr;

    if (rank != 0)
        return this->from_stream(bs);

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset_config::parse(const std::string &text, mfds_diagnostics &diag)
{
    mfds_file_util::line_buffer lines;
    if (lines.initialize_text(text))
    {
        MFDS_DIAG_ERROR(diag, "Failed to split the configuration in lines")
        return mfds_error::config_error;
    }

    return this->parse_lines(lines, diag);
}

// --------------------------------------------------------------------------
int mfds_dataset_config::parse_lines(mfds_file_util::line_buffer &lines,
    mfds_diagnostics &diag)
{
    m_data_root.clear();
    m_dims.clear();
    m_mode.clear();
    m_duplicate_policy.clear();
    m_coordinates.clear();
    m_filegroups.clear();

    // 0 for the global settings, 1 in a [coordinate], 2 in a [filegroup]
    int section = 0;

    while (lines)
    {
        unsigned long lno = lines.line_number() + 1;
        char *l = lines.current();
        lines.pop();

        if (mfds_string_util::skip_pad(l) || mfds_string_util::is_comment(l))
            continue;

        mfds_string_util::trim_pad(l);

        int ierr = 0;
        if (l[0] == '[')
        {
            if (strcmp("[coordinate]", l) == 0)
            {
                m_coordinates.push_back(coordinate_options());
                section = 1;
            }
            else if (strcmp("[filegroup]", l) == 0)
            {
                m_filegroups.push_back(filegroup_options());
                section = 2;
            }
            else
            {
                MFDS_DIAG_ERROR(diag, "Invalid section \"" << l << "\" on line "
                    << lno)
                return mfds_error::config_error;
            }
        }
        else if (section == 1)
        {
            ierr = m_coordinates.back().parse_line(l, lno);
        }
        else if (section == 2)
        {
            ierr = m_filegroups.back().parse_line(l, lno);
        }
        else if (is_label(l, "data_root"))
        {
            ierr = parse_string(l, lno, "data_root", m_data_root);
        }
        else if (is_label(l, "dims"))
        {
            ierr = parse_list(l, lno, "dims", m_dims);
        }
        else if (is_label(l, "mode"))
        {
            ierr = parse_string(l, lno, "mode", m_mode);
        }
        else if (is_label(l, "duplicate_policy"))
        {
            ierr = parse_string(l, lno, "duplicate_policy", m_duplicate_policy);
        }
        else
        {
            MFDS_DIAG_ERROR(diag, "Invalid global setting \"" << l
                << "\" on line " << lno)
            return mfds_error::config_error;
        }

        if (ierr)
        {
            MFDS_DIAG_ERROR(diag, "Syntax error on line " << lno)
            return mfds_error::config_error;
        }
    }

    // check the sections
    size_t n_coords = m_coordinates.size();
    for (size_t i = 0; i < n_coords; ++i)
    {
        if (m_coordinates[i].name.empty())
        {
            MFDS_DIAG_ERROR(diag, "[coordinate] section " << i << " has no name")
            return mfds_error::config_error;
        }
    }

    size_t n_fgs = m_filegroups.size();
    for (size_t i = 0; i < n_fgs; ++i)
    {
        filegroup_options &opts = m_filegroups[i];

        // always give a name
        if (opts.name.empty())
            opts.name = std::to_string(i);

        if (opts.pattern.empty())
        {
            MFDS_DIAG_ERROR(diag, "[filegroup] section \"" << opts.name
                << "\" has no pattern")
            return mfds_error::config_error;
        }

        // look for and replace %data_root% if it is present
        if (!m_data_root.empty())
        {
            size_t loc = opts.root.find("%data_root%");
            if (loc != std::string::npos)
                opts.root.replace(loc, 11, m_data_root);
        }
        else if (opts.root.find("%data_root%") != std::string::npos)
        {
            MFDS_DIAG_ERROR(diag, "[filegroup] section \"" << opts.name
                << "\" uses %data_root% but data_root is not set")
            return mfds_error::config_error;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset_config::configure(mfds_dataset &ds,
    mfds_diagnostics &diag) const
{
    if (!m_dims.empty())
        ds.set_dims(m_dims);

    if (!m_mode.empty())
        ds.set_mode(m_mode);

    if (!m_duplicate_policy.empty())
        ds.set_duplicate_policy(m_duplicate_policy);

    size_t n_coords = m_coordinates.size();
    for (size_t i = 0; i < n_coords; ++i)
    {
        const coordinate_options &opts = m_coordinates[i];

        p_mfds_coordinate coord = mfds_coordinate::New(opts.type);
        if (!coord)
        {
            MFDS_DIAG_ERROR(diag, "Coordinate \"" << opts.name << "\" has an"
                " invalid type \"" << opts.type << "\"")
            return mfds_error::config_error;
        }

        coord->set_name(opts.name);
        coord->set_units(opts.units);
        coord->set_alt_names(opts.alt_names);

        if (opts.tolerance >= 0.0)
            coord->set_tolerance(opts.tolerance);

        if (!opts.values.empty())
        {
            int ierr = 0;
            if (coord->is_string())
            {
                ierr = coord->set_names(opts.values);
            }
            else
            {
                size_t n = opts.values.size();
                std::vector<double> values(n);
                for (size_t j = 0; (j < n) && !ierr; ++j)
                    ierr = parse_number(opts.values[j], values[j]);

                if (!ierr)
                    ierr = coord->set_values(values);
            }

            if (ierr)
            {
                MFDS_DIAG_ERROR(diag, "Invalid values [" << opts.values
                    << "] for coordinate \"" << opts.name << "\"")
                return mfds_error::config_error;
            }
        }

        if (ds.add_coordinate(coord))
        {
            MFDS_DIAG_ERROR(diag, "Failed to add coordinate \"" << opts.name
                << "\"")
            return mfds_error::config_error;
        }
    }

    size_t n_fgs = m_filegroups.size();
    for (size_t i = 0; i < n_fgs; ++i)
    {
        int ierr = 0;
        if ((ierr = this->configure_filegroup(ds, m_filegroups[i], diag)))
        {
            MFDS_DIAG_ERROR(diag, "Failed to configure filegroup \""
                << m_filegroups[i].name << "\"")
            return ierr;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_dataset_config::configure_filegroup(mfds_dataset &ds,
    const filegroup_options &opts, mfds_diagnostics &diag) const
{
    const mfds_coordinate_registry &coords = ds.get_coordinates();

    p_mfds_filegroup fg = mfds_filegroup::New(opts.name);
    fg->set_root(opts.root);
    fg->set_pre_regex(opts.pattern);

    if (opts.max_depth >= 0)
        fg->set_max_depth(opts.max_depth);

    if (!opts.format.empty())
    {
        p_mfds_file_format format = mfds_file_format::New(opts.format);
        if (!format)
        {
            MFDS_DIAG_ERROR(diag, "Invalid format \"" << opts.format
                << "\", one of [" << mfds_file_format::get_format_names()
                << "] is expected")
            return mfds_error::config_error;
        }
        fg->set_format(format);
    }

    // the coordinates, in then shared
    for (int shared = 0; shared < 2; ++shared)
    {
        const std::vector<std::string> &names = shared ? opts.shared : opts.in;
        size_t n = names.size();
        for (size_t i = 0; i < n; ++i)
        {
            p_mfds_coordinate coord = coords.get(names[i]);
            if (!coord)
            {
                MFDS_DIAG_ERROR(diag, "No coordinate named \"" << names[i]
                    << "\"")
                return mfds_error::config_error;
            }

            if (!fg->add_coordinate(coord, shared))
            {
                MFDS_DIAG_ERROR(diag, "Coordinate \"" << names[i] << "\" is"
                    " listed twice")
                return mfds_error::config_error;
            }
        }
    }

    // the variables held
    if (!opts.variables.empty())
    {
        p_mfds_coord_scan var;
        const std::vector<p_mfds_coord_scan> &scans = fg->get_coord_scans();
        size_t n_scans = scans.size();
        for (size_t i = 0; (i < n_scans) && !var; ++i)
        {
            if (scans[i]->is_string())
                var = scans[i];
        }

        size_t n_coords = coords.size();
        for (size_t i = 0; (i < n_coords) && !var; ++i)
        {
            if (coords.get(i)->is_string())
                var = fg->add_coordinate(coords.get(i), false);
        }

        if (!var)
        {
            MFDS_DIAG_ERROR(diag, "There is no string coordinate to hold the"
                " variables [" << opts.variables << "]")
            return mfds_error::config_error;
        }

        var->set_manual_names(opts.variables);
    }

    // constant in-file indices
    size_t n = opts.index.size();
    for (size_t i = 0; i < n; ++i)
    {
        std::vector<std::string> toks;
        p_mfds_coord_scan cs;
        double idx = -1.0;
        if (mfds_string_util::split(opts.index[i], ':', toks) ||
            (toks.size() != 2) || !(cs = fg->get_coord_scan(toks[0])) ||
            ((toks[1] != "none") && parse_number(toks[1], idx)))
        {
            MFDS_DIAG_ERROR(diag, "Invalid index \"" << opts.index[i] << "\","
                " coord:value is expected")
            return mfds_error::config_error;
        }
        cs->set_constant_in_idx(long(idx));
    }

    n = opts.mirror.size();
    for (size_t i = 0; i < n; ++i)
    {
        p_mfds_coord_scan cs = fg->get_coord_scan(opts.mirror[i]);
        if (!cs)
        {
            MFDS_DIAG_ERROR(diag, "Can not mirror \"" << opts.mirror[i]
                << "\", the filegroup has no such coordinate")
            return mfds_error::config_error;
        }
        cs->set_force_index_descending(true);
    }

    if (!opts.order.empty())
        fg->set_dim_order(opts.order);

    n = opts.select.size();
    for (size_t i = 0; i < n; ++i)
    {
        std::vector<std::string> toks;
        p_mfds_coord_scan cs;
        double lo = 0.0;
        double hi = 0.0;
        if (mfds_string_util::split(opts.select[i], ':', toks) ||
            (toks.size() != 3) || !(cs = fg->get_coord_scan(toks[0])) ||
            parse_number(toks[1], lo) || parse_number(toks[2], hi))
        {
            MFDS_DIAG_ERROR(diag, "Invalid selection \"" << opts.select[i]
                << "\", coord:min:max is expected")
            return mfds_error::config_error;
        }
        cs->set_selection_range(lo, hi);
    }

    n = opts.tolerance.size();
    for (size_t i = 0; i < n; ++i)
    {
        std::vector<std::string> toks;
        p_mfds_coord_scan cs;
        double tol = -1.0;
        if (mfds_string_util::split(opts.tolerance[i], ':', toks) ||
            (toks.size() != 2) || !(cs = fg->get_coord_scan(toks[0])) ||
            parse_number(toks[1], tol) || (tol < 0.0))
        {
            MFDS_DIAG_ERROR(diag, "Invalid tolerance \"" << opts.tolerance[i]
                << "\", coord:value with a value of 0 or more is expected")
            return mfds_error::config_error;
        }
        cs->set_tolerance(tol);
    }

    // scan functions last, the coordinates must all be known
    n = opts.scan.size();
    for (size_t i = 0; i < n; ++i)
    {
        std::vector<std::string> toks;
        mfds_scan_function_info info;
        if (mfds_string_util::split(opts.scan[i], ':', toks) ||
            (toks.size() != 2) || mfds_scan_library::get(toks[1], info))
        {
            MFDS_DIAG_ERROR(diag, "Invalid scan function \"" << opts.scan[i]
                << "\", coord:function is expected with function one of ["
                << mfds_scan_library::get_names() << "]")
            return mfds_error::config_error;
        }

        int ierr = 0;
        if ((ierr = fg->add_scan_function(toks[0], info, diag)))
            return ierr;
    }

    if (ds.add_filegroup(fg))
        return mfds_error::config_error;

    return 0;
}

// --------------------------------------------------------------------------
void mfds_dataset_config::to_stream(mfds_binary_stream &bs) const
{
    bs.pack("mfds_dataset_config", 19);
    bs.pack(m_data_root);
    bs.pack(m_dims);
    bs.pack(m_mode);
    bs.pack(m_duplicate_policy);

    unsigned long n = m_coordinates.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
        m_coordinates[i].to_stream(bs);

    n = m_filegroups.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
        m_filegroups[i].to_stream(bs);
}

// --------------------------------------------------------------------------
int mfds_dataset_config::from_stream(mfds_binary_stream &bs)
{
    if (bs.expect("mfds_dataset_config"))
    {
        MFDS_ERROR("invalid stream")
        return mfds_error::config_error;
    }

    bs.unpack(m_data_root);
    bs.unpack(m_dims);
    bs.unpack(m_mode);
    bs.unpack(m_duplicate_policy);

    unsigned long n = 0;
    bs.unpack(n);
    m_coordinates.resize(n);
    for (unsigned long i = 0; i < n; ++i)
    {
        if (m_coordinates[i].from_stream(bs))
            return mfds_error::config_error;
    }

    bs.unpack(n);
    m_filegroups.resize(n);
    for (unsigned long i = 0; i < n; ++i)
    {
        if (m_filegroups[i].from_stream(bs))
            return mfds_error::config_error;
    }

    if (!bs.good())
    {
        MFDS_ERROR("The configuration stream is truncated")
        return mfds_error::config_error;
    }

    return 0;
}
