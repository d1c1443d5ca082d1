#include "mfds_scan_library.h"
#include "mfds_coordinate.h"
#include "mfds_calendar_util.h"
#include "mfds_diagnostics.h"

#include <map>

namespace
{
// **************************************************************************
const std::map<std::string, mfds_scan_function_info> &get_library()
{
    static const std::map<std::string, mfds_scan_function_info> library =
    {
        {"filename_date", mfds_scan_function_info("filename_date",
            mfds_scan_function_info::filename, mfds_scan_function_info::values,
            mfds_scan_library::scan_filename_date)},
        {"filename_value", mfds_scan_function_info("filename_value",
            mfds_scan_function_info::filename, mfds_scan_function_info::values,
            mfds_scan_library::scan_filename_value)},
        {"filename_index", mfds_scan_function_info("filename_index",
            mfds_scan_function_info::filename, mfds_scan_function_info::in_idx,
            mfds_scan_library::scan_filename_index)},
        {"filename_text", mfds_scan_function_info("filename_text",
            mfds_scan_function_info::filename, mfds_scan_function_info::values,
            mfds_scan_library::scan_filename_text)},
        {"in_file_values", mfds_scan_function_info("in_file_values",
            mfds_scan_function_info::in_file,
            mfds_scan_function_info::values|mfds_scan_function_info::in_idx,
            mfds_scan_library::scan_in_file_values)},
        {"in_file_variables", mfds_scan_function_info("in_file_variables",
            mfds_scan_function_info::in_file,
            mfds_scan_function_info::values|mfds_scan_function_info::in_idx,
            mfds_scan_library::scan_in_file_variables)}
    };
    return library;
}

// **************************************************************************
int check_in_file(const mfds_scan_context &ctx, mfds_diagnostics &diag)
{
    if (!ctx.format || !ctx.handle || !*ctx.handle)
    {
        MFDS_DIAG_ERROR(diag, "\"" << ctx.filename << "\" is not open for"
            " scanning coordinate \"" << (ctx.coord ? ctx.coord->get_name()
            : std::string()) << "\"")
        return -1;
    }
    return 0;
}
}

namespace mfds_scan_library
{
// **************************************************************************
int get(const std::string &name, mfds_scan_function_info &info)
{
    const std::map<std::string, mfds_scan_function_info> &library = get_library();
    std::map<std::string, mfds_scan_function_info>::const_iterator it =
        library.find(name);

    if (it == library.end())
        return -1;

    info = it->second;
    return 0;
}

// **************************************************************************
std::vector<std::string> get_names()
{
    std::vector<std::string> names;
    const std::map<std::string, mfds_scan_function_info> &library = get_library();
    std::map<std::string, mfds_scan_function_info>::const_iterator it =
        library.begin();
    for (; it != library.end(); ++it)
        names.push_back(it->first);
    return names;
}

// **************************************************************************
int scan_filename_date(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag)
{
    if (!ctx.elements.has_date())
    {
        MFDS_DIAG_ERROR(diag, "No date element matched in \""
            << ctx.filename << "\"")
        return -1;
    }

    mfds_date date;
    std::string errstr;
    if (ctx.elements.get_date(date, errstr))
    {
        MFDS_DIAG_ERROR(diag, "Invalid date in \"" << ctx.filename << "\". "
            << errstr)
        return -1;
    }

    const std::string &units = ctx.coord->get_units();
    if (!mfds_calendar_util::is_time_units(units))
    {
        MFDS_DIAG_ERROR(diag, "Coordinate \"" << ctx.coord->get_name()
            << "\" has units \"" << units << "\", dates need units of the"
            " form \"<unit> since <date>\"")
        return -1;
    }

    double value = 0.0;
    if (mfds_calendar_util::date_to_value(date, units, value))
    {
        MFDS_DIAG_ERROR(diag, "Failed to convert " << date << " to \""
            << units << "\"")
        return -1;
    }

    res.values.push_back(value);
    res.units = units;

    return 0;
}

// **************************************************************************
int scan_filename_value(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag)
{
    if (ctx.elements.flags & mfds_element_values::has_value)
    {
        res.values.push_back(ctx.elements.value);
    }
    else if (ctx.elements.flags & mfds_element_values::has_index)
    {
        res.values.push_back(ctx.elements.index);
    }
    else
    {
        MFDS_DIAG_ERROR(diag, "No value element matched in \""
            << ctx.filename << "\"")
        return -1;
    }

    return 0;
}

// **************************************************************************
int scan_filename_index(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag)
{
    if (!(ctx.elements.flags & mfds_element_values::has_index))
    {
        MFDS_DIAG_ERROR(diag, "No index element matched in \""
            << ctx.filename << "\"")
        return -1;
    }

    res.in_idx.push_back(ctx.elements.index);
    return 0;
}

// **************************************************************************
int scan_filename_text(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag)
{
    if (!(ctx.elements.flags & mfds_element_values::has_text))
    {
        MFDS_DIAG_ERROR(diag, "No text element matched in \""
            << ctx.filename << "\"")
        return -1;
    }

    res.names.push_back(ctx.elements.text);
    return 0;
}

// **************************************************************************
int scan_in_file_values(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag)
{
    if (check_in_file(ctx, diag))
        return -1;

    // the coordinate may go by one of its alternate names in the file
    std::string name = ctx.coord->get_name();
    std::vector<std::string> names(1, name);
    const std::vector<std::string> &alt_names = ctx.coord->get_alt_names();
    names.insert(names.end(), alt_names.begin(), alt_names.end());

    size_t n_names = names.size();
    for (size_t i = 0; i < n_names; ++i)
    {
        long size = 0;
        if (!ctx.format->get_dim_size(*ctx.handle, names[i], size, diag))
        {
            name = names[i];
            break;
        }
    }

    if (ctx.format->get_coordinate_values(*ctx.handle, name,
        res.values, res.units, diag))
        return -1;

    // time values are only understood in the standard calendar
    std::string calendar;
    if (mfds_calendar_util::is_time_units(res.units) &&
        ctx.format->get_coordinate_calendar(*ctx.handle, name, calendar, diag))
        return -1;

    if (!mfds_calendar_util::is_standard_calendar(calendar))
    {
        MFDS_DIAG_ERROR(diag, "Coordinate \"" << name << "\" in \""
            << ctx.filename << "\" uses the \"" << calendar << "\" calendar,"
            " only the standard, gregorian and proleptic_gregorian calendars"
            " are supported")
        return -1;
    }

    long n = res.values.size();
    res.in_idx.resize(n);
    for (long i = 0; i < n; ++i)
        res.in_idx[i] = i;

    MFDS_DIAG_DEBUG(diag, "Found " << n << " values of \"" << name
        << "\" in \"" << ctx.filename << "\"")

    return 0;
}

// **************************************************************************
int scan_in_file_variables(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag)
{
    if (check_in_file(ctx, diag))
        return -1;

    if (ctx.format->get_variables(*ctx.handle, res.names, diag))
        return -1;

    res.in_names = res.names;

    long n = res.names.size();
    res.in_idx.resize(n);
    for (long i = 0; i < n; ++i)
        res.in_idx[i] = i;

    MFDS_DIAG_DEBUG(diag, "Found variables " << res.names << " in \""
        << ctx.filename << "\"")

    return 0;
}
};
