#include "mfds_app_util.h"

#include "mfds_config.h"
#include "mfds_common.h"
#include "mfds_key.h"
#include "mfds_keyring.h"
#include "mfds_coordinate.h"
#include "mfds_file_util.h"
#include "mfds_string_util.h"

#include <exception>
#include <iostream>

namespace
{
// split on delim keeping empty fields, pad is removed
std::vector<std::string> split_fields(const std::string &str, char delim)
{
    std::vector<std::string> fields;
    size_t b = 0;
    while (true)
    {
        size_t e = str.find(delim, b);
        std::string field = str.substr(b, e == std::string::npos ?
            std::string::npos : e - b);

        size_t fb = field.find_first_not_of(" \t");
        size_t fe = field.find_last_not_of(" \t");
        fields.push_back(fb == std::string::npos ?
            std::string() : field.substr(fb, fe - fb + 1));

        if (e == std::string::npos)
            break;

        b = e + 1;
    }
    return fields;
}

// convert a slice bound, empty is open
int to_bound(const std::string &str, long &val)
{
    if (str.empty())
    {
        val = mfds_key::nil;
        return 0;
    }
    return mfds_string_util::string_tt<long>::convert(str.c_str(), val);
}
}

namespace mfds_app_util
{

// --------------------------------------------------------------------------
int process_command_line_help(int rank, const std::string &app_name,
    const std::string &flag,
    boost::program_options::options_description &opt_defs,
    boost::program_options::variables_map &opt_vals)
{
    if (opt_vals.count(flag))
    {
        if (rank == 0)
        {
            std::cerr << std::endl
                << "MFDS version " << MFDS_VERSION_DESCR
                << " compiled on " << __DATE__ << " " << __TIME__ << std::endl
                << std::endl
                << "Application usage: " << app_name << " [options]" << std::endl
                << std::endl
                << opt_defs << std::endl
                << std::endl;
        }
        return 1;
    }
    return 0;
}

// --------------------------------------------------------------------------
int process_command_line_help(int rank, int argc, char **argv,
    boost::program_options::options_description &basic_opt_defs,
    boost::program_options::options_description &advanced_opt_defs,
    boost::program_options::options_description &all_opt_defs,
    boost::program_options::variables_map &opt_vals)
{
    std::string app_name = mfds_file_util::filename(argv[0]);

    // this will prevent typos from being treated as positionals.
    boost::program_options::positional_options_description pos_opt_defs;

    try
    {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv)
                .style(boost::program_options::command_line_style::unix_style ^
                       boost::program_options::command_line_style::allow_short)
                .options(all_opt_defs)
                .positional(pos_opt_defs)
                .run(),
            opt_vals);

        if (process_command_line_help(rank, app_name, "help", basic_opt_defs, opt_vals) ||
            process_command_line_help(rank, app_name, "advanced_help", advanced_opt_defs, opt_vals) ||
            process_command_line_help(rank, app_name, "full_help", all_opt_defs, opt_vals))
        {
            return 1;
        }

        boost::program_options::notify(opt_vals);
    }
    catch (std::exception &e)
    {
        MFDS_ERROR("Error parsing command line options. See --help "
            "for a list of supported options. " << e.what())
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int parse_selection(const std::vector<std::string> &specs,
    const mfds_coordinate_registry &coords, mfds_keyring &keys)
{
    size_t n_specs = specs.size();
    for (size_t i = 0; i < n_specs; ++i)
    {
        std::vector<std::string> dv = split_fields(specs[i], '=');
        if ((dv.size() != 2) || dv[0].empty() || dv[1].empty())
        {
            MFDS_ERROR("Invalid selection \"" << specs[i] << "\", dim=spec"
                " is expected")
            return -1;
        }

        p_mfds_coordinate coord = coords.get(dv[0]);
        if (!coord)
        {
            MFDS_ERROR("Invalid selection \"" << specs[i] << "\", there is no"
                " coordinate named \"" << dv[0] << "\"")
            return -1;
        }

        const std::string &spec = dv[1];
        bool is_str = coord->is_string();

        int ierr = 0;
        mfds_key key;
        if (spec.find(':') != std::string::npos)
        {
            std::vector<std::string> f = split_fields(spec, ':');
            long start = mfds_key::nil;
            long stop = mfds_key::nil;
            long step = 1;

            if ((f.size() > 3) || ((f.size() == 3) && !f[2].empty() &&
                mfds_string_util::string_tt<long>::convert(f[2].c_str(), step)))
                ierr = -1;
            else if (is_str)
                key = mfds_key::from_name_slice(f[0], f[1], step);
            else if (to_bound(f[0], start) || to_bound(f[1], stop))
                ierr = -1;
            else
                key = mfds_key(start, stop, step);
        }
        else if (spec.find(',') != std::string::npos)
        {
            std::vector<std::string> f = split_fields(spec, ',');
            if (is_str)
            {
                key = mfds_key::from_names(f);
            }
            else
            {
                size_t n = f.size();
                std::vector<long> ids(n);
                for (size_t j = 0; (j < n) && !ierr; ++j)
                    ierr = mfds_string_util::string_tt<long>::convert(f[j].c_str(), ids[j]);
                key = mfds_key(ids);
            }
        }
        else if (is_str)
        {
            key = mfds_key::from_name(spec);
        }
        else
        {
            long id = 0;
            ierr = mfds_string_util::string_tt<long>::convert(spec.c_str(), id);
            key = mfds_key(id);
        }

        if (ierr)
        {
            MFDS_ERROR("Invalid selection \"" << specs[i] << "\"")
            return -1;
        }

        keys.set(coord->get_name(), key);
    }

    return 0;
}

}
