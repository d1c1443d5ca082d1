#include "mfds_config.h"
#include "mfds_common.h"
#include "mfds_diagnostics.h"
#include "mfds_mpi.h"
#include "mfds_keyring.h"
#include "mfds_array.h"
#include "mfds_dataset.h"
#include "mfds_dataset_config.h"
#include "mfds_app_util.h"

#include <vector>
#include <string>
#include <iostream>
#include <boost/program_options.hpp>

using namespace std;
using boost::program_options::value;

// --------------------------------------------------------------------------
int main(int argc, char **argv)
{
    mfds_mpi_manager mpi_man(argc, argv);
    int rank = mpi_man.get_comm_rank();

    // initialize comand line options description set up some comon options to
    // simplify use for most comon scenarios
    int help_width = 100;
    options_description basic_opt_defs(
        "Basic usage:\n\n"
        "Scans a dataset described by a configuration file, reports the\n"
        "available coordinates and optionally loads a selection. Information\n"
        "on all available options can be displayed using --advanced_help\n\n"
        "Basic comand line options", help_width, help_width - 4
        );
    basic_opt_defs.add_options()

        ("input_file", value<std::string>(), "\na dataset configuration file"
            " describing the coordinates and the filegroups to scan.\n")

        ("select", value<std::vector<std::string>>()->multitoken(),
            "\nselections to load, one per dimension, of the form dim=spec."
            " spec is an index (time=3), a list (time=0,2,4), a slice"
            " (time=0:10:2) or names for the variable dimension (var=SSH,SST)."
            " Dimensions not given are loaded in full.\n")

        ("load", "\nload the selection, all the data if no --select is given\n")

        ("commands", "\nprint the load commands of the selection\n")

        ("advanced", "\nreconcile the filegroups by union rather than"
            " intersection. the same as --dataset::mode advanced\n")

        ("verbose", value<int>()->default_value(1), "\nthe most verbose level"
            " of messages reported. 0 errors, 1 warnings, 2 notices, 3 info,"
            " 4 debug\n")

        ("help", "\ndisplays documentation for application specific command line options\n")
        ("advanced_help", "\ndisplays documentation for algorithm specific command line options\n")
        ("full_help", "\ndisplays both basic and advanced documentation together\n")
        ;

    // add all options from each stage for more advanced use
    options_description advanced_opt_defs(
        "Advanced usage:\n\n"
        "The following list contains the full set options giving one full\n"
        "control over all runtime modifiable parameters. The basic options\n"
        "(see" "--help) map to these, and will override them if both are\n"
        "specified.\n\n"
        "Advanced comand line options", help_width, help_width - 4
        );

    p_mfds_dataset ds = mfds_dataset::New();
    ds->get_properties_description("dataset", advanced_opt_defs);

    // package basic and advanced options for display
    options_description all_opt_defs(help_width, help_width - 4);
    all_opt_defs.add(basic_opt_defs).add(advanced_opt_defs);

    // parse the command line
    int ierr = 0;
    variables_map opt_vals;
    if ((ierr = mfds_app_util::process_command_line_help(
        rank, argc, argv, basic_opt_defs,
        advanced_opt_defs, all_opt_defs, opt_vals)))
    {
        if (ierr == 1)
            return 0;
        return -1;
    }

    if (!opt_vals.count("input_file"))
    {
        if (rank == 0)
        {
            MFDS_ERROR("--input_file is required")
        }
        return -1;
    }

    // only rank 0 reports
    mfds_diagnostics diag(opt_vals["verbose"].as<int>(),
        rank == 0 ? &std::cerr : nullptr);

    mfds_dataset_config config;
    if ((ierr = config.read(opt_vals["input_file"].as<string>(),
        MPI_COMM_WORLD, diag)) || (ierr = config.configure(*ds, diag)))
    {
        if (rank == 0)
        {
            MFDS_ERROR("Failed to configure the dataset from \""
                << opt_vals["input_file"].as<string>() << "\". "
                << mfds_error::get_name(ierr))
        }
        return ierr;
    }

    // the configuration file is overriden by the advanced options which are
    // overriden by the basic options
    ds->set_properties("dataset", opt_vals);

    if (opt_vals.count("advanced"))
        ds->set_mode("advanced");

    if ((ierr = ds->scan_all(diag)))
    {
        if (rank == 0)
        {
            MFDS_ERROR("Failed to scan the dataset. " << mfds_error::get_name(ierr))
        }
        return ierr;
    }

    if (rank == 0)
    {
        std::cout << *ds << std::endl;

        // report the coordinates running backward in the files
        const std::vector<p_mfds_filegroup> &fgs = ds->get_filegroups();
        size_t n_fgs = fgs.size();
        for (size_t i = 0; i < n_fgs; ++i)
        {
            const std::vector<p_mfds_coord_scan> &scans = fgs[i]->get_coord_scans();
            size_t n_scans = scans.size();
            for (size_t j = 0; j < n_scans; ++j)
            {
                if (scans[j]->is_index_descending())
                    std::cout << fgs[i]->get_name() << ": " << scans[j]->get_name()
                        << " is stored in descending order" << std::endl;
            }
        }
    }

    bool have_select = opt_vals.count("select");
    if (!have_select && !opt_vals.count("load") && !opt_vals.count("commands"))
        return 0;

    mfds_keyring request;
    if (have_select && mfds_app_util::parse_selection(
        opt_vals["select"].as<std::vector<std::string>>(),
        ds->get_coordinates(), request))
    {
        if (rank == 0)
        {
            MFDS_ERROR("Invalid selection")
        }
        return mfds_error::load_error;
    }

    if (opt_vals.count("commands") && (rank == 0))
    {
        std::vector<std::vector<mfds_load_command>> commands;
        if ((ierr = ds->get_load_commands(request, commands, diag)))
            return ierr;

        const std::vector<p_mfds_filegroup> &fgs = ds->get_filegroups();
        size_t n_fgs = fgs.size();
        for (size_t i = 0; i < n_fgs; ++i)
        {
            std::cout << "filegroup " << fgs[i]->get_name() << ": "
                << commands[i].size() << " commands" << std::endl;

            size_t n_cmds = commands[i].size();
            for (size_t j = 0; j < n_cmds; ++j)
                std::cout << "  " << commands[i][j] << std::endl;
        }
    }

    if (!opt_vals.count("load") && !have_select)
        return 0;

    mfds_array data;
    if ((ierr = ds->plan_and_load(request, data, diag)))
    {
        if (rank == 0)
        {
            MFDS_ERROR("Failed to load " << request << ". "
                << mfds_error::get_name(ierr))
        }
        return ierr;
    }

    if (rank == 0)
    {
        std::cout << "loaded " << data << ", " << data.count_valid()
            << " of " << data.size() << " values are valid" << std::endl;
    }

    return 0;
}
