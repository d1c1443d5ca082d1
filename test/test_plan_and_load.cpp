#include "mfds_dataset.h"
#include "mfds_numeric_coordinate.h"
#include "mfds_string_coordinate.h"
#include "mfds_scan_library.h"
#include "mfds_array.h"
#include "mfds_keyring.h"
#include "mfds_file_util.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"
#include "mfds_common.h"
#include "mfds_test_util.h"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using mfds_test_util::test_file;
using mfds_test_util::test_format;
using mfds_test_util::p_test_format;

#define TIME_UNITS "days since 2007-01-01 00:00:00"

// a dataset over time, depth and the variables
struct ocean
{
    ocean()
    {
        ds = mfds_dataset::New();
        time = mfds_numeric_coordinate::New("time", TIME_UNITS);
        depth = mfds_numeric_coordinate::New("depth", "m");
        var = mfds_string_coordinate::New("var");
        ds->add_coordinate(time);
        ds->add_coordinate(depth);
        ds->add_coordinate(var);
        ds->set_dims({"time", "depth", "var"});
    }

    p_mfds_dataset ds;
    p_mfds_numeric_coordinate time;
    p_mfds_numeric_coordinate depth;
    p_mfds_string_coordinate var;
};

// add a scan function from the library
int add_function(mfds_filegroup &fg, const string &coord, const string &name,
    mfds_diagnostics &diag)
{
    mfds_scan_function_info info;
    if (mfds_scan_library::get(name, info))
    {
        MFDS_ERROR("No scan function named \"" << name << "\"")
        return -1;
    }
    return fg.add_scan_function(coord, info, diag);
}

/* one file per day holding SSH over depth, SSH_YYYYMMDD.nc. the value of
 * SSH at depth d of day k is 100*(k+1) + d. the last n_bad files exist but
 * can not be opened.
 */
p_mfds_filegroup make_ssh(ocean &oc, const p_test_format &fmt,
    const string &root, int n_good, int n_bad, mfds_diagnostics &diag)
{
    vector<string> names;
    for (int k = 0; k < n_good + n_bad; ++k)
    {
        ostringstream oss;
        oss << "SSH_200701" << (k < 9 ? "0" : "") << k + 1 << ".nc";
        names.push_back(oss.str());

        if (k < n_good)
        {
            test_file f;
            f.add_coordinate("depth", {0.0, 10.0}, "m");
            f.add_variable("SSH", {"depth"}, 100.0*(k + 1));
            fmt->add_file(mfds_file_util::join(root, names.back()), f);
        }
    }
    names.push_back("README.txt");

    if (mfds_test_util::make_files(root, names))
        return nullptr;

    p_mfds_filegroup fg = mfds_filegroup::New("ssh");
    fg->set_root(root);
    fg->set_pre_regex("SSH_%(time:x)\\.nc");
    fg->set_format(fmt);
    fg->add_coordinate(oc.time, true);
    fg->add_coordinate(oc.depth, false);
    fg->add_coordinate(oc.var, false);

    if (add_function(*fg, "time", "filename_date", diag) ||
        add_function(*fg, "depth", "in_file_values", diag) ||
        add_function(*fg, "var", "in_file_variables", diag))
        return nullptr;

    return fg;
}

int test_shared_time(const string &scratch)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_test_format fmt = test_format::New();
    ocean oc;

    p_mfds_filegroup fg = make_ssh(oc, fmt,
        mfds_file_util::join(scratch, "shared"), 3, 1, diag);

    if (!fg || oc.ds->add_filegroup(fg) || oc.ds->scan_all(diag))
        return -1;

    if (!diag.contains(mfds_diagnostics::warning, "README.txt"))
    {
        MFDS_ERROR("The file not matching the pre-regex was not reported")
        return -1;
    }

    // only the first file is opened to scan the in coordinates
    if ((fg->get_files().size() != 4) || (fmt->get_n_open() != 1))
    {
        MFDS_ERROR("Scanned " << fg->get_files().size() << " files, opened "
            << fmt->get_n_open())
        return -1;
    }

    const vector<double> &times = oc.ds->get_available_space().get_values("time");
    if ((times.size() != 4) || !mfds_test_util::equal(times[1] - times[0], 1.0) ||
        !mfds_test_util::equal(times[0], 0.5))
    {
        MFDS_ERROR("Wrong times [" << times << "]")
        return -1;
    }

    // the first time step is one file, time is not a dimension in it
    mfds_keyring request({{"time", mfds_key(0)}});
    vector<vector<mfds_load_command>> commands;
    if (oc.ds->get_load_commands(request, commands, diag))
        return -1;

    if ((commands.size() != 1) || (commands[0].size() != 1) ||
        (commands[0][0].get_filename() != "SSH_20070101.nc") ||
        (commands[0][0].size() != 1) ||
        !commands[0][0].get_keys(0).infile.find("time") ||
        !commands[0][0].get_keys(0).infile.find("time")->is_none())
    {
        MFDS_ERROR("Wrong load commands for " << request)
        return -1;
    }

    fmt->reset_counters();
    mfds_array dst;
    if (oc.ds->plan_and_load(request, dst, diag))
        return -1;

    if ((dst.get_dims() != vector<string>({"time", "depth", "var"})) ||
        (dst.get_shape() != vector<long>({1, 2, 1})) ||
        (dst.at({0, 0, 0}) != 100.0) || (dst.at({0, 1, 0}) != 101.0) ||
        (fmt->get_n_read() != 1) || (fmt->get_n_open() != fmt->get_n_close()))
    {
        MFDS_ERROR("Wrong load of " << request << " into " << dst)
        return -1;
    }

    // a failing file does not stop the others
    mfds_diagnostics quiet(mfds_diagnostics::error, nullptr);
    mfds_array all;
    if ((oc.ds->plan_and_load(mfds_keyring(), all, quiet) != mfds_error::load_error)
        || !quiet.contains(mfds_diagnostics::error, "SSH_20070104.nc"))
    {
        MFDS_ERROR("The unreadable file was not reported")
        return -1;
    }

    for (long t = 0; t < 4; ++t)
    {
        for (long d = 0; d < 2; ++d)
        {
            double expected = t < 3 ? 100.0*(t + 1) + d : NAN;
            if (!mfds_test_util::equal(all.at({t, d, 0}), expected))
            {
                MFDS_ERROR("time " << t << " depth " << d << " is "
                    << all.at({t, d, 0}) << " expected " << expected)
                return -1;
            }
        }
    }

    // selections outside of the available space
    if ((oc.ds->plan_and_load(mfds_keyring({{"time", mfds_key(4)}}), dst, quiet)
        != mfds_error::load_error) ||
        (oc.ds->plan_and_load(mfds_keyring({{"level", mfds_key(0)}}), dst, quiet)
        != mfds_error::load_error))
    {
        MFDS_ERROR("An invalid selection was loaded")
        return -1;
    }

    // the destination must match the selection
    mfds_array wrong({"time", "depth", "var"}, {2, 2, 1});
    if (oc.ds->plan_and_load(request, wrong, quiet) != mfds_error::load_error)
    {
        MFDS_ERROR("Loaded into an array of the wrong shape")
        return -1;
    }

    return 0;
}

int test_in_file_time(const string &scratch)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_test_format fmt = test_format::New();
    ocean oc;

    p_mfds_filegroup ssh = make_ssh(oc, fmt,
        mfds_file_util::join(scratch, "in_file/ssh"), 5, 0, diag);
    if (!ssh)
        return -1;

    // SST over time and depth in a single file, SST = 2*t + d
    string root = mfds_file_util::join(scratch, "in_file/sst");
    if (mfds_test_util::make_files(root, {"SST.nc"}))
        return -1;

    test_file f;
    f.add_coordinate("time", {0.5, 1.5, 2.5, 3.5, 4.5}, TIME_UNITS);
    f.add_coordinate("depth", {0.0, 10.0}, "m");
    f.add_variable("SST", {"time", "depth"}, 0.0);
    fmt->add_file(mfds_file_util::join(root, "SST.nc"), f);

    p_mfds_filegroup sst = mfds_filegroup::New("sst");
    sst->set_root(root);
    sst->set_pre_regex("SST\\.nc");
    sst->set_format(fmt);
    sst->add_coordinate(oc.time, false);
    sst->add_coordinate(oc.depth, false);
    sst->add_coordinate(oc.var, false);

    if (add_function(*sst, "time", "in_file_values", diag) ||
        add_function(*sst, "depth", "in_file_values", diag) ||
        add_function(*sst, "var", "in_file_variables", diag) ||
        oc.ds->add_filegroup(ssh) || oc.ds->add_filegroup(sst) ||
        oc.ds->scan_all(diag))
        return -1;

    if (oc.ds->get_available_space().get_names("var")
        != vector<string>({"SSH", "SST"}))
    {
        MFDS_ERROR("Wrong variables " << oc.ds->get_available_space())
        return -1;
    }

    // scanning the same files again gives the same state
    mfds_binary_stream first;
    oc.ds->to_stream(first);

    mfds_binary_stream second;
    if (oc.ds->scan_all(diag))
        return -1;
    oc.ds->to_stream(second);

    if (!(first == second))
    {
        MFDS_ERROR("A second scan changed the dataset, " << first.size()
            << " bytes then " << second.size() << " bytes")
        return -1;
    }

    // every other time step at the surface, read with one slice
    mfds_keyring request({{"var", mfds_key::from_name("SST")},
        {"time", mfds_key(vector<long>({0, 2, 4}))}, {"depth", mfds_key(0)}});

    vector<vector<mfds_load_command>> commands;
    if (oc.ds->get_load_commands(request, commands, diag))
        return -1;

    ostringstream oss;
    if (commands.size() == 2)
    {
        for (size_t i = 0; i < commands[1].size(); ++i)
            oss << commands[1][i];
    }

    if ((commands.size() != 2) || !commands[0].empty() ||
        (oss.str() != "SST.nc\n    {time: slice(0, 5, 2), depth: 0, var: 'SST'}"
            " -> {time: slice(0, 3, 1), depth: 0, var: 0}"))
    {
        MFDS_ERROR("Wrong load commands for " << request << std::endl << oss.str())
        return -1;
    }

    vector<long> shape;
    if (oc.ds->get_load_shape(request, shape, diag) ||
        (shape != vector<long>({3, 1, 1})))
    {
        MFDS_ERROR("Wrong load shape [" << shape << "]")
        return -1;
    }

    fmt->reset_counters();
    mfds_array dst;
    if (oc.ds->plan_and_load(request, dst, diag))
        return -1;

    if ((fmt->get_n_read() != 1) ||
        (fmt->get_reads()[0].second != "{time: slice(0, 5, 2), depth: 0}") ||
        (dst.at({0, 0, 0}) != 0.0) || (dst.at({1, 0, 0}) != 4.0) ||
        (dst.at({2, 0, 0}) != 8.0))
    {
        MFDS_ERROR("Wrong load of " << request)
        return -1;
    }

    // both variables over two days
    mfds_array both;
    if (oc.ds->plan_and_load(mfds_keyring({{"time", mfds_key(1, 3, 1)}}), both,
        diag) || (both.get_shape() != vector<long>({2, 2, 2})) ||
        (both.at({0, 1, 0}) != 201.0) || (both.at({1, 0, 0}) != 300.0) ||
        (both.at({0, 1, 1}) != 3.0) || (both.at({1, 1, 1}) != 5.0) ||
        (both.count_valid() != 8))
    {
        MFDS_ERROR("Wrong load of both variables " << both)
        return -1;
    }

    return 0;
}

int test_descending(const string &scratch)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_test_format fmt = test_format::New();

    // temperature stored from the bottom up
    string root = mfds_file_util::join(scratch, "descending");
    if (mfds_test_util::make_files(root, {"TEMP.nc"}))
        return -1;

    test_file f;
    f.add_coordinate("depth", {30.0, 20.0, 10.0}, "m");
    f.add_variable("TEMP", {"depth"}, 0.0);
    fmt->add_file(mfds_file_util::join(root, "TEMP.nc"), f);

    p_mfds_dataset ds = mfds_dataset::New();
    p_mfds_numeric_coordinate depth = mfds_numeric_coordinate::New("depth", "m");
    ds->add_coordinate(depth);
    ds->add_coordinate(mfds_string_coordinate::New("var"));
    ds->set_dims({"depth", "var"});

    p_mfds_filegroup fg = mfds_filegroup::New("temp");
    fg->set_root(root);
    fg->set_pre_regex("TEMP\\.nc");
    fg->set_format(fmt);
    fg->add_coordinate(depth, false);
    fg->add_coordinate(ds->get_coordinates().get("var"), false);

    if (add_function(*fg, "depth", "in_file_values", diag) ||
        add_function(*fg, "var", "in_file_variables", diag) ||
        ds->add_filegroup(fg) || ds->scan_all(diag))
        return -1;

    if ((depth->get_values() != vector<double>({10.0, 20.0, 30.0})) ||
        !fg->get_coord_scan("depth")->is_index_descending())
    {
        MFDS_ERROR("Wrong depth " << *fg)
        return -1;
    }

    // the shallowest level is the last in the file
    mfds_array dst;
    if (ds->plan_and_load(mfds_keyring({{"depth", mfds_key(0)}}), dst, diag) ||
        (fmt->get_reads().size() != 1) ||
        (fmt->get_reads()[0].second != "{depth: 2}") || (dst.at({0, 0}) != 2.0))
    {
        MFDS_ERROR("Wrong load of the shallowest level " << dst)
        return -1;
    }

    // the file is read forward and placed backward
    mfds_array all;
    if (ds->plan_and_load(mfds_keyring(), all, diag) ||
        (fmt->get_reads().size() != 2) ||
        (fmt->get_reads()[1].second != "{depth: slice(0, 3, 1)}") ||
        (all.at({0, 0}) != 2.0) || (all.at({1, 0}) != 1.0) ||
        (all.at({2, 0}) != 0.0))
    {
        MFDS_ERROR("Wrong load of every level " << all)
        return -1;
    }

    return 0;
}

int test_dummy_version(const string &scratch)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_test_format fmt = test_format::New();
    ocean oc;

    // the version in the name changes from file to file
    string root = mfds_file_util::join(scratch, "version");
    vector<string> names({"SSH_20070101_v1.nc", "SSH_20070102_v2.nc",
        "SSH_20070103_v10.nc"});
    if (mfds_test_util::make_files(root, names))
        return -1;

    for (size_t k = 0; k < names.size(); ++k)
    {
        test_file f;
        f.add_coordinate("depth", {0.0, 10.0}, "m");
        f.add_variable("SSH", {"depth"}, 100.0*(k + 1));
        fmt->add_file(mfds_file_util::join(root, names[k]), f);
    }

    p_mfds_filegroup fg = mfds_filegroup::New("ssh");
    fg->set_root(root);
    fg->set_pre_regex("SSH_%(time:x)_v%(time:idx:dummy)\\.nc");
    fg->set_format(fmt);
    fg->add_coordinate(oc.time, true);
    fg->add_coordinate(oc.depth, false);
    fg->add_coordinate(oc.var, false);

    if (add_function(*fg, "time", "filename_date", diag) ||
        add_function(*fg, "depth", "in_file_values", diag) ||
        add_function(*fg, "var", "in_file_variables", diag) ||
        oc.ds->add_filegroup(fg) || oc.ds->scan_all(diag))
        return -1;

    if (oc.ds->get_available_space().get_size("time") != 3)
    {
        MFDS_ERROR("Wrong available space " << oc.ds->get_available_space())
        return -1;
    }

    // every file name is rebuilt with its own version
    for (long t = 0; t < 3; ++t)
    {
        mfds_keyring request({{"time", mfds_key(t)}});
        vector<vector<mfds_load_command>> commands;
        if (oc.ds->get_load_commands(request, commands, diag) ||
            (commands[0].size() != 1) ||
            (commands[0][0].get_filename() != names[t]))
        {
            MFDS_ERROR("Wrong file planned for " << request)
            return -1;
        }

        mfds_array dst;
        if (oc.ds->plan_and_load(request, dst, diag) ||
            (dst.at({0, 1, 0}) != 100.0*(t + 1) + 1.0))
        {
            MFDS_ERROR("Wrong load of " << request << " " << dst)
            return -1;
        }
    }

    return 0;
}

int test_descending_time(const string &scratch)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_test_format fmt = test_format::New();
    ocean oc;

    // the most recent day first
    string root = mfds_file_util::join(scratch, "backward");
    if (mfds_test_util::make_files(root, {"SSH.nc"}))
        return -1;

    test_file f;
    f.add_coordinate("time", {3.0, 2.0, 1.0}, TIME_UNITS);
    f.add_variable("SSH", {"time"}, 0.0);
    fmt->add_file(mfds_file_util::join(root, "SSH.nc"), f);

    p_mfds_filegroup fg = mfds_filegroup::New("ssh");
    fg->set_root(root);
    fg->set_pre_regex("SSH\\.nc");
    fg->set_format(fmt);
    fg->add_coordinate(oc.time, false);
    fg->add_coordinate(oc.var, false);
    fg->add_coordinate(oc.depth, false);
    fg->get_coord_scan("depth")->set_manual_values({0.0});
    fg->get_coord_scan("depth")->set_constant_in_idx(-1);

    if (add_function(*fg, "time", "in_file_values", diag) ||
        add_function(*fg, "var", "in_file_variables", diag) ||
        oc.ds->add_filegroup(fg) || oc.ds->scan_all(diag))
        return -1;

    p_mfds_coord_scan cs = fg->get_coord_scan("time");
    if ((cs->get_values() != vector<double>({1.0, 2.0, 3.0})) ||
        (cs->get_in_idx() != vector<long>({2, 1, 0})) ||
        !cs->is_index_descending())
    {
        MFDS_ERROR("Wrong scan of time " << *cs)
        return -1;
    }

    // the first value is the last element in the file
    mfds_array dst;
    if (oc.ds->plan_and_load(mfds_keyring({{"time", mfds_key(0)}}), dst, diag) ||
        (fmt->get_reads().size() != 1) ||
        (fmt->get_reads()[0].second != "{time: 2}") ||
        (dst.at({0, 0, 0}) != 2.0))
    {
        MFDS_ERROR("Wrong load of the first day " << dst)
        return -1;
    }

    return 0;
}

int test_calendar(const string &scratch)
{
    string root = mfds_file_util::join(scratch, "calendar");
    if (mfds_test_util::make_files(root, {"SSH.nc"}))
        return -1;

    vector<string> calendars({"gregorian", "noleap"});
    for (size_t i = 0; i < calendars.size(); ++i)
    {
        mfds_diagnostics diag(mfds_diagnostics::info, nullptr);

        p_test_format fmt = test_format::New();
        ocean oc;

        test_file f;
        f.add_coordinate("time", {0.5, 1.5}, TIME_UNITS);
        f.calendars["time"] = calendars[i];
        f.add_variable("SSH", {"time"}, 0.0);
        fmt->add_file(mfds_file_util::join(root, "SSH.nc"), f);

        p_mfds_filegroup fg = mfds_filegroup::New("ssh");
        fg->set_root(root);
        fg->set_pre_regex("SSH\\.nc");
        fg->set_format(fmt);
        fg->add_coordinate(oc.time, false);
        fg->add_coordinate(oc.var, false);
        fg->add_coordinate(oc.depth, false);
        fg->get_coord_scan("depth")->set_manual_values({0.0});
        fg->get_coord_scan("depth")->set_constant_in_idx(-1);

        if (add_function(*fg, "time", "in_file_values", diag) ||
            add_function(*fg, "var", "in_file_variables", diag) ||
            oc.ds->add_filegroup(fg))
            return -1;

        int ierr = oc.ds->scan_all(diag);
        if ((i == 0) && ierr)
        {
            MFDS_ERROR("Failed to scan times in the gregorian calendar")
            return -1;
        }

        // days in other calendars can not be placed on the standard one
        if ((i == 1) && ((ierr != mfds_error::scan_error) ||
            !diag.contains(mfds_diagnostics::error, "\"noleap\" calendar")))
        {
            MFDS_ERROR("Times in the noleap calendar were scanned")
            return -1;
        }
    }

    return 0;
}

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        MFDS_ERROR("Usage: test_plan_and_load [scratch directory]")
        return -1;
    }

    string scratch = argv[1];

    if (test_shared_time(scratch) || test_in_file_time(scratch) ||
        test_descending(scratch) || test_dummy_version(scratch) ||
        test_descending_time(scratch) || test_calendar(scratch))
        return -1;

    return 0;
}
