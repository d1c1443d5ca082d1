#include "mfds_dataset_config.h"
#include "mfds_dataset.h"
#include "mfds_array.h"
#include "mfds_keyring.h"
#include "mfds_file_util.h"
#include "mfds_diagnostics.h"
#include "mfds_common.h"
#include "mfds_test_util.h"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using mfds_test_util::test_file;
using mfds_test_util::test_format;
using mfds_test_util::p_test_format;

const char *config_text =
    "# daily sea surface height and a static land mask\n"
    "data_root = @ROOT@\n"
    "dims = time, depth, var\n"
    "mode = default\n"
    "duplicate_policy = reject\n"
    "\n"
    "[coordinate]\n"
    "name = time\n"
    "type = time\n"
    "units = days since 2007-01-01 00:00:00\n"
    "\n"
    "[coordinate]\n"
    "name = depth\n"
    "units = m\n"
    "alt_names = z, lev\n"
    "\n"
    "[coordinate]\n"
    "name = var\n"
    "type = string\n"
    "\n"
    "[filegroup]\n"
    "name = ssh\n"
    "root = %data_root%/ssh\n"
    "pattern = SSH_%(time:x)\\.nc\n"
    "format = test\n"
    "in = depth\n"
    "shared = time\n"
    "variables = SSH\n"
    "scan = time:filename_date, depth:in_file_values\n"
    "tolerance = depth:0.5\n"
    "\n"
    "[filegroup]\n"
    "name = mask\n"
    "root = %data_root%/mask\n"
    "pattern = MASK\\.nc\n"
    "format = test\n"
    "in = time, depth\n"
    "variables = MASK\n"
    "# the mask does not vary in time\n"
    "index = time:none\n"
    "scan = depth:in_file_values\n";

string make_config(const string &root)
{
    string text(config_text);
    mfds_file_util::search_and_replace("@ROOT@", root, text);
    return text;
}

int test_parse(const string &root)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    mfds_dataset_config cfg;
    if (cfg.parse(make_config(root), diag))
        return -1;

    if ((cfg.get_dims() != vector<string>({"time", "depth", "var"})) ||
        (cfg.get_coordinates().size() != 3) || (cfg.get_filegroups().size() != 2))
    {
        MFDS_ERROR("Wrong configuration")
        return -1;
    }

    const mfds_dataset_config::coordinate_options &depth = cfg.get_coordinates()[1];
    const mfds_dataset_config::filegroup_options &ssh = cfg.get_filegroups()[0];
    if ((depth.type != "numeric") || (depth.alt_names != vector<string>({"z", "lev"})) ||
        (ssh.root != mfds_file_util::join(root, "ssh")) ||
        (ssh.pattern != "SSH_%(time:x)\\.nc") ||
        (ssh.scan != vector<string>({"time:filename_date", "depth:in_file_values"})) ||
        (ssh.tolerance != vector<string>({"depth:0.5"})))
    {
        MFDS_ERROR("Wrong options, root " << ssh.root << " pattern " << ssh.pattern)
        return -1;
    }

    // malformed configurations
    vector<string> bad({
        "[nope]\n",
        "[filegroup]\nname = a\npattern = x\ncolour = red\n",
        "[filegroup]\nname = a\nname = b\npattern = x\n",
        "[filegroup]\nname = a\n",
        "[filegroup]\nroot = %data_root%/a\npattern = x\n",
        "[coordinate]\ntolerance = -1\n",
        "depth = 3\n"});

    for (size_t i = 0; i < bad.size(); ++i)
    {
        mfds_diagnostics quiet(mfds_diagnostics::error, nullptr);
        if (cfg.parse(bad[i], quiet) != mfds_error::config_error)
        {
            MFDS_ERROR("Malformed configuration " << i << " was parsed")
            return -1;
        }
    }

    // errors found when configuring
    vector<string> inconsistent({
        "[coordinate]\nname = t\ntype = date\n",
        "[coordinate]\nname = t\n[filegroup]\npattern = x\nformat = grib\n",
        "[coordinate]\nname = t\n[filegroup]\npattern = x\nin = u\n",
        "[coordinate]\nname = t\n[filegroup]\npattern = x\nin = t\nscan = t:nope\n",
        "[coordinate]\nname = t\n[filegroup]\npattern = x\nin = t\nselect = t:0\n",
        "[coordinate]\nname = t\n[filegroup]\npattern = x\nin = t\ntolerance = t:-2\n"});

    for (size_t i = 0; i < inconsistent.size(); ++i)
    {
        mfds_diagnostics quiet(mfds_diagnostics::error, nullptr);
        p_mfds_dataset ds = mfds_dataset::New();
        if (cfg.parse(inconsistent[i], quiet) ||
            (cfg.configure(*ds, quiet) != mfds_error::config_error))
        {
            MFDS_ERROR("Inconsistent configuration " << i << " was accepted")
            return -1;
        }
    }

    return 0;
}

int test_load(const string &root)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_test_format fmt = test_format::New();
    test_format::register_format(fmt);

    // three days of SSH
    string ssh_root = mfds_file_util::join(root, "ssh");
    vector<string> names({"SSH_20070101.nc", "SSH_20070102.nc", "SSH_20070103.nc"});
    if (mfds_test_util::make_files(ssh_root, names))
        return -1;

    for (size_t k = 0; k < names.size(); ++k)
    {
        test_file f;
        f.add_coordinate("depth", {0.0, 10.0}, "m");
        f.add_variable("SSH", {"depth"}, 100.0*(k + 1));
        fmt->add_file(mfds_file_util::join(ssh_root, names[k]), f);
    }

    // the mask names depth lev
    string mask_root = mfds_file_util::join(root, "mask");
    if (mfds_test_util::make_files(mask_root, {"MASK.nc"}))
        return -1;

    test_file f;
    f.add_coordinate("lev", {0.0, 10.0}, "m");
    f.add_variable("MASK", {"lev"}, 7.0);
    fmt->add_file(mfds_file_util::join(mask_root, "MASK.nc"), f);

    // read from a file
    string cfg_file = mfds_file_util::join(root, "ocean.cfg");
    ofstream ofs(cfg_file);
    ofs << make_config(root);
    ofs.close();

    mfds_dataset_config cfg;
    p_mfds_dataset ds = mfds_dataset::New();
    if (cfg.read(cfg_file, MPI_COMM_WORLD, diag) || cfg.configure(*ds, diag) ||
        ds->scan_all(diag))
        return -1;

    // the filegroup tolerance overrides the one of the coordinate
    if ((ds->get_filegroup("ssh")->get_coord_scan("depth")->get_tolerance() != 0.5) ||
        (ds->get_filegroup("mask")->get_coord_scan("depth")->get_tolerance() != 1e-5) ||
        (ds->get_available_space().get_tolerance("depth") != 0.5))
    {
        MFDS_ERROR("Wrong filegroup tolerances")
        return -1;
    }

    if ((ds->get_filegroups().size() != 2) ||
        (ds->get_available_space().get_size("time") != 3) ||
        (ds->get_available_space().get_names("var")
            != vector<string>({"SSH", "MASK"})))
    {
        MFDS_ERROR("Wrong dataset " << *ds)
        return -1;
    }

    // the mask is repeated at every time
    mfds_array dst;
    if (ds->plan_and_load(mfds_keyring(), dst, diag) ||
        (dst.get_shape() != vector<long>({3, 2, 2})))
    {
        MFDS_ERROR("Failed to load " << dst)
        return -1;
    }

    for (long t = 0; t < 3; ++t)
    {
        for (long d = 0; d < 2; ++d)
        {
            if ((dst.at({t, d, 0}) != 100.0*(t + 1) + d) ||
                (dst.at({t, d, 1}) != 7.0 + d))
            {
                MFDS_ERROR("Wrong values at time " << t << " depth " << d
                    << ": " << dst.at({t, d, 0}) << ", " << dst.at({t, d, 1}))
                return -1;
            }
        }
    }

    // a missing file
    mfds_diagnostics quiet(mfds_diagnostics::error, nullptr);
    if (cfg.read(mfds_file_util::join(root, "none.cfg"), MPI_COMM_WORLD, quiet)
        != mfds_error::config_error)
    {
        MFDS_ERROR("A missing configuration was read")
        return -1;
    }

    return 0;
}

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        MFDS_ERROR("Usage: test_dataset_config [scratch directory]")
        return -1;
    }

    string root = mfds_file_util::join(argv[1], "config");
    if (mfds_file_util::make_directory(root) || test_parse(root) ||
        test_load(root))
        return -1;

    return 0;
}
