#include "mfds_load_command.h"
#include "mfds_common.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;

// a pair of single element keys
mfds_command_keys point(long in_time, long mem_time, long depth)
{
    return mfds_command_keys(
        mfds_keyring({{"time", mfds_key(vector<long>({in_time}))},
            {"depth", mfds_key(vector<long>({depth}))}}),
        mfds_keyring({{"time", mfds_key(vector<long>({mem_time}))},
            {"depth", mfds_key(vector<long>({0}))}}));
}

int check(const mfds_load_command &cmd, const string &expected,
    const char *what)
{
    ostringstream oss;
    oss << cmd;
    if (oss.str() != expected)
    {
        MFDS_ERROR(<< what << ": got" << std::endl << oss.str() << std::endl
            << "expected" << std::endl << expected)
        return -1;
    }
    return 0;
}

int test_merge()
{
    // time=0,2,4 at depth 0 read into consecutive positions
    mfds_load_command cmd("SSH_2007.nc");
    cmd.add_keys(point(0, 0, 0));
    cmd.add_keys(point(2, 1, 0));
    cmd.add_keys(point(4, 2, 0));

    if (cmd.merge() || (cmd.size() != 1))
    {
        MFDS_ERROR("Merge left " << cmd)
        return -1;
    }

    cmd.simplify();
    if (check(cmd, "SSH_2007.nc\n"
        "    {time: slice(0, 5, 2), depth: 0} -> {time: slice(0, 3, 1), depth: 0}",
        "merge"))
        return -1;

    // the order pairs are added in does not change the result
    mfds_load_command shuffled("SSH_2007.nc");
    shuffled.add_keys(point(4, 2, 0));
    shuffled.add_keys(point(0, 0, 0));
    shuffled.add_keys(point(2, 1, 0));

    if (shuffled.merge() || (shuffled.size() != 1))
    {
        MFDS_ERROR("Merge left " << shuffled)
        return -1;
    }

    shuffled.simplify();
    if (!(shuffled == cmd) || check(shuffled, "SSH_2007.nc\n"
        "    {time: slice(0, 5, 2), depth: 0} -> {time: slice(0, 3, 1), depth: 0}",
        "shuffled merge"))
    {
        MFDS_ERROR("Merging out of order gave " << shuffled)
        return -1;
    }

    // the same elements twice
    mfds_load_command twice("f.nc");
    twice.add_keys(point(3, 0, 1));
    twice.add_keys(point(3, 0, 1));
    if (twice.merge() || (twice.size() != 1))
    {
        MFDS_ERROR("A repeated pair was kept " << twice)
        return -1;
    }

    // two dimensions differ, nothing is merged
    mfds_load_command two("f.nc");
    two.add_keys(point(0, 0, 0));
    two.add_keys(point(1, 1, 1));
    if (two.merge() || (two.size() != 2))
    {
        MFDS_ERROR("Pairs differing along two dimensions were merged")
        return -1;
    }

    // dimensions absent from the file are not merged
    mfds_load_command absent("g.nc");
    absent.add_keys(mfds_keyring({{"member", mfds_key()}}),
        mfds_keyring({{"member", mfds_key(vector<long>({0}))}}));
    absent.add_keys(mfds_keyring({{"member", mfds_key()}}),
        mfds_keyring({{"member", mfds_key(vector<long>({1}))}}));
    if (absent.merge() || (absent.size() != 2))
    {
        MFDS_ERROR("A dimension absent from the file was merged " << absent)
        return -1;
    }

    return 0;
}

int test_simplify()
{
    // the file is read forward, memory takes the reversed order
    mfds_load_command cmd("depth.nc");
    cmd.add_keys(mfds_keyring({{"depth", mfds_key(vector<long>({4, 2, 0}))}}),
        mfds_keyring({{"depth", mfds_key(vector<long>({0, 1, 2}))}}));

    cmd.simplify();
    if (check(cmd, "depth.nc\n"
        "    {depth: slice(0, 5, 2)} -> {depth: slice(2, None, -1)}", "reverse"))
        return -1;

    // lists that are not regular stay lists
    mfds_load_command irr("irr.nc");
    irr.add_keys(mfds_keyring({{"time", mfds_key(vector<long>({0, 1, 5}))}}),
        mfds_keyring({{"time", mfds_key(vector<long>({3, 4, 5}))}}));
    irr.simplify();
    if (check(irr, "irr.nc\n"
        "    {time: [0, 1, 5]} -> {time: slice(3, 6, 1)}", "irregular"))
        return -1;

    return 0;
}

int test_separate_variables()
{
    mfds_load_command cmd("ocean.nc");
    cmd.add_keys(
        mfds_keyring({{"time", mfds_key(0)},
            {"var", mfds_key::from_names({"SSH", "SST"})}}),
        mfds_keyring({{"time", mfds_key(1)},
            {"var", mfds_key(vector<long>({0, 2}))}}));

    vector<mfds_load_command> cmds;
    if (cmd.separate_variables("var", cmds) || (cmds.size() != 2))
    {
        MFDS_ERROR("Failed to separate the variables of " << cmd)
        return -1;
    }

    if (check(cmds[0], "ocean.nc\n    {time: 0, var: 'SSH'} -> {time: 1, var: 0}",
        "first variable") ||
        check(cmds[1], "ocean.nc\n    {time: 0, var: 'SST'} -> {time: 1, var: 2}",
        "second variable"))
        return -1;

    // without a variable dimension the command is kept whole
    cmds.clear();
    mfds_load_command none("none.nc");
    none.add_keys(point(0, 0, 0));
    if (none.separate_variables("var", cmds) || (cmds.size() != 1) ||
        !(cmds[0] == none))
    {
        MFDS_ERROR("A command without variables was changed")
        return -1;
    }

    // names and indices must agree
    mfds_load_command bad("bad.nc");
    bad.add_keys(mfds_keyring({{"var", mfds_key::from_names({"SSH", "SST"})}}),
        mfds_keyring({{"var", mfds_key(0)}}));
    cmds.clear();
    if (bad.separate_variables("var", cmds) == 0)
    {
        MFDS_ERROR("Two names were placed at one index")
        return -1;
    }

    return 0;
}

int main(int, char **)
{
    if (test_merge() || test_simplify() || test_separate_variables())
        return -1;

    return 0;
}
