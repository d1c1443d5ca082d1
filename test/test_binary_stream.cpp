#include "mfds_common.h"
#include "mfds_binary_stream.h"
#include "mfds_mpi.h"
#include "mfds_keyring.h"
#include "mfds_coordinate.h"
#include "mfds_numeric_coordinate.h"
#include "mfds_string_coordinate.h"
#include "mfds_coord_scan.h"
#include "mfds_dataset_config.h"
#include "mfds_diagnostics.h"

#include <iostream>
#include <string>
#include <vector>

using namespace std;

// serialize, deserialize into out, serialize again. the bytes must match
template <typename object_t>
int round_trip(const object_t &in, object_t &out, const char *what)
{
    mfds_binary_stream bs1;
    in.to_stream(bs1);

    out.from_stream(bs1);

    mfds_binary_stream bs2;
    out.to_stream(bs2);

    if (!(bs1 == bs2))
    {
        MFDS_ERROR(<< what << " serialized as " << bs1.size() << " bytes then "
            << bs2.size() << " bytes")
        return -1;
    }

    return 0;
}

int test_basic()
{
    mfds_binary_stream bs;
    bs.pack("header", 6);
    bs.pack(42);
    bs.pack(2.5);
    bs.pack(string("sea surface height"));
    bs.pack(vector<string>({"SSH", "SST"}));
    bs.pack(vector<vector<string>>({{"2007", "01"}, {"2007", "02"}}));
    bs.pack(vector<long>({3, -1, 7}));

    // copies and moves keep the bytes
    mfds_binary_stream cp(bs);
    mfds_binary_stream mv(std::move(cp));
    if (!(mv == bs) || cp)
    {
        MFDS_ERROR("Copy or move changed the stream")
        return -1;
    }

    int i = 0;
    double d = 0.0;
    string s;
    vector<string> vs;
    vector<vector<string>> vvs;
    vector<long> vl;

    if (mv.expect("header"))
    {
        MFDS_ERROR("The header was not found")
        return -1;
    }

    mv.unpack(i);
    mv.unpack(d);
    mv.unpack(s);
    mv.unpack(vs);
    mv.unpack(vvs);
    mv.unpack(vl);

    if ((i != 42) || (d != 2.5) || (s != "sea surface height") ||
        (vs != vector<string>({"SSH", "SST"})) || (vvs.size() != 2) ||
        (vvs[1] != vector<string>({"2007", "02"})) ||
        (vl != vector<long>({3, -1, 7})))
    {
        MFDS_ERROR("Wrong values unpacked " << i << " " << d << " " << s)
        return -1;
    }

    mfds_binary_stream other;
    other.swap(mv);
    if (mv || !(other == bs))
    {
        MFDS_ERROR("Swap failed")
        return -1;
    }

    // reading past the end fails and leaves the value alone
    if (!other.good())
    {
        MFDS_ERROR("A complete read failed")
        return -1;
    }

    int past = 7;
    other.unpack(past);
    if (other.good() || (past != 7))
    {
        MFDS_ERROR("Read past the end of the stream")
        return -1;
    }

    other.rewind();
    if (other.expect("header") || other.expect("header"))
    {
        MFDS_ERROR("Wrong header after rewinding")
        return -1;
    }

    return 0;
}

int test_truncated()
{
    mfds_binary_stream full;
    mfds_keyring keys({{"time", mfds_key(0, 3, 2)},
        {"var", mfds_key::from_names({"SST", "SSH"})}});
    keys.to_stream(full);

    // a stream cut short does not read as a keyring
    mfds_binary_stream cut;
    cut.pack(full.get_data(), full.size() - 3);

    mfds_keyring keys_out;
    keys_out.from_stream(cut);
    if (cut.good() || !keys_out.empty())
    {
        MFDS_ERROR("Read " << keys_out << " from a truncated stream")
        return -1;
    }

    // a length announcing more bytes than the stream holds
    mfds_binary_stream bad;
    bad.pack(1000000ul);
    vector<double> vals;
    bad.unpack(vals);
    if (bad.good() || !vals.empty())
    {
        MFDS_ERROR("Unpacked " << vals.size() << " values from 8 bytes")
        return -1;
    }

    return 0;
}

int test_objects()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    // coordinates keep their type through the stream
    mfds_coordinate_registry coords;
    p_mfds_coordinate time = mfds_coordinate::New("time");
    time->set_name("time");
    time->set_units("days since 2007-01-01 00:00:00");
    time->set_values({0.5, 1.5, 2.5});
    p_mfds_numeric_coordinate depth = mfds_numeric_coordinate::New("depth", "m");
    depth->set_alt_names({"lev"});
    depth->set_values({0.0, 10.0});
    p_mfds_string_coordinate var = mfds_string_coordinate::New("var");
    var->set_names({"SSH", "SST"});
    coords.add(time);
    coords.add(depth);
    coords.add(var);

    mfds_coordinate_registry coords_out;
    if (round_trip(coords, coords_out, "coordinates") ||
        (coords_out.get_names() != coords.get_names()) ||
        (string(coords_out.get("time")->get_type_name()) != time->get_type_name()) ||
        (coords_out.get("depth")->get_values() != depth->get_values()) ||
        !coords_out.get("depth")->has_name("lev") ||
        (coords_out.get("var")->get_names() != var->get_names()))
    {
        MFDS_ERROR("Coordinates changed through the stream")
        return -1;
    }

    // the state of a scan
    p_mfds_coord_scan cs = mfds_coord_scan::New(depth, false);
    cs->set_manual_values({10.0, 0.0});
    if (cs->finish(diag))
        return -1;
    cs->set_contains({1, 0}, 2);

    p_mfds_coord_scan cs_out = mfds_coord_scan::New(depth, false);
    if (round_trip(*cs, *cs_out, "coordinate scan") ||
        (cs_out->get_values() != cs->get_values()) ||
        (cs_out->get_in_idx() != cs->get_in_idx()) ||
        (cs_out->get_contains() != cs->get_contains()))
    {
        MFDS_ERROR("The scan changed through the stream " << *cs_out)
        return -1;
    }

    // a scan of another coordinate is rejected
    mfds_binary_stream bs;
    cs->to_stream(bs);
    p_mfds_coord_scan other = mfds_coord_scan::New(time, false);
    if (other->from_stream(bs) == 0)
    {
        MFDS_ERROR("The scan of depth was read into a scan of time")
        return -1;
    }

    // selections
    mfds_keyring keys({{"time", mfds_key(0, 3, 2)},
        {"var", mfds_key::from_names({"SST", "SSH"})}, {"depth", mfds_key()}});
    mfds_keyring keys_out;
    if (round_trip(keys, keys_out, "keyring") || (keys_out != keys))
    {
        MFDS_ERROR("Serialized " << keys << " read as " << keys_out)
        return -1;
    }

    return 0;
}

int test_broadcast(int rank)
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    // the configuration is parsed on rank 0 only
    mfds_dataset_config cfg;
    mfds_binary_stream bs;
    if (rank == 0)
    {
        if (cfg.parse("dims = time, var\n"
            "[coordinate]\nname = time\ntype = time\n"
            "units = hours since 2000-01-01 00:00:00\n"
            "[coordinate]\nname = var\ntype = string\n"
            "[filegroup]\nname = a\nroot = /data/a\npattern = A_%(time:x)\\.nc\n"
            "shared = time\nvariables = A\nscan = time:filename_date\n", diag))
            return -1;

        cfg.to_stream(bs);
    }

    if (bs.broadcast(MPI_COMM_WORLD))
    {
        MFDS_ERROR("Failed to broadcast the configuration")
        return -1;
    }

    mfds_dataset_config cfg_out;
    if (cfg_out.from_stream(bs) ||
        (cfg_out.get_dims() != vector<string>({"time", "var"})) ||
        (cfg_out.get_filegroups().size() != 1) ||
        (cfg_out.get_filegroups()[0].pattern != "A_%(time:x)\\.nc") ||
        (cfg_out.get_filegroups()[0].scan != vector<string>({"time:filename_date"})))
    {
        MFDS_ERROR("Rank " << rank << " received a wrong configuration")
        return -1;
    }

    return 0;
}

int main(int argc, char **argv)
{
    mfds_mpi_manager mpi_man(argc, argv);
    int rank = mpi_man.get_comm_rank();

    if (test_basic() || test_truncated() || test_objects() ||
        test_broadcast(rank))
        return -1;

    return 0;
}
