#include "mfds_keyring.h"
#include "mfds_coordinate.h"
#include "mfds_numeric_coordinate.h"
#include "mfds_string_coordinate.h"
#include "mfds_diagnostics.h"
#include "mfds_binary_stream.h"
#include "mfds_common.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;

int check(const mfds_keyring &keys, const string &expected, const char *what)
{
    ostringstream oss;
    oss << keys;
    if (oss.str() != expected)
    {
        MFDS_ERROR(<< what << ": got " << oss.str() << " expected " << expected)
        return -1;
    }
    return 0;
}

int main(int, char **)
{
    mfds_diagnostics diag(mfds_diagnostics::error, nullptr);

    // the dimensions of the dataset
    mfds_coordinate_registry coords;
    p_mfds_numeric_coordinate time = mfds_numeric_coordinate::New("time");
    time->set_values({0.0, 1.0, 2.0, 3.0, 4.0, 5.0});
    p_mfds_numeric_coordinate depth = mfds_numeric_coordinate::New("depth");
    depth->set_values({0.0, 10.0});
    p_mfds_string_coordinate var = mfds_string_coordinate::New("var");
    var->set_names({"SSH", "SST", "U", "V"});
    coords.add(time);
    coords.add(depth);
    coords.add(var);

    vector<string> dims({"time", "depth", "var"});

    // a partial selection, out of order
    mfds_keyring keys;
    keys.set("var", mfds_key::from_names({"U", "SSH"}));
    keys.set("time", mfds_key(0, 5, 2));
    if (check(keys, "{var: ['U', 'SSH'], time: slice(0, 5, 2)}", "set"))
        return -1;

    keys.make_full(dims, &diag);
    keys.sort_by(dims);
    if (check(keys, "{time: slice(0, 5, 2), depth: slice(None, None, 1),"
        " var: ['U', 'SSH']}", "make_full"))
        return -1;

    if (keys.make_str_idx(coords))
        return -1;

    keys.make_total(coords.get_sizes());
    if (check(keys, "{time: slice(0, 5, 2), depth: slice(0, 2, 1),"
        " var: [2, 0]}", "normalized"))
        return -1;

    vector<long> shape = keys.get_shape();
    if (shape != vector<long>({3, 2, 2}))
    {
        MFDS_ERROR("Wrong shape [" << shape << "]")
        return -1;
    }

    // unwanted dimensions are reported
    mfds_keyring extra;
    extra.set("level", mfds_key(0));
    extra.make_full(dims, &diag);
    if (!diag.contains(mfds_diagnostics::warning, "\"level\""))
    {
        MFDS_ERROR("The unwanted dimension was not reported")
        return -1;
    }

    // int keys are squeezed from the shape
    mfds_keyring pt({{"time", mfds_key(3)}, {"depth", mfds_key(vector<long>({1}))}});
    if (pt.get_shape() != vector<long>({1}) ||
        (pt.get_non_zeros() != vector<string>({"depth"})))
    {
        MFDS_ERROR("Wrong shape of " << pt)
        return -1;
    }

    pt.make_int_list();
    if (check(pt, "{time: [3], depth: [1]}", "make_int_list"))
        return -1;

    pt.make_list_int();
    if (check(pt, "{time: 3, depth: 1}", "make_list_int"))
        return -1;

    // restrict the selection in the space it selects
    mfds_keyring sub({{"time", mfds_key(1)}});
    mfds_keyring composed;
    if (keys.compose(sub, composed) ||
        check(composed, "{time: 2, depth: slice(0, 2, 1), var: [2, 0]}", "compose"))
        return -1;

    // concatenate
    mfds_keyring a({{"time", mfds_key(vector<long>({0, 1}))}});
    mfds_keyring b({{"time", mfds_key(vector<long>({2}))},
        {"depth", mfds_key(0)}});
    mfds_keyring appended;
    if (a.append(b, appended) ||
        check(appended, "{time: [0, 1, 2], depth: 0}", "append"))
        return -1;

    appended.simplify();
    if (check(appended, "{time: slice(0, 3, 1), depth: 0}", "simplify"))
        return -1;

    if (check(keys.subset({"var", "time"}), "{var: [2, 0], time: slice(0, 5, 2)}",
        "subset"))
        return -1;

    if (!a.is_shape_equivalent(mfds_keyring({{"x", mfds_key(0, 2, 1)}})) ||
        a.is_shape_equivalent(appended))
    {
        MFDS_ERROR("Shape equivalence is wrong")
        return -1;
    }

    if (keys.remove("depth") || !keys.remove("depth") || keys.has("depth"))
    {
        MFDS_ERROR("Failed to remove depth")
        return -1;
    }

    // serialization
    mfds_binary_stream bs;
    keys.to_stream(bs);
    mfds_keyring keys_out;
    keys_out.from_stream(bs);
    if (keys_out != keys)
    {
        MFDS_ERROR("Serialized " << keys << " read as " << keys_out)
        return -1;
    }

    return 0;
}
