#include "mfds_coord_scan.h"
#include "mfds_numeric_coordinate.h"
#include "mfds_string_coordinate.h"
#include "mfds_scan_library.h"
#include "mfds_diagnostics.h"
#include "mfds_common.h"

#include <iostream>
#include <string>
#include <vector>

using namespace std;

// a scan function returning fixed values and in-file indices
mfds_scan_function_info fixed_values(const vector<double> &values,
    const vector<long> &in_idx, const string &units = "")
{
    return mfds_scan_function_info("fixed", mfds_scan_function_info::in_file,
        mfds_scan_function_info::values|mfds_scan_function_info::in_idx,
        [values, in_idx, units](const mfds_scan_context &, mfds_scan_result &res,
            mfds_diagnostics &) -> int
        {
            res.values = values;
            res.in_idx = in_idx;
            res.units = units;
            return 0;
        });
}

// scan a file whose name gave the value
int scan_value(mfds_coord_scan &cs, const string &capture, double value,
    mfds_diagnostics &diag)
{
    mfds_scan_context ctx;
    ctx.filename = "f_" + capture + ".nc";
    ctx.coord = cs.get_coordinate().get();
    ctx.captures = {capture};
    ctx.elements.value = value;
    ctx.elements.flags = mfds_element_values::has_value;

    if (!cs.wants_file(ctx.captures))
        return 0;

    return cs.scan_file(ctx, diag);
}

int test_descending()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_mfds_coord_scan cs = mfds_coord_scan::New(
        mfds_numeric_coordinate::New("time"), false);

    // the file stores time backward
    if (cs->add_scan_function(fixed_values({3.0, 2.0, 1.0}, {0, 1, 2})))
        return -1;

    mfds_scan_context ctx;
    ctx.coord = cs->get_coordinate().get();
    if (!cs->wants_file({}) || cs->scan_file(ctx, diag) || cs->wants_file({}) ||
        cs->finish(diag))
        return -1;

    if ((cs->get_values() != vector<double>({1.0, 2.0, 3.0})) ||
        (cs->get_in_idx() != vector<long>({2, 1, 0})) ||
        !cs->is_index_descending())
    {
        MFDS_ERROR("Wrong scan " << *cs)
        return -1;
    }

    cs->set_contains({0, 1, 2}, 3);

    long in_idx = 0;
    long scan_idx = 0;
    if (cs->get_in_index(0, in_idx, scan_idx) || (in_idx != 2) || (scan_idx != 0))
    {
        MFDS_ERROR("time=0 is at in-file index " << in_idx)
        return -1;
    }

    return 0;
}

int test_shared()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_mfds_coord_scan cs = mfds_coord_scan::New(
        mfds_numeric_coordinate::New("time"), true);

    cs->set_matchers({0});

    mfds_scan_function_info info;
    if (mfds_scan_library::get("filename_value", info) ||
        cs->add_scan_function(info))
        return -1;

    // the second file with capture "5" is skipped
    if (scan_value(*cs, "5", 5.0, diag) || scan_value(*cs, "1", 1.0, diag) ||
        scan_value(*cs, "5", 5.0, diag) || scan_value(*cs, "3", 3.0, diag) ||
        cs->finish(diag))
        return -1;

    if ((cs->get_values() != vector<double>({1.0, 3.0, 5.0})) ||
        (cs->get_in_idx() != vector<long>({-1, -1, -1})) ||
        (cs->get_matches() != vector<vector<string>>({{"1"}, {"3"}, {"5"}})) ||
        cs->is_index_descending())
    {
        MFDS_ERROR("Wrong shared scan " << *cs)
        return -1;
    }

    // a value found in two files
    cs->reset();
    if (scan_value(*cs, "a", 1.0, diag) || scan_value(*cs, "b", 1.0, diag))
        return -1;

    mfds_diagnostics quiet(mfds_diagnostics::error, nullptr);
    if ((cs->finish(quiet) != mfds_error::scan_error) ||
        !quiet.contains(mfds_diagnostics::error, "duplicate"))
    {
        MFDS_ERROR("Duplicate values were not reported")
        return -1;
    }

    return 0;
}

int test_manual()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    // one value per distinct file name, in the order they were found
    p_mfds_coord_scan cs = mfds_coord_scan::New(
        mfds_numeric_coordinate::New("member"), true);
    cs->set_matchers({0});
    cs->set_manual_values({10.0, 20.0});

    if (scan_value(*cs, "b", 0.0, diag) || scan_value(*cs, "a", 0.0, diag) ||
        cs->finish(diag))
        return -1;

    if ((cs->get_values() != vector<double>({10.0, 20.0})) ||
        (cs->get_matches() != vector<vector<string>>({{"b"}, {"a"}})) ||
        (cs->get_status() != mfds_coord_scan::manually_set))
    {
        MFDS_ERROR("Wrong manual scan " << *cs)
        return -1;
    }

    // more files than values
    cs->reset();
    mfds_diagnostics quiet(mfds_diagnostics::error, nullptr);
    if (scan_value(*cs, "a", 0.0, quiet) || scan_value(*cs, "b", 0.0, quiet) ||
        scan_value(*cs, "c", 0.0, quiet) || !cs->finish(quiet))
    {
        MFDS_ERROR("Three files took two values")
        return -1;
    }

    // variables set by hand, not read from the file
    p_mfds_coord_scan vs = mfds_coord_scan::New(
        mfds_string_coordinate::New("var"), false);
    vs->set_manual_names({"SST", "SSH"});
    if (vs->finish(diag) || (vs->get_names() != vector<string>({"SST", "SSH"})) ||
        (vs->get_in_names() != vs->get_names()))
    {
        MFDS_ERROR("Wrong variables " << *vs)
        return -1;
    }

    return 0;
}

int test_empty()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_mfds_coord_scan cs = mfds_coord_scan::New(
        mfds_numeric_coordinate::New("lat"), false);
    cs->set_force_index_descending(true);

    if (!cs->is_empty() || cs->wants_file({}) || cs->finish(diag) ||
        !cs->is_index_descending())
        return -1;

    // an empty scan holds every available value, mirrored
    cs->set_contains({}, 4);

    long in_idx = 0;
    long scan_idx = 0;
    if (cs->get_in_index(1, in_idx, scan_idx) || (in_idx != 2) ||
        (scan_idx != 1) || !cs->get_in_index(4, in_idx, scan_idx))
    {
        MFDS_ERROR("Wrong in-file index " << in_idx << " of an empty scan")
        return -1;
    }

    // values the scan does not hold
    cs->set_contains({0, -1, 2, 3}, 4);
    if (!cs->get_in_index(1, in_idx, scan_idx))
    {
        MFDS_ERROR("An excluded value was found")
        return -1;
    }

    return 0;
}

int test_selection_and_units()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    p_mfds_numeric_coordinate depth = mfds_numeric_coordinate::New("depth", "cm");
    p_mfds_coord_scan cs = mfds_coord_scan::New(depth, false);

    if (cs->add_scan_function(fixed_values({0.0, 1.0, 2.0, 3.0}, {}, "m")))
        return -1;

    cs->set_unit_converter([](const string &from, const string &to,
        vector<double> &values) -> int
        {
            if ((from != "m") || (to != "cm"))
                return -1;
            for (size_t i = 0; i < values.size(); ++i)
                values[i] *= 100.0;
            return 0;
        });

    cs->set_selection_range(150.0, 300.0);

    mfds_scan_context ctx;
    ctx.coord = depth.get();
    if (cs->scan_file(ctx, diag) || cs->finish(diag))
        return -1;

    if ((cs->get_values() != vector<double>({200.0, 300.0})) ||
        (cs->get_in_idx() != vector<long>({2, 3})))
    {
        MFDS_ERROR("Wrong selection " << *cs)
        return -1;
    }

    // selection by index keeps value order
    p_mfds_coord_scan ci = mfds_coord_scan::New(
        mfds_numeric_coordinate::New("lev"), false);
    if (ci->add_scan_function(fixed_values({5.0, 6.0, 7.0, 8.0}, {})))
        return -1;

    ci->set_selection(mfds_key(vector<long>({3, 1})));
    if (ci->scan_file(ctx, diag) || ci->finish(diag) ||
        (ci->get_values() != vector<double>({6.0, 8.0})) ||
        (ci->get_in_idx() != vector<long>({1, 3})))
    {
        MFDS_ERROR("Wrong index selection " << *ci)
        return -1;
    }

    // filename functions need a matcher
    p_mfds_coord_scan cf = mfds_coord_scan::New(
        mfds_numeric_coordinate::New("x"), false);
    mfds_scan_function_info info;
    if (mfds_scan_library::get("filename_value", info) ||
        !cf->add_scan_function(info) || !mfds_scan_library::get("nope", info))
    {
        MFDS_ERROR("A filename function was added without a matcher")
        return -1;
    }

    return 0;
}

int main(int, char **)
{
    if (test_descending() || test_shared() || test_manual() || test_empty() ||
        test_selection_and_units())
        return -1;

    return 0;
}
