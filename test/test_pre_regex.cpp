#include "mfds_pre_regex.h"
#include "mfds_diagnostics.h"
#include "mfds_common.h"

#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace std;

int test_date_matcher()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    mfds_pre_regex pre;
    if (pre.compile("SSH_%(time:x)\\.nc", diag))
        return -1;

    if (pre.has_regex_tokens())
    {
        MFDS_ERROR("Escaped punctuation was taken for a regex token")
        return -1;
    }

    vector<string> captures;
    if (pre.match("SSH_20070109.nc", captures) ||
        (captures != vector<string>({"20070109"})))
    {
        MFDS_ERROR("Failed to match SSH_20070109.nc, got " << captures)
        return -1;
    }

    // the whole name has to match
    if (!pre.match("SSH_20070109.nc.bak", captures) ||
        !pre.match("old/SSH_20070109.nc", captures))
    {
        MFDS_ERROR("Partial names were matched")
        return -1;
    }

    mfds_element_values vals;
    if (pre.parse(0, "20070109", vals) || (vals.year != 2007) ||
        (vals.month != 1) || (vals.day != 9))
    {
        MFDS_ERROR("Failed to parse 20070109")
        return -1;
    }

    mfds_date date;
    string errstr;
    if (vals.get_date(date, errstr) || !(date == mfds_date(2007, 1, 9, 12)))
    {
        MFDS_ERROR("Wrong date " << date << " " << errstr)
        return -1;
    }

    // filenames are rebuilt from the segments of the first file
    string filename;
    if (pre.set_segments("SSH_20070109.nc") ||
        (pre.get_segments() != vector<string>({"SSH_", ".nc"})) ||
        pre.make_filename({"20070201"}, filename) ||
        (filename != "SSH_20070201.nc"))
    {
        MFDS_ERROR("Wrong filename " << filename)
        return -1;
    }

    return 0;
}

int test_dummy_matchers()
{
    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);

    mfds_pre_regex pre;
    if (pre.compile("%(time:Y)/data_%(time:m)_%(var:text)_v%(version:idx:dummy)\\.nc",
        diag))
        return -1;

    if ((pre.get_matchers().size() != 4) || (pre.get_n_groups() != 4) ||
        (pre.get_matchers_of("time") != vector<int>({0, 1})))
    {
        MFDS_ERROR("Wrong matchers in " << pre.get_regex())
        return -1;
    }

    vector<string> captures;
    if (pre.match("2007/data_03_SSH_v2.nc", captures) ||
        (captures != vector<string>({"2007", "03", "SSH", "2"})))
    {
        MFDS_ERROR("Wrong captures " << captures)
        return -1;
    }

    // dummy matchers vary, their text is substituted like any other
    string filename;
    if (pre.set_segments("2007/data_03_SSH_v2.nc") ||
        (pre.get_segments() != vector<string>({"", "/data_", "_", "_v", ".nc"})) ||
        pre.make_filename({"2008", "04", "SST", "11"}, filename) ||
        (filename != "2008/data_04_SST_v11.nc"))
    {
        MFDS_ERROR("Wrong filename " << filename)
        return -1;
    }

    // the captures of a file rebuild that file
    vector<string> files({"2009/data_12_U_v7.nc", "1999/data_1_V_v.nc"});
    for (size_t i = 0; i < files.size(); ++i)
    {
        if (pre.match(files[i], captures) ||
            pre.make_filename(captures, filename) || (filename != files[i]))
        {
            MFDS_ERROR("\"" << files[i] << "\" was rebuilt as \"" << filename << "\"")
            return -1;
        }
    }

    // a dummy is matched but its text is never parsed
    mfds_element_values vals;
    if (pre.match("2007/data_03_SSH_v.nc", captures) ||
        (captures[3] != "") || pre.parse(1, captures[1], vals) ||
        (vals.month != 3))
    {
        MFDS_ERROR("Wrong match of an empty dummy " << captures)
        return -1;
    }

    return 0;
}

int test_syntax()
{
    mfds_diagnostics diag(mfds_diagnostics::debug, nullptr);

    vector<string> bad({"SSH_%(time", "SSH_%(time:nope)", "SSH_%x",
        "%(time:idx:custom=\\d+", "%()", "%(time:Y:m)"});

    for (size_t i = 0; i < bad.size(); ++i)
    {
        mfds_pre_regex pre;
        if (pre.compile(bad[i], diag) != mfds_error::config_error)
        {
            MFDS_ERROR("The malformed pre-regex \"" << bad[i] << "\" compiled")
            return -1;
        }
    }

    if (diag.count(mfds_diagnostics::error) != bad.size())
    {
        MFDS_ERROR("Expected " << bad.size() << " errors, "
            << diag.count(mfds_diagnostics::error) << " were reported")
        return -1;
    }

    // %% is a literal percent sign
    mfds_pre_regex pre;
    vector<string> captures;
    if (pre.compile("a%%_%(t)", diag) || pre.match("a%_12", captures) ||
        (captures != vector<string>({"12"})))
    {
        MFDS_ERROR("Failed to match a literal %")
        return -1;
    }

    // a custom regex replaces the pattern of the element
    mfds_element_values vals;
    if (pre.compile("f%(lev:idx:custom=\\d{3}:)", diag) ||
        pre.match("f010", captures) || !pre.match("f10", captures) ||
        pre.match("f010", captures) || pre.parse(0, captures[0], vals) ||
        (vals.index != 10))
    {
        MFDS_ERROR("Custom regex failed")
        return -1;
    }

    // constant replacements
    std::map<string, string> repl({{"res", "1.0deg"}});
    if (pre.compile("%(res)_%(time:Y)\\.nc", repl,
        mfds_element_registry::get_global(), diag) ||
        (pre.get_matchers().size() != 1) ||
        pre.match("1.0deg_2000.nc", captures) || !pre.match("1x0deg_2000.nc", captures))
    {
        MFDS_ERROR("Replacement failed, regex " << pre.get_regex())
        return -1;
    }

    if (pre.compile("SSH.*_%(time:x)", diag) || !pre.has_regex_tokens())
    {
        MFDS_ERROR("Regex tokens were not detected")
        return -1;
    }

    return 0;
}

int test_elements()
{
    mfds_element_registry &reg = mfds_element_registry::get_global();

    mfds_element_values vals;
    if (reg.parse("F", "2001-02-03", vals) || (vals.year != 2001) ||
        (vals.month != 2) || (vals.day != 3))
    {
        MFDS_ERROR("Failed to parse F")
        return -1;
    }

    mfds_element_values b;
    if (reg.parse("M", "Feb", b) || (b.month != 2) ||
        reg.parse("M", "february", b) || (b.month != 2) ||
        reg.parse("B", "MAR", b) || (b.month != 3) ||
        !reg.parse("M", "Febr", b))
    {
        MFDS_ERROR("Failed to parse month names")
        return -1;
    }

    mfds_element_values yy;
    if (reg.parse("yy", "99", yy) || (yy.year != 1999) ||
        reg.parse("yy", "07", yy) || (yy.year != 2007))
    {
        MFDS_ERROR("Failed to parse two digit years")
        return -1;
    }

    string text;
    if (reg.format("x", vals, text) || (text != "20010203"))
    {
        MFDS_ERROR("Failed to format x, got " << text)
        return -1;
    }

    mfds_element_values doy;
    mfds_date date;
    string errstr;
    if (reg.parse("Y", "2000", doy) || reg.parse("doy", "60", doy) ||
        doy.get_date(date, errstr) || (date.month != 2) || (date.day != 29))
    {
        MFDS_ERROR("Day 60 of 2000 is " << date)
        return -1;
    }

    // minutes are min, M is the month name
    mfds_diagnostics mdiag(mfds_diagnostics::warning, &std::cerr);
    mfds_pre_regex mpre;
    vector<string> mcaps;
    mfds_element_values mvals;
    if (mpre.compile("sst_%(time:Y)%(time:M)_%(time:H)%(time:min)", mdiag) ||
        mpre.match("sst_2004jun_0645", mcaps) ||
        (mcaps != vector<string>({"2004", "jun", "06", "45"})) ||
        mpre.parse(1, mcaps[1], mvals) || (mvals.month != 6) ||
        mpre.parse(3, mcaps[3], mvals) || (mvals.minute != 45))
    {
        MFDS_ERROR("Failed to match month names and minutes, got " << mcaps)
        return -1;
    }

    mfds_element_values hms;
    if (reg.parse("X", "063015", hms) || hms.get_date(date, errstr) ||
        (date.hour != 6) || (date.minute != 30) || (date.second != 15.0))
    {
        MFDS_ERROR("Failed to parse X, got " << date)
        return -1;
    }

    mfds_element_values bad;
    if (reg.parse("x", "20010231", bad) || !bad.get_date(date, errstr))
    {
        MFDS_ERROR("February 31st was accepted")
        return -1;
    }

    // user elements
    mfds_element_registry custom(reg);
    if (custom.add("season", "DJF|MAM|JJA|SON",
        [](const string &t, mfds_element_values &v) -> int
        {
            const char *seasons[] = {"DJF", "MAM", "JJA", "SON"};
            for (int i = 0; i < 4; ++i)
            {
                if (t == seasons[i])
                {
                    v.month = 3*i ? 3*i : 12;
                    v.flags |= mfds_element_values::has_month;
                    return 0;
                }
            }
            return -1;
        }))
        return -1;

    if (custom.add("season", "x", [](const string &, mfds_element_values &) { return 0; }) == 0)
    {
        MFDS_ERROR("An element was registered twice")
        return -1;
    }

    mfds_diagnostics diag(mfds_diagnostics::warning, &std::cerr);
    mfds_pre_regex pre;
    vector<string> captures;
    mfds_element_values sv;
    if (pre.compile("%(time:Y)_%(time:season)", {}, custom, diag) ||
        pre.match("1999_JJA", captures) || pre.parse(1, captures[1], sv) ||
        (sv.month != 6))
    {
        MFDS_ERROR("Failed to use the season element")
        return -1;
    }

    return 0;
}

int main(int, char **)
{
    if (test_date_matcher() || test_dummy_matchers() || test_syntax() ||
        test_elements())
        return -1;

    return 0;
}
