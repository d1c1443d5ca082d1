#include "mfds_key.h"
#include "mfds_string_coordinate.h"
#include "mfds_common.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;

// compare the printed form of the key
int check(const mfds_key &key, const string &expected, const char *what)
{
    ostringstream oss;
    oss << key;
    if (oss.str() != expected)
    {
        MFDS_ERROR(<< what << ": got " << oss.str() << " expected " << expected)
        return -1;
    }
    return 0;
}

// compare the indices of the key
int check_ids(const mfds_key &key, const vector<long> &expected,
    const char *what)
{
    vector<long> ids;
    if (key.to_list(ids) || (ids != expected))
    {
        MFDS_ERROR(<< what << ": key " << key << " gives [" << ids
            << "] expected [" << expected << "]")
        return -1;
    }
    return 0;
}

int test_list_to_slice()
{
    mfds_key k(vector<long>({0, 2, 4}));
    k.simplify();
    if (check(k, "slice(0, 5, 2)", "list2slice"))
        return -1;

    // a single element stays a list until made an int
    mfds_key one(vector<long>({3}));
    one.simplify();
    if (check(one, "[3]", "list of one"))
        return -1;

    one.make_list_int();
    if (check(one, "3", "list of one to int"))
        return -1;

    one.make_int_list();
    if (check(one, "[3]", "int to list"))
        return -1;

    // mixed signs and irregular steps are not rewritten
    mfds_key mixed(vector<long>({-1, 0, 1}));
    mixed.simplify();
    if (check(mixed, "[-1, 0, 1]", "mixed signs"))
        return -1;

    mfds_key irregular(vector<long>({0, 1, 3}));
    irregular.simplify();
    if (check(irregular, "[0, 1, 3]", "irregular"))
        return -1;

    // backward lists end before the start of the sequence
    mfds_key back(vector<long>({4, 2, 0}));
    back.simplify();
    if (check(back, "slice(4, None, -2)", "backward list"))
        return -1;

    back.set_parent_size(6);
    if (check_ids(back, {4, 2, 0}, "backward slice"))
        return -1;

    return 0;
}

int test_shape()
{
    mfds_key s(0, 5, 2);
    if (!s.is_shape_estimated() || (s.get_shape() != 3))
    {
        MFDS_ERROR("slice(0, 5, 2) has shape " << s.get_shape())
        return -1;
    }

    mfds_key all = mfds_key::all();
    if (all.get_shape() != 0)
    {
        MFDS_ERROR("The full slice can not be sized without a parent size")
        return -1;
    }

    all.set_parent_size(7);
    if (all.is_shape_estimated() || (all.get_shape() != 7))
    {
        MFDS_ERROR("The full slice of 7 has shape " << all.get_shape())
        return -1;
    }

    // a range of names is bounded by the parent size
    mfds_key names = mfds_key::from_name_slice("SSH", "U");
    names.set_parent_size(4);
    if (!names.is_shape_estimated() || (names.get_shape() != 4))
    {
        MFDS_ERROR("The name slice " << names << " of 4 has shape "
            << names.get_shape())
        return -1;
    }

    mfds_key tail(-3, mfds_key::nil, 1);
    tail.set_parent_size(10);
    if (check_ids(tail, {7, 8, 9}, "negative start"))
        return -1;

    if ((mfds_key(4).get_shape() != 0) || (mfds_key().get_shape() != 0))
    {
        MFDS_ERROR("int and none keys have shape 0")
        return -1;
    }

    vector<long> ids;
    if (!mfds_key().to_list(ids))
    {
        MFDS_ERROR("A none key was converted to a list")
        return -1;
    }

    if (!mfds_key::from_name("u").to_list(ids))
    {
        MFDS_ERROR("A key of names was converted to a list")
        return -1;
    }

    return 0;
}

int test_reverse()
{
    mfds_key s(0, 5, 2);
    s.reverse();
    s.set_parent_size(10);
    if (check_ids(s, {4, 2, 0}, "reversed slice"))
        return -1;

    // the last selected index is not the stop
    mfds_key odd(1, 5, 2);
    odd.reverse();
    odd.set_parent_size(10);
    if (check_ids(odd, {3, 1}, "reversed slice(1, 5, 2)"))
        return -1;

    mfds_key sized(1, 5, 2);
    sized.set_parent_size(10);
    sized.reverse();
    if (check_ids(sized, {3, 1}, "reversed sized slice(1, 5, 2)"))
        return -1;

    mfds_key back(4, mfds_key::nil, -2);
    back.reverse();
    back.set_parent_size(10);
    if (check_ids(back, {0, 2, 4}, "reversed slice(4, None, -2)"))
        return -1;

    mfds_key l(vector<long>({1, 5, 2}));
    l.reverse();
    if (check(l, "[2, 5, 1]", "reversed list"))
        return -1;

    return 0;
}

int test_compose()
{
    // B = A[2:12:2], C = B[1]
    mfds_key a(2, 12, 2);
    mfds_key out;
    if (a.compose(mfds_key(1), out) || check(out, "4", "slice by int"))
        return -1;

    mfds_key l(vector<long>({5, 6, 7}));
    if (l.compose(mfds_key(0, 3, 2), out) || check(out, "[5, 7]", "list by slice"))
        return -1;

    if (mfds_key::all().compose(l, out) || (out != l))
    {
        MFDS_ERROR("Composing the full slice should give the other key")
        return -1;
    }

    if (a.compose(mfds_key(10), out) == 0)
    {
        MFDS_ERROR("An out of bounds composition succeeded")
        return -1;
    }

    return 0;
}

int test_append()
{
    mfds_key out;
    if (mfds_key(vector<long>({0, 1})).append(mfds_key(vector<long>({2})), out)
        || check(out, "[0, 1, 2]", "append lists"))
        return -1;

    if (mfds_key(0, 2, 1).append(mfds_key(vector<long>({2})), out)
        || check(out, "slice(0, 3, 1)", "append to slice"))
        return -1;

    if (mfds_key::from_names({"u"}).append(mfds_key::from_names({"v"}), out)
        || check(out, "['u', 'v']", "append names"))
        return -1;

    return 0;
}

int test_names()
{
    p_mfds_string_coordinate var = mfds_string_coordinate::New("var");
    var->set_names({"u", "v", "w"});

    mfds_key s = mfds_key::from_name_slice("u", "v");
    if (s.make_str_idx(*var) || check(s, "slice(0, 2, 1)", "slice of names"))
        return -1;

    mfds_key l = mfds_key::from_names({"w", "u"});
    if (l.make_str_idx(*var) || check(l, "[2, 0]", "list of names"))
        return -1;

    mfds_key n = mfds_key::from_name("v");
    if (n.make_str_idx(*var) || check(n, "1", "name"))
        return -1;

    mfds_key bad = mfds_key::from_name("t");
    if (bad.make_str_idx(*var) == 0)
    {
        MFDS_ERROR("An unknown name was converted")
        return -1;
    }

    if (l.make_idx_str(*var) || check(l, "['w', 'u']", "indices to names"))
        return -1;

    vector<string> seq({"a", "b", "c", "d"});
    vector<string> taken;
    if (mfds_key(-1).apply(seq, taken) || (taken != vector<string>({"d"})))
    {
        MFDS_ERROR("Applying -1 gave " << taken)
        return -1;
    }

    taken.clear();
    if (mfds_key(4).apply(seq, taken) == 0)
    {
        MFDS_ERROR("An out of bounds index was applied")
        return -1;
    }

    return 0;
}

int main(int, char **)
{
    if (test_list_to_slice() || test_shape() || test_reverse() ||
        test_compose() || test_append() || test_names())
        return -1;

    return 0;
}
