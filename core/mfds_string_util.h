#ifndef mfds_string_util_h
#define mfds_string_util_h

/// @file

#include "mfds_config.h"
#include "mfds_common.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

/// Codes for dealing with string processing
namespace mfds_string_util
{
/** Skip space, tabs, and new lines.  return non-zero if the end of the string
 * is reached before a non-pad character is encountered
 */
inline
int skip_pad(char *&buf)
{
    while ((*buf != '\0') &&
        ((*buf == ' ') || (*buf == '\n') || (*buf == '\r') || (*buf == '\t')))
        ++buf;
    return *buf == '\0' ? -1 : 0;
}

/// remove trailing space, tabs, and new lines in place
inline
void trim_pad(char *buf)
{
    size_t n = strlen(buf);
    while ((n > 0) && ((buf[n-1] == ' ') || (buf[n-1] == '\n') ||
        (buf[n-1] == '\r') || (buf[n-1] == '\t')))
        buf[--n] = '\0';
}

/// return 1 if the first non-pad character is #
inline
int is_comment(char *buf)
{
    skip_pad(buf);
    if (buf[0] == '#')
        return 1;
    return 0;
}

/** Split the string on delim, removing leading and trailing pad from each
 * token. Empty tokens are skipped. return zero if at least one token was
 * found.
 */
MFDS_EXPORT
int split(const std::string &str, char delim, std::vector<std::string> &toks);

/** Convert the text of a number with conv, a strtod like function. The text
 * must hold the number and nothing but trailing pad. returns 0 if
 * successful.
 */
template <typename num_t, typename conv_t>
int convert_number(const char *str, num_t &val, conv_t conv)
{
    errno = 0;
    char *endp = nullptr;
    num_t tmp = conv(str, &endp);
    if ((errno != 0) || (endp == str))
        return -1;

    while ((*endp == ' ') || (*endp == '\t'))
        ++endp;

    if (*endp != '\0')
        return -1;

    val = tmp;
    return 0;
}

/// A traits class for conversion from the text of a configuration
template <typename T>
struct MFDS_EXPORT string_tt {};

/// coordinate values, tolerances and selection bounds
template <>
struct string_tt<double>
{
    static const char *type_name() { return "double"; }

    static int convert(const char *str, double &val)
    {
        return convert_number(str, val,
            [](const char *s, char **e) { return strtod(s, e); });
    }
};

/// indices and slice bounds
template <>
struct string_tt<long>
{
    static const char *type_name() { return "long"; }

    static int convert(const char *str, long &val)
    {
        return convert_number(str, val,
            [](const char *s, char **e) { return strtol(s, e, 10); });
    }
};

/// date fields and depths, out of range values are rejected
template <>
struct string_tt<int>
{
    static const char *type_name() { return "int"; }

    static int convert(const char *str, int &val)
    {
        long tmp = 0;
        if (string_tt<long>::convert(str, tmp) ||
            (tmp < std::numeric_limits<int>::min()) ||
            (tmp > std::numeric_limits<int>::max()))
            return -1;
        val = tmp;
        return 0;
    }
};

/// A traits class for conversion from text, specialized for std::string
template <>
struct string_tt<std::string>
{
    static const char *type_name() { return "std::string"; }

    static int convert(const char *str, std::string &val)
    {
        val = str;
        return 0;
    }
};

/** Extract the value in a "name = value" pair. Only the first '=' splits
 * the line so that values, regular expressions for instance, may contain
 * '='. Trailing pad is removed. returns 0 if successful.
 */
template <typename val_t>
int extract_value(char *l, val_t &val)
{
    char *eq = strchr(l, '=');
    if (!eq)
    {
        MFDS_ERROR("Invalid name specifier in \"" << l << "\"")
        return -1;
    }

    char *r = eq + 1;
    trim_pad(r);
    if (skip_pad(r) || string_tt<val_t>::convert(r, val))
    {
        MFDS_ERROR("Invalid " << string_tt<val_t>::type_name()
            << " value \"" << r << "\" in \"" << l << "\"")
        return -1;
    }

    return 0;
}

/** Extract a comma separated list in a "name = v0, v1, ..." pair.
 * returns 0 if at least one value was found and all converted.
 */
template <typename val_t>
int extract_values(char *l, std::vector<val_t> &vals)
{
    std::string str;
    std::vector<std::string> toks;
    if (extract_value<std::string>(l, str) || split(str, ',', toks))
        return -1;

    size_t n_toks = toks.size();
    for (size_t i = 0; i < n_toks; ++i)
    {
        val_t val;
        if (string_tt<val_t>::convert(toks[i].c_str(), val))
        {
            MFDS_ERROR("Invalid " << string_tt<val_t>::type_name()
                << " value \"" << toks[i] << "\" in \"" << l << "\"")
            return -1;
        }
        vals.push_back(val);
    }

    return 0;
}
}

#endif
