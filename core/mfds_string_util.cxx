#include "mfds_string_util.h"

namespace mfds_string_util
{

// **************************************************************************
int split(const std::string &str, char delim, std::vector<std::string> &toks)
{
    size_t n = str.size();
    size_t i = 0;
    while (i <= n)
    {
        size_t e = str.find(delim, i);
        if (e == std::string::npos)
            e = n;

        size_t b = i;
        while ((b < e) && ((str[b] == ' ') || (str[b] == '\t')))
            ++b;

        size_t ee = e;
        while ((ee > b) && ((str[ee-1] == ' ') || (str[ee-1] == '\t') ||
            (str[ee-1] == '\r') || (str[ee-1] == '\n')))
            --ee;

        if (ee > b)
            toks.push_back(str.substr(b, ee - b));

        i = e + 1;
    }

    return toks.empty() ? -1 : 0;
}

}
