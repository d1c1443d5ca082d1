#ifdef CXX11_REGEX_TEST
#include <regex>
#include <string>
#include <iostream>
int main(int argc, char **argv)
{
    (void)argc;
    (void)argv;
    try
    {
        // element style sub-patterns used by the pre-regex compiler
        std::string s("SSH_20070101.nc SSH_20070109.nc");
        std::regex e("SSH_(\\d\\d\\d\\d\\d\\d\\d\\d)\\.nc");
        std::smatch m;
        int n_matches = 0;
        while (std::regex_search (s,m,e))
        {
            ++n_matches;
            s = m.suffix().str();
        }
        if (n_matches == 2)
            return 1;
    }
    catch (std::regex_error &err)
    {}
    return 0;
}
#endif
