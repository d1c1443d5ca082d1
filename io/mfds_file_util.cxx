#include "mfds_file_util.h"
#include "mfds_common.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

#if defined(MFDS_HAS_REGEX)
#include <regex>
#endif

namespace mfds_file_util
{
// **************************************************************************
const char *regex_strerr(int code)
{
#if !defined(MFDS_HAS_REGEX)
    (void)code;
    return "c++11 regex support is disabled in this build";
#else
    switch (code)
    {
    case std::regex_constants::error_collate:
        return "The expression contained an invalid collating element name.";
    case std::regex_constants::error_ctype:
        return "The expression contained an invalid character class name.";
    case std::regex_constants::error_escape:
        return "The expression contained an invalid escaped character, or a"
               "trailing escape.";
    case std::regex_constants::error_backref:
        return "The expression contained an invalid back reference.";
    case std::regex_constants::error_brack:
        return "The expression contained mismatched brackets ([ and ]).";
    case std::regex_constants::error_paren:
        return "The expression contained mismatched parentheses (( and )).";
    case std::regex_constants::error_brace:
        return "The expression contained mismatched braces ({ and }).";
    case std::regex_constants::error_badbrace:
        return "The expression contained an invalid range between braces ({ and }).";
    case std::regex_constants::error_range:
        return "The expression contained an invalid character range.";
    case std::regex_constants::error_space:
        return "There was insufficient memory to convert the expression into a"
               " finite state machine.";
    case std::regex_constants::error_badrepeat:
        return "The expression contained a repeat specifier (one of *?+{) that"
               " was not preceded by a valid regular expression.";
    case std::regex_constants::error_complexity:
        return "The complexity of an attempted match against a regular"
               " expression exceeded a pre-set level.";
    case std::regex_constants::error_stack:
        return "There was insufficient memory to determine whether the regular"
               " expression could match the specified character sequence.";
    }
    return "unkown regex error";
#endif
}

// ***************************************************************************
void to_lower(std::string &in)
{
    size_t n = in.size();
    for (size_t i = 0; i < n; ++i)
        in[i] = (char)tolower(in[i]);
}

// ***************************************************************************
int file_exists(const char *path)
{
    struct stat s;
    if (stat(path, &s) == 0)
        return 1;
    return 0;
}

// ***************************************************************************
int is_directory(const char *path)
{
    struct stat s;
    if ((stat(path, &s) == 0) && S_ISDIR(s.st_mode))
        return 1;
    return 0;
}

// ***************************************************************************
int make_directory(const std::string &path)
{
    if (path.empty() || is_directory(path.c_str()))
        return 0;

    size_t p = path.find_last_of(PATH_SEP);
    if ((p != std::string::npos) && (p > 0) &&
        make_directory(path.substr(0, p)))
        return -1;

    if (mkdir(path.c_str(), 0755) && (errno != EEXIST))
    {
        int e = errno;
        MFDS_ERROR("Failed to create directory \"" << path << "\". "
            << strerror(e))
        return -1;
    }

    return 0;
}

// ***************************************************************************
int touch_file(const std::string &path)
{
    FILE *fh = fopen(path.c_str(), "w");
    if (!fh)
    {
        int e = errno;
        MFDS_ERROR("Failed to create \"" << path << "\". " << strerror(e))
        return -1;
    }
    fclose(fh);
    return 0;
}

// ***************************************************************************
std::string path(const std::string &filename)
{
    size_t p;
    p = filename.find_last_of(PATH_SEP);
    if (p == std::string::npos)
        return "." PATH_SEP;

    return filename.substr(0,p);
}

// ***************************************************************************
std::string base_filename(const std::string &filename)
{
    size_t p;
    p = filename.rfind(".");
    if (p == std::string::npos)
        return filename;

    return filename.substr(0, p);
}

// ***************************************************************************
std::string filename(const std::string &filenm)
{
    size_t p;
    p = filenm.find_last_of(PATH_SEP);
    if (p == std::string::npos)
        return filenm;

    return filenm.substr(p+1,std::string::npos);
}

// ***************************************************************************
std::string extension(const std::string &filename)
{
    size_t p;
    p = filename.rfind(".");
    if (p == std::string::npos)
        return "";

    return filename.substr(p+1);
}

// ***************************************************************************
std::string join(const std::string &a, const std::string &b)
{
    if (a.empty())
        return b;

    if (b.empty())
        return a;

    if (a.back() == PATH_SEP[0])
        return a + b;

    return a + PATH_SEP + b;
}

namespace internal
{
// ***************************************************************************
int locate_files_recursive(const std::string &root, const std::string &rel,
    int depth, int max_depth, std::vector<std::string> &files)
{
    std::string dir_path = join(root, rel);

    DIR *dir = opendir(dir_path.c_str());
    if (!dir)
    {
        int e = errno;
        MFDS_ERROR("Failed to open directory \"" << dir_path << "\". "
            << strerror(e))
        return -1;
    }

    std::vector<std::string> sub_dirs;

    struct dirent *de = nullptr;
    while ((de = readdir(dir)))
    {
        if (de->d_name[0] == '.')
            continue;

        std::string rel_path = join(rel, de->d_name);
        std::string full_path = join(root, rel_path);

        struct stat s;
        if (stat(full_path.c_str(), &s))
            continue;

        if (S_ISDIR(s.st_mode))
            sub_dirs.push_back(rel_path);
        else if (S_ISREG(s.st_mode))
            files.push_back(rel_path);
    }

    closedir(dir);

    if (depth < max_depth)
    {
        size_t n_dirs = sub_dirs.size();
        for (size_t i = 0; i < n_dirs; ++i)
        {
            if (locate_files_recursive(root, sub_dirs[i], depth + 1,
                max_depth, files))
                return -1;
        }
    }

    return 0;
}
};

// ***************************************************************************
int locate_files_recursive(const std::string &root,
    std::vector<std::string> &files, int max_depth)
{
    if (internal::locate_files_recursive(root, "", 0, max_depth, files))
        return -1;

    std::sort(files.begin(), files.end());
    return 0;
}

// ***************************************************************************
int search_and_replace(const std::string &search_for,
    const std::string &replace_with, std::string &in_text)
{
    int n_replaced = 0;
    if (search_for.empty())
        return 0;

    size_t n = search_for.size();
    size_t at = in_text.find(search_for);
    while (at != std::string::npos)
    {
        in_text.replace(at, n, replace_with);
        at = in_text.find(search_for, at + replace_with.size());
        ++n_replaced;
    }

    return n_replaced;
}

// ***************************************************************************
int line_buffer::initialize(const char *file_name)
{
    std::ifstream file(file_name);
    if (!file.is_open())
    {
        MFDS_ERROR("File \"" << file_name << "\" could not be opened.")
        return -1;
    }

    std::ostringstream oss;
    oss << file.rdbuf();

    return this->initialize_text(oss.str());
}

// ***************************************************************************
int line_buffer::initialize_text(const std::string &text)
{
    free(m_buffer);
    m_lines.clear();
    m_line_number = 0;

    size_t n_bytes = text.size();
    m_buffer = static_cast<char*>(malloc(n_bytes + 1));
    memcpy(m_buffer, text.c_str(), n_bytes);
    m_buffer[n_bytes] = '\0';

    // split in place, every line is terminated
    char *line = m_buffer;
    for (size_t i = 0; i < n_bytes; ++i)
    {
        if (m_buffer[i] == '\n')
        {
            m_buffer[i] = '\0';
            m_lines.push_back(line);
            line = m_buffer + i + 1;
        }
    }

    if (*line != '\0')
        m_lines.push_back(line);

    return 0;
}
};
