#ifndef mfds_file_util_h
#define mfds_file_util_h

/// @file

#include "mfds_config.h"

#include <cstdlib>
#include <deque>
#include <string>
#include <vector>

#ifndef WIN32
#define PATH_SEP "/"
#else
#define PATH_SEP "\\"
#endif

/// Codes dealing with low level file system API's
namespace mfds_file_util
{
/// return a message describing the std::regex_error code
MFDS_EXPORT
const char *regex_strerr(int code);

/// return string converted to lower case
MFDS_EXPORT
void to_lower(std::string &in);

/// return 1 if the file exists, 0 otherwise
MFDS_EXPORT
int file_exists(const char *path);

/// return 1 if the path is a directory, 0 otherwise
MFDS_EXPORT
int is_directory(const char *path);

/** create the directory and any missing parents. returns non-zero if the
 * directory could not be created.
 */
MFDS_EXPORT
int make_directory(const std::string &path);

/// create an empty file, or truncate an existing one
MFDS_EXPORT
int touch_file(const std::string &path);

/** Returns the path not including the file name and not including the final
 * PATH_SEP. If PATH_SEP isn't found then ".PATH_SEP" is returned.
 */
MFDS_EXPORT
std::string path(const std::string &filename);

/** Returns the file name not including the extension (ie what ever is after
 * the last ".". If there is no "." then the filename is retnurned
 * unmodified.
 */
MFDS_EXPORT
std::string base_filename(const std::string &filename);

/** Returns the file name from the given path. If PATH_SEP isn't found
 * then the filename is returned unmodified.
 */
MFDS_EXPORT
std::string filename(const std::string &filename);

/// Returns the extension from the given filename.
MFDS_EXPORT
std::string extension(const std::string &filename);

/// join two path components with PATH_SEP
MFDS_EXPORT
std::string join(const std::string &a, const std::string &b);

/** List the regular files below root, descending at most max_depth levels
 * of sub directories. Paths are relative to root and sorted. Hidden
 * entries are skipped. returns non-zero if root can not be read.
 */
MFDS_EXPORT
int locate_files_recursive(const std::string &root,
    std::vector<std::string> &files, int max_depth = 3);

/// Search and replace with in a string of text.
MFDS_EXPORT
int search_and_replace(const std::string &search_for,
    const std::string &replace_with, std::string &in_text);

/** a stack of lines. lines can be popped as they are processed and the current
 * line number is recorded.
 */
struct MFDS_EXPORT line_buffer
{
    line_buffer() : m_buffer(nullptr), m_line_number(0) {}
    ~line_buffer() { free(m_buffer); }

    line_buffer(const line_buffer &) = delete;
    void operator=(const line_buffer &) = delete;

    // read the contents of the file and intitalize the
    // stack of lines.
    int initialize(const char *file_name);

    // intitalize the stack of lines from text in memory
    int initialize_text(const std::string &text);

    // check if the stack is not empty
    operator bool ()
    {
        return !m_lines.empty();
    }

    // get the line at the top of the stack
    char *current()
    {
        return m_lines.front();
    }

    // remove the line at the top of the stack
    void pop()
    {
        m_lines.pop_front();
        ++m_line_number;
    }

    // get the current line number
    size_t line_number()
    {
        return m_line_number;
    }

    char *m_buffer;
    std::deque<char*> m_lines;
    size_t m_line_number;
};

};

#endif
