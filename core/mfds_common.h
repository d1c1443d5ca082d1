#ifndef mfds_common_h
#define mfds_common_h

/// @file

#include "mfds_config.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

/// error codes
namespace mfds_error
{
/** The error taxonomy. Operations return 0 when successful and one of these
 * codes otherwise.
 *
 * | Code                 | Meaning |
 * |----------------------|---------|
 * | no_error             | success |
 * | config_error         | malformed pre-regex, unknown element, inconsistent dimension declarations |
 * | scan_error           | no file matches, duplicate or non-monotonic coordinate values |
 * | reconciliation_error | inconsistent filegroups when compiling the available space |
 * | load_error           | a file could not be opened or read, a value is not available |
 */
enum code
{
    no_error = 0,
    config_error = 1,
    scan_error = 2,
    reconciliation_error = 3,
    load_error = 4
};

/// returns a human readable name for the error code
MFDS_EXPORT
const char *get_name(int code);
};

/// A helper class for debug and error messages.
class MFDS_EXPORT mfds_parallel_id
{};

/** Prints the callers rank and thread id to the given stream. Rank is
 * reported relative to the WORLD communicator.
 */
MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_parallel_id &id);

/// @cond

// the operator<< overloads have to be namespace std in order for
// boost to find them. they are needed for mutitoken program options
namespace std
{
/// send a vector to a stream
template <typename T>
std::ostream &operator<<(std::ostream &os, const std::vector<T> &vec)
{
    if (!vec.empty())
    {
        os << vec[0];
        size_t n = vec.size();
        for (size_t i = 1; i < n; ++i)
            os << ", " << vec[i];
    }
    return os;
}

/// send a vector of strings to a stream
MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const std::vector<std::string> &vec);
}

/** Return true if we are writing to a TTY. If we are not then we should not
 * use ansi color codes.
 */
MFDS_EXPORT int have_tty();

#define ANSI_RED "\033[1;31;40m"
#define ANSI_GREEN "\033[1;32;40m"
#define ANSI_YELLOW "\033[1;33;40m"
#define ANSI_BLUE "\033[1;34;40m"
#define ANSI_WHITE "\033[1;37;40m"
#define ANSI_OFF "\033[0m"

#define BEGIN_HL(_color) (have_tty()?_color:"")
#define END_HL (have_tty()?ANSI_OFF:"")

/// @endcond

/** Send a message into the stream with an ANSI color coded message that
 * include MPI ranks and thread id.
 */
#define MFDS_MESSAGE(_strm, _head, _head_color, _msg)                   \
_strm                                                                   \
    << BEGIN_HL(_head_color) << _head << END_HL                         \
    << " " << mfds_parallel_id() << " [" << __FILE__ << ":" << __LINE__ \
    << " " << MFDS_VERSION_DESCR << "]" << std::endl                    \
    << BEGIN_HL(_head_color) << _head << END_HL << " "                  \
    << BEGIN_HL(ANSI_WHITE) << "" _msg << END_HL << std::endl;

/// Constructs an error message and sends it to the stderr stream
#define MFDS_ERROR(_msg) MFDS_MESSAGE(std::cerr, "ERROR:", ANSI_RED, _msg)

/// Constructs a warning message and sends it to the stderr stream
#define MFDS_WARNING(_msg) MFDS_MESSAGE(std::cerr, "WARNING:", ANSI_YELLOW, _msg)

/// Constructs a status message and sends it to the stderr stream
#define MFDS_STATUS(_msg) MFDS_MESSAGE(std::cerr, "STATUS:", ANSI_GREEN, _msg)

#endif
