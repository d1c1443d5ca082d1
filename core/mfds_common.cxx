#include "mfds_common.h"

#include "mfds_mpi.h"

#include <cstdio>
#include <thread>
#include <unistd.h>

namespace std
{
// **************************************************************************
std::ostream &operator<<(std::ostream &os, const std::vector<std::string> &vec)
{
    if (!vec.empty())
    {
        os << "\"" << vec[0] << "\"";
        size_t n = vec.size();
        for (size_t i = 1; i < n; ++i)
            os << ", \"" << vec[i] << "\"";
    }
    return os;
}
}

// **************************************************************************
std::ostream &operator<<(std::ostream &os, const mfds_parallel_id &)
{
    int rank = 0;
#if defined(MFDS_HAS_MPI)
    int is_init = 0;
    MPI_Initialized(&is_init);
    if (is_init)
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
#endif
    std::ostringstream oss;
    oss << "[" << rank << ":" << std::this_thread::get_id() << "]";
    os << oss.str();
    return os;
}

// **************************************************************************
int have_tty()
{
    static int have = -1;
    if (have < 0)
        have = isatty(fileno(stderr));
    return have;
}

namespace mfds_error
{
// **************************************************************************
const char *get_name(int code)
{
    switch (code)
    {
    case no_error:
        return "no error";
    case config_error:
        return "configuration error";
    case scan_error:
        return "scan error";
    case reconciliation_error:
        return "reconciliation error";
    case load_error:
        return "load error";
    }
    return "unknown error";
}
}
