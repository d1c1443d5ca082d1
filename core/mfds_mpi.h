#ifndef mfds_mpi_h
#define mfds_mpi_h

/// @file

#include "mfds_config.h"

#if defined(MFDS_HAS_MPI)
#include <mpi.h>
#else
using MPI_Comm = void*;
#define MPI_COMM_WORLD nullptr
#define MPI_COMM_SELF nullptr
#define MPI_COMM_NULL nullptr
#endif

/// Codes dealing with MPI
namespace mfds_mpi
{
/// returns the rank in comm, or 0 when MPI is not in use
MFDS_EXPORT
int get_comm_rank(MPI_Comm comm);

/// returns the size of comm, or 1 when MPI is not in use
MFDS_EXPORT
int get_comm_size(MPI_Comm comm);
}

/** @brief
 * Initializes MPI for the lifetime of an application.
 *
 * @details
 * MPI is finalized by the destructor only when this object initialized it.
 */
class MFDS_EXPORT mfds_mpi_manager
{
public:
    mfds_mpi_manager(int &argc, char **&argv);
    ~mfds_mpi_manager();

    mfds_mpi_manager(const mfds_mpi_manager &) = delete;
    void operator=(const mfds_mpi_manager &) = delete;

    /// rank and size in MPI_COMM_WORLD
    int get_comm_rank() const { return m_rank; }
    int get_comm_size() const { return m_size; }

private:
    bool m_initialized;
    int m_rank;
    int m_size;
};

#endif
