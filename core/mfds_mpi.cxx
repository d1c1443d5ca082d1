#include "mfds_mpi.h"

// --------------------------------------------------------------------------
mfds_mpi_manager::mfds_mpi_manager(int &argc, char **&argv) :
    m_initialized(false), m_rank(0), m_size(1)
{
#if defined(MFDS_HAS_MPI)
    int is_init = 0;
    MPI_Initialized(&is_init);
    if (!is_init)
    {
        MPI_Init(&argc, &argv);
        m_initialized = true;
    }
#else
    (void)argc;
    (void)argv;
#endif
    m_rank = mfds_mpi::get_comm_rank(MPI_COMM_WORLD);
    m_size = mfds_mpi::get_comm_size(MPI_COMM_WORLD);
}

// --------------------------------------------------------------------------
mfds_mpi_manager::~mfds_mpi_manager()
{
#if defined(MFDS_HAS_MPI)
    int is_final = 0;
    MPI_Finalized(&is_final);
    if (m_initialized && !is_final)
        MPI_Finalize();
#endif
}

namespace mfds_mpi
{
// **************************************************************************
int get_comm_rank(MPI_Comm comm)
{
    int rank = 0;
#if defined(MFDS_HAS_MPI)
    int is_init = 0;
    MPI_Initialized(&is_init);
    if (is_init)
        MPI_Comm_rank(comm, &rank);
#else
    (void)comm;
#endif
    return rank;
}

// **************************************************************************
int get_comm_size(MPI_Comm comm)
{
    int size = 1;
#if defined(MFDS_HAS_MPI)
    int is_init = 0;
    MPI_Initialized(&is_init);
    if (is_init)
        MPI_Comm_size(comm, &size);
#else
    (void)comm;
#endif
    return size;
}
}
