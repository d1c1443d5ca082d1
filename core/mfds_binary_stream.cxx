#include "mfds_binary_stream.h"
#include "mfds_common.h"

#include <utility>

// --------------------------------------------------------------------------
void mfds_binary_stream::clear()
{
    m_data.clear();
    m_read = 0;
    m_fail = false;
}

// --------------------------------------------------------------------------
void mfds_binary_stream::swap(mfds_binary_stream &other)
{
    m_data.swap(other.m_data);
    std::swap(m_read, other.m_read);
    std::swap(m_fail, other.m_fail);
}

// --------------------------------------------------------------------------
void mfds_binary_stream::write(const void *src, unsigned long n)
{
    if (!n)
        return;

    const unsigned char *bytes = static_cast<const unsigned char*>(src);
    m_data.insert(m_data.end(), bytes, bytes + n);
}

// --------------------------------------------------------------------------
int mfds_binary_stream::read(void *dst, unsigned long n)
{
    if (m_fail || (n > m_data.size() - m_read))
    {
        m_fail = true;
        return -1;
    }

    if (n)
        memcpy(dst, m_data.data() + m_read, n);

    m_read += n;
    return 0;
}

// --------------------------------------------------------------------------
unsigned long mfds_binary_stream::read_length(unsigned long elem_size)
{
    unsigned long n = 0;
    if (this->read(&n, sizeof(n)))
        return 0;

    // a length the remaining bytes can not hold is a corrupt stream
    if (elem_size && (n > (m_data.size() - m_read)/elem_size))
    {
        m_fail = true;
        return 0;
    }

    return n;
}

// --------------------------------------------------------------------------
void mfds_binary_stream::pack(const std::string &str)
{
    unsigned long n = str.size();
    this->pack(n);
    this->pack(str.data(), n);
}

// --------------------------------------------------------------------------
void mfds_binary_stream::unpack(std::string &str)
{
    unsigned long n = this->read_length(1);
    if (m_fail)
        return;

    str.assign(reinterpret_cast<const char*>(m_data.data() + m_read), n);
    m_read += n;
}

// --------------------------------------------------------------------------
void mfds_binary_stream::pack(const std::vector<std::string> &v)
{
    unsigned long n = v.size();
    this->pack(n);
    for (unsigned long i = 0; i < n; ++i)
        this->pack(v[i]);
}

// --------------------------------------------------------------------------
void mfds_binary_stream::unpack(std::vector<std::string> &v)
{
    // each string takes at least its length
    unsigned long n = this->read_length(sizeof(unsigned long));
    v.resize(n);
    for (unsigned long i = 0; i < n; ++i)
        this->unpack(v[i]);
}

// --------------------------------------------------------------------------
void mfds_binary_stream::pack(const std::vector<std::vector<std::string>> &v)
{
    unsigned long n = v.size();
    this->pack(n);
    for (unsigned long i = 0; i < n; ++i)
        this->pack(v[i]);
}

// --------------------------------------------------------------------------
void mfds_binary_stream::unpack(std::vector<std::vector<std::string>> &v)
{
    unsigned long n = this->read_length(sizeof(unsigned long));
    v.resize(n);
    for (unsigned long i = 0; i < n; ++i)
        this->unpack(v[i]);
}

// --------------------------------------------------------------------------
int mfds_binary_stream::expect(const char *tag)
{
    unsigned long n = strlen(tag);
    if (m_fail || (n > m_data.size() - m_read) ||
        memcmp(tag, m_data.data() + m_read, n))
        return -1;

    m_read += n;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_binary_stream::broadcast(MPI_Comm comm, int root_rank)
{
#if defined(MFDS_HAS_MPI)
    int is_init = 0;
    MPI_Initialized(&is_init);
    if (!is_init)
        return 0;

    int rank = 0;
    MPI_Comm_rank(comm, &rank);

    unsigned long n = m_data.size();
    if (MPI_Bcast(&n, 1, MPI_UNSIGNED_LONG, root_rank, comm) != MPI_SUCCESS)
    {
        MFDS_ERROR("Failed to broadcast the stream size")
        return -1;
    }

    if (rank != root_rank)
    {
        m_data.resize(n);
        m_read = 0;
        m_fail = false;
    }

    if (n && (MPI_Bcast(m_data.data(), n, MPI_BYTE, root_rank, comm)
        != MPI_SUCCESS))
    {
        MFDS_ERROR("Failed to broadcast " << n << " bytes")
        return -1;
    }
#else
    (void)comm;
    (void)root_rank;
#endif
    return 0;
}
